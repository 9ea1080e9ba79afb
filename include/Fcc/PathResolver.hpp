// =================================================================
// include/Fcc/PathResolver.hpp
// =================================================================
// Header for expanding a selection into a deduplicated file set.

#pragma once

#include "Fcc/Errors.hpp"
#include "Fcc/FileRecord.hpp"
#include "Fcc/IgnorePattern.hpp"
#include <filesystem>
#include <regex>
#include <string>
#include <unordered_set>
#include <vector>

namespace Fcc {

class Logger;

/**
 * @brief Files produced by one top-level selection entry
 */
struct SelectionGroup {
    std::string label;                             ///< The selection entry as given
    std::vector<ResolvedFile> files;               ///< Resolution order
    std::vector<std::string> ignored_files;        ///< Files met but filtered by ignore rules
    std::vector<std::string> pruned_directories;   ///< Directories not descended

    bool empty() const { return files.empty() && ignored_files.empty(); }
};

/**
 * @brief Result of resolving a whole selection
 */
struct Resolution {
    std::vector<SelectionGroup> groups;  ///< One per selection entry, selection order
    std::vector<Warning> warnings;

    size_t fileCount() const;
    size_t prunedCount() const;
};

/**
 * @brief Expands selection entries (paths or globs) into concrete files
 *
 * Directories are walked depth-first with entries in name order. Every
 * subdirectory is tested against the ignore rules before descent, so
 * ignored trees are never listed. A file reached through several entries
 * is attributed to the first one. Directory symlink cycles are broken
 * by tracking canonical directory identities per pass.
 */
class PathResolver {
public:
    /**
     * @param base_dir Directory relative entries and ignore rules refer to
     * @param ignore Compiled ignore rules for base_dir
     * @param logger Injected logger
     * @param max_files Stop adding files after this many (0 = unlimited)
     */
    PathResolver(const std::filesystem::path& base_dir, const IgnorePatternSet& ignore,
                 Logger& logger, size_t max_files = 0);

    /**
     * @brief Resolve the selection in order
     * @param selection Literal paths and/or glob patterns
     * @return Groups in selection order plus per-selection warnings
     */
    Resolution resolve(const std::vector<std::string>& selection);

    /**
     * @brief True when the entry contains glob metacharacters
     */
    static bool isGlobPattern(const std::string& entry);

    const std::filesystem::path& baseDir() const { return m_base_dir; }

private:
    std::filesystem::path m_base_dir;
    const IgnorePatternSet& m_ignore;
    Logger& m_logger;
    size_t m_max_files;

    // Per-pass state
    std::unordered_set<std::string> m_seen_files;
    std::unordered_set<std::string> m_seen_ignored;
    std::unordered_set<std::string> m_visited_dirs;
    size_t m_file_count;
    bool m_limit_reported;

    void resetPass();

    void resolveLiteral(const std::string& entry, SelectionGroup& group, Resolution& result);
    void resolveGlob(const std::string& entry, SelectionGroup& group, Resolution& result);

    void addPath(const std::filesystem::path& path, SelectionGroup& group, Resolution& result);
    void addFile(const std::filesystem::path& path, SelectionGroup& group, Resolution& result);
    void descend(const std::filesystem::path& dir, SelectionGroup& group, Resolution& result);

    /**
     * @brief Walk root collecting entries whose relative path matches the glob
     * @param max_depth Segment count of the glob, 0 for unlimited ("**")
     */
    void collectGlobMatches(const std::filesystem::path& root, const std::filesystem::path& dir,
                            const std::regex& matcher, size_t depth, size_t max_depth,
                            std::unordered_set<std::string>& visited,
                            std::vector<std::filesystem::path>& matches) const;

    /**
     * @brief Directory entries sorted by name; errors are reported as warnings
     */
    std::vector<std::filesystem::directory_entry> listDirectory(const std::filesystem::path& dir,
                                                                std::vector<Warning>* warnings) const;

    bool isIgnored(const std::filesystem::path& path, bool is_directory) const;
    std::string displayPath(const std::filesystem::path& path) const;
    std::filesystem::path absolutize(const std::string& entry) const;
    static std::string identityOf(const std::filesystem::path& path);
};

} // namespace Fcc
