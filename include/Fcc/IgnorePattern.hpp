// =================================================================
// include/Fcc/IgnorePattern.hpp
// =================================================================
// Header for gitignore-compatible pattern matching functionality.

#pragma once

#include <string>
#include <vector>
#include <regex>
#include <filesystem>

namespace Fcc {

/**
 * @brief Gitignore-compatible pattern matching utility
 *
 * Supports the gitignore pattern syntax:
 * - Wildcards: *, ?, [abc], [!abc]
 * - Recursive wildcards: a "**" segment at the start, end or middle
 * - Negation: !pattern
 * - Directory-only patterns: pattern/
 * - Anchored patterns: /pattern, or any pattern with a slash in the middle
 * - Comment lines: # comment
 */
class IgnorePattern {
public:
    /**
     * @brief Construct a pattern matcher from a gitignore-style pattern
     * @param pattern The pattern string (one .gitignore line)
     */
    explicit IgnorePattern(const std::string& pattern);

    /**
     * @brief Check if a path matches this pattern
     *
     * Polarity is not applied here; a negation pattern still reports
     * whether its glob matches.
     *
     * @param path Relative path from the base directory, '/' separated
     * @param is_directory True if the path is a directory
     * @return true if path matches the pattern
     */
    bool matches(const std::string& path, bool is_directory = false) const;

    bool isNegation() const { return m_is_negation; }
    bool isDirectoryOnly() const { return m_directory_only; }
    bool isAnchored() const { return m_is_anchored; }

    const std::string& getPattern() const { return m_original_pattern; }

    /**
     * @brief Check if pattern is empty or comment
     */
    bool isEmpty() const { return m_is_empty; }

    /**
     * @brief Non-empty when the glob could not be compiled
     */
    const std::string& getError() const { return m_error; }

    /**
     * @brief Convert a glob body to an ECMAScript regex body
     *
     * '*' and '?' never cross '/', "**" spans directories. Shared with
     * the glob expander in PathResolver.
     */
    static std::string globToRegex(const std::string& glob_pattern);

private:
    std::string m_original_pattern;
    std::string m_processed_pattern;
    bool m_is_negation;
    bool m_directory_only;
    bool m_is_anchored;
    bool m_is_empty;
    std::string m_error;
    std::regex m_regex;

    void processPattern(const std::string& pattern);
};

/**
 * @brief Ordered collection of ignore patterns, last match wins
 *
 * Later patterns override earlier ones. A path under an ignored
 * directory stays ignored regardless of later negations.
 */
class IgnorePatternSet {
public:
    /**
     * @brief Build the rule set for one invocation
     *
     * Rule order: default_patterns, then base_dir/.gitignore (if present),
     * then extra_patterns.
     *
     * @param base_dir Directory holding the .gitignore
     * @param extra_patterns User supplied exclude patterns
     * @param default_patterns Configured default excludes
     */
    static IgnorePatternSet compile(const std::filesystem::path& base_dir,
                                    const std::vector<std::string>& extra_patterns,
                                    const std::vector<std::string>& default_patterns = {});

    /**
     * @brief Add a pattern to the set
     * @return false if the pattern was blank, a comment or invalid
     */
    bool addPattern(const std::string& pattern);

    /**
     * @brief Load patterns from a file (e.g., .gitignore)
     * @param file_path Path to ignore file
     * @return Number of patterns loaded, 0 when the file is absent
     */
    size_t loadFromFile(const std::filesystem::path& file_path);

    /**
     * @brief Check if a path should be ignored
     * @param path Relative path from the base directory
     * @param is_directory True if path is a directory
     * @return true if path or one of its ancestor directories is ignored
     */
    bool shouldIgnore(const std::string& path, bool is_directory = false) const;

    size_t size() const { return m_patterns.size(); }

    void clear() { m_patterns.clear(); m_invalid_patterns.clear(); }

    /**
     * @brief Patterns rejected because their glob failed to compile
     */
    const std::vector<std::string>& invalidPatterns() const { return m_invalid_patterns; }

    /**
     * @brief Normalize a relative path for matching ("./a/b/" -> "a/b")
     */
    static std::string normalizePath(const std::string& path);

private:
    std::vector<IgnorePattern> m_patterns;
    std::vector<std::string> m_invalid_patterns;

    bool lastMatchIgnores(const std::string& path, bool is_directory) const;
};

} // namespace Fcc
