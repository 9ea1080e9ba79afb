// =================================================================
// src/Fcc/PathResolver.cpp
// =================================================================
// Implementation for selection expansion with ignore-rule pruning.

#include "Fcc/PathResolver.hpp"
#include "Fcc/Logger.hpp"
#include <algorithm>
#include <sstream>
#include <system_error>

namespace Fcc {

namespace fs = std::filesystem;

// Drop a trailing separator so lexical comparisons see the final component
static fs::path withoutTrailingSeparator(fs::path path) {
    if (!path.has_filename() && path.has_parent_path() && path != path.root_path()) {
        path = path.parent_path();
    }
    return path;
}

static std::vector<std::string> splitSegments(const std::string& pattern) {
    std::vector<std::string> segments;
    std::string segment;
    std::istringstream stream(pattern);
    while (std::getline(stream, segment, '/')) {
        if (segment.empty() || segment == ".") {
            continue;
        }
        segments.push_back(segment);
    }
    return segments;
}

size_t Resolution::fileCount() const {
    size_t count = 0;
    for (const auto& group : groups) {
        count += group.files.size();
    }
    return count;
}

size_t Resolution::prunedCount() const {
    size_t count = 0;
    for (const auto& group : groups) {
        count += group.pruned_directories.size();
    }
    return count;
}

PathResolver::PathResolver(const fs::path& base_dir, const IgnorePatternSet& ignore,
                           Logger& logger, size_t max_files)
    : m_base_dir(withoutTrailingSeparator(fs::absolute(base_dir).lexically_normal())),
      m_ignore(ignore),
      m_logger(logger),
      m_max_files(max_files),
      m_file_count(0),
      m_limit_reported(false) {}

Resolution PathResolver::resolve(const std::vector<std::string>& selection) {
    resetPass();

    Resolution result;
    for (const auto& entry : selection) {
        SelectionGroup group;
        group.label = entry;

        if (isGlobPattern(entry)) {
            resolveGlob(entry, group, result);
        } else {
            resolveLiteral(entry, group, result);
        }

        m_logger.debug("PathResolver", "Resolved selection '" + entry + "'",
                       std::to_string(group.files.size()) + " files, " +
                       std::to_string(group.ignored_files.size()) + " ignored");
        result.groups.push_back(std::move(group));
    }

    m_logger.logResolution(selection.size(), result.fileCount(), result.prunedCount());
    return result;
}

bool PathResolver::isGlobPattern(const std::string& entry) {
    return entry.find_first_of("*?[") != std::string::npos;
}

void PathResolver::resetPass() {
    m_seen_files.clear();
    m_seen_ignored.clear();
    m_visited_dirs.clear();
    m_file_count = 0;
    m_limit_reported = false;
}

void PathResolver::resolveLiteral(const std::string& entry, SelectionGroup& group, Resolution& result) {
    fs::path path = absolutize(entry);

    std::error_code ec;
    auto status = fs::status(path, ec);
    if (ec || !fs::exists(status)) {
        result.warnings.emplace_back(ErrorKind::SELECTION_NOT_FOUND, entry, "path does not exist");
        m_logger.warning("PathResolver", "Selection not found", entry);
        return;
    }

    addPath(path, group, result);
}

void PathResolver::resolveGlob(const std::string& entry, SelectionGroup& group, Resolution& result) {
    fs::path entry_path(entry);
    fs::path root = entry_path.is_absolute() ? entry_path.root_path() : m_base_dir;

    std::string relative_pattern = entry;
    if (entry_path.is_absolute()) {
        relative_pattern = entry_path.relative_path().generic_string();
    }

    // Literal leading segments narrow the walk
    std::vector<std::string> segments = splitSegments(relative_pattern);
    size_t first_glob = 0;
    while (first_glob < segments.size() && !isGlobPattern(segments[first_glob])) {
        root /= segments[first_glob];
        ++first_glob;
    }
    root = withoutTrailingSeparator(root.lexically_normal());

    std::string rest;
    size_t max_depth = 0;
    bool recursive = false;
    for (size_t i = first_glob; i < segments.size(); ++i) {
        if (!rest.empty()) {
            rest += '/';
        }
        rest += segments[i];
        recursive = recursive || segments[i] == "**";
        max_depth++;
    }
    if (recursive) {
        max_depth = 0;
    }

    std::regex matcher;
    try {
        matcher = std::regex("^" + IgnorePattern::globToRegex(rest) + "$", std::regex_constants::ECMAScript);
    } catch (const std::regex_error& e) {
        result.warnings.emplace_back(ErrorKind::SELECTION_NOT_FOUND, entry,
                                     std::string("invalid glob pattern: ") + e.what());
        m_logger.warning("PathResolver", "Invalid glob pattern", entry);
        return;
    }

    std::vector<fs::path> matches;
    std::error_code ec;
    if (!rest.empty() && fs::is_directory(root, ec)) {
        std::unordered_set<std::string> visited;
        collectGlobMatches(root, root, matcher, 1, max_depth, visited, matches);
    }

    if (matches.empty()) {
        result.warnings.emplace_back(ErrorKind::SELECTION_NOT_FOUND, entry, "no paths match pattern");
        m_logger.warning("PathResolver", "Glob pattern matched nothing", entry);
        return;
    }

    for (const auto& match : matches) {
        addPath(match, group, result);
    }
}

void PathResolver::addPath(const fs::path& path, SelectionGroup& group, Resolution& result) {
    std::error_code ec;
    auto status = fs::status(path, ec);
    if (ec) {
        result.warnings.emplace_back(ErrorKind::UNREADABLE, displayPath(path), ec.message());
        return;
    }

    if (fs::is_directory(status)) {
        if (path != m_base_dir && isIgnored(path, true)) {
            group.pruned_directories.push_back(displayPath(path) + "/");
            m_logger.debug("PathResolver", "Pruned ignored directory", displayPath(path));
            return;
        }
        descend(path, group, result);
    } else if (fs::is_regular_file(status)) {
        addFile(path, group, result);
    } else {
        result.warnings.emplace_back(ErrorKind::UNREADABLE, displayPath(path),
                                     "not a regular file or directory");
    }
}

void PathResolver::addFile(const fs::path& path, SelectionGroup& group, Resolution& result) {
    std::string display = displayPath(path);

    if (isIgnored(path, false)) {
        if (m_seen_ignored.insert(display).second) {
            group.ignored_files.push_back(display);
            m_logger.debug("PathResolver", "Ignored file", display);
        }
        return;
    }

    // First selection that reaches a file owns it
    if (!m_seen_files.insert(identityOf(path)).second) {
        return;
    }

    if (m_max_files > 0 && m_file_count >= m_max_files) {
        if (!m_limit_reported) {
            m_limit_reported = true;
            result.warnings.emplace_back(ErrorKind::LIMIT_REACHED, display,
                                         "file limit of " + std::to_string(m_max_files) +
                                         " reached, remaining files skipped");
            m_logger.warning("PathResolver", "File limit reached", std::to_string(m_max_files));
        }
        return;
    }

    group.files.emplace_back(path, display);
    m_file_count++;
}

void PathResolver::descend(const fs::path& dir, SelectionGroup& group, Resolution& result) {
    if (!m_visited_dirs.insert(identityOf(dir)).second) {
        m_logger.debug("PathResolver", "Skipping already visited directory", displayPath(dir));
        return;
    }

    for (const auto& entry : listDirectory(dir, &result.warnings)) {
        std::error_code ec;
        auto status = entry.status(ec);
        if (ec || !fs::exists(status)) {
            result.warnings.emplace_back(ErrorKind::UNREADABLE, displayPath(entry.path()),
                                         ec ? ec.message() : "broken symbolic link");
            continue;
        }

        if (fs::is_directory(status)) {
            // Decide before listing: ignored trees are never read
            if (isIgnored(entry.path(), true)) {
                group.pruned_directories.push_back(displayPath(entry.path()) + "/");
                m_logger.debug("PathResolver", "Pruned ignored directory", displayPath(entry.path()));
                continue;
            }
            descend(entry.path(), group, result);
        } else if (fs::is_regular_file(status)) {
            addFile(entry.path(), group, result);
        } else {
            m_logger.debug("PathResolver", "Skipping special file", displayPath(entry.path()));
        }
    }
}

void PathResolver::collectGlobMatches(const fs::path& root, const fs::path& dir,
                                      const std::regex& matcher, size_t depth, size_t max_depth,
                                      std::unordered_set<std::string>& visited,
                                      std::vector<fs::path>& matches) const {
    if (!visited.insert(identityOf(dir)).second) {
        return;
    }

    for (const auto& entry : listDirectory(dir, nullptr)) {
        std::error_code ec;
        auto status = entry.status(ec);
        if (ec || !fs::exists(status)) {
            continue;
        }

        bool is_directory = fs::is_directory(status);
        std::string relative = entry.path().lexically_relative(root).generic_string();

        if (std::regex_match(relative, matcher)) {
            // Matched directories are descended later by addPath
            matches.push_back(entry.path());
            continue;
        }

        if (is_directory && (max_depth == 0 || depth < max_depth) && !isIgnored(entry.path(), true)) {
            collectGlobMatches(root, entry.path(), matcher, depth + 1, max_depth, visited, matches);
        }
    }
}

std::vector<fs::directory_entry> PathResolver::listDirectory(const fs::path& dir,
                                                             std::vector<Warning>* warnings) const {
    std::vector<fs::directory_entry> entries;

    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    fs::directory_iterator end;
    if (ec) {
        if (warnings) {
            warnings->emplace_back(ErrorKind::UNREADABLE, displayPath(dir), ec.message());
        }
        m_logger.warning("PathResolver", "Cannot list directory", displayPath(dir) + ": " + ec.message());
        return entries;
    }

    for (; it != end; it.increment(ec)) {
        if (ec) {
            break;
        }
        entries.push_back(*it);
    }
    if (ec) {
        if (warnings) {
            warnings->emplace_back(ErrorKind::UNREADABLE, displayPath(dir), ec.message());
        }
        m_logger.warning("PathResolver", "Directory listing interrupted", displayPath(dir) + ": " + ec.message());
    }

    std::sort(entries.begin(), entries.end(),
              [](const fs::directory_entry& a, const fs::directory_entry& b) {
                  return a.path().filename().string() < b.path().filename().string();
              });
    return entries;
}

bool PathResolver::isIgnored(const fs::path& path, bool is_directory) const {
    std::string relative = path.lexically_relative(m_base_dir).generic_string();
    if (relative.empty() || relative == ".") {
        return false;
    }
    if (relative.compare(0, 2, "..") == 0) {
        // Outside the base directory only name-based rules can apply
        return m_ignore.shouldIgnore(path.filename().generic_string(), is_directory);
    }
    return m_ignore.shouldIgnore(relative, is_directory);
}

std::string PathResolver::displayPath(const fs::path& path) const {
    std::string relative = path.lexically_relative(m_base_dir).generic_string();
    if (relative.empty() || relative.compare(0, 2, "..") == 0) {
        return path.generic_string();
    }
    return relative;
}

fs::path PathResolver::absolutize(const std::string& entry) const {
    fs::path path(entry);
    if (!path.is_absolute()) {
        path = m_base_dir / path;
    }
    return withoutTrailingSeparator(path.lexically_normal());
}

std::string PathResolver::identityOf(const fs::path& path) {
    std::error_code ec;
    fs::path canonical = fs::canonical(path, ec);
    if (ec) {
        return path.lexically_normal().generic_string();
    }
    return canonical.generic_string();
}

} // namespace Fcc
