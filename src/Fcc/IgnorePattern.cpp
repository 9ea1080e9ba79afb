// =================================================================
// src/Fcc/IgnorePattern.cpp
// =================================================================
// Implementation for gitignore-compatible pattern matching.

#include "Fcc/IgnorePattern.hpp"
#include <fstream>
#include <algorithm>
#include <cctype>

namespace Fcc {

IgnorePattern::IgnorePattern(const std::string& pattern)
    : m_original_pattern(pattern),
      m_is_negation(false),
      m_directory_only(false),
      m_is_anchored(false),
      m_is_empty(false)
{
    processPattern(pattern);
}

bool IgnorePattern::matches(const std::string& path, bool is_directory) const {
    if (m_is_empty) {
        return false;
    }

    // Directory-only patterns only match directories
    if (m_directory_only && !is_directory) {
        return false;
    }

    return std::regex_match(path, m_regex);
}

void IgnorePattern::processPattern(const std::string& pattern) {
    std::string working_pattern = pattern;

    // Trailing whitespace (and CR from CRLF files) is not significant
    size_t last = working_pattern.find_last_not_of(" \t\r\n");
    if (last == std::string::npos) {
        m_is_empty = true;
        return;
    }
    working_pattern.erase(last + 1);

    if (working_pattern[0] == '#') {
        m_is_empty = true;
        return;
    }

    if (working_pattern[0] == '!') {
        m_is_negation = true;
        working_pattern = working_pattern.substr(1);
    } else if (working_pattern.size() > 1 && working_pattern[0] == '\\' &&
               (working_pattern[1] == '#' || working_pattern[1] == '!')) {
        working_pattern = working_pattern.substr(1);
    }

    if (!working_pattern.empty() && working_pattern.back() == '/') {
        m_directory_only = true;
        working_pattern.pop_back();
    }

    // A separator at the beginning or in the middle anchors to the base directory
    if (working_pattern.find('/') != std::string::npos) {
        m_is_anchored = true;
        if (working_pattern[0] == '/') {
            working_pattern = working_pattern.substr(1);
        }
    }

    if (working_pattern.empty()) {
        m_is_empty = true;
        return;
    }

    m_processed_pattern = working_pattern;

    std::string regex_pattern = globToRegex(working_pattern);
    if (m_is_anchored) {
        regex_pattern = "^" + regex_pattern + "$";
    } else {
        // No separator: match the basename at any depth
        regex_pattern = "^(?:.*/)?" + regex_pattern + "$";
    }

    try {
        m_regex = std::regex(regex_pattern, std::regex_constants::ECMAScript);
    } catch (const std::regex_error& e) {
        m_error = e.what();
        m_is_empty = true;
    }
}

std::string IgnorePattern::globToRegex(const std::string& glob_pattern) {
    std::string regex_pattern;
    const size_t length = glob_pattern.length();

    for (size_t i = 0; i < length; ++i) {
        char c = glob_pattern[i];

        switch (c) {
            case '*': {
                bool is_double = i + 1 < length && glob_pattern[i + 1] == '*';
                bool starts_segment = i == 0 || glob_pattern[i - 1] == '/';
                bool ends_segment = i + 2 == length || (i + 2 < length && glob_pattern[i + 2] == '/');

                if (is_double && starts_segment && ends_segment) {
                    if (i + 2 == length) {
                        // Trailing "**" matches everything inside
                        regex_pattern += ".*";
                        i += 1;
                    } else {
                        // "**/" matches zero or more directories
                        regex_pattern += "(?:.*/)?";
                        i += 2;
                    }
                } else {
                    // Consecutive stars inside a segment behave like one
                    while (i + 1 < length && glob_pattern[i + 1] == '*') {
                        ++i;
                    }
                    regex_pattern += "[^/]*";
                }
                break;
            }

            case '?':
                regex_pattern += "[^/]";
                break;

            case '[': {
                size_t j = i + 1;
                if (j < length && (glob_pattern[j] == '!' || glob_pattern[j] == '^')) {
                    ++j;
                }
                if (j < length && glob_pattern[j] == ']') {
                    ++j;
                }
                while (j < length && glob_pattern[j] != ']') {
                    ++j;
                }

                if (j >= length) {
                    // Unterminated class is a literal bracket
                    regex_pattern += "\\[";
                    break;
                }

                regex_pattern += '[';
                size_t k = i + 1;
                if (glob_pattern[k] == '!' || glob_pattern[k] == '^') {
                    regex_pattern += '^';
                    ++k;
                }
                for (; k < j; ++k) {
                    char member = glob_pattern[k];
                    if (member == '\\' || member == '[' || member == ']') {
                        regex_pattern += '\\';
                    }
                    regex_pattern += member;
                }
                regex_pattern += ']';
                i = j;
                break;
            }

            case '\\':
                if (i + 1 < length) {
                    char escaped = glob_pattern[++i];
                    if (std::isalnum(static_cast<unsigned char>(escaped))) {
                        regex_pattern += escaped;
                    } else {
                        regex_pattern += '\\';
                        regex_pattern += escaped;
                    }
                } else {
                    regex_pattern += "\\\\";
                }
                break;

            default:
                if (c == '.' || c == '^' || c == '$' || c == '+' || c == '{' || c == '}' ||
                    c == '|' || c == '(' || c == ')' || c == ']') {
                    regex_pattern += '\\';
                }
                regex_pattern += c;
                break;
        }
    }

    return regex_pattern;
}

// IgnorePatternSet implementation

IgnorePatternSet IgnorePatternSet::compile(const std::filesystem::path& base_dir,
                                           const std::vector<std::string>& extra_patterns,
                                           const std::vector<std::string>& default_patterns) {
    IgnorePatternSet set;

    for (const auto& pattern : default_patterns) {
        set.addPattern(pattern);
    }

    set.loadFromFile(base_dir / ".gitignore");

    for (const auto& pattern : extra_patterns) {
        set.addPattern(pattern);
    }

    return set;
}

bool IgnorePatternSet::addPattern(const std::string& pattern) {
    IgnorePattern ignore_pattern(pattern);
    if (!ignore_pattern.getError().empty()) {
        m_invalid_patterns.push_back(pattern);
        return false;
    }
    if (ignore_pattern.isEmpty()) {
        return false;
    }
    m_patterns.push_back(std::move(ignore_pattern));
    return true;
}

size_t IgnorePatternSet::loadFromFile(const std::filesystem::path& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        return 0;
    }

    size_t patterns_loaded = 0;
    std::string line;
    while (std::getline(file, line)) {
        if (addPattern(line)) {
            patterns_loaded++;
        }
    }

    return patterns_loaded;
}

bool IgnorePatternSet::shouldIgnore(const std::string& path, bool is_directory) const {
    std::string normalized = normalizePath(path);
    if (normalized.empty() || m_patterns.empty()) {
        return false;
    }

    // Nothing beneath an excluded directory can be re-included
    size_t pos = 0;
    while ((pos = normalized.find('/', pos)) != std::string::npos) {
        if (lastMatchIgnores(normalized.substr(0, pos), true)) {
            return true;
        }
        ++pos;
    }

    return lastMatchIgnores(normalized, is_directory);
}

std::string IgnorePatternSet::normalizePath(const std::string& path) {
    std::string normalized = path;
    std::replace(normalized.begin(), normalized.end(), '\\', '/');

    while (normalized.compare(0, 2, "./") == 0) {
        normalized.erase(0, 2);
    }
    while (!normalized.empty() && normalized.back() == '/') {
        normalized.pop_back();
    }
    if (normalized == ".") {
        normalized.clear();
    }
    return normalized;
}

bool IgnorePatternSet::lastMatchIgnores(const std::string& path, bool is_directory) const {
    bool should_ignore = false;

    // Later patterns override earlier ones
    for (const auto& pattern : m_patterns) {
        if (pattern.matches(path, is_directory)) {
            should_ignore = !pattern.isNegation();
        }
    }

    return should_ignore;
}

} // namespace Fcc
