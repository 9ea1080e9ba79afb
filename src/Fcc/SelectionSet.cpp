// =================================================================
// src/Fcc/SelectionSet.cpp
// =================================================================
// Implementation for the interactive selection state.

#include "Fcc/SelectionSet.hpp"
#include <algorithm>
#include <system_error>

namespace Fcc {

bool SelectionSet::toggle(const std::filesystem::path& path) {
    if (remove(path)) {
        return false;
    }
    add(path);
    return true;
}

bool SelectionSet::add(const std::filesystem::path& path) {
    std::string key = keyOf(path);
    if (m_paths.count(key) > 0) {
        return false;
    }
    m_paths.emplace(key, path);
    m_order.push_back(key);
    return true;
}

bool SelectionSet::remove(const std::filesystem::path& path) {
    std::string key = keyOf(path);
    if (m_paths.erase(key) == 0) {
        return false;
    }
    m_order.erase(std::remove(m_order.begin(), m_order.end(), key), m_order.end());
    return true;
}

bool SelectionSet::contains(const std::filesystem::path& path) const {
    return m_paths.count(keyOf(path)) > 0;
}

void SelectionSet::clear() {
    m_order.clear();
    m_paths.clear();
}

std::vector<std::filesystem::path> SelectionSet::paths() const {
    std::vector<std::filesystem::path> result;
    result.reserve(m_order.size());
    for (const auto& key : m_order) {
        result.push_back(m_paths.at(key));
    }
    return result;
}

std::vector<std::string> SelectionSet::entriesRelativeTo(const std::filesystem::path& base_dir) const {
    std::filesystem::path base(keyOf(base_dir));

    std::vector<std::string> entries;
    for (const auto& key : m_order) {
        std::filesystem::path path(key);
        std::string relative = path.lexically_relative(base).generic_string();
        if (relative.empty() || relative.compare(0, 2, "..") == 0) {
            entries.push_back(path.generic_string());
        } else {
            entries.push_back(relative);
        }
    }
    return entries;
}

std::string SelectionSet::keyOf(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::path canonical = std::filesystem::canonical(path, ec);
    if (ec) {
        return std::filesystem::absolute(path).lexically_normal().generic_string();
    }
    return canonical.generic_string();
}

} // namespace Fcc
