// =================================================================
// include/Fcc/SelectionSet.hpp
// =================================================================
// Header for the interactive selection state.

#pragma once

#include <filesystem>
#include <string>
#include <unordered_map>
#include <vector>

namespace Fcc {

/**
 * @brief Ordered set of selected paths keyed by canonical path
 *
 * Independent of any presentation: the same file reached through a
 * symlink or a "./" prefix is one entry. Iteration follows insertion
 * order, which becomes the selection order of the pipeline run.
 */
class SelectionSet {
public:
    /**
     * @brief Add the path if absent, remove it if present
     * @return true if the path is selected afterwards
     */
    bool toggle(const std::filesystem::path& path);

    /**
     * @return false if already selected
     */
    bool add(const std::filesystem::path& path);

    /**
     * @return false if it was not selected
     */
    bool remove(const std::filesystem::path& path);

    bool contains(const std::filesystem::path& path) const;

    void clear();

    size_t size() const { return m_order.size(); }
    bool empty() const { return m_order.empty(); }

    /**
     * @brief Selected paths in insertion order, as first given
     */
    std::vector<std::filesystem::path> paths() const;

    /**
     * @brief Selected paths as selection entries relative to base_dir
     *
     * Paths outside base_dir stay absolute.
     */
    std::vector<std::string> entriesRelativeTo(const std::filesystem::path& base_dir) const;

    /**
     * @brief Identity used as the set key
     */
    static std::string keyOf(const std::filesystem::path& path);

private:
    std::vector<std::string> m_order;
    std::unordered_map<std::string, std::filesystem::path> m_paths;
};

} // namespace Fcc
