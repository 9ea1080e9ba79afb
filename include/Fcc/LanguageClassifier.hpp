// =================================================================
// include/Fcc/LanguageClassifier.hpp
// =================================================================
// Maps file names to the language tag used on fenced code blocks.

#pragma once

#include <map>
#include <string>
#include <unordered_map>

namespace Fcc {

/**
 * @brief Filename/extension to language tag mapping
 *
 * Exact filename special cases are checked first, then configured
 * overrides, then the built-in extension table. Unknown files yield an
 * empty tag and are still included, just without highlighting.
 */
class LanguageClassifier {
public:
    LanguageClassifier();

    /**
     * @param overrides Extension (".ext") or exact filename to tag, from configuration
     */
    explicit LanguageClassifier(const std::map<std::string, std::string>& overrides);

    /**
     * @brief Classify a path by its name only
     * @param path File path (only the final component is inspected)
     * @return Language tag, empty when unknown
     */
    std::string classify(const std::string& path) const;

    /**
     * @brief Extension of a file name including the dot, lowercased
     */
    static std::string lowercaseExtension(const std::string& filename);

private:
    std::unordered_map<std::string, std::string> m_filenames;
    std::unordered_map<std::string, std::string> m_extensions;

    void initializeDefaults();
};

} // namespace Fcc
