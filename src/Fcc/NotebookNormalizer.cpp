// =================================================================
// src/Fcc/NotebookNormalizer.cpp
// =================================================================
// Implementation for notebook flattening.

#include "Fcc/NotebookNormalizer.hpp"
#include "Fcc/Errors.hpp"
#include "Fcc/LanguageClassifier.hpp"
#include "nlohmann/json.hpp"
#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace Fcc {

const char* const NotebookNormalizer::GENERIC_LANGUAGE = "text";

static std::string trim(const std::string& s) {
    size_t first = s.find_first_not_of(" \t\n\r");
    if (first == std::string::npos) {
        return "";
    }
    size_t last = s.find_last_not_of(" \t\n\r");
    return s.substr(first, last - first + 1);
}

// Cell "source" is either one string or a list of line strings
static std::string cellSource(const nlohmann::json& cell) {
    auto it = cell.find("source");
    if (it == cell.end() || it->is_null()) {
        return "";
    }
    if (it->is_string()) {
        return it->get<std::string>();
    }
    if (it->is_array()) {
        std::string joined;
        for (const auto& line : *it) {
            if (!line.is_string()) {
                throw MalformedNotebook("cell source contains a non-string line");
            }
            joined += line.get<std::string>();
        }
        return joined;
    }
    throw MalformedNotebook("cell source is neither a string nor a list");
}

static std::string kernelLanguage(const nlohmann::json& notebook) {
    auto metadata = notebook.find("metadata");
    if (metadata == notebook.end() || !metadata->is_object()) {
        return "";
    }

    auto kernelspec = metadata->find("kernelspec");
    if (kernelspec != metadata->end() && kernelspec->is_object()) {
        auto language = kernelspec->find("language");
        if (language != kernelspec->end() && language->is_string()) {
            return language->get<std::string>();
        }
    }

    auto language_info = metadata->find("language_info");
    if (language_info != metadata->end() && language_info->is_object()) {
        auto name = language_info->find("name");
        if (name != language_info->end() && name->is_string()) {
            return name->get<std::string>();
        }
    }

    return "";
}

std::vector<ContentBlock> NotebookNormalizer::normalize(const std::string& notebook_text) const {
    nlohmann::json notebook;
    try {
        notebook = nlohmann::json::parse(notebook_text);
    } catch (const nlohmann::json::parse_error& e) {
        throw MalformedNotebook(std::string("invalid JSON: ") + e.what());
    }

    if (!notebook.is_object()) {
        throw MalformedNotebook("top-level value is not an object");
    }

    auto cells = notebook.find("cells");
    if (cells == notebook.end()) {
        throw MalformedNotebook("missing 'cells' list");
    }
    if (!cells->is_array()) {
        throw MalformedNotebook("'cells' is not a list");
    }

    const std::string code_language = kernelTag(kernelLanguage(notebook));

    std::vector<ContentBlock> blocks;
    for (const auto& cell : *cells) {
        if (!cell.is_object()) {
            throw MalformedNotebook("cell is not an object");
        }

        std::string content = trim(cellSource(cell));
        if (content.empty()) {
            continue;
        }

        std::string cell_type;
        try {
            cell_type = cell.value("cell_type", std::string("code"));
        } catch (const nlohmann::json::type_error& e) {
            throw MalformedNotebook(std::string("invalid cell_type: ") + e.what());
        }
        if (cell_type == "markdown") {
            blocks.emplace_back("markdown", content);
        } else {
            blocks.emplace_back(code_language, content);
        }
    }

    return blocks;
}

std::string NotebookNormalizer::kernelTag(const std::string& kernel_language) {
    static const std::unordered_map<std::string, std::string> known_kernels = {
        {"python", "python"}, {"python2", "python"}, {"python3", "python"},
        {"ipython", "python"}, {"ipython3", "python"},
        {"r", "r"}, {"julia", "julia"}, {"scala", "scala"},
        {"javascript", "javascript"}, {"typescript", "typescript"},
        {"bash", "bash"}, {"sh", "bash"}, {"powershell", "powershell"},
        {"c++", "cpp"}, {"cpp", "cpp"}, {"c++11", "cpp"}, {"c++14", "cpp"},
        {"c++17", "cpp"}, {"c", "c"}, {"java", "java"}, {"kotlin", "kotlin"},
        {"go", "go"}, {"rust", "rust"}, {"ruby", "ruby"}, {"sql", "sql"},
        {"haskell", "haskell"}, {"octave", "octave"}, {"matlab", "matlab"},
        {"csharp", "csharp"}, {"c#", "csharp"}, {"fsharp", "fsharp"}, {"f#", "fsharp"}
    };

    std::string lower = trim(kernel_language);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    auto it = known_kernels.find(lower);
    if (it == known_kernels.end()) {
        return GENERIC_LANGUAGE;
    }
    return it->second;
}

bool NotebookNormalizer::isNotebookPath(const std::string& path) {
    return LanguageClassifier::lowercaseExtension(path) == ".ipynb";
}

} // namespace Fcc
