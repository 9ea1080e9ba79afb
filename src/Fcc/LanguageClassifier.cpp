// =================================================================
// src/Fcc/LanguageClassifier.cpp
// =================================================================
// Implementation for language tag detection.

#include "Fcc/LanguageClassifier.hpp"
#include <algorithm>
#include <cctype>

namespace Fcc {

static std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

static std::string baseName(const std::string& path) {
    size_t slash = path.find_last_of("/\\");
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

LanguageClassifier::LanguageClassifier() {
    initializeDefaults();
}

LanguageClassifier::LanguageClassifier(const std::map<std::string, std::string>& overrides) {
    initializeDefaults();

    for (const auto& entry : overrides) {
        if (!entry.first.empty() && entry.first[0] == '.') {
            m_extensions[toLower(entry.first)] = entry.second;
        } else {
            m_filenames[entry.first] = entry.second;
        }
    }
}

std::string LanguageClassifier::classify(const std::string& path) const {
    std::string name = baseName(path);

    auto name_it = m_filenames.find(name);
    if (name_it != m_filenames.end()) {
        return name_it->second;
    }

    // Dockerfile.dev, Dockerfile.prod, ...
    if (name.compare(0, 11, "Dockerfile.") == 0) {
        return "dockerfile";
    }

    auto ext_it = m_extensions.find(lowercaseExtension(name));
    if (ext_it != m_extensions.end()) {
        return ext_it->second;
    }

    return "";
}

std::string LanguageClassifier::lowercaseExtension(const std::string& filename) {
    std::string name = baseName(filename);
    size_t dot_pos = name.find_last_of('.');
    if (dot_pos == std::string::npos || dot_pos == 0) {
        return "";
    }
    return toLower(name.substr(dot_pos));
}

void LanguageClassifier::initializeDefaults() {
    m_filenames = {
        {"Dockerfile", "dockerfile"},
        {"Containerfile", "dockerfile"},
        {"Makefile", "makefile"},
        {"makefile", "makefile"},
        {"GNUmakefile", "makefile"},
        {"CMakeLists.txt", "cmake"},
        {"Jenkinsfile", "groovy"},
        {"Gemfile", "ruby"},
        {"Rakefile", "ruby"},
        {"Vagrantfile", "ruby"},
        {"Podfile", "ruby"},
        {"BUILD", "python"},
        {"WORKSPACE", "python"},
        {".bashrc", "bash"},
        {".bash_profile", "bash"},
        {".zshrc", "zsh"},
        {".profile", "sh"},
        {".gitignore", "gitignore"},
        {".dockerignore", "gitignore"},
        {".editorconfig", "ini"},
        {".env", "dotenv"}
    };

    m_extensions = {
        // C family
        {".c", "c"}, {".h", "c"},
        {".cpp", "cpp"}, {".cc", "cpp"}, {".cxx", "cpp"}, {".hpp", "cpp"},
        {".hh", "cpp"}, {".hxx", "cpp"}, {".ipp", "cpp"}, {".inl", "cpp"},
        {".m", "objectivec"}, {".mm", "objectivec"},
        {".cs", "csharp"},

        // Scripting
        {".py", "python"}, {".pyi", "python"}, {".pyx", "cython"},
        {".rb", "ruby"}, {".php", "php"}, {".pl", "perl"}, {".pm", "perl"},
        {".lua", "lua"}, {".r", "r"}, {".jl", "julia"},

        // JVM and others
        {".java", "java"}, {".kt", "kotlin"}, {".kts", "kotlin"},
        {".scala", "scala"}, {".groovy", "groovy"}, {".gradle", "groovy"},
        {".go", "go"}, {".rs", "rust"}, {".swift", "swift"}, {".dart", "dart"},
        {".zig", "zig"}, {".hs", "haskell"}, {".ex", "elixir"}, {".exs", "elixir"},
        {".erl", "erlang"}, {".clj", "clojure"}, {".ml", "ocaml"}, {".fs", "fsharp"},

        // Web
        {".js", "javascript"}, {".mjs", "javascript"}, {".cjs", "javascript"},
        {".jsx", "jsx"}, {".ts", "typescript"}, {".tsx", "tsx"},
        {".html", "html"}, {".htm", "html"}, {".css", "css"},
        {".scss", "scss"}, {".sass", "sass"}, {".less", "less"},
        {".vue", "vue"}, {".svelte", "svelte"},

        // Markup and data
        {".md", "markdown"}, {".markdown", "markdown"}, {".rst", "rst"},
        {".tex", "latex"}, {".json", "json"}, {".jsonc", "json"},
        {".yaml", "yaml"}, {".yml", "yaml"}, {".toml", "toml"},
        {".ini", "ini"}, {".cfg", "ini"}, {".xml", "xml"}, {".svg", "xml"},
        {".csv", "csv"}, {".graphql", "graphql"}, {".proto", "protobuf"},
        {".sql", "sql"},

        // Shell and build
        {".sh", "bash"}, {".bash", "bash"}, {".zsh", "zsh"}, {".fish", "fish"},
        {".ps1", "powershell"}, {".bat", "batch"}, {".cmd", "batch"},
        {".cmake", "cmake"}, {".mk", "makefile"}, {".make", "makefile"},
        {".dockerfile", "dockerfile"}, {".tf", "hcl"}, {".nix", "nix"},

        {".ipynb", "jupyter-notebook"}
    };
}

} // namespace Fcc
