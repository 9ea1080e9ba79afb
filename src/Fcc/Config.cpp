// =================================================================
// src/Fcc/Config.cpp
// =================================================================
// Implementation for the layered YAML configuration.

#include "Fcc/Config.hpp"
#include "Fcc/Errors.hpp"
#include "Fcc/Logger.hpp"
#include "Fcc/SysInteraction.hpp"
#include <algorithm>
#include <set>
#include <sstream>
#include <system_error>

namespace Fcc {

namespace {

std::vector<std::string> splitKey(const std::string& key) {
    // Language keys are extensions like ".tpl" and keep their dot
    const std::string languages_prefix = "languages.";
    if (key.compare(0, languages_prefix.size(), languages_prefix) == 0 && key.size() > languages_prefix.size()) {
        return {"languages", key.substr(languages_prefix.size())};
    }

    std::vector<std::string> parts;
    std::string part;
    std::istringstream stream(key);
    while (std::getline(stream, part, '.')) {
        parts.push_back(part);
    }
    return parts;
}

std::string trim(const std::string& s) {
    size_t first = s.find_first_not_of(" \t\n\r");
    if (std::string::npos == first) {
        return "";
    }
    size_t last = s.find_last_not_of(" \t\n\r");
    return s.substr(first, (last - first + 1));
}

// Null scalars (e.g. "name:" with no value) read as empty strings
std::string readString(const YAML::Node& node) {
    if (node.IsNull()) {
        return "";
    }
    return node.as<std::string>();
}

void requireMap(const YAML::Node& node, const std::string& section) {
    if (!node.IsMap()) {
        throw ConfigError("'" + section + "' must be a mapping");
    }
}

YAML::Node wrapPath(const std::vector<std::string>& parts, size_t index, const YAML::Node& leaf) {
    if (index == parts.size()) {
        return leaf;
    }
    YAML::Node wrapper(YAML::NodeType::Map);
    wrapper[parts[index]] = wrapPath(parts, index + 1, leaf);
    return wrapper;
}

YAML::Node parseValue(const std::string& key, const std::string& value) {
    if (key == "defaults.exclude_patterns" && (value.empty() || value.front() != '[')) {
        YAML::Node sequence(YAML::NodeType::Sequence);
        std::istringstream stream(value);
        std::string pattern;
        while (std::getline(stream, pattern, ',')) {
            pattern = trim(pattern);
            if (!pattern.empty()) {
                sequence.push_back(pattern);
            }
        }
        return sequence;
    }

    try {
        return YAML::Load(value);
    } catch (const YAML::Exception& e) {
        throw ConfigError("Invalid value for " + key + ": " + e.what());
    }
}

const std::map<std::string, std::set<std::string>>& sectionFields() {
    static const std::map<std::string, std::set<std::string>> fields = {
        {"limits", {"max_file_size_mb", "max_total_files", "read_workers", "read_timeout_ms"}},
        {"defaults", {"output_format", "exclude_patterns"}},
        {"project", {"name", "description"}},
        {"server", {"host", "port"}},
        {"logging", {"level", "file_dir", "max_file_size_mb", "max_files"}}
    };
    return fields;
}

const std::set<std::string>& formatFields() {
    static const std::set<std::string> fields = {"include_metadata", "include_line_numbers"};
    return fields;
}

} // namespace

FormatConfig Config::formatConfig(const std::string& format_name) const {
    auto it = formats.find(format_name);
    if (it == formats.end()) {
        return FormatConfig();
    }
    return it->second;
}

ConfigManager::ConfigManager(Logger& logger) : m_logger(logger) {}

Config ConfigManager::load(const std::filesystem::path& base_dir) const {
    Config config;

    std::filesystem::path global_path = globalConfigPath();
    if (!global_path.empty()) {
        mergeFile(config, global_path);
    }
    mergeFile(config, projectConfigPath(base_dir));
    applyEnvironment(config);

    return config;
}

bool ConfigManager::mergeFile(Config& config, const std::filesystem::path& file_path) const {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(file_path, ec)) {
        return true;
    }

    try {
        YAML::Node root = YAML::LoadFile(file_path.string());
        mergeNode(config, root);
        m_logger.debug("Config", "Loaded configuration", file_path.string());
        return true;
    } catch (const YAML::Exception& e) {
        m_logger.warning("Config", "Skipping malformed configuration file",
                         file_path.string() + ": " + e.what());
    } catch (const ConfigError& e) {
        m_logger.warning("Config", "Skipping invalid configuration file",
                         file_path.string() + ": " + e.what());
    }
    return false;
}

void ConfigManager::applyEnvironment(Config& config) const {
    static const std::vector<std::pair<std::string, std::string>> env_mappings = {
        {"FCC_MAX_FILE_SIZE", "limits.max_file_size_mb"},
        {"FCC_MAX_TOTAL_FILES", "limits.max_total_files"},
        {"FCC_READ_TIMEOUT_MS", "limits.read_timeout_ms"},
        {"FCC_OUTPUT_FORMAT", "defaults.output_format"},
        {"FCC_LOG_LEVEL", "logging.level"}
    };

    for (const auto& mapping : env_mappings) {
        std::string value = SysInteraction::getEnv(mapping.first);
        if (value.empty()) {
            continue;
        }

        try {
            setValue(config, mapping.second, value);
            m_logger.debug("Config", "Environment override applied", mapping.first + "=" + value);
        } catch (const ConfigError& e) {
            m_logger.warning("Config", "Invalid environment variable",
                             mapping.first + "=" + value + ": " + e.what());
        }
    }
}

void ConfigManager::save(const Config& config, const std::filesystem::path& file_path) const {
    SysInteraction sys;
    std::string error;

    std::filesystem::path parent = file_path.parent_path();
    if (!parent.empty() && !sys.createDirectories(parent.string(), error)) {
        throw ConfigError("Cannot create " + parent.string() + ": " + error);
    }
    if (!sys.writeFileAtomic(file_path.string(), toYaml(config), error)) {
        throw ConfigError("Cannot write " + file_path.string() + ": " + error);
    }

    m_logger.info("Config", "Configuration saved", file_path.string());
}

void ConfigManager::mergeYaml(Config& config, const std::string& yaml_text) {
    try {
        mergeNode(config, YAML::Load(yaml_text));
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("Invalid configuration: ") + e.what());
    }
}

std::string ConfigManager::getValue(const Config& config, const std::string& key) {
    std::vector<std::string> parts = splitKey(key);
    if (!isKnownKey(parts)) {
        throw ConfigError("Unknown configuration key: " + key);
    }

    YAML::Node current = toNode(config);
    for (const auto& part : parts) {
        const YAML::Node& view = current;
        YAML::Node child = view[part];
        if (!child) {
            throw ConfigError("Configuration key not set: " + key);
        }
        current.reset(child);
    }

    if (current.IsScalar()) {
        return current.Scalar();
    }

    YAML::Emitter out;
    out << YAML::Flow << current;
    return out.c_str();
}

void ConfigManager::setValue(Config& config, const std::string& key, const std::string& value) {
    std::vector<std::string> parts = splitKey(key);
    if (!isKnownKey(parts)) {
        throw ConfigError("Unknown configuration key: " + key);
    }

    try {
        mergeNode(config, wrapPath(parts, 0, parseValue(key, value)));
    } catch (const YAML::Exception& e) {
        throw ConfigError("Invalid value for " + key + ": " + e.what());
    }
}

std::string ConfigManager::toYaml(const Config& config) {
    YAML::Emitter out;
    out << toNode(config);
    return std::string(out.c_str()) + "\n";
}

std::vector<std::string> ConfigManager::knownKeys() {
    std::vector<std::string> keys;
    for (const auto& section : sectionFields()) {
        for (const auto& field : section.second) {
            keys.push_back(section.first + "." + field);
        }
    }
    keys.push_back("languages.<extension>");
    for (const auto& field : formatFields()) {
        keys.push_back("formats.<name>." + field);
    }
    return keys;
}

PipelineOptions ConfigManager::pipelineOptions(const Config& config, const std::filesystem::path& base_dir,
                                               const std::vector<std::string>& extra_excludes,
                                               bool per_selection) {
    PipelineOptions options;
    options.base_dir = base_dir;
    options.default_patterns = config.defaults.exclude_patterns;
    options.exclude_patterns = extra_excludes;
    options.max_file_size = config.limits.max_file_size_mb * 1024 * 1024;
    options.max_total_files = config.limits.max_total_files;
    options.read_workers = config.limits.read_workers;
    options.read_timeout_ms = config.limits.read_timeout_ms;
    options.language_overrides = config.languages;
    options.per_selection = per_selection;
    return options;
}

FormatOptions ConfigManager::formatOptions(const Config& config, const std::string& format_name,
                                           const std::filesystem::path& base_dir) {
    FormatOptions options;
    options.project_name = config.project.name;
    options.project_description = config.project.description;

    if (options.project_name.empty()) {
        std::error_code ec;
        std::filesystem::path resolved = std::filesystem::weakly_canonical(base_dir, ec);
        if (ec) {
            resolved = std::filesystem::absolute(base_dir).lexically_normal();
        }
        options.project_name = resolved.filename().string();
        if (options.project_name.empty()) {
            options.project_name = resolved.string();
        }
    }

    FormatConfig format = config.formatConfig(format_name);
    options.include_metadata = format.include_metadata;
    options.include_line_numbers = format.include_line_numbers;
    return options;
}

std::filesystem::path ConfigManager::globalConfigPath() {
    std::string home = SysInteraction::getEnv("HOME");
    if (home.empty()) {
        home = SysInteraction::getEnv("USERPROFILE");
    }
    if (home.empty()) {
        return std::filesystem::path();
    }
    return std::filesystem::path(home) / ".fcc" / "config.yml";
}

std::filesystem::path ConfigManager::projectConfigPath(const std::filesystem::path& base_dir) {
    return base_dir / ".fcc.yml";
}

void ConfigManager::mergeNode(Config& config, const YAML::Node& root) {
    if (!root || root.IsNull()) {
        return;
    }
    requireMap(root, "configuration");

    // Apply to a copy so a bad value leaves config untouched
    Config merged = config;

    try {
        if (const YAML::Node limits = root["limits"]) {
            requireMap(limits, "limits");
            if (limits["max_file_size_mb"]) {
                merged.limits.max_file_size_mb = limits["max_file_size_mb"].as<size_t>();
            }
            if (limits["max_total_files"]) {
                merged.limits.max_total_files = limits["max_total_files"].as<size_t>();
            }
            if (limits["read_workers"]) {
                merged.limits.read_workers = limits["read_workers"].as<size_t>();
            }
            if (limits["read_timeout_ms"]) {
                merged.limits.read_timeout_ms = limits["read_timeout_ms"].as<long>();
            }
        }

        if (const YAML::Node defaults = root["defaults"]) {
            requireMap(defaults, "defaults");
            if (defaults["output_format"]) {
                merged.defaults.output_format = defaults["output_format"].as<std::string>();
            }
            if (const YAML::Node patterns = defaults["exclude_patterns"]) {
                if (patterns.IsNull()) {
                    merged.defaults.exclude_patterns.clear();
                } else if (!patterns.IsSequence()) {
                    throw ConfigError("'defaults.exclude_patterns' must be a list");
                } else {
                    merged.defaults.exclude_patterns.clear();
                    for (const auto& pattern : patterns) {
                        merged.defaults.exclude_patterns.push_back(pattern.as<std::string>());
                    }
                }
            }
        }

        if (const YAML::Node project = root["project"]) {
            requireMap(project, "project");
            if (project["name"]) {
                merged.project.name = readString(project["name"]);
            }
            if (project["description"]) {
                merged.project.description = readString(project["description"]);
            }
        }

        if (const YAML::Node languages = root["languages"]) {
            requireMap(languages, "languages");
            for (YAML::const_iterator it = languages.begin(); it != languages.end(); ++it) {
                merged.languages[it->first.as<std::string>()] = it->second.as<std::string>();
            }
        }

        if (const YAML::Node formats = root["formats"]) {
            requireMap(formats, "formats");
            for (YAML::const_iterator it = formats.begin(); it != formats.end(); ++it) {
                std::string format_name = it->first.as<std::string>();
                const YAML::Node format_node = it->second;
                requireMap(format_node, "formats." + format_name);

                FormatConfig& format = merged.formats[format_name];
                if (format_node["include_metadata"]) {
                    format.include_metadata = format_node["include_metadata"].as<bool>();
                }
                if (format_node["include_line_numbers"]) {
                    format.include_line_numbers = format_node["include_line_numbers"].as<bool>();
                }
            }
        }

        if (const YAML::Node server = root["server"]) {
            requireMap(server, "server");
            if (server["host"]) {
                merged.server.host = server["host"].as<std::string>();
            }
            if (server["port"]) {
                int port = server["port"].as<int>();
                if (port <= 0 || port > 65535) {
                    throw ConfigError("'server.port' must be between 1 and 65535");
                }
                merged.server.port = port;
            }
        }

        if (const YAML::Node logging = root["logging"]) {
            requireMap(logging, "logging");
            if (logging["level"]) {
                merged.logging.level = logging["level"].as<std::string>();
            }
            if (logging["file_dir"]) {
                merged.logging.file_dir = readString(logging["file_dir"]);
            }
            if (logging["max_file_size_mb"]) {
                merged.logging.max_file_size_mb = logging["max_file_size_mb"].as<size_t>();
            }
            if (logging["max_files"]) {
                merged.logging.max_files = logging["max_files"].as<size_t>();
            }
        }
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("Invalid configuration value: ") + e.what());
    }

    config = merged;
}

YAML::Node ConfigManager::toNode(const Config& config) {
    YAML::Node root;

    root["limits"]["max_file_size_mb"] = config.limits.max_file_size_mb;
    root["limits"]["max_total_files"] = config.limits.max_total_files;
    root["limits"]["read_workers"] = config.limits.read_workers;
    root["limits"]["read_timeout_ms"] = config.limits.read_timeout_ms;

    root["defaults"]["output_format"] = config.defaults.output_format;
    YAML::Node patterns(YAML::NodeType::Sequence);
    for (const auto& pattern : config.defaults.exclude_patterns) {
        patterns.push_back(pattern);
    }
    root["defaults"]["exclude_patterns"] = patterns;

    root["project"]["name"] = config.project.name;
    root["project"]["description"] = config.project.description;

    YAML::Node languages(YAML::NodeType::Map);
    for (const auto& entry : config.languages) {
        languages[entry.first] = entry.second;
    }
    root["languages"] = languages;

    YAML::Node formats(YAML::NodeType::Map);
    for (const auto& entry : config.formats) {
        formats[entry.first]["include_metadata"] = entry.second.include_metadata;
        formats[entry.first]["include_line_numbers"] = entry.second.include_line_numbers;
    }
    root["formats"] = formats;

    root["server"]["host"] = config.server.host;
    root["server"]["port"] = config.server.port;

    root["logging"]["level"] = config.logging.level;
    root["logging"]["file_dir"] = config.logging.file_dir;
    root["logging"]["max_file_size_mb"] = config.logging.max_file_size_mb;
    root["logging"]["max_files"] = config.logging.max_files;

    return root;
}

bool ConfigManager::isKnownKey(const std::vector<std::string>& parts) {
    if (parts.empty()) {
        return false;
    }

    const std::string& section = parts[0];
    if (section == "languages") {
        return parts.size() <= 2;
    }
    if (section == "formats") {
        return parts.size() <= 2 || (parts.size() == 3 && formatFields().count(parts[2]) > 0);
    }

    auto it = sectionFields().find(section);
    if (it == sectionFields().end()) {
        return false;
    }
    return parts.size() == 1 || (parts.size() == 2 && it->second.count(parts[1]) > 0);
}

} // namespace Fcc
