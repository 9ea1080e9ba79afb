// =================================================================
// include/Fcc/Config.hpp
// =================================================================
// Defines the layered YAML configuration: built-in defaults, the
// global ~/.fcc/config.yml, the project .fcc.yml and FCC_* variables.

#pragma once

#include "Fcc/Formatter.hpp"
#include "Fcc/Pipeline.hpp"
#include <filesystem>
#include <map>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace Fcc {

class Logger;

struct LimitsConfig {
    size_t max_file_size_mb = 10;
    size_t max_total_files = 1000;
    size_t read_workers = 0;        ///< 0 = hardware concurrency, capped at 8
    long read_timeout_ms = 10000;
};

struct DefaultsConfig {
    std::string output_format = "markdown";
    std::vector<std::string> exclude_patterns = {
        ".git/", "node_modules/", "__pycache__/", "*.pyc", ".DS_Store"
    };
};

struct ProjectConfig {
    std::string name;
    std::string description;
};

struct FormatConfig {
    bool include_metadata = true;
    bool include_line_numbers = false;
};

struct ServerConfig {
    std::string host = "0.0.0.0";
    int port = 8000;
};

struct LoggingConfig {
    std::string level = "warning";
    std::string file_dir;            ///< Empty disables file logging
    size_t max_file_size_mb = 10;
    size_t max_files = 5;
};

/**
 * @brief Effective configuration after all layers are merged
 */
struct Config {
    LimitsConfig limits;
    DefaultsConfig defaults;
    ProjectConfig project;
    std::map<std::string, std::string> languages;   ///< Extension or file name -> tag
    std::map<std::string, FormatConfig> formats = {
        {"markdown", FormatConfig()},
        {"txt", FormatConfig()}
    };
    ServerConfig server;
    LoggingConfig logging;

    /**
     * @brief Settings for a format, defaults when the format has no section
     */
    FormatConfig formatConfig(const std::string& format_name) const;
};

/**
 * @brief Loads, queries and saves configuration layers
 */
class ConfigManager {
public:
    explicit ConfigManager(Logger& logger);

    /**
     * @brief Build the effective configuration for a base directory
     *
     * Layers, later wins: defaults, global file, project file, environment.
     * A malformed file is reported as a warning and skipped as a whole.
     */
    Config load(const std::filesystem::path& base_dir) const;

    /**
     * @brief Merge one YAML file into config
     * @return false if the file exists but could not be applied
     */
    bool mergeFile(Config& config, const std::filesystem::path& file_path) const;

    /**
     * @brief Apply FCC_* environment overrides, warning on invalid values
     */
    void applyEnvironment(Config& config) const;

    /**
     * @brief Write the configuration to a YAML file atomically
     * @throws ConfigError if the file cannot be written
     */
    void save(const Config& config, const std::filesystem::path& file_path) const;

    /**
     * @brief Merge a YAML document into config
     * @throws ConfigError on wrongly typed values
     */
    static void mergeYaml(Config& config, const std::string& yaml_text);

    /**
     * @brief Read a dotted key such as "limits.max_total_files"
     * @throws ConfigError for unknown keys
     */
    static std::string getValue(const Config& config, const std::string& key);

    /**
     * @brief Set a dotted key from its string form
     *
     * Values are parsed as YAML scalars or flow sequences;
     * "defaults.exclude_patterns" also accepts a comma-separated list.
     * @throws ConfigError for unknown keys or invalid values
     */
    static void setValue(Config& config, const std::string& key, const std::string& value);

    static std::string toYaml(const Config& config);

    static std::vector<std::string> knownKeys();

    /**
     * @brief Pipeline options for a run over base_dir
     * @param extra_excludes Caller patterns, applied after defaults and .gitignore
     */
    static PipelineOptions pipelineOptions(const Config& config, const std::filesystem::path& base_dir,
                                           const std::vector<std::string>& extra_excludes,
                                           bool per_selection = false);

    /**
     * @brief Presentation options; the title falls back to the base directory name
     */
    static FormatOptions formatOptions(const Config& config, const std::string& format_name,
                                       const std::filesystem::path& base_dir);

    static std::filesystem::path globalConfigPath();
    static std::filesystem::path projectConfigPath(const std::filesystem::path& base_dir);

private:
    Logger& m_logger;

    static void mergeNode(Config& config, const YAML::Node& root);
    static YAML::Node toNode(const Config& config);
    static bool isKnownKey(const std::vector<std::string>& parts);
};

} // namespace Fcc
