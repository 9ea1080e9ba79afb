// =================================================================
// src/Fcc/Core.cpp
// =================================================================
// Implementation for the core application logic.

#include "Fcc/Core.hpp"
#include "Fcc/ApiServer.hpp"
#include "Fcc/Errors.hpp"
#include "Fcc/Formatter.hpp"
#include "Fcc/IgnorePattern.hpp"
#include "Fcc/InteractiveSelector.hpp"
#include "Fcc/Logger.hpp"
#include "Fcc/OutputWriter.hpp"
#include "Fcc/Pipeline.hpp"
#include <chrono>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <system_error>

namespace Fcc {

static std::string joinSelection(const std::vector<std::string>& selection) {
    if (selection.empty()) {
        return ".";
    }
    std::string joined;
    for (const auto& entry : selection) {
        if (!joined.empty()) {
            joined += " ";
        }
        joined += entry;
    }
    return joined;
}

Core::Core(const Commands& commands)
    : m_commands(commands)
{
    // Configuration is loaded before the real logger exists, so its own
    // messages go through a console-only logger.
    LoggerOptions bootstrap_options;
    bootstrap_options.console_level = m_commands.verbose ? LogLevel::DEBUG : LogLevel::WARNING;
    Logger bootstrap(bootstrap_options);

    ConfigManager manager(bootstrap);
    m_config = manager.load(m_commands.base_path);

    m_logger = std::make_unique<Logger>(loggerOptions(m_config, m_commands.verbose));
}

Core::~Core() = default;

int Core::run() {
    if (m_commands.active_command == "markdown" || m_commands.active_command == "txt") {
        return handleFormat(m_commands.active_command);
    } else if (m_commands.active_command == "formats") {
        return handleFormats();
    } else if (m_commands.active_command == "serve") {
        return handleServe();
    } else if (m_commands.active_command == "pick") {
        return handlePick();
    } else if (m_commands.active_command == "config") {
        return handleConfig();
    } else if (m_commands.active_command.empty()) {
        return 0;
    }

    std::cerr << "Error: Unknown command '" << m_commands.active_command << "'." << std::endl;
    return 1;
}

LoggerOptions Core::loggerOptions(const Config& config, bool verbose) {
    LoggerOptions options;
    options.console_level = verbose ? LogLevel::DEBUG : Logger::parseLevel(config.logging.level);
    options.log_dir = config.logging.file_dir;
    options.max_log_size = config.logging.max_file_size_mb * 1024 * 1024;
    options.max_log_files = config.logging.max_files;
    return options;
}

void Core::printSummary(std::ostream& out, const PipelineResult& result) {
    const PipelineStats& stats = result.stats;

    out << "Summary: " << stats.readable() << " file(s) included";
    if (stats.empty > 0) {
        out << " (" << stats.empty << " empty)";
    }
    out << ", " << stats.skipped() << " skipped";
    if (stats.skipped() > 0) {
        out << " (" << stats.binary << " binary, " << stats.unreadable << " unreadable, "
            << stats.ignored << " ignored)";
    }
    out << std::endl;

    auto skipped = result.skippedRecords();
    if (!skipped.empty()) {
        out << "Skipped files:" << std::endl;
        for (const auto* record : skipped) {
            out << "  " << record->path << " [" << statusName(record->status) << "]: "
                << record->reason << std::endl;
        }
    }

    if (!result.pruned_directories.empty()) {
        out << "Pruned directories:" << std::endl;
        for (const auto& directory : result.pruned_directories) {
            out << "  " << directory << std::endl;
        }
    }

    if (!result.warnings.empty()) {
        out << "Warnings:" << std::endl;
        for (const auto& warning : result.warnings) {
            out << "  [" << errorKindName(warning.kind) << "] " << warning.subject << ": "
                << warning.message << std::endl;
        }
    }
}

int Core::handleFormat(const std::string& format_name) {
    return aggregate(format_name, m_commands.paths, m_commands.output_file, m_commands.output_dir);
}

int Core::handleFormats() {
    std::cout << "Available output formats:" << std::endl;
    for (const auto& name : Formatter::availableFormats()) {
        auto formatter = Formatter::create(name);
        std::cout << "  " << std::left << std::setw(10) << formatter->getName()
                  << " -> " << std::setw(6) << formatter->getExtension()
                  << " (" << formatter->getDescription() << ")" << std::endl;
    }
    return 0;
}

int Core::handleServe() {
    std::string host = m_commands.host.empty() ? m_config.server.host : m_commands.host;
    int port = m_commands.port > 0 ? m_commands.port : m_config.server.port;

    if (m_commands.verbose) {
        m_logger->setConsoleLogLevel(LogLevel::INFO);
    }

    m_logger->logSessionStart("serve", host + ":" + std::to_string(port));
    std::cout << "Starting fcc service on " << host << ":" << port << std::endl;

    ApiServer server(m_config, *m_logger);
    if (!server.start(host, port)) {
        std::cerr << "Error: Could not start the service on " << host << ":" << port << std::endl;
        m_logger->logSessionEnd("serve", 1, 0);
        return 1;
    }

    m_logger->logSessionEnd("serve", 0, 0);
    return 0;
}

int Core::handlePick() {
    std::filesystem::path base_dir(m_commands.base_path);
    IgnorePatternSet ignore = IgnorePatternSet::compile(base_dir, m_commands.exclude_patterns,
                                                        m_config.defaults.exclude_patterns);

    InteractiveSelector selector(base_dir, ignore, *m_logger);
    SelectorResult selection = selector.run();
    if (!selection.completed) {
        std::cout << "Nothing copied." << std::endl;
        return 0;
    }

    std::string format_name = m_config.defaults.output_format;
    if (!Formatter::create(format_name)) {
        m_logger->warning("Core", "Unknown default output format, using markdown", format_name);
        format_name = "markdown";
    }

    return aggregate(format_name, selection.selection, m_commands.output_file, "");
}

int Core::handleConfig() {
    ConfigManager manager(*m_logger);
    const std::string& sub = m_commands.config_subcommand;

    try {
        if (sub == "show") {
            std::filesystem::path global_path = ConfigManager::globalConfigPath();
            std::cout << "# Effective configuration" << std::endl;
            std::cout << "# global:  " << (global_path.empty() ? "(no home directory)" : global_path.string())
                      << std::endl;
            std::cout << "# project: " << ConfigManager::projectConfigPath(m_commands.base_path).string()
                      << std::endl;
            std::cout << ConfigManager::toYaml(m_config);
            return 0;
        }

        if (sub == "get") {
            std::cout << ConfigManager::getValue(m_config, m_commands.config_key) << std::endl;
            return 0;
        }

        if (sub == "set") {
            std::filesystem::path global_path = ConfigManager::globalConfigPath();
            if (global_path.empty()) {
                std::cerr << "Error: Cannot locate the home directory for the global configuration." << std::endl;
                return 1;
            }

            // Only the global layer is rewritten; project and environment values stay out of it
            Config global;
            if (!manager.mergeFile(global, global_path)) {
                std::cerr << "Error: " << global_path.string()
                          << " is not valid YAML configuration; fix or remove it first." << std::endl;
                return 1;
            }
            ConfigManager::setValue(global, m_commands.config_key, m_commands.config_value);
            manager.save(global, global_path);

            std::cout << "✓ " << m_commands.config_key << " = "
                      << ConfigManager::getValue(global, m_commands.config_key)
                      << " (saved to " << global_path.string() << ")" << std::endl;
            return 0;
        }

        if (sub == "init") {
            std::filesystem::path project_path = ConfigManager::projectConfigPath(m_commands.base_path);
            std::error_code ec;
            if (std::filesystem::exists(project_path, ec) && !m_commands.force) {
                std::cerr << "Error: " << project_path.string() << " already exists. Use --force to overwrite."
                          << std::endl;
                return 1;
            }

            manager.save(Config(), project_path);
            std::cout << "✓ Wrote default configuration to " << project_path.string() << std::endl;
            return 0;
        }
    } catch (const ConfigError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        std::cerr << "Known keys:" << std::endl;
        for (const auto& key : ConfigManager::knownKeys()) {
            std::cerr << "  " << key << std::endl;
        }
        return 1;
    }

    std::cerr << "Error: Unknown config command '" << sub << "'." << std::endl;
    return 1;
}

int Core::aggregate(const std::string& format_name, const std::vector<std::string>& selection,
                    const std::string& output_file, const std::string& output_dir) {
    auto start_time = std::chrono::steady_clock::now();
    m_logger->logSessionStart(format_name, joinSelection(selection));

    auto elapsed = [&start_time]() {
        return static_cast<long>(std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time).count());
    };

    std::unique_ptr<Formatter> formatter = Formatter::create(format_name);
    if (!formatter) {
        std::cerr << "Error: Unknown output format '" << format_name << "'. Run 'fcc formats'." << std::endl;
        return 1;
    }

    const bool per_selection = !output_dir.empty();
    std::filesystem::path base_dir(m_commands.base_path);

    PipelineResult result;
    try {
        Pipeline pipeline(ConfigManager::pipelineOptions(m_config, base_dir, m_commands.exclude_patterns,
                                                         per_selection),
                          *m_logger);
        result = pipeline.run(selection);
    } catch (const FccError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        m_logger->logSessionEnd(format_name, 1, elapsed());
        return 1;
    }

    printSummary(std::cout, result);

    if (!result.success()) {
        std::cerr << "Error: No readable files found for: " << joinSelection(selection) << std::endl;
        m_logger->logSessionEnd(format_name, 1, elapsed());
        return 1;
    }

    FormatOptions options = ConfigManager::formatOptions(m_config, formatter->getName(), base_dir);
    OutputWriter writer(*m_logger);
    std::vector<Warning> delivery_warnings;
    int exit_code = 0;

    if (per_selection) {
        std::cout << "Writing to directory: " << output_dir << std::endl;
        auto outputs = formatter->format(result.documents, OutputMode::PER_SELECTION, options);
        size_t written = writer.writeDirectory(output_dir, outputs, delivery_warnings);
        if (written == 0) {
            exit_code = 1;
        } else {
            std::cout << "✓ " << written << " context file(s) written to " << output_dir << std::endl;
        }
    } else {
        auto outputs = formatter->format(result.documents, OutputMode::COMBINED, options);
        const std::string& text = outputs.front().text;
        if (!output_file.empty()) {
            if (writer.writeFile(output_file, text, delivery_warnings)) {
                std::cout << "✓ Content from " << result.stats.readable() << " files written to "
                          << output_file << std::endl;
            } else {
                exit_code = 1;
            }
        } else if (writer.copyToClipboard(text, delivery_warnings)) {
            std::cout << "✓ Content from " << result.stats.readable() << " files copied to clipboard!" << std::endl;
        } else {
            exit_code = 1;
        }
    }

    for (const auto& warning : delivery_warnings) {
        std::cerr << "Error: [" << errorKindName(warning.kind) << "] " << warning.subject << ": "
                  << warning.message << std::endl;
    }

    m_logger->logSessionEnd(format_name, exit_code, elapsed());
    return exit_code;
}

} // namespace Fcc
