// =================================================================
// src/Fcc/CliParser.cpp
// =================================================================
// Implementation for the CLI parser.

#include "Fcc/CliParser.hpp"

namespace Fcc {

std::shared_ptr<CLI::App> CliParser::setupCli() {
    m_app = std::make_shared<CLI::App>("fcc: copy file and folder contents as one formatted context document.");
    m_app->require_subcommand(1);

    // Set command callback to store which subcommand was used
    m_app->callback([this]() {
        for (auto* subcommand : m_app->get_subcommands()) {
            if (subcommand->parsed()) {
                m_commands.active_command = subcommand->get_name();
                break;
            }
        }
    });

    setupFormatCommand(*m_app, "markdown", "Aggregate files as Markdown with fenced code blocks.");
    setupFormatCommand(*m_app, "txt", "Aggregate files as plain text.");
    setupFormatsCommand(*m_app);
    setupServeCommand(*m_app);
    setupPickCommand(*m_app);
    setupConfigCommand(*m_app);

    return m_app;
}

const Commands& CliParser::getCommands() const {
    return m_commands;
}

void CliParser::setupFormatCommand(CLI::App& app, const std::string& name, const std::string& description) {
    auto* sub = app.add_subcommand(name, description);
    sub->add_option("paths", m_commands.paths, "Files, directories or glob patterns (default: .)");
    auto* output = sub->add_option("-o,--output", m_commands.output_file,
                                   "Write to this file instead of the clipboard.");
    auto* output_dir = sub->add_option("-d,--output-dir", m_commands.output_dir,
                                       "Write one file per path into this directory.");
    output->excludes(output_dir);
    sub->add_option("-p,--base-path", m_commands.base_path, "Directory paths and ignore rules are relative to.")
        ->check(CLI::ExistingDirectory);
    sub->add_option("-e,--exclude", m_commands.exclude_patterns, "Additional gitignore-style exclude patterns.")
        ->delimiter(',');
    sub->add_flag("-v,--verbose", m_commands.verbose, "Log progress to stderr.");
}

void CliParser::setupFormatsCommand(CLI::App& app) {
    app.add_subcommand("formats", "List available output formats.");
}

void CliParser::setupServeCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("serve", "Start the HTTP service.");
    sub->add_option("--host", m_commands.host, "Host to bind to (default: server.host).");
    sub->add_option("--port", m_commands.port, "Port to bind to (default: server.port).")
        ->check(CLI::Range(1, 65535));
    sub->add_flag("-v,--verbose", m_commands.verbose, "Log requests to stderr.");
}

void CliParser::setupPickCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("pick", "Interactively select files and folders to copy.");
    sub->add_option("base", m_commands.base_path, "Directory to browse (default: .)")
        ->check(CLI::ExistingDirectory);
    sub->add_option("-o,--output", m_commands.output_file, "Write to this file instead of the clipboard.");
    sub->add_option("-e,--exclude", m_commands.exclude_patterns, "Additional gitignore-style exclude patterns.")
        ->delimiter(',');
    sub->add_flag("-v,--verbose", m_commands.verbose, "Log progress to stderr.");
}

void CliParser::setupConfigCommand(CLI::App& app) {
    auto* config_cmd = app.add_subcommand("config", "Show and edit configuration.");
    config_cmd->require_subcommand(1);

    auto* show_cmd = config_cmd->add_subcommand("show", "Show the effective configuration.");
    show_cmd->add_option("-p,--base-path", m_commands.base_path, "Project directory whose .fcc.yml applies.");
    show_cmd->callback([this]() { m_commands.config_subcommand = "show"; });

    auto* get_cmd = config_cmd->add_subcommand("get", "Print one configuration value.");
    get_cmd->add_option("key", m_commands.config_key, "Dotted key, e.g. limits.max_total_files")->required();
    get_cmd->add_option("-p,--base-path", m_commands.base_path, "Project directory whose .fcc.yml applies.");
    get_cmd->callback([this]() { m_commands.config_subcommand = "get"; });

    auto* set_cmd = config_cmd->add_subcommand("set", "Set a value in the global configuration file.");
    set_cmd->add_option("key", m_commands.config_key, "Dotted key, e.g. defaults.output_format")->required();
    set_cmd->add_option("value", m_commands.config_value, "New value")->required();
    set_cmd->callback([this]() { m_commands.config_subcommand = "set"; });

    auto* init_cmd = config_cmd->add_subcommand("init", "Write a .fcc.yml with default settings.");
    init_cmd->add_option("-p,--base-path", m_commands.base_path, "Directory to create .fcc.yml in.");
    init_cmd->add_flag("-f,--force", m_commands.force, "Overwrite an existing .fcc.yml.");
    init_cmd->callback([this]() { m_commands.config_subcommand = "init"; });

    config_cmd->callback([this]() { m_commands.active_command = "config"; });
}

} // namespace Fcc
