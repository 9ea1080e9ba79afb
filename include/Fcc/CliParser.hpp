// =================================================================
// include/Fcc/CliParser.hpp
// =================================================================
// Defines the interface for parsing command-line arguments.
// This class encapsulates all interaction with the CLI11 library.

#pragma once

#include "CLI/CLI.hpp"
#include <memory>
#include <string>
#include <vector>

namespace Fcc {

// A simple struct to hold parsed command information.
struct Commands {
    std::string active_command; // Name of the subcommand triggered

    // Options for 'markdown' and 'txt'
    std::vector<std::string> paths;
    std::string output_file;
    std::string output_dir;
    std::string base_path = ".";
    std::vector<std::string> exclude_patterns;
    bool verbose = false;

    // Options for 'serve'
    std::string host;      // Empty = server.host from configuration
    int port = 0;          // 0 = server.port from configuration

    // Options for 'config'
    std::string config_subcommand;  // show, get, set, init
    std::string config_key;
    std::string config_value;
    bool force = false;
};

class CliParser {
public:
    CliParser() = default;

    /**
     * @brief Sets up all CLI commands, options, and flags.
     * @return A shared pointer to the configured CLI::App object.
     */
    std::shared_ptr<CLI::App> setupCli();

    /**
     * @brief Retrieves the parsed command data.
     * @return A const reference to the Commands struct.
     */
    const Commands& getCommands() const;

private:
    void setupFormatCommand(CLI::App& app, const std::string& name, const std::string& description);
    void setupFormatsCommand(CLI::App& app);
    void setupServeCommand(CLI::App& app);
    void setupPickCommand(CLI::App& app);
    void setupConfigCommand(CLI::App& app);

    std::shared_ptr<CLI::App> m_app;
    Commands m_commands;
};

} // namespace Fcc
