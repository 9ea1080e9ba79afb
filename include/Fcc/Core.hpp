// =================================================================
// include/Fcc/Core.hpp
// =================================================================
// Defines the core application orchestrator.

#pragma once

#include "Fcc/CliParser.hpp"
#include "Fcc/Config.hpp"
#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

// Forward declarations to reduce header dependencies
namespace Fcc {
    class Logger;
    struct LoggerOptions;
    struct PipelineResult;
}

namespace Fcc {

class Core {
public:
    /**
     * @brief Constructs the Core application object and loads configuration.
     * @param commands The parsed command-line arguments.
     */
    explicit Core(const Commands& commands);

    /**
     * @brief Destructor must be declared here and defined in the .cpp file.
     * This is required because we are using unique_ptr with forward-declared types.
     */
    ~Core();

    /**
     * @brief Runs the main application logic based on parsed commands.
     * @return An integer exit code (0 for success).
     */
    int run();

    /**
     * @brief Prints included/skipped counts, every skipped file with its
     * reason, pruned directories and warnings.
     */
    static void printSummary(std::ostream& out, const PipelineResult& result);

    /**
     * @brief Logger options derived from configuration and the verbose flag.
     */
    static LoggerOptions loggerOptions(const Config& config, bool verbose);

private:
    // Command Handlers
    int handleFormat(const std::string& format_name);
    int handleFormats();
    int handleServe();
    int handlePick();
    int handleConfig();

    /**
     * @brief Runs the pipeline for a selection and delivers the result to
     * the output directory, output file or clipboard.
     */
    int aggregate(const std::string& format_name, const std::vector<std::string>& selection,
                  const std::string& output_file, const std::string& output_dir);

    const Commands& m_commands;
    Config m_config;
    std::unique_ptr<Logger> m_logger;
};

} // namespace Fcc
