// =================================================================
// include/Fcc/OutputWriter.hpp
// =================================================================
// Header for delivering rendered outputs to files, directories and
// the system clipboard.

#pragma once

#include "Fcc/Errors.hpp"
#include "Fcc/Formatter.hpp"
#include "Fcc/SysInteraction.hpp"
#include <string>
#include <vector>

namespace Fcc {

class Logger;

/**
 * @brief Writes outputs without ever leaving a half-written target
 *
 * Each file is written to a temporary sibling and renamed into place.
 * A failed target is reported as an OutputWriteFailure warning and does
 * not stop the remaining targets.
 */
class OutputWriter {
public:
    explicit OutputWriter(Logger& logger);

    /**
     * @brief Write one output file
     * @return true if the file is in place
     */
    bool writeFile(const std::string& file_path, const std::string& text, std::vector<Warning>& warnings);

    /**
     * @brief Write every output into a directory, creating it if needed
     * @return Number of files written
     */
    size_t writeDirectory(const std::string& dir_path, const std::vector<RenderedOutput>& outputs,
                          std::vector<Warning>& warnings);

    /**
     * @brief Hand the text to the first clipboard tool that accepts it
     * @return false if no clipboard tool is available or all failed
     */
    bool copyToClipboard(const std::string& text, std::vector<Warning>& warnings);

    /**
     * @brief Clipboard commands to try, most specific first
     */
    static std::vector<std::string> clipboardCommands();

private:
    Logger& m_logger;
    SysInteraction m_sys;
};

} // namespace Fcc
