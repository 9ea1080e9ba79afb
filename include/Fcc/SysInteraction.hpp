// =================================================================
// include/Fcc/SysInteraction.hpp
// =================================================================
// Defines the interface for system-level operations like file I/O
// and running external processes.

#pragma once

#include <string>
#include <vector>
#include <utility> // For std::pair

namespace Fcc {

class SysInteraction {
public:
    /**
     * @brief Writes content to a sibling temporary file and renames it over the target.
     * @param file_path The path to the file.
     * @param content The content to write.
     * @param error Receives the OS reason on failure.
     * @return True on success. On failure the target is left untouched.
     */
    bool writeFileAtomic(const std::string& file_path, const std::string& content, std::string& error) const;

    /**
     * @brief Checks if a directory exists.
     */
    bool directoryExists(const std::string& dir_path) const;

    /**
     * @brief Creates a directory and any missing parents.
     */
    bool createDirectories(const std::string& dir_path, std::string& error) const;

    /**
     * @brief Executes an external command and captures its output.
     * @param command The command to execute.
     * @param args A vector of arguments for the command.
     * @return A pair containing the stdout and the exit code.
     */
    std::pair<std::string, int> executeCommand(const std::string& command, const std::vector<std::string>& args) const;

    /**
     * @brief Runs a command and writes input to its stdin.
     * @return The command's exit code, -1 if it could not be started.
     */
    int pipeToCommand(const std::string& command, const std::string& input) const;

    /**
     * @brief True if the program can be found on PATH.
     */
    bool commandAvailable(const std::string& program) const;

    /**
     * @brief Value of an environment variable, empty when unset.
     */
    static std::string getEnv(const std::string& name);
};

} // namespace Fcc
