// =================================================================
// src/Fcc/SysInteraction.cpp
// =================================================================
// Implementation for system-level operations.

#include "Fcc/SysInteraction.hpp"
#include <array>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <sys/stat.h>
#include <system_error>

#if defined(_WIN32)
#define popen _popen
#define pclose _pclose
#else
#include <sys/wait.h>
#include <unistd.h>
#endif

namespace Fcc {

namespace {

int decodeExitStatus(int status) {
#if !defined(_WIN32)
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    // Process terminated abnormally
    return -1;
#else
    return status;
#endif
}

} // namespace

bool SysInteraction::writeFileAtomic(const std::string& file_path, const std::string& content,
                                     std::string& error) const {
    namespace fs = std::filesystem;

    fs::path target(file_path);
    fs::path temp = target;
    temp += ".tmp";
#if !defined(_WIN32)
    temp += "." + std::to_string(::getpid());
#endif

    {
        errno = 0;
        std::ofstream file_stream(temp, std::ios::binary | std::ios::trunc);
        if (!file_stream) {
            error = errno != 0 ? std::strerror(errno) : "cannot create temporary file";
            return false;
        }
        file_stream << content;
        file_stream.flush();
        if (!file_stream.good()) {
            error = errno != 0 ? std::strerror(errno) : "write failed";
            file_stream.close();
            std::error_code ignored;
            fs::remove(temp, ignored);
            return false;
        }
    }

    std::error_code ec;
    fs::rename(temp, target, ec);
    if (ec) {
        error = ec.message();
        std::error_code ignored;
        fs::remove(temp, ignored);
        return false;
    }
    return true;
}

bool SysInteraction::directoryExists(const std::string& dir_path) const {
    struct stat buffer;
    return (stat(dir_path.c_str(), &buffer) == 0 && S_ISDIR(buffer.st_mode));
}

bool SysInteraction::createDirectories(const std::string& dir_path, std::string& error) const {
    std::error_code ec;
    std::filesystem::create_directories(dir_path, ec);
    if (ec) {
        error = ec.message();
        return false;
    }
    if (!std::filesystem::is_directory(dir_path, ec)) {
        error = "path exists and is not a directory";
        return false;
    }
    return true;
}

std::pair<std::string, int> SysInteraction::executeCommand(const std::string& command,
                                                           const std::vector<std::string>& args) const {
    std::string full_command = command;
    for (const auto& arg : args) {
        // Basic shell escaping - wrap arguments containing spaces in quotes
        if (arg.find(' ') != std::string::npos) {
            full_command += " \"" + arg + "\"";
        } else {
            full_command += " " + arg;
        }
    }

    // Redirect stderr to stdout to capture all output
    full_command += " 2>&1";

    std::unique_ptr<FILE, decltype(&pclose)> pipe(popen(full_command.c_str(), "r"), pclose);
    if (!pipe) {
        throw std::runtime_error("Failed to execute command: " + full_command);
    }

    std::array<char, 128> buffer;
    std::string result;
    while (fgets(buffer.data(), buffer.size(), pipe.get()) != nullptr) {
        result += buffer.data();
    }

    int exit_status = pclose(pipe.release());
    return {result, decodeExitStatus(exit_status)};
}

int SysInteraction::pipeToCommand(const std::string& command, const std::string& input) const {
    std::string full_command = command + " >/dev/null 2>&1";

    FILE* pipe = popen(full_command.c_str(), "w");
    if (!pipe) {
        return -1;
    }

    size_t written = fwrite(input.data(), 1, input.size(), pipe);
    int exit_status = pclose(pipe);
    if (written != input.size()) {
        return -1;
    }
    return decodeExitStatus(exit_status);
}

bool SysInteraction::commandAvailable(const std::string& program) const {
    auto result = executeCommand("command", {"-v", program});
    return result.second == 0 && !result.first.empty();
}

std::string SysInteraction::getEnv(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    return value ? std::string(value) : std::string();
}

} // namespace Fcc
