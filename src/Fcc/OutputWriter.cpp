// =================================================================
// src/Fcc/OutputWriter.cpp
// =================================================================
// Implementation for file, directory and clipboard delivery.

#include "Fcc/OutputWriter.hpp"
#include "Fcc/Logger.hpp"
#include <filesystem>

namespace Fcc {

OutputWriter::OutputWriter(Logger& logger) : m_logger(logger) {}

bool OutputWriter::writeFile(const std::string& file_path, const std::string& text,
                             std::vector<Warning>& warnings) {
    std::filesystem::path parent = std::filesystem::path(file_path).parent_path();
    std::string error;
    if (!parent.empty() && !m_sys.directoryExists(parent.string()) &&
        !m_sys.createDirectories(parent.string(), error)) {
        warnings.emplace_back(ErrorKind::OUTPUT_WRITE_FAILURE, file_path, error);
        m_logger.error("OutputWriter", "Cannot create output directory", parent.string() + ": " + error);
        return false;
    }

    if (!m_sys.writeFileAtomic(file_path, text, error)) {
        warnings.emplace_back(ErrorKind::OUTPUT_WRITE_FAILURE, file_path, error);
        m_logger.error("OutputWriter", "Cannot write output", file_path + ": " + error);
        return false;
    }

    m_logger.info("OutputWriter", "Output written", file_path + " (" + std::to_string(text.size()) + " bytes)");
    return true;
}

size_t OutputWriter::writeDirectory(const std::string& dir_path, const std::vector<RenderedOutput>& outputs,
                                    std::vector<Warning>& warnings) {
    std::string error;
    if (!m_sys.createDirectories(dir_path, error)) {
        warnings.emplace_back(ErrorKind::OUTPUT_WRITE_FAILURE, dir_path, error);
        m_logger.error("OutputWriter", "Cannot create output directory", dir_path + ": " + error);
        return 0;
    }

    size_t written = 0;
    for (const auto& output : outputs) {
        std::string target = (std::filesystem::path(dir_path) / output.name).string();
        if (writeFile(target, output.text, warnings)) {
            written++;
        }
    }
    return written;
}

bool OutputWriter::copyToClipboard(const std::string& text, std::vector<Warning>& warnings) {
    for (const auto& command : clipboardCommands()) {
        std::string program = command.substr(0, command.find(' '));
        if (!m_sys.commandAvailable(program)) {
            continue;
        }

        int exit_code = m_sys.pipeToCommand(command, text);
        if (exit_code == 0) {
            m_logger.info("OutputWriter", "Copied to clipboard", program);
            return true;
        }
        m_logger.warning("OutputWriter", "Clipboard command failed",
                         program + " exited with " + std::to_string(exit_code));
    }

    warnings.emplace_back(ErrorKind::OUTPUT_WRITE_FAILURE, "clipboard",
                          "no working clipboard tool found (tried pbcopy, wl-copy, xclip, xsel); use --output instead");
    m_logger.error("OutputWriter", "Clipboard unavailable");
    return false;
}

std::vector<std::string> OutputWriter::clipboardCommands() {
    std::vector<std::string> commands;
#if defined(__APPLE__)
    commands.push_back("pbcopy");
#elif defined(_WIN32)
    commands.push_back("clip");
#else
    if (!SysInteraction::getEnv("WAYLAND_DISPLAY").empty()) {
        commands.push_back("wl-copy");
    }
    commands.push_back("xclip -selection clipboard");
    commands.push_back("xsel --clipboard --input");
#endif
    return commands;
}

} // namespace Fcc
