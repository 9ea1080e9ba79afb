// =================================================================
// include/Fcc/Logger.hpp
// =================================================================
// Header for structured logging injected into pipeline components.

#pragma once

#include <deque>
#include <string>
#include <vector>
#include <fstream>
#include <chrono>
#include <memory>
#include <mutex>

namespace Fcc {

/**
 * @brief Log levels for message classification
 */
enum class LogLevel {
    DEBUG,      ///< Detailed debug information
    INFO,       ///< General information
    WARNING,    ///< Warning conditions
    ERROR,      ///< Error conditions
    CRITICAL    ///< Critical conditions
};

/**
 * @brief Log entry structure
 */
struct LogEntry {
    std::chrono::system_clock::time_point timestamp;
    LogLevel level;
    std::string component;
    std::string message;
    std::string context;

    LogEntry(LogLevel lvl, const std::string& comp, const std::string& msg, const std::string& ctx = "")
        : timestamp(std::chrono::system_clock::now()), level(lvl), component(comp), message(msg), context(ctx) {}
};

/**
 * @brief Logger settings, usually filled from the `logging` config section
 */
struct LoggerOptions {
    LogLevel console_level = LogLevel::WARNING;
    LogLevel file_level = LogLevel::DEBUG;
    bool console_enabled = true;
    bool color = true;
    std::string log_dir;                        ///< Empty disables file logging
    size_t max_log_size = 10 * 1024 * 1024;     // 10MB
    size_t max_log_files = 5;
    size_t max_memory_entries = 1000;           ///< Most recent entries kept by entries(), 0 keeps none
};

/**
 * @brief Structured logger passed by reference into every component
 *
 * Console output goes to stderr so that stdout stays reserved for
 * summaries and rendered content. Optional file output rotates by size.
 * All methods are safe to call from read workers.
 */
class Logger {
public:
    explicit Logger(const LoggerOptions& options = LoggerOptions());
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void setConsoleLogLevel(LogLevel level);
    void setConsoleLogging(bool enabled);

    void debug(const std::string& component, const std::string& message, const std::string& context = "");
    void info(const std::string& component, const std::string& message, const std::string& context = "");
    void warning(const std::string& component, const std::string& message, const std::string& context = "");
    void error(const std::string& component, const std::string& message, const std::string& context = "");
    void critical(const std::string& component, const std::string& message, const std::string& context = "");

    /**
     * @brief Log resolution results for one invocation
     * @param selection_count Number of selection entries
     * @param resolved_count Files that survived filtering
     * @param pruned_count Directories pruned without descent
     */
    void logResolution(size_t selection_count, size_t resolved_count, size_t pruned_count);

    /**
     * @brief Log read statistics after the read pool drains
     */
    void logReadStats(size_t included, size_t empty, size_t binary, size_t unreadable, long duration_ms);

    void logSessionStart(const std::string& command, const std::string& detail);
    void logSessionEnd(const std::string& command, int exit_code, long duration_ms);

    /**
     * @brief Most recent entries, oldest first, at most max_memory_entries
     */
    std::vector<LogEntry> entries() const;

    void flush();

    static std::string getLevelName(LogLevel level);
    static std::string getLevelColor(LogLevel level);

    /**
     * @brief Parse a level name ("debug", "info", "warning", ...)
     * @return Parsed level, or fallback when the name is unknown
     */
    static LogLevel parseLevel(const std::string& name, LogLevel fallback = LogLevel::WARNING);

private:
    LoggerOptions m_options;
    mutable std::mutex m_mutex;
    std::deque<LogEntry> m_entries;

    std::unique_ptr<std::ofstream> m_current_log_file;
    std::string m_current_log_filename;
    size_t m_current_log_size;

    void logEntry(const LogEntry& entry);
    void writeToConsole(const LogEntry& entry);
    void writeToFile(const LogEntry& entry);
    std::string formatEntry(const LogEntry& entry, bool include_color) const;
    void rotateLogsIfNeeded();
    static std::string formatTimestamp(const std::chrono::system_clock::time_point& time_point);
    void openLogFile();
    std::string generateLogFilename() const;
};

} // namespace Fcc
