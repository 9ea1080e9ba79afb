// =================================================================
// include/Fcc/ApiServer.hpp
// =================================================================
// Defines the HTTP transport over the aggregation pipeline.

#pragma once

#include "Fcc/Config.hpp"
#include "nlohmann/json.hpp"
#include <atomic>
#include <memory>
#include <string>
#include <vector>

namespace httplib {
class Server;
}

namespace Fcc {

class Logger;

/**
 * @brief Status code and JSON body produced by a handler
 */
struct ApiResponse {
    int status = 200;
    nlohmann::json body;
};

/**
 * @brief Thin HTTP layer: every endpoint maps onto one pipeline run
 *
 * Handlers are plain member functions so they can be exercised without
 * a socket; start() binds them to cpp-httplib routes.
 *
 * Routes:
 *   GET  /                 service banner
 *   GET  /health           liveness, no pipeline involvement
 *   POST /process          aggregate and return the content
 *   POST /process-to-file  aggregate into a temporary file, return its path
 */
class ApiServer {
public:
    /**
     * @param config Effective configuration used for every request
     * @param logger Injected logger
     */
    ApiServer(const Config& config, Logger& logger);
    ~ApiServer();

    ApiServer(const ApiServer&) = delete;
    ApiServer& operator=(const ApiServer&) = delete;

    /**
     * @brief Bind and serve until stop() is called
     * @return false if the address could not be bound
     */
    bool start(const std::string& host, int port);

    void stop();

    bool isRunning() const { return m_running; }

    ApiResponse handleRoot() const;
    ApiResponse handleHealth() const;

    /**
     * @brief Body: {"paths": [...], "base_path", "exclude", "output_format"}
     *
     * "exclude" may be a comma-separated string or a list of patterns.
     * "output_format" is markdown, txt or json; json returns a
     * path -> content object.
     */
    ApiResponse handleProcess(const std::string& request_body) const;

    ApiResponse handleProcessToFile(const std::string& request_body) const;

    /**
     * @brief Split a comma-separated pattern list, dropping blanks
     */
    static std::vector<std::string> splitPatterns(const std::string& patterns);

    /**
     * @brief Pretty-printed JSON text, invalid UTF-8 replaced by U+FFFD
     *
     * File names and contents come from disk and are not guaranteed to be
     * valid UTF-8.
     */
    static std::string serialize(const nlohmann::json& value);

    static const char* const SERVICE_NAME;

private:
    struct ProcessRequest {
        std::vector<std::string> paths;
        std::string base_path = ".";
        std::vector<std::string> exclude_patterns;
        std::string output_format;
    };

    /**
     * @brief Outcome of running the pipeline for a request
     */
    struct ProcessOutcome {
        ApiResponse response;
        std::string content;     ///< Rendered text, empty on failure
        std::string extension;   ///< Extension for file output
    };

    Config m_config;
    Logger& m_logger;
    std::unique_ptr<httplib::Server> m_server;
    std::atomic<bool> m_running;

    /**
     * @throws std::invalid_argument with a client-facing message
     */
    ProcessRequest parseRequest(const std::string& request_body) const;

    ProcessOutcome process(const std::string& request_body) const;

    static ApiResponse errorResponse(int status, const std::string& message);
    std::string temporaryOutputPath(const std::string& extension) const;
};

} // namespace Fcc
