// =================================================================
// src/Fcc/ApiServer.cpp
// =================================================================
// Implementation for the HTTP transport.

#include "Fcc/ApiServer.hpp"
#include "Fcc/Errors.hpp"
#include "Fcc/Formatter.hpp"
#include "Fcc/Logger.hpp"
#include "Fcc/Pipeline.hpp"
#include "Fcc/SysInteraction.hpp"
#include "httplib.h"
#include <chrono>
#include <filesystem>
#include <sstream>
#include <stdexcept>
#include <system_error>

#if !defined(_WIN32)
#include <unistd.h>
#endif

namespace Fcc {

const char* const ApiServer::SERVICE_NAME = "fcc";

namespace {

void respond(httplib::Response& res, const ApiResponse& response) {
    res.status = response.status;
    res.set_content(ApiServer::serialize(response.body), "application/json");
}

std::string recordContent(const FileRecord& record) {
    std::string content;
    for (size_t i = 0; i < record.blocks.size(); ++i) {
        if (i > 0) {
            content += "\n\n";
        }
        content += record.blocks[i].content;
    }
    return content;
}

} // namespace

ApiServer::ApiServer(const Config& config, Logger& logger)
    : m_config(config), m_logger(logger), m_running(false) {}

ApiServer::~ApiServer() {
    stop();
}

bool ApiServer::start(const std::string& host, int port) {
    m_server = std::make_unique<httplib::Server>();

    m_server->Get("/", [this](const httplib::Request&, httplib::Response& res) {
        respond(res, handleRoot());
    });
    m_server->Get("/health", [this](const httplib::Request&, httplib::Response& res) {
        respond(res, handleHealth());
    });
    m_server->Post("/process", [this](const httplib::Request& req, httplib::Response& res) {
        respond(res, handleProcess(req.body));
    });
    m_server->Post("/process-to-file", [this](const httplib::Request& req, httplib::Response& res) {
        respond(res, handleProcessToFile(req.body));
    });

    m_server->set_logger([this](const httplib::Request& req, const httplib::Response& res) {
        m_logger.info("ApiServer", req.method + " " + req.path, "status " + std::to_string(res.status));
    });

    if (!m_server->bind_to_port(host, port)) {
        m_logger.error("ApiServer", "Cannot bind", host + ":" + std::to_string(port));
        return false;
    }

    m_running = true;
    m_logger.info("ApiServer", "Listening", host + ":" + std::to_string(port));
    bool clean_exit = m_server->listen_after_bind();
    m_running = false;

    m_logger.info("ApiServer", "Stopped");
    return clean_exit;
}

void ApiServer::stop() {
    if (m_server) {
        m_server->stop();
    }
}

ApiResponse ApiServer::handleRoot() const {
    ApiResponse response;
    response.body = {
        {"message", "File Context Copier API"},
        {"service", SERVICE_NAME},
        {"status", "running"},
        {"formats", {"markdown", "txt", "json"}}
    };
    return response;
}

ApiResponse ApiServer::handleHealth() const {
    ApiResponse response;
    response.body = {{"status", "healthy"}, {"service", SERVICE_NAME}};
    return response;
}

ApiResponse ApiServer::handleProcess(const std::string& request_body) const {
    return process(request_body).response;
}

ApiResponse ApiServer::handleProcessToFile(const std::string& request_body) const {
    ProcessOutcome outcome = process(request_body);
    if (outcome.response.status != 200) {
        return outcome.response;
    }
    if (!outcome.response.body.value("success", false)) {
        return errorResponse(400, outcome.response.body.value("error", std::string("processing failed")));
    }

    std::string file_path = temporaryOutputPath(outcome.extension);
    SysInteraction sys;
    std::string error;
    if (!sys.writeFileAtomic(file_path, outcome.content, error)) {
        m_logger.error("ApiServer", "Cannot write temporary output", file_path + ": " + error);
        return errorResponse(500, "Cannot write " + file_path + ": " + error);
    }

    ApiResponse response;
    response.body = {
        {"file_path", file_path},
        {"file_count", outcome.response.body["file_count"]},
        {"files_processed", outcome.response.body["files_processed"]},
        {"message", "Content written to " + file_path}
    };
    return response;
}

std::string ApiServer::serialize(const nlohmann::json& value) {
    return value.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::vector<std::string> ApiServer::splitPatterns(const std::string& patterns) {
    std::vector<std::string> result;
    std::istringstream stream(patterns);
    std::string pattern;
    while (std::getline(stream, pattern, ',')) {
        size_t first = pattern.find_first_not_of(" \t");
        if (first == std::string::npos) {
            continue;
        }
        size_t last = pattern.find_last_not_of(" \t");
        result.push_back(pattern.substr(first, last - first + 1));
    }
    return result;
}

ApiServer::ProcessRequest ApiServer::parseRequest(const std::string& request_body) const {
    nlohmann::json json;
    try {
        json = nlohmann::json::parse(request_body);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::invalid_argument(std::string("Invalid JSON: ") + e.what());
    }

    if (!json.is_object()) {
        throw std::invalid_argument("Request body must be a JSON object");
    }

    ProcessRequest request;

    auto paths = json.find("paths");
    if (paths == json.end() || !paths->is_array()) {
        throw std::invalid_argument("'paths' must be a list of strings");
    }
    for (const auto& path : *paths) {
        if (!path.is_string()) {
            throw std::invalid_argument("'paths' must be a list of strings");
        }
        request.paths.push_back(path.get<std::string>());
    }

    auto base_path = json.find("base_path");
    if (base_path != json.end() && !base_path->is_null()) {
        if (!base_path->is_string()) {
            throw std::invalid_argument("'base_path' must be a string");
        }
        request.base_path = base_path->get<std::string>();
    }

    // "exclude_patterns" is accepted for older clients
    auto exclude = json.find("exclude");
    if (exclude == json.end()) {
        exclude = json.find("exclude_patterns");
    }
    if (exclude != json.end() && !exclude->is_null()) {
        if (exclude->is_string()) {
            request.exclude_patterns = splitPatterns(exclude->get<std::string>());
        } else if (exclude->is_array()) {
            for (const auto& pattern : *exclude) {
                if (!pattern.is_string()) {
                    throw std::invalid_argument("'exclude' entries must be strings");
                }
                request.exclude_patterns.push_back(pattern.get<std::string>());
            }
        } else {
            throw std::invalid_argument("'exclude' must be a string or a list of strings");
        }
    }

    auto output_format = json.find("output_format");
    if (output_format != json.end() && !output_format->is_null()) {
        if (!output_format->is_string()) {
            throw std::invalid_argument("'output_format' must be a string");
        }
        request.output_format = output_format->get<std::string>();
    }

    return request;
}

ApiServer::ProcessOutcome ApiServer::process(const std::string& request_body) const {
    ProcessOutcome outcome;

    ProcessRequest request;
    try {
        request = parseRequest(request_body);
    } catch (const std::invalid_argument& e) {
        outcome.response = errorResponse(400, e.what());
        return outcome;
    }

    std::error_code ec;
    if (!std::filesystem::is_directory(request.base_path, ec)) {
        outcome.response = errorResponse(400, "Base path does not exist: " + request.base_path);
        return outcome;
    }

    std::string format_name = request.output_format.empty() ? m_config.defaults.output_format
                                                            : request.output_format;
    const bool json_output = format_name == "json";
    std::unique_ptr<Formatter> formatter;
    if (!json_output) {
        formatter = Formatter::create(format_name);
        if (!formatter) {
            outcome.response = errorResponse(400, "Unknown output format: " + format_name);
            return outcome;
        }
    }

    PipelineResult result;
    try {
        Pipeline pipeline(ConfigManager::pipelineOptions(m_config, request.base_path, request.exclude_patterns),
                          m_logger);
        result = pipeline.run(request.paths);
    } catch (const FccError& e) {
        outcome.response = errorResponse(400, e.what());
        return outcome;
    }

    nlohmann::json files_processed = nlohmann::json::array();
    nlohmann::json json_content = nlohmann::json::object();
    for (const auto& document : result.documents) {
        for (const auto& record : document.records) {
            if (record.hasContent()) {
                files_processed.push_back(record.path);
                json_content[record.path] = recordContent(record);
            }
        }
    }

    nlohmann::json skipped = nlohmann::json::array();
    for (const auto* record : result.skippedRecords()) {
        skipped.push_back({{"path", record->path}, {"status", statusName(record->status)},
                           {"reason", record->reason}});
    }

    nlohmann::json warnings = nlohmann::json::array();
    for (const auto& warning : result.warnings) {
        warnings.push_back({{"kind", errorKindName(warning.kind)}, {"subject", warning.subject},
                            {"message", warning.message}});
    }

    nlohmann::json& body = outcome.response.body;
    body["success"] = result.success();
    body["file_count"] = files_processed.size();
    body["files_processed"] = files_processed;
    body["skipped"] = skipped;
    body["warnings"] = warnings;

    if (!result.success()) {
        body["content"] = nullptr;
        body["error"] = "No readable text files found in selection";
        return outcome;
    }

    if (json_output) {
        body["content"] = json_content;
        outcome.content = serialize(json_content);
        outcome.extension = ".json";
    } else {
        FormatOptions options = ConfigManager::formatOptions(m_config, formatter->getName(), request.base_path);
        std::vector<RenderedOutput> rendered = formatter->format(result.documents, OutputMode::COMBINED, options);
        outcome.content = rendered.front().text;
        outcome.extension = formatter->getExtension();
        body["content"] = outcome.content;
    }
    body["error"] = nullptr;

    return outcome;
}

ApiResponse ApiServer::errorResponse(int status, const std::string& message) {
    ApiResponse response;
    response.status = status;
    response.body = {{"success", false}, {"error", message}};
    return response;
}

std::string ApiServer::temporaryOutputPath(const std::string& extension) const {
    static std::atomic<unsigned long> counter(0);

    std::error_code ec;
    std::filesystem::path dir = std::filesystem::temp_directory_path(ec);
    if (ec) {
        dir = ".";
    }

    auto stamp = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();

    std::ostringstream name;
    name << "fcc-context-";
#if !defined(_WIN32)
    name << ::getpid() << "-";
#endif
    name << stamp << "-" << counter++ << extension;
    return (dir / name.str()).string();
}

} // namespace Fcc
