// =================================================================
// include/Fcc/Errors.hpp
// =================================================================
// Error taxonomy for the aggregation pipeline.

#pragma once

#include <stdexcept>
#include <string>

namespace Fcc {

/**
 * @brief Classification of everything that can go wrong (or be filtered)
 *
 * Only setup failures are thrown; per-file and per-selection outcomes
 * travel as values alongside the output.
 */
enum class ErrorKind {
    SELECTION_NOT_FOUND,
    IGNORED,
    BINARY_CONTENT,
    UNREADABLE,
    MALFORMED_NOTEBOOK,
    OUTPUT_WRITE_FAILURE,
    LIMIT_REACHED
};

/**
 * @brief Non-fatal problem reported with the output
 */
struct Warning {
    ErrorKind kind;
    std::string subject;  ///< Selection entry, path or output target
    std::string message;

    Warning(ErrorKind k, const std::string& subj, const std::string& msg)
        : kind(k), subject(subj), message(msg) {}
};

std::string errorKindName(ErrorKind kind);

class FccError : public std::runtime_error {
public:
    explicit FccError(const std::string& message) : std::runtime_error(message) {}
};

class ConfigError : public FccError {
public:
    explicit ConfigError(const std::string& message) : FccError(message) {}
};

class MalformedNotebook : public FccError {
public:
    explicit MalformedNotebook(const std::string& message) : FccError(message) {}
};

} // namespace Fcc
