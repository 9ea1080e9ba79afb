// =================================================================
// src/Fcc/Errors.cpp
// =================================================================

#include "Fcc/Errors.hpp"

namespace Fcc {

std::string errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::SELECTION_NOT_FOUND: return "SelectionNotFound";
        case ErrorKind::IGNORED: return "Ignored";
        case ErrorKind::BINARY_CONTENT: return "BinaryContent";
        case ErrorKind::UNREADABLE: return "Unreadable";
        case ErrorKind::MALFORMED_NOTEBOOK: return "MalformedNotebook";
        case ErrorKind::OUTPUT_WRITE_FAILURE: return "OutputWriteFailure";
        case ErrorKind::LIMIT_REACHED: return "LimitReached";
        default: return "Unknown";
    }
}

} // namespace Fcc
