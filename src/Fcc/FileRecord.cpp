// =================================================================
// src/Fcc/FileRecord.cpp
// =================================================================
// Helpers for the pipeline data model.

#include "Fcc/FileRecord.hpp"
#include <algorithm>

namespace Fcc {

size_t FileRecord::lineCount() const {
    size_t lines = 0;
    for (const auto& block : blocks) {
        if (block.content.empty()) {
            continue;
        }
        lines += std::count(block.content.begin(), block.content.end(), '\n');
        if (block.content.back() != '\n') {
            lines++;
        }
    }
    return lines;
}

std::string statusName(FileStatus status) {
    switch (status) {
        case FileStatus::OK: return "ok";
        case FileStatus::EMPTY: return "empty";
        case FileStatus::BINARY: return "binary";
        case FileStatus::UNREADABLE: return "unreadable";
        case FileStatus::IGNORED: return "ignored";
        default: return "unknown";
    }
}

} // namespace Fcc
