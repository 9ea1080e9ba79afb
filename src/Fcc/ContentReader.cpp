// =================================================================
// src/Fcc/ContentReader.cpp
// =================================================================
// Implementation for reading and classifying file content.

#include "Fcc/ContentReader.hpp"
#include "Fcc/Errors.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <system_error>

namespace Fcc {

ContentReader::ContentReader(const LanguageClassifier& classifier, size_t max_file_size)
    : m_classifier(classifier), m_max_file_size(max_file_size) {}

FileRecord ContentReader::read(const ResolvedFile& file) const {
    FileRecord record;
    record.path = file.relative_path;
    record.language = m_classifier.classify(file.relative_path);

    std::error_code ec;
    auto size = std::filesystem::file_size(file.absolute_path, ec);
    if (ec) {
        return markUnreadable(record, ec.message());
    }
    record.size = static_cast<size_t>(size);

    if (m_max_file_size > 0 && record.size > m_max_file_size) {
        return markUnreadable(record, "exceeds size limit of " + std::to_string(m_max_file_size) + " bytes");
    }

    std::string bytes;
    std::string error;
    if (!readBytes(file, bytes, error)) {
        return markUnreadable(record, error);
    }
    record.size = bytes.size();

    stripBom(bytes);

    const bool is_notebook = NotebookNormalizer::isNotebookPath(file.relative_path);

    if (bytes.empty()) {
        record.status = FileStatus::EMPTY;
        record.blocks.emplace_back(is_notebook ? "" : record.language, "");
        return record;
    }

    if (looksBinary(bytes)) {
        record.status = FileStatus::BINARY;
        record.reason = "binary content";
        return record;
    }

    if (!isValidUtf8(bytes)) {
        record.status = FileStatus::BINARY;
        record.reason = "not valid UTF-8 text";
        return record;
    }

    if (is_notebook) {
        try {
            record.blocks = m_notebooks.normalize(bytes);
        } catch (const MalformedNotebook& e) {
            record.blocks.clear();
            return markUnreadable(record, std::string("malformed notebook: ") + e.what());
        }

        if (record.blocks.empty()) {
            record.status = FileStatus::EMPTY;
            record.blocks.emplace_back("", "");
        }
        return record;
    }

    record.blocks.emplace_back(record.language, std::move(bytes));
    return record;
}

bool ContentReader::looksBinary(const std::string& bytes) {
    const size_t sample = std::min(bytes.size(), BINARY_SAMPLE_SIZE);
    if (sample == 0) {
        return false;
    }

    size_t control_chars = 0;
    for (size_t i = 0; i < sample; ++i) {
        unsigned char c = static_cast<unsigned char>(bytes[i]);
        if (c == 0) {
            return true;
        }
        bool whitespace = c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
        // Backspace and escape show up in terminal captures
        bool tolerated = c == 0x08 || c == 0x1b;
        if ((c < 0x20 && !whitespace && !tolerated) || c == 0x7f) {
            control_chars++;
        }
    }

    return static_cast<double>(control_chars) / sample > MAX_CONTROL_RATIO;
}

bool ContentReader::isValidUtf8(const std::string& bytes) {
    size_t i = 0;
    const size_t n = bytes.size();

    while (i < n) {
        unsigned char c = static_cast<unsigned char>(bytes[i]);
        if (c < 0x80) {
            ++i;
            continue;
        }

        size_t continuation;
        unsigned int code_point;
        if ((c & 0xE0) == 0xC0) {
            continuation = 1;
            code_point = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            continuation = 2;
            code_point = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            continuation = 3;
            code_point = c & 0x07;
        } else {
            return false;
        }

        if (i + continuation >= n) {
            return false;
        }

        for (size_t k = 1; k <= continuation; ++k) {
            unsigned char next = static_cast<unsigned char>(bytes[i + k]);
            if ((next & 0xC0) != 0x80) {
                return false;
            }
            code_point = (code_point << 6) | (next & 0x3F);
        }

        // Overlong encodings, surrogates and out-of-range values
        if ((continuation == 1 && code_point < 0x80) ||
            (continuation == 2 && code_point < 0x800) ||
            (continuation == 3 && code_point < 0x10000) ||
            (code_point >= 0xD800 && code_point <= 0xDFFF) ||
            code_point > 0x10FFFF) {
            return false;
        }

        i += continuation + 1;
    }

    return true;
}

bool ContentReader::stripBom(std::string& bytes) {
    if (bytes.size() >= 3 &&
        static_cast<unsigned char>(bytes[0]) == 0xEF &&
        static_cast<unsigned char>(bytes[1]) == 0xBB &&
        static_cast<unsigned char>(bytes[2]) == 0xBF) {
        bytes.erase(0, 3);
        return true;
    }
    return false;
}

bool ContentReader::readBytes(const ResolvedFile& file, std::string& bytes, std::string& error) const {
    errno = 0;
    std::ifstream stream(file.absolute_path, std::ios::binary);
    if (!stream.is_open()) {
        error = errno != 0 ? std::strerror(errno) : "cannot open file";
        return false;
    }

    std::ostringstream buffer;
    buffer << stream.rdbuf();
    if (stream.bad()) {
        error = errno != 0 ? std::strerror(errno) : "I/O error while reading";
        return false;
    }

    bytes = buffer.str();
    return true;
}

FileRecord& ContentReader::markUnreadable(FileRecord& record, const std::string& reason) {
    record.status = FileStatus::UNREADABLE;
    record.reason = reason;
    return record;
}

} // namespace Fcc
