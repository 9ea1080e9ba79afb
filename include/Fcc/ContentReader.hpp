// =================================================================
// include/Fcc/ContentReader.hpp
// =================================================================
// Header for reading resolved files into FileRecords.

#pragma once

#include "Fcc/FileRecord.hpp"
#include "Fcc/LanguageClassifier.hpp"
#include "Fcc/NotebookNormalizer.hpp"
#include <string>

namespace Fcc {

/**
 * @brief Reads a resolved file as text and classifies the outcome
 *
 * Never throws for per-file problems: binary content, undecodable text,
 * filesystem errors and malformed notebooks are all annotated on the
 * returned record so the batch keeps going. Holds no references, so a
 * read task can own its reader outright.
 */
class ContentReader {
public:
    /**
     * @param classifier Language classifier used for the record tag (copied)
     * @param max_file_size Files above this size are not read (bytes, 0 = unlimited)
     */
    explicit ContentReader(const LanguageClassifier& classifier, size_t max_file_size = 0);

    /**
     * @brief Read one file
     * @param file Resolved file to read
     * @return Record with content blocks or an absence reason
     */
    FileRecord read(const ResolvedFile& file) const;

    /**
     * @brief Null byte or too many control characters in the leading sample
     */
    static bool looksBinary(const std::string& bytes);

    static bool isValidUtf8(const std::string& bytes);

    /**
     * @brief Remove a leading UTF-8 byte-order marker
     * @return true if one was removed
     */
    static bool stripBom(std::string& bytes);

    static constexpr size_t BINARY_SAMPLE_SIZE = 8192;
    static constexpr double MAX_CONTROL_RATIO = 0.30;

private:
    LanguageClassifier m_classifier;
    size_t m_max_file_size;
    NotebookNormalizer m_notebooks;

    bool readBytes(const ResolvedFile& file, std::string& bytes, std::string& error) const;
    static FileRecord& markUnreadable(FileRecord& record, const std::string& reason);
};

} // namespace Fcc
