// =================================================================
// include/Fcc/FileRecord.hpp
// =================================================================
// Data model shared by the aggregation pipeline: resolved files,
// per-file read outcomes and the documents handed to formatters.

#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace Fcc {

/**
 * @brief Outcome of reading a single resolved file
 */
enum class FileStatus {
    OK,          ///< Text content available
    EMPTY,       ///< Zero-byte file, rendered with empty content
    BINARY,      ///< Binary or undecodable content, skipped
    UNREADABLE,  ///< Permission, I/O, timeout or malformed notebook
    IGNORED      ///< Matched by ignore rules, reported but never read
};

/**
 * @brief A concrete file that survived selection expansion and ignore filtering
 */
struct ResolvedFile {
    std::filesystem::path absolute_path;
    std::string relative_path;  ///< Display path, relative to the base directory when inside it

    ResolvedFile() = default;
    ResolvedFile(const std::filesystem::path& abs, const std::string& rel)
        : absolute_path(abs), relative_path(rel) {}
};

/**
 * @brief A language-tagged piece of text content
 *
 * Regular files produce one block; notebooks produce one block per cell.
 */
struct ContentBlock {
    std::string language;
    std::string content;

    ContentBlock() = default;
    ContentBlock(const std::string& lang, const std::string& text)
        : language(lang), content(text) {}
};

/**
 * @brief Read result for one resolved (or ignored) path
 */
struct FileRecord {
    std::string path;
    std::string language;
    FileStatus status = FileStatus::OK;
    std::string reason;  ///< Why the content is absent, empty for OK/EMPTY
    std::vector<ContentBlock> blocks;
    size_t size = 0;     ///< Size of the file on disk in bytes

    bool hasContent() const {
        return status == FileStatus::OK || status == FileStatus::EMPTY;
    }

    size_t lineCount() const;
};

/**
 * @brief An ordered group of records destined for one rendered output
 */
struct Document {
    std::string label;
    std::vector<FileRecord> records;
};

/**
 * @brief Per-invocation tally of read outcomes
 */
struct PipelineStats {
    size_t included = 0;
    size_t empty = 0;
    size_t binary = 0;
    size_t unreadable = 0;
    size_t ignored = 0;
    size_t pruned_directories = 0;

    size_t readable() const { return included + empty; }
    size_t skipped() const { return binary + unreadable + ignored; }
};

/**
 * @brief Human-readable status name used in notices and summaries
 */
std::string statusName(FileStatus status);

} // namespace Fcc
