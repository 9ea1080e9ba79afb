// =================================================================
// include/Fcc/Pipeline.hpp
// =================================================================
// Header for the content-aggregation pipeline: selection in,
// ordered documents out.

#pragma once

#include "Fcc/Errors.hpp"
#include "Fcc/FileRecord.hpp"
#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace Fcc {

class Logger;
class ContentReader;
class LanguageClassifier;

/**
 * @brief Inputs that shape one aggregation run
 */
struct PipelineOptions {
    std::filesystem::path base_dir = ".";
    std::vector<std::string> default_patterns;   ///< Configured excludes, lowest precedence
    std::vector<std::string> exclude_patterns;   ///< Caller excludes, highest precedence
    size_t max_file_size = 0;                    ///< Bytes, 0 = unlimited
    size_t max_total_files = 0;                  ///< 0 = unlimited
    size_t read_workers = 0;                     ///< 0 = hardware default
    long read_timeout_ms = 10000;                ///< Measured from read start, <= 0 disables
    std::map<std::string, std::string> language_overrides;
    bool per_selection = false;                  ///< One document per selection entry
};

/**
 * @brief Documents plus everything the caller needs to report
 */
struct PipelineResult {
    std::vector<Document> documents;
    std::vector<Warning> warnings;
    std::vector<std::string> pruned_directories;
    PipelineStats stats;

    /**
     * @brief At least one readable (OK or EMPTY) record was produced
     */
    bool success() const { return stats.readable() > 0; }

    /**
     * @brief Records without content, in document order
     */
    std::vector<const FileRecord*> skippedRecords() const;
};

/**
 * @brief Runs resolve, read and group for one selection
 *
 * Pure with respect to (selection, base directory, ignore rules): the
 * same tree and inputs produce the same documents in the same order.
 * Reads run on a bounded pool but records are slotted by resolution
 * order, never by completion order. With a read timeout set, run()
 * returns even when reads stall: stalled files, and files queued behind
 * them that never start, become Unreadable.
 */
class Pipeline {
public:
    /**
     * @param options Run options; the base directory must exist
     * @param logger Injected logger
     */
    Pipeline(const PipelineOptions& options, Logger& logger);

    /**
     * @brief Aggregate the selection
     * @param selection Literal paths and globs, "." when empty
     * @return Documents, warnings and counts
     * @throws FccError if the base directory is missing or not a directory
     */
    PipelineResult run(const std::vector<std::string>& selection) const;

    const PipelineOptions& options() const { return m_options; }

private:
    PipelineOptions m_options;
    Logger& m_logger;

    /**
     * @brief Read files on the worker pool, results in input order
     */
    std::vector<FileRecord> readAll(const std::vector<ResolvedFile>& files,
                                    std::shared_ptr<const ContentReader> reader,
                                    const LanguageClassifier& classifier) const;

    void logRecord(const FileRecord& record) const;

    static FileRecord ignoredRecord(const std::string& path, const LanguageClassifier& classifier);
    static void countRecord(const FileRecord& record, PipelineStats& stats);
};

} // namespace Fcc
