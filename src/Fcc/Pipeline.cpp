// =================================================================
// src/Fcc/Pipeline.cpp
// =================================================================
// Implementation for the content-aggregation pipeline.

#include "Fcc/Pipeline.hpp"
#include "Fcc/ContentReader.hpp"
#include "Fcc/IgnorePattern.hpp"
#include "Fcc/LanguageClassifier.hpp"
#include "Fcc/Logger.hpp"
#include "Fcc/PathResolver.hpp"
#include "Fcc/ThreadPool.hpp"
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <system_error>

namespace Fcc {

namespace {

/**
 * @brief Hand-off point between one read task and the collector
 *
 * The collector abandons a slot once its timeout expires; a late worker
 * then drops its result instead of publishing it. `finished` is set when
 * the task returns either way, so the collector can tell which workers
 * are still stuck.
 */
struct ReadSlot {
    std::mutex mutex;
    std::condition_variable ready;
    bool started = false;
    bool done = false;
    bool abandoned = false;
    bool finished = false;
    std::chrono::steady_clock::time_point started_at;
    FileRecord record;
};

} // namespace

std::vector<const FileRecord*> PipelineResult::skippedRecords() const {
    std::vector<const FileRecord*> skipped;
    for (const auto& document : documents) {
        for (const auto& record : document.records) {
            if (!record.hasContent()) {
                skipped.push_back(&record);
            }
        }
    }
    return skipped;
}

Pipeline::Pipeline(const PipelineOptions& options, Logger& logger)
    : m_options(options), m_logger(logger) {}

PipelineResult Pipeline::run(const std::vector<std::string>& selection) const {
    std::error_code ec;
    if (!std::filesystem::is_directory(m_options.base_dir, ec)) {
        throw FccError("Base path is not a directory: " + m_options.base_dir.string());
    }

    std::vector<std::string> entries = selection;
    if (entries.empty()) {
        entries.push_back(".");
    }

    auto start_time = std::chrono::steady_clock::now();

    IgnorePatternSet ignore = IgnorePatternSet::compile(m_options.base_dir,
                                                        m_options.exclude_patterns,
                                                        m_options.default_patterns);
    for (const auto& invalid : ignore.invalidPatterns()) {
        m_logger.warning("Pipeline", "Ignoring invalid pattern", invalid);
    }

    PathResolver resolver(m_options.base_dir, ignore, m_logger, m_options.max_total_files);
    Resolution resolution = resolver.resolve(entries);

    LanguageClassifier classifier(m_options.language_overrides);
    std::shared_ptr<const ContentReader> reader =
        std::make_shared<ContentReader>(classifier, m_options.max_file_size);

    std::vector<ResolvedFile> files;
    for (const auto& group : resolution.groups) {
        files.insert(files.end(), group.files.begin(), group.files.end());
    }
    std::vector<FileRecord> records = readAll(files, reader, classifier);

    PipelineResult result;
    result.warnings = std::move(resolution.warnings);

    Document combined;
    combined.label = "combined";

    size_t next = 0;
    for (const auto& group : resolution.groups) {
        Document document;
        document.label = group.label;

        for (size_t i = 0; i < group.files.size(); ++i) {
            document.records.push_back(std::move(records[next++]));
        }
        for (const auto& path : group.ignored_files) {
            document.records.push_back(ignoredRecord(path, classifier));
        }
        result.pruned_directories.insert(result.pruned_directories.end(),
                                         group.pruned_directories.begin(),
                                         group.pruned_directories.end());

        for (const auto& record : document.records) {
            countRecord(record, result.stats);
        }

        if (m_options.per_selection) {
            // Selections that produced nothing get no artifact
            if (!document.records.empty()) {
                result.documents.push_back(std::move(document));
            }
        } else {
            for (auto& record : document.records) {
                combined.records.push_back(std::move(record));
            }
        }
    }

    if (!m_options.per_selection) {
        result.documents.push_back(std::move(combined));
    }
    result.stats.pruned_directories = result.pruned_directories.size();

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);
    m_logger.logReadStats(result.stats.included, result.stats.empty, result.stats.binary,
                          result.stats.unreadable, static_cast<long>(duration.count()));

    return result;
}

std::vector<FileRecord> Pipeline::readAll(const std::vector<ResolvedFile>& files,
                                          std::shared_ptr<const ContentReader> reader,
                                          const LanguageClassifier& classifier) const {
    std::vector<FileRecord> records(files.size());
    if (files.empty()) {
        return records;
    }

    std::vector<std::shared_ptr<ReadSlot>> slots;
    slots.reserve(files.size());
    for (size_t i = 0; i < files.size(); ++i) {
        slots.push_back(std::make_shared<ReadSlot>());
    }

    size_t workers = m_options.read_workers > 0 ? m_options.read_workers : ThreadPool::defaultWorkerCount();
    if (workers > files.size()) {
        workers = files.size();
    }

    const std::chrono::milliseconds timeout(m_options.read_timeout_ms);
    std::vector<size_t> abandoned;

    // Workers still inside a read whose slot was given up on
    auto stalledWorkers = [&slots, &abandoned]() {
        size_t stalled = 0;
        for (size_t index : abandoned) {
            std::lock_guard<std::mutex> lock(slots[index]->mutex);
            if (slots[index]->started && !slots[index]->finished) {
                stalled++;
            }
        }
        return stalled;
    };

    ThreadPool pool(workers);
    m_logger.debug("Pipeline", "Reading files", std::to_string(files.size()) + " files on " +
                   std::to_string(workers) + " workers");

    for (size_t i = 0; i < files.size(); ++i) {
        std::shared_ptr<ReadSlot> slot = slots[i];
        ResolvedFile file = files[i];

        // Tasks own their inputs: a stalled one may outlive this call
        pool.enqueue([slot, file, reader]() {
            {
                std::lock_guard<std::mutex> lock(slot->mutex);
                if (slot->abandoned) {
                    slot->finished = true;
                    return;
                }
                slot->started = true;
                slot->started_at = std::chrono::steady_clock::now();
            }
            slot->ready.notify_all();

            FileRecord record;
            try {
                record = reader->read(file);
            } catch (const std::exception& e) {
                record.path = file.relative_path;
                record.status = FileStatus::UNREADABLE;
                record.reason = e.what();
            }

            {
                std::lock_guard<std::mutex> lock(slot->mutex);
                slot->finished = true;
                if (slot->abandoned) {
                    return;
                }
                slot->record = std::move(record);
                slot->done = true;
            }
            slot->ready.notify_all();
        });
    }

    for (size_t i = 0; i < files.size(); ++i) {
        ReadSlot& slot = *slots[i];
        bool finished = true;

        if (m_options.read_timeout_ms > 0) {
            // Tasks start in queue order, so an unstarted slot waits only on
            // workers held by earlier abandoned reads
            auto start_deadline = std::chrono::steady_clock::now();
            if (stalledWorkers() < workers) {
                start_deadline += timeout;
            }

            std::unique_lock<std::mutex> lock(slot.mutex);
            bool started = slot.ready.wait_until(lock, start_deadline, [&slot] { return slot.started; });
            if (started) {
                finished = slot.ready.wait_until(lock, slot.started_at + timeout, [&slot] { return slot.done; });
            } else {
                finished = false;
            }

            if (finished) {
                records[i] = std::move(slot.record);
            } else {
                slot.abandoned = true;
            }
        } else {
            std::unique_lock<std::mutex> lock(slot.mutex);
            slot.ready.wait(lock, [&slot] { return slot.done; });
            records[i] = std::move(slot.record);
        }

        if (!finished) {
            abandoned.push_back(i);
            FileRecord timed_out;
            timed_out.path = files[i].relative_path;
            timed_out.language = classifier.classify(files[i].relative_path);
            timed_out.status = FileStatus::UNREADABLE;
            timed_out.reason = "read timed out after " + std::to_string(m_options.read_timeout_ms) + " ms";
            m_logger.warning("Pipeline", "Read timed out", files[i].relative_path);
            records[i] = std::move(timed_out);
            continue;
        }

        logRecord(records[i]);
    }

    if (!abandoned.empty()) {
        m_logger.warning("Pipeline", "Leaving stalled reads behind",
                         std::to_string(stalledWorkers()) + " worker(s) still blocked");
        pool.abandonWorkers();
    }

    return records;
}

void Pipeline::logRecord(const FileRecord& record) const {
    switch (record.status) {
        case FileStatus::BINARY:
            m_logger.debug("ContentReader", "Skipping binary file", record.path + ": " + record.reason);
            break;
        case FileStatus::UNREADABLE:
            m_logger.warning("ContentReader", "Cannot read file", record.path + ": " + record.reason);
            break;
        default:
            break;
    }
}

FileRecord Pipeline::ignoredRecord(const std::string& path, const LanguageClassifier& classifier) {
    FileRecord record;
    record.path = path;
    record.language = classifier.classify(path);
    record.status = FileStatus::IGNORED;
    record.reason = "matched ignore rules";
    return record;
}

void Pipeline::countRecord(const FileRecord& record, PipelineStats& stats) {
    switch (record.status) {
        case FileStatus::OK:
            stats.included++;
            break;
        case FileStatus::EMPTY:
            stats.empty++;
            break;
        case FileStatus::BINARY:
            stats.binary++;
            break;
        case FileStatus::UNREADABLE:
            stats.unreadable++;
            break;
        case FileStatus::IGNORED:
            stats.ignored++;
            break;
    }
}

} // namespace Fcc
