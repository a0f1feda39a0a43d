#pragma once

#include <functional>
#include <string>
#include <vector>
#include "core/file_record.hpp"
#include "core/file_utils.hpp"
#include "core/metadata_extractor.hpp"
#include "core/scan_config.hpp"

class WorkerPool;

/**
 * @brief Parameters of one scan
 *
 * Empty exclusion lists select the configured defaults.
 */
struct ScanRequest
{
    std::string root;
    std::vector<std::string> exclude_dirs;
    std::vector<std::string> exclude_patterns;
    bool include_hash = true;
    bool generate_video_artifacts = true;
};

/**
 * @brief Progress callbacks invoked while a scan runs
 *
 * on_processed is called from worker threads, once per enumerated file whether or not
 * a record was produced.
 */
struct ScanHooks
{
    std::function<void(size_t total)> on_total;
    std::function<void(const std::string &path, bool produced)> on_processed;
};

/**
 * @brief Enumerate a tree and enrich every file in bounded-concurrency batches
 *
 * The whole candidate list is collected first. Files are then processed batch by batch on the
 * worker pool; a batch is fully joined before its records are emitted and the next batch starts.
 */
class FileScanner
{
public:
    FileScanner(const ScanConfig &config, MetadataExtractor &extractor, WorkerPool &pool);
    ~FileScanner() = default;

    /**
     * @brief Stream the records of a scan
     *
     * Subscribing runs the scan synchronously. Enumeration failures (NotFoundError,
     * NotADirectoryError) and exceptions thrown by onNext are delivered to onError, or
     * rethrown when no error handler was given.
     */
    SimpleObservable<FileRecord> scan(const ScanRequest &request, ScanHooks hooks = {});

    // Candidate files of a request, with configured defaults applied
    std::vector<std::string> enumerate(const ScanRequest &request) const;

    // min(max_batch, max(min_batch, total / 10))
    static size_t batchSize(size_t total, size_t min_batch, size_t max_batch);

    // Get scan statistics
    size_t getFilesScanned() const { return files_scanned_; }
    size_t getFilesStored() const { return files_stored_; }
    size_t getFilesSkipped() const { return files_skipped_; }

    // Clear statistics
    void clearStats();

private:
    EnumerationOptions enumerationOptions(const ScanRequest &request) const;
    std::vector<std::optional<FileRecord>> processBatch(const std::vector<std::string> &files, size_t begin, size_t end,
                                                        const ExtractionOptions &options, const ScanHooks &hooks);

    ScanConfig config_;
    MetadataExtractor &extractor_;
    WorkerPool &pool_;
    size_t files_scanned_;
    size_t files_stored_;
    size_t files_skipped_;
};
