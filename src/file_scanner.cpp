#include "core/file_scanner.hpp"
#include "core/worker_pool.hpp"
#include "logging/logger.hpp"
#include <algorithm>

FileScanner::FileScanner(const ScanConfig &config, MetadataExtractor &extractor, WorkerPool &pool)
    : config_(config), extractor_(extractor), pool_(pool),
      files_scanned_(0), files_stored_(0), files_skipped_(0)
{
}

size_t FileScanner::batchSize(size_t total, size_t min_batch, size_t max_batch)
{
    // Never zero, or the batch loop would not advance
    return std::max<size_t>(1, std::min(max_batch, std::max(min_batch, total / 10)));
}

EnumerationOptions FileScanner::enumerationOptions(const ScanRequest &request) const
{
    EnumerationOptions options = config_.enumeration;
    if (!request.exclude_dirs.empty())
        options.exclude_dirs = request.exclude_dirs;
    if (!request.exclude_patterns.empty())
        options.exclude_patterns = request.exclude_patterns;
    return options;
}

std::vector<std::string> FileScanner::enumerate(const ScanRequest &request) const
{
    return FileUtils::listFiles(request.root, enumerationOptions(request));
}

std::vector<std::optional<FileRecord>> FileScanner::processBatch(const std::vector<std::string> &files, size_t begin,
                                                                 size_t end, const ExtractionOptions &options,
                                                                 const ScanHooks &hooks)
{
    std::vector<std::optional<FileRecord>> results(end - begin);
    pool_.parallelFor(end - begin, [&](size_t i)
                      {
        const std::string &path = files[begin + i];
        try
        {
            results[i] = extractor_.extract(path, options);
        }
        catch (const std::exception &e)
        {
            Logger::error("Error processing file " + path + ": " + e.what());
            results[i] = std::nullopt;
        }

        if (hooks.on_processed)
        {
            try
            {
                hooks.on_processed(path, results[i].has_value());
            }
            catch (const std::exception &e)
            {
                Logger::error("Progress callback failed for " + path + ": " + e.what());
            }
        } });
    return results;
}

SimpleObservable<FileRecord> FileScanner::scan(const ScanRequest &request, ScanHooks hooks)
{
    return SimpleObservable<FileRecord>(
        [this, request, hooks](SimpleObservable<FileRecord>::Observer onNext,
                               SimpleObservable<FileRecord>::ErrorHandler onError,
                               SimpleObservable<FileRecord>::CompleteHandler onComplete)
        {
            clearStats();
            try
            {
                Logger::info("Starting directory scan: " + request.root);
                const std::vector<std::string> files = enumerate(request);
                const size_t total = files.size();
                if (hooks.on_total)
                    hooks.on_total(total);

                const ExtractionOptions options{request.include_hash, request.generate_video_artifacts};
                const size_t batch_size = batchSize(total, config_.min_batch_size, config_.max_batch_size);
                Logger::info("Found " + std::to_string(total) + " files, processing in batches of " +
                             std::to_string(batch_size));

                for (size_t begin = 0; begin < total; begin += batch_size)
                {
                    const size_t end = std::min(total, begin + batch_size);
                    auto batch = processBatch(files, begin, end, options, hooks);
                    files_scanned_ += batch.size();

                    for (auto &record : batch)
                    {
                        if (!record)
                        {
                            files_skipped_++;
                            continue;
                        }
                        files_stored_++;
                        onNext(*record);
                    }
                    Logger::info("Processed " + std::to_string(end) + "/" + std::to_string(total) + " files");
                }

                Logger::info("Directory scan completed. Scanned: " + std::to_string(files_scanned_) +
                             ", Produced: " + std::to_string(files_stored_) +
                             ", Skipped: " + std::to_string(files_skipped_));
            }
            catch (const std::exception &e)
            {
                Logger::error("Scan failed: " + std::string(e.what()));
                if (!onError)
                    throw;
                onError(e);
                return;
            }

            if (onComplete)
                onComplete();
        });
}

void FileScanner::clearStats()
{
    files_scanned_ = 0;
    files_stored_ = 0;
    files_skipped_ = 0;
}
