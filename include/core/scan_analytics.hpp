#pragma once

#include <cstdint>
#include <ctime>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/file_record.hpp"
#include "core/file_scanner.hpp"
#include "core/media_probe.hpp"
#include "core/metadata_extractor.hpp"
#include "core/scan_config.hpp"
#include "core/video_analyzer.hpp"
#include "core/worker_pool.hpp"

/**
 * @brief Disk usage summary of a tree
 */
struct DiskInsights
{
    uint64_t total_size = 0;
    size_t file_count = 0;
    std::map<std::string, size_t> file_type_count;
    std::vector<FileRecord> largest_files; // size descending, at most 10
    std::vector<FileRecord> oldest_files;  // modified_time ascending, at most 10
    std::vector<FileRecord> low_quality_videos;
};

void to_json(nlohmann::json &j, const DiskInsights &insights);

// Content hash -> files sharing it, each group sorted by path
using DuplicateGroups = std::map<std::string, std::vector<FileRecord>>;

enum class AgingMode
{
    ACCESSED,
    MODIFIED
};

struct SearchFilters
{
    std::optional<uint64_t> min_size;
    std::optional<uint64_t> max_size;
    std::vector<std::string> file_types; // "mp4" or ".MP4"
    std::optional<std::time_t> created_before;
    std::optional<std::time_t> modified_before;
    bool low_quality_videos = false;
    std::optional<size_t> top_n;
    bool include_duplicates = false;
    bool preview_image = true;
};

/**
 * @brief On-demand analyses of a directory tree
 *
 * Every call runs its own scan of the tree; nothing is cached between calls.
 * Enumeration errors propagate as NotFoundError / NotADirectoryError.
 */
class ScanAnalytics
{
public:
    ScanAnalytics(const ScanConfig &config, MediaProbe &probe);

    DiskInsights getInsights(const std::string &root);
    DuplicateGroups findDuplicates(const std::string &root);
    std::vector<FileRecord> findAgingFiles(const std::string &root, int days, AgingMode mode);

    /**
     * @brief Filtered search, written to output_file (replacing it) and returned
     * @throws StoreError if the results cannot be written
     */
    std::vector<FileRecord> search(const std::string &root, const SearchFilters &filters,
                                   const std::string &output_file);

    static bool matchesFilters(const FileRecord &record, const SearchFilters &filters);
    static DuplicateGroups groupByHash(const std::vector<FileRecord> &records);

private:
    std::vector<FileRecord> collect(const ScanRequest &request);

    ScanConfig config_;
    VideoAnalyzer video_analyzer_;
    MetadataExtractor extractor_;
    WorkerPool pool_;
};
