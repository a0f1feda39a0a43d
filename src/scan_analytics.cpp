#include "core/scan_analytics.hpp"
#include "core/result_sink.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>

namespace
{
    constexpr size_t kTopCount = 10;

    std::string normalizeFileType(std::string type)
    {
        if (!type.empty() && type[0] != '.')
            type = "." + type;
        std::transform(type.begin(), type.end(), type.begin(), [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });
        return type;
    }

    bool largerFirst(const FileRecord &a, const FileRecord &b)
    {
        if (a.size != b.size)
            return a.size > b.size;
        return a.path < b.path;
    }

    bool olderFirst(const FileRecord &a, const FileRecord &b)
    {
        if (a.modified_time != b.modified_time)
            return a.modified_time < b.modified_time;
        return a.path < b.path;
    }

    template <typename Compare>
    void pushBounded(std::vector<FileRecord> &top, const FileRecord &record, Compare compare)
    {
        top.push_back(record);
        if (top.size() > kTopCount)
        {
            std::sort(top.begin(), top.end(), compare);
            top.resize(kTopCount);
        }
    }
}

void to_json(nlohmann::json &j, const DiskInsights &insights)
{
    j = nlohmann::json{
        {"total_size", insights.total_size},
        {"file_count", insights.file_count},
        {"file_type_count", insights.file_type_count},
        {"largest_files", insights.largest_files},
        {"oldest_files", insights.oldest_files},
        {"low_quality_videos", insights.low_quality_videos}};
}

ScanAnalytics::ScanAnalytics(const ScanConfig &config, MediaProbe &probe)
    : config_(config),
      video_analyzer_(probe, config_.video),
      extractor_(config_, video_analyzer_),
      pool_(config_.max_workers)
{
}

std::vector<FileRecord> ScanAnalytics::collect(const ScanRequest &request)
{
    std::vector<FileRecord> records;
    FileScanner scanner(config_, extractor_, pool_);
    scanner.scan(request).subscribe(
        [&records](const FileRecord &record)
        {
            records.push_back(record);
        },
        nullptr,
        nullptr);
    return records;
}

DiskInsights ScanAnalytics::getInsights(const std::string &root)
{
    ScanRequest request;
    request.root = root;
    request.generate_video_artifacts = false;

    DiskInsights insights;
    for (const auto &record : collect(request))
    {
        insights.total_size += record.size;
        insights.file_count++;
        insights.file_type_count[record.file_type]++;

        pushBounded(insights.largest_files, record, largerFirst);
        pushBounded(insights.oldest_files, record, olderFirst);

        if (record.video_metadata && record.video_metadata->is_low_quality.value_or(false))
        {
            insights.low_quality_videos.push_back(record);
        }
    }

    std::sort(insights.largest_files.begin(), insights.largest_files.end(), largerFirst);
    std::sort(insights.oldest_files.begin(), insights.oldest_files.end(), olderFirst);
    Logger::info("Insights for " + root + ": " + std::to_string(insights.file_count) + " files, " +
                 std::to_string(insights.total_size) + " bytes");
    return insights;
}

DuplicateGroups ScanAnalytics::groupByHash(const std::vector<FileRecord> &records)
{
    DuplicateGroups groups;
    for (const auto &record : records)
    {
        if (record.hash)
            groups[*record.hash].push_back(record);
    }

    for (auto it = groups.begin(); it != groups.end();)
    {
        if (it->second.size() < 2)
        {
            it = groups.erase(it);
            continue;
        }
        std::sort(it->second.begin(), it->second.end(), [](const FileRecord &a, const FileRecord &b)
                  { return a.path < b.path; });
        ++it;
    }
    return groups;
}

DuplicateGroups ScanAnalytics::findDuplicates(const std::string &root)
{
    ScanRequest request;
    request.root = root;
    request.include_hash = true;
    request.generate_video_artifacts = false;

    DuplicateGroups groups = groupByHash(collect(request));
    Logger::info("Found " + std::to_string(groups.size()) + " duplicate groups under " + root);
    return groups;
}

std::vector<FileRecord> ScanAnalytics::findAgingFiles(const std::string &root, int days, AgingMode mode)
{
    ScanRequest request;
    request.root = root;
    request.include_hash = false;
    request.generate_video_artifacts = false;

    const std::time_t cutoff = std::chrono::system_clock::to_time_t(
        std::chrono::system_clock::now() - std::chrono::hours(24) * days);

    std::vector<FileRecord> aging;
    for (const auto &record : collect(request))
    {
        const std::time_t last_used = mode == AgingMode::ACCESSED ? record.accessed_time : record.modified_time;
        if (last_used < cutoff)
            aging.push_back(record);
    }
    Logger::info("Found " + std::to_string(aging.size()) + " files older than " + std::to_string(days) +
                 " days under " + root);
    return aging;
}

bool ScanAnalytics::matchesFilters(const FileRecord &record, const SearchFilters &filters)
{
    if (filters.min_size && record.size < *filters.min_size)
        return false;
    if (filters.max_size && record.size > *filters.max_size)
        return false;

    if (!filters.file_types.empty())
    {
        const std::string type = normalizeFileType(record.file_type);
        bool matched = std::any_of(filters.file_types.begin(), filters.file_types.end(),
                                   [&type](const std::string &wanted)
                                   { return normalizeFileType(wanted) == type; });
        if (!matched)
            return false;
    }

    if (filters.created_before && record.created_time > *filters.created_before)
        return false;
    if (filters.modified_before && record.modified_time > *filters.modified_before)
        return false;

    if (filters.low_quality_videos && record.video_metadata &&
        !record.video_metadata->is_low_quality.value_or(false))
        return false;

    return true;
}

std::vector<FileRecord> ScanAnalytics::search(const std::string &root, const SearchFilters &filters,
                                              const std::string &output_file)
{
    ScanRequest request;
    request.root = root;
    request.include_hash = filters.include_duplicates;
    request.generate_video_artifacts = filters.preview_image;

    std::vector<FileRecord> results;
    for (auto &record : collect(request))
    {
        if (matchesFilters(record, filters))
            results.push_back(std::move(record));
    }

    if (filters.top_n)
    {
        std::sort(results.begin(), results.end(), largerFirst);
        if (results.size() > *filters.top_n)
            results.resize(*filters.top_n);
    }

    if (filters.include_duplicates)
    {
        std::vector<FileRecord> duplicates;
        for (auto &group : groupByHash(results))
        {
            for (auto &record : group.second)
                duplicates.push_back(std::move(record));
        }
        results = std::move(duplicates);
    }

    ResultSink sink(output_file);
    if (results.empty())
        sink.initialize();
    else
        sink.write(results, false);

    Logger::info("Search under " + root + " matched " + std::to_string(results.size()) + " files, written to " +
                 output_file);
    return results;
}
