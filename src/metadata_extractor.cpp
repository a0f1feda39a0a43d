#include "core/metadata_extractor.hpp"
#include "core/file_utils.hpp"
#include "core/mime_sniffer.hpp"
#include "core/video_analyzer.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>

MetadataExtractor::MetadataExtractor(const ScanConfig &config, VideoAnalyzer &video_analyzer)
    : hash_chunk_size_(config.hash_chunk_size),
      video_extensions_(config.video_extensions),
      video_analyzer_(video_analyzer)
{
    // Accept "mp4" as well as ".MP4" in configuration
    for (auto &ext : video_extensions_)
    {
        if (!ext.empty() && ext[0] != '.')
            ext = "." + ext;
        std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });
    }
}

bool MetadataExtractor::isVideoExtension(const std::string &file_type) const
{
    return std::find(video_extensions_.begin(), video_extensions_.end(), file_type) != video_extensions_.end();
}

std::optional<FileRecord> MetadataExtractor::extract(const std::string &path, const ExtractionOptions &options) const
{
    auto stat = FileUtils::getFileStat(path);
    if (!stat)
    {
        Logger::error("Error getting metadata for " + path + ": cannot stat file");
        return std::nullopt;
    }
    if (!stat->is_regular_file && !stat->is_directory)
    {
        Logger::debug("Skipping non-regular file: " + path);
        return std::nullopt;
    }

    FileRecord record;
    record.path = path;
    record.name = std::filesystem::path(path).filename().string();
    record.size = stat->size;
    record.created_time = stat->created_time;
    record.modified_time = stat->modified_time;
    record.accessed_time = stat->accessed_time;
    record.file_type = FileUtils::getFileExtension(path);
    record.is_directory = stat->is_directory;
    record.mime_type = MimeSniffer::sniff(path);

    if (options.include_hash && !record.is_directory)
    {
        record.hash = FileUtils::computeFileHash(path, hash_chunk_size_);
    }

    if (!record.is_directory && isVideoExtension(record.file_type))
    {
        try
        {
            record.video_metadata = video_analyzer_.analyze(path, options.generate_video_artifacts);
        }
        catch (const std::exception &e)
        {
            Logger::error("Error analyzing video " + path + ": " + e.what());
            record.video_metadata = std::nullopt;
        }
    }

    Logger::debug("Extracted metadata for " + path);
    return record;
}
