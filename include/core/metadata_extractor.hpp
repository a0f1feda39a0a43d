#pragma once

#include <optional>
#include <string>
#include <vector>
#include "core/file_record.hpp"
#include "core/scan_config.hpp"

class VideoAnalyzer;

struct ExtractionOptions
{
    bool include_hash = true;
    bool generate_video_artifacts = true;
};

/**
 * @brief Builds the FileRecord of one path: stat, MIME type, content hash and video metadata
 *
 * Every step is isolated. A failing MIME sniff falls back to application/octet-stream,
 * a failing hash or video probe leaves that field null.
 */
class MetadataExtractor
{
public:
    MetadataExtractor(const ScanConfig &config, VideoAnalyzer &video_analyzer);

    /**
     * @brief Extract the record of one file
     * @return std::nullopt if the path is not a regular file or could not be stat'ed
     */
    std::optional<FileRecord> extract(const std::string &path, const ExtractionOptions &options) const;

    bool isVideoExtension(const std::string &file_type) const;

private:
    size_t hash_chunk_size_;
    std::vector<std::string> video_extensions_;
    VideoAnalyzer &video_analyzer_;
};
