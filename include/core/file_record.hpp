#pragma once

#include <ctime>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

/**
 * @brief Normalized frame metrics behind a quality score
 *
 * Each value is the raw metric divided by its normalization constant; values may exceed 1.0,
 * clamping only happens when the score is weighted.
 */
struct VideoQualityDetails
{
    double blur = 0.0;
    double contrast = 0.0;
    double edge_density = 0.0;
    double temporal = 0.0;
};

/**
 * @brief Result of frame-sampling quality analysis
 */
struct VideoQualityResult
{
    double score = 0.0;             // 0 - 100
    std::string category = "Unknown"; // High Quality / Medium Quality / Low Quality / Unknown
    VideoQualityDetails details;
};

/**
 * @brief Stream and container attributes of a video file
 *
 * Every numeric attribute is optional: an absent value means the probe could not
 * determine it, never that it is zero.
 */
struct VideoRecord
{
    std::optional<int> width;
    std::optional<int> height;
    std::optional<double> duration; // seconds
    std::optional<int64_t> bitrate; // bits per second
    std::optional<std::string> codec;
    std::optional<double> fps;
    std::optional<int64_t> file_size;
    std::optional<bool> is_low_quality;
    std::vector<std::string> video_screenshots;
    std::optional<VideoQualityResult> video_quality_result;
};

/**
 * @brief One enumerated file with its content and identity metadata
 */
struct FileRecord
{
    std::string path;
    std::string name;
    uint64_t size = 0;
    std::time_t created_time = 0;
    std::time_t modified_time = 0;
    std::time_t accessed_time = 0;
    std::string file_type; // lower-cased extension including the dot
    std::string mime_type;
    std::optional<std::string> hash;
    std::optional<std::string> perceptual_hash;
    bool is_directory = false;
    std::optional<VideoRecord> video_metadata;
};

// ISO-8601 local time with UTC offset, e.g. 2024-05-01T13:45:10+02:00.
// Parsing also accepts a trailing Z, and no offset at all (read as local time).
std::string formatTimestamp(std::time_t timestamp);
std::time_t parseTimestamp(const std::string &text);

void to_json(nlohmann::json &j, const VideoQualityDetails &details);
void from_json(const nlohmann::json &j, VideoQualityDetails &details);
void to_json(nlohmann::json &j, const VideoQualityResult &result);
void from_json(const nlohmann::json &j, VideoQualityResult &result);
void to_json(nlohmann::json &j, const VideoRecord &record);
void from_json(const nlohmann::json &j, VideoRecord &record);
void to_json(nlohmann::json &j, const FileRecord &record);
void from_json(const nlohmann::json &j, FileRecord &record);
