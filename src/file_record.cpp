#include "core/file_record.hpp"
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace
{
    template <typename T>
    nlohmann::json optionalToJson(const std::optional<T> &value)
    {
        if (value)
            return nlohmann::json(*value);
        return nullptr;
    }

    template <typename T>
    std::optional<T> optionalFromJson(const nlohmann::json &j, const std::string &key)
    {
        auto it = j.find(key);
        if (it == j.end() || it->is_null())
            return std::nullopt;
        return it->get<T>();
    }
}

std::string formatTimestamp(std::time_t timestamp)
{
    std::tm tm_buf{};
    localtime_r(&timestamp, &tm_buf);

    // The offset disambiguates the repeated hour when daylight saving time ends
    const long offset_minutes = tm_buf.tm_gmtoff / 60;
    const long abs_minutes = offset_minutes < 0 ? -offset_minutes : offset_minutes;
    std::stringstream ss;
    ss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S") << (offset_minutes < 0 ? '-' : '+')
       << std::setw(2) << std::setfill('0') << abs_minutes / 60 << ':'
       << std::setw(2) << std::setfill('0') << abs_minutes % 60;
    return ss.str();
}

std::time_t parseTimestamp(const std::string &text)
{
    std::tm tm_buf{};
    std::istringstream ss(text);
    ss >> std::get_time(&tm_buf, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail())
    {
        throw std::invalid_argument("Invalid timestamp: " + text);
    }

    std::string zone;
    ss >> zone;
    if (zone.empty())
    {
        // No offset: local time, as written by older stores
        tm_buf.tm_isdst = -1;
        return std::mktime(&tm_buf);
    }

    long offset_seconds = 0;
    if (zone != "Z")
    {
        // +HH:MM or +HHMM
        std::string digits;
        for (size_t i = 1; i < zone.size(); ++i)
        {
            if (zone[i] != ':')
                digits += zone[i];
        }
        if ((zone[0] != '+' && zone[0] != '-') || digits.size() != 4 ||
            digits.find_first_not_of("0123456789") != std::string::npos)
        {
            throw std::invalid_argument("Invalid timestamp offset: " + text);
        }
        offset_seconds = std::stol(digits.substr(0, 2)) * 3600 + std::stol(digits.substr(2, 2)) * 60;
        if (zone[0] == '-')
            offset_seconds = -offset_seconds;
    }
    return timegm(&tm_buf) - offset_seconds;
}

void to_json(nlohmann::json &j, const VideoQualityDetails &details)
{
    j = nlohmann::json{
        {"blur", details.blur},
        {"contrast", details.contrast},
        {"edge_density", details.edge_density},
        {"temporal", details.temporal}};
}

void from_json(const nlohmann::json &j, VideoQualityDetails &details)
{
    details.blur = j.value("blur", 0.0);
    details.contrast = j.value("contrast", 0.0);
    details.edge_density = j.value("edge_density", 0.0);
    details.temporal = j.value("temporal", 0.0);
}

void to_json(nlohmann::json &j, const VideoQualityResult &result)
{
    j = nlohmann::json{
        {"score", result.score},
        {"category", result.category},
        {"details", result.details}};
}

void from_json(const nlohmann::json &j, VideoQualityResult &result)
{
    result.score = j.value("score", 0.0);
    result.category = j.value("category", std::string("Unknown"));
    if (j.contains("details"))
        result.details = j.at("details").get<VideoQualityDetails>();
}

void to_json(nlohmann::json &j, const VideoRecord &record)
{
    j = nlohmann::json{
        {"width", optionalToJson(record.width)},
        {"height", optionalToJson(record.height)},
        {"duration", optionalToJson(record.duration)},
        {"bitrate", optionalToJson(record.bitrate)},
        {"codec", optionalToJson(record.codec)},
        {"fps", optionalToJson(record.fps)},
        {"file_size", optionalToJson(record.file_size)},
        {"is_low_quality", optionalToJson(record.is_low_quality)},
        {"video_screenshots", record.video_screenshots},
        {"video_quality_result", optionalToJson(record.video_quality_result)}};
}

void from_json(const nlohmann::json &j, VideoRecord &record)
{
    record.width = optionalFromJson<int>(j, "width");
    record.height = optionalFromJson<int>(j, "height");
    record.duration = optionalFromJson<double>(j, "duration");
    record.bitrate = optionalFromJson<int64_t>(j, "bitrate");
    record.codec = optionalFromJson<std::string>(j, "codec");
    record.fps = optionalFromJson<double>(j, "fps");
    record.file_size = optionalFromJson<int64_t>(j, "file_size");
    record.is_low_quality = optionalFromJson<bool>(j, "is_low_quality");
    record.video_screenshots = j.value("video_screenshots", std::vector<std::string>{});
    record.video_quality_result = optionalFromJson<VideoQualityResult>(j, "video_quality_result");
}

void to_json(nlohmann::json &j, const FileRecord &record)
{
    j = nlohmann::json{
        {"path", record.path},
        {"name", record.name},
        {"size", record.size},
        {"created_time", formatTimestamp(record.created_time)},
        {"modified_time", formatTimestamp(record.modified_time)},
        {"accessed_time", formatTimestamp(record.accessed_time)},
        {"file_type", record.file_type},
        {"mime_type", record.mime_type},
        {"hash", optionalToJson(record.hash)},
        {"perceptual_hash", optionalToJson(record.perceptual_hash)},
        {"is_directory", record.is_directory},
        {"video_metadata", optionalToJson(record.video_metadata)}};
}

void from_json(const nlohmann::json &j, FileRecord &record)
{
    record.path = j.at("path").get<std::string>();
    record.name = j.value("name", std::string());
    record.size = j.value("size", uint64_t{0});
    record.created_time = parseTimestamp(j.at("created_time").get<std::string>());
    record.modified_time = parseTimestamp(j.at("modified_time").get<std::string>());
    if (j.contains("accessed_time"))
        record.accessed_time = parseTimestamp(j.at("accessed_time").get<std::string>());
    else
        record.accessed_time = record.modified_time;
    record.file_type = j.value("file_type", std::string());
    record.mime_type = j.value("mime_type", std::string());
    record.hash = optionalFromJson<std::string>(j, "hash");
    record.perceptual_hash = optionalFromJson<std::string>(j, "perceptual_hash");
    record.is_directory = j.value("is_directory", false);
    record.video_metadata = optionalFromJson<VideoRecord>(j, "video_metadata");
}
