#include "core/video_analyzer.hpp"
#include "core/file_utils.hpp"
#include "core/frame_quality_scorer.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cctype>
#include <iterator>
#include <filesystem>
#include <stdexcept>

namespace fs = std::filesystem;

namespace
{
    // Length of the path digest appended to a screenshot directory name
    constexpr size_t kShortDigestLength = 8;
}

VideoAnalyzer::VideoAnalyzer(MediaProbe &probe, VideoConfig config)
    : probe_(probe), config_(std::move(config)), rng_(std::random_device{}())
{
}

std::optional<double> VideoAnalyzer::parseFrameRate(const std::string &rate)
{
    auto slash = rate.find('/');
    try
    {
        if (slash == std::string::npos)
        {
            size_t consumed = 0;
            double value = std::stod(rate, &consumed);
            if (consumed != rate.size())
                return std::nullopt;
            return value;
        }

        double numerator = std::stod(rate.substr(0, slash));
        double denominator = std::stod(rate.substr(slash + 1));
        if (denominator == 0.0)
            return std::nullopt;
        return numerator / denominator;
    }
    catch (const std::exception &)
    {
        return std::nullopt;
    }
}

std::optional<VideoRecord> VideoAnalyzer::probe(const std::string &path) const
{
    std::optional<ProbeResult> probed = probe_.probe(path);
    if (!probed)
    {
        Logger::warn("Could not probe video: " + path);
        return std::nullopt;
    }

    auto video_stream = std::find_if(probed->streams.begin(), probed->streams.end(),
                                     [](const ProbeStream &stream)
                                     { return stream.codec_type == "video"; });
    if (video_stream == probed->streams.end())
    {
        Logger::warn("No video stream found in " + path);
        return std::nullopt;
    }

    VideoRecord record;
    record.width = video_stream->width;
    record.height = video_stream->height;
    record.codec = video_stream->codec_name;
    if (video_stream->r_frame_rate)
        record.fps = parseFrameRate(*video_stream->r_frame_rate);
    record.duration = probed->format.duration;
    record.bitrate = probed->format.bit_rate;
    record.file_size = probed->format.size;
    return record;
}

std::optional<int64_t> VideoAnalyzer::expectedBitrate(int height, const LowQualityThresholds &thresholds)
{
    if (thresholds.bitrate_by_height.empty())
        return std::nullopt;

    auto bucket = thresholds.bitrate_by_height.upper_bound(height);
    if (bucket == thresholds.bitrate_by_height.begin())
        return bucket->second;
    return std::prev(bucket)->second;
}

int VideoAnalyzer::qualityScore(const VideoRecord &record, const LowQualityThresholds &thresholds)
{
    int score = 100;

    if (record.height && *record.height < thresholds.min_height)
        score -= 20;

    if (record.bitrate)
    {
        if (*record.bitrate < thresholds.min_bitrate)
        {
            score -= 30;
        }
        else if (record.height)
        {
            auto expected = expectedBitrate(*record.height, thresholds);
            if (expected && *record.bitrate < *expected)
                score -= 20;
        }
    }

    if (record.fps && *record.fps < thresholds.min_fps)
        score -= 10;

    if (record.file_size && record.duration && *record.duration > 0.0)
    {
        double byte_rate = static_cast<double>(*record.file_size) / *record.duration;
        if (byte_rate < thresholds.min_byte_rate)
            score -= 20;
    }

    if (record.codec)
    {
        std::string codec = *record.codec;
        std::transform(codec.begin(), codec.end(), codec.begin(), [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });
        if (std::find(thresholds.modern_codecs.begin(), thresholds.modern_codecs.end(), codec) ==
            thresholds.modern_codecs.end())
            score -= 10;
    }

    if (record.width && record.height && *record.height > 0)
    {
        double aspect_ratio = static_cast<double>(*record.width) / *record.height;
        if (aspect_ratio < thresholds.min_aspect_ratio || aspect_ratio > thresholds.max_aspect_ratio)
            score -= 5;
    }

    return score;
}

bool VideoAnalyzer::isLowQuality(const VideoRecord &record, const LowQualityThresholds &thresholds)
{
    return qualityScore(record, thresholds) < thresholds.score_threshold;
}

std::string VideoAnalyzer::screenshotDirectory(const std::string &path) const
{
    const std::string digest = FileUtils::computeStringHash(fs::absolute(path).string());
    return (fs::path(config_.screenshot_dir) /
            (fs::path(path).stem().string() + "_" + digest.substr(0, kShortDigestLength)))
        .string();
}

std::vector<std::string> VideoAnalyzer::generateScreenshots(const std::string &path, int count)
{
    std::optional<ProbeResult> probed = probe_.probe(path);
    if (!probed || !probed->format.duration)
    {
        throw std::runtime_error("Could not determine duration of " + path);
    }
    const double duration = *probed->format.duration;
    if (duration <= 1.0)
    {
        throw std::runtime_error("Video too short for screenshots (" + std::to_string(duration) + "s): " + path);
    }

    const fs::path output_dir = screenshotDirectory(path);
    fs::create_directories(output_dir);

    std::vector<std::string> screenshots;
    for (int i = 0; i < count; ++i)
    {
        const std::string output_path = (output_dir / ("screenshot_" + std::to_string(i) + ".jpg")).string();
        if (fs::exists(output_path))
        {
            Logger::debug("Reusing existing screenshot " + output_path);
            screenshots.push_back(output_path);
            continue;
        }

        double timestamp;
        {
            std::lock_guard<std::mutex> lock(rng_mutex_);
            std::uniform_real_distribution<double> pick(1.0, std::max(1.0, duration - 1.0));
            timestamp = pick(rng_);
        }

        if (probe_.captureFrame(path, timestamp, output_path) && fs::exists(output_path))
        {
            screenshots.push_back(output_path);
        }
        else
        {
            Logger::warn("Screenshot " + std::to_string(i) + " was not produced for " + path);
        }
    }

    Logger::debug("Generated " + std::to_string(screenshots.size()) + " screenshots for " + path);
    return screenshots;
}

std::optional<VideoRecord> VideoAnalyzer::analyze(const std::string &path, bool generate_artifacts)
{
    std::optional<VideoRecord> record = probe(path);
    if (!record)
    {
        return std::nullopt;
    }

    record->is_low_quality = isLowQuality(*record, config_.low_quality);

    if (!generate_artifacts)
    {
        return record;
    }

    try
    {
        record->video_screenshots = generateScreenshots(path, config_.screenshot_count);
    }
    catch (const std::exception &e)
    {
        Logger::warn("Screenshot generation failed for " + path + ": " + e.what());
    }

    if (config_.analyze_frame_quality)
    {
        try
        {
            FrameQualityScorer scorer(config_.sample_interval_seconds, config_.roi_fraction);
            record->video_quality_result = scorer.analyze(path);
        }
        catch (const std::exception &e)
        {
            Logger::warn("Frame quality analysis failed for " + path + ": " + e.what());
        }
    }

    return record;
}
