#pragma once

#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <vector>
#include "core/file_record.hpp"
#include "core/media_probe.hpp"
#include "core/scan_config.hpp"

/**
 * @brief Video enrichment: probe attributes, low-quality heuristic, screenshots and frame scoring
 *
 * The probe is borrowed and must outlive the analyzer. Safe to share across worker threads
 * when the probe itself is.
 */
class VideoAnalyzer
{
public:
    VideoAnalyzer(MediaProbe &probe, VideoConfig config);

    /**
     * @brief Read stream and container attributes of a video
     * @return Populated record, or std::nullopt if the file could not be probed or has no video stream
     */
    std::optional<VideoRecord> probe(const std::string &path) const;

    /**
     * @brief Full enrichment of one video
     *
     * Sets is_low_quality; with generate_artifacts it also captures screenshots and, if
     * enabled, scores frame quality. A failing artifact step leaves its field empty.
     */
    std::optional<VideoRecord> analyze(const std::string &path, bool generate_artifacts);

    /**
     * @brief Capture n frames at random times into the per-video screenshot directory
     *
     * Existing screenshots are reused, so running twice produces no new captures.
     * @throws std::runtime_error if the duration is unknown or not longer than one second
     * @return Paths of the screenshot files that exist
     */
    std::vector<std::string> generateScreenshots(const std::string &path, int count);

    /**
     * @brief Heuristic quality score starting at 100, minus deductions
     *
     * Checks whose inputs are absent are skipped.
     */
    static int qualityScore(const VideoRecord &record, const LowQualityThresholds &thresholds);
    static bool isLowQuality(const VideoRecord &record, const LowQualityThresholds &thresholds);

    // "30000/1001" -> 29.97; empty on a zero denominator or unparsable text
    static std::optional<double> parseFrameRate(const std::string &rate);

    // Expected bitrate for the largest bucket not taller than height
    static std::optional<int64_t> expectedBitrate(int height, const LowQualityThresholds &thresholds);

    std::string screenshotDirectory(const std::string &path) const;

private:
    MediaProbe &probe_;
    VideoConfig config_;
    std::mt19937 rng_;
    std::mutex rng_mutex_;
};
