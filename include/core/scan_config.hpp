#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>
#include "core/file_utils.hpp"

/**
 * @brief Deductions used by the heuristic low-quality video check
 */
struct LowQualityThresholds
{
    int min_height = 480;
    double min_fps = 24.0;
    int64_t min_bitrate = 500000;   // absolute floor, bits per second
    double min_byte_rate = 102400.0; // file_size / duration, bytes per second
    int score_threshold = 40;       // low quality iff score < threshold
    double min_aspect_ratio = 0.5;
    double max_aspect_ratio = 2.5;
    std::vector<std::string> modern_codecs = {"h264", "hevc", "h265", "vp9", "av1"};
    // Expected bitrate keyed by frame height
    std::map<int, int64_t> bitrate_by_height = {
        {240, 300000},
        {360, 500000},
        {480, 800000},
        {720, 1500000},
        {1080, 3000000}};
};

struct VideoConfig
{
    LowQualityThresholds low_quality;
    std::string screenshot_dir = "scan_output/screenshots";
    int screenshot_count = 3;
    bool analyze_frame_quality = true;
    double sample_interval_seconds = 1.0;
    double roi_fraction = 0.3;
    int probe_retries = 1;
};

/**
 * @brief Plain configuration value handed to the scan pipeline at construction
 */
struct ScanConfig
{
    std::string log_level = "INFO";
    std::string output_dir = "scan_output";
    std::string progress_file = "scan_progress.json";
    size_t max_workers = 0; // 0 = min(4, hardware threads)
    size_t hash_chunk_size = 8192;
    size_t min_batch_size = 100;
    size_t max_batch_size = 1000;
    size_t flush_every = 100;
    EnumerationOptions enumeration;
    std::vector<std::string> video_extensions = {".mp4", ".avi", ".mov", ".mkv", ".wmv", ".flv"};
    VideoConfig video;
};
