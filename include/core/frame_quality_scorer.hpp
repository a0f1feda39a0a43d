#pragma once

#include <string>
#include <vector>
#include <opencv2/core.hpp>
#include "core/file_record.hpp"

/**
 * @brief Raw metrics measured on one sampled frame
 */
struct FrameMetrics
{
    double blur = 0.0;         // variance of the Laplacian
    double contrast = 0.0;     // std-dev of Lab lightness
    double edge_density = 0.0; // fraction of Canny edge pixels
    double temporal = 0.0;     // mean absolute difference to the previous sample
};

/**
 * @brief Scores the visual quality of a local video by sampling frames with OpenCV
 *
 * One frame is sampled every sample_interval_seconds. Metrics are taken on a centered
 * region covering roi_fraction of the frame's width and height.
 */
class FrameQualityScorer
{
public:
    explicit FrameQualityScorer(double sample_interval_seconds = 1.0, double roi_fraction = 0.3);

    /**
     * @brief Sample and score a video
     * @throws CannotOpenError if the container cannot be opened for decoding
     * @return Weighted score; score 0 / "Unknown" if no frame could be sampled
     */
    VideoQualityResult analyze(const std::string &path) const;

    /**
     * @brief Combine per-sample metrics into a score and category
     *
     * Never throws; an empty input or a numeric failure yields the "Unknown" result.
     */
    static VideoQualityResult aggregate(const std::vector<FrameMetrics> &samples);

    static std::string categorize(double score);

private:
    cv::Mat extractRoi(const cv::Mat &frame) const;

    double sample_interval_seconds_;
    double roi_fraction_;
};
