#include "core/frame_quality_scorer.hpp"
#include "core/scan_errors.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cmath>
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <opencv2/videoio.hpp>

namespace
{
    constexpr double kBlurNorm = 300.0;
    constexpr double kContrastNorm = 50.0;
    constexpr double kEdgeNorm = 0.2;
    constexpr double kTemporalNorm = 30.0;

    constexpr double kBlurWeight = 0.4;
    constexpr double kContrastWeight = 0.3;
    constexpr double kEdgeWeight = 0.2;
    constexpr double kTemporalWeight = 0.1;

    double meanOverChannels(const cv::Mat &image)
    {
        cv::Scalar per_channel = cv::mean(image);
        double sum = 0.0;
        for (int c = 0; c < image.channels(); ++c)
            sum += per_channel[c];
        return sum / std::max(1, image.channels());
    }

    FrameMetrics measure(const cv::Mat &roi)
    {
        FrameMetrics metrics;

        cv::Mat gray;
        if (roi.channels() == 3)
            cv::cvtColor(roi, gray, cv::COLOR_BGR2GRAY);
        else
            gray = roi;

        cv::Mat laplacian;
        cv::Laplacian(gray, laplacian, CV_64F);
        cv::Scalar mean, stddev;
        cv::meanStdDev(laplacian, mean, stddev);
        metrics.blur = stddev[0] * stddev[0];

        if (roi.channels() == 3)
        {
            cv::Mat lab;
            cv::cvtColor(roi, lab, cv::COLOR_BGR2Lab);
            cv::Mat lightness;
            cv::extractChannel(lab, lightness, 0);
            cv::meanStdDev(lightness, mean, stddev);
        }
        else
        {
            cv::meanStdDev(gray, mean, stddev);
        }
        metrics.contrast = stddev[0];

        cv::Mat edges;
        cv::Canny(gray, edges, 100, 200);
        metrics.edge_density = static_cast<double>(cv::countNonZero(edges)) / static_cast<double>(gray.total());

        return metrics;
    }
}

FrameQualityScorer::FrameQualityScorer(double sample_interval_seconds, double roi_fraction)
    : sample_interval_seconds_(sample_interval_seconds), roi_fraction_(roi_fraction)
{
}

cv::Mat FrameQualityScorer::extractRoi(const cv::Mat &frame) const
{
    const int x1 = static_cast<int>(frame.cols * (0.5 - roi_fraction_ / 2));
    const int x2 = static_cast<int>(frame.cols * (0.5 + roi_fraction_ / 2));
    const int y1 = static_cast<int>(frame.rows * (0.5 - roi_fraction_ / 2));
    const int y2 = static_cast<int>(frame.rows * (0.5 + roi_fraction_ / 2));
    cv::Rect rect(x1, y1, std::max(1, x2 - x1), std::max(1, y2 - y1));
    rect &= cv::Rect(0, 0, frame.cols, frame.rows);
    return frame(rect).clone();
}

VideoQualityResult FrameQualityScorer::analyze(const std::string &path) const
{
    Logger::info("Starting frame quality analysis for video: " + path);
    cv::VideoCapture cap(path);
    if (!cap.isOpened())
    {
        Logger::error("Could not open video file " + path);
        throw CannotOpenError(path);
    }

    const double fps = cap.get(cv::CAP_PROP_FPS);
    const int total_frames = static_cast<int>(cap.get(cv::CAP_PROP_FRAME_COUNT));
    const int sample_step = std::max(1, static_cast<int>(std::lround(fps * sample_interval_seconds_)));
    Logger::debug("Video FPS: " + std::to_string(fps) + ", total frames: " + std::to_string(total_frames) +
                  ", sampling every " + std::to_string(sample_step) + " frames");

    std::vector<FrameMetrics> samples;
    cv::Mat previous_roi;
    cv::Mat frame;
    for (int frame_idx = 0; frame_idx < total_frames; frame_idx += sample_step)
    {
        cap.set(cv::CAP_PROP_POS_FRAMES, frame_idx);
        if (!cap.read(frame) || frame.empty())
        {
            Logger::warn("Frame " + std::to_string(frame_idx) + " could not be read, stopping iteration");
            break;
        }

        try
        {
            cv::Mat roi = extractRoi(frame);
            FrameMetrics metrics = measure(roi);
            if (!previous_roi.empty() && previous_roi.size() == roi.size() && previous_roi.type() == roi.type())
            {
                cv::Mat diff;
                cv::absdiff(previous_roi, roi, diff);
                metrics.temporal = meanOverChannels(diff);
            }
            samples.push_back(metrics);
            previous_roi = roi;
        }
        catch (const cv::Exception &e)
        {
            Logger::error("Error measuring frame " + std::to_string(frame_idx) + " of " + path + ": " + e.what());
        }
    }
    cap.release();

    VideoQualityResult result = aggregate(samples);
    Logger::info("Finished frame quality analysis for " + path + ": " + result.category +
                 " (" + std::to_string(result.score) + ")");
    return result;
}

VideoQualityResult FrameQualityScorer::aggregate(const std::vector<FrameMetrics> &samples)
{
    if (samples.empty())
    {
        Logger::warn("No frame metrics were collected; returning default quality result");
        return VideoQualityResult{};
    }

    FrameMetrics mean;
    for (const auto &sample : samples)
    {
        mean.blur += sample.blur;
        mean.contrast += sample.contrast;
        mean.edge_density += sample.edge_density;
        mean.temporal += sample.temporal;
    }
    const double count = static_cast<double>(samples.size());

    VideoQualityDetails details;
    details.blur = mean.blur / count / kBlurNorm;
    details.contrast = mean.contrast / count / kContrastNorm;
    details.edge_density = mean.edge_density / count / kEdgeNorm;
    details.temporal = 1.0 - (mean.temporal / count) / kTemporalNorm;

    const double score = 100.0 * (kBlurWeight * std::min(details.blur, 1.0) +
                                  kContrastWeight * std::min(details.contrast, 1.0) +
                                  kEdgeWeight * std::min(details.edge_density, 1.0) +
                                  kTemporalWeight * std::min(details.temporal, 1.0));
    if (!std::isfinite(score))
    {
        Logger::error("Frame quality aggregation produced a non-finite score");
        return VideoQualityResult{};
    }

    VideoQualityResult result;
    result.score = score;
    result.category = categorize(score);
    result.details = details;
    return result;
}

std::string FrameQualityScorer::categorize(double score)
{
    if (score >= 75.0)
        return "High Quality";
    if (score >= 55.0)
        return "Medium Quality";
    return "Low Quality";
}
