#include <gtest/gtest.h>
#include "core/media_probe.hpp"
#include "core/video_analyzer.hpp"
#include "test_base.hpp"
#include <algorithm>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <opencv2/videoio.hpp>

class FfmpegMediaProbeTest : public TestBase
{
protected:
    // 4 second 320x240 MJPG clip at 10 fps, empty string if no encoder is available
    std::string writeClip(const std::string &name)
    {
        const std::string path = (treeDir() / name).string();
        cv::VideoWriter writer(path, cv::VideoWriter::fourcc('M', 'J', 'P', 'G'), 10.0, cv::Size(320, 240));
        if (!writer.isOpened())
            return "";
        for (int i = 0; i < 40; ++i)
        {
            cv::Mat frame(240, 320, CV_8UC3, cv::Scalar(40, 80, 120));
            cv::putText(frame, std::to_string(i), cv::Point(100, 140), cv::FONT_HERSHEY_SIMPLEX, 2.0,
                        cv::Scalar(255, 255, 255), 3);
            writer.write(frame);
        }
        writer.release();
        return path;
    }

    FfmpegMediaProbe probe_;
};

TEST_F(FfmpegMediaProbeTest, ProbeReportsVideoStream)
{
    const std::string clip = writeClip("clip.avi");
    if (clip.empty())
        GTEST_SKIP() << "No MJPG encoder available";

    auto result = probe_.probe(clip);
    ASSERT_TRUE(result.has_value());

    auto video = std::find_if(result->streams.begin(), result->streams.end(), [](const ProbeStream &stream)
                              { return stream.codec_type == "video"; });
    ASSERT_NE(video, result->streams.end());
    EXPECT_EQ(video->width.value_or(0), 320);
    EXPECT_EQ(video->height.value_or(0), 240);
    EXPECT_EQ(video->codec_name.value_or(""), "mjpeg");
    ASSERT_TRUE(video->r_frame_rate.has_value());
    EXPECT_NEAR(VideoAnalyzer::parseFrameRate(*video->r_frame_rate).value_or(0.0), 10.0, 0.01);

    ASSERT_TRUE(result->format.size.has_value());
    EXPECT_EQ(*result->format.size, static_cast<int64_t>(std::filesystem::file_size(clip)));
    ASSERT_TRUE(result->format.duration.has_value());
    EXPECT_NEAR(*result->format.duration, 4.0, 0.5);
}

TEST_F(FfmpegMediaProbeTest, ProbeRejectsNonMedia)
{
    const std::string text = createFile("empty.mp4", "");
    EXPECT_FALSE(probe_.probe(text).has_value());
    EXPECT_FALSE(probe_.probe((treeDir() / "missing.mp4").string()).has_value());
}

TEST_F(FfmpegMediaProbeTest, CaptureFrameWritesImage)
{
    const std::string clip = writeClip("clip.avi");
    if (clip.empty())
        GTEST_SKIP() << "No MJPG encoder available";

    const std::string output = (outputDir() / "frame.jpg").string();
    ASSERT_TRUE(probe_.captureFrame(clip, 2.0, output));

    cv::Mat image = cv::imread(output);
    ASSERT_FALSE(image.empty());
    EXPECT_EQ(image.cols, 320);
    EXPECT_EQ(image.rows, 240);
}

TEST_F(FfmpegMediaProbeTest, CaptureFrameFailsOnNonMedia)
{
    const std::string text = createFile("empty.avi", "");
    const std::string output = (outputDir() / "frame.jpg").string();
    EXPECT_FALSE(probe_.captureFrame(text, 1.0, output));
    EXPECT_FALSE(std::filesystem::exists(output));
}
