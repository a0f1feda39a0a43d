#include <gtest/gtest.h>
#include "core/frame_quality_scorer.hpp"
#include "core/scan_errors.hpp"
#include "test_base.hpp"
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <opencv2/videoio.hpp>
#include <fstream>
#include <iterator>

class FrameQualityScorerTest : public TestBase
{
protected:
    // Writes a short MJPG clip; returns an empty string if no encoder is available
    std::string writeClip(const std::string &name, bool textured, int frames = 30, double fps = 10.0)
    {
        const std::string path = (treeDir() / name).string();
        cv::VideoWriter writer(path, cv::VideoWriter::fourcc('M', 'J', 'P', 'G'), fps, cv::Size(320, 240));
        if (!writer.isOpened())
            return "";

        cv::RNG rng(42);
        for (int i = 0; i < frames; ++i)
        {
            cv::Mat frame(240, 320, CV_8UC3, cv::Scalar(90, 90, 90));
            if (textured)
            {
                for (int y = 0; y < frame.rows; y += 8)
                    for (int x = 0; x < frame.cols; x += 8)
                        cv::rectangle(frame, cv::Rect(x, y, 8, 8),
                                      ((x + y) / 8) % 2 ? cv::Scalar(255, 255, 255) : cv::Scalar(0, 0, 0), cv::FILLED);
            }
            writer.write(frame);
        }
        writer.release();
        return path;
    }
};

TEST_F(FrameQualityScorerTest, NoSamplesYieldsUnknown)
{
    VideoQualityResult result = FrameQualityScorer::aggregate({});
    EXPECT_DOUBLE_EQ(result.score, 0.0);
    EXPECT_EQ(result.category, "Unknown");
    EXPECT_DOUBLE_EQ(result.details.blur, 0.0);
    EXPECT_DOUBLE_EQ(result.details.contrast, 0.0);
    EXPECT_DOUBLE_EQ(result.details.edge_density, 0.0);
    EXPECT_DOUBLE_EQ(result.details.temporal, 0.0);
}

TEST_F(FrameQualityScorerTest, AggregateNormalizesAndWeights)
{
    FrameMetrics first{150.0, 25.0, 0.1, 0.0};
    FrameMetrics second{450.0, 75.0, 0.3, 30.0};

    VideoQualityResult result = FrameQualityScorer::aggregate({first, second});

    // Means: blur 300, contrast 50, edge 0.2, temporal 15
    EXPECT_DOUBLE_EQ(result.details.blur, 1.0);
    EXPECT_DOUBLE_EQ(result.details.contrast, 1.0);
    EXPECT_DOUBLE_EQ(result.details.edge_density, 1.0);
    EXPECT_DOUBLE_EQ(result.details.temporal, 0.5);
    EXPECT_NEAR(result.score, 95.0, 1e-9);
    EXPECT_EQ(result.category, "High Quality");
}

TEST_F(FrameQualityScorerTest, DetailsAreNotClampedButScoreIs)
{
    FrameMetrics sharp{3000.0, 500.0, 1.0, 0.0};

    VideoQualityResult result = FrameQualityScorer::aggregate({sharp});

    EXPECT_DOUBLE_EQ(result.details.blur, 10.0);
    EXPECT_DOUBLE_EQ(result.details.contrast, 10.0);
    EXPECT_DOUBLE_EQ(result.details.edge_density, 5.0);
    EXPECT_DOUBLE_EQ(result.details.temporal, 1.0);
    EXPECT_NEAR(result.score, 100.0, 1e-9);
}

TEST_F(FrameQualityScorerTest, FlatFramesScoreLow)
{
    FrameMetrics flat{0.0, 0.0, 0.0, 0.0};

    VideoQualityResult result = FrameQualityScorer::aggregate({flat, flat, flat});

    // Only temporal stability contributes
    EXPECT_NEAR(result.score, 10.0, 1e-9);
    EXPECT_EQ(result.category, "Low Quality");
}

TEST_F(FrameQualityScorerTest, Categories)
{
    EXPECT_EQ(FrameQualityScorer::categorize(75.0), "High Quality");
    EXPECT_EQ(FrameQualityScorer::categorize(74.99), "Medium Quality");
    EXPECT_EQ(FrameQualityScorer::categorize(55.0), "Medium Quality");
    EXPECT_EQ(FrameQualityScorer::categorize(54.99), "Low Quality");
}

TEST_F(FrameQualityScorerTest, MissingFileCannotBeOpened)
{
    FrameQualityScorer scorer;
    EXPECT_THROW(scorer.analyze((treeDir() / "missing.mp4").string()), CannotOpenError);
}

TEST_F(FrameQualityScorerTest, TexturedClipOutscoresFlatClip)
{
    const std::string textured = writeClip("textured.avi", true);
    const std::string flat = writeClip("flat.avi", false);
    if (textured.empty() || flat.empty())
    {
        GTEST_SKIP() << "No MJPG encoder available";
    }

    FrameQualityScorer scorer(1.0, 0.3);
    VideoQualityResult textured_result = scorer.analyze(textured);
    VideoQualityResult flat_result = scorer.analyze(flat);

    EXPECT_NE(textured_result.category, "Unknown");
    EXPECT_GT(textured_result.score, flat_result.score);
    EXPECT_GT(textured_result.details.edge_density, flat_result.details.edge_density);
    EXPECT_GE(textured_result.score, 0.0);
    EXPECT_LE(textured_result.score, 100.0);
}

TEST_F(FrameQualityScorerTest, ClipWithoutFramesYieldsUnknown)
{
    const std::string empty_clip = writeClip("empty.avi", true, 0);
    const std::string full_clip = writeClip("full.avi", true);
    if (empty_clip.empty() || full_clip.empty())
    {
        GTEST_SKIP() << "No MJPG encoder available";
    }

    // Keep the AVI headers but cut every frame: the file ends right after the "movi" list tag
    std::ifstream in(full_clip, std::ios::binary);
    std::string bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    const size_t movi = bytes.find("movi");
    ASSERT_NE(movi, std::string::npos);
    const std::string truncated_clip = (treeDir() / "truncated.avi").string();
    {
        std::ofstream out(truncated_clip, std::ios::binary);
        out << bytes.substr(0, movi + 4);
    }

    FrameQualityScorer scorer;
    size_t analyzed = 0;
    for (const std::string &clip : {empty_clip, truncated_clip})
    {
        cv::VideoCapture cap(clip);
        if (!cap.isOpened())
            continue;
        cap.release();

        VideoQualityResult result;
        EXPECT_NO_THROW(result = scorer.analyze(clip)) << clip;
        EXPECT_DOUBLE_EQ(result.score, 0.0) << clip;
        EXPECT_EQ(result.category, "Unknown") << clip;
        EXPECT_DOUBLE_EQ(result.details.blur, 0.0) << clip;
        EXPECT_DOUBLE_EQ(result.details.temporal, 0.0) << clip;
        analyzed++;
    }
    if (analyzed == 0)
    {
        GTEST_SKIP() << "Video backend refuses to open clips without frames";
    }
}
