#include <gtest/gtest.h>
#include "core/metadata_extractor.hpp"
#include "core/mime_sniffer.hpp"
#include "core/video_analyzer.hpp"
#include "fake_media_probe.hpp"
#include "test_base.hpp"
#include <filesystem>

class MetadataExtractorTest : public TestBase
{
protected:
    void SetUp() override
    {
        TestBase::SetUp();
        config_ = testConfig();
        config_.video.analyze_frame_quality = false;
        analyzer_ = std::make_unique<VideoAnalyzer>(probe_, config_.video);
        extractor_ = std::make_unique<MetadataExtractor>(config_, *analyzer_);
    }

    ScanConfig config_;
    FakeMediaProbe probe_;
    std::unique_ptr<VideoAnalyzer> analyzer_;
    std::unique_ptr<MetadataExtractor> extractor_;
};

TEST_F(MetadataExtractorTest, RegularFileRecord)
{
    const std::string path = createFile("docs/Readme.TXT", "hello world");

    auto record = extractor_->extract(path, ExtractionOptions{true, false});
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->path, path);
    EXPECT_EQ(record->name, "Readme.TXT");
    EXPECT_EQ(record->size, 11u);
    EXPECT_EQ(record->file_type, ".txt");
    EXPECT_EQ(record->mime_type, "text/plain");
    EXPECT_EQ(record->hash.value_or(""), "5eb63bbbe01eeed093cb22bb8f5acdc3");
    EXPECT_FALSE(record->perceptual_hash.has_value());
    EXPECT_FALSE(record->is_directory);
    EXPECT_FALSE(record->video_metadata.has_value());
    EXPECT_GT(record->modified_time, 0);
}

TEST_F(MetadataExtractorTest, HashIsOptional)
{
    const std::string path = createFile("data.bin", "abc");

    auto record = extractor_->extract(path, ExtractionOptions{false, false});
    ASSERT_TRUE(record.has_value());
    EXPECT_FALSE(record->hash.has_value());
}

TEST_F(MetadataExtractorTest, VanishedFileIsSkipped)
{
    EXPECT_FALSE(extractor_->extract((treeDir() / "gone.txt").string(), ExtractionOptions{}).has_value());
}

TEST_F(MetadataExtractorTest, VideoExtensionDelegatesToAnalyzer)
{
    const std::string path = createFile("movie.MKV", "fake");
    probe_.setResult(path, FakeMediaProbe::hdVideo());

    auto record = extractor_->extract(path, ExtractionOptions{true, false});
    ASSERT_TRUE(record.has_value());
    ASSERT_TRUE(record->video_metadata.has_value());
    EXPECT_EQ(record->video_metadata->height.value_or(0), 1080);
    EXPECT_EQ(record->video_metadata->is_low_quality, std::optional<bool>(false));
}

TEST_F(MetadataExtractorTest, UnprobeableVideoHasNullMetadata)
{
    const std::string path = createFile("corrupt.mp4", "garbage bytes");

    auto record = extractor_->extract(path, ExtractionOptions{true, true});
    ASSERT_TRUE(record.has_value());
    EXPECT_FALSE(record->video_metadata.has_value());
    EXPECT_TRUE(record->hash.has_value());
}

TEST_F(MetadataExtractorTest, NonVideoExtensionIsNotProbed)
{
    const std::string path = createFile("clip.txt", "fake");
    probe_.setResult(path, FakeMediaProbe::hdVideo());

    auto record = extractor_->extract(path, ExtractionOptions{});
    ASSERT_TRUE(record.has_value());
    EXPECT_FALSE(record->video_metadata.has_value());
    EXPECT_EQ(probe_.probe_calls.load(), 0);
}

TEST_F(MetadataExtractorTest, ConfiguredExtensionsAreNormalized)
{
    config_.video_extensions = {"MP4", ".Webm"};
    MetadataExtractor extractor(config_, *analyzer_);
    EXPECT_TRUE(extractor.isVideoExtension(".mp4"));
    EXPECT_TRUE(extractor.isVideoExtension(".webm"));
    EXPECT_FALSE(extractor.isVideoExtension(".avi"));
}

TEST_F(MetadataExtractorTest, MimeSnifferFallsBackForMissingFile)
{
    EXPECT_EQ(MimeSniffer::sniff((treeDir() / "missing").string()), "application/octet-stream");
}

TEST_F(MetadataExtractorTest, RecordSerializesWithNulls)
{
    const std::string path = createFile("note.txt", "x");
    auto record = extractor_->extract(path, ExtractionOptions{false, false});
    ASSERT_TRUE(record.has_value());

    nlohmann::json json = *record;
    EXPECT_TRUE(json["hash"].is_null());
    EXPECT_TRUE(json["perceptual_hash"].is_null());
    EXPECT_TRUE(json["video_metadata"].is_null());
    EXPECT_EQ(json["modified_time"].get<std::string>().size(), 25u);

    FileRecord parsed = json.get<FileRecord>();
    EXPECT_EQ(parsed.path, path);
    EXPECT_EQ(parsed.modified_time, record->modified_time);
}
