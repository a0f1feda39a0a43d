#include <gtest/gtest.h>
#include "core/file_record.hpp"
#include <cstdlib>
#include <ctime>
#include <string>

class FileRecordTimestampTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        const char *current = std::getenv("TZ");
        had_tz_ = current != nullptr;
        if (had_tz_)
            saved_tz_ = current;
        // US Eastern rules spelled out, so no zoneinfo database is needed
        setenv("TZ", "EST5EDT,M3.2.0,M11.1.0", 1);
        tzset();
    }

    void TearDown() override
    {
        if (had_tz_)
            setenv("TZ", saved_tz_.c_str(), 1);
        else
            unsetenv("TZ");
        tzset();
    }

private:
    bool had_tz_ = false;
    std::string saved_tz_;
};

TEST_F(FileRecordTimestampTest, FormatCarriesOffset)
{
    // 2024-01-15T12:00:00Z is winter time in New York
    EXPECT_EQ(formatTimestamp(1705320000), "2024-01-15T07:00:00-05:00");
    // 2024-07-15T12:00:00Z is summer time
    EXPECT_EQ(formatTimestamp(1721044800), "2024-07-15T08:00:00-04:00");
}

TEST_F(FileRecordTimestampTest, RepeatedHourRoundTripsExactly)
{
    // Both instants read 01:30 local on 2023-11-05, once in EDT and once in EST
    const std::time_t first = 1699162200;
    const std::time_t second = 1699165800;
    ASSERT_NE(formatTimestamp(first), formatTimestamp(second));

    EXPECT_EQ(parseTimestamp(formatTimestamp(first)), first);
    EXPECT_EQ(parseTimestamp(formatTimestamp(second)), second);
}

TEST_F(FileRecordTimestampTest, RecordRoundTripKeepsTimes)
{
    FileRecord record;
    record.path = "/videos/clip.mp4";
    record.name = "clip.mp4";
    record.created_time = 1699162200;
    record.modified_time = 1699165800;
    record.accessed_time = 1699165800;

    FileRecord parsed = nlohmann::json(record).get<FileRecord>();
    EXPECT_EQ(parsed.created_time, record.created_time);
    EXPECT_EQ(parsed.modified_time, record.modified_time);
    EXPECT_EQ(parsed.accessed_time, record.accessed_time);
}

TEST_F(FileRecordTimestampTest, ParsesUtcAndOffsetForms)
{
    EXPECT_EQ(parseTimestamp("2024-01-01T00:00:00Z"), 1704067200);
    EXPECT_EQ(parseTimestamp("2024-01-01T02:00:00+02:00"), 1704067200);
    EXPECT_EQ(parseTimestamp("2023-12-31T19:00:00-0500"), 1704067200);
}

TEST_F(FileRecordTimestampTest, TimestampWithoutOffsetIsLocalTime)
{
    EXPECT_EQ(parseTimestamp("2024-01-15T07:00:00"), 1705320000);
}

TEST_F(FileRecordTimestampTest, MalformedTimestampsThrow)
{
    EXPECT_THROW(parseTimestamp("yesterday"), std::invalid_argument);
    EXPECT_THROW(parseTimestamp("2024-01-01T00:00:00+2"), std::invalid_argument);
    EXPECT_THROW(parseTimestamp("2024-01-01T00:00:00 UTC"), std::invalid_argument);
}
