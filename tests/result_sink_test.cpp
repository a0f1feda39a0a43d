#include <gtest/gtest.h>
#include "core/result_sink.hpp"
#include "core/scan_errors.hpp"
#include "test_base.hpp"
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>

class ResultSinkTest : public TestBase
{
protected:
    std::string storePath() const { return (outputDir() / "results.json").string(); }

    std::string readFile(const std::string &path) const
    {
        std::ifstream in(path, std::ios::binary);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    nlohmann::json parseStore() const
    {
        return nlohmann::json::parse(readFile(storePath()));
    }

    static FileRecord makeRecord(const std::string &path, uint64_t size)
    {
        FileRecord record;
        record.path = path;
        record.name = path.substr(path.find_last_of('/') + 1);
        record.size = size;
        record.created_time = 1700000000;
        record.modified_time = 1700000000;
        record.accessed_time = 1700000000;
        record.file_type = ".txt";
        record.mime_type = "text/plain";
        record.hash = "d41d8cd98f00b204e9800998ecf8427e";
        return record;
    }
};

TEST_F(ResultSinkTest, InitializeWritesEmptyArray)
{
    ResultSink sink(storePath());
    sink.initialize();

    EXPECT_EQ(readFile(storePath()), "[\n]");
    EXPECT_TRUE(parseStore().is_array());
    EXPECT_TRUE(sink.readAll().empty());
}

TEST_F(ResultSinkTest, FirstAppendProducesValidArray)
{
    ResultSink sink(storePath());
    sink.initialize();
    sink.write({makeRecord("/a/one.txt", 1)}, true);

    auto json = parseStore();
    ASSERT_TRUE(json.is_array());
    ASSERT_EQ(json.size(), 1u);
    EXPECT_EQ(json[0]["path"], "/a/one.txt");
}

TEST_F(ResultSinkTest, SuccessiveAppendsStayValid)
{
    ResultSink sink(storePath());
    sink.initialize();

    size_t expected = 0;
    for (int batch = 0; batch < 3; ++batch)
    {
        std::vector<FileRecord> records;
        for (int i = 0; i <= batch; ++i)
            records.push_back(makeRecord("/a/file_" + std::to_string(batch) + "_" + std::to_string(i), i));
        sink.write(records, true);
        expected += records.size();

        auto json = parseStore();
        ASSERT_TRUE(json.is_array()) << "after append " << batch;
        EXPECT_EQ(json.size(), expected);
    }

    auto all = sink.readAll();
    ASSERT_EQ(all.size(), 6u);
    EXPECT_EQ(all.front().path, "/a/file_0_0");
    EXPECT_EQ(all.back().path, "/a/file_2_2");
    EXPECT_EQ(sink.getRecordCount(), 6u);
}

TEST_F(ResultSinkTest, EntriesAreOnePerLine)
{
    ResultSink sink(storePath());
    sink.initialize();
    sink.write({makeRecord("/a/1", 1), makeRecord("/a/2", 2)}, true);

    std::string content = readFile(storePath());
    EXPECT_EQ(content.rfind("[\n", 0), 0u);
    EXPECT_EQ(content.substr(content.size() - 2), "\n]");
    EXPECT_NE(content.find("},\n{"), std::string::npos);
}

TEST_F(ResultSinkTest, ReplaceModeOverwrites)
{
    ResultSink sink(storePath());
    sink.initialize();
    sink.write({makeRecord("/a/1", 1), makeRecord("/a/2", 2)}, true);
    sink.write({makeRecord("/b/only", 3)}, false);

    auto all = sink.readAll();
    ASSERT_EQ(all.size(), 1u);
    EXPECT_EQ(all[0].path, "/b/only");

    // Appending after a replace continues the new array
    sink.write({makeRecord("/b/next", 4)}, true);
    EXPECT_EQ(parseStore().size(), 2u);
}

TEST_F(ResultSinkTest, EmptyWriteIsNoOp)
{
    ResultSink sink(storePath());
    sink.initialize();
    sink.write({makeRecord("/a/1", 1)}, true);
    const std::string before = readFile(storePath());

    sink.write({}, true);
    sink.write({}, false);

    EXPECT_EQ(readFile(storePath()), before);
}

TEST_F(ResultSinkTest, OpenAdoptsExistingStore)
{
    {
        std::ofstream out(storePath());
        out << "[ {\"path\": \"/x\", \"name\": \"x\", \"size\": 5, \"created_time\": \"2024-01-01T00:00:00\","
               " \"modified_time\": \"2024-01-01T00:00:00\", \"file_type\": \"\", \"mime_type\": \"text/plain\","
               " \"hash\": null, \"perceptual_hash\": null, \"is_directory\": false, \"video_metadata\": null} ]   ";
    }

    ResultSink sink(storePath());
    sink.open();
    EXPECT_EQ(sink.getRecordCount(), 1u);

    sink.write({makeRecord("/y", 1)}, true);
    auto all = sink.readAll();
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all[0].path, "/x");
    EXPECT_EQ(all[1].path, "/y");
}

TEST_F(ResultSinkTest, OpenRejectsCorruptStore)
{
    {
        std::ofstream out(storePath());
        out << "[ {\"path\": ";
    }
    ResultSink sink(storePath());
    EXPECT_THROW(sink.open(), StoreError);
}

TEST_F(ResultSinkTest, AppendWithoutInitializeCreatesStore)
{
    ResultSink sink((outputDir() / "nested" / "fresh.json").string());
    sink.write({makeRecord("/a/1", 1)}, true);

    EXPECT_EQ(sink.readAll().size(), 1u);
}

TEST_F(ResultSinkTest, UnwritableLocationThrowsStoreError)
{
    std::string blocker = createFile("blocker", "file, not a directory");
    ResultSink sink(blocker + "/results.json");
    EXPECT_THROW(sink.initialize(), StoreError);
}

TEST_F(ResultSinkTest, ReadAllOfMissingStoreThrows)
{
    ResultSink sink((outputDir() / "missing.json").string());
    EXPECT_THROW(sink.readAll(), StoreError);
}
