#pragma once

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>
#include "core/scan_config.hpp"
#include "logging/logger.hpp"

/**
 * @brief Base class for tests that need a scratch directory tree
 *
 * Each test gets its own directory under the system temp path, removed on TearDown.
 */
class TestBase : public ::testing::Test
{
protected:
    void SetUp() override
    {
        Logger::init("WARN");

        static std::atomic<int> counter{0};
        const auto *info = ::testing::UnitTest::GetInstance()->current_test_info();
        test_dir_ = std::filesystem::temp_directory_path() /
                    ("disk_explorer_test_" + std::to_string(getpid()) + "_" + std::to_string(counter++) + "_" +
                     info->name());
        std::filesystem::remove_all(test_dir_);
        std::filesystem::create_directories(test_dir_ / "tree");
        std::filesystem::create_directories(test_dir_ / "output");
    }

    void TearDown() override
    {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    // Create a file below the scanned tree, creating parent directories as needed
    std::string createFile(const std::string &relative_path, const std::string &content = "dummy content")
    {
        std::filesystem::path file_path = treeDir() / relative_path;
        std::filesystem::create_directories(file_path.parent_path());
        std::ofstream ofs(file_path, std::ios::binary);
        ofs << content;
        ofs.close();
        return file_path.string();
    }

    std::string createFileOfSize(const std::string &relative_path, size_t size)
    {
        return createFile(relative_path, std::string(size, 'x'));
    }

    // Configuration writing every artifact below the test directory
    ScanConfig testConfig() const
    {
        ScanConfig config;
        config.output_dir = outputDir().string();
        config.max_workers = 2;
        config.video.screenshot_dir = (outputDir() / "screenshots").string();
        return config;
    }

    std::filesystem::path treeDir() const { return test_dir_ / "tree"; }
    std::filesystem::path outputDir() const { return test_dir_ / "output"; }
    std::filesystem::path testDir() const { return test_dir_; }

private:
    std::filesystem::path test_dir_;
};
