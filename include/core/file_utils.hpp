#pragma once

#include <filesystem>
#include <string>
#include <functional>
#include <vector>
#include <memory>
#include <optional>
#include <ctime>
#include <cstdint>

namespace fs = std::filesystem;

// Simple custom observable implementation
template <typename T>
class SimpleObservable
{
public:
    using Observer = std::function<void(const T &)>;
    using ErrorHandler = std::function<void(const std::exception &)>;
    using CompleteHandler = std::function<void()>;

    SimpleObservable(std::function<void(Observer, ErrorHandler, CompleteHandler)> source)
        : source_(std::move(source)) {}

    void subscribe(Observer onNext, ErrorHandler onError = nullptr, CompleteHandler onComplete = nullptr)
    {
        if (source_)
        {
            source_(onNext, onError, onComplete);
        }
    }

private:
    std::function<void(Observer, ErrorHandler, CompleteHandler)> source_;
};

/**
 * @brief Result of a single stat() call
 */
struct FileStat
{
    uint64_t size = 0;
    std::time_t created_time = 0; // inode change time on Linux
    std::time_t modified_time = 0;
    std::time_t accessed_time = 0;
    bool is_regular_file = false;
    bool is_directory = false;
};

/**
 * @brief Rules applied while walking a directory tree
 */
struct EnumerationOptions
{
    std::vector<std::string> exclude_dirs = {".git", "node_modules", "__pycache__"};
    std::vector<std::string> exclude_patterns = {".DS_Store", "*.tmp", "*.log"};
    bool skip_hidden = false;
};

/**
 * @brief File utilities for enumeration and content hashing
 */
class FileUtils
{
public:
    /**
     * @brief Walk a directory tree and collect every candidate regular file
     *
     * Directories whose name is excluded are pruned, files whose name matches an exclude
     * pattern are skipped. Symbolic links are never followed nor returned. Unreadable
     * subdirectories are logged and skipped.
     *
     * @param root_path Directory to walk
     * @param options Exclusion rules
     * @return Complete list of candidate file paths
     * @throws NotFoundError if root_path does not exist
     * @throws NotADirectoryError if root_path is not a directory
     */
    static std::vector<std::string> listFiles(const std::string &root_path, const EnumerationOptions &options);

    /**
     * @brief Stat a path without following it if it is a symlink
     * @return FileStat, or std::nullopt if the entry cannot be stat'ed
     */
    static std::optional<FileStat> getFileStat(const std::string &file_path);

    /**
     * Computes the MD5 digest of a file, reading it in fixed-size chunks
     * @param file_path Path to the file
     * @param chunk_size Read size in bytes
     * @return Lower-case hexadecimal digest, or std::nullopt if the file could not be read
     */
    static std::optional<std::string> computeFileHash(const std::string &file_path, size_t chunk_size = 8192);

    // MD5 digest of an in-memory string, lower-case hexadecimal
    static std::string computeStringHash(const std::string &text);

    // Lower-cased extension including the leading dot, empty if there is none
    static std::string getFileExtension(const std::string &file_path);

    static bool matchesAnyPattern(const std::string &file_name, const std::vector<std::string> &patterns);

private:
    static void scanDirectoryRecursively(const fs::path &dir_path, const EnumerationOptions &options,
                                         std::vector<std::string> &files);
};
