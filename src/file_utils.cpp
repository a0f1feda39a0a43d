#include "core/file_utils.hpp"
#include "core/scan_errors.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <vector>
#include <fnmatch.h>
#include <sys/stat.h>
#include <openssl/evp.h>

namespace fs = std::filesystem;

namespace
{
    bool isHidden(const std::string &name)
    {
        return !name.empty() && name[0] == '.';
    }

    struct EvpMdCtxDeleter
    {
        void operator()(EVP_MD_CTX *ctx) const { EVP_MD_CTX_free(ctx); }
    };
}

std::vector<std::string> FileUtils::listFiles(const std::string &root_path, const EnumerationOptions &options)
{
    std::error_code ec;
    fs::path root(root_path);
    if (!fs::exists(root, ec))
    {
        throw NotFoundError(root_path);
    }
    if (!fs::is_directory(root, ec))
    {
        throw NotADirectoryError(root_path);
    }

    std::vector<std::string> files;
    scanDirectoryRecursively(root, options, files);
    Logger::info("Enumerated " + std::to_string(files.size()) + " candidate files under " + root_path);
    return files;
}

void FileUtils::scanDirectoryRecursively(const fs::path &dir_path, const EnumerationOptions &options,
                                         std::vector<std::string> &files)
{
    try
    {
        for (const auto &entry : fs::directory_iterator(dir_path, fs::directory_options::skip_permission_denied))
        {
            try
            {
                const std::string name = entry.path().filename().string();
                if (entry.is_symlink())
                {
                    Logger::debug("Skipping symbolic link: " + entry.path().string());
                    continue;
                }
                if (options.skip_hidden && isHidden(name))
                {
                    continue;
                }

                if (entry.is_directory())
                {
                    if (std::find(options.exclude_dirs.begin(), options.exclude_dirs.end(), name) != options.exclude_dirs.end())
                    {
                        Logger::debug("Pruning excluded directory: " + entry.path().string());
                        continue;
                    }
                    scanDirectoryRecursively(entry.path(), options, files);
                }
                else if (entry.is_regular_file())
                {
                    if (matchesAnyPattern(name, options.exclude_patterns))
                    {
                        continue;
                    }
                    files.push_back(entry.path().string());
                }
            }
            catch (const fs::filesystem_error &e)
            {
                // Log the error but continue scanning
                Logger::warn("Skipping entry due to filesystem error: " + entry.path().string() + " - " + e.what());
            }
        }
    }
    catch (const fs::filesystem_error &e)
    {
        // Log the error but don't stop the entire scan
        Logger::warn("Error accessing directory " + dir_path.string() + ": " + e.what());
    }
}

bool FileUtils::matchesAnyPattern(const std::string &file_name, const std::vector<std::string> &patterns)
{
    return std::any_of(patterns.begin(), patterns.end(), [&file_name](const std::string &pattern)
                       { return fnmatch(pattern.c_str(), file_name.c_str(), 0) == 0; });
}

std::optional<FileStat> FileUtils::getFileStat(const std::string &file_path)
{
    struct stat st;
    if (lstat(file_path.c_str(), &st) != 0)
    {
        return std::nullopt;
    }

    FileStat result;
    result.size = static_cast<uint64_t>(st.st_size);
    result.created_time = st.st_ctime;
    result.modified_time = st.st_mtime;
    result.accessed_time = st.st_atime;
    result.is_regular_file = S_ISREG(st.st_mode);
    result.is_directory = S_ISDIR(st.st_mode);
    return result;
}

std::optional<std::string> FileUtils::computeFileHash(const std::string &file_path, size_t chunk_size)
{
    Logger::debug("Reading entire file for hash computation: " + file_path);
    std::ifstream file(file_path, std::ios::binary);
    if (!file.is_open())
    {
        Logger::error("Error computing hash for " + file_path + ": cannot open file");
        return std::nullopt;
    }

    std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter> ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1)
        return std::nullopt;

    std::vector<char> buffer(std::max<size_t>(chunk_size, 1));
    while (file.good())
    {
        file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        std::streamsize bytes_read = file.gcount();
        if (bytes_read > 0)
        {
            if (EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<size_t>(bytes_read)) != 1)
                return std::nullopt;
        }
    }
    if (file.bad())
    {
        Logger::error("Error computing hash for " + file_path + ": read failed");
        return std::nullopt;
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest, &digest_len) != 1)
        return std::nullopt;

    std::stringstream ss;
    for (unsigned int i = 0; i < digest_len; ++i)
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(digest[i]);
    return ss.str();
}

std::string FileUtils::getFileExtension(const std::string &file_path)
{
    std::string ext = fs::path(file_path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c)
                   { return static_cast<char>(std::tolower(c)); });
    return ext;
}

std::string FileUtils::computeStringHash(const std::string &text)
{
    std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter> ctx(EVP_MD_CTX_new());
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), text.data(), text.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), digest, &digest_len) != 1)
    {
        throw std::runtime_error("MD5 digest failed");
    }

    std::stringstream ss;
    for (unsigned int i = 0; i < digest_len; ++i)
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(digest[i]);
    return ss.str();
}
