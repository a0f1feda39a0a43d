#include "core/result_sink.hpp"
#include "core/scan_errors.hpp"
#include "logging/logger.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace
{
    const std::string kArrayOpen = "[\n";
    const std::string kEntrySeparator = ",\n";
    const std::string kArrayClose = "\n]";
    const std::string kEmptyArray = "[\n]";

    void createParentDirectory(const std::string &path)
    {
        fs::path parent = fs::path(path).parent_path();
        if (parent.empty())
            return;
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec)
            throw StoreError("Cannot create directory " + parent.string() + ": " + ec.message());
    }

    std::vector<std::string> serialize(const std::vector<FileRecord> &records)
    {
        std::vector<std::string> entries;
        entries.reserve(records.size());
        for (const auto &record : records)
        {
            entries.push_back(nlohmann::json(record).dump());
        }
        return entries;
    }
}

ResultSink::ResultSink(std::string path) : path_(std::move(path))
{
}

void ResultSink::initialize()
{
    std::lock_guard<std::mutex> lock(mutex_);
    replaceContents({});
    Logger::debug("Initialized result store " + path_);
}

void ResultSink::open()
{
    std::lock_guard<std::mutex> lock(mutex_);
    ensureOpen();
}

void ResultSink::ensureOpen()
{
    if (close_offset_)
        return;

    if (!fs::exists(path_))
    {
        replaceContents({});
        return;
    }

    std::ifstream file(path_, std::ios::binary);
    if (!file.is_open())
        throw StoreError("Cannot open result store " + path_);

    nlohmann::json existing;
    try
    {
        std::stringstream buffer;
        buffer << file.rdbuf();
        const std::string content = buffer.str();
        existing = content.find_first_not_of(" \t\r\n") == std::string::npos
                       ? nlohmann::json::array()
                       : nlohmann::json::parse(content);
    }
    catch (const nlohmann::json::exception &e)
    {
        throw StoreError("Result store " + path_ + " is not valid JSON: " + e.what());
    }
    if (!existing.is_array())
        throw StoreError("Result store " + path_ + " does not hold a JSON array");

    std::vector<std::string> entries;
    for (const auto &item : existing)
        entries.push_back(item.dump());
    replaceContents(entries);
}

void ResultSink::replaceContents(const std::vector<std::string> &entries)
{
    createParentDirectory(path_);
    const std::string temp_path = path_ + ".tmp";

    std::string content;
    if (entries.empty())
    {
        content = kEmptyArray;
    }
    else
    {
        content = kArrayOpen;
        for (size_t i = 0; i < entries.size(); ++i)
        {
            if (i > 0)
                content += kEntrySeparator;
            content += entries[i];
        }
        content += kArrayClose;
    }

    {
        std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open())
            throw StoreError("Cannot write result store " + temp_path);
        out << content;
        out.flush();
        if (!out)
            throw StoreError("Write failed for result store " + temp_path);
    }

    std::error_code ec;
    fs::rename(temp_path, path_, ec);
    if (ec)
        throw StoreError("Cannot replace result store " + path_ + ": " + ec.message());

    // Empty array closes at "]", a populated one at "\n]"
    close_offset_ = entries.empty() ? kArrayOpen.size() : content.size() - kArrayClose.size();
    record_count_ = entries.size();
}

void ResultSink::appendEntries(const std::vector<std::string> &entries)
{
    std::string chunk;
    for (size_t i = 0; i < entries.size(); ++i)
    {
        if (i > 0 || record_count_ > 0)
            chunk += kEntrySeparator;
        chunk += entries[i];
    }
    chunk += kArrayClose;

    std::fstream file(path_, std::ios::in | std::ios::out | std::ios::binary);
    if (!file.is_open())
        throw StoreError("Cannot open result store " + path_ + " for append");

    file.seekp(static_cast<std::streamoff>(*close_offset_));
    file << chunk;
    file.flush();
    if (!file)
        throw StoreError("Append failed for result store " + path_);

    close_offset_ = *close_offset_ + chunk.size() - kArrayClose.size();
    record_count_ += entries.size();
}

void ResultSink::write(const std::vector<FileRecord> &records, bool append)
{
    if (records.empty())
        return;

    std::lock_guard<std::mutex> lock(mutex_);
    const std::vector<std::string> entries = serialize(records);
    if (append)
    {
        ensureOpen();
        appendEntries(entries);
    }
    else
    {
        replaceContents(entries);
    }
    Logger::debug("Wrote " + std::to_string(records.size()) + " records to " + path_ +
                  " (" + std::to_string(record_count_) + " total)");
}

std::vector<FileRecord> ResultSink::readAll() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::ifstream file(path_, std::ios::binary);
    if (!file.is_open())
        throw StoreError("Cannot open result store " + path_);

    try
    {
        nlohmann::json content = nlohmann::json::parse(file);
        return content.get<std::vector<FileRecord>>();
    }
    catch (const nlohmann::json::exception &e)
    {
        throw StoreError("Result store " + path_ + " is not valid: " + e.what());
    }
    catch (const std::invalid_argument &e)
    {
        throw StoreError("Result store " + path_ + " holds an invalid record: " + e.what());
    }
}

size_t ResultSink::getRecordCount() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return record_count_;
}
