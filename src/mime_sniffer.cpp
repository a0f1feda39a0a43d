#include "core/mime_sniffer.hpp"
#include "logging/logger.hpp"
#include <stdexcept>

namespace
{
    const char *kFallbackMimeType = "application/octet-stream";
}

MimeSniffer::MimeSniffer()
{
    // MAGIC_ERROR turns unreadable files into errors instead of "cannot open" descriptions
    cookie_ = magic_open(MAGIC_MIME_TYPE | MAGIC_ERROR);
    if (!cookie_)
        throw std::runtime_error("Failed to create magic cookie");
    // nullptr selects the system default database
    if (magic_load(cookie_, nullptr) != 0)
    {
        const std::string err = magic_error(cookie_);
        magic_close(cookie_);
        throw std::runtime_error("Failed to load magic database: " + err);
    }
}

MimeSniffer::~MimeSniffer()
{
    if (cookie_)
        magic_close(cookie_);
}

std::string MimeSniffer::mimeType(const std::string &path) const
{
    const char *result = magic_file(cookie_, path.c_str());
    if (!result)
        throw std::runtime_error("magic_file failed: " + std::string(magic_error(cookie_)));
    return {result};
}

std::string MimeSniffer::sniff(const std::string &path)
{
    try
    {
        thread_local MimeSniffer instance;
        return instance.mimeType(path);
    }
    catch (const std::exception &e)
    {
        Logger::warn("MIME detection failed for " + path + ": " + e.what());
        return kFallbackMimeType;
    }
}
