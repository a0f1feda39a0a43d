#pragma once

#include <string>
#include <magic.h>

/**
 * @brief Content-type detection backed by libmagic
 *
 * A magic cookie is not safe for concurrent use, so sniff() keeps one instance per thread.
 */
class MimeSniffer
{
public:
    MimeSniffer();
    ~MimeSniffer();

    MimeSniffer(const MimeSniffer &) = delete;
    MimeSniffer &operator=(const MimeSniffer &) = delete;

    // Throws std::runtime_error when libmagic cannot classify the file
    std::string mimeType(const std::string &path) const;

    // Per-thread sniffing; never throws, falls back to application/octet-stream
    static std::string sniff(const std::string &path);

private:
    magic_t cookie_;
};
