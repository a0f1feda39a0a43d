#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief One stream as reported by a media probe
 */
struct ProbeStream
{
    std::string codec_type; // "video", "audio", ...
    std::optional<int> width;
    std::optional<int> height;
    std::optional<std::string> codec_name;
    std::optional<std::string> r_frame_rate; // "num/den"
};

/**
 * @brief Container level attributes as reported by a media probe
 */
struct ProbeFormat
{
    std::optional<double> duration; // seconds
    std::optional<int64_t> bit_rate;
    std::optional<int64_t> size;
};

struct ProbeResult
{
    std::vector<ProbeStream> streams;
    ProbeFormat format;
};

/**
 * @brief Media inspection and single-frame capture capability
 */
class MediaProbe
{
public:
    virtual ~MediaProbe() = default;

    /**
     * @brief Inspect a media file
     * @return Stream and format attributes, or std::nullopt if the file is not a readable container
     */
    virtual std::optional<ProbeResult> probe(const std::string &path) = 0;

    /**
     * @brief Decode one frame at the given time and write it as an image
     * @return true if the image file was produced
     */
    virtual bool captureFrame(const std::string &path, double timestamp_seconds, const std::string &output_path) = 0;
};

/**
 * @brief MediaProbe implemented in-process with libavformat / libavcodec
 *
 * Captured frames are converted to BGR with libswscale and written with OpenCV.
 */
class FfmpegMediaProbe : public MediaProbe
{
public:
    explicit FfmpegMediaProbe(int max_retries = 1);

    std::optional<ProbeResult> probe(const std::string &path) override;
    bool captureFrame(const std::string &path, double timestamp_seconds, const std::string &output_path) override;

private:
    int max_retries_;
};
