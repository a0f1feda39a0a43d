#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include "logging/logger.hpp"

extern "C"
{
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/error.h>
#include <libavutil/frame.h>
#include <libswscale/swscale.h>
}

// Human readable text for an FFmpeg error code
inline std::string ffmpegErrorString(int error_code)
{
    char err_buf[AV_ERROR_MAX_STRING_SIZE];
    av_strerror(error_code, err_buf, AV_ERROR_MAX_STRING_SIZE);
    return std::string(err_buf);
}

struct CodecContextDeleter
{
    void operator()(AVCodecContext *ctx) const { avcodec_free_context(&ctx); }
};

struct FrameDeleter
{
    void operator()(AVFrame *frame) const { av_frame_free(&frame); }
};

struct PacketDeleter
{
    void operator()(AVPacket *packet) const { av_packet_free(&packet); }
};

struct ScalerDeleter
{
    void operator()(SwsContext *ctx) const { sws_freeContext(ctx); }
};

using CodecContextPtr = std::unique_ptr<AVCodecContext, CodecContextDeleter>;
using FramePtr = std::unique_ptr<AVFrame, FrameDeleter>;
using PacketPtr = std::unique_ptr<AVPacket, PacketDeleter>;
using ScalerPtr = std::unique_ptr<SwsContext, ScalerDeleter>;

/**
 * @brief Owns an opened demuxer context for one media file
 *
 * avformat_open_input frees the context itself on failure, so only a successful open leaves
 * something to close.
 */
class MediaInput
{
public:
    MediaInput() = default;
    ~MediaInput()
    {
        if (ctx_)
            avformat_close_input(&ctx_);
    }

    MediaInput(const MediaInput &) = delete;
    MediaInput &operator=(const MediaInput &) = delete;

    /**
     * @brief Open a file and read its stream information
     *
     * Opening is attempted up to max_retries times with exponential backoff
     * (100ms, 200ms, ...). Stream discovery is not retried.
     *
     * @return 0 on success, the last FFmpeg error code otherwise
     */
    int open(const std::string &path, int max_retries)
    {
        const int attempts = max_retries < 1 ? 1 : max_retries;
        int result = 0;
        for (int attempt = 0; attempt < attempts; ++attempt)
        {
            result = avformat_open_input(&ctx_, path.c_str(), nullptr, nullptr);
            if (result >= 0)
                break;
            if (attempt + 1 < attempts)
            {
                const int delay_ms = (1 << attempt) * 100;
                Logger::warn("Opening " + path + " failed, retrying in " + std::to_string(delay_ms) + "ms (attempt " +
                             std::to_string(attempt + 1) + "/" + std::to_string(attempts) +
                             "): " + ffmpegErrorString(result));
                std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
            }
        }
        if (result < 0)
            return result;

        result = avformat_find_stream_info(ctx_, nullptr);
        return result < 0 ? result : 0;
    }

    AVFormatContext *get() const { return ctx_; }

private:
    AVFormatContext *ctx_ = nullptr;
};
