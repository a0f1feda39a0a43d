#include "core/media_probe.hpp"
#include "core/ffmpeg_support.hpp"
#include "logging/logger.hpp"
#include <filesystem>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>

extern "C"
{
#include <libavutil/avutil.h>
#include <libavutil/imgutils.h>
}

namespace
{
    // Frames decoded past the seek point before giving up on reaching the target time
    constexpr int kMaxFramesAfterSeek = 500;

    bool openInput(MediaInput &input, const std::string &path, int max_retries)
    {
        const int result = input.open(path, max_retries);
        if (result < 0)
        {
            Logger::debug("Could not open media file " + path + ": " + ffmpegErrorString(result));
            return false;
        }
        return true;
    }

    bool writeFrame(AVFrame *frame, const std::string &output_path)
    {
        ScalerPtr scaler(sws_getContext(frame->width, frame->height, static_cast<AVPixelFormat>(frame->format),
                                        frame->width, frame->height, AV_PIX_FMT_BGR24,
                                        SWS_BILINEAR, nullptr, nullptr, nullptr));
        if (!scaler)
        {
            Logger::warn("Could not create scaler context for " + output_path);
            return false;
        }

        cv::Mat image(frame->height, frame->width, CV_8UC3);
        uint8_t *dst_data[4] = {image.data, nullptr, nullptr, nullptr};
        int dst_linesize[4] = {static_cast<int>(image.step[0]), 0, 0, 0};
        sws_scale(scaler.get(), frame->data, frame->linesize, 0, frame->height, dst_data, dst_linesize);

        return cv::imwrite(output_path, image);
    }
}

FfmpegMediaProbe::FfmpegMediaProbe(int max_retries) : max_retries_(max_retries)
{
    av_log_set_level(AV_LOG_ERROR);
}

std::optional<ProbeResult> FfmpegMediaProbe::probe(const std::string &path)
{
    try
    {
        MediaInput input;
        if (!openInput(input, path, max_retries_))
        {
            return std::nullopt;
        }

        AVFormatContext *ctx = input.get();
        ProbeResult result;
        for (unsigned int i = 0; i < ctx->nb_streams; i++)
        {
            const AVStream *stream = ctx->streams[i];
            const AVCodecParameters *params = stream->codecpar;

            ProbeStream probe_stream;
            const char *type_name = av_get_media_type_string(params->codec_type);
            probe_stream.codec_type = type_name ? type_name : "unknown";
            if (params->width > 0)
                probe_stream.width = params->width;
            if (params->height > 0)
                probe_stream.height = params->height;
            if (params->codec_id != AV_CODEC_ID_NONE)
                probe_stream.codec_name = avcodec_get_name(params->codec_id);
            probe_stream.r_frame_rate = std::to_string(stream->r_frame_rate.num) + "/" +
                                        std::to_string(stream->r_frame_rate.den);
            result.streams.push_back(probe_stream);
        }

        if (ctx->duration != AV_NOPTS_VALUE && ctx->duration > 0)
            result.format.duration = static_cast<double>(ctx->duration) / AV_TIME_BASE;
        if (ctx->bit_rate > 0)
            result.format.bit_rate = ctx->bit_rate;

        int64_t size = ctx->pb ? avio_size(ctx->pb) : -1;
        if (size < 0)
        {
            std::error_code ec;
            auto fs_size = std::filesystem::file_size(path, ec);
            if (!ec)
                size = static_cast<int64_t>(fs_size);
        }
        if (size >= 0)
            result.format.size = size;

        return result;
    }
    catch (const std::exception &e)
    {
        Logger::warn("Probe failed for " + path + ": " + e.what());
        return std::nullopt;
    }
}

bool FfmpegMediaProbe::captureFrame(const std::string &path, double timestamp_seconds, const std::string &output_path)
{
    try
    {
        MediaInput input;
        if (!openInput(input, path, max_retries_))
        {
            return false;
        }

        const AVCodec *codec = nullptr;
        int stream_index = av_find_best_stream(input.get(), AVMEDIA_TYPE_VIDEO, -1, -1, &codec, 0);
        if (stream_index < 0 || !codec)
        {
            Logger::warn("No decodable video stream in " + path);
            return false;
        }
        AVStream *stream = input.get()->streams[stream_index];

        CodecContextPtr codec_ctx(avcodec_alloc_context3(codec));
        if (!codec_ctx ||
            avcodec_parameters_to_context(codec_ctx.get(), stream->codecpar) < 0 ||
            avcodec_open2(codec_ctx.get(), codec, nullptr) < 0)
        {
            Logger::warn("Could not open decoder for " + path);
            return false;
        }

        FramePtr frame(av_frame_alloc());
        PacketPtr packet(av_packet_alloc());
        if (!frame || !packet)
        {
            return false;
        }

        const double time_base = av_q2d(stream->time_base);
        const int64_t target_pts = time_base > 0 ? static_cast<int64_t>(timestamp_seconds / time_base) : 0;
        if (av_seek_frame(input.get(), stream_index, target_pts, AVSEEK_FLAG_BACKWARD) < 0)
        {
            Logger::debug("Seek failed for " + path + ", decoding from the start");
        }
        avcodec_flush_buffers(codec_ctx.get());

        bool have_frame = false;
        int frames_decoded = 0;
        bool draining = false;
        while (!have_frame && frames_decoded < kMaxFramesAfterSeek)
        {
            if (!draining)
            {
                int read_result = av_read_frame(input.get(), packet.get());
                if (read_result < 0)
                {
                    // End of stream: flush the decoder and take what it still holds
                    draining = true;
                    avcodec_send_packet(codec_ctx.get(), nullptr);
                }
                else
                {
                    if (packet->stream_index != stream_index)
                    {
                        av_packet_unref(packet.get());
                        continue;
                    }
                    int send_result = avcodec_send_packet(codec_ctx.get(), packet.get());
                    av_packet_unref(packet.get());
                    if (send_result < 0 && send_result != AVERROR(EAGAIN))
                    {
                        continue;
                    }
                }
            }

            int response = avcodec_receive_frame(codec_ctx.get(), frame.get());
            if (response == AVERROR(EAGAIN))
            {
                continue;
            }
            if (response < 0)
            {
                break; // AVERROR_EOF or decode error
            }

            ++frames_decoded;
            int64_t pts = frame->best_effort_timestamp;
            if (pts == AV_NOPTS_VALUE || pts >= target_pts || draining)
            {
                have_frame = true;
            }
            else
            {
                av_frame_unref(frame.get());
            }
        }

        if (!have_frame)
        {
            Logger::warn("No frame decoded at " + std::to_string(timestamp_seconds) + "s in " + path);
            return false;
        }

        if (!writeFrame(frame.get(), output_path))
        {
            Logger::warn("Could not write frame image " + output_path);
            return false;
        }
        return std::filesystem::exists(output_path);
    }
    catch (const cv::Exception &e)
    {
        Logger::error("OpenCV error while capturing frame from " + path + ": " + std::string(e.what()));
        return false;
    }
    catch (const std::exception &e)
    {
        Logger::error("Error while capturing frame from " + path + ": " + std::string(e.what()));
        return false;
    }
}
