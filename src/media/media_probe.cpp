#include "media/media_probe.hpp"
#include "logging/logger.hpp"

extern "C"
{
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/avutil.h>
#include <libavutil/error.h>
}

namespace
{
    // Owns an input context opened by avformat_open_input
    class FormatContextGuard
    {
    public:
        FormatContextGuard() : ctx_(nullptr) {}
        ~FormatContextGuard()
        {
            if (ctx_)
                avformat_close_input(&ctx_);
        }
        FormatContextGuard(const FormatContextGuard &) = delete;
        FormatContextGuard &operator=(const FormatContextGuard &) = delete;

        AVFormatContext *get() { return ctx_; }
        AVFormatContext **address() { return &ctx_; }

    private:
        AVFormatContext *ctx_;
    };

    std::string avError(int code)
    {
        char buf[AV_ERROR_MAX_STRING_SIZE] = {0};
        av_strerror(code, buf, sizeof(buf));
        return buf;
    }
}

std::optional<MediaInfo> MediaProbe::probe(const std::string &file_path)
{
    FormatContextGuard format_ctx;
    int rc = avformat_open_input(format_ctx.address(), file_path.c_str(), nullptr, nullptr);
    if (rc < 0)
    {
        Logger::debug("MediaProbe: cannot open " + file_path + ": " + avError(rc));
        return std::nullopt;
    }

    rc = avformat_find_stream_info(format_ctx.get(), nullptr);
    if (rc < 0)
    {
        Logger::debug("MediaProbe: no stream info for " + file_path + ": " + avError(rc));
        return std::nullopt;
    }

    MediaInfo info;
    AVFormatContext *ctx = format_ctx.get();
    if (ctx->iformat != nullptr && ctx->iformat->name != nullptr)
    {
        info.format_name = ctx->iformat->name;
    }
    if (ctx->duration > 0)
    {
        info.duration_seconds = static_cast<double>(ctx->duration) / AV_TIME_BASE;
    }

    for (unsigned int i = 0; i < ctx->nb_streams; ++i)
    {
        const AVCodecParameters *params = ctx->streams[i]->codecpar;
        if (params->codec_type == AVMEDIA_TYPE_VIDEO)
        {
            // Cover art is reported as a video stream; ignore it
            if (ctx->streams[i]->disposition & AV_DISPOSITION_ATTACHED_PIC)
                continue;
            if (!info.has_video)
            {
                info.has_video = true;
                info.width = params->width;
                info.height = params->height;
            }
        }
        else if (params->codec_type == AVMEDIA_TYPE_AUDIO)
        {
            info.has_audio = true;
        }
    }
    return info;
}
