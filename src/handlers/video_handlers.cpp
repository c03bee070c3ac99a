#include "handlers/video_handlers.hpp"
#include "core/filename_sanitizer.hpp"
#include "logging/logger.hpp"
#include "media/media_probe.hpp"
#include "tools/external_tools.hpp"
#include "tools/media_downloader.hpp"
#include <cstdlib>

namespace fs = std::filesystem;

namespace
{
    bool parsePositive(const std::string &text, int &value)
    {
        if (text.empty() || text.size() > 6 || text.find_first_not_of("0123456789") != std::string::npos)
        {
            return false;
        }
        value = std::atoi(text.c_str());
        return value > 0;
    }
}

const std::set<std::string> &VideoHandlers::videoExtensions()
{
    static const std::set<std::string> exts = {"mp4", "mov", "mkv", "avi", "webm", "flv", "wmv", "mpg", "mpeg", "m4v", "3gp"};
    return exts;
}

void VideoHandlers::registerCapabilities(CapabilityRegistry &registry)
{
    std::set<std::string> upscale_inputs = videoExtensions();
    upscale_inputs.insert("zip");
    registry.registerCapability({"video.upscale", {"video-upscale"}, "video",
                                 "Upscale videos with ffmpeg (H.264 output)",
                                 upscale_inputs, {{"scale", "2x"}, {"crf", 18}}, 1, &VideoHandlers::upscale});

    registry.registerCapability({"video.download_batch", {"download-video-batch"}, "video",
                                 "Download videos from a URL or a text file of URLs",
                                 {"txt"}, {{"url", ""}}, 0, &VideoHandlers::downloadBatch});
}

ScaleTarget VideoHandlers::parseScale(const std::string &scale, int source_width, int source_height)
{
    ScaleTarget target;
    if (scale == "2x" || scale == "4x")
    {
        int factor = scale == "2x" ? 2 : 4;
        target.width = source_width * factor;
        target.height = source_height * factor;
    }
    else
    {
        auto colon = scale.find(':');
        if (colon == std::string::npos ||
            !parsePositive(scale.substr(0, colon), target.width) ||
            !parsePositive(scale.substr(colon + 1), target.height))
        {
            throw ProcessingError(FailureKind::InvalidInput, "scale must be 2x, 4x or WIDTH:HEIGHT");
        }
    }

    target.width -= target.width % 2;
    target.height -= target.height % 2;
    if (target.width < 2 || target.height < 2 || target.width > MAX_DIMENSION || target.height > MAX_DIMENSION)
    {
        throw ProcessingError(FailureKind::InvalidInput,
                              "target size " + std::to_string(target.width) + "x" + std::to_string(target.height) +
                                  " is outside 2.." + std::to_string(MAX_DIMENSION));
    }
    return target;
}

ProcessingOutcome VideoHandlers::upscale(const HandlerRequest &request)
{
    const std::string scale = HandlerSupport::optionString(request, "scale", "2x");
    const int crf = HandlerSupport::optionInt(request, "crf", 18);
    if (crf < 0 || crf > 51)
    {
        throw ProcessingError(FailureKind::InvalidInput, "crf must be between 0 and 51");
    }
    const std::string ffmpeg = ExternalTools::getInstance().require(ExternalTools::FFMPEG);

    WorkBatch batch = HandlerSupport::expandInputs(request, videoExtensions());
    auto outputs = HandlerSupport::processAll(request, batch, [&](const WorkItem &item, const fs::path &out_dir)
                                              {
        auto info = MediaProbe::probe(item.path.string());
        if (!info || !info->has_video)
        {
            throw ProcessingError(FailureKind::InvalidInput, item.name + " has no readable video stream");
        }
        ScaleTarget target = parseScale(scale, info->width, info->height);
        Logger::debug("VideoHandlers: " + item.name + " " + std::to_string(info->width) + "x" +
                      std::to_string(info->height) + " -> " + std::to_string(target.width) + "x" +
                      std::to_string(target.height));

        fs::path out = HandlerSupport::uniqueOutputPath(out_dir, FilenameSanitizer::stemOf(item.name) + "_upscaled", ".mp4");
        HandlerSupport::runTool(request, {ffmpeg, "-y", "-hide_banner", "-loglevel", "error",
                                          "-i", item.path.string(),
                                          "-vf", "scale=" + std::to_string(target.width) + ":" + std::to_string(target.height) + ":flags=lanczos",
                                          "-c:v", "libx264", "-preset", "medium", "-crf", std::to_string(crf),
                                          "-pix_fmt", "yuv420p",
                                          "-c:a", "aac", "-b:a", "192k",
                                          "-movflags", "+faststart",
                                          out.string()});
        return out; },
                                              false);
    return HandlerSupport::packageOutputs(request, outputs, batch, "upscaled");
}

ProcessingOutcome VideoHandlers::downloadBatch(const HandlerRequest &request)
{
    std::vector<std::string> urls = MediaDownloader::collectUrls(request);

    // Reuse the batch machinery: one work item per URL
    WorkBatch batch;
    for (const auto &url : urls)
    {
        batch.items.push_back({fs::path(), url, "url", false});
    }

    auto outputs = HandlerSupport::processAll(request, batch, [&](const WorkItem &item, const fs::path &out_dir)
                                              { return MediaDownloader::download(request, item.name, DownloadMode::Video, out_dir); },
                                              false);
    if (outputs.size() < urls.size())
    {
        Logger::warn("VideoHandlers: downloaded " + std::to_string(outputs.size()) + " of " +
                     std::to_string(urls.size()) + " URL(s)");
    }
    return HandlerSupport::bundleOutputs(request, outputs, "videos.zip");
}
