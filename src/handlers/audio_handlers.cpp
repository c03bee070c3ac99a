#include "handlers/audio_handlers.hpp"
#include "core/filename_sanitizer.hpp"
#include "logging/logger.hpp"
#include "media/media_probe.hpp"
#include "tools/external_tools.hpp"
#include "tools/media_downloader.hpp"

namespace fs = std::filesystem;

namespace
{
    const std::set<std::string> MEDIA_EXTENSIONS = {"mp4", "mov", "mkv", "webm", "avi", "m4a", "mp3", "wav", "flac", "ogg"};
}

void AudioHandlers::registerCapabilities(CapabilityRegistry &registry)
{
    std::set<std::string> inputs = MEDIA_EXTENSIONS;
    inputs.insert("txt");
    registry.registerCapability({"audio.download_batch", {"download-audio-batch"}, "audio",
                                 "Extract audio from URLs or uploaded media files",
                                 inputs, {{"url", ""}, {"format", "mp3"}}, 0, &AudioHandlers::downloadBatch});
}

bool AudioHandlers::isSupportedFormat(const std::string &format)
{
    return format == "mp3" || format == "m4a" || format == "wav" || format == "flac" || format == "opus";
}

std::vector<std::string> AudioHandlers::codecArguments(const std::string &format)
{
    if (format == "mp3")
        return {"-c:a", "libmp3lame", "-b:a", "192k"};
    if (format == "m4a")
        return {"-c:a", "aac", "-b:a", "192k"};
    if (format == "wav")
        return {"-c:a", "pcm_s16le"};
    if (format == "flac")
        return {"-c:a", "flac"};
    return {"-c:a", "libopus", "-b:a", "160k"};
}

fs::path AudioHandlers::extractFromFile(const HandlerRequest &request, const WorkItem &item,
                                        const fs::path &out_dir, const std::string &format)
{
    auto info = MediaProbe::probe(item.path.string());
    if (!info)
    {
        throw ProcessingError(FailureKind::InvalidInput, item.name + " is not a readable media file");
    }
    if (!info->has_audio)
    {
        throw ProcessingError(FailureKind::InvalidInput, item.name + " has no audio track");
    }

    const std::string ffmpeg = ExternalTools::getInstance().require(ExternalTools::FFMPEG);
    fs::path out = HandlerSupport::uniqueOutputPath(out_dir, FilenameSanitizer::stemOf(item.name), "." + format);

    std::vector<std::string> argv = {ffmpeg, "-y", "-hide_banner", "-loglevel", "error",
                                     "-i", item.path.string(), "-vn", "-map", "0:a:0"};
    auto codec = codecArguments(format);
    argv.insert(argv.end(), codec.begin(), codec.end());
    argv.push_back(out.string());
    HandlerSupport::runTool(request, argv);
    return out;
}

ProcessingOutcome AudioHandlers::downloadBatch(const HandlerRequest &request)
{
    const std::string format = HandlerSupport::optionString(request, "format", "mp3");
    if (!isSupportedFormat(format))
    {
        throw ProcessingError(FailureKind::InvalidInput, "format must be mp3, m4a, wav, flac or opus");
    }

    WorkBatch batch;
    bool has_text = false;
    for (const auto &input : request.inputs)
    {
        if (input.extension == "txt")
        {
            has_text = true;
        }
        else if (MEDIA_EXTENSIONS.count(input.extension) > 0)
        {
            batch.items.push_back({input.path, input.safe_name, input.extension, false});
        }
    }

    if (has_text || !HandlerSupport::optionString(request, "url", "").empty() || batch.items.empty())
    {
        for (const auto &url : MediaDownloader::collectUrls(request))
        {
            batch.items.push_back({fs::path(), url, "url", false});
        }
    }

    auto outputs = HandlerSupport::processAll(request, batch, [&](const WorkItem &item, const fs::path &out_dir)
                                              {
        if (item.extension == "url")
        {
            return MediaDownloader::download(request, item.name, DownloadMode::Audio, out_dir, format);
        }
        return extractFromFile(request, item, out_dir, format); },
                                              false);

    Logger::info("AudioHandlers: produced " + std::to_string(outputs.size()) + " of " +
                 std::to_string(batch.items.size()) + " audio file(s)");
    return HandlerSupport::bundleOutputs(request, outputs,
                                         "audio_files_" + std::to_string(outputs.size()) + "_files.zip");
}
