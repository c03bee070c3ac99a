#include "tools/media_downloader.hpp"
#include "handlers/handler_support.hpp"
#include "logging/logger.hpp"
#include "tools/external_tools.hpp"
#include <regex>
#include <set>

namespace fs = std::filesystem;

std::vector<std::string> MediaDownloader::extractUrls(const std::string &text)
{
    static const std::regex url_pattern(R"(https?://[^\s<>"'`]+)", std::regex::icase);

    std::vector<std::string> urls;
    std::set<std::string> seen;
    for (auto it = std::sregex_iterator(text.begin(), text.end(), url_pattern); it != std::sregex_iterator(); ++it)
    {
        std::string url = it->str();
        // Trailing punctuation usually belongs to the surrounding sentence
        while (!url.empty() && std::string(".,;:)]}").find(url.back()) != std::string::npos)
        {
            url.pop_back();
        }
        if (url.size() > 8 && seen.insert(url).second)
        {
            urls.push_back(url);
        }
    }
    return urls;
}

std::vector<std::string> MediaDownloader::collectUrls(const HandlerRequest &request)
{
    std::string text = HandlerSupport::optionString(request, "url", "");
    for (const auto &input : request.inputs)
    {
        if (input.extension == "txt")
        {
            auto bytes = HandlerSupport::readFileBytes(input.path);
            text += "\n";
            text.append(bytes.begin(), bytes.end());
        }
    }

    std::vector<std::string> urls = extractUrls(text);
    if (urls.empty())
    {
        throw ProcessingError(FailureKind::InvalidInput, "no http(s) URL provided");
    }
    if (urls.size() > MAX_URLS)
    {
        throw ProcessingError(FailureKind::InvalidInput,
                              "at most " + std::to_string(MAX_URLS) + " URLs per request");
    }
    return urls;
}

fs::path MediaDownloader::download(const HandlerRequest &request, const std::string &url, DownloadMode mode,
                                   const fs::path &out_dir, const std::string &audio_format)
{
    auto &tools = ExternalTools::getInstance();
    const std::string yt_dlp = tools.require(ExternalTools::YT_DLP);

    std::vector<std::string> argv = {yt_dlp, "--no-playlist", "--no-progress", "--restrict-filenames",
                                     "--no-mtime", "-o", (out_dir / "%(title).80s.%(ext)s").string()};

    std::string ffmpeg = tools.path(ExternalTools::FFMPEG);
    if (!ffmpeg.empty())
    {
        argv.insert(argv.end(), {"--ffmpeg-location", ffmpeg});
    }

    if (mode == DownloadMode::Video)
    {
        argv.insert(argv.end(), {"-f", "bestvideo[ext=mp4]+bestaudio[ext=m4a]/best[ext=mp4]/best",
                                 "--merge-output-format", "mp4"});
    }
    else if (ffmpeg.empty())
    {
        Logger::warn("MediaDownloader: ffmpeg not found, keeping the native audio format");
        argv.insert(argv.end(), {"-f", "bestaudio/best"});
    }
    else
    {
        argv.insert(argv.end(), {"-f", "bestaudio/best", "-x", "--audio-format", audio_format, "--audio-quality", "192K"});
    }
    argv.push_back("--");
    argv.push_back(url);

    Logger::info("MediaDownloader: downloading " + url);
    HandlerSupport::runTool(request, argv, out_dir);

    // yt-dlp picks the final name itself; take the largest finished file
    fs::path best;
    uintmax_t best_size = 0;
    for (const auto &entry : fs::directory_iterator(out_dir))
    {
        if (!entry.is_regular_file())
            continue;
        std::string ext = entry.path().extension().string();
        if (ext == ".part" || ext == ".ytdl" || ext == ".temp")
            continue;
        if (entry.file_size() >= best_size)
        {
            best = entry.path();
            best_size = entry.file_size();
        }
    }
    if (best.empty())
    {
        throw ProcessingError(FailureKind::HandlerCrashed, "yt-dlp finished without producing a file for " + url);
    }
    return best;
}
