#pragma once

#include "core/capability_registry.hpp"
#include <filesystem>
#include <string>
#include <vector>

enum class DownloadMode
{
    Video,
    Audio
};

/**
 * @brief yt-dlp front end for the batch download capabilities
 */
class MediaDownloader
{
public:
    static constexpr size_t MAX_URLS = 50;

    /**
     * @brief http(s) URLs found in `text`, in order of appearance, without duplicates
     */
    static std::vector<std::string> extractUrls(const std::string &text);

    /**
     * @brief URLs from the "url" option and from every uploaded .txt input.
     * @throws ProcessingError(InvalidInput) when none are found or there are too many
     */
    static std::vector<std::string> collectUrls(const HandlerRequest &request);

    /**
     * @brief Download `url` into the empty directory `out_dir`.
     * @param audio_format target codec when `mode` is Audio (mp3, m4a, ...)
     * @return the downloaded file
     */
    static std::filesystem::path download(const HandlerRequest &request, const std::string &url,
                                          DownloadMode mode, const std::filesystem::path &out_dir,
                                          const std::string &audio_format = "mp3");
};
