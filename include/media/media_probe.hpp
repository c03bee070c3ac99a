#pragma once

#include <optional>
#include <string>

/**
 * @brief Container level facts about an audio/video file
 */
struct MediaInfo
{
    bool has_video = false;
    bool has_audio = false;
    int width = 0;
    int height = 0;
    double duration_seconds = 0.0;
    std::string format_name;
};

/**
 * @brief Stream inspection through libavformat (no decoding)
 */
class MediaProbe
{
public:
    /**
     * @return std::nullopt when libavformat cannot open or parse the file
     */
    static std::optional<MediaInfo> probe(const std::string &file_path);
};
