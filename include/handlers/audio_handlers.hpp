#pragma once

#include "core/capability_registry.hpp"
#include "handlers/handler_support.hpp"
#include <string>
#include <vector>

/**
 * @brief Audio extraction from URLs (yt-dlp) and uploaded media files (ffmpeg)
 */
class AudioHandlers
{
public:
    static void registerCapabilities(CapabilityRegistry &registry);

    static ProcessingOutcome downloadBatch(const HandlerRequest &request);

    static bool isSupportedFormat(const std::string &format);

    // ffmpeg codec arguments for `format`
    static std::vector<std::string> codecArguments(const std::string &format);

private:
    static std::filesystem::path extractFromFile(const HandlerRequest &request, const WorkItem &item,
                                                 const std::filesystem::path &out_dir, const std::string &format);
};
