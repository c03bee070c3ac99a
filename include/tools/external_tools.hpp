#pragma once

#include <map>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

/**
 * @brief Locations of the command line tools the handlers shell out to.
 *
 * discover() resolves each tool once at startup; handlers call require()
 * and get a ToolUnavailable failure when a tool is missing.
 */
class ExternalTools
{
public:
    static constexpr const char *FFMPEG = "ffmpeg";
    static constexpr const char *YT_DLP = "yt-dlp";
    static constexpr const char *QPDF = "qpdf";
    static constexpr const char *GHOSTSCRIPT = "gs";
    static constexpr const char *SOFFICE = "soffice";
    static constexpr const char *REMBG = "rembg";

    static ExternalTools &getInstance()
    {
        static ExternalTools instance;
        return instance;
    }

    void discover();

    // Empty string when the tool is not installed
    std::string path(const std::string &tool) const;
    bool has(const std::string &tool) const { return !path(tool).empty(); }

    /**
     * @throws ProcessingError(ToolUnavailable) when the tool is missing
     */
    std::string require(const std::string &tool) const;

    // Pin a tool location, or hide it with an empty path
    void setPath(const std::string &tool, const std::string &location);

    nlohmann::json availability() const;

    /**
     * @brief Search PATH for `name`, then each of `extra_paths`.
     * @return absolute path of an executable file, or empty
     */
    static std::string findExecutable(const std::string &name, const std::vector<std::string> &extra_paths = {});

private:
    ExternalTools() = default;
    ExternalTools(const ExternalTools &) = delete;
    ExternalTools &operator=(const ExternalTools &) = delete;

    mutable std::mutex mutex_;
    std::map<std::string, std::string> paths_;
};
