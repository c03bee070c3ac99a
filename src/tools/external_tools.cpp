#include "tools/external_tools.hpp"
#include "core/processing_outcome.hpp"
#include "logging/logger.hpp"
#include <cstdlib>
#include <filesystem>
#include <sstream>
#include <unistd.h>

namespace fs = std::filesystem;

namespace
{
    bool isExecutableFile(const fs::path &candidate)
    {
        std::error_code ec;
        return fs::is_regular_file(candidate, ec) && ::access(candidate.c_str(), X_OK) == 0;
    }
}

std::string ExternalTools::findExecutable(const std::string &name, const std::vector<std::string> &extra_paths)
{
    if (name.find('/') != std::string::npos)
    {
        return isExecutableFile(name) ? name : "";
    }

    const char *path_env = std::getenv("PATH");
    std::stringstream ss(path_env != nullptr ? path_env : "/usr/local/bin:/usr/bin:/bin");
    std::string dir;
    while (std::getline(ss, dir, ':'))
    {
        if (dir.empty())
            continue;
        fs::path candidate = fs::path(dir) / name;
        if (isExecutableFile(candidate))
            return candidate.string();
    }

    for (const auto &extra : extra_paths)
    {
        if (isExecutableFile(extra))
            return extra;
    }
    return "";
}

void ExternalTools::discover()
{
    std::map<std::string, std::string> found;
    found[FFMPEG] = findExecutable("ffmpeg", {"/usr/local/bin/ffmpeg", "/opt/homebrew/bin/ffmpeg"});
    found[YT_DLP] = findExecutable("yt-dlp", {"/usr/local/bin/yt-dlp"});
    found[QPDF] = findExecutable("qpdf", {"/opt/homebrew/bin/qpdf"});
    found[GHOSTSCRIPT] = findExecutable("gs", {"/opt/homebrew/bin/gs"});
    found[REMBG] = findExecutable("rembg");

    std::string soffice = findExecutable("soffice", {"/usr/lib/libreoffice/program/soffice",
                                                     "/opt/libreoffice/program/soffice",
                                                     "/Applications/LibreOffice.app/Contents/MacOS/soffice"});
    if (soffice.empty())
    {
        soffice = findExecutable("libreoffice");
    }
    found[SOFFICE] = soffice;

    for (const auto &entry : found)
    {
        if (entry.second.empty())
            Logger::warn("ExternalTools: " + entry.first + " not found; dependent capabilities will report ToolUnavailable");
        else
            Logger::info("ExternalTools: " + entry.first + " -> " + entry.second);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    paths_ = std::move(found);
}

std::string ExternalTools::path(const std::string &tool) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = paths_.find(tool);
    return it == paths_.end() ? "" : it->second;
}

std::string ExternalTools::require(const std::string &tool) const
{
    std::string location = path(tool);
    if (location.empty())
    {
        throw ProcessingError(FailureKind::ToolUnavailable, tool + " is not installed on this server");
    }
    return location;
}

void ExternalTools::setPath(const std::string &tool, const std::string &location)
{
    std::lock_guard<std::mutex> lock(mutex_);
    paths_[tool] = location;
}

nlohmann::json ExternalTools::availability() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    nlohmann::json tools = nlohmann::json::object();
    for (const auto &entry : paths_)
    {
        tools[entry.first] = !entry.second.empty();
    }
    return tools;
}
