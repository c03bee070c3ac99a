#include "core/filename_sanitizer.hpp"
#include "core/random_token.hpp"
#include <algorithm>
#include <cctype>

SanitizedName FilenameSanitizer::sanitize(const std::string &raw_name)
{
    // Keep only the last path component, treating both separators alike
    std::string base = raw_name;
    std::replace(base.begin(), base.end(), '\\', '/');
    size_t slash = base.find_last_of('/');
    if (slash != std::string::npos)
    {
        base = base.substr(slash + 1);
    }

    std::string cleaned;
    cleaned.reserve(base.size());
    for (unsigned char c : base)
    {
        cleaned.push_back(isAllowedChar(c) ? static_cast<char>(c) : '_');
    }

    cleaned = stripDots(cleaned);
    cleaned = stripDots(truncatePreservingExtension(cleaned));

    SanitizedName result;
    if (cleaned.empty())
    {
        result.safe_name = "upload_" + randomHexToken(8);
        result.randomized = true;
    }
    else
    {
        result.safe_name = cleaned;
    }
    result.extension = extensionOf(result.safe_name);
    return result;
}

std::string FilenameSanitizer::extensionOf(const std::string &name)
{
    size_t dot = name.find_last_of('.');
    if (dot == std::string::npos || dot + 1 >= name.size())
    {
        return "";
    }
    std::string ext = name.substr(dot + 1);
    if (ext.find('/') != std::string::npos || ext.find('\\') != std::string::npos)
    {
        return "";
    }
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c)
                   { return static_cast<char>(std::tolower(c)); });
    return ext;
}

std::string FilenameSanitizer::stemOf(const std::string &name)
{
    size_t dot = name.find_last_of('.');
    if (dot == std::string::npos || dot == 0)
    {
        return name;
    }
    return name.substr(0, dot);
}

bool FilenameSanitizer::isAllowedChar(unsigned char c)
{
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
           c == '.' || c == '-' || c == '_';
}

std::string FilenameSanitizer::stripDots(const std::string &name)
{
    size_t first = name.find_first_not_of('.');
    if (first == std::string::npos)
    {
        return "";
    }
    size_t last = name.find_last_not_of('.');
    return name.substr(first, last - first + 1);
}

std::string FilenameSanitizer::truncatePreservingExtension(const std::string &name)
{
    if (name.size() <= MAX_NAME_BYTES)
    {
        return name;
    }

    size_t dot = name.find_last_of('.');
    std::string ext = (dot == std::string::npos) ? "" : name.substr(dot);
    if (ext.size() >= MAX_NAME_BYTES / 2)
    {
        // An absurdly long "extension" is not worth preserving
        return name.substr(0, MAX_NAME_BYTES);
    }
    return name.substr(0, MAX_NAME_BYTES - ext.size()) + ext;
}
