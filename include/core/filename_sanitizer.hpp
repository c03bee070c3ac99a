#pragma once

#include <string>

/**
 * @brief Result of sanitizing a client-supplied filename
 */
struct SanitizedName
{
    std::string safe_name;
    std::string extension; // lowercase, without the dot, empty if none
    bool randomized;       // true when the generated fallback name was used

    SanitizedName() : randomized(false) {}
};

inline bool operator==(const SanitizedName &a, const SanitizedName &b)
{
    return a.safe_name == b.safe_name && a.extension == b.extension && a.randomized == b.randomized;
}

/**
 * @brief Maps arbitrary client filenames onto names that are safe to create
 * inside a staging directory.
 *
 * The output holds only [A-Za-z0-9._-], never starts or ends with a dot,
 * contains no path separator, is at most 255 bytes and is never empty.
 * sanitize() is idempotent on its own output except when the random
 * fallback was needed.
 */
class FilenameSanitizer
{
public:
    static constexpr size_t MAX_NAME_BYTES = 255;

    static SanitizedName sanitize(const std::string &raw_name);

    /**
     * @brief Lowercased text after the final dot of `name`, or empty.
     */
    static std::string extensionOf(const std::string &name);

    /**
     * @brief `name` without its final extension.
     */
    static std::string stemOf(const std::string &name);

private:
    static bool isAllowedChar(unsigned char c);
    static std::string stripDots(const std::string &name);
    static std::string truncatePreservingExtension(const std::string &name);
};
