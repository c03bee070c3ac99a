#pragma once

#include "core/capability_registry.hpp"
#include <filesystem>
#include <string>

/**
 * @brief Headless LibreOffice conversions.
 *
 * Every request gets its own LibreOffice profile under the request's work
 * directory, so concurrent requests do not block on a shared profile lock.
 */
class OfficeConverter
{
public:
    /**
     * @brief Convert `input` to `target` (e.g. "pdf", "docx", "pptx") inside `out_dir`.
     * @param import_filter optional --infilter value
     * @return path of the converted file
     * @throws ProcessingError(ToolUnavailable) without soffice,
     *         ProcessingError(HandlerCrashed) when no output appears
     */
    static std::filesystem::path convert(const HandlerRequest &request,
                                         const std::filesystem::path &input,
                                         const std::string &target,
                                         const std::filesystem::path &out_dir,
                                         const std::string &import_filter = "");

private:
    static std::string profileUrl(const HandlerRequest &request);
};
