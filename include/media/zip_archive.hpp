#pragma once

#include "core/cancellation_token.hpp"
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <utility>
#include <vector>

/**
 * @brief ZIP batch helpers on top of libarchive
 */
class ZipArchive
{
public:
    static constexpr size_t MAX_ENTRIES = 2000;
    static constexpr uint64_t MAX_EXTRACTED_BYTES = 4ULL * 1024 * 1024 * 1024;

    /**
     * @brief Extract the regular files of `archive_path` below `dest_dir`.
     *
     * Entries that would land outside `dest_dir` (absolute paths, `..`),
     * links and device nodes are skipped. The parent of `dest_dir` must
     * exist; directories are only ever created below it.
     * @return extracted files in archive order
     * @throws ProcessingError(InvalidInput) if the archive cannot be read or exceeds the limits
     * @throws ProcessingError(Timeout) once `cancel` is set
     */
    static std::vector<std::filesystem::path> extract(const std::filesystem::path &archive_path,
                                                      const std::filesystem::path &dest_dir,
                                                      const CancellationToken *cancel = nullptr);

    /**
     * @brief Write a deflate-compressed ZIP with `entries` (name in archive, file on disk).
     * @throws std::runtime_error on any libarchive failure
     */
    static void create(const std::filesystem::path &out_path,
                       const std::vector<std::pair<std::string, std::filesystem::path>> &entries);

    // Called for each member of a repacked archive; return true if `data` was replaced
    using EntryTransform = std::function<bool(const std::string &name, std::string &data)>;

    /**
     * @brief Copy a ZIP container (docx, pptx...) member by member, letting
     * `transform` rewrite member contents.
     * @return number of members rewritten
     */
    static size_t repack(const std::filesystem::path &src_path,
                         const std::filesystem::path &dst_path,
                         const EntryTransform &transform);
};
