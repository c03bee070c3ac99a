#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <set>
#include <stdexcept>
#include <string>

/**
 * @brief Raised when the staging area cannot create or fill a working directory
 */
class StagingError : public std::runtime_error
{
public:
    explicit StagingError(const std::string &message) : std::runtime_error(message) {}
};

/**
 * @brief One uploaded file materialized inside a request's staging directory
 */
struct StagedFile
{
    std::filesystem::path path;
    std::string safe_name;
    std::string extension;
    uint64_t size_bytes = 0;
};

struct StagingOptions
{
    std::filesystem::path root;
    int stale_age_seconds = 3600;
    int release_grace_ms = 2000;
    int64_t min_free_bytes = 64LL * 1024 * 1024;
};

class StagingAreaManager;

/**
 * @brief Move-only handle on one request's staging directory.
 *
 * Layout is `<root>/req-<pid>-<seq>-<hex>/{in,out}`. The directory and
 * everything under it is removed by release(), which the destructor calls.
 */
class ScopedStagingDir
{
public:
    ScopedStagingDir(ScopedStagingDir &&other) noexcept;
    ScopedStagingDir &operator=(ScopedStagingDir &&other) noexcept;
    ScopedStagingDir(const ScopedStagingDir &) = delete;
    ScopedStagingDir &operator=(const ScopedStagingDir &) = delete;
    ~ScopedStagingDir();

    /**
     * @brief Persist `bytes` as `in/<safe_name>`, suffixing `_N` on collision.
     *
     * The data is written under a hidden temporary name and renamed into
     * place, so a partial file is never visible under its final name.
     * @throws StagingError on I/O failure or when the free-space reserve would be violated
     */
    StagedFile writeInput(const std::string &bytes, const std::string &safe_name);

    const std::filesystem::path &path() const { return dir_; }
    std::filesystem::path inputDir() const { return dir_ / "in"; }
    std::filesystem::path outputDir() const { return dir_ / "out"; }

    // Idempotent; never throws
    void release() noexcept;
    bool isReleased() const { return owner_ == nullptr; }

private:
    friend class StagingAreaManager;
    ScopedStagingDir(StagingAreaManager *owner, std::filesystem::path dir);

    std::string uniqueName(const std::string &safe_name);

    StagingAreaManager *owner_;
    std::filesystem::path dir_;
    std::set<std::string> used_names_;
};

/**
 * @brief Creates isolated per-request working directories under a common
 * root and guarantees they are deleted.
 */
class StagingAreaManager
{
public:
    explicit StagingAreaManager(StagingOptions options);
    StagingAreaManager(const StagingAreaManager &) = delete;
    StagingAreaManager &operator=(const StagingAreaManager &) = delete;

    /**
     * @throws StagingError if the directory cannot be created
     */
    ScopedStagingDir acquire();

    /**
     * @brief Remove `req-*` directories older than the stale age.
     * @return number of directories removed
     */
    size_t sweepStale();

    bool isRootWritable() const;

    const std::filesystem::path &root() const { return options_.root; }
    const StagingOptions &options() const { return options_; }
    size_t activeCount() const { return active_.load(); }

private:
    friend class ScopedStagingDir;

    void releaseDirectory(const std::filesystem::path &dir) noexcept;
    void checkFreeSpace(const std::filesystem::path &dir, uint64_t incoming) const;

    StagingOptions options_;
    std::atomic<uint64_t> sequence_{0};
    std::atomic<size_t> active_{0};
};
