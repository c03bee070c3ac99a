#include "core/staging_area_manager.hpp"
#include "core/filename_sanitizer.hpp"
#include "core/random_token.hpp"
#include "logging/logger.hpp"
#include <chrono>
#include <fstream>
#include <thread>
#include <system_error>
#include <unistd.h>

namespace fs = std::filesystem;

namespace
{
    const char *const DIR_PREFIX = "req-";
    constexpr int MAX_ACQUIRE_ATTEMPTS = 8;
    constexpr auto RELEASE_RETRY_INTERVAL = std::chrono::milliseconds(25);
}

ScopedStagingDir::ScopedStagingDir(StagingAreaManager *owner, fs::path dir)
    : owner_(owner), dir_(std::move(dir))
{
}

ScopedStagingDir::ScopedStagingDir(ScopedStagingDir &&other) noexcept
    : owner_(other.owner_), dir_(std::move(other.dir_)), used_names_(std::move(other.used_names_))
{
    other.owner_ = nullptr;
}

ScopedStagingDir &ScopedStagingDir::operator=(ScopedStagingDir &&other) noexcept
{
    if (this != &other)
    {
        release();
        owner_ = other.owner_;
        dir_ = std::move(other.dir_);
        used_names_ = std::move(other.used_names_);
        other.owner_ = nullptr;
    }
    return *this;
}

ScopedStagingDir::~ScopedStagingDir()
{
    release();
}

std::string ScopedStagingDir::uniqueName(const std::string &safe_name)
{
    std::string candidate = safe_name;
    std::string stem = FilenameSanitizer::stemOf(safe_name);
    std::string ext = safe_name.substr(stem.size());
    int suffix = 1;
    while (used_names_.count(candidate) > 0)
    {
        candidate = stem + "_" + std::to_string(suffix++) + ext;
    }
    used_names_.insert(candidate);
    return candidate;
}

StagedFile ScopedStagingDir::writeInput(const std::string &bytes, const std::string &safe_name)
{
    if (owner_ == nullptr)
    {
        throw StagingError("staging directory already released");
    }
    if (safe_name.empty() || safe_name.find('/') != std::string::npos || safe_name.front() == '.')
    {
        throw StagingError("refusing unsafe staged name '" + safe_name + "'");
    }

    owner_->checkFreeSpace(dir_, bytes.size());

    std::string final_name = uniqueName(safe_name);
    fs::path final_path = inputDir() / final_name;
    fs::path temp_path = inputDir() / ("." + randomHexToken(6) + ".part");

    {
        std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open())
        {
            throw StagingError("cannot open " + temp_path.string() + " for writing");
        }
        out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        out.flush();
        if (!out.good())
        {
            out.close();
            std::error_code ec;
            fs::remove(temp_path, ec);
            throw StagingError("short write while staging " + final_name);
        }
    }

    std::error_code ec;
    fs::rename(temp_path, final_path, ec);
    if (ec)
    {
        std::error_code ignored;
        fs::remove(temp_path, ignored);
        throw StagingError("cannot finalize " + final_name + ": " + ec.message());
    }

    StagedFile staged;
    staged.path = final_path;
    staged.safe_name = final_name;
    staged.extension = FilenameSanitizer::extensionOf(final_name);
    staged.size_bytes = bytes.size();
    return staged;
}

void ScopedStagingDir::release() noexcept
{
    StagingAreaManager *owner = owner_;
    owner_ = nullptr;
    if (owner != nullptr)
    {
        owner->releaseDirectory(dir_);
    }
}

StagingAreaManager::StagingAreaManager(StagingOptions options) : options_(std::move(options))
{
    if (options_.root.empty())
    {
        options_.root = fs::temp_directory_path() / "file_gateway";
    }
}

ScopedStagingDir StagingAreaManager::acquire()
{
    std::error_code ec;
    fs::create_directories(options_.root, ec);
    if (ec)
    {
        throw StagingError("cannot create staging root " + options_.root.string() + ": " + ec.message());
    }

    for (int attempt = 0; attempt < MAX_ACQUIRE_ATTEMPTS; ++attempt)
    {
        std::string name = std::string(DIR_PREFIX) + std::to_string(::getpid()) + "-" +
                           std::to_string(sequence_.fetch_add(1)) + "-" + randomHexToken(4);
        fs::path dir = options_.root / name;

        // create_directory reports false when the path already exists
        if (!fs::create_directory(dir, ec))
        {
            if (ec)
            {
                throw StagingError("cannot create staging directory " + dir.string() + ": " + ec.message());
            }
            continue;
        }

        fs::permissions(dir, fs::perms::owner_all, fs::perm_options::replace, ec);
        fs::create_directory(dir / "in", ec);
        if (!ec)
        {
            fs::create_directory(dir / "out", ec);
        }
        if (ec)
        {
            std::error_code ignored;
            fs::remove_all(dir, ignored);
            throw StagingError("cannot prepare staging directory " + dir.string() + ": " + ec.message());
        }

        active_.fetch_add(1);
        Logger::debug("StagingAreaManager: acquired " + dir.string());
        return ScopedStagingDir(this, dir);
    }

    throw StagingError("could not allocate a unique staging directory under " + options_.root.string());
}

void StagingAreaManager::releaseDirectory(const fs::path &dir) noexcept
{
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(options_.release_grace_ms);
    std::error_code ec;
    for (;;)
    {
        ec.clear();
        fs::remove_all(dir, ec);
        if (!ec && !fs::exists(dir, ec))
        {
            break;
        }
        if (std::chrono::steady_clock::now() >= deadline)
        {
            Logger::warn("StagingAreaManager: could not remove " + dir.string() +
                         (ec ? ": " + ec.message() : std::string()) + "; left for the startup sweep");
            break;
        }
        std::this_thread::sleep_for(RELEASE_RETRY_INTERVAL);
    }
    active_.fetch_sub(1);
    Logger::debug("StagingAreaManager: released " + dir.string());
}

void StagingAreaManager::checkFreeSpace(const fs::path &dir, uint64_t incoming) const
{
    std::error_code ec;
    fs::space_info info = fs::space(dir, ec);
    if (ec)
    {
        throw StagingError("cannot query free space on " + dir.string() + ": " + ec.message());
    }
    uint64_t reserve = options_.min_free_bytes > 0 ? static_cast<uint64_t>(options_.min_free_bytes) : 0;
    if (info.available < incoming || info.available - incoming < reserve)
    {
        throw StagingError("insufficient disk space in staging area (" + std::to_string(info.available) +
                           " bytes available)");
    }
}

size_t StagingAreaManager::sweepStale()
{
    std::error_code ec;
    if (!fs::is_directory(options_.root, ec))
    {
        return 0;
    }

    size_t removed = 0;
    auto max_age = std::chrono::seconds(options_.stale_age_seconds);
    auto now = fs::file_time_type::clock::now();
    for (fs::directory_iterator it(options_.root, ec), end; !ec && it != end; it.increment(ec))
    {
        const fs::directory_entry &entry = *it;
        std::string name = entry.path().filename().string();
        std::error_code entry_ec;
        if (name.rfind(DIR_PREFIX, 0) != 0 || !entry.is_directory(entry_ec))
        {
            continue;
        }
        auto modified = entry.last_write_time(entry_ec);
        if (entry_ec || now - modified < max_age)
        {
            continue;
        }
        std::error_code remove_ec;
        fs::remove_all(entry.path(), remove_ec);
        if (remove_ec)
        {
            Logger::warn("StagingAreaManager: sweep could not remove " + entry.path().string() + ": " + remove_ec.message());
        }
        else
        {
            ++removed;
        }
    }
    if (ec)
    {
        Logger::warn("StagingAreaManager: sweep stopped early: " + ec.message());
    }

    Logger::info("StagingAreaManager: startup sweep removed " + std::to_string(removed) + " stale directories");
    return removed;
}

bool StagingAreaManager::isRootWritable() const
{
    std::error_code ec;
    fs::create_directories(options_.root, ec);
    if (ec)
    {
        return false;
    }
    return ::access(options_.root.c_str(), W_OK | X_OK) == 0;
}
