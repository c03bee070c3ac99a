#pragma once

#include <Poco/Util/JSONConfiguration.h>
#include <Poco/AutoPtr.h>
#include <cstdint>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>

/**
 * @brief Gateway configuration backed by Poco's JSONConfiguration.
 *
 * Built-in defaults are installed at construction. A JSON file is merged on
 * top of them by load(), and applyEnvironmentOverrides() applies the process
 * environment last. Nested JSON objects are addressed with dotted keys
 * ("limits.max_upload_bytes").
 */
class PocoConfigManager
{
public:
    static PocoConfigManager &getInstance()
    {
        static PocoConfigManager instance;
        return instance;
    }

    // Core file operations
    bool load(const std::string &path);
    bool save(const std::string &path) const;
    void update(const nlohmann::json &patch);
    nlohmann::json getAll() const;

    /**
     * @brief Apply PORT, FRONTEND_URL, MAX_CONTENT_LENGTH, APP_ENV, LOG_LEVEL
     * and STAGING_ROOT from the environment when they are set and parse.
     */
    void applyEnvironmentOverrides();

    // Basic configuration getters
    std::string getString(const std::string &key, const std::string &def = "") const;
    int getInt(const std::string &key, int def = 0) const;
    int64_t getInt64(const std::string &key, int64_t def = 0) const;
    bool getBool(const std::string &key, bool def = false) const;
    bool hasKey(const std::string &key) const;

    // Server configuration getters
    std::string getServerHost() const;
    int getServerPort() const;
    std::string getLogLevel() const;
    std::string getEnvironment() const;
    bool isProduction() const;
    std::string getAllowedOrigin() const;
    int getHttpServerThreads() const;

    // Request limits
    int64_t getMaxUploadBytes() const;
    int getHandlerTimeoutSeconds() const;
    int getMaxHandlerThreads() const;
    int getShutdownDrainSeconds() const;

    // Staging area
    std::string getStagingRoot() const;
    int getStagingStaleAgeSeconds() const;
    int getStagingReleaseGraceMs() const;
    int64_t getStagingMinFreeBytes() const;

    bool validateConfig() const;

    // Restore built-in defaults, dropping anything loaded or overridden
    void initializeDefaultConfig();

private:
    PocoConfigManager();
    ~PocoConfigManager() = default;
    PocoConfigManager(const PocoConfigManager &) = delete;
    PocoConfigManager &operator=(const PocoConfigManager &) = delete;

    void applyPatchLocked(const nlohmann::json &patch);

    mutable std::mutex mutex_;
    Poco::AutoPtr<Poco::Util::JSONConfiguration> cfg_;
};
