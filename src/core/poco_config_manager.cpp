#include "core/poco_config_manager.hpp"
#include "logging/logger.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <sstream>

using Poco::AutoPtr;
using Poco::Util::JSONConfiguration;

namespace
{
    const char *envValue(const char *name)
    {
        const char *value = std::getenv(name);
        if (value == nullptr || *value == '\0')
            return nullptr;
        return value;
    }

    bool parseInt64(const std::string &text, int64_t &out)
    {
        try
        {
            size_t consumed = 0;
            long long value = std::stoll(text, &consumed);
            if (consumed != text.size())
                return false;
            out = static_cast<int64_t>(value);
            return true;
        }
        catch (const std::exception &)
        {
            return false;
        }
    }
}

PocoConfigManager::PocoConfigManager()
{
    cfg_ = new JSONConfiguration();
    initializeDefaultConfig();
}

bool PocoConfigManager::load(const std::string &path)
{
    std::ifstream in(path);
    if (!in.good())
        return false;

    nlohmann::json patch;
    try
    {
        in >> patch;
    }
    catch (const nlohmann::json::exception &e)
    {
        Logger::error("PocoConfigManager: cannot parse " + path + ": " + e.what());
        return false;
    }
    if (!patch.is_object())
    {
        Logger::error("PocoConfigManager: " + path + " does not contain a JSON object");
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    applyPatchLocked(patch);
    return true;
}

bool PocoConfigManager::save(const std::string &path) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::ofstream out(path);
    if (!out.is_open())
        return false;
    cfg_->save(out);
    return true;
}

nlohmann::json PocoConfigManager::getAll() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::stringstream ss;
    cfg_->save(ss);
    return nlohmann::json::parse(ss.str());
}

void PocoConfigManager::update(const nlohmann::json &patch)
{
    std::lock_guard<std::mutex> lock(mutex_);
    applyPatchLocked(patch);
}

void PocoConfigManager::applyPatchLocked(const nlohmann::json &patch)
{
    // Flatten nested objects into dotted keys
    std::function<void(const std::string &, const nlohmann::json &)> apply;
    apply = [&](const std::string &prefix, const nlohmann::json &node)
    {
        if (node.is_object())
        {
            for (auto it = node.begin(); it != node.end(); ++it)
            {
                std::string key = prefix.empty() ? it.key() : (prefix + "." + it.key());
                apply(key, it.value());
            }
        }
        else if (!node.is_null())
        {
            if (node.is_boolean())
                cfg_->setBool(prefix, node.get<bool>());
            else if (node.is_number_integer())
                cfg_->setInt64(prefix, node.get<int64_t>());
            else if (node.is_number_unsigned())
                cfg_->setUInt64(prefix, node.get<uint64_t>());
            else if (node.is_number_float())
                cfg_->setDouble(prefix, node.get<double>());
            else if (node.is_string())
                cfg_->setString(prefix, node.get<std::string>());
            else
                cfg_->setString(prefix, node.dump());
        }
    };
    apply("", patch);
}

void PocoConfigManager::applyEnvironmentOverrides()
{
    nlohmann::json patch = nlohmann::json::object();

    if (const char *port = envValue("PORT"))
    {
        int64_t value = 0;
        if (parseInt64(port, value))
            patch["server_port"] = value;
        else
            Logger::warn("PocoConfigManager: ignoring non-numeric PORT=" + std::string(port));
    }
    if (const char *origin = envValue("FRONTEND_URL"))
    {
        patch["cors"]["allowed_origin"] = origin;
    }
    if (const char *max_len = envValue("MAX_CONTENT_LENGTH"))
    {
        int64_t value = 0;
        if (parseInt64(max_len, value))
            patch["limits"]["max_upload_bytes"] = value;
        else
            Logger::warn("PocoConfigManager: ignoring non-numeric MAX_CONTENT_LENGTH=" + std::string(max_len));
    }
    if (const char *env = envValue("APP_ENV"))
    {
        patch["environment"] = env;
    }
    if (const char *level = envValue("LOG_LEVEL"))
    {
        patch["log_level"] = level;
    }
    if (const char *root = envValue("STAGING_ROOT"))
    {
        patch["staging"]["root"] = root;
    }

    if (!patch.empty())
    {
        update(patch);
        Logger::debug("PocoConfigManager: applied environment overrides " + patch.dump());
    }
}

std::string PocoConfigManager::getString(const std::string &key, const std::string &def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getString(key, def);
}

int PocoConfigManager::getInt(const std::string &key, int def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getInt(key, def);
}

int64_t PocoConfigManager::getInt64(const std::string &key, int64_t def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getInt64(key, def);
}

bool PocoConfigManager::getBool(const std::string &key, bool def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getBool(key, def);
}

bool PocoConfigManager::hasKey(const std::string &key) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->hasProperty(key);
}

std::string PocoConfigManager::getServerHost() const
{
    return getString("server_host", "0.0.0.0");
}

int PocoConfigManager::getServerPort() const
{
    return getInt("server_port", 5000);
}

std::string PocoConfigManager::getLogLevel() const
{
    return getString("log_level", "INFO");
}

std::string PocoConfigManager::getEnvironment() const
{
    return getString("environment", "development");
}

bool PocoConfigManager::isProduction() const
{
    return getEnvironment() == "production";
}

std::string PocoConfigManager::getAllowedOrigin() const
{
    return getString("cors.allowed_origin", "*");
}

int PocoConfigManager::getHttpServerThreads() const
{
    return getInt("threading.http_server_threads", 8);
}

int64_t PocoConfigManager::getMaxUploadBytes() const
{
    return getInt64("limits.max_upload_bytes", 500LL * 1024 * 1024);
}

int PocoConfigManager::getHandlerTimeoutSeconds() const
{
    return getInt("limits.handler_timeout_seconds", 600);
}

int PocoConfigManager::getMaxHandlerThreads() const
{
    return getInt("limits.max_handler_threads", 64);
}

int PocoConfigManager::getShutdownDrainSeconds() const
{
    return getInt("limits.shutdown_drain_seconds", 30);
}

std::string PocoConfigManager::getStagingRoot() const
{
    return getString("staging.root", (std::filesystem::temp_directory_path() / "file_gateway").string());
}

int PocoConfigManager::getStagingStaleAgeSeconds() const
{
    return getInt("staging.stale_age_seconds", 3600);
}

int PocoConfigManager::getStagingReleaseGraceMs() const
{
    return getInt("staging.release_grace_ms", 2000);
}

int64_t PocoConfigManager::getStagingMinFreeBytes() const
{
    return getInt64("staging.min_free_bytes", 64LL * 1024 * 1024);
}

bool PocoConfigManager::validateConfig() const
{
    int port = getServerPort();
    if (port <= 0 || port > 65535)
    {
        Logger::error("Invalid server port: " + std::to_string(port));
        return false;
    }

    std::string log_level = getLogLevel();
    if (!Logger::isValidLevel(log_level))
    {
        Logger::error("Invalid log level: " + log_level);
        return false;
    }

    std::string environment = getEnvironment();
    if (environment != "production" && environment != "development")
    {
        Logger::error("Invalid environment: " + environment);
        return false;
    }

    if (getMaxUploadBytes() <= 0)
    {
        Logger::error("limits.max_upload_bytes must be positive");
        return false;
    }

    if (getHandlerTimeoutSeconds() <= 0)
    {
        Logger::error("limits.handler_timeout_seconds must be positive");
        return false;
    }

    if (getMaxHandlerThreads() <= 0 || getShutdownDrainSeconds() < 0)
    {
        Logger::error("limits.max_handler_threads must be positive and limits.shutdown_drain_seconds not negative");
        return false;
    }

    if (getHttpServerThreads() <= 0)
    {
        Logger::error("threading.http_server_threads must be positive");
        return false;
    }

    if (getStagingRoot().empty())
    {
        Logger::error("staging.root must not be empty");
        return false;
    }

    if (getStagingReleaseGraceMs() < 0 || getStagingStaleAgeSeconds() <= 0 || getStagingMinFreeBytes() < 0)
    {
        Logger::error("Invalid staging timing or reserve settings");
        return false;
    }

    return true;
}

void PocoConfigManager::initializeDefaultConfig()
{
    std::lock_guard<std::mutex> lock(mutex_);

    cfg_ = new JSONConfiguration();

    cfg_->setString("server_host", "0.0.0.0");
    cfg_->setInt("server_port", 5000);
    cfg_->setString("environment", "development");
    cfg_->setString("log_level", "INFO");
    cfg_->setString("cors.allowed_origin", "*");

    // Limits
    cfg_->setInt64("limits.max_upload_bytes", 500LL * 1024 * 1024);
    cfg_->setInt("limits.handler_timeout_seconds", 600);
    cfg_->setInt("limits.max_handler_threads", 64);
    cfg_->setInt("limits.shutdown_drain_seconds", 30);

    // Staging defaults
    cfg_->setString("staging.root", (std::filesystem::temp_directory_path() / "file_gateway").string());
    cfg_->setInt("staging.stale_age_seconds", 3600);
    cfg_->setInt("staging.release_grace_ms", 2000);
    cfg_->setInt64("staging.min_free_bytes", 64LL * 1024 * 1024);

    // Threading defaults
    cfg_->setInt("threading.http_server_threads", 8);
}
