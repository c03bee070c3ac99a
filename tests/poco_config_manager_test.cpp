#include "test_base.hpp"
#include "core/poco_config_manager.hpp"
#include <cstdlib>

class PocoConfigManagerTest : public TestBase
{
protected:
    void SetUp() override
    {
        TestBase::SetUp();
        clearEnvironment();
        PocoConfigManager::getInstance().initializeDefaultConfig();
    }

    void TearDown() override
    {
        clearEnvironment();
        PocoConfigManager::getInstance().initializeDefaultConfig();
        TestBase::TearDown();
    }

    static void clearEnvironment()
    {
        for (const char *name : {"PORT", "FRONTEND_URL", "MAX_CONTENT_LENGTH", "APP_ENV", "LOG_LEVEL", "STAGING_ROOT"})
        {
            ::unsetenv(name);
        }
    }
};

TEST_F(PocoConfigManagerTest, DefaultsAreValid)
{
    auto &config = PocoConfigManager::getInstance();
    EXPECT_EQ(config.getServerPort(), 5000);
    EXPECT_EQ(config.getServerHost(), "0.0.0.0");
    EXPECT_EQ(config.getEnvironment(), "development");
    EXPECT_FALSE(config.isProduction());
    EXPECT_EQ(config.getAllowedOrigin(), "*");
    EXPECT_EQ(config.getMaxUploadBytes(), 500LL * 1024 * 1024);
    EXPECT_EQ(config.getHandlerTimeoutSeconds(), 600);
    EXPECT_EQ(config.getMaxHandlerThreads(), 64);
    EXPECT_EQ(config.getShutdownDrainSeconds(), 30);
    EXPECT_EQ(config.getStagingStaleAgeSeconds(), 3600);
    EXPECT_TRUE(config.validateConfig());
}

TEST_F(PocoConfigManagerTest, LoadMergesNestedFile)
{
    std::filesystem::path path = writeFile("config.json", R"({
        "server_port": 9090,
        "log_level": "DEBUG",
        "limits": { "max_upload_bytes": 1048576 },
        "staging": { "root": "/tmp/gateway-test-root" }
    })");

    auto &config = PocoConfigManager::getInstance();
    ASSERT_TRUE(config.load(path.string()));
    EXPECT_EQ(config.getServerPort(), 9090);
    EXPECT_EQ(config.getLogLevel(), "DEBUG");
    EXPECT_EQ(config.getMaxUploadBytes(), 1048576);
    EXPECT_EQ(config.getStagingRoot(), "/tmp/gateway-test-root");
    // Untouched keys keep their defaults
    EXPECT_EQ(config.getHandlerTimeoutSeconds(), 600);
    EXPECT_TRUE(config.validateConfig());
}

TEST_F(PocoConfigManagerTest, LoadRejectsMissingOrMalformedFiles)
{
    auto &config = PocoConfigManager::getInstance();
    EXPECT_FALSE(config.load((test_dir_ / "absent.json").string()));
    EXPECT_FALSE(config.load(writeFile("broken.json", "{ not json").string()));
    EXPECT_FALSE(config.load(writeFile("array.json", "[1, 2]").string()));
    EXPECT_EQ(config.getServerPort(), 5000);
}

TEST_F(PocoConfigManagerTest, EnvironmentOverridesWin)
{
    auto &config = PocoConfigManager::getInstance();
    config.update({{"server_port", 7000}});

    ::setenv("PORT", "8123", 1);
    ::setenv("FRONTEND_URL", "https://app.example.com", 1);
    ::setenv("MAX_CONTENT_LENGTH", "2048", 1);
    ::setenv("APP_ENV", "production", 1);
    ::setenv("STAGING_ROOT", "/var/tmp/staging", 1);
    config.applyEnvironmentOverrides();

    EXPECT_EQ(config.getServerPort(), 8123);
    EXPECT_EQ(config.getAllowedOrigin(), "https://app.example.com");
    EXPECT_EQ(config.getMaxUploadBytes(), 2048);
    EXPECT_TRUE(config.isProduction());
    EXPECT_EQ(config.getStagingRoot(), "/var/tmp/staging");
}

TEST_F(PocoConfigManagerTest, NonNumericEnvironmentValuesAreIgnored)
{
    auto &config = PocoConfigManager::getInstance();
    ::setenv("PORT", "eighty", 1);
    ::setenv("MAX_CONTENT_LENGTH", "10MB", 1);
    config.applyEnvironmentOverrides();

    EXPECT_EQ(config.getServerPort(), 5000);
    EXPECT_EQ(config.getMaxUploadBytes(), 500LL * 1024 * 1024);
}

TEST_F(PocoConfigManagerTest, ValidationCatchesBadValues)
{
    auto &config = PocoConfigManager::getInstance();

    config.update({{"server_port", 70000}});
    EXPECT_FALSE(config.validateConfig());
    config.initializeDefaultConfig();

    config.update({{"log_level", "CHATTY"}});
    EXPECT_FALSE(config.validateConfig());
    config.initializeDefaultConfig();

    config.update({{"environment", "staging"}});
    EXPECT_FALSE(config.validateConfig());
    config.initializeDefaultConfig();

    config.update({{"limits", {{"handler_timeout_seconds", 0}}}});
    EXPECT_FALSE(config.validateConfig());
    config.initializeDefaultConfig();

    config.update({{"limits", {{"max_handler_threads", 0}}}});
    EXPECT_FALSE(config.validateConfig());
}

TEST_F(PocoConfigManagerTest, SaveRoundTripsThroughLoad)
{
    auto &config = PocoConfigManager::getInstance();
    config.update({{"server_port", 6001}, {"cors", {{"allowed_origin", "https://x.test"}}}});
    std::filesystem::path path = test_dir_ / "saved.json";
    ASSERT_TRUE(config.save(path.string()));

    config.initializeDefaultConfig();
    ASSERT_TRUE(config.load(path.string()));
    EXPECT_EQ(config.getServerPort(), 6001);
    EXPECT_EQ(config.getAllowedOrigin(), "https://x.test");
    EXPECT_TRUE(config.getAll().contains("staging"));
}
