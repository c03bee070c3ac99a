#pragma once

#include <gtest/gtest.h>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>
#include "core/random_token.hpp"
#include "logging/logger.hpp"

/**
 * @brief Base fixture: gives every test its own scratch directory under the
 * system temp dir and removes it afterwards.
 */
class TestBase : public ::testing::Test
{
protected:
    void SetUp() override
    {
        Logger::init("DEBUG");

        const auto *info = ::testing::UnitTest::GetInstance()->current_test_info();
        test_dir_ = std::filesystem::temp_directory_path() /
                    ("file_gateway_test_" + std::string(info->name()) + "_" + randomHexToken(4));
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override
    {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
        if (ec)
        {
            Logger::warn("TestBase: could not remove " + test_dir_.string() + ": " + ec.message());
        }
    }

    std::filesystem::path writeFile(const std::string &name, const std::string &content)
    {
        std::filesystem::path path = test_dir_ / name;
        std::filesystem::create_directories(path.parent_path());
        std::ofstream out(path, std::ios::binary);
        out << content;
        return path;
    }

    static size_t countEntries(const std::filesystem::path &dir)
    {
        std::error_code ec;
        if (!std::filesystem::exists(dir, ec))
            return 0;
        size_t n = 0;
        for (auto it = std::filesystem::directory_iterator(dir, ec); !ec && it != std::filesystem::directory_iterator(); it.increment(ec))
            ++n;
        return n;
    }

    // Poll `condition` for up to `timeout`
    template <typename Predicate>
    static bool waitUntil(Predicate condition, std::chrono::milliseconds timeout = std::chrono::milliseconds(3000))
    {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline)
        {
            if (condition())
                return true;
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
        return condition();
    }

    std::filesystem::path test_dir_;
};
