#pragma once

#include "core/cancellation_token.hpp"
#include <chrono>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

/**
 * @brief Exit information and captured output of one external tool run
 */
struct ToolResult
{
    int exit_code = -1;
    std::string output; // combined stdout/stderr, tail only
    bool cancelled = false;
    bool timed_out = false;

    bool succeeded() const { return exit_code == 0 && !cancelled && !timed_out; }
};

class ToolError : public std::runtime_error
{
public:
    explicit ToolError(const std::string &message) : std::runtime_error(message) {}
};

/**
 * @brief Runs command line tools without a shell.
 *
 * The child gets its own process group, so cancellation or timeout stops
 * the whole tree (SIGTERM, then SIGKILL after a short grace period).
 */
class ToolRunner
{
public:
    static constexpr size_t MAX_CAPTURED_BYTES = 64 * 1024;

    /**
     * @param argv program and arguments; argv[0] is looked up on PATH
     * @param cancel polled while the tool runs; may be null
     * @param timeout zero means no limit other than cancellation
     * @throws ToolError if the process cannot be started
     */
    static ToolResult run(const std::vector<std::string> &argv,
                          const CancellationToken *cancel = nullptr,
                          std::chrono::milliseconds timeout = std::chrono::milliseconds(0),
                          const std::filesystem::path &working_dir = {});

    // Last `max_bytes` of `output`, for error details
    static std::string tail(const std::string &output, size_t max_bytes = 2000);

private:
    // SIGTERM then SIGKILL to the group; true if the leader was reaped into `status`
    static bool terminateGroup(int pid, int &status);
};
