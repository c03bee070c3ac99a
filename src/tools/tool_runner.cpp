#include "tools/tool_runner.hpp"
#include "logging/logger.hpp"
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace
{
    constexpr int POLL_INTERVAL_MS = 50;
    constexpr auto TERMINATE_GRACE = std::chrono::milliseconds(1500);

    void appendCapped(std::string &out, const char *data, size_t len)
    {
        out.append(data, len);
        if (out.size() > ToolRunner::MAX_CAPTURED_BYTES)
        {
            out.erase(0, out.size() - ToolRunner::MAX_CAPTURED_BYTES);
        }
    }

    std::string joinArgs(const std::vector<std::string> &argv)
    {
        std::string out;
        for (const auto &arg : argv)
        {
            if (!out.empty())
                out += ' ';
            out += arg;
        }
        return out;
    }
}

ToolResult ToolRunner::run(const std::vector<std::string> &argv,
                           const CancellationToken *cancel,
                           std::chrono::milliseconds timeout,
                           const std::filesystem::path &working_dir)
{
    if (argv.empty() || argv[0].empty())
    {
        throw ToolError("empty command line");
    }

    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0)
    {
        throw ToolError(std::string("pipe failed: ") + std::strerror(errno));
    }

    // Build argv before forking; only async-signal-safe calls in the child
    std::vector<char *> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto &arg : argv)
    {
        cargv.push_back(const_cast<char *>(arg.c_str()));
    }
    cargv.push_back(nullptr);
    std::string cwd = working_dir.string();

    Logger::debug("ToolRunner: exec " + joinArgs(argv));

    pid_t pid = ::fork();
    if (pid < 0)
    {
        int err = errno;
        ::close(fds[0]);
        ::close(fds[1]);
        throw ToolError(std::string("fork failed: ") + std::strerror(err));
    }

    if (pid == 0)
    {
        ::setpgid(0, 0);
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0)
        {
            ::dup2(devnull, STDIN_FILENO);
            ::close(devnull);
        }
        ::dup2(fds[1], STDOUT_FILENO);
        ::dup2(fds[1], STDERR_FILENO);
        if (!cwd.empty() && ::chdir(cwd.c_str()) != 0)
        {
            _exit(126);
        }
        ::execvp(cargv[0], cargv.data());
        const char msg[] = "exec failed\n";
        ssize_t ignored = ::write(STDERR_FILENO, msg, sizeof(msg) - 1);
        (void)ignored;
        _exit(127);
    }

    ::setpgid(pid, pid);
    ::close(fds[1]);
    int read_fd = fds[0];
    ::fcntl(read_fd, F_SETFL, ::fcntl(read_fd, F_GETFL) | O_NONBLOCK);

    ToolResult result;
    auto started = std::chrono::steady_clock::now();
    bool pipe_open = true;
    bool reaped = false;
    int status = 0;
    char buffer[4096];

    while (!reaped)
    {
        if (pipe_open)
        {
            struct pollfd pfd;
            pfd.fd = read_fd;
            pfd.events = POLLIN;
            pfd.revents = 0;
            int ready = ::poll(&pfd, 1, POLL_INTERVAL_MS);
            if (ready > 0)
            {
                for (;;)
                {
                    ssize_t n = ::read(read_fd, buffer, sizeof(buffer));
                    if (n > 0)
                    {
                        appendCapped(result.output, buffer, static_cast<size_t>(n));
                        continue;
                    }
                    if (n == 0)
                    {
                        pipe_open = false;
                    }
                    else if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR)
                    {
                        pipe_open = false;
                    }
                    break;
                }
            }
        }
        else
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(POLL_INTERVAL_MS));
        }

        pid_t waited = ::waitpid(pid, &status, WNOHANG);
        if (waited == pid)
        {
            reaped = true;
            break;
        }

        bool cancel_now = cancel != nullptr && cancel->isCancelled();
        bool timeout_now = timeout.count() > 0 && std::chrono::steady_clock::now() - started >= timeout;
        if (cancel_now || timeout_now)
        {
            result.cancelled = cancel_now;
            result.timed_out = timeout_now && !cancel_now;
            Logger::warn("ToolRunner: stopping " + argv[0] + (cancel_now ? " (cancelled)" : " (timed out)"));
            if (!terminateGroup(pid, status))
            {
                ::waitpid(pid, &status, 0);
            }
            reaped = true;
        }
    }

    // Drain anything left in the pipe
    for (;;)
    {
        ssize_t n = ::read(read_fd, buffer, sizeof(buffer));
        if (n <= 0)
            break;
        appendCapped(result.output, buffer, static_cast<size_t>(n));
    }
    ::close(read_fd);

    if (WIFEXITED(status))
        result.exit_code = WEXITSTATUS(status);
    else if (WIFSIGNALED(status))
        result.exit_code = 128 + WTERMSIG(status);

    if (!result.succeeded())
    {
        Logger::debug("ToolRunner: " + argv[0] + " exited with " + std::to_string(result.exit_code));
    }
    return result;
}

bool ToolRunner::terminateGroup(int pid, int &status)
{
    ::killpg(pid, SIGTERM);
    auto deadline = std::chrono::steady_clock::now() + TERMINATE_GRACE;
    while (std::chrono::steady_clock::now() < deadline)
    {
        if (::waitpid(pid, &status, WNOHANG) == pid)
        {
            // Leader is gone; make sure no stragglers from the group survive
            ::killpg(pid, SIGKILL);
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(POLL_INTERVAL_MS));
    }
    ::killpg(pid, SIGKILL);
    return false;
}

std::string ToolRunner::tail(const std::string &output, size_t max_bytes)
{
    if (output.size() <= max_bytes)
    {
        return output;
    }
    return output.substr(output.size() - max_bytes);
}
