#pragma once

#include <atomic>

/**
 * @brief One-way cancellation flag shared between the dispatcher and a
 * running handler. Handlers and the tool runner poll it.
 */
class CancellationToken
{
public:
    void cancel() noexcept { cancelled_.store(true); }
    bool isCancelled() const noexcept { return cancelled_.load(); }

private:
    std::atomic<bool> cancelled_{false};
};
