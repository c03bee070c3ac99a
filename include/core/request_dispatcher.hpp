#pragma once

#include "core/capability_registry.hpp"
#include "core/processing_outcome.hpp"
#include "core/staging_area_manager.hpp"
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

/**
 * @brief One uploaded file as received from the client
 */
struct UploadedArtifact
{
    std::string filename;
    std::string content_type;
    std::string content;
};

struct DispatcherOptions
{
    int64_t max_upload_bytes = 500LL * 1024 * 1024;
    std::chrono::milliseconds handler_timeout{std::chrono::seconds(600)};
    // Handler threads alive at once, including ones abandoned after a timeout
    size_t max_handler_threads = 64;
};

/**
 * @brief Single entry point that validates, stages, runs and cleans up one
 * capability invocation.
 *
 * dispatch() never throws: every failure is returned as a Failure outcome.
 * The staging directory of a request is gone by the time dispatch() returns,
 * regardless of how the handler finished. The dispatcher keeps no
 * per-request state and may be called from any number of threads.
 *
 * Each invocation runs on its own thread. A handler that overruns the
 * timeout is cancelled and left to finish on its own; its thread keeps
 * counting against max_handler_threads until it does.
 */
class RequestDispatcher
{
public:
    RequestDispatcher(const CapabilityRegistry &registry, StagingAreaManager &staging, DispatcherOptions options);

    ProcessingOutcome dispatch(const std::string &capability_key,
                               const std::vector<UploadedArtifact> &uploads,
                               const nlohmann::json &options) const;

    /**
     * @brief Overlay `provided` onto `defaults`.
     *
     * Only keys present in `defaults` are kept. String values (form fields)
     * are coerced to the type of the default; unparsable values keep the
     * default.
     */
    static nlohmann::json mergeOptions(const nlohmann::json &defaults, const nlohmann::json &provided);

    const DispatcherOptions &options() const { return options_; }

    // Handler threads still running, abandoned ones included
    size_t runningHandlers() const;

    /**
     * @brief Block until every handler thread has finished or `timeout` passes.
     * @return true if none are left running
     */
    bool waitForHandlers(std::chrono::milliseconds timeout) const;

private:
    struct RunningHandlers
    {
        std::mutex mutex;
        std::condition_variable drained;
        size_t count = 0;
    };

    // Holds one unit of RunningHandlers::count, returned on destruction
    class HandlerSlot
    {
    public:
        explicit HandlerSlot(std::shared_ptr<RunningHandlers> running) : running_(std::move(running)) {}
        HandlerSlot(HandlerSlot &&other) noexcept = default;
        HandlerSlot(const HandlerSlot &) = delete;
        HandlerSlot &operator=(const HandlerSlot &) = delete;
        HandlerSlot &operator=(HandlerSlot &&) = delete;
        ~HandlerSlot();

    private:
        std::shared_ptr<RunningHandlers> running_;
    };

    std::optional<HandlerSlot> tryAcquireSlot() const;

    ProcessingOutcome dispatchChecked(const CapabilityDescriptor &descriptor,
                                      const std::vector<UploadedArtifact> &uploads,
                                      const nlohmann::json &options) const;
    ProcessingOutcome invokeWithTimeout(const CapabilityDescriptor &descriptor, HandlerRequest request,
                                        HandlerSlot slot) const;

    static ProcessingOutcome runHandler(const CapabilityHandler &handler, const HandlerRequest &request);
    static bool coerceValue(const nlohmann::json &def, const nlohmann::json &value, nlohmann::json &out);

    const CapabilityRegistry &registry_;
    StagingAreaManager &staging_;
    DispatcherOptions options_;
    std::shared_ptr<RunningHandlers> running_;
};
