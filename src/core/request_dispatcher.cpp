#include "core/request_dispatcher.hpp"
#include "core/filename_sanitizer.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

namespace
{
    // Shared between the dispatcher and a (possibly abandoned) handler thread
    struct InvocationState
    {
        std::mutex mutex;
        std::condition_variable cv;
        std::optional<ProcessingOutcome> outcome;
    };

    std::string joinExtensions(const std::set<std::string> &extensions)
    {
        std::string out;
        for (const auto &ext : extensions)
        {
            if (!out.empty())
                out += ", ";
            out += ext;
        }
        return out;
    }

    std::string lowercase(std::string text)
    {
        std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });
        return text;
    }

    // llround is unspecified outside the int64 range
    int64_t roundToInt64(double value)
    {
        constexpr double limit = 9.2e18;
        return static_cast<int64_t>(std::llround(std::clamp(value, -limit, limit)));
    }

    std::string describeOutcome(const ProcessingOutcome &outcome)
    {
        if (outcome.isArtifact())
            return "artifact " + outcome.getArtifact().filename + " (" + std::to_string(outcome.getArtifact().data.size()) + " bytes)";
        if (outcome.isStatus())
            return "status payload";
        return failureKindName(outcome.getFailure().kind) + ": " + outcome.getFailure().message;
    }
}

RequestDispatcher::RequestDispatcher(const CapabilityRegistry &registry, StagingAreaManager &staging, DispatcherOptions options)
    : registry_(registry), staging_(staging), options_(options), running_(std::make_shared<RunningHandlers>())
{
}

RequestDispatcher::HandlerSlot::~HandlerSlot()
{
    if (!running_)
        return;
    {
        std::lock_guard<std::mutex> lock(running_->mutex);
        --running_->count;
    }
    running_->drained.notify_all();
}

std::optional<RequestDispatcher::HandlerSlot> RequestDispatcher::tryAcquireSlot() const
{
    std::lock_guard<std::mutex> lock(running_->mutex);
    if (running_->count >= options_.max_handler_threads)
    {
        return std::nullopt;
    }
    ++running_->count;
    return HandlerSlot(running_);
}

size_t RequestDispatcher::runningHandlers() const
{
    std::lock_guard<std::mutex> lock(running_->mutex);
    return running_->count;
}

bool RequestDispatcher::waitForHandlers(std::chrono::milliseconds timeout) const
{
    std::unique_lock<std::mutex> lock(running_->mutex);
    return running_->drained.wait_for(lock, timeout, [this]
                                      { return running_->count == 0; });
}

ProcessingOutcome RequestDispatcher::dispatch(const std::string &capability_key,
                                              const std::vector<UploadedArtifact> &uploads,
                                              const nlohmann::json &options) const
{
    auto started = std::chrono::steady_clock::now();

    const CapabilityDescriptor *descriptor = registry_.resolve(capability_key);
    if (descriptor == nullptr)
    {
        Logger::info("RequestDispatcher: unknown capability '" + capability_key + "'");
        return ProcessingOutcome::failure(FailureKind::NotFound, "unknown capability '" + capability_key + "'");
    }

    ProcessingOutcome outcome = dispatchChecked(*descriptor, uploads, options);

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
    std::string summary = "RequestDispatcher: " + descriptor->key + " inputs=" + std::to_string(uploads.size()) +
                          " took " + std::to_string(elapsed.count()) + "ms -> " + describeOutcome(outcome);
    if (outcome.isFailure() && httpStatusFor(outcome.getFailure().kind) >= 500)
        Logger::error(summary + (outcome.getFailure().detail.empty() ? "" : " [" + outcome.getFailure().detail + "]"));
    else
        Logger::info(summary);
    return outcome;
}

ProcessingOutcome RequestDispatcher::dispatchChecked(const CapabilityDescriptor &descriptor,
                                                     const std::vector<UploadedArtifact> &uploads,
                                                     const nlohmann::json &options) const
{
    if (uploads.size() < descriptor.min_inputs)
    {
        return ProcessingOutcome::failure(FailureKind::UnsupportedType, "no input file provided");
    }

    // Validate everything before touching the filesystem
    std::vector<SanitizedName> names;
    names.reserve(uploads.size());
    uint64_t total_bytes = 0;
    for (const auto &upload : uploads)
    {
        SanitizedName name = FilenameSanitizer::sanitize(upload.filename);
        if (!CapabilityRegistry::isAcceptedExtension(descriptor, name.extension))
        {
            std::string shown = name.extension.empty() ? "(none)" : "." + name.extension;
            return ProcessingOutcome::failure(FailureKind::UnsupportedType,
                                              "unsupported file type " + shown + "; accepted: " +
                                                  joinExtensions(descriptor.accepted_extensions));
        }
        total_bytes += upload.content.size();
        names.push_back(std::move(name));
    }

    if (options_.max_upload_bytes > 0 && total_bytes > static_cast<uint64_t>(options_.max_upload_bytes))
    {
        return ProcessingOutcome::failure(FailureKind::PayloadTooLarge,
                                          "upload of " + std::to_string(total_bytes) + " bytes exceeds the limit of " +
                                              std::to_string(options_.max_upload_bytes) + " bytes");
    }

    std::optional<HandlerSlot> slot = tryAcquireSlot();
    if (!slot)
    {
        Logger::warn("RequestDispatcher: " + std::to_string(options_.max_handler_threads) +
                     " handler threads busy, refusing " + descriptor.key);
        return ProcessingOutcome::failure(FailureKind::ToolUnavailable, "server is busy, try again later");
    }

    HandlerRequest request;
    request.options = mergeOptions(descriptor.option_defaults, options);
    request.cancel_token = std::make_shared<CancellationToken>();

    try
    {
        ScopedStagingDir scope = staging_.acquire();
        request.output_dir = scope.outputDir();
        for (size_t i = 0; i < uploads.size(); ++i)
        {
            request.inputs.push_back(scope.writeInput(uploads[i].content, names[i].safe_name));
        }

        ProcessingOutcome outcome = invokeWithTimeout(descriptor, std::move(request), std::move(*slot));
        scope.release();
        return outcome;
    }
    catch (const StagingError &e)
    {
        return ProcessingOutcome::failure(FailureKind::StagingError, "could not stage upload", e.what());
    }
    catch (const std::exception &e)
    {
        return ProcessingOutcome::failure(FailureKind::HandlerCrashed, "request processing failed", e.what());
    }
}

ProcessingOutcome RequestDispatcher::invokeWithTimeout(const CapabilityDescriptor &descriptor, HandlerRequest request,
                                                     HandlerSlot slot) const
{
    auto state = std::make_shared<InvocationState>();
    auto token = request.cancel_token;
    CapabilityHandler handler = descriptor.handler;

    // The slot travels with the thread and is returned when it exits
    std::thread worker([state, handler, request = std::move(request), slot = std::move(slot)]()
                       {
        ProcessingOutcome result = runHandler(handler, request);
        {
            std::lock_guard<std::mutex> lock(state->mutex);
            state->outcome = std::move(result);
        }
        state->cv.notify_all(); });
    worker.detach();

    std::unique_lock<std::mutex> lock(state->mutex);
    bool finished = state->cv.wait_for(lock, options_.handler_timeout, [&state]
                                       { return state->outcome.has_value(); });
    if (!finished)
    {
        token->cancel();
        return ProcessingOutcome::failure(FailureKind::Timeout,
                                          "processing did not finish within " +
                                              std::to_string(options_.handler_timeout.count()) + "ms");
    }
    return std::move(*state->outcome);
}

ProcessingOutcome RequestDispatcher::runHandler(const CapabilityHandler &handler, const HandlerRequest &request)
{
    try
    {
        return handler(request);
    }
    catch (const ProcessingError &e)
    {
        return ProcessingOutcome::failure(e.kind(), e.what(), e.detail());
    }
    catch (const StagingError &e)
    {
        return ProcessingOutcome::failure(FailureKind::StagingError, "could not write handler output", e.what());
    }
    catch (const std::exception &e)
    {
        return ProcessingOutcome::failure(FailureKind::HandlerCrashed, "handler failed", e.what());
    }
    catch (...)
    {
        return ProcessingOutcome::failure(FailureKind::HandlerCrashed, "handler failed", "non-standard exception");
    }
}

nlohmann::json RequestDispatcher::mergeOptions(const nlohmann::json &defaults, const nlohmann::json &provided)
{
    nlohmann::json merged = defaults.is_object() ? defaults : nlohmann::json::object();
    if (!provided.is_object())
    {
        return merged;
    }

    for (auto it = provided.begin(); it != provided.end(); ++it)
    {
        auto def = merged.find(it.key());
        if (def == merged.end())
        {
            continue;
        }
        nlohmann::json coerced;
        if (coerceValue(*def, it.value(), coerced))
        {
            *def = std::move(coerced);
        }
        else
        {
            Logger::warn("RequestDispatcher: ignoring option " + it.key() + "=" + it.value().dump() +
                         ", keeping default " + def->dump());
        }
    }
    return merged;
}

bool RequestDispatcher::coerceValue(const nlohmann::json &def, const nlohmann::json &value, nlohmann::json &out)
{
    if (def.is_boolean())
    {
        if (value.is_boolean())
        {
            out = value;
            return true;
        }
        if (value.is_number())
        {
            out = value.get<double>() != 0.0;
            return true;
        }
        if (value.is_string())
        {
            std::string text = lowercase(value.get<std::string>());
            if (text == "true" || text == "1" || text == "yes" || text == "on")
            {
                out = true;
                return true;
            }
            if (text == "false" || text == "0" || text == "no" || text == "off" || text.empty())
            {
                out = false;
                return true;
            }
        }
        return false;
    }

    if (def.is_number_integer())
    {
        if (value.is_number_integer())
        {
            out = value;
            return true;
        }
        if (value.is_number_float())
        {
            out = roundToInt64(value.get<double>());
            return true;
        }
        if (value.is_string())
        {
            try
            {
                const std::string text = value.get<std::string>();
                size_t consumed = 0;
                double parsed = std::stod(text, &consumed);
                if (consumed == text.size() && std::isfinite(parsed))
                {
                    out = roundToInt64(parsed);
                    return true;
                }
            }
            catch (const std::exception &)
            {
                return false;
            }
        }
        return false;
    }

    if (def.is_number_float())
    {
        if (value.is_number())
        {
            out = value.get<double>();
            return true;
        }
        if (value.is_string())
        {
            try
            {
                const std::string text = value.get<std::string>();
                size_t consumed = 0;
                double parsed = std::stod(text, &consumed);
                if (consumed == text.size() && std::isfinite(parsed))
                {
                    out = parsed;
                    return true;
                }
            }
            catch (const std::exception &)
            {
                return false;
            }
        }
        return false;
    }

    if (def.is_string())
    {
        if (value.is_string())
            out = value;
        else if (value.is_boolean() || value.is_number())
            out = value.dump();
        else
            return false;
        return true;
    }

    if (value.type() == def.type())
    {
        out = value;
        return true;
    }
    return false;
}
