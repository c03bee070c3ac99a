#pragma once

#include "core/cancellation_token.hpp"
#include "core/processing_outcome.hpp"
#include "core/staging_area_manager.hpp"
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

/**
 * @brief Everything a handler gets for one invocation. Owned by the
 * invocation thread, so it stays valid even if the dispatcher stops waiting.
 */
struct HandlerRequest
{
    std::vector<StagedFile> inputs;
    nlohmann::json options;
    std::filesystem::path output_dir;
    std::shared_ptr<CancellationToken> cancel_token;

    bool cancelled() const { return cancel_token && cancel_token->isCancelled(); }
};

using CapabilityHandler = std::function<ProcessingOutcome(const HandlerRequest &)>;

/**
 * @brief Static description of one capability
 */
struct CapabilityDescriptor
{
    std::string key;                          // e.g. "image.compress"
    std::vector<std::string> aliases;         // route names, e.g. "img-compress"
    std::string group;                        // image, video, audio, pdf, conversion
    std::string description;
    std::set<std::string> accepted_extensions; // lowercase, no dot
    nlohmann::json option_defaults = nlohmann::json::object();
    size_t min_inputs = 1;
    CapabilityHandler handler;
};

/**
 * @brief Key/alias to capability mapping, populated at startup then frozen.
 *
 * After freeze() the registry is immutable, so concurrent resolve() calls
 * need no locking.
 */
class CapabilityRegistry
{
public:
    CapabilityRegistry() = default;
    CapabilityRegistry(const CapabilityRegistry &) = delete;
    CapabilityRegistry &operator=(const CapabilityRegistry &) = delete;

    /**
     * @brief Add a capability.
     * @throws std::invalid_argument on duplicate key/alias, empty key,
     *         empty accepted set or missing handler
     * @throws std::logic_error once the registry is frozen
     */
    void registerCapability(CapabilityDescriptor descriptor);

    void freeze() { frozen_ = true; }
    bool isFrozen() const { return frozen_; }

    // nullptr when neither a key nor an alias matches
    const CapabilityDescriptor *resolve(const std::string &key_or_alias) const;

    static bool isAcceptedExtension(const CapabilityDescriptor &descriptor, const std::string &extension);

    std::vector<const CapabilityDescriptor *> list() const;
    size_t size() const { return by_key_.size(); }

    // Capability listing for the index endpoint
    nlohmann::json describe() const;

private:
    static std::string normalizeExtension(const std::string &extension);

    bool frozen_ = false;
    std::map<std::string, std::unique_ptr<CapabilityDescriptor>> by_key_;
    std::map<std::string, const CapabilityDescriptor *> by_name_; // keys and aliases
};
