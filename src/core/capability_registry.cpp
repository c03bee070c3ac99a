#include "core/capability_registry.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

void CapabilityRegistry::registerCapability(CapabilityDescriptor descriptor)
{
    if (frozen_)
    {
        throw std::logic_error("capability registry is frozen; cannot register '" + descriptor.key + "'");
    }
    if (descriptor.key.empty())
    {
        throw std::invalid_argument("capability key must not be empty");
    }
    if (!descriptor.handler)
    {
        throw std::invalid_argument("capability '" + descriptor.key + "' has no handler");
    }

    std::set<std::string> normalized;
    for (const auto &ext : descriptor.accepted_extensions)
    {
        std::string n = normalizeExtension(ext);
        if (!n.empty())
            normalized.insert(n);
    }
    if (normalized.empty())
    {
        throw std::invalid_argument("capability '" + descriptor.key + "' accepts no extensions");
    }
    descriptor.accepted_extensions = std::move(normalized);

    if (!descriptor.option_defaults.is_object())
    {
        throw std::invalid_argument("capability '" + descriptor.key + "' option defaults must be an object");
    }

    std::vector<std::string> names{descriptor.key};
    names.insert(names.end(), descriptor.aliases.begin(), descriptor.aliases.end());
    for (size_t i = 0; i < names.size(); ++i)
    {
        if (names[i].empty())
        {
            throw std::invalid_argument("capability '" + descriptor.key + "' has an empty alias");
        }
        if (by_name_.count(names[i]) > 0 || std::find(names.begin(), names.begin() + i, names[i]) != names.begin() + i)
        {
            throw std::invalid_argument("duplicate capability name: " + names[i]);
        }
    }

    auto owned = std::make_unique<CapabilityDescriptor>(std::move(descriptor));
    const CapabilityDescriptor *ptr = owned.get();
    for (const auto &name : names)
    {
        by_name_[name] = ptr;
    }
    Logger::debug("CapabilityRegistry: registered " + ptr->key + " (" + std::to_string(ptr->accepted_extensions.size()) + " extensions)");
    by_key_[ptr->key] = std::move(owned);
}

const CapabilityDescriptor *CapabilityRegistry::resolve(const std::string &key_or_alias) const
{
    auto it = by_name_.find(key_or_alias);
    if (it == by_name_.end())
    {
        return nullptr;
    }
    return it->second;
}

bool CapabilityRegistry::isAcceptedExtension(const CapabilityDescriptor &descriptor, const std::string &extension)
{
    std::string n = normalizeExtension(extension);
    return !n.empty() && descriptor.accepted_extensions.count(n) > 0;
}

std::vector<const CapabilityDescriptor *> CapabilityRegistry::list() const
{
    std::vector<const CapabilityDescriptor *> out;
    out.reserve(by_key_.size());
    for (const auto &entry : by_key_)
    {
        out.push_back(entry.second.get());
    }
    return out;
}

nlohmann::json CapabilityRegistry::describe() const
{
    nlohmann::json capabilities = nlohmann::json::array();
    for (const auto *descriptor : list())
    {
        capabilities.push_back({{"key", descriptor->key},
                                {"routes", descriptor->aliases},
                                {"group", descriptor->group},
                                {"description", descriptor->description},
                                {"accepted_extensions", descriptor->accepted_extensions},
                                {"options", descriptor->option_defaults},
                                {"min_inputs", descriptor->min_inputs}});
    }
    return capabilities;
}

std::string CapabilityRegistry::normalizeExtension(const std::string &extension)
{
    std::string n = extension;
    if (!n.empty() && n.front() == '.')
    {
        n.erase(0, 1);
    }
    std::transform(n.begin(), n.end(), n.begin(), [](unsigned char c)
                   { return static_cast<char>(std::tolower(c)); });
    return n;
}
