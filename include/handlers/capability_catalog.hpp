#pragma once

#include "core/capability_registry.hpp"

/**
 * @brief Registers every built-in capability. Call once at startup, before
 * CapabilityRegistry::freeze().
 */
class CapabilityCatalog
{
public:
    static void registerAll(CapabilityRegistry &registry);
};
