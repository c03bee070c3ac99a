#pragma once

#include "core/capability_registry.hpp"
#include "handlers/handler_support.hpp"
#include <string>

/**
 * @brief Target frame size for video upscaling
 */
struct ScaleTarget
{
    int width = 0;
    int height = 0;
};

class VideoHandlers
{
public:
    static void registerCapabilities(CapabilityRegistry &registry);

    static ProcessingOutcome upscale(const HandlerRequest &request);
    static ProcessingOutcome downloadBatch(const HandlerRequest &request);

    static constexpr int MAX_DIMENSION = 7680;

    /**
     * @brief Resolve "2x", "4x" or "W:H" against the source size.
     * Dimensions are rounded down to even numbers for yuv420p.
     * @throws ProcessingError(InvalidInput) on malformed or oversized targets
     */
    static ScaleTarget parseScale(const std::string &scale, int source_width, int source_height);

    static const std::set<std::string> &videoExtensions();
};
