#pragma once

#include "core/capability_registry.hpp"
#include "handlers/handler_support.hpp"
#include <string>
#include <opencv2/core.hpp>

/**
 * @brief QR code generation with the OpenCV encoder. The payload comes from
 * the `data` option or, when that is empty, from an uploaded text file.
 */
class QrHandlers
{
public:
    static void registerCapabilities(CapabilityRegistry &registry);

    static ProcessingOutcome generate(const HandlerRequest &request);

    static constexpr int MIN_SIZE = 100;
    static constexpr int MAX_SIZE = 2000;
    static constexpr int QUIET_ZONE_MODULES = 4;

    /**
     * @brief Render `data` as a `size` x `size` BGR image.
     * @param error_correction one of L, M, Q, H (case-insensitive)
     * @throws ProcessingError(InvalidInput) on bad parameters or data too long to encode
     */
    static cv::Mat render(const std::string &data, int size, const std::string &error_correction,
                          const cv::Scalar &foreground, const cv::Scalar &background);

    /**
     * @brief Parse "#rrggbb", "#rgb" or the same without '#' into a BGR scalar.
     * @return false if `text` is not a hex colour
     */
    static bool parseHexColor(const std::string &text, cv::Scalar &color);
};
