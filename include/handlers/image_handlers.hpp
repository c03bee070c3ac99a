#pragma once

#include "core/capability_registry.hpp"
#include "handlers/handler_support.hpp"
#include "media/image_codec.hpp"
#include <filesystem>
#include <set>
#include <string>

/**
 * @brief Still image capabilities (compress, format conversion, upscale,
 * background removal). Decoding and encoding go through OpenCV; batches are
 * processed in parallel with oneTBB.
 */
class ImageHandlers
{
public:
    static void registerCapabilities(CapabilityRegistry &registry);

    static ProcessingOutcome compress(const HandlerRequest &request);
    static ProcessingOutcome toJpg(const HandlerRequest &request);
    static ProcessingOutcome toPng(const HandlerRequest &request);
    static ProcessingOutcome toWebp(const HandlerRequest &request);
    static ProcessingOutcome upscale(const HandlerRequest &request);
    static ProcessingOutcome removeBackground(const HandlerRequest &request);

    // Upscaled images larger than this are refused
    static constexpr long long MAX_OUTPUT_PIXELS = 120LL * 1000 * 1000;

    static const std::set<std::string> &imageExtensions();

    /**
     * @brief Compress one image in its own format (bmp/tiff become jpg),
     * writing `<stem>_compressed.<ext>` into `out_dir`.
     * @return the written file
     */
    static std::filesystem::path compressImage(const WorkItem &item, const std::filesystem::path &out_dir, int quality);

private:
    static ProcessingOutcome convertAll(const HandlerRequest &request, const std::set<std::string> &accepted,
                                        const std::string &target_ext, const EncodeSettings &settings,
                                        const std::string &bundle_suffix);

    static void removeWithGrabCut(const std::filesystem::path &input, const std::filesystem::path &output);
};
