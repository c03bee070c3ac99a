#pragma once

#include "core/capability_registry.hpp"
#include "handlers/handler_support.hpp"
#include "media/watermark_renderer.hpp"
#include <filesystem>
#include <string>

/**
 * @brief Text watermarks for images, videos and documents.
 *
 * Images are stamped directly with OpenCV. Videos get the same rendered
 * layer composited by ffmpeg. PDFs get a generated one-page overlay applied
 * to every page with qpdf; Word files are converted to PDF first.
 */
class WatermarkHandlers
{
public:
    static void registerCapabilities(CapabilityRegistry &registry);

    static ProcessingOutcome watermarkMedia(const HandlerRequest &request);
    static ProcessingOutcome watermarkDocument(const HandlerRequest &request);

    /**
     * @brief Read text/font_size/bold/rotation/position/transparency options.
     * @throws ProcessingError(InvalidInput) on out of range values
     */
    static WatermarkStyle styleFromOptions(const HandlerRequest &request);

    /**
     * @brief Single-page PDF (US letter) containing `style.text` in Helvetica
     * with the requested opacity, rotation and position.
     */
    static std::string buildOverlayPdf(const WatermarkStyle &style, double page_width = 612.0, double page_height = 792.0);

    static constexpr size_t MAX_TEXT_LENGTH = 500;

private:
    static std::filesystem::path watermarkImage(const WorkItem &item, const std::filesystem::path &out_dir,
                                                const WatermarkStyle &style);
    static std::filesystem::path watermarkVideo(const HandlerRequest &request, const WorkItem &item,
                                                const std::filesystem::path &out_dir, const WatermarkStyle &style);
    static std::filesystem::path watermarkPdf(const HandlerRequest &request, const WorkItem &item,
                                              const std::filesystem::path &out_dir, const std::string &overlay);

    static std::string escapePdfText(const std::string &text);
};
