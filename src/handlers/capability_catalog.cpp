#include "handlers/capability_catalog.hpp"
#include "handlers/audio_handlers.hpp"
#include "handlers/conversion_handlers.hpp"
#include "handlers/image_handlers.hpp"
#include "handlers/pdf_handlers.hpp"
#include "handlers/qr_handlers.hpp"
#include "handlers/video_handlers.hpp"
#include "handlers/watermark_handlers.hpp"
#include "logging/logger.hpp"

void CapabilityCatalog::registerAll(CapabilityRegistry &registry)
{
    ImageHandlers::registerCapabilities(registry);
    WatermarkHandlers::registerCapabilities(registry);
    VideoHandlers::registerCapabilities(registry);
    AudioHandlers::registerCapabilities(registry);
    PdfHandlers::registerCapabilities(registry);
    ConversionHandlers::registerCapabilities(registry);
    QrHandlers::registerCapabilities(registry);
    Logger::info("CapabilityCatalog: registered " + std::to_string(registry.size()) + " capabilities");
}
