#include "handlers/image_handlers.hpp"
#include "core/filename_sanitizer.hpp"
#include "logging/logger.hpp"
#include "tools/external_tools.hpp"
#include <algorithm>
#include <opencv2/imgproc.hpp>

namespace fs = std::filesystem;

namespace
{
    std::set<std::string> withZip(std::set<std::string> exts)
    {
        exts.insert("zip");
        return exts;
    }
}

const std::set<std::string> &ImageHandlers::imageExtensions()
{
    static const std::set<std::string> exts = {"jpg", "jpeg", "png", "webp", "bmp", "tif", "tiff"};
    return exts;
}

void ImageHandlers::registerCapabilities(CapabilityRegistry &registry)
{
    registry.registerCapability({"image.compress", {"img-compress"}, "image",
                                 "Compress images keeping their format",
                                 withZip(imageExtensions()),
                                 {{"quality", 85}}, 1, &ImageHandlers::compress});

    std::set<std::string> jpg_inputs = imageExtensions();
    jpg_inputs.insert("gif");
    registry.registerCapability({"image.to_jpg", {"img-jpg"}, "image",
                                 "Convert images to JPEG",
                                 withZip(jpg_inputs),
                                 {{"quality", 85}}, 1, &ImageHandlers::toJpg});

    registry.registerCapability({"image.to_png", {"img-png"}, "image",
                                 "Convert images to PNG",
                                 withZip(imageExtensions()),
                                 {{"compression", 6}}, 1, &ImageHandlers::toPng});

    registry.registerCapability({"image.to_webp", {"img-webp"}, "image",
                                 "Convert images to WebP",
                                 withZip(imageExtensions()),
                                 {{"quality", 80}}, 1, &ImageHandlers::toWebp});

    registry.registerCapability({"image.upscale", {"upscale"}, "image",
                                 "Upscale images 2x to 16x with Lanczos resampling",
                                 {"jpg", "jpeg", "png", "webp", "bmp", "tif", "tiff", "zip"},
                                 {{"scale", 2}}, 1, &ImageHandlers::upscale});

    registry.registerCapability({"image.remove_background", {"remove-imgbg"}, "image",
                                 "Remove the background of images",
                                 {"jpg", "jpeg", "png", "webp", "bmp", "zip"},
                                 {{"method", "auto"}}, 1, &ImageHandlers::removeBackground});
}

fs::path ImageHandlers::compressImage(const WorkItem &item, const fs::path &out_dir, int quality)
{
    cv::Mat image = ImageCodec::load(item.path);

    std::string ext = item.extension;
    if (ext == "bmp" || ext == "tif" || ext == "tiff")
    {
        // No useful lossy mode, re-encode as JPEG
        ext = "jpg";
    }

    EncodeSettings settings;
    settings.quality = quality;
    if (ext == "png")
    {
        settings.png_compression = 9;
        // Fewer colour levels when the caller accepts loss
        settings.png_levels = quality < 95 ? std::max(8, quality * 64 / 100) : 0;
    }

    fs::path out = HandlerSupport::uniqueOutputPath(out_dir, FilenameSanitizer::stemOf(item.name) + "_compressed", "." + ext);
    ImageCodec::save(image, out, settings);
    return out;
}

ProcessingOutcome ImageHandlers::compress(const HandlerRequest &request)
{
    const int quality = std::clamp(HandlerSupport::optionInt(request, "quality", 85), 1, 100);
    WorkBatch batch = HandlerSupport::expandInputs(request, imageExtensions());

    auto outputs = HandlerSupport::processAll(request, batch, [quality](const WorkItem &item, const fs::path &out_dir)
                                              { return compressImage(item, out_dir, quality); },
                                              true);
    return HandlerSupport::packageOutputs(request, outputs, batch, "compressed");
}

ProcessingOutcome ImageHandlers::convertAll(const HandlerRequest &request, const std::set<std::string> &accepted,
                                            const std::string &target_ext, const EncodeSettings &settings,
                                            const std::string &bundle_suffix)
{
    WorkBatch batch = HandlerSupport::expandInputs(request, accepted);
    auto outputs = HandlerSupport::processAll(request, batch, [&](const WorkItem &item, const fs::path &out_dir)
                                              {
        cv::Mat image = ImageCodec::load(item.path);
        fs::path out = HandlerSupport::uniqueOutputPath(out_dir, FilenameSanitizer::stemOf(item.name), "." + target_ext);
        ImageCodec::save(image, out, settings);
        return out; },
                                              true);
    return HandlerSupport::packageOutputs(request, outputs, batch, bundle_suffix);
}

ProcessingOutcome ImageHandlers::toJpg(const HandlerRequest &request)
{
    EncodeSettings settings;
    settings.quality = std::clamp(HandlerSupport::optionInt(request, "quality", 85), 1, 95);

    std::set<std::string> accepted = imageExtensions();
    accepted.insert("gif");
    return convertAll(request, accepted, "jpg", settings, "jpgs");
}

ProcessingOutcome ImageHandlers::toPng(const HandlerRequest &request)
{
    EncodeSettings settings;
    settings.png_compression = std::clamp(HandlerSupport::optionInt(request, "compression", 6), 0, 9);
    return convertAll(request, imageExtensions(), "png", settings, "pngs");
}

ProcessingOutcome ImageHandlers::toWebp(const HandlerRequest &request)
{
    EncodeSettings settings;
    settings.quality = std::clamp(HandlerSupport::optionInt(request, "quality", 80), 1, 100);
    return convertAll(request, imageExtensions(), "webp", settings, "webp");
}

ProcessingOutcome ImageHandlers::upscale(const HandlerRequest &request)
{
    const int scale = HandlerSupport::optionInt(request, "scale", 2);
    if (scale != 2 && scale != 4 && scale != 8 && scale != 16)
    {
        throw ProcessingError(FailureKind::InvalidInput, "scale must be one of 2, 4, 8 or 16");
    }

    WorkBatch batch = HandlerSupport::expandInputs(request, {"jpg", "jpeg", "png", "webp", "bmp", "tif", "tiff"});

    // Upscaling is memory heavy, one image at a time
    auto outputs = HandlerSupport::processAll(request, batch, [&](const WorkItem &item, const fs::path &out_dir)
                                              {
        cv::Mat image = ImageCodec::flattenAlpha(ImageCodec::load(item.path));
        long long pixels = static_cast<long long>(image.cols) * scale * image.rows * scale;
        if (pixels > MAX_OUTPUT_PIXELS)
        {
            throw ProcessingError(FailureKind::InvalidInput,
                                  item.name + " is too large to upscale " + std::to_string(scale) + "x");
        }

        HandlerSupport::throwIfCancelled(request);
        cv::Mat upscaled;
        cv::resize(image, upscaled, cv::Size(image.cols * scale, image.rows * scale), 0, 0, cv::INTER_LANCZOS4);

        EncodeSettings settings;
        settings.quality = 90;
        fs::path out = HandlerSupport::uniqueOutputPath(out_dir, "upscaled_" + FilenameSanitizer::stemOf(item.name), ".jpg");
        ImageCodec::save(upscaled, out, settings);
        return out; },
                                              false);
    return HandlerSupport::packageOutputs(request, outputs, batch, "upscaled_x" + std::to_string(scale));
}

void ImageHandlers::removeWithGrabCut(const fs::path &input, const fs::path &output)
{
    cv::Mat image = ImageCodec::load(input);
    cv::Mat bgr = ImageCodec::flattenAlpha(image);
    if (bgr.cols < 8 || bgr.rows < 8)
    {
        throw ProcessingError(FailureKind::InvalidInput, input.filename().string() + " is too small for background removal");
    }

    // Assume the subject sits inside a 5% border
    int dx = std::max(1, bgr.cols / 20);
    int dy = std::max(1, bgr.rows / 20);
    cv::Rect subject(dx, dy, bgr.cols - 2 * dx, bgr.rows - 2 * dy);

    cv::Mat mask, bg_model, fg_model;
    cv::grabCut(bgr, mask, subject, bg_model, fg_model, 5, cv::GC_INIT_WITH_RECT);

    cv::Mat foreground = (mask == cv::GC_FGD) | (mask == cv::GC_PR_FGD);
    cv::Mat alpha;
    foreground.convertTo(alpha, CV_8U);
    cv::GaussianBlur(alpha, alpha, cv::Size(3, 3), 0);

    cv::Mat bgra = ImageCodec::toBgra(bgr);
    cv::insertChannel(alpha, bgra, 3);

    EncodeSettings settings;
    settings.png_compression = 6;
    ImageCodec::save(bgra, output, settings);
}

ProcessingOutcome ImageHandlers::removeBackground(const HandlerRequest &request)
{
    const std::string method = HandlerSupport::optionString(request, "method", "auto");
    if (method != "auto" && method != "rembg" && method != "grabcut")
    {
        throw ProcessingError(FailureKind::InvalidInput, "method must be auto, rembg or grabcut");
    }

    auto &tools = ExternalTools::getInstance();
    std::string rembg;
    if (method == "rembg")
    {
        rembg = tools.require(ExternalTools::REMBG);
    }
    else if (method == "auto")
    {
        rembg = tools.path(ExternalTools::REMBG);
        if (rembg.empty())
        {
            Logger::debug("ImageHandlers: rembg not installed, using grabCut");
        }
    }

    WorkBatch batch = HandlerSupport::expandInputs(request, {"jpg", "jpeg", "png", "webp", "bmp"});
    auto outputs = HandlerSupport::processAll(request, batch, [&](const WorkItem &item, const fs::path &out_dir)
                                              {
        fs::path out = HandlerSupport::uniqueOutputPath(out_dir, FilenameSanitizer::stemOf(item.name) + "_nobg", ".png");
        if (!rembg.empty())
        {
            HandlerSupport::runTool(request, {rembg, "i", item.path.string(), out.string()});
        }
        else
        {
            removeWithGrabCut(item.path, out);
        }
        return out; },
                                              rembg.empty());
    return HandlerSupport::packageOutputs(request, outputs, batch, "nobg");
}
