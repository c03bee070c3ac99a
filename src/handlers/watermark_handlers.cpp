#include "handlers/watermark_handlers.hpp"
#include "handlers/pdf_handlers.hpp"
#include "core/filename_sanitizer.hpp"
#include "logging/logger.hpp"
#include "media/image_codec.hpp"
#include "media/media_probe.hpp"
#include "tools/external_tools.hpp"
#include "tools/office_converter.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <sstream>
#include <vector>

namespace fs = std::filesystem;

namespace
{
    const std::set<std::string> VIDEO_EXTENSIONS = {"mp4", "mov", "mkv", "avi", "webm"};
    const std::set<std::string> IMAGE_EXTENSIONS = {"jpg", "jpeg", "png", "webp", "bmp", "tif", "tiff"};
    const std::set<std::string> DOCUMENT_EXTENSIONS = {"pdf", "docx", "doc"};

    std::string formatNumber(double value)
    {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%.3f", value);
        return buf;
    }
}

void WatermarkHandlers::registerCapabilities(CapabilityRegistry &registry)
{
    nlohmann::json style_defaults = {
        {"text", "SAMPLE"},
        {"font_size", 48},
        {"bold", false},
        {"rotation", 0.0},
        {"position", "middle-center"},
        {"transparency", 50}};

    std::set<std::string> media = IMAGE_EXTENSIONS;
    media.insert(VIDEO_EXTENSIONS.begin(), VIDEO_EXTENSIONS.end());
    media.insert("zip");
    registry.registerCapability({"media.watermark", {"watermark-imgvideo"}, "image",
                                 "Stamp a text watermark on images and videos",
                                 media, style_defaults, 1, &WatermarkHandlers::watermarkMedia});

    nlohmann::json doc_defaults = style_defaults;
    doc_defaults["text"] = "";
    doc_defaults["password"] = "";
    std::set<std::string> documents = DOCUMENT_EXTENSIONS;
    documents.insert("zip");
    registry.registerCapability({"pdf.watermark", {"watermark-files"}, "pdf",
                                 "Stamp a text watermark on every page of PDF and Word documents",
                                 documents, doc_defaults, 1, &WatermarkHandlers::watermarkDocument});
}

WatermarkStyle WatermarkHandlers::styleFromOptions(const HandlerRequest &request)
{
    WatermarkStyle style;
    style.text = HandlerSupport::optionString(request, "text", "SAMPLE");
    if (style.text.size() > MAX_TEXT_LENGTH)
    {
        style.text.resize(MAX_TEXT_LENGTH);
    }
    style.font_size = HandlerSupport::optionInt(request, "font_size", 48);
    style.bold = HandlerSupport::optionBool(request, "bold", false);
    style.rotation = HandlerSupport::optionDouble(request, "rotation", 0.0);
    style.position = HandlerSupport::optionString(request, "position", "middle-center");
    style.transparency = HandlerSupport::optionInt(request, "transparency", 50);

    if (style.font_size < 4 || style.font_size > 1000)
    {
        throw ProcessingError(FailureKind::InvalidInput, "font_size must be between 4 and 1000");
    }
    if (!std::isfinite(style.rotation))
    {
        throw ProcessingError(FailureKind::InvalidInput, "rotation must be a number");
    }
    if (!WatermarkRenderer::isValidPosition(style.position))
    {
        throw ProcessingError(FailureKind::InvalidInput, "unknown position '" + style.position + "'");
    }
    if (style.transparency < 0 || style.transparency > 100)
    {
        throw ProcessingError(FailureKind::InvalidInput, "transparency must be between 0 and 100");
    }
    return style;
}

fs::path WatermarkHandlers::watermarkImage(const WorkItem &item, const fs::path &out_dir, const WatermarkStyle &style)
{
    cv::Mat image = ImageCodec::load(item.path);
    cv::Mat layer = WatermarkRenderer::renderLayer(image.cols, image.rows, style);
    cv::Mat stamped = WatermarkRenderer::composite(image, layer);

    std::string ext = item.extension == "jpeg" ? "jpg" : item.extension;
    EncodeSettings settings;
    settings.quality = 95;
    fs::path out = HandlerSupport::uniqueOutputPath(out_dir, FilenameSanitizer::stemOf(item.name) + "_watermarked", "." + ext);
    ImageCodec::save(stamped, out, settings);
    return out;
}

fs::path WatermarkHandlers::watermarkVideo(const HandlerRequest &request, const WorkItem &item,
                                           const fs::path &out_dir, const WatermarkStyle &style)
{
    const std::string ffmpeg = ExternalTools::getInstance().require(ExternalTools::FFMPEG);

    auto info = MediaProbe::probe(item.path.string());
    if (!info || !info->has_video || info->width <= 0 || info->height <= 0)
    {
        throw ProcessingError(FailureKind::InvalidInput, item.name + " has no readable video stream");
    }

    // The layer is written next to the output so parallel items never share it
    fs::path layer_path = out_dir / (FilenameSanitizer::stemOf(item.name) + "_layer.png");
    EncodeSettings png;
    png.png_compression = 3;
    ImageCodec::save(WatermarkRenderer::renderLayer(info->width, info->height, style), layer_path, png);

    fs::path out = HandlerSupport::uniqueOutputPath(out_dir, FilenameSanitizer::stemOf(item.name) + "_watermarked", ".mp4");
    std::vector<std::string> argv = {
        ffmpeg, "-y", "-hide_banner", "-loglevel", "error",
        "-i", item.path.string(),
        "-i", layer_path.string(),
        "-filter_complex", "[0:v][1:v]overlay=0:0:format=auto,format=yuv420p[v]",
        "-map", "[v]", "-map", "0:a?",
        "-c:v", "libx264", "-preset", "medium", "-crf", "20",
        "-c:a", "aac", "-b:a", "192k",
        "-movflags", "+faststart",
        out.string()};
    HandlerSupport::runTool(request, argv);

    std::error_code ec;
    fs::remove(layer_path, ec);
    return out;
}

ProcessingOutcome WatermarkHandlers::watermarkMedia(const HandlerRequest &request)
{
    WatermarkStyle style = styleFromOptions(request);
    if (style.text.empty())
    {
        throw ProcessingError(FailureKind::InvalidInput, "watermark text is required");
    }

    std::set<std::string> members = IMAGE_EXTENSIONS;
    members.insert(VIDEO_EXTENSIONS.begin(), VIDEO_EXTENSIONS.end());
    WorkBatch batch = HandlerSupport::expandInputs(request, members);

    // ffmpeg is already multi-threaded, so items run one after another
    auto outputs = HandlerSupport::processAll(request, batch, [&](const WorkItem &item, const fs::path &out_dir)
                                              {
        if (VIDEO_EXTENSIONS.count(item.extension) > 0)
        {
            return watermarkVideo(request, item, out_dir, style);
        }
        return watermarkImage(item, out_dir, style); },
                                              false);
    return HandlerSupport::packageOutputs(request, outputs, batch, "watermarked");
}

std::string WatermarkHandlers::escapePdfText(const std::string &text)
{
    std::string out;
    out.reserve(text.size());
    for (unsigned char c : text)
    {
        if (c == '(' || c == ')' || c == '\\')
        {
            out += '\\';
            out += static_cast<char>(c);
        }
        else if (c < 0x20 || c > 0x7e)
        {
            // Standard 14 fonts only cover ASCII here
            out += '?';
        }
        else
        {
            out += static_cast<char>(c);
        }
    }
    return out;
}

std::string WatermarkHandlers::buildOverlayPdf(const WatermarkStyle &style, double page_width, double page_height)
{
    const double size = style.font_size;
    const double opacity = std::clamp(style.transparency, 0, 100) / 100.0;
    const std::string text = escapePdfText(style.text);

    // Helvetica averages roughly half an em per glyph
    const double text_width = 0.5 * size * static_cast<double>(style.text.size());
    const double text_height = size;

    cv::Point origin = WatermarkRenderer::placement(style.position,
                                                    cv::Size(static_cast<int>(page_width), static_cast<int>(page_height)),
                                                    cv::Size(static_cast<int>(text_width), static_cast<int>(text_height)),
                                                    style.margin);
    // placement() works top-down, PDF user space is bottom-up
    const double cx = origin.x + text_width / 2.0;
    const double cy = page_height - (origin.y + text_height / 2.0);

    const double rad = style.rotation * CV_PI / 180.0;
    const double c = std::cos(rad);
    const double s = std::sin(rad);
    // Rotate around the text centre
    const double tx = cx - (c * text_width / 2.0 - s * text_height * 0.35);
    const double ty = cy - (s * text_width / 2.0 + c * text_height * 0.35);

    std::ostringstream content;
    content << "q /GS1 gs 0 0 0 rg BT /F1 " << formatNumber(size) << " Tf "
            << formatNumber(c) << " " << formatNumber(s) << " " << formatNumber(-s) << " " << formatNumber(c) << " "
            << formatNumber(tx) << " " << formatNumber(ty) << " Tm (" << text << ") Tj ET Q\n";
    const std::string stream = content.str();

    std::vector<std::string> objects = {
        "<< /Type /Catalog /Pages 2 0 R >>",
        "<< /Type /Pages /Kids [3 0 R] /Count 1 >>",
        "<< /Type /Page /Parent 2 0 R /MediaBox [0 0 " + formatNumber(page_width) + " " + formatNumber(page_height) +
            "] /Resources << /Font << /F1 5 0 R >> /ExtGState << /GS1 6 0 R >> >> /Contents 4 0 R >>",
        "<< /Length " + std::to_string(stream.size()) + " >>\nstream\n" + stream + "endstream",
        std::string("<< /Type /Font /Subtype /Type1 /BaseFont /") + (style.bold ? "Helvetica-Bold" : "Helvetica") +
            " /Encoding /WinAnsiEncoding >>",
        "<< /Type /ExtGState /ca " + formatNumber(opacity) + " /CA " + formatNumber(opacity) + " >>"};

    std::string pdf = "%PDF-1.4\n";
    std::vector<size_t> offsets;
    for (size_t i = 0; i < objects.size(); ++i)
    {
        offsets.push_back(pdf.size());
        pdf += std::to_string(i + 1) + " 0 obj\n" + objects[i] + "\nendobj\n";
    }

    const size_t xref_offset = pdf.size();
    pdf += "xref\n0 " + std::to_string(objects.size() + 1) + "\n0000000000 65535 f \n";
    for (size_t offset : offsets)
    {
        char line[32];
        std::snprintf(line, sizeof(line), "%010zu 00000 n \n", offset);
        pdf += line;
    }
    pdf += "trailer\n<< /Size " + std::to_string(objects.size() + 1) + " /Root 1 0 R >>\nstartxref\n" +
           std::to_string(xref_offset) + "\n%%EOF\n";
    return pdf;
}

fs::path WatermarkHandlers::watermarkPdf(const HandlerRequest &request, const WorkItem &item,
                                         const fs::path &out_dir, const std::string &overlay)
{
    const std::string stem = FilenameSanitizer::stemOf(item.name);

    fs::path source = item.path;
    if (item.extension != "pdf")
    {
        fs::path convert_dir = HandlerSupport::makeSubdir(out_dir, stem + "_pdf");
        source = OfficeConverter::convert(request, item.path, "pdf", convert_dir);
    }

    fs::path overlay_path = out_dir / (stem + "_overlay.pdf");
    HandlerSupport::writeFileBytes(overlay_path, std::vector<uint8_t>(overlay.begin(), overlay.end()));

    fs::path out = HandlerSupport::uniqueOutputPath(out_dir, stem + "_watermarked", ".pdf");
    std::vector<std::string> args;
    const std::string password = HandlerSupport::optionString(request, "password", "");
    if (!password.empty())
    {
        args.push_back("--password=" + password);
    }
    args.insert(args.end(), {source.string(), "--overlay", overlay_path.string(), "--repeat=1", "--", out.string()});
    PdfHandlers::runQpdf(request, args, item.name);

    std::error_code ec;
    fs::remove(overlay_path, ec);
    return out;
}

ProcessingOutcome WatermarkHandlers::watermarkDocument(const HandlerRequest &request)
{
    WatermarkStyle style = styleFromOptions(request);
    if (style.text.empty())
    {
        throw ProcessingError(FailureKind::InvalidInput, "watermark text is required");
    }
    const std::string overlay = buildOverlayPdf(style);

    WorkBatch batch = HandlerSupport::expandInputs(request, DOCUMENT_EXTENSIONS);
    Logger::debug("WatermarkHandlers: stamping " + std::to_string(batch.items.size()) + " document(s)");

    // Conversions share one LibreOffice profile, so stay sequential
    auto outputs = HandlerSupport::processAll(request, batch, [&](const WorkItem &item, const fs::path &out_dir)
                                              { return watermarkPdf(request, item, out_dir, overlay); },
                                              false);
    return HandlerSupport::packageOutputs(request, outputs, batch, "watermarked");
}
