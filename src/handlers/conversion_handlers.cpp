#include "handlers/conversion_handlers.hpp"
#include "core/filename_sanitizer.hpp"
#include "logging/logger.hpp"
#include "media/image_codec.hpp"
#include "media/zip_archive.hpp"
#include "tools/external_tools.hpp"
#include "tools/office_converter.hpp"
#include <map>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

namespace fs = std::filesystem;

namespace
{
    const std::set<std::string> PDF_INPUTS = {"doc", "docx", "ppt", "pptx", "xls", "xlsx", "html", "txt",
                                              "jpg", "jpeg", "png", "webp", "pdf"};
    const std::set<std::string> PPT_INPUTS = {"pdf", "doc", "docx", "ppt", "pptx", "html", "htm", "txt",
                                              "jpg", "jpeg", "png", "webp"};
    const std::set<std::string> COMPRESS_INPUTS = {"pdf", "docx", "pptx", "jpg", "jpeg", "png", "webp",
                                                   "tif", "tiff", "bmp", "doc", "ppt"};
    const std::set<std::string> RASTER_EXTENSIONS = {"jpg", "jpeg", "png", "webp", "tif", "tiff", "bmp"};

    uintmax_t fileSize(const fs::path &path)
    {
        std::error_code ec;
        uintmax_t size = fs::file_size(path, ec);
        return ec ? 0 : size;
    }

    bool isOfficeMediaMember(const std::string &name)
    {
        return name.rfind("word/media/", 0) == 0 || name.rfind("ppt/media/", 0) == 0 || name.rfind("media/", 0) == 0;
    }
}

void ConversionHandlers::registerCapabilities(CapabilityRegistry &registry)
{
    std::set<std::string> pdf_inputs = PDF_INPUTS;
    pdf_inputs.insert("zip");
    registry.registerCapability({"convert.to_pdf", {"file-pdf"}, "conversion",
                                 "Convert office documents, text and images to PDF",
                                 pdf_inputs, nlohmann::json::object(), 1, &ConversionHandlers::toPdf});

    registry.registerCapability({"convert.to_ppt", {"convert-all-to-ppt"}, "conversion",
                                 "Convert documents and images to PowerPoint",
                                 PPT_INPUTS, nlohmann::json::object(), 1, &ConversionHandlers::toPpt});

    std::set<std::string> compress_inputs = COMPRESS_INPUTS;
    compress_inputs.insert("zip");
    registry.registerCapability({"convert.compress", {"compress"}, "conversion",
                                 "Compress PDF, Office and image files keeping their type",
                                 compress_inputs, {{"option", "medium"}}, 1, &ConversionHandlers::compress});
}

CompressionPreset ConversionHandlers::presetFor(const std::string &option)
{
    static const std::map<std::string, CompressionPreset> presets = {
        {"low", {90, 1.0, 6, "/ebook", 150}},
        {"medium", {75, 0.95, 7, "/screen", 100}},
        {"high", {60, 0.8, 9, "/screen", 72}},
        {"maximum", {40, 0.6, 9, "/screen", 50}},
    };
    auto it = presets.find(option);
    if (it == presets.end())
    {
        throw ProcessingError(FailureKind::InvalidInput, "option must be low, medium, high or maximum");
    }
    return it->second;
}

ProcessingOutcome ConversionHandlers::toPdf(const HandlerRequest &request)
{
    WorkBatch batch = HandlerSupport::expandInputs(request, PDF_INPUTS);
    auto outputs = HandlerSupport::processAll(request, batch, [&](const WorkItem &item, const fs::path &out_dir)
                                              {
        if (item.extension == "pdf")
        {
            return item.path;
        }
        fs::path convert_dir = HandlerSupport::makeSubdir(out_dir, "converted");
        fs::path converted = OfficeConverter::convert(request, item.path, "pdf", convert_dir);
        fs::path out = HandlerSupport::uniqueOutputPath(out_dir, FilenameSanitizer::stemOf(item.name), ".pdf");
        fs::rename(converted, out);
        return out; },
                                              false);
    return HandlerSupport::bundleOutputs(request, outputs, "converted_pdfs.zip", batch.has_archive);
}

fs::path ConversionHandlers::convertToPptx(const HandlerRequest &request, const WorkItem &item, const fs::path &out_dir)
{
    const std::string stem = FilenameSanitizer::stemOf(item.name);
    if (item.extension == "pptx")
    {
        return item.path;
    }

    fs::path convert_dir = HandlerSupport::makeSubdir(out_dir, "converted");

    fs::path converted;
    if (item.extension == "ppt")
    {
        converted = OfficeConverter::convert(request, item.path, "pptx", convert_dir);
    }
    else
    {
        // Everything else goes through PDF and the Impress PDF importer
        fs::path pdf = item.path;
        if (item.extension != "pdf")
        {
            fs::path pdf_dir = HandlerSupport::makeSubdir(out_dir, "pdf");
            pdf = OfficeConverter::convert(request, item.path, "pdf", pdf_dir);
        }
        converted = OfficeConverter::convert(request, pdf, "pptx", convert_dir, "impress_pdf_import");
    }

    fs::path out = HandlerSupport::uniqueOutputPath(out_dir, stem, ".pptx");
    fs::rename(converted, out);
    return out;
}

ProcessingOutcome ConversionHandlers::toPpt(const HandlerRequest &request)
{
    WorkBatch batch = HandlerSupport::expandInputs(request, PPT_INPUTS);
    auto outputs = HandlerSupport::processAll(request, batch, [&](const WorkItem &item, const fs::path &out_dir)
                                              { return convertToPptx(request, item, out_dir); },
                                              false);
    return HandlerSupport::bundleOutputs(request, outputs, "converted_ppts.zip");
}

bool ConversionHandlers::compressPdf(const HandlerRequest &request, const fs::path &input, const fs::path &output,
                                     const CompressionPreset &preset)
{
    const std::string gs = ExternalTools::getInstance().require(ExternalTools::GHOSTSCRIPT);
    std::vector<std::string> argv = {
        gs, "-sDEVICE=pdfwrite", "-dCompatibilityLevel=1.4", "-dNOPAUSE", "-dQUIET", "-dBATCH", "-dSAFER",
        "-dPDFSETTINGS=" + preset.gs_preset,
        "-dCompressPages=true",
        "-dDownsampleColorImages=true", "-dDownsampleGrayImages=true", "-dDownsampleMonoImages=true",
        "-dColorImageDownsampleType=/Bicubic", "-dGrayImageDownsampleType=/Bicubic", "-dMonoImageDownsampleType=/Subsample",
        "-dColorImageFilter=/DCTEncode", "-dGrayImageFilter=/DCTEncode", "-dMonoImageFilter=/CCITTFaxEncode",
        "-dAutoFilterColorImages=false", "-dAutoFilterGrayImages=false",
        "-dEmbedAllFonts=true", "-dSubsetFonts=true", "-dCompressFonts=true",
        "-dDetectDuplicateImages=true", "-dPreserveAnnots=false"};
    if (preset.gs_dpi > 0)
    {
        const std::string dpi = std::to_string(preset.gs_dpi);
        argv.insert(argv.end(), {"-dColorImageResolution=" + dpi, "-dGrayImageResolution=" + dpi,
                                 "-dMonoImageResolution=" + dpi});
    }
    argv.push_back("-sOutputFile=" + output.string());
    argv.push_back(input.string());

    HandlerSupport::runTool(request, argv);
    return fs::exists(output);
}

bool ConversionHandlers::recompressImageBytes(const std::string &extension, const CompressionPreset &preset, std::string &data)
{
    if (RASTER_EXTENSIONS.count(extension) == 0)
    {
        return false;
    }

    std::vector<uint8_t> buffer(data.begin(), data.end());
    cv::Mat image = cv::imdecode(buffer, cv::IMREAD_UNCHANGED);
    if (image.empty() || image.depth() != CV_8U)
    {
        return false;
    }

    if (preset.scale < 1.0)
    {
        cv::Mat resized;
        cv::resize(image, resized, cv::Size(), preset.scale, preset.scale, cv::INTER_AREA);
        if (!resized.empty())
            image = resized;
    }

    EncodeSettings settings;
    settings.quality = preset.jpeg_quality;
    settings.png_compression = preset.png_compression;
    std::vector<uint8_t> encoded = ImageCodec::encode(image, extension, settings);
    if (encoded.empty() || encoded.size() >= data.size())
    {
        return false;
    }
    data.assign(encoded.begin(), encoded.end());
    return true;
}

bool ConversionHandlers::compressImage(const fs::path &input, const std::string &extension, const fs::path &output,
                                       const CompressionPreset &preset)
{
    auto bytes = HandlerSupport::readFileBytes(input);
    std::string data(bytes.begin(), bytes.end());
    if (!recompressImageBytes(extension, preset, data))
    {
        return false;
    }
    HandlerSupport::writeFileBytes(output, std::vector<uint8_t>(data.begin(), data.end()));
    return true;
}

bool ConversionHandlers::compressOfficePackage(const fs::path &input, const fs::path &output, const CompressionPreset &preset)
{
    size_t rewritten = ZipArchive::repack(input, output, [&preset](const std::string &name, std::string &data)
                                          {
        if (!isOfficeMediaMember(name))
        {
            return false;
        }
        return recompressImageBytes(FilenameSanitizer::extensionOf(name), preset, data); });
    Logger::debug("ConversionHandlers: recompressed " + std::to_string(rewritten) + " media part(s) of " +
                  input.filename().string());
    return rewritten > 0;
}

CompressionResult ConversionHandlers::compressFile(const HandlerRequest &request, const WorkItem &item,
                                                   const fs::path &out_dir, const CompressionPreset &preset)
{
    CompressionResult result{item.path, "original", false};
    const std::string stem = FilenameSanitizer::stemOf(item.name);
    const std::string ext = item.extension;

    std::string method;
    fs::path candidate = HandlerSupport::uniqueOutputPath(out_dir, stem + "_compressed", "." + ext);
    bool produced = false;
    if (ext == "pdf")
    {
        method = "gs";
        produced = compressPdf(request, item.path, candidate, preset);
    }
    else if (ext == "docx" || ext == "pptx")
    {
        method = "office";
        produced = compressOfficePackage(item.path, candidate, preset);
    }
    else if (RASTER_EXTENSIONS.count(ext) > 0)
    {
        method = "image";
        produced = compressImage(item.path, ext, candidate, preset);
    }
    // doc and ppt are binary formats and pass through untouched

    if (produced && fileSize(candidate) > 0 && fileSize(candidate) < fileSize(item.path))
    {
        result.path = candidate;
        result.method = method;
        result.compressed = true;
    }
    return result;
}

ProcessingOutcome ConversionHandlers::compress(const HandlerRequest &request)
{
    const CompressionPreset preset = presetFor(HandlerSupport::optionString(request, "option", "medium"));
    WorkBatch batch = HandlerSupport::expandInputs(request, COMPRESS_INPUTS);

    if (batch.items.size() == 1 && !batch.has_archive)
    {
        const WorkItem &item = batch.items.front();
        CompressionResult result = compressFile(request, item, request.output_dir, preset);
        const std::string name = result.compressed ? result.path.filename().string() : item.name;

        ProcessingOutcome outcome = ProcessingOutcome::artifact(HandlerSupport::readFileBytes(result.path), name,
                                                                HandlerSupport::mimeForExtension(item.extension));
        auto &artifact = std::get<OutputArtifact>(outcome.value);
        artifact.headers["X-Returned"] = result.compressed ? "compressed" : "original";
        artifact.headers["X-Method"] = result.method;
        Logger::info("ConversionHandlers: " + item.name + " " + artifact.headers["X-Returned"] + " via " + result.method);
        return outcome;
    }

    auto outputs = HandlerSupport::processAll(request, batch, [&](const WorkItem &item, const fs::path &out_dir)
                                              { return compressFile(request, item, out_dir, preset).path; },
                                              true);
    ProcessingOutcome outcome = HandlerSupport::bundleOutputs(request, outputs, "compressed_results.zip", true);
    auto &artifact = std::get<OutputArtifact>(outcome.value);
    artifact.headers["X-Returned"] = "compressed";
    artifact.headers["X-Method"] = "zip";
    return outcome;
}
