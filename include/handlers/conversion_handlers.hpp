#pragma once

#include "core/capability_registry.hpp"
#include "handlers/handler_support.hpp"
#include <filesystem>
#include <string>

/**
 * @brief Compression strength for the compress capability
 */
struct CompressionPreset
{
    int jpeg_quality;
    double scale;
    int png_compression;
    std::string gs_preset;
    int gs_dpi;
};

/**
 * @brief What the compress capability did with one file
 */
struct CompressionResult
{
    std::filesystem::path path;
    std::string method; // gs, office, image or original
    bool compressed = false;
};

/**
 * @brief Document conversions (LibreOffice) and type-preserving compression
 * (Ghostscript for PDF, OpenCV for images, libarchive repacking for Office
 * containers).
 */
class ConversionHandlers
{
public:
    static void registerCapabilities(CapabilityRegistry &registry);

    static ProcessingOutcome toPdf(const HandlerRequest &request);
    static ProcessingOutcome toPpt(const HandlerRequest &request);
    static ProcessingOutcome compress(const HandlerRequest &request);

    /**
     * @brief Preset for low, medium, high or maximum.
     * @throws ProcessingError(InvalidInput) for any other name
     */
    static CompressionPreset presetFor(const std::string &option);

    /**
     * @brief Compress one file keeping its type. Falls back to the input file
     * when the result would not be smaller.
     */
    static CompressionResult compressFile(const HandlerRequest &request, const WorkItem &item,
                                          const std::filesystem::path &out_dir, const CompressionPreset &preset);

    // Re-encode an in-memory image; false when the input is not an image or did not shrink
    static bool recompressImageBytes(const std::string &extension, const CompressionPreset &preset, std::string &data);

private:
    static bool compressPdf(const HandlerRequest &request, const std::filesystem::path &input,
                            const std::filesystem::path &output, const CompressionPreset &preset);
    static bool compressOfficePackage(const std::filesystem::path &input, const std::filesystem::path &output,
                                      const CompressionPreset &preset);
    static bool compressImage(const std::filesystem::path &input, const std::string &extension,
                              const std::filesystem::path &output, const CompressionPreset &preset);
    static std::filesystem::path convertToPptx(const HandlerRequest &request, const WorkItem &item,
                                               const std::filesystem::path &out_dir);
};
