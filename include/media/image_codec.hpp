#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include <opencv2/core.hpp>

/**
 * @brief Encoder settings for ImageCodec::encode
 */
struct EncodeSettings
{
    int quality = 85;         // JPEG / WebP quality, 1..100
    int png_compression = 6;  // zlib level 0..9
    int png_levels = 0;       // per-channel levels for lossy PNG (0 = lossless)
};

/**
 * @brief Decode/encode helpers over OpenCV imgcodecs
 */
class ImageCodec
{
public:
    /**
     * @brief Load an image keeping its alpha channel when present.
     * @throws ProcessingError(InvalidInput) if the file is not a decodable image
     */
    static cv::Mat load(const std::filesystem::path &path);

    /**
     * @brief Encode `image` for the format named by `extension` (jpg, png, webp, bmp, tiff).
     * Alpha is flattened onto white for formats without transparency.
     */
    static std::vector<uint8_t> encode(const cv::Mat &image, const std::string &extension, const EncodeSettings &settings);

    // Encode and write to `path`; format from the path's extension
    static void save(const cv::Mat &image, const std::filesystem::path &path, const EncodeSettings &settings);

    // BGR copy of `image` with any alpha composited over `background`
    static cv::Mat flattenAlpha(const cv::Mat &image, const cv::Scalar &background = cv::Scalar(255, 255, 255));

    // 4-channel BGRA copy of `image`
    static cv::Mat toBgra(const cv::Mat &image);

    // Reduce each channel to `levels` distinct values so lossless codecs compress better
    static cv::Mat posterize(const cv::Mat &image, int levels);

    static bool supportsAlpha(const std::string &extension);
};
