#include "media/image_codec.hpp"
#include "core/processing_outcome.hpp"
#include "handlers/handler_support.hpp"
#include <algorithm>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

cv::Mat ImageCodec::load(const std::filesystem::path &path)
{
    std::vector<uint8_t> bytes = HandlerSupport::readFileBytes(path);
    cv::Mat image;
    if (!bytes.empty())
    {
        image = cv::imdecode(bytes, cv::IMREAD_UNCHANGED);
    }
    if (image.empty())
    {
        throw ProcessingError(FailureKind::InvalidInput, path.filename().string() + " is not a recognized image");
    }

    // 16-bit sources are reduced to 8-bit so every encoder accepts them
    if (image.depth() != CV_8U)
    {
        cv::Mat converted;
        double scale = image.depth() == CV_16U ? 1.0 / 257.0 : 1.0;
        image.convertTo(converted, CV_8U, scale);
        image = converted;
    }
    if (image.channels() == 1)
    {
        cv::Mat bgr;
        cv::cvtColor(image, bgr, cv::COLOR_GRAY2BGR);
        image = bgr;
    }
    return image;
}

std::vector<uint8_t> ImageCodec::encode(const cv::Mat &image, const std::string &extension, const EncodeSettings &settings)
{
    std::string ext = extension;
    if (ext == "jpeg")
        ext = "jpg";
    if (ext == "tif")
        ext = "tiff";

    cv::Mat source = supportsAlpha(ext) ? image : flattenAlpha(image);
    std::vector<int> params;
    int quality = std::clamp(settings.quality, 1, 100);

    if (ext == "jpg")
    {
        params = {cv::IMWRITE_JPEG_QUALITY, quality, cv::IMWRITE_JPEG_OPTIMIZE, 1};
    }
    else if (ext == "webp")
    {
        params = {cv::IMWRITE_WEBP_QUALITY, quality};
    }
    else if (ext == "png")
    {
        if (settings.png_levels > 1)
        {
            source = posterize(source, settings.png_levels);
        }
        params = {cv::IMWRITE_PNG_COMPRESSION, std::clamp(settings.png_compression, 0, 9)};
    }
    else if (ext != "bmp" && ext != "tiff")
    {
        throw ProcessingError(FailureKind::InvalidInput, "cannot encode images as ." + extension);
    }

    std::vector<uint8_t> out;
    if (!cv::imencode("." + ext, source, out, params))
    {
        throw ProcessingError(FailureKind::HandlerCrashed, "image encoder for ." + ext + " failed");
    }
    return out;
}

void ImageCodec::save(const cv::Mat &image, const std::filesystem::path &path, const EncodeSettings &settings)
{
    std::string ext = path.extension().string();
    if (!ext.empty())
        ext.erase(0, 1);
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c)
                   { return static_cast<char>(std::tolower(c)); });
    HandlerSupport::writeFileBytes(path, encode(image, ext, settings));
}

cv::Mat ImageCodec::flattenAlpha(const cv::Mat &image, const cv::Scalar &background)
{
    if (image.channels() != 4)
    {
        return image.clone();
    }

    cv::Mat bgr, alpha;
    cv::cvtColor(image, bgr, cv::COLOR_BGRA2BGR);
    cv::extractChannel(image, alpha, 3);

    cv::Mat bgr_f, alpha_f, alpha3;
    bgr.convertTo(bgr_f, CV_32FC3);
    alpha.convertTo(alpha_f, CV_32F, 1.0 / 255.0);
    cv::merge(std::vector<cv::Mat>{alpha_f, alpha_f, alpha_f}, alpha3);

    cv::Mat bg(bgr.size(), CV_32FC3, background);
    cv::Mat blended = bgr_f.mul(alpha3) + bg.mul(cv::Scalar(1.0, 1.0, 1.0) - alpha3);
    cv::Mat out;
    blended.convertTo(out, CV_8UC3);
    return out;
}

cv::Mat ImageCodec::toBgra(const cv::Mat &image)
{
    if (image.channels() == 4)
    {
        return image.clone();
    }
    cv::Mat out;
    cv::cvtColor(image, out, image.channels() == 1 ? cv::COLOR_GRAY2BGRA : cv::COLOR_BGR2BGRA);
    return out;
}

cv::Mat ImageCodec::posterize(const cv::Mat &image, int levels)
{
    levels = std::clamp(levels, 2, 256);
    if (levels == 256)
    {
        return image.clone();
    }

    cv::Mat lut(1, 256, CV_8U);
    double step = 255.0 / (levels - 1);
    for (int i = 0; i < 256; ++i)
    {
        lut.at<uint8_t>(i) = cv::saturate_cast<uint8_t>(std::round(std::round(i / step) * step));
    }

    if (image.channels() == 4)
    {
        // Leave alpha untouched
        std::vector<cv::Mat> channels;
        cv::split(image, channels);
        for (int c = 0; c < 3; ++c)
            cv::LUT(channels[c], lut, channels[c]);
        cv::Mat out;
        cv::merge(channels, out);
        return out;
    }
    cv::Mat out;
    cv::LUT(image, lut, out);
    return out;
}

bool ImageCodec::supportsAlpha(const std::string &extension)
{
    return extension == "png" || extension == "webp" || extension == "tiff" || extension == "tif";
}
