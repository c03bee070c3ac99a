#include "handlers/qr_handlers.hpp"
#include "logging/logger.hpp"
#include "media/image_codec.hpp"
#include <algorithm>
#include <cctype>
#include <opencv2/imgproc.hpp>
#include <opencv2/objdetect.hpp>

namespace
{
    // Pixels per module before the final resize
    constexpr int BOX_SIZE = 10;
    constexpr size_t MAX_TEXT_BYTES = 4096;

    bool correctionLevelFor(const std::string &name, cv::QRCodeEncoder::CorrectionLevel &level)
    {
        std::string upper = name;
        std::transform(upper.begin(), upper.end(), upper.begin(), [](unsigned char c)
                       { return static_cast<char>(std::toupper(c)); });
        if (upper == "L")
            level = cv::QRCodeEncoder::CORRECT_LEVEL_L;
        else if (upper == "M")
            level = cv::QRCodeEncoder::CORRECT_LEVEL_M;
        else if (upper == "Q")
            level = cv::QRCodeEncoder::CORRECT_LEVEL_Q;
        else if (upper == "H")
            level = cv::QRCodeEncoder::CORRECT_LEVEL_H;
        else
            return false;
        return true;
    }

    std::string trimmed(const std::string &text)
    {
        size_t begin = text.find_first_not_of(" \t\r\n");
        if (begin == std::string::npos)
            return "";
        size_t end = text.find_last_not_of(" \t\r\n");
        return text.substr(begin, end - begin + 1);
    }
}

void QrHandlers::registerCapabilities(CapabilityRegistry &registry)
{
    registry.registerCapability({"qr.generate", {"generate-qr"}, "qr",
                                 "Generate a QR code PNG from text or a URL",
                                 {"txt"},
                                 {{"data", ""},
                                  {"size", 300},
                                  {"error_correction", "M"},
                                  {"foreground", "#000000"},
                                  {"background", "#ffffff"}},
                                 0, &QrHandlers::generate});
}

bool QrHandlers::parseHexColor(const std::string &text, cv::Scalar &color)
{
    std::string hex = text;
    if (!hex.empty() && hex.front() == '#')
        hex.erase(0, 1);
    if (hex.size() == 3)
        hex = {hex[0], hex[0], hex[1], hex[1], hex[2], hex[2]};
    if (hex.size() != 6 || !std::all_of(hex.begin(), hex.end(), [](unsigned char c)
                                        { return std::isxdigit(c) != 0; }))
    {
        return false;
    }
    int r = std::stoi(hex.substr(0, 2), nullptr, 16);
    int g = std::stoi(hex.substr(2, 2), nullptr, 16);
    int b = std::stoi(hex.substr(4, 2), nullptr, 16);
    color = cv::Scalar(b, g, r);
    return true;
}

cv::Mat QrHandlers::render(const std::string &data, int size, const std::string &error_correction,
                           const cv::Scalar &foreground, const cv::Scalar &background)
{
    if (data.empty())
    {
        throw ProcessingError(FailureKind::InvalidInput, "QR code data is required");
    }
    if (size < MIN_SIZE || size > MAX_SIZE)
    {
        throw ProcessingError(FailureKind::InvalidInput, "Size must be between " + std::to_string(MIN_SIZE) +
                                                             " and " + std::to_string(MAX_SIZE) + " pixels");
    }
    cv::QRCodeEncoder::Params params;
    if (!correctionLevelFor(error_correction, params.correction_level))
    {
        throw ProcessingError(FailureKind::InvalidInput, "Invalid error correction level, use L, M, Q or H");
    }

    cv::Mat modules;
    try
    {
        cv::Ptr<cv::QRCodeEncoder> encoder = cv::QRCodeEncoder::create(params);
        encoder->encode(data, modules);
    }
    catch (const cv::Exception &e)
    {
        throw ProcessingError(FailureKind::InvalidInput, "data cannot be encoded as a QR code", e.what());
    }

    if (modules.empty())
    {
        throw ProcessingError(FailureKind::InvalidInput, "data cannot be encoded as a QR code");
    }
    // Dark modules are 0; crop to the symbol and add a fixed quiet zone
    cv::Mat dark = modules < 128;
    if (cv::countNonZero(dark) == 0)
    {
        throw ProcessingError(FailureKind::InvalidInput, "data cannot be encoded as a QR code");
    }
    cv::Mat symbol = modules(cv::boundingRect(dark));
    cv::Mat padded;
    cv::copyMakeBorder(symbol, padded, QUIET_ZONE_MODULES, QUIET_ZONE_MODULES, QUIET_ZONE_MODULES, QUIET_ZONE_MODULES,
                       cv::BORDER_CONSTANT, cv::Scalar(255));

    cv::Mat boxed;
    cv::resize(padded, boxed, cv::Size(), BOX_SIZE, BOX_SIZE, cv::INTER_NEAREST);
    cv::Mat gray;
    cv::resize(boxed, gray, cv::Size(size, size), 0, 0, size < boxed.cols ? cv::INTER_AREA : cv::INTER_LANCZOS4);

    cv::Mat out(size, size, CV_8UC3);
    for (int y = 0; y < size; ++y)
    {
        const uchar *src = gray.ptr<uchar>(y);
        cv::Vec3b *dst = out.ptr<cv::Vec3b>(y);
        for (int x = 0; x < size; ++x)
        {
            double ink = 1.0 - src[x] / 255.0;
            for (int c = 0; c < 3; ++c)
            {
                dst[x][c] = cv::saturate_cast<uchar>(background[c] + (foreground[c] - background[c]) * ink);
            }
        }
    }
    return out;
}

ProcessingOutcome QrHandlers::generate(const HandlerRequest &request)
{
    std::string data = HandlerSupport::optionString(request, "data", "");
    if (data.empty() && !request.inputs.empty())
    {
        std::vector<uint8_t> bytes = HandlerSupport::readFileBytes(request.inputs.front().path);
        if (bytes.size() > MAX_TEXT_BYTES)
        {
            throw ProcessingError(FailureKind::InvalidInput, "text file is too long for a QR code");
        }
        data = trimmed(std::string(bytes.begin(), bytes.end()));
    }

    cv::Scalar foreground, background;
    if (!parseHexColor(HandlerSupport::optionString(request, "foreground", "#000000"), foreground) ||
        !parseHexColor(HandlerSupport::optionString(request, "background", "#ffffff"), background))
    {
        throw ProcessingError(FailureKind::InvalidInput, "colours must be hex values such as #1a2b3c");
    }

    const int size = HandlerSupport::optionInt(request, "size", 300);
    cv::Mat image = render(data, size, HandlerSupport::optionString(request, "error_correction", "M"),
                           foreground, background);

    EncodeSettings settings;
    settings.png_compression = 9;
    std::string name = "qr-code-" + std::to_string(size) + "x" + std::to_string(size) + ".png";
    Logger::debug("QrHandlers: encoded " + std::to_string(data.size()) + " bytes as " + name);
    return ProcessingOutcome::artifact(ImageCodec::encode(image, "png", settings), name, "image/png");
}
