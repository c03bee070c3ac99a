#include "media/watermark_renderer.hpp"
#include <algorithm>
#include <cmath>
#include <set>
#include <vector>
#include <opencv2/imgproc.hpp>

bool WatermarkRenderer::isValidPosition(const std::string &position)
{
    static const std::set<std::string> positions = {
        "top-left", "top-center", "top-right",
        "middle-left", "middle-center", "middle-right",
        "bottom-left", "bottom-center", "bottom-right"};
    return positions.count(position) > 0;
}

cv::Point WatermarkRenderer::placement(const std::string &position, const cv::Size &container, const cv::Size &content, int margin)
{
    int x;
    if (position.find("left") != std::string::npos)
        x = margin;
    else if (position.find("right") != std::string::npos)
        x = container.width - content.width - margin;
    else
        x = (container.width - content.width) / 2;

    int y;
    if (position.find("top") != std::string::npos)
        y = margin;
    else if (position.find("bottom") != std::string::npos)
        y = container.height - content.height - margin;
    else
        y = (container.height - content.height) / 2;

    return cv::Point(x, y);
}

cv::Mat WatermarkRenderer::renderText(const WatermarkStyle &style)
{
    const int font = cv::FONT_HERSHEY_SIMPLEX;
    // Hershey simplex glyphs are about 22px tall at scale 1.0
    const double scale = std::max(1, style.font_size) / 22.0;
    const int thickness = std::max(1, static_cast<int>(std::lround(scale * (style.bold ? 3.0 : 1.6))));

    int baseline = 0;
    cv::Size text_size = cv::getTextSize(style.text, font, scale, thickness, &baseline);
    cv::Size canvas(text_size.width + 2 * thickness, text_size.height + baseline + 2 * thickness);

    const int alpha = std::clamp(style.transparency, 0, 100) * 255 / 100;
    cv::Mat layer(canvas, CV_8UC4, cv::Scalar(0, 0, 0, 0));
    cv::putText(layer, style.text, cv::Point(thickness, thickness + text_size.height), font, scale,
                cv::Scalar(0, 0, 0, alpha), thickness, cv::LINE_AA);
    return layer;
}

cv::Mat WatermarkRenderer::rotateExpanded(const cv::Mat &src, double degrees)
{
    if (std::fabs(std::fmod(degrees, 360.0)) < 1e-6)
    {
        return src;
    }

    cv::Point2f center(src.cols / 2.0f, src.rows / 2.0f);
    cv::Mat rot = cv::getRotationMatrix2D(center, degrees, 1.0);
    cv::Rect2f bounds = cv::RotatedRect(cv::Point2f(), src.size(), static_cast<float>(degrees)).boundingRect2f();
    rot.at<double>(0, 2) += bounds.width / 2.0 - src.cols / 2.0;
    rot.at<double>(1, 2) += bounds.height / 2.0 - src.rows / 2.0;

    cv::Mat out;
    cv::warpAffine(src, out, rot, cv::Size(static_cast<int>(std::ceil(bounds.width)), static_cast<int>(std::ceil(bounds.height))),
                   cv::INTER_LINEAR, cv::BORDER_CONSTANT, cv::Scalar(0, 0, 0, 0));
    return out;
}

cv::Mat WatermarkRenderer::renderLayer(int width, int height, const WatermarkStyle &style)
{
    cv::Mat layer(height, width, CV_8UC4, cv::Scalar(0, 0, 0, 0));
    if (style.text.empty() || width <= 0 || height <= 0)
    {
        return layer;
    }

    cv::Mat mark = rotateExpanded(renderText(style), style.rotation);
    cv::Point origin = placement(style.position, layer.size(), mark.size(), style.margin);

    // Clip the mark to the layer
    cv::Rect dst(origin, mark.size());
    cv::Rect visible = dst & cv::Rect(0, 0, width, height);
    if (visible.empty())
    {
        return layer;
    }
    cv::Rect src(visible.x - origin.x, visible.y - origin.y, visible.width, visible.height);
    mark(src).copyTo(layer(visible));
    return layer;
}

cv::Mat WatermarkRenderer::composite(const cv::Mat &image, const cv::Mat &layer)
{
    cv::Mat base;
    image.convertTo(base, CV_32F);

    std::vector<cv::Mat> layer_channels;
    cv::split(layer, layer_channels);
    cv::Mat alpha;
    layer_channels[3].convertTo(alpha, CV_32F, 1.0 / 255.0);

    cv::Mat inverse = 1.0 - alpha;

    std::vector<cv::Mat> channels;
    cv::split(base, channels);
    for (int c = 0; c < 3 && c < static_cast<int>(channels.size()); ++c)
    {
        cv::Mat mark;
        layer_channels[c].convertTo(mark, CV_32F);
        channels[c] = channels[c].mul(inverse) + mark.mul(alpha);
    }
    if (channels.size() == 4)
    {
        // Watermark pixels become at least as opaque as the mark
        cv::Mat mark_alpha = alpha * 255.0;
        cv::max(channels[3], mark_alpha, channels[3]);
    }

    cv::Mat merged, out;
    cv::merge(channels, merged);
    merged.convertTo(out, image.type());
    return out;
}
