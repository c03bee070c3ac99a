#pragma once

#include <string>
#include <opencv2/core.hpp>

/**
 * @brief Appearance of a text watermark
 */
struct WatermarkStyle
{
    std::string text = "SAMPLE";
    int font_size = 48;                    // approximate cap height in pixels
    bool bold = false;
    double rotation = 0.0;                 // degrees, counter-clockwise
    std::string position = "middle-center"; // {top,middle,bottom}-{left,center,right}
    int transparency = 50;                 // 0 (invisible) .. 100 (opaque)
    int margin = 40;
};

/**
 * @brief Renders text watermarks with OpenCV
 */
class WatermarkRenderer
{
public:
    static bool isValidPosition(const std::string &position);

    /**
     * @brief Transparent BGRA layer of `width` x `height` with the styled text
     * placed according to `style.position`.
     */
    static cv::Mat renderLayer(int width, int height, const WatermarkStyle &style);

    /**
     * @brief Alpha-composite `layer` (BGRA, same size) over `image`.
     * The result keeps the channel count of `image`.
     */
    static cv::Mat composite(const cv::Mat &image, const cv::Mat &layer);

    // Top-left corner for content of the given size
    static cv::Point placement(const std::string &position, const cv::Size &container, const cv::Size &content, int margin);

private:
    static cv::Mat renderText(const WatermarkStyle &style);
    static cv::Mat rotateExpanded(const cv::Mat &src, double degrees);
};
