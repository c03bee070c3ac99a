#include "test_base.hpp"
#include "core/request_dispatcher.hpp"
#include "handlers/conversion_handlers.hpp"
#include "handlers/pdf_handlers.hpp"
#include "handlers/video_handlers.hpp"
#include "handlers/watermark_handlers.hpp"
#include "tools/media_downloader.hpp"
#include <limits>

class HandlerOptionsTest : public TestBase
{
protected:
    static HandlerRequest requestWith(const nlohmann::json &options)
    {
        HandlerRequest request;
        request.options = options;
        request.cancel_token = std::make_shared<CancellationToken>();
        return request;
    }

    template <typename Fn>
    static FailureKind failureOf(Fn fn)
    {
        try
        {
            fn();
        }
        catch (const ProcessingError &e)
        {
            return e.kind();
        }
        ADD_FAILURE() << "expected ProcessingError";
        return FailureKind::HandlerCrashed;
    }
};

TEST_F(HandlerOptionsTest, IntegerOptionsSaturate)
{
    nlohmann::json defaults{{"quality", 85}};
    HandlerRequest huge = requestWith(RequestDispatcher::mergeOptions(defaults, {{"quality", "1e18"}}));
    EXPECT_EQ(HandlerSupport::optionInt(huge, "quality", 85), std::numeric_limits<int>::max());

    HandlerRequest negative = requestWith(RequestDispatcher::mergeOptions(defaults, {{"quality", "-1e300"}}));
    EXPECT_EQ(HandlerSupport::optionInt(negative, "quality", 85), std::numeric_limits<int>::min());

    EXPECT_EQ(HandlerSupport::optionInt(requestWith({{"quality", 42.9}}), "quality", 85), 42);
    EXPECT_EQ(HandlerSupport::optionInt(requestWith({{"quality", "high"}}), "quality", 85), 85);
    EXPECT_EQ(HandlerSupport::optionInt(requestWith(nlohmann::json::object()), "quality", 85), 85);
}

TEST_F(HandlerOptionsTest, VideoScaleFactors)
{
    ScaleTarget doubled = VideoHandlers::parseScale("2x", 640, 360);
    EXPECT_EQ(doubled.width, 1280);
    EXPECT_EQ(doubled.height, 720);

    ScaleTarget quadrupled = VideoHandlers::parseScale("4x", 321, 241);
    EXPECT_EQ(quadrupled.width, 1284);
    EXPECT_EQ(quadrupled.height, 964);
}

TEST_F(HandlerOptionsTest, VideoScaleExplicitSizeIsEvened)
{
    ScaleTarget target = VideoHandlers::parseScale("1921:1081", 100, 100);
    EXPECT_EQ(target.width, 1920);
    EXPECT_EQ(target.height, 1080);
}

TEST_F(HandlerOptionsTest, VideoScaleRejectsNonsense)
{
    for (const std::string scale : {"3x", "abc", "1920", "1920:", ":1080", "-2:4", "0:0", "99999:2"})
    {
        EXPECT_EQ(failureOf([&]
                            { VideoHandlers::parseScale(scale, 640, 360); }),
                  FailureKind::InvalidInput)
            << scale;
    }
    // 4x of a 4K source exceeds the size cap
    EXPECT_EQ(failureOf([]
                        { VideoHandlers::parseScale("4x", 3840, 2160); }),
              FailureKind::InvalidInput);
}

TEST_F(HandlerOptionsTest, CompressionPresets)
{
    CompressionPreset low = ConversionHandlers::presetFor("low");
    CompressionPreset maximum = ConversionHandlers::presetFor("maximum");
    EXPECT_GT(low.jpeg_quality, maximum.jpeg_quality);
    EXPECT_GE(low.scale, maximum.scale);
    EXPECT_EQ(low.gs_preset, "/ebook");
    EXPECT_EQ(ConversionHandlers::presetFor("medium").gs_preset, "/screen");

    EXPECT_EQ(failureOf([]
                        { ConversionHandlers::presetFor("extreme"); }),
              FailureKind::InvalidInput);
}

TEST_F(HandlerOptionsTest, UrlExtraction)
{
    std::string text = "first https://example.com/watch?v=1, then (http://videos.test/clip).\n"
                       "dup https://example.com/watch?v=1 and ftp://ignored.example/file";
    std::vector<std::string> urls = MediaDownloader::extractUrls(text);
    ASSERT_EQ(urls.size(), 2u);
    EXPECT_EQ(urls[0], "https://example.com/watch?v=1");
    EXPECT_EQ(urls[1], "http://videos.test/clip");

    EXPECT_TRUE(MediaDownloader::extractUrls("no links here").empty());
}

TEST_F(HandlerOptionsTest, UrlCollectionReadsTextInputs)
{
    writeFile("links.txt", "https://a.example/1\nhttps://b.example/2\n");
    HandlerRequest request = requestWith({{"url", "https://c.example/3"}});
    StagedFile staged;
    staged.path = test_dir_ / "links.txt";
    staged.safe_name = "links.txt";
    staged.extension = "txt";
    request.inputs.push_back(staged);

    std::vector<std::string> urls = MediaDownloader::collectUrls(request);
    ASSERT_EQ(urls.size(), 3u);
    EXPECT_EQ(urls[0], "https://c.example/3");

    EXPECT_EQ(failureOf([]
                        { MediaDownloader::collectUrls(requestWith({{"url", ""}})); }),
              FailureKind::InvalidInput);
}

TEST_F(HandlerOptionsTest, UrlCollectionIsCapped)
{
    std::string many;
    for (size_t i = 0; i <= MediaDownloader::MAX_URLS; ++i)
    {
        many += "https://host.example/" + std::to_string(i) + "\n";
    }
    EXPECT_EQ(failureOf([&]
                        { MediaDownloader::collectUrls(requestWith({{"url", many}})); }),
              FailureKind::InvalidInput);
}

TEST_F(HandlerOptionsTest, WatermarkStyleValidation)
{
    WatermarkStyle style = WatermarkHandlers::styleFromOptions(requestWith({{"text", "CONFIDENTIAL"},
                                                                            {"font_size", 30},
                                                                            {"position", "bottom-right"},
                                                                            {"transparency", 25}}));
    EXPECT_EQ(style.text, "CONFIDENTIAL");
    EXPECT_EQ(style.font_size, 30);
    EXPECT_EQ(style.position, "bottom-right");
    EXPECT_EQ(style.transparency, 25);

    WatermarkStyle trimmed = WatermarkHandlers::styleFromOptions(requestWith({{"text", std::string(900, 'x')}}));
    EXPECT_EQ(trimmed.text.size(), WatermarkHandlers::MAX_TEXT_LENGTH);

    EXPECT_EQ(failureOf([]
                        { WatermarkHandlers::styleFromOptions(requestWith({{"position", "upside-down"}})); }),
              FailureKind::InvalidInput);
    EXPECT_EQ(failureOf([]
                        { WatermarkHandlers::styleFromOptions(requestWith({{"transparency", 150}})); }),
              FailureKind::InvalidInput);
    EXPECT_EQ(failureOf([]
                        { WatermarkHandlers::styleFromOptions(requestWith({{"font_size", 2}})); }),
              FailureKind::InvalidInput);
}

TEST_F(HandlerOptionsTest, OverlayPdfIsWellFormed)
{
    WatermarkStyle style;
    style.text = "Top (secret) \\ copy";
    style.bold = true;
    style.rotation = 45;
    style.transparency = 30;
    std::string pdf = WatermarkHandlers::buildOverlayPdf(style);

    EXPECT_EQ(pdf.rfind("%PDF-1.4\n", 0), 0u);
    EXPECT_NE(pdf.find("/Helvetica-Bold"), std::string::npos);
    EXPECT_NE(pdf.find("/ca 0.3"), std::string::npos);
    EXPECT_NE(pdf.find("(Top \\(secret\\) \\\\ copy) Tj"), std::string::npos);
    EXPECT_EQ(pdf.compare(pdf.size() - 6, 6, "%%EOF\n"), 0);

    // startxref must point at the xref table
    size_t startxref = pdf.rfind("startxref\n");
    ASSERT_NE(startxref, std::string::npos);
    size_t offset = std::stoul(pdf.substr(startxref + 10));
    EXPECT_EQ(pdf.compare(offset, 5, "xref\n"), 0);

    // Each xref entry points at its object header
    size_t entry = offset + std::string("xref\n0 7\n0000000000 65535 f \n").size();
    for (int object = 1; object <= 6; ++object)
    {
        size_t object_offset = std::stoul(pdf.substr(entry + (object - 1) * 20, 10));
        EXPECT_EQ(pdf.compare(object_offset, std::to_string(object).size() + 6, std::to_string(object) + " 0 obj"), 0) << object;
    }
}

TEST_F(HandlerOptionsTest, QpdfPasswordErrorsAreRecognized)
{
    EXPECT_TRUE(PdfHandlers::isPasswordError("qpdf: in.pdf: invalid password"));
    EXPECT_TRUE(PdfHandlers::isPasswordError("Password incorrect"));
    EXPECT_FALSE(PdfHandlers::isPasswordError("qpdf: in.pdf: file is damaged"));
}
