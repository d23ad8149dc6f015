#include "test_base.hpp"
#include "deck_builder.hpp"
#include "core/image_transformer.hpp"
#include <cstdlib>

class ImageTransformerTest : public TestBase
{
protected:
    static bool near(const cv::Vec3b &pixel, const RgbColor &expected, int tolerance)
    {
        return std::abs(pixel[2] - expected.r) <= tolerance &&
               std::abs(pixel[1] - expected.g) <= tolerance &&
               std::abs(pixel[0] - expected.b) <= tolerance;
    }

    DiagnosticsCollector diagnostics_;
};

TEST_F(ImageTransformerTest, OpaqueImageBecomesJpeg)
{
    InversionConfig config;
    auto source = DeckBuilder::solidImage(8, 8, RgbColor(255, 255, 255));

    auto result = ImageTransformer::transform(source, config, diagnostics_);

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->encoding, ImageEncoding::LOSSY);
    EXPECT_EQ(result->extension(), "jpeg");
    EXPECT_EQ(result->contentType(), "image/jpeg");
    ASSERT_GE(result->data.size(), 3u);
    EXPECT_EQ(result->data[0], 0xFF);
    EXPECT_EQ(result->data[1], 0xD8);
    EXPECT_TRUE(diagnostics_.empty());
}

TEST_F(ImageTransformerTest, SwappedSchemeInvertsPolarity)
{
    InversionConfig config = InversionConfig::fromHex("#FFFFFF", "#000000");
    auto source = DeckBuilder::solidImage(8, 8, RgbColor(255, 255, 255));

    auto result = ImageTransformer::transform(source, config, diagnostics_);
    ASSERT_TRUE(result.has_value());

    cv::Mat decoded = DeckBuilder::decodeImage(result->data);
    ASSERT_FALSE(decoded.empty());
    EXPECT_TRUE(near(decoded.at<cv::Vec3b>(4, 4), RgbColor(0, 0, 0), 4));
}

TEST_F(ImageTransformerTest, TransparentImageStaysLosslessWithAlpha)
{
    InversionConfig config;
    auto source = DeckBuilder::solidImage(6, 6, RgbColor(0, 0, 0), 128);

    auto result = ImageTransformer::transform(source, config, diagnostics_);

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->encoding, ImageEncoding::LOSSLESS);
    EXPECT_EQ(result->extension(), "png");

    cv::Mat decoded = DeckBuilder::decodeImage(result->data);
    ASSERT_EQ(decoded.channels(), 4);
    cv::Vec4b pixel = decoded.at<cv::Vec4b>(2, 3);
    EXPECT_EQ(pixel[3], 128);
    // Black is dark and maps onto the black background colour
    EXPECT_EQ(pixel[0], 0);
    EXPECT_EQ(pixel[1], 0);
    EXPECT_EQ(pixel[2], 0);
}

TEST_F(ImageTransformerTest, FullyOpaqueAlphaChannelStillUsesJpeg)
{
    cv::Mat image(4, 4, CV_8UC4, cv::Scalar(10, 20, 30, 255));
    EXPECT_FALSE(ImageTransformer::hasPartialTransparency(image));
    EXPECT_EQ(ImageTransformer::chooseEncoding(image), ImageEncoding::LOSSY);

    image.at<cv::Vec4b>(3, 3)[3] = 254;
    EXPECT_TRUE(ImageTransformer::hasPartialTransparency(image));
    EXPECT_EQ(ImageTransformer::chooseEncoding(image), ImageEncoding::LOSSLESS);

    cv::Mat bgr(4, 4, CV_8UC3, cv::Scalar(0, 0, 0));
    EXPECT_FALSE(ImageTransformer::hasPartialTransparency(bgr));
}

TEST_F(ImageTransformerTest, DisabledImagesAreKept)
{
    InversionConfig config = InversionConfig::fromHex("#000000", "#FFFFFF", false);
    auto source = DeckBuilder::solidImage(4, 4, RgbColor(255, 255, 255));

    EXPECT_FALSE(ImageTransformer::transform(source, config, diagnostics_).has_value());
    EXPECT_TRUE(diagnostics_.empty());
}

TEST_F(ImageTransformerTest, UndecodableBytesWarnAndKeepOriginal)
{
    InversionConfig config;
    std::vector<uint8_t> garbage = {'n', 'o', 't', ' ', 'a', 'n', ' ', 'i', 'm', 'a', 'g', 'e'};

    EXPECT_FALSE(ImageTransformer::transform(garbage, config, diagnostics_).has_value());
    ASSERT_EQ(diagnostics_.size(), 1u);
    EXPECT_NE(diagnostics_.warnings()[0].find("Image processing failed"), std::string::npos);
}

TEST_F(ImageTransformerTest, GreyscaleInputIsAccepted)
{
    cv::Mat grey(5, 5, CV_8UC1, cv::Scalar(255));
    std::vector<uchar> encoded;
    ASSERT_TRUE(cv::imencode(".png", grey, encoded));

    auto result = ImageTransformer::transform(std::vector<uint8_t>(encoded.begin(), encoded.end()),
                                              InversionConfig(), diagnostics_);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->encoding, ImageEncoding::LOSSY);
}

TEST_F(ImageTransformerTest, RemapColorKeepsPositionWithinClass)
{
    RgbColor white(255, 255, 255);
    RgbColor black(0, 0, 0);

    EXPECT_EQ(ImageTransformer::remapColor(white, white, black), white);
    EXPECT_EQ(ImageTransformer::remapColor(black, white, black), black);
    // Mid grey is dark (luminance ~0.216) and lands 43% of the way to the midpoint
    EXPECT_EQ(ImageTransformer::remapColor(RgbColor(128, 128, 128), white, black), RgbColor(55, 55, 55));
}

TEST_F(ImageTransformerTest, RemapColorRetainsChroma)
{
    RgbColor red = ImageTransformer::remapColor(RgbColor(255, 0, 0), RgbColor(255, 255, 255), RgbColor(0, 0, 0));
    EXPECT_GT(red.r, red.g);
    EXPECT_EQ(red.g, red.b);
    EXPECT_EQ(red, RgbColor(139, 12, 12));
}
