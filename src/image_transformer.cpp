#include "core/image_transformer.hpp"
#include "core/contrast_validator.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cmath>
#include <opencv2/imgcodecs.hpp>

namespace
{
    struct Rgbd
    {
        double r;
        double g;
        double b;
    };

    Rgbd lerp(const Rgbd &from, const Rgbd &to, double t)
    {
        return {from.r + (to.r - from.r) * t,
                from.g + (to.g - from.g) * t,
                from.b + (to.b - from.b) * t};
    }

    Rgbd toRgbd(const RgbColor &color)
    {
        return {static_cast<double>(color.r), static_cast<double>(color.g), static_cast<double>(color.b)};
    }

    uint8_t clampChannel(double value)
    {
        return static_cast<uint8_t>(std::clamp(std::lround(value), 0L, 255L));
    }

    /**
     * Position of a pixel on the dark-to-light ramp. Pixels on the light
     * side of the midpoint land between the midpoint colour and the light
     * target; dark pixels between the dark target and the midpoint.
     */
    Rgbd rampColor(double luminance, const Rgbd &light, const Rgbd &dark, const Rgbd &mid)
    {
        const double midpoint = ContrastValidator::POLARITY_MIDPOINT;
        if (luminance >= midpoint)
        {
            return lerp(mid, light, (luminance - midpoint) / (1.0 - midpoint));
        }
        return lerp(dark, mid, luminance / midpoint);
    }

    void remapPixel(uint8_t &b, uint8_t &g, uint8_t &r,
                    const Rgbd &light, const Rgbd &dark, const Rgbd &mid)
    {
        double luminance = ContrastValidator::relativeLuminance(r, g, b);
        Rgbd base = rampColor(luminance, light, dark, mid);

        double mean = (static_cast<double>(r) + g + b) / 3.0;
        const double keep = ImageTransformer::CHROMA_RETENTION;
        r = clampChannel(base.r + keep * (r - mean));
        g = clampChannel(base.g + keep * (g - mean));
        b = clampChannel(base.b + keep * (b - mean));
    }
}

std::optional<TransformedImage> ImageTransformer::transform(const std::vector<uint8_t> &source,
                                                            const InversionConfig &config,
                                                            DiagnosticsCollector &diagnostics)
{
    if (!config.invertImages() || source.empty())
    {
        return std::nullopt;
    }

    try
    {
        cv::Mat decoded = cv::imdecode(cv::Mat(1, static_cast<int>(source.size()), CV_8UC1,
                                               const_cast<uint8_t *>(source.data())),
                                       cv::IMREAD_UNCHANGED);
        if (decoded.empty())
        {
            diagnostics.warn("Image processing failed: could not decode image data (" +
                             std::to_string(source.size()) + " bytes)");
            return std::nullopt;
        }

        cv::Mat image = normalizeForRemap(decoded);
        if (image.empty())
        {
            diagnostics.warn("Image processing failed: unsupported pixel layout (" +
                             std::to_string(decoded.channels()) + " channels, depth " +
                             std::to_string(decoded.depth()) + ")");
            return std::nullopt;
        }

        remapPixels(image, config.lightTarget(), config.darkTarget());

        TransformedImage result;
        result.encoding = chooseEncoding(image);

        std::vector<uchar> encoded;
        bool ok = false;
        if (result.encoding == ImageEncoding::LOSSLESS)
        {
            ok = cv::imencode(".png", image, encoded);
        }
        else
        {
            cv::Mat opaque = image;
            if (image.channels() == 4)
            {
                std::vector<cv::Mat> planes;
                cv::split(image, planes);
                planes.pop_back();
                cv::merge(planes, opaque);
            }
            std::vector<int> params = {cv::IMWRITE_JPEG_QUALITY, config.imageQuality()};
            ok = cv::imencode(".jpg", opaque, encoded, params);
        }

        if (!ok || encoded.empty())
        {
            diagnostics.warn("Image processing failed: could not encode " + result.extension() + " output");
            return std::nullopt;
        }

        result.data.assign(encoded.begin(), encoded.end());
        Logger::debug("Transformed image " + std::to_string(image.cols) + "x" + std::to_string(image.rows) +
                      " -> " + result.extension() + " (" + std::to_string(result.data.size()) + " bytes)");
        return result;
    }
    catch (const cv::Exception &e)
    {
        Logger::warn("OpenCV error during image transform: " + std::string(e.what()));
        diagnostics.warn("Image processing failed: " + std::string(e.err));
        return std::nullopt;
    }
}

cv::Mat ImageTransformer::normalizeForRemap(const cv::Mat &decoded)
{
    cv::Mat eight_bit;
    if (decoded.depth() == CV_8U)
    {
        eight_bit = decoded;
    }
    else if (decoded.depth() == CV_16U)
    {
        decoded.convertTo(eight_bit, CV_8U, 1.0 / 257.0);
    }
    else if (decoded.depth() == CV_32F)
    {
        decoded.convertTo(eight_bit, CV_8U, 255.0);
    }
    else
    {
        return cv::Mat();
    }

    switch (eight_bit.channels())
    {
    case 1:
    {
        cv::Mat bgr;
        cv::merge(std::vector<cv::Mat>{eight_bit, eight_bit, eight_bit}, bgr);
        return bgr;
    }
    case 3:
    case 4:
        return eight_bit.clone();
    default:
        return cv::Mat();
    }
}

void ImageTransformer::remapPixels(cv::Mat &image, const RgbColor &light_target, const RgbColor &dark_target)
{
    CV_Assert(image.depth() == CV_8U && (image.channels() == 3 || image.channels() == 4));

    const Rgbd light = toRgbd(light_target);
    const Rgbd dark = toRgbd(dark_target);
    const Rgbd mid = lerp(dark, light, 0.5);
    const int channels = image.channels();

    for (int y = 0; y < image.rows; ++y)
    {
        uint8_t *row = image.ptr<uint8_t>(y);
        for (int x = 0; x < image.cols; ++x)
        {
            uint8_t *px = row + x * channels;
            remapPixel(px[0], px[1], px[2], light, dark, mid);
        }
    }
}

RgbColor ImageTransformer::remapColor(const RgbColor &color, const RgbColor &light_target, const RgbColor &dark_target)
{
    const Rgbd light = toRgbd(light_target);
    const Rgbd dark = toRgbd(dark_target);
    uint8_t b = color.b;
    uint8_t g = color.g;
    uint8_t r = color.r;
    remapPixel(b, g, r, light, dark, lerp(dark, light, 0.5));
    return RgbColor(r, g, b);
}

bool ImageTransformer::hasPartialTransparency(const cv::Mat &image)
{
    if (image.channels() != 4)
    {
        return false;
    }
    for (int y = 0; y < image.rows; ++y)
    {
        const uint8_t *row = image.ptr<uint8_t>(y);
        for (int x = 0; x < image.cols; ++x)
        {
            if (row[x * 4 + 3] != 255)
            {
                return true;
            }
        }
    }
    return false;
}

ImageEncoding ImageTransformer::chooseEncoding(const cv::Mat &image)
{
    return hasPartialTransparency(image) ? ImageEncoding::LOSSLESS : ImageEncoding::LOSSY;
}
