#pragma once

#include "core/color.hpp"
#include "core/diagnostics.hpp"
#include "core/inversion_config.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <opencv2/core.hpp>

/**
 * @brief Output encoding chosen for a transformed image
 */
enum class ImageEncoding
{
    LOSSLESS, // PNG, used whenever any pixel is not fully opaque
    LOSSY     // JPEG at the configured quality
};

/**
 * @brief Re-encoded replacement for one embedded picture
 */
struct TransformedImage
{
    std::vector<uint8_t> data;
    ImageEncoding encoding = ImageEncoding::LOSSLESS;

    std::string extension() const { return encoding == ImageEncoding::LOSSLESS ? "png" : "jpeg"; }
    std::string contentType() const { return encoding == ImageEncoding::LOSSLESS ? "image/png" : "image/jpeg"; }
};

/**
 * @brief Polarity-preserving two-colour remap of raster images
 *
 * Each pixel is classified light or dark by relative luminance against the
 * 0.5 midpoint. Light pixels ramp toward the foreground colour and dark
 * pixels toward the background colour, keeping their position within
 * the class so gradients and anti-aliasing survive. Part of each pixel's
 * chroma is carried over. Alpha passes through unmodified.
 */
class ImageTransformer
{
public:
    /// Fraction of a pixel's deviation from its channel mean kept in the output
    static constexpr double CHROMA_RETENTION = 0.5;

    /**
     * @brief Transform one embedded image
     * @param source Encoded image bytes (PNG, JPEG, BMP, TIFF, ...)
     * @param config Batch configuration (colours, quality, images switch)
     * @param diagnostics Receives a warning if the bytes cannot be decoded or encoded
     * @return Replacement bytes, or std::nullopt meaning "keep the original"
     */
    static std::optional<TransformedImage> transform(const std::vector<uint8_t> &source,
                                                     const InversionConfig &config,
                                                     DiagnosticsCollector &diagnostics);

    /**
     * @brief Remap an 8-bit BGR or BGRA image in place
     */
    static void remapPixels(cv::Mat &image, const RgbColor &light_target, const RgbColor &dark_target);

    /**
     * @brief Remap a single colour with the same rule as remapPixels()
     */
    static RgbColor remapColor(const RgbColor &color, const RgbColor &light_target, const RgbColor &dark_target);

    /**
     * @brief True if a BGRA image has any alpha value other than 255
     */
    static bool hasPartialTransparency(const cv::Mat &image);

    /**
     * @brief Choose the encoding for a remapped image
     */
    static ImageEncoding chooseEncoding(const cv::Mat &image);

private:
    static cv::Mat normalizeForRemap(const cv::Mat &decoded);
};
