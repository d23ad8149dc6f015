#pragma once

#include "core/color.hpp"
#include <string>
#include <vector>

/**
 * @brief WCAG 2.x luminance and contrast helpers.
 *
 * All functions are pure and never throw.
 */
class ContrastValidator
{
public:
    /// WCAG AA threshold for body text
    static constexpr double MIN_BODY_TEXT_RATIO = 4.5;
    /// Below this the two colours are practically indistinguishable
    static constexpr double SIMILAR_COLORS_RATIO = 1.5;
    /// Luminance midpoint separating "light" from "dark"
    static constexpr double POLARITY_MIDPOINT = 0.5;

    /**
     * @brief sRGB relative luminance in [0, 1]
     */
    static double relativeLuminance(const RgbColor &color);

    /**
     * @brief Relative luminance of a raw 8-bit triple
     */
    static double relativeLuminance(uint8_t r, uint8_t g, uint8_t b);

    /**
     * @brief (L1 + 0.05) / (L2 + 0.05) with L1 the lighter colour; in [1, 21]
     */
    static double contrastRatio(const RgbColor &a, const RgbColor &b);

    /**
     * @brief One warning if the pair falls below the AA body-text ratio, none otherwise
     */
    static std::vector<std::string> validate(const RgbColor &foreground, const RgbColor &background);

    /**
     * @brief True if the colour classifies as light (luminance >= 0.5)
     */
    static bool isLight(const RgbColor &color);

    /**
     * @brief Linearised sRGB channel value for an 8-bit input
     */
    static double linearize(uint8_t channel);
};
