#include "core/contrast_validator.hpp"
#include <algorithm>
#include <array>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace
{
    std::array<double, 256> buildLinearTable()
    {
        std::array<double, 256> table{};
        for (int i = 0; i < 256; ++i)
        {
            double c = i / 255.0;
            table[i] = c <= 0.04045 ? c / 12.92 : std::pow((c + 0.055) / 1.055, 2.4);
        }
        return table;
    }

    std::string formatRatio(double ratio)
    {
        std::ostringstream ss;
        ss << std::fixed << std::setprecision(1) << ratio;
        return ss.str();
    }
}

double ContrastValidator::linearize(uint8_t channel)
{
    static const std::array<double, 256> table = buildLinearTable();
    return table[channel];
}

double ContrastValidator::relativeLuminance(uint8_t r, uint8_t g, uint8_t b)
{
    double luminance = 0.2126 * linearize(r) + 0.7152 * linearize(g) + 0.0722 * linearize(b);
    return std::clamp(luminance, 0.0, 1.0);
}

double ContrastValidator::relativeLuminance(const RgbColor &color)
{
    return relativeLuminance(color.r, color.g, color.b);
}

double ContrastValidator::contrastRatio(const RgbColor &a, const RgbColor &b)
{
    double la = relativeLuminance(a);
    double lb = relativeLuminance(b);
    double lighter = std::max(la, lb);
    double darker = std::min(la, lb);
    return (lighter + 0.05) / (darker + 0.05);
}

std::vector<std::string> ContrastValidator::validate(const RgbColor &foreground, const RgbColor &background)
{
    std::vector<std::string> warnings;
    double ratio = contrastRatio(foreground, background);

    if (ratio < SIMILAR_COLORS_RATIO)
    {
        warnings.push_back("Colors are very similar (contrast ratio: " + formatRatio(ratio) +
                           "). Text may be difficult to read. Consider using more contrasting colors.");
    }
    else if (ratio < MIN_BODY_TEXT_RATIO)
    {
        warnings.push_back("Contrast ratio is " + formatRatio(ratio) +
                           ". WCAG AA recommends at least 4.5:1 for normal text. "
                           "Consider using colors with more contrast.");
    }

    return warnings;
}

bool ContrastValidator::isLight(const RgbColor &color)
{
    return relativeLuminance(color) >= POLARITY_MIDPOINT;
}
