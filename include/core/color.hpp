#pragma once

#include <cstdint>
#include <string>

/**
 * @brief 8-bit sRGB colour triple
 */
struct RgbColor
{
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;

    RgbColor() = default;
    RgbColor(uint8_t red, uint8_t green, uint8_t blue) : r(red), g(green), b(blue) {}

    /**
     * @brief Parse "#RRGGBB" or "RRGGBB" (case-insensitive)
     * @throws ConfigError on empty input, wrong length or non-hex digits
     */
    static RgbColor fromHex(const std::string &hex);

    /**
     * @brief Format as six upper-case hex digits
     * @param with_hash Prefix the result with '#'
     */
    std::string toHex(bool with_hash = true) const;

    bool operator==(const RgbColor &other) const { return r == other.r && g == other.g && b == other.b; }
    bool operator!=(const RgbColor &other) const { return !(*this == other); }
};
