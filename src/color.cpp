#include "core/color.hpp"
#include "core/inversion_config.hpp"
#include <cctype>
#include <iomanip>
#include <sstream>

RgbColor RgbColor::fromHex(const std::string &hex)
{
    if (hex.empty())
    {
        throw ConfigError("Hex color cannot be empty");
    }

    std::string digits = hex[0] == '#' ? hex.substr(1) : hex;
    if (digits.size() != 6)
    {
        throw ConfigError("Hex color must be exactly 6 characters (got " + std::to_string(digits.size()) +
                          "). Example: #FF0000 or FF0000");
    }

    for (char c : digits)
    {
        if (!std::isxdigit(static_cast<unsigned char>(c)))
        {
            throw ConfigError("Invalid hex color '" + digits +
                              "'. Must contain only hex digits (0-9, A-F). Example: #FF0000");
        }
    }

    auto channel = [&digits](size_t offset)
    {
        return static_cast<uint8_t>(std::stoul(digits.substr(offset, 2), nullptr, 16));
    };
    return RgbColor(channel(0), channel(2), channel(4));
}

std::string RgbColor::toHex(bool with_hash) const
{
    std::ostringstream ss;
    if (with_hash)
        ss << '#';
    ss << std::uppercase << std::hex << std::setfill('0')
       << std::setw(2) << static_cast<int>(r)
       << std::setw(2) << static_cast<int>(g)
       << std::setw(2) << static_cast<int>(b);
    return ss.str();
}
