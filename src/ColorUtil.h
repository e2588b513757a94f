// SPDX-License-Identifier: MIT
#pragma once
#include <charconv>
#include <cstdint>
#include <optional>
#include <string_view>
#include <typed-geometry/types/color.hh>
namespace ColorUtil
{
constexpr uint32_t defaultGray = 0x808080;

inline tg::color3 unpackRGB(uint32_t value)
{
    return tg::color3(
        float((value >> 16) & 0xFF) / 255.f,
        float((value >> 8) & 0xFF) / 255.f,
        float((value >> 0) & 0xFF) / 255.f
    );
}

// accepts "0xff6b6b", "0XFF6B6B" and "ff6b6b"
inline std::optional<uint32_t> parseHex(std::string_view text)
{
    if (text.size() > 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X'))
    {
        text.remove_prefix(2);
    }
    uint32_t value = 0;
    auto [end, err] = std::from_chars(text.data(), text.data() + text.size(), value, 16);
    if (err != std::errc() || end != text.data() + text.size() || value > 0xFFFFFF)
    {
        return std::nullopt;
    }
    return value;
}
}
