// SPDX-License-Identifier: MIT
#include "ColorPalette.hh"

#include <glow/common/log.hh>

#include <ColorUtil.h>

using namespace BeatMotion;

ColorPalette ColorPalette::fromEntries(const std::vector<PaletteEntry>& entries) {
    std::vector<uint32_t> colors;
    colors.reserve(entries.size());
    for (const auto& entry : entries) {
        if (auto packed = std::get_if<uint32_t>(&entry)) {
            colors.push_back(*packed & 0xFFFFFF);
            continue;
        }
        const auto& text = std::get<std::string>(entry);
        if (auto parsed = ColorUtil::parseHex(text)) {
            colors.push_back(*parsed);
        } else {
            glow::warning() << "Cannot parse palette color \"" << text << "\", using gray";
            colors.push_back(ColorUtil::defaultGray);
        }
    }
    return ColorPalette(std::move(colors));
}

std::optional<tg::color3> ColorPalette::colorAt(std::optional<int> index) const {
    if (!index || *index < 0 || std::size_t(*index) >= mColors.size()) {
        return std::nullopt;
    }
    return ColorUtil::unpackRGB(mColors[*index]);
}
