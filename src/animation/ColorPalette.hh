// SPDX-License-Identifier: MIT
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <typed-geometry/types/color.hh>

namespace BeatMotion {

// packed 0xRRGGBB or its hex string form
using PaletteEntry = std::variant<uint32_t, std::string>;

/// Level-wide ordered color list, shared read-only by every animator of a level.
class ColorPalette {
    std::vector<uint32_t> mColors;

public:
    ColorPalette() = default;
    explicit ColorPalette(std::vector<uint32_t> colors) : mColors{std::move(colors)} {}

    /// Unparsable strings become ColorUtil::defaultGray.
    static ColorPalette fromEntries(const std::vector<PaletteEntry>& entries);

    std::size_t size() const { return mColors.size(); }
    bool empty() const { return mColors.empty(); }
    uint32_t packedAt(std::size_t idx) const { return mColors.at(idx); }

    /// No color for a missing, negative or out-of-range index.
    std::optional<tg::color3> colorAt(std::optional<int> index) const;
};

}
