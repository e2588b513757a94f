// SPDX-License-Identifier: MIT
#include <catch2/catch.hpp>

#include <string>
#include <vector>

#include <ColorUtil.h>
#include <animation/ColorPalette.hh>

using namespace BeatMotion;

TEST_CASE("hex strings parse with and without prefix")
{
    CHECK(ColorUtil::parseHex("0xff6b6b") == uint32_t(0xff6b6b));
    CHECK(ColorUtil::parseHex("0XFF6B6B") == uint32_t(0xff6b6b));
    CHECK(ColorUtil::parseHex("4ecdc4") == uint32_t(0x4ecdc4));
    CHECK_FALSE(ColorUtil::parseHex("").has_value());
    CHECK_FALSE(ColorUtil::parseHex("0x").has_value());
    CHECK_FALSE(ColorUtil::parseHex("purple").has_value());
    CHECK_FALSE(ColorUtil::parseHex("0x1234567").has_value());
}

TEST_CASE("packed colors unpack to unit range channels")
{
    auto color = ColorUtil::unpackRGB(0xff8000);
    CHECK(color.r == 1.f);
    CHECK(color.g == Approx(128.f / 255.f));
    CHECK(color.b == 0.f);
}

TEST_CASE("palette entries may mix numbers and strings")
{
    auto palette = ColorPalette::fromEntries({uint32_t(0x112233), std::string("0x445566"), std::string("not a color")});
    REQUIRE(palette.size() == 3);
    CHECK(palette.packedAt(0) == 0x112233);
    CHECK(palette.packedAt(1) == 0x445566);
    CHECK(palette.packedAt(2) == ColorUtil::defaultGray);
}

TEST_CASE("missing palette indices yield no color")
{
    ColorPalette palette(std::vector<uint32_t>{0x0000ff});
    CHECK(palette.colorAt(0).has_value());
    CHECK(palette.colorAt(0)->b == 1.f);
    CHECK_FALSE(palette.colorAt(std::nullopt).has_value());
    CHECK_FALSE(palette.colorAt(-1).has_value());
    CHECK_FALSE(palette.colorAt(1).has_value());
    CHECK_FALSE(ColorPalette().colorAt(0).has_value());
}
