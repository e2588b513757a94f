// SPDX-License-Identifier: MIT
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <typed-geometry/tg-lean.hh>

namespace BeatMotion {

// omitted | catalog name | custom [x1, y1, x2, y2]
using CurveSpec = std::variant<std::monostate, std::string, std::vector<float>>;

/// Cubic bezier timing curve through (0,0), p1, p2, (1,1).
/// x of both control points is clamped to [0,1], y is free so curves may overshoot.
struct AnimationEasing
{
private:
    tg::vec2 mP1;
    tg::vec2 mP2;

    // polynomial coefficients, x and y packed into one vec2 each
    tg::vec2 mA;
    tg::vec2 mB;
    tg::vec2 mC;

    float solveForX(float x) const;

public:
    static constexpr int newtonIterations = 8;

    static const AnimationEasing linear;
    static const AnimationEasing easeInOut;
    static const AnimationEasing easeOutQuart;
    static const AnimationEasing easeOutBack;

    AnimationEasing(tg::vec2 p1, tg::vec2 p2);
    AnimationEasing(float x1, float y1, float x2, float y2) : AnimationEasing(tg::vec2(x1, y1), tg::vec2(x2, y2)) {}

    float ease(float t) const;

    tg::vec2 p1() const { return mP1; }
    tg::vec2 p2() const { return mP2; }

    // curve used when nothing (or nothing usable) is configured
    static const AnimationEasing& defaultCurve() { return easeOutQuart; }

    static std::optional<AnimationEasing> byName(std::string_view name);
    static std::vector<std::string_view> catalogNames();

    /// Never fails: unknown names and malformed arrays fall back to defaultCurve().
    static AnimationEasing fromSpec(const CurveSpec& spec);
};

}
