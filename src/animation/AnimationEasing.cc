// SPDX-License-Identifier: MIT
#include "AnimationEasing.hh"

#include <cmath>

#include <glow/common/log.hh>
#include <typed-geometry/tg.hh>

using namespace BeatMotion;

namespace {

struct NamedCurve {
    const char* name;
    float x1, y1, x2, y2;
};

// CSS / Penner approximations
constexpr NamedCurve namedCurves[] = {
    {"linear", 0.f, 0.f, 1.f, 1.f},
    {"easeIn", 0.42f, 0.f, 1.f, 1.f},
    {"easeOut", 0.f, 0.f, 0.58f, 1.f},
    {"easeInOut", 0.42f, 0.f, 0.58f, 1.f},
    {"easeInQuad", 0.55f, 0.085f, 0.68f, 0.53f},
    {"easeOutQuad", 0.25f, 0.46f, 0.45f, 0.94f},
    {"easeInOutQuad", 0.455f, 0.03f, 0.515f, 0.955f},
    {"easeInCubic", 0.55f, 0.055f, 0.675f, 0.19f},
    {"easeOutCubic", 0.215f, 0.61f, 0.355f, 1.f},
    {"easeInOutCubic", 0.645f, 0.045f, 0.355f, 1.f},
    {"easeInQuart", 0.895f, 0.03f, 0.685f, 0.22f},
    {"easeOutQuart", 0.165f, 0.84f, 0.44f, 1.f},
    {"easeInOutQuart", 0.77f, 0.f, 0.175f, 1.f},
    {"easeInBack", 0.6f, -0.28f, 0.735f, 0.045f},
    {"easeOutBack", 0.175f, 0.885f, 0.32f, 1.275f},
    {"easeInOutBack", 0.68f, -0.55f, 0.265f, 1.55f},
};

// ((a * t + b) * t + c) * t
inline float polynomial(float t, float a, float b, float c) {
    return ((a * t + b) * t + c) * t;
}

inline float derivative(float t, float a, float b, float c) {
    return (3 * a * t + 2 * b) * t + c;
}

const NamedCurve* findCurve(std::string_view name) {
    for (const auto& curve : namedCurves) {
        if (name == curve.name) {
            return &curve;
        }
    }
    return nullptr;
}

// only called with names from the table above
AnimationEasing catalogCurve(std::string_view name) {
    const NamedCurve* curve = findCurve(name);
    return AnimationEasing(curve->x1, curve->y1, curve->x2, curve->y2);
}

}

const AnimationEasing AnimationEasing::linear(catalogCurve("linear"));
const AnimationEasing AnimationEasing::easeInOut(catalogCurve("easeInOut"));
const AnimationEasing AnimationEasing::easeOutQuart(catalogCurve("easeOutQuart"));
const AnimationEasing AnimationEasing::easeOutBack(catalogCurve("easeOutBack"));

AnimationEasing::AnimationEasing(tg::vec2 p1, tg::vec2 p2) : mP1{p1}, mP2{p2} {
    if (mP1.x < 0 || mP1.x > 1 || mP2.x < 0 || mP2.x > 1) {
        glow::warning() << "bezier x control points must lie in [0, 1], clamping " << mP1.x << ", " << mP2.x;
        mP1.x = tg::clamp(mP1.x, 0.f, 1.f);
        mP2.x = tg::clamp(mP2.x, 0.f, 1.f);
    }

    mC = 3.f * mP1;
    mB = 3.f * (mP2 - mP1) - mC;
    mA = tg::vec2(1, 1) - mC - mB;
}

float AnimationEasing::solveForX(float x) const {
    // bezier x(u) is monotonic for x control points in [0,1], seed at u = x
    float u = x;
    for (int i = 0; i < newtonIterations; i++) {
        float slope = derivative(u, mA.x, mB.x, mC.x);
        if (tg::abs(slope) < 1e-6f) {
            break;
        }
        u -= (polynomial(u, mA.x, mB.x, mC.x) - x) / slope;
    }
    return u;
}

float AnimationEasing::ease(float t) const {
    if (t == 0.f) {
        return 0.f;
    }
    if (t == 1.f) {
        return 1.f;
    }
    return polynomial(solveForX(t), mA.y, mB.y, mC.y);
}

std::optional<AnimationEasing> AnimationEasing::byName(std::string_view name) {
    if (const NamedCurve* curve = findCurve(name)) {
        return AnimationEasing(curve->x1, curve->y1, curve->x2, curve->y2);
    }
    return std::nullopt;
}

std::vector<std::string_view> AnimationEasing::catalogNames() {
    std::vector<std::string_view> names;
    for (const auto& curve : namedCurves) {
        names.emplace_back(curve.name);
    }
    return names;
}

AnimationEasing AnimationEasing::fromSpec(const CurveSpec& spec) {
    if (auto name = std::get_if<std::string>(&spec)) {
        if (auto curve = byName(*name)) {
            return *curve;
        }
        glow::warning() << "Unknown easing \"" << *name << "\", using easeOutQuart";
        return defaultCurve();
    }

    if (auto points = std::get_if<std::vector<float>>(&spec)) {
        bool finite = true;
        for (float p : *points) {
            finite = finite && std::isfinite(p);
        }
        if (points->size() == 4 && finite) {
            return AnimationEasing((*points)[0], (*points)[1], (*points)[2], (*points)[3]);
        }
        glow::warning() << "Invalid easing control points (" << points->size() << " values), using easeOutQuart";
        return defaultCurve();
    }

    return defaultCurve();
}
