// SPDX-License-Identifier: MIT
#pragma once

#include <optional>

#include <typed-geometry/tg-lean.hh>

namespace BeatMotion {

enum class TransformType : int {Translate, Scale, Rotate};

/// Fully resolved transform snapshot. Rotation is euler angles in radians.
struct Pose
{
    tg::vec3 translate = tg::vec3::zero;
    tg::vec3 scale = tg::vec3(1, 1, 1);
    tg::vec3 rotate = tg::vec3::zero;
    std::optional<int> colorIndex;

    tg::vec3& operator[](TransformType type);
    const tg::vec3& operator[](TransformType type) const;

    bool operator==(const Pose& other) const;
    bool operator!=(const Pose& other) const { return !(*this == other); }
};

struct PartialVec3
{
    std::optional<float> x;
    std::optional<float> y;
    std::optional<float> z;
};

/// Pose as authored in level data: any axis may be left out.
struct PartialPose
{
    PartialVec3 translate;
    PartialVec3 scale;
    PartialVec3 rotate;
    std::optional<int> colorIndex;
};

tg::vec3 mergeAxes(tg::vec3 base, const PartialVec3& override);

/// Total merge: every axis missing in override keeps the value from base,
/// a missing colorIndex keeps base's colorIndex.
Pose mergePose(const Pose& base, const PartialPose& override);

/// from + (to - from) * t per axis, t is not clamped
tg::vec3 interpolateAxes(tg::vec3 from, tg::vec3 to, float t);

}
