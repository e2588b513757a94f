// SPDX-License-Identifier: MIT
#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "AnimationEasing.hh"
#include "Pose.hh"

namespace BeatMotion {

struct PerTypeEasingSpec
{
    CurveSpec translate;
    CurveSpec scale;
    CurveSpec rotate;
};

// one curve for all transform types, or one per type
using EasingSpec = std::variant<std::monostate, std::string, std::vector<float>, PerTypeEasingSpec>;

struct TransitionSpec
{
    std::optional<float> beats;
    EasingSpec easing;
    PartialPose transforms;
};

struct TransformEasings
{
    AnimationEasing translate = AnimationEasing::defaultCurve();
    AnimationEasing scale = AnimationEasing::defaultCurve();
    AnimationEasing rotate = AnimationEasing::defaultCurve();

    const AnimationEasing& operator[](TransformType type) const;

    static TransformEasings fromSpec(const EasingSpec& spec);
};

struct Transition
{
    float duration;
    TransformEasings easings;
    Pose targetPose;
};

/// Resolves specs in order, folding (baseline pose, running color) across them:
/// each target is the previous target with this transition's overrides merged on top.
/// Throws ConfigurationError for a non-positive or non-finite beat count.
std::vector<Transition> resolveTransitions(const Pose& startPose, const std::vector<TransitionSpec>& specs, float secondsPerBeat);

}
