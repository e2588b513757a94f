// SPDX-License-Identifier: MIT
#include "Transition.hh"

#include <cmath>
#include <utility>

#include "ConfigurationError.hh"

using namespace BeatMotion;

namespace {

CurveSpec curveOf(const EasingSpec& spec) {
    if (auto name = std::get_if<std::string>(&spec)) {
        return *name;
    }
    if (auto points = std::get_if<std::vector<float>>(&spec)) {
        return *points;
    }
    return std::monostate{};
}

struct Baseline {
    Pose pose;
    std::optional<int> colorIndex;
};

}

const AnimationEasing& TransformEasings::operator[](TransformType type) const {
    switch (type) {
    case TransformType::Translate: return translate;
    case TransformType::Scale: return scale;
    case TransformType::Rotate: return rotate;
    }
    return translate;
}

TransformEasings TransformEasings::fromSpec(const EasingSpec& spec) {
    if (auto perType = std::get_if<PerTypeEasingSpec>(&spec)) {
        return {AnimationEasing::fromSpec(perType->translate),
                AnimationEasing::fromSpec(perType->scale),
                AnimationEasing::fromSpec(perType->rotate)};
    }
    auto curve = AnimationEasing::fromSpec(curveOf(spec));
    return {curve, curve, curve};
}

std::vector<Transition> BeatMotion::resolveTransitions(const Pose& startPose, const std::vector<TransitionSpec>& specs, float secondsPerBeat) {
    std::vector<Transition> transitions;
    transitions.reserve(specs.size());

    Baseline baseline{startPose, startPose.colorIndex};
    for (std::size_t i = 0; i < specs.size(); i++) {
        const auto& spec = specs[i];

        float beats = spec.beats.value_or(1.f);
        float duration = beats * secondsPerBeat;
        if (!std::isfinite(duration) || !(beats > 0) || !(duration > 0)) {
            throw ConfigurationError("beats must be a positive number, got " + std::to_string(beats), i);
        }

        if (spec.transforms.colorIndex) {
            baseline.colorIndex = spec.transforms.colorIndex;
        }

        Transition transition;
        transition.duration = duration;
        transition.easings = TransformEasings::fromSpec(spec.easing);
        transition.targetPose = mergePose(baseline.pose, spec.transforms);
        transition.targetPose.colorIndex = baseline.colorIndex;

        baseline.pose = transition.targetPose;
        transitions.emplace_back(std::move(transition));
    }
    return transitions;
}
