// SPDX-License-Identifier: MIT
#include "TransformAnimator.hh"

#include <cmath>
#include <utility>

#include <glow/common/log.hh>
#include <typed-geometry/tg.hh>

#include "ConfigurationError.hh"

using namespace BeatMotion;

static float secondsPerBeatFor(float bpm) {
    if (!std::isfinite(bpm) || bpm <= 0) {
        throw ConfigurationError("bpm must be a positive number, got " + std::to_string(bpm));
    }
    return 60.f / bpm;
}

TransformAnimator::TransformAnimator(const AnimatorConfig& config, std::shared_ptr<const ColorPalette> palette)
  : mSecondsPerBeat{secondsPerBeatFor(config.bpm)},
    mStartPose{mergePose(Pose(), config.startState)},
    mTransitions{resolveTransitions(mStartPose, config.transitions, mSecondsPerBeat)},
    mRemainder{config.remainder},
    mPalette{std::move(palette)}
{
    reset();
    glow::info() << "transform animator with " << mTransitions.size() << " transitions at " << config.bpm << " bpm";
}

void TransformAnimator::reset() {
    mCurrentTransitionIdx = 0;
    mProgress = 0.f;
    mCurrentPose = mStartPose;
    mColorIndex = mStartPose.colorIndex;
    mElapsedTime = 0.f;
}

float TransformAnimator::cycleDuration() const {
    float total = 0.f;
    for (const auto& transition : mTransitions) {
        total += transition.duration;
    }
    return total;
}

void TransformAnimator::completeTransition() {
    const auto& completed = mTransitions[mCurrentTransitionIdx];
    mCurrentTransitionIdx++;

    if (mCurrentTransitionIdx >= mTransitions.size()) {
        // close the loop
        mCurrentTransitionIdx = 0;
        mCurrentPose = mStartPose;
    } else {
        mCurrentPose = completed.targetPose;
    }

    // colors switch instantly when the next transition begins
    const auto& next = mTransitions[mCurrentTransitionIdx];
    if (next.targetPose.colorIndex) {
        mColorIndex = next.targetPose.colorIndex;
    }
}

void TransformAnimator::advance(float deltaSeconds) {
    if (isInert() || !std::isfinite(deltaSeconds) || deltaSeconds <= 0) {
        return;
    }

    mElapsedTime += deltaSeconds;
    float duration = mTransitions[mCurrentTransitionIdx].duration;
    float progressBefore = mProgress;
    mProgress += deltaSeconds / duration;
    if (mProgress < 1.f) {
        return;
    }

    if (mRemainder == RemainderPolicy::Discard) {
        mProgress = 0.f;
        completeTransition();
        return;
    }

    // seconds left over once the current transition is finished
    float excess = tg::max(0.f, deltaSeconds - (1.f - progressBefore) * duration);
    mProgress = 0.f;
    completeTransition();

    // past one full cycle the sequence repeats, so only the remainder matters
    float cycle = cycleDuration();
    if (excess > cycle) {
        excess = cycle + std::fmod(excess - cycle, cycle);
    }
    while (excess >= mTransitions[mCurrentTransitionIdx].duration) {
        excess -= mTransitions[mCurrentTransitionIdx].duration;
        completeTransition();
    }
    mProgress = excess / mTransitions[mCurrentTransitionIdx].duration;
}

Pose TransformAnimator::currentInterpolatedPose() const {
    if (isInert()) {
        return mStartPose;
    }

    const auto& transition = mTransitions[mCurrentTransitionIdx];
    Pose result;
    for (auto type : {TransformType::Translate, TransformType::Scale, TransformType::Rotate}) {
        float easedT = transition.easings[type].ease(mProgress);
        result[type] = interpolateAxes(mCurrentPose[type], transition.targetPose[type], easedT);
    }
    result.colorIndex = mColorIndex;
    return result;
}

std::optional<tg::color3> TransformAnimator::currentColor() const {
    if (!mPalette) {
        return std::nullopt;
    }
    return mPalette->colorAt(mColorIndex);
}
