// SPDX-License-Identifier: MIT
#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <vector>

#include <typed-geometry/types/color.hh>

#include "ColorPalette.hh"
#include "Pose.hh"
#include "Transition.hh"

namespace BeatMotion {

enum class RemainderPolicy : int {
    Discard, // overshoot past a transition boundary is dropped, one boundary per advance
    Carry    // overshoot flows into the following transitions
};

struct AnimatorConfig
{
    float bpm = 120;
    PartialPose startState;
    std::vector<TransitionSpec> transitions;
    RemainderPolicy remainder = RemainderPolicy::Discard;
};

class AbstractAnimator {
public:
    virtual ~AbstractAnimator() {}
    virtual void advance(float deltaSeconds) = 0;
    virtual void reset() = 0;
};

/// Beat-synchronized, endlessly looping pose animation of one level object.
///
/// The start pose and transitions are resolved once at construction. Each
/// transition interpolates from the pose the previous one ended in toward its
/// own target; finishing the last one snaps back to the start pose. Color
/// indices switch discretely at transition boundaries.
class TransformAnimator final : public AbstractAnimator {
    float mSecondsPerBeat;
    Pose mStartPose;
    std::vector<Transition> mTransitions;
    RemainderPolicy mRemainder;
    std::shared_ptr<const ColorPalette> mPalette;

    std::size_t mCurrentTransitionIdx = 0;
    float mProgress = 0.f;
    Pose mCurrentPose;
    std::optional<int> mColorIndex;
    float mElapsedTime = 0.f;

    void completeTransition();

public:
    /// Throws ConfigurationError for a non-positive bpm or beat count.
    explicit TransformAnimator(const AnimatorConfig& config, std::shared_ptr<const ColorPalette> palette = nullptr);

    void advance(float deltaSeconds) override;
    void reset() override;

    Pose currentInterpolatedPose() const;
    std::optional<tg::color3> currentColor() const;

    bool isInert() const { return mTransitions.empty(); }
    float secondsPerBeat() const { return mSecondsPerBeat; }
    float currentBeat() const { return mElapsedTime / mSecondsPerBeat; }
    float cycleDuration() const;

    const Pose& startPose() const { return mStartPose; }
    const std::vector<Transition>& transitions() const { return mTransitions; }
    std::size_t currentTransitionIndex() const { return mCurrentTransitionIdx; }
    float progress() const { return mProgress; }
    const Pose& currentPose() const { return mCurrentPose; }
    std::optional<int> colorIndex() const { return mColorIndex; }
    float elapsedTime() const { return mElapsedTime; }
};

}
