// SPDX-License-Identifier: MIT
#pragma once
#include <memory>
#include <vector>

#include <typed-geometry/tg-lean.hh>

#include <animation/AnimatorManager.hh>
#include <fwd.hh>

namespace Demo {

struct Instance {
    tg::pos3 basePosition;
    std::shared_ptr<BeatMotion::TransformAnimator> animator;
};

/// A tiny headless level: a few moving platforms sharing one palette and tempo.
class System final {
    float mBpm;
    std::shared_ptr<const BeatMotion::ColorPalette> mPalette;
    BeatMotion::AnimatorManager mAnimators;
    std::vector<Instance> mInstances;

public:
    explicit System(float bpm);

    void addPlatform(tg::pos3 basePos, BeatMotion::AnimatorConfig config);
    void update(float deltaSeconds);
    void logState() const;

    const std::vector<Instance>& instances() const { return mInstances; }
};

// elevator bouncing on the beat, closed loop
BeatMotion::AnimatorConfig elevatorConfig();
// spinning, pulsing platform cycling through palette colors
BeatMotion::AnimatorConfig spinnerConfig();

}
