// SPDX-License-Identifier: MIT
#pragma once

namespace BeatMotion {
    struct AnimationEasing;
    struct AnimatorConfig;
    class AnimatorManager;
    class ColorPalette;
    struct Pose;
    struct PartialPose;
    class TransformAnimator;
    struct Transition;
    struct TransitionSpec;
}

namespace Demo {
    struct Instance;
    class System;
}
