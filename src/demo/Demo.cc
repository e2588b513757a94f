// SPDX-License-Identifier: MIT
#include "Demo.hh"

#include <string>
#include <utility>

#include <glow/common/log.hh>
#include <typed-geometry/tg-std.hh>
#include <typed-geometry/tg.hh>

#include <MathUtil.hh>
#include <animation/ColorPalette.hh>
#include <animation/TransformAnimator.hh>

using namespace Demo;
using namespace BeatMotion;

System::System(float bpm) : mBpm{bpm}
{
    mPalette = std::make_shared<const ColorPalette>(ColorPalette::fromEntries({
        uint32_t(0xff6b6b),
        std::string("0x4ecdc4"),
        std::string("FFE66D"),
    }));
}

void System::addPlatform(tg::pos3 basePos, AnimatorConfig config)
{
    config.bpm = mBpm;
    auto animator = std::make_shared<TransformAnimator>(config, mPalette);
    mAnimators.start(animator);
    mInstances.push_back({basePos, std::move(animator)});
}

void System::update(float deltaSeconds)
{
    mAnimators.updateAllAnimators(deltaSeconds);
}

void System::logState() const
{
    for (size_t i = 0; i < mInstances.size(); i++) {
        const auto& inst = mInstances[i];
        auto pose = inst.animator->currentInterpolatedPose();
        auto world = Util::poseMatrix(inst.basePosition, pose);
        auto color = inst.animator->currentColor().value_or(tg::color3(0, 0, 0));
        glow::info() << "platform " << i
                     << " beat " << inst.animator->currentBeat()
                     << " pos " << tg::pos3(world[3])
                     << " scale " << pose.scale
                     << " rot " << pose.rotate
                     << " color " << pose.colorIndex.value_or(-1) << " " << color;
    }
}

AnimatorConfig Demo::elevatorConfig()
{
    AnimatorConfig config;
    config.startState.colorIndex = 0;

    TransitionSpec up;
    up.beats = 2;
    up.easing = std::string("easeInOutCubic");
    up.transforms.translate.y = 4;

    TransitionSpec hold;
    hold.beats = 1;
    hold.easing = std::string("linear");
    hold.transforms.colorIndex = 1;

    TransitionSpec down;
    down.beats = 1;
    down.easing = std::string("easeOutBack");
    down.transforms.translate.y = 0;
    down.transforms.colorIndex = 0;

    config.transitions = {up, hold, down};
    return config;
}

AnimatorConfig Demo::spinnerConfig()
{
    AnimatorConfig config;
    config.startState.scale.x = 2;
    config.startState.scale.z = 2;

    TransitionSpec spin;
    spin.beats = 4;
    spin.easing = PerTypeEasingSpec{std::string("linear"), std::string("easeOutBack"), std::vector<float>{0.25f, 0.1f, 0.25f, 1.f}};
    spin.transforms.rotate.y = tg::pi_scalar<float>;
    spin.transforms.scale.x = 3;
    spin.transforms.colorIndex = 2;

    TransitionSpec settle;
    settle.beats = 2;
    settle.transforms.rotate.y = 2 * tg::pi_scalar<float>;
    settle.transforms.scale.x = 2;

    config.transitions = {spin, settle};
    config.remainder = RemainderPolicy::Carry;
    return config;
}
