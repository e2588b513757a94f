// SPDX-License-Identifier: MIT
#include <catch2/catch.hpp>

#include <memory>
#include <string>

#include <animation/AnimatorManager.hh>
#include <demo/Demo.hh>

using namespace BeatMotion;

namespace {
AnimatorConfig riseConfig()
{
    AnimatorConfig config;
    TransitionSpec rise;
    rise.beats = 2;
    rise.easing = std::string("linear");
    rise.transforms.translate.y = 3;
    config.transitions = {rise};
    return config;
}
}

TEST_CASE("manager advances every started animator")
{
    AnimatorManager manager;
    auto first = std::make_shared<TransformAnimator>(riseConfig());
    auto second = std::make_shared<TransformAnimator>(riseConfig());
    manager.start(first);
    manager.start(second);
    CHECK(manager.activeCount() == 2);

    manager.updateAllAnimators(0.5f);
    CHECK(first->currentInterpolatedPose().translate.y == 1.5f);
    CHECK(second->currentInterpolatedPose().translate.y == 1.5f);

    manager.stop(second);
    CHECK(manager.activeCount() == 1);
    CHECK(second->elapsedTime() == 0.f);

    manager.updateAllAnimators(0.25f);
    CHECK(first->elapsedTime() == 0.75f);
    CHECK(second->elapsedTime() == 0.f);
}

TEST_CASE("starting an animator rewinds it")
{
    AnimatorManager manager;
    auto animator = std::make_shared<TransformAnimator>(riseConfig());
    animator->advance(0.5f);
    manager.start(animator);
    CHECK(animator->progress() == 0.f);
    manager.clear();
    CHECK(manager.activeCount() == 0);
}

TEST_CASE("demo level animates its platforms")
{
    Demo::System demo(128.f);
    demo.addPlatform(tg::pos3(0, 0, 0), Demo::elevatorConfig());
    demo.addPlatform(tg::pos3(6, 2, 0), Demo::spinnerConfig());
    REQUIRE(demo.instances().size() == 2);

    for (int i = 0; i < 120; i++)
    {
        demo.update(1.f / 60.f);
    }
    demo.logState();

    for (const auto& inst : demo.instances())
    {
        CHECK(inst.animator->secondsPerBeat() == Approx(60.f / 128.f));
        CHECK(inst.animator->elapsedTime() == Approx(2.f).margin(1e-3));
        CHECK(inst.animator->currentColor().has_value());
    }
}
