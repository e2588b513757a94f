// SPDX-License-Identifier: MIT
#include <catch2/catch.hpp>

#include <animation/Pose.hh>

using namespace BeatMotion;

TEST_CASE("default pose is the identity transform without color")
{
    Pose pose;
    CHECK(pose.translate == tg::vec3(0, 0, 0));
    CHECK(pose.scale == tg::vec3(1, 1, 1));
    CHECK(pose.rotate == tg::vec3(0, 0, 0));
    CHECK_FALSE(pose.colorIndex.has_value());
}

TEST_CASE("mergePose only replaces the given axes")
{
    Pose base;
    base.translate = tg::vec3(1, 2, 3);
    base.scale = tg::vec3(2, 2, 2);
    base.colorIndex = 4;

    PartialPose override;
    override.translate.y = 10;
    override.scale.z = 0.5f;
    override.rotate.x = 1.5f;

    auto merged = mergePose(base, override);
    CHECK(merged.translate == tg::vec3(1, 10, 3));
    CHECK(merged.scale == tg::vec3(2, 2, 0.5f));
    CHECK(merged.rotate == tg::vec3(1.5f, 0, 0));
    CHECK(merged.colorIndex == 4);
}

TEST_CASE("mergePose replaces the color only when given")
{
    Pose base;
    base.colorIndex = 1;

    PartialPose override;
    override.colorIndex = 3;
    CHECK(mergePose(base, override).colorIndex == 3);
    CHECK(mergePose(Pose(), PartialPose()).colorIndex == std::nullopt);
}

TEST_CASE("empty override leaves the pose unchanged")
{
    Pose base;
    base.rotate = tg::vec3(0.1f, 0.2f, 0.3f);
    CHECK(mergePose(base, PartialPose()) == base);
}

TEST_CASE("pose components are addressable by transform type")
{
    Pose pose;
    pose[TransformType::Rotate] = tg::vec3(0, 3, 0);
    pose[TransformType::Translate] = tg::vec3(5, 0, 0);
    pose[TransformType::Scale].z = 2;
    CHECK(pose.rotate.y == 3.f);
    CHECK(pose.translate.x == 5.f);
    CHECK(pose.scale.z == 2.f);
    CHECK(pose.translate.y == 0.f);
    const Pose& view = pose;
    CHECK(view[TransformType::Scale] == tg::vec3(1, 1, 2));
    CHECK(view[TransformType::Translate] == tg::vec3(5, 0, 0));
    CHECK(view[TransformType::Rotate] == tg::vec3(0, 3, 0));
}

TEST_CASE("interpolateAxes is linear and unclamped")
{
    tg::vec3 from(0, 2, -4);
    tg::vec3 to(10, 2, 4);
    CHECK(interpolateAxes(from, to, 0.f) == from);
    CHECK(interpolateAxes(from, to, 1.f) == to);
    CHECK(interpolateAxes(from, to, 0.5f) == tg::vec3(5, 2, 0));
    CHECK(interpolateAxes(from, to, 1.5f).x == Approx(15.f));
    CHECK(interpolateAxes(from, to, -0.25f).z == Approx(-6.f));
}
