// SPDX-License-Identifier: MIT
#include <catch2/catch.hpp>

#include <MathUtil.hh>

using BeatMotion::Pose;

TEST_CASE("identity pose places the object at its base position")
{
    auto mat = Util::poseMatrix(tg::pos3(1, 2, 3), Pose());
    CHECK(mat[3][0] == Approx(1.f));
    CHECK(mat[3][1] == Approx(2.f));
    CHECK(mat[3][2] == Approx(3.f));
    CHECK(mat[3][3] == 1.f);
    CHECK(mat[0][0] == Approx(1.f));
    CHECK(mat[1][1] == Approx(1.f));
    CHECK(mat[2][2] == Approx(1.f));
}

TEST_CASE("pose translation offsets and scale stretches")
{
    Pose pose;
    pose.translate = tg::vec3(0, 4, 0);
    pose.scale = tg::vec3(2, 1, 3);
    auto mat = Util::poseMatrix(tg::pos3(1, 0, 0), pose);
    CHECK(mat[3][0] == Approx(1.f));
    CHECK(mat[3][1] == Approx(4.f));
    CHECK(mat[0][0] == Approx(2.f));
    CHECK(mat[2][2] == Approx(3.f));
}

TEST_CASE("euler rotation about y turns x into -z")
{
    auto q = Util::eulerToQuat(tg::vec3(0, tg::pi_scalar<float> / 2, 0));
    auto rotated = tg::mat3(q) * tg::vec3(1, 0, 0);
    CHECK(rotated.x == Approx(0.f).margin(1e-5));
    CHECK(rotated.y == Approx(0.f).margin(1e-5));
    CHECK(rotated.z == Approx(-1.f).margin(1e-5));
}
