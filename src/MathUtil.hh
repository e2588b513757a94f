// SPDX-License-Identifier: MIT
#pragma once
#include <typed-geometry/tg.hh>

#include <animation/Pose.hh>

namespace Util {

// intrinsic X, then Y, then Z
inline tg::quat eulerToQuat(tg::vec3 radians) {
    auto qx = tg::quat::from_axis_angle(tg::dir3(1, 0, 0), tg::angle_t<float>::from_radians(radians.x));
    auto qy = tg::quat::from_axis_angle(tg::dir3(0, 1, 0), tg::angle_t<float>::from_radians(radians.y));
    auto qz = tg::quat::from_axis_angle(tg::dir3(0, 0, 1), tg::angle_t<float>::from_radians(radians.z));
    return qx * qy * qz;
}

inline tg::mat4x3 transformMat(tg::pos3 translation, tg::quat rotation = {0, 0, 0, 1}, tg::size3 scaling = {1, 1, 1}) {
    // note: this is significantly faster than three naive matrix muls!
    auto const rot_mat = tg::mat3(rotation);
    tg::mat4x3 M;
    M[0] = rot_mat[0] * scaling[0];
    M[1] = rot_mat[1] * scaling[1];
    M[2] = rot_mat[2] * scaling[2];
    M[3] = tg::vec3(translation);
    return M;
}

inline tg::mat4 transformMat4(tg::pos3 translation, tg::quat rotation = {0, 0, 0, 1}, tg::size3 scaling = {1, 1, 1}) {
    auto mat = tg::mat4(transformMat(translation, rotation, scaling));
    mat[3][3] = 1.0;
    return mat;
}

/// World matrix of an animated object whose pose translates relative to basePosition.
inline tg::mat4 poseMatrix(tg::pos3 basePosition, const BeatMotion::Pose& pose) {
    return transformMat4(basePosition + pose.translate,
                         eulerToQuat(pose.rotate),
                         tg::size3(pose.scale.x, pose.scale.y, pose.scale.z));
}

}
