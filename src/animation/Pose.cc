// SPDX-License-Identifier: MIT
#include "Pose.hh"

#include <typed-geometry/tg.hh>

using namespace BeatMotion;

tg::vec3& Pose::operator[](TransformType type) {
    switch (type) {
    case TransformType::Translate: return translate;
    case TransformType::Scale: return scale;
    case TransformType::Rotate: return rotate;
    }
    return translate;
}

const tg::vec3& Pose::operator[](TransformType type) const {
    switch (type) {
    case TransformType::Translate: return translate;
    case TransformType::Scale: return scale;
    case TransformType::Rotate: return rotate;
    }
    return translate;
}

bool Pose::operator==(const Pose& other) const {
    return translate == other.translate && scale == other.scale && rotate == other.rotate && colorIndex == other.colorIndex;
}

tg::vec3 BeatMotion::mergeAxes(tg::vec3 base, const PartialVec3& override) {
    return tg::vec3(override.x.value_or(base.x), override.y.value_or(base.y), override.z.value_or(base.z));
}

Pose BeatMotion::mergePose(const Pose& base, const PartialPose& override) {
    Pose merged;
    merged.translate = mergeAxes(base.translate, override.translate);
    merged.scale = mergeAxes(base.scale, override.scale);
    merged.rotate = mergeAxes(base.rotate, override.rotate);
    merged.colorIndex = override.colorIndex ? override.colorIndex : base.colorIndex;
    return merged;
}

tg::vec3 BeatMotion::interpolateAxes(tg::vec3 from, tg::vec3 to, float t) {
    return tg::vec3(from.x + (to.x - from.x) * t,
                    from.y + (to.y - from.y) * t,
                    from.z + (to.z - from.z) * t);
}
