// SPDX-License-Identifier: MIT
#pragma once

#include <list>
#include <memory>

#include "TransformAnimator.hh"

namespace BeatMotion {

/// Active animators of one level, advanced together once per frame.
class AnimatorManager
{
    std::list<std::shared_ptr<AbstractAnimator>> mActiveAnimators;
public:
    void updateAllAnimators(float deltaSeconds);
    void start(std::shared_ptr<AbstractAnimator> animator);
    void stop(const std::shared_ptr<AbstractAnimator>& animator);
    void clear() { mActiveAnimators.clear(); }
    std::size_t activeCount() const { return mActiveAnimators.size(); }
};

}
