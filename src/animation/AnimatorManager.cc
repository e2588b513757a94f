// SPDX-License-Identifier: MIT
#include "AnimatorManager.hh"

using namespace BeatMotion;

void AnimatorManager::updateAllAnimators(float deltaSeconds) {
    for (const auto& anim : mActiveAnimators)
    {
        anim->advance(deltaSeconds);
    }
}

void AnimatorManager::start(std::shared_ptr<AbstractAnimator> animator) {
    animator->reset();
    mActiveAnimators.emplace_back(std::move(animator));
}

void AnimatorManager::stop(const std::shared_ptr<AbstractAnimator>& animator) {
    animator->reset();
    mActiveAnimators.remove(animator);
}
