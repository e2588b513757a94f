// SPDX-License-Identifier: MIT
#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>

namespace BeatMotion {

/// Structural problem in an animation configuration that has no safe fallback.
class ConfigurationError : public std::runtime_error {
    std::optional<std::size_t> mTransitionIdx;

public:
    explicit ConfigurationError(const std::string& message, std::optional<std::size_t> transitionIdx = std::nullopt)
      : std::runtime_error(transitionIdx ? "transition " + std::to_string(*transitionIdx) + ": " + message : message),
        mTransitionIdx{transitionIdx} {}

    std::optional<std::size_t> transitionIndex() const noexcept { return mTransitionIdx; }
};

}
