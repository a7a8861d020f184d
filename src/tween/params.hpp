/// @file params.hpp
/// @brief Creation parameters for tweens and sequences

#pragma once

#include "easing/ease.hpp"
#include "tween/animation.hpp"
#include "tween/property_binding.hpp"

#include <memory>
#include <utility>
#include <vector>

namespace tweenflow {

class OverwriteArbiter;

struct TweenParams {
    std::vector<std::unique_ptr<PropertyBinding>> bindings;
    EaseType ease = DEFAULT_EASE;
    float delay = 0.0f;
    int loops = 1; ///< Negative for infinite
    LoopType loop_type = LoopType::RESTART;
    float time_scale = 1.0f;
    bool paused = false;
    bool auto_kill = true;
    bool is_from = false;     ///< Animate from the given values to the current ones
    bool speed_based = false; ///< Duration is read as units per second
    OverwriteArbiter* arbiter = nullptr;
    AnimationCallbacks callbacks;

    /// Constructs a binding in place and returns it for option chaining
    template <typename Binding, typename... Args>
    Binding& bind(Args&&... args) {
        auto binding = std::make_unique<Binding>(std::forward<Args>(args)...);
        Binding& ref = *binding;
        bindings.push_back(std::move(binding));
        return ref;
    }
};

struct SequenceParams {
    int loops = 1;
    LoopType loop_type = LoopType::RESTART;
    float time_scale = 1.0f;
    bool auto_kill = true;
    AnimationCallbacks callbacks;
};

} // namespace tweenflow
