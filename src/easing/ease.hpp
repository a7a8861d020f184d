/// @file ease.hpp
/// @brief Easing curves mapping normalized time to normalized progress

#pragma once

#include <string_view>

namespace tweenflow {

/// Built-in easing curves (Penner families)
enum class EaseType {
    LINEAR,
    EASE_IN_SINE,
    EASE_OUT_SINE,
    EASE_IN_OUT_SINE,
    EASE_IN_QUAD,
    EASE_OUT_QUAD,
    EASE_IN_OUT_QUAD,
    EASE_IN_CUBIC,
    EASE_OUT_CUBIC,
    EASE_IN_OUT_CUBIC,
    EASE_IN_QUART,
    EASE_OUT_QUART,
    EASE_IN_OUT_QUART,
    EASE_IN_QUINT,
    EASE_OUT_QUINT,
    EASE_IN_OUT_QUINT,
    EASE_IN_EXPO,
    EASE_OUT_EXPO,
    EASE_IN_OUT_EXPO,
    EASE_IN_CIRC,
    EASE_OUT_CIRC,
    EASE_IN_OUT_CIRC,
    EASE_IN_ELASTIC,
    EASE_OUT_ELASTIC,
    EASE_IN_OUT_ELASTIC,
    EASE_IN_BACK,
    EASE_OUT_BACK,
    EASE_IN_OUT_BACK,
    EASE_IN_BOUNCE,
    EASE_OUT_BOUNCE,
    EASE_IN_OUT_BOUNCE,
};

/// Ease used when a tween does not specify one
constexpr EaseType DEFAULT_EASE = EaseType::EASE_OUT_QUAD;

/// Evaluates a curve at normalized time t.
/// t is clamped to [0, 1]; the result is 0 at t = 0 and 1 at t = 1.
/// Elastic and Back curves overshoot in between.
[[nodiscard]] float ease_normalized(EaseType type, float t);

/// Penner-style evaluation: start + change * curve(elapsed / duration).
/// A non-positive duration yields the end value.
[[nodiscard]] float ease(EaseType type, float elapsed, float start, float change,
                         float duration);

/// Returns the curve that plays this one backwards: In and Out variants swap,
/// Linear and InOut variants map to themselves.
[[nodiscard]] EaseType inverse_ease(EaseType type);

/// Human-readable name (e.g. "EaseOutQuad")
[[nodiscard]] std::string_view ease_type_name(EaseType type);

} // namespace tweenflow
