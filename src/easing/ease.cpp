/// @file ease.cpp
/// @brief Implements the easing curve families

#include "easing/ease.hpp"

#include <cmath>

namespace tweenflow {

namespace {

constexpr float PI = 3.14159265358979f;

// Back overshoot amount and its InOut scaling
constexpr float BACK_C1 = 1.70158f;
constexpr float BACK_C2 = BACK_C1 * 1.525f;
constexpr float BACK_C3 = BACK_C1 + 1.0f;

constexpr float ELASTIC_C4 = (2.0f * PI) / 3.0f;
constexpr float ELASTIC_C5 = (2.0f * PI) / 4.5f;

constexpr float BOUNCE_N1 = 7.5625f;
constexpr float BOUNCE_D1 = 2.75f;

float out_bounce(float t) {
    if (t < 1.0f / BOUNCE_D1) {
        return BOUNCE_N1 * t * t;
    }
    if (t < 2.0f / BOUNCE_D1) {
        t -= 1.5f / BOUNCE_D1;
        return BOUNCE_N1 * t * t + 0.75f;
    }
    if (t < 2.5f / BOUNCE_D1) {
        t -= 2.25f / BOUNCE_D1;
        return BOUNCE_N1 * t * t + 0.9375f;
    }
    t -= 2.625f / BOUNCE_D1;
    return BOUNCE_N1 * t * t + 0.984375f;
}

/// Shared shape of the polynomial InOut curves
float in_out_power(float t, float power) {
    if (t < 0.5f) {
        return std::pow(2.0f, power - 1.0f) * std::pow(t, power);
    }
    return 1.0f - std::pow(-2.0f * t + 2.0f, power) / 2.0f;
}

} // namespace

float ease_normalized(EaseType type, float t) {
    if (t <= 0.0f) {
        return 0.0f;
    }
    if (t >= 1.0f) {
        return 1.0f;
    }

    switch (type) {
    case EaseType::LINEAR:
        return t;

    case EaseType::EASE_IN_SINE:
        return 1.0f - std::cos((t * PI) / 2.0f);
    case EaseType::EASE_OUT_SINE:
        return std::sin((t * PI) / 2.0f);
    case EaseType::EASE_IN_OUT_SINE:
        return -(std::cos(PI * t) - 1.0f) / 2.0f;

    case EaseType::EASE_IN_QUAD:
        return t * t;
    case EaseType::EASE_OUT_QUAD:
        return 1.0f - (1.0f - t) * (1.0f - t);
    case EaseType::EASE_IN_OUT_QUAD:
        return in_out_power(t, 2.0f);

    case EaseType::EASE_IN_CUBIC:
        return t * t * t;
    case EaseType::EASE_OUT_CUBIC:
        return 1.0f - std::pow(1.0f - t, 3.0f);
    case EaseType::EASE_IN_OUT_CUBIC:
        return in_out_power(t, 3.0f);

    case EaseType::EASE_IN_QUART:
        return t * t * t * t;
    case EaseType::EASE_OUT_QUART:
        return 1.0f - std::pow(1.0f - t, 4.0f);
    case EaseType::EASE_IN_OUT_QUART:
        return in_out_power(t, 4.0f);

    case EaseType::EASE_IN_QUINT:
        return t * t * t * t * t;
    case EaseType::EASE_OUT_QUINT:
        return 1.0f - std::pow(1.0f - t, 5.0f);
    case EaseType::EASE_IN_OUT_QUINT:
        return in_out_power(t, 5.0f);

    case EaseType::EASE_IN_EXPO:
        return std::pow(2.0f, 10.0f * t - 10.0f);
    case EaseType::EASE_OUT_EXPO:
        return 1.0f - std::pow(2.0f, -10.0f * t);
    case EaseType::EASE_IN_OUT_EXPO:
        if (t < 0.5f) {
            return std::pow(2.0f, 20.0f * t - 10.0f) / 2.0f;
        }
        return (2.0f - std::pow(2.0f, -20.0f * t + 10.0f)) / 2.0f;

    case EaseType::EASE_IN_CIRC:
        return 1.0f - std::sqrt(1.0f - t * t);
    case EaseType::EASE_OUT_CIRC:
        return std::sqrt(1.0f - (t - 1.0f) * (t - 1.0f));
    case EaseType::EASE_IN_OUT_CIRC:
        if (t < 0.5f) {
            return (1.0f - std::sqrt(1.0f - 4.0f * t * t)) / 2.0f;
        }
        return (std::sqrt(1.0f - std::pow(-2.0f * t + 2.0f, 2.0f)) + 1.0f) / 2.0f;

    case EaseType::EASE_IN_ELASTIC:
        return -std::pow(2.0f, 10.0f * t - 10.0f) * std::sin((t * 10.0f - 10.75f) * ELASTIC_C4);
    case EaseType::EASE_OUT_ELASTIC:
        return std::pow(2.0f, -10.0f * t) * std::sin((t * 10.0f - 0.75f) * ELASTIC_C4) + 1.0f;
    case EaseType::EASE_IN_OUT_ELASTIC:
        if (t < 0.5f) {
            return -(std::pow(2.0f, 20.0f * t - 10.0f) *
                     std::sin((20.0f * t - 11.125f) * ELASTIC_C5)) /
                   2.0f;
        }
        return (std::pow(2.0f, -20.0f * t + 10.0f) * std::sin((20.0f * t - 11.125f) * ELASTIC_C5)) /
                   2.0f +
               1.0f;

    case EaseType::EASE_IN_BACK:
        return BACK_C3 * t * t * t - BACK_C1 * t * t;
    case EaseType::EASE_OUT_BACK:
        return 1.0f + BACK_C3 * std::pow(t - 1.0f, 3.0f) + BACK_C1 * std::pow(t - 1.0f, 2.0f);
    case EaseType::EASE_IN_OUT_BACK:
        if (t < 0.5f) {
            return (std::pow(2.0f * t, 2.0f) * ((BACK_C2 + 1.0f) * 2.0f * t - BACK_C2)) / 2.0f;
        }
        return (std::pow(2.0f * t - 2.0f, 2.0f) * ((BACK_C2 + 1.0f) * (t * 2.0f - 2.0f) + BACK_C2) +
                2.0f) /
               2.0f;

    case EaseType::EASE_IN_BOUNCE:
        return 1.0f - out_bounce(1.0f - t);
    case EaseType::EASE_OUT_BOUNCE:
        return out_bounce(t);
    case EaseType::EASE_IN_OUT_BOUNCE:
        if (t < 0.5f) {
            return (1.0f - out_bounce(1.0f - 2.0f * t)) / 2.0f;
        }
        return (1.0f + out_bounce(2.0f * t - 1.0f)) / 2.0f;
    }
    return t;
}

float ease(EaseType type, float elapsed, float start, float change, float duration) {
    if (duration <= 0.0f) {
        return start + change;
    }
    return start + change * ease_normalized(type, elapsed / duration);
}

EaseType inverse_ease(EaseType type) {
    switch (type) {
    case EaseType::EASE_IN_SINE:
        return EaseType::EASE_OUT_SINE;
    case EaseType::EASE_OUT_SINE:
        return EaseType::EASE_IN_SINE;
    case EaseType::EASE_IN_QUAD:
        return EaseType::EASE_OUT_QUAD;
    case EaseType::EASE_OUT_QUAD:
        return EaseType::EASE_IN_QUAD;
    case EaseType::EASE_IN_CUBIC:
        return EaseType::EASE_OUT_CUBIC;
    case EaseType::EASE_OUT_CUBIC:
        return EaseType::EASE_IN_CUBIC;
    case EaseType::EASE_IN_QUART:
        return EaseType::EASE_OUT_QUART;
    case EaseType::EASE_OUT_QUART:
        return EaseType::EASE_IN_QUART;
    case EaseType::EASE_IN_QUINT:
        return EaseType::EASE_OUT_QUINT;
    case EaseType::EASE_OUT_QUINT:
        return EaseType::EASE_IN_QUINT;
    case EaseType::EASE_IN_EXPO:
        return EaseType::EASE_OUT_EXPO;
    case EaseType::EASE_OUT_EXPO:
        return EaseType::EASE_IN_EXPO;
    case EaseType::EASE_IN_CIRC:
        return EaseType::EASE_OUT_CIRC;
    case EaseType::EASE_OUT_CIRC:
        return EaseType::EASE_IN_CIRC;
    case EaseType::EASE_IN_ELASTIC:
        return EaseType::EASE_OUT_ELASTIC;
    case EaseType::EASE_OUT_ELASTIC:
        return EaseType::EASE_IN_ELASTIC;
    case EaseType::EASE_IN_BACK:
        return EaseType::EASE_OUT_BACK;
    case EaseType::EASE_OUT_BACK:
        return EaseType::EASE_IN_BACK;
    case EaseType::EASE_IN_BOUNCE:
        return EaseType::EASE_OUT_BOUNCE;
    case EaseType::EASE_OUT_BOUNCE:
        return EaseType::EASE_IN_BOUNCE;
    default:
        return type;
    }
}

std::string_view ease_type_name(EaseType type) {
    switch (type) {
    case EaseType::LINEAR:
        return "Linear";
    case EaseType::EASE_IN_SINE:
        return "EaseInSine";
    case EaseType::EASE_OUT_SINE:
        return "EaseOutSine";
    case EaseType::EASE_IN_OUT_SINE:
        return "EaseInOutSine";
    case EaseType::EASE_IN_QUAD:
        return "EaseInQuad";
    case EaseType::EASE_OUT_QUAD:
        return "EaseOutQuad";
    case EaseType::EASE_IN_OUT_QUAD:
        return "EaseInOutQuad";
    case EaseType::EASE_IN_CUBIC:
        return "EaseInCubic";
    case EaseType::EASE_OUT_CUBIC:
        return "EaseOutCubic";
    case EaseType::EASE_IN_OUT_CUBIC:
        return "EaseInOutCubic";
    case EaseType::EASE_IN_QUART:
        return "EaseInQuart";
    case EaseType::EASE_OUT_QUART:
        return "EaseOutQuart";
    case EaseType::EASE_IN_OUT_QUART:
        return "EaseInOutQuart";
    case EaseType::EASE_IN_QUINT:
        return "EaseInQuint";
    case EaseType::EASE_OUT_QUINT:
        return "EaseOutQuint";
    case EaseType::EASE_IN_OUT_QUINT:
        return "EaseInOutQuint";
    case EaseType::EASE_IN_EXPO:
        return "EaseInExpo";
    case EaseType::EASE_OUT_EXPO:
        return "EaseOutExpo";
    case EaseType::EASE_IN_OUT_EXPO:
        return "EaseInOutExpo";
    case EaseType::EASE_IN_CIRC:
        return "EaseInCirc";
    case EaseType::EASE_OUT_CIRC:
        return "EaseOutCirc";
    case EaseType::EASE_IN_OUT_CIRC:
        return "EaseInOutCirc";
    case EaseType::EASE_IN_ELASTIC:
        return "EaseInElastic";
    case EaseType::EASE_OUT_ELASTIC:
        return "EaseOutElastic";
    case EaseType::EASE_IN_OUT_ELASTIC:
        return "EaseInOutElastic";
    case EaseType::EASE_IN_BACK:
        return "EaseInBack";
    case EaseType::EASE_OUT_BACK:
        return "EaseOutBack";
    case EaseType::EASE_IN_OUT_BACK:
        return "EaseInOutBack";
    case EaseType::EASE_IN_BOUNCE:
        return "EaseInBounce";
    case EaseType::EASE_OUT_BOUNCE:
        return "EaseOutBounce";
    case EaseType::EASE_IN_OUT_BOUNCE:
        return "EaseInOutBounce";
    }
    return "Unknown";
}

} // namespace tweenflow
