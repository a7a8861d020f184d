/// @file value_bindings.cpp
/// @brief Implements scalar and vector bindings

#include "tween/value_bindings.hpp"

#include <cmath>
#include <utility>

namespace tweenflow {

FloatBinding::FloatBinding(Property<float> property, float value, bool relative)
    : property_(std::move(property)), value_(value), relative_(relative) {}

void FloatBinding::on_startup(bool is_from) {
    float current = property_.get();
    float target = relative_ ? current + value_ : value_;
    if (is_from) {
        start_ = target;
        change_ = current - target;
    } else {
        start_ = current;
        change_ = target - current;
    }
}

void FloatBinding::apply(float progress) { property_.set(start_ + change_ * progress); }

void FloatBinding::shift(int loop_delta) { start_ += change_ * static_cast<float>(loop_delta); }

float FloatBinding::speed_based_duration(float speed) const {
    if (speed <= 0.0f) {
        return 0.0f;
    }
    return std::fabs(change_) / speed;
}

Vec3Binding::Vec3Binding(Property<Vec3> property, Vec3 value, bool relative)
    : property_(std::move(property)), value_(value), relative_(relative) {}

void Vec3Binding::on_startup(bool is_from) {
    Vec3 current = property_.get();
    Vec3 target = relative_ ? current + value_ : value_;
    if (is_from) {
        start_ = target;
        change_ = current - target;
    } else {
        start_ = current;
        change_ = target - current;
    }
}

void Vec3Binding::apply(float progress) { property_.set(start_ + change_ * progress); }

void Vec3Binding::shift(int loop_delta) { start_ += change_ * static_cast<float>(loop_delta); }

float Vec3Binding::speed_based_duration(float speed) const {
    if (speed <= 0.0f) {
        return 0.0f;
    }
    return change_.length() / speed;
}

} // namespace tweenflow
