/// @file property_binding.cpp
/// @brief Implements the shared binding lifecycle

#include "tween/property_binding.hpp"

#include <algorithm>

namespace tweenflow {

void PropertyBinding::init(EaseType tween_ease, float duration) {
    if (!own_ease_) {
        set_ease(tween_ease);
    }
    duration_ = duration;
}

void PropertyBinding::startup(bool is_from) {
    if (started_) {
        return;
    }
    started_ = true;
    on_startup(is_from);
}

void PropertyBinding::update(float local_elapsed) {
    float t = std::clamp(local_elapsed, 0.0f, duration_);
    apply(tweenflow::ease(ease_, t, 0.0f, 1.0f, duration_));
}

void PropertyBinding::complete() { apply(1.0f); }

void PropertyBinding::rewind() { apply(0.0f); }

void PropertyBinding::reverse_ease() {
    ease_reversed_ = !ease_reversed_;
    ease_ = ease_reversed_ ? inverse_ease(forward_ease_) : forward_ease_;
}

void PropertyBinding::set_ease(EaseType ease) {
    forward_ease_ = ease;
    ease_ = ease_reversed_ ? inverse_ease(ease) : ease;
}

void PropertyBinding::override_ease(EaseType ease) {
    own_ease_ = true;
    set_ease(ease);
}

void PropertyBinding::copy_ease_override(PropertyBinding& other) const {
    if (own_ease_) {
        other.override_ease(forward_ease_);
    }
}

void PropertyBinding::set_incremental(int loop_delta) {
    if (!started_) {
        return;
    }
    shift(loop_delta);
}

} // namespace tweenflow
