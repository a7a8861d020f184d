/// @file property_binding.hpp
/// @brief Base class for the per-property interpolation strategies a Tweener drives

#pragma once

#include "easing/ease.hpp"

#include <string>

namespace tweenflow {

/// Interpolates one property between a start and an end state.
///
/// Lifecycle:
///   1. init() with the owning tween's ease and duration
///   2. startup() once, right before the first update, to capture start values
///   3. update(local_elapsed) each tick; complete() / rewind() to force an end
class PropertyBinding {
  public:
    virtual ~PropertyBinding() = default;

    PropertyBinding(const PropertyBinding&) = delete;
    PropertyBinding& operator=(const PropertyBinding&) = delete;

    /// Adopts the tween's ease (unless one was set with override_ease) and duration
    void init(EaseType tween_ease, float duration);

    /// Captures start/end values from the current property value. Runs once.
    void startup(bool is_from);

    /// Writes the state at local_elapsed seconds (clamped to [0, duration])
    void update(float local_elapsed);

    /// Writes the end state
    void complete();

    /// Writes the start state
    void rewind();

    /// Toggles between the ease and its inverse (used on YoyoInverse back passes)
    void reverse_ease();
    [[nodiscard]] bool ease_reversed() const { return ease_reversed_; }

    /// Changes the ease, keeping the reversed state
    void set_ease(EaseType ease);
    [[nodiscard]] EaseType ease() const { return ease_; }

    /// Uses this ease regardless of the owning tween's ease
    void override_ease(EaseType ease);

    /// Shifts start and end by loop_delta loop widths. Ignored before startup.
    void set_incremental(int loop_delta);

    [[nodiscard]] float duration() const { return duration_; }
    void set_duration(float duration) { duration_ = duration; }
    [[nodiscard]] bool is_started() const { return started_; }

    /// Seconds needed to cover this binding's change at the given units per second
    [[nodiscard]] virtual float speed_based_duration(float speed) const = 0;

    /// Name of the driven property
    [[nodiscard]] virtual const std::string& name() const = 0;

  protected:
    PropertyBinding() = default;

    virtual void on_startup(bool is_from) = 0;

    /// Writes the state at eased progress (0 = start, 1 = end, may overshoot)
    virtual void apply(float progress) = 0;

    virtual void shift(int loop_delta) = 0;

    /// Gives another binding the same ease override, if this one has one
    void copy_ease_override(PropertyBinding& other) const;

  private:
    EaseType ease_ = DEFAULT_EASE;
    EaseType forward_ease_ = DEFAULT_EASE;
    bool own_ease_ = false;
    bool ease_reversed_ = false;
    bool started_ = false;
    float duration_ = 0.0f;
};

} // namespace tweenflow
