/// @file value_bindings.hpp
/// @brief Straight-line bindings for scalar and vector properties

#pragma once

#include "math/vec3.hpp"
#include "tween/property.hpp"
#include "tween/property_binding.hpp"

namespace tweenflow {

/// Animates a float property towards (or, for from tweens, away from) a value
class FloatBinding : public PropertyBinding {
  public:
    /// @param relative If true, value is an offset from the property's value at startup
    FloatBinding(Property<float> property, float value, bool relative = false);

    [[nodiscard]] float speed_based_duration(float speed) const override;
    [[nodiscard]] const std::string& name() const override { return property_.name; }

    [[nodiscard]] float start_value() const { return start_; }
    [[nodiscard]] float end_value() const { return start_ + change_; }

  protected:
    void on_startup(bool is_from) override;
    void apply(float progress) override;
    void shift(int loop_delta) override;

  private:
    Property<float> property_;
    float value_;
    bool relative_;
    float start_ = 0.0f;
    float change_ = 0.0f;
};

/// Animates a Vec3 property along a straight line
class Vec3Binding : public PropertyBinding {
  public:
    Vec3Binding(Property<Vec3> property, Vec3 value, bool relative = false);

    [[nodiscard]] float speed_based_duration(float speed) const override;
    [[nodiscard]] const std::string& name() const override { return property_.name; }

    [[nodiscard]] Vec3 start_value() const { return start_; }
    [[nodiscard]] Vec3 end_value() const { return start_ + change_; }

  protected:
    void on_startup(bool is_from) override;
    void apply(float progress) override;
    void shift(int loop_delta) override;

  private:
    Property<Vec3> property_;
    Vec3 value_;
    bool relative_;
    Vec3 start_;
    Vec3 change_;
};

} // namespace tweenflow
