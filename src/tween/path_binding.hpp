/// @file path_binding.hpp
/// @brief Moves a Vec3 property along a Catmull-Rom path through waypoints

#pragma once

#include "math/vec3.hpp"
#include "path/spline_path.hpp"
#include "tween/property.hpp"
#include "tween/property_binding.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <vector>

namespace tweenflow {

/// Distance ahead on the path (in path percentage) sampled when orienting to the path
constexpr float ORIENT_LOOK_AHEAD = 0.0001f;

/// How the target is rotated while it moves
enum class OrientType { NONE, TO_PATH, LOOK_AT_TARGET, LOOK_AT_POSITION };

/// Turns the animated object to face a world point
using LookAtFn = std::function<void(const Vec3& point)>;

class PathBinding : public PropertyBinding {
  public:
    /// @param waypoints Points to pass through (at least one)
    /// @param relative If true, the path keeps its shape but starts at the property's value
    /// @throws std::invalid_argument if waypoints is empty
    PathBinding(Property<Vec3> property, std::vector<Vec3> waypoints, bool relative = false);

    // --- Options (set before the tween starts) ---
    PathBinding& constant_speed(bool enabled = true);
    PathBinding& close_path(bool closed = true);
    PathBinding& orient_to_path(LookAtFn look_at);
    PathBinding& look_at(const Vec3& position, LookAtFn look_at);
    PathBinding& look_at(std::function<Vec3()> target_position, LookAtFn look_at);

    [[nodiscard]] float speed_based_duration(float speed) const override;
    [[nodiscard]] const std::string& name() const override { return property_.name; }

    /// The built path, or nullptr before startup
    [[nodiscard]] const SplinePath* path() const { return path_ ? &*path_ : nullptr; }

    /// Last eased path percentage written (read-only telemetry for debug drawing)
    [[nodiscard]] float path_percentage() const { return path_percentage_; }

    /// Whether startup injected the property's value as the first waypoint
    [[nodiscard]] bool has_additional_start_point() const { return has_additional_start_point_; }

    [[nodiscard]] bool is_closed() const { return closed_; }
    [[nodiscard]] bool is_constant_speed() const { return constant_speed_; }
    [[nodiscard]] OrientType orient_type() const { return orient_type_; }

    /// Point at constant-speed parameter t, building the arc-length table if needed.
    /// Returns the origin before startup.
    [[nodiscard]] Vec3 constant_point_on_path(float t);

    /// New binding driving the same property over the given control points
    /// (boundary control points included), sharing this binding's options
    [[nodiscard]] std::unique_ptr<PathBinding>
    clone_for_partial_path(std::vector<Vec3> control_points) const;

  protected:
    void on_startup(bool is_from) override;
    void apply(float progress) override;
    void shift(int loop_delta) override;

  private:
    void orient(const Vec3& position, float path_t);

    Property<Vec3> property_;
    std::vector<Vec3> waypoints_;
    std::vector<Vec3> partial_control_points_; // Non-empty for partial-path clones
    bool relative_;
    bool closed_ = false;
    bool constant_speed_ = false;
    bool has_additional_start_point_ = false;

    OrientType orient_type_ = OrientType::NONE;
    LookAtFn look_at_;
    Vec3 look_position_;
    std::function<Vec3()> look_target_;

    std::optional<SplinePath> path_;
    float path_percentage_ = 0.0f;
};

} // namespace tweenflow
