/// @file spline_path.hpp
/// @brief Catmull-Rom spline through ordered 3D points, with an optional
///        arc-length table for approximately constant-speed traversal.
///
/// The control point list includes one synthetic point before the first real
/// point and one after the last, so a path with N control points has N - 3
/// segments. Parameter t in [0, 1] covers all segments uniformly.

#pragma once

#include "math/vec3.hpp"

#include <vector>

namespace tweenflow {

/// Subdivisions used when sampling the arc-length table
constexpr int DEFAULT_ARC_SUBDIVISIONS = 100;

/// Samples per segment when measuring waypoint-to-waypoint lengths
constexpr int WAYPOINT_LENGTH_SAMPLES = 10;

class SplinePath {
  public:
    /// @param control_points At least 4 points, boundary control points included
    /// @throws std::invalid_argument if fewer than 4 points are given
    explicit SplinePath(std::vector<Vec3> control_points);

    /// Builds a path through the given waypoints, adding the boundary control points.
    /// Open paths duplicate the first waypoint and extrapolate past the last one.
    /// Closed paths append the first waypoint again and wrap the control points.
    /// A single waypoint is duplicated, producing a stationary path.
    /// @throws std::invalid_argument if waypoints is empty
    [[nodiscard]] static SplinePath from_waypoints(const std::vector<Vec3>& waypoints,
                                                   bool closed);

    /// Position at parameter t (clamped to the valid segment range)
    [[nodiscard]] Vec3 evaluate(float t) const;

    /// First derivative with respect to the local segment parameter
    [[nodiscard]] Vec3 velocity(float t) const;

    /// Samples the curve and records each subdivision's share of the total length
    void build_arc_length_table(int subdivisions = DEFAULT_ARC_SUBDIVISIONS);
    [[nodiscard]] bool has_arc_length_table() const { return !arc_fractions_.empty(); }
    [[nodiscard]] const std::vector<float>& arc_length_fractions() const { return arc_fractions_; }

    /// Maps a linear parameter to one that advances at roughly constant speed.
    /// Non-decreasing, fixes 0 and 1. Requires the arc-length table; without one
    /// the clamped input is returned.
    [[nodiscard]] float reparameterize_for_constant_speed(float t_linear) const;

    /// evaluate(reparameterize_for_constant_speed(t))
    [[nodiscard]] Vec3 constant_speed_point(float t) const;

    /// Approximate total length of the curve
    [[nodiscard]] float length() const;

    /// Fraction of the total length between two control point ids (1-based real points).
    /// @param from_id First control point id (>= 1)
    /// @param to_id Last control point id (<= control_points().size() - 2)
    [[nodiscard]] float waypoints_length_fraction(int from_id, int to_id) const;

    /// Shifts every control point by offset
    void translate(const Vec3& offset);

    /// Polyline approximation with count + 1 points (debug drawing)
    [[nodiscard]] std::vector<Vec3> sample(int count) const;

    [[nodiscard]] const std::vector<Vec3>& control_points() const { return points_; }
    [[nodiscard]] int num_segments() const { return static_cast<int>(points_.size()) - 3; }

  private:
    /// Lengths of each segment, measured lazily
    const std::vector<float>& segment_lengths() const;

    std::vector<Vec3> points_;
    std::vector<float> arc_fractions_;
    mutable std::vector<float> segment_lengths_; // Cache, cleared on translate()
};

} // namespace tweenflow
