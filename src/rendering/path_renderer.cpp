/// @file path_renderer.cpp
/// @brief Draws spline paths as polylines with waypoint and velocity markers

#include "rendering/path_renderer.hpp"

#include "path/spline_path.hpp"
#include "tween/path_binding.hpp"

#include <vector>

namespace tweenflow {

namespace {

const Color PATH_COLOR = {150, 150, 150, 160};
const Color WAYPOINT_COLOR = {240, 190, 70, 255};
const Color POSITION_COLOR = {80, 220, 100, 255};
const Color VELOCITY_COLOR = {80, 140, 255, 255};
constexpr int PATH_SUBDIVISIONS = 200;
constexpr float PATH_THICKNESS = 1.5f;
constexpr float WAYPOINT_RADIUS = 3.0f;
constexpr float POSITION_RADIUS = 5.0f;
constexpr float VELOCITY_SCALE = 0.25f; // Velocity vectors are long; shorten for display

Vector2 to_screen(const Vec3& v, float scale, Vector2 offset) {
    return {v.x * scale + offset.x, v.y * scale + offset.y};
}

void draw_path(const PathBinding& binding, float scale, Vector2 offset) {
    const SplinePath* path = binding.path();
    if (path == nullptr) {
        return;
    }

    std::vector<Vec3> points = path->sample(PATH_SUBDIVISIONS);
    for (size_t i = 0; i + 1 < points.size(); i++) {
        DrawLineEx(to_screen(points[i], scale, offset), to_screen(points[i + 1], scale, offset),
                   PATH_THICKNESS, PATH_COLOR);
    }

    // Skip the synthetic boundary control points
    const auto& controls = path->control_points();
    for (size_t i = 1; i + 1 < controls.size(); i++) {
        DrawCircleV(to_screen(controls[i], scale, offset), WAYPOINT_RADIUS, WAYPOINT_COLOR);
    }

    float t = binding.path_percentage();
    Vec3 pos = path->evaluate(t);
    Vec3 tip = pos + path->velocity(t) * VELOCITY_SCALE;
    Vector2 pos_screen = to_screen(pos, scale, offset);
    DrawLineEx(pos_screen, to_screen(tip, scale, offset), PATH_THICKNESS, VELOCITY_COLOR);
    DrawCircleV(pos_screen, POSITION_RADIUS, POSITION_COLOR);
}

} // namespace

void draw_paths(Animation& animation, float scale, Vector2 offset) {
    if (animation.is_destroyed()) {
        return;
    }
    std::vector<PropertyBinding*> bindings;
    animation.fill_property_bindings(bindings);
    for (PropertyBinding* binding : bindings) {
        if (const auto* path = dynamic_cast<const PathBinding*>(binding)) {
            draw_path(*path, scale, offset);
        }
    }
}

} // namespace tweenflow
