/// @file path_renderer.hpp
/// @brief Debug drawing of spline paths driven by path bindings

#pragma once

#include "tween/animation.hpp"

#include <raylib.h>

namespace tweenflow {

/// Draws every path binding found in the animation (recursively for sequences):
/// the sampled curve, its waypoints, the current position and its velocity.
/// Paths are projected onto the XY plane.
/// @param animation Root animation to inspect
/// @param scale     Pixels per world unit
/// @param offset    Screen-space offset
void draw_paths(Animation& animation, float scale, Vector2 offset);

} // namespace tweenflow
