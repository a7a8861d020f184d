/// @file vec3.hpp
/// @brief Minimal 3D vector used by paths and spatial bindings

#pragma once

#include <cmath>

namespace tweenflow {

/// A 3D point or direction in world units
struct Vec3 {
    float x = 0.0f;
    float y = 0.0f;
    float z = 0.0f;

    Vec3& operator+=(const Vec3& o) {
        x += o.x;
        y += o.y;
        z += o.z;
        return *this;
    }

    Vec3& operator-=(const Vec3& o) {
        x -= o.x;
        y -= o.y;
        z -= o.z;
        return *this;
    }

    Vec3& operator*=(float s) {
        x *= s;
        y *= s;
        z *= s;
        return *this;
    }

    [[nodiscard]] float length() const { return std::sqrt(x * x + y * y + z * z); }
};

[[nodiscard]] inline Vec3 operator+(Vec3 a, const Vec3& b) { return a += b; }
[[nodiscard]] inline Vec3 operator-(Vec3 a, const Vec3& b) { return a -= b; }
[[nodiscard]] inline Vec3 operator-(const Vec3& a) { return {-a.x, -a.y, -a.z}; }
[[nodiscard]] inline Vec3 operator*(Vec3 a, float s) { return a *= s; }
[[nodiscard]] inline Vec3 operator*(float s, Vec3 a) { return a *= s; }

/// Exact component-wise equality (used for waypoint coincidence checks)
[[nodiscard]] inline bool operator==(const Vec3& a, const Vec3& b) {
    return a.x == b.x && a.y == b.y && a.z == b.z;
}
[[nodiscard]] inline bool operator!=(const Vec3& a, const Vec3& b) { return !(a == b); }

[[nodiscard]] inline float distance(const Vec3& a, const Vec3& b) { return (b - a).length(); }

} // namespace tweenflow
