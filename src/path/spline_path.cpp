/// @file spline_path.cpp
/// @brief Implements Catmull-Rom evaluation and arc-length reparameterization

#include "path/spline_path.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace tweenflow {

namespace {

/// The four control points of the segment containing t, and the local parameter
struct SegmentSample {
    Vec3 a;
    Vec3 b;
    Vec3 c;
    Vec3 d;
    float u = 0.0f;
};

SegmentSample locate(const std::vector<Vec3>& points, float t) {
    int num_sections = static_cast<int>(points.size()) - 3;
    int seg = static_cast<int>(std::floor(t * static_cast<float>(num_sections)));
    seg = std::clamp(seg, 0, num_sections - 1);

    auto i = static_cast<size_t>(seg);
    SegmentSample s;
    s.a = points[i];
    s.b = points[i + 1];
    s.c = points[i + 2];
    s.d = points[i + 3];
    s.u = t * static_cast<float>(num_sections) - static_cast<float>(seg);
    return s;
}

} // namespace

SplinePath::SplinePath(std::vector<Vec3> control_points) : points_(std::move(control_points)) {
    if (points_.size() < 4) {
        throw std::invalid_argument("SplinePath requires at least 4 control points");
    }
}

SplinePath SplinePath::from_waypoints(const std::vector<Vec3>& waypoints, bool closed) {
    if (waypoints.empty()) {
        throw std::invalid_argument("SplinePath requires at least one waypoint");
    }

    std::vector<Vec3> real = waypoints;
    if (real.size() == 1) {
        real.push_back(real.front());
    }
    if (closed) {
        real.push_back(real.front());
    }

    std::vector<Vec3> pts(real.size() + 2);
    std::copy(real.begin(), real.end(), pts.begin() + 1);

    size_t n = pts.size();
    if (closed) {
        pts[0] = pts[n - 3];
        pts[n - 1] = pts[2];
    } else {
        pts[0] = pts[1];
        Vec3 last = pts[n - 2];
        pts[n - 1] = last + (last - pts[n - 3]);
    }
    return SplinePath(std::move(pts));
}

Vec3 SplinePath::evaluate(float t) const {
    SegmentSample s = locate(points_, t);
    float u = s.u;
    return 0.5f * ((-s.a + 3.0f * s.b - 3.0f * s.c + s.d) * (u * u * u) +
                   (2.0f * s.a - 5.0f * s.b + 4.0f * s.c - s.d) * (u * u) + (-s.a + s.c) * u +
                   2.0f * s.b);
}

Vec3 SplinePath::velocity(float t) const {
    SegmentSample s = locate(points_, t);
    float u = s.u;
    return 1.5f * (-s.a + 3.0f * s.b - 3.0f * s.c + s.d) * (u * u) +
           (2.0f * s.a - 5.0f * s.b + 4.0f * s.c - s.d) * u + 0.5f * s.c - 0.5f * s.a;
}

void SplinePath::build_arc_length_table(int subdivisions) {
    subdivisions = std::max(subdivisions, 1);
    arc_fractions_.assign(static_cast<size_t>(subdivisions), 0.0f);

    float total = 0.0f;
    Vec3 prev = evaluate(0.0f);
    for (int i = 1; i <= subdivisions; i++) {
        Vec3 curr = evaluate(static_cast<float>(i) / static_cast<float>(subdivisions));
        float len = distance(prev, curr);
        arc_fractions_[static_cast<size_t>(i - 1)] = len;
        total += len;
        prev = curr;
    }

    if (total <= 0.0f) {
        // Degenerate (stationary) path: every subdivision weighs the same
        std::fill(arc_fractions_.begin(), arc_fractions_.end(),
                  1.0f / static_cast<float>(subdivisions));
        return;
    }
    for (float& f : arc_fractions_) {
        f /= total;
    }
}

float SplinePath::reparameterize_for_constant_speed(float t_linear) const {
    float t = t_linear;
    if (!arc_fractions_.empty() && t > 0.0f && t < 1.0f) {
        float step = 1.0f / static_cast<float>(arc_fractions_.size());
        float cumulative = 0.0f;
        for (size_t i = 0; i < arc_fractions_.size(); i++) {
            float frac = arc_fractions_[i];
            if (cumulative + frac > t) {
                t = static_cast<float>(i) * step + step * ((t - cumulative) / frac);
                break;
            }
            cumulative += frac;
        }
    }
    return std::clamp(t, 0.0f, 1.0f);
}

Vec3 SplinePath::constant_speed_point(float t) const {
    return evaluate(reparameterize_for_constant_speed(t));
}

float SplinePath::length() const {
    const auto& segs = segment_lengths();
    float total = 0.0f;
    for (float len : segs) {
        total += len;
    }
    return total;
}

float SplinePath::waypoints_length_fraction(int from_id, int to_id) const {
    const auto& segs = segment_lengths();
    int count = static_cast<int>(segs.size());

    // Segment k runs from control point k + 1 to k + 2
    int first = std::clamp(from_id - 1, 0, count);
    int last = std::clamp(to_id - 1, 0, count);
    if (last <= first) {
        return 0.0f;
    }

    float total = length();
    if (total <= 0.0f) {
        return static_cast<float>(last - first) / static_cast<float>(count);
    }

    float partial = 0.0f;
    for (int k = first; k < last; k++) {
        partial += segs[static_cast<size_t>(k)];
    }
    return partial / total;
}

void SplinePath::translate(const Vec3& offset) {
    for (Vec3& p : points_) {
        p += offset;
    }
    segment_lengths_.clear();
}

std::vector<Vec3> SplinePath::sample(int count) const {
    count = std::max(count, 1);
    std::vector<Vec3> out;
    out.reserve(static_cast<size_t>(count) + 1);
    for (int i = 0; i <= count; i++) {
        out.push_back(evaluate(static_cast<float>(i) / static_cast<float>(count)));
    }
    return out;
}

const std::vector<float>& SplinePath::segment_lengths() const {
    if (!segment_lengths_.empty()) {
        return segment_lengths_;
    }

    int segments = num_segments();
    segment_lengths_.resize(static_cast<size_t>(segments));
    float seg_span = 1.0f / static_cast<float>(segments);
    for (int k = 0; k < segments; k++) {
        float t0 = static_cast<float>(k) * seg_span;
        Vec3 prev = evaluate(t0);
        float len = 0.0f;
        for (int i = 1; i <= WAYPOINT_LENGTH_SAMPLES; i++) {
            float t = t0 + seg_span * static_cast<float>(i) /
                               static_cast<float>(WAYPOINT_LENGTH_SAMPLES);
            Vec3 curr = evaluate(t);
            len += distance(prev, curr);
            prev = curr;
        }
        segment_lengths_[static_cast<size_t>(k)] = len;
    }
    return segment_lengths_;
}

} // namespace tweenflow
