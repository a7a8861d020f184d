/// @file path_binding.cpp
/// @brief Implements path construction, constant-speed traversal and orientation

#include "tween/path_binding.hpp"

#include "core/log.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace tweenflow {

PathBinding::PathBinding(Property<Vec3> property, std::vector<Vec3> waypoints, bool relative)
    : property_(std::move(property)), waypoints_(std::move(waypoints)), relative_(relative) {
    if (waypoints_.empty()) {
        throw std::invalid_argument("PathBinding requires at least one waypoint");
    }
}

PathBinding& PathBinding::constant_speed(bool enabled) {
    constant_speed_ = enabled;
    return *this;
}

PathBinding& PathBinding::close_path(bool closed) {
    closed_ = closed;
    return *this;
}

PathBinding& PathBinding::orient_to_path(LookAtFn look_at) {
    orient_type_ = OrientType::TO_PATH;
    look_at_ = std::move(look_at);
    return *this;
}

PathBinding& PathBinding::look_at(const Vec3& position, LookAtFn look_at) {
    orient_type_ = OrientType::LOOK_AT_POSITION;
    look_position_ = position;
    look_target_ = nullptr;
    look_at_ = std::move(look_at);
    return *this;
}

PathBinding& PathBinding::look_at(std::function<Vec3()> target_position, LookAtFn look_at) {
    if (!target_position) {
        return *this;
    }
    orient_type_ = OrientType::LOOK_AT_TARGET;
    look_target_ = std::move(target_position);
    look_at_ = std::move(look_at);
    return *this;
}

void PathBinding::on_startup(bool is_from) {
    if (is_from) {
        log_warning("path binding '" + property_.name + "' does not support from tweens");
    }

    if (!partial_control_points_.empty()) {
        path_.emplace(partial_control_points_);
    } else {
        Vec3 current = property_.get();
        std::vector<Vec3> real;
        real.reserve(waypoints_.size() + 1);
        has_additional_start_point_ = false;

        if (relative_) {
            Vec3 diff = waypoints_.front() - current;
            for (const Vec3& p : waypoints_) {
                real.push_back(p - diff);
            }
        } else {
            if (waypoints_.front() != current) {
                real.push_back(current);
                has_additional_start_point_ = true;
            }
            real.insert(real.end(), waypoints_.begin(), waypoints_.end());
        }
        path_ = SplinePath::from_waypoints(real, closed_);
    }

    if (constant_speed_) {
        path_->build_arc_length_table();
    }
}

void PathBinding::apply(float progress) {
    if (!path_) {
        return;
    }
    float t = progress;
    if (constant_speed_) {
        t = path_->reparameterize_for_constant_speed(t);
    }
    t = std::clamp(t, 0.0f, 1.0f);
    path_percentage_ = t;

    Vec3 position = path_->evaluate(t);
    property_.set(position);
    orient(position, t);
}

void PathBinding::orient(const Vec3& position, float path_t) {
    if (!look_at_) {
        return;
    }
    switch (orient_type_) {
    case OrientType::NONE:
        break;
    case OrientType::LOOK_AT_POSITION:
        look_at_(look_position_);
        break;
    case OrientType::LOOK_AT_TARGET:
        look_at_(look_target_());
        break;
    case OrientType::TO_PATH: {
        float next_t = path_t + ORIENT_LOOK_AHEAD;
        look_at_(next_t > 1.0f ? position : path_->evaluate(next_t));
        break;
    }
    }
}

void PathBinding::shift(int loop_delta) {
    // Closed paths end where they start, so there is nothing to shift by
    if (closed_ || !path_) {
        return;
    }
    const auto& pts = path_->control_points();
    Vec3 loop_offset = pts[pts.size() - 2] - pts[1];
    path_->translate(loop_offset * static_cast<float>(loop_delta));
}

float PathBinding::speed_based_duration(float speed) const {
    if (speed <= 0.0f || !path_) {
        return 0.0f;
    }
    return path_->length() / speed;
}

Vec3 PathBinding::constant_point_on_path(float t) {
    if (!path_) {
        return {};
    }
    if (!path_->has_arc_length_table()) {
        path_->build_arc_length_table();
    }
    return path_->constant_speed_point(t);
}

std::unique_ptr<PathBinding> PathBinding::clone_for_partial_path(std::vector<Vec3> control_points) const {
    auto clone = std::make_unique<PathBinding>(property_, waypoints_, relative_);
    clone->partial_control_points_ = std::move(control_points);
    clone->constant_speed_ = constant_speed_;
    clone->orient_type_ = orient_type_;
    clone->look_at_ = look_at_;
    clone->look_position_ = look_position_;
    clone->look_target_ = look_target_;
    copy_ease_override(*clone);
    return clone;
}

} // namespace tweenflow
