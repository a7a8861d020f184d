/// @file tweener.cpp
/// @brief Implements the Tweener update cycle, delay handling and partial paths

#include "tween/tweener.hpp"

#include "core/log.hpp"
#include "path/spline_path.hpp"
#include "tween/overwrite_arbiter.hpp"
#include "tween/path_binding.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

namespace tweenflow {

Tweener::Tweener(std::weak_ptr<void> target, float duration, TweenParams params)
    : target_(std::move(target)), bindings_(std::move(params.bindings)), ease_(params.ease),
      delay_(params.delay), delay_count_(params.delay), is_from_(params.is_from),
      speed_based_(params.speed_based), arbiter_(params.arbiter) {
    if (auto locked = target_.lock()) {
        target_id_ = locked.get();
        tracks_target_ = true;
    }
    for (const auto& binding : bindings_) {
        if (!binding) {
            throw std::invalid_argument("Tweener bindings must not be null");
        }
        binding->init(ease_, duration);
    }

    duration_ = duration;
    speed_ = duration;
    loops_ = params.loops;
    loop_type_ = params.loop_type;
    time_scale_ = params.time_scale;
    auto_kill_on_complete_ = params.auto_kill;
    paused_ = params.paused;
    callbacks_ = std::move(params.callbacks);
    set_full_duration();

    if (is_from_) {
        // From tweens show their start state right away, even while delayed
        advance(0.0f, true, true, true);
    }
}

void Tweener::play(bool skip_delay) {
    if (skip_delay) {
        this->skip_delay();
    }
    play();
}

void Tweener::restart(bool skip_delay) {
    if (full_elapsed_ == 0.0f) {
        if (skip_delay) {
            this->skip_delay();
        }
        play_forward();
    } else {
        rewind_to_start(true, skip_delay);
    }
}

void Tweener::complete() {
    if (destroyed_ || loops_ < 0) {
        return;
    }
    full_elapsed_ = full_duration_;
    delay_count_ = 0.0f;
    elapsed_delay_ = delay_;
    update(0.0f, true);
    if (auto_kill_on_complete_) {
        kill();
    }
}

void Tweener::kill(bool detach) {
    if (destroyed_) {
        return;
    }
    if (arbiter_ != nullptr) {
        arbiter_->remove(*this);
    }
    bindings_.clear();
    original_bindings_.clear();
    Animation::kill(detach);
}

bool Tweener::update(float dt, bool force_update, bool ignore_callbacks) {
    return advance(dt, force_update, ignore_callbacks, false);
}

bool Tweener::advance(float dt, bool force_update, bool ignore_callbacks, bool ignore_delay) {
    if (destroyed_) {
        return true;
    }
    if (tracks_target_ && target_.expired()) {
        kill();
        return true;
    }
    if (complete_ && !reversed_ && !force_update) {
        return true;
    }
    if (full_elapsed_ == 0.0f && reversed_ && !force_update) {
        return false;
    }
    if (paused_ && !force_update) {
        return false;
    }

    ignore_callbacks_ = ignore_callbacks;

    if (ignore_delay || delay_count_ == 0.0f) {
        startup();
        if (!has_started_) {
            on_start();
        }
        float step = reversed_ ? -dt : dt;
        full_elapsed_ = std::clamp(full_elapsed_ + step, 0.0f, full_duration_);
        elapsed_ += step;
    } else {
        // The delay always runs forward and in unscaled time
        if (time_scale_ != 0.0f) {
            elapsed_delay_ += dt / time_scale_;
        }
        if (elapsed_delay_ < delay_count_) {
            ignore_callbacks_ = false;
            return false;
        }
        if (reversed_) {
            full_elapsed_ = elapsed_ = 0.0f;
        } else {
            full_elapsed_ = elapsed_ = elapsed_delay_ - delay_count_;
            full_elapsed_ = std::min(full_elapsed_, full_duration_);
        }
        elapsed_delay_ = delay_count_;
        delay_count_ = 0.0f;
        startup();
        if (!has_started_) {
            on_start();
        }
    }

    bool was_complete = complete_;
    bool step_complete = !reversed_ && !was_complete && elapsed_ >= duration_;
    set_loops_from_elapsed();
    set_elapsed_from_full();
    complete_ = !reversed_ && loops_ >= 0 && completed_loops_ >= loops_;
    bool completed = !was_complete && complete_;

    int loop_delta = consume_incremental_delta();
    if (loop_delta != 0) {
        set_incremental(loop_delta);
    }

    float binding_elapsed = looping_back_ ? duration_ - elapsed_ : elapsed_;
    for (auto& binding : bindings_) {
        bool restore_forward = !looping_back_ && binding->ease_reversed();
        bool invert_back_pass = looping_back_ && loop_type_ == LoopType::YOYO_INVERSE &&
                                !binding->ease_reversed();
        if (restore_forward || invert_back_pass) {
            binding->reverse_ease();
        }
        if (duration_ > 0.0f) {
            binding->update(binding_elapsed);
        } else {
            binding->complete();
            completed = true;
        }
    }

    notify_time_changed();
    if (completed) {
        on_complete();
    } else if (step_complete) {
        on_step_complete();
    }

    ignore_callbacks_ = false;
    return completed;
}

bool Tweener::seek(float time, bool play, bool force_update, bool ignore_callbacks) {
    if (destroyed_) {
        return complete_;
    }
    time = std::clamp(time, 0.0f, full_duration_);
    if (!force_update && full_elapsed_ == time) {
        return complete_;
    }

    full_elapsed_ = time;
    delay_count_ = 0.0f;
    elapsed_delay_ = delay_;
    update(0.0f, true, ignore_callbacks);
    if (!complete_ && play) {
        this->play();
    }
    return complete_;
}

void Tweener::rewind_to_start(bool play, bool skip_delay) {
    if (destroyed_) {
        return;
    }
    startup();
    if (!has_started_) {
        on_start();
    }

    complete_ = false;
    looping_back_ = false;
    delay_count_ = skip_delay ? 0.0f : delay_;
    elapsed_delay_ = skip_delay ? delay_ : 0.0f;
    completed_loops_ = 0;
    full_elapsed_ = elapsed_ = 0.0f;

    int accumulated = reset_incremental();
    if (accumulated != 0) {
        set_incremental(-accumulated);
    }

    for (auto& binding : bindings_) {
        if (binding->ease_reversed()) {
            binding->reverse_ease();
        }
        binding->rewind();
    }

    notify_time_changed();

    if (play) {
        this->play();
    } else {
        pause();
    }
}

void Tweener::skip_delay() {
    if (delay_count_ > 0.0f) {
        delay_count_ = 0.0f;
        elapsed_delay_ = delay_;
        elapsed_ = full_elapsed_ = 0.0f;
    }
}

void Tweener::set_incremental(int loop_delta) {
    for (auto& binding : bindings_) {
        binding->set_incremental(loop_delta);
    }
}

void Tweener::fill_property_bindings(std::vector<PropertyBinding*>& out) {
    for (auto& binding : bindings_) {
        out.push_back(binding.get());
    }
}

bool Tweener::is_linked_to(const void* target) const {
    return !destroyed_ && target != nullptr && target == target_id_;
}

bool Tweener::is_tweening(const void* target) const {
    return !destroyed_ && !paused_ && !complete_ && is_linked_to(target);
}

void Tweener::set_ease(EaseType ease) {
    ease_ = ease;
    for (auto& binding : bindings_) {
        binding->set_ease(ease);
    }
}

void Tweener::on_start() {
    if (callbacks_suppressed()) {
        return;
    }
    if (arbiter_ != nullptr) {
        arbiter_->add(*this);
    }
    Animation::on_start();
}

void Tweener::run_startup(bool force) {
    if (!force && startup_done_) {
        return;
    }
    for (auto& binding : bindings_) {
        binding->startup(is_from_);
    }
    if (speed_based_) {
        apply_speed_based_durations();
    }
    Animation::startup();
}

void Tweener::force_speed_based_duration() {
    if (!speed_based_) {
        return;
    }
    for (auto& binding : bindings_) {
        binding->startup(is_from_);
    }
    apply_speed_based_durations();
}

void Tweener::apply_speed_based_durations() {
    duration_ = 0.0f;
    for (auto& binding : bindings_) {
        float binding_duration = binding->speed_based_duration(speed_);
        binding->set_duration(binding_duration);
        duration_ = std::max(duration_, binding_duration);
    }
    set_full_duration();
}

PathBinding* Tweener::original_path_binding() const {
    const auto& source = original_bindings_.empty() ? bindings_ : original_bindings_;
    for (const auto& binding : source) {
        if (auto* path = dynamic_cast<PathBinding*>(binding.get())) {
            return path;
        }
    }
    return nullptr;
}

int Tweener::waypoint_to_control_point(const PathBinding& binding, int waypoint) const {
    if (waypoint == -1) {
        return 1;
    }
    return waypoint + (binding.has_additional_start_point() ? 2 : 1);
}

Tweener& Tweener::use_partial_path(int from_waypoint, int to_waypoint) {
    PathBinding* source = original_path_binding();
    if (source == nullptr) {
        log_warning("use_partial_path: tween has no path binding");
        return *this;
    }
    if (bindings_.size() > 1) {
        log_warning("use_partial_path: tween drives more than one property");
        return *this;
    }

    startup();
    const SplinePath* path = source->path();
    int id0 = waypoint_to_control_point(*source, from_waypoint);
    int id1 = waypoint_to_control_point(*source, to_waypoint);
    int last_real = static_cast<int>(path->control_points().size()) - 2;
    if (id0 < 1 || id1 > last_real || id1 <= id0) {
        log_warning("use_partial_path: invalid waypoint range " + std::to_string(from_waypoint) +
                    " to " + std::to_string(to_waypoint));
        return *this;
    }

    if (original_bindings_.empty()) {
        original_duration_ = duration_;
        original_bindings_ = std::move(bindings_);
    }
    duration_ = original_duration_ * path->waypoints_length_fraction(id0, id1);

    const auto& pts = path->control_points();
    std::vector<Vec3> section(pts.begin() + (id0 - 1), pts.begin() + (id1 + 2));
    auto partial = source->clone_for_partial_path(std::move(section));
    partial->init(ease_, duration_);

    bindings_.clear();
    bindings_.push_back(std::move(partial));
    set_full_duration();

    run_startup(true);
    if (!paused_) {
        restart(true);
    } else {
        rewind_to_start(false, true);
    }
    return *this;
}

void Tweener::reset_path() {
    if (original_bindings_.empty()) {
        log_warning("reset_path: tween is not using a partial path");
        return;
    }
    duration_ = original_duration_;
    bindings_ = std::move(original_bindings_);
    original_bindings_.clear();
    set_full_duration();

    run_startup(true);
    if (!paused_) {
        restart(true);
    } else {
        rewind_to_start(false, true);
    }
}

Vec3 Tweener::point_on_path(float t) {
    PathBinding* source = original_path_binding();
    if (source == nullptr) {
        return {};
    }
    startup();
    return source->constant_point_on_path(t);
}

} // namespace tweenflow
