/// @file animation.cpp
/// @brief Implements loop bookkeeping, playback control and callback dispatch

#include "tween/animation.hpp"

#include <cmath>
#include <limits>

namespace tweenflow {

namespace {

// Tolerance when deciding whether full_elapsed sits exactly on a loop boundary
constexpr float LOOP_BOUNDARY_EPSILON = 0.0000001f;

} // namespace

void Animation::play() { play_if_paused(); }

void Animation::play_forward() {
    reversed_ = false;
    play_if_paused();
}

void Animation::play_backwards() {
    reversed_ = true;
    play_if_paused();
}

void Animation::pause() {
    if (paused_) {
        return;
    }
    paused_ = true;
    on_pause();
}

void Animation::reverse(bool force_play) {
    reversed_ = !reversed_;
    if (force_play) {
        play();
    }
}

void Animation::kill(bool detach) {
    if (destroyed_) {
        return;
    }
    destroyed_ = true;
    if (detach && owner_ != nullptr) {
        owner_->discard(*this);
    }
}

void Animation::set_loops(int loops, LoopType loop_type) {
    loops_ = loops;
    loop_type_ = loop_type;
    set_full_duration();
}

void Animation::startup() { startup_done_ = true; }

void Animation::set_full_duration() {
    full_duration_ = loops_ < 0 ? std::numeric_limits<float>::infinity()
                                : duration_ * static_cast<float>(loops_);
}

void Animation::set_loops_from_elapsed() {
    if (duration_ <= 0.0f) {
        completed_loops_ = 1;
    } else {
        float ratio = full_elapsed_ / duration_;
        float ceiled = std::ceil(ratio);
        completed_loops_ = static_cast<int>(ceiled - ratio < LOOP_BOUNDARY_EPSILON ? ceiled
                                                                                  : ceiled - 1.0f);
    }

    bool odd = completed_loops_ % 2 != 0;
    bool yoyo = loop_type_ == LoopType::YOYO || loop_type_ == LoopType::YOYO_INVERSE;
    if (!yoyo) {
        looping_back_ = false;
    } else if (loops_ > 0) {
        // On the final boundary the direction of the last loop is kept
        looping_back_ = completed_loops_ < loops_ ? odd : !odd;
    } else {
        looping_back_ = loops_ < 0 && odd;
    }
}

void Animation::set_elapsed_from_full() {
    if (duration_ <= 0.0f || (loops_ >= 0 && completed_loops_ >= loops_)) {
        elapsed_ = duration_;
    } else if (full_elapsed_ < duration_) {
        elapsed_ = full_elapsed_;
    } else {
        elapsed_ = std::fmod(full_elapsed_, duration_);
    }
}

int Animation::consume_incremental_delta() {
    if (loop_type_ != LoopType::INCREMENTAL) {
        return -reset_incremental();
    }
    if (prev_incremental_loops_ == completed_loops_) {
        return 0;
    }
    int current = completed_loops_;
    if (loops_ >= 0 && current >= loops_) {
        // The completion loop does not add another increment
        --current;
    }
    int delta = current - prev_incremental_loops_;
    prev_incremental_loops_ = current;
    return delta;
}

int Animation::reset_incremental() {
    int accumulated = prev_incremental_loops_;
    prev_incremental_loops_ = 0;
    return accumulated;
}

void Animation::play_if_paused() {
    if (!paused_) {
        return;
    }
    bool can_advance = reversed_ ? full_elapsed_ > 0.0f : !complete_;
    if (can_advance) {
        paused_ = false;
        on_play();
    }
}

void Animation::on_start() {
    if (callbacks_suppressed()) {
        return;
    }
    has_started_ = true;
    fire(callbacks_.on_start);
}

void Animation::on_update() { fire(callbacks_.on_update); }

void Animation::on_step_complete() { fire(callbacks_.on_step_complete); }

void Animation::on_complete() { fire(callbacks_.on_complete); }

void Animation::on_rewound() { fire(callbacks_.on_rewound); }

void Animation::on_play() { fire(callbacks_.on_play); }

void Animation::on_pause() { fire(callbacks_.on_pause); }

void Animation::notify_time_changed() {
    if (full_elapsed_ != prev_full_elapsed_) {
        on_update();
        if (full_elapsed_ == 0.0f) {
            on_rewound();
        }
    }
    prev_full_elapsed_ = full_elapsed_;
}

void Animation::fire(const Callback& callback) {
    if (callback && !callbacks_suppressed()) {
        callback(*this);
    }
}

} // namespace tweenflow
