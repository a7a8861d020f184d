/// @file scheduler.cpp
/// @brief Implements root animation ownership and per-frame updates

#include "timing/scheduler.hpp"

#include "tween/sequence.hpp"
#include "tween/tweener.hpp"

#include <algorithm>
#include <utility>

namespace tweenflow {

Scheduler::~Scheduler() = default;

Tweener& Scheduler::to(std::weak_ptr<void> target, float duration, TweenParams params) {
    auto tweener = std::make_unique<Tweener>(std::move(target), duration, std::move(params));
    Tweener& ref = *tweener;
    add(std::move(tweener));
    return ref;
}

Tweener& Scheduler::from(std::weak_ptr<void> target, float duration, TweenParams params) {
    params.is_from = true;
    return to(std::move(target), duration, std::move(params));
}

Sequence& Scheduler::sequence(const SequenceParams& params) {
    auto seq = std::make_unique<Sequence>(params);
    Sequence& ref = *seq;
    add(std::move(seq));
    return ref;
}

Animation& Scheduler::add(std::unique_ptr<Animation> animation) {
    Animation& ref = *animation;
    ref.set_owner(this);
    roots_.push_back(std::move(animation));
    return ref;
}

void Scheduler::tick(float delta_time) {
    if (mode_ != PlaybackMode::REALTIME && !step_requested_) {
        return;
    }

    float dt = speed_ * delta_time;
    if (step_requested_) {
        dt = STEP_DELTA;
        step_requested_ = false;
    }

    ++updating_;
    // Animations created during this tick start updating on the next one
    size_t count = roots_.size();
    for (size_t i = 0; i < count; i++) {
        Animation* animation = roots_[i].get();
        if (animation == nullptr || animation->is_destroyed()) {
            continue;
        }
        bool completed = animation->update(dt * animation->time_scale());
        if (completed && animation->auto_kill_on_complete()) {
            animation->kill();
        }
    }
    --updating_;

    if (updating_ == 0) {
        sweep();
    }
}

void Scheduler::step() {
    step_requested_ = true;
    if (mode_ == PlaybackMode::REALTIME) {
        mode_ = PlaybackMode::PAUSED;
    }
}

void Scheduler::toggle_pause() {
    if (mode_ == PlaybackMode::PAUSED) {
        mode_ = PlaybackMode::REALTIME;
    } else {
        mode_ = PlaybackMode::PAUSED;
    }
}

void Scheduler::kill_all() {
    ++updating_;
    for (size_t i = 0; i < roots_.size(); i++) {
        if (roots_[i]) {
            roots_[i]->kill(false);
        }
    }
    --updating_;
    if (updating_ == 0) {
        sweep();
    }
}

void Scheduler::pause_all() {
    for (auto& animation : roots_) {
        if (animation && !animation->is_destroyed()) {
            animation->pause();
        }
    }
}

void Scheduler::play_all() {
    for (auto& animation : roots_) {
        if (animation && !animation->is_destroyed()) {
            animation->play();
        }
    }
}

bool Scheduler::is_tweening(const void* target) const {
    return std::any_of(roots_.begin(), roots_.end(), [target](const auto& animation) {
        return animation && animation->is_tweening(target);
    });
}

size_t Scheduler::size() const {
    return static_cast<size_t>(std::count_if(roots_.begin(), roots_.end(), [](const auto& animation) {
        return animation && !animation->is_destroyed();
    }));
}

int Scheduler::find_root(const Animation& animation) const {
    for (size_t i = 0; i < roots_.size(); i++) {
        if (roots_[i].get() == &animation) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

std::unique_ptr<Animation> Scheduler::release(Animation& animation) {
    int index = find_root(animation);
    if (index < 0) {
        return nullptr;
    }
    std::unique_ptr<Animation> released = std::move(roots_[static_cast<size_t>(index)]);
    if (updating_ == 0) {
        roots_.erase(roots_.begin() + index);
    }
    released->set_owner(nullptr);
    return released;
}

void Scheduler::discard(Animation& animation) {
    int index = find_root(animation);
    if (index < 0) {
        return;
    }
    // Destruction waits for the next sweep: the caller may still be running
    graveyard_.push_back(std::move(roots_[static_cast<size_t>(index)]));
    if (updating_ == 0) {
        roots_.erase(roots_.begin() + index);
    }
}

void Scheduler::sweep() {
    roots_.erase(std::remove_if(roots_.begin(), roots_.end(),
                                [](const auto& animation) {
                                    return !animation || animation->is_destroyed();
                                }),
                 roots_.end());
    graveyard_.clear();
}

} // namespace tweenflow
