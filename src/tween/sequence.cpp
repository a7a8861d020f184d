/// @file sequence.cpp
/// @brief Implements timeline placement and the two-pass member update

#include "tween/sequence.hpp"

#include "core/log.hpp"
#include "tween/tweener.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace tweenflow {

Sequence::Sequence(const SequenceParams& params) {
    loops_ = params.loops;
    loop_type_ = params.loop_type;
    time_scale_ = params.time_scale;
    auto_kill_on_complete_ = params.auto_kill;
    callbacks_ = params.callbacks;
    paused_ = true;
    set_full_duration();
}

Sequence::~Sequence() = default;

// --- Timeline building ---

float Sequence::append(std::unique_ptr<Animation> member) {
    if (!member) {
        log_warning("Sequence::append: null member ignored");
        return duration_;
    }
    return add_item(Placement::APPEND, 0.0f, std::move(member), 0.0f);
}

float Sequence::append(Animation& member) {
    auto owned = take_over(member);
    return owned ? add_item(Placement::APPEND, 0.0f, std::move(owned), 0.0f) : duration_;
}

float Sequence::append_interval(float duration) {
    return add_item(Placement::APPEND, 0.0f, nullptr, duration);
}

float Sequence::prepend(std::unique_ptr<Animation> member) {
    if (!member) {
        log_warning("Sequence::prepend: null member ignored");
        return duration_;
    }
    return add_item(Placement::PREPEND, 0.0f, std::move(member), 0.0f);
}

float Sequence::prepend(Animation& member) {
    auto owned = take_over(member);
    return owned ? add_item(Placement::PREPEND, 0.0f, std::move(owned), 0.0f) : duration_;
}

float Sequence::prepend_interval(float duration) {
    return add_item(Placement::PREPEND, 0.0f, nullptr, duration);
}

float Sequence::insert(float time, std::unique_ptr<Animation> member) {
    if (!member) {
        log_warning("Sequence::insert: null member ignored");
        return duration_;
    }
    return add_item(Placement::INSERT, time, std::move(member), 0.0f);
}

float Sequence::insert(float time, Animation& member) {
    auto owned = take_over(member);
    return owned ? add_item(Placement::INSERT, time, std::move(owned), 0.0f) : duration_;
}

float Sequence::insert_interval(float time, float duration) {
    return add_item(Placement::INSERT, time, nullptr, duration);
}

float Sequence::add_item(Placement placement, float time, std::unique_ptr<Animation> member,
                         float interval) {
    if (!member && interval < 0.0f) {
        throw std::invalid_argument("Sequence interval must not be negative");
    }
    if (time < 0.0f) {
        log_warning("Sequence::insert: negative time clamped to 0");
        time = 0.0f;
    }
    if (member) {
        adopt(*member);
    }

    SequenceItem item;
    item.interval = interval;
    item.member = std::move(member);
    float item_duration = item.duration();

    switch (placement) {
    case Placement::APPEND:
        item.start_time = duration_;
        items_.push_back(std::move(item));
        duration_ += item_duration;
        break;
    case Placement::PREPEND:
        for (auto& existing : items_) {
            existing.start_time += item_duration;
        }
        item.start_time = 0.0f;
        items_.insert(items_.begin(), std::move(item));
        duration_ += item_duration;
        break;
    case Placement::INSERT: {
        item.start_time = time;
        auto pos = std::find_if(items_.begin(), items_.end(),
                                [time](const SequenceItem& existing) { return existing.start_time >= time; });
        items_.insert(pos, std::move(item));
        duration_ = std::max(time + item_duration, duration_);
        break;
    }
    }

    set_full_duration();
    return duration_;
}

std::unique_ptr<Animation> Sequence::take_over(Animation& member) {
    if (&member == this) {
        log_warning("a sequence cannot contain itself");
        return nullptr;
    }
    // Adding an ancestor would create a cycle
    for (AnimationOwner* owner = owner_; owner != nullptr;) {
        auto* ancestor = dynamic_cast<Animation*>(owner);
        if (ancestor == nullptr) {
            break;
        }
        if (ancestor == &member) {
            log_warning("a sequence cannot contain one of its parents");
            return nullptr;
        }
        owner = ancestor->owner();
    }
    if (member.is_destroyed()) {
        log_warning("cannot add a killed animation to a sequence");
        return nullptr;
    }
    AnimationOwner* current = member.owner();
    std::unique_ptr<Animation> owned = current != nullptr ? current->release(member) : nullptr;
    if (!owned) {
        log_warning("animation is not owned by a scheduler or sequence; pass ownership instead");
    }
    return owned;
}

void Sequence::adopt(Animation& member) {
    member.set_owner(this);
    if (member.kind() == AnimationKind::TWEENER) {
        static_cast<Tweener&>(member).force_speed_based_duration();
    }
    if (steady_ignore_callbacks_) {
        member.set_steady_ignore_callbacks(true);
    }
}

void Sequence::remove(Animation& member) {
    if (find_item(member) < 0) {
        log_warning("Sequence::remove: animation is not a member");
        return;
    }
    member.kill();
}

// --- Ownership ---

int Sequence::find_item(const Animation& member) const {
    for (size_t i = 0; i < items_.size(); i++) {
        if (!items_[i].removed && items_[i].member.get() == &member) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

std::unique_ptr<Animation> Sequence::detach_item(int index) {
    auto it = items_.begin() + index;
    std::unique_ptr<Animation> member = std::move(it->member);
    if (updating_ > 0) {
        it->removed = true;
    } else {
        items_.erase(it);
    }
    return member;
}

std::unique_ptr<Animation> Sequence::release(Animation& animation) {
    int index = find_item(animation);
    if (index < 0) {
        return nullptr;
    }
    auto member = detach_item(index);
    member->set_owner(nullptr);
    return member;
}

void Sequence::discard(Animation& animation) {
    int index = find_item(animation);
    if (index < 0) {
        return;
    }
    graveyard_.push_back(detach_item(index));
    if (updating_ > 0) {
        check_empty_ = true;
        return;
    }
    if (items_.empty()) {
        kill(true);
    }
}

void Sequence::end_member_pass() {
    if (--updating_ > 0) {
        return;
    }
    items_.erase(std::remove_if(items_.begin(), items_.end(),
                                [](const SequenceItem& item) { return item.removed; }),
                 items_.end());
    graveyard_.clear();

    bool emptied = check_empty_ && items_.empty();
    check_empty_ = false;
    if (emptied) {
        kill(true);
    }
}

// --- Animation ---

void Sequence::restart() {
    if (full_elapsed_ == 0.0f) {
        play_forward();
    } else {
        rewind_to_start(true);
    }
}

void Sequence::complete() {
    if (destroyed_ || items_.empty() || loops_ < 0) {
        return;
    }
    full_elapsed_ = full_duration_;
    update(0.0f, true);
    if (auto_kill_on_complete_) {
        kill();
    }
}

void Sequence::kill(bool detach) {
    if (destroyed_) {
        return;
    }
    // Members stay owned (and are destroyed) with the sequence
    for (auto& item : items_) {
        if (item.member) {
            item.member->kill(false);
        }
    }
    Animation::kill(detach);
}

bool Sequence::update(float dt, bool force_update, bool ignore_callbacks) {
    if (destroyed_ || items_.empty()) {
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

    float step = reversed_ ? -dt : dt;
    full_elapsed_ = std::clamp(full_elapsed_ + step, 0.0f, full_duration_);
    elapsed_ += step;

    startup();
    if (!has_started_) {
        on_start();
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

    float local = looping_back_ ? duration_ - elapsed_ : elapsed_;

    begin_member_pass();
    // Members that have not started yet at this local time go back to their start state
    for (size_t i = items_.size(); i-- > 0;) {
        Animation* member = items_[i].member.get();
        if (member != nullptr && items_[i].start_time > local) {
            member->seek(local - items_[i].start_time, false, force_update, true);
        }
    }
    for (size_t i = 0; i < items_.size(); i++) {
        Animation* member = items_[i].member.get();
        if (member != nullptr && items_[i].start_time <= local) {
            member->seek(local - items_[i].start_time, false, force_update, ignore_callbacks_);
        }
    }

    notify_time_changed();
    if (completed) {
        on_complete();
    } else if (step_complete) {
        on_step_complete();
    }

    ignore_callbacks_ = false;
    end_member_pass();
    return completed;
}

bool Sequence::seek(float time, bool play, bool force_update, bool ignore_callbacks) {
    if (destroyed_) {
        return complete_;
    }
    time = std::clamp(time, 0.0f, full_duration_);
    if (!force_update && full_elapsed_ == time) {
        return complete_;
    }
    full_elapsed_ = time;
    update(0.0f, true, ignore_callbacks);
    if (!complete_ && play) {
        this->play();
    }
    return complete_;
}

void Sequence::rewind_to_start(bool play) {
    if (destroyed_ || items_.empty()) {
        return;
    }
    startup();
    if (!has_started_) {
        on_start();
    }

    complete_ = false;
    looping_back_ = false;
    completed_loops_ = 0;
    full_elapsed_ = elapsed_ = 0.0f;

    int accumulated = reset_incremental();
    if (accumulated != 0) {
        set_incremental(-accumulated);
    }

    begin_member_pass();
    for (size_t i = items_.size(); i-- > 0;) {
        if (Animation* member = items_[i].member.get()) {
            member->rewind();
        }
    }
    end_member_pass();

    notify_time_changed();
    if (play) {
        this->play();
    } else {
        pause();
    }
}

void Sequence::startup() {
    if (startup_done_) {
        return;
    }
    Animation::startup();
    startup_iteration();
}

void Sequence::startup_iteration() {
    bool set_steady = !steady_ignore_callbacks_;
    if (set_steady) {
        set_steady_ignore_callbacks(true);
    }

    begin_member_pass();
    for (size_t i = 0; i < items_.size(); i++) {
        if (Animation* member = items_[i].member.get()) {
            member->update(member->duration(), true, true);
        }
    }
    for (size_t i = items_.size(); i-- > 0;) {
        if (Animation* member = items_[i].member.get()) {
            member->rewind();
        }
    }
    end_member_pass();

    if (set_steady) {
        set_steady_ignore_callbacks(false);
    }
}

void Sequence::set_incremental(int loop_delta) {
    for (auto& item : items_) {
        if (item.member) {
            item.member->set_incremental(loop_delta);
        }
    }
}

void Sequence::fill_property_bindings(std::vector<PropertyBinding*>& out) {
    for (auto& item : items_) {
        if (item.member) {
            item.member->fill_property_bindings(out);
        }
    }
}

bool Sequence::is_linked_to(const void* target) const {
    return std::any_of(items_.begin(), items_.end(), [target](const SequenceItem& item) {
        return item.member && item.member->is_linked_to(target);
    });
}

bool Sequence::is_tweening(const void* target) const {
    return !destroyed_ && !paused_ && !complete_ && is_linked_to(target);
}

void Sequence::set_steady_ignore_callbacks(bool ignore) {
    Animation::set_steady_ignore_callbacks(ignore);
    for (auto& item : items_) {
        if (item.member) {
            item.member->set_steady_ignore_callbacks(ignore);
        }
    }
}

} // namespace tweenflow
