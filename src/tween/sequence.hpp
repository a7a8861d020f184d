/// @file sequence.hpp
/// @brief Timeline composing tweens, nested sequences and intervals at start offsets

#pragma once

#include "tween/animation.hpp"
#include "tween/params.hpp"

#include <memory>
#include <vector>

namespace tweenflow {

/// One timeline entry: a member animation, or a pure interval when member is null
struct SequenceItem {
    float start_time = 0.0f;
    float interval = 0.0f;
    std::unique_ptr<Animation> member;
    bool removed = false; ///< Detached during an update, erased once the update ends

    /// Length the item occupies on the timeline (one loop of the member)
    [[nodiscard]] float duration() const { return member ? member->duration() : interval; }
};

/// Plays its members on a shared timeline. Every tick the sequence computes its own
/// local time and seeks each member to (local time - start offset); members that
/// start later are first sent back to their start state.
///
/// Sequences are created paused.
class Sequence : public Animation, public AnimationOwner {
  public:
    explicit Sequence(const SequenceParams& params = {});
    ~Sequence() override;

    [[nodiscard]] AnimationKind kind() const override { return AnimationKind::SEQUENCE; }

    // --- Timeline building (each returns the new duration) ---

    /// Adds member at the current end of the timeline
    float append(std::unique_ptr<Animation> member);
    /// Takes member over from its current owner and appends it
    float append(Animation& member);
    float append_interval(float duration);

    /// Adds member at time zero, shifting existing items later by its duration
    float prepend(std::unique_ptr<Animation> member);
    float prepend(Animation& member);
    float prepend_interval(float duration);

    /// Adds member at time, before any item starting at or after it
    float insert(float time, std::unique_ptr<Animation> member);
    float insert(float time, Animation& member);
    float insert_interval(float time, float duration);

    /// Kills member and drops its item. A sequence left empty kills itself.
    void remove(Animation& member);

    [[nodiscard]] const std::vector<SequenceItem>& items() const { return items_; }

    // --- Animation ---
    void rewind() override { rewind_to_start(false); }
    void restart() override;
    void complete() override;

    using Animation::kill;
    void kill(bool detach) override;

    bool update(float dt, bool force_update = false, bool ignore_callbacks = false) override;
    bool seek(float time, bool play, bool force_update, bool ignore_callbacks) override;
    void set_incremental(int loop_delta) override;
    void fill_property_bindings(std::vector<PropertyBinding*>& out) override;
    [[nodiscard]] bool is_linked_to(const void* target) const override;
    [[nodiscard]] bool is_tweening(const void* target) const override;
    void set_steady_ignore_callbacks(bool ignore) override;

    // --- AnimationOwner ---
    std::unique_ptr<Animation> release(Animation& animation) override;
    void discard(Animation& animation) override;

  protected:
    void startup() override;

  private:
    enum class Placement { APPEND, PREPEND, INSERT };

    float add_item(Placement placement, float time, std::unique_ptr<Animation> member,
                   float interval);

    /// Releases member from its current owner, or returns nullptr with a warning
    std::unique_ptr<Animation> take_over(Animation& member);

    void adopt(Animation& member);
    void rewind_to_start(bool play);

    /// Applies every member once (forward, then rewound in reverse) with callbacks off
    void startup_iteration();

    [[nodiscard]] int find_item(const Animation& member) const;
    std::unique_ptr<Animation> detach_item(int index);

    void begin_member_pass() { ++updating_; }
    /// Erases items detached during the pass; kills the sequence if none are left
    void end_member_pass();

    std::vector<SequenceItem> items_;
    std::vector<std::unique_ptr<Animation>> graveyard_; // Killed members awaiting destruction
    int updating_ = 0;
    bool check_empty_ = false; // A member was discarded during the current pass
};

} // namespace tweenflow
