/// @file animation.hpp
/// @brief Shared timeline state machine for tweens and sequences.
///
/// An Animation tracks elapsed time within one loop and across all loops,
/// resolves loop boundaries (Restart, Yoyo, YoyoInverse, Incremental) and
/// fires lifecycle callbacks. Tweener and Sequence supply what an update
/// actually drives.

#pragma once

#include <functional>
#include <memory>
#include <vector>

namespace tweenflow {

class Animation;
class PropertyBinding;

/// How consecutive loops are played
enum class LoopType { RESTART, YOYO, YOYO_INVERSE, INCREMENTAL };

/// Concrete animation variant
enum class AnimationKind { TWEENER, SEQUENCE };

using Callback = std::function<void(Animation&)>;

/// Lifecycle hooks. Each receives the animation that fired it.
struct AnimationCallbacks {
    Callback on_start;         ///< First time the animation starts updating
    Callback on_update;        ///< Whenever full elapsed time changed during an update
    Callback on_step_complete; ///< Each completed loop except the last
    Callback on_complete;      ///< Reached the end of the last loop
    Callback on_rewound;       ///< Returned to time zero
    Callback on_play;
    Callback on_pause;
};

/// Exclusive owner of animations (the scheduler, or a sequence for its members).
class AnimationOwner {
  public:
    virtual ~AnimationOwner() = default;

    /// Hands ownership of a member to the caller without killing it.
    /// Returns nullptr if the animation is not owned here.
    virtual std::unique_ptr<Animation> release(Animation& animation) = 0;

    /// Called by a member that killed itself with detach. The owner destroys it,
    /// deferred to the end of the current tick if it is mid-update.
    virtual void discard(Animation& animation) = 0;
};

class Animation {
  public:
    virtual ~Animation() = default;

    Animation(const Animation&) = delete;
    Animation& operator=(const Animation&) = delete;

    [[nodiscard]] virtual AnimationKind kind() const = 0;

    // --- Playback control ---

    /// Resumes if progress is possible in the current direction
    void play();
    void play_forward();
    void play_backwards();
    void pause();

    /// Flips the playback direction
    /// @param force_play Also resume if paused
    void reverse(bool force_play = false);

    /// Back to time zero, paused
    virtual void rewind() = 0;

    /// Back to time zero and playing
    virtual void restart() = 0;

    /// Jumps to the end of the last loop (finite loops only). Kills when auto-kill is on.
    virtual void complete() = 0;

    /// Stops the animation for good and hands it to its owner for destruction.
    /// Any pointer or reference to it is invalid afterwards.
    void kill() { kill(true); }

    /// @param detach Notify the owner; false when the owner is already dropping it
    virtual void kill(bool detach);

    /// Seeks to time (clamped to [0, full duration]) without changing paused state.
    /// @return Whether the animation is complete afterwards
    bool go_to(float time) { return seek(time, false, false, false); }

    /// Seeks to time and plays unless complete
    bool go_to_and_play(float time) { return seek(time, true, false, false); }

    // --- Engine interface (driven by owners) ---

    /// Advances by dt seconds.
    /// @param force_update Update even if paused or complete
    /// @param ignore_callbacks Suppress callbacks for this update
    /// @return true on the tick that completes the animation, and for destroyed animations
    virtual bool update(float dt, bool force_update = false, bool ignore_callbacks = false) = 0;

    /// Forced seek used by sequences and go_to()
    virtual bool seek(float time, bool play, bool force_update, bool ignore_callbacks) = 0;

    /// Shifts all values by loop_delta loop widths
    virtual void set_incremental(int loop_delta) = 0;

    /// Appends every binding driven by this animation (recursively for sequences)
    virtual void fill_property_bindings(std::vector<PropertyBinding*>& out) = 0;

    /// Whether target is (or is inside) this animation's target
    [[nodiscard]] virtual bool is_linked_to(const void* target) const = 0;

    /// Whether target is animated by this animation and it is currently running
    [[nodiscard]] virtual bool is_tweening(const void* target) const = 0;

    // --- Settings ---
    void set_loops(int loops, LoopType loop_type);
    void set_loops(int loops) { set_loops(loops, loop_type_); }
    void set_loop_type(LoopType loop_type) { loop_type_ = loop_type; }
    void set_time_scale(float time_scale) { time_scale_ = time_scale; }
    void set_auto_kill_on_complete(bool auto_kill) { auto_kill_on_complete_ = auto_kill; }
    [[nodiscard]] AnimationCallbacks& callbacks() { return callbacks_; }

    /// Suppresses callbacks until cleared (sequences propagate it to members)
    virtual void set_steady_ignore_callbacks(bool ignore) { steady_ignore_callbacks_ = ignore; }

    // --- State ---
    [[nodiscard]] float duration() const { return duration_; }
    [[nodiscard]] float full_duration() const { return full_duration_; }
    [[nodiscard]] float elapsed() const { return elapsed_; }
    [[nodiscard]] float full_elapsed() const { return full_elapsed_; }
    [[nodiscard]] int completed_loops() const { return completed_loops_; }
    [[nodiscard]] int loops() const { return loops_; }
    [[nodiscard]] LoopType loop_type() const { return loop_type_; }
    [[nodiscard]] float time_scale() const { return time_scale_; }
    [[nodiscard]] bool auto_kill_on_complete() const { return auto_kill_on_complete_; }
    [[nodiscard]] bool is_paused() const { return paused_; }
    [[nodiscard]] bool is_complete() const { return complete_; }
    [[nodiscard]] bool is_reversed() const { return reversed_; }
    [[nodiscard]] bool is_looping_back() const { return looping_back_; }
    [[nodiscard]] bool has_started() const { return has_started_; }
    [[nodiscard]] bool is_destroyed() const { return destroyed_; }

    /// Current owner (scheduler or containing sequence), or nullptr
    [[nodiscard]] AnimationOwner* owner() const { return owner_; }
    void set_owner(AnimationOwner* owner) { owner_ = owner; }

  protected:
    Animation() = default;

    /// One-time initialization before the first update
    virtual void startup();

    /// Recomputes full_duration from duration and loops (infinite for loops < 0)
    void set_full_duration();

    /// Recomputes completed_loops and is_looping_back from full_elapsed
    void set_loops_from_elapsed();

    /// Recomputes the in-loop elapsed time from full_elapsed
    void set_elapsed_from_full();

    /// Loop delta to apply for Incremental loops since the last call.
    /// Returns the negative accumulated delta once when the loop type changed away.
    [[nodiscard]] int consume_incremental_delta();

    /// Forgets the accumulated Incremental delta, returning it
    int reset_incremental();

    /// Unpauses (and fires on_play) when progress is possible
    void play_if_paused();

    [[nodiscard]] bool callbacks_suppressed() const {
        return ignore_callbacks_ || steady_ignore_callbacks_;
    }

    virtual void on_start();
    void on_update();
    void on_step_complete();
    void on_complete();
    void on_rewound();
    void on_play();
    void on_pause();

    /// Fires on_update (and on_rewound at zero) if full_elapsed moved since the last check
    void notify_time_changed();

    float duration_ = 0.0f;
    float full_duration_ = 0.0f;
    float elapsed_ = 0.0f;
    float full_elapsed_ = 0.0f;
    float prev_full_elapsed_ = 0.0f;
    int completed_loops_ = 0;
    int prev_incremental_loops_ = 0;
    int loops_ = 1;
    LoopType loop_type_ = LoopType::RESTART;
    float time_scale_ = 1.0f;
    bool auto_kill_on_complete_ = true;

    bool paused_ = false;
    bool complete_ = false;
    bool reversed_ = false;
    bool looping_back_ = false;
    bool has_started_ = false;
    bool startup_done_ = false;
    bool destroyed_ = false;
    bool ignore_callbacks_ = false;
    bool steady_ignore_callbacks_ = false;

    AnimationCallbacks callbacks_;
    AnimationOwner* owner_ = nullptr; // Non-owning back pointer

  private:
    void fire(const Callback& callback);
};

} // namespace tweenflow
