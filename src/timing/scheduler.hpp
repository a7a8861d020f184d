/// @file scheduler.hpp
/// @brief Owns root animations and advances them once per frame.
///
/// Each frame the scheduler scales the frame time by its playback speed and by
/// each animation's own time scale, updates every root animation, kills the ones
/// that completed with auto-kill on, and drops killed animations at the end of
/// the tick.

#pragma once

#include "tween/animation.hpp"
#include "tween/params.hpp"

#include <cstddef>
#include <memory>
#include <vector>

namespace tweenflow {

class Sequence;
class Tweener;

/// Scheduler playback mode. PAUSED and STEP only advance through step().
enum class PlaybackMode { REALTIME, PAUSED, STEP };

/// Frame time used by step()
constexpr float STEP_DELTA = 1.0f / 60.0f;

/// Usage:
///   1. Create animations with to() / from() / sequence()
///   2. Each frame, call tick(delta_time)
///   3. References returned by to() and sequence() stay valid until the animation is killed
class Scheduler : public AnimationOwner {
  public:
    Scheduler() = default;
    ~Scheduler() override;

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    /// Creates a tween from the target's current values to the bound ones
    /// @param target Liveness handle (e.g. a shared_ptr to the animated object)
    Tweener& to(std::weak_ptr<void> target, float duration, TweenParams params);

    /// Creates a tween from the bound values to the target's current ones
    Tweener& from(std::weak_ptr<void> target, float duration, TweenParams params);

    /// Creates an empty, paused sequence
    Sequence& sequence(const SequenceParams& params = {});

    /// Takes ownership of an animation built elsewhere
    Animation& add(std::unique_ptr<Animation> animation);

    /// Advances all animations by one frame.
    /// @param delta_time Seconds since last frame
    void tick(float delta_time);

    /// Advances exactly one STEP_DELTA frame on the next tick (pausing realtime playback)
    void step();

    // --- Mode control ---
    void set_mode(PlaybackMode mode) { mode_ = mode; }
    [[nodiscard]] PlaybackMode mode() const { return mode_; }

    /// Toggle between REALTIME and PAUSED
    void toggle_pause();

    // --- Speed control ---
    void set_speed(float speed) { speed_ = speed; }
    [[nodiscard]] float speed() const { return speed_; }

    // --- Bulk control ---
    void kill_all();
    void pause_all();
    void play_all();

    /// Whether any running animation drives target
    [[nodiscard]] bool is_tweening(const void* target) const;

    /// Number of live (not killed) root animations
    [[nodiscard]] size_t size() const;

    // --- AnimationOwner ---
    std::unique_ptr<Animation> release(Animation& animation) override;
    void discard(Animation& animation) override;

  private:
    [[nodiscard]] int find_root(const Animation& animation) const;

    /// Drops released and killed roots, and destroys discarded ones
    void sweep();

    std::vector<std::unique_ptr<Animation>> roots_;
    std::vector<std::unique_ptr<Animation>> graveyard_;
    int updating_ = 0;
    float speed_ = 1.0f;
    PlaybackMode mode_ = PlaybackMode::REALTIME;
    bool step_requested_ = false;
};

} // namespace tweenflow
