/// @file tweener.hpp
/// @brief A single animation driving one target's properties over time

#pragma once

#include "math/vec3.hpp"
#include "tween/animation.hpp"
#include "tween/params.hpp"

#include <memory>
#include <vector>

namespace tweenflow {

class PathBinding;

class Tweener : public Animation {
  public:
    /// @param target Liveness handle of the animated object. The tween kills itself
    ///               on the first update after the target expires. An empty handle
    ///               means the tween is not tied to an object.
    /// @param duration Seconds per loop (units per second when params.speed_based)
    /// @throws std::invalid_argument if a binding is null
    Tweener(std::weak_ptr<void> target, float duration, TweenParams params);

    [[nodiscard]] AnimationKind kind() const override { return AnimationKind::TWEENER; }

    using Animation::play;
    /// @param skip_delay Start immediately even if the delay has not elapsed
    void play(bool skip_delay);

    void rewind() override { rewind_to_start(false, false); }
    void rewind(bool skip_delay) { rewind_to_start(false, skip_delay); }
    void restart() override { restart(false); }
    void restart(bool skip_delay);
    void complete() override;

    using Animation::kill;
    void kill(bool detach) override;

    bool update(float dt, bool force_update = false, bool ignore_callbacks = false) override;
    bool seek(float time, bool play, bool force_update, bool ignore_callbacks) override;
    void set_incremental(int loop_delta) override;
    void fill_property_bindings(std::vector<PropertyBinding*>& out) override;
    [[nodiscard]] bool is_linked_to(const void* target) const override;
    [[nodiscard]] bool is_tweening(const void* target) const override;

    /// Changes the ease of every binding
    void set_ease(EaseType ease);
    [[nodiscard]] EaseType ease() const { return ease_; }

    // --- Path helpers (no-ops with a warning when there is no path binding) ---

    /// Restricts the path binding to the section between two waypoints and
    /// restarts (or rewinds, when paused). Duration scales with the section's length.
    /// @param from_waypoint Waypoint index, or -1 for the path's actual first point
    /// @param to_waypoint Waypoint index
    Tweener& use_partial_path(int from_waypoint, int to_waypoint);

    /// Restores the full path and duration after use_partial_path
    void reset_path();

    /// Point at constant-speed percentage t of the full path (origin without a path)
    [[nodiscard]] Vec3 point_on_path(float t);

    /// Computes the speed-based duration now instead of at startup
    void force_speed_based_duration();

    [[nodiscard]] float delay() const { return delay_; }
    [[nodiscard]] float elapsed_delay() const { return elapsed_delay_; }
    [[nodiscard]] bool is_from() const { return is_from_; }
    [[nodiscard]] bool is_speed_based() const { return speed_based_; }
    [[nodiscard]] bool has_partial_path() const { return !original_bindings_.empty(); }
    [[nodiscard]] const std::vector<std::unique_ptr<PropertyBinding>>& bindings() const {
        return bindings_;
    }

  protected:
    void startup() override { run_startup(false); }
    void on_start() override;

  private:
    void run_startup(bool force);
    bool advance(float dt, bool force_update, bool ignore_callbacks, bool ignore_delay);
    void rewind_to_start(bool play, bool skip_delay);
    void skip_delay();
    void apply_speed_based_durations();

    /// The path binding of the full (non-partial) path
    [[nodiscard]] PathBinding* original_path_binding() const;
    [[nodiscard]] int waypoint_to_control_point(const PathBinding& binding, int waypoint) const;

    std::weak_ptr<void> target_;
    const void* target_id_ = nullptr;
    bool tracks_target_ = false;

    std::vector<std::unique_ptr<PropertyBinding>> bindings_;
    std::vector<std::unique_ptr<PropertyBinding>> original_bindings_; // Archived by partial paths
    float original_duration_ = 0.0f;

    EaseType ease_;
    float delay_;
    float delay_count_;
    float elapsed_delay_ = 0.0f;
    bool is_from_;
    bool speed_based_;
    float speed_ = 0.0f;
    OverwriteArbiter* arbiter_;
};

} // namespace tweenflow
