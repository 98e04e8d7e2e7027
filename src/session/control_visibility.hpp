#pragma once

#include "../config.hpp"
#include "../scheduler.hpp"
#include <cstdint>
#include <functional>
#include <optional>
#include <utility>

namespace Encore {

/**
 * On-screen control visibility driven by pointer activity
 *
 *   Hidden   - controls and cursor hidden
 *   Visible  - shown, inactivity timer running
 *   Hovering - shown because the pointer is over the controls, no timer
 *
 * While an overlay (menu, popover) is open nothing hides the controls.
 */
class ControlVisibility {
public:
    enum class State {
        Hidden,
        Visible,
        Hovering
    };

    using VisibilityChangedCallback = std::function<void(bool visible)>;

    /**
     * Starts in Visible with the inactivity timer running
     */
    ControlVisibility(Scheduler& scheduler, const PlaybackConfig& config);
    ~ControlVisibility();

    ControlVisibility(const ControlVisibility&) = delete;
    ControlVisibility& operator=(const ControlVisibility&) = delete;

    void update_config(const PlaybackConfig& config);

    void on_enter();
    void on_leave();
    void on_motion(double x, double y, bool over_controls);
    void toggle();

    /**
     * Track an overlay opening (true) or closing (false); calls nest
     */
    void set_overlay_open(bool open);

    State state() const { return state_; }
    bool is_visible() const { return state_ != State::Hidden; }
    bool has_timer() const { return timer_.is_pending(); }
    int overlay_count() const { return overlay_count_; }

    void on_visibility_changed(VisibilityChangedCallback callback) { callback_ = std::move(callback); }

private:
    Scheduler& scheduler_;
    State state_ = State::Visible;
    TimerHandle timer_;
    std::optional<std::pair<double, double>> last_position_;
    int overlay_count_ = 0;
    int64_t timeout_ms_;
    double move_threshold_;
    VisibilityChangedCallback callback_;

    bool exceeds_threshold(double x, double y) const;
    void on_timer();

    void transition_to_visible();
    void transition_to_hovering();
    void transition_to_hidden();
    void set_state(State state);
};

} // namespace Encore
