#include "control_visibility.hpp"
#include <glib.h>
#include <cmath>

namespace Encore {

ControlVisibility::ControlVisibility(Scheduler& scheduler, const PlaybackConfig& config)
    : scheduler_(scheduler) {
    update_config(config);
    transition_to_visible();
}

ControlVisibility::~ControlVisibility() {
    timer_.cancel();
}

void ControlVisibility::update_config(const PlaybackConfig& config) {
    timeout_ms_ = config.controls_timeout_ms;
    move_threshold_ = config.pointer_move_threshold;
}

void ControlVisibility::on_enter() {
    if (state_ == State::Hidden) {
        transition_to_visible();
    }
}

void ControlVisibility::on_leave() {
    transition_to_hidden();
}

void ControlVisibility::on_motion(double x, double y, bool over_controls) {
    if (!exceeds_threshold(x, y)) return;
    last_position_ = std::make_pair(x, y);

    switch (state_) {
        case State::Hidden:
            transition_to_visible();
            break;
        case State::Visible:
            if (over_controls) {
                transition_to_hovering();
            } else {
                transition_to_visible();  // Restart the timer
            }
            break;
        case State::Hovering:
            if (!over_controls) {
                transition_to_visible();
            }
            break;
    }
}

void ControlVisibility::toggle() {
    if (state_ == State::Hidden) {
        transition_to_visible();
    } else {
        transition_to_hidden();
    }
}

void ControlVisibility::set_overlay_open(bool open) {
    if (open) {
        overlay_count_++;
    } else if (overlay_count_ > 0) {
        overlay_count_--;
        // A timer blocked by the overlay has already fired; start a fresh one
        if (overlay_count_ == 0 && state_ == State::Visible && !timer_.is_pending()) {
            transition_to_visible();
        }
    }
}

bool ControlVisibility::exceeds_threshold(double x, double y) const {
    // First movement always counts
    if (!last_position_) return true;

    double dx = x - last_position_->first;
    double dy = y - last_position_->second;
    return std::sqrt(dx * dx + dy * dy) >= move_threshold_;
}

void ControlVisibility::on_timer() {
    // Only Visible owns a timer; anything else means it went stale
    if (state_ != State::Visible) return;
    transition_to_hidden();
}

void ControlVisibility::transition_to_visible() {
    timer_.cancel();
    timer_ = scheduler_.schedule_once(std::chrono::milliseconds(timeout_ms_), [this]() {
        on_timer();
    });
    set_state(State::Visible);
}

void ControlVisibility::transition_to_hovering() {
    timer_.cancel();
    set_state(State::Hovering);
}

void ControlVisibility::transition_to_hidden() {
    if (overlay_count_ > 0) {
        g_debug("Overlay open, keeping controls visible");
        return;
    }
    timer_.cancel();
    set_state(State::Hidden);
}

void ControlVisibility::set_state(State state) {
    bool was_visible = is_visible();
    state_ = state;
    if (callback_ && was_visible != is_visible()) {
        callback_(is_visible());
    }
}

} // namespace Encore
