#pragma once

#include "../config.hpp"
#include "../scheduler.hpp"
#include "session_types.hpp"
#include <cstdint>
#include <functional>

namespace Encore {

/**
 * Advances the playlist once playback gets close to the end.
 * Fires at most once per playback; reset() re-arms it.
 */
class AutoPlayScheduler {
public:
    enum class Action {
        None,
        LoadNext,       // "load next" scheduled
        NavigateAway    // end of the playlist, "navigate away" scheduled
    };

    AutoPlayScheduler(Scheduler& scheduler, const PlaybackConfig& config);
    ~AutoPlayScheduler();

    AutoPlayScheduler(const AutoPlayScheduler&) = delete;
    AutoPlayScheduler& operator=(const AutoPlayScheduler&) = delete;

    void update_config(const PlaybackConfig& config);

    /**
     * Feed the latest position. context may be null for a standalone item.
     */
    Action on_position(int64_t position_ms, int64_t duration_ms, const PlaylistContext *context,
                       std::function<void()> load_next, std::function<void()> navigate_away);

    /**
     * Cancel the grace timer and re-arm the trigger
     */
    void reset();

    /**
     * Cancel the grace timer only
     */
    void cancel();

    bool has_triggered() const { return triggered_; }
    bool has_pending() const { return timer_.is_pending(); }

private:
    Scheduler& scheduler_;
    double ratio_;
    int64_t next_delay_ms_;
    int64_t end_delay_ms_;
    bool triggered_ = false;
    TimerHandle timer_;
};

} // namespace Encore
