#pragma once

#include "../config.hpp"
#include "../player/player_types.hpp"
#include "session_types.hpp"
#include <cstdint>
#include <string>

namespace Encore {

/**
 * Decides when playback progress is written and whether a load resumes
 */
class ProgressPolicy {
public:
    explicit ProgressPolicy(const PlaybackConfig& config);

    void update_config(const PlaybackConfig& config);

    /**
     * Resume iff auto-resume is on, the saved position is past the
     * threshold, below the resume ceiling and not marked watched
     */
    bool should_resume(const PlaybackProgress& saved) const;

    /**
     * position/duration above the watched ratio; false for unknown duration
     */
    bool is_watched(int64_t position_ms, int64_t duration_ms) const;

    /**
     * Periodic check: persist when watched or the interval elapsed.
     * Never true for duration_ms <= 0.
     */
    bool should_persist(int64_t position_ms, int64_t duration_ms, int64_t now_ms) const;

    void mark_persisted(int64_t now_ms) { last_persist_ms_ = now_ms; }

    /**
     * Restart the persistence interval, at the start of every load
     */
    void reset(int64_t now_ms) { last_persist_ms_ = now_ms; }

    /**
     * Remote play-queue vocabulary for a transport state.
     * `buffering` is set while playback waits for the network cache.
     */
    static std::string remote_state_tag(PlayerState state, bool watched, bool buffering = false);

private:
    bool auto_resume_;
    int64_t resume_threshold_ms_;
    int64_t interval_ms_;
    double watched_ratio_;
    double resume_ceiling_;
    int64_t last_persist_ms_ = 0;
};

} // namespace Encore
