#include "progress_policy.hpp"

namespace Encore {

ProgressPolicy::ProgressPolicy(const PlaybackConfig& config) {
    update_config(config);
}

void ProgressPolicy::update_config(const PlaybackConfig& config) {
    auto_resume_ = config.auto_resume;
    resume_threshold_ms_ = config.resume_threshold_ms;
    interval_ms_ = config.progress_interval_ms;
    watched_ratio_ = config.watched_ratio;
    resume_ceiling_ = config.resume_ceiling;
}

bool ProgressPolicy::should_resume(const PlaybackProgress& saved) const {
    if (!auto_resume_ || saved.watched) return false;
    if (saved.position_ms <= resume_threshold_ms_) return false;
    return saved.percent_complete() < resume_ceiling_;
}

bool ProgressPolicy::is_watched(int64_t position_ms, int64_t duration_ms) const {
    if (duration_ms <= 0) return false;
    return static_cast<double>(position_ms) / static_cast<double>(duration_ms) > watched_ratio_;
}

bool ProgressPolicy::should_persist(int64_t position_ms, int64_t duration_ms, int64_t now_ms) const {
    if (duration_ms <= 0) return false;
    return is_watched(position_ms, duration_ms) || now_ms - last_persist_ms_ >= interval_ms_;
}

std::string ProgressPolicy::remote_state_tag(PlayerState state, bool watched, bool buffering) {
    if (watched) return "stopped";
    if (buffering && state != PlayerState::Stopped) return "buffering";

    switch (state) {
        case PlayerState::Playing: return "playing";
        case PlayerState::Paused: return "paused";
        case PlayerState::Stopped: return "stopped";
        case PlayerState::Loading: return "buffering";
        default: return "playing";
    }
}

} // namespace Encore
