#include "auto_play.hpp"
#include <glib.h>

namespace Encore {

AutoPlayScheduler::AutoPlayScheduler(Scheduler& scheduler, const PlaybackConfig& config)
    : scheduler_(scheduler) {
    update_config(config);
}

AutoPlayScheduler::~AutoPlayScheduler() {
    timer_.cancel();
}

void AutoPlayScheduler::update_config(const PlaybackConfig& config) {
    ratio_ = config.auto_play_ratio;
    next_delay_ms_ = config.auto_play_next_delay_ms;
    end_delay_ms_ = config.auto_play_end_delay_ms;
}

AutoPlayScheduler::Action AutoPlayScheduler::on_position(int64_t position_ms, int64_t duration_ms,
                                                         const PlaylistContext *context,
                                                         std::function<void()> load_next,
                                                         std::function<void()> navigate_away) {
    if (triggered_ || duration_ms <= 0) return Action::None;

    double progress = static_cast<double>(position_ms) / static_cast<double>(duration_ms);
    if (progress <= ratio_) return Action::None;

    triggered_ = true;

    if (!context || !context->is_auto_play_enabled()) {
        g_debug("Auto-play not enabled, letting playback finish");
        return Action::None;
    }

    if (context->has_next()) {
        g_info("Auto-play: next item in %lld ms", static_cast<long long>(next_delay_ms_));
        timer_ = scheduler_.schedule_once(std::chrono::milliseconds(next_delay_ms_),
                                          std::move(load_next));
        return Action::LoadNext;
    }

    g_info("Auto-play: end of playlist, leaving in %lld ms", static_cast<long long>(end_delay_ms_));
    timer_ = scheduler_.schedule_once(std::chrono::milliseconds(end_delay_ms_),
                                      std::move(navigate_away));
    return Action::NavigateAway;
}

void AutoPlayScheduler::reset() {
    timer_.cancel();
    triggered_ = false;
}

void AutoPlayScheduler::cancel() {
    timer_.cancel();
}

} // namespace Encore
