#include "skip_markers.hpp"
#include <glib.h>

namespace Encore {

SkipMarkerManager::SkipMarkerManager(const PlaybackConfig& config) {
    update_config(config);
}

void SkipMarkerManager::update_config(const PlaybackConfig& config) {
    auto_skip_intro_ = config.auto_skip_intro;
    auto_skip_credits_ = config.auto_skip_credits;
    minimum_duration_ms_ = config.minimum_marker_duration_ms;
}

void SkipMarkerManager::load_markers(const MarkerPair& markers) {
    intro_ = SkipWindow{};
    credits_ = SkipWindow{};
    intro_.marker = markers.intro;
    credits_.marker = markers.credits;

    if (markers.intro) {
        g_debug("Intro marker: %lld - %lld ms",
                static_cast<long long>(markers.intro->start_ms),
                static_cast<long long>(markers.intro->end_ms));
    }
    if (markers.credits) {
        g_debug("Credits marker: %lld - %lld ms",
                static_cast<long long>(markers.credits->start_ms),
                static_cast<long long>(markers.credits->end_ms));
    }
}

void SkipMarkerManager::clear_markers() {
    intro_ = SkipWindow{};
    credits_ = SkipWindow{};
}

std::optional<int64_t> SkipMarkerManager::update(int64_t position_ms) {
    std::optional<int64_t> intro_seek = update_window(intro_, auto_skip_intro_, position_ms);
    std::optional<int64_t> credits_seek = update_window(credits_, auto_skip_credits_, position_ms);
    return intro_seek ? intro_seek : credits_seek;
}

std::optional<int64_t> SkipMarkerManager::update_window(SkipWindow& window, bool auto_skip,
                                                        int64_t position_ms) {
    window.visible = window.is_visible_at(position_ms);
    if (!window.visible || !auto_skip) return std::nullopt;

    if (window.marker->duration_ms() < minimum_duration_ms_) return std::nullopt;

    g_info("Auto-skipping to %lld ms", static_cast<long long>(window.marker->end_ms));
    return dismiss(window);
}

std::optional<int64_t> SkipMarkerManager::skip_intro() {
    return dismiss(intro_);
}

std::optional<int64_t> SkipMarkerManager::skip_credits() {
    return dismiss(credits_);
}

std::optional<int64_t> SkipMarkerManager::dismiss(SkipWindow& window) {
    if (!window.marker) return std::nullopt;
    window.user_dismissed = true;
    window.visible = false;
    return window.marker->end_ms;
}

} // namespace Encore
