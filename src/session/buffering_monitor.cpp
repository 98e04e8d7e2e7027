#include "buffering_monitor.hpp"
#include <glib.h>
#include <algorithm>

namespace Encore {

namespace {

constexpr int kSevereBufferPercent = 10;

double to_mbps(int64_t bytes_per_second) {
    return static_cast<double>(bytes_per_second) * 8.0 / 1000000.0;
}

} // namespace

BufferingWarning BufferingWarning::slow_download(int64_t download_bps, int64_t bitrate_bps) {
    g_autofree gchar *message = g_strdup_printf(
        "Download speed (%.1f Mbps) is slower than required (%.1f Mbps)",
        to_mbps(download_bps), to_mbps(bitrate_bps));
    return {Kind::SlowDownload, Severity::Warning, message,
            "Try pausing playback briefly to allow more buffering"};
}

BufferingWarning BufferingWarning::critically_low(int percentage) {
    g_autofree gchar *message = g_strdup_printf("Buffer level critically low (%d%%)", percentage);
    return {Kind::CriticallyLowBuffer,
            percentage < kSevereBufferPercent ? Severity::Critical : Severity::Warning,
            message,
            "Playback may stall soon. Consider pausing to buffer."};
}

BufferingWarning BufferingWarning::stalled() {
    return {Kind::BufferingStalled, Severity::Critical,
            "Buffering appears to be stalled",
            "Check your network connection or try reloading"};
}

bool is_download_too_slow(int64_t download_bps, int64_t bitrate_bps, double margin) {
    if (download_bps <= 0 || bitrate_bps <= 0) return false;
    return static_cast<double>(download_bps) < static_cast<double>(bitrate_bps) * margin;
}

bool is_buffer_critically_low(int percentage, int threshold) {
    return percentage > 0 && percentage < threshold;
}

bool is_buffering_stalled(int current, int previous, int64_t unchanged_ms, int64_t threshold_ms) {
    if (current <= 0 || current >= 100) return false;
    return current == previous && unchanged_ms >= threshold_ms;
}

std::vector<BufferingWarning> detect_warnings(const BufferingStatus& status, const PlaybackConfig& config) {
    std::vector<BufferingWarning> warnings;
    if (is_download_too_slow(status.download_speed_bps, status.bitrate_bps, config.download_safety_margin)) {
        warnings.push_back(BufferingWarning::slow_download(status.download_speed_bps, status.bitrate_bps));
    }
    if (is_buffer_critically_low(status.percentage, config.critical_buffer_percent)) {
        warnings.push_back(BufferingWarning::critically_low(status.percentage));
    }
    return warnings;
}

BufferingMonitor::BufferingMonitor(const PlaybackConfig& config)
    : config_(config) {
}

std::vector<BufferingWarning> BufferingMonitor::update(const BufferingStatus& status, int64_t now_ms) {
    if (!status.paused_for_cache) {
        if (buffering_) g_debug("Buffering finished at %d%%", status.percentage);
        reset();
        percentage_ = status.percentage;
        return {};
    }

    if (!buffering_) {
        g_debug("Buffering started at %d%%", status.percentage);
        buffering_ = true;
        percentage_ = status.percentage;
        unchanged_since_ms_ = now_ms;
        reported_.clear();
    }

    int previous = percentage_;
    if (status.percentage != percentage_) {
        percentage_ = status.percentage;
        unchanged_since_ms_ = now_ms;
    }

    std::vector<BufferingWarning> candidates;
    if (is_buffering_stalled(status.percentage, previous, now_ms - unchanged_since_ms_,
                             config_.buffer_stall_threshold_ms)) {
        candidates.push_back(BufferingWarning::stalled());
    }
    for (auto& warning : detect_warnings(status, config_)) {
        candidates.push_back(std::move(warning));
    }

    std::vector<BufferingWarning> fresh;
    for (auto& warning : candidates) {
        if (std::find(reported_.begin(), reported_.end(), warning.kind) != reported_.end()) continue;
        reported_.push_back(warning.kind);
        fresh.push_back(std::move(warning));
    }
    return fresh;
}

void BufferingMonitor::reset() {
    buffering_ = false;
    percentage_ = 100;
    unchanged_since_ms_ = 0;
    reported_.clear();
}

} // namespace Encore
