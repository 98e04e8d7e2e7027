#pragma once

#include "../config.hpp"
#include "../player/player_types.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace Encore {

struct BufferingWarning {
    enum class Kind {
        SlowDownload,
        CriticallyLowBuffer,
        BufferingStalled
    };

    enum class Severity {
        Warning,
        Critical
    };

    Kind kind;
    Severity severity;
    std::string message;
    std::string recommendation;

    static BufferingWarning slow_download(int64_t download_bps, int64_t bitrate_bps);
    static BufferingWarning critically_low(int percentage);
    static BufferingWarning stalled();
};

/**
 * Download is slower than the bitrate times the margin; false when either is unknown
 */
bool is_download_too_slow(int64_t download_bps, int64_t bitrate_bps, double margin);

/**
 * Buffer is non-empty but below the threshold percentage
 */
bool is_buffer_critically_low(int percentage, int threshold);

/**
 * Percentage has not moved for threshold_ms. An empty or full buffer is never stalled.
 */
bool is_buffering_stalled(int current, int previous, int64_t unchanged_ms, int64_t threshold_ms);

/**
 * Slow download first, then low buffer
 */
std::vector<BufferingWarning> detect_warnings(const BufferingStatus& status, const PlaybackConfig& config);

/**
 * Follows the network cache while playback waits for it
 *
 * A buffering episode starts when the engine pauses for the cache and ends
 * when it resumes. Each kind of warning is reported once per episode.
 */
class BufferingMonitor {
public:
    explicit BufferingMonitor(const PlaybackConfig& config);

    void update_config(const PlaybackConfig& config) { config_ = config; }

    /**
     * Feed one cache sample; returns the warnings new to this episode
     */
    std::vector<BufferingWarning> update(const BufferingStatus& status, int64_t now_ms);

    void reset();

    bool is_buffering() const { return buffering_; }
    int percentage() const { return percentage_; }

private:
    PlaybackConfig config_;
    bool buffering_ = false;
    int percentage_ = 100;
    int64_t unchanged_since_ms_ = 0;
    std::vector<BufferingWarning::Kind> reported_;
};

} // namespace Encore
