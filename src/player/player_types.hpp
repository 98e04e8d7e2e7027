#pragma once

#include <cstdint>
#include <string>

namespace Encore {

/**
 * Transport state as reported by the playback backend
 */
enum class PlayerState {
    Idle,
    Loading,
    Playing,
    Paused,
    Stopped,
    Error
};

const char* player_state_name(PlayerState state);

enum class TrackKind {
    Audio,
    Subtitle
};

/**
 * Audio or subtitle track exposed by the backend
 */
struct Track {
    int64_t id = 0;
    TrackKind kind = TrackKind::Audio;
    std::string label;     // "Title (lang)", "Lang" or "Track N"
    bool selected = false;
};

/**
 * Video frame size in pixels
 */
struct Dimensions {
    int width = 0;
    int height = 0;

    bool is_valid() const {
        return width > 0 && height > 0;
    }
};

/**
 * Network cache state of the current stream
 */
struct BufferingStatus {
    bool paused_for_cache = false;   // Playback is waiting for the cache to fill
    int percentage = 100;            // Cache fill level, 0-100
    int64_t download_speed_bps = 0;  // Bytes per second, 0 if unknown
    int64_t bitrate_bps = 0;         // Bytes per second needed for playback, 0 if unknown
};

} // namespace Encore
