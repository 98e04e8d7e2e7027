#pragma once

#include "player_types.hpp"
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace Encore {

/**
 * Handle to a decode/render engine
 *
 * Every call returns immediately and reports its outcome later through the
 * callback, always from the main loop. Commands report success or an error
 * message. Queries report a value, or std::nullopt with an error message on
 * failure. A query answered with std::nullopt and an empty error means the
 * value is not available yet (no file loaded, duration unknown).
 */
class PlaybackBackend {
public:
    using CommandCallback = std::function<void(bool success, const std::string& error)>;

    template<typename T>
    using ResultCallback = std::function<void(std::optional<T> result, const std::string& error)>;

    using PositionCallback = ResultCallback<int64_t>;
    using StateCallback = ResultCallback<PlayerState>;
    using DimensionsCallback = ResultCallback<Dimensions>;
    using TracksCallback = ResultCallback<std::vector<Track>>;
    using BufferingCallback = ResultCallback<BufferingStatus>;

    virtual ~PlaybackBackend() = default;

    virtual const char* name() const = 0;

    // ============ Commands ============

    /**
     * Load a stream URL; completes once the engine has opened the file
     */
    virtual void load(const std::string& url, CommandCallback callback) = 0;
    virtual void play(CommandCallback callback) = 0;
    virtual void pause(CommandCallback callback) = 0;
    virtual void stop(CommandCallback callback) = 0;
    virtual void seek(int64_t position_ms, CommandCallback callback) = 0;

    /**
     * Volume in [0, 1]
     */
    virtual void set_volume(double volume, CommandCallback callback) = 0;
    virtual void set_speed(double speed, CommandCallback callback) = 0;

    /**
     * Select a track; id 0 disables subtitles
     */
    virtual void select_track(TrackKind kind, int64_t id, CommandCallback callback) = 0;
    virtual void frame_step(bool forward, CommandCallback callback) = 0;

    // ============ Queries ============

    virtual void get_position(PositionCallback callback) = 0;
    virtual void get_duration(PositionCallback callback) = 0;
    virtual void get_state(StateCallback callback) = 0;
    virtual void get_dimensions(DimensionsCallback callback) = 0;
    virtual void get_tracks(TracksCallback callback) = 0;

    /**
     * Cache state; values the engine cannot report keep their defaults
     */
    virtual void get_buffering(BufferingCallback callback) = 0;
};

} // namespace Encore
