#pragma once

#include "session_types.hpp"
#include <functional>
#include <optional>
#include <string>

namespace Encore {

/**
 * Collaborators the session reaches for stream URLs, saved progress and
 * skip markers. All callbacks are delivered from the main loop.
 */
class PlaybackServices {
public:
    template<typename T>
    using ResultCallback = std::function<void(std::optional<T> result, const std::string& error)>;
    using DoneCallback = std::function<void(bool success, const std::string& error)>;

    virtual ~PlaybackServices() = default;

    /**
     * Resolve a playable URL for the item; may answer from a cache
     */
    virtual void resolve_stream(const MediaItemId& id, ResultCallback<std::string> callback) = 0;

    /**
     * Saved progress for the item, std::nullopt (no error) if never played
     */
    virtual void load_progress(const MediaItemId& id, const std::string& user,
                               ResultCallback<PlaybackProgress> callback) = 0;

    virtual void save_progress(const MediaItemId& id, int64_t position_ms, int64_t duration_ms,
                               bool watched, DoneCallback callback) = 0;

    /**
     * Markers stored by a previous fetch, std::nullopt (no error) if none
     */
    virtual void lookup_markers(const MediaItemId& id, ResultCallback<MarkerPair> callback) = 0;

    /**
     * Ask the item's source for its markers
     */
    virtual void fetch_markers(const MediaItemId& id, ResultCallback<MarkerPair> callback) = 0;

    virtual void store_markers(const MediaItemId& id, const MarkerPair& markers,
                               DoneCallback callback) = 0;
};

/**
 * Mirrors playback progress into a remote play queue
 */
class RemoteProgressSync {
public:
    using DoneCallback = PlaybackServices::DoneCallback;

    virtual ~RemoteProgressSync() = default;

    /**
     * state_tag is one of "playing", "paused", "stopped", "buffering"
     */
    virtual void sync_progress(const PlaylistContext& context, const MediaItemId& id,
                               int64_t position_ms, int64_t duration_ms,
                               const std::string& state_tag, DoneCallback callback) = 0;
};

} // namespace Encore
