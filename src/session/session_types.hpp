#pragma once

#include "../player/player_types.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace Encore {

using MediaItemId = std::string;

/**
 * One entry of a playlist: a series episode or a play-queue item
 */
struct EpisodeRef {
    MediaItemId id;
    std::string title;
    int season = 0;
    int episode = 0;
    std::optional<int64_t> duration_ms;
    bool watched = false;
    std::optional<int64_t> queue_item_id;  // Remote play-queue item, if any
};

/**
 * Correlation with a play queue kept by a remote server.
 * A context carrying one has its progress mirrored remotely.
 */
struct RemoteQueueInfo {
    int64_t queue_id = 0;
    int version = 0;
    int64_t item_id = 0;  // Currently selected queue item
};

/**
 * Ordered traversal enabling previous/next/auto-play
 *
 * Episodes live in a flat vector and are addressed by index only.
 * The session owns its context and replaces it wholesale on navigation.
 */
class PlaylistContext {
public:
    enum class Kind {
        SingleItem,
        Series,
        PlayQueue
    };

    PlaylistContext() = default;

    static PlaylistContext single_item();
    static PlaylistContext series(const std::string& title, std::vector<EpisodeRef> episodes,
                                  size_t current_index, bool auto_play,
                                  std::optional<RemoteQueueInfo> queue = std::nullopt);
    static PlaylistContext play_queue(std::vector<EpisodeRef> items, size_t current_index,
                                      bool auto_play,
                                      std::optional<RemoteQueueInfo> queue = std::nullopt);

    Kind kind() const { return kind_; }
    const std::string& title() const { return title_; }
    const std::vector<EpisodeRef>& episodes() const { return episodes_; }
    size_t current_index() const { return current_index_; }

    bool has_previous() const;
    bool has_next() const;
    std::optional<MediaItemId> get_previous() const;
    std::optional<MediaItemId> get_next() const;
    bool is_auto_play_enabled() const;

    /**
     * Point the context at the item with the given id.
     * Returns false (and leaves the context untouched) if the id is unknown.
     */
    bool update_current_index(const MediaItemId& id);

    const EpisodeRef* current() const;
    const std::optional<RemoteQueueInfo>& remote_queue() const { return queue_; }

    /**
     * Human readable position, e.g. "Show - S1E2 - Episode 2 of 8".
     * Empty for a single item.
     */
    std::string position_label() const;

private:
    Kind kind_ = Kind::SingleItem;
    std::string title_;
    std::vector<EpisodeRef> episodes_;
    size_t current_index_ = 0;
    bool auto_play_ = false;
    std::optional<RemoteQueueInfo> queue_;
};

enum class MarkerKind {
    Intro,
    Credits
};

/**
 * Skippable range of the media, [start_ms, end_ms)
 */
struct ChapterMarker {
    int64_t start_ms = 0;
    int64_t end_ms = 0;
    MarkerKind kind = MarkerKind::Intro;

    int64_t duration_ms() const { return end_ms - start_ms; }
    bool contains(int64_t position_ms) const {
        return position_ms >= start_ms && position_ms < end_ms;
    }
};

struct MarkerPair {
    std::optional<ChapterMarker> intro;
    std::optional<ChapterMarker> credits;
};

/**
 * Saved playback progress for one media item
 */
struct PlaybackProgress {
    int64_t position_ms = 0;
    int64_t duration_ms = 0;
    bool watched = false;

    /**
     * Fraction of the media played (0.0 - 1.0); 0 when the duration is unknown
     */
    double percent_complete() const;
};

/**
 * Event emitted by the session to its host
 */
struct SessionEvent {
    enum class Type {
        NavigateBack,
        MediaLoaded,
        Error,
        WindowResizeRequested,
        Notice,
        StateChanged
    };

    Type type = Type::MediaLoaded;
    std::string message;      // Error and Notice
    int width = 0;            // WindowResizeRequested
    int height = 0;
    PlayerState state = PlayerState::Idle;  // StateChanged

    static SessionEvent navigate_back() { return {Type::NavigateBack, "", 0, 0, PlayerState::Idle}; }
    static SessionEvent media_loaded() { return {Type::MediaLoaded, "", 0, 0, PlayerState::Idle}; }
    static SessionEvent error(const std::string& msg) { return {Type::Error, msg, 0, 0, PlayerState::Idle}; }
    static SessionEvent notice(const std::string& msg) { return {Type::Notice, msg, 0, 0, PlayerState::Idle}; }
    static SessionEvent resize(int w, int h) { return {Type::WindowResizeRequested, "", w, h, PlayerState::Idle}; }
    static SessionEvent state_changed(PlayerState s) { return {Type::StateChanged, "", 0, 0, s}; }
};

/**
 * Window size for a video frame: scaled down to max_width keeping the aspect
 * ratio, plus room for the controls below it
 */
Dimensions compute_window_size(const Dimensions& video, int max_width, int controls_height);

} // namespace Encore
