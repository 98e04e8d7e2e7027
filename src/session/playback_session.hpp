#pragma once

#include "../config.hpp"
#include "../player/playback_backend.hpp"
#include "../scheduler.hpp"
#include "auto_play.hpp"
#include "buffering_monitor.hpp"
#include "control_visibility.hpp"
#include "playback_services.hpp"
#include "progress_policy.hpp"
#include "retry_supervisor.hpp"
#include "session_types.hpp"
#include "skip_markers.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace Encore {

/**
 * Owns the playback lifecycle of one media item at a time
 *
 * The session is the only component that talks to the backend and the
 * services. Every load bumps a generation counter; completions issued under
 * an older generation, or arriving after the session is gone, are dropped.
 * All methods must be called from the main loop.
 */
class PlaybackSession {
public:
    using EventCallback = std::function<void(const SessionEvent& event)>;

    static constexpr const char* kRetryExhaustedMessage =
        "Failed to load media after multiple attempts. Please try again later.";
    static constexpr const char* kPlaybackFailedMessage = "Playback failed";
    static constexpr const char* kEndOfSeriesMessage = "End of series";

    PlaybackSession(std::shared_ptr<PlaybackBackend> backend,
                    PlaybackServices& services,
                    Scheduler& scheduler,
                    const PlaybackConfig& config,
                    RemoteProgressSync *remote_sync = nullptr);
    ~PlaybackSession();

    PlaybackSession(const PlaybackSession&) = delete;
    PlaybackSession& operator=(const PlaybackSession&) = delete;

    // ============ Loading ============

    void load(const MediaItemId& id);
    void load_with_context(const MediaItemId& id, const PlaylistContext& context);

    /**
     * Re-issue the last load after a terminal error, with a fresh retry budget
     */
    void retry();

    /**
     * Poll the backend and drive markers, auto-play and persistence.
     * Expected once a second.
     */
    void tick();

    // ============ Transport ============

    void play();
    void pause();
    void toggle_play_pause();
    void stop();
    void seek(int64_t position_ms);
    void seek_relative(int64_t delta_ms);
    void set_volume(double volume);
    void set_speed(double speed);
    void speed_up();
    void speed_down();
    void speed_reset();
    void set_track(TrackKind kind, int64_t id);
    void frame_step(bool forward);
    void refresh_tracks();

    // ============ Navigation ============

    void previous();
    void next();

    /**
     * Final best-effort persistence before leaving the player
     */
    void stop_for_navigation();

    /**
     * stop_for_navigation() followed by a NavigateBack event
     */
    void go_back();

    void skip_intro();
    void skip_credits();

    // ============ Pointer ============

    void pointer_enter();
    void pointer_leave();
    void pointer_motion(double x, double y, bool over_controls);
    void toggle_controls();
    void set_overlay_open(bool open);

    /**
     * Apply a newer configuration snapshot; older versions are ignored
     */
    void on_config_changed(const PlaybackConfig& config);

    // ============ State ============

    void on_event(EventCallback callback);

    PlayerState state() const { return state_; }
    int64_t position_ms() const { return position_ms_; }
    int64_t duration_ms() const { return duration_ms_; }
    double speed() const { return speed_; }
    double volume() const { return volume_; }
    bool controls_visible() const { return controls_.is_visible(); }
    ControlVisibility::State control_state() const { return controls_.state(); }
    bool skip_intro_visible() const { return skip_markers_.is_intro_visible(); }
    bool skip_credits_visible() const { return skip_markers_.is_credits_visible(); }
    const std::string& error_message() const { return error_message_; }
    const std::optional<PlaylistContext>& context() const { return context_; }
    const std::optional<MediaItemId>& current_media() const { return current_media_; }
    const std::vector<Track>& tracks() const { return tracks_; }
    const PlaybackConfig& config() const { return config_; }
    uint64_t generation() const { return generation_; }
    int retry_attempt() const { return retry_.attempt(); }
    bool has_pending_retry() const { return retry_.has_pending(); }
    bool has_pending_auto_play() const { return auto_play_.has_pending(); }
    bool is_buffering() const { return buffering_.is_buffering(); }
    int buffer_percentage() const { return buffering_.percentage(); }

private:
    std::shared_ptr<PlaybackBackend> backend_;
    PlaybackServices& services_;
    Scheduler& scheduler_;
    RemoteProgressSync *remote_sync_;
    PlaybackConfig config_;

    ProgressPolicy progress_;
    RetrySupervisor retry_;
    SkipMarkerManager skip_markers_;
    AutoPlayScheduler auto_play_;
    ControlVisibility controls_;
    BufferingMonitor buffering_;

    std::optional<MediaItemId> current_media_;
    std::optional<PlaylistContext> context_;
    PlayerState state_ = PlayerState::Idle;
    int64_t position_ms_ = 0;
    int64_t duration_ms_ = 0;
    double speed_ = 1.0;
    double volume_ = 1.0;
    std::vector<Track> tracks_;
    std::string error_message_;
    bool tick_in_flight_ = false;
    bool backend_loaded_ = false;  // The backend holds the current file

    uint64_t generation_ = 0;
    std::shared_ptr<bool> alive_;
    std::vector<EventCallback> event_callbacks_;

    /**
     * Wrap a completion so it only runs while the session is alive and
     * the load it was issued under is still current
     */
    template<typename Fn>
    auto guarded(uint64_t generation, Fn fn) {
        std::weak_ptr<bool> alive = alive_;
        return [this, alive, generation, fn](auto&&... args) {
            if (alive.expired() || generation != generation_) return;
            fn(std::forward<decltype(args)>(args)...);
        };
    }

    void begin_load(const MediaItemId& id, const std::optional<PlaylistContext>& context,
                    bool external);
    void request_markers(const MediaItemId& id, uint64_t generation);
    void on_backend_loaded(uint64_t generation);
    void start_playback(uint64_t generation);
    void handle_load_failure(const std::string& error);

    void finish_tick();
    void on_buffering(const BufferingStatus& status);
    bool can_control() const;
    PlaybackBackend::CommandCallback command_done(const char *command);
    void refresh_state();

    /**
     * Adopt a state reported by the backend.
     * Returns true if the change forced a progress write.
     */
    bool apply_reported_state(PlayerState reported);
    void set_state(PlayerState state);

    void persist_progress();
    void sync_remote(bool watched);
    void emit(const SessionEvent& event);
};

} // namespace Encore
