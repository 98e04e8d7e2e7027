#pragma once

#include "playback_backend.hpp"
#include <glib.h>
#include <mpv/client.h>
#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace Encore {

/**
 * PlaybackBackend driven by libmpv
 *
 * All mpv calls are asynchronous; replies are matched to their callbacks by
 * reply_userdata. mpv wakes us from its own thread, the wakeup is marshalled
 * onto the GLib main loop and events are drained there.
 */
class MpvBackend : public PlaybackBackend {
public:
    /**
     * Create and initialize an mpv context.
     * Returns nullptr (and logs) when mpv cannot be initialized.
     */
    static std::shared_ptr<MpvBackend> create(bool hardware_decoding);

    ~MpvBackend() override;

    MpvBackend(const MpvBackend&) = delete;
    MpvBackend& operator=(const MpvBackend&) = delete;

    const char* name() const override { return "mpv"; }

    void load(const std::string& url, CommandCallback callback) override;
    void play(CommandCallback callback) override;
    void pause(CommandCallback callback) override;
    void stop(CommandCallback callback) override;
    void seek(int64_t position_ms, CommandCallback callback) override;
    void set_volume(double volume, CommandCallback callback) override;
    void set_speed(double speed, CommandCallback callback) override;
    void select_track(TrackKind kind, int64_t id, CommandCallback callback) override;
    void frame_step(bool forward, CommandCallback callback) override;

    void get_position(PositionCallback callback) override;
    void get_duration(PositionCallback callback) override;
    void get_state(StateCallback callback) override;
    void get_dimensions(DimensionsCallback callback) override;
    void get_tracks(TracksCallback callback) override;
    void get_buffering(BufferingCallback callback) override;

private:
    // Wakeup target shared with pending idle sources; owner is cleared on destruction
    struct Wakeup : std::enable_shared_from_this<Wakeup> {
        MpvBackend *owner = nullptr;
        std::atomic<bool> scheduled{false};
    };

    using ReplyHandler = std::function<void(int error, mpv_event_property *property)>;

    explicit MpvBackend(mpv_handle *mpv);

    mpv_handle *mpv_;
    std::shared_ptr<Wakeup> wakeup_;
    uint64_t next_reply_id_ = 1;
    std::map<uint64_t, ReplyHandler> pending_;
    CommandCallback pending_load_;
    PlayerState state_ = PlayerState::Idle;

    uint64_t register_reply(ReplyHandler handler);

    void run_command(const std::vector<std::string>& args, CommandCallback callback,
                     std::function<void()> on_success = nullptr);
    void set_property(const char *name, mpv_format format, void *value,
                      CommandCallback callback, std::function<void()> on_success = nullptr);
    void get_property(const char *name, mpv_format format, ReplyHandler handler);
    void get_milliseconds(const char *name, PositionCallback callback);
    void get_number(const char *name, std::function<void(std::optional<double> value)> callback);

    void finish_load(bool success, const std::string& error);
    void drain_events();
    void handle_event(mpv_event *event);

    static void on_wakeup(void *ctx);
    static gboolean on_dispatch(gpointer user_data);
};

} // namespace Encore
