#include "mpv_backend.hpp"
#include "../scheduler.hpp"
#include <algorithm>
#include <clocale>
#include <cmath>
#include <cstring>

namespace Encore {

std::shared_ptr<MpvBackend> MpvBackend::create(bool hardware_decoding) {
    setlocale(LC_NUMERIC, "C");

    mpv_handle *mpv = mpv_create();
    if (!mpv) {
        g_warning("Failed to create MPV context");
        return nullptr;
    }

    mpv_set_option_string(mpv, "hwdec", hardware_decoding ? "auto" : "no");
    mpv_set_option_string(mpv, "keep-open", "no");
    mpv_set_option_string(mpv, "idle", "yes");

    int rc = mpv_initialize(mpv);
    if (rc < 0) {
        g_warning("Failed to initialize MPV: %s", mpv_error_string(rc));
        mpv_destroy(mpv);
        return nullptr;
    }

    return std::shared_ptr<MpvBackend>(new MpvBackend(mpv));
}

MpvBackend::MpvBackend(mpv_handle *mpv)
    : mpv_(mpv), wakeup_(std::make_shared<Wakeup>()) {
    wakeup_->owner = this;
    mpv_set_wakeup_callback(mpv_, on_wakeup, wakeup_.get());
}

MpvBackend::~MpvBackend() {
    // No more wakeups after this returns; idles already queued see owner == nullptr
    mpv_set_wakeup_callback(mpv_, nullptr, nullptr);
    wakeup_->owner = nullptr;
    mpv_terminate_destroy(mpv_);
    mpv_ = nullptr;
}

// ============ Main loop plumbing ============

void MpvBackend::on_wakeup(void *ctx) {
    // Called from an mpv thread
    auto *wakeup = static_cast<Wakeup*>(ctx);
    if (wakeup->scheduled.exchange(true)) return;

    auto *ref = new std::shared_ptr<Wakeup>(wakeup->shared_from_this());
    g_idle_add_full(G_PRIORITY_DEFAULT, on_dispatch, ref,
        [](gpointer user_data) {
            delete static_cast<std::shared_ptr<Wakeup>*>(user_data);
        });
}

gboolean MpvBackend::on_dispatch(gpointer user_data) {
    auto& wakeup = *static_cast<std::shared_ptr<Wakeup>*>(user_data);
    wakeup->scheduled = false;
    if (wakeup->owner) {
        wakeup->owner->drain_events();
    }
    return G_SOURCE_REMOVE;
}

void MpvBackend::drain_events() {
    while (mpv_) {
        mpv_event *event = mpv_wait_event(mpv_, 0);
        if (event->event_id == MPV_EVENT_NONE) break;
        handle_event(event);
    }
}

void MpvBackend::handle_event(mpv_event *event) {
    switch (event->event_id) {
        case MPV_EVENT_COMMAND_REPLY:
        case MPV_EVENT_SET_PROPERTY_REPLY:
        case MPV_EVENT_GET_PROPERTY_REPLY: {
            auto it = pending_.find(event->reply_userdata);
            if (it == pending_.end()) break;
            ReplyHandler handler = std::move(it->second);
            pending_.erase(it);

            mpv_event_property *prop = nullptr;
            if (event->event_id == MPV_EVENT_GET_PROPERTY_REPLY) {
                prop = static_cast<mpv_event_property*>(event->data);
            }
            handler(event->error, prop);
            break;
        }
        case MPV_EVENT_FILE_LOADED:
            g_debug("mpv: file loaded");
            state_ = PlayerState::Paused;
            finish_load(true, "");
            break;
        case MPV_EVENT_END_FILE: {
            auto *end = static_cast<mpv_event_end_file*>(event->data);
            if (end->reason == MPV_END_FILE_REASON_ERROR) {
                g_warning("MPV playback error: %s", mpv_error_string(end->error));
                state_ = PlayerState::Error;
                finish_load(false, mpv_error_string(end->error));
            } else if (end->reason == MPV_END_FILE_REASON_EOF ||
                       end->reason == MPV_END_FILE_REASON_STOP) {
                if (state_ != PlayerState::Loading) {
                    state_ = PlayerState::Stopped;
                }
            }
            break;
        }
        case MPV_EVENT_LOG_MESSAGE: {
            auto *msg = static_cast<mpv_event_log_message*>(event->data);
            g_debug("mpv [%s] %s", msg->prefix, msg->text);
            break;
        }
        default:
            break;
    }
}

// ============ Request helpers ============

uint64_t MpvBackend::register_reply(ReplyHandler handler) {
    uint64_t id = next_reply_id_++;
    pending_[id] = std::move(handler);
    return id;
}

void MpvBackend::run_command(const std::vector<std::string>& args, CommandCallback callback,
                             std::function<void()> on_success) {
    std::vector<const char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& arg : args) {
        argv.push_back(arg.c_str());
    }
    argv.push_back(nullptr);

    std::string command = args.empty() ? "" : args.front();
    uint64_t id = register_reply([callback, on_success, command](int error, mpv_event_property *) {
        if (error < 0) {
            callback(false, command + ": " + mpv_error_string(error));
            return;
        }
        if (on_success) on_success();
        callback(true, "");
    });

    int rc = mpv_command_async(mpv_, id, argv.data());
    if (rc < 0) {
        pending_.erase(id);
        std::string error = command + ": " + mpv_error_string(rc);
        run_on_main_loop([callback, error]() { callback(false, error); });
    }
}

void MpvBackend::set_property(const char *name, mpv_format format, void *value,
                              CommandCallback callback, std::function<void()> on_success) {
    std::string property = name;
    uint64_t id = register_reply([callback, on_success, property](int error, mpv_event_property *) {
        if (error < 0) {
            callback(false, property + ": " + mpv_error_string(error));
            return;
        }
        if (on_success) on_success();
        callback(true, "");
    });

    int rc = mpv_set_property_async(mpv_, id, name, format, value);
    if (rc < 0) {
        pending_.erase(id);
        std::string error = property + ": " + mpv_error_string(rc);
        run_on_main_loop([callback, error]() { callback(false, error); });
    }
}

void MpvBackend::get_property(const char *name, mpv_format format, ReplyHandler handler) {
    uint64_t id = register_reply(handler);
    int rc = mpv_get_property_async(mpv_, id, name, format);
    if (rc < 0) {
        pending_.erase(id);
        run_on_main_loop([handler, rc]() { handler(rc, nullptr); });
    }
}

void MpvBackend::get_milliseconds(const char *name, PositionCallback callback) {
    get_property(name, MPV_FORMAT_DOUBLE, [callback](int error, mpv_event_property *prop) {
        if (error == MPV_ERROR_PROPERTY_UNAVAILABLE) {
            callback(std::nullopt, "");
            return;
        }
        if (error < 0) {
            callback(std::nullopt, mpv_error_string(error));
            return;
        }
        if (!prop || prop->format != MPV_FORMAT_DOUBLE || !prop->data) {
            callback(std::nullopt, "");
            return;
        }
        double seconds = *static_cast<double*>(prop->data);
        callback(static_cast<int64_t>(std::llround(seconds * 1000.0)), "");
    });
}

// nullopt when the property is unavailable or failed
void MpvBackend::get_number(const char *name, std::function<void(std::optional<double> value)> callback) {
    std::string property = name;
    get_property(name, MPV_FORMAT_DOUBLE, [callback, property](int error, mpv_event_property *prop) {
        if (error < 0) {
            if (error != MPV_ERROR_PROPERTY_UNAVAILABLE) {
                g_debug("mpv: %s: %s", property.c_str(), mpv_error_string(error));
            }
            callback(std::nullopt);
            return;
        }
        if (!prop || prop->format != MPV_FORMAT_DOUBLE || !prop->data) {
            callback(std::nullopt);
            return;
        }
        callback(*static_cast<double*>(prop->data));
    });
}

void MpvBackend::finish_load(bool success, const std::string& error) {
    if (!pending_load_) return;
    CommandCallback callback = std::move(pending_load_);
    pending_load_ = nullptr;
    callback(success, error);
}

// ============ Commands ============

void MpvBackend::load(const std::string& url, CommandCallback callback) {
    if (pending_load_) {
        finish_load(false, "Load superseded");
    }

    // Open paused; the session decides when to start after resuming
    mpv_set_property_string(mpv_, "pause", "yes");

    state_ = PlayerState::Loading;
    pending_load_ = std::move(callback);

    run_command({"loadfile", url, "replace"}, [this](bool success, const std::string& error) {
        // The reply only confirms the command was queued; FILE_LOADED completes the load
        if (!success) {
            state_ = PlayerState::Error;
            finish_load(false, error);
        }
    });
}

void MpvBackend::play(CommandCallback callback) {
    int flag = 0;
    set_property("pause", MPV_FORMAT_FLAG, &flag, std::move(callback), [this]() {
        state_ = PlayerState::Playing;
    });
}

void MpvBackend::pause(CommandCallback callback) {
    int flag = 1;
    set_property("pause", MPV_FORMAT_FLAG, &flag, std::move(callback), [this]() {
        state_ = PlayerState::Paused;
    });
}

void MpvBackend::stop(CommandCallback callback) {
    run_command({"stop"}, std::move(callback), [this]() {
        state_ = PlayerState::Stopped;
    });
}

void MpvBackend::seek(int64_t position_ms, CommandCallback callback) {
    char seconds[32];
    g_ascii_formatd(seconds, sizeof(seconds), "%.3f", static_cast<double>(position_ms) / 1000.0);
    run_command({"seek", seconds, "absolute"}, std::move(callback));
}

void MpvBackend::set_volume(double volume, CommandCallback callback) {
    double mpv_volume = std::min(1.0, std::max(0.0, volume)) * 100.0;
    set_property("volume", MPV_FORMAT_DOUBLE, &mpv_volume, std::move(callback));
}

void MpvBackend::set_speed(double speed, CommandCallback callback) {
    set_property("speed", MPV_FORMAT_DOUBLE, &speed, std::move(callback));
}

void MpvBackend::select_track(TrackKind kind, int64_t id, CommandCallback callback) {
    if (kind == TrackKind::Subtitle && id == 0) {
        const char *off = "no";
        set_property("sid", MPV_FORMAT_STRING, &off, std::move(callback));
        return;
    }
    set_property(kind == TrackKind::Audio ? "aid" : "sid", MPV_FORMAT_INT64, &id, std::move(callback));
}

void MpvBackend::frame_step(bool forward, CommandCallback callback) {
    run_command({forward ? "frame-step" : "frame-back-step"}, std::move(callback), [this]() {
        // mpv pauses on frame stepping
        state_ = PlayerState::Paused;
    });
}

// ============ Queries ============

void MpvBackend::get_position(PositionCallback callback) {
    get_milliseconds("time-pos", std::move(callback));
}

void MpvBackend::get_duration(PositionCallback callback) {
    get_milliseconds("duration", std::move(callback));
}

void MpvBackend::get_state(StateCallback callback) {
    if (state_ != PlayerState::Playing && state_ != PlayerState::Paused) {
        PlayerState state = state_;
        run_on_main_loop([callback, state]() { callback(state, ""); });
        return;
    }

    // Paused state can change behind our back (frame stepping, end of cache)
    get_property("pause", MPV_FORMAT_FLAG, [this, callback](int error, mpv_event_property *prop) {
        if (error < 0) {
            callback(std::nullopt, mpv_error_string(error));
            return;
        }
        if (prop && prop->format == MPV_FORMAT_FLAG && prop->data &&
            (state_ == PlayerState::Playing || state_ == PlayerState::Paused)) {
            state_ = *static_cast<int*>(prop->data) ? PlayerState::Paused : PlayerState::Playing;
        }
        callback(state_, "");
    });
}

void MpvBackend::get_dimensions(DimensionsCallback callback) {
    get_property("width", MPV_FORMAT_INT64, [this, callback](int error, mpv_event_property *prop) {
        if (error == MPV_ERROR_PROPERTY_UNAVAILABLE) {
            callback(std::nullopt, "");
            return;
        }
        if (error < 0 || !prop || prop->format != MPV_FORMAT_INT64) {
            callback(std::nullopt, error < 0 ? mpv_error_string(error) : "");
            return;
        }
        int width = static_cast<int>(*static_cast<int64_t*>(prop->data));

        get_property("height", MPV_FORMAT_INT64, [callback, width](int error, mpv_event_property *prop) {
            if (error == MPV_ERROR_PROPERTY_UNAVAILABLE) {
                callback(std::nullopt, "");
                return;
            }
            if (error < 0 || !prop || prop->format != MPV_FORMAT_INT64) {
                callback(std::nullopt, error < 0 ? mpv_error_string(error) : "");
                return;
            }
            Dimensions dims;
            dims.width = width;
            dims.height = static_cast<int>(*static_cast<int64_t*>(prop->data));
            callback(dims, "");
        });
    });
}

static std::string track_label(const char *title, const char *lang, int64_t id) {
    if (title && lang) {
        return std::string(title) + " (" + lang + ")";
    }
    if (title) {
        return title;
    }
    if (lang) {
        // Capitalize language code
        std::string label = lang;
        if (!label.empty()) {
            label[0] = g_ascii_toupper(label[0]);
        }
        return label;
    }
    return "Track " + std::to_string(id);
}

void MpvBackend::get_tracks(TracksCallback callback) {
    get_property("track-list", MPV_FORMAT_NODE, [callback](int error, mpv_event_property *prop) {
        if (error < 0) {
            callback(std::nullopt, mpv_error_string(error));
            return;
        }

        std::vector<Track> tracks;
        if (!prop || prop->format != MPV_FORMAT_NODE || !prop->data) {
            callback(tracks, "");
            return;
        }

        auto *list = static_cast<mpv_node*>(prop->data);
        if (list->format != MPV_FORMAT_NODE_ARRAY) {
            callback(tracks, "");
            return;
        }

        for (int i = 0; i < list->u.list->num; i++) {
            mpv_node *track = &list->u.list->values[i];
            if (track->format != MPV_FORMAT_NODE_MAP) continue;

            const char *type = nullptr;
            const char *title = nullptr;
            const char *lang = nullptr;
            int64_t id = 0;
            bool selected = false;

            for (int j = 0; j < track->u.list->num; j++) {
                const char *key = track->u.list->keys[j];
                mpv_node *val = &track->u.list->values[j];

                if (strcmp(key, "type") == 0 && val->format == MPV_FORMAT_STRING) {
                    type = val->u.string;
                } else if (strcmp(key, "id") == 0 && val->format == MPV_FORMAT_INT64) {
                    id = val->u.int64;
                } else if (strcmp(key, "title") == 0 && val->format == MPV_FORMAT_STRING) {
                    title = val->u.string;
                } else if (strcmp(key, "lang") == 0 && val->format == MPV_FORMAT_STRING) {
                    lang = val->u.string;
                } else if (strcmp(key, "selected") == 0 && val->format == MPV_FORMAT_FLAG) {
                    selected = val->u.flag != 0;
                }
            }

            if (!type) continue;

            Track entry;
            entry.id = id;
            entry.label = track_label(title, lang, id);
            entry.selected = selected;
            if (strcmp(type, "audio") == 0) {
                entry.kind = TrackKind::Audio;
            } else if (strcmp(type, "sub") == 0) {
                entry.kind = TrackKind::Subtitle;
            } else {
                continue;
            }
            tracks.push_back(entry);
        }

        callback(tracks, "");
    });
}

void MpvBackend::get_buffering(BufferingCallback callback) {
    get_property("paused-for-cache", MPV_FORMAT_FLAG, [this, callback](int error, mpv_event_property *prop) {
        if (error < 0 && error != MPV_ERROR_PROPERTY_UNAVAILABLE) {
            callback(std::nullopt, mpv_error_string(error));
            return;
        }

        auto status = std::make_shared<BufferingStatus>();
        if (error >= 0 && prop && prop->format == MPV_FORMAT_FLAG && prop->data) {
            status->paused_for_cache = *static_cast<int*>(prop->data) != 0;
        }

        get_number("cache-buffering-state", [this, status, callback](std::optional<double> percentage) {
            if (percentage) status->percentage = static_cast<int>(std::lround(*percentage));

            get_number("cache-speed", [this, status, callback](std::optional<double> speed) {
                if (speed) status->download_speed_bps = std::llround(*speed);

                // video-bitrate is in bits per second
                get_number("video-bitrate", [status, callback](std::optional<double> bitrate) {
                    if (bitrate) status->bitrate_bps = std::llround(*bitrate / 8.0);
                    callback(*status, "");
                });
            });
        });
    });
}

} // namespace Encore
