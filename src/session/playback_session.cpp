#include "playback_session.hpp"
#include <glib.h>
#include <algorithm>

namespace Encore {

namespace {

constexpr double kMinSpeed = 0.25;
constexpr double kMaxSpeed = 4.0;

} // namespace

PlaybackSession::PlaybackSession(std::shared_ptr<PlaybackBackend> backend,
                                 PlaybackServices& services,
                                 Scheduler& scheduler,
                                 const PlaybackConfig& config,
                                 RemoteProgressSync *remote_sync)
    : backend_(std::move(backend))
    , services_(services)
    , scheduler_(scheduler)
    , remote_sync_(remote_sync)
    , config_(config)
    , progress_(config)
    , retry_(scheduler, config.max_retry_attempts)
    , skip_markers_(config)
    , auto_play_(scheduler, config)
    , controls_(scheduler, config)
    , buffering_(config)
    , alive_(std::make_shared<bool>(true)) {
    g_debug("Playback session created with %s backend", backend_->name());
}

PlaybackSession::~PlaybackSession() {
    retry_.reset();
    auto_play_.reset();
}

// ============ Loading ============

void PlaybackSession::load(const MediaItemId& id) {
    begin_load(id, std::nullopt, true);
}

void PlaybackSession::load_with_context(const MediaItemId& id, const PlaylistContext& context) {
    begin_load(id, context, true);
}

void PlaybackSession::retry() {
    if (!current_media_) {
        g_debug("Nothing to retry");
        return;
    }
    g_info("Retrying %s", current_media_->c_str());
    begin_load(*current_media_, context_, true);
}

void PlaybackSession::begin_load(const MediaItemId& id,
                                 const std::optional<PlaylistContext>& context,
                                 bool external) {
    if (external) {
        retry_.reset();
    } else {
        retry_.cancel();
    }
    auto_play_.reset();

    position_ms_ = 0;
    duration_ms_ = 0;
    skip_markers_.clear_markers();
    tracks_.clear();
    error_message_.clear();
    tick_in_flight_ = false;
    backend_loaded_ = false;
    buffering_.reset();

    current_media_ = id;
    context_ = context;
    progress_.reset(scheduler_.now());

    uint64_t generation = ++generation_;
    g_info("Loading %s (generation %llu)", id.c_str(), static_cast<unsigned long long>(generation));
    if (context_ && context_->kind() != PlaylistContext::Kind::SingleItem) {
        g_debug("Playlist: %s", context_->position_label().c_str());
    }
    set_state(PlayerState::Loading);

    request_markers(id, generation);

    services_.resolve_stream(id, guarded(generation,
        [this, generation](std::optional<std::string> url, const std::string& error) {
            if (!url) {
                handle_load_failure(error.empty() ? "No stream available" : error);
                return;
            }

            g_debug("Resolved stream: %s", url->c_str());
            backend_->load(*url, guarded(generation,
                [this, generation](bool success, const std::string& error) {
                    if (!success) {
                        handle_load_failure(error);
                        return;
                    }
                    on_backend_loaded(generation);
                }));
        }));
}

void PlaybackSession::request_markers(const MediaItemId& id, uint64_t generation) {
    services_.lookup_markers(id, guarded(generation,
        [this, id, generation](std::optional<MarkerPair> stored, const std::string& error) {
            if (stored) {
                skip_markers_.load_markers(*stored);
                return;
            }
            if (!error.empty()) {
                g_debug("Marker lookup failed: %s", error.c_str());
            }

            services_.fetch_markers(id, guarded(generation,
                [this, id](std::optional<MarkerPair> fetched, const std::string& error) {
                    if (!fetched) {
                        if (!error.empty()) {
                            g_warning("Failed to fetch markers for %s: %s", id.c_str(), error.c_str());
                        }
                        return;
                    }

                    skip_markers_.load_markers(*fetched);
                    services_.store_markers(id, *fetched, [id](bool success, const std::string& error) {
                        if (!success) {
                            g_warning("Failed to store markers for %s: %s", id.c_str(), error.c_str());
                        }
                    });
                }));
        }));
}

void PlaybackSession::on_backend_loaded(uint64_t generation) {
    retry_.reset();
    backend_loaded_ = true;

    services_.load_progress(*current_media_, config_.user_id, guarded(generation,
        [this, generation](std::optional<PlaybackProgress> saved, const std::string& error) {
            if (!error.empty()) {
                g_warning("Failed to load progress: %s", error.c_str());
            }

            if (saved && progress_.should_resume(*saved)) {
                g_info("Resuming at %lld ms", static_cast<long long>(saved->position_ms));
                position_ms_ = saved->position_ms;
                backend_->seek(saved->position_ms, guarded(generation,
                    [](bool success, const std::string& error) {
                        if (!success) {
                            g_warning("Resume seek failed: %s", error.c_str());
                        }
                    }));
            }

            start_playback(generation);
        }));
}

void PlaybackSession::start_playback(uint64_t generation) {
    backend_->get_dimensions(guarded(generation,
        [this](std::optional<Dimensions> dims, const std::string& error) {
            if (!dims || !dims->is_valid()) {
                g_debug("Video dimensions not available: %s", error.c_str());
                return;
            }
            Dimensions size = compute_window_size(*dims, config_.max_window_width,
                                                  config_.controls_height_px);
            emit(SessionEvent::resize(size.width, size.height));
        }));

    backend_->play(guarded(generation,
        [this](bool success, const std::string& error) {
            if (!success) {
                g_warning("Failed to start playback: %s", error.c_str());
            }
            refresh_state();
            refresh_tracks();
            emit(SessionEvent::media_loaded());
        }));
}

void PlaybackSession::handle_load_failure(const std::string& error) {
    g_warning("Failed to load %s: %s", current_media_->c_str(), error.c_str());

    MediaItemId id = *current_media_;
    std::optional<PlaylistContext> context = context_;
    RetrySupervisor::Decision decision = retry_.on_failure([this, id, context]() {
        begin_load(id, context, false);
    });
    if (decision.scheduled) return;

    error_message_ = kRetryExhaustedMessage;
    set_state(PlayerState::Error);
    emit(SessionEvent::error(error_message_));
}

// ============ Tick ============

void PlaybackSession::tick() {
    if (!current_media_ || state_ == PlayerState::Error) return;
    // Before the backend has the file there is nothing to poll
    if (state_ == PlayerState::Loading && !backend_loaded_) return;
    if (tick_in_flight_) return;

    tick_in_flight_ = true;
    uint64_t generation = generation_;

    backend_->get_position(guarded(generation,
        [this, generation](std::optional<int64_t> position, const std::string& error) {
            // Without a position the last one is kept; state is still polled
            bool fresh = position.has_value();
            if (position) {
                position_ms_ = *position;
            } else if (!error.empty()) {
                g_debug("Position query failed: %s", error.c_str());
            }

            backend_->get_duration(guarded(generation,
                [this, generation, fresh](std::optional<int64_t> duration, const std::string& error) {
                    if (duration) {
                        duration_ms_ = *duration;
                    } else if (!error.empty()) {
                        g_debug("Duration query failed: %s", error.c_str());
                    }

                    backend_->get_state(guarded(generation,
                        [this, generation, fresh](std::optional<PlayerState> state, const std::string& error) {
                            bool persisted = false;
                            if (state) {
                                persisted = apply_reported_state(*state);
                            } else if (!error.empty()) {
                                g_debug("State query failed: %s", error.c_str());
                            }

                            if (state_ == PlayerState::Error || state_ == PlayerState::Loading) {
                                tick_in_flight_ = false;
                                return;
                            }

                            backend_->get_buffering(guarded(generation,
                                [this, fresh, persisted](std::optional<BufferingStatus> status,
                                                         const std::string& error) {
                                    tick_in_flight_ = false;
                                    if (status) {
                                        on_buffering(*status);
                                    } else if (!error.empty()) {
                                        g_debug("Buffering query failed: %s", error.c_str());
                                    }

                                    if (!fresh) return;

                                    finish_tick();
                                    if (!persisted &&
                                        progress_.should_persist(position_ms_, duration_ms_, scheduler_.now())) {
                                        persist_progress();
                                    }
                                }));
                        }));
                }));
        }));
}

void PlaybackSession::on_buffering(const BufferingStatus& status) {
    for (const BufferingWarning& warning : buffering_.update(status, scheduler_.now())) {
        if (warning.severity == BufferingWarning::Severity::Critical) {
            g_warning("%s. %s", warning.message.c_str(), warning.recommendation.c_str());
        } else {
            g_info("%s. %s", warning.message.c_str(), warning.recommendation.c_str());
        }
        emit(SessionEvent::notice(warning.message));
    }
}

void PlaybackSession::finish_tick() {
    if (std::optional<int64_t> target = skip_markers_.update(position_ms_)) {
        seek(*target);
    }

    const PlaylistContext *context = context_ ? &*context_ : nullptr;
    AutoPlayScheduler::Action action = auto_play_.on_position(position_ms_, duration_ms_, context,
        [this]() { next(); },
        [this]() { go_back(); });
    if (action == AutoPlayScheduler::Action::NavigateAway) {
        emit(SessionEvent::notice(kEndOfSeriesMessage));
    }
}

// ============ Transport ============

bool PlaybackSession::can_control() const {
    return current_media_ && state_ != PlayerState::Loading && state_ != PlayerState::Error;
}

PlaybackBackend::CommandCallback PlaybackSession::command_done(const char *command) {
    std::string name = command;
    return guarded(generation_, [this, name](bool success, const std::string& error) {
        if (!success) {
            g_warning("%s failed: %s", name.c_str(), error.c_str());
        }
        refresh_state();
    });
}

void PlaybackSession::refresh_state() {
    backend_->get_state(guarded(generation_,
        [this](std::optional<PlayerState> state, const std::string& error) {
            if (!state) {
                if (!error.empty()) g_warning("State query failed: %s", error.c_str());
                return;
            }
            apply_reported_state(*state);
        }));
}

void PlaybackSession::play() {
    if (!can_control()) return;
    backend_->play(command_done("play"));
}

void PlaybackSession::pause() {
    if (!can_control()) return;
    backend_->pause(command_done("pause"));
}

void PlaybackSession::toggle_play_pause() {
    if (state_ == PlayerState::Playing) {
        pause();
    } else {
        play();
    }
}

void PlaybackSession::stop() {
    if (!can_control()) return;
    backend_->stop(command_done("stop"));
}

void PlaybackSession::seek(int64_t position_ms) {
    if (!can_control()) return;

    position_ms = std::max<int64_t>(0, position_ms);
    if (duration_ms_ > 0) {
        position_ms = std::min(position_ms, duration_ms_);
    }
    position_ms_ = position_ms;
    backend_->seek(position_ms, command_done("seek"));
}

void PlaybackSession::seek_relative(int64_t delta_ms) {
    seek(position_ms_ + delta_ms);
}

void PlaybackSession::set_volume(double volume) {
    if (!can_control()) return;
    volume_ = std::clamp(volume, 0.0, 1.0);
    backend_->set_volume(volume_, command_done("set_volume"));
}

void PlaybackSession::set_speed(double speed) {
    if (!can_control()) return;
    speed_ = std::clamp(speed, kMinSpeed, kMaxSpeed);
    g_debug("Playback speed %.2fx", speed_);
    backend_->set_speed(speed_, command_done("set_speed"));
}

void PlaybackSession::speed_up() {
    set_speed(speed_ * 1.1);
}

void PlaybackSession::speed_down() {
    set_speed(speed_ * 0.9);
}

void PlaybackSession::speed_reset() {
    set_speed(1.0);
}

void PlaybackSession::set_track(TrackKind kind, int64_t id) {
    if (!can_control()) return;
    backend_->select_track(kind, id, guarded(generation_,
        [this](bool success, const std::string& error) {
            if (!success) {
                g_warning("Track selection failed: %s", error.c_str());
            }
            refresh_tracks();
            refresh_state();
        }));
}

void PlaybackSession::frame_step(bool forward) {
    if (!can_control()) return;
    backend_->frame_step(forward, command_done(forward ? "frame_step" : "frame_back_step"));
}

void PlaybackSession::refresh_tracks() {
    if (!current_media_) return;
    backend_->get_tracks(guarded(generation_,
        [this](std::optional<std::vector<Track>> tracks, const std::string& error) {
            if (!tracks) {
                if (!error.empty()) g_warning("Track query failed: %s", error.c_str());
                return;
            }
            tracks_ = std::move(*tracks);
        }));
}

// ============ Navigation ============

void PlaybackSession::previous() {
    if (!context_) {
        g_debug("No playlist context, ignoring previous");
        return;
    }
    std::optional<MediaItemId> id = context_->get_previous();
    if (!id) {
        g_debug("No previous item");
        return;
    }

    PlaylistContext context = *context_;
    context.update_current_index(*id);
    persist_progress();
    load_with_context(*id, context);
}

void PlaybackSession::next() {
    if (!context_) {
        g_debug("No playlist context, ignoring next");
        return;
    }
    std::optional<MediaItemId> id = context_->get_next();
    if (!id) {
        g_debug("No next item");
        return;
    }

    PlaylistContext context = *context_;
    context.update_current_index(*id);
    persist_progress();
    load_with_context(*id, context);
}

void PlaybackSession::stop_for_navigation() {
    retry_.reset();
    auto_play_.cancel();
    persist_progress();

    // Results of anything still in flight belong to a session the user left
    ++generation_;
    tick_in_flight_ = false;
}

void PlaybackSession::go_back() {
    stop_for_navigation();
    emit(SessionEvent::navigate_back());
}

void PlaybackSession::skip_intro() {
    if (std::optional<int64_t> target = skip_markers_.skip_intro()) {
        seek(*target);
    }
}

void PlaybackSession::skip_credits() {
    if (std::optional<int64_t> target = skip_markers_.skip_credits()) {
        seek(*target);
    }
}

// ============ Pointer ============

void PlaybackSession::pointer_enter() {
    controls_.on_enter();
}

void PlaybackSession::pointer_leave() {
    controls_.on_leave();
}

void PlaybackSession::pointer_motion(double x, double y, bool over_controls) {
    controls_.on_motion(x, y, over_controls);
}

void PlaybackSession::toggle_controls() {
    controls_.toggle();
}

void PlaybackSession::set_overlay_open(bool open) {
    controls_.set_overlay_open(open);
}

// ============ Config ============

void PlaybackSession::on_config_changed(const PlaybackConfig& config) {
    if (config.version < config_.version) {
        g_debug("Ignoring config version %llu, have %llu",
                static_cast<unsigned long long>(config.version),
                static_cast<unsigned long long>(config_.version));
        return;
    }

    config_ = config;
    progress_.update_config(config);
    retry_.set_max_attempts(config.max_retry_attempts);
    skip_markers_.update_config(config);
    auto_play_.update_config(config);
    controls_.update_config(config);
    buffering_.update_config(config);
}

// ============ State ============

bool PlaybackSession::apply_reported_state(PlayerState reported) {
    if (reported == state_) return false;

    PlayerState previous = state_;
    set_state(reported);

    if (reported == PlayerState::Error) {
        error_message_ = kPlaybackFailedMessage;
        emit(SessionEvent::error(error_message_));
        return false;
    }

    if (reported == PlayerState::Playing || reported == PlayerState::Paused ||
        reported == PlayerState::Stopped) {
        g_debug("State %s -> %s, saving progress", player_state_name(previous),
                player_state_name(reported));
        if (duration_ms_ > 0) {
            persist_progress();
            return true;
        }
    }
    return false;
}

void PlaybackSession::set_state(PlayerState state) {
    if (state == state_) return;
    state_ = state;
    emit(SessionEvent::state_changed(state));
}

void PlaybackSession::persist_progress() {
    if (!current_media_ || duration_ms_ <= 0) return;

    bool watched = progress_.is_watched(position_ms_, duration_ms_);
    progress_.mark_persisted(scheduler_.now());

    MediaItemId id = *current_media_;
    services_.save_progress(id, position_ms_, duration_ms_, watched,
        [id](bool success, const std::string& error) {
            if (!success) {
                g_warning("Failed to save progress for %s: %s", id.c_str(), error.c_str());
            }
        });

    sync_remote(watched);
}

void PlaybackSession::sync_remote(bool watched) {
    if (!remote_sync_ || !context_ || !context_->remote_queue()) return;

    std::string tag = ProgressPolicy::remote_state_tag(state_, watched, buffering_.is_buffering());
    remote_sync_->sync_progress(*context_, *current_media_, position_ms_, duration_ms_, tag,
        [](bool success, const std::string& error) {
            if (!success) {
                g_warning("Remote progress sync failed: %s", error.c_str());
            }
        });
}

void PlaybackSession::on_event(EventCallback callback) {
    event_callbacks_.push_back(std::move(callback));
}

void PlaybackSession::emit(const SessionEvent& event) {
    // Listeners may re-enter the session
    std::vector<EventCallback> callbacks = event_callbacks_;
    for (const auto& callback : callbacks) {
        callback(event);
    }
}

} // namespace Encore
