#include "application.hpp"
#include "player/player.hpp"
#include "remote/timeline_sync.hpp"
#include <vector>

struct _EncoreApplication {
    GApplication parent_instance;

    Encore::ConfigStore *config;
    Encore::LocalLibrary *library;
    Encore::GLibScheduler *scheduler;
    Encore::TimelineSync *remote_sync;
    Encore::PlaybackSession *session;

    GFileMonitor *config_monitor;
    guint tick_source;
};

G_DEFINE_TYPE(EncoreApplication, encore_application, G_TYPE_APPLICATION)

static void on_play_pause_action(GSimpleAction *action, GVariant *parameter, gpointer user_data);
static void on_stop_action(GSimpleAction *action, GVariant *parameter, gpointer user_data);
static void on_seek_relative_action(GSimpleAction *action, GVariant *parameter, gpointer user_data);
static void on_next_action(GSimpleAction *action, GVariant *parameter, gpointer user_data);
static void on_previous_action(GSimpleAction *action, GVariant *parameter, gpointer user_data);
static void on_skip_intro_action(GSimpleAction *action, GVariant *parameter, gpointer user_data);
static void on_skip_credits_action(GSimpleAction *action, GVariant *parameter, gpointer user_data);
static void on_speed_action(GSimpleAction *action, GVariant *parameter, gpointer user_data);
static void on_retry_action(GSimpleAction *action, GVariant *parameter, gpointer user_data);
static void on_go_back_action(GSimpleAction *action, GVariant *parameter, gpointer user_data);

static void on_session_event(EncoreApplication *self, const Encore::SessionEvent& event) {
    using Type = Encore::SessionEvent::Type;

    switch (event.type) {
        case Type::MediaLoaded:
            g_message("Playing %s", self->session->current_media()->c_str());
            break;
        case Type::StateChanged:
            g_debug("State: %s", Encore::player_state_name(event.state));
            break;
        case Type::WindowResizeRequested:
            g_debug("Preferred window size %dx%d", event.width, event.height);
            break;
        case Type::Notice:
            g_message("%s", event.message.c_str());
            break;
        case Type::Error:
            g_printerr("%s\n", event.message.c_str());
            break;
        case Type::NavigateBack:
            g_application_quit(G_APPLICATION(self));
            break;
    }
}

static gboolean on_tick(gpointer user_data) {
    EncoreApplication *self = ENCORE_APPLICATION(user_data);
    if (self->session) {
        self->session->tick();
    }
    return G_SOURCE_CONTINUE;
}

static void on_config_file_changed([[maybe_unused]] GFileMonitor *monitor,
                                   [[maybe_unused]] GFile *file,
                                   [[maybe_unused]] GFile *other_file,
                                   GFileMonitorEvent event_type,
                                   gpointer user_data) {
    if (event_type != G_FILE_MONITOR_EVENT_CHANGES_DONE_HINT &&
        event_type != G_FILE_MONITOR_EVENT_CREATED) {
        return;
    }

    EncoreApplication *self = ENCORE_APPLICATION(user_data);
    self->config->load();
    self->library->set_user(self->config->get_config().user_id);
    if (self->remote_sync) {
        self->remote_sync->set_watched_ratio(self->config->get_config().watched_ratio);
    }
    g_info("Configuration reloaded (version %llu)",
           static_cast<unsigned long long>(self->config->get_config().version));
    if (self->session) {
        self->session->on_config_changed(self->config->get_config());
    }
}

static bool ensure_session(EncoreApplication *self) {
    if (self->session) return true;

    const Encore::PlaybackConfig& config = self->config->get_config();
    std::shared_ptr<Encore::MpvBackend> backend = Encore::MpvBackend::create(config.hardware_decoding);
    if (!backend) {
        g_printerr("Could not initialize the playback engine\n");
        return false;
    }

    self->session = new Encore::PlaybackSession(backend, *self->library, *self->scheduler, config,
                                                self->remote_sync);
    self->session->on_event([self](const Encore::SessionEvent& event) {
        on_session_event(self, event);
    });

    self->tick_source = g_timeout_add_seconds(1, on_tick, self);
    return true;
}

static void encore_application_activate(GApplication *app) {
    g_assert(ENCORE_IS_APPLICATION(app));

    EncoreApplication *self = ENCORE_APPLICATION(app);
    if (!self->session) {
        g_printerr("Usage: encore FILE...\n");
    }
}

static void encore_application_open(GApplication *app, GFile **files, gint n_files,
                                    [[maybe_unused]] const gchar *hint) {
    EncoreApplication *self = ENCORE_APPLICATION(app);
    if (n_files <= 0 || !ensure_session(self)) return;

    std::vector<Encore::EpisodeRef> items;
    for (gint i = 0; i < n_files; i++) {
        g_autofree gchar *path = g_file_get_path(files[i]);
        g_autofree gchar *uri = g_file_get_uri(files[i]);
        g_autofree gchar *basename = g_file_get_basename(files[i]);

        Encore::EpisodeRef item;
        item.id = path ? path : uri;
        item.title = basename ? basename : item.id;
        items.push_back(item);
    }

    // Keep running until the session navigates back
    g_application_hold(app);

    if (items.size() == 1) {
        self->session->load(items.front().id);
    } else {
        std::string first = items.front().id;
        self->session->load_with_context(first,
            Encore::PlaylistContext::play_queue(std::move(items), 0, true));
    }
}

static void encore_application_startup(GApplication *app) {
    G_APPLICATION_CLASS(encore_application_parent_class)->startup(app);

    EncoreApplication *self = ENCORE_APPLICATION(app);

    // Initialize configuration
    self->config = new Encore::ConfigStore();
    self->config->load();

    g_autoptr(GFile) config_file = g_file_new_for_path(self->config->storage_path().c_str());
    g_autoptr(GError) error = nullptr;
    self->config_monitor = g_file_monitor_file(config_file, G_FILE_MONITOR_NONE, nullptr, &error);
    if (self->config_monitor) {
        g_signal_connect(self->config_monitor, "changed", G_CALLBACK(on_config_file_changed), self);
    } else {
        g_warning("Cannot watch config file: %s", error->message);
    }

    // Initialize progress library
    self->library = new Encore::LocalLibrary();
    self->library->load();
    self->library->set_user(self->config->get_config().user_id);

    self->scheduler = new Encore::GLibScheduler();

    // Remote progress sync is optional
    const Encore::PlaybackConfig& config = self->config->get_config();
    if (!config.remote_server_url.empty()) {
        self->remote_sync = new Encore::TimelineSync(config.remote_server_url, config.remote_token,
                                                     config.watched_ratio);
        g_info("Syncing progress to %s", config.remote_server_url.c_str());
    }

    // Add actions
    static const GActionEntry app_actions[] = {
        { "play-pause", on_play_pause_action, nullptr, nullptr, nullptr },
        { "stop", on_stop_action, nullptr, nullptr, nullptr },
        { "seek-relative", on_seek_relative_action, "x", nullptr, nullptr },
        { "next", on_next_action, nullptr, nullptr, nullptr },
        { "previous", on_previous_action, nullptr, nullptr, nullptr },
        { "skip-intro", on_skip_intro_action, nullptr, nullptr, nullptr },
        { "skip-credits", on_skip_credits_action, nullptr, nullptr, nullptr },
        { "speed", on_speed_action, "s", nullptr, nullptr },
        { "retry", on_retry_action, nullptr, nullptr, nullptr },
        { "go-back", on_go_back_action, nullptr, nullptr, nullptr },
    };

    g_action_map_add_action_entries(G_ACTION_MAP(app), app_actions, G_N_ELEMENTS(app_actions), app);
}

static void encore_application_shutdown(GApplication *app) {
    EncoreApplication *self = ENCORE_APPLICATION(app);

    if (self->tick_source) {
        g_source_remove(self->tick_source);
        self->tick_source = 0;
    }

    if (self->session) {
        self->session->stop_for_navigation();
        delete self->session;
        self->session = nullptr;
    }

    g_clear_object(&self->config_monitor);

    if (self->remote_sync) {
        delete self->remote_sync;
        self->remote_sync = nullptr;
    }

    if (self->scheduler) {
        delete self->scheduler;
        self->scheduler = nullptr;
    }

    if (self->library) {
        delete self->library;
        self->library = nullptr;
    }

    if (self->config) {
        delete self->config;
        self->config = nullptr;
    }

    G_APPLICATION_CLASS(encore_application_parent_class)->shutdown(app);
}

// ============ Actions ============

static void on_play_pause_action([[maybe_unused]] GSimpleAction *action,
                                 [[maybe_unused]] GVariant *parameter,
                                 gpointer user_data) {
    EncoreApplication *self = ENCORE_APPLICATION(user_data);
    if (self->session) self->session->toggle_play_pause();
}

static void on_stop_action([[maybe_unused]] GSimpleAction *action,
                           [[maybe_unused]] GVariant *parameter,
                           gpointer user_data) {
    EncoreApplication *self = ENCORE_APPLICATION(user_data);
    if (self->session) self->session->stop();
}

static void on_seek_relative_action([[maybe_unused]] GSimpleAction *action,
                                    GVariant *parameter,
                                    gpointer user_data) {
    EncoreApplication *self = ENCORE_APPLICATION(user_data);
    if (self->session) self->session->seek_relative(g_variant_get_int64(parameter));
}

static void on_next_action([[maybe_unused]] GSimpleAction *action,
                           [[maybe_unused]] GVariant *parameter,
                           gpointer user_data) {
    EncoreApplication *self = ENCORE_APPLICATION(user_data);
    if (self->session) self->session->next();
}

static void on_previous_action([[maybe_unused]] GSimpleAction *action,
                               [[maybe_unused]] GVariant *parameter,
                               gpointer user_data) {
    EncoreApplication *self = ENCORE_APPLICATION(user_data);
    if (self->session) self->session->previous();
}

static void on_skip_intro_action([[maybe_unused]] GSimpleAction *action,
                                 [[maybe_unused]] GVariant *parameter,
                                 gpointer user_data) {
    EncoreApplication *self = ENCORE_APPLICATION(user_data);
    if (self->session) self->session->skip_intro();
}

static void on_skip_credits_action([[maybe_unused]] GSimpleAction *action,
                                   [[maybe_unused]] GVariant *parameter,
                                   gpointer user_data) {
    EncoreApplication *self = ENCORE_APPLICATION(user_data);
    if (self->session) self->session->skip_credits();
}

// "up", "down" or "reset"
static void on_speed_action([[maybe_unused]] GSimpleAction *action,
                            GVariant *parameter,
                            gpointer user_data) {
    EncoreApplication *self = ENCORE_APPLICATION(user_data);
    if (!self->session) return;

    const gchar *direction = g_variant_get_string(parameter, nullptr);
    if (g_strcmp0(direction, "up") == 0) {
        self->session->speed_up();
    } else if (g_strcmp0(direction, "down") == 0) {
        self->session->speed_down();
    } else if (g_strcmp0(direction, "reset") == 0) {
        self->session->speed_reset();
    } else {
        g_warning("Unknown speed change: %s", direction);
    }
}

static void on_retry_action([[maybe_unused]] GSimpleAction *action,
                            [[maybe_unused]] GVariant *parameter,
                            gpointer user_data) {
    EncoreApplication *self = ENCORE_APPLICATION(user_data);
    if (self->session) self->session->retry();
}

static void on_go_back_action([[maybe_unused]] GSimpleAction *action,
                              [[maybe_unused]] GVariant *parameter,
                              gpointer user_data) {
    EncoreApplication *self = ENCORE_APPLICATION(user_data);
    if (self->session) {
        self->session->go_back();
    } else {
        g_application_quit(G_APPLICATION(self));
    }
}

static void encore_application_class_init(EncoreApplicationClass *klass) {
    GApplicationClass *app_class = G_APPLICATION_CLASS(klass);

    app_class->activate = encore_application_activate;
    app_class->open = encore_application_open;
    app_class->startup = encore_application_startup;
    app_class->shutdown = encore_application_shutdown;
}

static void encore_application_init(EncoreApplication *self) {
    self->config = nullptr;
    self->library = nullptr;
    self->scheduler = nullptr;
    self->remote_sync = nullptr;
    self->session = nullptr;
    self->config_monitor = nullptr;
    self->tick_source = 0;
}

EncoreApplication *encore_application_new(void) {
    return ENCORE_APPLICATION(g_object_new(
        ENCORE_TYPE_APPLICATION,
        "application-id", "media.encore.Player",
        "flags", G_APPLICATION_HANDLES_OPEN,
        nullptr
    ));
}

Encore::ConfigStore* encore_application_get_config(EncoreApplication *app) {
    g_return_val_if_fail(ENCORE_IS_APPLICATION(app), nullptr);
    return app->config;
}

Encore::LocalLibrary* encore_application_get_library(EncoreApplication *app) {
    g_return_val_if_fail(ENCORE_IS_APPLICATION(app), nullptr);
    return app->library;
}

Encore::PlaybackSession* encore_application_get_session(EncoreApplication *app) {
    g_return_val_if_fail(ENCORE_IS_APPLICATION(app), nullptr);
    return app->session;
}
