#pragma once

#include <gio/gio.h>
#include "config.hpp"
#include "local_library.hpp"
#include "session/session.hpp"

G_BEGIN_DECLS

#define ENCORE_TYPE_APPLICATION (encore_application_get_type())

G_DECLARE_FINAL_TYPE(EncoreApplication, encore_application, ENCORE, APPLICATION, GApplication)

EncoreApplication *encore_application_new(void);

Encore::ConfigStore* encore_application_get_config(EncoreApplication *app);

Encore::LocalLibrary* encore_application_get_library(EncoreApplication *app);

/**
 * Session for the current playback, nullptr until files are opened
 */
Encore::PlaybackSession* encore_application_get_session(EncoreApplication *app);

G_END_DECLS
