#pragma once

/**
 * Playback session core for Encore
 *
 * Components:
 * - session_types.hpp: Playlist context, markers, progress, session events
 * - playback_services.hpp: Stream resolution, progress and marker collaborators
 * - progress_policy.hpp: When to save progress, whether to resume
 * - retry_supervisor.hpp: Exponential backoff around failed loads
 * - skip_markers.hpp: Intro/credits skip windows
 * - auto_play.hpp: Advancing the playlist near the end of an item
 * - buffering_monitor.hpp: Stall and slow-download warnings while buffering
 * - control_visibility.hpp: Pointer driven control visibility
 * - playback_session.hpp: The controller composing all of the above
 *
 * Usage:
 *
 *    Encore::GLibScheduler scheduler;
 *    Encore::PlaybackSession session(backend, library, scheduler, config);
 *    session.on_event([](const Encore::SessionEvent& event) {
 *        if (event.type == Encore::SessionEvent::Type::Error)
 *            g_print("Error: %s\n", event.message.c_str());
 *    });
 *    session.load_with_context(episodes[0].id,
 *        Encore::PlaylistContext::series("Show", episodes, 0, true));
 *
 *    // Once a second
 *    session.tick();
 */

#include "session_types.hpp"
#include "playback_services.hpp"
#include "progress_policy.hpp"
#include "retry_supervisor.hpp"
#include "skip_markers.hpp"
#include "auto_play.hpp"
#include "buffering_monitor.hpp"
#include "control_visibility.hpp"
#include "playback_session.hpp"
