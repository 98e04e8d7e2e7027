#pragma once

/**
 * Playback backend handle and its libmpv implementation
 */

#include "player_types.hpp"
#include "playback_backend.hpp"
#include "mpv_backend.hpp"
