#include "player_types.hpp"

namespace Encore {

const char* player_state_name(PlayerState state) {
    switch (state) {
        case PlayerState::Idle: return "idle";
        case PlayerState::Loading: return "loading";
        case PlayerState::Playing: return "playing";
        case PlayerState::Paused: return "paused";
        case PlayerState::Stopped: return "stopped";
        case PlayerState::Error: return "error";
    }
    return "unknown";
}

} // namespace Encore
