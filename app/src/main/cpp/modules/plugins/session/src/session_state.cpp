#include "session_state.h"

const char* session_state_to_string(SessionState state) {
    switch (state) {
        case SessionState::NONE: return "NONE";
        case SessionState::LISTENING: return "LISTENING";
        case SessionState::CONNECTING: return "CONNECTING";
        case SessionState::CONNECTED: return "CONNECTED";
    }
    return "UNKNOWN";
}
