#pragma once

#include <string>

namespace lumi {

/// discovered -> connecting -> connected -> { disconnected, failed }
enum class SessionState {
    discovered,
    connecting,
    connected,
    disconnected,
    failed,
};

enum class SessionRole {
    client,
    server,
};

inline bool is_terminal(SessionState s) {
    return s == SessionState::disconnected || s == SessionState::failed;
}

/// Only forward moves are legal; terminal states accept nothing.
inline bool can_transition(SessionState from, SessionState to) {
    return static_cast<int>(to) > static_cast<int>(from) && !is_terminal(from) &&
           !(from == SessionState::discovered && to == SessionState::connected);
}

inline const char* to_string(SessionState s) {
    switch (s) {
        case SessionState::discovered:   return "discovered";
        case SessionState::connecting:   return "connecting";
        case SessionState::connected:    return "connected";
        case SessionState::disconnected: return "disconnected";
        case SessionState::failed:       return "failed";
    }
    return "unknown";
}

/// Text shown next to a device in a peer list.
inline std::string describe(SessionState s, const std::string& reason = {}) {
    switch (s) {
        case SessionState::discovered:   return "Tap to connect";
        case SessionState::connecting:   return "Connecting...";
        case SessionState::connected:    return "Connected";
        case SessionState::disconnected: return "Disconnected";
        case SessionState::failed:       return "Failed: " + reason;
    }
    return {};
}

} // namespace lumi
