#pragma once

#include <ostream>
#include <string>

namespace renkei {

// Lifecycle of the single device connection.
enum class ConnectionState {
    Disconnected,
    Connecting,
    Connected,
    Reconnecting,
};

inline const char* toString(ConnectionState state) noexcept {
    switch (state) {
        case ConnectionState::Disconnected: return "disconnected";
        case ConnectionState::Connecting:   return "connecting";
        case ConnectionState::Connected:    return "connected";
        case ConnectionState::Reconnecting: return "reconnecting";
    }
    return "unknown";
}

inline std::ostream& operator<<(std::ostream& os, ConnectionState state) {
    return os << toString(state);
}

} // namespace renkei
