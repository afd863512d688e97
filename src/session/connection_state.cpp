/*
 * PeerLink - session connection states implementation
 */

#include "connection_state.hpp"

#include <cmath>

namespace peerlink {

const char* status_name(ConnectionStatus status) {
    switch (status) {
    case ConnectionStatus::Idle:
        return "idle";
    case ConnectionStatus::Discovering:
        return "discovering";
    case ConnectionStatus::PeerFound:
        return "peerFound";
    case ConnectionStatus::Requesting:
        return "requesting";
    case ConnectionStatus::IncomingRequest:
        return "incomingRequest";
    case ConnectionStatus::Connecting:
        return "connecting";
    case ConnectionStatus::Connected:
        return "connected";
    case ConnectionStatus::Transferring:
        return "transferring";
    case ConnectionStatus::VoiceCall:
        return "voiceCall";
    case ConnectionStatus::Disconnected:
        return "disconnected";
    case ConnectionStatus::Rejected:
        return "rejected";
    case ConnectionStatus::Failed:
        return "failed";
    }
    return "unknown";
}

bool can_transition(ConnectionStatus from, ConnectionStatus to) {
    using S = ConnectionStatus;
    switch (from) {
    case S::Idle:
        return to == S::Discovering || to == S::PeerFound || to == S::Failed;
    case S::Discovering:
        return to == S::PeerFound || to == S::Idle || to == S::IncomingRequest || to == S::Failed;
    case S::PeerFound:
        return to == S::Requesting || to == S::Discovering || to == S::IncomingRequest || to == S::Idle ||
               to == S::Failed;
    case S::Requesting:
        return to == S::Connecting || to == S::Rejected || to == S::Failed || to == S::Disconnected;
    case S::IncomingRequest:
        return to == S::Connecting || to == S::Rejected || to == S::Failed || to == S::Disconnected;
    case S::Connecting:
        return to == S::Connected || to == S::Failed || to == S::Disconnected;
    case S::Connected:
        return to == S::Transferring || to == S::VoiceCall || to == S::Disconnected || to == S::Failed;
    case S::Transferring:
        return to == S::Transferring || to == S::Connected || to == S::Disconnected || to == S::Failed;
    case S::VoiceCall:
        return to == S::Connected || to == S::Disconnected || to == S::Failed;
    case S::Disconnected:
    case S::Rejected:
        return to == S::Idle || to == S::Discovering;
    case S::Failed:
        // Failed to Failed updates the reason.
        return to == S::Idle || to == S::Discovering || to == S::Failed;
    }
    return false;
}

bool ConnectionState::is_active() const {
    switch (status) {
    case ConnectionStatus::Requesting:
    case ConnectionStatus::IncomingRequest:
    case ConnectionStatus::Connecting:
    case ConnectionStatus::Connected:
    case ConnectionStatus::Transferring:
    case ConnectionStatus::VoiceCall:
        return true;
    default:
        return false;
    }
}

bool ConnectionState::is_terminal() const {
    return status == ConnectionStatus::Disconnected || status == ConnectionStatus::Rejected ||
           status == ConnectionStatus::Failed;
}

std::string ConnectionState::to_string() const {
    std::string text = status_name(status);
    if (status == ConnectionStatus::Transferring) {
        text += " " + std::to_string(static_cast<int>(std::lround(progress * 100.0))) + "%";
    }
    if (!reason.empty()) {
        text += " (" + reason + ")";
    }
    return text;
}

} // namespace peerlink
