/*
 * PeerLink - session connection states
 */

#pragma once

#include <string>
#include <utility>

namespace peerlink {

enum class ConnectionStatus {
    Idle,
    Discovering,
    PeerFound,
    Requesting,
    IncomingRequest,
    Connecting,
    Connected,
    Transferring,
    VoiceCall,
    Disconnected,
    Rejected,
    Failed
};

const char* status_name(ConnectionStatus status);

// Transition table; associated values play no part.
bool can_transition(ConnectionStatus from, ConnectionStatus to);

struct ConnectionState {
    ConnectionStatus status = ConnectionStatus::Idle;
    // Transferring only, in [0, 1].
    double progress = 0.0;
    // Failed, and Rejected when the peer gave one.
    std::string reason;

    static ConnectionState of(ConnectionStatus status) { return ConnectionState{status, 0.0, {}}; }
    static ConnectionState transferring(double progress) {
        return ConnectionState{ConnectionStatus::Transferring, progress, {}};
    }
    static ConnectionState failed(std::string reason) {
        return ConnectionState{ConnectionStatus::Failed, 0.0, std::move(reason)};
    }
    static ConnectionState rejected(std::string reason = {}) {
        return ConnectionState{ConnectionStatus::Rejected, 0.0, std::move(reason)};
    }

    // A channel exists or is being set up.
    bool is_active() const;

    // Idle again possible: disconnected, rejected or failed.
    bool is_terminal() const;

    std::string to_string() const;

    bool operator==(const ConnectionState& other) const {
        return status == other.status && progress == other.progress && reason == other.reason;
    }
    bool operator!=(const ConnectionState& other) const { return !(*this == other); }
};

} // namespace peerlink
