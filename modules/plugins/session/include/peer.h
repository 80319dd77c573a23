#ifndef PEER_H
#define PEER_H

#include <chrono>
#include <string>

// Externally visible lifecycle of one remote device.
enum class ConnectionPhase {
    DISCOVERED,
    CONNECTING,
    CHANNEL_PROBING,
    HANDSHAKE_SENT,
    HANDSHAKE_COMPLETED,
    CONNECTED,        // authenticated, listed in connectedDevices()
    DISCONNECTED,
    FAILED            // see Peer::failure_reason
};

enum class FailureKind {
    NONE,
    TRANSPORT_ERROR,
    PROTOCOL_TIMEOUT,
    DECODE_ERROR,
    AUTHENTICATION_INCOMPLETE,
    LOCAL_TEARDOWN
};

// Aggregate shown to a UI: one value for the whole registry.
enum class ConnectionState {
    DISCONNECTED,
    CONNECTING,
    CONNECTED,
    FAILED
};

const char* connection_phase_to_string(ConnectionPhase phase);
const char* failure_kind_to_string(FailureKind kind);
const char* connection_state_to_string(ConnectionState state);

struct Peer {
    std::string id;            // transport-level key
    std::string platform;
    std::string name;
    std::string device_id;     // formatted DeviceIdentifier, learned in the handshake

    ConnectionPhase phase = ConnectionPhase::DISCOVERED;
    FailureKind failure_kind = FailureKind::NONE;
    std::string failure_reason;

    bool is_authenticated = false;
    bool discovered = false;

    std::chrono::steady_clock::time_point last_keep_alive_at;

    // Cross-session attempt gating, survives session teardown.
    int failed_attempts = 0;
    std::chrono::steady_clock::time_point last_attempt_at;

    bool isConnected() const { return phase == ConnectionPhase::CONNECTED; }
};

struct ConnectedDevice {
    std::string id;
    std::string name;
    std::string platform;
    bool is_authenticated = false;

    bool operator==(const ConnectedDevice& other) const { return id == other.id; }
    bool operator!=(const ConnectedDevice& other) const { return id != other.id; }
};

#endif // PEER_H
