#include "peer.h"

const char* connection_phase_to_string(ConnectionPhase phase) {
    switch (phase) {
        case ConnectionPhase::DISCOVERED: return "DISCOVERED";
        case ConnectionPhase::CONNECTING: return "CONNECTING";
        case ConnectionPhase::CHANNEL_PROBING: return "CHANNEL_PROBING";
        case ConnectionPhase::HANDSHAKE_SENT: return "HANDSHAKE_SENT";
        case ConnectionPhase::HANDSHAKE_COMPLETED: return "HANDSHAKE_COMPLETED";
        case ConnectionPhase::CONNECTED: return "CONNECTED";
        case ConnectionPhase::DISCONNECTED: return "DISCONNECTED";
        case ConnectionPhase::FAILED: return "FAILED";
    }
    return "UNKNOWN";
}

const char* failure_kind_to_string(FailureKind kind) {
    switch (kind) {
        case FailureKind::NONE: return "None";
        case FailureKind::TRANSPORT_ERROR: return "TransportError";
        case FailureKind::PROTOCOL_TIMEOUT: return "ProtocolTimeout";
        case FailureKind::DECODE_ERROR: return "DecodeError";
        case FailureKind::AUTHENTICATION_INCOMPLETE: return "AuthenticationIncomplete";
        case FailureKind::LOCAL_TEARDOWN: return "LocalTeardown";
    }
    return "Unknown";
}

const char* connection_state_to_string(ConnectionState state) {
    switch (state) {
        case ConnectionState::DISCONNECTED: return "disconnected";
        case ConnectionState::CONNECTING: return "connecting";
        case ConnectionState::CONNECTED: return "connected";
        case ConnectionState::FAILED: return "failed";
    }
    return "unknown";
}
