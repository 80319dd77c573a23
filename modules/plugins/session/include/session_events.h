#ifndef SESSION_EVENTS_H
#define SESSION_EVENTS_H

#include "itransport.h"

#include <string>

// --- Bytes received from a transport peer ---
struct DataReceivedEvent {
    std::string peer_id;
    std::string data;
};

// --- Transport link state change ---
struct TransportStateEvent {
    std::string peer_id;
    TransportPeerState state;
};

// --- Inbound link offered by the transport ---
struct InvitationEvent {
    std::string peer_id;
    std::string platform;   // may be empty
};

// --- Discovery reported a device ---
struct PeerDiscoveredEvent {
    std::string peer_id;
    std::string platform;
    std::string name;
};

// --- Discovery no longer sees a device ---
struct PeerLostEvent {
    std::string peer_id;
};

// --- Explicit connect from the observer ---
struct ConnectToPeerEvent {
    std::string peer_id;
};

// --- Explicit teardown from the observer ---
struct PeerDisconnectEvent {
    std::string peer_id;
    std::string reason;
};

// --- Connection monitor sweep ---
struct TimerTickEvent {};

#endif // SESSION_EVENTS_H
