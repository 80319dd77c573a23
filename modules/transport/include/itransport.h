#ifndef ITRANSPORT_H
#define ITRANSPORT_H

#include <functional>
#include <string>

enum class TransportPeerState {
    CONNECTING,
    CONNECTED,
    DISCONNECTED
};

const char* transport_peer_state_to_string(TransportPeerState state);

/**
 * @brief Reliable, per-peer ordered message channel.
 *
 * Peers are identified by a transport-level id that stays stable for the
 * lifetime of a link. Callbacks are never invoked synchronously from inside
 * an API call; they arrive on the transport's own delivery context.
 * A local disconnect() does not produce a callback for the local side.
 */
class ITransport {
public:
    using ReceiveCallback = std::function<void(const std::string& peer_id, const std::string& bytes)>;
    using PeerStateCallback = std::function<void(const std::string& peer_id, TransportPeerState state)>;
    // Asked before an inbound link is accepted. `platform` may be empty when
    // the transport cannot learn it before the handshake.
    using InvitationCallback = std::function<bool(const std::string& peer_id, const std::string& platform)>;

    virtual ~ITransport() = default;

    virtual bool start() = 0;
    virtual void stop() = 0;

    // Returns false on immediate failure. Success is reported later through
    // the peer state callback.
    virtual bool connect(const std::string& target) = 0;

    // Fails immediately (no queuing) when the peer is unknown or not connected.
    virtual bool send(const std::string& peer_id, const std::string& bytes) = 0;

    virtual void disconnect(const std::string& peer_id) = 0;
    virtual bool isConnected(const std::string& peer_id) const = 0;

    virtual void setReceiveCallback(ReceiveCallback cb) = 0;
    virtual void setPeerStateCallback(PeerStateCallback cb) = 0;
    virtual void setInvitationCallback(InvitationCallback cb) = 0;
};

#endif // ITRANSPORT_H
