#ifndef SESSION_MANAGER_H
#define SESSION_MANAGER_H

#include "peer.h"
#include "control_messages.h"
#include "connection_gate.h"
#include "device_identity.h"
#include "session_config.h"
#include "session_dependencies.h"
#include "session_state_machine.h"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace detail {
    class MessageHandler;
    class PeerLifecycleManager;
    class ConnectionMonitor;
}

/**
 * @brief Drives every peer session: connect, channel probe, handshake,
 * keep-alive, monitoring, gating and reconnect.
 *
 * Callbacks run on the timer scheduler or transport thread and never while
 * a SessionManager lock is held, so they may call back into the manager.
 */
class SessionManager {
public:
    using PeerUpdateCallback = std::function<void(const std::vector<Peer>&)>;
    using CommandCallback = std::function<void(const std::string& peer_id, const Command& command)>;
    using MediaCallback = std::function<void(const std::string& peer_id, const std::string& frame)>;

    // Configuration from ConfigManager, TCP transport, real-time timers.
    SessionManager();
    explicit SessionManager(SessionConfig config,
                            std::shared_ptr<ISessionDependenciesFactory> factory =
                                std::make_shared<DefaultSessionDependenciesFactory>());
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    bool start(PeerUpdateCallback peer_update_cb = nullptr);
    // Tears down every session (Disconnected) and forgets all peers. start() may follow.
    void stop();
    bool isRunning() const;

    // Returns false when the peer is cooling down ("cannot connect, try later")
    // or the transport refuses immediately. True when an attempt is running.
    bool connectToPeer(const std::string& peer_id);

    // Local teardown. Timers are cancelled and the registry updated before
    // this returns. False when the peer has no session.
    bool disconnectPeer(const std::string& peer_id);

    // Sent at once on an active session, queued (bounded) while the session
    // is still being set up.
    bool sendCommand(const std::string& peer_id, const Command& command);

    // Only on an active session; media is never queued.
    bool sendMedia(const std::string& peer_id, const std::string& frame);

    void setCommandCallback(CommandCallback cb);
    void setMediaCallback(MediaCallback cb);

    std::vector<Peer> getPeers() const;
    std::optional<Peer> getPeer(const std::string& peer_id) const;
    std::vector<ConnectedDevice> getConnectedDevices() const;
    ConnectionState getConnectionState() const;
    bool isPeerConnected(const std::string& peer_id) const;
    const DeviceIdentifier& getLocalIdentity() const;

    // Diagnostics
    std::optional<SessionState> getSessionState(const std::string& peer_id) const;
    bool hasArmedTimer(const std::string& peer_id, TimerSlot slot) const;
    ConnectionGate::Stats getAttemptStats(const std::string& peer_id) const;

private:
    friend class detail::MessageHandler;
    friend class detail::PeerLifecycleManager;
    friend class detail::ConnectionMonitor;

    class Impl;
    std::unique_ptr<Impl> m_impl;
};

#endif // SESSION_MANAGER_H
