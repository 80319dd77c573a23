#pragma once

#include "session_events.h"
#include "session_manager.h"
#include "session.h"

#include <chrono>
#include <memory>
#include <string>

namespace detail {
    class PeerLifecycleManager {
    public:
        explicit PeerLifecycleManager(SessionManager::Impl* sm);

        // Entry points; each takes the peer mutex.
        bool handleConnectToPeer(const ConnectToPeerEvent& event);
        bool handlePeerDisconnect(const PeerDisconnectEvent& event);
        void handleTransportState(const TransportStateEvent& event);
        bool handleInvitation(const InvitationEvent& event);
        void handlePeerDiscovered(const PeerDiscoveredEvent& event);
        void handlePeerLost(const PeerLostEvent& event);
        void shutdownPeer(const std::string& peer_id);

        // The rest require the peer mutex to be held.

        // Runs one FSM step and executes its actions. A nested step taken by
        // an action supersedes the actions left over from this one.
        void apply(Session& session, SessionInput input, const std::string& reason = "");

        // Drops a FAILED/DISCONNECTED session, counts the failure and, for a
        // discovered peer we were dialling, arms the reconnect timer.
        void discardIfTerminal(const std::string& peer_id);

        bool sendKeepAlive(const std::string& peer_id, bool reply = false);

    private:
        bool startAttempt(const std::string& peer_id, bool automatic);
        void scheduleReconnect(const std::string& peer_id);
        void openResponderSession(const std::string& peer_id);
        void execute(Session& session, SessionAction action);
        void publishPhase(const Session& session);
        void mirrorGate(const std::string& peer_id);

        void armTimer(Session& session, TimerSlot slot, std::chrono::milliseconds delay, SessionInput input);
        void handleTimer(const std::string& peer_id, uint64_t epoch, TimerSlot slot,
                         const std::shared_ptr<TimerId>& fired, SessionInput input);
        void handleKeepAliveTick(const std::string& peer_id, uint64_t epoch,
                                 const std::shared_ptr<TimerId>& fired);

        SessionManager::Impl* m_sm;
    };
}
