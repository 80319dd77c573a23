#pragma once

#include "session_events.h"
#include "session_manager.h"
#include "session.h"

#include <functional>
#include <vector>

namespace detail {
    class MessageHandler {
    public:
        using Deferred = std::vector<std::function<void()>>;

        explicit MessageHandler(SessionManager::Impl* sm);
        void handleDataReceived(const DataReceivedEvent& event);

    private:
        // Caller holds the peer mutex. Observer callbacks go to `deferred`.
        void handleControl(Session& session, const ControlMessage& message, Deferred& deferred);
        void handleHandshake(Session& session, const HandshakeMessage& handshake);
        void handleCommand(Session& session, const Command& command, Deferred& deferred);
        bool validateHandshake(const HandshakeMessage& handshake, std::string& why) const;

        SessionManager::Impl* m_sm;
    };
}
