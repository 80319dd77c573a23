#pragma once

#include "session_events.h"
#include "session_manager.h"

#include <string>

namespace detail {
    // Periodic keep-alive sweep over every active session.
    class ConnectionMonitor {
    public:
        explicit ConnectionMonitor(SessionManager::Impl* sm);
        void handleTimerTick(const TimerTickEvent& event);
    private:
        void checkPeer(const std::string& peer_id);

        SessionManager::Impl* m_sm;
    };
}
