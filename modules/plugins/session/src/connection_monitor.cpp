#include "connection_monitor.h"
#include "session_manager_p.h"

namespace detail {
    ConnectionMonitor::ConnectionMonitor(SessionManager::Impl* sm) : m_sm(sm) {}

    void ConnectionMonitor::handleTimerTick(const TimerTickEvent&) {
        if (m_sm->m_shutting_down) {
            return;
        }
        for (const Peer& peer : m_sm->m_registry.list()) {
            checkPeer(peer.id);
        }
    }

    void ConnectionMonitor::checkPeer(const std::string& peer_id) {
        std::lock_guard<std::mutex> lock(m_sm->get_peer_mutex(peer_id));
        Session* session = m_sm->m_registry.session(peer_id);
        if (!session || session->state != SessionState::KEEP_ALIVE_ACTIVE) {
            return;
        }
        auto peer = m_sm->m_registry.get(peer_id);
        if (!peer) {
            return;
        }

        const auto now = m_sm->m_scheduler->now();
        const auto silent = std::chrono::duration_cast<std::chrono::milliseconds>(now - peer->last_keep_alive_at);
        if (silent < m_sm->m_config.keep_alive_timeout) {
            return;
        }

        if (!m_sm->m_transport->isConnected(peer_id) || !peer->is_authenticated) {
            m_sm->m_peer_lifecycle_manager->apply(*session, SessionInput::KEEP_ALIVE_LOST, "keep-alive timeout");
        } else {
            // The link still looks up: give it one more chance before failing.
            LOG_INFO("CM: no keep-alive from " + peer_id + " for " + std::to_string(silent.count()) +
                     "ms, sending a last-chance keep-alive");
            if (m_sm->m_peer_lifecycle_manager->sendKeepAlive(peer_id)) {
                m_sm->m_registry.stampKeepAlive(peer_id, now);
            } else {
                m_sm->m_peer_lifecycle_manager->apply(*session, SessionInput::KEEP_ALIVE_LOST,
                                                      "last-chance keep-alive failed");
            }
        }
        m_sm->m_peer_lifecycle_manager->discardIfTerminal(peer_id);
    }
}
