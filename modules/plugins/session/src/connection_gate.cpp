#include "connection_gate.h"
#include "logger.h"

ConnectionGate::ConnectionGate(int max_attempts, std::chrono::milliseconds cooldown)
    : m_max_attempts(max_attempts > 0 ? max_attempts : 1), m_cooldown(cooldown) {}

bool ConnectionGate::coolingDown(const Stats& s, Clock::time_point now) const {
    return s.failed_attempts >= m_max_attempts && now - s.last_attempt_at < m_cooldown;
}

bool ConnectionGate::canAttempt(const std::string& peer_id, Clock::time_point now) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_stats.find(peer_id);
    return it == m_stats.end() || !coolingDown(it->second, now);
}

bool ConnectionGate::tryBeginAttempt(const std::string& peer_id, Clock::time_point now) {
    std::lock_guard<std::mutex> lock(m_mutex);
    Stats& s = m_stats[peer_id];
    if (coolingDown(s, now)) {
        return false;
    }
    if (s.failed_attempts >= m_max_attempts) {
        LOG_INFO("Gate: cooldown over for " + peer_id + ", resetting " +
                 std::to_string(s.failed_attempts) + " failed attempts");
        s.failed_attempts = 0;
    }
    s.last_attempt_at = now;
    return true;
}

void ConnectionGate::recordFailure(const std::string& peer_id, Clock::time_point now) {
    std::lock_guard<std::mutex> lock(m_mutex);
    Stats& s = m_stats[peer_id];
    s.failed_attempts++;
    s.last_attempt_at = now;
    if (s.failed_attempts == m_max_attempts) {
        LOG_WARN("Gate: " + peer_id + " reached " + std::to_string(m_max_attempts) +
                 " failed attempts, cooling down for " + std::to_string(m_cooldown.count()) + "ms");
    }
}

void ConnectionGate::recordSuccess(const std::string& peer_id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_stats.find(peer_id);
    if (it != m_stats.end()) {
        it->second.failed_attempts = 0;
    }
}

ConnectionGate::Stats ConnectionGate::stats(const std::string& peer_id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_stats.find(peer_id);
    return it == m_stats.end() ? Stats{} : it->second;
}

std::chrono::milliseconds ConnectionGate::remainingCooldown(const std::string& peer_id, Clock::time_point now) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_stats.find(peer_id);
    if (it == m_stats.end() || !coolingDown(it->second, now)) {
        return std::chrono::milliseconds(0);
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(it->second.last_attempt_at + m_cooldown - now);
}
