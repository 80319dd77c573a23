#ifndef CONNECTION_GATE_H
#define CONNECTION_GATE_H

#include <chrono>
#include <map>
#include <mutex>
#include <string>

/**
 * @brief Cross-session connection attempt gating, keyed by peer id.
 *
 * Every failure increments the counter and stamps last_attempt_at. Once the
 * counter reaches max_attempts, attempts are refused until the cooldown has
 * elapsed since last_attempt_at; the first attempt after that resets the
 * counter to zero. Every admitted attempt stamps last_attempt_at.
 */
class ConnectionGate {
public:
    using Clock = std::chrono::steady_clock;

    struct Stats {
        int failed_attempts = 0;
        Clock::time_point last_attempt_at{};
    };

    ConnectionGate(int max_attempts, std::chrono::milliseconds cooldown);

    // Read-only check.
    bool canAttempt(const std::string& peer_id, Clock::time_point now) const;

    // canAttempt() plus bookkeeping for an admitted attempt. Returns false,
    // without touching the record, while the peer is cooling down.
    bool tryBeginAttempt(const std::string& peer_id, Clock::time_point now);

    void recordFailure(const std::string& peer_id, Clock::time_point now);

    // A completed handshake ends the run of consecutive failures.
    void recordSuccess(const std::string& peer_id);

    Stats stats(const std::string& peer_id) const;

    // Time left before attempts are admitted again (zero when not gated).
    std::chrono::milliseconds remainingCooldown(const std::string& peer_id, Clock::time_point now) const;

private:
    bool coolingDown(const Stats& s, Clock::time_point now) const;

    const int m_max_attempts;
    const std::chrono::milliseconds m_cooldown;

    mutable std::mutex m_mutex;
    std::map<std::string, Stats> m_stats;
};

#endif // CONNECTION_GATE_H
