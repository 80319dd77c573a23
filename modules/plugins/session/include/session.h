#ifndef SESSION_H
#define SESSION_H

#include "peer.h"
#include "session_state_machine.h"
#include "timer_scheduler.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <string>

enum class QueueOverflowPolicy {
    DROP_OLDEST,
    REJECT
};

// "drop_oldest" / "reject"; anything else is DROP_OLDEST.
QueueOverflowPolicy queue_policy_from_string(const std::string& name);
const char* queue_policy_to_string(QueueOverflowPolicy policy);

// Control messages produced before the channel is ready.
class OutboundQueue {
public:
    OutboundQueue(size_t capacity, QueueOverflowPolicy policy);

    // false when the message was rejected (REJECT policy, queue full).
    bool push(std::string message);
    std::deque<std::string> drain();
    void clear();

    size_t size() const { return m_messages.size(); }
    size_t capacity() const { return m_capacity; }
    size_t dropped() const { return m_dropped; }

private:
    size_t m_capacity;
    QueueOverflowPolicy m_policy;
    std::deque<std::string> m_messages;
    size_t m_dropped = 0;
};

enum class TimerSlot : size_t {
    HANDSHAKE,       // handshake deadline
    KEEP_ALIVE,      // repeating keep-alive sender
    PROBE,           // channel probe retry
    RESPONSE,        // responder's delayed handshake response
    SETTLE,          // responder establishment / stabilization windows
    RECONNECT,       // pending automatic reconnect
    COUNT
};

const char* timer_slot_to_string(TimerSlot slot);

// Protocol context of one connection attempt. Owned by PeerRegistry and only
// touched while holding the peer's mutex.
struct Session {
    Session(std::string peer_id, SessionRole role, uint64_t epoch,
            size_t queue_capacity, QueueOverflowPolicy queue_policy);

    const std::string peer_id;
    const SessionRole role;
    const uint64_t epoch;

    SessionState state = SessionState::IDLE;

    int probe_attempts = 0;
    bool response_sent = false;

    FailureKind failure_kind = FailureKind::NONE;
    std::string failure_reason;

    OutboundQueue outbound;

    TimerId& timer(TimerSlot slot) { return m_timers[static_cast<size_t>(slot)]; }
    TimerId timer(TimerSlot slot) const { return m_timers[static_cast<size_t>(slot)]; }

    void cancelTimer(ITimerScheduler& scheduler, TimerSlot slot);
    void cancelAllTimers(ITimerScheduler& scheduler);
    size_t armedTimerCount() const;

    bool isTerminal() const { return SessionStateMachine::is_terminal(state); }
    // Not IDLE and not terminal.
    bool isLive() const { return state != SessionState::IDLE && !isTerminal(); }

    // Commands are accepted once the handshake is over on our side.
    bool acceptsCommands() const;

    ConnectionPhase phase() const;

private:
    std::array<TimerId, static_cast<size_t>(TimerSlot::COUNT)> m_timers{};
};

#endif // SESSION_H
