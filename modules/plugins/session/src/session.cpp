#include "session.h"
#include "logger.h"

#include <utility>

QueueOverflowPolicy queue_policy_from_string(const std::string& name) {
    if (name == "reject") {
        return QueueOverflowPolicy::REJECT;
    }
    if (name != "drop_oldest") {
        LOG_WARN("Unknown outbound queue policy '" + name + "', using drop_oldest");
    }
    return QueueOverflowPolicy::DROP_OLDEST;
}

const char* queue_policy_to_string(QueueOverflowPolicy policy) {
    return policy == QueueOverflowPolicy::REJECT ? "reject" : "drop_oldest";
}

// ----------------------------------------------------------------------------
// OutboundQueue
// ----------------------------------------------------------------------------

OutboundQueue::OutboundQueue(size_t capacity, QueueOverflowPolicy policy)
    : m_capacity(capacity), m_policy(policy) {}

bool OutboundQueue::push(std::string message) {
    if (m_capacity == 0) {
        m_dropped++;
        return false;
    }
    if (m_messages.size() >= m_capacity) {
        if (m_policy == QueueOverflowPolicy::REJECT) {
            m_dropped++;
            return false;
        }
        m_messages.pop_front();
        m_dropped++;
    }
    m_messages.push_back(std::move(message));
    return true;
}

std::deque<std::string> OutboundQueue::drain() {
    std::deque<std::string> out;
    out.swap(m_messages);
    return out;
}

void OutboundQueue::clear() {
    m_messages.clear();
}

// ----------------------------------------------------------------------------
// Session
// ----------------------------------------------------------------------------

const char* timer_slot_to_string(TimerSlot slot) {
    switch (slot) {
        case TimerSlot::HANDSHAKE: return "handshake";
        case TimerSlot::KEEP_ALIVE: return "keep-alive";
        case TimerSlot::PROBE: return "probe";
        case TimerSlot::RESPONSE: return "response";
        case TimerSlot::SETTLE: return "settle";
        case TimerSlot::RECONNECT: return "reconnect";
        case TimerSlot::COUNT: break;
    }
    return "unknown";
}

Session::Session(std::string id, SessionRole session_role, uint64_t session_epoch,
                 size_t queue_capacity, QueueOverflowPolicy queue_policy)
    : peer_id(std::move(id)),
      role(session_role),
      epoch(session_epoch),
      outbound(queue_capacity, queue_policy) {
    m_timers.fill(kInvalidTimer);
}

void Session::cancelTimer(ITimerScheduler& scheduler, TimerSlot slot) {
    TimerId& id = timer(slot);
    if (id != kInvalidTimer) {
        scheduler.cancel(id);
        id = kInvalidTimer;
    }
}

void Session::cancelAllTimers(ITimerScheduler& scheduler) {
    for (TimerId& id : m_timers) {
        if (id != kInvalidTimer) {
            scheduler.cancel(id);
            id = kInvalidTimer;
        }
    }
}

size_t Session::armedTimerCount() const {
    size_t count = 0;
    for (TimerId id : m_timers) {
        if (id != kInvalidTimer) {
            count++;
        }
    }
    return count;
}

bool Session::acceptsCommands() const {
    if (state == SessionState::KEEP_ALIVE_ACTIVE) {
        return true;
    }
    // A responder has finished its side once the response is out.
    return role == SessionRole::RESPONDER &&
           state == SessionState::HANDSHAKE_AWAITING_RESPONSE &&
           response_sent;
}

ConnectionPhase Session::phase() const {
    switch (state) {
        case SessionState::IDLE:
            return ConnectionPhase::DISCOVERED;
        case SessionState::TRANSPORT_CONNECTING:
            return ConnectionPhase::CONNECTING;
        case SessionState::CHANNEL_PROBING:
            return ConnectionPhase::CHANNEL_PROBING;
        case SessionState::HANDSHAKE_INIT:
        case SessionState::HANDSHAKE_AWAITING_RESPONSE:
            return ConnectionPhase::HANDSHAKE_SENT;
        case SessionState::HANDSHAKE_COMPLETED:
            return ConnectionPhase::HANDSHAKE_COMPLETED;
        case SessionState::KEEP_ALIVE_ACTIVE:
            return ConnectionPhase::CONNECTED;
        case SessionState::FAILED:
            return ConnectionPhase::FAILED;
        case SessionState::DISCONNECTED:
            return ConnectionPhase::DISCONNECTED;
    }
    return ConnectionPhase::DISCONNECTED;
}
