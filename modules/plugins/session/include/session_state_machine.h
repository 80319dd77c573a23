#ifndef SESSION_STATE_MACHINE_H
#define SESSION_STATE_MACHINE_H

#include <initializer_list>
#include <vector>

struct Session;

// =======================================================
// Session protocol state (one Session per connection attempt)
// =======================================================
enum class SessionState {
    IDLE,                         // created, nothing sent (also: reconnect pending)
    TRANSPORT_CONNECTING,
    CHANNEL_PROBING,              // initiator only
    HANDSHAKE_INIT,
    HANDSHAKE_AWAITING_RESPONSE,
    HANDSHAKE_COMPLETED,
    KEEP_ALIVE_ACTIVE,
    FAILED,                       // terminal
    DISCONNECTED                  // terminal, local teardown
};

enum class SessionRole {
    INITIATOR,
    RESPONDER
};

// =======================================================
// FSM inputs
// =======================================================
enum class SessionInput {
    CONNECT_REQUESTED,
    INBOUND_ACCEPTED,
    TRANSPORT_CONNECTED,
    TRANSPORT_DISCONNECTED,
    PROBE_SENT,
    PROBE_FAILED,
    PROBE_RETRY_DUE,
    HANDSHAKE_REQUEST_SENT,
    HANDSHAKE_SEND_FAILED,
    HANDSHAKE_REQUEST_RECEIVED,
    HANDSHAKE_RESPONSE_RECEIVED,
    HANDSHAKE_REJECTED,
    RESPONSE_DELAY_ELAPSED,
    RESPONSE_SENT,
    ESTABLISHMENT_ELAPSED,
    STABILIZATION_ELAPSED,
    HANDSHAKE_TIMEOUT,
    ENTER_KEEP_ALIVE,
    KEEP_ALIVE_LOST,
    LOCAL_DISCONNECT,
    SHUTDOWN
};

// =======================================================
// FSM output actions (executed by PeerLifecycleManager)
// =======================================================
enum class SessionAction {
    NONE,
    OPEN_TRANSPORT,
    SEND_CHANNEL_PROBE,
    SCHEDULE_PROBE_RETRY,
    SEND_HANDSHAKE_REQUEST,
    ARM_HANDSHAKE_TIMER,
    SCHEDULE_HANDSHAKE_RESPONSE,
    SEND_HANDSHAKE_RESPONSE,
    ARM_ESTABLISHMENT_TIMER,
    ARM_STABILIZATION_TIMER,
    COMPLETE_HANDSHAKE,
    START_KEEP_ALIVE,
    FLUSH_QUEUED_MESSAGES,
    CLOSE_TRANSPORT,
    CLEANUP_RESOURCES
};

struct FSMResult {
    SessionState new_state;
    std::vector<SessionAction> actions;

    explicit FSMResult(SessionState state)
        : new_state(state) {}

    FSMResult(SessionState state, std::initializer_list<SessionAction> action_list)
        : new_state(state), actions(action_list) {}
};

// =======================================================
// Session State Machine (transition table only)
// =======================================================
// The machine updates the session's state, probe counter and failure kind;
// every other side effect is described by the returned actions.
class SessionStateMachine {
public:
    // Total probe sends allowed before the session fails.
    explicit SessionStateMachine(int probe_attempt_limit);

    FSMResult handle_event(Session& session, SessionInput input);

    static const char* state_to_string(SessionState state);
    static const char* input_to_string(SessionInput input);
    static const char* action_to_string(SessionAction action);
    static const char* role_to_string(SessionRole role);

    static bool is_terminal(SessionState state);

private:
    FSMResult compute_transition(SessionState current,
                                 SessionInput input,
                                 Session& session) const;

    int m_probe_attempt_limit;
};

#endif // SESSION_STATE_MACHINE_H
