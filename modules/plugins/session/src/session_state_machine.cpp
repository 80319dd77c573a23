#include "session_state_machine.h"
#include "session.h"
#include "logger.h"

namespace {
    FSMResult fail(Session& session, FailureKind kind, std::initializer_list<SessionAction> actions) {
        session.failure_kind = kind;
        return FSMResult(SessionState::FAILED, actions);
    }

    FSMResult teardown(Session& session, std::initializer_list<SessionAction> actions) {
        session.failure_kind = FailureKind::LOCAL_TEARDOWN;
        return FSMResult(SessionState::DISCONNECTED, actions);
    }

    bool in_handshake(SessionState state) {
        return state == SessionState::HANDSHAKE_INIT ||
               state == SessionState::HANDSHAKE_AWAITING_RESPONSE ||
               state == SessionState::HANDSHAKE_COMPLETED;
    }
}

SessionStateMachine::SessionStateMachine(int probe_attempt_limit)
    : m_probe_attempt_limit(probe_attempt_limit > 0 ? probe_attempt_limit : 1) {}

// ==========================================================
// FSM ENTRY POINT
// ==========================================================
FSMResult SessionStateMachine::handle_event(Session& session, SessionInput input) {

    const SessionState old_state = session.state;

    FSMResult result = compute_transition(old_state, input, session);

    if (result.new_state != old_state) {
        session.state = result.new_state;

        LOG_INFO(
            std::string("[SessionFSM] ") +
            state_to_string(old_state) +
            " --(" + input_to_string(input) + ")--> " +
            state_to_string(result.new_state) +
            " peer=" + session.peer_id +
            " role=" + role_to_string(session.role) +
            " epoch=" + std::to_string(session.epoch)
        );
    }

    return result;
}

// ==========================================================
// TRANSITION TABLE
// ==========================================================
FSMResult SessionStateMachine::compute_transition(
    SessionState current,
    SessionInput input,
    Session& session
) const {

    const bool initiator = session.role == SessionRole::INITIATOR;

    switch (current) {

    // ------------------------------------------------------
    case SessionState::IDLE:
        if (input == SessionInput::CONNECT_REQUESTED && initiator)
            return FSMResult(
                SessionState::TRANSPORT_CONNECTING,
                { SessionAction::OPEN_TRANSPORT }
            );

        // The link is already being set up by the remote side.
        if (input == SessionInput::INBOUND_ACCEPTED && !initiator)
            return FSMResult(SessionState::TRANSPORT_CONNECTING);

        if (input == SessionInput::LOCAL_DISCONNECT || input == SessionInput::SHUTDOWN)
            return teardown(session, { SessionAction::CLEANUP_RESOURCES });
        break;

    // ------------------------------------------------------
    case SessionState::TRANSPORT_CONNECTING:
        if (input == SessionInput::TRANSPORT_CONNECTED) {
            if (initiator)
                return FSMResult(
                    SessionState::CHANNEL_PROBING,
                    { SessionAction::SEND_CHANNEL_PROBE }
                );
            // Responder waits passively for the request.
            return FSMResult(
                SessionState::HANDSHAKE_INIT,
                { SessionAction::ARM_HANDSHAKE_TIMER }
            );
        }

        if (input == SessionInput::TRANSPORT_DISCONNECTED)
            return fail(session, FailureKind::TRANSPORT_ERROR, { SessionAction::CLEANUP_RESOURCES });
        break;

    // ------------------------------------------------------
    case SessionState::CHANNEL_PROBING:
        if (input == SessionInput::PROBE_SENT) {
            ++session.probe_attempts;
            return FSMResult(
                SessionState::HANDSHAKE_INIT,
                { SessionAction::SEND_HANDSHAKE_REQUEST }
            );
        }

        if (input == SessionInput::PROBE_FAILED) {
            if (++session.probe_attempts >= m_probe_attempt_limit) {
                return fail(session, FailureKind::PROTOCOL_TIMEOUT,
                            { SessionAction::CLEANUP_RESOURCES, SessionAction::CLOSE_TRANSPORT });
            }
            return FSMResult(
                SessionState::CHANNEL_PROBING,
                { SessionAction::SCHEDULE_PROBE_RETRY }
            );
        }

        if (input == SessionInput::PROBE_RETRY_DUE)
            return FSMResult(
                SessionState::CHANNEL_PROBING,
                { SessionAction::SEND_CHANNEL_PROBE }
            );
        break;

    // ------------------------------------------------------
    case SessionState::HANDSHAKE_INIT:
        if (initiator) {
            if (input == SessionInput::HANDSHAKE_REQUEST_SENT)
                return FSMResult(
                    SessionState::HANDSHAKE_AWAITING_RESPONSE,
                    { SessionAction::ARM_HANDSHAKE_TIMER }
                );

            if (input == SessionInput::HANDSHAKE_SEND_FAILED)
                return fail(session, FailureKind::TRANSPORT_ERROR,
                            { SessionAction::CLEANUP_RESOURCES, SessionAction::CLOSE_TRANSPORT });
        } else if (input == SessionInput::HANDSHAKE_REQUEST_RECEIVED) {
            return FSMResult(
                SessionState::HANDSHAKE_AWAITING_RESPONSE,
                { SessionAction::SCHEDULE_HANDSHAKE_RESPONSE }
            );
        }
        break;

    // ------------------------------------------------------
    case SessionState::HANDSHAKE_AWAITING_RESPONSE:
        if (initiator) {
            if (input == SessionInput::HANDSHAKE_RESPONSE_RECEIVED)
                return FSMResult(
                    SessionState::HANDSHAKE_COMPLETED,
                    { SessionAction::COMPLETE_HANDSHAKE }
                );
            break;
        }

        // Duplicate request while the response is pending: nothing to do.
        if (input == SessionInput::HANDSHAKE_REQUEST_RECEIVED)
            return FSMResult(SessionState::HANDSHAKE_AWAITING_RESPONSE);

        if (input == SessionInput::RESPONSE_DELAY_ELAPSED && !session.response_sent)
            return FSMResult(
                SessionState::HANDSHAKE_AWAITING_RESPONSE,
                { SessionAction::SEND_HANDSHAKE_RESPONSE }
            );

        if (input == SessionInput::RESPONSE_SENT) {
            session.response_sent = true;
            return FSMResult(
                SessionState::HANDSHAKE_AWAITING_RESPONSE,
                { SessionAction::ARM_ESTABLISHMENT_TIMER }
            );
        }

        if (input == SessionInput::HANDSHAKE_SEND_FAILED)
            return fail(session, FailureKind::TRANSPORT_ERROR,
                        { SessionAction::CLEANUP_RESOURCES, SessionAction::CLOSE_TRANSPORT });

        if (input == SessionInput::ESTABLISHMENT_ELAPSED && session.response_sent)
            return FSMResult(
                SessionState::HANDSHAKE_AWAITING_RESPONSE,
                { SessionAction::ARM_STABILIZATION_TIMER }
            );

        if (input == SessionInput::STABILIZATION_ELAPSED && session.response_sent)
            return FSMResult(
                SessionState::HANDSHAKE_COMPLETED,
                { SessionAction::COMPLETE_HANDSHAKE }
            );
        break;

    // ------------------------------------------------------
    case SessionState::HANDSHAKE_COMPLETED:
        if (input == SessionInput::ENTER_KEEP_ALIVE)
            return FSMResult(
                SessionState::KEEP_ALIVE_ACTIVE,
                { SessionAction::START_KEEP_ALIVE, SessionAction::FLUSH_QUEUED_MESSAGES }
            );
        break;

    // ------------------------------------------------------
    case SessionState::KEEP_ALIVE_ACTIVE:
        if (input == SessionInput::KEEP_ALIVE_LOST)
            return fail(session, FailureKind::PROTOCOL_TIMEOUT,
                        { SessionAction::CLEANUP_RESOURCES, SessionAction::CLOSE_TRANSPORT });

        // Late or duplicate handshake traffic after completion.
        if (input == SessionInput::HANDSHAKE_REQUEST_RECEIVED ||
            input == SessionInput::HANDSHAKE_RESPONSE_RECEIVED)
            return FSMResult(SessionState::KEEP_ALIVE_ACTIVE);
        break;

    // ------------------------------------------------------
    case SessionState::FAILED:
    case SessionState::DISCONNECTED:
        // Terminal: the session is discarded by its owner.
        return FSMResult(current);
    }

    // ------------------------------------------------------
    // Exits shared by every live state
    // ------------------------------------------------------
    if (current != SessionState::IDLE) {
        if (input == SessionInput::TRANSPORT_DISCONNECTED) {
            // The link is gone; nothing to close.
            return fail(session,
                        in_handshake(current) ? FailureKind::AUTHENTICATION_INCOMPLETE
                                              : FailureKind::TRANSPORT_ERROR,
                        { SessionAction::CLEANUP_RESOURCES });
        }

        if (input == SessionInput::HANDSHAKE_TIMEOUT)
            return fail(session, FailureKind::PROTOCOL_TIMEOUT,
                        { SessionAction::CLEANUP_RESOURCES, SessionAction::CLOSE_TRANSPORT });

        if (input == SessionInput::HANDSHAKE_REJECTED)
            return fail(session, FailureKind::AUTHENTICATION_INCOMPLETE,
                        { SessionAction::CLEANUP_RESOURCES, SessionAction::CLOSE_TRANSPORT });

        if (input == SessionInput::LOCAL_DISCONNECT || input == SessionInput::SHUTDOWN)
            return teardown(session, { SessionAction::CLEANUP_RESOURCES, SessionAction::CLOSE_TRANSPORT });
    }

    LOG_WARN(
        std::string("[SessionFSM] Ignored transition ") +
        state_to_string(current) +
        " + " + input_to_string(input) +
        " peer=" + session.peer_id
    );

    return FSMResult(current);
}

bool SessionStateMachine::is_terminal(SessionState state) {
    return state == SessionState::FAILED || state == SessionState::DISCONNECTED;
}

// ==========================================================
// DEBUG HELPERS
// ==========================================================
const char* SessionStateMachine::state_to_string(SessionState state) {
    switch (state) {
        case SessionState::IDLE: return "IDLE";
        case SessionState::TRANSPORT_CONNECTING: return "TRANSPORT_CONNECTING";
        case SessionState::CHANNEL_PROBING: return "CHANNEL_PROBING";
        case SessionState::HANDSHAKE_INIT: return "HANDSHAKE_INIT";
        case SessionState::HANDSHAKE_AWAITING_RESPONSE: return "HANDSHAKE_AWAITING_RESPONSE";
        case SessionState::HANDSHAKE_COMPLETED: return "HANDSHAKE_COMPLETED";
        case SessionState::KEEP_ALIVE_ACTIVE: return "KEEP_ALIVE_ACTIVE";
        case SessionState::FAILED: return "FAILED";
        case SessionState::DISCONNECTED: return "DISCONNECTED";
    }
    return "UNKNOWN";
}

const char* SessionStateMachine::input_to_string(SessionInput input) {
    switch (input) {
        case SessionInput::CONNECT_REQUESTED: return "CONNECT_REQUESTED";
        case SessionInput::INBOUND_ACCEPTED: return "INBOUND_ACCEPTED";
        case SessionInput::TRANSPORT_CONNECTED: return "TRANSPORT_CONNECTED";
        case SessionInput::TRANSPORT_DISCONNECTED: return "TRANSPORT_DISCONNECTED";
        case SessionInput::PROBE_SENT: return "PROBE_SENT";
        case SessionInput::PROBE_FAILED: return "PROBE_FAILED";
        case SessionInput::PROBE_RETRY_DUE: return "PROBE_RETRY_DUE";
        case SessionInput::HANDSHAKE_REQUEST_SENT: return "HANDSHAKE_REQUEST_SENT";
        case SessionInput::HANDSHAKE_SEND_FAILED: return "HANDSHAKE_SEND_FAILED";
        case SessionInput::HANDSHAKE_REQUEST_RECEIVED: return "HANDSHAKE_REQUEST_RECEIVED";
        case SessionInput::HANDSHAKE_RESPONSE_RECEIVED: return "HANDSHAKE_RESPONSE_RECEIVED";
        case SessionInput::HANDSHAKE_REJECTED: return "HANDSHAKE_REJECTED";
        case SessionInput::RESPONSE_DELAY_ELAPSED: return "RESPONSE_DELAY_ELAPSED";
        case SessionInput::RESPONSE_SENT: return "RESPONSE_SENT";
        case SessionInput::ESTABLISHMENT_ELAPSED: return "ESTABLISHMENT_ELAPSED";
        case SessionInput::STABILIZATION_ELAPSED: return "STABILIZATION_ELAPSED";
        case SessionInput::HANDSHAKE_TIMEOUT: return "HANDSHAKE_TIMEOUT";
        case SessionInput::ENTER_KEEP_ALIVE: return "ENTER_KEEP_ALIVE";
        case SessionInput::KEEP_ALIVE_LOST: return "KEEP_ALIVE_LOST";
        case SessionInput::LOCAL_DISCONNECT: return "LOCAL_DISCONNECT";
        case SessionInput::SHUTDOWN: return "SHUTDOWN";
    }
    return "UNKNOWN";
}

const char* SessionStateMachine::action_to_string(SessionAction action) {
    switch (action) {
        case SessionAction::NONE: return "NONE";
        case SessionAction::OPEN_TRANSPORT: return "OPEN_TRANSPORT";
        case SessionAction::SEND_CHANNEL_PROBE: return "SEND_CHANNEL_PROBE";
        case SessionAction::SCHEDULE_PROBE_RETRY: return "SCHEDULE_PROBE_RETRY";
        case SessionAction::SEND_HANDSHAKE_REQUEST: return "SEND_HANDSHAKE_REQUEST";
        case SessionAction::ARM_HANDSHAKE_TIMER: return "ARM_HANDSHAKE_TIMER";
        case SessionAction::SCHEDULE_HANDSHAKE_RESPONSE: return "SCHEDULE_HANDSHAKE_RESPONSE";
        case SessionAction::SEND_HANDSHAKE_RESPONSE: return "SEND_HANDSHAKE_RESPONSE";
        case SessionAction::ARM_ESTABLISHMENT_TIMER: return "ARM_ESTABLISHMENT_TIMER";
        case SessionAction::ARM_STABILIZATION_TIMER: return "ARM_STABILIZATION_TIMER";
        case SessionAction::COMPLETE_HANDSHAKE: return "COMPLETE_HANDSHAKE";
        case SessionAction::START_KEEP_ALIVE: return "START_KEEP_ALIVE";
        case SessionAction::FLUSH_QUEUED_MESSAGES: return "FLUSH_QUEUED_MESSAGES";
        case SessionAction::CLOSE_TRANSPORT: return "CLOSE_TRANSPORT";
        case SessionAction::CLEANUP_RESOURCES: return "CLEANUP_RESOURCES";
    }
    return "UNKNOWN";
}

const char* SessionStateMachine::role_to_string(SessionRole role) {
    return role == SessionRole::INITIATOR ? "initiator" : "responder";
}
