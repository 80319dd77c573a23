#include "session_state_machine.h"
#include "session.h"
#include "logger.h"
#include <algorithm>
#include <iostream>
#include <string>

static int tests_failed = 0;

#define TEST_ASSERT(cond, msg) \
    do { \
        if (!(cond)) { \
            std::cerr << "FAIL: " << msg << " [" << __FILE__ << ":" << __LINE__ << "]" << std::endl; \
            tests_failed++; \
            return false; \
        } \
    } while (0)

static bool has_action(const FSMResult& r, SessionAction action) {
    return std::find(r.actions.begin(), r.actions.end(), action) != r.actions.end();
}

static Session make_session(SessionRole role) {
    return Session("peer", role, 7, 4, QueueOverflowPolicy::DROP_OLDEST);
}

bool test_initiator_happy_path() {
    std::cout << "Testing initiator path..." << std::endl;
    SessionStateMachine fsm(3);
    Session s = make_session(SessionRole::INITIATOR);

    FSMResult r = fsm.handle_event(s, SessionInput::CONNECT_REQUESTED);
    TEST_ASSERT(s.state == SessionState::TRANSPORT_CONNECTING && has_action(r, SessionAction::OPEN_TRANSPORT),
                "Connect should open the transport");

    r = fsm.handle_event(s, SessionInput::TRANSPORT_CONNECTED);
    TEST_ASSERT(s.state == SessionState::CHANNEL_PROBING && has_action(r, SessionAction::SEND_CHANNEL_PROBE),
                "Initiator should probe the channel");

    r = fsm.handle_event(s, SessionInput::PROBE_SENT);
    TEST_ASSERT(s.state == SessionState::HANDSHAKE_INIT && has_action(r, SessionAction::SEND_HANDSHAKE_REQUEST),
                "Successful probe should send the handshake request");

    r = fsm.handle_event(s, SessionInput::HANDSHAKE_REQUEST_SENT);
    TEST_ASSERT(s.state == SessionState::HANDSHAKE_AWAITING_RESPONSE && has_action(r, SessionAction::ARM_HANDSHAKE_TIMER),
                "Request sent should arm the handshake timer");

    r = fsm.handle_event(s, SessionInput::HANDSHAKE_RESPONSE_RECEIVED);
    TEST_ASSERT(s.state == SessionState::HANDSHAKE_COMPLETED && has_action(r, SessionAction::COMPLETE_HANDSHAKE),
                "Response should complete the handshake");

    r = fsm.handle_event(s, SessionInput::ENTER_KEEP_ALIVE);
    TEST_ASSERT(s.state == SessionState::KEEP_ALIVE_ACTIVE, "Should enter keep-alive");
    TEST_ASSERT(r.actions.size() == 2 && r.actions[0] == SessionAction::START_KEEP_ALIVE &&
                r.actions[1] == SessionAction::FLUSH_QUEUED_MESSAGES, "Keep-alive starts, then the queue flushes");
    TEST_ASSERT(s.phase() == ConnectionPhase::CONNECTED, "Active session maps to CONNECTED");

    std::cout << "initiator path Passed!" << std::endl;
    return true;
}

bool test_responder_path() {
    std::cout << "Testing responder path..." << std::endl;
    SessionStateMachine fsm(3);
    Session s = make_session(SessionRole::RESPONDER);

    TEST_ASSERT(fsm.handle_event(s, SessionInput::CONNECT_REQUESTED).new_state == SessionState::IDLE,
                "Responder ignores CONNECT_REQUESTED");
    fsm.handle_event(s, SessionInput::INBOUND_ACCEPTED);
    TEST_ASSERT(s.state == SessionState::TRANSPORT_CONNECTING, "Inbound accept");

    FSMResult r = fsm.handle_event(s, SessionInput::TRANSPORT_CONNECTED);
    TEST_ASSERT(s.state == SessionState::HANDSHAKE_INIT && has_action(r, SessionAction::ARM_HANDSHAKE_TIMER),
                "Responder skips probing and arms the handshake timer");

    r = fsm.handle_event(s, SessionInput::HANDSHAKE_REQUEST_RECEIVED);
    TEST_ASSERT(has_action(r, SessionAction::SCHEDULE_HANDSHAKE_RESPONSE), "Response is delayed");
    TEST_ASSERT(s.phase() == ConnectionPhase::HANDSHAKE_SENT, "Awaiting maps to HANDSHAKE_SENT");

    r = fsm.handle_event(s, SessionInput::HANDSHAKE_REQUEST_RECEIVED);
    TEST_ASSERT(r.actions.empty() && s.state == SessionState::HANDSHAKE_AWAITING_RESPONSE, "Duplicate request is a no-op");

    r = fsm.handle_event(s, SessionInput::ESTABLISHMENT_ELAPSED);
    TEST_ASSERT(r.actions.empty(), "No establishment window before the response is sent");
    TEST_ASSERT(!s.acceptsCommands(), "No commands before the response is sent");

    r = fsm.handle_event(s, SessionInput::RESPONSE_DELAY_ELAPSED);
    TEST_ASSERT(has_action(r, SessionAction::SEND_HANDSHAKE_RESPONSE), "Delay elapsed sends the response");
    r = fsm.handle_event(s, SessionInput::RESPONSE_SENT);
    TEST_ASSERT(s.response_sent && has_action(r, SessionAction::ARM_ESTABLISHMENT_TIMER), "Establishment window armed");
    TEST_ASSERT(s.acceptsCommands(), "Settling responder accepts commands");

    r = fsm.handle_event(s, SessionInput::RESPONSE_DELAY_ELAPSED);
    TEST_ASSERT(r.actions.empty(), "Response is never sent twice");

    r = fsm.handle_event(s, SessionInput::ESTABLISHMENT_ELAPSED);
    TEST_ASSERT(has_action(r, SessionAction::ARM_STABILIZATION_TIMER), "Stabilization window armed");
    r = fsm.handle_event(s, SessionInput::STABILIZATION_ELAPSED);
    TEST_ASSERT(s.state == SessionState::HANDSHAKE_COMPLETED && has_action(r, SessionAction::COMPLETE_HANDSHAKE),
                "Stabilization completes the handshake");

    std::cout << "responder path Passed!" << std::endl;
    return true;
}

bool test_probe_retries() {
    std::cout << "Testing probe retries..." << std::endl;
    SessionStateMachine fsm(3);
    Session s = make_session(SessionRole::INITIATOR);
    fsm.handle_event(s, SessionInput::CONNECT_REQUESTED);
    fsm.handle_event(s, SessionInput::TRANSPORT_CONNECTED);

    FSMResult r = fsm.handle_event(s, SessionInput::PROBE_FAILED);
    TEST_ASSERT(s.state == SessionState::CHANNEL_PROBING && has_action(r, SessionAction::SCHEDULE_PROBE_RETRY),
                "First failure schedules a retry");
    r = fsm.handle_event(s, SessionInput::PROBE_RETRY_DUE);
    TEST_ASSERT(has_action(r, SessionAction::SEND_CHANNEL_PROBE), "Retry resends the probe");
    fsm.handle_event(s, SessionInput::PROBE_FAILED);
    TEST_ASSERT(s.state == SessionState::CHANNEL_PROBING && s.probe_attempts == 2, "Second failure still probing");

    r = fsm.handle_event(s, SessionInput::PROBE_FAILED);
    TEST_ASSERT(s.state == SessionState::FAILED, "Third failure exhausts the attempts");
    TEST_ASSERT(s.failure_kind == FailureKind::PROTOCOL_TIMEOUT, "Exhausted probing is a protocol timeout");
    TEST_ASSERT(has_action(r, SessionAction::CLEANUP_RESOURCES) && has_action(r, SessionAction::CLOSE_TRANSPORT),
                "Failure cleans up and closes the link");

    std::cout << "probe retries Passed!" << std::endl;
    return true;
}

bool test_failures_and_teardown() {
    std::cout << "Testing failure exits..." << std::endl;
    SessionStateMachine fsm(3);

    Session probing = make_session(SessionRole::INITIATOR);
    fsm.handle_event(probing, SessionInput::CONNECT_REQUESTED);
    fsm.handle_event(probing, SessionInput::TRANSPORT_CONNECTED);
    FSMResult r = fsm.handle_event(probing, SessionInput::TRANSPORT_DISCONNECTED);
    TEST_ASSERT(probing.state == SessionState::FAILED && probing.failure_kind == FailureKind::TRANSPORT_ERROR,
                "Link loss while probing is a transport error");
    TEST_ASSERT(!has_action(r, SessionAction::CLOSE_TRANSPORT) && !has_action(r, SessionAction::ARM_HANDSHAKE_TIMER),
                "Nothing to close and no handshake timer");

    Session waiting = make_session(SessionRole::RESPONDER);
    fsm.handle_event(waiting, SessionInput::INBOUND_ACCEPTED);
    fsm.handle_event(waiting, SessionInput::TRANSPORT_CONNECTED);
    fsm.handle_event(waiting, SessionInput::TRANSPORT_DISCONNECTED);
    TEST_ASSERT(waiting.failure_kind == FailureKind::AUTHENTICATION_INCOMPLETE,
                "Link loss mid-handshake is an incomplete authentication");

    Session timed_out = make_session(SessionRole::RESPONDER);
    fsm.handle_event(timed_out, SessionInput::INBOUND_ACCEPTED);
    fsm.handle_event(timed_out, SessionInput::TRANSPORT_CONNECTED);
    r = fsm.handle_event(timed_out, SessionInput::HANDSHAKE_TIMEOUT);
    TEST_ASSERT(timed_out.state == SessionState::FAILED && timed_out.failure_kind == FailureKind::PROTOCOL_TIMEOUT,
                "Handshake timeout fails the session");
    TEST_ASSERT(has_action(r, SessionAction::CLOSE_TRANSPORT), "Timeout closes the link");

    Session local = make_session(SessionRole::INITIATOR);
    fsm.handle_event(local, SessionInput::CONNECT_REQUESTED);
    r = fsm.handle_event(local, SessionInput::LOCAL_DISCONNECT);
    TEST_ASSERT(local.state == SessionState::DISCONNECTED && local.failure_kind == FailureKind::LOCAL_TEARDOWN,
                "Local teardown disconnects");

    Session pending = make_session(SessionRole::INITIATOR);
    r = fsm.handle_event(pending, SessionInput::SHUTDOWN);
    TEST_ASSERT(pending.state == SessionState::DISCONNECTED && !has_action(r, SessionAction::CLOSE_TRANSPORT),
                "An idle session has no link to close");

    r = fsm.handle_event(local, SessionInput::TRANSPORT_CONNECTED);
    TEST_ASSERT(local.state == SessionState::DISCONNECTED && r.actions.empty(), "Terminal states absorb every input");
    TEST_ASSERT(SessionStateMachine::is_terminal(SessionState::FAILED), "FAILED is terminal");
    TEST_ASSERT(!SessionStateMachine::is_terminal(SessionState::KEEP_ALIVE_ACTIVE), "ACTIVE is not terminal");

    std::cout << "failure exits Passed!" << std::endl;
    return true;
}

bool test_keep_alive_exits() {
    std::cout << "Testing keep-alive exits..." << std::endl;
    SessionStateMachine fsm(3);
    Session s = make_session(SessionRole::INITIATOR);
    for (SessionInput in : {SessionInput::CONNECT_REQUESTED, SessionInput::TRANSPORT_CONNECTED,
                            SessionInput::PROBE_SENT, SessionInput::HANDSHAKE_REQUEST_SENT,
                            SessionInput::HANDSHAKE_RESPONSE_RECEIVED, SessionInput::ENTER_KEEP_ALIVE}) {
        fsm.handle_event(s, in);
    }
    TEST_ASSERT(s.state == SessionState::KEEP_ALIVE_ACTIVE, "Session should be active");

    FSMResult r = fsm.handle_event(s, SessionInput::HANDSHAKE_RESPONSE_RECEIVED);
    TEST_ASSERT(s.state == SessionState::KEEP_ALIVE_ACTIVE && r.actions.empty(), "Late response is ignored");

    r = fsm.handle_event(s, SessionInput::KEEP_ALIVE_LOST);
    TEST_ASSERT(s.state == SessionState::FAILED && s.failure_kind == FailureKind::PROTOCOL_TIMEOUT,
                "Lost keep-alive fails the session");
    TEST_ASSERT(s.phase() == ConnectionPhase::FAILED, "Failed maps to FAILED");

    std::cout << "keep-alive exits Passed!" << std::endl;
    return true;
}

bool test_outbound_queue() {
    std::cout << "Testing OutboundQueue..." << std::endl;

    OutboundQueue drop(2, QueueOverflowPolicy::DROP_OLDEST);
    TEST_ASSERT(drop.push("1") && drop.push("2") && drop.push("3"), "Drop-oldest always accepts");
    TEST_ASSERT(drop.size() == 2 && drop.dropped() == 1, "Oldest message dropped");
    auto drained = drop.drain();
    TEST_ASSERT(drained.size() == 2 && drained[0] == "2" && drained[1] == "3", "FIFO order kept");
    TEST_ASSERT(drop.size() == 0, "Drain empties the queue");

    OutboundQueue reject(1, QueueOverflowPolicy::REJECT);
    TEST_ASSERT(reject.push("a"), "First message fits");
    TEST_ASSERT(!reject.push("b"), "Full queue rejects");
    TEST_ASSERT(reject.drain().front() == "a", "Original message kept");

    OutboundQueue none(0, QueueOverflowPolicy::DROP_OLDEST);
    TEST_ASSERT(!none.push("x"), "Zero capacity holds nothing");

    TEST_ASSERT(queue_policy_from_string("reject") == QueueOverflowPolicy::REJECT, "reject parses");
    TEST_ASSERT(queue_policy_from_string("bogus") == QueueOverflowPolicy::DROP_OLDEST, "Unknown policy is drop_oldest");

    std::cout << "OutboundQueue Passed!" << std::endl;
    return true;
}

int main() {
    set_log_level(LogLevel::ERROR);
    std::cout << "Running Session State Machine Tests..." << std::endl;

    test_initiator_happy_path();
    test_responder_path();
    test_probe_retries();
    test_failures_and_teardown();
    test_keep_alive_exits();
    test_outbound_queue();

    if (tests_failed == 0) {
        std::cout << "ALL SESSION STATE MACHINE TESTS PASSED" << std::endl;
        return 0;
    } else {
        std::cerr << tests_failed << " TESTS FAILED" << std::endl;
        return 1;
    }
}
