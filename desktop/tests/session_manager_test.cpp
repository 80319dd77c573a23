#include "session_manager.h"
#include "control_messages.h"
#include "loopback_transport.h"
#include "manual_discovery.h"
#include "wire_codec.h"
#include "logger.h"
#include <iostream>
#include <memory>
#include <string>
#include <vector>

static int tests_failed = 0;

#define TEST_ASSERT(cond, msg) \
    do { \
        if (!(cond)) { \
            std::cerr << "FAIL: " << msg << " [" << __FILE__ << ":" << __LINE__ << "]" << std::endl; \
            tests_failed++; \
            return false; \
        } \
    } while (0)

using std::chrono::milliseconds;

static SessionConfig mac_config() {
    SessionConfig config;
    config.platform = "macOS";
    config.device_name = "MacDesktop";
    config.accepted_platforms = {"iOS"};
    return config;
}

static SessionConfig phone_config() {
    SessionConfig config;
    config.platform = "iOS";
    config.device_name = "iPhone";
    config.accepted_platforms = {"macOS"};
    return config;
}

// A desktop node ("mac") and a phone node ("phone") on one loopback network,
// both driven by the same manual clock. Managers are declared last so they
// are torn down before the endpoints they use.
struct TestBed {
    std::shared_ptr<ManualTimerScheduler> sched = std::make_shared<ManualTimerScheduler>();
    std::shared_ptr<LoopbackNetwork> network = LoopbackNetwork::create(*sched);
    std::shared_ptr<LoopbackTransport> mac_ep = network->createEndpoint("mac", "macOS");
    std::shared_ptr<LoopbackTransport> phone_ep = network->createEndpoint("phone", "iOS");
    std::shared_ptr<ManualDiscovery> discovery = std::make_shared<ManualDiscovery>();
    std::unique_ptr<SessionManager> mac;
    std::unique_ptr<SessionManager> phone;

    explicit TestBed(SessionConfig mac_cfg = mac_config(), SessionConfig phone_cfg = phone_config(),
                     bool with_discovery = false) {
        mac = std::make_unique<SessionManager>(
            std::move(mac_cfg),
            std::make_shared<ProvidedSessionDependencies>(sched, mac_ep,
                                                          with_discovery ? discovery : nullptr));
        phone = std::make_unique<SessionManager>(
            std::move(phone_cfg), std::make_shared<ProvidedSessionDependencies>(sched, phone_ep));
    }

    // A peer that links but never speaks the protocol.
    std::shared_ptr<LoopbackTransport> rawEndpoint(const std::string& address) {
        auto ep = network->createEndpoint(address, "iOS");
        ep->start();
        return ep;
    }
};

// Speaks the protocol by hand on a loopback endpoint: answers handshake
// requests and counts the keep-alives it receives.
struct ScriptedPeer {
    std::shared_ptr<LoopbackTransport> endpoint;
    int keep_alives = 0;
    int reply_keep_alives = 0;

    explicit ScriptedPeer(std::shared_ptr<LoopbackTransport> ep) : endpoint(std::move(ep)) {
        endpoint->setReceiveCallback([this](const std::string& from, const std::string& bytes) {
            MessageType type;
            std::string payload;
            ControlMessage message;
            std::string error;
            if (!wire::decode_message(bytes, type, payload) || type != MessageType::CONTROL_JSON ||
                !decode_control_message(payload, message, error)) {
                return;
            }
            if (const auto* keep_alive = std::get_if<KeepAliveMessage>(&message)) {
                keep_alives++;
                if (keep_alive->reply) reply_keep_alives++;
            } else if (const auto* handshake = std::get_if<HandshakeMessage>(&message)) {
                if (handshake->kind == HandshakeKind::REQUEST) {
                    HandshakeMessage response;
                    response.kind = HandshakeKind::RESPONSE;
                    response.device_id = "iOS_ScriptedPhone_0001";
                    response.platform = "iOS";
                    sendControl(from, response);
                }
            }
        });
    }

    bool sendKeepAlive(const std::string& to, bool reply) {
        KeepAliveMessage keep_alive;
        keep_alive.timestamp = unix_timestamp_now();
        keep_alive.device_id = "iOS_ScriptedPhone_0001";
        keep_alive.reply = reply;
        return sendControl(to, keep_alive);
    }

    bool sendControl(const std::string& to, const ControlMessage& message) {
        return endpoint->send(to, wire::encode_message(MessageType::CONTROL_JSON, encode_control_message(message)));
    }
};

bool test_handshake_between_managers() {
    std::cout << "Testing handshake between two managers..." << std::endl;
    TestBed bed;

    std::vector<std::vector<Peer>> snapshots;
    TEST_ASSERT(bed.phone->start(), "phone should start");
    TEST_ASSERT(bed.mac->start([&](const std::vector<Peer>& peers) { snapshots.push_back(peers); }),
                "mac should start");

    TEST_ASSERT(bed.mac->connectToPeer("phone"), "connect should start an attempt");
    bed.sched->runPending();
    TEST_ASSERT(bed.mac->getSessionState("phone") == SessionState::HANDSHAKE_AWAITING_RESPONSE,
                "Initiator waits for the response");
    TEST_ASSERT(bed.mac->hasArmedTimer("phone", TimerSlot::HANDSHAKE), "Handshake deadline armed");
    TEST_ASSERT(bed.phone->getSessionState("mac") == SessionState::HANDSHAKE_AWAITING_RESPONSE,
                "Responder delays its response");
    TEST_ASSERT(bed.mac->getPeer("phone")->phase == ConnectionPhase::HANDSHAKE_SENT, "Phase mirrors the handshake");

    bed.sched->advance(milliseconds(500));
    TEST_ASSERT(bed.mac->isPeerConnected("phone"), "Initiator is connected once the response arrives");
    TEST_ASSERT(!bed.mac->hasArmedTimer("phone", TimerSlot::HANDSHAKE), "Handshake deadline cancelled");
    TEST_ASSERT(bed.mac->hasArmedTimer("phone", TimerSlot::KEEP_ALIVE), "Keep-alive running");
    TEST_ASSERT(!bed.phone->isPeerConnected("mac"), "Responder is still settling");

    bed.sched->advance(milliseconds(3000));
    TEST_ASSERT(bed.phone->isPeerConnected("mac"), "Responder connected after establishment and stabilization");
    TEST_ASSERT(bed.phone->getSessionState("mac") == SessionState::KEEP_ALIVE_ACTIVE, "Responder active");

    auto devices = bed.mac->getConnectedDevices();
    TEST_ASSERT(devices.size() == 1 && devices[0].id == "phone", "One connected device");
    TEST_ASSERT(devices[0].name == "iPhone" && devices[0].platform == "iOS", "Identity learned in the handshake");
    TEST_ASSERT(devices[0].is_authenticated, "Connected devices are authenticated");
    TEST_ASSERT(bed.phone->getPeer("mac")->device_id == bed.mac->getLocalIdentity().format(),
                "Responder stores the initiator's device id");
    TEST_ASSERT(bed.mac->getConnectionState() == ConnectionState::CONNECTED, "Aggregate state connected");
    TEST_ASSERT(bed.mac->getAttemptStats("phone").failed_attempts == 0, "No failures recorded");

    bool saw_connected = false;
    for (const auto& snapshot : snapshots) {
        for (const auto& peer : snapshot) {
            if (peer.id == "phone" && peer.isConnected()) saw_connected = true;
        }
    }
    TEST_ASSERT(saw_connected, "Observer received a snapshot with the connected peer");

    bed.sched->advance(milliseconds(20000));
    TEST_ASSERT(bed.mac->isPeerConnected("phone") && bed.phone->isPeerConnected("mac"),
                "Keep-alives hold the session up");

    std::cout << "handshake between two managers Passed!" << std::endl;
    return true;
}

bool test_handshake_timeout() {
    std::cout << "Testing handshake timeout..." << std::endl;
    TestBed bed;
    auto raw = bed.rawEndpoint("raw");
    bed.mac->start();

    TEST_ASSERT(bed.mac->connectToPeer("raw"), "connect should start");
    bed.sched->runPending();
    TEST_ASSERT(bed.mac->getSessionState("raw") == SessionState::HANDSHAKE_AWAITING_RESPONSE, "Request sent");

    bed.sched->advance(milliseconds(14999));
    TEST_ASSERT(bed.mac->getSessionState("raw") == SessionState::HANDSHAKE_AWAITING_RESPONSE, "Still waiting");

    bed.sched->advance(milliseconds(1));
    TEST_ASSERT(!bed.mac->getSessionState("raw").has_value(), "Failed session is discarded");
    auto peer = bed.mac->getPeer("raw");
    TEST_ASSERT(peer && peer->phase == ConnectionPhase::FAILED, "Peer failed");
    TEST_ASSERT(peer->failure_kind == FailureKind::PROTOCOL_TIMEOUT, "Failure is a protocol timeout");
    TEST_ASSERT(peer->failure_reason == "handshake timeout", "Failure reason recorded");
    TEST_ASSERT(!bed.network->linked("mac", "raw"), "Link closed on timeout");
    TEST_ASSERT(bed.mac->getAttemptStats("raw").failed_attempts == 1, "Failure counted by the gate");
    TEST_ASSERT(peer->failed_attempts == 1, "Gate counter mirrored on the peer");

    std::cout << "handshake timeout Passed!" << std::endl;
    return true;
}

bool test_channel_probe_failures() {
    std::cout << "Testing channel probe failures..." << std::endl;
    TestBed bed;
    auto raw = bed.rawEndpoint("raw");
    bed.mac->start();
    bed.network->setSendFailure("mac", true);

    TEST_ASSERT(bed.mac->connectToPeer("raw"), "connect should start");
    bed.sched->runPending();
    TEST_ASSERT(bed.mac->getSessionState("raw") == SessionState::CHANNEL_PROBING, "Probing after the first failure");
    TEST_ASSERT(bed.mac->hasArmedTimer("raw", TimerSlot::PROBE), "Probe retry armed");
    TEST_ASSERT(!bed.mac->hasArmedTimer("raw", TimerSlot::HANDSHAKE), "No handshake deadline while probing");

    bed.sched->advance(milliseconds(1000));
    TEST_ASSERT(bed.mac->getSessionState("raw") == SessionState::CHANNEL_PROBING, "Second probe failed, still probing");
    bed.sched->advance(milliseconds(1000));
    auto peer = bed.mac->getPeer("raw");
    TEST_ASSERT(!bed.mac->getSessionState("raw").has_value(), "Third failure ends the session");
    TEST_ASSERT(peer->phase == ConnectionPhase::FAILED && peer->failure_kind == FailureKind::PROTOCOL_TIMEOUT,
                "Exhausted probing is a protocol timeout");
    TEST_ASSERT(peer->failure_reason == "channel probe failed 3 times", "Reason names the attempt count");

    TEST_ASSERT(bed.mac->connectToPeer("raw"), "A new attempt is still allowed");
    bed.sched->runPending();
    TEST_ASSERT(bed.mac->getSessionState("raw") == SessionState::CHANNEL_PROBING, "Probing again");
    bed.network->sever("mac", "raw");
    bed.sched->runPending();
    peer = bed.mac->getPeer("raw");
    TEST_ASSERT(!bed.mac->getSessionState("raw").has_value(), "Link loss ends the session");
    TEST_ASSERT(peer->failure_kind == FailureKind::TRANSPORT_ERROR, "Link loss while probing is a transport error");
    TEST_ASSERT(bed.mac->getAttemptStats("raw").failed_attempts == 2, "Both failures counted");
    TEST_ASSERT(!bed.mac->hasArmedTimer("raw", TimerSlot::HANDSHAKE), "No handshake deadline after link loss");

    bed.sched->advance(milliseconds(20000));
    peer = bed.mac->getPeer("raw");
    TEST_ASSERT(!bed.mac->hasArmedTimer("raw", TimerSlot::HANDSHAKE), "No handshake deadline armed later either");
    TEST_ASSERT(peer->failure_kind == FailureKind::TRANSPORT_ERROR && peer->failed_attempts == 2,
                "No handshake timeout fires for the abandoned attempt");

    std::cout << "channel probe failures Passed!" << std::endl;
    return true;
}

bool test_keep_alive_loss() {
    std::cout << "Testing keep-alive loss..." << std::endl;
    TestBed bed;
    bed.phone->start();
    bed.mac->start();
    bed.mac->connectToPeer("phone");
    bed.sched->advance(milliseconds(4000));
    TEST_ASSERT(bed.mac->isPeerConnected("phone") && bed.phone->isPeerConnected("mac"), "Both sides active");

    // The link stays up but nothing gets through any more.
    bed.network->setSendFailure("mac", true);
    bed.network->setSendFailure("phone", true);

    bed.sched->advance(milliseconds(3900));
    TEST_ASSERT(bed.mac->isPeerConnected("phone"), "Silence shorter than the timeout is tolerated");

    bed.sched->advance(milliseconds(4100));
    auto peer = bed.mac->getPeer("phone");
    TEST_ASSERT(!bed.mac->isPeerConnected("phone"), "Silent peer is dropped");
    TEST_ASSERT(peer->phase == ConnectionPhase::FAILED && peer->failure_kind == FailureKind::PROTOCOL_TIMEOUT,
                "Keep-alive loss is a protocol timeout");
    TEST_ASSERT(peer->failure_reason == "last-chance keep-alive failed", "Last-chance keep-alive was tried");
    TEST_ASSERT(!peer->is_authenticated, "Authentication cleared with the session");
    TEST_ASSERT(!bed.mac->hasArmedTimer("phone", TimerSlot::KEEP_ALIVE), "Keep-alive timer cancelled");
    TEST_ASSERT(!bed.phone->isPeerConnected("mac"), "Other side gives up as well");
    TEST_ASSERT(bed.mac->getConnectionState() == ConnectionState::FAILED, "Aggregate state failed");

    std::cout << "keep-alive loss Passed!" << std::endl;
    return true;
}

bool test_keep_alive_grace_extends() {
    std::cout << "Testing keep-alive grace..." << std::endl;
    // Keep-alives are sent rarely, so the monitor finds the peer silent while
    // the link is still fine.
    SessionConfig mac_cfg = mac_config();
    mac_cfg.keep_alive_interval = milliseconds(60000);
    mac_cfg.keep_alive_timeout = milliseconds(3000);
    SessionConfig phone_cfg = phone_config();
    phone_cfg.keep_alive_interval = milliseconds(60000);
    phone_cfg.keep_alive_timeout = milliseconds(3000);
    TestBed bed(mac_cfg, phone_cfg);

    bed.phone->start();
    bed.mac->start();
    bed.mac->connectToPeer("phone");
    bed.sched->advance(milliseconds(4000));
    TEST_ASSERT(bed.mac->isPeerConnected("phone") && bed.phone->isPeerConnected("mac"), "Both sides active");

    bed.sched->advance(milliseconds(10000));
    TEST_ASSERT(bed.mac->isPeerConnected("phone") && bed.phone->isPeerConnected("mac"),
                "A successful last-chance keep-alive extends the session");
    const auto silent = bed.sched->now() - bed.mac->getPeer("phone")->last_keep_alive_at;
    TEST_ASSERT(silent < milliseconds(4000), "Each last-chance keep-alive restarts the silence window");

    std::cout << "keep-alive grace Passed!" << std::endl;
    return true;
}

bool test_last_chance_keep_alive() {
    std::cout << "Testing last-chance keep-alive..." << std::endl;
    // Periodic keep-alives are far apart, so only the monitor sends in between.
    SessionConfig cfg = mac_config();
    cfg.keep_alive_interval = milliseconds(60000);
    cfg.keep_alive_timeout = milliseconds(3000);
    TestBed bed(cfg);
    ScriptedPeer raw(bed.rawEndpoint("raw"));

    bed.mac->start();
    TEST_ASSERT(bed.mac->connectToPeer("raw"), "connect should start");
    bed.sched->runPending();
    TEST_ASSERT(bed.mac->isPeerConnected("raw"), "Scripted peer completes the handshake");
    TEST_ASSERT(raw.keep_alives == 1, "First keep-alive goes out on activation");

    bed.sched->advance(milliseconds(2999));
    TEST_ASSERT(raw.keep_alives == 1, "Nothing sent while the peer is within the timeout");

    bed.sched->advance(milliseconds(1));
    TEST_ASSERT(raw.keep_alives == 2, "Exactly one last-chance keep-alive in the escalation tick");
    TEST_ASSERT(bed.mac->isPeerConnected("raw"), "Successful last chance extends the session");
    TEST_ASSERT(bed.mac->getPeer("raw")->last_keep_alive_at == bed.sched->now(), "Silence window restarted");

    bed.sched->advance(milliseconds(2999));
    TEST_ASSERT(raw.keep_alives == 2, "Extension lasts a full timeout");
    bed.sched->advance(milliseconds(1));
    TEST_ASSERT(raw.keep_alives == 3, "One more last-chance keep-alive per escalation");

    bed.network->setSendFailure("mac", true);
    bed.sched->advance(milliseconds(2999));
    TEST_ASSERT(bed.mac->isPeerConnected("raw"), "Still inside the extended window");
    bed.sched->advance(milliseconds(1));
    auto peer = bed.mac->getPeer("raw");
    TEST_ASSERT(!bed.mac->isPeerConnected("raw"), "Failed last chance disconnects in the same tick");
    TEST_ASSERT(peer->failure_reason == "last-chance keep-alive failed", "Failure names the last chance");
    TEST_ASSERT(peer->last_keep_alive_at < bed.sched->now(), "A failed last chance does not extend");
    TEST_ASSERT(raw.keep_alives == 3, "Nothing else reached the peer");
    TEST_ASSERT(!bed.network->linked("mac", "raw"), "Link closed on failure");

    std::cout << "last-chance keep-alive Passed!" << std::endl;
    return true;
}

bool test_keep_alive_replies() {
    std::cout << "Testing keep-alive replies..." << std::endl;
    SessionConfig cfg = mac_config();
    cfg.keep_alive_reply = true;
    {
        TestBed bed(cfg);
        ScriptedPeer raw(bed.rawEndpoint("raw"));
        bed.mac->start();
        bed.mac->connectToPeer("raw");
        bed.sched->runPending();
        TEST_ASSERT(bed.mac->isPeerConnected("raw"), "Session active");
        TEST_ASSERT(raw.keep_alives == 1 && raw.reply_keep_alives == 0, "Periodic keep-alive is not a reply");

        TEST_ASSERT(raw.sendKeepAlive("mac", false), "Plain keep-alive sent");
        bed.sched->runPending();
        TEST_ASSERT(raw.keep_alives == 2 && raw.reply_keep_alives == 1, "Plain keep-alive is answered once");

        TEST_ASSERT(raw.sendKeepAlive("mac", true), "Reply keep-alive sent");
        bed.sched->runPending();
        TEST_ASSERT(raw.keep_alives == 2, "A reply is never answered");
    }

    SessionConfig phone_cfg = phone_config();
    phone_cfg.keep_alive_reply = true;
    TestBed bed(cfg, phone_cfg);
    bed.phone->start();
    bed.mac->start();
    bed.mac->connectToPeer("phone");
    bed.sched->advance(milliseconds(4000));
    TEST_ASSERT(bed.mac->isPeerConnected("phone") && bed.phone->isPeerConnected("mac"), "Both sides active");

    const size_t mac_sent = bed.network->sentCount("mac", "phone");
    const size_t phone_sent = bed.network->sentCount("phone", "mac");
    bed.sched->advance(milliseconds(10000));
    // Five periodic keep-alives and at most five replies each way.
    TEST_ASSERT(bed.network->sentCount("mac", "phone") - mac_sent <= 11, "Mac traffic stays bounded");
    TEST_ASSERT(bed.network->sentCount("phone", "mac") - phone_sent <= 11, "Phone traffic stays bounded");
    TEST_ASSERT(bed.mac->isPeerConnected("phone") && bed.phone->isPeerConnected("mac"), "Still connected");

    std::cout << "keep-alive replies Passed!" << std::endl;
    return true;
}

bool test_connection_cooldown() {
    std::cout << "Testing connection cooldown..." << std::endl;
    TestBed bed;
    auto raw = bed.rawEndpoint("raw");
    bed.network->setRefuseConnections("raw", true);
    bed.mac->start();

    for (int i = 1; i <= 3; ++i) {
        TEST_ASSERT(bed.mac->connectToPeer("raw"), "Attempt below the limit is admitted");
        bed.sched->runPending();
        TEST_ASSERT(!bed.mac->getSessionState("raw").has_value(), "Refused attempt fails");
        TEST_ASSERT(bed.mac->getAttemptStats("raw").failed_attempts == i, "Failure counted");
    }
    auto peer = bed.mac->getPeer("raw");
    TEST_ASSERT(peer->failure_kind == FailureKind::TRANSPORT_ERROR, "Refusal is a transport error");

    TEST_ASSERT(!bed.mac->connectToPeer("raw"), "Fourth attempt is refused during the cooldown");
    TEST_ASSERT(!bed.mac->getSessionState("raw").has_value(), "No session for a gated attempt");

    bed.sched->advance(milliseconds(9999));
    TEST_ASSERT(!bed.mac->connectToPeer("raw"), "Still cooling down");

    bed.network->setRefuseConnections("raw", false);
    bed.sched->advance(milliseconds(1));
    TEST_ASSERT(bed.mac->connectToPeer("raw"), "Allowed once the cooldown is over");
    TEST_ASSERT(bed.mac->getAttemptStats("raw").failed_attempts == 0, "Counter reset by the new attempt");
    bed.sched->runPending();
    TEST_ASSERT(bed.mac->getSessionState("raw") == SessionState::HANDSHAKE_AWAITING_RESPONSE, "Attempt proceeds");

    std::cout << "connection cooldown Passed!" << std::endl;
    return true;
}

bool test_commands_and_media() {
    std::cout << "Testing commands and media..." << std::endl;
    TestBed bed;

    std::vector<Command> mac_commands;
    std::vector<Command> phone_commands;
    std::vector<std::string> phone_frames;
    bed.mac->setCommandCallback([&](const std::string&, const Command& c) { mac_commands.push_back(c); });
    bed.phone->setCommandCallback([&](const std::string& from, const Command& c) {
        if (from == "mac") phone_commands.push_back(c);
    });
    bed.phone->setMediaCallback([&](const std::string&, const std::string& frame) { phone_frames.push_back(frame); });

    bed.phone->start();
    bed.mac->start();
    bed.mac->connectToPeer("phone");
    bed.sched->advance(milliseconds(4000));
    TEST_ASSERT(bed.phone->isPeerConnected("mac"), "Both sides active");

    TEST_ASSERT(bed.mac->sendCommand("phone", StartVideoCommand{}), "start_video sent");
    bed.sched->runPending();
    TEST_ASSERT(phone_commands.size() == 1 && std::holds_alternative<StartVideoCommand>(phone_commands[0]),
                "Phone received start_video");
    TEST_ASSERT(mac_commands.size() == 1, "Mac received the acknowledgement");
    const auto* ack = std::get_if<VideoAckCommand>(&mac_commands[0]);
    TEST_ASSERT(ack && ack->status == "starting" && ack->quality == "high", "video_ack with the default quality");

    TEST_ASSERT(bed.mac->sendCommand("phone", FlashlightCommand{true}), "flashlight sent");
    bed.sched->runPending();
    const auto* flash_ack = std::get_if<FlashlightAckCommand>(&mac_commands.back());
    TEST_ASSERT(flash_ack && flash_ack->state, "flashlight acknowledged with its state");

    TEST_ASSERT(bed.phone->sendCommand("mac", StopPreviewCommand{}), "Phone can send too");
    bed.sched->runPending();
    TEST_ASSERT(std::holds_alternative<StopPreviewCommand>(mac_commands.back()), "Mac received stop_preview");
    TEST_ASSERT(phone_commands.size() == 2, "stop_preview is not answered");

    TEST_ASSERT(bed.phone->sendCommand("mac", FlashlightAckCommand{true}), "Unsolicited acknowledgement sent");
    bed.sched->runPending();
    TEST_ASSERT(std::holds_alternative<FlashlightAckCommand>(mac_commands.back()), "Acknowledgement forwarded");
    TEST_ASSERT(phone_commands.size() == 2, "Acknowledgements are never answered");

    TEST_ASSERT(bed.mac->sendMedia("phone", std::string("\x00\xFF frame", 8)), "Media sent on an active session");
    bed.sched->runPending();
    TEST_ASSERT(phone_frames.size() == 1 && phone_frames[0] == std::string("\x00\xFF frame", 8),
                "Media frame delivered intact");

    TEST_ASSERT(!bed.mac->sendCommand("ghost", StopPreviewCommand{}), "No session, no command");
    TEST_ASSERT(!bed.mac->sendMedia("ghost", "x"), "No session, no media");

    std::cout << "commands and media Passed!" << std::endl;
    return true;
}

bool test_queue_before_active() {
    std::cout << "Testing queued commands..." << std::endl;
    TestBed bed;
    std::vector<Command> mac_commands;
    std::vector<Command> phone_commands;
    bed.mac->setCommandCallback([&](const std::string&, const Command& c) { mac_commands.push_back(c); });
    bed.phone->setCommandCallback([&](const std::string&, const Command& c) { phone_commands.push_back(c); });
    bed.phone->start();
    bed.mac->start();

    TEST_ASSERT(bed.mac->connectToPeer("phone"), "connect");
    TEST_ASSERT(bed.mac->sendCommand("phone", FlashlightCommand{true}), "Command queued while connecting");
    TEST_ASSERT(!bed.mac->sendMedia("phone", "frame"), "Media is never queued");
    bed.sched->runPending();
    TEST_ASSERT(phone_commands.empty(), "Nothing delivered before the session is active");

    bed.sched->advance(milliseconds(4000));
    TEST_ASSERT(phone_commands.size() == 1 && std::holds_alternative<FlashlightCommand>(phone_commands[0]),
                "Queued command flushed exactly once");
    TEST_ASSERT(mac_commands.size() == 1 && std::holds_alternative<FlashlightAckCommand>(mac_commands[0]),
                "Queued command acknowledged");

    SessionConfig strict = mac_config();
    strict.max_queued_messages = 2;
    strict.queue_policy = QueueOverflowPolicy::REJECT;
    TestBed small(strict);
    auto raw = small.rawEndpoint("raw");
    small.mac->start();
    small.mac->connectToPeer("raw");
    TEST_ASSERT(small.mac->sendCommand("raw", StopPreviewCommand{}), "First fits");
    TEST_ASSERT(small.mac->sendCommand("raw", StopPreviewCommand{}), "Second fits");
    TEST_ASSERT(!small.mac->sendCommand("raw", StopPreviewCommand{}), "Full queue rejects");

    std::cout << "queued commands Passed!" << std::endl;
    return true;
}

bool test_disconnect_peer() {
    std::cout << "Testing local disconnect..." << std::endl;
    TestBed bed;
    bed.phone->start();
    bed.mac->start();
    bed.mac->connectToPeer("phone");
    bed.sched->advance(milliseconds(4000));
    TEST_ASSERT(bed.mac->isPeerConnected("phone"), "Connected");

    TEST_ASSERT(bed.mac->disconnectPeer("phone"), "disconnectPeer succeeds");
    auto peer = bed.mac->getPeer("phone");
    TEST_ASSERT(peer && peer->phase == ConnectionPhase::DISCONNECTED, "Peer kept as disconnected");
    TEST_ASSERT(peer->failure_kind == FailureKind::LOCAL_TEARDOWN, "Local teardown recorded");
    TEST_ASSERT(!bed.mac->getSessionState("phone").has_value(), "Session discarded");
    TEST_ASSERT(!bed.mac->hasArmedTimer("phone", TimerSlot::KEEP_ALIVE), "Timers cancelled before returning");
    TEST_ASSERT(bed.mac->getAttemptStats("phone").failed_attempts == 0, "A local teardown is not a failure");
    TEST_ASSERT(!bed.mac->disconnectPeer("phone"), "Second disconnect has nothing to do");

    bed.sched->runPending();
    TEST_ASSERT(!bed.phone->isPeerConnected("mac"), "Remote side sees the link go");
    TEST_ASSERT(bed.phone->getPeer("mac")->failure_kind == FailureKind::TRANSPORT_ERROR,
                "Remote side records a transport error");

    bed.sched->advance(milliseconds(10000));
    TEST_ASSERT(!bed.mac->getSessionState("phone").has_value(), "No reconnect after a local teardown");

    std::cout << "local disconnect Passed!" << std::endl;
    return true;
}

bool test_platform_filter() {
    std::cout << "Testing platform filtering..." << std::endl;

    SessionConfig phone_only_ios = phone_config();
    phone_only_ios.accepted_platforms = {"iOS"};
    TestBed refusing(mac_config(), phone_only_ios);
    refusing.phone->start();
    refusing.mac->start();
    TEST_ASSERT(refusing.mac->connectToPeer("phone"), "Attempt starts");
    refusing.sched->runPending();
    TEST_ASSERT(!refusing.phone->getPeer("mac").has_value(), "Declined invitation leaves no peer");
    TEST_ASSERT(refusing.mac->getPeer("phone")->failure_kind == FailureKind::TRANSPORT_ERROR,
                "Declined link fails the initiator");

    SessionConfig watch = phone_config();
    watch.platform = "watchOS";
    TestBed mismatch(mac_config(), watch);
    mismatch.phone->start();
    mismatch.mac->start();
    mismatch.mac->connectToPeer("phone");
    mismatch.sched->advance(milliseconds(500));
    auto peer = mismatch.mac->getPeer("phone");
    TEST_ASSERT(peer->phase == ConnectionPhase::FAILED, "Unexpected platform fails the handshake");
    TEST_ASSERT(peer->failure_kind == FailureKind::AUTHENTICATION_INCOMPLETE, "Rejected handshake kind");
    TEST_ASSERT(peer->failure_reason == "platform watchOS not accepted", "Reason names the platform");
    TEST_ASSERT(!peer->is_authenticated, "Never authenticated");

    mismatch.sched->runPending();
    TEST_ASSERT(mismatch.phone->getPeer("mac")->failure_kind == FailureKind::AUTHENTICATION_INCOMPLETE,
                "Responder loses the link mid-handshake");

    std::cout << "platform filtering Passed!" << std::endl;
    return true;
}

bool test_discovery_connect_and_loss() {
    std::cout << "Testing discovery driven connect and loss..." << std::endl;
    TestBed bed(mac_config(), phone_config(), true);
    bed.discovery->announce("phone", "iOS", "Alice's iPhone");
    bed.discovery->announce("tv", "Android", "Living room");

    bed.phone->start();
    bed.mac->start();
    TEST_ASSERT(!bed.mac->getPeer("tv").has_value(), "Other platforms are ignored");
    auto peer = bed.mac->getPeer("phone");
    TEST_ASSERT(peer && peer->discovered, "Discovered peer registered");
    TEST_ASSERT(bed.mac->getSessionState("phone").has_value(), "Discovered peer connects automatically");

    bed.sched->advance(milliseconds(4000));
    TEST_ASSERT(bed.mac->isPeerConnected("phone") && bed.phone->isPeerConnected("mac"), "Both sides active");

    bed.discovery->withdraw("phone");
    TEST_ASSERT(!bed.mac->getPeer("phone").has_value(), "Lost peer is forgotten");
    TEST_ASSERT(!bed.mac->getSessionState("phone").has_value(), "Lost peer has no session");
    bed.sched->runPending();
    TEST_ASSERT(!bed.phone->isPeerConnected("mac"), "Remote side sees the link go");

    bed.sched->advance(milliseconds(10000));
    TEST_ASSERT(!bed.mac->getPeer("phone").has_value(), "No reconnect to a lost peer");

    std::cout << "discovery driven connect and loss Passed!" << std::endl;
    return true;
}

bool test_automatic_reconnect() {
    std::cout << "Testing automatic reconnect..." << std::endl;
    TestBed bed(mac_config(), phone_config(), true);
    bed.discovery->announce("phone", "iOS", "Alice's iPhone");
    bed.network->setRefuseConnections("phone", true);

    bed.phone->start();
    bed.mac->start();
    bed.sched->runPending();
    TEST_ASSERT(bed.mac->getPeer("phone")->phase == ConnectionPhase::FAILED, "First attempt refused");
    TEST_ASSERT(bed.mac->getSessionState("phone") == SessionState::IDLE, "Reconnect pending");
    TEST_ASSERT(bed.mac->hasArmedTimer("phone", TimerSlot::RECONNECT), "Reconnect timer armed");

    bed.network->setRefuseConnections("phone", false);
    bed.sched->advance(milliseconds(4999));
    TEST_ASSERT(bed.mac->getSessionState("phone") == SessionState::IDLE, "Waits for the reconnect interval");

    bed.sched->advance(milliseconds(1));
    TEST_ASSERT(bed.mac->getSessionState("phone") == SessionState::HANDSHAKE_AWAITING_RESPONSE,
                "Reconnect attempt started");
    bed.sched->advance(milliseconds(4000));
    TEST_ASSERT(bed.mac->isPeerConnected("phone") && bed.phone->isPeerConnected("mac"), "Reconnected");
    TEST_ASSERT(bed.mac->getAttemptStats("phone").failed_attempts == 0, "Success clears the failure run");

    std::cout << "automatic reconnect Passed!" << std::endl;
    return true;
}

bool test_stop_and_restart() {
    std::cout << "Testing stop and restart..." << std::endl;
    TestBed bed;
    TEST_ASSERT(!bed.mac->connectToPeer("phone"), "No attempts before start");

    bed.phone->start();
    bed.mac->start();
    bed.mac->connectToPeer("phone");
    bed.sched->advance(milliseconds(4000));
    TEST_ASSERT(bed.mac->isPeerConnected("phone"), "Connected");

    bed.mac->stop();
    TEST_ASSERT(!bed.mac->isRunning(), "Stopped");
    TEST_ASSERT(bed.mac->getPeers().empty(), "Peers forgotten on stop");
    TEST_ASSERT(!bed.mac->connectToPeer("phone"), "No attempts while stopped");
    bed.sched->runPending();
    TEST_ASSERT(!bed.phone->isPeerConnected("mac"), "Remote side sees the shutdown");

    TEST_ASSERT(bed.mac->start(), "Restart");
    TEST_ASSERT(bed.mac->connectToPeer("phone"), "Connect after restart");
    bed.sched->advance(milliseconds(4000));
    TEST_ASSERT(bed.mac->isPeerConnected("phone") && bed.phone->isPeerConnected("mac"), "Connected again");

    std::cout << "stop and restart Passed!" << std::endl;
    return true;
}

int main() {
    set_log_level(LogLevel::ERROR);
    std::cout << "Running Session Manager Tests..." << std::endl;

    test_handshake_between_managers();
    test_handshake_timeout();
    test_channel_probe_failures();
    test_keep_alive_loss();
    test_keep_alive_grace_extends();
    test_last_chance_keep_alive();
    test_keep_alive_replies();
    test_connection_cooldown();
    test_commands_and_media();
    test_queue_before_active();
    test_disconnect_peer();
    test_platform_filter();
    test_discovery_connect_and_loss();
    test_automatic_reconnect();
    test_stop_and_restart();

    if (tests_failed == 0) {
        std::cout << "ALL SESSION MANAGER TESTS PASSED" << std::endl;
        return 0;
    } else {
        std::cerr << tests_failed << " TESTS FAILED" << std::endl;
        return 1;
    }
}
