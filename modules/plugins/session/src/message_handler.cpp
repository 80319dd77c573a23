#include "message_handler.h"
#include "session_manager_p.h"

namespace detail {
    MessageHandler::MessageHandler(SessionManager::Impl* sm) : m_sm(sm) {}

    void MessageHandler::handleDataReceived(const DataReceivedEvent& event) {
        const std::string& peer_id = event.peer_id;

        MessageType type;
        std::string payload;
        if (!wire::decode_message(event.data, type, payload)) {
            LOG_WARN("MH: dropping undecodable frame of " + std::to_string(event.data.size()) +
                     " bytes from " + peer_id);
            return;
        }

        Deferred deferred;
        {
            std::lock_guard<std::mutex> lock(m_sm->get_peer_mutex(peer_id));
            if (m_sm->m_shutting_down) {
                return;
            }
            Session* session = m_sm->m_registry.session(peer_id);
            if (!session || !session->isLive()) {
                LOG_DEBUG(std::string("MH: ") + wire::message_type_to_string(type) + " from " + peer_id +
                          " without a session, dropped");
                return;
            }

            if (type == MessageType::MEDIA_FRAME) {
                if (session->state != SessionState::KEEP_ALIVE_ACTIVE) {
                    LOG_DEBUG("MH: media frame from unauthenticated " + peer_id + " dropped");
                    return;
                }
                if (auto cb = m_sm->mediaCallback()) {
                    deferred.emplace_back([cb, peer_id, frame = std::move(payload)]() { cb(peer_id, frame); });
                }
            } else {
                ControlMessage message;
                std::string error;
                if (!decode_control_message(payload, message, error)) {
                    LOG_WARN("MH: " + std::string(failure_kind_to_string(FailureKind::DECODE_ERROR)) + " from " +
                             peer_id + ": " + error);
                    return;
                }
                handleControl(*session, message, deferred);
            }
            m_sm->m_peer_lifecycle_manager->discardIfTerminal(peer_id);
        }

        for (auto& fn : deferred) {
            fn();
        }
    }

    void MessageHandler::handleControl(Session& session, const ControlMessage& message, Deferred& deferred) {
        const std::string& peer_id = session.peer_id;

        if (const auto* handshake = std::get_if<HandshakeMessage>(&message)) {
            handleHandshake(session, *handshake);
        } else if (const auto* keep_alive = std::get_if<KeepAliveMessage>(&message)) {
            if (session.state != SessionState::KEEP_ALIVE_ACTIVE) {
                LOG_DEBUG("MH: keep-alive from " + peer_id + " before authentication ignored");
                return;
            }
            m_sm->m_registry.stampKeepAlive(peer_id, m_sm->m_scheduler->now());
            // Replies are never answered.
            if (m_sm->m_config.keep_alive_reply && !keep_alive->reply &&
                !m_sm->m_peer_lifecycle_manager->sendKeepAlive(peer_id, true)) {
                LOG_WARN("MH: keep-alive reply to " + peer_id + " failed");
            }
        } else if (const auto* command = std::get_if<CommandMessage>(&message)) {
            handleCommand(session, command->command, deferred);
        } else if (const auto* probe = std::get_if<ChannelProbeMessage>(&message)) {
            LOG_DEBUG("MH: channel probe from " + peer_id + (probe->from.empty() ? "" : " (" + probe->from + ")"));
        } else if (const auto* error = std::get_if<ErrorMessage>(&message)) {
            LOG_WARN("MH: " + peer_id + " reported an error: " + error->message);
            if (session.state == SessionState::HANDSHAKE_INIT ||
                session.state == SessionState::HANDSHAKE_AWAITING_RESPONSE) {
                m_sm->m_peer_lifecycle_manager->apply(session, SessionInput::HANDSHAKE_REJECTED,
                                                      "rejected by peer: " + error->message);
            }
        }
    }

    void MessageHandler::handleHandshake(Session& session, const HandshakeMessage& handshake) {
        const std::string& peer_id = session.peer_id;
        const bool is_request = handshake.kind == HandshakeKind::REQUEST;

        // Requests are answered by the responder, responses by the initiator.
        if ((is_request && session.role != SessionRole::RESPONDER) ||
            (!is_request && session.role != SessionRole::INITIATOR)) {
            LOG_WARN(std::string("MH: unexpected handshake ") + (is_request ? "request" : "response") +
                     " from " + peer_id + " (we are " + SessionStateMachine::role_to_string(session.role) + ")");
            return;
        }

        std::string why;
        if (!validateHandshake(handshake, why)) {
            LOG_WARN("MH: rejecting handshake from " + peer_id + ": " + why);
            if (is_request) {
                ErrorMessage reply;
                reply.message = why;
                if (!m_sm->sendControl(peer_id, reply)) {
                    LOG_DEBUG("MH: error reply to " + peer_id + " not delivered");
                }
            }
            m_sm->m_peer_lifecycle_manager->apply(session, SessionInput::HANDSHAKE_REJECTED, why);
            return;
        }

        const SessionState expected = is_request ? SessionState::HANDSHAKE_INIT
                                                 : SessionState::HANDSHAKE_AWAITING_RESPONSE;
        if (session.state == expected) {
            auto parsed = DeviceIdentifier::parse(handshake.device_id);
            const std::string name = parsed ? parsed->displayName() : handshake.device_id;
            m_sm->m_registry.setIdentity(peer_id, handshake.device_id, name, handshake.platform);
            LOG_INFO(std::string("MH: handshake ") + (is_request ? "request" : "response") + " from " +
                     peer_id + " as " + handshake.device_id);
        }

        m_sm->m_peer_lifecycle_manager->apply(session, is_request ? SessionInput::HANDSHAKE_REQUEST_RECEIVED
                                                                  : SessionInput::HANDSHAKE_RESPONSE_RECEIVED);
    }

    bool MessageHandler::validateHandshake(const HandshakeMessage& handshake, std::string& why) const {
        if (handshake.device_id.empty()) {
            why = "missing device id";
            return false;
        }
        if (!m_sm->m_config.acceptsPlatform(handshake.platform)) {
            why = "platform " + handshake.platform + " not accepted";
            return false;
        }
        if (!DeviceIdentifier::validate(handshake.device_id)) {
            // Older builds send a bare name; still usable as an id.
            LOG_DEBUG("MH: legacy device id '" + handshake.device_id + "'");
        }
        return true;
    }

    void MessageHandler::handleCommand(Session& session, const Command& command, Deferred& deferred) {
        const std::string& peer_id = session.peer_id;
        if (!session.acceptsCommands()) {
            LOG_WARN("MH: " + CommandDispatcher::describe(command) + " from unauthenticated " + peer_id + " dropped");
            return;
        }
        LOG_INFO("MH: command " + CommandDispatcher::describe(command) + " from " + peer_id);

        if (CommandDispatcher::isAcknowledgement(command)) {
            LOG_DEBUG("MH: " + peer_id + " acknowledged a command");
        } else if (auto reply = m_sm->m_dispatcher.replyFor(command)) {
            if (!m_sm->sendControl(peer_id, CommandMessage{*reply})) {
                LOG_WARN("MH: " + std::string(command_name(*reply)) + " to " + peer_id + " failed");
            }
        }

        if (auto cb = m_sm->commandCallback()) {
            deferred.emplace_back([cb, peer_id, command]() { cb(peer_id, command); });
        }
    }
}
