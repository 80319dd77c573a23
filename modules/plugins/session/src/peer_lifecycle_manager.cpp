#include "peer_lifecycle_manager.h"
#include "session_manager_p.h"

namespace {
    std::string default_reason(SessionInput input) {
        switch (input) {
            case SessionInput::TRANSPORT_DISCONNECTED: return "transport disconnected";
            case SessionInput::PROBE_FAILED: return "channel probe failed";
            case SessionInput::HANDSHAKE_SEND_FAILED: return "handshake send failed";
            case SessionInput::HANDSHAKE_REJECTED: return "handshake rejected";
            case SessionInput::HANDSHAKE_TIMEOUT: return "handshake timeout";
            case SessionInput::KEEP_ALIVE_LOST: return "keep-alive timeout";
            case SessionInput::LOCAL_DISCONNECT: return "disconnected locally";
            case SessionInput::SHUTDOWN: return "session manager stopped";
            default: return SessionStateMachine::input_to_string(input);
        }
    }

    // Delayed steps that must see a live link when they fire.
    bool requires_link(SessionInput input) {
        return input == SessionInput::RESPONSE_DELAY_ELAPSED ||
               input == SessionInput::ESTABLISHMENT_ELAPSED ||
               input == SessionInput::STABILIZATION_ELAPSED;
    }
}

namespace detail {
    PeerLifecycleManager::PeerLifecycleManager(SessionManager::Impl* sm) : m_sm(sm) {}

    // ========================================================================
    // Entry points
    // ========================================================================

    bool PeerLifecycleManager::handleConnectToPeer(const ConnectToPeerEvent& event) {
        if (event.peer_id.empty()) {
            LOG_WARN("PLM: connect request without a peer id");
            return false;
        }
        std::lock_guard<std::mutex> lock(m_sm->get_peer_mutex(event.peer_id));
        if (m_sm->m_shutting_down) {
            return false;
        }
        return startAttempt(event.peer_id, false);
    }

    bool PeerLifecycleManager::handlePeerDisconnect(const PeerDisconnectEvent& event) {
        std::lock_guard<std::mutex> lock(m_sm->get_peer_mutex(event.peer_id));
        Session* session = m_sm->m_registry.session(event.peer_id);
        if (!session) {
            LOG_DEBUG("PLM: disconnect of " + event.peer_id + " without a session");
            return false;
        }
        LOG_INFO("PLM: disconnecting " + event.peer_id + " (" + event.reason + ")");
        apply(*session, SessionInput::LOCAL_DISCONNECT, event.reason);
        discardIfTerminal(event.peer_id);
        return true;
    }

    void PeerLifecycleManager::handleTransportState(const TransportStateEvent& event) {
        const std::string& peer_id = event.peer_id;
        std::lock_guard<std::mutex> lock(m_sm->get_peer_mutex(peer_id));
        if (m_sm->m_shutting_down || !m_sm->m_running) {
            return;
        }

        Session* session = m_sm->m_registry.session(peer_id);
        LOG_DEBUG(std::string("PLM: transport ") + transport_peer_state_to_string(event.state) + " for " + peer_id);

        switch (event.state) {
            case TransportPeerState::CONNECTING:
                break;

            case TransportPeerState::CONNECTED:
                if (session && session->state == SessionState::TRANSPORT_CONNECTING) {
                    apply(*session, SessionInput::TRANSPORT_CONNECTED);
                } else if (session && session->isLive()) {
                    LOG_DEBUG("PLM: duplicate CONNECTED for " + peer_id + " ignored");
                } else {
                    openResponderSession(peer_id);
                }
                break;

            case TransportPeerState::DISCONNECTED:
                if (session && session->isLive()) {
                    apply(*session, SessionInput::TRANSPORT_DISCONNECTED, "transport reported disconnect");
                }
                break;
        }
        discardIfTerminal(peer_id);
    }

    bool PeerLifecycleManager::handleInvitation(const InvitationEvent& event) {
        if (m_sm->m_shutting_down || !m_sm->m_running) {
            return false;
        }
        if (!event.platform.empty() && !m_sm->m_config.acceptsPlatform(event.platform)) {
            LOG_INFO("PLM: declining link from " + event.peer_id + ", platform " + event.platform + " not accepted");
            return false;
        }

        std::lock_guard<std::mutex> lock(m_sm->get_peer_mutex(event.peer_id));
        Peer peer;
        peer.id = event.peer_id;
        peer.name = event.peer_id;
        peer.platform = event.platform;
        m_sm->m_registry.upsert(peer);
        LOG_INFO("PLM: accepting link from " + event.peer_id);
        return true;
    }

    void PeerLifecycleManager::handlePeerDiscovered(const PeerDiscoveredEvent& event) {
        if (m_sm->m_shutting_down || !m_sm->m_running) {
            return;
        }
        if (!m_sm->m_config.acceptsPlatform(event.platform)) {
            LOG_DEBUG("PLM: ignoring discovered " + event.peer_id + " (platform " + event.platform + ")");
            return;
        }

        std::lock_guard<std::mutex> lock(m_sm->get_peer_mutex(event.peer_id));
        Peer peer;
        peer.id = event.peer_id;
        peer.platform = event.platform;
        peer.name = event.name.empty() ? event.peer_id : event.name;
        peer.discovered = true;
        m_sm->m_registry.upsert(peer);
        LOG_INFO("PLM: discovered " + event.peer_id + " (" + event.platform + ")");

        if (!m_sm->m_config.auto_connect_discovered) {
            return;
        }
        Session* session = m_sm->m_registry.session(event.peer_id);
        if (session && (session->isLive() || session->timer(TimerSlot::RECONNECT) != kInvalidTimer)) {
            return;
        }
        startAttempt(event.peer_id, true);
    }

    void PeerLifecycleManager::handlePeerLost(const PeerLostEvent& event) {
        if (m_sm->m_shutting_down) {
            return;
        }
        std::lock_guard<std::mutex> lock(m_sm->get_peer_mutex(event.peer_id));
        if (!m_sm->m_registry.contains(event.peer_id)) {
            return;
        }
        m_sm->m_registry.setDiscovered(event.peer_id, false);
        if (Session* session = m_sm->m_registry.session(event.peer_id)) {
            apply(*session, SessionInput::LOCAL_DISCONNECT, "lost by discovery");
            discardIfTerminal(event.peer_id);
        }
        m_sm->m_registry.remove(event.peer_id);
        LOG_INFO("PLM: lost " + event.peer_id);
    }

    void PeerLifecycleManager::shutdownPeer(const std::string& peer_id) {
        std::lock_guard<std::mutex> lock(m_sm->get_peer_mutex(peer_id));
        if (Session* session = m_sm->m_registry.session(peer_id)) {
            apply(*session, SessionInput::SHUTDOWN);
            discardIfTerminal(peer_id);
        }
    }

    // ========================================================================
    // Attempts
    // ========================================================================

    bool PeerLifecycleManager::startAttempt(const std::string& peer_id, bool automatic) {
        Session* existing = m_sm->m_registry.session(peer_id);
        if (existing && existing->isLive()) {
            LOG_DEBUG("PLM: " + peer_id + " already has a live session (" +
                      SessionStateMachine::state_to_string(existing->state) + ")");
            return true;
        }

        if (!m_sm->m_registry.contains(peer_id)) {
            Peer peer;
            peer.id = peer_id;
            peer.name = peer_id;
            m_sm->m_registry.upsert(peer);
        }

        const auto now = m_sm->m_scheduler->now();
        if (!m_sm->m_gate.tryBeginAttempt(peer_id, now)) {
            const auto remaining = m_sm->m_gate.remainingCooldown(peer_id, now);
            LOG_WARN("PLM: cannot connect to " + peer_id + ", try later (cooldown " +
                     std::to_string(remaining.count()) + "ms left)");
            if (automatic) {
                scheduleReconnect(peer_id);
            }
            return false;
        }
        mirrorGate(peer_id);

        auto fresh = std::make_unique<Session>(peer_id, SessionRole::INITIATOR, m_sm->m_next_epoch++,
                                               m_sm->m_config.max_queued_messages, m_sm->m_config.queue_policy);
        // Replaces (and cancels) a pending reconnect session.
        Session* session = m_sm->m_registry.attachSession(std::move(fresh));
        if (!session) {
            return false;
        }
        LOG_INFO("PLM: connecting to " + peer_id + (automatic ? " (automatic)" : "") +
                 " epoch=" + std::to_string(session->epoch));

        apply(*session, SessionInput::CONNECT_REQUESTED);
        const bool started = !session->isTerminal();
        discardIfTerminal(peer_id);
        return started;
    }

    void PeerLifecycleManager::scheduleReconnect(const std::string& peer_id) {
        auto pending = std::make_unique<Session>(peer_id, SessionRole::INITIATOR, m_sm->m_next_epoch++,
                                                 m_sm->m_config.max_queued_messages, m_sm->m_config.queue_policy);
        Session* session = m_sm->m_registry.attachSession(std::move(pending));
        if (!session) {
            return;
        }
        armTimer(*session, TimerSlot::RECONNECT, m_sm->m_config.reconnect_interval, SessionInput::CONNECT_REQUESTED);
        LOG_INFO("PLM: reconnect to " + peer_id + " in " +
                 std::to_string(m_sm->m_config.reconnect_interval.count()) + "ms");
    }

    void PeerLifecycleManager::openResponderSession(const std::string& peer_id) {
        if (!m_sm->m_registry.contains(peer_id)) {
            Peer peer;
            peer.id = peer_id;
            peer.name = peer_id;
            m_sm->m_registry.upsert(peer);
        }
        auto fresh = std::make_unique<Session>(peer_id, SessionRole::RESPONDER, m_sm->m_next_epoch++,
                                               m_sm->m_config.max_queued_messages, m_sm->m_config.queue_policy);
        Session* session = m_sm->m_registry.attachSession(std::move(fresh));
        if (!session) {
            return;
        }
        LOG_INFO("PLM: inbound link from " + peer_id + " epoch=" + std::to_string(session->epoch));
        apply(*session, SessionInput::INBOUND_ACCEPTED);
        apply(*session, SessionInput::TRANSPORT_CONNECTED);
    }

    void PeerLifecycleManager::discardIfTerminal(const std::string& peer_id) {
        Session* current = m_sm->m_registry.session(peer_id);
        if (!current || !current->isTerminal()) {
            return;
        }

        std::unique_ptr<Session> session = m_sm->m_registry.detachSession(peer_id);
        session->cancelAllTimers(*m_sm->m_scheduler);

        if (session->state != SessionState::FAILED) {
            return;
        }

        m_sm->m_gate.recordFailure(peer_id, m_sm->m_scheduler->now());
        mirrorGate(peer_id);

        if (session->role != SessionRole::INITIATOR || !m_sm->m_config.auto_reconnect ||
            m_sm->m_shutting_down || !m_sm->m_running) {
            return;
        }
        auto peer = m_sm->m_registry.get(peer_id);
        if (peer && peer->discovered) {
            scheduleReconnect(peer_id);
        }
    }

    void PeerLifecycleManager::mirrorGate(const std::string& peer_id) {
        const ConnectionGate::Stats stats = m_sm->m_gate.stats(peer_id);
        m_sm->m_registry.recordAttempt(peer_id, stats.failed_attempts, stats.last_attempt_at);
    }

    // ========================================================================
    // FSM execution
    // ========================================================================

    void PeerLifecycleManager::apply(Session& session, SessionInput input, const std::string& reason) {
        const SessionState before = session.state;
        FSMResult result = m_sm->m_fsm.handle_event(session, input);

        if (result.new_state != before && session.isTerminal()) {
            session.failure_reason = reason.empty() ? default_reason(input) : reason;
        }
        if (result.new_state != before) {
            publishPhase(session);
        }

        for (SessionAction action : result.actions) {
            execute(session, action);
            if (session.state != result.new_state) {
                break;
            }
        }
    }

    void PeerLifecycleManager::publishPhase(const Session& session) {
        switch (session.state) {
            case SessionState::IDLE:
            case SessionState::KEEP_ALIVE_ACTIVE:   // already CONNECTED via setAuthenticated
            case SessionState::FAILED:              // published by CLEANUP_RESOURCES
            case SessionState::DISCONNECTED:
                return;
            default:
                m_sm->m_registry.setPhase(session.peer_id, session.phase());
        }
    }

    void PeerLifecycleManager::execute(Session& session, SessionAction action) {
        const std::string& peer_id = session.peer_id;
        ITransport& transport = *m_sm->m_transport;
        ITimerScheduler& scheduler = *m_sm->m_scheduler;
        const SessionConfig& config = m_sm->m_config;

        LOG_DEBUG(std::string("PLM: ") + SessionStateMachine::action_to_string(action) + " for " + peer_id);

        switch (action) {
            case SessionAction::NONE:
                break;

            case SessionAction::OPEN_TRANSPORT:
                if (!transport.connect(peer_id)) {
                    apply(session, SessionInput::TRANSPORT_DISCONNECTED, "transport connect to " + peer_id + " failed");
                }
                break;

            case SessionAction::SEND_CHANNEL_PROBE: {
                if (!transport.isConnected(peer_id)) {
                    apply(session, SessionInput::TRANSPORT_DISCONNECTED, "link lost before channel probe");
                    break;
                }
                ChannelProbeMessage probe;
                probe.from = config.platform;
                if (!m_sm->sendControl(peer_id, probe)) {
                    LOG_WARN("PLM: channel probe to " + peer_id + " failed (attempt " +
                             std::to_string(session.probe_attempts + 1) + "/" +
                             std::to_string(config.dtls_retry_attempts) + ")");
                    apply(session, SessionInput::PROBE_FAILED,
                          "channel probe failed " + std::to_string(config.dtls_retry_attempts) + " times");
                } else if (!transport.isConnected(peer_id)) {
                    apply(session, SessionInput::TRANSPORT_DISCONNECTED, "link lost during channel probe");
                } else {
                    apply(session, SessionInput::PROBE_SENT);
                }
                break;
            }

            case SessionAction::SCHEDULE_PROBE_RETRY:
                armTimer(session, TimerSlot::PROBE, config.dtls_retry_delay, SessionInput::PROBE_RETRY_DUE);
                break;

            case SessionAction::SEND_HANDSHAKE_REQUEST: {
                HandshakeMessage request;
                request.kind = HandshakeKind::REQUEST;
                request.device_id = m_sm->m_identity.format();
                request.platform = config.platform;
                if (m_sm->sendControl(peer_id, request)) {
                    apply(session, SessionInput::HANDSHAKE_REQUEST_SENT);
                } else {
                    apply(session, SessionInput::HANDSHAKE_SEND_FAILED, "handshake request could not be sent");
                }
                break;
            }

            case SessionAction::ARM_HANDSHAKE_TIMER:
                armTimer(session, TimerSlot::HANDSHAKE, config.handshake_timeout, SessionInput::HANDSHAKE_TIMEOUT);
                break;

            case SessionAction::SCHEDULE_HANDSHAKE_RESPONSE:
                armTimer(session, TimerSlot::RESPONSE, config.handshake_response_delay,
                         SessionInput::RESPONSE_DELAY_ELAPSED);
                break;

            case SessionAction::SEND_HANDSHAKE_RESPONSE: {
                HandshakeMessage response;
                response.kind = HandshakeKind::RESPONSE;
                response.device_id = m_sm->m_identity.format();
                response.platform = config.platform;
                if (m_sm->sendControl(peer_id, response)) {
                    LOG_INFO("PLM: handshake response sent to " + peer_id + ", settling");
                    apply(session, SessionInput::RESPONSE_SENT);
                } else {
                    apply(session, SessionInput::HANDSHAKE_SEND_FAILED, "handshake response could not be sent");
                }
                break;
            }

            case SessionAction::ARM_ESTABLISHMENT_TIMER:
                armTimer(session, TimerSlot::SETTLE, config.channel_establishment_delay,
                         SessionInput::ESTABLISHMENT_ELAPSED);
                break;

            case SessionAction::ARM_STABILIZATION_TIMER:
                armTimer(session, TimerSlot::SETTLE, config.channel_stabilization_delay,
                         SessionInput::STABILIZATION_ELAPSED);
                break;

            case SessionAction::COMPLETE_HANDSHAKE:
                session.cancelTimer(scheduler, TimerSlot::HANDSHAKE);
                session.cancelTimer(scheduler, TimerSlot::RESPONSE);
                session.cancelTimer(scheduler, TimerSlot::SETTLE);
                session.cancelTimer(scheduler, TimerSlot::PROBE);
                m_sm->m_registry.stampKeepAlive(peer_id, scheduler.now());
                m_sm->m_registry.setAuthenticated(peer_id);
                m_sm->m_gate.recordSuccess(peer_id);
                mirrorGate(peer_id);
                LOG_INFO("PLM: " + peer_id + " authenticated (" + SessionStateMachine::role_to_string(session.role) + ")");
                apply(session, SessionInput::ENTER_KEEP_ALIVE);
                break;

            case SessionAction::START_KEEP_ALIVE: {
                session.cancelTimer(scheduler, TimerSlot::KEEP_ALIVE);
                auto fired = std::make_shared<TimerId>(kInvalidTimer);
                std::weak_ptr<char> alive = m_sm->m_alive;
                const uint64_t epoch = session.epoch;
                const TimerId id = scheduler.scheduleRepeating(
                    std::chrono::milliseconds(0), config.keep_alive_interval,
                    [this, alive, peer_id, epoch, fired]() {
                        if (alive.expired()) return;
                        handleKeepAliveTick(peer_id, epoch, fired);
                    });
                *fired = id;
                session.timer(TimerSlot::KEEP_ALIVE) = id;
                break;
            }

            case SessionAction::FLUSH_QUEUED_MESSAGES: {
                std::deque<std::string> queued = session.outbound.drain();
                if (queued.empty()) {
                    break;
                }
                LOG_INFO("PLM: flushing " + std::to_string(queued.size()) + " queued message(s) to " + peer_id);
                for (const std::string& frame : queued) {
                    if (!transport.send(peer_id, frame)) {
                        LOG_WARN("PLM: queued message to " + peer_id + " could not be sent");
                    }
                }
                break;
            }

            case SessionAction::CLOSE_TRANSPORT:
                transport.disconnect(peer_id);
                break;

            case SessionAction::CLEANUP_RESOURCES: {
                session.cancelAllTimers(scheduler);
                if (session.outbound.size() > 0) {
                    LOG_DEBUG("PLM: dropping " + std::to_string(session.outbound.size()) +
                              " queued message(s) for " + peer_id);
                    session.outbound.clear();
                }
                m_sm->m_registry.setPhase(peer_id, session.phase(), session.failure_kind, session.failure_reason);
                if (session.state == SessionState::FAILED) {
                    LOG_WARN("PLM: session with " + peer_id + " failed: " + session.failure_reason + " [" +
                             failure_kind_to_string(session.failure_kind) + "]");
                } else {
                    LOG_INFO("PLM: session with " + peer_id + " closed: " + session.failure_reason);
                }
                break;
            }
        }
    }

    // ========================================================================
    // Timers
    // ========================================================================

    void PeerLifecycleManager::armTimer(Session& session, TimerSlot slot, std::chrono::milliseconds delay,
                                        SessionInput input) {
        session.cancelTimer(*m_sm->m_scheduler, slot);

        // The id is only known after schedule() returns; the callback reads it
        // once it holds the peer mutex, which we hold until then.
        auto fired = std::make_shared<TimerId>(kInvalidTimer);
        std::weak_ptr<char> alive = m_sm->m_alive;
        const std::string peer_id = session.peer_id;
        const uint64_t epoch = session.epoch;

        const TimerId id = m_sm->m_scheduler->schedule(delay, [this, alive, peer_id, epoch, slot, fired, input]() {
            if (alive.expired()) return;
            handleTimer(peer_id, epoch, slot, fired, input);
        });
        *fired = id;
        session.timer(slot) = id;
    }

    void PeerLifecycleManager::handleTimer(const std::string& peer_id, uint64_t epoch, TimerSlot slot,
                                           const std::shared_ptr<TimerId>& fired, SessionInput input) {
        std::lock_guard<std::mutex> lock(m_sm->get_peer_mutex(peer_id));
        if (m_sm->m_shutting_down) {
            return;
        }
        Session* session = m_sm->m_registry.session(peer_id);
        if (!session || session->epoch != epoch || session->timer(slot) != *fired) {
            LOG_DEBUG(std::string("PLM: stale ") + timer_slot_to_string(slot) + " timer for " + peer_id + " ignored");
            return;
        }
        session->timer(slot) = kInvalidTimer;

        if (slot == TimerSlot::RECONNECT) {
            startAttempt(peer_id, true);
            return;
        }

        if (requires_link(input) && !m_sm->m_transport->isConnected(peer_id)) {
            apply(*session, SessionInput::TRANSPORT_DISCONNECTED,
                  std::string("link lost during ") + timer_slot_to_string(slot) + " window");
        } else {
            apply(*session, input);
        }
        discardIfTerminal(peer_id);
    }

    void PeerLifecycleManager::handleKeepAliveTick(const std::string& peer_id, uint64_t epoch,
                                                   const std::shared_ptr<TimerId>& fired) {
        std::lock_guard<std::mutex> lock(m_sm->get_peer_mutex(peer_id));
        if (m_sm->m_shutting_down) {
            return;
        }
        Session* session = m_sm->m_registry.session(peer_id);
        if (!session || session->epoch != epoch || session->timer(TimerSlot::KEEP_ALIVE) != *fired ||
            session->state != SessionState::KEEP_ALIVE_ACTIVE) {
            return;
        }
        if (sendKeepAlive(peer_id)) {
            m_sm->m_registry.stampKeepAlive(peer_id, m_sm->m_scheduler->now());
        } else {
            LOG_WARN("PLM: keep-alive to " + peer_id + " failed");
        }
    }

    bool PeerLifecycleManager::sendKeepAlive(const std::string& peer_id, bool reply) {
        KeepAliveMessage keep_alive;
        keep_alive.timestamp = unix_timestamp_now();
        keep_alive.device_id = m_sm->m_identity.format();
        keep_alive.reply = reply;
        return m_sm->sendControl(peer_id, keep_alive);
    }
}
