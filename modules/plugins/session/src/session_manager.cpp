#include "session_manager.h"
#include "session_manager_p.h"

#include <stdexcept>

namespace {
    std::shared_ptr<ITimerScheduler> require_scheduler(ISessionDependenciesFactory& factory) {
        auto scheduler = factory.createTimerScheduler();
        if (!scheduler) {
            throw std::invalid_argument("SessionManager: dependency factory returned no timer scheduler");
        }
        return scheduler;
    }

    std::shared_ptr<ITransport> require_transport(ISessionDependenciesFactory& factory) {
        auto transport = factory.createTransport();
        if (!transport) {
            throw std::invalid_argument("SessionManager: dependency factory returned no transport");
        }
        return transport;
    }

    DeviceIdentifier make_identity(const SessionConfig& config) {
        if (!config.device_id.empty()) {
            if (auto parsed = DeviceIdentifier::parse(config.device_id)) {
                return *parsed;
            }
            LOG_WARN("SM: configured device id '" + config.device_id + "' is malformed, generating one");
        }
        return DeviceIdentifier::generate(config.platform, config.device_name);
    }
}

// ============================================================================
// SessionManager::Impl
// ============================================================================

SessionManager::Impl::Impl(SessionConfig config, std::shared_ptr<ISessionDependenciesFactory> factory)
    : m_config(std::move(config)),
      m_identity(make_identity(m_config)),
      m_factory(factory ? std::move(factory)
                         : std::shared_ptr<ISessionDependenciesFactory>(std::make_shared<DefaultSessionDependenciesFactory>())),
      m_scheduler(require_scheduler(*m_factory)),
      m_transport(require_transport(*m_factory)),
      m_discovery(m_factory->createDiscoveryProvider()),
      m_registry(*m_scheduler),
      m_fsm(m_config.dtls_retry_attempts),
      m_gate(m_config.max_connection_attempts, m_config.connection_cooldown),
      m_dispatcher(m_config.auto_acknowledge_commands, m_config.default_video_quality) {
    m_message_handler = std::make_unique<detail::MessageHandler>(this);
    m_peer_lifecycle_manager = std::make_unique<detail::PeerLifecycleManager>(this);
    m_connection_monitor = std::make_unique<detail::ConnectionMonitor>(this);
}

SessionManager::Impl::~Impl() {
    stop();
    m_registry.clear();
    m_alive.reset();
    // A worker-backed scheduler only we hold is joined here, while every
    // member its callbacks could reach is still alive.
    if (m_scheduler.use_count() == 1) {
        m_scheduler.reset();
    }
}

bool SessionManager::Impl::start(PeerUpdateCallback cb) {
    std::lock_guard<std::mutex> lock(m_lifecycle_mutex);
    if (m_running) {
        LOG_WARN("SM: start() called while running");
        return true;
    }

    {
        std::lock_guard<std::mutex> cb_lock(m_callbacks_mutex);
        m_peer_update_cb = std::move(cb);
    }
    m_shutting_down = false;

    m_transport->setReceiveCallback([this](const std::string& peer_id, const std::string& bytes) {
        m_message_handler->handleDataReceived(DataReceivedEvent{peer_id, bytes});
    });
    m_transport->setPeerStateCallback([this](const std::string& peer_id, TransportPeerState state) {
        m_peer_lifecycle_manager->handleTransportState(TransportStateEvent{peer_id, state});
    });
    m_transport->setInvitationCallback([this](const std::string& peer_id, const std::string& platform) {
        return m_peer_lifecycle_manager->handleInvitation(InvitationEvent{peer_id, platform});
    });

    if (!m_transport->start()) {
        LOG_ERROR("SM: transport failed to start");
        m_transport->setReceiveCallback(nullptr);
        m_transport->setPeerStateCallback(nullptr);
        m_transport->setInvitationCallback(nullptr);
        return false;
    }

    // Observers get snapshots from the scheduler, never from inside a peer lock.
    m_registry_subscription = m_registry.subscribe([this](const std::vector<Peer>& snapshot) {
        post([this, snapshot]() {
            if (auto cb = peerUpdateCallback()) {
                cb(snapshot);
            }
        });
    });

    m_running = true;

    std::weak_ptr<char> alive = m_alive;
    m_monitor_timer = m_scheduler->scheduleRepeating(
        m_config.monitor_interval, m_config.monitor_interval,
        [this, alive]() {
            if (alive.expired()) return;
            m_connection_monitor->handleTimerTick(TimerTickEvent{});
        });

    LOG_INFO("SM: started as " + m_identity.format() +
             " (keep-alive " + std::to_string(m_config.keep_alive_interval.count()) + "ms, timeout " +
             std::to_string(m_config.keep_alive_timeout.count()) + "ms)");

    if (m_discovery) {
        m_discovery->setCallbacks(
            [this](const std::string& peer_id, const std::string& platform, const std::string& name) {
                m_peer_lifecycle_manager->handlePeerDiscovered(PeerDiscoveredEvent{peer_id, platform, name});
            },
            [this](const std::string& peer_id) {
                m_peer_lifecycle_manager->handlePeerLost(PeerLostEvent{peer_id});
            });
        if (!m_discovery->start()) {
            LOG_WARN("SM: discovery provider failed to start; waiting for explicit connects");
        }
    }
    return true;
}

void SessionManager::Impl::stop() {
    std::lock_guard<std::mutex> lock(m_lifecycle_mutex);
    if (!m_running) {
        return;
    }
    LOG_INFO("SM: stopping");
    m_shutting_down = true;

    if (m_discovery) {
        m_discovery->stop();
    }

    m_scheduler->cancel(m_monitor_timer);
    m_monitor_timer = kInvalidTimer;

    for (const Peer& peer : m_registry.list()) {
        m_peer_lifecycle_manager->shutdownPeer(peer.id);
    }

    m_transport->stop();
    m_transport->setReceiveCallback(nullptr);
    m_transport->setPeerStateCallback(nullptr);
    m_transport->setInvitationCallback(nullptr);

    m_registry.unsubscribe(m_registry_subscription);
    m_registry_subscription = 0;
    m_registry.clear();

    m_running = false;
    LOG_INFO("SM: stopped");
}

bool SessionManager::Impl::sendControl(const std::string& peer_id, const ControlMessage& message) {
    const std::string frame = wire::encode_message(MessageType::CONTROL_JSON, encode_control_message(message));
    if (!m_transport->send(peer_id, frame)) {
        LOG_DEBUG(std::string("SM: send of ") + control_message_type(message) + " to " + peer_id + " failed");
        return false;
    }
    return true;
}

void SessionManager::Impl::post(std::function<void()> fn) {
    std::weak_ptr<char> alive = m_alive;
    m_scheduler->schedule(std::chrono::milliseconds(0), [alive, fn = std::move(fn)]() {
        if (!alive.expired()) {
            fn();
        }
    });
}

std::mutex& SessionManager::Impl::get_peer_mutex(const std::string& peer_id) const {
    return m_registry.peerMutex(peer_id);
}

SessionManager::PeerUpdateCallback SessionManager::Impl::peerUpdateCallback() const {
    std::lock_guard<std::mutex> lock(m_callbacks_mutex);
    return m_peer_update_cb;
}

SessionManager::CommandCallback SessionManager::Impl::commandCallback() const {
    std::lock_guard<std::mutex> lock(m_callbacks_mutex);
    return m_command_cb;
}

SessionManager::MediaCallback SessionManager::Impl::mediaCallback() const {
    std::lock_guard<std::mutex> lock(m_callbacks_mutex);
    return m_media_cb;
}

bool SessionManager::Impl::sendCommand(const std::string& peer_id, const Command& command) {
    const std::string frame = wire::encode_message(MessageType::CONTROL_JSON,
                                                   encode_control_message(CommandMessage{command}));

    std::lock_guard<std::mutex> lock(get_peer_mutex(peer_id));
    Session* session = m_registry.session(peer_id);
    if (!session || !session->isLive()) {
        LOG_WARN("SM: cannot send " + CommandDispatcher::describe(command) + " to " + peer_id + ": no active session");
        return false;
    }

    if (session->state == SessionState::KEEP_ALIVE_ACTIVE) {
        if (!m_transport->send(peer_id, frame)) {
            LOG_WARN("SM: send of " + CommandDispatcher::describe(command) + " to " + peer_id + " failed");
            return false;
        }
        return true;
    }

    const size_t dropped_before = session->outbound.dropped();
    if (!session->outbound.push(frame)) {
        LOG_WARN("SM: outbound queue for " + peer_id + " is full, rejected " + command_name(command));
        return false;
    }
    if (session->outbound.dropped() != dropped_before) {
        LOG_WARN("SM: outbound queue for " + peer_id + " is full, dropped the oldest message");
    }
    LOG_DEBUG("SM: queued " + std::string(command_name(command)) + " for " + peer_id + " (" +
              std::to_string(session->outbound.size()) + "/" + std::to_string(session->outbound.capacity()) + ")");
    return true;
}

bool SessionManager::Impl::sendMedia(const std::string& peer_id, const std::string& frame) {
    if (frame.size() > wire::kMaxMessageSize) {
        LOG_WARN("SM: media frame of " + std::to_string(frame.size()) + " bytes exceeds the frame limit");
        return false;
    }
    std::lock_guard<std::mutex> lock(get_peer_mutex(peer_id));
    Session* session = m_registry.session(peer_id);
    if (!session || session->state != SessionState::KEEP_ALIVE_ACTIVE) {
        LOG_DEBUG("SM: media to " + peer_id + " dropped, session not active");
        return false;
    }
    return m_transport->send(peer_id, wire::encode_message(MessageType::MEDIA_FRAME, frame));
}

std::optional<SessionState> SessionManager::Impl::getSessionState(const std::string& peer_id) const {
    std::lock_guard<std::mutex> lock(get_peer_mutex(peer_id));
    const Session* session = m_registry.session(peer_id);
    if (!session) {
        return std::nullopt;
    }
    return session->state;
}

bool SessionManager::Impl::hasArmedTimer(const std::string& peer_id, TimerSlot slot) const {
    std::lock_guard<std::mutex> lock(get_peer_mutex(peer_id));
    const Session* session = m_registry.session(peer_id);
    return session && session->timer(slot) != kInvalidTimer;
}

// ============================================================================
// SessionManager
// ============================================================================

SessionManager::SessionManager()
    : m_impl(std::make_unique<Impl>(SessionConfig::fromConfigManager(),
                                    std::make_shared<DefaultSessionDependenciesFactory>())) {}

SessionManager::SessionManager(SessionConfig config, std::shared_ptr<ISessionDependenciesFactory> factory)
    : m_impl(std::make_unique<Impl>(std::move(config), std::move(factory))) {}

SessionManager::~SessionManager() = default;

bool SessionManager::start(PeerUpdateCallback peer_update_cb) {
    return m_impl->start(std::move(peer_update_cb));
}

void SessionManager::stop() {
    m_impl->stop();
}

bool SessionManager::isRunning() const {
    return m_impl->m_running.load();
}

bool SessionManager::connectToPeer(const std::string& peer_id) {
    if (!m_impl->m_running) {
        LOG_WARN("SM: connectToPeer(" + peer_id + ") while stopped");
        return false;
    }
    return m_impl->m_peer_lifecycle_manager->handleConnectToPeer(ConnectToPeerEvent{peer_id});
}

bool SessionManager::disconnectPeer(const std::string& peer_id) {
    return m_impl->m_peer_lifecycle_manager->handlePeerDisconnect(PeerDisconnectEvent{peer_id, "disconnected locally"});
}

bool SessionManager::sendCommand(const std::string& peer_id, const Command& command) {
    return m_impl->sendCommand(peer_id, command);
}

bool SessionManager::sendMedia(const std::string& peer_id, const std::string& frame) {
    return m_impl->sendMedia(peer_id, frame);
}

void SessionManager::setCommandCallback(CommandCallback cb) {
    std::lock_guard<std::mutex> lock(m_impl->m_callbacks_mutex);
    m_impl->m_command_cb = std::move(cb);
}

void SessionManager::setMediaCallback(MediaCallback cb) {
    std::lock_guard<std::mutex> lock(m_impl->m_callbacks_mutex);
    m_impl->m_media_cb = std::move(cb);
}

std::vector<Peer> SessionManager::getPeers() const {
    return m_impl->m_registry.list();
}

std::optional<Peer> SessionManager::getPeer(const std::string& peer_id) const {
    return m_impl->m_registry.get(peer_id);
}

std::vector<ConnectedDevice> SessionManager::getConnectedDevices() const {
    return m_impl->m_registry.connectedDevices();
}

ConnectionState SessionManager::getConnectionState() const {
    return m_impl->m_registry.connectionState();
}

bool SessionManager::isPeerConnected(const std::string& peer_id) const {
    auto peer = m_impl->m_registry.get(peer_id);
    return peer && peer->isConnected();
}

const DeviceIdentifier& SessionManager::getLocalIdentity() const {
    return m_impl->m_identity;
}

std::optional<SessionState> SessionManager::getSessionState(const std::string& peer_id) const {
    return m_impl->getSessionState(peer_id);
}

bool SessionManager::hasArmedTimer(const std::string& peer_id, TimerSlot slot) const {
    return m_impl->hasArmedTimer(peer_id, slot);
}

ConnectionGate::Stats SessionManager::getAttemptStats(const std::string& peer_id) const {
    return m_impl->m_gate.stats(peer_id);
}
