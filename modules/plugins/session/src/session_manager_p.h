#pragma once

#include "session_manager.h"
#include "session_dependencies.h"
#include "session_events.h"
#include "session.h"
#include "peer_registry.h"
#include "command_dispatcher.h"
#include "connection_gate.h"
#include "message_handler.h"
#include "peer_lifecycle_manager.h"
#include "connection_monitor.h"
#include "message_types.h"
#include "wire_codec.h"
#include "logger.h"

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>

class SessionManager::Impl {
public:
    Impl(SessionConfig config, std::shared_ptr<ISessionDependenciesFactory> factory);
    ~Impl();

    bool start(PeerUpdateCallback cb);
    void stop();

    bool sendCommand(const std::string& peer_id, const Command& command);
    bool sendMedia(const std::string& peer_id, const std::string& frame);

    std::optional<SessionState> getSessionState(const std::string& peer_id) const;
    bool hasArmedTimer(const std::string& peer_id, TimerSlot slot) const;

private:
    friend class SessionManager;
    friend class detail::MessageHandler;
    friend class detail::PeerLifecycleManager;
    friend class detail::ConnectionMonitor;

    // Frames and sends one control message. No queuing.
    bool sendControl(const std::string& peer_id, const ControlMessage& message);

    // Runs `fn` on the scheduler, outside every lock, unless the manager is gone by then.
    void post(std::function<void()> fn);

    std::mutex& get_peer_mutex(const std::string& peer_id) const;

    PeerUpdateCallback peerUpdateCallback() const;
    CommandCallback commandCallback() const;
    MediaCallback mediaCallback() const;

    const SessionConfig m_config;
    DeviceIdentifier m_identity;

    std::shared_ptr<ISessionDependenciesFactory> m_factory;
    // Declared before the registry: the registry cancels timers on it.
    std::shared_ptr<ITimerScheduler> m_scheduler;
    std::shared_ptr<ITransport> m_transport;
    std::shared_ptr<IDiscoveryProvider> m_discovery;

    mutable PeerRegistry m_registry;
    SessionStateMachine m_fsm;
    ConnectionGate m_gate;
    CommandDispatcher m_dispatcher;

    std::unique_ptr<detail::MessageHandler> m_message_handler;
    std::unique_ptr<detail::PeerLifecycleManager> m_peer_lifecycle_manager;
    std::unique_ptr<detail::ConnectionMonitor> m_connection_monitor;

    std::atomic<uint64_t> m_next_epoch{1};
    std::atomic<bool> m_running{false};
    std::atomic<bool> m_shutting_down{false};  // handlers drop events while set
    mutable std::mutex m_lifecycle_mutex;

    TimerId m_monitor_timer = kInvalidTimer;
    PeerRegistry::SubscriberId m_registry_subscription = 0;

    mutable std::mutex m_callbacks_mutex;
    PeerUpdateCallback m_peer_update_cb;
    CommandCallback m_command_cb;
    MediaCallback m_media_cb;

    // Expires with the manager; scheduled closures check it before touching `this`.
    std::shared_ptr<char> m_alive = std::make_shared<char>(0);
};
