#ifndef SESSION_DEPENDENCIES_H
#define SESSION_DEPENDENCIES_H

#include "itransport.h"
#include "tcp_transport.h"
#include "timer_scheduler.h"
#include "idiscovery_provider.h"
#include "static_discovery.h"
#include "config_manager.h"

#include <memory>

// Factory interface for the collaborators SessionManager runs on.
// Called once per SessionManager, from its constructor.
class ISessionDependenciesFactory {
public:
    virtual ~ISessionDependenciesFactory() = default;

    virtual std::shared_ptr<ITimerScheduler> createTimerScheduler() = 0;
    virtual std::shared_ptr<ITransport> createTransport() = 0;
    // May return nullptr: peers then only come from connectToPeer() and inbound links.
    virtual std::shared_ptr<IDiscoveryProvider> createDiscoveryProvider() = 0;
};

// Default factory implementation: TCP, real-time timers, configured peers.
class DefaultSessionDependenciesFactory : public ISessionDependenciesFactory {
public:
    std::shared_ptr<ITimerScheduler> createTimerScheduler() override {
        return std::make_shared<ThreadTimerScheduler>();
    }

    std::shared_ptr<ITransport> createTransport() override {
        const ConfigManager& cfg = ConfigManager::getInstance();
        TcpTransportOptions options;
        options.listen_port = cfg.getTCPListenPort();
        options.nodelay = cfg.isTCPNoDelayEnabled();
        options.read_buffer_size = cfg.getTCPBufferSize();
        options.connect_timeout_ms = cfg.getTCPConnectTimeoutMs();
        return std::make_shared<TcpTransport>(options);
    }

    std::shared_ptr<IDiscoveryProvider> createDiscoveryProvider() override {
        return std::make_shared<StaticDiscovery>(StaticDiscovery::fromConfig());
    }
};

// Hands out instances built by the caller (loopback networks, manual clocks).
class ProvidedSessionDependencies : public ISessionDependenciesFactory {
public:
    ProvidedSessionDependencies(std::shared_ptr<ITimerScheduler> scheduler,
                                std::shared_ptr<ITransport> transport,
                                std::shared_ptr<IDiscoveryProvider> discovery = nullptr)
        : m_scheduler(std::move(scheduler)),
          m_transport(std::move(transport)),
          m_discovery(std::move(discovery)) {}

    std::shared_ptr<ITimerScheduler> createTimerScheduler() override { return m_scheduler; }
    std::shared_ptr<ITransport> createTransport() override { return m_transport; }
    std::shared_ptr<IDiscoveryProvider> createDiscoveryProvider() override { return m_discovery; }

private:
    std::shared_ptr<ITimerScheduler> m_scheduler;
    std::shared_ptr<ITransport> m_transport;
    std::shared_ptr<IDiscoveryProvider> m_discovery;
};

#endif // SESSION_DEPENDENCIES_H
