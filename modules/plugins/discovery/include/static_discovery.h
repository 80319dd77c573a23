#pragma once

#include "idiscovery_provider.h"
#include "config_manager.h"

#include <mutex>
#include <string>
#include <vector>

// Reports a fixed list of peers (the "discovery.static_peers" config array)
// as found on start() and as lost on stop(). Peers are keyed by address.
class StaticDiscovery : public IDiscoveryProvider {
public:
    explicit StaticDiscovery(std::vector<StaticPeerConfig> peers);

    static std::vector<StaticPeerConfig> fromConfig();

    void setCallbacks(FoundCallback on_found, LostCallback on_lost) override;
    bool start() override;
    void stop() override;
    bool isRunning() const override;

private:
    std::vector<StaticPeerConfig> m_peers;
    FoundCallback m_on_found;
    LostCallback m_on_lost;
    mutable std::mutex m_mutex;
    bool m_running = false;
};
