#include "static_discovery.h"
#include "logger.h"

#include <utility>

StaticDiscovery::StaticDiscovery(std::vector<StaticPeerConfig> peers) : m_peers(std::move(peers)) {}

std::vector<StaticPeerConfig> StaticDiscovery::fromConfig() {
    return ConfigManager::getInstance().getStaticPeers();
}

void StaticDiscovery::setCallbacks(FoundCallback on_found, LostCallback on_lost) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_on_found = std::move(on_found);
    m_on_lost = std::move(on_lost);
}

bool StaticDiscovery::start() {
    FoundCallback on_found;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_running) {
            return true;
        }
        m_running = true;
        on_found = m_on_found;
    }
    LOG_INFO("StaticDiscovery: reporting " + std::to_string(m_peers.size()) + " configured peer(s)");
    if (!on_found) {
        return true;
    }
    for (const auto& peer : m_peers) {
        on_found(peer.address, peer.platform, peer.name.empty() ? peer.id : peer.name);
    }
    return true;
}

void StaticDiscovery::stop() {
    LostCallback on_lost;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running) {
            return;
        }
        m_running = false;
        on_lost = m_on_lost;
    }
    if (!on_lost) {
        return;
    }
    for (const auto& peer : m_peers) {
        on_lost(peer.address);
    }
}

bool StaticDiscovery::isRunning() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_running;
}
