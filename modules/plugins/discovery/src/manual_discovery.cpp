#include "manual_discovery.h"
#include "logger.h"

#include <utility>
#include <vector>

void ManualDiscovery::setCallbacks(FoundCallback on_found, LostCallback on_lost) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_on_found = std::move(on_found);
    m_on_lost = std::move(on_lost);
}

bool ManualDiscovery::start() {
    FoundCallback on_found;
    std::map<std::string, Announcement> announced;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_running) {
            return true;
        }
        m_running = true;
        on_found = m_on_found;
        announced = m_announced;
    }
    if (on_found) {
        for (const auto& kv : announced) {
            on_found(kv.first, kv.second.platform, kv.second.name);
        }
    }
    return true;
}

void ManualDiscovery::stop() {
    LostCallback on_lost;
    std::vector<std::string> ids;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running) {
            return;
        }
        m_running = false;
        on_lost = m_on_lost;
        for (const auto& kv : m_announced) {
            ids.push_back(kv.first);
        }
    }
    if (on_lost) {
        for (const auto& id : ids) {
            on_lost(id);
        }
    }
}

bool ManualDiscovery::isRunning() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_running;
}

void ManualDiscovery::announce(const std::string& peer_id, const std::string& platform, const std::string& name) {
    FoundCallback on_found;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_announced[peer_id] = Announcement{platform, name};
        if (!m_running) {
            return;
        }
        on_found = m_on_found;
    }
    LOG_DEBUG("ManualDiscovery: found " + peer_id + " (" + platform + ")");
    if (on_found) {
        on_found(peer_id, platform, name);
    }
}

void ManualDiscovery::withdraw(const std::string& peer_id) {
    LostCallback on_lost;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_announced.erase(peer_id) == 0 || !m_running) {
            return;
        }
        on_lost = m_on_lost;
    }
    LOG_DEBUG("ManualDiscovery: lost " + peer_id);
    if (on_lost) {
        on_lost(peer_id);
    }
}

size_t ManualDiscovery::announcedCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_announced.size();
}
