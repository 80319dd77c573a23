#include "peer_registry.h"
#include "logger.h"

PeerRegistry::PeerRegistry(ITimerScheduler& scheduler) : m_scheduler(scheduler) {}

PeerRegistry::~PeerRegistry() {
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    for (auto& kv : m_entries) {
        if (kv.second.session) {
            kv.second.session->cancelAllTimers(m_scheduler);
        }
    }
}

void PeerRegistry::upsert(const Peer& peer) {
    if (peer.id.empty()) {
        LOG_WARN("Registry: refusing peer with empty id");
        return;
    }
    {
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        auto it = m_entries.find(peer.id);
        if (it == m_entries.end()) {
            Entry entry;
            entry.peer = peer;
            // Only setAuthenticated() may produce a connected peer.
            if (entry.peer.phase == ConnectionPhase::CONNECTED || entry.peer.is_authenticated) {
                entry.peer.phase = ConnectionPhase::DISCOVERED;
                entry.peer.is_authenticated = false;
            }
            m_entries.emplace(peer.id, std::move(entry));
            LOG_DEBUG("Registry: added peer " + peer.id);
        } else {
            Peer& existing = it->second.peer;
            if (!peer.platform.empty()) existing.platform = peer.platform;
            if (!peer.name.empty()) existing.name = peer.name;
            if (!peer.device_id.empty()) existing.device_id = peer.device_id;
            existing.discovered = existing.discovered || peer.discovered;
        }
    }
    notify();
}

bool PeerRegistry::remove(const std::string& id) {
    std::unique_ptr<Session> dropped;
    {
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        auto it = m_entries.find(id);
        if (it == m_entries.end()) {
            return false;
        }
        if (it->second.session) {
            it->second.session->cancelAllTimers(m_scheduler);
            dropped = std::move(it->second.session);
        }
        m_entries.erase(it);
    }
    LOG_INFO("Registry: removed peer " + id);
    notify();
    return true;
}

std::optional<Peer> PeerRegistry::get(const std::string& id) const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    auto it = m_entries.find(id);
    if (it == m_entries.end()) {
        return std::nullopt;
    }
    return it->second.peer;
}

std::vector<Peer> PeerRegistry::list() const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    std::vector<Peer> peers;
    peers.reserve(m_entries.size());
    for (const auto& kv : m_entries) {
        peers.push_back(kv.second.peer);
    }
    return peers;
}

bool PeerRegistry::contains(const std::string& id) const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_entries.count(id) != 0;
}

size_t PeerRegistry::size() const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_entries.size();
}

std::vector<ConnectedDevice> PeerRegistry::connectedDevices() const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    std::vector<ConnectedDevice> devices;
    for (const auto& kv : m_entries) {
        const Peer& p = kv.second.peer;
        if (!p.isConnected()) {
            continue;
        }
        ConnectedDevice d;
        d.id = p.id;
        d.name = p.name.empty() ? p.id : p.name;
        d.platform = p.platform;
        d.is_authenticated = p.is_authenticated;
        devices.push_back(std::move(d));
    }
    return devices;
}

ConnectionState PeerRegistry::connectionState() const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    bool connecting = false;
    bool failed = false;
    for (const auto& kv : m_entries) {
        switch (kv.second.peer.phase) {
            case ConnectionPhase::CONNECTED:
                return ConnectionState::CONNECTED;
            case ConnectionPhase::CONNECTING:
            case ConnectionPhase::CHANNEL_PROBING:
            case ConnectionPhase::HANDSHAKE_SENT:
            case ConnectionPhase::HANDSHAKE_COMPLETED:
                connecting = true;
                break;
            case ConnectionPhase::FAILED:
                failed = true;
                break;
            default:
                break;
        }
    }
    if (connecting) return ConnectionState::CONNECTING;
    if (failed) return ConnectionState::FAILED;
    return ConnectionState::DISCONNECTED;
}

bool PeerRegistry::mutate(const std::string& id, const std::function<bool(Peer&)>& fn) {
    {
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        auto it = m_entries.find(id);
        if (it == m_entries.end()) {
            return false;
        }
        if (!fn(it->second.peer)) {
            return false;
        }
    }
    notify();
    return true;
}

bool PeerRegistry::setAuthenticated(const std::string& id) {
    return mutate(id, [](Peer& p) {
        p.phase = ConnectionPhase::CONNECTED;
        p.is_authenticated = true;
        p.failure_kind = FailureKind::NONE;
        p.failure_reason.clear();
        return true;
    });
}

bool PeerRegistry::setPhase(const std::string& id, ConnectionPhase phase,
                            FailureKind kind, const std::string& reason) {
    if (phase == ConnectionPhase::CONNECTED) {
        LOG_WARN("Registry: setPhase(CONNECTED) refused for " + id + ", use setAuthenticated");
        return false;
    }
    return mutate(id, [&](Peer& p) {
        p.phase = phase;
        p.is_authenticated = false;
        p.failure_kind = kind;
        p.failure_reason = reason;
        return true;
    });
}

bool PeerRegistry::stampKeepAlive(const std::string& id, TimePoint at) {
    return mutate(id, [at](Peer& p) {
        p.last_keep_alive_at = at;
        return true;
    });
}

bool PeerRegistry::recordAttempt(const std::string& id, int failed_attempts, TimePoint last_attempt_at) {
    return mutate(id, [&](Peer& p) {
        p.failed_attempts = failed_attempts;
        p.last_attempt_at = last_attempt_at;
        return true;
    });
}

bool PeerRegistry::setDiscovered(const std::string& id, bool discovered) {
    return mutate(id, [discovered](Peer& p) {
        if (p.discovered == discovered) {
            return false;
        }
        p.discovered = discovered;
        return true;
    });
}

bool PeerRegistry::setIdentity(const std::string& id, const std::string& device_id,
                               const std::string& name, const std::string& platform) {
    return mutate(id, [&](Peer& p) {
        p.device_id = device_id;
        if (!name.empty()) p.name = name;
        if (!platform.empty()) p.platform = platform;
        return true;
    });
}

Session* PeerRegistry::attachSession(std::unique_ptr<Session> session) {
    if (!session) {
        return nullptr;
    }
    std::unique_ptr<Session> replaced;
    Session* raw = nullptr;
    {
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        auto it = m_entries.find(session->peer_id);
        if (it == m_entries.end()) {
            LOG_WARN("Registry: cannot attach session to unknown peer " + session->peer_id);
            return nullptr;
        }
        if (it->second.session) {
            it->second.session->cancelAllTimers(m_scheduler);
            replaced = std::move(it->second.session);
        }
        raw = session.get();
        it->second.session = std::move(session);
    }
    return raw;
}

std::unique_ptr<Session> PeerRegistry::detachSession(const std::string& id) {
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    auto it = m_entries.find(id);
    if (it == m_entries.end()) {
        return nullptr;
    }
    return std::move(it->second.session);
}

Session* PeerRegistry::session(const std::string& id) const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    auto it = m_entries.find(id);
    if (it == m_entries.end()) {
        return nullptr;
    }
    return it->second.session.get();
}

std::mutex& PeerRegistry::peerMutex(const std::string& id) {
    std::lock_guard<std::mutex> lock(m_peer_mutexes_mutex);
    auto& slot = m_peer_mutexes[id];
    if (!slot) {
        slot = std::make_unique<std::mutex>();
    }
    return *slot;
}

PeerRegistry::SubscriberId PeerRegistry::subscribe(Subscriber subscriber) {
    std::lock_guard<std::mutex> lock(m_subscribers_mutex);
    const SubscriberId id = m_next_subscriber++;
    m_subscribers.emplace(id, std::move(subscriber));
    return id;
}

void PeerRegistry::unsubscribe(SubscriberId id) {
    std::lock_guard<std::mutex> lock(m_subscribers_mutex);
    m_subscribers.erase(id);
}

void PeerRegistry::clear() {
    std::map<std::string, Entry> dropped;
    {
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        for (auto& kv : m_entries) {
            if (kv.second.session) {
                kv.second.session->cancelAllTimers(m_scheduler);
            }
        }
        dropped.swap(m_entries);
    }
    if (!dropped.empty()) {
        notify();
    }
}

void PeerRegistry::notify() {
    std::vector<Subscriber> subscribers;
    {
        std::lock_guard<std::mutex> lock(m_subscribers_mutex);
        if (m_subscribers.empty()) {
            return;
        }
        for (const auto& kv : m_subscribers) {
            subscribers.push_back(kv.second);
        }
    }
    const std::vector<Peer> snapshot = list();
    for (const auto& subscriber : subscribers) {
        subscriber(snapshot);
    }
}
