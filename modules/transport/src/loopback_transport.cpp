#include "loopback_transport.h"
#include "logger.h"

#include <vector>

const char* transport_peer_state_to_string(TransportPeerState state) {
    switch (state) {
        case TransportPeerState::CONNECTING: return "CONNECTING";
        case TransportPeerState::CONNECTED: return "CONNECTED";
        case TransportPeerState::DISCONNECTED: return "DISCONNECTED";
    }
    return "UNKNOWN";
}

// ============================================================================
// LoopbackNetwork
// ============================================================================

std::shared_ptr<LoopbackNetwork> LoopbackNetwork::create(ITimerScheduler& scheduler,
                                                         std::chrono::milliseconds latency) {
    return std::shared_ptr<LoopbackNetwork>(new LoopbackNetwork(scheduler, latency));
}

LoopbackNetwork::LoopbackNetwork(ITimerScheduler& scheduler, std::chrono::milliseconds latency)
    : m_scheduler(scheduler), m_latency(latency) {}

std::shared_ptr<LoopbackTransport> LoopbackNetwork::createEndpoint(const std::string& address,
                                                                   const std::string& platform) {
    auto ep = std::make_shared<LoopbackTransport>(weak_from_this(), address, platform);
    std::lock_guard<std::mutex> lock(m_mutex);
    m_endpoints[address] = ep;
    return ep;
}

void LoopbackNetwork::setLatency(std::chrono::milliseconds latency) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_latency = latency;
}

LoopbackNetwork::Link LoopbackNetwork::makeLink(const std::string& a, const std::string& b) {
    return a < b ? Link(a, b) : Link(b, a);
}

bool LoopbackNetwork::linked(const std::string& a, const std::string& b) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_links.count(makeLink(a, b)) != 0;
}

size_t LoopbackNetwork::sentCount(const std::string& from, const std::string& to) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_sent.find(std::make_pair(from, to));
    return it == m_sent.end() ? 0 : it->second;
}

std::shared_ptr<LoopbackTransport> LoopbackNetwork::endpoint(const std::string& address) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_endpoints.find(address);
    if (it == m_endpoints.end()) {
        return nullptr;
    }
    return it->second.lock();
}

void LoopbackNetwork::post(std::function<void()> fn) {
    std::chrono::milliseconds latency;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        latency = m_latency;
    }
    std::weak_ptr<LoopbackNetwork> weak = weak_from_this();
    m_scheduler.schedule(latency, [weak, fn = std::move(fn)]() {
        if (auto self = weak.lock()) {
            fn();
        }
    });
}

void LoopbackNetwork::setSendFailure(const std::string& address, bool fail) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (fail) {
        m_send_failures.insert(address);
    } else {
        m_send_failures.erase(address);
    }
}

void LoopbackNetwork::setRefuseConnections(const std::string& address, bool refuse) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (refuse) {
        m_refusing.insert(address);
    } else {
        m_refusing.erase(address);
    }
}

void LoopbackNetwork::sever(const std::string& a, const std::string& b) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_links.erase(makeLink(a, b)) == 0) {
            return;
        }
    }
    LOG_INFO("Loopback: link " + a + " <-> " + b + " severed");
    post([this, a, b]() {
        if (auto ep = endpoint(a)) ep->deliverState(b, TransportPeerState::DISCONNECTED);
        if (auto ep = endpoint(b)) ep->deliverState(a, TransportPeerState::DISCONNECTED);
    });
}

bool LoopbackNetwork::connectFrom(const std::string& from, const std::string& target) {
    auto target_ep = endpoint(target);
    if (!target_ep || !target_ep->running()) {
        LOG_WARN("Loopback: connect to unknown or stopped endpoint " + target);
        return false;
    }

    bool already_linked = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        already_linked = m_links.count(makeLink(from, target)) != 0;
    }

    if (already_linked) {
        post([this, from, target]() {
            if (auto ep = endpoint(from)) ep->deliverState(target, TransportPeerState::CONNECTED);
        });
        return true;
    }

    post([this, from, target]() {
        if (auto ep = endpoint(from)) ep->deliverState(target, TransportPeerState::CONNECTING);
    });

    post([this, from, target]() {
        auto from_ep = endpoint(from);
        auto to_ep = endpoint(target);
        if (!from_ep || !from_ep->running()) {
            return;
        }

        bool refused = false;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            refused = m_refusing.count(target) != 0;
        }
        if (!refused && to_ep && to_ep->running()) {
            refused = !to_ep->askInvitation(from, from_ep->platform());
        } else {
            refused = true;
        }

        if (refused) {
            LOG_INFO("Loopback: " + target + " refused link from " + from);
            from_ep->deliverState(target, TransportPeerState::DISCONNECTED);
            return;
        }

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_links.insert(makeLink(from, target));
        }
        // Accepting side first so its session exists before the first frame arrives.
        to_ep->deliverState(from, TransportPeerState::CONNECTED);
        from_ep->deliverState(target, TransportPeerState::CONNECTED);
    });
    return true;
}

bool LoopbackNetwork::sendFrom(const std::string& from, const std::string& to, const std::string& bytes) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_send_failures.count(from) != 0) {
            return false;
        }
        if (m_links.count(makeLink(from, to)) == 0) {
            return false;
        }
        m_sent[std::make_pair(from, to)]++;
    }
    post([this, from, to, bytes]() {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_links.count(makeLink(from, to)) == 0) {
                return;
            }
        }
        if (auto ep = endpoint(to)) ep->deliverData(from, bytes);
    });
    return true;
}

void LoopbackNetwork::disconnectFrom(const std::string& from, const std::string& to) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_links.erase(makeLink(from, to)) == 0) {
            return;
        }
    }
    post([this, from, to]() {
        if (auto ep = endpoint(to)) ep->deliverState(from, TransportPeerState::DISCONNECTED);
    });
}

void LoopbackNetwork::endpointStopped(const std::string& address) {
    std::vector<std::string> others;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (auto it = m_links.begin(); it != m_links.end();) {
            if (it->first == address || it->second == address) {
                others.push_back(it->first == address ? it->second : it->first);
                it = m_links.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (const auto& other : others) {
        post([this, address, other]() {
            if (auto ep = endpoint(other)) ep->deliverState(address, TransportPeerState::DISCONNECTED);
        });
    }
}

// ============================================================================
// LoopbackTransport
// ============================================================================

LoopbackTransport::LoopbackTransport(std::weak_ptr<LoopbackNetwork> network, std::string address, std::string platform)
    : m_network(std::move(network)), m_address(std::move(address)), m_platform(std::move(platform)) {}

LoopbackTransport::~LoopbackTransport() {
    stop();
}

bool LoopbackTransport::start() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_running = true;
    return true;
}

void LoopbackTransport::stop() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running) return;
        m_running = false;
    }
    if (auto net = m_network.lock()) {
        net->endpointStopped(m_address);
    }
}

bool LoopbackTransport::running() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_running;
}

bool LoopbackTransport::connect(const std::string& target) {
    if (!running()) return false;
    auto net = m_network.lock();
    if (!net || target == m_address) return false;
    return net->connectFrom(m_address, target);
}

bool LoopbackTransport::send(const std::string& peer_id, const std::string& bytes) {
    if (!running()) return false;
    auto net = m_network.lock();
    if (!net) return false;
    return net->sendFrom(m_address, peer_id, bytes);
}

void LoopbackTransport::disconnect(const std::string& peer_id) {
    if (auto net = m_network.lock()) {
        net->disconnectFrom(m_address, peer_id);
    }
}

bool LoopbackTransport::isConnected(const std::string& peer_id) const {
    if (!running()) return false;
    auto net = m_network.lock();
    return net && net->linked(m_address, peer_id);
}

void LoopbackTransport::setReceiveCallback(ReceiveCallback cb) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_receive_cb = std::move(cb);
}

void LoopbackTransport::setPeerStateCallback(PeerStateCallback cb) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_state_cb = std::move(cb);
}

void LoopbackTransport::setInvitationCallback(InvitationCallback cb) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_invitation_cb = std::move(cb);
}

void LoopbackTransport::deliverState(const std::string& peer_id, TransportPeerState state) {
    PeerStateCallback cb;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running) return;
        cb = m_state_cb;
    }
    if (cb) cb(peer_id, state);
}

void LoopbackTransport::deliverData(const std::string& peer_id, const std::string& bytes) {
    ReceiveCallback cb;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running) return;
        cb = m_receive_cb;
    }
    if (cb) cb(peer_id, bytes);
}

bool LoopbackTransport::askInvitation(const std::string& peer_id, const std::string& platform) {
    InvitationCallback cb;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        cb = m_invitation_cb;
    }
    return cb ? cb(peer_id, platform) : true;
}
