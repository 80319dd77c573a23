#ifndef LOOPBACK_TRANSPORT_H
#define LOOPBACK_TRANSPORT_H

#include "itransport.h"
#include "timer_scheduler.h"

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <utility>

class LoopbackTransport;

/**
 * @brief In-process hub connecting LoopbackTransport endpoints.
 *
 * Every delivery (state change or message) is posted on the shared timer
 * scheduler after the configured latency, so a ManualTimerScheduler gives
 * fully deterministic runs. Includes fault injection for tests.
 */
class LoopbackNetwork : public std::enable_shared_from_this<LoopbackNetwork> {
public:
    static std::shared_ptr<LoopbackNetwork> create(ITimerScheduler& scheduler,
                                                   std::chrono::milliseconds latency = std::chrono::milliseconds(0));

    // `address` is the id other endpoints use for this one.
    std::shared_ptr<LoopbackTransport> createEndpoint(const std::string& address, const std::string& platform);

    void setLatency(std::chrono::milliseconds latency);

    // Drops the link without either side asking; both ends see DISCONNECTED.
    void sever(const std::string& a, const std::string& b);

    // While enabled every send() from `address` returns false.
    void setSendFailure(const std::string& address, bool fail);

    // While enabled connect() attempts to `address` are refused (DISCONNECTED).
    void setRefuseConnections(const std::string& address, bool refuse);

    bool linked(const std::string& a, const std::string& b) const;

    // Messages accepted by send() from `from` to `to` so far.
    size_t sentCount(const std::string& from, const std::string& to) const;

private:
    friend class LoopbackTransport;

    LoopbackNetwork(ITimerScheduler& scheduler, std::chrono::milliseconds latency);

    using Link = std::pair<std::string, std::string>;
    static Link makeLink(const std::string& a, const std::string& b);

    bool connectFrom(const std::string& from, const std::string& target);
    bool sendFrom(const std::string& from, const std::string& to, const std::string& bytes);
    void disconnectFrom(const std::string& from, const std::string& to);
    void endpointStopped(const std::string& address);

    void post(std::function<void()> fn);
    std::shared_ptr<LoopbackTransport> endpoint(const std::string& address) const;

    ITimerScheduler& m_scheduler;
    mutable std::mutex m_mutex;
    std::chrono::milliseconds m_latency;
    std::map<std::string, std::weak_ptr<LoopbackTransport>> m_endpoints;
    std::set<Link> m_links;
    std::set<std::string> m_send_failures;
    std::set<std::string> m_refusing;
    std::map<std::pair<std::string, std::string>, size_t> m_sent;
};

class LoopbackTransport : public ITransport {
public:
    LoopbackTransport(std::weak_ptr<LoopbackNetwork> network, std::string address, std::string platform);
    ~LoopbackTransport() override;

    bool start() override;
    void stop() override;
    bool connect(const std::string& target) override;
    bool send(const std::string& peer_id, const std::string& bytes) override;
    void disconnect(const std::string& peer_id) override;
    bool isConnected(const std::string& peer_id) const override;

    void setReceiveCallback(ReceiveCallback cb) override;
    void setPeerStateCallback(PeerStateCallback cb) override;
    void setInvitationCallback(InvitationCallback cb) override;

    const std::string& address() const { return m_address; }
    const std::string& platform() const { return m_platform; }
    bool running() const;

private:
    friend class LoopbackNetwork;

    void deliverState(const std::string& peer_id, TransportPeerState state);
    void deliverData(const std::string& peer_id, const std::string& bytes);
    bool askInvitation(const std::string& peer_id, const std::string& platform);

    std::weak_ptr<LoopbackNetwork> m_network;
    const std::string m_address;
    const std::string m_platform;

    mutable std::mutex m_mutex;
    bool m_running = false;
    ReceiveCallback m_receive_cb;
    PeerStateCallback m_state_cb;
    InvitationCallback m_invitation_cb;
};

#endif // LOOPBACK_TRANSPORT_H
