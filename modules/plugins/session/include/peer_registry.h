#ifndef PEER_REGISTRY_H
#define PEER_REGISTRY_H

#include "peer.h"
#include "session.h"
#include "timer_scheduler.h"

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

/**
 * @brief Sole owner of every Peer and its current Session.
 *
 * Reads take a shared lock, mutations an exclusive one. Each mutation that
 * changes something is followed by a snapshot notification, delivered after
 * the lock is released, so subscribers may call back into the registry.
 *
 * Sessions handed out by session() stay valid until detachSession(),
 * attachSession() for the same peer, remove() or clear(); callers hold
 * peerMutex(id) for the whole time they use one.
 */
class PeerRegistry {
public:
    using TimePoint = std::chrono::steady_clock::time_point;
    using Subscriber = std::function<void(const std::vector<Peer>&)>;
    using SubscriberId = uint64_t;

    explicit PeerRegistry(ITimerScheduler& scheduler);
    ~PeerRegistry();

    PeerRegistry(const PeerRegistry&) = delete;
    PeerRegistry& operator=(const PeerRegistry&) = delete;

    // Inserts a new peer as given, or refreshes platform/name/device_id (when
    // non-empty) and `discovered` of an existing one. Lifecycle fields of an
    // existing peer are never touched here.
    void upsert(const Peer& peer);

    // Cancels the peer's session timers, then drops the session and the peer.
    bool remove(const std::string& id);

    std::optional<Peer> get(const std::string& id) const;
    std::vector<Peer> list() const;
    bool contains(const std::string& id) const;
    size_t size() const;

    // Peers with phase CONNECTED, which are exactly the authenticated ones.
    std::vector<ConnectedDevice> connectedDevices() const;
    ConnectionState connectionState() const;

    // The only way into CONNECTED: sets the phase and isAuthenticated together.
    bool setAuthenticated(const std::string& id);

    // Any phase but CONNECTED (refused); clears isAuthenticated. The failure
    // record is replaced by `kind`/`reason`.
    bool setPhase(const std::string& id, ConnectionPhase phase,
                  FailureKind kind = FailureKind::NONE, const std::string& reason = "");

    bool stampKeepAlive(const std::string& id, TimePoint at);
    bool recordAttempt(const std::string& id, int failed_attempts, TimePoint last_attempt_at);
    bool setDiscovered(const std::string& id, bool discovered);
    bool setIdentity(const std::string& id, const std::string& device_id,
                     const std::string& name, const std::string& platform);

    // Takes ownership; a previous session of the same peer is cancelled and
    // destroyed. Returns nullptr (and destroys `session`) for an unknown peer.
    Session* attachSession(std::unique_ptr<Session> session);
    std::unique_ptr<Session> detachSession(const std::string& id);
    Session* session(const std::string& id) const;

    // Serialises everything done on behalf of one peer. Created on first use
    // and never destroyed before the registry.
    std::mutex& peerMutex(const std::string& id);

    SubscriberId subscribe(Subscriber subscriber);
    void unsubscribe(SubscriberId id);

    // Cancels every session and forgets every peer.
    void clear();

private:
    struct Entry {
        Peer peer;
        std::unique_ptr<Session> session;
    };

    // Applies `fn` to the peer under the write lock; notifies when fn returns true.
    bool mutate(const std::string& id, const std::function<bool(Peer&)>& fn);
    void notify();

    ITimerScheduler& m_scheduler;

    mutable std::shared_mutex m_mutex;
    std::map<std::string, Entry> m_entries;

    std::mutex m_peer_mutexes_mutex;
    std::map<std::string, std::unique_ptr<std::mutex>> m_peer_mutexes;

    std::mutex m_subscribers_mutex;
    std::map<SubscriberId, Subscriber> m_subscribers;
    SubscriberId m_next_subscriber = 1;
};

#endif // PEER_REGISTRY_H
