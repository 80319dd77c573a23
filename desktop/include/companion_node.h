#pragma once

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

class SessionManager;
struct Peer;

/**
 * @brief Desktop companion wrapper around SessionManager.
 *
 * The engine does the work (discovery, handshake, keep-alive, reconnect);
 * this class starts it with the loaded configuration and reports peer
 * transitions and received commands on stdout.
 */
class CompanionNode {
public:
    CompanionNode();
    ~CompanionNode();

    bool start();
    void stop();

    // target is "host:port".
    bool connectToPeer(const std::string& target);
    bool disconnectPeer(const std::string& peer_id);

    bool isRunning() const { return running_; }
    std::string getLocalDeviceId() const;

    // One line per known peer, e.g. "127.0.0.1:47801 iPhone [Connected]".
    std::vector<std::string> describePeers() const;

private:
    void onPeersChanged(const std::vector<Peer>& peers);

    std::atomic<bool> running_;
    std::unique_ptr<SessionManager> session_manager_;

    mutable std::mutex peers_mutex_;
    std::map<std::string, bool> peer_connected_state_;
};
