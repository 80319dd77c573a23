#include "companion_node.h"
#include "command_dispatcher.h"
#include "logger.h"
#include "session_manager.h"

#include <iostream>

CompanionNode::CompanionNode() : running_(false) {
    session_manager_ = std::make_unique<SessionManager>();
}

CompanionNode::~CompanionNode() {
    if (running_) {
        stop();
    }
}

bool CompanionNode::start() {
    if (running_) {
        LOG_WARN("NODE: already running");
        return false;
    }

    session_manager_->setCommandCallback([](const std::string& peer_id, const Command& command) {
        std::cout << "[command] " << peer_id << ": " << CommandDispatcher::describe(command) << std::endl;
    });
    session_manager_->setMediaCallback([](const std::string& peer_id, const std::string& frame) {
        LOG_DEBUG("NODE: media frame of " + std::to_string(frame.size()) + " bytes from " + peer_id);
    });

    if (!session_manager_->start([this](const std::vector<Peer>& peers) { onPeersChanged(peers); })) {
        LOG_ERROR("NODE: session manager failed to start");
        return false;
    }
    running_ = true;
    std::cout << "LightLink node running as " << getLocalDeviceId() << std::endl;
    return true;
}

void CompanionNode::stop() {
    if (!running_) {
        return;
    }
    session_manager_->stop();
    running_ = false;
    std::lock_guard<std::mutex> lock(peers_mutex_);
    peer_connected_state_.clear();
}

bool CompanionNode::connectToPeer(const std::string& target) {
    if (!session_manager_->connectToPeer(target)) {
        std::cerr << "Cannot connect to " << target << " now, try later" << std::endl;
        return false;
    }
    return true;
}

bool CompanionNode::disconnectPeer(const std::string& peer_id) {
    return session_manager_->disconnectPeer(peer_id);
}

std::string CompanionNode::getLocalDeviceId() const {
    return session_manager_->getLocalIdentity().format();
}

std::vector<std::string> CompanionNode::describePeers() const {
    std::vector<std::string> lines;
    for (const Peer& peer : session_manager_->getPeers()) {
        std::string line = peer.id + " " + (peer.name.empty() ? "?" : peer.name) +
                           " [" + connection_phase_to_string(peer.phase) + "]";
        if (!peer.failure_reason.empty() && !peer.isConnected()) {
            line += " (" + peer.failure_reason + ")";
        }
        lines.push_back(line);
    }
    return lines;
}

void CompanionNode::onPeersChanged(const std::vector<Peer>& peers) {
    std::vector<std::string> now_connected;
    std::vector<std::string> now_disconnected;
    {
        std::lock_guard<std::mutex> lock(peers_mutex_);
        std::map<std::string, bool> current;
        for (const Peer& peer : peers) {
            current[peer.id] = peer.isConnected();
            auto prev = peer_connected_state_.find(peer.id);
            const bool was_connected = prev != peer_connected_state_.end() && prev->second;
            if (!was_connected && peer.isConnected()) {
                now_connected.push_back(peer.id + " (" + peer.name + ", " + peer.platform + ")");
            } else if (was_connected && !peer.isConnected()) {
                now_disconnected.push_back(peer.id + ": " + peer.failure_reason);
            }
        }
        // Peers that vanished from the list count as disconnected.
        for (const auto& kv : peer_connected_state_) {
            if (kv.second && current.find(kv.first) == current.end()) {
                now_disconnected.push_back(kv.first + ": removed");
            }
        }
        peer_connected_state_ = std::move(current);
    }

    for (const auto& line : now_connected) {
        std::cout << "[connected] " << line << std::endl;
    }
    for (const auto& line : now_disconnected) {
        std::cout << "[disconnected] " << line << std::endl;
    }
}
