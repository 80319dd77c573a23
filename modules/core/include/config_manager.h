#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <mutex>

using json = nlohmann::json;

// Peer entry from the "discovery.static_peers" array.
struct StaticPeerConfig {
    std::string id;
    std::string address;   // "host:port"
    std::string platform;
    std::string name;
};

class ConfigManager {
public:
    static ConfigManager& getInstance();

    bool loadConfig(const std::string& config_path);
    bool loadConfigFromString(const std::string& content);

    // Replaces the document with the built-in defaults.
    void resetToDefaults();

    // Creates intermediate objects as needed. Returns false for an empty path
    // or when an intermediate node exists and is not an object.
    bool setValueAtPath(const std::vector<std::string>& key_path, const json& value);
    bool eraseValueAtPath(const std::vector<std::string>& key_path);

    json snapshot() const;

    // Identity
    std::string getDevicePlatform() const;
    std::string getDeviceName() const;

    // Session timing (milliseconds)
    int getKeepAliveIntervalMs() const;
    int getKeepAliveTimeoutMs() const;
    int getHandshakeTimeoutMs() const;
    int getReconnectIntervalMs() const;
    int getConnectionCooldownMs() const;
    int getChannelEstablishmentDelayMs() const;
    int getChannelStabilizationDelayMs() const;
    int getHandshakeResponseDelayMs() const;
    int getDtlsRetryDelayMs() const;
    int getMonitorIntervalMs() const;

    // Session limits and policy
    int getMaxConnectionAttempts() const;
    int getMaxQueuedMessages() const;
    int getDtlsRetryAttempts() const;
    std::string getOutboundQueuePolicy() const;
    bool isAutoReconnectEnabled() const;
    bool isKeepAliveReplyEnabled() const;
    std::vector<std::string> getAcceptedPlatforms() const;

    // Commands
    bool isCommandAutoAckEnabled() const;
    std::string getDefaultVideoQuality() const;

    // Transport
    int getTCPListenPort() const;
    bool isTCPNoDelayEnabled() const;
    int getTCPBufferSize() const;
    int getTCPConnectTimeoutMs() const;

    // Discovery
    bool isAutoConnectEnabled() const;
    std::vector<StaticPeerConfig> getStaticPeers() const;

    // Logging
    std::string getLogLevel() const;
    bool isAsyncLoggingEnabled() const;

private:
    ConfigManager();

    json section(const char* name) const;

    template <typename T>
    T valueAt(const char* section, const char* key, const T& fallback) const;

    mutable std::mutex m_mutex;
    json m_config;
};
