#include "config_manager.h"
#include "logger.h"
#include <fstream>
#include <sstream>

namespace {

std::string string_field(const json& obj, const char* key, const std::string& fallback) {
    auto it = obj.find(key);
    return it != obj.end() && it->is_string() ? it->get<std::string>() : fallback;
}

json default_config() {
    return json{
        {"identity", {
            {"platform", "macOS"},
            {"device_name", "MacDesktop"}
        }},
        {"session", {
            {"keep_alive_interval_ms", 2000},
            {"keep_alive_timeout_ms", 6000},
            {"handshake_timeout_ms", 15000},
            {"reconnect_interval_ms", 5000},
            {"max_connection_attempts", 3},
            {"connection_cooldown_ms", 10000},
            {"channel_establishment_delay_ms", 2000},
            {"channel_stabilization_delay_ms", 1000},
            {"handshake_response_delay_ms", 500},
            {"max_queued_messages", 10},
            {"outbound_queue_policy", "drop_oldest"},
            {"dtls_retry_attempts", 3},
            {"dtls_retry_delay_ms", 1000},
            {"monitor_interval_ms", 1000},
            {"auto_reconnect", true},
            {"keep_alive_reply_on_receive", false},
            {"accepted_platforms", json::array({"iOS"})}
        }},
        {"commands", {
            {"auto_acknowledge", true},
            {"default_video_quality", "high"}
        }},
        {"transport", {
            {"tcp", {
                {"listen_port", 47800},
                {"nodelay", true},
                {"buffer_size", 65536},
                {"connect_timeout_ms", 5000}
            }}
        }},
        {"discovery", {
            {"auto_connect", true},
            {"static_peers", json::array()}
        }},
        {"logging", {
            {"level", "info"},
            {"async", false}
        }}
    };
}

} // namespace

ConfigManager& ConfigManager::getInstance() {
    static ConfigManager instance;
    return instance;
}

ConfigManager::ConfigManager() : m_config(default_config()) {}

bool ConfigManager::loadConfig(const std::string& config_path) {
    std::ifstream config_file(config_path);
    if (!config_file.is_open()) {
        LOG_ERROR("Config: failed to open config file: " + config_path);
        return false;
    }
    std::stringstream buffer;
    buffer << config_file.rdbuf();
    if (!loadConfigFromString(buffer.str())) {
        LOG_ERROR("Config: failed to load " + config_path);
        return false;
    }
    LOG_INFO("Config: loaded " + config_path);
    return true;
}

bool ConfigManager::loadConfigFromString(const std::string& content) {
    json parsed;
    try {
        parsed = json::parse(content, nullptr, true, true);
    } catch (const std::exception& e) {
        LOG_ERROR(std::string("Config: parse error: ") + e.what());
        return false;
    }
    if (!parsed.is_object()) {
        LOG_ERROR("Config: top-level value must be an object");
        return false;
    }

    // Missing keys fall back to the defaults.
    json merged = default_config();
    merged.merge_patch(parsed);

    std::lock_guard<std::mutex> lock(m_mutex);
    m_config = std::move(merged);
    return true;
}

void ConfigManager::resetToDefaults() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_config = default_config();
}

bool ConfigManager::setValueAtPath(const std::vector<std::string>& key_path, const json& value) {
    if (key_path.empty()) {
        return false;
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    json* node = &m_config;
    for (size_t i = 0; i + 1 < key_path.size(); ++i) {
        json& child = (*node)[key_path[i]];
        if (child.is_null()) {
            child = json::object();
        } else if (!child.is_object()) {
            return false;
        }
        node = &child;
    }
    (*node)[key_path.back()] = value;
    return true;
}

bool ConfigManager::eraseValueAtPath(const std::vector<std::string>& key_path) {
    if (key_path.empty()) {
        return false;
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    json* node = &m_config;
    for (size_t i = 0; i + 1 < key_path.size(); ++i) {
        auto it = node->find(key_path[i]);
        if (it == node->end() || !it->is_object()) {
            return false;
        }
        node = &(*it);
    }
    return node->erase(key_path.back()) > 0;
}

json ConfigManager::snapshot() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_config;
}

json ConfigManager::section(const char* name) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto sec = m_config.find(name);
    if (sec == m_config.end() || !sec->is_object()) {
        return json::object();
    }
    return *sec;
}

template <typename T>
T ConfigManager::valueAt(const char* section, const char* key, const T& fallback) const {
    std::string error;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto sec = m_config.find(section);
        if (sec == m_config.end() || !sec->is_object()) {
            return fallback;
        }
        try {
            return sec->value(key, fallback);
        } catch (const json::exception& e) {
            error = e.what();
        }
    }
    // Logged without m_mutex: a log sink may read the configuration.
    LOG_WARN(std::string("Config: bad value for ") + section + "." + key + ": " + error);
    return fallback;
}

std::string ConfigManager::getDevicePlatform() const {
    return valueAt<std::string>("identity", "platform", "macOS");
}

std::string ConfigManager::getDeviceName() const {
    return valueAt<std::string>("identity", "device_name", "MacDesktop");
}

int ConfigManager::getKeepAliveIntervalMs() const {
    return valueAt<int>("session", "keep_alive_interval_ms", 2000);
}

int ConfigManager::getKeepAliveTimeoutMs() const {
    return valueAt<int>("session", "keep_alive_timeout_ms", 6000);
}

int ConfigManager::getHandshakeTimeoutMs() const {
    return valueAt<int>("session", "handshake_timeout_ms", 15000);
}

int ConfigManager::getReconnectIntervalMs() const {
    return valueAt<int>("session", "reconnect_interval_ms", 5000);
}

int ConfigManager::getConnectionCooldownMs() const {
    return valueAt<int>("session", "connection_cooldown_ms", 10000);
}

int ConfigManager::getChannelEstablishmentDelayMs() const {
    return valueAt<int>("session", "channel_establishment_delay_ms", 2000);
}

int ConfigManager::getChannelStabilizationDelayMs() const {
    return valueAt<int>("session", "channel_stabilization_delay_ms", 1000);
}

int ConfigManager::getHandshakeResponseDelayMs() const {
    return valueAt<int>("session", "handshake_response_delay_ms", 500);
}

int ConfigManager::getDtlsRetryDelayMs() const {
    return valueAt<int>("session", "dtls_retry_delay_ms", 1000);
}

int ConfigManager::getMonitorIntervalMs() const {
    return valueAt<int>("session", "monitor_interval_ms", 1000);
}

int ConfigManager::getMaxConnectionAttempts() const {
    return valueAt<int>("session", "max_connection_attempts", 3);
}

int ConfigManager::getMaxQueuedMessages() const {
    return valueAt<int>("session", "max_queued_messages", 10);
}

int ConfigManager::getDtlsRetryAttempts() const {
    return valueAt<int>("session", "dtls_retry_attempts", 3);
}

std::string ConfigManager::getOutboundQueuePolicy() const {
    return valueAt<std::string>("session", "outbound_queue_policy", "drop_oldest");
}

bool ConfigManager::isAutoReconnectEnabled() const {
    return valueAt<bool>("session", "auto_reconnect", true);
}

bool ConfigManager::isKeepAliveReplyEnabled() const {
    return valueAt<bool>("session", "keep_alive_reply_on_receive", false);
}

std::vector<std::string> ConfigManager::getAcceptedPlatforms() const {
    return valueAt<std::vector<std::string>>("session", "accepted_platforms", {"iOS"});
}

bool ConfigManager::isCommandAutoAckEnabled() const {
    return valueAt<bool>("commands", "auto_acknowledge", true);
}

std::string ConfigManager::getDefaultVideoQuality() const {
    return valueAt<std::string>("commands", "default_video_quality", "high");
}

int ConfigManager::getTCPListenPort() const {
    json tcp = section("transport").value("tcp", json::object());
    return tcp.value("listen_port", 47800);
}

bool ConfigManager::isTCPNoDelayEnabled() const {
    json tcp = section("transport").value("tcp", json::object());
    return tcp.value("nodelay", true);
}

int ConfigManager::getTCPBufferSize() const {
    json tcp = section("transport").value("tcp", json::object());
    return tcp.value("buffer_size", 65536);
}

int ConfigManager::getTCPConnectTimeoutMs() const {
    json tcp = section("transport").value("tcp", json::object());
    return tcp.value("connect_timeout_ms", 5000);
}

bool ConfigManager::isAutoConnectEnabled() const {
    return valueAt<bool>("discovery", "auto_connect", true);
}

std::vector<StaticPeerConfig> ConfigManager::getStaticPeers() const {
    json peers = section("discovery").value("static_peers", json::array());
    std::vector<StaticPeerConfig> result;
    if (!peers.is_array()) {
        return result;
    }
    for (const auto& entry : peers) {
        if (!entry.is_object()) {
            continue;
        }
        StaticPeerConfig peer;
        peer.address = string_field(entry, "address", "");
        peer.id = string_field(entry, "id", peer.address);
        peer.platform = string_field(entry, "platform", "iOS");
        peer.name = string_field(entry, "name", peer.id);
        if (peer.address.empty()) {
            LOG_WARN("Config: skipping static peer without a string address");
            continue;
        }
        result.push_back(std::move(peer));
    }
    return result;
}

std::string ConfigManager::getLogLevel() const {
    return valueAt<std::string>("logging", "level", "info");
}

bool ConfigManager::isAsyncLoggingEnabled() const {
    return valueAt<bool>("logging", "async", false);
}
