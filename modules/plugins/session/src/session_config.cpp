#include "session_config.h"
#include "config_manager.h"

#include <algorithm>

bool SessionConfig::acceptsPlatform(const std::string& candidate) const {
    if (accepted_platforms.empty()) {
        return true;
    }
    return std::find(accepted_platforms.begin(), accepted_platforms.end(), candidate) != accepted_platforms.end();
}

SessionConfig SessionConfig::fromConfigManager() {
    const ConfigManager& cfg = ConfigManager::getInstance();
    SessionConfig c;

    c.platform = cfg.getDevicePlatform();
    c.device_name = cfg.getDeviceName();

    c.keep_alive_interval = std::chrono::milliseconds(cfg.getKeepAliveIntervalMs());
    c.keep_alive_timeout = std::chrono::milliseconds(cfg.getKeepAliveTimeoutMs());
    c.handshake_timeout = std::chrono::milliseconds(cfg.getHandshakeTimeoutMs());
    c.reconnect_interval = std::chrono::milliseconds(cfg.getReconnectIntervalMs());
    c.connection_cooldown = std::chrono::milliseconds(cfg.getConnectionCooldownMs());
    c.channel_establishment_delay = std::chrono::milliseconds(cfg.getChannelEstablishmentDelayMs());
    c.channel_stabilization_delay = std::chrono::milliseconds(cfg.getChannelStabilizationDelayMs());
    c.handshake_response_delay = std::chrono::milliseconds(cfg.getHandshakeResponseDelayMs());
    c.dtls_retry_delay = std::chrono::milliseconds(cfg.getDtlsRetryDelayMs());
    c.monitor_interval = std::chrono::milliseconds(cfg.getMonitorIntervalMs());

    c.max_connection_attempts = cfg.getMaxConnectionAttempts();
    c.dtls_retry_attempts = cfg.getDtlsRetryAttempts();
    const int queued = cfg.getMaxQueuedMessages();
    c.max_queued_messages = queued > 0 ? static_cast<size_t>(queued) : 0;
    c.queue_policy = queue_policy_from_string(cfg.getOutboundQueuePolicy());

    c.auto_reconnect = cfg.isAutoReconnectEnabled();
    c.auto_connect_discovered = cfg.isAutoConnectEnabled();
    c.keep_alive_reply = cfg.isKeepAliveReplyEnabled();

    c.auto_acknowledge_commands = cfg.isCommandAutoAckEnabled();
    c.default_video_quality = cfg.getDefaultVideoQuality();

    c.accepted_platforms = cfg.getAcceptedPlatforms();
    return c;
}
