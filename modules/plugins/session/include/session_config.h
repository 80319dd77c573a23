#ifndef SESSION_CONFIG_H
#define SESSION_CONFIG_H

#include "session.h"

#include <chrono>
#include <string>
#include <vector>

// Tunables of the session layer. Defaults match config.json.
struct SessionConfig {
    std::string platform = "macOS";
    std::string device_name = "MacDesktop";
    // Formatted DeviceIdentifier; generated from platform/device_name when empty.
    std::string device_id;

    std::chrono::milliseconds keep_alive_interval{2000};
    std::chrono::milliseconds keep_alive_timeout{6000};
    std::chrono::milliseconds handshake_timeout{15000};
    std::chrono::milliseconds reconnect_interval{5000};
    std::chrono::milliseconds connection_cooldown{10000};
    std::chrono::milliseconds channel_establishment_delay{2000};
    std::chrono::milliseconds channel_stabilization_delay{1000};
    std::chrono::milliseconds handshake_response_delay{500};
    std::chrono::milliseconds dtls_retry_delay{1000};
    std::chrono::milliseconds monitor_interval{1000};

    int max_connection_attempts = 3;
    int dtls_retry_attempts = 3;
    size_t max_queued_messages = 10;
    QueueOverflowPolicy queue_policy = QueueOverflowPolicy::DROP_OLDEST;

    bool auto_reconnect = true;
    bool auto_connect_discovered = true;
    bool keep_alive_reply = false;

    bool auto_acknowledge_commands = true;
    std::string default_video_quality = "high";

    // Empty accepts every platform.
    std::vector<std::string> accepted_platforms{"iOS"};

    bool acceptsPlatform(const std::string& platform) const;

    static SessionConfig fromConfigManager();
};

#endif // SESSION_CONFIG_H
