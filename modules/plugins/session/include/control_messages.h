#ifndef CONTROL_MESSAGES_H
#define CONTROL_MESSAGES_H

#include <string>
#include <variant>

// ---------------------------------------------------------------------------
// Control protocol carried in CONTROL_JSON frames. Discriminated by "type";
// "command" messages carry a second discriminator in "command".
// ---------------------------------------------------------------------------

struct StartVideoCommand {
    std::string quality;           // empty: sender did not ask for one
};

struct FlashlightCommand {
    bool state = false;
};

struct SetFlashIntensityCommand {
    double intensity = 0.0;
};

struct VideoAckCommand {
    std::string status;
    std::string quality;
};

struct FlashlightAckCommand {
    bool state = false;
};

struct StartPreviewCommand {
    std::string quality;
};

struct StopPreviewCommand {};

using Command = std::variant<StartVideoCommand,
                             FlashlightCommand,
                             SetFlashIntensityCommand,
                             VideoAckCommand,
                             FlashlightAckCommand,
                             StartPreviewCommand,
                             StopPreviewCommand>;

enum class HandshakeKind {
    REQUEST,
    RESPONSE
};

struct HandshakeMessage {
    HandshakeKind kind = HandshakeKind::REQUEST;
    std::string device_id;
    std::string platform;
};

struct KeepAliveMessage {
    double timestamp = 0.0;        // seconds since the Unix epoch
    std::string device_id;
    bool reply = false;            // answers a received keep-alive; never answered itself
};

struct CommandMessage {
    Command command;
};

// "dtls_test": sent by the initiator to check the channel carries data.
struct ChannelProbeMessage {
    std::string from;
};

struct ErrorMessage {
    std::string message;
};

using ControlMessage = std::variant<HandshakeMessage,
                                    KeepAliveMessage,
                                    CommandMessage,
                                    ChannelProbeMessage,
                                    ErrorMessage>;

// Value of the "command" field, e.g. "start_video".
const char* command_name(const Command& command);

// Value of the "type" field, e.g. "handshake_request".
const char* control_message_type(const ControlMessage& message);

// Invalid UTF-8 in string fields is replaced with U+FFFD rather than thrown.
std::string encode_control_message(const ControlMessage& message);

/**
 * @brief Parses one control message.
 *
 * Accepts the nested handshake form {"type":"handshake_request","handshake":{...}}
 * and the legacy flat form {"type":"request"|"response","deviceId":..,"platform":..}.
 * Unknown fields are ignored. Never throws.
 *
 * @return false with a description in `error` for malformed JSON, an unknown
 *         "type", an unknown command, or a missing/mistyped required field.
 */
bool decode_control_message(const std::string& text, ControlMessage& out, std::string& error);

// Seconds since the Unix epoch, as carried in keep_alive.timestamp.
double unix_timestamp_now();

#endif // CONTROL_MESSAGES_H
