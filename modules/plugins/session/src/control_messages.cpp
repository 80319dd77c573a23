#include "control_messages.h"

#include <nlohmann/json.hpp>

#include <chrono>

using json = nlohmann::json;

namespace {
    // Field readers: false when the field is missing or has the wrong type.
    bool read_string(const json& obj, const char* key, std::string& out) {
        auto it = obj.find(key);
        if (it == obj.end() || !it->is_string()) {
            return false;
        }
        out = it->get<std::string>();
        return true;
    }

    bool read_bool(const json& obj, const char* key, bool& out) {
        auto it = obj.find(key);
        if (it == obj.end() || !it->is_boolean()) {
            return false;
        }
        out = it->get<bool>();
        return true;
    }

    bool read_number(const json& obj, const char* key, double& out) {
        auto it = obj.find(key);
        if (it == obj.end() || !it->is_number()) {
            return false;
        }
        out = it->get<double>();
        return true;
    }

    // Optional fields: absent is fine, present with the wrong type is not.
    bool read_optional_string(const json& obj, const char* key, std::string& out) {
        auto it = obj.find(key);
        if (it == obj.end() || it->is_null()) {
            return true;
        }
        return read_string(obj, key, out);
    }

    bool read_optional_bool(const json& obj, const char* key, bool& out) {
        auto it = obj.find(key);
        if (it == obj.end() || it->is_null()) {
            return true;
        }
        return read_bool(obj, key, out);
    }

    bool read_optional_number(const json& obj, const char* key, double& out) {
        auto it = obj.find(key);
        if (it == obj.end() || it->is_null()) {
            return true;
        }
        return read_number(obj, key, out);
    }

    json encode_command(const Command& command) {
        json j;
        j["type"] = "command";
        j["command"] = command_name(command);

        if (const auto* c = std::get_if<StartVideoCommand>(&command)) {
            if (!c->quality.empty()) j["quality"] = c->quality;
        } else if (const auto* c = std::get_if<FlashlightCommand>(&command)) {
            j["state"] = c->state;
        } else if (const auto* c = std::get_if<SetFlashIntensityCommand>(&command)) {
            j["intensity"] = c->intensity;
        } else if (const auto* c = std::get_if<VideoAckCommand>(&command)) {
            j["status"] = c->status;
            j["quality"] = c->quality;
        } else if (const auto* c = std::get_if<FlashlightAckCommand>(&command)) {
            j["state"] = c->state;
        } else if (const auto* c = std::get_if<StartPreviewCommand>(&command)) {
            if (!c->quality.empty()) j["quality"] = c->quality;
        }
        return j;
    }

    bool decode_command(const json& j, Command& out, std::string& error) {
        std::string name;
        if (!read_string(j, "command", name)) {
            error = "command message without a \"command\" string";
            return false;
        }

        if (name == "start_video") {
            StartVideoCommand c;
            if (!read_optional_string(j, "quality", c.quality)) {
                error = "start_video: \"quality\" must be a string";
                return false;
            }
            out = c;
        } else if (name == "flashlight") {
            FlashlightCommand c;
            if (!read_bool(j, "state", c.state)) {
                error = "flashlight: missing boolean \"state\"";
                return false;
            }
            out = c;
        } else if (name == "set_flash_intensity") {
            SetFlashIntensityCommand c;
            if (!read_number(j, "intensity", c.intensity)) {
                error = "set_flash_intensity: missing numeric \"intensity\"";
                return false;
            }
            out = c;
        } else if (name == "video_ack") {
            VideoAckCommand c;
            if (!read_string(j, "status", c.status) || !read_optional_string(j, "quality", c.quality)) {
                error = "video_ack: missing \"status\" or malformed \"quality\"";
                return false;
            }
            out = c;
        } else if (name == "flashlight_ack") {
            FlashlightAckCommand c;
            if (!read_bool(j, "state", c.state)) {
                error = "flashlight_ack: missing boolean \"state\"";
                return false;
            }
            out = c;
        } else if (name == "start_preview") {
            StartPreviewCommand c;
            if (!read_optional_string(j, "quality", c.quality)) {
                error = "start_preview: \"quality\" must be a string";
                return false;
            }
            out = c;
        } else if (name == "stop_preview") {
            out = StopPreviewCommand{};
        } else {
            error = "unknown command \"" + name + "\"";
            return false;
        }
        return true;
    }

    bool decode_handshake(const json& fields, HandshakeKind kind, HandshakeMessage& out, std::string& error) {
        out.kind = kind;
        if (!read_string(fields, "deviceId", out.device_id) || !read_string(fields, "platform", out.platform)) {
            error = "handshake without \"deviceId\" and \"platform\" strings";
            return false;
        }
        return true;
    }
}

const char* command_name(const Command& command) {
    if (std::holds_alternative<StartVideoCommand>(command)) return "start_video";
    if (std::holds_alternative<FlashlightCommand>(command)) return "flashlight";
    if (std::holds_alternative<SetFlashIntensityCommand>(command)) return "set_flash_intensity";
    if (std::holds_alternative<VideoAckCommand>(command)) return "video_ack";
    if (std::holds_alternative<FlashlightAckCommand>(command)) return "flashlight_ack";
    if (std::holds_alternative<StartPreviewCommand>(command)) return "start_preview";
    return "stop_preview";
}

const char* control_message_type(const ControlMessage& message) {
    if (const auto* h = std::get_if<HandshakeMessage>(&message)) {
        return h->kind == HandshakeKind::REQUEST ? "handshake_request" : "handshake_response";
    }
    if (std::holds_alternative<KeepAliveMessage>(message)) return "keep_alive";
    if (std::holds_alternative<CommandMessage>(message)) return "command";
    if (std::holds_alternative<ChannelProbeMessage>(message)) return "dtls_test";
    return "error";
}

std::string encode_control_message(const ControlMessage& message) {
    json j;
    if (const auto* h = std::get_if<HandshakeMessage>(&message)) {
        j["type"] = control_message_type(message);
        j["handshake"] = {{"deviceId", h->device_id}, {"platform", h->platform}};
    } else if (const auto* k = std::get_if<KeepAliveMessage>(&message)) {
        j["type"] = "keep_alive";
        j["timestamp"] = k->timestamp;
        j["deviceId"] = k->device_id;
        if (k->reply) j["reply"] = true;
    } else if (const auto* c = std::get_if<CommandMessage>(&message)) {
        j = encode_command(c->command);
    } else if (const auto* p = std::get_if<ChannelProbeMessage>(&message)) {
        j["type"] = "dtls_test";
        j["from"] = p->from;
    } else if (const auto* e = std::get_if<ErrorMessage>(&message)) {
        j["type"] = "error";
        j["message"] = e->message;
    }
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

bool decode_control_message(const std::string& text, ControlMessage& out, std::string& error) {
    const json j = json::parse(text, nullptr, false);
    if (j.is_discarded()) {
        error = "malformed JSON";
        return false;
    }
    if (!j.is_object()) {
        error = "control message is not a JSON object";
        return false;
    }

    std::string type;
    if (!read_string(j, "type", type)) {
        error = "missing \"type\" discriminator";
        return false;
    }

    if (type == "handshake_request" || type == "handshake_response") {
        const HandshakeKind kind = type == "handshake_request" ? HandshakeKind::REQUEST : HandshakeKind::RESPONSE;
        auto it = j.find("handshake");
        if (it == j.end() || !it->is_object()) {
            error = type + " without a \"handshake\" object";
            return false;
        }
        HandshakeMessage h;
        if (!decode_handshake(*it, kind, h, error)) {
            return false;
        }
        out = h;
        return true;
    }

    // Older peers send the handshake fields at the top level.
    if (type == "request" || type == "response") {
        HandshakeMessage h;
        if (!decode_handshake(j, type == "request" ? HandshakeKind::REQUEST : HandshakeKind::RESPONSE, h, error)) {
            return false;
        }
        out = h;
        return true;
    }

    if (type == "keep_alive") {
        KeepAliveMessage k;
        if (!read_optional_number(j, "timestamp", k.timestamp) || !read_optional_string(j, "deviceId", k.device_id) ||
            !read_optional_bool(j, "reply", k.reply)) {
            error = "keep_alive with malformed \"timestamp\", \"deviceId\" or \"reply\"";
            return false;
        }
        out = k;
        return true;
    }

    if (type == "command") {
        CommandMessage c;
        if (!decode_command(j, c.command, error)) {
            return false;
        }
        out = c;
        return true;
    }

    if (type == "dtls_test") {
        ChannelProbeMessage p;
        if (!read_optional_string(j, "from", p.from)) {
            error = "dtls_test: \"from\" must be a string";
            return false;
        }
        out = p;
        return true;
    }

    if (type == "error") {
        ErrorMessage e;
        if (!read_string(j, "message", e.message)) {
            error = "error message without a \"message\" string";
            return false;
        }
        out = e;
        return true;
    }

    error = "unknown message type \"" + type + "\"";
    return false;
}

double unix_timestamp_now() {
    const auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration<double>(since_epoch).count();
}
