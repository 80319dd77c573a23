#include "wire_codec.h"

namespace {
    inline bool is_valid_message_type(uint8_t raw) {
        switch (static_cast<MessageType>(raw)) {
            case MessageType::CONTROL_JSON:
            case MessageType::MEDIA_FRAME:
                return true;
        }
        return false;
    }
}

namespace wire {

std::string encode_message(MessageType type, std::string_view payload) {
    const uint32_t length = static_cast<uint32_t>(payload.size());

    std::string encoded;
    encoded.reserve(kHeaderSize + length);

    encoded.push_back(static_cast<char>(type));

    // length big-endian
    encoded.push_back(static_cast<char>((length >> 24) & 0xFF));
    encoded.push_back(static_cast<char>((length >> 16) & 0xFF));
    encoded.push_back(static_cast<char>((length >> 8) & 0xFF));
    encoded.push_back(static_cast<char>(length & 0xFF));

    encoded.append(payload.data(), payload.size());
    return encoded;
}

bool decode_message(std::string_view data, MessageType& type, std::string_view& payload) {
    if (data.size() < kHeaderSize) {
        return false;
    }

    const uint8_t raw_type = static_cast<uint8_t>(data[0]);
    if (!is_valid_message_type(raw_type)) {
        return false;
    }

    const uint32_t length = (static_cast<uint32_t>(static_cast<uint8_t>(data[1])) << 24) |
                            (static_cast<uint32_t>(static_cast<uint8_t>(data[2])) << 16) |
                            (static_cast<uint32_t>(static_cast<uint8_t>(data[3])) << 8) |
                            static_cast<uint32_t>(static_cast<uint8_t>(data[4]));

    if (length > kMaxMessageSize) {
        return false;
    }

    // One transport message carries exactly one frame.
    if (data.size() != kHeaderSize + length) {
        return false;
    }

    type = static_cast<MessageType>(raw_type);
    payload = data.substr(kHeaderSize, length);
    return true;
}

bool decode_message(const std::string& data, MessageType& type, std::string& payload) {
    std::string_view view_payload;
    if (!decode_message(std::string_view{data}, type, view_payload)) {
        return false;
    }
    payload.assign(view_payload.data(), view_payload.size());
    return true;
}

const char* message_type_to_string(MessageType type) {
    switch (type) {
        case MessageType::CONTROL_JSON: return "CONTROL_JSON";
        case MessageType::MEDIA_FRAME: return "MEDIA_FRAME";
    }
    return "UNKNOWN";
}

} // namespace wire
