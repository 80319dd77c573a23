#pragma once

#include "message_types.h"

#include <cstdint>
#include <string>
#include <string_view>

namespace wire {

// Maximum allowed payload size (10 MB)
inline constexpr uint32_t kMaxMessageSize = 10u * 1024u * 1024u;
inline constexpr size_t kHeaderSize = 5;

// [type: 1 byte][length: 4 bytes big-endian][payload: length bytes]
std::string encode_message(MessageType type, std::string_view payload);

// Decodes exactly one wire message. Returns false for an unknown type, a
// payload over kMaxMessageSize, or a length that disagrees with the data.
bool decode_message(std::string_view data, MessageType& type, std::string_view& payload);

bool decode_message(const std::string& data, MessageType& type, std::string& payload);

const char* message_type_to_string(MessageType type);

} // namespace wire
