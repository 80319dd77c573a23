#pragma once

#include <cstdint>

enum class MessageType : uint8_t {
    CONTROL_JSON         = 0x01,   // UTF-8 JSON control message
    MEDIA_FRAME          = 0x02    // opaque media payload
};
