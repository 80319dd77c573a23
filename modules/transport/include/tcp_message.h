#pragma once

#include <cstdint>
#include <string>
#include <vector>

// Stream framing for TcpTransport: [length: 4 bytes big-endian][payload].
class TcpMessage {
public:
    static constexpr uint32_t kMaxFrameSize = 16u * 1024u * 1024u;

    static std::string frameMessage(const std::string& payload);

    // Moves every complete frame out of `buffer` into `out`. Returns false
    // when a frame header announces more than kMaxFrameSize; the stream is
    // unusable after that.
    static bool extractMessages(std::string& buffer, std::vector<std::string>& out);

    // Writes as much of `pending` as the non-blocking socket accepts and
    // erases the written prefix. Returns false on a hard socket error.
    static bool flush(int sock, std::string& pending, const std::string& peer_id);
};
