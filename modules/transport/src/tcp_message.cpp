#include "tcp_message.h"
#include "logger.h"

#include <sys/socket.h>
#include <cerrno>
#include <cstring>

std::string TcpMessage::frameMessage(const std::string& payload) {
    const uint32_t len = static_cast<uint32_t>(payload.size());
    std::string framed;
    framed.reserve(4 + payload.size());
    framed.push_back(static_cast<char>((len >> 24) & 0xFF));
    framed.push_back(static_cast<char>((len >> 16) & 0xFF));
    framed.push_back(static_cast<char>((len >> 8) & 0xFF));
    framed.push_back(static_cast<char>(len & 0xFF));
    framed.append(payload);
    return framed;
}

bool TcpMessage::extractMessages(std::string& buffer, std::vector<std::string>& out) {
    size_t offset = 0;
    while (buffer.size() - offset >= 4) {
        const auto* p = reinterpret_cast<const uint8_t*>(buffer.data() + offset);
        const uint32_t len = (static_cast<uint32_t>(p[0]) << 24) |
                             (static_cast<uint32_t>(p[1]) << 16) |
                             (static_cast<uint32_t>(p[2]) << 8) |
                             static_cast<uint32_t>(p[3]);
        if (len > kMaxFrameSize) {
            LOG_WARN("TCP: frame of " + std::to_string(len) + " bytes exceeds limit");
            return false;
        }
        if (buffer.size() - offset < 4ull + len) {
            break;
        }
        out.emplace_back(buffer, offset + 4, len);
        offset += 4ull + len;
    }
    if (offset > 0) {
        buffer.erase(0, offset);
    }
    return true;
}

bool TcpMessage::flush(int sock, std::string& pending, const std::string& peer_id) {
    size_t total_sent = 0;
    while (total_sent < pending.size()) {
#ifdef __APPLE__
        ssize_t n = ::send(sock, pending.data() + total_sent, pending.size() - total_sent, 0);
#else
        ssize_t n = ::send(sock, pending.data() + total_sent, pending.size() - total_sent, MSG_NOSIGNAL);
#endif
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                break;
            }
            LOG_WARN("TCP: send to " + peer_id + " failed: " + std::string(strerror(errno)));
            pending.erase(0, total_sent);
            return false;
        }
        total_sent += static_cast<size_t>(n);
    }
    pending.erase(0, total_sent);
    return true;
}
