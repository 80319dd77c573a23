#include "tcp_transport.h"
#include "tcp_message.h"
#include "logger.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cerrno>
#include <cstring>
#include <map>
#include <mutex>
#include <thread>
#include <vector>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <unistd.h>

namespace {

constexpr int kDefaultListenBacklog = 16;
constexpr int kSelectTimeoutMs = 100;

void set_non_blocking(int sock) {
    int flags = fcntl(sock, F_GETFL, 0);
    if (flags >= 0) {
        fcntl(sock, F_SETFL, flags | O_NONBLOCK);
    }
}

void configure_socket(int sock, bool nodelay) {
#ifdef __APPLE__
    int nosigpipe = 1;
    setsockopt(sock, SOL_SOCKET, SO_NOSIGPIPE, &nosigpipe, sizeof(nosigpipe));
#endif
    int flag = nodelay ? 1 : 0;
    if (setsockopt(sock, IPPROTO_TCP, TCP_NODELAY, &flag, sizeof(flag)) < 0) {
        LOG_WARN("TCP: failed to set TCP_NODELAY: " + std::string(strerror(errno)));
    }
    set_non_blocking(sock);
}

bool resolve_ipv4(const std::string& host, in_addr& out) {
    if (inet_pton(AF_INET, host.c_str(), &out) == 1) {
        return true;
    }
    addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo* res = nullptr;
    int rc = getaddrinfo(host.c_str(), nullptr, &hints, &res);
    if (rc != 0 || res == nullptr) {
        LOG_WARN("TCP: cannot resolve " + host + ": " + std::string(gai_strerror(rc)));
        return false;
    }
    out = reinterpret_cast<sockaddr_in*>(res->ai_addr)->sin_addr;
    freeaddrinfo(res);
    return true;
}

} // namespace

class TcpTransport::Impl {
public:
    explicit Impl(TcpTransportOptions options) : m_options(options) {}
    ~Impl() { stop(); }

    bool start() {
        std::lock_guard<std::mutex> lifecycle(m_lifecycle_mutex);
        if (m_running) {
            return true;
        }

        if (pipe(m_wake) != 0) {
            LOG_ERROR("TCP: failed to create wake pipe: " + std::string(strerror(errno)));
            return false;
        }
        set_non_blocking(m_wake[0]);
        set_non_blocking(m_wake[1]);

        if (m_options.listen_port >= 0 && !openListener()) {
            closeWakePipe();
            return false;
        }

        m_running = true;
        m_io_thread = std::thread(&Impl::ioLoop, this);
        LOG_INFO("TCP: transport started" +
                 (m_bound_port.load() > 0 ? " on port " + std::to_string(m_bound_port.load()) : std::string(" (outbound only)")));
        return true;
    }

    void stop() {
        std::lock_guard<std::mutex> lifecycle(m_lifecycle_mutex);
        if (!m_running) {
            return;
        }
        m_running = false;
        wake();
        if (m_io_thread.joinable()) {
            m_io_thread.join();
        }

        std::lock_guard<std::mutex> lock(m_mutex);
        for (auto& kv : m_links) {
            ::shutdown(kv.second.sock, SHUT_RDWR);
            ::close(kv.second.sock);
        }
        m_links.clear();
        closeDetachedLocked();
        m_posted.clear();
        if (m_server_sock >= 0) {
            ::close(m_server_sock);
            m_server_sock = -1;
        }
        m_bound_port = -1;
        closeWakePipe();
        LOG_INFO("TCP: transport stopped");
    }

    bool connect(const std::string& target) {
        if (!m_running) {
            LOG_WARN("TCP: connect while stopped");
            return false;
        }
        std::string host;
        int port = 0;
        if (!TcpTransport::parseAddress(target, host, port)) {
            LOG_WARN("TCP: invalid target address '" + target + "'");
            return false;
        }

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto it = m_links.find(target);
            if (it != m_links.end()) {
                if (it->second.open) {
                    m_posted.push_back(Event{Event::STATE, target, TransportPeerState::CONNECTED, {}});
                }
                wake();
                return true;
            }
        }

        sockaddr_in dest{};
        dest.sin_family = AF_INET;
        dest.sin_port = htons(static_cast<uint16_t>(port));
        if (!resolve_ipv4(host, dest.sin_addr)) {
            return false;
        }

        int sock = ::socket(AF_INET, SOCK_STREAM, 0);
        if (sock < 0) {
            LOG_ERROR("TCP: failed to create client socket: " + std::string(strerror(errno)));
            return false;
        }
        configure_socket(sock, m_options.nodelay);

        int rc = ::connect(sock, reinterpret_cast<sockaddr*>(&dest), sizeof(dest));
        if (rc < 0 && errno != EINPROGRESS) {
            LOG_WARN("TCP: connect to " + target + " failed: " + std::string(strerror(errno)));
            ::close(sock);
            return false;
        }

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            Link link;
            link.sock = sock;
            link.open = (rc == 0);
            link.started = std::chrono::steady_clock::now();
            m_links[target] = std::move(link);
            m_posted.push_back(Event{Event::STATE, target,
                                     rc == 0 ? TransportPeerState::CONNECTED : TransportPeerState::CONNECTING, {}});
        }
        wake();
        LOG_INFO("TCP: connecting to " + target);
        return true;
    }

    bool send(const std::string& peer_id, const std::string& bytes) {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_links.find(peer_id);
        if (it == m_links.end() || !it->second.open || it->second.broken) {
            return false;
        }
        Link& link = it->second;
        if (link.tx.size() + bytes.size() + 4 > m_options.max_pending_bytes) {
            LOG_WARN("TCP: send buffer for " + peer_id + " is full");
            return false;
        }
        const bool was_idle = link.tx.empty();
        link.tx += TcpMessage::frameMessage(bytes);
        if (was_idle && !TcpMessage::flush(link.sock, link.tx, peer_id)) {
            link.broken = true;
            wake();
            return false;
        }
        if (!link.tx.empty()) {
            wake();
        }
        return true;
    }

    void disconnect(const std::string& peer_id) {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_links.find(peer_id);
        if (it == m_links.end()) {
            return;
        }
        // The I/O thread may be inside select() on this descriptor; it closes
        // the socket itself once select() has returned.
        ::shutdown(it->second.sock, SHUT_RDWR);
        m_closing.push_back(it->second.sock);
        m_links.erase(it);
        wake();
        LOG_INFO("TCP: closed link to " + peer_id);
    }

    bool isConnected(const std::string& peer_id) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_links.find(peer_id);
        return it != m_links.end() && it->second.open && !it->second.broken;
    }

    int listeningPort() const {
        return m_bound_port;
    }

    void setReceiveCallback(ReceiveCallback cb) {
        std::lock_guard<std::mutex> lock(m_cb_mutex);
        m_on_receive = std::move(cb);
    }

    void setPeerStateCallback(PeerStateCallback cb) {
        std::lock_guard<std::mutex> lock(m_cb_mutex);
        m_on_state = std::move(cb);
    }

    void setInvitationCallback(InvitationCallback cb) {
        std::lock_guard<std::mutex> lock(m_cb_mutex);
        m_on_invitation = std::move(cb);
    }

private:
    struct Link {
        int sock = -1;
        bool open = false;
        bool broken = false;
        std::string rx;
        std::string tx;
        std::chrono::steady_clock::time_point started;
    };

    struct Event {
        enum Kind { STATE, DATA } kind;
        std::string peer_id;
        TransportPeerState state;
        std::string data;
    };

    bool openListener() {
        m_server_sock = ::socket(AF_INET, SOCK_STREAM, 0);
        if (m_server_sock < 0) {
            LOG_ERROR("TCP: failed to create server socket: " + std::string(strerror(errno)));
            return false;
        }
        int opt = 1;
        if (setsockopt(m_server_sock, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) != 0) {
            LOG_ERROR("TCP: setsockopt(SO_REUSEADDR) failed: " + std::string(strerror(errno)));
            ::close(m_server_sock);
            m_server_sock = -1;
            return false;
        }

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = INADDR_ANY;
        addr.sin_port = htons(static_cast<uint16_t>(m_options.listen_port));
        if (::bind(m_server_sock, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
            LOG_ERROR("TCP: failed to bind port " + std::to_string(m_options.listen_port) + ": " +
                      std::string(strerror(errno)));
            ::close(m_server_sock);
            m_server_sock = -1;
            return false;
        }
        if (::listen(m_server_sock, kDefaultListenBacklog) < 0) {
            LOG_ERROR("TCP: listen failed: " + std::string(strerror(errno)));
            ::close(m_server_sock);
            m_server_sock = -1;
            return false;
        }
        set_non_blocking(m_server_sock);

        socklen_t len = sizeof(addr);
        if (::getsockname(m_server_sock, reinterpret_cast<sockaddr*>(&addr), &len) == 0) {
            m_bound_port = ntohs(addr.sin_port);
        }
        return true;
    }

    void closeWakePipe() {
        for (int& fd : m_wake) {
            if (fd >= 0) {
                ::close(fd);
                fd = -1;
            }
        }
    }

    void wake() {
        if (m_wake[1] >= 0) {
            char b = 1;
            ssize_t rc = ::write(m_wake[1], &b, 1);
            (void)rc;  // a full pipe already guarantees a wakeup
        }
    }

    void closeDetachedLocked() {
        for (int sock : m_closing) {
            ::close(sock);
        }
        m_closing.clear();
    }

    void closeLinkLocked(std::map<std::string, Link>::iterator it, std::vector<Event>& events, const std::string& why) {
        LOG_INFO("TCP: link to " + it->first + " closed (" + why + ")");
        ::close(it->second.sock);
        events.push_back(Event{Event::STATE, it->first, TransportPeerState::DISCONNECTED, {}});
        m_links.erase(it);
    }

    void ioLoop() {
        std::vector<char> buf(static_cast<size_t>(m_options.read_buffer_size > 0 ? m_options.read_buffer_size : 65536));

        while (m_running) {
            fd_set read_fds;
            fd_set write_fds;
            FD_ZERO(&read_fds);
            FD_ZERO(&write_fds);
            int max_fd = m_wake[0];
            FD_SET(m_wake[0], &read_fds);
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                if (m_server_sock >= 0) {
                    FD_SET(m_server_sock, &read_fds);
                    max_fd = std::max(max_fd, m_server_sock);
                }
                for (const auto& kv : m_links) {
                    const Link& link = kv.second;
                    if (!link.open || !link.tx.empty()) {
                        FD_SET(link.sock, &write_fds);
                    }
                    if (link.open) {
                        FD_SET(link.sock, &read_fds);
                    }
                    max_fd = std::max(max_fd, link.sock);
                }
            }

            timeval timeout{0, kSelectTimeoutMs * 1000};
            int ready = ::select(max_fd + 1, &read_fds, &write_fds, nullptr, &timeout);
            if (ready < 0) {
                if (errno != EINTR && errno != EBADF) {
                    LOG_WARN("TCP: select failed: " + std::string(strerror(errno)));
                }
                FD_ZERO(&read_fds);
                FD_ZERO(&write_fds);
            }
            if (!m_running) {
                break;
            }

            std::vector<Event> events;
            std::vector<std::pair<int, std::string>> accepted;
            const auto now = std::chrono::steady_clock::now();
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                events.swap(m_posted);
                closeDetachedLocked();

                if (FD_ISSET(m_wake[0], &read_fds)) {
                    char drain[64];
                    while (::read(m_wake[0], drain, sizeof(drain)) > 0) {
                    }
                }

                if (m_server_sock >= 0 && FD_ISSET(m_server_sock, &read_fds)) {
                    acceptPending(accepted);
                }

                for (auto it = m_links.begin(); it != m_links.end();) {
                    auto current = it++;
                    Link& link = current->second;

                    if (link.broken) {
                        closeLinkLocked(current, events, "send error");
                        continue;
                    }

                    if (!link.open) {
                        if (FD_ISSET(link.sock, &write_fds)) {
                            int err = 0;
                            socklen_t len = sizeof(err);
                            if (getsockopt(link.sock, SOL_SOCKET, SO_ERROR, &err, &len) < 0 || err != 0) {
                                closeLinkLocked(current, events, err ? strerror(err) : "connect failed");
                                continue;
                            }
                            link.open = true;
                            events.push_back(Event{Event::STATE, current->first, TransportPeerState::CONNECTED, {}});
                            LOG_INFO("TCP: connected to " + current->first);
                        } else if (now - link.started > std::chrono::milliseconds(m_options.connect_timeout_ms)) {
                            closeLinkLocked(current, events, "connect timeout");
                        }
                        continue;
                    }

                    if (FD_ISSET(link.sock, &read_fds) && !readLink(current, buf, events)) {
                        continue;
                    }

                    if (!link.tx.empty() && FD_ISSET(link.sock, &write_fds)) {
                        if (!TcpMessage::flush(link.sock, link.tx, current->first)) {
                            closeLinkLocked(current, events, "send error");
                            continue;
                        }
                    }
                }
            }

            for (auto& item : accepted) {
                admit(item.first, item.second, events);
            }
            dispatch(events);
        }
    }

    // Returns false if the link was closed.
    bool readLink(std::map<std::string, Link>::iterator it, std::vector<char>& buf, std::vector<Event>& events) {
        Link& link = it->second;
        for (;;) {
            ssize_t n = ::recv(link.sock, buf.data(), buf.size(), 0);
            if (n > 0) {
                link.rx.append(buf.data(), static_cast<size_t>(n));
                continue;
            }
            if (n == 0) {
                flushFrames(it, events);
                closeLinkLocked(it, events, "peer closed");
                return false;
            }
            if (errno == EINTR) {
                continue;
            }
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                break;
            }
            closeLinkLocked(it, events, strerror(errno));
            return false;
        }
        if (!flushFrames(it, events)) {
            closeLinkLocked(it, events, "oversized frame");
            return false;
        }
        return true;
    }

    bool flushFrames(std::map<std::string, Link>::iterator it, std::vector<Event>& events) {
        std::vector<std::string> frames;
        bool ok = TcpMessage::extractMessages(it->second.rx, frames);
        for (auto& frame : frames) {
            events.push_back(Event{Event::DATA, it->first, TransportPeerState::CONNECTED, std::move(frame)});
        }
        return ok;
    }

    void acceptPending(std::vector<std::pair<int, std::string>>& accepted) {
        for (;;) {
            sockaddr_in client_addr{};
            socklen_t client_len = sizeof(client_addr);
            int client = ::accept(m_server_sock, reinterpret_cast<sockaddr*>(&client_addr), &client_len);
            if (client < 0) {
                if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
                    LOG_WARN("TCP: accept failed: " + std::string(strerror(errno)));
                }
                return;
            }
            configure_socket(client, m_options.nodelay);
            char ip[INET_ADDRSTRLEN];
            inet_ntop(AF_INET, &client_addr.sin_addr, ip, sizeof(ip));
            accepted.emplace_back(client, std::string(ip) + ":" + std::to_string(ntohs(client_addr.sin_port)));
        }
    }

    void admit(int sock, const std::string& peer_id, std::vector<Event>& events) {
        InvitationCallback invitation;
        {
            std::lock_guard<std::mutex> lock(m_cb_mutex);
            invitation = m_on_invitation;
        }
        if (invitation && !invitation(peer_id, "")) {
            LOG_INFO("TCP: rejected inbound link from " + peer_id);
            ::close(sock);
            return;
        }

        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_links.count(peer_id) != 0) {
            LOG_WARN("TCP: duplicate inbound id " + peer_id + ", dropping");
            ::close(sock);
            return;
        }
        Link link;
        link.sock = sock;
        link.open = true;
        link.started = std::chrono::steady_clock::now();
        m_links[peer_id] = std::move(link);
        events.push_back(Event{Event::STATE, peer_id, TransportPeerState::CONNECTED, {}});
        LOG_INFO("TCP: accepted link from " + peer_id);
    }

    void dispatch(std::vector<Event>& events) {
        if (events.empty()) {
            return;
        }
        ReceiveCallback on_receive;
        PeerStateCallback on_state;
        {
            std::lock_guard<std::mutex> lock(m_cb_mutex);
            on_receive = m_on_receive;
            on_state = m_on_state;
        }
        for (auto& ev : events) {
            if (ev.kind == Event::STATE) {
                if (on_state) on_state(ev.peer_id, ev.state);
            } else if (on_receive) {
                on_receive(ev.peer_id, ev.data);
            }
        }
    }

    TcpTransportOptions m_options;
    std::atomic<bool> m_running{false};
    std::mutex m_lifecycle_mutex;
    mutable std::mutex m_mutex;
    std::map<std::string, Link> m_links;
    std::vector<Event> m_posted;
    std::vector<int> m_closing;  // detached by disconnect(), closed by the I/O thread
    int m_server_sock = -1;
    std::atomic<int> m_bound_port{-1};
    int m_wake[2] = {-1, -1};
    std::thread m_io_thread;

    std::mutex m_cb_mutex;
    ReceiveCallback m_on_receive;
    PeerStateCallback m_on_state;
    InvitationCallback m_on_invitation;
};

TcpTransport::TcpTransport(TcpTransportOptions options) : m_impl(std::make_unique<Impl>(options)) {}
TcpTransport::~TcpTransport() = default;

bool TcpTransport::start() { return m_impl->start(); }
void TcpTransport::stop() { m_impl->stop(); }
bool TcpTransport::connect(const std::string& target) { return m_impl->connect(target); }
bool TcpTransport::send(const std::string& peer_id, const std::string& bytes) { return m_impl->send(peer_id, bytes); }
void TcpTransport::disconnect(const std::string& peer_id) { m_impl->disconnect(peer_id); }
bool TcpTransport::isConnected(const std::string& peer_id) const { return m_impl->isConnected(peer_id); }
void TcpTransport::setReceiveCallback(ReceiveCallback cb) { m_impl->setReceiveCallback(std::move(cb)); }
void TcpTransport::setPeerStateCallback(PeerStateCallback cb) { m_impl->setPeerStateCallback(std::move(cb)); }
void TcpTransport::setInvitationCallback(InvitationCallback cb) { m_impl->setInvitationCallback(std::move(cb)); }
int TcpTransport::listeningPort() const { return m_impl->listeningPort(); }

bool TcpTransport::parseAddress(const std::string& target, std::string& host, int& port) {
    auto pos = target.rfind(':');
    if (pos == std::string::npos || pos == 0 || pos + 1 >= target.size()) {
        return false;
    }
    host = target.substr(0, pos);
    const std::string port_str = target.substr(pos + 1);
    for (char c : port_str) {
        if (c < '0' || c > '9') {
            return false;
        }
    }
    if (port_str.size() > 5) {
        return false;
    }
    port = std::stoi(port_str);
    return port > 0 && port <= 65535;
}
