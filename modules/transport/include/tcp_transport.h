#ifndef TCP_TRANSPORT_H
#define TCP_TRANSPORT_H

#include "itransport.h"

#include <memory>
#include <string>

struct TcpTransportOptions {
    // > 0: listen on that port, 0: listen on an ephemeral port, < 0: outbound only.
    int listen_port = 0;
    bool nodelay = true;
    int read_buffer_size = 65536;
    int connect_timeout_ms = 5000;
    // A peer whose unsent bytes exceed this is treated as failed by send().
    size_t max_pending_bytes = 32u * 1024u * 1024u;
};

/**
 * @brief ITransport over TCP sockets.
 *
 * One I/O thread multiplexes the listening socket and every link with
 * select(). Peers are keyed "ip:port". Outbound links use the target string
 * as given to connect(); inbound links use the remote address. The platform
 * passed to the invitation callback is empty (it is learned in the handshake).
 */
class TcpTransport : public ITransport {
public:
    explicit TcpTransport(TcpTransportOptions options);
    ~TcpTransport() override;

    bool start() override;
    void stop() override;
    bool connect(const std::string& target) override;
    bool send(const std::string& peer_id, const std::string& bytes) override;
    void disconnect(const std::string& peer_id) override;
    bool isConnected(const std::string& peer_id) const override;

    void setReceiveCallback(ReceiveCallback cb) override;
    void setPeerStateCallback(PeerStateCallback cb) override;
    void setInvitationCallback(InvitationCallback cb) override;

    // Bound port once started (useful with listen_port == 0), -1 otherwise.
    int listeningPort() const;

    // Splits "host:port". Returns false for a missing host or invalid port.
    static bool parseAddress(const std::string& target, std::string& host, int& port);

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

#endif // TCP_TRANSPORT_H
