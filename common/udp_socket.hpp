#pragma once

// ============================================================
// udp_socket.hpp -- RAII UDP socket wrapper and the datagram
//                   channel interface the ARQ engine runs on
// ============================================================

#include "platform.hpp"
#include <string>
#include <vector>

// IPv4 peer address
struct PeerAddr {
    sockaddr_in sa{};

    static PeerAddr from(const std::string& ip, u16 port);

    bool valid() const { return sa.sin_family == AF_INET; }
    u16  port() const  { return ntohs(sa.sin_port); }
    std::string to_string() const;

    bool operator==(const PeerAddr& o) const {
        return sa.sin_addr.s_addr == o.sa.sin_addr.s_addr &&
               sa.sin_port == o.sa.sin_port;
    }
    bool operator!=(const PeerAddr& o) const { return !(*this == o); }
};

// Unreliable datagram endpoint: may drop, duplicate or reorder.
class DatagramChannel {
public:
    virtual ~DatagramChannel() = default;

    // Returns false if the datagram could not be queued (OS buffer full)
    virtual bool send_to(const PeerAddr& to, const u8* data, size_t len) = 0;

    // Wait up to timeout_ms (0 = just poll) for one datagram.
    // Returns false on timeout.
    virtual bool recv_from(std::vector<u8>& out, PeerAddr& from, int timeout_ms) = 0;
};

class UdpSocket : public DatagramChannel {
public:
    UdpSocket();
    ~UdpSocket() override;

    UdpSocket(const UdpSocket&) = delete;
    UdpSocket& operator=(const UdpSocket&) = delete;

    UdpSocket(UdpSocket&& o) noexcept;
    UdpSocket& operator=(UdpSocket&& o) noexcept;

    // Bind to ip:port (port 0 = ephemeral)
    void bind(const std::string& ip, u16 port);

    // Grow SO_RCVBUF/SO_SNDBUF so bursts are not dropped by the kernel.
    // Best effort: falls back to OS defaults when not permitted.
    void tune();

    bool send_to(const PeerAddr& to, const u8* data, size_t len) override;
    bool recv_from(std::vector<u8>& out, PeerAddr& from, int timeout_ms) override;

    bool is_valid() const { return fd_ != INVALID_SOCKET_VAL; }
    socket_t native() const { return fd_; }
    u16 local_port() const;

    void close();

private:
    socket_t fd_{INVALID_SOCKET_VAL};
};
