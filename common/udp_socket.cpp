// ============================================================
// udp_socket.cpp -- UdpSocket / PeerAddr implementation
// ============================================================

#include "udp_socket.hpp"
#include "protocol.hpp"
#include <stdexcept>
#include <string>

// 8 MB kernel buffers absorb a full blast round
static constexpr int UDP_BUF_SIZE = 8 * 1024 * 1024;

// ============================================================
// PeerAddr
// ============================================================

PeerAddr PeerAddr::from(const std::string& ip, u16 port) {
    PeerAddr a;
    a.sa.sin_family = AF_INET;
    a.sa.sin_port   = htons(port);
    if (inet_pton(AF_INET, ip.c_str(), &a.sa.sin_addr) != 1) {
        throw std::runtime_error("Invalid IP address: " + ip);
    }
    return a;
}

std::string PeerAddr::to_string() const {
    char buf[INET_ADDRSTRLEN] = {0};
    if (!inet_ntop(AF_INET, &sa.sin_addr, buf, sizeof(buf))) return "unknown";
    return std::string(buf) + ":" + std::to_string(port());
}

// ============================================================
// UdpSocket
// ============================================================

UdpSocket::UdpSocket() {
    fd_ = ::socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP);
    if (fd_ == INVALID_SOCKET_VAL) {
        throw std::runtime_error("socket(UDP) failed: " + socket_error_str(last_socket_error()));
    }
    // Sends never block: a full buffer just ends the current blast round.
    if (!set_nonblocking(fd_, true)) {
        CLOSE_SOCKET(fd_);
        fd_ = INVALID_SOCKET_VAL;
        throw std::runtime_error("set_nonblocking(UDP) failed");
    }
}

UdpSocket::~UdpSocket() {
    close();
}

UdpSocket::UdpSocket(UdpSocket&& o) noexcept : fd_(o.fd_) {
    o.fd_ = INVALID_SOCKET_VAL;
}

UdpSocket& UdpSocket::operator=(UdpSocket&& o) noexcept {
    if (this != &o) {
        close();
        fd_ = o.fd_;
        o.fd_ = INVALID_SOCKET_VAL;
    }
    return *this;
}

void UdpSocket::bind(const std::string& ip, u16 port) {
    int on = 1;
#ifdef _WIN32
    setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, (const char*)&on, sizeof(on));
#else
    setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &on, sizeof(on));
#endif
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port   = htons(port);
    if (ip.empty() || ip == "0.0.0.0") {
        addr.sin_addr.s_addr = INADDR_ANY;
    } else if (inet_pton(AF_INET, ip.c_str(), &addr.sin_addr) != 1) {
        throw std::runtime_error("Invalid IP address: " + ip);
    }
    if (::bind(fd_, (sockaddr*)&addr, sizeof(addr)) == SOCKET_ERROR_VAL) {
        throw std::runtime_error("bind(UDP) failed: " + socket_error_str(last_socket_error()));
    }
}

void UdpSocket::tune() {
    int sz = UDP_BUF_SIZE;
#ifdef _WIN32
    setsockopt(fd_, SOL_SOCKET, SO_RCVBUF, (const char*)&sz, sizeof(sz));
    setsockopt(fd_, SOL_SOCKET, SO_SNDBUF, (const char*)&sz, sizeof(sz));
#else
    setsockopt(fd_, SOL_SOCKET, SO_RCVBUF, &sz, sizeof(sz));
    setsockopt(fd_, SOL_SOCKET, SO_SNDBUF, &sz, sizeof(sz));
#endif
}

bool UdpSocket::send_to(const PeerAddr& to, const u8* data, size_t len) {
    for (;;) {
#ifdef _WIN32
        int rc = ::sendto(fd_, (const char*)data, (int)len, 0,
                          (const sockaddr*)&to.sa, sizeof(to.sa));
#else
        ssize_t rc = ::sendto(fd_, data, len, 0,
                              (const sockaddr*)&to.sa, sizeof(to.sa));
#endif
        if (rc >= 0) return true;
        int err = last_socket_error();
        if (interrupted(err)) continue;
        if (would_block(err)) return false;
        // ICMP-induced errors (port unreachable) are just loss at this layer
        return false;
    }
}

bool UdpSocket::recv_from(std::vector<u8>& out, PeerAddr& from, int timeout_ms) {
    if (!platform::wait_readable(fd_, timeout_ms)) return false;

    out.resize(MAX_DATAGRAM_SIZE);
    sockaddr_in src{};
    socklen_type src_len = sizeof(src);
    for (;;) {
#ifdef _WIN32
        int rc = ::recvfrom(fd_, (char*)out.data(), (int)out.size(), 0,
                            (sockaddr*)&src, &src_len);
#else
        ssize_t rc = ::recvfrom(fd_, out.data(), out.size(), 0,
                                (sockaddr*)&src, &src_len);
#endif
        if (rc >= 0) {
            out.resize((size_t)rc);
            from.sa = src;
            return true;
        }
        int err = last_socket_error();
        if (interrupted(err)) continue;
        // would-block after a spurious wakeup, or a stale ICMP error: no datagram
        out.clear();
        return false;
    }
}

u16 UdpSocket::local_port() const {
    sockaddr_in local{};
    socklen_type len = sizeof(local);
    if (getsockname(fd_, (sockaddr*)&local, &len) != 0) {
        throw std::runtime_error("getsockname(UDP) failed: " + socket_error_str(last_socket_error()));
    }
    return ntohs(local.sin_port);
}

void UdpSocket::close() {
    if (fd_ != INVALID_SOCKET_VAL) {
        CLOSE_SOCKET(fd_);
        fd_ = INVALID_SOCKET_VAL;
    }
}
