// ============================================================
// socket.cpp -- TcpSocket implementation
// ============================================================

#include "socket.hpp"
#include "errors.hpp"
#include <cstring>
#include <stdexcept>
#include <string>
#include <algorithm>
#include <climits>

// Buffer size for SO_SNDBUF / SO_RCVBUF = 4 MB
static constexpr int SOCKET_BUF_SIZE = 4 * 1024 * 1024;

// Keepalive: idle 10 s, probe every 1 s, give up after 5 probes
static constexpr int KEEPALIVE_IDLE_S  = 10;
static constexpr int KEEPALIVE_INTVL_S = 1;
static constexpr int KEEPALIVE_CNT     = 5;

TcpSocket::TcpSocket() {
    fd_ = ::socket(AF_INET, SOCK_STREAM, IPPROTO_TCP);
    if (fd_ == INVALID_SOCKET_VAL) {
        throw std::runtime_error("socket() failed: " + socket_error_str(last_socket_error()));
    }
    apply_socket_opts();
}

TcpSocket::TcpSocket(socket_t fd) : fd_(fd) {
    if (fd_ != INVALID_SOCKET_VAL) {
        apply_socket_opts();
    }
}

TcpSocket::~TcpSocket() {
    close();
}

TcpSocket::TcpSocket(TcpSocket&& o) noexcept : fd_(o.fd_) {
    o.fd_ = INVALID_SOCKET_VAL;
}

TcpSocket& TcpSocket::operator=(TcpSocket&& o) noexcept {
    if (this != &o) {
        close();
        fd_ = o.fd_;
        o.fd_ = INVALID_SOCKET_VAL;
    }
    return *this;
}

void TcpSocket::apply_socket_opts() {
    // SO_REUSEADDR
    int on = 1;
#ifdef _WIN32
    setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, (const char*)&on, sizeof(on));
#else
    setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &on, sizeof(on));
#endif
}

void TcpSocket::tune() {
    int nodelay = 1;
    int keepalive = 1;
    int sndbuf = SOCKET_BUF_SIZE;
    int rcvbuf = SOCKET_BUF_SIZE;

#ifdef _WIN32
    setsockopt(fd_, IPPROTO_TCP, TCP_NODELAY,  (const char*)&nodelay,   sizeof(nodelay));
    setsockopt(fd_, SOL_SOCKET,  SO_KEEPALIVE, (const char*)&keepalive, sizeof(keepalive));
    setsockopt(fd_, SOL_SOCKET,  SO_SNDBUF,    (const char*)&sndbuf,    sizeof(sndbuf));
    setsockopt(fd_, SOL_SOCKET,  SO_RCVBUF,    (const char*)&rcvbuf,    sizeof(rcvbuf));
    tcp_keepalive ka{};
    ka.onoff             = 1;
    ka.keepalivetime     = KEEPALIVE_IDLE_S * 1000;
    ka.keepaliveinterval = KEEPALIVE_INTVL_S * 1000;
    DWORD ret = 0;
    WSAIoctl(fd_, SIO_KEEPALIVE_VALS, &ka, sizeof(ka), nullptr, 0, &ret, nullptr, nullptr);
#else
    setsockopt(fd_, IPPROTO_TCP, TCP_NODELAY,  &nodelay,   sizeof(nodelay));
    setsockopt(fd_, SOL_SOCKET,  SO_KEEPALIVE, &keepalive, sizeof(keepalive));
    setsockopt(fd_, SOL_SOCKET,  SO_SNDBUF,    &sndbuf,    sizeof(sndbuf));
    setsockopt(fd_, SOL_SOCKET,  SO_RCVBUF,    &rcvbuf,    sizeof(rcvbuf));
#  ifdef TCP_KEEPIDLE
    int idle = KEEPALIVE_IDLE_S, intvl = KEEPALIVE_INTVL_S, cnt = KEEPALIVE_CNT;
    setsockopt(fd_, IPPROTO_TCP, TCP_KEEPIDLE,  &idle,  sizeof(idle));
    setsockopt(fd_, IPPROTO_TCP, TCP_KEEPINTVL, &intvl, sizeof(intvl));
    setsockopt(fd_, IPPROTO_TCP, TCP_KEEPCNT,   &cnt,   sizeof(cnt));
#  endif
#endif
}

void TcpSocket::set_nonblocking(bool on) {
    if (!::set_nonblocking(fd_, on)) {
        throw std::runtime_error("set_nonblocking failed: " + socket_error_str(last_socket_error()));
    }
}

void TcpSocket::connect(const std::string& ip, u16 port) {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (inet_pton(AF_INET, ip.c_str(), &addr.sin_addr) != 1) {
        throw std::runtime_error("Invalid IP address: " + ip);
    }
    if (::connect(fd_, (sockaddr*)&addr, sizeof(addr)) == SOCKET_ERROR_VAL) {
        throw TransportError("connect() failed: " + socket_error_str(last_socket_error()));
    }
    tune();
}

void TcpSocket::bind_and_listen(const std::string& ip, u16 port, int backlog) {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (ip.empty() || ip == "0.0.0.0") {
        addr.sin_addr.s_addr = INADDR_ANY;
    } else if (inet_pton(AF_INET, ip.c_str(), &addr.sin_addr) != 1) {
        throw std::runtime_error("Invalid IP address: " + ip);
    }
    if (::bind(fd_, (sockaddr*)&addr, sizeof(addr)) == SOCKET_ERROR_VAL) {
        throw std::runtime_error("bind() failed: " + socket_error_str(last_socket_error()));
    }
    if (::listen(fd_, backlog) == SOCKET_ERROR_VAL) {
        throw std::runtime_error("listen() failed: " + socket_error_str(last_socket_error()));
    }
}

TcpSocket TcpSocket::accept() {
    sockaddr_in peer{};
    socklen_type peer_len = sizeof(peer);
    socket_t client = ::accept(fd_, (sockaddr*)&peer, &peer_len);
    if (client == INVALID_SOCKET_VAL) {
        throw std::runtime_error("accept() failed: " + socket_error_str(last_socket_error()));
    }
    return TcpSocket(client);
}

bool TcpSocket::try_accept(TcpSocket& out) {
    sockaddr_in peer{};
    socklen_type peer_len = sizeof(peer);
    socket_t client = ::accept(fd_, (sockaddr*)&peer, &peer_len);
    if (client == INVALID_SOCKET_VAL) {
        int err = last_socket_error();
        if (would_block(err) || interrupted(err)) return false;
        throw std::runtime_error("accept() failed: " + socket_error_str(err));
    }
    out = TcpSocket(client);
    return true;
}

void TcpSocket::send_all(const void* buf, size_t len) {
    const char* p = static_cast<const char*>(buf);
    size_t remaining = len;
    while (remaining > 0) {
#ifdef _WIN32
        int sent = ::send(fd_, p, (int)std::min(remaining, (size_t)INT_MAX), 0);
#else
        ssize_t sent = ::send(fd_, p, remaining, MSG_NOSIGNAL);
#endif
        if (sent <= 0) {
            if (sent == 0) {
                throw ConnectionLost("Connection closed during send");
            }
            int err = last_socket_error();
            if (interrupted(err)) continue;
            if (would_block(err)) {
                platform::wait_writable(fd_, 100);
                continue;
            }
            throw ConnectionLost("send() failed: " + socket_error_str(err));
        }
        p += sent;
        remaining -= static_cast<size_t>(sent);
    }
}

size_t TcpSocket::recv_some(void* buf, size_t len) {
    for (;;) {
#ifdef _WIN32
        int received = ::recv(fd_, static_cast<char*>(buf), (int)std::min(len, (size_t)INT_MAX), 0);
#else
        ssize_t received = ::recv(fd_, buf, len, 0);
#endif
        if (received >= 0) return static_cast<size_t>(received);
        int err = last_socket_error();
        if (interrupted(err)) continue;
        throw ConnectionLost("recv() failed: " + socket_error_str(err));
    }
}

i64 TcpSocket::try_send(const void* buf, size_t len) {
#ifdef _WIN32
    int sent = ::send(fd_, static_cast<const char*>(buf), (int)std::min(len, (size_t)INT_MAX), 0);
#else
    ssize_t sent = ::send(fd_, buf, len, MSG_NOSIGNAL);
#endif
    if (sent >= 0) return (i64)sent;
    int err = last_socket_error();
    if (would_block(err) || interrupted(err)) return -1;
    throw ConnectionLost("send() failed: " + socket_error_str(err));
}

i64 TcpSocket::try_recv(void* buf, size_t len) {
#ifdef _WIN32
    int received = ::recv(fd_, static_cast<char*>(buf), (int)std::min(len, (size_t)INT_MAX), 0);
#else
    ssize_t received = ::recv(fd_, buf, len, 0);
#endif
    if (received >= 0) return (i64)received;
    int err = last_socket_error();
    if (would_block(err) || interrupted(err)) return -1;
    throw ConnectionLost("recv() failed: " + socket_error_str(err));
}

void TcpSocket::close() {
    if (fd_ != INVALID_SOCKET_VAL) {
        CLOSE_SOCKET(fd_);
        fd_ = INVALID_SOCKET_VAL;
    }
}

void TcpSocket::shutdown() {
    if (fd_ != INVALID_SOCKET_VAL) {
#ifdef _WIN32
        ::shutdown(fd_, SD_BOTH);
#else
        ::shutdown(fd_, SHUT_RDWR);
#endif
    }
}

std::string TcpSocket::peer_addr() const {
    sockaddr_in peer{};
    socklen_type len = sizeof(peer);
    if (getpeername(fd_, (sockaddr*)&peer, &len) == 0) {
        char buf[INET_ADDRSTRLEN] = {0};
        if (inet_ntop(AF_INET, &peer.sin_addr, buf, sizeof(buf))) {
            return std::string(buf) + ":" + std::to_string(ntohs(peer.sin_port));
        }
    }
    return "unknown";
}

u16 TcpSocket::local_port() const {
    sockaddr_in local{};
    socklen_type len = sizeof(local);
    if (getsockname(fd_, (sockaddr*)&local, &len) != 0) {
        throw std::runtime_error("getsockname() failed: " + socket_error_str(last_socket_error()));
    }
    return ntohs(local.sin_port);
}
