#pragma once

// ============================================================
// socket.hpp -- RAII TCP socket wrapper
// ============================================================

#include "platform.hpp"
#include <string>
#include <stdexcept>
#include <vector>

class TcpSocket {
public:
    TcpSocket();
    explicit TcpSocket(socket_t fd);
    ~TcpSocket();

    // Non-copyable
    TcpSocket(const TcpSocket&) = delete;
    TcpSocket& operator=(const TcpSocket&) = delete;

    // Movable
    TcpSocket(TcpSocket&& o) noexcept;
    TcpSocket& operator=(TcpSocket&& o) noexcept;

    // Client: connect to remote
    void connect(const std::string& ip, u16 port);

    // Server: bind + listen (port 0 = ephemeral, see local_port())
    void bind_and_listen(const std::string& ip, u16 port, int backlog = 128);

    // Accept one connection (blocking)
    TcpSocket accept();

    // Non-blocking accept: returns false when no connection is pending
    bool try_accept(TcpSocket& out);

    // Send exactly 'len' bytes; throws ConnectionLost on error
    void send_all(const void* buf, size_t len);

    // Blocking read of up to 'len' bytes; returns 0 on clean close
    size_t recv_some(void* buf, size_t len);

    // Non-blocking variants: >0 bytes moved, 0 peer closed (recv only),
    // -1 would block. Throw ConnectionLost on hard errors.
    i64 try_send(const void* buf, size_t len);
    i64 try_recv(void* buf, size_t len);

    // TCP keepalive + buffer sizes, applied once at connection setup
    void tune();

    void set_nonblocking(bool on);

    bool is_valid() const { return fd_ != INVALID_SOCKET_VAL; }
    socket_t native() const { return fd_; }

    void close();

    // Wake a thread blocked in accept()/recv() on this socket
    void shutdown();

    // Get peer address as string
    std::string peer_addr() const;

    u16 local_port() const;

private:
    socket_t fd_{INVALID_SOCKET_VAL};

    void apply_socket_opts();
};
