#pragma once

// ============================================================
// stream_transport.hpp -- Transport over a connected TcpSocket
// ============================================================

#include "transport.hpp"
#include "socket.hpp"
#include <string>
#include <vector>

class StreamTransport : public Transport {
public:
    explicit StreamTransport(TcpSocket sock);

    void send_message(const std::string& text) override;
    std::string receive_line() override;
    void send_raw(const u8* data, size_t len) override;
    using Transport::send_raw;
    std::vector<u8> receive_raw(size_t n) override;
    std::vector<u8> receive_some(size_t max) override;

    size_t raw_chunk_size() const override;
    bool is_datagram() const override { return false; }
    std::string peer_name() const override { return peer_; }

    TcpSocket& socket() { return sock_; }

    // Bytes received but not yet consumed
    size_t buffered() const { return buf_.size(); }

private:
    TcpSocket        sock_;
    std::string      peer_;
    std::vector<u8>  buf_;
    size_t           scanned_{0};  // prefix of buf_ known to hold no '\n'

    // Read once from the socket into buf_; throws ConnectionLost on close
    void fill();
};
