#pragma once

// ============================================================
// datagram_transport.hpp -- Transport where every call is one
//                           ARQ blob transfer
// ============================================================

#include "transport.hpp"
#include "reliable_channel.hpp"
#include <string>
#include <vector>

class DatagramTransport : public Transport {
public:
    // Server side: the peer is learnt from the first received blob
    explicit DatagramTransport(ReliableChannel& arq);
    // Client side: talk to a fixed peer
    DatagramTransport(ReliableChannel& arq, const PeerAddr& peer);

    void send_message(const std::string& text) override;
    std::string receive_line() override;
    void send_raw(const u8* data, size_t len) override;
    using Transport::send_raw;
    std::vector<u8> receive_raw(size_t n) override;
    std::vector<u8> receive_some(size_t max) override;

    size_t raw_chunk_size() const override;
    bool is_datagram() const override { return true; }
    std::string peer_name() const override;

    const PeerAddr& peer() const { return peer_; }
    bool has_peer() const { return has_peer_; }

private:
    ReliableChannel& arq_;
    PeerAddr         peer_;
    bool             has_peer_{false};

    std::vector<u8> receive_blob();
};
