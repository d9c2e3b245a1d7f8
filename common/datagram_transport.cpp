// ============================================================
// datagram_transport.cpp
// ============================================================

#include "datagram_transport.hpp"
#include "errors.hpp"
#include "protocol.hpp"

DatagramTransport::DatagramTransport(ReliableChannel& arq)
    : arq_(arq) {}

DatagramTransport::DatagramTransport(ReliableChannel& arq, const PeerAddr& peer)
    : arq_(arq), peer_(peer), has_peer_(true) {}

std::vector<u8> DatagramTransport::receive_blob() {
    ReceivedBlob blob = arq_.receive(has_peer_ ? &peer_ : nullptr);
    peer_     = blob.from;
    has_peer_ = true;
    return std::move(blob.data);
}

void DatagramTransport::send_message(const std::string& text) {
    if (!has_peer_) throw TransportError("datagram send before any peer is known");
    std::string line = text;
    line.push_back('\n');
    arq_.send(peer_, reinterpret_cast<const u8*>(line.data()), line.size());
}

std::string DatagramTransport::receive_line() {
    std::vector<u8> data = receive_blob();
    std::string line(data.begin(), data.end());
    if (!line.empty() && line.back() == '\n') line.pop_back();
    if (!line.empty() && line.back() == '\r') line.pop_back();
    return line;
}

void DatagramTransport::send_raw(const u8* data, size_t len) {
    if (!has_peer_) throw TransportError("datagram send before any peer is known");
    arq_.send(peer_, data, len);
}

std::vector<u8> DatagramTransport::receive_raw(size_t /*n*/) {
    return receive_blob();
}

std::vector<u8> DatagramTransport::receive_some(size_t /*max*/) {
    return receive_blob();
}

size_t DatagramTransport::raw_chunk_size() const {
    return DATAGRAM_CHUNK_SIZE;
}

std::string DatagramTransport::peer_name() const {
    return has_peer_ ? "udp://" + peer_.to_string() : "udp://?";
}
