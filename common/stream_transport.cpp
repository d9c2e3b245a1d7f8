// ============================================================
// stream_transport.cpp -- line/raw framing over TCP
// ============================================================

#include "stream_transport.hpp"
#include "errors.hpp"
#include "protocol.hpp"
#include <algorithm>
#include <cstring>

static constexpr size_t RECV_CHUNK = 64 * 1024;

StreamTransport::StreamTransport(TcpSocket sock)
    : sock_(std::move(sock)) {
    peer_ = sock_.peer_addr();
}

void StreamTransport::send_message(const std::string& text) {
    std::string line = text;
    line.push_back('\n');
    sock_.send_all(line.data(), line.size());
}

void StreamTransport::fill() {
    size_t old = buf_.size();
    buf_.resize(old + RECV_CHUNK);
    size_t got;
    try {
        got = sock_.recv_some(buf_.data() + old, RECV_CHUNK);
    } catch (...) {
        buf_.resize(old);
        throw;
    }
    buf_.resize(old + got);
    if (got == 0) {
        throw ConnectionLost("peer " + peer_ + " closed the connection");
    }
}

std::string StreamTransport::receive_line() {
    for (;;) {
        auto begin = buf_.begin() + (std::ptrdiff_t)scanned_;
        auto nl = std::find(begin, buf_.end(), (u8)'\n');
        if (nl != buf_.end()) {
            std::string line(buf_.begin(), nl);
            buf_.erase(buf_.begin(), nl + 1);
            scanned_ = 0;
            if (!line.empty() && line.back() == '\r') line.pop_back();
            return line;
        }
        scanned_ = buf_.size();
        if (buf_.size() > MAX_LINE_LEN) {
            throw ConnectionLost("line from " + peer_ + " exceeds " +
                                 std::to_string(MAX_LINE_LEN) + " bytes");
        }
        fill();
    }
}

void StreamTransport::send_raw(const u8* data, size_t len) {
    if (len == 0) return;
    sock_.send_all(data, len);
}

std::vector<u8> StreamTransport::receive_raw(size_t n) {
    std::vector<u8> out;
    out.reserve(n);
    while (out.size() < n) {
        std::vector<u8> part = receive_some(n - out.size());
        out.insert(out.end(), part.begin(), part.end());
    }
    return out;
}

std::vector<u8> StreamTransport::receive_some(size_t max) {
    if (max == 0) return {};
    if (buf_.empty()) fill();

    size_t take = std::min(max, buf_.size());
    std::vector<u8> out(buf_.begin(), buf_.begin() + (std::ptrdiff_t)take);
    buf_.erase(buf_.begin(), buf_.begin() + (std::ptrdiff_t)take);
    scanned_ = 0;
    return out;
}

size_t StreamTransport::raw_chunk_size() const {
    return DISK_CHUNK_SIZE;
}
