#pragma once

// ============================================================
// transport.hpp -- Message/raw-byte transport used by sessions
//
// Control traffic is newline-terminated ASCII lines, file data
// is raw bytes; both share one inbound buffer so a line and the
// first raw bytes may arrive in the same read.
// ============================================================

#include "platform.hpp"
#include <string>
#include <vector>

class Transport {
public:
    virtual ~Transport() = default;

    // Send text followed by '\n'
    virtual void send_message(const std::string& text) = 0;

    // Next line without its terminator ('\r' stripped too).
    // Throws ConnectionLost / TimeoutError.
    virtual std::string receive_line() = 0;

    virtual void send_raw(const u8* data, size_t len) = 0;
    void send_raw(const std::vector<u8>& data) { send_raw(data.data(), data.size()); }

    // Stream transports return exactly n bytes. Datagram transports return
    // one whole blob, for which n is only the size the caller expects.
    virtual std::vector<u8> receive_raw(size_t n) = 0;

    // Whatever has arrived, at most max bytes (never empty on a stream).
    // Chunked receivers use this so bytes that made it before a disconnect
    // can still be written.
    virtual std::vector<u8> receive_some(size_t max) = 0;

    // Largest raw chunk a sender should hand to send_raw in one call
    virtual size_t raw_chunk_size() const = 0;

    virtual bool is_datagram() const = 0;
    virtual std::string peer_name() const = 0;
};
