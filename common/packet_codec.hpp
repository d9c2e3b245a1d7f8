#pragma once

// ============================================================
// packet_codec.hpp -- Datagram packet encode/decode with
//                     byte-order handling
// ============================================================

#include "protocol.hpp"
#include <cstring>
#include <vector>

// Linux: htobe32 / be32toh live in <endian.h>
#ifndef _WIN32
#  include <endian.h>
#endif

namespace proto {

// ---- Byte-order helpers ----

inline u32 hton32(u32 v) {
#if defined(_WIN32)
    return htonl(v);
#else
    return htobe32(v);
#endif
}

inline u32 ntoh32(u32 v) {
#if defined(_WIN32)
    return ntohl(v);
#else
    return be32toh(v);
#endif
}

// ---- Packet ----

struct Packet {
    u32             seq{0};
    PacketType      type{PacketType::PT_DATA};
    std::vector<u8> payload;
};

inline bool is_known_type(u8 tag) {
    return tag == (u8)PacketType::PT_DATA ||
           tag == (u8)PacketType::PT_FIN  ||
           tag == (u8)PacketType::PT_ACK;
}

// Serialise header + payload into one datagram
inline std::vector<u8> encode_packet(u32 seq, PacketType type,
                                     const u8* payload = nullptr, size_t len = 0) {
    std::vector<u8> buf(PACKET_HEADER_SIZE + len);
    u32 s = hton32(seq);
    std::memcpy(buf.data(), &s, 4);
    buf[4] = static_cast<u8>(type);
    if (len > 0) {
        std::memcpy(buf.data() + PACKET_HEADER_SIZE, payload, len);
    }
    return buf;
}

inline std::vector<u8> encode_packet(const Packet& p) {
    return encode_packet(p.seq, p.type, p.payload.data(), p.payload.size());
}

// Returns false for datagrams that are too short or carry an unknown tag;
// callers drop those silently.
inline bool decode_packet(const u8* buf, size_t len, Packet& out) {
    if (len < PACKET_HEADER_SIZE) return false;
    if (!is_known_type(buf[4])) return false;
    u32 s;
    std::memcpy(&s, buf, 4);
    out.seq  = ntoh32(s);
    out.type = static_cast<PacketType>(buf[4]);
    out.payload.assign(buf + PACKET_HEADER_SIZE, buf + len);
    return true;
}

// ---- ACK bitmap: bit (s % 8) of byte (s / 8), LSB first ----

inline size_t bitmap_bytes(u32 total) {
    return ((size_t)total + 7) / 8;
}

inline void bitmap_set(std::vector<u8>& bm, u32 seq) {
    size_t idx = seq / 8;
    if (idx >= bm.size()) bm.resize(idx + 1, 0);
    bm[idx] = (u8)(bm[idx] | (1u << (seq % 8)));
}

inline bool bitmap_test(const std::vector<u8>& bm, u32 seq) {
    size_t idx = seq / 8;
    return idx < bm.size() && (bm[idx] & (1u << (seq % 8))) != 0;
}

inline std::vector<u8> full_bitmap(u32 total) {
    std::vector<u8> bm(bitmap_bytes(total), 0);
    for (u32 s = 0; s < total; ++s) bitmap_set(bm, s);
    return bm;
}

} // namespace proto
