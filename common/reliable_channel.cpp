// ============================================================
// reliable_channel.cpp -- blast-and-repair ARQ implementation
// ============================================================

#include "reliable_channel.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "packet_codec.hpp"
#include <algorithm>
#include <string>

using Clock = std::chrono::steady_clock;

static int ms_until(Clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
    return left > 0 ? (int)left : 0;
}

// ============================================================
// ReceiveAssembly
// ============================================================

u32 ReceiveAssembly::present_in_range(u32 total) const {
    u32 n = 0;
    for (auto it = segments.begin(); it != segments.end() && it->first < total; ++it) ++n;
    return n;
}

std::vector<u8> ReceiveAssembly::bitmap(u32 total) const {
    std::vector<u8> bm(proto::bitmap_bytes(total), 0);
    for (auto it = segments.begin(); it != segments.end() && it->first < total; ++it) {
        proto::bitmap_set(bm, it->first);
    }
    return bm;
}

// ============================================================
// ReliableChannel
// ============================================================

ReliableChannel::ReliableChannel(DatagramChannel& chan, ArqConfig cfg)
    : chan_(chan), cfg_(cfg) {
    if (cfg_.segment_size == 0 || cfg_.segment_size > MAX_UDP_PAYLOAD - PACKET_HEADER_SIZE) {
        cfg_.segment_size = MAX_SEGMENT_PAYLOAD;
    }
    if (cfg_.rto_ms <= 0)            cfg_.rto_ms = 1;
    if (cfg_.max_idle_rounds <= 0)   cfg_.max_idle_rounds = 1;
    if (cfg_.fin_repeats <= 0)       cfg_.fin_repeats = 1;
    if (cfg_.final_ack_repeats <= 0) cfg_.final_ack_repeats = 1;
}

std::vector<std::vector<u8>> ReliableChannel::split(const u8* data, size_t len) const {
    std::vector<std::vector<u8>> segs;
    if (len == 0) {
        segs.emplace_back();  // one empty segment
        return segs;
    }
    segs.reserve((len + cfg_.segment_size - 1) / cfg_.segment_size);
    for (size_t off = 0; off < len; off += cfg_.segment_size) {
        size_t n = std::min(cfg_.segment_size, len - off);
        segs.emplace_back(data + off, data + off + n);
    }
    return segs;
}

void ReliableChannel::send_ack(const PeerAddr& to, u32 total,
                               const std::vector<u8>& bitmap, int copies) {
    auto pkt = proto::encode_packet(total, PacketType::PT_ACK, bitmap.data(), bitmap.size());
    // An ACK the OS refused is recovered like one lost on the wire
    for (int i = 0; i < copies; ++i) {
        chan_.send_to(to, pkt.data(), pkt.size());
    }
}

bool ReliableChannel::is_stale_fin(const PeerAddr& from, u32 total) const {
    return has_last_ && last_peer_ == from && last_total_ == total;
}

void ReliableChannel::answer_stale_fin(const PeerAddr& from, u32 total) {
    ++stale_fins_;
    send_ack(from, total, proto::full_bitmap(total), 1);
}

void ReliableChannel::drain_pending() {
    // Leftover final ACKs of an earlier exchange must not be mistaken for
    // ACKs of the blob we are about to send.
    PeerAddr from;
    proto::Packet pkt;
    while (chan_.recv_from(rx_buf_, from, 0)) {
        if (!proto::decode_packet(rx_buf_.data(), rx_buf_.size(), pkt)) continue;
        if (pkt.type == PacketType::PT_FIN && is_stale_fin(from, pkt.seq)) {
            answer_stale_fin(from, pkt.seq);
        }
    }
}

void ReliableChannel::send(const PeerAddr& peer, const u8* data, size_t len) {
    drain_pending();

    PendingTransfer tx;
    tx.peer     = peer;
    tx.segments = split(data, len);
    if (tx.segments.size() > MAX_BLOB_SEGMENTS) {
        throw TransportError("ARQ send: " + std::to_string(len) + " bytes need " +
                             std::to_string(tx.segments.size()) + " segments, limit is " +
                             std::to_string(MAX_BLOB_SEGMENTS));
    }
    const u32 total = (u32)tx.segments.size();
    for (u32 s = 0; s < total; ++s) tx.unacked.insert(s);

    const auto fin = proto::encode_packet(total, PacketType::PT_FIN);
    int  idle_rounds = 0;
    bool first_round = true;
    bool got_bitmap  = false;
    PeerAddr from;
    proto::Packet pkt;

    while (!tx.unacked.empty()) {
        // Blast everything once, then only what a bitmap reported missing.
        // Without fresh feedback just ask again: a peer that already has
        // the whole blob must not be fed a second copy of it.
        if (first_round || got_bitmap) {
            for (u32 seq : tx.unacked) {
                const auto& seg = tx.segments[seq];
                auto wire = proto::encode_packet(seq, PacketType::PT_DATA, seg.data(), seg.size());
                if (!chan_.send_to(peer, wire.data(), wire.size())) break;  // OS buffer full
                if (!first_round) ++retransmitted_;
            }
        }
        first_round = false;
        got_bitmap  = false;

        // Bitmap request
        for (int i = 0; i < cfg_.fin_repeats; ++i) {
            chan_.send_to(peer, fin.data(), fin.size());
        }

        const size_t before = tx.unacked.size();
        tx.deadline = Clock::now() + std::chrono::milliseconds(cfg_.rto_ms);
        while (!tx.unacked.empty()) {
            int wait = ms_until(tx.deadline);
            if (!chan_.recv_from(rx_buf_, from, wait)) {
                if (wait == 0) break;
                continue;
            }
            if (!proto::decode_packet(rx_buf_.data(), rx_buf_.size(), pkt)) continue;

            if (pkt.type == PacketType::PT_ACK) {
                if (from != peer || pkt.seq != total) continue;
                got_bitmap = true;
                for (auto it = tx.unacked.begin(); it != tx.unacked.end();) {
                    if (proto::bitmap_test(pkt.payload, *it)) it = tx.unacked.erase(it);
                    else ++it;
                }
            } else if (pkt.type == PacketType::PT_FIN && is_stale_fin(from, pkt.seq)) {
                answer_stale_fin(from, pkt.seq);
            }
        }

        if (tx.unacked.size() < before) {
            idle_rounds = 0;
        } else if (++idle_rounds >= cfg_.max_idle_rounds) {
            throw TimeoutError("ARQ send to " + peer.to_string() + " gave up after " +
                               std::to_string(idle_rounds) + " rounds without progress (" +
                               std::to_string(tx.unacked.size()) + "/" +
                               std::to_string(total) + " segments unacknowledged)");
        }
    }

    // The peer has received something we sent after our last receive
    // completed, so it has stopped retransmitting that blob.
    if (has_last_ && last_peer_ == peer) has_last_ = false;

    LOG_DEBUG("ARQ sent " + std::to_string(len) + " bytes in " + std::to_string(total) +
              " segments to " + peer.to_string());
}

ReceivedBlob ReliableChannel::receive(const PeerAddr* only_from) {
    ReceiveAssembly rx;
    if (only_from) {
        rx.peer     = *only_from;
        rx.has_peer = true;
    }

    PeerAddr from;
    proto::Packet pkt;
    auto idle_deadline = Clock::now() + std::chrono::milliseconds(cfg_.recv_idle_timeout_ms);

    for (;;) {
        int wait = ms_until(idle_deadline);
        if (wait == 0) {
            throw TimeoutError("ARQ receive: no datagrams for " +
                               std::to_string(cfg_.recv_idle_timeout_ms) + " ms");
        }
        if (!chan_.recv_from(rx_buf_, from, wait)) continue;
        if (!proto::decode_packet(rx_buf_.data(), rx_buf_.size(), pkt)) continue;

        // A peer that missed our final ACK keeps asking; answer whoever it is.
        if (pkt.type == PacketType::PT_FIN && rx.segments.empty() && is_stale_fin(from, pkt.seq)) {
            answer_stale_fin(from, pkt.seq);
            continue;
        }
        // One assembly serves one peer; others retransmit later.
        if (rx.has_peer && from != rx.peer) continue;

        idle_deadline = Clock::now() + std::chrono::milliseconds(cfg_.recv_idle_timeout_ms);

        switch (pkt.type) {
        case PacketType::PT_DATA:
            if (pkt.seq >= MAX_BLOB_SEGMENTS) break;
            // Beyond the announced total: a FIN for a new blob will raise it
            if (rx.expected_total != 0 && pkt.seq >= rx.expected_total) break;
            if (!rx.has_peer) {
                rx.peer     = from;
                rx.has_peer = true;
            }
            rx.segments[pkt.seq] = std::move(pkt.payload);
            break;

        case PacketType::PT_FIN: {
            const u32 total = pkt.seq;
            // Malformed: a blob has at least one segment and its ACK fits one datagram
            if (total == 0 || total > MAX_BLOB_SEGMENTS) break;
            if (!rx.has_peer) {
                rx.peer     = from;
                rx.has_peer = true;
            }
            rx.expected_total = total;

            if (rx.present_in_range(total) < total) {
                send_ack(from, total, rx.bitmap(total), 1);
                break;
            }

            ReceivedBlob out;
            out.from = from;
            size_t bytes = 0;
            for (u32 s = 0; s < total; ++s) bytes += rx.segments[s].size();
            out.data.reserve(bytes);
            for (u32 s = 0; s < total; ++s) {
                const auto& seg = rx.segments[s];
                out.data.insert(out.data.end(), seg.begin(), seg.end());
            }
            send_ack(from, total, proto::full_bitmap(total), cfg_.final_ack_repeats);
            last_peer_  = from;
            last_total_ = total;
            has_last_   = true;
            LOG_DEBUG("ARQ received " + std::to_string(bytes) + " bytes in " +
                      std::to_string(total) + " segments from " + from.to_string());
            return out;
        }

        case PacketType::PT_ACK:
            // Late ACK of an earlier send of ours
            break;
        }
    }
}
