#pragma once

// ============================================================
// reliable_channel.hpp -- ARQ over an unreliable datagram channel
//
// Delivers whole byte blobs exactly once, in order, using
// "blast and repair" with bitmap ACKs:
//
//   sender                               receiver
//   D0 D1 ... D(N-1)   ------------->    store by seq (dups overwrite)
//   F(N) x fin_repeats ------------->    all of [0,N) present?
//                      <-------------    A(N) + bitmap (what it has)
//   resend missing Ds, F(N) again ...
//                      <-------------    A(N) + full bitmap, return blob
//
// Both calls block, bounded by ArqConfig, and raise TimeoutError
// instead of hanging.
//
// Packets carry no transfer id, so a blob is known only by its peer
// and segment count. Between two blobs in the same direction from the
// same peer:
//   - if every final ACK of a blob is lost and the sender last saw a
//     partial bitmap, it re-sends the data and a receiver already
//     waiting for the next blob delivers it a second time;
//   - if the next blob has the same segment count and its whole blast
//     is lost, its FIN is answered as stale and it is never delivered.
// Alternating request/response traffic is not exposed: a completed
// send clears the stale record and FINs are answered while sending.
// ============================================================

#include "platform.hpp"
#include "protocol.hpp"
#include "udp_socket.hpp"
#include <chrono>
#include <map>
#include <set>
#include <vector>

struct ArqConfig {
    size_t segment_size{MAX_SEGMENT_PAYLOAD};
    int    rto_ms{50};                 // wait for bitmap ACKs per round
    int    max_idle_rounds{200};       // rounds without progress before TimeoutError
    int    fin_repeats{3};             // FIN copies per round
    int    final_ack_repeats{10};      // full-bitmap copies sent on completion
    int    recv_idle_timeout_ms{5000}; // receive() gives up after this much silence
};

// Sender-side bookkeeping for one blob
struct PendingTransfer {
    PeerAddr                     peer;
    std::vector<std::vector<u8>> segments;
    std::set<u32>                unacked;
    std::chrono::steady_clock::time_point deadline;
};

// Receiver-side bookkeeping for one blob
struct ReceiveAssembly {
    PeerAddr                      peer;
    bool                          has_peer{false};
    std::map<u32, std::vector<u8>> segments;
    u32                           expected_total{0}; // 0 until FIN seen

    u32 present_in_range(u32 total) const;
    std::vector<u8> bitmap(u32 total) const;
};

struct ReceivedBlob {
    std::vector<u8> data;
    PeerAddr        from;
};

class ReliableChannel {
public:
    explicit ReliableChannel(DatagramChannel& chan, ArqConfig cfg = ArqConfig{});

    ReliableChannel(const ReliableChannel&) = delete;
    ReliableChannel& operator=(const ReliableChannel&) = delete;

    // Deliver data to peer; throws TimeoutError once the retry budget is spent
    void send(const PeerAddr& peer, const u8* data, size_t len);
    void send(const PeerAddr& peer, const std::vector<u8>& data) {
        send(peer, data.data(), data.size());
    }

    // Receive one blob. If only_from is set, datagrams from other peers are
    // ignored. Throws TimeoutError after recv_idle_timeout_ms of silence.
    ReceivedBlob receive(const PeerAddr* only_from = nullptr);

    const ArqConfig& config() const { return cfg_; }

    // Counters for diagnostics and tests
    u64 retransmitted_segments() const { return retransmitted_; }
    u64 stale_fins_answered() const { return stale_fins_; }

private:
    DatagramChannel& chan_;
    ArqConfig        cfg_;
    std::vector<u8>  rx_buf_;

    // Last blob fully received; a FIN for it means the peer missed our ACK
    PeerAddr last_peer_;
    u32      last_total_{0};
    bool     has_last_{false};

    u64 retransmitted_{0};
    u64 stale_fins_{0};

    std::vector<std::vector<u8>> split(const u8* data, size_t len) const;
    void send_ack(const PeerAddr& to, u32 total, const std::vector<u8>& bitmap, int copies);
    bool is_stale_fin(const PeerAddr& from, u32 total) const;
    void answer_stale_fin(const PeerAddr& from, u32 total);
    void drain_pending();
};
