#pragma once

// ============================================================
// test_util.hpp -- Shared helpers for the TwinFT test suite
// ============================================================

#include "../common/platform.hpp"
#include "../common/file_io.hpp"
#include "../common/logger.hpp"
#include "../common/socket.hpp"
#include "../common/stream_transport.hpp"
#include "../common/udp_socket.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <fstream>
#include <functional>
#include <iterator>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <thread>
#include <vector>

namespace testutil {

// Quiet logger, no transfer_errors.log next to the test binary
inline void quiet_logs() {
    Logger::get().set_level(LogLevel::OFF);
    Logger::get().set_transfer_log("");
}

// ---- Scratch directory removed on destruction ----
class TempDir {
public:
    TempDir() {
        static std::atomic<u64> counter{0};
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path_ = fs::temp_directory_path() /
                ("twinft_test_" + std::to_string(stamp) + "_" + std::to_string(counter++));
        fs::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    std::string str() const { return path_.string(); }
    std::string file(const std::string& name) const { return (path_ / name).string(); }
    std::string sub(const std::string& name) const {
        fs::create_directories(path_ / name);
        return (path_ / name).string();
    }

private:
    fs::path path_;
};

inline std::vector<u8> random_bytes(size_t n, u32 seed = 1) {
    std::mt19937 rng(seed);
    std::vector<u8> out(n);
    for (auto& b : out) b = (u8)(rng() & 0xFF);
    return out;
}

inline void write_file(const std::string& path, const std::vector<u8>& data) {
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    f.write(reinterpret_cast<const char*>(data.data()), (std::streamsize)data.size());
}

inline void write_file(const std::string& path, const std::string& text) {
    write_file(path, std::vector<u8>(text.begin(), text.end()));
}

inline std::vector<u8> read_file(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    return std::vector<u8>((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
}

inline std::vector<u8> prefix(const std::vector<u8>& v, size_t n) {
    return std::vector<u8>(v.begin(), v.begin() + (std::ptrdiff_t)std::min(n, v.size()));
}

// Connected TCP transport to 127.0.0.1:port
inline std::unique_ptr<StreamTransport> connect_stream(u16 port) {
    TcpSocket sock;
    sock.connect("127.0.0.1", port);
    return std::make_unique<StreamTransport>(std::move(sock));
}

// ============================================================
// LossyLink -- in-memory datagram pair with injected faults
//
// Endpoint a() sends to b() and back. Each datagram may be
// dropped, duplicated or inserted out of order; drop filters
// let a test target specific packets.
// ============================================================

struct LinkFaults {
    double loss{0.0};
    double duplicate{0.0};
    double reorder{0.0};
};

class LossyLink {
public:
    using DropFilter = std::function<bool(const std::vector<u8>&)>;

    class Endpoint : public DatagramChannel {
    public:
        Endpoint(LossyLink& link, int side) : link_(link), side_(side) {}

        bool send_to(const PeerAddr& /*to*/, const u8* data, size_t len) override {
            link_.deliver(side_, std::vector<u8>(data, data + len));
            return true;
        }

        bool recv_from(std::vector<u8>& out, PeerAddr& from, int timeout_ms) override {
            return link_.take(side_, out, from, timeout_ms);
        }

        const PeerAddr& addr() const { return link_.addr_[side_]; }

    private:
        LossyLink& link_;
        int        side_;
    };

    explicit LossyLink(LinkFaults faults = LinkFaults{}, u32 seed = 7)
        : faults_(faults), rng_(seed), a_(*this, 0), b_(*this, 1) {
        addr_[0] = PeerAddr::from("127.0.0.1", 40001);
        addr_[1] = PeerAddr::from("127.0.0.1", 40002);
    }

    Endpoint& a() { return a_; }
    Endpoint& b() { return b_; }

    // Datagrams travelling from `side` are dropped while the filter says so
    void set_drop_filter(int side, DropFilter f) {
        std::lock_guard<std::mutex> lk(mu_);
        filter_[side] = std::move(f);
    }

    u64 delivered() const {
        std::lock_guard<std::mutex> lk(mu_);
        return delivered_;
    }

private:
    friend class Endpoint;

    LinkFaults              faults_;
    std::mt19937            rng_;
    mutable std::mutex      mu_;
    std::condition_variable cv_;
    std::deque<std::vector<u8>> queue_[2];  // inbound queue of each side
    DropFilter              filter_[2];
    PeerAddr                addr_[2];
    u64                     delivered_{0};
    Endpoint                a_;
    Endpoint                b_;

    double roll() { return std::uniform_real_distribution<double>(0.0, 1.0)(rng_); }

    void deliver(int from_side, std::vector<u8> pkt) {
        std::lock_guard<std::mutex> lk(mu_);
        if (filter_[from_side] && filter_[from_side](pkt)) return;
        if (roll() < faults_.loss) return;
        auto& q = queue_[1 - from_side];
        int copies = roll() < faults_.duplicate ? 2 : 1;
        for (int i = 0; i < copies; ++i) {
            if (!q.empty() && roll() < faults_.reorder) {
                size_t at = std::uniform_int_distribution<size_t>(0, q.size() - 1)(rng_);
                q.insert(q.begin() + (std::ptrdiff_t)at, pkt);
            } else {
                q.push_back(pkt);
            }
        }
        ++delivered_;
        cv_.notify_all();
    }

    bool take(int side, std::vector<u8>& out, PeerAddr& from, int timeout_ms) {
        std::unique_lock<std::mutex> lk(mu_);
        auto& q = queue_[side];
        if (q.empty()) {
            if (timeout_ms <= 0) return false;
            cv_.wait_for(lk, std::chrono::milliseconds(timeout_ms), [&] { return !q.empty(); });
            if (q.empty()) return false;
        }
        out = std::move(q.front());
        q.pop_front();
        from = addr_[1 - side];
        return true;
    }
};

} // namespace testutil
