#pragma once

// ============================================================
// datagram_service.hpp -- UDP endpoint served by one dedicated
//                         thread; each incoming exchange runs one
//                         request/response session over ARQ
// ============================================================

#include "../common/platform.hpp"
#include "../common/reliable_channel.hpp"
#include "../common/udp_socket.hpp"
#include "file_store.hpp"
#include <atomic>
#include <string>
#include <thread>

class DatagramService {
public:
    DatagramService(FileStore& store, ArqConfig arq);
    ~DatagramService();

    DatagramService(const DatagramService&) = delete;
    DatagramService& operator=(const DatagramService&) = delete;

    void bind(const std::string& ip, u16 port);
    u16  port() const { return sock_.local_port(); }

    // Serve on a background thread until stop()
    void start();
    void stop();

    // Blocking loop (what start() runs)
    void run();

    u64 sessions_served() const { return sessions_.load(); }

private:
    FileStore&        store_;
    UdpSocket         sock_;
    ReliableChannel   arq_;
    std::atomic<bool> running_{false};
    std::atomic<u64>  sessions_{0};
    std::thread       thread_;

    void serve_one_exchange();
};
