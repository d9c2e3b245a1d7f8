// ============================================================
// datagram_service.cpp
// ============================================================

#include "datagram_service.hpp"
#include "session_handler.hpp"
#include "../common/datagram_transport.hpp"
#include "../common/errors.hpp"
#include "../common/logger.hpp"

static constexpr int IDLE_POLL_MS = 200;

DatagramService::DatagramService(FileStore& store, ArqConfig arq)
    : store_(store), arq_(sock_, arq) {}

DatagramService::~DatagramService() {
    stop();
}

void DatagramService::bind(const std::string& ip, u16 port) {
    sock_.bind(ip, port);
    sock_.tune();
    running_.store(true);
}

void DatagramService::start() {
    thread_ = std::thread([this]() { run(); });
}

void DatagramService::stop() {
    running_.store(false);
    if (thread_.joinable()) thread_.join();
}

void DatagramService::run() {
    LOG_INFO("Datagram service listening on UDP port " + std::to_string(port()));
    while (running_.load()) {
        try {
            if (!platform::wait_readable(sock_.native(), IDLE_POLL_MS)) continue;
            serve_one_exchange();
        } catch (const std::exception& e) {
            LOG_ERROR("datagram service: " + std::string(e.what()));
        }
    }
}

void DatagramService::serve_one_exchange() {
    DatagramTransport transport(arq_);
    try {
        SessionHandler handler(transport, store_);
        handler.serve_one();
        ++sessions_;
    } catch (const TimeoutError& e) {
        // Also the normal outcome for a lone stale datagram: nothing followed it
        if (transport.has_peer()) {
            LOG_WARN("Datagram session " + transport.peer_name() + " timed out: " + e.what());
        } else {
            LOG_DEBUG("Datagram wakeup without a request: " + std::string(e.what()));
        }
    } catch (const TransportError& e) {
        LOG_WARN("Datagram session " + transport.peer_name() + " failed: " + e.what());
    }
}
