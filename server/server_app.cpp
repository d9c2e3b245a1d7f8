// ============================================================
// server_app.cpp -- TwinFT server daemon implementation
// ============================================================

#include "server_app.hpp"
#include "../common/logger.hpp"
#include <chrono>

static constexpr int STOP_POLL_MS = 100;

ServerApp::ServerApp(ServerConfig config)
    : config_(std::move(config)), store_(config_.storage_dir) {}

ServerApp::~ServerApp() {
    shutdown();
}

void ServerApp::start() {
    store_.bootstrap();

    u16 port = config_.listen_port;
    if (config_.model == ServerModel::EVENT_LOOP) {
        event_loop_ = std::make_unique<EventLoopServer>(store_);
        event_loop_->bind(config_.listen_ip, port);
        port = event_loop_->port();
        engine_thread_ = std::thread([this]() {
            try {
                event_loop_->run();
            } catch (const std::exception& e) {
                LOG_ERROR("Event loop stopped: " + std::string(e.what()));
                stop();
            }
        });
    } else {
        threaded_ = std::make_unique<ThreadedServer>(store_);
        threaded_->bind(config_.listen_ip, port);
        port = threaded_->port();
        engine_thread_ = std::thread([this]() {
            try {
                threaded_->run();
            } catch (const std::exception& e) {
                LOG_ERROR("Accept loop stopped: " + std::string(e.what()));
                stop();
            }
        });
    }
    started_ = true;

    if (config_.enable_udp) {
        datagram_ = std::make_unique<DatagramService>(store_, config_.arq);
        datagram_->bind(config_.listen_ip, port);
        datagram_->start();
    }

    LOG_INFO("TwinFT server listening on " + config_.listen_ip + ":" + std::to_string(port) +
             (config_.model == ServerModel::EVENT_LOOP ? "  (event loop" : "  (thread per connection") +
             (config_.enable_udp ? ", TCP+UDP)" : ", TCP only)"));
}

int ServerApp::run() {
    start();
    while (!stop_requested_.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(STOP_POLL_MS));
    }
    LOG_INFO("Shutting down");
    shutdown();
    return 0;
}

void ServerApp::shutdown() {
    if (!started_) return;
    started_ = false;
    if (datagram_) datagram_->stop();
    if (threaded_) threaded_->stop();
    if (event_loop_) event_loop_->stop();
    if (engine_thread_.joinable()) engine_thread_.join();
    datagram_.reset();
    threaded_.reset();
    event_loop_.reset();
}

u16 ServerApp::tcp_port() const {
    if (threaded_) return threaded_->port();
    if (event_loop_) return event_loop_->port();
    return config_.listen_port;
}

u16 ServerApp::udp_port() const {
    return datagram_ ? datagram_->port() : 0;
}

size_t ServerApp::open_sessions() const {
    if (threaded_) return threaded_->active_sessions();
    if (event_loop_) return event_loop_->connection_count();
    return 0;
}

u64 ServerApp::datagram_exchanges() const {
    return datagram_ ? datagram_->sessions_served() : 0;
}
