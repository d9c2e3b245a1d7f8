// ============================================================
// threaded_server.cpp
// ============================================================

#include "threaded_server.hpp"
#include "session_handler.hpp"
#include "../common/errors.hpp"
#include "../common/logger.hpp"
#include <vector>

// Accept poll interval: bounds how long stop() takes to be noticed
static constexpr int ACCEPT_POLL_MS = 200;

ThreadedServer::ThreadedServer(FileStore& store)
    : store_(store) {}

ThreadedServer::~ThreadedServer() {
    stop();
    join_all();
}

void ThreadedServer::bind(const std::string& ip, u16 port) {
    listen_sock_.bind_and_listen(ip, port);
    listen_sock_.set_nonblocking(true);
    running_.store(true);
}

void ThreadedServer::run() {
    LOG_INFO("Thread-per-connection engine listening on port " + std::to_string(port()));
    accept_loop();
    // A connection accepted while stop() was running escaped its shutdown
    stop();
    join_all();
}

void ThreadedServer::stop() {
    running_.store(false);
    std::lock_guard<std::mutex> lk(workers_mutex_);
    for (auto& w : workers_) {
        if (!w->done && w->transport) w->transport->socket().shutdown();
    }
}

size_t ThreadedServer::active_sessions() const {
    std::lock_guard<std::mutex> lk(workers_mutex_);
    size_t n = 0;
    for (auto& w : workers_) {
        if (!w->done) ++n;
    }
    return n;
}

void ThreadedServer::accept_loop() {
    while (running_.load()) {
        try {
            if (!platform::wait_readable(listen_sock_.native(), ACCEPT_POLL_MS)) {
                reap_finished();
                continue;
            }
            TcpSocket sock(INVALID_SOCKET_VAL);
            if (!listen_sock_.try_accept(sock)) continue;
            sock.set_nonblocking(false);
            sock.tune();
            LOG_DEBUG("Accepted connection from " + sock.peer_addr());

            auto transport = std::make_unique<StreamTransport>(std::move(sock));
            auto w = std::make_shared<Worker>();
            w->transport = transport.get();
            std::lock_guard<std::mutex> lk(workers_mutex_);
            w->thread = std::thread([this, w, t = std::move(transport)]() mutable {
                session_thread(w, std::move(t));
            });
            workers_.push_back(std::move(w));
        } catch (const std::exception& e) {
            if (!running_.load()) break;
            LOG_ERROR("accept_loop: " + std::string(e.what()));
        }
        reap_finished();
    }
}

void ThreadedServer::session_thread(std::shared_ptr<Worker> w,
                                    std::unique_ptr<StreamTransport> transport) {
    const std::string peer = transport->peer_name();
    LOG_INFO("Session started: " + peer);
    try {
        SessionHandler handler(*transport, store_);
        handler.run();
        LOG_INFO("Session closed: " + peer);
    } catch (const ConnectionLost& e) {
        LOG_INFO("Session " + peer + " ended: " + e.what());
    } catch (const std::exception& e) {
        LOG_ERROR("Session " + peer + " failed: " + e.what());
    }
    // Detach before the socket closes so stop() never touches a reused fd
    {
        std::lock_guard<std::mutex> lk(workers_mutex_);
        w->done      = true;
        w->transport = nullptr;
    }
    transport.reset();
}

void ThreadedServer::reap_finished() {
    std::vector<std::shared_ptr<Worker>> finished;
    {
        std::lock_guard<std::mutex> lk(workers_mutex_);
        for (auto it = workers_.begin(); it != workers_.end();) {
            if ((*it)->done) {
                finished.push_back(*it);
                it = workers_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (auto& w : finished) {
        if (w->thread.joinable()) w->thread.join();
    }
}

void ThreadedServer::join_all() {
    std::list<std::shared_ptr<Worker>> all;
    {
        std::lock_guard<std::mutex> lk(workers_mutex_);
        all.swap(workers_);
    }
    for (auto& w : all) {
        if (w->thread.joinable()) w->thread.join();
    }
}
