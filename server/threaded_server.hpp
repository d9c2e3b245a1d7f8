#pragma once

// ============================================================
// threaded_server.hpp -- Thread-per-connection stream engine
//
//   accept_loop()  -> accepts one socket at a time and spawns a
//                     session thread that owns it.
//   session thread -> SessionHandler::run() over a StreamTransport
//                     until CLOSE or disconnect.
// Finished threads are joined by the accept loop; stop() shuts
// down live connections so their threads unblock.
// ============================================================

#include "../common/platform.hpp"
#include "../common/socket.hpp"
#include "../common/stream_transport.hpp"
#include "file_store.hpp"
#include <atomic>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

class ThreadedServer {
public:
    explicit ThreadedServer(FileStore& store);
    ~ThreadedServer();

    ThreadedServer(const ThreadedServer&) = delete;
    ThreadedServer& operator=(const ThreadedServer&) = delete;

    void bind(const std::string& ip, u16 port);
    u16  port() const { return listen_sock_.local_port(); }

    // Blocks until stop()
    void run();
    void stop();

    size_t active_sessions() const;

private:
    struct Worker {
        std::thread       thread;
        StreamTransport*  transport{nullptr};  // guarded by workers_mutex_
        bool              done{false};         // guarded by workers_mutex_
    };

    FileStore&        store_;
    TcpSocket         listen_sock_;
    std::atomic<bool> running_{false};

    mutable std::mutex                 workers_mutex_;
    std::list<std::shared_ptr<Worker>> workers_;

    void accept_loop();
    void session_thread(std::shared_ptr<Worker> w, std::unique_ptr<StreamTransport> transport);
    void reap_finished();
    void join_all();
};
