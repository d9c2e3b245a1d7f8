#pragma once

// ============================================================
// server_app.hpp -- TwinFT server: persistent daemon
//   Serves the storage directory over TCP with the selected
//   concurrency model, and over UDP (same port number) through
//   the datagram service.
//
// Concurrency models:
//   THREADED    accept loop + one session thread per connection
//   EVENT_LOOP  one thread polling every connection
// In both, the UDP socket has its own dedicated thread.
// ============================================================

#include "../common/platform.hpp"
#include "../common/protocol.hpp"
#include "../common/reliable_channel.hpp"
#include "datagram_service.hpp"
#include "event_loop_server.hpp"
#include "file_store.hpp"
#include "threaded_server.hpp"
#include <atomic>
#include <memory>
#include <string>
#include <thread>

enum class ServerModel {
    THREADED,
    EVENT_LOOP,
};

struct ServerConfig {
    std::string storage_dir{"server_files"};
    std::string listen_ip{"0.0.0.0"};
    u16         listen_port{TWINFT_DEFAULT_PORT};  // 0 = ephemeral (tests)
    ServerModel model{ServerModel::THREADED};
    bool        enable_udp{true};
    ArqConfig   arq;
};

class ServerApp {
public:
    explicit ServerApp(ServerConfig config);
    ~ServerApp();

    // Bootstrap storage, bind sockets and launch the engines in the
    // background. Throws on bind/storage failure.
    void start();

    // start(), then block until stop() is requested; returns exit code
    int run();

    // Request shutdown. Only sets a flag: safe from a signal handler.
    void stop() { stop_requested_.store(true); }

    // Stop engines and join their threads
    void shutdown();

    u16 tcp_port() const;
    u16 udp_port() const;

    // Stream connections currently open on the running engine
    size_t open_sessions() const;
    // Datagram request/response cycles completed so far
    u64 datagram_exchanges() const;

    const ServerConfig& config() const { return config_; }
    FileStore& store() { return store_; }

private:
    ServerConfig                     config_;
    FileStore                        store_;
    std::unique_ptr<ThreadedServer>  threaded_;
    std::unique_ptr<EventLoopServer> event_loop_;
    std::unique_ptr<DatagramService> datagram_;
    std::thread                      engine_thread_;
    std::atomic<bool>                stop_requested_{false};
    bool                             started_{false};
};
