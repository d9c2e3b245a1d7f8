#pragma once

// ============================================================
// client_app.hpp -- TwinFT client: interactive command loop
//   over TCP (one persistent session) or UDP (one exchange
//   per command), with reconnect on the next command after a
//   dropped connection
// ============================================================

#include "../common/platform.hpp"
#include "../common/protocol.hpp"
#include "../common/reliable_channel.hpp"
#include "../common/transport.hpp"
#include "../common/udp_socket.hpp"
#include "transfer_client.hpp"
#include <atomic>
#include <iosfwd>
#include <memory>
#include <string>

enum class ClientTransport {
    TCP,
    UDP,
};

struct ClientConfig {
    std::string     download_dir{"client_downloads"};
    std::string     server_ip{"127.0.0.1"};
    u16             server_port{TWINFT_DEFAULT_PORT};
    ClientTransport transport{ClientTransport::TCP};
    ArqConfig       arq;
};

class ClientApp {
public:
    explicit ClientApp(ClientConfig config);
    ~ClientApp();

    // Read commands from `in` until CLOSE/QUIT, EOF or stop().
    // Returns 0 on a clean exit.
    int run(std::istream& in, std::ostream& out);

    // Execute one input line. Returns false when the session is over.
    bool execute(const std::string& line, std::ostream& out);

    void stop() { stop_.store(true); }

private:
    ClientConfig      config_;
    std::atomic<bool> stop_{false};

    std::unique_ptr<UdpSocket>       udp_;
    std::unique_ptr<ReliableChannel> arq_;
    std::unique_ptr<Transport>       transport_;
    std::unique_ptr<TransferClient>  client_;

    void connect();
    void disconnect();
    void print_help(std::ostream& out) const;
    void print_result(const std::string& what, const TransferResult& r, std::ostream& out) const;
};
