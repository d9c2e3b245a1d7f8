// ============================================================
// server/main.cpp -- TwinFT server entry point
// ============================================================

#include "../common/platform.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include "server_app.hpp"
#include <iostream>
#include <string>
#include <cstring>
#include <cstdlib>
#include <csignal>

static ServerApp* g_app = nullptr;

static void sig_handler(int /*sig*/) {
    if (g_app) g_app->stop();
}

static void print_usage(const char* prog) {
    std::cerr
        << "Usage: " << prog << " [storage_dir] [ip] [port] [options]\n"
        << "\n"
        << "  storage_dir    directory holding served files (default: server_files)\n"
        << "  ip             IP address to listen on (default: 0.0.0.0)\n"
        << "  port           TCP and UDP port (default: " << TWINFT_DEFAULT_PORT << ")\n"
        << "\nOptions:\n"
        << "  --event-loop   single-threaded event loop instead of thread per connection\n"
        << "  --no-udp       do not serve the datagram transport\n"
        << "  --log-file F   also append log lines to F\n"
        << "  --verbose      enable debug logging\n"
        << "\nExample:\n"
        << "  " << prog << " /srv/twinft 0.0.0.0 12345 --event-loop\n";
}

int main(int argc, char* argv[]) {
    platform::Guard platform_guard;

    ServerConfig cfg;
    int port_int = TWINFT_DEFAULT_PORT;
    int positional = 0;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--event-loop") == 0) {
            cfg.model = ServerModel::EVENT_LOOP;
        } else if (std::strcmp(argv[i], "--no-udp") == 0) {
            cfg.enable_udp = false;
        } else if (std::strcmp(argv[i], "--log-file") == 0 && i + 1 < argc) {
            Logger::get().set_log_file(argv[++i]);
        } else if (std::strcmp(argv[i], "--verbose") == 0) {
            Logger::get().set_level(LogLevel::DEBUG);
        } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if (argv[i][0] == '-') {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        } else if (positional == 0) {
            cfg.storage_dir = argv[i];
            ++positional;
        } else if (positional == 1) {
            cfg.listen_ip = argv[i];
            ++positional;
        } else if (positional == 2) {
            port_int = std::atoi(argv[i]);
            ++positional;
        } else {
            print_usage(argv[0]);
            return 1;
        }
    }

    if (cfg.storage_dir.empty()) {
        std::cerr << "ERROR: Invalid storage_dir\n";
        return 1;
    }
    if (cfg.listen_ip != "0.0.0.0" && !utils::validate_ip(cfg.listen_ip)) {
        std::cerr << "ERROR: Invalid IP address: " << cfg.listen_ip << "\n";
        return 1;
    }
    if (!utils::validate_port(port_int)) {
        std::cerr << "ERROR: Invalid port: " << port_int << "\n";
        return 1;
    }
    cfg.listen_port = (u16)port_int;

    try {
        ServerApp app(std::move(cfg));
        g_app = &app;

        std::signal(SIGINT,  sig_handler);
        std::signal(SIGTERM, sig_handler);
#ifndef _WIN32
        std::signal(SIGPIPE, SIG_IGN);
#endif

        int rc = app.run();
        g_app = nullptr;
        return rc;
    } catch (const std::exception& e) {
        std::cerr << "FATAL: " << e.what() << "\n";
        return 2;
    }
}
