// ============================================================
// client/main.cpp -- TwinFT client entry point
// ============================================================

#include "../common/platform.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include "client_app.hpp"
#include <iostream>
#include <string>
#include <cstdlib>
#include <cstring>
#include <csignal>

static ClientApp* g_app = nullptr;

static void sig_handler(int /*sig*/) {
    if (g_app) g_app->stop();
}

static void print_usage(const char* prog) {
    std::cerr
        << "Usage: " << prog << " [ip] [port] [options]\n"
        << "\n"
        << "  ip              twinft_server IP address (default: 127.0.0.1)\n"
        << "  port            server port (default: " << TWINFT_DEFAULT_PORT << ")\n"
        << "\nOptions:\n"
        << "  --udp           use the datagram transport instead of TCP\n"
        << "  --dir D         download directory (default: client_downloads)\n"
        << "  --verbose       enable debug logging\n"
        << "\nCommands are read from standard input; type HELP for the list.\n"
        << "\nExamples:\n"
        << "  " << prog << " 192.168.1.1 12345\n"
        << "  " << prog << " 192.168.1.1 12345 --udp\n";
}

int main(int argc, char* argv[]) {
    platform::Guard platform_guard;

#ifndef _WIN32
    // Broken sockets surface as EPIPE, not a fatal signal
    signal(SIGPIPE, SIG_IGN);
#endif

    ClientConfig cfg;
    int port_int   = TWINFT_DEFAULT_PORT;
    int positional = 0;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--udp") == 0) {
            cfg.transport = ClientTransport::UDP;
        } else if (std::strcmp(argv[i], "--dir") == 0 && i + 1 < argc) {
            cfg.download_dir = argv[++i];
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
            cfg.server_ip = argv[i];
            ++positional;
        } else if (positional == 1) {
            port_int = std::atoi(argv[i]);
            ++positional;
        } else {
            print_usage(argv[0]);
            return 1;
        }
    }

    if (!utils::validate_ip(cfg.server_ip)) {
        std::cerr << "ERROR: Invalid IP address: " << cfg.server_ip << "\n";
        return 1;
    }
    if (!utils::validate_port(port_int)) {
        std::cerr << "ERROR: Invalid port: " << port_int << "\n";
        return 1;
    }
    cfg.server_port = (u16)port_int;

    try {
        ClientApp app(std::move(cfg));
        g_app = &app;

        std::signal(SIGINT,  sig_handler);
        std::signal(SIGTERM, sig_handler);

        int rc = app.run(std::cin, std::cout);
        g_app = nullptr;
        return rc;
    } catch (const std::exception& e) {
        std::cerr << "FATAL: " << e.what() << "\n";
        return 2;
    }
}
