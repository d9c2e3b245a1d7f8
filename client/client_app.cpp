// ============================================================
// client_app.cpp -- TwinFT client implementation
// ============================================================

#include "client_app.hpp"
#include "../common/command.hpp"
#include "../common/datagram_transport.hpp"
#include "../common/errors.hpp"
#include "../common/logger.hpp"
#include "../common/socket.hpp"
#include "../common/stream_transport.hpp"
#include "../common/utils.hpp"
#include <iostream>

ClientApp::ClientApp(ClientConfig config)
    : config_(std::move(config)) {}

ClientApp::~ClientApp() {
    disconnect();
}

void ClientApp::connect() {
    if (transport_) return;
    if (config_.transport == ClientTransport::UDP) {
        udp_ = std::make_unique<UdpSocket>();
        udp_->bind("0.0.0.0", 0);
        udp_->tune();
        arq_ = std::make_unique<ReliableChannel>(*udp_, config_.arq);
        transport_ = std::make_unique<DatagramTransport>(
            *arq_, PeerAddr::from(config_.server_ip, config_.server_port));
    } else {
        TcpSocket sock;
        sock.connect(config_.server_ip, config_.server_port);
        transport_ = std::make_unique<StreamTransport>(std::move(sock));
    }
    client_ = std::make_unique<TransferClient>(*transport_);
    client_->set_progress([](const TransferStats& s) {
        LOG_DEBUG("progress " + utils::format_bytes(s.bytes_done) + " / " +
                  utils::format_bytes(s.bytes_total) + " (" +
                  utils::format_percent(s.bytes_done, s.bytes_total) + ")");
    });
    LOG_INFO("Connected to " + transport_->peer_name());
}

void ClientApp::disconnect() {
    client_.reset();
    transport_.reset();
    arq_.reset();
    udp_.reset();
}

int ClientApp::run(std::istream& in, std::ostream& out) {
    print_help(out);
    std::string line;
    while (!stop_.load()) {
        out << "> " << std::flush;
        if (!std::getline(in, line)) break;
        if (!execute(line, out)) break;
    }
    disconnect();
    return 0;
}

bool ClientApp::execute(const std::string& raw, std::ostream& out) {
    std::string line = utils::trim(raw);
    if (line.empty()) return true;

    cmd::Command c = cmd::parse(line);
    std::string kw = utils::to_upper(c.keyword);
    if (kw == "HELP") {
        print_help(out);
        return true;
    }
    if (kw == "QUIT" || kw == "EXIT") return false;

    try {
        connect();
        switch (c.kind) {
        case cmd::Kind::UPLOAD: {
            if (c.args.empty()) {
                out << "usage: UPLOAD <local_path> [remote_name]\n";
                return true;
            }
            TransferResult r = client_->upload(c.args[0], c.args.size() > 1 ? c.args[1] : "");
            print_result("upload", r, out);
            return true;
        }
        case cmd::Kind::DOWNLOAD: {
            if (c.args.empty()) {
                out << "usage: DOWNLOAD <name>\n";
                return true;
            }
            TransferResult r = client_->download(c.args[0], config_.download_dir);
            print_result("download", r, out);
            return true;
        }
        case cmd::Kind::CLOSE:
            out << client_->request(line) << "\n";
            disconnect();
            return false;
        default:
            out << client_->request(line) << "\n";
            return true;
        }
    } catch (const TransportError& e) {
        Logger::get().transfer_error(line + ": " + e.what());
        out << "connection error: " << e.what() << "\n";
        // Next command reconnects
        disconnect();
        return true;
    } catch (const FilesystemError& e) {
        out << "local file error: " << e.what() << "\n";
        return true;
    } catch (const std::runtime_error& e) {
        out << "error: " << e.what() << "\n";
        disconnect();
        return true;
    }
}

void ClientApp::print_help(std::ostream& out) const {
    out << "Commands:\n"
        << "  ECHO <text>                    server repeats text\n"
        << "  TIME                           server local time\n"
        << "  LIST                           files stored on the server\n"
        << "  UPLOAD <path> [name]           send a file (resumes partial uploads)\n"
        << "  DOWNLOAD <name>                fetch a file into " << config_.download_dir << "\n"
        << "  CLOSE                          end the session\n"
        << "  HELP | QUIT\n";
}

void ClientApp::print_result(const std::string& what, const TransferResult& r, std::ostream& out) const {
    if (!r.ok) {
        out << what << " failed: " << r.message << "\n";
        return;
    }
    const TransferStats& s = r.stats;
    u64 moved = s.bytes_done - s.resumed_from;
    out << what << " complete: " << utils::format_bytes(s.bytes_total);
    if (s.restarted) {
        out << " (restarted, prefix mismatch)";
    } else if (s.resumed_from > 0) {
        out << " (resumed at " << s.resumed_from << ")";
    }
    if (s.elapsed_ms > 0) {
        out << ", " << utils::format_speed((double)moved * 1000.0 / (double)s.elapsed_ms);
    }
    out << "\n";
}
