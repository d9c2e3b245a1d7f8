#pragma once

// ============================================================
// event_loop_server.hpp -- Single-threaded poll() stream engine
//
// One thread polls the listener and every connection. Each
// connection is a ConnectionState whose protocol position is a
// tagged variant:
//
//   Idle --UPLOAD--> AwaitingUploadReply --OK/RESTART--> ReceivingUpload --done--> Idle
//   Idle --DOWNLOAD--> AwaitingDownloadOffset --match--> SendingDownload --EOF--> Idle
//
// Reads and writes never block; partial I/O resumes on the next
// readiness event. Commands go through the same grammar and
// FileStore decisions as SessionHandler.
// ============================================================

#include "../common/platform.hpp"
#include "../common/socket.hpp"
#include "../common/file_io.hpp"
#include "file_store.hpp"
#include <atomic>
#include <memory>
#include <string>
#include <variant>
#include <vector>

class EventLoopServer {
public:
    explicit EventLoopServer(FileStore& store);
    ~EventLoopServer();

    EventLoopServer(const EventLoopServer&) = delete;
    EventLoopServer& operator=(const EventLoopServer&) = delete;

    void bind(const std::string& ip, u16 port);
    u16  port() const { return listen_sock_.local_port(); }

    // Blocks until stop(); safe to call stop() from another thread
    void run();
    void stop() { running_.store(false); }

    size_t connection_count() const { return conn_count_.load(); }

private:
    struct Idle {};
    struct AwaitingUploadReply {
        UploadPlan          plan;
        file_io::AppendFile file;
    };
    struct ReceivingUpload {
        UploadPlan          plan;
        file_io::AppendFile file;
        u64                 offset{0};
        u64                 remaining{0};
    };
    struct AwaitingDownloadOffset {
        DownloadPlan plan;
        bool         restarted{false};
    };
    struct SendingDownload {
        DownloadPlan        plan;
        file_io::FileReader file;
        u64                 pos{0};
    };
    using State = std::variant<Idle, AwaitingUploadReply, ReceivingUpload,
                               AwaitingDownloadOffset, SendingDownload>;

    struct ConnectionState {
        TcpSocket        sock;
        std::string      peer;
        State            state;
        std::vector<u8>  in;        // unconsumed inbound bytes
        std::vector<u8>  out;       // pending outbound bytes
        size_t           out_pos{0};
        bool             closing{false};  // close once `out` drains
        bool             dead{false};

        explicit ConnectionState(TcpSocket s) : sock(std::move(s)), state(Idle{}) {}
    };
    using ConnPtr = std::unique_ptr<ConnectionState>;

    FileStore&           store_;
    TcpSocket            listen_sock_;
    std::atomic<bool>    running_{false};
    std::atomic<size_t>  conn_count_{0};
    std::vector<ConnPtr> conns_;
    std::vector<u8>      scratch_;

    void accept_pending();
    void on_readable(ConnectionState& c);
    void on_writable(ConnectionState& c);
    void process_input(ConnectionState& c);
    void handle_line(ConnectionState& c, const std::string& line);

    void on_idle_line(ConnectionState& c, const std::string& line);
    void on_upload_reply(ConnectionState& c, const std::string& line);
    void on_download_offset(ConnectionState& c, const std::string& line);
    void begin_upload(ConnectionState& c, UploadPlan plan, file_io::AppendFile file, u64 offset);
    void consume_upload_bytes(ConnectionState& c);
    void fill_download_chunk(ConnectionState& c);

    void queue_line(ConnectionState& c, const std::string& text);
    bool has_output(const ConnectionState& c) const { return c.out_pos < c.out.size(); }
    bool wants_read(const ConnectionState& c) const;
    bool wants_write(const ConnectionState& c) const;
    void kill(ConnectionState& c, const std::string& why);
    void sweep_dead();
};
