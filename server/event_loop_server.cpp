// ============================================================
// event_loop_server.cpp
// ============================================================

#include "event_loop_server.hpp"
#include "../common/command.hpp"
#include "../common/errors.hpp"
#include "../common/logger.hpp"
#include "../common/protocol.hpp"
#include "../common/utils.hpp"
#include <algorithm>

static constexpr int    POLL_INTERVAL_MS = 100;
static constexpr size_t READ_CHUNK       = 64 * 1024;
static constexpr int    MAX_READS_PER_EVENT = 16;
// Stop parsing and reading pipelined commands while this much output is queued
static constexpr size_t OUT_HIGH_WATER   = 1024 * 1024;
// Stop reading while this much unparsed input is buffered; holds a
// full-length line with room to spare
static constexpr size_t IN_HIGH_WATER    = 4 * MAX_LINE_LEN;

EventLoopServer::EventLoopServer(FileStore& store)
    : store_(store), scratch_(READ_CHUNK) {}

EventLoopServer::~EventLoopServer() {
    stop();
    conns_.clear();
}

void EventLoopServer::bind(const std::string& ip, u16 port) {
    listen_sock_.bind_and_listen(ip, port);
    listen_sock_.set_nonblocking(true);
    running_.store(true);
}

void EventLoopServer::run() {
    LOG_INFO("Event-loop engine listening on port " + std::to_string(port()));
    std::vector<pollfd_t> pfds;

    while (running_.load()) {
        pfds.clear();
        pollfd_t lp{};
        lp.fd     = listen_sock_.native();
        lp.events = POLLIN;
        pfds.push_back(lp);

        const size_t polled = conns_.size();
        for (auto& c : conns_) {
            pollfd_t p{};
            p.fd = c->sock.native();
            if (wants_read(*c)) p.events |= POLLIN;
            if (wants_write(*c)) p.events |= POLLOUT;
            pfds.push_back(p);
        }

        int rc = POLL_SOCKETS(pfds.data(), (unsigned long)pfds.size(), POLL_INTERVAL_MS);
        if (rc < 0) {
            int err = last_socket_error();
            if (interrupted(err)) continue;
            throw std::runtime_error("poll() failed: " + socket_error_str(err));
        }
        if (rc == 0) continue;

        for (size_t i = 0; i < polled; ++i) {
            ConnectionState& c = *conns_[i];
            short re = pfds[i + 1].revents;
            if (re == 0 || c.dead) continue;
            try {
                if (re & POLLNVAL) {
                    kill(c, "invalid socket");
                    continue;
                }
                if (re & (POLLIN | POLLHUP | POLLERR)) on_readable(c);
                if (!c.dead && (re & POLLOUT)) on_writable(c);
            } catch (const ConnectionLost& e) {
                kill(c, e.what());
            } catch (const std::exception& e) {
                LOG_ERROR("Connection " + c.peer + ": " + e.what());
                kill(c, "internal error");
            }
        }
        if (pfds[0].revents & POLLIN) accept_pending();
        sweep_dead();
    }

    for (auto& c : conns_) kill(*c, "server stopping");
    sweep_dead();
}

void EventLoopServer::accept_pending() {
    for (;;) {
        TcpSocket sock(INVALID_SOCKET_VAL);
        try {
            if (!listen_sock_.try_accept(sock)) return;
            sock.set_nonblocking(true);
            sock.tune();
        } catch (const std::exception& e) {
            LOG_ERROR("accept: " + std::string(e.what()));
            return;
        }
        auto c = std::make_unique<ConnectionState>(std::move(sock));
        c->peer = c->sock.peer_addr();
        LOG_INFO("Session started: " + c->peer);
        conns_.push_back(std::move(c));
        conn_count_.store(conns_.size());
    }
}

// ============================================================
// Readiness handlers
// ============================================================

void EventLoopServer::on_readable(ConnectionState& c) {
    bool peer_closed = false;
    for (int i = 0; i < MAX_READS_PER_EVENT && wants_read(c); ++i) {
        i64 n = c.sock.try_recv(scratch_.data(), scratch_.size());
        if (n < 0) break;
        if (n == 0) {
            peer_closed = true;
            break;
        }
        c.in.insert(c.in.end(), scratch_.begin(), scratch_.begin() + (std::ptrdiff_t)n);
        if ((size_t)n < scratch_.size()) break;
    }
    process_input(c);
    if (peer_closed && !c.dead) kill(c, "peer closed the connection");
}

void EventLoopServer::on_writable(ConnectionState& c) {
    for (;;) {
        if (has_output(c)) {
            i64 n = c.sock.try_send(c.out.data() + c.out_pos, c.out.size() - c.out_pos);
            if (n < 0) return;  // would block: resume on next POLLOUT
            c.out_pos += (size_t)n;
            if (!has_output(c)) {
                c.out.clear();
                c.out_pos = 0;
            }
            continue;
        }
        if (std::holds_alternative<SendingDownload>(c.state)) {
            fill_download_chunk(c);
            continue;
        }
        break;
    }
    if (c.closing) {
        kill(c, "closed by client");
        return;
    }
    // Lines pipelined behind a download or a large reply
    process_input(c);
}

bool EventLoopServer::wants_read(const ConnectionState& c) const {
    if (c.closing || c.dead) return false;
    // Unread bytes stay in the kernel, so a peer that never reads replies blocks
    if (c.out.size() - c.out_pos > OUT_HIGH_WATER) return false;
    return c.in.size() < IN_HIGH_WATER;
}

bool EventLoopServer::wants_write(const ConnectionState& c) const {
    return has_output(c) || std::holds_alternative<SendingDownload>(c.state) ||
           (c.closing && !c.dead);
}

// ============================================================
// Input processing
// ============================================================

void EventLoopServer::process_input(ConnectionState& c) {
    while (!c.dead && !c.closing) {
        if (std::holds_alternative<ReceivingUpload>(c.state)) {
            if (c.in.empty()) break;
            consume_upload_bytes(c);
            continue;
        }
        if (std::holds_alternative<SendingDownload>(c.state)) break;
        if (c.out.size() - c.out_pos > OUT_HIGH_WATER) break;

        auto nl = std::find(c.in.begin(), c.in.end(), (u8)'\n');
        if (nl == c.in.end()) {
            if (c.in.size() > MAX_LINE_LEN) {
                kill(c, "line exceeds " + std::to_string(MAX_LINE_LEN) + " bytes");
            }
            break;
        }
        std::string line(c.in.begin(), nl);
        c.in.erase(c.in.begin(), nl + 1);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        handle_line(c, line);
    }
}

void EventLoopServer::handle_line(ConnectionState& c, const std::string& line) {
    LOG_DEBUG(c.peer + " > " + line);
    try {
        if (std::holds_alternative<Idle>(c.state)) {
            on_idle_line(c, line);
        } else if (std::holds_alternative<AwaitingUploadReply>(c.state)) {
            on_upload_reply(c, line);
        } else if (std::holds_alternative<AwaitingDownloadOffset>(c.state)) {
            on_download_offset(c, line);
        }
    } catch (const FilesystemError& e) {
        // No raw bytes have moved in any of these states
        LOG_ERROR(c.peer + ": " + e.what());
        queue_line(c, cmd::make_error(e.what()));
        c.state = Idle{};
    }
}

void EventLoopServer::on_idle_line(ConnectionState& c, const std::string& line) {
    cmd::Command command = cmd::parse(line);
    switch (command.kind) {
    case cmd::Kind::UPLOAD: {
        UploadPlan plan = store_.plan_upload(command);
        if (!plan.ok()) {
            queue_line(c, plan.error);
            return;
        }
        file_io::AppendFile file;
        file.open(plan.path);
        queue_line(c, cmd::make_offset(plan.current, plan.checksum));
        c.state = AwaitingUploadReply{std::move(plan), std::move(file)};
        return;
    }
    case cmd::Kind::DOWNLOAD: {
        DownloadPlan plan = store_.plan_download(command);
        if (!plan.ok()) {
            queue_line(c, plan.error);
            return;
        }
        queue_line(c, cmd::make_size(plan.size));
        c.state = AwaitingDownloadOffset{std::move(plan), false};
        return;
    }
    case cmd::Kind::CLOSE:
        queue_line(c, reply::BYE);
        c.closing = true;
        return;
    default:
        queue_line(c, store_.stateless_reply(command));
        return;
    }
}

void EventLoopServer::on_upload_reply(ConnectionState& c, const std::string& line) {
    auto& st = std::get<AwaitingUploadReply>(c.state);
    switch (cmd::classify_upload_answer(line)) {
    case cmd::UploadAnswer::PROCEED: {
        u64 offset = st.plan.current;
        begin_upload(c, std::move(st.plan), std::move(st.file), offset);
        return;
    }
    case cmd::UploadAnswer::RESTART:
        store_.restart_upload(st.plan);
        queue_line(c, reply::READY);
        begin_upload(c, std::move(st.plan), std::move(st.file), 0);
        return;
    case cmd::UploadAnswer::ABORT:
        LOG_INFO(c.peer + " aborted upload of " + st.plan.name);
        c.state = Idle{};
        return;
    case cmd::UploadAnswer::INVALID:
        queue_line(c, cmd::make_error("expected OK, RESTART or ABORT"));
        c.state = Idle{};
        return;
    }
}

void EventLoopServer::begin_upload(ConnectionState& c, UploadPlan plan,
                                   file_io::AppendFile file, u64 offset) {
    u64 remaining = plan.size - offset;
    if (remaining == 0) {
        queue_line(c, reply::UPLOAD_COMPLETE);
        LOG_INFO("Upload complete: " + plan.name + " (" + utils::format_bytes(plan.size) + ")");
        c.state = Idle{};
        return;
    }
    c.state = ReceivingUpload{std::move(plan), std::move(file), offset, remaining};
}

void EventLoopServer::consume_upload_bytes(ConnectionState& c) {
    auto& st = std::get<ReceivingUpload>(c.state);
    size_t take = (size_t)std::min<u64>(c.in.size(), st.remaining);
    try {
        st.file.append(c.in.data(), take);
    } catch (const FilesystemError& e) {
        Logger::get().transfer_error("upload " + st.plan.name + " from " + c.peer + ": " + e.what());
        queue_line(c, cmd::make_error(e.what()));
        c.in.clear();
        c.state = Idle{};
        c.closing = true;  // the rest of the raw stream cannot be resynchronised
        return;
    }
    c.in.erase(c.in.begin(), c.in.begin() + (std::ptrdiff_t)take);
    st.remaining -= take;
    if (st.remaining == 0) {
        queue_line(c, reply::UPLOAD_COMPLETE);
        LOG_INFO("Upload complete: " + st.plan.name + " (" + utils::format_bytes(st.plan.size) +
                 ", resumed at " + std::to_string(st.offset) + ")");
        c.state = Idle{};
    }
}

void EventLoopServer::on_download_offset(ConnectionState& c, const std::string& line) {
    auto& st = std::get<AwaitingDownloadOffset>(c.state);
    if (cmd::is_abort(line)) {
        LOG_INFO(c.peer + " declined download of " + st.plan.name);
        c.state = Idle{};
        return;
    }
    cmd::OffsetLine off;
    if (!cmd::parse_offset(line, off)) {
        queue_line(c, cmd::make_error("expected OFFSET"));
        c.state = Idle{};
        return;
    }
    if (!store_.prefix_matches(st.plan.path, st.plan.size, off.offset, off.checksum)) {
        if (st.restarted) {
            queue_line(c, cmd::make_error("resume negotiation failed"));
            c.state = Idle{};
        } else {
            queue_line(c, reply::RESTART);
            st.restarted = true;
        }
        return;
    }

    DownloadPlan plan = std::move(st.plan);
    if (off.offset >= plan.size) {
        queue_line(c, reply::OK);
        LOG_INFO("Download complete: " + plan.name + " (nothing to send)");
        c.state = Idle{};
        return;
    }
    file_io::FileReader reader(plan.path);
    queue_line(c, reply::OK);
    c.state = SendingDownload{std::move(plan), std::move(reader), off.offset};
}

void EventLoopServer::fill_download_chunk(ConnectionState& c) {
    auto& st = std::get<SendingDownload>(c.state);
    if (st.pos >= st.plan.size) {
        LOG_INFO("Download complete: " + st.plan.name + " (" + utils::format_bytes(st.plan.size) + ")");
        c.state = Idle{};
        return;
    }
    size_t want = (size_t)std::min<u64>(DISK_CHUNK_SIZE, st.plan.size - st.pos);
    c.out.resize(want);
    c.out_pos = 0;
    size_t got = st.file.read_at(st.pos, c.out.data(), want);
    if (got == 0) {
        c.out.clear();
        throw FilesystemError(st.plan.name + " shrank during download");
    }
    c.out.resize(got);
    st.pos += got;
}

// ============================================================
// Helpers
// ============================================================

void EventLoopServer::queue_line(ConnectionState& c, const std::string& text) {
    c.out.insert(c.out.end(), text.begin(), text.end());
    c.out.push_back('\n');
}

void EventLoopServer::kill(ConnectionState& c, const std::string& why) {
    if (c.dead) return;
    c.dead = true;
    if (auto* up = std::get_if<ReceivingUpload>(&c.state)) {
        Logger::get().transfer_error("upload " + up->plan.name + " from " + c.peer +
                                     " interrupted with " + std::to_string(up->remaining) +
                                     " bytes left: " + why);
    } else if (auto* down = std::get_if<SendingDownload>(&c.state)) {
        Logger::get().transfer_error("download " + down->plan.name + " to " + c.peer +
                                     " interrupted at " + std::to_string(down->pos) + ": " + why);
    }
    LOG_INFO("Session " + c.peer + " ended: " + why);
    c.state = Idle{};
    c.sock.close();
}

void EventLoopServer::sweep_dead() {
    conns_.erase(std::remove_if(conns_.begin(), conns_.end(),
                                [](const ConnPtr& c) { return c->dead; }),
                 conns_.end());
    conn_count_.store(conns_.size());
}
