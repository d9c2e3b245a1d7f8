// ============================================================
// session_handler.cpp
// ============================================================

#include "session_handler.hpp"
#include "../common/errors.hpp"
#include "../common/file_io.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include <algorithm>
#include <vector>

SessionHandler::SessionHandler(Transport& transport, FileStore& store)
    : t_(transport), store_(store) {}

void SessionHandler::run() {
    while (serve_one()) {
    }
}

bool SessionHandler::serve_one() {
    std::string line = t_.receive_line();
    cmd::Command c = cmd::parse(line);
    LOG_DEBUG(t_.peer_name() + " > " + line);

    try {
        switch (c.kind) {
        case cmd::Kind::UPLOAD:
            return handle_upload(c);
        case cmd::Kind::DOWNLOAD:
            return handle_download(c);
        case cmd::Kind::CLOSE:
            t_.send_message(reply::BYE);
            return false;
        default:
            t_.send_message(store_.stateless_reply(c));
            return true;
        }
    } catch (const FilesystemError& e) {
        // Raised before any raw bytes moved: the stream is still in sync
        LOG_ERROR(t_.peer_name() + ": " + e.what());
        t_.send_message(cmd::make_error(e.what()));
        return true;
    }
}

bool SessionHandler::handle_upload(const cmd::Command& c) {
    UploadPlan plan = store_.plan_upload(c);
    if (!plan.ok()) {
        t_.send_message(plan.error);
        return true;
    }
    // Opened before OFFSET so a storage failure is reported while the
    // client is still waiting for a reply line.
    file_io::AppendFile file;
    file.open(plan.path);
    t_.send_message(cmd::make_offset(plan.current, plan.checksum));

    u64 offset = plan.current;
    std::string answer = t_.receive_line();
    switch (cmd::classify_upload_answer(answer)) {
    case cmd::UploadAnswer::PROCEED:
        break;
    case cmd::UploadAnswer::RESTART:
        store_.restart_upload(plan);
        offset = 0;
        t_.send_message(reply::READY);
        break;
    case cmd::UploadAnswer::ABORT:
        LOG_INFO(t_.peer_name() + " aborted upload of " + plan.name);
        return true;
    case cmd::UploadAnswer::INVALID:
        t_.send_message(cmd::make_error("expected OK, RESTART or ABORT"));
        return true;
    }
    return receive_upload(plan, file, offset);
}

bool SessionHandler::receive_upload(UploadPlan& plan, file_io::AppendFile& file, u64 offset) {
    u64 remaining = plan.size - offset;
    const u64 started = utils::now_ms();
    try {
        while (remaining > 0) {
            size_t want = (size_t)std::min<u64>(t_.raw_chunk_size(), remaining);
            std::vector<u8> chunk = t_.receive_some(want);
            if (chunk.size() > remaining) {
                Logger::get().transfer_error("upload " + plan.name + " from " + t_.peer_name() +
                                             ": chunk overruns declared size");
                t_.send_message(cmd::make_error("upload exceeds declared size"));
                return false;
            }
            file.append(chunk.data(), chunk.size());
            remaining -= chunk.size();
        }
    } catch (const TransportError& e) {
        Logger::get().transfer_error("upload " + plan.name + " from " + t_.peer_name() +
                                     " interrupted with " + std::to_string(remaining) +
                                     " bytes left: " + e.what());
        throw;
    } catch (const FilesystemError& e) {
        Logger::get().transfer_error("upload " + plan.name + ": " + e.what());
        t_.send_message(cmd::make_error(e.what()));
        return false;
    }

    t_.send_message(reply::UPLOAD_COMPLETE);
    u64 elapsed_ms = utils::now_ms() - started;
    LOG_INFO("Upload complete: " + plan.name + " (" + utils::format_bytes(plan.size) +
             ", resumed at " + std::to_string(offset) + ", " + std::to_string(elapsed_ms) + " ms)");
    return true;
}

bool SessionHandler::handle_download(const cmd::Command& c) {
    DownloadPlan plan = store_.plan_download(c);
    if (!plan.ok()) {
        t_.send_message(plan.error);
        return true;
    }
    t_.send_message(cmd::make_size(plan.size));

    cmd::OffsetLine off;
    bool restarted = false;
    for (;;) {
        std::string answer = t_.receive_line();
        if (cmd::is_abort(answer)) {
            LOG_INFO(t_.peer_name() + " declined download of " + plan.name);
            return true;
        }
        if (!cmd::parse_offset(answer, off)) {
            t_.send_message(cmd::make_error("expected OFFSET"));
            return true;
        }
        if (store_.prefix_matches(plan.path, plan.size, off.offset, off.checksum)) break;
        if (restarted) {
            t_.send_message(cmd::make_error("resume negotiation failed"));
            return true;
        }
        t_.send_message(reply::RESTART);
        restarted = true;
    }
    file_io::FileReader reader;
    if (off.offset < plan.size) reader.open(plan.path);
    t_.send_message(reply::OK);

    try {
        send_file(plan, reader, off.offset);
    } catch (const FilesystemError& e) {
        // Raw bytes may already be on the wire; the session cannot continue
        Logger::get().transfer_error("download " + plan.name + " to " + t_.peer_name() + ": " + e.what());
        return false;
    }
    LOG_INFO("Download complete: " + plan.name + " (" + utils::format_bytes(plan.size - off.offset) +
             " sent from offset " + std::to_string(off.offset) + ")");
    return true;
}

void SessionHandler::send_file(const DownloadPlan& plan, file_io::FileReader& reader, u64 offset) {
    if (offset >= plan.size) return;
    std::vector<u8> buf(t_.raw_chunk_size());
    u64 pos = offset;
    while (pos < plan.size) {
        size_t want = (size_t)std::min<u64>(buf.size(), plan.size - pos);
        size_t got  = reader.read_at(pos, buf.data(), want);
        if (got == 0) {
            throw FilesystemError(plan.name + " shrank during download");
        }
        t_.send_raw(buf.data(), got);
        pos += got;
    }
}
