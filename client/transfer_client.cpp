// ============================================================
// transfer_client.cpp
// ============================================================

#include "transfer_client.hpp"
#include "../common/command.hpp"
#include "../common/errors.hpp"
#include "../common/file_io.hpp"
#include "../common/logger.hpp"
#include "../common/protocol.hpp"
#include "../common/utils.hpp"
#include <algorithm>
#include <vector>

static TransferResult failed(const std::string& msg, const TransferStats& stats = TransferStats{}) {
    TransferResult r;
    r.ok      = false;
    r.message = msg;
    r.stats   = stats;
    return r;
}

TransferClient::TransferClient(Transport& transport)
    : t_(transport) {}

std::string TransferClient::request(const std::string& line) {
    t_.send_message(line);
    return t_.receive_line();
}

// ============================================================
// UPLOAD
// ============================================================

TransferResult TransferClient::upload(const std::string& local_path, const std::string& remote_name) {
    if (!file_io::file_exists(local_path)) {
        return failed("local file not found: " + local_path);
    }
    std::string name = file_io::sanitize_name(remote_name.empty() ? local_path : remote_name);
    if (name.empty()) {
        return failed("invalid file name: " + local_path);
    }

    file_io::FileReader reader(local_path);
    TransferStats stats;
    stats.bytes_total = reader.size();
    const u64 started = utils::now_ms();

    t_.send_message(std::string(cmd::UPLOAD) + " " + name + " " + std::to_string(stats.bytes_total));
    std::string line = t_.receive_line();
    if (cmd::is_error(line)) return failed(line, stats);

    cmd::OffsetLine off;
    if (!cmd::parse_offset(line, off)) return failed("unexpected reply: " + line, stats);

    bool same_prefix = false;
    if (off.offset <= stats.bytes_total) {
        same_prefix = file_io::prefix_checksum(local_path, off.offset) == off.checksum;
    }

    u64 offset = off.offset;
    if (same_prefix) {
        t_.send_message(reply::OK);
    } else {
        LOG_INFO("Server copy of " + name + " diverges from local file; restarting upload");
        t_.send_message(reply::RESTART);
        line = t_.receive_line();
        if (line != reply::READY) return failed(cmd::is_error(line) ? line : "expected READY, got: " + line, stats);
        offset = 0;
        stats.restarted = true;
    }
    stats.resumed_from = offset;
    stats.bytes_done   = offset;
    report(stats);

    std::vector<u8> buf(t_.raw_chunk_size());
    while (stats.bytes_done < stats.bytes_total) {
        size_t want = (size_t)std::min<u64>(buf.size(), stats.bytes_total - stats.bytes_done);
        size_t got  = reader.read_at(stats.bytes_done, buf.data(), want);
        if (got == 0) {
            throw FilesystemError(local_path + " shrank during upload");
        }
        t_.send_raw(buf.data(), got);
        stats.bytes_done += got;
        report(stats);
    }

    line = t_.receive_line();
    stats.elapsed_ms = utils::now_ms() - started;
    if (line != reply::UPLOAD_COMPLETE) return failed(line, stats);

    TransferResult r;
    r.ok      = true;
    r.message = line;
    r.stats   = stats;
    return r;
}

// ============================================================
// DOWNLOAD
// ============================================================

TransferResult TransferClient::download(const std::string& name, const std::string& download_dir) {
    std::string base = file_io::sanitize_name(name);
    if (base.empty()) return failed("invalid file name: " + name);
    file_io::ensure_dir(download_dir);
    const std::string local = (fs::path(download_dir) / base).string();
    const u64 started = utils::now_ms();

    t_.send_message(std::string(cmd::DOWNLOAD) + " " + base);
    std::string line = t_.receive_line();
    if (cmd::is_error(line)) return failed(line);

    TransferStats stats;
    if (!cmd::parse_size(line, stats.bytes_total)) return failed("unexpected reply: " + line);

    u64 cur = file_io::get_file_size(local);
    if (cur > stats.bytes_total) {
        LOG_INFO("Local " + base + " is larger than the server copy; discarding it");
        file_io::truncate_file(local);
        cur = 0;
    }
    t_.send_message(cmd::make_offset(cur, file_io::prefix_checksum(local, cur)));

    line = t_.receive_line();
    if (line == reply::RESTART) {
        LOG_INFO("Local " + base + " diverges from the server copy; restarting download");
        file_io::truncate_file(local);
        cur = 0;
        stats.restarted = true;
        t_.send_message(cmd::make_offset(0, EMPTY_CHECKSUM));
        line = t_.receive_line();
    }
    if (line != reply::OK) {
        return failed(cmd::is_error(line) ? line : "unexpected reply: " + line, stats);
    }

    stats.resumed_from = cur;
    stats.bytes_done   = cur;
    report(stats);

    file_io::AppendFile out;
    out.open(local);
    while (stats.bytes_done < stats.bytes_total) {
        u64 remaining = stats.bytes_total - stats.bytes_done;
        size_t want = (size_t)std::min<u64>(t_.raw_chunk_size(), remaining);
        std::vector<u8> chunk = t_.receive_some(want);
        if (chunk.size() > remaining) {
            throw TransportError("download of " + base + " overran the announced size");
        }
        out.append(chunk.data(), chunk.size());
        stats.bytes_done += chunk.size();
        report(stats);
    }
    stats.elapsed_ms = utils::now_ms() - started;

    TransferResult r;
    r.ok      = true;
    r.message = local;
    r.stats   = stats;
    return r;
}
