#pragma once

// ============================================================
// transfer_client.hpp -- Client side of the session protocol
//
// Drives UPLOAD / DOWNLOAD negotiation (offset + prefix checksum,
// RESTART on divergence) and the raw byte phase over any
// Transport. Transport failures propagate as TransportError;
// refusals by the server come back as a failed TransferResult.
// ============================================================

#include "../common/platform.hpp"
#include "../common/transport.hpp"
#include <functional>
#include <string>

struct TransferStats {
    u64  bytes_total{0};   // full file size
    u64  bytes_done{0};    // bytes on the receiving side so far
    u64  resumed_from{0};  // offset the raw phase started at
    bool restarted{false}; // prefix mismatch forced a restart from zero
    u64  elapsed_ms{0};
};

using ProgressFn = std::function<void(const TransferStats&)>;

struct TransferResult {
    bool          ok{false};
    std::string   message;  // server reply or local error on failure
    TransferStats stats;
};

class TransferClient {
public:
    explicit TransferClient(Transport& transport);

    void set_progress(ProgressFn fn) { progress_ = std::move(fn); }

    // Send one command line, return the single reply line
    std::string request(const std::string& line);

    // Upload local_path; stored under remote_name (default: its basename)
    TransferResult upload(const std::string& local_path, const std::string& remote_name = "");

    // Download name into download_dir, resuming a partial local copy
    TransferResult download(const std::string& name, const std::string& download_dir);

    Transport& transport() { return t_; }

private:
    Transport& t_;
    ProgressFn progress_;

    void report(const TransferStats& s) const {
        if (progress_) progress_(s);
    }
};
