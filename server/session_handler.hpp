#pragma once

// ============================================================
// session_handler.hpp -- Blocking server side of one session
//
// Runs the command loop over any Transport: thread-per-connection
// streams call run(), the datagram service calls serve_one() once
// per request/response cycle.
// ============================================================

#include "../common/transport.hpp"
#include "../common/command.hpp"
#include "../common/file_io.hpp"
#include "file_store.hpp"

class SessionHandler {
public:
    SessionHandler(Transport& transport, FileStore& store);

    // Serve commands until CLOSE. TransportError propagates to the caller.
    void run();

    // Read and answer one command. Returns false when the session is over
    // (CLOSE, or a failure that leaves the byte stream out of sync).
    bool serve_one();

private:
    Transport& t_;
    FileStore& store_;

    bool handle_upload(const cmd::Command& c);
    bool handle_download(const cmd::Command& c);

    // Receive the rest of the upload (from offset) into file
    bool receive_upload(UploadPlan& plan, file_io::AppendFile& file, u64 offset);
    void send_file(const DownloadPlan& plan, file_io::FileReader& reader, u64 offset);
};
