#pragma once

// ============================================================
// file_store.hpp -- Server storage directory and the decisions
//                   both engines share: upload/download plans,
//                   resume checks, per-file upload locks
// ============================================================

#include "../common/platform.hpp"
#include "../common/command.hpp"
#include <mutex>
#include <set>
#include <string>

class FileStore;

// Exclusive right to upload one file name; released on destruction
class UploadLease {
public:
    UploadLease() = default;
    UploadLease(FileStore* store, std::string name)
        : store_(store), name_(std::move(name)) {}
    ~UploadLease() { release(); }

    UploadLease(const UploadLease&) = delete;
    UploadLease& operator=(const UploadLease&) = delete;
    UploadLease(UploadLease&& o) noexcept
        : store_(o.store_), name_(std::move(o.name_)) { o.store_ = nullptr; }
    UploadLease& operator=(UploadLease&& o) noexcept {
        if (this != &o) {
            release();
            store_ = o.store_;
            name_  = std::move(o.name_);
            o.store_ = nullptr;
        }
        return *this;
    }

    bool held() const { return store_ != nullptr; }
    void release();

private:
    FileStore*  store_{nullptr};
    std::string name_;
};

struct UploadPlan {
    std::string error;     // non-empty: send it and stay idle
    std::string name;
    std::string path;
    u64         size{0};
    u64         current{0};
    std::string checksum;  // of the first `current` stored bytes
    UploadLease lease;

    bool ok() const { return error.empty(); }
};

struct DownloadPlan {
    std::string error;
    std::string name;
    std::string path;
    u64         size{0};

    bool ok() const { return error.empty(); }
};

class FileStore {
public:
    explicit FileStore(std::string root);

    // Create the storage directory if needed
    void bootstrap();

    const std::string& root() const { return root_; }
    std::string path_of(const std::string& name) const;

    // Reply line for ECHO, TIME, LIST and unknown/empty commands
    std::string stateless_reply(const cmd::Command& c) const;

    // Validate UPLOAD args, take the upload lock, measure the stored prefix
    UploadPlan plan_upload(const cmd::Command& c);

    // Validate DOWNLOAD args and snapshot the file size
    DownloadPlan plan_download(const cmd::Command& c) const;

    // Discard stored bytes after a RESTART
    void restart_upload(UploadPlan& plan);

    // True when the peer's copy of the first `offset` bytes equals ours
    // and we hold at least that many (download resume)
    bool prefix_matches(const std::string& path, u64 stored_size,
                        u64 offset, const std::string& checksum) const;

    bool upload_in_progress(const std::string& name) const;

private:
    friend class UploadLease;

    std::string root_;

    mutable std::mutex    locks_mutex_;
    std::set<std::string> uploading_;

    bool try_lock_upload(const std::string& name);
    void unlock_upload(const std::string& name);
};
