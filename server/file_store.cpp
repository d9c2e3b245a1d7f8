// ============================================================
// file_store.cpp
// ============================================================

#include "file_store.hpp"
#include "../common/errors.hpp"
#include "../common/file_io.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"

// ============================================================
// UploadLease
// ============================================================

void UploadLease::release() {
    if (store_) {
        store_->unlock_upload(name_);
        store_ = nullptr;
    }
}

// ============================================================
// FileStore
// ============================================================

FileStore::FileStore(std::string root)
    : root_(std::move(root)) {}

void FileStore::bootstrap() {
    file_io::ensure_dir(root_);
    LOG_INFO("Storage directory: " + fs::absolute(root_).string());
}

std::string FileStore::path_of(const std::string& name) const {
    return (fs::path(root_) / name).string();
}

std::string FileStore::stateless_reply(const cmd::Command& c) const {
    switch (c.kind) {
    case cmd::Kind::EMPTY:
        return cmd::make_error("empty command");
    case cmd::Kind::ECHO:
        return c.rest;
    case cmd::Kind::TIME:
        return utils::local_time_string();
    case cmd::Kind::LIST: {
        auto names = file_io::list_files(root_);
        if (names.empty()) return reply::NO_FILES;
        std::string out;
        for (size_t i = 0; i < names.size(); ++i) {
            if (i) out += ", ";
            out += names[i];
        }
        return out;
    }
    case cmd::Kind::CLOSE:
        return reply::BYE;
    case cmd::Kind::UPLOAD:
    case cmd::Kind::DOWNLOAD:
    case cmd::Kind::UNKNOWN:
        break;
    }
    return cmd::make_error("unknown command " + c.keyword);
}

UploadPlan FileStore::plan_upload(const cmd::Command& c) {
    UploadPlan plan;
    if (c.args.size() != 2) {
        plan.error = cmd::make_error("usage: UPLOAD <name> <size>");
        return plan;
    }
    plan.name = file_io::sanitize_name(c.args[0]);
    if (plan.name.empty()) {
        plan.error = cmd::make_error("invalid file name");
        return plan;
    }
    if (!utils::parse_u64(c.args[1], plan.size)) {
        plan.error = cmd::make_error("invalid size");
        return plan;
    }
    if (!try_lock_upload(plan.name)) {
        plan.error = cmd::make_error("file is busy");
        return plan;
    }
    plan.lease = UploadLease(this, plan.name);

    plan.path    = path_of(plan.name);
    plan.current = file_io::get_file_size(plan.path);
    if (plan.current > plan.size || (plan.size > 0 && plan.current == plan.size)) {
        plan.lease.release();
        plan.error = cmd::make_error("file already exists");
        return plan;
    }
    plan.checksum = file_io::prefix_checksum(plan.path, plan.current);
    return plan;
}

DownloadPlan FileStore::plan_download(const cmd::Command& c) const {
    DownloadPlan plan;
    if (c.args.size() != 1) {
        plan.error = cmd::make_error("usage: DOWNLOAD <name>");
        return plan;
    }
    plan.name = file_io::sanitize_name(c.args[0]);
    if (plan.name.empty()) {
        plan.error = cmd::make_error("invalid file name");
        return plan;
    }
    plan.path = path_of(plan.name);
    if (!file_io::file_exists(plan.path)) {
        plan.error = cmd::make_error("not found");
        return plan;
    }
    plan.size = file_io::get_file_size(plan.path);
    return plan;
}

void FileStore::restart_upload(UploadPlan& plan) {
    file_io::truncate_file(plan.path);
    LOG_INFO("Upload of " + plan.name + " restarted from zero (prefix mismatch)");
    plan.current  = 0;
    plan.checksum = EMPTY_CHECKSUM;
}

bool FileStore::prefix_matches(const std::string& path, u64 stored_size,
                               u64 offset, const std::string& checksum) const {
    if (offset > stored_size) return false;
    return file_io::prefix_checksum(path, offset) == checksum;
}

bool FileStore::upload_in_progress(const std::string& name) const {
    std::lock_guard<std::mutex> lk(locks_mutex_);
    return uploading_.count(name) != 0;
}

bool FileStore::try_lock_upload(const std::string& name) {
    std::lock_guard<std::mutex> lk(locks_mutex_);
    return uploading_.insert(name).second;
}

void FileStore::unlock_upload(const std::string& name) {
    std::lock_guard<std::mutex> lk(locks_mutex_);
    uploading_.erase(name);
}
