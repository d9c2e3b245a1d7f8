// ============================================================
// file_io.cpp -- Stored-file access implementation
// ============================================================

#include "file_io.hpp"
#include "errors.hpp"
#include "hash.hpp"
#include "protocol.hpp"
#include <algorithm>
#include <cstring>
#include <string>
#include <system_error>

#ifndef _WIN32
#  include <sys/stat.h>
#  include <fcntl.h>
#  include <unistd.h>
#endif

using namespace file_io;

#ifndef _WIN32
static std::string errno_str() {
    return std::string(strerror(errno));
}
#endif

// ============================================================
// FileReader
// ============================================================

FileReader::~FileReader() {
    close();
}

FileReader::FileReader(FileReader&& o) noexcept
#ifdef _WIN32
    : handle_(o.handle_), size_(o.size_), path_(std::move(o.path_)) {
    o.handle_ = INVALID_HANDLE_VALUE;
#else
    : fd_(o.fd_), size_(o.size_), path_(std::move(o.path_)) {
    o.fd_ = -1;
#endif
    o.size_ = 0;
}

FileReader& FileReader::operator=(FileReader&& o) noexcept {
    if (this != &o) {
        close();
#ifdef _WIN32
        handle_ = o.handle_;
        o.handle_ = INVALID_HANDLE_VALUE;
#else
        fd_ = o.fd_;
        o.fd_ = -1;
#endif
        size_ = o.size_;
        path_ = std::move(o.path_);
        o.size_ = 0;
    }
    return *this;
}

void FileReader::open(const std::string& path) {
    close();
    path_ = path;
#ifdef _WIN32
    handle_ = CreateFileA(path.c_str(), GENERIC_READ, FILE_SHARE_READ | FILE_SHARE_WRITE,
                          nullptr, OPEN_EXISTING, FILE_ATTRIBUTE_NORMAL |
                          FILE_FLAG_SEQUENTIAL_SCAN, nullptr);
    if (handle_ == INVALID_HANDLE_VALUE) {
        throw FilesystemError("Cannot open file: " + path);
    }
    LARGE_INTEGER sz{};
    GetFileSizeEx(handle_, &sz);
    size_ = (u64)sz.QuadPart;
#else
    fd_ = ::open(path.c_str(), O_RDONLY);
    if (fd_ < 0) {
        throw FilesystemError("Cannot open file: " + path + ": " + errno_str());
    }
    struct stat st{};
    if (fstat(fd_, &st) != 0) {
        ::close(fd_);
        fd_ = -1;
        throw FilesystemError("fstat failed: " + path);
    }
    size_ = (u64)st.st_size;
#  ifdef POSIX_FADV_SEQUENTIAL
    posix_fadvise(fd_, 0, 0, POSIX_FADV_SEQUENTIAL);
#  endif
#endif
}

size_t FileReader::read_at(u64 offset, void* buf, size_t len) {
    if (!is_open()) throw FilesystemError("read from closed file");
#ifdef _WIN32
    OVERLAPPED ov{};
    ov.Offset     = (DWORD)(offset & 0xFFFFFFFF);
    ov.OffsetHigh = (DWORD)(offset >> 32);
    DWORD got = 0;
    if (!ReadFile(handle_, buf, (DWORD)std::min(len, (size_t)0x7FFFFFFF), &got, &ov)) {
        if (GetLastError() == ERROR_HANDLE_EOF) return 0;
        throw FilesystemError("ReadFile failed: " + path_);
    }
    return (size_t)got;
#else
    for (;;) {
        ssize_t n = ::pread(fd_, buf, len, (off_t)offset);
        if (n >= 0) return (size_t)n;
        if (errno == EINTR) continue;
        throw FilesystemError("read failed: " + path_ + ": " + errno_str());
    }
#endif
}

bool FileReader::is_open() const {
#ifdef _WIN32
    return handle_ != INVALID_HANDLE_VALUE;
#else
    return fd_ >= 0;
#endif
}

void FileReader::close() {
#ifdef _WIN32
    if (handle_ != INVALID_HANDLE_VALUE) { CloseHandle(handle_); handle_ = INVALID_HANDLE_VALUE; }
#else
    if (fd_ >= 0) { ::close(fd_); fd_ = -1; }
#endif
    size_ = 0;
}

// ============================================================
// AppendFile
// ============================================================

AppendFile::~AppendFile() {
    close();
}

AppendFile::AppendFile(AppendFile&& o) noexcept
#ifdef _WIN32
    : handle_(o.handle_), size_(o.size_), path_(std::move(o.path_)) {
    o.handle_ = INVALID_HANDLE_VALUE;
#else
    : fd_(o.fd_), size_(o.size_), path_(std::move(o.path_)) {
    o.fd_ = -1;
#endif
    o.size_ = 0;
}

AppendFile& AppendFile::operator=(AppendFile&& o) noexcept {
    if (this != &o) {
        close();
#ifdef _WIN32
        handle_ = o.handle_;
        o.handle_ = INVALID_HANDLE_VALUE;
#else
        fd_ = o.fd_;
        o.fd_ = -1;
#endif
        size_ = o.size_;
        path_ = std::move(o.path_);
        o.size_ = 0;
    }
    return *this;
}

void AppendFile::open(const std::string& path) {
    close();
    path_ = path;
#ifdef _WIN32
    handle_ = CreateFileA(path.c_str(), FILE_APPEND_DATA, FILE_SHARE_READ | FILE_SHARE_WRITE,
                          nullptr, OPEN_ALWAYS, FILE_ATTRIBUTE_NORMAL, nullptr);
    if (handle_ == INVALID_HANDLE_VALUE) {
        throw FilesystemError("Cannot open file for append: " + path);
    }
    LARGE_INTEGER sz{};
    GetFileSizeEx(handle_, &sz);
    size_ = (u64)sz.QuadPart;
#else
    fd_ = ::open(path.c_str(), O_WRONLY | O_CREAT | O_APPEND, 0644);
    if (fd_ < 0) {
        throw FilesystemError("Cannot open file for append: " + path + ": " + errno_str());
    }
    struct stat st{};
    if (fstat(fd_, &st) != 0) {
        ::close(fd_);
        fd_ = -1;
        throw FilesystemError("fstat failed: " + path);
    }
    size_ = (u64)st.st_size;
#endif
}

void AppendFile::append(const void* data, size_t len) {
    if (!is_open()) throw FilesystemError("append to closed file");
    const char* p = static_cast<const char*>(data);
    size_t remaining = len;
#ifdef _WIN32
    while (remaining > 0) {
        DWORD wrote = 0;
        if (!WriteFile(handle_, p, (DWORD)std::min(remaining, (size_t)0x7FFFFFFF), &wrote, nullptr)) {
            throw FilesystemError("WriteFile failed: " + path_);
        }
        p += wrote;
        remaining -= wrote;
    }
    if (!FlushFileBuffers(handle_)) {
        throw FilesystemError("FlushFileBuffers failed: " + path_);
    }
#else
    while (remaining > 0) {
        ssize_t n = ::write(fd_, p, remaining);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw FilesystemError("write failed: " + path_ + ": " + errno_str());
        }
        p += n;
        remaining -= (size_t)n;
    }
    if (::fsync(fd_) != 0) {
        throw FilesystemError("fsync failed: " + path_ + ": " + errno_str());
    }
#endif
    size_ += len;
}

bool AppendFile::is_open() const {
#ifdef _WIN32
    return handle_ != INVALID_HANDLE_VALUE;
#else
    return fd_ >= 0;
#endif
}

void AppendFile::close() {
#ifdef _WIN32
    if (handle_ != INVALID_HANDLE_VALUE) { CloseHandle(handle_); handle_ = INVALID_HANDLE_VALUE; }
#else
    if (fd_ >= 0) { ::close(fd_); fd_ = -1; }
#endif
    size_ = 0;
}

// ============================================================
// Utility functions
// ============================================================

std::string file_io::sanitize_name(const std::string& name) {
    if (name.empty()) return "";
    for (char c : name) {
        if (c == '\0') return "";
    }
    size_t cut = name.find_last_of("/\\");
    std::string base = (cut == std::string::npos) ? name : name.substr(cut + 1);
    if (base.empty() || base == "." || base == "..") return "";
    return base;
}

u64 file_io::get_file_size(const std::string& path) {
    std::error_code ec;
    auto sz = fs::file_size(path, ec);
    if (ec) return 0;
    return (u64)sz;
}

bool file_io::file_exists(const std::string& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

std::string file_io::prefix_checksum(const std::string& path, u64 n) {
    if (n == 0) return EMPTY_CHECKSUM;

    FileReader reader(path);
    if (reader.size() < n) {
        throw FilesystemError("prefix_checksum: " + path + " is shorter than " + std::to_string(n));
    }
    hash::StreamHasher128 hasher;
    std::vector<u8> buf(DISK_CHUNK_SIZE);
    u64 off = 0;
    while (off < n) {
        size_t want = (size_t)std::min<u64>(buf.size(), n - off);
        size_t got  = reader.read_at(off, buf.data(), want);
        if (got == 0) {
            throw FilesystemError("prefix_checksum: unexpected EOF in " + path);
        }
        hasher.update(buf.data(), got);
        off += got;
    }
    return hash::to_hex(hasher.digest());
}

void file_io::truncate_file(const std::string& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        AppendFile f;
        f.open(path);
        return;
    }
    fs::resize_file(path, 0, ec);
    if (ec) {
        throw FilesystemError("truncate failed: " + path + ": " + ec.message());
    }
}

void file_io::ensure_dir(const std::string& dir) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec || !fs::is_directory(dir)) {
        throw FilesystemError("Cannot create directory: " + dir +
                              (ec ? ": " + ec.message() : std::string()));
    }
}

std::vector<std::string> file_io::list_files(const std::string& dir) {
    std::vector<std::string> names;
    std::error_code ec;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code sec;
        if (it->is_regular_file(sec)) {
            names.push_back(it->path().filename().string());
        }
    }
    if (ec) {
        throw FilesystemError("Cannot list directory: " + dir + ": " + ec.message());
    }
    std::sort(names.begin(), names.end());
    return names;
}
