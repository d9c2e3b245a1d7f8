#pragma once

// ============================================================
// file_io.hpp -- Stored-file access: chunked reads, durable
//                appends, prefix checksums, name sanitising
// ============================================================

#include "platform.hpp"
#include <string>
#include <vector>
#include <filesystem>

namespace fs = std::filesystem;

namespace file_io {

// ---- FileReader: positioned reads from an existing file ----
class FileReader {
public:
    FileReader() = default;
    explicit FileReader(const std::string& path) { open(path); }
    ~FileReader();

    FileReader(const FileReader&) = delete;
    FileReader& operator=(const FileReader&) = delete;
    FileReader(FileReader&& o) noexcept;
    FileReader& operator=(FileReader&& o) noexcept;

    // Throws FilesystemError if the file cannot be opened
    void open(const std::string& path);

    // Read up to len bytes at offset; returns bytes read (0 at EOF)
    size_t read_at(u64 offset, void* buf, size_t len);

    u64  size() const { return size_; }
    bool is_open() const;
    void close();

private:
#ifdef _WIN32
    HANDLE handle_{INVALID_HANDLE_VALUE};
#else
    int fd_{-1};
#endif
    u64 size_{0};
    std::string path_;
};

// ---- AppendFile: every append reaches stable storage before returning ----
class AppendFile {
public:
    AppendFile() = default;
    ~AppendFile();

    AppendFile(const AppendFile&) = delete;
    AppendFile& operator=(const AppendFile&) = delete;
    AppendFile(AppendFile&& o) noexcept;
    AppendFile& operator=(AppendFile&& o) noexcept;

    // Open for append, creating the file if absent
    void open(const std::string& path);

    // Write all bytes then fsync. Throws FilesystemError on failure.
    void append(const void* data, size_t len);

    u64  size() const { return size_; }
    bool is_open() const;
    void close();

private:
#ifdef _WIN32
    HANDLE handle_{INVALID_HANDLE_VALUE};
#else
    int fd_{-1};
#endif
    u64 size_{0};
    std::string path_;
};

// ---- Utility functions ----

// Reduce a client-supplied name to its final path component.
// Returns "" for names that are empty, ".", ".." or end in a separator.
std::string sanitize_name(const std::string& name);

// Get file size in bytes; returns 0 if not found
u64 get_file_size(const std::string& path);

bool file_exists(const std::string& path);

// Lowercase hex xxh3_128 of the first n bytes; "0" when n == 0.
// Throws FilesystemError if the file holds fewer than n bytes.
std::string prefix_checksum(const std::string& path, u64 n);

// Cut the file to zero length (creating it if absent)
void truncate_file(const std::string& path);

void ensure_dir(const std::string& dir);

// Names of regular files directly under dir, sorted
std::vector<std::string> list_files(const std::string& dir);

} // namespace file_io
