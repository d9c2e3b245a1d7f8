#pragma once

// ============================================================
// utils.hpp -- Utility functions
// ============================================================

#include "platform.hpp"
#include <string>
#include <vector>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <sstream>
#include <iomanip>

namespace utils {

// Current time in milliseconds since epoch
inline u64 now_ms() {
    using namespace std::chrono;
    return (u64)duration_cast<milliseconds>(
        system_clock::now().time_since_epoch()
    ).count();
}

// Local wall-clock time as "YYYY-MM-DD HH:MM:SS"
inline std::string local_time_string() {
    auto t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm_buf{};
#ifdef _WIN32
    localtime_s(&tm_buf, &t);
#else
    localtime_r(&t, &tm_buf);
#endif
    std::ostringstream ss;
    ss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    return ss.str();
}

// Format bytes as human-readable (e.g., "1.23 MB")
inline std::string format_bytes(u64 bytes) {
    if (bytes < 1024ULL) {
        return std::to_string(bytes) + " B";
    }
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(2);
    if (bytes < 1024ULL * 1024) {
        ss << (double)bytes / 1024.0 << " KB";
    } else if (bytes < 1024ULL * 1024 * 1024) {
        ss << (double)bytes / (1024.0 * 1024) << " MB";
    } else {
        ss << (double)bytes / (1024.0 * 1024 * 1024) << " GB";
    }
    return ss.str();
}

// Format speed as "X.XX MB/s"
inline std::string format_speed(double bytes_per_sec) {
    std::ostringstream ss;
    if (bytes_per_sec < 1024.0) {
        ss << std::fixed << std::setprecision(1) << bytes_per_sec << " B/s";
    } else if (bytes_per_sec < 1024.0 * 1024) {
        ss << std::fixed << std::setprecision(2) << bytes_per_sec / 1024.0 << " KB/s";
    } else {
        ss << std::fixed << std::setprecision(2) << bytes_per_sec / (1024.0 * 1024) << " MB/s";
    }
    return ss.str();
}

// Progress percentage string
inline std::string format_percent(u64 done, u64 total) {
    if (total == 0) return "100%";
    double pct = (double)done / (double)total * 100.0;
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(1) << pct << "%";
    return ss.str();
}

// Validate IPv4 address string
inline bool validate_ip(const std::string& ip) {
    int a, b, c, d;
    char tail;
    if (sscanf(ip.c_str(), "%d.%d.%d.%d%c", &a, &b, &c, &d, &tail) != 4) return false;
    return (a >= 0 && a <= 255) && (b >= 0 && b <= 255) &&
           (c >= 0 && c <= 255) && (d >= 0 && d <= 255);
}

// Validate port number (1-65535)
inline bool validate_port(int port) {
    return port >= 1 && port <= 65535;
}

// ASCII upper-case copy
inline std::string to_upper(std::string s) {
    for (char& c : s) {
        if (c >= 'a' && c <= 'z') c = (char)(c - 'a' + 'A');
    }
    return s;
}

// Split on runs of spaces/tabs
inline std::vector<std::string> split_ws(const std::string& s) {
    std::vector<std::string> out;
    std::istringstream in(s);
    std::string tok;
    while (in >> tok) out.push_back(tok);
    return out;
}

inline std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    size_t b = s.find_first_not_of(ws);
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(ws);
    return s.substr(b, e - b + 1);
}

// Parse a non-negative decimal integer; false on any junk
inline bool parse_u64(const std::string& s, u64& out) {
    if (s.empty() || s.size() > 20) return false;
    u64 v = 0;
    for (char c : s) {
        if (c < '0' || c > '9') return false;
        u64 d = (u64)(c - '0');
        if (v > (UINT64_MAX - d) / 10) return false;  // overflow
        v = v * 10 + d;
    }
    out = v;
    return true;
}

} // namespace utils
