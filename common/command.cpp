// ============================================================
// command.cpp -- control-line parsing and formatting
// ============================================================

#include "command.hpp"
#include "utils.hpp"
#include <cstring>

namespace cmd {

static Kind kind_of(const std::string& upper) {
    if (upper == ECHO)     return Kind::ECHO;
    if (upper == TIME)     return Kind::TIME;
    if (upper == LIST)     return Kind::LIST;
    if (upper == CLOSE)    return Kind::CLOSE;
    if (upper == UPLOAD)   return Kind::UPLOAD;
    if (upper == DOWNLOAD) return Kind::DOWNLOAD;
    return Kind::UNKNOWN;
}

Command parse(const std::string& line) {
    Command c;
    size_t start = line.find_first_not_of(" \t");
    if (start == std::string::npos) return c;  // EMPTY

    size_t kw_end = line.find_first_of(" \t", start);
    c.keyword = line.substr(start, kw_end == std::string::npos ? std::string::npos : kw_end - start);
    c.kind    = kind_of(utils::to_upper(c.keyword));
    if (kw_end != std::string::npos) {
        c.rest = line.substr(kw_end + 1);
        c.args = utils::split_ws(c.rest);
    }
    return c;
}

bool parse_offset(const std::string& line, OffsetLine& out) {
    auto tok = utils::split_ws(line);
    if (tok.size() < 2 || tok.size() > 3) return false;
    if (utils::to_upper(tok[0]) != reply::OFFSET) return false;
    OffsetLine o;
    if (!utils::parse_u64(tok[1], o.offset)) return false;
    if (tok.size() == 3) o.checksum = tok[2];
    out = o;
    return true;
}

bool parse_size(const std::string& line, u64& out) {
    auto tok = utils::split_ws(line);
    if (tok.size() != 2 || utils::to_upper(tok[0]) != reply::SIZE) return false;
    return utils::parse_u64(tok[1], out);
}

UploadAnswer classify_upload_answer(const std::string& line) {
    std::string t = utils::to_upper(utils::trim(line));
    if (t == reply::OK)      return UploadAnswer::PROCEED;
    if (t == reply::RESTART) return UploadAnswer::RESTART;
    if (t == reply::ABORT)   return UploadAnswer::ABORT;
    return UploadAnswer::INVALID;
}

bool is_error(const std::string& line) {
    return line.compare(0, std::strlen(reply::ERROR_PREFIX) - 1, "ERROR:") == 0;
}

bool is_abort(const std::string& line) {
    return utils::to_upper(utils::trim(line)) == reply::ABORT;
}

std::string make_offset(u64 offset, const std::string& checksum) {
    return std::string(reply::OFFSET) + " " + std::to_string(offset) + " " + checksum;
}

std::string make_size(u64 size) {
    return std::string(reply::SIZE) + " " + std::to_string(size);
}

std::string make_error(const std::string& reason) {
    return std::string(reply::ERROR_PREFIX) + reason;
}

} // namespace cmd
