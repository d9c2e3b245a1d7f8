#pragma once

// ============================================================
// command.hpp -- Control-line grammar
//
// Requests:  ECHO <text> | TIME | LIST | CLOSE
//            UPLOAD <name> <size> | DOWNLOAD <name>
// Replies:   OFFSET <n> [checksum] | SIZE <n> | OK | RESTART
//            READY | ABORT | BYE | UPLOAD COMPLETE | ERROR: ...
//
// Keywords are case-insensitive; arguments are space separated.
// ============================================================

#include "protocol.hpp"
#include <string>
#include <vector>

namespace cmd {

enum class Kind {
    EMPTY,
    ECHO,
    TIME,
    LIST,
    CLOSE,
    UPLOAD,
    DOWNLOAD,
    UNKNOWN,
};

struct Command {
    Kind                     kind{Kind::EMPTY};
    std::string              keyword;  // as typed
    std::vector<std::string> args;
    std::string              rest;     // verbatim text after the keyword's first space
};

Command parse(const std::string& line);

// "OFFSET <n> [checksum]"; a missing checksum reads as "0"
struct OffsetLine {
    u64         offset{0};
    std::string checksum{EMPTY_CHECKSUM};
};
bool parse_offset(const std::string& line, OffsetLine& out);

// "SIZE <n>"
bool parse_size(const std::string& line, u64& out);

// Client answer to an upload OFFSET line
enum class UploadAnswer { PROCEED, RESTART, ABORT, INVALID };
UploadAnswer classify_upload_answer(const std::string& line);

bool is_error(const std::string& line);
bool is_abort(const std::string& line);

std::string make_offset(u64 offset, const std::string& checksum);
std::string make_size(u64 size);
std::string make_error(const std::string& reason);

} // namespace cmd
