#pragma once

// protocol.hpp -- Wire protocol definitions for TwinFT

#include "platform.hpp"

static constexpr u16 TWINFT_DEFAULT_PORT = 12345;

// Disk reads/writes and stream-mode raw chunks.
static constexpr u32 DISK_CHUNK_SIZE     = 64u * 1024u;
// Datagram mode: every raw chunk is one ARQ blob.
static constexpr u32 DATAGRAM_CHUNK_SIZE = 1u * 1024u * 1024u;
// A control line longer than this without '\n' is a framing violation.
static constexpr size_t MAX_LINE_LEN     = 64u * 1024u;

// ---- Datagram packet (ARQ) ----
// 4-byte big-endian sequence number + 1-byte type tag + payload.
static constexpr size_t PACKET_HEADER_SIZE  = 5;
static constexpr size_t MAX_SEGMENT_PAYLOAD = 1400;  // stays under a 1500-byte path MTU
static constexpr size_t MAX_DATAGRAM_SIZE   = 65535;
// Largest payload one IPv4 UDP datagram can carry
static constexpr size_t MAX_UDP_PAYLOAD     = 65507;
// The final ACK carries one bit per segment and must fit in one datagram,
// which bounds the segment count of a blob. Larger FIN totals or DATA
// sequence numbers are malformed.
static constexpr u32    MAX_BLOB_SEGMENTS   = (u32)((MAX_UDP_PAYLOAD - PACKET_HEADER_SIZE) * 8);

enum class PacketType : u8 {
    PT_DATA = 'D',
    PT_FIN  = 'F',
    PT_ACK  = 'A',
};

// ---- Session command keywords ----
namespace cmd {
static constexpr const char* ECHO     = "ECHO";
static constexpr const char* TIME     = "TIME";
static constexpr const char* LIST     = "LIST";
static constexpr const char* CLOSE    = "CLOSE";
static constexpr const char* UPLOAD   = "UPLOAD";
static constexpr const char* DOWNLOAD = "DOWNLOAD";
} // namespace cmd

// ---- Session replies ----
namespace reply {
static constexpr const char* OFFSET          = "OFFSET";
static constexpr const char* OK              = "OK";
static constexpr const char* RESTART         = "RESTART";
static constexpr const char* READY           = "READY";
static constexpr const char* ABORT           = "ABORT";
static constexpr const char* SIZE            = "SIZE";
static constexpr const char* BYE             = "BYE";
static constexpr const char* UPLOAD_COMPLETE = "UPLOAD COMPLETE";
static constexpr const char* ERROR_PREFIX    = "ERROR: ";
static constexpr const char* NO_FILES        = "No files on server.";
} // namespace reply

// Checksum sent for an empty prefix
static constexpr const char* EMPTY_CHECKSUM = "0";
