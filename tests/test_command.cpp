// ============================================================
// test_command.cpp -- control-line grammar and small utilities
// ============================================================

#include "../common/command.hpp"
#include "../common/utils.hpp"
#include <gtest/gtest.h>

TEST(CommandParse, KeywordsAreCaseInsensitive) {
    EXPECT_EQ(cmd::parse("echo hi").kind, cmd::Kind::ECHO);
    EXPECT_EQ(cmd::parse("Time").kind, cmd::Kind::TIME);
    EXPECT_EQ(cmd::parse("LIST").kind, cmd::Kind::LIST);
    EXPECT_EQ(cmd::parse("close").kind, cmd::Kind::CLOSE);
    EXPECT_EQ(cmd::parse("Upload a 1").kind, cmd::Kind::UPLOAD);
    EXPECT_EQ(cmd::parse("download a").kind, cmd::Kind::DOWNLOAD);
    EXPECT_EQ(cmd::parse("FROB").kind, cmd::Kind::UNKNOWN);
}

TEST(CommandParse, EmptyAndBlank) {
    EXPECT_EQ(cmd::parse("").kind, cmd::Kind::EMPTY);
    EXPECT_EQ(cmd::parse("   ").kind, cmd::Kind::EMPTY);
}

TEST(CommandParse, EchoKeepsTextVerbatim) {
    auto c = cmd::parse("ECHO  two  spaces ");
    EXPECT_EQ(c.kind, cmd::Kind::ECHO);
    EXPECT_EQ(c.rest, " two  spaces ");
    ASSERT_EQ(c.args.size(), 2u);
    EXPECT_EQ(c.args[0], "two");
}

TEST(CommandParse, EchoWithoutText) {
    auto c = cmd::parse("ECHO");
    EXPECT_EQ(c.kind, cmd::Kind::ECHO);
    EXPECT_EQ(c.rest, "");
}

TEST(CommandParse, UploadArguments) {
    auto c = cmd::parse("UPLOAD notes.txt 1024");
    ASSERT_EQ(c.args.size(), 2u);
    EXPECT_EQ(c.args[0], "notes.txt");
    EXPECT_EQ(c.args[1], "1024");
    EXPECT_EQ(c.keyword, "UPLOAD");
}

TEST(OffsetLine, WithChecksum) {
    cmd::OffsetLine o;
    ASSERT_TRUE(cmd::parse_offset("OFFSET 512 abcdef", o));
    EXPECT_EQ(o.offset, 512u);
    EXPECT_EQ(o.checksum, "abcdef");
}

TEST(OffsetLine, MissingChecksumReadsAsZero) {
    cmd::OffsetLine o;
    ASSERT_TRUE(cmd::parse_offset("OFFSET 0", o));
    EXPECT_EQ(o.offset, 0u);
    EXPECT_EQ(o.checksum, "0");
}

TEST(OffsetLine, Malformed) {
    cmd::OffsetLine o;
    EXPECT_FALSE(cmd::parse_offset("OFFSET", o));
    EXPECT_FALSE(cmd::parse_offset("OFFSET -1 x", o));
    EXPECT_FALSE(cmd::parse_offset("OFFSET 12x", o));
    EXPECT_FALSE(cmd::parse_offset("SIZE 12", o));
    EXPECT_FALSE(cmd::parse_offset("OFFSET 1 2 3", o));
}

TEST(OffsetLine, FormatRoundTrip) {
    EXPECT_EQ(cmd::make_offset(7, "0"), "OFFSET 7 0");
    cmd::OffsetLine o;
    ASSERT_TRUE(cmd::parse_offset(cmd::make_offset(99, "beef"), o));
    EXPECT_EQ(o.offset, 99u);
    EXPECT_EQ(o.checksum, "beef");
}

TEST(SizeLine, ParseAndFormat) {
    u64 n = 0;
    ASSERT_TRUE(cmd::parse_size("SIZE 123456789012", n));
    EXPECT_EQ(n, 123456789012ull);
    EXPECT_FALSE(cmd::parse_size("SIZE", n));
    EXPECT_FALSE(cmd::parse_size("SIZE ten", n));
    EXPECT_EQ(cmd::make_size(0), "SIZE 0");
}

TEST(UploadAnswer, Classification) {
    EXPECT_EQ(cmd::classify_upload_answer("OK"), cmd::UploadAnswer::PROCEED);
    EXPECT_EQ(cmd::classify_upload_answer("ok"), cmd::UploadAnswer::PROCEED);
    EXPECT_EQ(cmd::classify_upload_answer("RESTART"), cmd::UploadAnswer::RESTART);
    EXPECT_EQ(cmd::classify_upload_answer("ABORT"), cmd::UploadAnswer::ABORT);
    EXPECT_EQ(cmd::classify_upload_answer("YES"), cmd::UploadAnswer::INVALID);
    EXPECT_EQ(cmd::classify_upload_answer(""), cmd::UploadAnswer::INVALID);
}

TEST(ErrorLines, PrefixDetection) {
    EXPECT_EQ(cmd::make_error("not found"), "ERROR: not found");
    EXPECT_TRUE(cmd::is_error("ERROR: file is busy"));
    EXPECT_FALSE(cmd::is_error("OK"));
    EXPECT_FALSE(cmd::is_error("ERR"));
    EXPECT_TRUE(cmd::is_abort("abort"));
}

TEST(Utils, ParseU64) {
    u64 v = 0;
    EXPECT_TRUE(utils::parse_u64("18446744073709551615", v));
    EXPECT_EQ(v, UINT64_MAX);
    EXPECT_FALSE(utils::parse_u64("18446744073709551616", v));
    EXPECT_FALSE(utils::parse_u64("", v));
    EXPECT_FALSE(utils::parse_u64("+1", v));
    EXPECT_TRUE(utils::parse_u64("007", v));
    EXPECT_EQ(v, 7u);
}

TEST(Utils, ValidateIp) {
    EXPECT_TRUE(utils::validate_ip("127.0.0.1"));
    EXPECT_TRUE(utils::validate_ip("0.0.0.0"));
    EXPECT_FALSE(utils::validate_ip("256.0.0.1"));
    EXPECT_FALSE(utils::validate_ip("1.2.3"));
    EXPECT_FALSE(utils::validate_ip("1.2.3.4x"));
}

TEST(Utils, FormatBytes) {
    EXPECT_EQ(utils::format_bytes(512), "512 B");
    EXPECT_EQ(utils::format_percent(1, 4), "25.0%");
}
