// ============================================================
// test_file_io.cpp -- stored-file helpers
// ============================================================

#include "../common/errors.hpp"
#include "../common/file_io.hpp"
#include "../common/hash.hpp"
#include "test_util.hpp"
#include <gtest/gtest.h>

using testutil::TempDir;

TEST(SanitizeName, KeepsFinalComponent) {
    EXPECT_EQ(file_io::sanitize_name("report.pdf"), "report.pdf");
    EXPECT_EQ(file_io::sanitize_name("a/b/c.txt"), "c.txt");
    EXPECT_EQ(file_io::sanitize_name("..\\..\\win.ini"), "win.ini");
    EXPECT_EQ(file_io::sanitize_name("../../etc/passwd"), "passwd");
}

TEST(SanitizeName, RejectsNamesWithoutAFile) {
    EXPECT_EQ(file_io::sanitize_name(""), "");
    EXPECT_EQ(file_io::sanitize_name("."), "");
    EXPECT_EQ(file_io::sanitize_name(".."), "");
    EXPECT_EQ(file_io::sanitize_name("dir/"), "");
    EXPECT_EQ(file_io::sanitize_name("x/.."), "");
    EXPECT_EQ(file_io::sanitize_name(std::string("a\0b", 3)), "");
}

TEST(PrefixChecksum, EmptyPrefixIsZero) {
    TempDir tmp;
    // The file need not exist for an empty prefix
    EXPECT_EQ(file_io::prefix_checksum(tmp.file("missing"), 0), "0");
}

TEST(PrefixChecksum, MatchesXxh3OfThePrefix) {
    TempDir tmp;
    auto data = testutil::random_bytes(200 * 1024, 11);
    testutil::write_file(tmp.file("f"), data);

    for (u64 n : {(u64)1, (u64)1000, (u64)DISK_CHUNK_SIZE, (u64)DISK_CHUNK_SIZE + 1, (u64)data.size()}) {
        std::string expect = hash::to_hex(hash::xxh3_128(data.data(), (size_t)n));
        EXPECT_EQ(file_io::prefix_checksum(tmp.file("f"), n), expect) << "n=" << n;
    }
}

TEST(PrefixChecksum, LowercaseHex32) {
    TempDir tmp;
    testutil::write_file(tmp.file("f"), std::string("hello"));
    std::string h = file_io::prefix_checksum(tmp.file("f"), 5);
    ASSERT_EQ(h.size(), 32u);
    for (char c : h) {
        EXPECT_TRUE((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f')) << h;
    }
}

TEST(PrefixChecksum, ShortFileThrows) {
    TempDir tmp;
    testutil::write_file(tmp.file("f"), std::string("abc"));
    EXPECT_THROW(file_io::prefix_checksum(tmp.file("f"), 4), FilesystemError);
}

TEST(AppendFile, AppendsAndCreates) {
    TempDir tmp;
    std::string p = tmp.file("out.bin");
    {
        file_io::AppendFile f;
        f.open(p);
        f.append("abc", 3);
        f.append("def", 3);
        EXPECT_EQ(f.size(), 6u);
    }
    {
        file_io::AppendFile f;
        f.open(p);
        EXPECT_EQ(f.size(), 6u);
        f.append("g", 1);
    }
    auto got = testutil::read_file(p);
    EXPECT_EQ(std::string(got.begin(), got.end()), "abcdefg");
}

TEST(FileReader, ReadAtOffsets) {
    TempDir tmp;
    testutil::write_file(tmp.file("f"), std::string("0123456789"));
    file_io::FileReader r(tmp.file("f"));
    EXPECT_EQ(r.size(), 10u);

    char buf[4] = {};
    ASSERT_EQ(r.read_at(6, buf, 4), 4u);
    EXPECT_EQ(std::string(buf, 4), "6789");
    EXPECT_EQ(r.read_at(10, buf, 4), 0u);
}

TEST(FileReader, MissingFileThrows) {
    TempDir tmp;
    EXPECT_THROW({ file_io::FileReader r(tmp.file("nope")); }, FilesystemError);
}

TEST(TruncateFile, CutsToZeroOrCreates) {
    TempDir tmp;
    testutil::write_file(tmp.file("f"), std::string("content"));
    file_io::truncate_file(tmp.file("f"));
    EXPECT_TRUE(file_io::file_exists(tmp.file("f")));
    EXPECT_EQ(file_io::get_file_size(tmp.file("f")), 0u);

    file_io::truncate_file(tmp.file("new"));
    EXPECT_TRUE(file_io::file_exists(tmp.file("new")));
}

TEST(ListFiles, SortedRegularFilesOnly) {
    TempDir tmp;
    testutil::write_file(tmp.file("b.txt"), std::string("b"));
    testutil::write_file(tmp.file("a.txt"), std::string("a"));
    tmp.sub("subdir");

    auto names = file_io::list_files(tmp.str());
    ASSERT_EQ(names.size(), 2u);
    EXPECT_EQ(names[0], "a.txt");
    EXPECT_EQ(names[1], "b.txt");
}

TEST(FileSize, MissingIsZero) {
    TempDir tmp;
    EXPECT_EQ(file_io::get_file_size(tmp.file("none")), 0u);
    EXPECT_FALSE(file_io::file_exists(tmp.file("none")));
}
