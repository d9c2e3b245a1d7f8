// ============================================================
// test_stream_transport.cpp -- line + raw framing over loopback TCP
// ============================================================

#include "../common/errors.hpp"
#include "../common/protocol.hpp"
#include "../common/stream_transport.hpp"
#include "test_util.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <future>
#include <string>

namespace {

// Connected loopback pair: client() writes, server() reads (and back)
class StreamPair : public ::testing::Test {
protected:
    void SetUp() override {
        testutil::quiet_logs();
        TcpSocket listener;
        listener.bind_and_listen("127.0.0.1", 0);
        TcpSocket c;
        c.connect("127.0.0.1", listener.local_port());
        TcpSocket s = listener.accept();
        client_ = std::make_unique<StreamTransport>(std::move(c));
        server_ = std::make_unique<StreamTransport>(std::move(s));
    }

    StreamTransport& client() { return *client_; }
    StreamTransport& server() { return *server_; }

    void write_raw(const std::string& bytes) {
        client_->send_raw(reinterpret_cast<const u8*>(bytes.data()), bytes.size());
    }

    std::unique_ptr<StreamTransport> client_;
    std::unique_ptr<StreamTransport> server_;
};

} // namespace

TEST_F(StreamPair, MessagesAreNewlineTerminatedLines) {
    client().send_message("ECHO hello");
    client().send_message("TIME");
    EXPECT_EQ(server().receive_line(), "ECHO hello");
    EXPECT_EQ(server().receive_line(), "TIME");
}

TEST_F(StreamPair, CarriageReturnIsStripped) {
    write_raw("LIST\r\n");
    EXPECT_EQ(server().receive_line(), "LIST");
}

TEST_F(StreamPair, EmptyLine) {
    write_raw("\n");
    EXPECT_EQ(server().receive_line(), "");
}

TEST_F(StreamPair, LineAndRawBytesShareOneBuffer) {
    // The OK line and the first file bytes arrive in one write
    write_raw("OK\nABCDEFGH");
    EXPECT_EQ(server().receive_line(), "OK");

    auto first = server().receive_raw(3);
    EXPECT_EQ(std::string(first.begin(), first.end()), "ABC");
    auto rest = server().receive_raw(5);
    EXPECT_EQ(std::string(rest.begin(), rest.end()), "DEFGH");
    EXPECT_EQ(server().buffered(), 0u);
}

TEST_F(StreamPair, RawBytesFollowedByLine) {
    write_raw("xyzUPLOAD COMPLETE\n");
    auto raw = server().receive_raw(3);
    EXPECT_EQ(std::string(raw.begin(), raw.end()), "xyz");
    EXPECT_EQ(server().receive_line(), "UPLOAD COMPLETE");
}

TEST_F(StreamPair, ReceiveRawWaitsForExactCount) {
    auto data = testutil::random_bytes(300 * 1024, 3);
    auto got = std::async(std::launch::async, [&] { return server().receive_raw(data.size()); });
    for (size_t off = 0; off < data.size(); off += 10000) {
        size_t n = std::min<size_t>(10000, data.size() - off);
        client().send_raw(data.data() + off, n);
    }
    EXPECT_EQ(got.get(), data);
}

TEST_F(StreamPair, ReceiveSomeNeverReturnsMoreThanAsked) {
    write_raw("0123456789");
    std::string got;
    while (got.size() < 10) {
        auto part = server().receive_some(4);
        ASSERT_FALSE(part.empty());
        ASSERT_LE(part.size(), 4u);
        got.append(part.begin(), part.end());
    }
    EXPECT_EQ(got, "0123456789");
}

TEST_F(StreamPair, PeerCloseRaisesConnectionLost) {
    client_.reset();
    EXPECT_THROW(server().receive_line(), ConnectionLost);
}

TEST_F(StreamPair, PeerCloseMidRawRaisesConnectionLost) {
    write_raw("abc");
    client_.reset();
    EXPECT_THROW(server().receive_raw(10), ConnectionLost);
}

TEST_F(StreamPair, ReceiveSomeHandsOverBytesBeforeClose) {
    write_raw("abc");
    client_.reset();
    std::string got;
    while (got.size() < 3) {
        auto part = server().receive_some(10);
        got.append(part.begin(), part.end());
    }
    EXPECT_EQ(got, "abc");
    EXPECT_THROW(server().receive_some(10), ConnectionLost);
}

TEST_F(StreamPair, OverlongLineRaisesConnectionLost) {
    std::string flood(MAX_LINE_LEN + 100, 'a');
    auto writer = std::async(std::launch::async, [&] { write_raw(flood); });
    EXPECT_THROW(server().receive_line(), ConnectionLost);
    writer.get();
}

TEST_F(StreamPair, StreamChunkSize) {
    EXPECT_FALSE(client().is_datagram());
    EXPECT_EQ(client().raw_chunk_size(), (size_t)DISK_CHUNK_SIZE);
}
