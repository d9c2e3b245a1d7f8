// ============================================================
// test_event_loop_server.cpp -- poll() engine flow control
// ============================================================

#include "../common/errors.hpp"
#include "../server/event_loop_server.hpp"
#include "test_util.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <future>
#include <string>
#include <thread>

namespace {

class EventLoopServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        testutil::quiet_logs();
        store_ = std::make_unique<FileStore>(tmp_.sub("store"));
        store_->bootstrap();
        server_ = std::make_unique<EventLoopServer>(*store_);
        server_->bind("127.0.0.1", 0);
        loop_ = std::thread([this]() { server_->run(); });
    }

    void TearDown() override {
        server_->stop();
        if (loop_.joinable()) loop_.join();
    }

    static std::string echo_block(size_t min_bytes) {
        const std::string line = "ECHO " + std::string(1000, 'x') + "\n";
        std::string block;
        while (block.size() < min_bytes) block += line;
        return block;
    }

    testutil::TempDir                tmp_;
    std::unique_ptr<FileStore>       store_;
    std::unique_ptr<EventLoopServer> server_;
    std::thread                      loop_;
};

} // namespace

TEST_F(EventLoopServerTest, ClientThatNeverReadsIsThrottled) {
    TcpSocket flood;
    flood.connect("127.0.0.1", server_->port());

    const std::string block = echo_block(64 * 1024);
    const u64 target = 256ull * 1024 * 1024;
    std::atomic<u64> written{0};
    auto writer = std::async(std::launch::async, [&]() {
        try {
            while (written.load() < target) {
                flood.send_all(block.data(), block.size());
                written += block.size();
            }
        } catch (const TransportError&) {
            // shutdown() below ends the blocked send
        }
    });

    // Wait until the writer stops making progress
    u64 last   = 0;
    int stable = 0;
    for (int i = 0; i < 100 && stable < 5; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        u64 now = written.load();
        stable  = (now == last && now > 0) ? stable + 1 : 0;
        last    = now;
    }
    EXPECT_LT(written.load(), 96ull * 1024 * 1024);
    EXPECT_EQ(writer.wait_for(std::chrono::seconds(0)), std::future_status::timeout);

    // The loop itself is still responsive
    auto other = testutil::connect_stream(server_->port());
    other->send_message("ECHO still here");
    EXPECT_EQ(other->receive_line(), "still here");
    EXPECT_EQ(server_->connection_count(), 2u);

    flood.shutdown();
    writer.get();
}

TEST_F(EventLoopServerTest, PipelinedBurstIsAnsweredInOrder) {
    auto t = testutil::connect_stream(server_->port());
    const int lines = 3000;

    auto writer = std::async(std::launch::async, [&]() {
        std::string burst;
        for (int i = 0; i < lines; ++i) {
            burst += "ECHO " + std::to_string(i) + std::string(500, '.') + "\n";
        }
        t->send_raw(reinterpret_cast<const u8*>(burst.data()), burst.size());
    });

    int mismatches = 0;
    for (int i = 0; i < lines; ++i) {
        if (t->receive_line() != std::to_string(i) + std::string(500, '.')) ++mismatches;
    }
    writer.get();
    EXPECT_EQ(mismatches, 0);
}

TEST_F(EventLoopServerTest, ClosedConnectionsAreSwept) {
    {
        auto a = testutil::connect_stream(server_->port());
        auto b = testutil::connect_stream(server_->port());
        a->send_message("ECHO a");
        b->send_message("ECHO b");
        EXPECT_EQ(a->receive_line(), "a");
        EXPECT_EQ(b->receive_line(), "b");
        EXPECT_EQ(server_->connection_count(), 2u);
    }
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(3);
    while (server_->connection_count() != 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    EXPECT_EQ(server_->connection_count(), 0u);
}
