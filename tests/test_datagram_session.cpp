// ============================================================
// test_datagram_session.cpp -- session protocol over UDP + ARQ
// ============================================================

#include "../client/transfer_client.hpp"
#include "../common/datagram_transport.hpp"
#include "../common/reliable_channel.hpp"
#include "../common/udp_socket.hpp"
#include "session_fixture.hpp"

using testutil::random_bytes;
using testutil::read_file;
using testutil::write_file;

namespace {

// One UDP client endpoint talking to the fixture's server
struct UdpClient {
    UdpSocket         sock;
    ReliableChannel   arq;
    DatagramTransport transport;

    UdpClient(u16 server_port, const ArqConfig& cfg)
        : sock(bound()), arq(sock, cfg),
          transport(arq, PeerAddr::from("127.0.0.1", server_port)) {}

    static UdpSocket bound() {
        UdpSocket s;
        s.bind("127.0.0.1", 0);
        s.tune();
        return s;
    }
};

} // namespace

class DatagramSessionTest : public ServerFixture {
protected:
    bool udp_enabled() const override { return true; }

    // Shorter idle wait so shutdown is not held up by trailing ACKs
    void customize(ServerConfig& cfg) override {
        cfg.arq.recv_idle_timeout_ms = 1500;
    }

    std::unique_ptr<UdpClient> udp_client() {
        ArqConfig cfg;
        cfg.recv_idle_timeout_ms = 5000;
        return std::make_unique<UdpClient>(app_->udp_port(), cfg);
    }
};

TEST_P(DatagramSessionTest, SharesTheTcpPortNumber) {
    EXPECT_EQ(app_->udp_port(), app_->tcp_port());
}

TEST_P(DatagramSessionTest, StatelessCommands) {
    auto c = udp_client();
    EXPECT_TRUE(c->transport.is_datagram());
    EXPECT_EQ(ask(c->transport, "ECHO over udp"), "over udp");
    EXPECT_EQ(ask(c->transport, "LIST"), "No files on server.");
    EXPECT_EQ(ask(c->transport, "NOPE"), "ERROR: unknown command NOPE");
    EXPECT_FALSE(ask(c->transport, "TIME").empty());
    EXPECT_TRUE(wait_until([this] { return app_->datagram_exchanges() >= 4; }));
    // UDP exchanges never show up as stream sessions
    EXPECT_EQ(app_->open_sessions(), 0u);
}

TEST_P(DatagramSessionTest, TwoClientsTakeTurns) {
    auto a = udp_client();
    auto b = udp_client();
    for (int i = 0; i < 5; ++i) {
        EXPECT_EQ(ask(a->transport, "ECHO a" + std::to_string(i)), "a" + std::to_string(i));
        EXPECT_EQ(ask(b->transport, "ECHO b" + std::to_string(i)), "b" + std::to_string(i));
    }
}

TEST_P(DatagramSessionTest, SmallUpload) {
    write_file(local("a.bin"), std::string("0123456789"));
    auto c = udp_client();
    TransferClient client(c->transport);

    TransferResult r = client.upload(local("a.bin"));
    ASSERT_TRUE(r.ok) << r.message;
    auto got = read_file(stored("a.bin"));
    EXPECT_EQ(std::string(got.begin(), got.end()), "0123456789");
}

TEST_P(DatagramSessionTest, MultiChunkUploadAndDownload) {
    auto data = random_bytes(2 * DATAGRAM_CHUNK_SIZE + 12345, 9);
    write_file(local("big.bin"), data);
    auto c = udp_client();
    TransferClient client(c->transport);

    TransferResult up = client.upload(local("big.bin"));
    ASSERT_TRUE(up.ok) << up.message;
    EXPECT_EQ(read_file(stored("big.bin")), data);

    std::string back = tmp_.sub("back");
    TransferResult down = client.download("big.bin", back);
    ASSERT_TRUE(down.ok) << down.message;
    EXPECT_EQ(read_file((fs::path(back) / "big.bin").string()), data);
}

TEST_P(DatagramSessionTest, UploadResumesFromServerPrefix) {
    auto data = random_bytes(300 * 1000, 12);
    write_file(local("r.bin"), data);
    write_file(stored("r.bin"), testutil::prefix(data, 100 * 1000));

    auto c = udp_client();
    TransferClient client(c->transport);
    TransferResult r = client.upload(local("r.bin"));
    ASSERT_TRUE(r.ok) << r.message;
    EXPECT_EQ(r.stats.resumed_from, 100u * 1000u);
    EXPECT_EQ(read_file(stored("r.bin")), data);
}

TEST_P(DatagramSessionTest, DownloadResumeAndRestart) {
    auto data = random_bytes(200 * 1000, 13);
    write_file(stored("d.bin"), data);
    auto c = udp_client();
    TransferClient client(c->transport);

    write_file(local("d.bin"), testutil::prefix(data, 50 * 1000));
    TransferResult r = client.download("d.bin", client_dir_);
    ASSERT_TRUE(r.ok) << r.message;
    EXPECT_EQ(r.stats.resumed_from, 50u * 1000u);
    EXPECT_EQ(read_file(local("d.bin")), data);

    write_file(local("d.bin"), random_bytes(1000, 14));
    r = client.download("d.bin", client_dir_);
    ASSERT_TRUE(r.ok) << r.message;
    EXPECT_TRUE(r.stats.restarted);
    EXPECT_EQ(read_file(local("d.bin")), data);
}

TEST_P(DatagramSessionTest, ZeroByteFiles) {
    write_file(local("empty.bin"), std::string());
    auto c = udp_client();
    TransferClient client(c->transport);

    ASSERT_TRUE(client.upload(local("empty.bin")).ok);
    EXPECT_TRUE(file_io::file_exists(stored("empty.bin")));

    std::string back = tmp_.sub("back");
    TransferResult r = client.download("empty.bin", back);
    ASSERT_TRUE(r.ok) << r.message;
    EXPECT_EQ(file_io::get_file_size((fs::path(back) / "empty.bin").string()), 0u);
}

TEST_P(DatagramSessionTest, RefusalsComeBackAsErrorLines) {
    write_file(stored("full.bin"), std::string("abc"));
    auto c = udp_client();
    EXPECT_EQ(ask(c->transport, "UPLOAD full.bin 3"), "ERROR: file already exists");
    EXPECT_EQ(ask(c->transport, "DOWNLOAD ghost.bin"), "ERROR: not found");
    EXPECT_EQ(ask(c->transport, "ECHO fine"), "fine");
}

TEST_P(DatagramSessionTest, TcpAndUdpShareOneStore) {
    write_file(local("x.bin"), std::string("shared"));
    auto c = udp_client();
    TransferClient udp(c->transport);
    ASSERT_TRUE(udp.upload(local("x.bin")).ok);

    auto t = connect();
    EXPECT_EQ(ask(*t, "LIST"), "x.bin");
    // Complete copy: TCP upload of the same file is refused
    EXPECT_EQ(ask(*t, "UPLOAD x.bin 6"), "ERROR: file already exists");
}

INSTANTIATE_TEST_SUITE_P(BothEngines, DatagramSessionTest,
                         ::testing::Values(ServerModel::THREADED, ServerModel::EVENT_LOOP),
                         model_name);
