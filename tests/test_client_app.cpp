// ============================================================
// test_client_app.cpp -- interactive client over TCP and UDP
// ============================================================

#include "../client/client_app.hpp"
#include "../server/server_app.hpp"
#include "test_util.hpp"
#include <gtest/gtest.h>
#include <sstream>

using testutil::read_file;
using testutil::write_file;

namespace {

class ClientAppTest : public ::testing::TestWithParam<ClientTransport> {
protected:
    void SetUp() override {
        testutil::quiet_logs();
        ServerConfig scfg;
        scfg.storage_dir = tmp_.sub("server");
        scfg.listen_ip   = "127.0.0.1";
        scfg.listen_port = 0;
        scfg.arq.recv_idle_timeout_ms = 1500;
        server_ = std::make_unique<ServerApp>(scfg);
        server_->start();
    }

    void TearDown() override { server_->shutdown(); }

    ClientConfig client_config() const {
        ClientConfig cfg;
        cfg.download_dir = tmp_.file("downloads");
        cfg.server_ip    = "127.0.0.1";
        cfg.server_port  = server_->tcp_port();
        cfg.transport    = GetParam();
        return cfg;
    }

    static std::string run_line(ClientApp& app, const std::string& line, bool* more = nullptr) {
        std::ostringstream out;
        bool m = app.execute(line, out);
        if (more) *more = m;
        return out.str();
    }

    testutil::TempDir          tmp_;
    std::unique_ptr<ServerApp> server_;
};

std::string transport_name(const ::testing::TestParamInfo<ClientTransport>& info) {
    return info.param == ClientTransport::UDP ? "Udp" : "Tcp";
}

} // namespace

TEST_P(ClientAppTest, ServerRepliesArePrinted) {
    ClientApp app(client_config());
    EXPECT_EQ(run_line(app, "ECHO hi there"), "hi there\n");
    EXPECT_EQ(run_line(app, "LIST"), "No files on server.\n");
}

TEST_P(ClientAppTest, LocalCommands) {
    ClientApp app(client_config());
    bool more = false;
    EXPECT_NE(run_line(app, "help", &more).find("UPLOAD"), std::string::npos);
    EXPECT_TRUE(more);
    EXPECT_EQ(run_line(app, "   ", &more), "");
    EXPECT_TRUE(more);
    run_line(app, "QUIT", &more);
    EXPECT_FALSE(more);
}

TEST_P(ClientAppTest, UploadThenDownload) {
    write_file(tmp_.file("notes.txt"), std::string("some notes"));
    ClientApp app(client_config());

    std::string out = run_line(app, "UPLOAD " + tmp_.file("notes.txt") + " remote.txt");
    EXPECT_EQ(out.rfind("upload complete", 0), 0u) << out;
    EXPECT_EQ(run_line(app, "LIST"), "remote.txt\n");

    out = run_line(app, "DOWNLOAD remote.txt");
    EXPECT_EQ(out.rfind("download complete", 0), 0u) << out;
    auto got = read_file(tmp_.file("downloads/remote.txt"));
    EXPECT_EQ(std::string(got.begin(), got.end()), "some notes");
}

TEST_P(ClientAppTest, FailuresAreReported) {
    ClientApp app(client_config());
    EXPECT_EQ(run_line(app, "DOWNLOAD ghost.bin"), "download failed: ERROR: not found\n");
    EXPECT_EQ(run_line(app, "UPLOAD"), "usage: UPLOAD <local_path> [remote_name]\n");
    std::string out = run_line(app, "UPLOAD " + tmp_.file("missing.bin"));
    EXPECT_EQ(out.rfind("upload failed", 0), 0u) << out;
}

TEST_P(ClientAppTest, CloseEndsTheLoop) {
    ClientApp app(client_config());
    bool more = true;
    EXPECT_EQ(run_line(app, "CLOSE", &more), "BYE\n");
    EXPECT_FALSE(more);
    // A new command opens a fresh connection
    EXPECT_EQ(run_line(app, "ECHO again"), "again\n");
}

TEST_P(ClientAppTest, RunReadsScript) {
    ClientApp app(client_config());
    std::istringstream in("ECHO first\nECHO second\nQUIT\nECHO never\n");
    std::ostringstream out;
    EXPECT_EQ(app.run(in, out), 0);
    EXPECT_NE(out.str().find("first\n"), std::string::npos);
    EXPECT_NE(out.str().find("second\n"), std::string::npos);
    EXPECT_EQ(out.str().find("never"), std::string::npos);
}

TEST(ClientAppNoServer, ConnectionFailureIsReported) {
    testutil::quiet_logs();
    // Grab a free port and release it so nothing listens there
    u16 port;
    {
        TcpSocket listener;
        listener.bind_and_listen("127.0.0.1", 0);
        port = listener.local_port();
    }
    ClientConfig cfg;
    cfg.server_ip   = "127.0.0.1";
    cfg.server_port = port;
    ClientApp app(cfg);

    std::ostringstream out;
    EXPECT_TRUE(app.execute("ECHO hello", out));
    EXPECT_NE(out.str().find("error"), std::string::npos) << out.str();
}

INSTANTIATE_TEST_SUITE_P(BothTransports, ClientAppTest,
                         ::testing::Values(ClientTransport::TCP, ClientTransport::UDP),
                         transport_name);
