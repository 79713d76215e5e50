#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "discovery/NetworkDiscovery.h"
#include <filesystem>
#include <fstream>
#include <unistd.h>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>

namespace fs = std::filesystem;

namespace asset_scan {

namespace {

const char* kTcpHeader = "  sl  local_address rem_address   st tx_queue rx_queue tr tm->when retrnsmt   uid  timeout inode";

// Listening socket on an ephemeral loopback port, closed on destruction.
class LoopbackListener {
public:
    LoopbackListener() {
        fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        if (fd_ >= 0 && ::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0 && ::listen(fd_, 4) == 0) {
            socklen_t len = sizeof(addr);
            if (::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len) == 0) port_ = ntohs(addr.sin_port);
        }
    }
    ~LoopbackListener() { close(); }
    void close() { if (fd_ >= 0) { ::close(fd_); fd_ = -1; } }
    unsigned port() const { return port_; }
private:
    int fd_ = -1;
    unsigned port_ = 0;
};

}

class NetworkDiscoveryTest : public ::testing::Test {
protected:
    void SetUp() override {
        root = (fs::temp_directory_path() / ("asset_scan_net_" + std::to_string(::getpid()))).lexically_normal();
        fs::create_directories(root / "net");
        cfg.proc_root = root.string();
        cfg.ports = {{5432, 5432}, {3306, 3306}, {6379, 6379}};
        cfg.connect_timeout_ms = 500;
    }
    void TearDown() override { fs::remove_all(root); }

    void write_table(const std::string& name, const std::vector<std::string>& rows) {
        std::ofstream f(root / "net" / name);
        f << kTcpHeader << "\n";
        for (const auto& r : rows) f << r << "\n";
    }
    std::vector<CandidateObservation> run() {
        NetworkDiscovery module;
        auto stream = module.discover(cfg.scope_for(DiscoveryMethod::Network), Deadline::after(std::chrono::seconds(10)));
        std::vector<CandidateObservation> out;
        while (auto o = stream->next()) out.push_back(*o);
        return out;
    }
    const CandidateObservation* find(const std::vector<CandidateObservation>& obs, const std::string& locator) {
        for (const auto& o : obs) if (o.locator == locator) return &o;
        return nullptr;
    }

    fs::path root;
    Config cfg;
};

TEST_F(NetworkDiscoveryTest, PassiveListenersOnConfiguredPorts) {
    write_table("tcp", {
        "   0: 0100007F:1538 00000000:0000 0A 00000000:00000000 00:00000000 00000000   113        0 1001 1 0 100 0 0 10 0",
        "   1: 00000000:0CEA 00000000:0000 0A 00000000:00000000 00:00000000 00000000   27         0 1002 1 0 100 0 0 10 0",
        "   2: 0100007F:1F90 00000000:0000 0A 00000000:00000000 00:00000000 00000000 1000         0 1003 1 0 100 0 0 10 0",
        "   3: 0100007F:1538 0100007F:D2F0 01 00000000:00000000 00:00000000 00000000   113        0 1004 1 0 100 0 0 10 0",
    });
    write_table("tcp6", {
        "   0: 00000000000000000000000001000000:1538 00000000000000000000000000000000:0000 0A 00000000:00000000 00:00000000 00000000   113        0 2001 1 0 100 0 0 10 0",
    });
    auto obs = run();
    ASSERT_EQ(obs.size(), 2u);
    auto* pg = find(obs, "localhost:5432");
    ASSERT_NE(pg, nullptr);
    EXPECT_DOUBLE_EQ(pg->method_confidence, 0.7);
    EXPECT_EQ(pg->method, DiscoveryMethod::Network);
    EXPECT_EQ(pg->attributes.at("engine"), "postgresql");
    EXPECT_EQ(pg->attributes.at("listen_address"), "127.0.0.1");
    auto* my = find(obs, "localhost:3306");
    ASSERT_NE(my, nullptr);
    EXPECT_EQ(my->attributes.at("engine"), "mysql");
}

TEST_F(NetworkDiscoveryTest, ActiveProbeFindsOpenPort) {
    LoopbackListener listener;
    ASSERT_NE(listener.port(), 0u);
    cfg.hosts = {"127.0.0.1"};
    cfg.ports = {{listener.port(), listener.port()}};
    auto obs = run();
    ASSERT_EQ(obs.size(), 1u);
    EXPECT_EQ(obs[0].locator, "127.0.0.1:" + std::to_string(listener.port()));
    EXPECT_DOUBLE_EQ(obs[0].method_confidence, 0.75);
    EXPECT_EQ(obs[0].attributes.at("source"), "tcp_connect");
}

TEST_F(NetworkDiscoveryTest, ClosedPortIsNotReported) {
    unsigned port = 0;
    {
        LoopbackListener listener;
        port = listener.port();
    }
    ASSERT_NE(port, 0u);
    EXPECT_FALSE(tcp_probe("127.0.0.1", port, 300));
}

TEST_F(NetworkDiscoveryTest, ResolvesHostOnceAndProbesEachPort) {
    LoopbackListener listener;
    ASSERT_NE(listener.port(), 0u);
    auto target = resolve_host("127.0.0.1");
    ASSERT_TRUE(target.has_value());
    EXPECT_EQ(target->addr.ss_family, AF_INET);
    EXPECT_EQ(target->name, "127.0.0.1");
    EXPECT_TRUE(tcp_probe(*target, listener.port(), 300));
    EXPECT_FALSE(resolve_host("").has_value());
}

TEST_F(NetworkDiscoveryTest, CancelledDeadlineStopsBeforeProbing) {
    LoopbackListener listener;
    ASSERT_NE(listener.port(), 0u);
    cfg.hosts = {"127.0.0.1", "127.0.0.1"};
    cfg.ports = {{listener.port(), listener.port()}};
    Deadline deadline = Deadline::after(std::chrono::seconds(10));
    deadline.cancel();
    NetworkDiscovery module;
    auto stream = module.discover(cfg.scope_for(DiscoveryMethod::Network), deadline);
    EXPECT_FALSE(stream->next().has_value());
    EXPECT_TRUE(stream->partial());
}

TEST_F(NetworkDiscoveryTest, Availability) {
    NetworkDiscovery module;
    EXPECT_TRUE(module.availability(cfg.scope_for(DiscoveryMethod::Network)).has_value());
    write_table("tcp", {});
    EXPECT_FALSE(module.availability(cfg.scope_for(DiscoveryMethod::Network)).has_value());
    cfg.ports.clear();
    EXPECT_TRUE(module.availability(cfg.scope_for(DiscoveryMethod::Network)).has_value());
}

TEST(ProcNetTcpTest, ParsesListenEntriesOnly) {
    std::vector<std::string> lines = {
        kTcpHeader,
        "   0: 0100007F:1538 00000000:0000 0A 00000000:00000000 00:00000000 00000000   113        0 1001",
        "   1: 0100007F:1538 0100007F:D2F0 01 00000000:00000000 00:00000000 00000000   113        0 1004",
        "garbage",
    };
    auto sockets = parse_proc_net_tcp(lines, false);
    ASSERT_EQ(sockets.size(), 1u);
    EXPECT_EQ(sockets[0].port, 5432u);
    EXPECT_EQ(sockets[0].address, "127.0.0.1");
    EXPECT_FALSE(sockets[0].v6);
}

TEST(ProcNetTcpTest, ListenLocator) {
    EXPECT_EQ(listen_locator({"0.0.0.0", 5432, false}), "localhost:5432");
    EXPECT_EQ(listen_locator({"10.1.2.3", 5432, false}), "10.1.2.3:5432");
    EXPECT_EQ(listen_locator({"::", 6379, true}), "localhost:6379");
    EXPECT_EQ(listen_locator({"fe80::1", 6379, true}), "[fe80::1]:6379");
}

}
