#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../src/probes/PortProber.h"
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#include <vector>

namespace link_scope {

using ::testing::ElementsAre;

// Loopback listener on an ephemeral port.
class PortProberTest : public ::testing::Test {
protected:
    void SetUp() override {
        listen_fd = socket(AF_INET, SOCK_STREAM, 0);
        ASSERT_GE(listen_fd, 0);
        int one = 1;
        setsockopt(listen_fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        ASSERT_EQ(bind(listen_fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)), 0);
        ASSERT_EQ(listen(listen_fd, 8), 0);
        socklen_t len = sizeof(addr);
        ASSERT_EQ(getsockname(listen_fd, reinterpret_cast<sockaddr*>(&addr), &len), 0);
        open_port = ntohs(addr.sin_port);
        closed_port = find_closed_port();
    }

    void TearDown() override {
        if (listen_fd >= 0) close(listen_fd);
    }

    // Binds and releases an ephemeral port so nothing is listening on it.
    static int find_closed_port() {
        int fd = socket(AF_INET, SOCK_STREAM, 0);
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
        socklen_t len = sizeof(addr);
        getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len);
        close(fd);
        return ntohs(addr.sin_port);
    }

    int listen_fd = -1;
    int open_port = 0;
    int closed_port = 0;
    TcpConnectProber prober{200};
};

TEST_F(PortProberTest, OpenPortMakesHostActive) {
    PortProbeResult res = prober.probe("127.0.0.1", {closed_port, open_port});
    EXPECT_TRUE(res.active);
    EXPECT_THAT(res.open_ports, ElementsAre(open_port));
}

TEST_F(PortProberTest, ClosedPortsOnly) {
    PortProbeResult res = prober.probe("127.0.0.1", {closed_port});
    EXPECT_FALSE(res.active);
    EXPECT_TRUE(res.open_ports.empty());
}

TEST_F(PortProberTest, OpenPortsKeepRequestOrder) {
    PortProbeResult res = prober.probe("127.0.0.1", {open_port, closed_port, open_port});
    EXPECT_THAT(res.open_ports, ElementsAre(open_port, open_port));
}

TEST_F(PortProberTest, EmptyPortListIsInactive) {
    PortProbeResult res = prober.probe("127.0.0.1", {});
    EXPECT_FALSE(res.active);
}

TEST_F(PortProberTest, InvalidInputsAreClosed) {
    EXPECT_FALSE(prober.port_open("127.0.0.1", 0));
    EXPECT_FALSE(prober.port_open("127.0.0.1", 70000));
    EXPECT_FALSE(prober.port_open("not-an-ip", open_port));
}

} // namespace link_scope
