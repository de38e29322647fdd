#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../src/probes/IdentityResolver.h"
#include "../src/core/NetUtil.h"
#include <cstdio>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <string>
#include <unistd.h>
#include <vector>

namespace link_scope {

using ::testing::_;
using ::testing::AnyNumber;
using ::testing::ElementsAre;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;

class MockCommandRunner : public CommandRunner {
public:
    MOCK_METHOD(CommandResult, run, (const std::vector<std::string>& argv, std::chrono::milliseconds timeout),
                (const, override));
};

static CommandResult ok_output(const std::string& out) {
    CommandResult r;
    r.started = true;
    r.exit_code = 0;
    r.output = out;
    return r;
}

class IdentityResolverTest : public ::testing::Test {
protected:
    void SetUp() override {
        runner = std::make_shared<NiceMock<MockCommandRunner>>();
        arp_path = "/tmp/link_scope_arp_" + std::to_string(getpid());
        // Catch-all; tests layer specific expectations on top.
        EXPECT_CALL(*runner, run(_, _)).Times(AnyNumber()).WillRepeatedly(Return(CommandResult{}));
    }

    void TearDown() override {
        std::remove(arp_path.c_str());
    }

    void write_arp(const std::string& body) {
        std::ofstream f(arp_path);
        f << "IP address       HW type     Flags       HW address            Mask     Device\n" << body;
    }

    std::unique_ptr<SystemIdentityResolver> make(std::shared_ptr<const PlatformCommands> cmds,
                                                 ReverseLookup lookup = [](const std::string&) { return std::optional<std::string>(); },
                                                 int ping_timeout_ms = 1000) {
        return std::make_unique<SystemIdentityResolver>(runner, std::move(cmds), 1000, ping_timeout_ms,
                                                        std::move(lookup), arp_path);
    }

    std::shared_ptr<NiceMock<MockCommandRunner>> runner;
    std::string arp_path;
};

TEST_F(IdentityResolverTest, ExtractMacFromNeighborOutput) {
    auto mac = SystemIdentityResolver::extract_mac("192.168.1.20 dev eth0 lladdr B8:27:EB:01:02:03 REACHABLE\n");
    ASSERT_TRUE(mac.has_value());
    EXPECT_EQ(*mac, "b8:27:eb:01:02:03");
}

TEST_F(IdentityResolverTest, ExtractMacFromArpDashFormat) {
    auto mac = SystemIdentityResolver::extract_mac("  192.168.0.5     dc-a6-32-aa-bb-cc     dynamic\n");
    EXPECT_EQ(mac.value(), "dc:a6:32:aa:bb:cc");
}

TEST_F(IdentityResolverTest, ExtractMacAbsent) {
    EXPECT_FALSE(SystemIdentityResolver::extract_mac("192.168.1.20 dev eth0 FAILED\n").has_value());
}

TEST_F(IdentityResolverTest, ArpTableLookupSkipsIncompleteEntries) {
    write_arp("192.168.1.7      0x1         0x0         00:00:00:00:00:00     *        eth0\n"
              "192.168.1.8      0x1         0x2         00:0c:29:11:22:33     *        eth0\n");
    EXPECT_FALSE(SystemIdentityResolver::mac_from_arp_table(arp_path, "192.168.1.7").has_value());
    EXPECT_EQ(SystemIdentityResolver::mac_from_arp_table(arp_path, "192.168.1.8").value(), "00:0c:29:11:22:33");
    EXPECT_FALSE(SystemIdentityResolver::mac_from_arp_table(arp_path, "192.168.1.9").has_value());
    EXPECT_FALSE(SystemIdentityResolver::mac_from_arp_table("/nonexistent/arp", "192.168.1.8").has_value());
}

TEST_F(IdentityResolverTest, ResolveUsesNeighborTool) {
    EXPECT_CALL(*runner, run(ElementsAre("ip", "neigh", "show", "192.168.1.20"), _))
        .WillOnce(Return(ok_output("192.168.1.20 dev eth0 lladdr b8:27:eb:01:02:03 STALE\n")));
    auto resolver = make(std::make_shared<PosixCommands>(),
                         [](const std::string& ip) { return std::optional<std::string>("pi-" + ip); });

    Identity id = resolver->resolve("192.168.1.20");
    EXPECT_EQ(id.mac, "b8:27:eb:01:02:03");
    EXPECT_EQ(id.hostname.value(), "pi-192.168.1.20");
    EXPECT_EQ(id.manufacturer.value(), "Raspberry Pi");
}

TEST_F(IdentityResolverTest, ResolvePingsBeforeLookup) {
    ::testing::InSequence seq;
    EXPECT_CALL(*runner, run(ElementsAre("ping", "-c", "1", "-W", "1", "192.168.1.20"), _))
        .WillOnce(Return(ok_output("")));
    EXPECT_CALL(*runner, run(ElementsAre("ip", "neigh", "show", "192.168.1.20"), _))
        .WillOnce(Return(ok_output("")));
    auto resolver = make(std::make_shared<PosixCommands>());
    resolver->resolve("192.168.1.20");
}

TEST_F(IdentityResolverTest, RefreshPingUsesConfiguredTimeout) {
    EXPECT_CALL(*runner, run(ElementsAre("ping", "-c", "1", "-W", "3", "192.168.1.20"), _))
        .WillOnce(Return(ok_output("")));
    auto resolver = make(std::make_shared<PosixCommands>(),
                         [](const std::string&) { return std::optional<std::string>(); }, 2500);
    resolver->resolve("192.168.1.20");
}

TEST_F(IdentityResolverTest, RefreshPingUsesConfiguredTimeoutOnWindows) {
    EXPECT_CALL(*runner, run(ElementsAre("ping", "-n", "1", "-w", "250", "192.168.1.20"), _))
        .WillOnce(Return(ok_output("")));
    auto resolver = make(std::make_shared<WindowsCommands>(),
                         [](const std::string&) { return std::optional<std::string>(); }, 250);
    resolver->resolve("192.168.1.20");
}

TEST_F(IdentityResolverTest, FallsBackToArpTableOnPosix) {
    write_arp("192.168.1.8      0x1         0x2         00:0c:29:11:22:33     *        eth0\n");
    EXPECT_CALL(*runner, run(ElementsAre("ip", "neigh", "show", "192.168.1.8"), _))
        .WillOnce(Throw(std::runtime_error("ip: not found")));
    auto resolver = make(std::make_shared<PosixCommands>());

    Identity id = resolver->resolve("192.168.1.8");
    EXPECT_EQ(id.mac, "00:0c:29:11:22:33");
    EXPECT_EQ(id.manufacturer.value(), "VMware");
}

TEST_F(IdentityResolverTest, WindowsSetDoesNotReadArpTable) {
    write_arp("192.168.1.8      0x1         0x2         00:0c:29:11:22:33     *        eth0\n");
    auto resolver = make(std::make_shared<WindowsCommands>());
    EXPECT_EQ(resolver->lookup_mac("192.168.1.8"), kUnknownMac);
}

TEST_F(IdentityResolverTest, UnresolvedMacYieldsSentinelAndNoVendor) {
    auto resolver = make(std::make_shared<PosixCommands>());
    Identity id = resolver->resolve("192.168.1.99");
    EXPECT_EQ(id.mac, kUnknownMac);
    EXPECT_FALSE(id.manufacturer.has_value());
    EXPECT_FALSE(id.hostname.has_value());
}

TEST_F(IdentityResolverTest, ReverseLookupFailureLeavesHostnameEmpty) {
    EXPECT_CALL(*runner, run(ElementsAre("ip", "neigh", "show", "192.168.1.20"), _))
        .WillOnce(Return(ok_output("lladdr 12:34:56:78:9a:bc")));
    auto resolver = make(std::make_shared<PosixCommands>(),
                         [](const std::string&) -> std::optional<std::string> { throw std::runtime_error("dns down"); });

    Identity id;
    EXPECT_NO_THROW(id = resolver->resolve("192.168.1.20"));
    EXPECT_EQ(id.mac, "12:34:56:78:9a:bc");
    EXPECT_FALSE(id.hostname.has_value());
    EXPECT_FALSE(id.manufacturer.has_value());
}

TEST_F(IdentityResolverTest, ReverseDnsRejectsMalformedAddress) {
    EXPECT_FALSE(SystemIdentityResolver::reverse_dns("not.an.ip").has_value());
}

} // namespace link_scope
