#include "core/ArgumentParser.h"
#include "core/Config.h"
#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <string>
#include <vector>

namespace link_scope {

class ArgumentParserTest : public ::testing::Test {
protected:
    bool parse(std::vector<std::string> args) {
        args.insert(args.begin(), "link-scope");
        argv_storage = std::move(args);
        std::vector<char*> argv;
        for (auto& a : argv_storage) argv.push_back(const_cast<char*>(a.c_str()));
        return parser.parse(static_cast<int>(argv.size()), argv.data(), cfg);
    }

    ArgumentParser parser;
    Config cfg;
    std::vector<std::string> argv_storage;
};

TEST_F(ArgumentParserTest, NoArgumentsKeepsDefaults) {
    EXPECT_TRUE(parse({}));
    EXPECT_EQ(cfg.ip_range, "192.168.1.0/24");
    EXPECT_EQ(cfg.interval_seconds, 10);
    EXPECT_EQ(cfg.publish_interval_seconds, 5);
    EXPECT_EQ(cfg.ping_workers, 50);
    EXPECT_EQ(cfg.port_workers, 20);
    EXPECT_EQ(cfg.compat_host_limit, 19);
    EXPECT_FALSE(cfg.once);
    EXPECT_EQ(cfg.command_set, CommandSetKind::Auto);
}

TEST_F(ArgumentParserTest, ParseBasicArguments) {
    EXPECT_TRUE(parse({"--range", "10.0.0.0/24", "--interval", "30", "--once", "--output", "inv.json", "--compact"}));
    EXPECT_EQ(cfg.ip_range, "10.0.0.0/24");
    EXPECT_EQ(cfg.interval_seconds, 30);
    EXPECT_TRUE(cfg.once);
    EXPECT_EQ(cfg.output_file, "inv.json");
    EXPECT_TRUE(cfg.compact);
    EXPECT_FALSE(parser.had_error());
}

TEST_F(ArgumentParserTest, ParseProbeTuning) {
    EXPECT_TRUE(parse({"--ping-workers", "8", "--port-workers", "4", "--resolve-workers", "2",
                       "--ping-timeout-ms", "250", "--connect-timeout-ms", "50", "--command-timeout-ms", "900",
                       "--compat-host-limit", "5"}));
    EXPECT_EQ(cfg.ping_workers, 8);
    EXPECT_EQ(cfg.port_workers, 4);
    EXPECT_EQ(cfg.resolve_workers, 2);
    EXPECT_EQ(cfg.ping_timeout_ms, 250);
    EXPECT_EQ(cfg.connect_timeout_ms, 50);
    EXPECT_EQ(cfg.command_timeout_ms, 900);
    EXPECT_EQ(cfg.compat_host_limit, 5);
}

TEST_F(ArgumentParserTest, ParsePortLists) {
    EXPECT_TRUE(parse({"--iot-ports", "80,1883", "--default-ports", "22", "--special-suffixes", "1,254"}));
    EXPECT_EQ(cfg.iot_ports, (std::vector<int>{80, 1883}));
    EXPECT_EQ(cfg.default_ports, (std::vector<int>{22}));
    EXPECT_EQ(cfg.special_suffixes, (std::vector<int>{1, 254}));
}

TEST_F(ArgumentParserTest, ParseCommandSet) {
    EXPECT_TRUE(parse({"--command-set", "windows"}));
    EXPECT_EQ(cfg.command_set, CommandSetKind::Windows);
}

TEST_F(ArgumentParserTest, InvalidCommandSet) {
    ::testing::internal::CaptureStderr();
    EXPECT_FALSE(parse({"--command-set", "bsd"}));
    std::string err = ::testing::internal::GetCapturedStderr();
    EXPECT_TRUE(parser.had_error());
    EXPECT_THAT(err, ::testing::HasSubstr("--command-set"));
}

TEST_F(ArgumentParserTest, ParseHelpFlag) {
    ::testing::internal::CaptureStdout();
    EXPECT_FALSE(parse({"--help"}));
    std::string out = ::testing::internal::GetCapturedStdout();
    EXPECT_FALSE(parser.had_error());
    EXPECT_THAT(out, ::testing::HasSubstr("--range"));
    EXPECT_THAT(out, ::testing::HasSubstr("--once"));
}

TEST_F(ArgumentParserTest, ParseVersionFlag) {
    ::testing::internal::CaptureStdout();
    EXPECT_FALSE(parse({"--version"}));
    std::string out = ::testing::internal::GetCapturedStdout();
    EXPECT_FALSE(parser.had_error());
    EXPECT_THAT(out, ::testing::StartsWith("link-scope "));
}

TEST_F(ArgumentParserTest, UnknownArgument) {
    ::testing::internal::CaptureStderr();
    EXPECT_FALSE(parse({"--frobnicate"}));
    ::testing::internal::GetCapturedStderr();
    EXPECT_TRUE(parser.had_error());
}

TEST_F(ArgumentParserTest, MissingValue) {
    ::testing::internal::CaptureStderr();
    EXPECT_FALSE(parse({"--range"}));
    std::string err = ::testing::internal::GetCapturedStderr();
    EXPECT_TRUE(parser.had_error());
    EXPECT_THAT(err, ::testing::HasSubstr("Missing value for --range"));
}

TEST_F(ArgumentParserTest, NonNumericIntegerValue) {
    ::testing::internal::CaptureStderr();
    EXPECT_FALSE(parse({"--interval", "10s"}));
    ::testing::internal::GetCapturedStderr();
    EXPECT_TRUE(parser.had_error());
    EXPECT_EQ(cfg.interval_seconds, 10);
}

TEST_F(ArgumentParserTest, BadPortListLeavesDefault) {
    ::testing::internal::CaptureStderr();
    EXPECT_FALSE(parse({"--iot-ports", "80,http"}));
    ::testing::internal::GetCapturedStderr();
    EXPECT_EQ(cfg.iot_ports.size(), 10u);
}

TEST_F(ArgumentParserTest, SplitCsvSkipsEmptyTokens) {
    EXPECT_EQ(ArgumentParser::split_csv("a,,b,"), (std::vector<std::string>{"a", "b"}));
    EXPECT_TRUE(ArgumentParser::split_csv("").empty());
}

} // namespace link_scope
