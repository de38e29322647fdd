#include "core/ConfigValidator.h"
#include "core/Config.h"
#include <gtest/gtest.h>

namespace link_scope {

class ConfigValidatorTest : public ::testing::Test {
protected:
    bool validate() {
        ::testing::internal::CaptureStderr();
        bool ok = validator.validate(cfg);
        last_error = ::testing::internal::GetCapturedStderr();
        return ok;
    }

    ConfigValidator validator;
    Config cfg;
    std::string last_error;
};

TEST_F(ConfigValidatorTest, DefaultsAreValid) {
    EXPECT_TRUE(validate());
    EXPECT_TRUE(last_error.empty());
}

TEST_F(ConfigValidatorTest, CompactWinsOverPretty) {
    cfg.pretty = true;
    cfg.compact = true;
    EXPECT_TRUE(validate());
    EXPECT_FALSE(cfg.pretty);
    EXPECT_TRUE(cfg.compact);
}

TEST_F(ConfigValidatorTest, RejectsMalformedRange) {
    cfg.ip_range = "192.168.1.0/40";
    EXPECT_FALSE(validate());
    EXPECT_NE(last_error.find("--range"), std::string::npos);
}

TEST_F(ConfigValidatorTest, RejectsLeadingZeroOctetInRange) {
    cfg.ip_range = "192.168.01.0/24";
    EXPECT_FALSE(validate());
    EXPECT_NE(last_error.find("--range"), std::string::npos);
}

TEST_F(ConfigValidatorTest, RejectsUnknownLogLevel) {
    cfg.log_level = "chatty";
    EXPECT_FALSE(validate());
}

TEST_F(ConfigValidatorTest, RejectsNonPositiveInterval) {
    cfg.interval_seconds = 0;
    EXPECT_FALSE(validate());
    EXPECT_NE(last_error.find("--interval"), std::string::npos);
}

TEST_F(ConfigValidatorTest, RejectsTooManyWorkers) {
    cfg.ping_workers = 1000;
    EXPECT_FALSE(validate());
}

TEST_F(ConfigValidatorTest, CompatHostLimitZeroIsAllowed) {
    cfg.compat_host_limit = 0;
    EXPECT_TRUE(validate());
    cfg.compat_host_limit = 255;
    EXPECT_FALSE(validate());
}

TEST_F(ConfigValidatorTest, RejectsOutOfRangeSuffix) {
    cfg.special_suffixes = {1, 255};
    EXPECT_FALSE(validate());
}

TEST_F(ConfigValidatorTest, RejectsBadPorts) {
    cfg.iot_ports = {80, 70000};
    EXPECT_FALSE(validate());
    cfg.iot_ports = {80};
    cfg.default_ports.clear();
    EXPECT_FALSE(validate());
}

TEST_F(ConfigValidatorTest, CommandTimeoutMustCoverPing) {
    cfg.ping_timeout_ms = 2000;
    cfg.command_timeout_ms = 1000;
    EXPECT_FALSE(validate());
}

} // namespace link_scope
