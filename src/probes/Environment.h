#pragma once
#include "CommandRunner.h"
#include "PlatformCommands.h"
#include <optional>
#include <string>

namespace link_scope {

struct EnvironmentInfo {
    bool is_compat_layer = false; // running under WSL or similar
    std::optional<std::string> gateway_ip;
    CommandSetKind command_set = CommandSetKind::Posix;
};

class EnvironmentProbe {
public:
    EnvironmentProbe(const CommandRunner& runner, const PlatformCommands& commands,
                     std::string version_file = "/proc/version",
                     std::chrono::milliseconds command_timeout = std::chrono::milliseconds(5000));

    // Never throws; failures degrade to "native OS" and "gateway unknown".
    EnvironmentInfo detect() const;

    std::optional<std::string> detect_gateway() const;
    bool detect_compat_layer() const;

    // True when the kernel version banner carries the WSL vendor signature.
    static bool is_compat_kernel(const std::string& version_text);

private:
    const CommandRunner& runner_;
    const PlatformCommands& commands_;
    std::string version_file_;
    std::chrono::milliseconds command_timeout_;
};

}
