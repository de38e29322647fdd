#pragma once
#include "../core/Config.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace link_scope {

// OS-specific tool invocations and output parsing. Selected once at startup.
class PlatformCommands {
public:
    virtual ~PlatformCommands() = default;
    virtual CommandSetKind kind() const = 0;
    virtual std::vector<std::string> ping(const std::string& ip, int timeout_ms) const = 0;
    virtual std::vector<std::string> neighbor_lookup(const std::string& ip) const = 0;
    virtual std::vector<std::string> default_route() const = 0;
    virtual std::optional<std::string> parse_gateway(const std::string& output) const = 0;
};

// iputils ping, iproute2 `ip route` / `ip neigh`.
class PosixCommands : public PlatformCommands {
public:
    CommandSetKind kind() const override { return CommandSetKind::Posix; }
    std::vector<std::string> ping(const std::string& ip, int timeout_ms) const override;
    std::vector<std::string> neighbor_lookup(const std::string& ip) const override;
    std::vector<std::string> default_route() const override;
    std::optional<std::string> parse_gateway(const std::string& output) const override;
};

// ping.exe flag syntax, `arp -a`, `ipconfig`.
class WindowsCommands : public PlatformCommands {
public:
    CommandSetKind kind() const override { return CommandSetKind::Windows; }
    std::vector<std::string> ping(const std::string& ip, int timeout_ms) const override;
    std::vector<std::string> neighbor_lookup(const std::string& ip) const override;
    std::vector<std::string> default_route() const override;
    std::optional<std::string> parse_gateway(const std::string& output) const override;
};

// Auto resolves to the build platform's native tools.
std::shared_ptr<const PlatformCommands> make_platform_commands(CommandSetKind kind);

}
