#pragma once
#include "CommandRunner.h"
#include "PlatformCommands.h"
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace link_scope {

struct Identity {
    std::string mac; // kUnknownMac when unresolved
    std::optional<std::string> hostname;
    std::optional<std::string> manufacturer;
};

class IdentityResolver {
public:
    virtual ~IdentityResolver() = default;
    virtual Identity resolve(const std::string& ip) = 0;
};

using ReverseLookup = std::function<std::optional<std::string>(const std::string& ip)>;

// MAC from the neighbor table (tool first, /proc/net/arp second), hostname
// from reverse DNS, vendor from the OUI sample. Each lookup is best-effort.
class SystemIdentityResolver : public IdentityResolver {
public:
    SystemIdentityResolver(std::shared_ptr<const CommandRunner> runner,
                           std::shared_ptr<const PlatformCommands> commands,
                           int command_timeout_ms,
                           int ping_timeout_ms,
                           ReverseLookup reverse_lookup = &SystemIdentityResolver::reverse_dns,
                           std::string arp_table_path = "/proc/net/arp");

    Identity resolve(const std::string& ip) override;

    std::string lookup_mac(const std::string& ip) const;

    // First six-octet hex pattern in `text`, normalized; nullopt when absent.
    static std::optional<std::string> extract_mac(const std::string& text);
    // Reads a /proc/net/arp style table; skips incomplete (all-zero) entries.
    static std::optional<std::string> mac_from_arp_table(const std::string& path, const std::string& ip);
    static std::optional<std::string> reverse_dns(const std::string& ip);

private:
    void refresh_neighbor_cache(const std::string& ip) const;

    std::shared_ptr<const CommandRunner> runner_;
    std::shared_ptr<const PlatformCommands> commands_;
    int command_timeout_ms_;
    int ping_timeout_ms_;
    ReverseLookup reverse_lookup_;
    std::string arp_table_path_;
};

}
