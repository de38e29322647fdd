#pragma once
#include <string>
#include <optional>

namespace link_scope {

inline constexpr const char* kUnknownMac = "00:00:00:00:00:00";

// Parsed scan target. Only the first three octets of the base address are
// kept: discovery always sweeps the /24 containing it.
struct IpRange {
    std::string base_network; // e.g. "192.168.1"
    int cidr = 24;
};

// "192.168.1.0/24" -> {"192.168.1", 24}; "10.0.0.5" -> {"10.0.0", 24}.
// Throws std::invalid_argument on a malformed address or prefix length.
IpRange parse_ip_range(const std::string& range);

bool is_valid_ipv4(const std::string& ip);

// Accepts six two-digit hex groups separated by ':' or '-' (any case).
// Returns the lowercase, colon separated form.
std::optional<std::string> normalize_mac(const std::string& mac);

// "192.168.1.7" -> "192.168.1". Empty for an invalid address.
std::string network_prefix(const std::string& ip);

// Last octet of a dotted quad, -1 when invalid.
int host_octet(const std::string& ip);

// Orders dotted quads numerically; anything unparsable sorts after by plain string order.
struct IpLess {
    bool operator()(const std::string& a, const std::string& b) const;
};

}
