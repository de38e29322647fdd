#pragma once
#include "NetUtil.h"
#include <string>
#include <vector>
#include <optional>
#include <map>

namespace link_scope {

// One discovered host. Construction validates the address and MAC shape and
// throws std::invalid_argument on malformed input; the MAC is stored
// lowercase and colon separated.
class Device {
public:
    Device(std::string ip,
           std::string mac,
           std::optional<std::string> manufacturer = std::nullopt,
           std::optional<std::string> hostname = std::nullopt,
           bool is_gateway = false,
           std::vector<std::string> connected_to = {});

    const std::string& ip() const { return ip_; }
    const std::string& mac() const { return mac_; }
    const std::optional<std::string>& manufacturer() const { return manufacturer_; }
    const std::optional<std::string>& hostname() const { return hostname_; }
    bool is_gateway() const { return is_gateway_; }
    const std::vector<std::string>& connected_to() const { return connected_to_; }
    bool mac_known() const { return mac_ != kUnknownMac; }

    void set_gateway(bool gw) { is_gateway_ = gw; }
    void set_hostname(std::optional<std::string> name) { hostname_ = std::move(name); }
    void set_connected_to(std::vector<std::string> links);

    bool operator==(const Device& o) const;
    bool operator!=(const Device& o) const { return !(*this == o); }

private:
    std::string ip_;
    std::string mac_;
    std::optional<std::string> manufacturer_;
    std::optional<std::string> hostname_;
    bool is_gateway_ = false;
    std::vector<std::string> connected_to_;
};

using DeviceMap = std::map<std::string, Device, IpLess>;
using ConnectionMap = std::map<std::string, std::vector<std::string>, IpLess>;

}
