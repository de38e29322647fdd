#include "Device.h"
#include <stdexcept>

namespace link_scope {

Device::Device(std::string ip, std::string mac, std::optional<std::string> manufacturer,
               std::optional<std::string> hostname, bool is_gateway, std::vector<std::string> connected_to)
    : ip_(std::move(ip)), manufacturer_(std::move(manufacturer)), hostname_(std::move(hostname)), is_gateway_(is_gateway) {
    if(!is_valid_ipv4(ip_)) throw std::invalid_argument("invalid device address: " + ip_);
    auto norm = normalize_mac(mac);
    if(!norm) throw std::invalid_argument("invalid MAC address for " + ip_ + ": " + mac);
    mac_ = *norm;
    set_connected_to(std::move(connected_to));
}

void Device::set_connected_to(std::vector<std::string> links){
    for(const auto& l : links){
        if(!is_valid_ipv4(l)) throw std::invalid_argument("invalid link target for " + ip_ + ": " + l);
    }
    connected_to_ = std::move(links);
}

bool Device::operator==(const Device& o) const {
    return ip_==o.ip_ && mac_==o.mac_ && manufacturer_==o.manufacturer_ && hostname_==o.hostname_
        && is_gateway_==o.is_gateway_ && connected_to_==o.connected_to_;
}

}
