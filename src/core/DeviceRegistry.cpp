#include "DeviceRegistry.h"

namespace link_scope {

std::vector<Device> DeviceRegistry::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Device> out;
    out.reserve(devices_.size());
    for(const auto& kv : devices_) out.push_back(kv.second);
    return out;
}

ConnectionMap DeviceRegistry::connections() const {
    std::lock_guard<std::mutex> lock(mutex_);
    ConnectionMap out;
    for(const auto& kv : devices_) out.emplace(kv.first, kv.second.connected_to());
    return out;
}

void DeviceRegistry::replace(DeviceMap devices){
    std::lock_guard<std::mutex> lock(mutex_);
    devices_.swap(devices);
}

size_t DeviceRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return devices_.size();
}

}
