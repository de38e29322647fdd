#pragma once
#include "Device.h"
#include <mutex>
#include <vector>

namespace link_scope {

// Current inventory. Readers get copies; the only write is a whole-map swap.
class DeviceRegistry {
public:
    std::vector<Device> snapshot() const;
    ConnectionMap connections() const;
    void replace(DeviceMap devices);
    size_t size() const;

private:
    mutable std::mutex mutex_;
    DeviceMap devices_;
};

}
