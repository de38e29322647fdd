#pragma once
#include "Device.h"
#include <optional>
#include <string>

namespace link_scope {

// Star graph rooted at the gateway; an approximation, not discovered
// topology. Root is the flagged device or the one matching `gateway_ip`,
// otherwise the first device in map order. Devices already carrying links
// keep them. Returns the root IP, nullopt for an empty map.
std::optional<std::string> estimate_topology(DeviceMap& devices, const std::optional<std::string>& gateway_ip);

}
