#pragma once
#include "Device.h"
#include <string>
#include <vector>

namespace link_scope {

// Lowercase hex SHA-256 of the compact device array. Identical inventories
// hash identically regardless of when they were scanned.
std::string inventory_fingerprint(const std::vector<Device>& devices);

std::string sha256_hex(const std::string& data);

}
