#pragma once
#include <optional>
#include <string>

namespace link_scope {

// Small static sample of vendor prefixes, not the IEEE registry.
// Lookup lowercases the first 8 characters ("aa:bb:cc") of the MAC; the
// all-zero sentinel and unknown prefixes yield nullopt.
std::optional<std::string> lookup_manufacturer(const std::string& mac);

size_t oui_table_size();

}
