#pragma once
#include "Config.h"
#include <string>
#include <vector>

namespace link_scope {

class ConfigValidator {
public:
    // Checks value ranges and normalizes conflicting output flags. Prints the
    // first problem found to stderr and returns false.
    bool validate(Config& cfg);

private:
    bool validate_positive(int value, int max, const std::string& flag_name);
    bool validate_ports(const std::vector<int>& ports, const std::string& flag_name);
};

}
