#pragma once
#include "Device.h"
#include "ScanReport.h"
#include "../probes/Environment.h"
#include <string>
#include <vector>

namespace link_scope {

class JSONWriter {
public:
    // Bare device array in the wire shape:
    // {ip, mac, manufacturer|null, hostname|null, is_gateway, connected_to[]}.
    std::string write_devices(const std::vector<Device>& devices, bool pretty = false) const;

    // {"meta":{...},"summary":{...},"devices":[...]}. `report` may be null
    // before the first cycle finishes.
    std::string write(const std::vector<Device>& devices, const ScanReport* report,
                      const EnvironmentInfo& env, bool pretty = false) const;
};

}
