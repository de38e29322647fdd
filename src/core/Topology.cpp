#include "Topology.h"
#include "Logging.h"

namespace link_scope {

std::optional<std::string> estimate_topology(DeviceMap& devices, const std::optional<std::string>& gateway_ip){
    if(devices.empty()) return std::nullopt;

    std::string root;
    if(gateway_ip && devices.count(*gateway_ip)) {
        root = *gateway_ip;
    } else {
        for(const auto& kv : devices){
            if(kv.second.is_gateway()){ root = kv.first; break; }
        }
    }
    if(root.empty()){
        root = devices.begin()->first;
        Logger::instance().debug("gateway not among discovered devices; using " + root + " as topology root");
    }

    for(auto& kv : devices){
        Device& d = kv.second;
        if(kv.first == root){
            d.set_gateway(true);
            d.set_connected_to({});
            continue;
        }
        d.set_gateway(false);
        if(d.connected_to().empty()) d.set_connected_to({root});
    }
    return root;
}

}
