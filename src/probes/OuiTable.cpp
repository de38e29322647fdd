#include "OuiTable.h"
#include "../core/NetUtil.h"
#include <algorithm>
#include <unordered_map>

namespace link_scope {

static const std::unordered_map<std::string, std::string>& oui_table(){
    static const std::unordered_map<std::string, std::string> table = {
        {"00:0c:29", "VMware"},
        {"00:50:56", "VMware"},
        {"ac:de:48", "Apple"},
        {"b8:27:eb", "Raspberry Pi"},
        {"dc:a6:32", "Raspberry Pi"},
        {"00:25:90", "Cisco"},
        {"00:16:3e", "Xen"},
        {"f8:1a:67", "TP-Link"},
        {"00:11:32", "Synology"},
        {"74:da:38", "Edimax"},
        {"00:21:29", "Cisco-Linksys"},
        {"f0:9f:c2", "Ubiquiti"},
        {"3c:7c:3f", "Huawei"},
        {"2c:54:cf", "LG Electronics"},
        {"40:b0:76", "ASUSTek"},
        {"00:e0:4c", "REALTEK"},
        {"94:10:3e", "Belkin"},
        {"18:b4:30", "Nest"},
        {"fc:fc:48", "Apple"},
        {"a8:8e:24", "Apple"},
        {"70:4d:7b", "Apple"},
        {"58:40:4e", "Apple"},
        {"ac:bc:32", "Apple"},
        {"fe:c4:e5", "Samsung"},
        {"18:67:b0", "Samsung"},
    };
    return table;
}

std::optional<std::string> lookup_manufacturer(const std::string& mac){
    if(mac.size() < 8 || mac == kUnknownMac) return std::nullopt;
    std::string prefix = mac.substr(0, 8);
    std::transform(prefix.begin(), prefix.end(), prefix.begin(), ::tolower);
    auto it = oui_table().find(prefix);
    if(it == oui_table().end()) return std::nullopt;
    return it->second;
}

size_t oui_table_size(){ return oui_table().size(); }

}
