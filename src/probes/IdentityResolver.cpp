#include "IdentityResolver.h"
#include "OuiTable.h"
#include "../core/Logging.h"
#include "../core/NetUtil.h"
#include <arpa/inet.h>
#include <fstream>
#include <netdb.h>
#include <netinet/in.h>
#include <regex>
#include <sstream>
#include <sys/socket.h>

namespace link_scope {

SystemIdentityResolver::SystemIdentityResolver(std::shared_ptr<const CommandRunner> runner,
                                               std::shared_ptr<const PlatformCommands> commands,
                                               int command_timeout_ms,
                                               int ping_timeout_ms,
                                               ReverseLookup reverse_lookup,
                                               std::string arp_table_path)
    : runner_(std::move(runner)), commands_(std::move(commands)), command_timeout_ms_(command_timeout_ms),
      ping_timeout_ms_(ping_timeout_ms), reverse_lookup_(std::move(reverse_lookup)),
      arp_table_path_(std::move(arp_table_path)) {}

std::optional<std::string> SystemIdentityResolver::extract_mac(const std::string& text){
    static const std::regex re(R"(([0-9A-Fa-f]{2}[:-]){5}[0-9A-Fa-f]{2})");
    std::smatch m;
    if(!std::regex_search(text, m, re)) return std::nullopt;
    return normalize_mac(m[0].str());
}

std::optional<std::string> SystemIdentityResolver::mac_from_arp_table(const std::string& path, const std::string& ip){
    std::ifstream f(path);
    if(!f.is_open()) return std::nullopt;
    std::string line;
    std::getline(f, line); // header
    while(std::getline(f, line)){
        std::istringstream ss(line);
        std::string addr, hw_type, flags, mac;
        if(!(ss >> addr >> hw_type >> flags >> mac)) continue;
        if(addr != ip) continue;
        auto norm = normalize_mac(mac);
        if(norm && *norm != kUnknownMac) return norm;
    }
    return std::nullopt;
}

std::optional<std::string> SystemIdentityResolver::reverse_dns(const std::string& ip){
    sockaddr_in sa{};
    sa.sin_family = AF_INET;
    if(inet_pton(AF_INET, ip.c_str(), &sa.sin_addr) != 1) return std::nullopt;
    char host[NI_MAXHOST];
    int rc = getnameinfo(reinterpret_cast<sockaddr*>(&sa), sizeof(sa), host, sizeof(host), nullptr, 0, NI_NAMEREQD);
    if(rc != 0) return std::nullopt;
    return std::string(host);
}

void SystemIdentityResolver::refresh_neighbor_cache(const std::string& ip) const {
    try {
        auto res = runner_->run(commands_->ping(ip, ping_timeout_ms_), std::chrono::milliseconds(command_timeout_ms_));
        if(!res.ok()) Logger::instance().trace("cache refresh ping to " + ip + " got no reply");
    } catch(const std::exception& ex) {
        Logger::instance().trace("cache refresh ping to " + ip + " failed: " + ex.what());
    }
}

std::string SystemIdentityResolver::lookup_mac(const std::string& ip) const {
    try {
        auto res = runner_->run(commands_->neighbor_lookup(ip), std::chrono::milliseconds(command_timeout_ms_));
        if(res.ok()){
            if(auto mac = extract_mac(res.output)) return *mac;
        }
    } catch(const std::exception& ex) {
        Logger::instance().debug("neighbor lookup for " + ip + " failed: " + ex.what());
    }
    if(commands_->kind() == CommandSetKind::Posix){
        if(auto mac = mac_from_arp_table(arp_table_path_, ip)) return *mac;
    }
    return kUnknownMac;
}

Identity SystemIdentityResolver::resolve(const std::string& ip){
    refresh_neighbor_cache(ip);
    Identity id;
    id.mac = lookup_mac(ip);
    try {
        if(reverse_lookup_) id.hostname = reverse_lookup_(ip);
    } catch(const std::exception& ex) {
        Logger::instance().debug("reverse lookup for " + ip + " failed: " + ex.what());
    }
    id.manufacturer = lookup_manufacturer(id.mac);
    return id;
}

}
