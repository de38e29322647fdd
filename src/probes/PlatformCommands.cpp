#include "PlatformCommands.h"
#include <regex>
#include <sstream>

namespace link_scope {

std::vector<std::string> PosixCommands::ping(const std::string& ip, int timeout_ms) const {
    // -W takes whole seconds on iputils
    int secs = (timeout_ms + 999) / 1000;
    if(secs < 1) secs = 1;
    return {"ping", "-c", "1", "-W", std::to_string(secs), ip};
}

std::vector<std::string> PosixCommands::neighbor_lookup(const std::string& ip) const {
    return {"ip", "neigh", "show", ip};
}

std::vector<std::string> PosixCommands::default_route() const {
    return {"ip", "route", "show", "default"};
}

std::optional<std::string> PosixCommands::parse_gateway(const std::string& output) const {
    static const std::regex re(R"(default via (\d+\.\d+\.\d+\.\d+))");
    std::smatch m;
    if(std::regex_search(output, m, re)) return m[1].str();
    return std::nullopt;
}

std::vector<std::string> WindowsCommands::ping(const std::string& ip, int timeout_ms) const {
    return {"ping", "-n", "1", "-w", std::to_string(timeout_ms), ip};
}

std::vector<std::string> WindowsCommands::neighbor_lookup(const std::string& ip) const {
    return {"arp", "-a", ip};
}

std::vector<std::string> WindowsCommands::default_route() const {
    return {"ipconfig"};
}

std::optional<std::string> WindowsCommands::parse_gateway(const std::string& output) const {
    static const std::regex re(R"((\d+\.\d+\.\d+\.\d+))");
    std::istringstream iss(output);
    std::string line;
    while(std::getline(iss, line)){
        if(line.find("Default Gateway") == std::string::npos) continue;
        std::smatch m;
        // an adapter without a gateway leaves the field blank; keep looking
        if(std::regex_search(line, m, re)) return m[1].str();
    }
    return std::nullopt;
}

std::shared_ptr<const PlatformCommands> make_platform_commands(CommandSetKind kind){
    if(kind == CommandSetKind::Auto){
#ifdef _WIN32
        kind = CommandSetKind::Windows;
#else
        kind = CommandSetKind::Posix;
#endif
    }
    if(kind == CommandSetKind::Windows) return std::make_shared<WindowsCommands>();
    return std::make_shared<PosixCommands>();
}

}
