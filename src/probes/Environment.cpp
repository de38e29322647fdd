#include "Environment.h"
#include "../core/Logging.h"
#include "../core/NetUtil.h"
#include <algorithm>
#include <fstream>
#include <sstream>

namespace link_scope {

EnvironmentProbe::EnvironmentProbe(const CommandRunner& runner, const PlatformCommands& commands,
                                   std::string version_file, std::chrono::milliseconds command_timeout)
    : runner_(runner), commands_(commands), version_file_(std::move(version_file)), command_timeout_(command_timeout) {}

EnvironmentInfo EnvironmentProbe::detect() const {
    EnvironmentInfo info;
    info.command_set = commands_.kind();
    info.is_compat_layer = detect_compat_layer();
    info.gateway_ip = detect_gateway();
    if(info.gateway_ip) Logger::instance().info("Default gateway: " + *info.gateway_ip);
    else Logger::instance().warn("Default gateway could not be detected; topology will pick a fallback root");
    if(info.is_compat_layer) Logger::instance().info("Compatibility layer (WSL) detected");
    return info;
}

std::optional<std::string> EnvironmentProbe::detect_gateway() const {
    // Routing table first, then the Windows configuration dump.
    PosixCommands posix;
    WindowsCommands windows;
    const PlatformCommands* order[] = {&posix, &windows};
    for(const PlatformCommands* cmds : order){
        try {
            auto res = runner_.run(cmds->default_route(), command_timeout_);
            if(!res.ok()) continue;
            auto gw = cmds->parse_gateway(res.output);
            if(gw && is_valid_ipv4(*gw)) return gw;
        } catch(const std::exception& ex) {
            Logger::instance().debug(std::string("gateway query failed: ") + ex.what());
        }
    }
    return std::nullopt;
}

bool EnvironmentProbe::detect_compat_layer() const {
    std::ifstream f(version_file_);
    if(!f.is_open()) return false;
    std::stringstream ss;
    ss << f.rdbuf();
    if(f.bad()) return false;
    return is_compat_kernel(ss.str());
}

bool EnvironmentProbe::is_compat_kernel(const std::string& version_text){
    std::string lower = version_text;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);
    return lower.find("microsoft") != std::string::npos;
}

}
