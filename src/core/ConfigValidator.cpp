#include "ConfigValidator.h"
#include "Logging.h"
#include "NetUtil.h"
#include <iostream>
#include <stdexcept>

namespace link_scope {

bool ConfigValidator::validate(Config& cfg) {
    // pretty vs compact: if both set, compact wins
    if(cfg.pretty && cfg.compact) {
        cfg.pretty = false;
    }

    try {
        parse_ip_range(cfg.ip_range);
    } catch(const std::invalid_argument& ex) {
        std::cerr << "Invalid --range value: " << ex.what() << "\n";
        return false;
    }

    LogLevel lvl;
    if(!parse_log_level(cfg.log_level, lvl)) {
        std::cerr << "Invalid --log-level value: " << cfg.log_level << "\n";
        return false;
    }

    if(!validate_positive(cfg.interval_seconds, 86400, "--interval")) return false;
    if(!validate_positive(cfg.publish_interval_seconds, 86400, "--publish-interval")) return false;
    if(!validate_positive(cfg.ping_workers, 256, "--ping-workers")) return false;
    if(!validate_positive(cfg.port_workers, 256, "--port-workers")) return false;
    if(!validate_positive(cfg.resolve_workers, 256, "--resolve-workers")) return false;
    if(!validate_positive(cfg.ping_timeout_ms, 60000, "--ping-timeout-ms")) return false;
    if(!validate_positive(cfg.connect_timeout_ms, 60000, "--connect-timeout-ms")) return false;
    if(!validate_positive(cfg.command_timeout_ms, 600000, "--command-timeout-ms")) return false;

    // 0 disables compatibility-layer host probing
    if(cfg.compat_host_limit < 0 || cfg.compat_host_limit > 254) {
        std::cerr << "--compat-host-limit must be between 0 and 254\n";
        return false;
    }

    for(int s : cfg.special_suffixes) {
        if(s < 1 || s > 254) {
            std::cerr << "--special-suffixes entries must be between 1 and 254: " << s << "\n";
            return false;
        }
    }
    if(!validate_ports(cfg.iot_ports, "--iot-ports")) return false;
    if(!validate_ports(cfg.default_ports, "--default-ports")) return false;

    if(cfg.command_timeout_ms < cfg.ping_timeout_ms) {
        std::cerr << "--command-timeout-ms must not be shorter than --ping-timeout-ms\n";
        return false;
    }

    return true;
}

bool ConfigValidator::validate_positive(int value, int max, const std::string& flag_name) {
    if(value < 1 || value > max) {
        std::cerr << flag_name << " must be between 1 and " << max << "\n";
        return false;
    }
    return true;
}

bool ConfigValidator::validate_ports(const std::vector<int>& ports, const std::string& flag_name) {
    if(ports.empty()) {
        std::cerr << flag_name << " requires at least one port\n";
        return false;
    }
    for(int p : ports) {
        if(p < 1 || p > 65535) {
            std::cerr << flag_name << " port out of range: " << p << "\n";
            return false;
        }
    }
    return true;
}

}
