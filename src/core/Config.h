#pragma once
#include <string>
#include <vector>

namespace link_scope {

enum class CommandSetKind { Auto, Posix, Windows };

struct Config {
    std::string ip_range = "192.168.1.0/24";
    int interval_seconds = 10;
    int publish_interval_seconds = 5; // how often the inventory is republished in watch mode
    bool once = false; // single cycle then exit

    // Probe tuning
    int ping_workers = 50;
    int port_workers = 20;
    int resolve_workers = 16;
    int ping_timeout_ms = 1000;
    int connect_timeout_ms = 100;
    int command_timeout_ms = 5000; // hard deadline for any external command
    int compat_host_limit = 19; // probe .1 .. .N on the gateway's /24 under a compatibility layer
    std::vector<int> special_suffixes = {100, 101, 102, 200, 201, 1, 2, 3, 4, 10, 20, 30, 50};
    std::vector<int> iot_ports = {80, 443, 8080, 5000, 1883, 8883, 23, 22, 5353, 1900};
    std::vector<int> default_ports = {80, 443, 22, 8080, 5000};
    CommandSetKind command_set = CommandSetKind::Auto;

    // Output
    std::string output_file; // empty = stdout
    bool pretty = false;
    bool compact = false; // wins over pretty
    bool devices_only = false; // bare device array instead of the envelope
    std::string log_level = "info";
};

bool parse_command_set(const std::string& name, CommandSetKind& out);
const char* command_set_name(CommandSetKind kind);

}
