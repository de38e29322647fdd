#include "ArgumentParser.h"
#include "BuildInfo.h"
#include <iostream>
#include <stdexcept>

namespace link_scope {

static bool to_int(const std::string& v, int& out){
    try {
        size_t pos = 0;
        int n = std::stoi(v, &pos);
        if(pos != v.size()) return false;
        out = n;
        return true;
    } catch(const std::exception&) {
        return false;
    }
}

static bool to_int_list(const std::string& v, std::vector<int>& out){
    std::vector<int> vals;
    for(const auto& tok : ArgumentParser::split_csv(v)){
        int n = 0;
        if(!to_int(tok, n)) return false;
        vals.push_back(n);
    }
    if(vals.empty()) return false;
    out = std::move(vals);
    return true;
}

std::vector<std::string> ArgumentParser::split_csv(const std::string& s){
    std::vector<std::string> out; std::string cur;
    for(char c: s){ if(c==','){ if(!cur.empty()) out.push_back(cur); cur.clear(); } else cur.push_back(c); }
    if(!cur.empty()) out.push_back(cur);
    return out;
}

ArgumentParser::ArgumentParser(){
    auto int_flag = [](int Config::*field){
        return [field](const std::string& v, Config& c){ return to_int(v, c.*field); };
    };
    auto list_flag = [](std::vector<int> Config::*field){
        return [field](const std::string& v, Config& c){ return to_int_list(v, c.*field); };
    };
    specs_ = {
        {"--range", "CIDR range to scan (default 192.168.1.0/24)", ArgKind::String, [](const std::string& v, Config& c){ c.ip_range = v; return true; }},
        {"--interval", "Seconds between periodic scans", ArgKind::Int, int_flag(&Config::interval_seconds)},
        {"--publish-interval", "Seconds between inventory publishes", ArgKind::Int, int_flag(&Config::publish_interval_seconds)},
        {"--once", "Run a single scan, print, exit", ArgKind::None, [](const std::string&, Config& c){ c.once = true; return true; }},
        {"--output", "Write JSON to FILE (default stdout)", ArgKind::String, [](const std::string& v, Config& c){ c.output_file = v; return true; }},
        {"--pretty", "Pretty-print JSON", ArgKind::None, [](const std::string&, Config& c){ c.pretty = true; return true; }},
        {"--compact", "Minified JSON output", ArgKind::None, [](const std::string&, Config& c){ c.compact = true; return true; }},
        {"--devices-only", "Emit the bare device array", ArgKind::None, [](const std::string&, Config& c){ c.devices_only = true; return true; }},
        {"--ping-workers", "Concurrent ping probes", ArgKind::Int, int_flag(&Config::ping_workers)},
        {"--port-workers", "Concurrent port probes", ArgKind::Int, int_flag(&Config::port_workers)},
        {"--resolve-workers", "Concurrent identity lookups", ArgKind::Int, int_flag(&Config::resolve_workers)},
        {"--ping-timeout-ms", "Per-host ping timeout", ArgKind::Int, int_flag(&Config::ping_timeout_ms)},
        {"--connect-timeout-ms", "Per-port TCP connect timeout", ArgKind::Int, int_flag(&Config::connect_timeout_ms)},
        {"--command-timeout-ms", "Deadline for external commands", ArgKind::Int, int_flag(&Config::command_timeout_ms)},
        {"--compat-host-limit", "Host candidates probed under WSL", ArgKind::Int, int_flag(&Config::compat_host_limit)},
        {"--special-suffixes", "Last octets port-probed when silent", ArgKind::CSV, list_flag(&Config::special_suffixes)},
        {"--iot-ports", "Ports for special candidates", ArgKind::CSV, list_flag(&Config::iot_ports)},
        {"--default-ports", "Ports for WSL host candidates", ArgKind::CSV, list_flag(&Config::default_ports)},
        {"--command-set", "auto|posix|windows tool syntax", ArgKind::String, [](const std::string& v, Config& c){ return parse_command_set(v, c.command_set); }},
        {"--log-level", "error|warn|info|debug|trace", ArgKind::String, [](const std::string& v, Config& c){ c.log_level = v; return true; }},
    };
}

const ArgumentParser::FlagSpec* ArgumentParser::find_spec(const std::string& flag) const {
    for(const auto& s : specs_) if(flag == s.name) return &s;
    return nullptr;
}

void ArgumentParser::print_help() const {
    std::cout << "link-scope options:\n";
    for(const auto& s : specs_){
        std::string name = s.name;
        if(s.kind == ArgKind::Int) name += " N";
        else if(s.kind == ArgKind::String) name += " VALUE";
        else if(s.kind == ArgKind::CSV) name += " a,b,...";
        std::cout << "  " << name;
        if(name.size() < 30) for(size_t i=name.size(); i<30; ++i) std::cout << ' '; else std::cout << ' ';
        std::cout << s.help << "\n";
    }
    std::cout << "  --version                     Print version & exit\n";
    std::cout << "  --help                        Show this help\n";
}

bool ArgumentParser::parse(int argc, char** argv, Config& cfg){
    error_ = false;
    for(int i=1;i<argc;++i){
        std::string a = argv[i] ? argv[i] : "";
        if(a=="--help"){ print_help(); return false; }
        if(a=="--version"){
            std::cout << "link-scope " << buildinfo::APP_VERSION << " (compiler=" << buildinfo::COMPILER_ID << " "
                      << buildinfo::COMPILER_VERSION << ", cxx_std=" << buildinfo::CXX_STANDARD << ")\n";
            return false;
        }
        const FlagSpec* spec = find_spec(a);
        if(!spec){ std::cerr << "Unknown arg: " << a << "\n"; error_ = true; return false; }
        std::string val;
        if(spec->kind != ArgKind::None){
            if(i+1 >= argc || !argv[i+1]){ std::cerr << "Missing value for " << a << "\n"; error_ = true; return false; }
            val = argv[++i];
        }
        if(!spec->apply(val, cfg)){
            std::cerr << "Invalid value for " << a << ": " << val << "\n";
            error_ = true;
            return false;
        }
    }
    return true;
}

}
