#include "JSONWriter.h"
#include "BuildInfo.h"
#include "Fingerprint.h"
#include "Config.h"
#include "JsonUtil.h"
#include <chrono>
#include <sstream>
#include <unistd.h>
#include <sys/utsname.h>

namespace link_scope {
namespace {
    using jsonutil::escape; using jsonutil::time_to_iso;

    // Minimal indentation helper; in compact mode every call is a no-op.
    struct Out {
        std::ostringstream os;
        bool pretty;
        int depth = 0;
        explicit Out(bool p) : pretty(p) {}
        void nl(){ if(!pretty) return; os << '\n'; for(int i=0;i<depth;++i) os << "  "; }
        const char* colon() const { return pretty ? ": " : ":"; }
    };

    static void emit_str(Out& o, const std::string& s){ o.os << '"' << escape(s) << '"'; }

    static void emit_opt(Out& o, const std::optional<std::string>& v){
        if(v) emit_str(o, *v); else o.os << "null";
    }

    static void emit_device(Out& o, const Device& d){
        o.os << '{'; ++o.depth;
        o.nl(); emit_str(o, "ip"); o.os << o.colon(); emit_str(o, d.ip()); o.os << ',';
        o.nl(); emit_str(o, "mac"); o.os << o.colon(); emit_str(o, d.mac()); o.os << ',';
        o.nl(); emit_str(o, "manufacturer"); o.os << o.colon(); emit_opt(o, d.manufacturer()); o.os << ',';
        o.nl(); emit_str(o, "hostname"); o.os << o.colon(); emit_opt(o, d.hostname()); o.os << ',';
        o.nl(); emit_str(o, "is_gateway"); o.os << o.colon() << (d.is_gateway() ? "true" : "false") << ',';
        o.nl(); emit_str(o, "connected_to"); o.os << o.colon() << '[';
        for(size_t i=0;i<d.connected_to().size();++i){ if(i) o.os << ','; emit_str(o, d.connected_to()[i]); }
        o.os << ']';
        --o.depth; o.nl(); o.os << '}';
    }

    static void emit_devices(Out& o, const std::vector<Device>& devices){
        o.os << '[';
        if(devices.empty()){ o.os << ']'; return; }
        ++o.depth;
        for(size_t i=0;i<devices.size();++i){
            if(i) o.os << ',';
            o.nl(); emit_device(o, devices[i]);
        }
        --o.depth; o.nl(); o.os << ']';
    }

    static std::string local_hostname(){
        struct utsname u{};
        if(uname(&u) == 0) return u.nodename;
        return "";
    }

    static void emit_meta(Out& o, const EnvironmentInfo& env){
        o.os << '{'; ++o.depth;
        o.nl(); emit_str(o, "tool"); o.os << o.colon(); emit_str(o, "link-scope"); o.os << ',';
        o.nl(); emit_str(o, "version"); o.os << o.colon(); emit_str(o, buildinfo::APP_VERSION); o.os << ',';
        o.nl(); emit_str(o, "hostname"); o.os << o.colon(); emit_str(o, local_hostname()); o.os << ',';
        o.nl(); emit_str(o, "generated_at"); o.os << o.colon(); emit_str(o, time_to_iso(std::chrono::system_clock::now())); o.os << ',';
        o.nl(); emit_str(o, "gateway"); o.os << o.colon(); emit_opt(o, env.gateway_ip); o.os << ',';
        o.nl(); emit_str(o, "compat_layer"); o.os << o.colon() << (env.is_compat_layer ? "true" : "false") << ',';
        o.nl(); emit_str(o, "command_set"); o.os << o.colon(); emit_str(o, command_set_name(env.command_set));
        --o.depth; o.nl(); o.os << '}';
    }

    static void emit_summary(Out& o, const std::vector<Device>& devices, const ScanReport* r){
        o.os << '{'; ++o.depth;
        o.nl(); emit_str(o, "device_count"); o.os << o.colon() << devices.size() << ',';
        o.nl(); emit_str(o, "fingerprint"); o.os << o.colon(); emit_str(o, inventory_fingerprint(devices));
        if(r){
            o.os << ',';
            o.nl(); emit_str(o, "last_scan"); o.os << o.colon() << '{'; ++o.depth;
            o.nl(); emit_str(o, "range"); o.os << o.colon(); emit_str(o, r->ip_range); o.os << ',';
            o.nl(); emit_str(o, "outcome"); o.os << o.colon(); emit_str(o, outcome_name(r->outcome)); o.os << ',';
            if(!r->error.empty()){ o.nl(); emit_str(o, "error"); o.os << o.colon(); emit_str(o, r->error); o.os << ','; }
            o.nl(); emit_str(o, "start_time"); o.os << o.colon(); emit_str(o, time_to_iso(r->start_time)); o.os << ',';
            o.nl(); emit_str(o, "end_time"); o.os << o.colon(); emit_str(o, time_to_iso(r->end_time)); o.os << ',';
            auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(r->end_time - r->start_time).count();
            o.nl(); emit_str(o, "duration_ms"); o.os << o.colon() << ms << ',';
            o.nl(); emit_str(o, "ping_responders"); o.os << o.colon() << r->ping_responders << ',';
            o.nl(); emit_str(o, "port_responders"); o.os << o.colon() << r->port_responders << ',';
            o.nl(); emit_str(o, "compat_hosts"); o.os << o.colon() << r->compat_hosts << ',';
            o.nl(); emit_str(o, "topology_root"); o.os << o.colon();
            if(r->topology_root.empty()) o.os << "null"; else emit_str(o, r->topology_root);
            o.os << ',';
            o.nl(); emit_str(o, "warnings"); o.os << o.colon() << '[';
            for(size_t i=0;i<r->warnings.size();++i){ if(i) o.os << ','; emit_str(o, r->warnings[i]); }
            o.os << ']';
            --o.depth; o.nl(); o.os << '}';
        }
        --o.depth; o.nl(); o.os << '}';
    }
}

std::string JSONWriter::write_devices(const std::vector<Device>& devices, bool pretty) const {
    Out o(pretty);
    emit_devices(o, devices);
    if(pretty) o.os << '\n';
    return o.os.str();
}

std::string JSONWriter::write(const std::vector<Device>& devices, const ScanReport* report,
                              const EnvironmentInfo& env, bool pretty) const {
    Out o(pretty);
    o.os << '{'; ++o.depth;
    o.nl(); emit_str(o, "meta"); o.os << o.colon(); emit_meta(o, env); o.os << ',';
    o.nl(); emit_str(o, "summary"); o.os << o.colon(); emit_summary(o, devices, report); o.os << ',';
    o.nl(); emit_str(o, "devices"); o.os << o.colon(); emit_devices(o, devices);
    --o.depth; o.nl(); o.os << '}';
    if(pretty) o.os << '\n';
    return o.os.str();
}

}
