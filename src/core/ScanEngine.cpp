#include "ScanEngine.h"
#include "Logging.h"
#include "ThreadPool.h"
#include "Topology.h"
#include <future>
#include <stdexcept>
#include <utility>

namespace link_scope {

namespace {
// Clears the busy flag however the cycle ends.
struct BusyFlagGuard {
    std::atomic<bool>& flag;
    ~BusyFlagGuard(){ flag.store(false); }
};

const char* kGatewayLabel = "Gateway";
const char* kCompatHostLabel = "Windows Host";
}

ScanEngine::ScanEngine(Config cfg, EnvironmentInfo env, EngineProbes probes)
    : cfg_(std::move(cfg)), env_(std::move(env)), probes_(std::move(probes)) {
    if(!probes_.liveness || !probes_.ports || !probes_.identity)
        throw std::invalid_argument("ScanEngine requires liveness, port and identity probes");
}

ScanEngine::~ScanEngine(){
    stop_periodic_scan();
}

ScanStatus ScanEngine::scan_network(const std::string& ip_range, const CancellationToken& token){
    bool expected = false;
    if(!scanning_.compare_exchange_strong(expected, true)){
        Logger::instance().debug("scan of " + ip_range + " requested while another is running; dropped");
        return {ScanOutcome::Skipped, ""};
    }
    BusyFlagGuard guard{scanning_};

    ScanReport report;
    report.ip_range = ip_range;
    report.start_time = std::chrono::system_clock::now();
    ScanStatus status;
    Logger::instance().info("Network scan started: " + ip_range);
    try {
        run_cycle(ip_range, token, report);
        Logger::instance().info("Network scan finished: " + std::to_string(report.device_count) + " device(s)");
    } catch(const OperationCancelled&) {
        status = {ScanOutcome::Cancelled, ""};
        Logger::instance().info("Network scan of " + ip_range + " cancelled");
    } catch(const std::exception& ex) {
        status = {ScanOutcome::Failed, ex.what()};
        Logger::instance().error("Network scan of " + ip_range + " failed: " + ex.what());
    }
    report.outcome = status.outcome;
    report.error = status.error;
    report.end_time = std::chrono::system_clock::now();
    last_report_.store(std::move(report));
    return status;
}

void ScanEngine::run_cycle(const std::string& ip_range, const CancellationToken& token, ScanReport& report){
    ConnectionMap prior = registry_.connections();
    IpRange range = parse_ip_range(ip_range);
    Logger::instance().debug("scan target " + range.base_network + ".0/" + std::to_string(range.cidr));

    std::set<std::string> live = probes_.liveness->ping_sweep(range.base_network, token);
    report.ping_responders = live.size();
    Logger::instance().info("Ping sweep found " + std::to_string(live.size()) + " host(s)");
    token.throw_if_cancellation_requested();

    if(range.cidr <= 24){
        std::set<std::string> extra = probe_special_candidates(range, live, token);
        report.port_responders = extra.size();
        live.insert(extra.begin(), extra.end());
        token.throw_if_cancellation_requested();
    }

    DeviceMap devices = resolve_devices(live, prior, token);
    token.throw_if_cancellation_requested();

    if(env_.is_compat_layer && env_.gateway_ip){
        add_compat_layer_devices(devices, token, report);
        token.throw_if_cancellation_requested();
    }

    auto root = estimate_topology(devices, env_.gateway_ip);
    if(root){
        report.topology_root = *root;
        if(!env_.gateway_ip) report.warnings.push_back("default gateway unknown; " + *root + " used as topology root");
        else if(*root != *env_.gateway_ip) report.warnings.push_back("gateway " + *env_.gateway_ip + " did not respond; " + *root + " used as topology root");
    }
    report.device_count = devices.size();
    token.throw_if_cancellation_requested();
    registry_.replace(std::move(devices));
}

std::set<std::string> ScanEngine::probe_special_candidates(const IpRange& range, const std::set<std::string>& live,
                                                           const CancellationToken& token){
    std::vector<std::string> candidates;
    for(int suffix : cfg_.special_suffixes){
        std::string ip = range.base_network + "." + std::to_string(suffix);
        if(!live.count(ip)) candidates.push_back(ip);
    }
    std::set<std::string> found;
    for(const auto& ip : probe_active(candidates, cfg_.iot_ports, token)){
        found.insert(ip);
        Logger::instance().info("Port probe found additional device: " + ip);
    }
    return found;
}

std::vector<std::string> ScanEngine::probe_active(const std::vector<std::string>& candidates, const std::vector<int>& ports,
                                                  const CancellationToken& token){
    std::vector<std::pair<std::string, std::future<PortProbeResult>>> pending;
    pending.reserve(candidates.size());
    {
        ThreadPool pool(static_cast<size_t>(cfg_.port_workers));
        for(const auto& ip : candidates){
            pending.emplace_back(ip, pool.submit([this, ip, &ports, token]{
                if(token.is_cancellation_requested()) return PortProbeResult{};
                return probes_.ports->probe(ip, ports);
            }));
        }
    }
    std::vector<std::string> active;
    for(auto& p : pending){
        try {
            PortProbeResult r = p.second.get();
            if(r.active) active.push_back(p.first);
        } catch(const std::exception& ex) {
            Logger::instance().warn("port probe of " + p.first + " failed: " + ex.what());
        }
    }
    return active;
}

Identity ScanEngine::resolve_identity(const std::string& ip){
    try {
        return probes_.identity->resolve(ip);
    } catch(const std::exception& ex) {
        Logger::instance().warn("identity lookup for " + ip + " failed: " + ex.what());
    }
    return Identity{kUnknownMac, std::nullopt, std::nullopt};
}

Device ScanEngine::make_device(const std::string& ip, const Identity& id, bool is_gateway, std::vector<std::string> links){
    try {
        return Device(ip, id.mac, id.manufacturer, id.hostname, is_gateway, links);
    } catch(const std::invalid_argument& ex) {
        Logger::instance().warn(std::string("discarding malformed identity: ") + ex.what());
    }
    return Device(ip, kUnknownMac, std::nullopt, id.hostname, is_gateway, std::move(links));
}

DeviceMap ScanEngine::resolve_devices(const std::set<std::string>& ips, const ConnectionMap& prior,
                                      const CancellationToken& token){
    std::vector<std::pair<std::string, std::future<Identity>>> pending;
    pending.reserve(ips.size());
    {
        ThreadPool pool(static_cast<size_t>(cfg_.resolve_workers));
        for(const auto& ip : ips){
            pending.emplace_back(ip, pool.submit([this, ip, token]{
                if(token.is_cancellation_requested()) return Identity{kUnknownMac, std::nullopt, std::nullopt};
                return resolve_identity(ip);
            }));
        }
    }
    DeviceMap devices;
    for(auto& p : pending){
        const std::string& ip = p.first;
        Identity id = p.second.get(); // resolve_identity does not throw
        bool is_gw = env_.gateway_ip && ip == *env_.gateway_ip;
        std::vector<std::string> links;
        auto it = prior.find(ip);
        if(it != prior.end()) links = it->second;
        devices.emplace(ip, make_device(ip, id, is_gw, std::move(links)));
    }
    return devices;
}

void ScanEngine::add_compat_layer_devices(DeviceMap& devices, const CancellationToken& token, ScanReport& report){
    const std::string& gw = *env_.gateway_ip;
    Logger::instance().info("Compatibility layer: probing gateway and host candidates");

    if(!devices.count(gw)){
        Identity id = resolve_identity(gw);
        id.hostname = kGatewayLabel;
        devices.emplace(gw, make_device(gw, id, true, {}));
    }

    std::string base = network_prefix(gw);
    int gw_octet = host_octet(gw);
    std::vector<std::string> candidates;
    for(int i=1; i<=cfg_.compat_host_limit && i<255; ++i){
        if(i == gw_octet) continue;
        std::string ip = base + "." + std::to_string(i);
        if(!devices.count(ip)) candidates.push_back(ip);
    }

    for(const auto& ip : probe_active(candidates, cfg_.default_ports, token)){
        Identity id = resolve_identity(ip);
        id.hostname = kCompatHostLabel;
        devices.emplace(ip, make_device(ip, id, false, {gw}));
        ++report.compat_hosts;
        Logger::instance().info("Compatibility layer host candidate active: " + ip);
    }
}

void ScanEngine::start_periodic_scan(const std::string& ip_range, int interval_seconds){
    std::lock_guard<std::mutex> lock(periodic_mutex_);
    if(periodic_thread_.joinable()){
        Logger::instance().warn("periodic scan already running; ignoring start request");
        return;
    }
    if(interval_seconds < 1) interval_seconds = 1;
    periodic_cancel_.reset();
    CancellationToken token = periodic_cancel_.token();
    periodic_thread_ = std::thread([this, ip_range, interval_seconds, token]{
        while(!token.is_cancellation_requested()){
            scan_network(ip_range, token);
            if(token.wait_for(std::chrono::seconds(interval_seconds))) break;
        }
        Logger::instance().debug("periodic scan driver stopped");
    });
    Logger::instance().info("Periodic scan started (interval " + std::to_string(interval_seconds) + "s)");
}

void ScanEngine::stop_periodic_scan(){
    std::lock_guard<std::mutex> lock(periodic_mutex_);
    if(!periodic_thread_.joinable()) return;
    periodic_cancel_.cancel();
    periodic_thread_.join();
}

bool ScanEngine::periodic_running() const {
    std::lock_guard<std::mutex> lock(periodic_mutex_);
    return periodic_thread_.joinable();
}

}
