#pragma once
#include "Cancellation.h"
#include "Config.h"
#include "Device.h"
#include "DeviceRegistry.h"
#include "NetUtil.h"
#include "ScanReport.h"
#include "../probes/Environment.h"
#include "../probes/IdentityResolver.h"
#include "../probes/LivenessProber.h"
#include "../probes/PortProber.h"
#include <atomic>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace link_scope {

struct EngineProbes {
    std::unique_ptr<LivenessProber> liveness;
    std::unique_ptr<PortProber> ports;
    std::unique_ptr<IdentityResolver> identity;
};

// Drives discovery cycles: ping sweep, port probing of silent candidates,
// identity resolution, topology estimation, registry swap. At most one cycle
// runs at a time; overlapping requests are dropped, not queued.
class ScanEngine {
public:
    // `env` is detected once by the caller and reused for every cycle.
    ScanEngine(Config cfg, EnvironmentInfo env, EngineProbes probes);
    ~ScanEngine();

    ScanEngine(const ScanEngine&) = delete;
    ScanEngine& operator=(const ScanEngine&) = delete;

    // Runs one cycle on the calling thread. Returns Skipped without touching
    // any state when another cycle is in flight.
    ScanStatus scan_network(const std::string& ip_range, const CancellationToken& token = CancellationToken());

    // Background driver: cycle, sleep `interval_seconds`, repeat until
    // stop_periodic_scan(). A second start while running is ignored.
    void start_periodic_scan(const std::string& ip_range, int interval_seconds);
    void stop_periodic_scan();
    bool periodic_running() const;

    std::vector<Device> get_devices() const { return registry_.snapshot(); }
    ScanReport last_report() const { return last_report_.load(); }
    bool has_report() const { return !last_report_.empty(); }
    bool is_scanning() const { return scanning_.load(); }
    const EnvironmentInfo& environment() const { return env_; }
    const Config& config() const { return cfg_; }

private:
    void run_cycle(const std::string& ip_range, const CancellationToken& token, ScanReport& report);
    std::set<std::string> probe_special_candidates(const IpRange& range, const std::set<std::string>& live,
                                                   const CancellationToken& token);
    std::vector<std::string> probe_active(const std::vector<std::string>& candidates, const std::vector<int>& ports,
                                          const CancellationToken& token);
    DeviceMap resolve_devices(const std::set<std::string>& ips, const ConnectionMap& prior,
                              const CancellationToken& token);
    Identity resolve_identity(const std::string& ip);
    Device make_device(const std::string& ip, const Identity& id, bool is_gateway, std::vector<std::string> links);
    void add_compat_layer_devices(DeviceMap& devices, const CancellationToken& token, ScanReport& report);

    Config cfg_;
    EnvironmentInfo env_;
    EngineProbes probes_;
    DeviceRegistry registry_;
    ReportHolder last_report_;
    std::atomic<bool> scanning_{false};

    mutable std::mutex periodic_mutex_;
    std::thread periodic_thread_;
    CancellationSource periodic_cancel_;
};

}
