#pragma once
#include "CommandRunner.h"
#include "PlatformCommands.h"
#include "../core/Cancellation.h"
#include <memory>
#include <set>
#include <string>

namespace link_scope {

class LivenessProber {
public:
    virtual ~LivenessProber() = default;
    // Probes hosts 1..254 of a /24 prefix ("192.168.1") and returns the responders.
    virtual std::set<std::string> ping_sweep(const std::string& base_network, const CancellationToken& token) = 0;
};

// One ICMP echo per host through the OS ping utility, on a bounded pool.
class PingSweepProber : public LivenessProber {
public:
    PingSweepProber(std::shared_ptr<const CommandRunner> runner,
                    std::shared_ptr<const PlatformCommands> commands,
                    int workers, int timeout_ms, int command_timeout_ms);

    std::set<std::string> ping_sweep(const std::string& base_network, const CancellationToken& token) override;

    // Single host; false on any failure.
    bool ping_host(const std::string& ip) const;

private:
    std::shared_ptr<const CommandRunner> runner_;
    std::shared_ptr<const PlatformCommands> commands_;
    int workers_;
    int timeout_ms_;
    int command_timeout_ms_;
};

}
