#include "LivenessProber.h"
#include "../core/Logging.h"
#include "../core/ThreadPool.h"
#include <future>
#include <utility>
#include <vector>

namespace link_scope {

PingSweepProber::PingSweepProber(std::shared_ptr<const CommandRunner> runner,
                                 std::shared_ptr<const PlatformCommands> commands,
                                 int workers, int timeout_ms, int command_timeout_ms)
    : runner_(std::move(runner)), commands_(std::move(commands)), workers_(workers),
      timeout_ms_(timeout_ms), command_timeout_ms_(command_timeout_ms) {}

bool PingSweepProber::ping_host(const std::string& ip) const {
    auto res = runner_->run(commands_->ping(ip, timeout_ms_), std::chrono::milliseconds(command_timeout_ms_));
    return res.ok();
}

std::set<std::string> PingSweepProber::ping_sweep(const std::string& base_network, const CancellationToken& token){
    std::set<std::string> live;
    std::vector<std::pair<std::string, std::future<bool>>> pending;
    pending.reserve(254);
    {
        ThreadPool pool(static_cast<size_t>(workers_));
        for(int i=1;i<255;++i){
            std::string ip = base_network + "." + std::to_string(i);
            pending.emplace_back(ip, pool.submit([this, ip, token]{
                if(token.is_cancellation_requested()) return false;
                return ping_host(ip);
            }));
        }
    }
    for(auto& p : pending){
        try {
            if(p.second.get()) live.insert(p.first);
        } catch(const std::exception& ex) {
            Logger::instance().debug("ping " + p.first + " failed: " + ex.what());
        }
    }
    Logger::instance().debug("ping sweep of " + base_network + ".0/24: " + std::to_string(live.size()) + " responders");
    return live;
}

}
