#include "EngineFactory.h"
#include "Logging.h"
#include "../probes/Environment.h"
#include "../probes/IdentityResolver.h"
#include "../probes/LivenessProber.h"
#include "../probes/PlatformCommands.h"
#include "../probes/PortProber.h"
#include <chrono>

namespace link_scope {

std::unique_ptr<ScanEngine> make_engine(const Config& cfg){
    return make_engine(cfg, std::make_shared<ProcessRunner>());
}

std::unique_ptr<ScanEngine> make_engine(const Config& cfg, std::shared_ptr<const CommandRunner> runner,
                                        const std::string& version_file){
    auto commands = make_platform_commands(cfg.command_set);
    Logger::instance().debug(std::string("command set: ") + command_set_name(commands->kind()));

    EnvironmentProbe probe(*runner, *commands, version_file, std::chrono::milliseconds(cfg.command_timeout_ms));
    EnvironmentInfo env = probe.detect();

    EngineProbes probes;
    probes.liveness = std::make_unique<PingSweepProber>(runner, commands, cfg.ping_workers,
                                                        cfg.ping_timeout_ms, cfg.command_timeout_ms);
    probes.ports = std::make_unique<TcpConnectProber>(cfg.connect_timeout_ms);
    probes.identity = std::make_unique<SystemIdentityResolver>(runner, commands, cfg.command_timeout_ms,
                                                               cfg.ping_timeout_ms);
    return std::make_unique<ScanEngine>(cfg, std::move(env), std::move(probes));
}

}
