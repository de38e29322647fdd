#pragma once
#include "Config.h"
#include "ScanEngine.h"
#include "../probes/CommandRunner.h"
#include <memory>

namespace link_scope {

// Wires the production probes (subprocess runner, platform command set,
// ping sweep, TCP connect prober, system identity resolver), detects the
// host environment once and returns a ready engine.
std::unique_ptr<ScanEngine> make_engine(const Config& cfg);

// Same wiring with an injected runner; used by tests that fake subprocesses.
std::unique_ptr<ScanEngine> make_engine(const Config& cfg, std::shared_ptr<const CommandRunner> runner,
                                        const std::string& version_file = "/proc/version");

}
