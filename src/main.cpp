#include "core/ArgumentParser.h"
#include "core/Config.h"
#include "core/ConfigValidator.h"
#include "core/EngineFactory.h"
#include "core/InventoryPublisher.h"
#include "core/Logging.h"
#include "core/ScanEngine.h"
#include <atomic>
#include <chrono>
#include <signal.h>
#include <exception>
#include <iostream>
#include <thread>

using namespace link_scope;

static std::atomic<bool> g_stop{false};

extern "C" void handle_stop_signal(int){ g_stop.store(true); }

static int run_once(ScanEngine& engine, InventoryPublisher& publisher, const Config& cfg){
    ScanStatus st = engine.scan_network(cfg.ip_range);
    publisher.force_publish(engine);
    if(!st.ok()){
        Logger::instance().error(std::string("scan ") + outcome_name(st.outcome) + (st.error.empty() ? "" : ": " + st.error));
        return 1;
    }
    return 0;
}

static int run_watch(ScanEngine& engine, InventoryPublisher& publisher, const Config& cfg){
    struct sigaction sa{};
    sa.sa_handler = handle_stop_signal;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    engine.start_periodic_scan(cfg.ip_range, cfg.interval_seconds);
    Logger::instance().info("watching " + cfg.ip_range + " every " + std::to_string(cfg.interval_seconds) + "s");

    const auto slice = std::chrono::milliseconds(100);
    const auto publish_every = std::chrono::seconds(cfg.publish_interval_seconds);
    auto next_publish = std::chrono::steady_clock::now() + publish_every;
    while(!g_stop.load()){
        std::this_thread::sleep_for(slice);
        if(std::chrono::steady_clock::now() < next_publish) continue;
        next_publish += publish_every;
        publisher.publish_or_log(engine);
    }
    Logger::instance().info("stopping");
    engine.stop_periodic_scan();
    return 0;
}

int main(int argc, char** argv){
    Config cfg;
    ArgumentParser parser;
    if(!parser.parse(argc, argv, cfg)) return parser.had_error() ? 2 : 0;

    ConfigValidator validator;
    if(!validator.validate(cfg)) return 2;

    LogLevel lvl = LogLevel::Info;
    if(parse_log_level(cfg.log_level, lvl)) Logger::instance().set_level(lvl);

    try {
        auto engine = make_engine(cfg);
        InventoryPublisher publisher(cfg);
        if(cfg.once) return run_once(*engine, publisher, cfg);
        return run_watch(*engine, publisher, cfg);
    } catch(const std::exception& ex) {
        Logger::instance().error(std::string("fatal: ") + ex.what());
        return 1;
    }
}
