#include "InventoryPublisher.h"
#include "Fingerprint.h"
#include "Logging.h"
#include "ScanEngine.h"
#include <cstdio>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace link_scope {

std::string InventoryPublisher::render(const std::vector<Device>& devices, const ScanEngine& engine) const {
    bool pretty = cfg_.pretty && !cfg_.compact;
    if(cfg_.devices_only) return writer_.write_devices(devices, pretty);
    if(engine.has_report()){
        ScanReport r = engine.last_report();
        return writer_.write(devices, &r, engine.environment(), pretty);
    }
    return writer_.write(devices, nullptr, engine.environment(), pretty);
}

void InventoryPublisher::emit(const std::string& text) const {
    if(cfg_.output_file.empty()){
        std::cout << text;
        if(text.empty() || text.back() != '\n') std::cout << '\n';
        std::cout.flush();
        return;
    }
    // Write to a sibling temp file and rename so readers never see a partial document.
    std::string tmp = cfg_.output_file + ".tmp";
    {
        std::ofstream ofs(tmp, std::ios::trunc);
        if(!ofs) throw std::runtime_error("cannot open output file: " + tmp);
        ofs << text;
        if(text.empty() || text.back() != '\n') ofs << '\n';
        if(!ofs) throw std::runtime_error("write failed: " + tmp);
    }
    if(std::rename(tmp.c_str(), cfg_.output_file.c_str()) != 0)
        throw std::runtime_error("cannot replace output file: " + cfg_.output_file);
}

bool InventoryPublisher::publish(const ScanEngine& engine){
    auto devices = engine.get_devices();
    std::string fp = inventory_fingerprint(devices);
    if(fp == last_fingerprint_){
        Logger::instance().trace("inventory unchanged (" + fp.substr(0, 12) + ")");
        return false;
    }
    emit(render(devices, engine));
    Logger::instance().debug("published inventory " + fp.substr(0, 12));
    last_fingerprint_ = fp;
    return true;
}

void InventoryPublisher::force_publish(const ScanEngine& engine){
    auto devices = engine.get_devices();
    emit(render(devices, engine));
    last_fingerprint_ = inventory_fingerprint(devices);
}

bool InventoryPublisher::publish_or_log(const ScanEngine& engine){
    try {
        return publish(engine);
    } catch(const std::exception& ex) {
        Logger::instance().error(std::string("publish failed, retrying next interval: ") + ex.what());
        return false;
    }
}

}
