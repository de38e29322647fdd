#pragma once
#include "Config.h"
#include "Device.h"
#include "JSONWriter.h"
#include <string>
#include <vector>

namespace link_scope {

class ScanEngine;

// Renders the engine's current inventory and writes it to the configured sink
// (file or stdout). Unchanged inventories are not rewritten.
class InventoryPublisher {
public:
    explicit InventoryPublisher(const Config& cfg) : cfg_(cfg) {}

    // Returns true when something was written. Throws std::runtime_error when
    // the output file cannot be written.
    bool publish(const ScanEngine& engine);

    // Writes unconditionally and records the fingerprint.
    void force_publish(const ScanEngine& engine);

    // publish() for the watch loop: a write failure is logged and leaves the
    // fingerprint untouched so the next call retries.
    bool publish_or_log(const ScanEngine& engine);

    const std::string& last_fingerprint() const { return last_fingerprint_; }

private:
    void emit(const std::string& text) const;
    std::string render(const std::vector<Device>& devices, const ScanEngine& engine) const;

    const Config& cfg_;
    JSONWriter writer_;
    std::string last_fingerprint_;
};

}
