#pragma once
#include <chrono>
#include <mutex>
#include <string>
#include <vector>

namespace link_scope {

enum class ScanOutcome { Completed, Skipped, Failed, Cancelled };

const char* outcome_name(ScanOutcome o);

// Result of an on-demand or periodic trigger.
struct ScanStatus {
    ScanOutcome outcome = ScanOutcome::Completed;
    std::string error; // set for Failed
    bool ok() const { return outcome == ScanOutcome::Completed; }
};

// Bookkeeping for one scan cycle.
struct ScanReport {
    std::string ip_range;
    std::chrono::system_clock::time_point start_time;
    std::chrono::system_clock::time_point end_time;
    ScanOutcome outcome = ScanOutcome::Completed;
    std::string error;
    size_t ping_responders = 0;
    size_t port_responders = 0;
    size_t compat_hosts = 0;
    size_t device_count = 0;
    std::string topology_root;
    std::vector<std::string> warnings;
};

// Holds the most recent finished cycle's report for concurrent readers.
class ReportHolder {
public:
    void store(ScanReport report);
    ScanReport load() const;
    bool empty() const;

private:
    mutable std::mutex mutex_;
    ScanReport report_;
    bool has_report_ = false;
};

}
