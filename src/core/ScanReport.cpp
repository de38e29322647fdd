#include "ScanReport.h"

namespace link_scope {

const char* outcome_name(ScanOutcome o){
    switch(o){
        case ScanOutcome::Completed: return "completed";
        case ScanOutcome::Skipped: return "skipped";
        case ScanOutcome::Failed: return "failed";
        case ScanOutcome::Cancelled: return "cancelled";
    }
    return "unknown";
}

void ReportHolder::store(ScanReport report){
    std::lock_guard<std::mutex> lock(mutex_);
    report_ = std::move(report);
    has_report_ = true;
}

ScanReport ReportHolder::load() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return report_;
}

bool ReportHolder::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !has_report_;
}

}
