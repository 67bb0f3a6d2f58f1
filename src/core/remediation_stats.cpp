#include "core/remediation_stats.hpp"

namespace autoheal {

void RemediationStats::record_action(const RemediationAction& action) {
    const std::string type(action_type_to_string(action.action_type));
    const double seconds = static_cast<double>(action.execution_time.count()) / 1e3;

    size_t bucket = kDurationBuckets.size();  // +Inf
    for (size_t i = 0; i < kDurationBuckets.size(); ++i) {
        if (seconds <= kDurationBuckets[i]) {
            bucket = i;
            break;
        }
    }

    std::lock_guard lock(mutex_);
    ++data_.actions[{type, action.target}];
    if (!action.success) {
        ++data_.failures[{type, classify_failure(action.error)}];
    }
    auto& histogram = data_.durations[type];
    ++histogram.buckets[bucket];
    histogram.sum_seconds += seconds;
    ++histogram.count;
}

void RemediationStats::record_detection(FindingKind kind) {
    std::lock_guard lock(mutex_);
    ++data_.detections[std::string(finding_kind_to_string(kind))];
}

void RemediationStats::record_state_change(const std::string& service, CircuitState from,
                                           CircuitState to) {
    if (to != CircuitState::OPEN) return;
    const char* reason = from == CircuitState::HALF_OPEN ? "trial_failed" : "failure_threshold";

    std::lock_guard lock(mutex_);
    ++data_.breaker_trips[{service, reason}];
}

RemediationStats::Snapshot RemediationStats::snapshot() const {
    std::lock_guard lock(mutex_);
    return data_;
}

std::string RemediationStats::classify_failure(const std::string& error) {
    if (error.find("time budget exhausted") != std::string::npos) return "budget_exhausted";
    if (error.find("timed out") != std::string::npos) return "timeout";
    if (error.find("health check failed") != std::string::npos) return "health_check";
    return "provider";
}

} // namespace autoheal
