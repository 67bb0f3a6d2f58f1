#pragma once

#include "core/types.hpp"

#include <array>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <utility>

namespace autoheal {

/**
 * @brief Cumulative, labelled counters for the Prometheus exporter
 *
 * Fed by the executor (actions), the orchestrator (detections) and the
 * breaker registry's state-change callback (trips). Thread-safe.
 */
class RemediationStats {
public:
    /// Upper bounds (seconds) of the action duration histogram; +Inf is implicit
    static constexpr std::array<double, 7> kDurationBuckets = {1, 5, 10, 30, 60, 120, 300};

    struct DurationHistogram {
        std::array<uint64_t, kDurationBuckets.size() + 1> buckets = {};  // Not cumulative
        double sum_seconds = 0.0;
        uint64_t count = 0;
    };

    using LabelPair = std::pair<std::string, std::string>;

    struct Snapshot {
        std::map<LabelPair, uint64_t> actions;       // (action_type, target)
        std::map<LabelPair, uint64_t> failures;      // (action_type, error_type)
        std::map<std::string, DurationHistogram> durations;   // action_type
        std::map<LabelPair, uint64_t> breaker_trips; // (service, reason)
        std::map<std::string, uint64_t> detections;  // detector_type
    };

    void record_action(const RemediationAction& action);
    void record_detection(FindingKind kind);

    /// Counts transitions into OPEN; anything else is ignored
    void record_state_change(const std::string& service, CircuitState from, CircuitState to);

    [[nodiscard]] Snapshot snapshot() const;

    /// "timeout", "budget_exhausted", "health_check" or "provider"
    [[nodiscard]] static std::string classify_failure(const std::string& error);

private:
    Snapshot data_;
    mutable std::mutex mutex_;
};

} // namespace autoheal
