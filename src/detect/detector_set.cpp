#include "detect/detector_set.hpp"
#include "detect/detectors.hpp"
#include "core/utils.hpp"

#include <format>

namespace autoheal {

DetectorSet DetectorSet::with_defaults() {
    DetectorSet set;
    set.add(std::make_unique<HealthCheckDetector>());
    set.add(std::make_unique<ErrorRateDetector>());
    set.add(std::make_unique<CpuSpikeDetector>());
    set.add(std::make_unique<LatencyDetector>());
    set.add(std::make_unique<MemoryDetector>());
    set.add(std::make_unique<AdvisoryDetector>());
    return set;
}

void DetectorSet::add(std::unique_ptr<IDetector> detector) {
    detectors_.push_back(std::move(detector));
}

std::vector<Finding> DetectorSet::run(
    const MetricsSnapshot& snapshot,
    const std::vector<MetricsSnapshot>& history,
    const MonitorConfig& config) const {
    std::vector<Finding> findings;
    const bool health_failed = !snapshot.reachable || snapshot.status_code >= 500;

    for (const auto& detector : detectors_) {
        if (!detector->enabled(config.detectors)) continue;
        if (health_failed && detector->name() != "health_check") continue;

        try {
            if (auto finding = detector->evaluate(snapshot, history, config)) {
                findings.push_back(std::move(*finding));
            }
        } catch (const std::exception& e) {
            detector_errors_.fetch_add(1, std::memory_order_relaxed);
            utils::log::error(std::format("Detector {} failed for {}: {}",
                                          detector->name(), snapshot.service, e.what()));
        }
    }

    return findings;
}

} // namespace autoheal
