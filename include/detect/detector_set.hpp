#pragma once

#include "detect/idetector.hpp"

#include <atomic>
#include <memory>
#include <vector>

namespace autoheal {

/**
 * @brief Runs every enabled detector over one snapshot
 *
 * A snapshot that failed its health check (unreachable or 5xx) carries no
 * usable metrics, so only health-check detectors run for it. A detector that
 * throws is logged and skipped; the remaining detectors still run.
 */
class DetectorSet {
public:
    DetectorSet() = default;

    /// Health check, error rate, CPU, latency, memory and advisory
    [[nodiscard]] static DetectorSet with_defaults();

    void add(std::unique_ptr<IDetector> detector);

    [[nodiscard]] std::vector<Finding> run(
        const MetricsSnapshot& snapshot,
        const std::vector<MetricsSnapshot>& history,
        const MonitorConfig& config) const;

    [[nodiscard]] size_t size() const { return detectors_.size(); }
    [[nodiscard]] uint64_t detector_errors() const { return detector_errors_.load(); }

    DetectorSet(DetectorSet&& other) noexcept
        : detectors_(std::move(other.detectors_)),
          detector_errors_(other.detector_errors_.load()) {}

private:
    std::vector<std::unique_ptr<IDetector>> detectors_;
    mutable std::atomic<uint64_t> detector_errors_{0};
};

} // namespace autoheal
