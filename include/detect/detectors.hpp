#pragma once

#include "detect/idetector.hpp"

namespace autoheal {

// ============================================================================
// Canonical detectors
//
// Each one maps a single signal to zero or one Finding. Evidence values are
// preformatted strings so they can be merged into incident details as-is.
// ============================================================================

/// Unreachable or 5xx -> health_check_failed, CRITICAL
class HealthCheckDetector : public IDetector {
public:
    [[nodiscard]] std::optional<Finding> evaluate(
        const MetricsSnapshot& snapshot,
        const std::vector<MetricsSnapshot>& history,
        const MonitorConfig& config) const override;
    [[nodiscard]] bool enabled(const DetectorConfig& c) const override { return c.health_check_enabled; }
    [[nodiscard]] std::string_view name() const override { return "health_check"; }
};

/**
 * @brief errors/requests for the window (reported rate when no requests)
 *
 * Above error_rate -> WARNING, above error_rate_critical -> CRITICAL.
 */
class ErrorRateDetector : public IDetector {
public:
    [[nodiscard]] std::optional<Finding> evaluate(
        const MetricsSnapshot& snapshot,
        const std::vector<MetricsSnapshot>& history,
        const MonitorConfig& config) const override;
    [[nodiscard]] bool enabled(const DetectorConfig& c) const override { return c.error_rate_enabled; }
    [[nodiscard]] std::string_view name() const override { return "error_rate"; }

    /// Rate used for the comparison
    [[nodiscard]] static double effective_rate(const MetricsSnapshot& snapshot);
};

/**
 * @brief cpu_percent above threshold -> WARNING
 *
 * CRITICAL when the current snapshot and the cpu_sustained_ticks - 1 before
 * it are all above the threshold.
 */
class CpuSpikeDetector : public IDetector {
public:
    [[nodiscard]] std::optional<Finding> evaluate(
        const MetricsSnapshot& snapshot,
        const std::vector<MetricsSnapshot>& history,
        const MonitorConfig& config) const override;
    [[nodiscard]] bool enabled(const DetectorConfig& c) const override { return c.cpu_enabled; }
    [[nodiscard]] std::string_view name() const override { return "cpu_spike"; }
};

/// p95 above threshold -> WARNING, above twice the threshold -> CRITICAL
class LatencyDetector : public IDetector {
public:
    [[nodiscard]] std::optional<Finding> evaluate(
        const MetricsSnapshot& snapshot,
        const std::vector<MetricsSnapshot>& history,
        const MonitorConfig& config) const override;
    [[nodiscard]] bool enabled(const DetectorConfig& c) const override { return c.latency_enabled; }
    [[nodiscard]] std::string_view name() const override { return "latency"; }
};

/**
 * @brief memory_mb above threshold -> memory_leak WARNING
 *
 * CRITICAL when memory grew on every tick across memory_sustained_ticks.
 */
class MemoryDetector : public IDetector {
public:
    [[nodiscard]] std::optional<Finding> evaluate(
        const MetricsSnapshot& snapshot,
        const std::vector<MetricsSnapshot>& history,
        const MonitorConfig& config) const override;
    [[nodiscard]] bool enabled(const DetectorConfig& c) const override { return c.memory_enabled; }
    [[nodiscard]] std::string_view name() const override { return "memory"; }
};

/// Advisory score from an external producer (anomaly, failure probability, forecast)
class AdvisoryDetector : public IDetector {
public:
    [[nodiscard]] std::optional<Finding> evaluate(
        const MetricsSnapshot& snapshot,
        const std::vector<MetricsSnapshot>& history,
        const MonitorConfig& config) const override;
    [[nodiscard]] bool enabled(const DetectorConfig& c) const override { return c.advisory_enabled; }
    [[nodiscard]] std::string_view name() const override { return "advisory"; }
};

} // namespace autoheal
