#include "detect/detectors.hpp"

#include <format>

namespace autoheal {

namespace {

Finding make_finding(const MetricsSnapshot& snapshot, FindingKind kind, Severity severity) {
    Finding f;
    f.service = snapshot.service;
    f.kind = kind;
    f.severity = severity;
    f.observed_at = snapshot.observed_at;
    return f;
}

/// Current snapshot plus the most recent history entries, newest last
std::vector<const MetricsSnapshot*> trailing_window(
    const MetricsSnapshot& snapshot,
    const std::vector<MetricsSnapshot>& history,
    size_t count) {
    std::vector<const MetricsSnapshot*> window;
    if (count == 0 || history.size() + 1 < count) return window;

    window.reserve(count);
    for (size_t i = history.size() - (count - 1); i < history.size(); ++i) {
        window.push_back(&history[i]);
    }
    window.push_back(&snapshot);
    return window;
}

} // anonymous namespace

// ============================================================================
// Health check
// ============================================================================

std::optional<Finding> HealthCheckDetector::evaluate(
    const MetricsSnapshot& snapshot,
    const std::vector<MetricsSnapshot>& /*history*/,
    const MonitorConfig& /*config*/) const {
    const bool server_error = snapshot.status_code >= 500;
    if (snapshot.reachable && !server_error) return std::nullopt;

    auto f = make_finding(snapshot, FindingKind::HEALTH_CHECK_FAILED, Severity::CRITICAL);
    f.evidence["reachable"] = snapshot.reachable ? "true" : "false";
    if (snapshot.status_code != 0) {
        f.evidence["status_code"] = std::to_string(snapshot.status_code);
    }
    if (!snapshot.error.empty()) {
        f.evidence["error"] = snapshot.error;
    } else if (server_error) {
        f.evidence["error"] = std::format("HTTP {}", snapshot.status_code);
    }
    return f;
}

// ============================================================================
// Error rate
// ============================================================================

double ErrorRateDetector::effective_rate(const MetricsSnapshot& snapshot) {
    if (snapshot.requests == 0) return snapshot.error_rate;
    return static_cast<double>(snapshot.errors) / static_cast<double>(snapshot.requests);
}

std::optional<Finding> ErrorRateDetector::evaluate(
    const MetricsSnapshot& snapshot,
    const std::vector<MetricsSnapshot>& /*history*/,
    const MonitorConfig& config) const {
    const double rate = effective_rate(snapshot);
    const auto& t = config.thresholds;
    if (rate <= t.error_rate) return std::nullopt;

    const bool critical = rate > t.error_rate_critical;
    auto f = make_finding(snapshot, FindingKind::HIGH_ERROR_RATE,
                          critical ? Severity::CRITICAL : Severity::WARNING);
    f.evidence["error_rate"] = std::format("{:.4f}", rate);
    f.evidence["threshold"] = std::format("{:.4f}", critical ? t.error_rate_critical : t.error_rate);
    f.evidence["requests"] = std::to_string(snapshot.requests);
    f.evidence["errors"] = std::to_string(snapshot.errors);
    return f;
}

// ============================================================================
// CPU spike
// ============================================================================

std::optional<Finding> CpuSpikeDetector::evaluate(
    const MetricsSnapshot& snapshot,
    const std::vector<MetricsSnapshot>& history,
    const MonitorConfig& config) const {
    const double threshold = config.thresholds.cpu_percent;
    if (snapshot.cpu_percent <= threshold) return std::nullopt;

    const auto ticks = config.detectors.cpu_sustained_ticks;
    const auto window = trailing_window(snapshot, history, ticks);
    bool sustained = !window.empty();
    for (const auto* s : window) {
        if (!s->reachable || s->cpu_percent <= threshold) {
            sustained = false;
            break;
        }
    }

    auto f = make_finding(snapshot, FindingKind::CPU_SPIKE,
                          sustained ? Severity::CRITICAL : Severity::WARNING);
    f.evidence["cpu_percent"] = std::format("{:.2f}", snapshot.cpu_percent);
    f.evidence["threshold"] = std::format("{:.2f}", threshold);
    if (sustained) {
        f.evidence["sustained_ticks"] = std::to_string(ticks);
    }
    return f;
}

// ============================================================================
// Latency
// ============================================================================

std::optional<Finding> LatencyDetector::evaluate(
    const MetricsSnapshot& snapshot,
    const std::vector<MetricsSnapshot>& /*history*/,
    const MonitorConfig& config) const {
    const double threshold = config.thresholds.response_time_ms;
    if (snapshot.p95_ms <= threshold) return std::nullopt;

    const bool critical = snapshot.p95_ms > threshold * 2.0;
    auto f = make_finding(snapshot, FindingKind::HIGH_RESPONSE_TIME,
                          critical ? Severity::CRITICAL : Severity::WARNING);
    f.evidence["p95_ms"] = std::format("{:.2f}", snapshot.p95_ms);
    f.evidence["p50_ms"] = std::format("{:.2f}", snapshot.p50_ms);
    f.evidence["p99_ms"] = std::format("{:.2f}", snapshot.p99_ms);
    f.evidence["threshold_ms"] = std::format("{:.2f}", threshold);
    return f;
}

// ============================================================================
// Memory
// ============================================================================

std::optional<Finding> MemoryDetector::evaluate(
    const MetricsSnapshot& snapshot,
    const std::vector<MetricsSnapshot>& history,
    const MonitorConfig& config) const {
    const double threshold = config.thresholds.memory_mb;
    if (snapshot.memory_mb <= threshold) return std::nullopt;

    const auto ticks = config.detectors.memory_sustained_ticks;
    const auto window = trailing_window(snapshot, history, ticks);
    bool growing = window.size() >= 2;
    for (size_t i = 1; i < window.size(); ++i) {
        if (!window[i - 1]->reachable || window[i]->memory_mb <= window[i - 1]->memory_mb) {
            growing = false;
            break;
        }
    }

    auto f = make_finding(snapshot, FindingKind::MEMORY_LEAK,
                          growing ? Severity::CRITICAL : Severity::WARNING);
    f.evidence["memory_mb"] = std::format("{:.2f}", snapshot.memory_mb);
    f.evidence["threshold_mb"] = std::format("{:.2f}", threshold);
    if (growing) {
        f.evidence["growth_mb"] = std::format("{:.2f}", snapshot.memory_mb - window.front()->memory_mb);
    }
    return f;
}

// ============================================================================
// Advisory
// ============================================================================

std::optional<Finding> AdvisoryDetector::evaluate(
    const MetricsSnapshot& snapshot,
    const std::vector<MetricsSnapshot>& /*history*/,
    const MonitorConfig& config) const {
    if (!snapshot.advisory) return std::nullopt;

    const auto& advisory = *snapshot.advisory;
    const auto& t = config.thresholds;
    if (advisory.score < t.advisory_score) return std::nullopt;

    const bool critical = advisory.score >= t.advisory_critical_score;
    auto f = make_finding(snapshot, FindingKind::EXTERNAL_ADVISORY,
                          critical ? Severity::CRITICAL : Severity::WARNING);
    f.evidence["source"] = advisory.source;
    f.evidence["score"] = std::format("{:.3f}", advisory.score);
    if (!advisory.message.empty()) {
        f.evidence["message"] = advisory.message;
    }
    return f;
}

} // namespace autoheal
