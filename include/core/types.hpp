#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace autoheal {

using TimePoint = std::chrono::system_clock::time_point;

// ============================================================================
// Enumerations
// ============================================================================

enum class Severity {
    INFO,
    WARNING,
    CRITICAL
};

enum class FindingKind {
    HEALTH_CHECK_FAILED,
    HIGH_ERROR_RATE,
    CPU_SPIKE,
    HIGH_RESPONSE_TIME,
    MEMORY_LEAK,
    EXTERNAL_ADVISORY
};

enum class IncidentStatus {
    ACTIVE,
    RESOLVED,
    ESCALATED       // Terminal: a human has to take over
};

enum class ActionType {
    RESTART_CONTAINER,
    SCALE_UP,
    SCALE_DOWN,
    HEAL,
    MANUAL
};

enum class TriggeredBy {
    BOT,
    MANUAL
};

enum class CircuitState {
    CLOSED,         // Normal operation
    OPEN,           // Failing, remediation blocked
    HALF_OPEN       // Testing recovery with a single trial
};

// ============================================================================
// String conversion
// ============================================================================

namespace keys {
    inline constexpr std::string_view HEALTH_CHECK_FAILED = "health_check_failed";
    inline constexpr std::string_view HIGH_ERROR_RATE     = "high_error_rate";
    inline constexpr std::string_view CPU_SPIKE           = "cpu_spike";
    inline constexpr std::string_view HIGH_RESPONSE_TIME  = "high_response_time";
    inline constexpr std::string_view MEMORY_LEAK         = "memory_leak";
    inline constexpr std::string_view EXTERNAL_ADVISORY   = "external_advisory";

    inline constexpr std::string_view RESTART_CONTAINER = "restart_container";
    inline constexpr std::string_view SCALE_UP          = "scale_up";
    inline constexpr std::string_view SCALE_DOWN        = "scale_down";
    inline constexpr std::string_view HEAL              = "heal";
    inline constexpr std::string_view MANUAL            = "manual";
}

[[nodiscard]] constexpr std::string_view severity_to_string(Severity s) {
    switch (s) {
        case Severity::INFO:     return "INFO";
        case Severity::WARNING:  return "WARNING";
        case Severity::CRITICAL: return "CRITICAL";
        default: return "UNKNOWN";
    }
}

[[nodiscard]] constexpr std::string_view finding_kind_to_string(FindingKind k) {
    switch (k) {
        case FindingKind::HEALTH_CHECK_FAILED: return keys::HEALTH_CHECK_FAILED;
        case FindingKind::HIGH_ERROR_RATE:     return keys::HIGH_ERROR_RATE;
        case FindingKind::CPU_SPIKE:           return keys::CPU_SPIKE;
        case FindingKind::HIGH_RESPONSE_TIME:  return keys::HIGH_RESPONSE_TIME;
        case FindingKind::MEMORY_LEAK:         return keys::MEMORY_LEAK;
        case FindingKind::EXTERNAL_ADVISORY:   return keys::EXTERNAL_ADVISORY;
        default: return "unknown";
    }
}

[[nodiscard]] constexpr std::string_view incident_status_to_string(IncidentStatus s) {
    switch (s) {
        case IncidentStatus::ACTIVE:    return "ACTIVE";
        case IncidentStatus::RESOLVED:  return "RESOLVED";
        case IncidentStatus::ESCALATED: return "ESCALATED";
        default: return "UNKNOWN";
    }
}

[[nodiscard]] constexpr std::string_view action_type_to_string(ActionType a) {
    switch (a) {
        case ActionType::RESTART_CONTAINER: return keys::RESTART_CONTAINER;
        case ActionType::SCALE_UP:          return keys::SCALE_UP;
        case ActionType::SCALE_DOWN:        return keys::SCALE_DOWN;
        case ActionType::HEAL:              return keys::HEAL;
        case ActionType::MANUAL:            return keys::MANUAL;
        default: return "unknown";
    }
}

[[nodiscard]] constexpr std::string_view triggered_by_to_string(TriggeredBy t) {
    return t == TriggeredBy::MANUAL ? "manual" : "bot";
}

[[nodiscard]] constexpr std::string_view circuit_state_to_string(CircuitState s) {
    switch (s) {
        case CircuitState::CLOSED:    return "CLOSED";
        case CircuitState::OPEN:      return "OPEN";
        case CircuitState::HALF_OPEN: return "HALF_OPEN";
        default: return "UNKNOWN";
    }
}

[[nodiscard]] std::optional<Severity> parse_severity(std::string_view s);
[[nodiscard]] std::optional<FindingKind> parse_finding_kind(std::string_view s);
[[nodiscard]] std::optional<IncidentStatus> parse_incident_status(std::string_view s);
[[nodiscard]] std::optional<ActionType> parse_action_type(std::string_view s);
[[nodiscard]] std::optional<CircuitState> parse_circuit_state(std::string_view s);

// ============================================================================
// Metrics snapshot
// ============================================================================

/**
 * @brief Score produced by an advisory source (anomaly model, failure
 * predictor, forecaster). Treated as one more detector input.
 */
struct AdvisorySignal {
    std::string source;
    double score = 0.0;
    std::string message;
};

struct MetricsSnapshot {
    std::string service;
    bool reachable = false;
    int status_code = 0;            // HTTP status of the health poll, 0 if none
    std::string error;              // Transport error when unreachable

    double cpu_percent = 0.0;
    double memory_mb = 0.0;
    double memory_percent = 0.0;

    double error_rate = 0.0;        // Reported rate (0..1), used when requests == 0
    uint64_t requests = 0;
    uint64_t errors = 0;

    double p50_ms = 0.0;
    double p95_ms = 0.0;
    double p99_ms = 0.0;

    std::optional<AdvisorySignal> advisory;
    TimePoint observed_at{};
};

// ============================================================================
// Findings and incidents
// ============================================================================

using Evidence = std::map<std::string, std::string>;

struct Finding {
    std::string service;
    FindingKind kind = FindingKind::HEALTH_CHECK_FAILED;
    Severity severity = Severity::WARNING;
    Evidence evidence;
    TimePoint observed_at{};
};

struct Incident {
    int64_t id = 0;
    std::string uuid;
    std::string service;
    FindingKind kind = FindingKind::HEALTH_CHECK_FAILED;
    Severity severity = Severity::WARNING;
    IncidentStatus status = IncidentStatus::ACTIVE;
    Evidence details;
    TimePoint created_at{};
    std::optional<TimePoint> resolved_at;
    std::optional<std::chrono::seconds> resolution_duration;

    uint32_t attempts = 0;
    std::optional<TimePoint> last_action_at;
    std::string escalation_reason;
};

struct RemediationAction {
    int64_t id = 0;
    std::string uuid;
    int64_t incident_id = 0;
    std::string service;
    ActionType action_type = ActionType::RESTART_CONTAINER;
    std::string target;
    bool success = false;
    std::string error;
    std::chrono::milliseconds execution_time{0};
    TriggeredBy triggered_by = TriggeredBy::BOT;
    TimePoint created_at{};
};

/**
 * @brief Persisted per-service circuit breaker record
 */
struct CircuitBreakerRecord {
    std::string service;
    CircuitState state = CircuitState::CLOSED;
    uint32_t failure_count = 0;
    uint32_t success_count = 0;
    std::optional<TimePoint> last_failure_at;
    std::optional<TimePoint> opened_at;
    std::optional<TimePoint> last_success_at;
};

struct ActionWindowEntry {
    std::string service;
    ActionType action_type = ActionType::RESTART_CONTAINER;
    TimePoint timestamp{};
    bool success = false;
};

} // namespace autoheal
