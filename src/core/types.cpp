#include "core/types.hpp"
#include "core/utils.hpp"

#include <unordered_map>

namespace autoheal {

std::optional<Severity> parse_severity(std::string_view s) {
    static const std::unordered_map<std::string, Severity> lookup = {
        {"info",     Severity::INFO},
        {"warning",  Severity::WARNING},
        {"critical", Severity::CRITICAL},
    };
    const auto it = lookup.find(utils::to_lower(s));
    return (it != lookup.end()) ? std::make_optional(it->second) : std::nullopt;
}

std::optional<FindingKind> parse_finding_kind(std::string_view s) {
    static const std::unordered_map<std::string_view, FindingKind> lookup = {
        {keys::HEALTH_CHECK_FAILED, FindingKind::HEALTH_CHECK_FAILED},
        {keys::HIGH_ERROR_RATE,     FindingKind::HIGH_ERROR_RATE},
        {keys::CPU_SPIKE,           FindingKind::CPU_SPIKE},
        {keys::HIGH_RESPONSE_TIME,  FindingKind::HIGH_RESPONSE_TIME},
        {keys::MEMORY_LEAK,         FindingKind::MEMORY_LEAK},
        {keys::EXTERNAL_ADVISORY,   FindingKind::EXTERNAL_ADVISORY},
    };
    const auto it = lookup.find(s);
    return (it != lookup.end()) ? std::make_optional(it->second) : std::nullopt;
}

std::optional<IncidentStatus> parse_incident_status(std::string_view s) {
    static const std::unordered_map<std::string, IncidentStatus> lookup = {
        {"active",    IncidentStatus::ACTIVE},
        {"resolved",  IncidentStatus::RESOLVED},
        {"escalated", IncidentStatus::ESCALATED},
    };
    const auto it = lookup.find(utils::to_lower(s));
    return (it != lookup.end()) ? std::make_optional(it->second) : std::nullopt;
}

std::optional<ActionType> parse_action_type(std::string_view s) {
    static const std::unordered_map<std::string_view, ActionType> lookup = {
        {keys::RESTART_CONTAINER, ActionType::RESTART_CONTAINER},
        {keys::SCALE_UP,          ActionType::SCALE_UP},
        {keys::SCALE_DOWN,        ActionType::SCALE_DOWN},
        {keys::HEAL,              ActionType::HEAL},
        {keys::MANUAL,            ActionType::MANUAL},
    };
    const auto it = lookup.find(s);
    return (it != lookup.end()) ? std::make_optional(it->second) : std::nullopt;
}

std::optional<CircuitState> parse_circuit_state(std::string_view s) {
    static const std::unordered_map<std::string, CircuitState> lookup = {
        {"closed",    CircuitState::CLOSED},
        {"open",      CircuitState::OPEN},
        {"half_open", CircuitState::HALF_OPEN},
    };
    const auto it = lookup.find(utils::to_lower(s));
    return (it != lookup.end()) ? std::make_optional(it->second) : std::nullopt;
}

} // namespace autoheal
