#include "executor/remediation_policy.hpp"

namespace autoheal {

std::optional<ActionType> select_action(FindingKind kind, const RemediationConfig& config) {
    switch (kind) {
        case FindingKind::HEALTH_CHECK_FAILED:
        case FindingKind::CPU_SPIKE:
        case FindingKind::HIGH_RESPONSE_TIME:
        case FindingKind::MEMORY_LEAK:
            return ActionType::RESTART_CONTAINER;
        case FindingKind::HIGH_ERROR_RATE:
            return config.error_rate_action;
        case FindingKind::EXTERNAL_ADVISORY:
            return config.advisory_action;
    }
    return std::nullopt;
}

bool is_executable(ActionType action) {
    switch (action) {
        case ActionType::RESTART_CONTAINER:
        case ActionType::SCALE_UP:
        case ActionType::SCALE_DOWN:
        case ActionType::HEAL:
            return true;
        default:
            return false;
    }
}

} // namespace autoheal
