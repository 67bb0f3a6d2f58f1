#pragma once

#include "config/config_types.hpp"
#include "core/types.hpp"

#include <optional>

namespace autoheal {

/**
 * @brief Default action for a finding kind
 *
 * health_check_failed, cpu_spike, high_response_time, memory_leak restart the
 * container; high_error_rate follows remediation.error_rate_action;
 * external_advisory follows remediation.advisory_action.
 *
 * @return nullopt when policy says observe only
 */
[[nodiscard]] std::optional<ActionType> select_action(FindingKind kind, const RemediationConfig& config);

/// True for action types that map to a lifecycle provider operation
[[nodiscard]] bool is_executable(ActionType action);

} // namespace autoheal
