#pragma once

#include "core/error.hpp"
#include "core/types.hpp"

#include <string>
#include <vector>

namespace autoheal {

/**
 * @brief Everything one remediation outcome writes, committed atomically
 *
 * A crash between the writes must never leave an action recorded without
 * the matching breaker and incident update, so backends apply these four
 * records in a single transaction.
 */
struct RemediationCommit {
    RemediationAction action;
    ActionWindowEntry window_entry;
    CircuitBreakerRecord breaker;
    Incident incident;
};

/**
 * @brief Durable storage for incidents, actions, breaker state and the
 * action window
 *
 * Pure persistence, no business rules. Implementations must be safe to
 * call from several service workers at once.
 */
class IStateStore {
public:
    virtual ~IStateStore() = default;

    // ---- Incidents ----------------------------------------------------------

    /// Insert a new incident; the returned copy carries the assigned id
    [[nodiscard]] virtual Result<Incident> insert_incident(const Incident& incident) = 0;

    [[nodiscard]] virtual Status update_incident(const Incident& incident) = 0;

    /// NOT_FOUND when the id is unknown
    [[nodiscard]] virtual Result<Incident> get_incident(int64_t id) = 0;

    /// NOT_FOUND when no ACTIVE incident exists for (service, kind)
    [[nodiscard]] virtual Result<Incident> find_active_incident(
        const std::string& service, FindingKind kind) = 0;

    [[nodiscard]] virtual Result<std::vector<Incident>> list_active_incidents(
        const std::string& service) = 0;

    // ---- Remediation actions (append-only) ----------------------------------

    [[nodiscard]] virtual Result<std::vector<RemediationAction>> list_actions(int64_t incident_id) = 0;

    // ---- Action window ------------------------------------------------------

    [[nodiscard]] virtual Result<size_t> count_window_entries(
        const std::string& service, ActionType action_type, TimePoint since) = 0;

    [[nodiscard]] virtual Result<std::vector<ActionWindowEntry>> list_window_entries(TimePoint since) = 0;

    // ---- Circuit breaker ----------------------------------------------------

    /// NOT_FOUND when the service has no persisted record yet
    [[nodiscard]] virtual Result<CircuitBreakerRecord> load_breaker(const std::string& service) = 0;

    [[nodiscard]] virtual Status save_breaker(const CircuitBreakerRecord& record) = 0;

    // ---- Transactional outcome ----------------------------------------------

    /**
     * @brief Append the action and window entry, upsert the breaker record
     * and update the incident, all or nothing
     * @return The stored action with its assigned id
     */
    [[nodiscard]] virtual Result<RemediationAction> commit_remediation(const RemediationCommit& commit) = 0;

    [[nodiscard]] virtual std::string name() const = 0;
};

} // namespace autoheal
