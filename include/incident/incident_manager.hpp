#pragma once

#include "core/error.hpp"
#include "core/types.hpp"
#include "notify/notification_types.hpp"
#include "store/istate_store.hpp"

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace autoheal {

/**
 * @brief Incident lifecycle: ACTIVE -> RESOLVED | ESCALATED
 *
 * Findings are deduplicated on the ACTIVE (service, kind) pair: a repeated
 * finding merges its evidence into the open incident and raises the severity
 * if the new one is higher. RESOLVED and ESCALATED are terminal. Every
 * transition enqueues a notification.
 *
 * The close time of the last incident per (service, kind) is remembered so
 * the caller can hold back findings that would reopen it straight away
 * (recently_closed). That memory is process-local.
 *
 * All transitions for a service are expected to be serialized by the caller
 * (orchestrator per-service lock); record() additionally holds an internal
 * lock so the single-ACTIVE invariant survives unsynchronized callers.
 */
class IncidentManager {
public:
    IncidentManager(std::shared_ptr<IStateStore> store, std::shared_ptr<INotifier> notifier);

    /**
     * @brief Open a new incident or merge into the ACTIVE one
     * @return The ACTIVE incident after the merge
     */
    [[nodiscard]] Result<Incident> record(const Finding& finding);

    /**
     * @brief ACTIVE -> RESOLVED, stamping resolved_at and duration
     *
     * No-op on a non-ACTIVE incident; the current record is returned.
     */
    [[nodiscard]] Result<Incident> resolve(int64_t incident_id, TimePoint at);

    /// ACTIVE -> ESCALATED (terminal). No-op on a non-ACTIVE incident.
    [[nodiscard]] Result<Incident> escalate(int64_t incident_id, const std::string& reason, TimePoint at);

    /// Count one remediation attempt and stamp last_action_at
    [[nodiscard]] Result<Incident> note_attempt(int64_t incident_id, TimePoint at);

    /**
     * @brief True when an incident for the finding's (service, kind) closed
     * less than @p window before the finding was observed
     */
    [[nodiscard]] bool recently_closed(const Finding& finding, std::chrono::seconds window) const;

    [[nodiscard]] Result<Incident> get(int64_t incident_id);
    [[nodiscard]] Result<std::vector<Incident>> active_incidents(const std::string& service);

    /**
     * @brief Apply an outcome to a copy of the incident without persisting it
     *
     * Success resolves the incident. Failure leaves it ACTIVE.
     */
    [[nodiscard]] static Incident stage_outcome(Incident incident, bool success, TimePoint at);

    /**
     * @brief Persist a remediation outcome in one transaction and emit the
     * matching notifications once it is durable
     */
    [[nodiscard]] Result<RemediationAction> commit(const RemediationCommit& commit);

private:
    void emit(EventType type, const Incident& incident, std::string title, std::string message);
    void note_closed(const Incident& incident);

    std::shared_ptr<IStateStore> store_;
    std::shared_ptr<INotifier> notifier_;
    std::mutex record_mutex_;

    std::map<std::pair<std::string, FindingKind>, TimePoint> last_closed_;
    mutable std::mutex closed_mutex_;
};

} // namespace autoheal
