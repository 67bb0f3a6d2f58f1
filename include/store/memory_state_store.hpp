#pragma once

#include "store/istate_store.hpp"

#include <atomic>
#include <map>
#include <mutex>
#include <unordered_map>

namespace autoheal {

/**
 * @brief In-process IStateStore
 *
 * Used when no database is configured and by tests. A single mutex makes
 * commit_remediation trivially atomic. set_fail_writes() lets tests exercise
 * the persistence-error paths.
 */
class MemoryStateStore : public IStateStore {
public:
    MemoryStateStore() = default;

    [[nodiscard]] Result<Incident> insert_incident(const Incident& incident) override;
    [[nodiscard]] Status update_incident(const Incident& incident) override;
    [[nodiscard]] Result<Incident> get_incident(int64_t id) override;
    [[nodiscard]] Result<Incident> find_active_incident(
        const std::string& service, FindingKind kind) override;
    [[nodiscard]] Result<std::vector<Incident>> list_active_incidents(
        const std::string& service) override;

    [[nodiscard]] Result<std::vector<RemediationAction>> list_actions(int64_t incident_id) override;

    [[nodiscard]] Result<size_t> count_window_entries(
        const std::string& service, ActionType action_type, TimePoint since) override;
    [[nodiscard]] Result<std::vector<ActionWindowEntry>> list_window_entries(TimePoint since) override;

    [[nodiscard]] Result<CircuitBreakerRecord> load_breaker(const std::string& service) override;
    [[nodiscard]] Status save_breaker(const CircuitBreakerRecord& record) override;

    [[nodiscard]] Result<RemediationAction> commit_remediation(const RemediationCommit& commit) override;

    [[nodiscard]] std::string name() const override { return "memory"; }

    /// Make every write fail with PERSISTENCE_ERROR until cleared
    void set_fail_writes(bool fail) { fail_writes_.store(fail); }

    [[nodiscard]] size_t incident_count() const;
    [[nodiscard]] size_t action_count() const;
    [[nodiscard]] size_t window_entry_count() const;

private:
    [[nodiscard]] Status check_writable() const;

    std::map<int64_t, Incident> incidents_;
    std::vector<RemediationAction> actions_;
    std::vector<ActionWindowEntry> window_;
    std::unordered_map<std::string, CircuitBreakerRecord> breakers_;

    int64_t next_incident_id_ = 1;
    int64_t next_action_id_ = 1;

    std::atomic<bool> fail_writes_{false};
    mutable std::mutex mutex_;
};

} // namespace autoheal
