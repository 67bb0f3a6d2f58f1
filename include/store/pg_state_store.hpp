#pragma once

#include "store/istate_store.hpp"

#include <libpq-fe.h>

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace autoheal {

/**
 * @brief PostgreSQL-backed IStateStore (libpq)
 *
 * One connection guarded by a mutex; every statement is parameterized.
 * Timestamps are stored as epoch milliseconds. A partial unique index on
 * incidents(service, kind) WHERE status = 'ACTIVE' backs the single-active
 * incident rule at the database level.
 *
 * commit_remediation runs BEGIN / four writes / COMMIT and rolls back on
 * the first failure.
 */
class PgStateStore : public IStateStore {
public:
    explicit PgStateStore(std::string connection_string);
    ~PgStateStore() override;

    PgStateStore(const PgStateStore&) = delete;
    PgStateStore& operator=(const PgStateStore&) = delete;

    /// Connect and create tables/indexes if missing
    [[nodiscard]] Status connect();

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

    [[nodiscard]] std::string name() const override { return "postgresql"; }

private:
    struct PGResultDeleter {
        void operator()(PGresult* res) const noexcept {
            if (res) PQclear(res);
        }
    };
    using PGResultPtr = std::unique_ptr<PGresult, PGResultDeleter>;

    using Params = std::vector<std::optional<std::string>>;

    struct QueryOutcome {
        PGResultPtr result;
        std::string error;

        [[nodiscard]] bool ok() const { return error.empty(); }
    };

    // Caller must hold mutex_
    [[nodiscard]] QueryOutcome exec(const char* sql, const Params& params = {});
    [[nodiscard]] bool ensure_connected();
    [[nodiscard]] Status ensure_schema();

    [[nodiscard]] QueryOutcome write_incident_update(const Incident& incident);
    [[nodiscard]] QueryOutcome write_breaker(const CircuitBreakerRecord& record);

    static Incident row_to_incident(PGresult* res, int row);
    static RemediationAction row_to_action(PGresult* res, int row);

    std::string connection_string_;
    PGconn* conn_ = nullptr;
    std::mutex mutex_;
};

} // namespace autoheal
