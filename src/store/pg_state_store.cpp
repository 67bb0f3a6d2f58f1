#include "store/pg_state_store.hpp"
#include "core/json.hpp"
#include "core/utils.hpp"

#include <format>

namespace autoheal {

namespace {

constexpr const char* kSchemaSql =
    "CREATE TABLE IF NOT EXISTS incidents ("
    "  id BIGSERIAL PRIMARY KEY,"
    "  uuid TEXT NOT NULL UNIQUE,"
    "  service TEXT NOT NULL,"
    "  kind TEXT NOT NULL,"
    "  severity TEXT NOT NULL,"
    "  status TEXT NOT NULL,"
    "  details JSONB NOT NULL DEFAULT '{}',"
    "  created_at_ms BIGINT NOT NULL,"
    "  resolved_at_ms BIGINT,"
    "  resolution_seconds BIGINT,"
    "  attempts INTEGER NOT NULL DEFAULT 0,"
    "  last_action_at_ms BIGINT,"
    "  escalation_reason TEXT NOT NULL DEFAULT '');"
    "CREATE UNIQUE INDEX IF NOT EXISTS incidents_one_active "
    "  ON incidents (service, kind) WHERE status = 'ACTIVE';"
    "CREATE TABLE IF NOT EXISTS remediation_actions ("
    "  id BIGSERIAL PRIMARY KEY,"
    "  uuid TEXT NOT NULL UNIQUE,"
    "  incident_id BIGINT NOT NULL REFERENCES incidents(id),"
    "  service TEXT NOT NULL,"
    "  action_type TEXT NOT NULL,"
    "  target TEXT NOT NULL,"
    "  success BOOLEAN NOT NULL,"
    "  error TEXT NOT NULL DEFAULT '',"
    "  execution_time_ms BIGINT NOT NULL,"
    "  triggered_by TEXT NOT NULL,"
    "  created_at_ms BIGINT NOT NULL);"
    "CREATE INDEX IF NOT EXISTS remediation_actions_incident ON remediation_actions (incident_id);"
    "CREATE TABLE IF NOT EXISTS action_window ("
    "  id BIGSERIAL PRIMARY KEY,"
    "  service TEXT NOT NULL,"
    "  action_type TEXT NOT NULL,"
    "  ts_ms BIGINT NOT NULL,"
    "  success BOOLEAN NOT NULL);"
    "CREATE INDEX IF NOT EXISTS action_window_lookup ON action_window (service, action_type, ts_ms);"
    "CREATE TABLE IF NOT EXISTS circuit_breaker_state ("
    "  service TEXT PRIMARY KEY,"
    "  state TEXT NOT NULL,"
    "  failure_count INTEGER NOT NULL,"
    "  success_count INTEGER NOT NULL,"
    "  last_failure_at_ms BIGINT,"
    "  opened_at_ms BIGINT,"
    "  last_success_at_ms BIGINT);";

constexpr const char* kIncidentColumns =
    "id, uuid, service, kind, severity, status, details::text, created_at_ms, "
    "resolved_at_ms, resolution_seconds, attempts, last_action_at_ms, escalation_reason";

constexpr const char* kActionColumns =
    "id, uuid, incident_id, service, action_type, target, success, error, "
    "execution_time_ms, triggered_by, created_at_ms";

std::string ms_param(TimePoint tp) {
    return std::to_string(utils::to_epoch_ms(tp));
}

std::optional<std::string> optional_ms_param(const std::optional<TimePoint>& tp) {
    if (!tp) return std::nullopt;
    return ms_param(*tp);
}

std::string text_at(PGresult* res, int row, int col) {
    const char* v = PQgetvalue(res, row, col);
    return v ? std::string(v) : std::string();
}

int64_t int_at(PGresult* res, int row, int col) {
    return utils::parse_int<int64_t>(text_at(res, row, col));
}

std::optional<TimePoint> optional_time_at(PGresult* res, int row, int col) {
    if (PQgetisnull(res, row, col)) return std::nullopt;
    return utils::from_epoch_ms(int_at(res, row, col));
}

bool bool_at(PGresult* res, int row, int col) {
    return text_at(res, row, col) == "t";
}

} // anonymous namespace

// ============================================================================
// Connection management
// ============================================================================

PgStateStore::PgStateStore(std::string connection_string)
    : connection_string_(std::move(connection_string)) {}

PgStateStore::~PgStateStore() {
    if (conn_) {
        PQfinish(conn_);
        conn_ = nullptr;
    }
}

Status PgStateStore::connect() {
    std::lock_guard lock(mutex_);
    if (!ensure_connected()) {
        return Status::error(ErrorCategory::PERSISTENCE_ERROR,
            std::format("PostgreSQL connection failed: {}",
                        conn_ ? PQerrorMessage(conn_) : "out of memory"));
    }
    return ensure_schema();
}

bool PgStateStore::ensure_connected() {
    if (conn_ && PQstatus(conn_) == CONNECTION_OK) return true;

    if (conn_) {
        utils::log::warn("PostgreSQL connection lost, resetting");
        PQreset(conn_);
        return PQstatus(conn_) == CONNECTION_OK;
    }

    conn_ = PQconnectdb(connection_string_.c_str());
    return conn_ && PQstatus(conn_) == CONNECTION_OK;
}

Status PgStateStore::ensure_schema() {
    PGResultPtr res(PQexec(conn_, kSchemaSql));
    if (!res || PQresultStatus(res.get()) != PGRES_COMMAND_OK) {
        return Status::error(ErrorCategory::PERSISTENCE_ERROR,
            std::format("schema setup failed: {}", PQerrorMessage(conn_)));
    }
    return Status::ok();
}

PgStateStore::QueryOutcome PgStateStore::exec(const char* sql, const Params& params) {
    QueryOutcome outcome;
    if (!ensure_connected()) {
        outcome.error = std::format("not connected: {}", conn_ ? PQerrorMessage(conn_) : "no handle");
        return outcome;
    }

    std::vector<const char*> values;
    values.reserve(params.size());
    for (const auto& p : params) {
        values.push_back(p ? p->c_str() : nullptr);
    }

    outcome.result.reset(PQexecParams(conn_, sql, static_cast<int>(values.size()),
                                      nullptr, values.data(), nullptr, nullptr, 0));
    if (!outcome.result) {
        outcome.error = PQerrorMessage(conn_);
        return outcome;
    }

    const ExecStatusType status = PQresultStatus(outcome.result.get());
    if (status != PGRES_TUPLES_OK && status != PGRES_COMMAND_OK) {
        outcome.error = PQresultErrorMessage(outcome.result.get());
    }
    return outcome;
}

// ============================================================================
// Row mapping
// ============================================================================

Incident PgStateStore::row_to_incident(PGresult* res, int row) {
    Incident inc;
    inc.id = int_at(res, row, 0);
    inc.uuid = text_at(res, row, 1);
    inc.service = text_at(res, row, 2);
    inc.kind = parse_finding_kind(text_at(res, row, 3)).value_or(FindingKind::HEALTH_CHECK_FAILED);
    inc.severity = parse_severity(text_at(res, row, 4)).value_or(Severity::WARNING);
    inc.status = parse_incident_status(text_at(res, row, 5)).value_or(IncidentStatus::ACTIVE);
    inc.details = evidence_from_json(text_at(res, row, 6));
    inc.created_at = utils::from_epoch_ms(int_at(res, row, 7));
    inc.resolved_at = optional_time_at(res, row, 8);
    if (!PQgetisnull(res, row, 9)) {
        inc.resolution_duration = std::chrono::seconds(int_at(res, row, 9));
    }
    inc.attempts = static_cast<uint32_t>(int_at(res, row, 10));
    inc.last_action_at = optional_time_at(res, row, 11);
    inc.escalation_reason = text_at(res, row, 12);
    return inc;
}

RemediationAction PgStateStore::row_to_action(PGresult* res, int row) {
    RemediationAction action;
    action.id = int_at(res, row, 0);
    action.uuid = text_at(res, row, 1);
    action.incident_id = int_at(res, row, 2);
    action.service = text_at(res, row, 3);
    action.action_type = parse_action_type(text_at(res, row, 4)).value_or(ActionType::MANUAL);
    action.target = text_at(res, row, 5);
    action.success = bool_at(res, row, 6);
    action.error = text_at(res, row, 7);
    action.execution_time = std::chrono::milliseconds(int_at(res, row, 8));
    action.triggered_by = text_at(res, row, 9) == "manual" ? TriggeredBy::MANUAL : TriggeredBy::BOT;
    action.created_at = utils::from_epoch_ms(int_at(res, row, 10));
    return action;
}

// ============================================================================
// Incidents
// ============================================================================

Result<Incident> PgStateStore::insert_incident(const Incident& incident) {
    std::lock_guard lock(mutex_);
    const auto q = exec(
        "INSERT INTO incidents (uuid, service, kind, severity, status, details, created_at_ms, "
        "resolved_at_ms, resolution_seconds, attempts, last_action_at_ms, escalation_reason) "
        "VALUES ($1, $2, $3, $4, $5, $6::jsonb, $7, $8, $9, $10, $11, $12) RETURNING id",
        {incident.uuid, incident.service,
         std::string(finding_kind_to_string(incident.kind)),
         std::string(severity_to_string(incident.severity)),
         std::string(incident_status_to_string(incident.status)),
         evidence_to_json(incident.details),
         ms_param(incident.created_at),
         optional_ms_param(incident.resolved_at),
         incident.resolution_duration
             ? std::make_optional(std::to_string(incident.resolution_duration->count()))
             : std::nullopt,
         std::to_string(incident.attempts),
         optional_ms_param(incident.last_action_at),
         incident.escalation_reason});
    if (!q.ok()) {
        return Result<Incident>::error(ErrorCategory::PERSISTENCE_ERROR,
                                       std::format("insert incident: {}", q.error));
    }

    Incident stored = incident;
    stored.id = int_at(q.result.get(), 0, 0);
    return Result<Incident>::ok(std::move(stored));
}

PgStateStore::QueryOutcome PgStateStore::write_incident_update(const Incident& incident) {
    return exec(
        "UPDATE incidents SET severity = $2, status = $3, details = $4::jsonb, "
        "resolved_at_ms = $5, resolution_seconds = $6, attempts = $7, "
        "last_action_at_ms = $8, escalation_reason = $9 WHERE id = $1",
        {std::to_string(incident.id),
         std::string(severity_to_string(incident.severity)),
         std::string(incident_status_to_string(incident.status)),
         evidence_to_json(incident.details),
         optional_ms_param(incident.resolved_at),
         incident.resolution_duration
             ? std::make_optional(std::to_string(incident.resolution_duration->count()))
             : std::nullopt,
         std::to_string(incident.attempts),
         optional_ms_param(incident.last_action_at),
         incident.escalation_reason});
}

Status PgStateStore::update_incident(const Incident& incident) {
    std::lock_guard lock(mutex_);
    const auto q = write_incident_update(incident);
    if (!q.ok()) {
        return Status::error(ErrorCategory::PERSISTENCE_ERROR,
                             std::format("update incident {}: {}", incident.id, q.error));
    }
    if (std::string(PQcmdTuples(q.result.get())) == "0") {
        return Status::error(ErrorCategory::NOT_FOUND,
                             std::format("incident {} not found", incident.id));
    }
    return Status::ok();
}

Result<Incident> PgStateStore::get_incident(int64_t id) {
    std::lock_guard lock(mutex_);
    const auto sql = std::format("SELECT {} FROM incidents WHERE id = $1", kIncidentColumns);
    const auto q = exec(sql.c_str(), {std::to_string(id)});
    if (!q.ok()) {
        return Result<Incident>::error(ErrorCategory::PERSISTENCE_ERROR, q.error);
    }
    if (PQntuples(q.result.get()) == 0) {
        return Result<Incident>::error(ErrorCategory::NOT_FOUND,
                                       std::format("incident {} not found", id));
    }
    return Result<Incident>::ok(row_to_incident(q.result.get(), 0));
}

Result<Incident> PgStateStore::find_active_incident(const std::string& service, FindingKind kind) {
    std::lock_guard lock(mutex_);
    const auto sql = std::format(
        "SELECT {} FROM incidents WHERE service = $1 AND kind = $2 AND status = 'ACTIVE'",
        kIncidentColumns);
    const auto q = exec(sql.c_str(), {service, std::string(finding_kind_to_string(kind))});
    if (!q.ok()) {
        return Result<Incident>::error(ErrorCategory::PERSISTENCE_ERROR, q.error);
    }
    if (PQntuples(q.result.get()) == 0) {
        return Result<Incident>::error(ErrorCategory::NOT_FOUND, "no active incident");
    }
    return Result<Incident>::ok(row_to_incident(q.result.get(), 0));
}

Result<std::vector<Incident>> PgStateStore::list_active_incidents(const std::string& service) {
    std::lock_guard lock(mutex_);
    const auto sql = std::format(
        "SELECT {} FROM incidents WHERE service = $1 AND status = 'ACTIVE' ORDER BY id",
        kIncidentColumns);
    const auto q = exec(sql.c_str(), {service});
    if (!q.ok()) {
        return Result<std::vector<Incident>>::error(ErrorCategory::PERSISTENCE_ERROR, q.error);
    }

    std::vector<Incident> result;
    const int rows = PQntuples(q.result.get());
    result.reserve(static_cast<size_t>(rows));
    for (int i = 0; i < rows; ++i) {
        result.push_back(row_to_incident(q.result.get(), i));
    }
    return Result<std::vector<Incident>>::ok(std::move(result));
}

// ============================================================================
// Actions and window
// ============================================================================

Result<std::vector<RemediationAction>> PgStateStore::list_actions(int64_t incident_id) {
    std::lock_guard lock(mutex_);
    const auto sql = std::format(
        "SELECT {} FROM remediation_actions WHERE incident_id = $1 ORDER BY id", kActionColumns);
    const auto q = exec(sql.c_str(), {std::to_string(incident_id)});
    if (!q.ok()) {
        return Result<std::vector<RemediationAction>>::error(ErrorCategory::PERSISTENCE_ERROR, q.error);
    }

    std::vector<RemediationAction> result;
    const int rows = PQntuples(q.result.get());
    for (int i = 0; i < rows; ++i) {
        result.push_back(row_to_action(q.result.get(), i));
    }
    return Result<std::vector<RemediationAction>>::ok(std::move(result));
}

Result<size_t> PgStateStore::count_window_entries(
    const std::string& service, ActionType action_type, TimePoint since) {
    std::lock_guard lock(mutex_);
    const auto q = exec(
        "SELECT COUNT(*) FROM action_window WHERE service = $1 AND action_type = $2 AND ts_ms >= $3",
        {service, std::string(action_type_to_string(action_type)), ms_param(since)});
    if (!q.ok()) {
        return Result<size_t>::error(ErrorCategory::PERSISTENCE_ERROR, q.error);
    }
    return Result<size_t>::ok(static_cast<size_t>(int_at(q.result.get(), 0, 0)));
}

Result<std::vector<ActionWindowEntry>> PgStateStore::list_window_entries(TimePoint since) {
    std::lock_guard lock(mutex_);
    const auto q = exec(
        "SELECT service, action_type, ts_ms, success FROM action_window WHERE ts_ms >= $1 ORDER BY ts_ms",
        {ms_param(since)});
    if (!q.ok()) {
        return Result<std::vector<ActionWindowEntry>>::error(ErrorCategory::PERSISTENCE_ERROR, q.error);
    }

    std::vector<ActionWindowEntry> result;
    const int rows = PQntuples(q.result.get());
    for (int i = 0; i < rows; ++i) {
        ActionWindowEntry entry;
        entry.service = text_at(q.result.get(), i, 0);
        entry.action_type = parse_action_type(text_at(q.result.get(), i, 1)).value_or(ActionType::MANUAL);
        entry.timestamp = utils::from_epoch_ms(int_at(q.result.get(), i, 2));
        entry.success = bool_at(q.result.get(), i, 3);
        result.push_back(std::move(entry));
    }
    return Result<std::vector<ActionWindowEntry>>::ok(std::move(result));
}

// ============================================================================
// Circuit breaker
// ============================================================================

Result<CircuitBreakerRecord> PgStateStore::load_breaker(const std::string& service) {
    std::lock_guard lock(mutex_);
    const auto q = exec(
        "SELECT service, state, failure_count, success_count, last_failure_at_ms, "
        "opened_at_ms, last_success_at_ms FROM circuit_breaker_state WHERE service = $1",
        {service});
    if (!q.ok()) {
        return Result<CircuitBreakerRecord>::error(ErrorCategory::PERSISTENCE_ERROR, q.error);
    }
    if (PQntuples(q.result.get()) == 0) {
        return Result<CircuitBreakerRecord>::error(ErrorCategory::NOT_FOUND,
            std::format("no breaker record for {}", service));
    }

    PGresult* res = q.result.get();
    CircuitBreakerRecord record;
    record.service = text_at(res, 0, 0);
    record.state = parse_circuit_state(text_at(res, 0, 1)).value_or(CircuitState::CLOSED);
    record.failure_count = static_cast<uint32_t>(int_at(res, 0, 2));
    record.success_count = static_cast<uint32_t>(int_at(res, 0, 3));
    record.last_failure_at = optional_time_at(res, 0, 4);
    record.opened_at = optional_time_at(res, 0, 5);
    record.last_success_at = optional_time_at(res, 0, 6);
    return Result<CircuitBreakerRecord>::ok(std::move(record));
}

PgStateStore::QueryOutcome PgStateStore::write_breaker(const CircuitBreakerRecord& record) {
    return exec(
        "INSERT INTO circuit_breaker_state (service, state, failure_count, success_count, "
        "last_failure_at_ms, opened_at_ms, last_success_at_ms) VALUES ($1, $2, $3, $4, $5, $6, $7) "
        "ON CONFLICT (service) DO UPDATE SET state = EXCLUDED.state, "
        "failure_count = EXCLUDED.failure_count, success_count = EXCLUDED.success_count, "
        "last_failure_at_ms = EXCLUDED.last_failure_at_ms, opened_at_ms = EXCLUDED.opened_at_ms, "
        "last_success_at_ms = EXCLUDED.last_success_at_ms",
        {record.service,
         std::string(circuit_state_to_string(record.state)),
         std::to_string(record.failure_count),
         std::to_string(record.success_count),
         optional_ms_param(record.last_failure_at),
         optional_ms_param(record.opened_at),
         optional_ms_param(record.last_success_at)});
}

Status PgStateStore::save_breaker(const CircuitBreakerRecord& record) {
    std::lock_guard lock(mutex_);
    const auto q = write_breaker(record);
    if (!q.ok()) {
        return Status::error(ErrorCategory::PERSISTENCE_ERROR,
                             std::format("save breaker {}: {}", record.service, q.error));
    }
    return Status::ok();
}

// ============================================================================
// Transactional outcome
// ============================================================================

Result<RemediationAction> PgStateStore::commit_remediation(const RemediationCommit& commit) {
    std::lock_guard lock(mutex_);

    auto fail = [this](const std::string& step, const std::string& error) {
        const auto rb = exec("ROLLBACK");
        if (!rb.ok()) {
            utils::log::error(std::format("PostgreSQL rollback failed: {}", rb.error));
        }
        return Result<RemediationAction>::error(ErrorCategory::PERSISTENCE_ERROR,
            std::format("commit remediation ({}): {}", step, error));
    };

    const auto begin = exec("BEGIN");
    if (!begin.ok()) {
        return Result<RemediationAction>::error(ErrorCategory::PERSISTENCE_ERROR,
            std::format("commit remediation (begin): {}", begin.error));
    }

    const auto& a = commit.action;
    const auto insert_action = exec(
        "INSERT INTO remediation_actions (uuid, incident_id, service, action_type, target, "
        "success, error, execution_time_ms, triggered_by, created_at_ms) "
        "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10) RETURNING id",
        {a.uuid, std::to_string(a.incident_id), a.service,
         std::string(action_type_to_string(a.action_type)), a.target,
         std::string(utils::booltostr(a.success)), a.error,
         std::to_string(a.execution_time.count()),
         std::string(triggered_by_to_string(a.triggered_by)),
         ms_param(a.created_at)});
    if (!insert_action.ok()) return fail("action", insert_action.error);

    const auto& w = commit.window_entry;
    const auto insert_window = exec(
        "INSERT INTO action_window (service, action_type, ts_ms, success) VALUES ($1, $2, $3, $4)",
        {w.service, std::string(action_type_to_string(w.action_type)),
         ms_param(w.timestamp), std::string(utils::booltostr(w.success))});
    if (!insert_window.ok()) return fail("window", insert_window.error);

    const auto breaker = write_breaker(commit.breaker);
    if (!breaker.ok()) return fail("breaker", breaker.error);

    const auto incident = write_incident_update(commit.incident);
    if (!incident.ok()) return fail("incident", incident.error);

    const auto done = exec("COMMIT");
    if (!done.ok()) return fail("commit", done.error);

    RemediationAction stored = a;
    stored.id = int_at(insert_action.result.get(), 0, 0);
    return Result<RemediationAction>::ok(std::move(stored));
}

} // namespace autoheal
