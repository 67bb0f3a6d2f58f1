#include "store/memory_state_store.hpp"

#include <algorithm>
#include <format>

namespace autoheal {

Status MemoryStateStore::check_writable() const {
    if (fail_writes_.load()) {
        return Status::error(ErrorCategory::PERSISTENCE_ERROR, "memory store: writes disabled");
    }
    return Status::ok();
}

// ============================================================================
// Incidents
// ============================================================================

Result<Incident> MemoryStateStore::insert_incident(const Incident& incident) {
    if (auto st = check_writable(); st.is_error()) {
        return Result<Incident>::error(st.category, st.message);
    }

    std::lock_guard lock(mutex_);
    Incident stored = incident;
    stored.id = next_incident_id_++;
    incidents_[stored.id] = stored;
    return Result<Incident>::ok(std::move(stored));
}

Status MemoryStateStore::update_incident(const Incident& incident) {
    if (auto st = check_writable(); st.is_error()) return st;

    std::lock_guard lock(mutex_);
    const auto it = incidents_.find(incident.id);
    if (it == incidents_.end()) {
        return Status::error(ErrorCategory::NOT_FOUND,
                             std::format("incident {} not found", incident.id));
    }
    it->second = incident;
    return Status::ok();
}

Result<Incident> MemoryStateStore::get_incident(int64_t id) {
    std::lock_guard lock(mutex_);
    const auto it = incidents_.find(id);
    if (it == incidents_.end()) {
        return Result<Incident>::error(ErrorCategory::NOT_FOUND,
                                       std::format("incident {} not found", id));
    }
    return Result<Incident>::ok(it->second);
}

Result<Incident> MemoryStateStore::find_active_incident(
    const std::string& service, FindingKind kind) {
    std::lock_guard lock(mutex_);
    for (const auto& [id, incident] : incidents_) {
        if (incident.service == service && incident.kind == kind &&
            incident.status == IncidentStatus::ACTIVE) {
            return Result<Incident>::ok(incident);
        }
    }
    return Result<Incident>::error(ErrorCategory::NOT_FOUND, "no active incident");
}

Result<std::vector<Incident>> MemoryStateStore::list_active_incidents(const std::string& service) {
    std::lock_guard lock(mutex_);
    std::vector<Incident> result;
    for (const auto& [id, incident] : incidents_) {
        if (incident.service == service && incident.status == IncidentStatus::ACTIVE) {
            result.push_back(incident);
        }
    }
    return Result<std::vector<Incident>>::ok(std::move(result));
}

// ============================================================================
// Actions and window
// ============================================================================

Result<std::vector<RemediationAction>> MemoryStateStore::list_actions(int64_t incident_id) {
    std::lock_guard lock(mutex_);
    std::vector<RemediationAction> result;
    for (const auto& action : actions_) {
        if (action.incident_id == incident_id) {
            result.push_back(action);
        }
    }
    return Result<std::vector<RemediationAction>>::ok(std::move(result));
}

Result<size_t> MemoryStateStore::count_window_entries(
    const std::string& service, ActionType action_type, TimePoint since) {
    std::lock_guard lock(mutex_);
    const auto count = std::count_if(window_.begin(), window_.end(),
        [&](const ActionWindowEntry& e) {
            return e.service == service && e.action_type == action_type && e.timestamp >= since;
        });
    return Result<size_t>::ok(static_cast<size_t>(count));
}

Result<std::vector<ActionWindowEntry>> MemoryStateStore::list_window_entries(TimePoint since) {
    std::lock_guard lock(mutex_);
    std::vector<ActionWindowEntry> result;
    for (const auto& entry : window_) {
        if (entry.timestamp >= since) {
            result.push_back(entry);
        }
    }
    return Result<std::vector<ActionWindowEntry>>::ok(std::move(result));
}

// ============================================================================
// Circuit breaker
// ============================================================================

Result<CircuitBreakerRecord> MemoryStateStore::load_breaker(const std::string& service) {
    std::lock_guard lock(mutex_);
    const auto it = breakers_.find(service);
    if (it == breakers_.end()) {
        return Result<CircuitBreakerRecord>::error(ErrorCategory::NOT_FOUND,
            std::format("no breaker record for {}", service));
    }
    return Result<CircuitBreakerRecord>::ok(it->second);
}

Status MemoryStateStore::save_breaker(const CircuitBreakerRecord& record) {
    if (auto st = check_writable(); st.is_error()) return st;

    std::lock_guard lock(mutex_);
    breakers_[record.service] = record;
    return Status::ok();
}

// ============================================================================
// Transactional outcome
// ============================================================================

Result<RemediationAction> MemoryStateStore::commit_remediation(const RemediationCommit& commit) {
    if (auto st = check_writable(); st.is_error()) {
        return Result<RemediationAction>::error(st.category, st.message);
    }

    std::lock_guard lock(mutex_);
    const auto it = incidents_.find(commit.incident.id);
    if (it == incidents_.end()) {
        return Result<RemediationAction>::error(ErrorCategory::NOT_FOUND,
            std::format("incident {} not found", commit.incident.id));
    }

    RemediationAction stored = commit.action;
    stored.id = next_action_id_++;
    actions_.push_back(stored);
    window_.push_back(commit.window_entry);
    breakers_[commit.breaker.service] = commit.breaker;
    it->second = commit.incident;
    return Result<RemediationAction>::ok(std::move(stored));
}

// ============================================================================
// Introspection
// ============================================================================

size_t MemoryStateStore::incident_count() const {
    std::lock_guard lock(mutex_);
    return incidents_.size();
}

size_t MemoryStateStore::action_count() const {
    std::lock_guard lock(mutex_);
    return actions_.size();
}

size_t MemoryStateStore::window_entry_count() const {
    std::lock_guard lock(mutex_);
    return window_.size();
}

} // namespace autoheal
