#include "incident/incident_manager.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>

namespace autoheal {

namespace {

void merge_evidence(Evidence& into, const Evidence& from) {
    for (const auto& [key, value] : from) {
        into[key] = value;
    }
}

std::string summarize(const Evidence& evidence) {
    std::string out;
    for (const auto& [key, value] : evidence) {
        if (!out.empty()) out += ", ";
        out += std::format("{}={}", key, value);
    }
    return out;
}

} // anonymous namespace

IncidentManager::IncidentManager(std::shared_ptr<IStateStore> store,
                                 std::shared_ptr<INotifier> notifier)
    : store_(std::move(store)),
      notifier_(std::move(notifier)) {}

// ============================================================================
// Transitions
// ============================================================================

Result<Incident> IncidentManager::record(const Finding& finding) {
    std::lock_guard lock(record_mutex_);

    auto existing = store_->find_active_incident(finding.service, finding.kind);
    if (existing.is_ok()) {
        Incident incident = existing.value();
        merge_evidence(incident.details, finding.evidence);
        if (static_cast<int>(finding.severity) > static_cast<int>(incident.severity)) {
            utils::log::info(std::format("Incident {} ({} on {}) severity {} -> {}",
                incident.id, finding_kind_to_string(incident.kind), incident.service,
                severity_to_string(incident.severity), severity_to_string(finding.severity)));
            incident.severity = finding.severity;
        }
        if (auto st = store_->update_incident(incident); st.is_error()) {
            return Result<Incident>::error(st.category, st.message);
        }
        return Result<Incident>::ok(std::move(incident));
    }

    if (existing.error_category() != ErrorCategory::NOT_FOUND) {
        return existing;
    }

    Incident incident;
    incident.uuid = utils::generate_uuid();
    incident.service = finding.service;
    incident.kind = finding.kind;
    incident.severity = finding.severity;
    incident.status = IncidentStatus::ACTIVE;
    incident.details = finding.evidence;
    incident.created_at = finding.observed_at;

    auto inserted = store_->insert_incident(incident);
    if (inserted.is_error()) {
        return inserted;
    }

    const Incident& stored = inserted.value();
    utils::log::warn(std::format("Incident {} opened: {} on {} [{}]",
        stored.id, finding_kind_to_string(stored.kind), stored.service,
        severity_to_string(stored.severity)));
    emit(EventType::INCIDENT_CREATED, stored,
         std::format("Incident detected: {}", finding_kind_to_string(stored.kind)),
         std::format("Service `{}`: {}", stored.service, summarize(stored.details)));
    return inserted;
}

Result<Incident> IncidentManager::resolve(int64_t incident_id, TimePoint at) {
    auto found = store_->get_incident(incident_id);
    if (found.is_error() || found.value().status != IncidentStatus::ACTIVE) {
        return found;
    }

    Incident incident = stage_outcome(found.value(), true, at);
    if (auto st = store_->update_incident(incident); st.is_error()) {
        return Result<Incident>::error(st.category, st.message);
    }

    note_closed(incident);
    emit(EventType::INCIDENT_RESOLVED, incident,
         std::format("Incident resolved: {}", finding_kind_to_string(incident.kind)),
         std::format("Service `{}` recovered after {}s", incident.service,
                     incident.resolution_duration.value_or(std::chrono::seconds{0}).count()));
    return Result<Incident>::ok(std::move(incident));
}

Result<Incident> IncidentManager::escalate(int64_t incident_id, const std::string& reason, TimePoint at) {
    auto found = store_->get_incident(incident_id);
    if (found.is_error() || found.value().status != IncidentStatus::ACTIVE) {
        return found;
    }

    Incident incident = found.value();
    incident.status = IncidentStatus::ESCALATED;
    incident.escalation_reason = reason;
    incident.resolved_at = at;
    if (auto st = store_->update_incident(incident); st.is_error()) {
        return Result<Incident>::error(st.category, st.message);
    }

    utils::log::error(std::format("Incident {} escalated ({}): {}",
                                  incident.id, incident.service, reason));
    note_closed(incident);
    emit(EventType::INCIDENT_ESCALATED, incident, "Escalation required",
         std::format("ESCALATION REQUIRED for `{}` - Auto-remediation exhausted. "
                     "Manual intervention needed. Reason: {}", incident.service, reason));
    return Result<Incident>::ok(std::move(incident));
}

Result<Incident> IncidentManager::note_attempt(int64_t incident_id, TimePoint at) {
    auto found = store_->get_incident(incident_id);
    if (found.is_error()) {
        return found;
    }

    Incident incident = found.value();
    ++incident.attempts;
    incident.last_action_at = at;
    if (auto st = store_->update_incident(incident); st.is_error()) {
        return Result<Incident>::error(st.category, st.message);
    }
    return Result<Incident>::ok(std::move(incident));
}

// ============================================================================
// Queries
// ============================================================================

bool IncidentManager::recently_closed(const Finding& finding, std::chrono::seconds window) const {
    if (window.count() <= 0) return false;
    std::lock_guard lock(closed_mutex_);
    const auto it = last_closed_.find({finding.service, finding.kind});
    return it != last_closed_.end() && finding.observed_at - it->second < window;
}

Result<Incident> IncidentManager::get(int64_t incident_id) {
    return store_->get_incident(incident_id);
}

Result<std::vector<Incident>> IncidentManager::active_incidents(const std::string& service) {
    return store_->list_active_incidents(service);
}

// ============================================================================
// Remediation outcome
// ============================================================================

Incident IncidentManager::stage_outcome(Incident incident, bool success, TimePoint at) {
    if (!success || incident.status != IncidentStatus::ACTIVE) {
        return incident;
    }
    incident.status = IncidentStatus::RESOLVED;
    incident.resolved_at = at;
    const auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(at - incident.created_at);
    incident.resolution_duration = elapsed.count() < 0 ? std::chrono::seconds{0} : elapsed;
    return incident;
}

Result<RemediationAction> IncidentManager::commit(const RemediationCommit& commit) {
    auto stored = store_->commit_remediation(commit);
    if (stored.is_error()) {
        return stored;
    }

    const RemediationAction& action = stored.value();
    const Incident& incident = commit.incident;

    if (action.success) {
        emit(EventType::REMEDIATION_SUCCEEDED, incident,
             std::format("Remediation succeeded: {}", action_type_to_string(action.action_type)),
             std::format("`{}` on `{}` completed in {}ms", action_type_to_string(action.action_type),
                         action.target, action.execution_time.count()));
    } else {
        emit(EventType::REMEDIATION_FAILED, incident,
             std::format("Remediation failed: {}", action_type_to_string(action.action_type)),
             std::format("`{}` on `{}` failed: {}", action_type_to_string(action.action_type),
                         action.target, action.error));
    }

    if (incident.status == IncidentStatus::RESOLVED) {
        utils::log::info(std::format("Incident {} resolved by {}",
                                     incident.id, action_type_to_string(action.action_type)));
        note_closed(incident);
        emit(EventType::INCIDENT_RESOLVED, incident,
             std::format("Incident resolved: {}", finding_kind_to_string(incident.kind)),
             std::format("Service `{}` recovered after {}s", incident.service,
                         incident.resolution_duration.value_or(std::chrono::seconds{0}).count()));
    }
    return stored;
}

void IncidentManager::note_closed(const Incident& incident) {
    std::lock_guard lock(closed_mutex_);
    auto& closed = last_closed_[{incident.service, incident.kind}];
    closed = std::max(closed, incident.resolved_at.value_or(TimePoint{}));
}

void IncidentManager::emit(EventType type, const Incident& incident,
                           std::string title, std::string message) {
    if (!notifier_) return;
    auto event = make_event(type, incident.service, incident.severity,
                            std::move(title), std::move(message));
    event.incident_id = incident.id;
    event.fields = incident.details;
    event.fields["kind"] = std::string(finding_kind_to_string(incident.kind));
    notifier_->notify(std::move(event));
}

} // namespace autoheal
