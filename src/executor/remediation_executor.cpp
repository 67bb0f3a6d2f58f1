#include "executor/remediation_executor.hpp"
#include "executor/remediation_policy.hpp"
#include "core/utils.hpp"

#include <format>
#include <future>
#include <thread>

namespace autoheal {

RemediationExecutor::RemediationExecutor(std::shared_ptr<ILifecycleProvider> provider,
                                         std::shared_ptr<IncidentManager> incidents,
                                         std::shared_ptr<CircuitBreakerRegistry> breakers,
                                         std::shared_ptr<ActionRateLimiter> rate_limiter,
                                         std::shared_ptr<INotifier> notifier)
    : provider_(std::move(provider)),
      incidents_(std::move(incidents)),
      breakers_(std::move(breakers)),
      rate_limiter_(std::move(rate_limiter)),
      notifier_(std::move(notifier)) {}

// ============================================================================
// Public Interface
// ============================================================================

Result<RemediationAction> RemediationExecutor::execute(
    const Incident& incident, ActionType action, const MonitorConfig& config, TimePoint now) {
    return run(incident, action, TriggeredBy::BOT, config, now);
}

Result<RemediationAction> RemediationExecutor::execute_manual(
    const Incident& incident, ActionType action, const MonitorConfig& config, TimePoint now) {
    utils::log::info(std::format("Manual {} requested for {} (incident {})",
        action_type_to_string(action), incident.service, incident.id));
    return run(incident, action, TriggeredBy::MANUAL, config, now);
}

size_t RemediationExecutor::retry_pending() {
    std::vector<RemediationCommit> batch;
    {
        std::lock_guard lock(pending_mutex_);
        batch.swap(pending_);
    }

    std::vector<RemediationCommit> still_pending;
    for (auto& commit : batch) {
        // Breaker may have moved on since the outcome was staged
        commit.breaker = breakers_->get_breaker(commit.breaker.service)->snapshot();
        auto stored = incidents_->commit(commit);
        if (stored.is_error()) {
            utils::log::warn(std::format("Re-commit of {} outcome for incident {} failed: {}",
                action_type_to_string(commit.action.action_type), commit.incident.id,
                stored.error_message()));
            still_pending.push_back(std::move(commit));
        } else {
            utils::log::info(std::format("Re-committed {} outcome for incident {}",
                action_type_to_string(commit.action.action_type), commit.incident.id));
        }
    }

    std::lock_guard lock(pending_mutex_);
    // Anything queued concurrently goes after the retried batch
    for (auto& commit : pending_) {
        still_pending.push_back(std::move(commit));
    }
    pending_.swap(still_pending);
    return pending_.size();
}

bool RemediationExecutor::has_pending(const std::string& service) const {
    std::lock_guard lock(pending_mutex_);
    for (const auto& commit : pending_) {
        if (commit.incident.service == service) return true;
    }
    return false;
}

size_t RemediationExecutor::pending_count() const {
    std::lock_guard lock(pending_mutex_);
    return pending_.size();
}

// ============================================================================
// Execution
// ============================================================================

Result<RemediationAction> RemediationExecutor::run(
    const Incident& incident, ActionType action, TriggeredBy triggered_by,
    const MonitorConfig& config, TimePoint now) {

    auto breaker = breakers_->get_breaker(incident.service);
    const bool feeds_breaker = triggered_by == TriggeredBy::BOT;

    if (!is_executable(action)) {
        if (feeds_breaker) breaker->release();
        return Result<RemediationAction>::error(ErrorCategory::INTERNAL_ERROR,
            std::format("action '{}' has no lifecycle operation", action_type_to_string(action)));
    }

    // Count the attempt before touching the target
    auto attempted = incidents_->note_attempt(incident.id, now);
    if (attempted.is_error()) {
        if (feeds_breaker) breaker->release();
        return Result<RemediationAction>::error(attempted.error_category(),
            std::format("could not record attempt on incident {}: {}",
                        incident.id, attempted.error_message()));
    }

    const ServiceConfig* svc = config.find_service(incident.service);
    const std::string target = svc ? svc->target() : incident.service;
    const auto timeout = config.remediation.provider_timeout;

    utils::log::info(std::format("Executing {} on {} for incident {} ({}, attempt {})",
        action_type_to_string(action), target, incident.id,
        triggered_by_to_string(triggered_by), attempted.value().attempts));

    // One budget covers the action and its verification
    utils::Timer timer;
    ProviderResult result = call_provider(action, target, timeout);
    if (result.success && action == ActionType::RESTART_CONTAINER &&
        config.remediation.verify_after_restart) {
        auto verified = call_provider(ActionType::HEAL, target, timeout - timer.elapsed_ms());
        if (!verified.success) {
            result = ProviderResult::failure(
                std::format("post-restart health check failed: {}", verified.error));
        }
    }
    const auto elapsed = timer.elapsed_ms();
    const TimePoint completed_at = now + elapsed;

    RemediationAction record;
    record.uuid = utils::generate_uuid();
    record.incident_id = incident.id;
    record.service = incident.service;
    record.action_type = action;
    record.target = target;
    record.success = result.success;
    record.error = result.error;
    record.execution_time = elapsed;
    record.triggered_by = triggered_by;
    record.created_at = completed_at;
    if (stats_) stats_->record_action(record);

    if (result.success) {
        utils::log::info(std::format("{} on {} succeeded in {}ms",
            action_type_to_string(action), target, elapsed.count()));
    } else {
        utils::log::error(std::format("{} on {} failed after {}ms: {}",
            action_type_to_string(action), target, elapsed.count(), result.error));
    }

    ActionWindowEntry window_entry{incident.service, action, completed_at, result.success};
    rate_limiter_->record(window_entry);

    if (feeds_breaker) {
        const CircuitState before = breaker->get_state();
        const CircuitState after = breaker->record_outcome(result.success, completed_at);
        if (after == CircuitState::OPEN && before != CircuitState::OPEN) {
            notify_breaker_opened(incident, breaker->snapshot(),
                before == CircuitState::HALF_OPEN
                    ? "recovery trial failed"
                    : std::format("{} consecutive remediation failures",
                                  breaker->snapshot().failure_count));
        }
    }

    RemediationCommit commit{
        record,
        window_entry,
        breaker->snapshot(),
        IncidentManager::stage_outcome(attempted.value(), result.success, completed_at)
    };

    auto stored = incidents_->commit(commit);
    if (stored.is_error()) {
        utils::log::error(std::format("Outcome for incident {} not persisted, will retry: {}",
                                      incident.id, stored.error_message()));
        std::lock_guard lock(pending_mutex_);
        pending_.push_back(std::move(commit));
    }
    return stored;
}

ProviderResult RemediationExecutor::call_provider(ActionType action, const std::string& target,
                                                  std::chrono::milliseconds timeout) {
    if (timeout.count() <= 0) {
        return ProviderResult::failure(std::format("{} on {} not started: time budget exhausted",
            action_type_to_string(action), target));
    }

    // The provider gets the same budget and gives up on its own; the task
    // owns a reference to it so a call that overruns can still unwind safely
    auto task = std::make_shared<std::packaged_task<ProviderResult()>>(
        [provider = provider_, action, target, timeout]() -> ProviderResult {
            switch (action) {
                case ActionType::RESTART_CONTAINER: return provider->restart(target, timeout);
                case ActionType::SCALE_UP:          return provider->scale(target, 1, timeout);
                case ActionType::SCALE_DOWN:        return provider->scale(target, -1, timeout);
                case ActionType::HEAL:              return provider->health(target, timeout);
                default:
                    return ProviderResult::failure(std::format(
                        "action '{}' has no lifecycle operation", action_type_to_string(action)));
            }
        });

    auto future = task->get_future();
    std::thread([task] { (*task)(); }).detach();

    if (future.wait_for(timeout) == std::future_status::timeout) {
        return ProviderResult::failure(std::format("{} on {} timed out after {}ms",
            action_type_to_string(action), target, timeout.count()));
    }

    try {
        return future.get();
    } catch (const std::exception& e) {
        return ProviderResult::failure(std::format("{} provider error: {}", provider_->name(), e.what()));
    }
}

void RemediationExecutor::notify_breaker_opened(const Incident& incident,
                                                const CircuitBreakerRecord& record,
                                                const std::string& reason) {
    if (!notifier_) return;
    auto event = make_event(EventType::BREAKER_OPENED, incident.service, Severity::CRITICAL,
        "Circuit breaker opened",
        std::format("Circuit breaker OPENED for `{}` - {}", incident.service, reason));
    event.incident_id = incident.id;
    event.fields["failure_count"] = std::to_string(record.failure_count);
    if (record.opened_at) {
        event.fields["opened_at"] = utils::format_timestamp(*record.opened_at);
    }
    notifier_->notify(std::move(event));
}

} // namespace autoheal
