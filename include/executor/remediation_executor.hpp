#pragma once

#include "config/config_types.hpp"
#include "core/error.hpp"
#include "core/remediation_stats.hpp"
#include "core/types.hpp"
#include "executor/action_rate_limiter.hpp"
#include "executor/circuit_breaker_registry.hpp"
#include "executor/ilifecycle_provider.hpp"
#include "incident/incident_manager.hpp"
#include "notify/notification_types.hpp"
#include "store/istate_store.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace autoheal {

/**
 * @brief Runs one remediation action and records its outcome
 *
 * For automatic (BOT) actions the caller must already hold the service's
 * breaker slot (CircuitBreaker::allow). The executor:
 *   1. counts the attempt on the incident,
 *   2. calls the lifecycle provider under provider_timeout (a timeout is a
 *      failure); the provider is handed the same budget,
 *   3. verifies health after a restart when configured, within what is left
 *      of that budget,
 *   4. feeds the breaker and the rate-limit window,
 *   5. commits action, window entry, breaker record and incident in one
 *      transaction through the IncidentManager.
 *
 * A commit that fails is kept and retried by retry_pending() at the start
 * of the next tick. Provider errors never escape as exceptions.
 */
class RemediationExecutor {
public:
    RemediationExecutor(std::shared_ptr<ILifecycleProvider> provider,
                        std::shared_ptr<IncidentManager> incidents,
                        std::shared_ptr<CircuitBreakerRegistry> breakers,
                        std::shared_ptr<ActionRateLimiter> rate_limiter,
                        std::shared_ptr<INotifier> notifier);

    /**
     * @brief Execute a policy-selected action for an ACTIVE incident
     * @return The committed action (success or failure of the provider call);
     *         PERSISTENCE_ERROR when the outcome could not be committed,
     *         INTERNAL_ERROR for an action with no provider operation
     */
    [[nodiscard]] Result<RemediationAction> execute(
        const Incident& incident, ActionType action, const MonitorConfig& config, TimePoint now);

    /**
     * @brief Operator-requested action: bypasses breaker and rate limiter
     *
     * Recorded in the action window as triggered_by=manual; the outcome is
     * not fed to the breaker.
     */
    [[nodiscard]] Result<RemediationAction> execute_manual(
        const Incident& incident, ActionType action, const MonitorConfig& config, TimePoint now);

    /**
     * @brief Re-commit outcomes that failed to persist
     * @return Number still pending
     */
    size_t retry_pending();

    [[nodiscard]] bool has_pending(const std::string& service) const;
    [[nodiscard]] size_t pending_count() const;

    /// Every provider outcome, committed or not, is counted here
    void set_stats(std::shared_ptr<RemediationStats> stats) {
        stats_ = std::move(stats);
    }

private:
    [[nodiscard]] Result<RemediationAction> run(
        const Incident& incident, ActionType action, TriggeredBy triggered_by,
        const MonitorConfig& config, TimePoint now);

    /// Provider call bounded by timeout; exceptions become failures
    [[nodiscard]] ProviderResult call_provider(ActionType action, const std::string& target,
                                               std::chrono::milliseconds timeout);

    void notify_breaker_opened(const Incident& incident, const CircuitBreakerRecord& record,
                               const std::string& reason);

    std::shared_ptr<ILifecycleProvider> provider_;
    std::shared_ptr<IncidentManager> incidents_;
    std::shared_ptr<CircuitBreakerRegistry> breakers_;
    std::shared_ptr<ActionRateLimiter> rate_limiter_;
    std::shared_ptr<INotifier> notifier_;
    std::shared_ptr<RemediationStats> stats_;

    std::vector<RemediationCommit> pending_;
    mutable std::mutex pending_mutex_;
};

} // namespace autoheal
