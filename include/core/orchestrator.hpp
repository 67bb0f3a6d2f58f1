#pragma once

#include "config/iconfig_source.hpp"
#include "core/remediation_stats.hpp"
#include "detect/detector_set.hpp"
#include "detect/snapshot_history.hpp"
#include "executor/action_rate_limiter.hpp"
#include "executor/circuit_breaker_registry.hpp"
#include "executor/remediation_executor.hpp"
#include "incident/incident_manager.hpp"
#include "metrics/imetrics_provider.hpp"
#include "store/istate_store.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

namespace autoheal {

/**
 * @brief Counters for one tick, summed over services
 */
struct TickReport {
    size_t services_polled = 0;
    size_t services_skipped = 0;        // Busy (attempt in flight) or disabled
    size_t findings = 0;
    size_t actions_executed = 0;
    size_t actions_succeeded = 0;
    size_t escalations = 0;
    size_t rate_limited = 0;
    size_t breaker_blocked = 0;
    size_t findings_suppressed = 0;     // Same (service, kind) closed within the dedupe window
    size_t errors = 0;
    size_t pending_commits = 0;

    TickReport& operator+=(const TickReport& other);
};

/**
 * @brief Periodic driver: snapshot -> detect -> record -> gate -> remediate
 *
 * Per tick the current config snapshot is fetched once and passed down.
 * Services are processed in parallel (at most max_parallel_services at a
 * time); everything that touches one service runs under that service's lock,
 * and a service whose lock is held (manual action in flight) is skipped for
 * the tick.
 *
 * Findings whose (service, kind) incident closed within
 * incident_dedupe_window are not recorded again.
 *
 * For each ACTIVE incident:
 *   - breaker OPEN           -> escalate
 *   - attempt within min_action_interval -> wait
 *   - no policy action       -> escalate
 *   - rate limiter refuses   -> escalate if the incident already had attempts
 *   - breaker busy           -> skip
 *   - otherwise              -> execute (one action per service per tick)
 */
class Orchestrator {
public:
    struct Dependencies {
        std::shared_ptr<IConfigSource> config;
        std::shared_ptr<IMetricsProvider> metrics;
        std::shared_ptr<IStateStore> store;
        std::shared_ptr<IncidentManager> incidents;
        std::shared_ptr<ActionRateLimiter> rate_limiter;
        std::shared_ptr<CircuitBreakerRegistry> breakers;
        std::shared_ptr<RemediationExecutor> executor;
        std::shared_ptr<RemediationStats> stats;   // Optional
    };

    Orchestrator(Dependencies deps, DetectorSet detectors);
    ~Orchestrator();

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    /// Run one tick synchronously at @p now
    TickReport run_once(TimePoint now);

    /// Start the periodic driver thread (tick_interval from config)
    void start();

    /// Stop the driver; an in-progress tick completes first
    void stop();

    [[nodiscard]] bool is_running() const { return running_.load(std::memory_order_acquire); }
    [[nodiscard]] uint64_t ticks_completed() const { return ticks_.load(std::memory_order_relaxed); }

    /// Counters summed over every completed tick; pending_commits is the latest value
    [[nodiscard]] TickReport totals() const;

    [[nodiscard]] uint64_t detector_errors() const { return detectors_.detector_errors(); }

    /**
     * @brief Operator-requested action on an incident's service
     *
     * Waits for the service lock, then bypasses breaker and rate limiter.
     */
    [[nodiscard]] Result<RemediationAction> trigger_manual(int64_t incident_id, ActionType action,
                                                           TimePoint now);

private:
    void driver_loop();

    /// Window hydration from the store, done once before the first tick
    void ensure_hydrated(const MonitorConfig& config, TimePoint now);

    /// Push reloaded thresholds into stateful components
    void apply_config(const std::shared_ptr<const MonitorConfig>& config);

    [[nodiscard]] TickReport process_service(const ServiceConfig& service,
                                             const MonitorConfig& config, TimePoint now);

    enum class IncidentStep { WAIT, ACTED, ESCALATED, ABORT };

    [[nodiscard]] IncidentStep handle_incident(const Incident& incident, const MonitorConfig& config,
                                               TimePoint now, TickReport& report);

    [[nodiscard]] bool escalate(const Incident& incident, const std::string& reason, TimePoint now,
                                TickReport& report);

    [[nodiscard]] std::shared_ptr<std::mutex> service_lock(const std::string& service);

    Dependencies deps_;
    DetectorSet detectors_;
    SnapshotHistory history_;

    std::shared_ptr<const MonitorConfig> applied_config_;
    bool hydrated_ = false;
    std::mutex tick_mutex_;

    std::unordered_map<std::string, std::shared_ptr<std::mutex>> service_locks_;
    std::mutex locks_mutex_;

    std::thread driver_thread_;
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> ticks_{0};
    TickReport totals_;
    mutable std::mutex totals_mutex_;
    std::mutex cv_mutex_;
    std::condition_variable cv_;
};

} // namespace autoheal
