#pragma once

#include "config/config_types.hpp"
#include "core/types.hpp"

#include <atomic>
#include <chrono>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace autoheal {

/**
 * @brief Structured event emitted on circuit breaker state transitions
 */
struct StateChangeEvent {
    CircuitState from;
    CircuitState to;
    TimePoint timestamp;
    std::string service;
    std::string reason;
};

struct CircuitBreakerStats {
    std::string service;
    CircuitState state = CircuitState::CLOSED;
    uint32_t failure_count = 0;
    uint32_t success_count = 0;
    std::optional<TimePoint> opened_at;
    std::optional<TimePoint> last_failure_at;
    bool in_flight = false;
    uint64_t total_allowed = 0;
    uint64_t total_rejected = 0;
    uint64_t transitions_to_open = 0;
};

/**
 * @brief Outcome of CircuitBreaker::allow()
 */
struct BreakerDecision {
    bool allowed = false;
    bool busy = false;                  // Another attempt for this service is in flight
    bool state_changed = false;         // OPEN -> HALF_OPEN happened during this check
    CircuitState state = CircuitState::CLOSED;
    std::chrono::seconds retry_after{0};
    std::string reason;
};

/**
 * @brief Per-service circuit breaker for remediation actions
 *
 * Three states:
 * - CLOSED:     Remediation allowed. Failures are kept for a trailing
 *               failure_window; failure_threshold of them inside the window
 *               trips OPEN. A success clears them.
 * - OPEN:       Remediation blocked. Once cooldown has elapsed since
 *               opened_at the next check moves to HALF_OPEN.
 * - HALF_OPEN:  Exactly one trial. success_threshold successes close the
 *               circuit; any failure re-opens it with a fresh opened_at.
 *
 * allow() claims a single in-flight slot per service; concurrent checks see
 * the breaker busy until record_outcome() or release() is called. Time is
 * passed in explicitly so cooldown arithmetic is deterministic.
 *
 * All read-modify-write is serialized by one mutex per breaker.
 */
class CircuitBreaker {
public:
    struct Config {
        uint32_t failure_threshold = 3;     // Failures to trip OPEN
        uint32_t success_threshold = 1;     // Successes to close from HALF_OPEN
        std::chrono::seconds failure_window{300};
        std::chrono::seconds cooldown{120}; // Time before trying HALF_OPEN

        /// Global defaults with per-service overrides applied
        [[nodiscard]] static Config from(const CircuitBreakerConfig& defaults,
                                         const ServiceConfig* service = nullptr);
    };

    /**
     * @brief Construct circuit breaker
     * @param service Service the breaker guards
     * @param config Thresholds
     * @param persisted Record loaded from the state store, if any
     */
    CircuitBreaker(std::string service, const Config& config,
                   std::optional<CircuitBreakerRecord> persisted = std::nullopt);

    /**
     * @brief Check whether a remediation attempt may proceed at @p now
     *
     * On success the in-flight slot is taken and must be given back through
     * record_outcome() or release().
     */
    [[nodiscard]] BreakerDecision allow(TimePoint now);

    /**
     * @brief Feed the result of an attempt and release the in-flight slot
     * @return The state after the outcome is applied
     */
    CircuitState record_outcome(bool success, TimePoint now);

    /// Give back the in-flight slot without an outcome (attempt never ran)
    void release();

    /// Current state, without the lazy OPEN -> HALF_OPEN check
    [[nodiscard]] CircuitState get_state() const;

    /**
     * @brief Cooldown left when the breaker is OPEN at @p now
     * @return nullopt when closed, half-open or due for a trial; no slot is
     *         taken and no transition happens
     */
    [[nodiscard]] std::optional<std::chrono::seconds> open_remaining(TimePoint now) const;

    /// Copy of the persisted fields
    [[nodiscard]] CircuitBreakerRecord snapshot() const;

    [[nodiscard]] CircuitBreakerStats get_stats() const;

    [[nodiscard]] bool in_flight() const;

    /// Thresholds may change between ticks (config reload)
    void update_config(const Config& config);

    /// Force reset to CLOSED (operator action)
    void reset(TimePoint now);

    [[nodiscard]] const std::string& service() const { return service_; }

    /**
     * @brief Register callback for state transitions
     *
     * Invoked with the breaker lock released.
     */
    void set_on_state_change(std::function<void(const StateChangeEvent&)> cb);

    /**
     * @brief Get recent state change events (most recent last)
     */
    [[nodiscard]] std::vector<StateChangeEvent> get_recent_events() const;

private:
    /// Caller holds mutex_; returns the event to publish after unlocking
    StateChangeEvent transition(CircuitState to, TimePoint now, std::string reason);
    void publish(const StateChangeEvent& event);
    /// Caller holds mutex_; drops failures older than failure_window before @p now
    void prune_failures(TimePoint now);

    std::string service_;
    Config config_;
    CircuitBreakerRecord record_;
    bool in_flight_ = false;
    std::deque<TimePoint> failure_times_;   // CLOSED-state failures, oldest first
    mutable std::mutex mutex_;

    std::atomic<uint64_t> total_allowed_{0};
    std::atomic<uint64_t> total_rejected_{0};
    std::atomic<uint64_t> transitions_to_open_{0};

    // State change events
    std::function<void(const StateChangeEvent&)> on_state_change_;
    std::deque<StateChangeEvent> recent_events_;
    mutable std::mutex events_mutex_;
    static constexpr size_t kMaxRecentEvents = 100;
};

} // namespace autoheal
