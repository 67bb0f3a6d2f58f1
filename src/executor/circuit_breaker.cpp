#include "executor/circuit_breaker.hpp"
#include "core/utils.hpp"

#include <format>

namespace autoheal {

CircuitBreaker::Config CircuitBreaker::Config::from(
    const CircuitBreakerConfig& defaults, const ServiceConfig* service) {
    Config cfg;
    cfg.failure_threshold = defaults.failure_threshold;
    cfg.success_threshold = defaults.success_threshold;
    cfg.failure_window = defaults.failure_window;
    cfg.cooldown = defaults.cooldown;
    if (service) {
        if (service->failure_threshold) cfg.failure_threshold = *service->failure_threshold;
        if (service->cooldown) cfg.cooldown = *service->cooldown;
    }
    return cfg;
}

CircuitBreaker::CircuitBreaker(std::string service, const Config& config,
                               std::optional<CircuitBreakerRecord> persisted)
    : service_(std::move(service)),
      config_(config) {
    if (persisted) {
        record_ = std::move(*persisted);
    }
    record_.service = service_;
    // Only the count and newest failure survive a restart; assume the
    // restored failures all happened at the newest timestamp.
    if (record_.state == CircuitState::CLOSED) {
        if (record_.last_failure_at) {
            failure_times_.assign(record_.failure_count, *record_.last_failure_at);
        } else {
            record_.failure_count = 0;
        }
    }
}

BreakerDecision CircuitBreaker::allow(TimePoint now) {
    BreakerDecision decision;
    std::optional<StateChangeEvent> event;
    {
        std::lock_guard lock(mutex_);

        if (record_.state == CircuitState::OPEN) {
            const TimePoint opened = record_.opened_at.value_or(now);
            const auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(now - opened);
            if (elapsed >= config_.cooldown) {
                // Cooldown elapsed - lazily try HALF_OPEN
                event = transition(CircuitState::HALF_OPEN, now, "cooldown elapsed");
                decision.state_changed = true;
            } else {
                decision.state = CircuitState::OPEN;
                decision.retry_after = config_.cooldown - elapsed;
                decision.reason = std::format("circuit open, {}s of cooldown remaining",
                                              decision.retry_after.count());
            }
        }

        if (record_.state != CircuitState::OPEN) {
            decision.state = record_.state;
            if (in_flight_) {
                decision.busy = true;
                decision.reason = "remediation already in flight";
            } else {
                in_flight_ = true;
                decision.allowed = true;
                decision.reason = record_.state == CircuitState::HALF_OPEN
                    ? "half-open trial" : "closed";
            }
        }
    }

    if (decision.allowed) {
        total_allowed_.fetch_add(1, std::memory_order_relaxed);
    } else {
        total_rejected_.fetch_add(1, std::memory_order_relaxed);
    }
    if (event) publish(*event);
    return decision;
}

CircuitState CircuitBreaker::record_outcome(bool success, TimePoint now) {
    std::optional<StateChangeEvent> event;
    CircuitState result;
    {
        std::lock_guard lock(mutex_);
        in_flight_ = false;

        if (success) {
            record_.last_success_at = now;
            if (record_.state == CircuitState::HALF_OPEN) {
                ++record_.success_count;
                if (record_.success_count >= config_.success_threshold) {
                    event = transition(CircuitState::CLOSED, now, "trial succeeded");
                }
            } else if (record_.state == CircuitState::CLOSED) {
                failure_times_.clear();
                record_.failure_count = 0;
            }
        } else {
            record_.last_failure_at = now;

            if (record_.state == CircuitState::HALF_OPEN) {
                // Any failure in HALF_OPEN -> back to OPEN
                event = transition(CircuitState::OPEN, now, "half-open trial failed");
            } else if (record_.state == CircuitState::CLOSED) {
                failure_times_.push_back(now);
                prune_failures(now);
                record_.failure_count = static_cast<uint32_t>(failure_times_.size());
                if (record_.failure_count >= config_.failure_threshold) {
                    event = transition(CircuitState::OPEN, now,
                        std::format("{} consecutive remediation failures", record_.failure_count));
                }
            }
        }
        result = record_.state;
    }

    if (event) publish(*event);
    return result;
}

void CircuitBreaker::release() {
    std::lock_guard lock(mutex_);
    in_flight_ = false;
}

CircuitState CircuitBreaker::get_state() const {
    std::lock_guard lock(mutex_);
    return record_.state;
}

std::optional<std::chrono::seconds> CircuitBreaker::open_remaining(TimePoint now) const {
    std::lock_guard lock(mutex_);
    if (record_.state != CircuitState::OPEN) return std::nullopt;
    const TimePoint opened = record_.opened_at.value_or(now);
    const auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(now - opened);
    if (elapsed >= config_.cooldown) return std::nullopt;
    return config_.cooldown - elapsed;
}

CircuitBreakerRecord CircuitBreaker::snapshot() const {
    std::lock_guard lock(mutex_);
    return record_;
}

bool CircuitBreaker::in_flight() const {
    std::lock_guard lock(mutex_);
    return in_flight_;
}

CircuitBreakerStats CircuitBreaker::get_stats() const {
    CircuitBreakerStats stats;
    {
        std::lock_guard lock(mutex_);
        stats.service = service_;
        stats.state = record_.state;
        stats.failure_count = record_.failure_count;
        stats.success_count = record_.success_count;
        stats.opened_at = record_.opened_at;
        stats.last_failure_at = record_.last_failure_at;
        stats.in_flight = in_flight_;
    }
    stats.total_allowed = total_allowed_.load(std::memory_order_relaxed);
    stats.total_rejected = total_rejected_.load(std::memory_order_relaxed);
    stats.transitions_to_open = transitions_to_open_.load(std::memory_order_relaxed);
    return stats;
}

void CircuitBreaker::update_config(const Config& config) {
    std::lock_guard lock(mutex_);
    config_ = config;
}

void CircuitBreaker::reset(TimePoint now) {
    std::optional<StateChangeEvent> event;
    {
        std::lock_guard lock(mutex_);
        if (record_.state != CircuitState::CLOSED) {
            event = transition(CircuitState::CLOSED, now, "manual reset");
        }
        failure_times_.clear();
        record_.failure_count = 0;
        record_.success_count = 0;
        record_.last_failure_at.reset();
    }
    if (event) publish(*event);
}

// ============================================================================
// Transitions
// ============================================================================

StateChangeEvent CircuitBreaker::transition(CircuitState to, TimePoint now, std::string reason) {
    StateChangeEvent event{record_.state, to, now, service_, std::move(reason)};
    record_.state = to;

    switch (to) {
        case CircuitState::OPEN:
            record_.opened_at = now;
            record_.success_count = 0;
            transitions_to_open_.fetch_add(1, std::memory_order_relaxed);
            break;
        case CircuitState::HALF_OPEN:
            record_.success_count = 0;
            break;
        case CircuitState::CLOSED:
            failure_times_.clear();
            record_.failure_count = 0;
            record_.success_count = 0;
            record_.opened_at.reset();
            break;
    }
    return event;
}

void CircuitBreaker::prune_failures(TimePoint now) {
    while (!failure_times_.empty() && now - failure_times_.front() > config_.failure_window) {
        failure_times_.pop_front();
    }
}

void CircuitBreaker::publish(const StateChangeEvent& event) {
    utils::log::info(std::format("Circuit breaker {}: {} -> {} ({})", event.service,
        circuit_state_to_string(event.from), circuit_state_to_string(event.to), event.reason));

    std::function<void(const StateChangeEvent&)> cb;
    {
        std::lock_guard lock(events_mutex_);
        recent_events_.push_back(event);
        if (recent_events_.size() > kMaxRecentEvents) {
            recent_events_.pop_front();
        }
        cb = on_state_change_;
    }
    if (cb) {
        cb(event);
    }
}

void CircuitBreaker::set_on_state_change(std::function<void(const StateChangeEvent&)> cb) {
    std::lock_guard lock(events_mutex_);
    on_state_change_ = std::move(cb);
}

std::vector<StateChangeEvent> CircuitBreaker::get_recent_events() const {
    std::lock_guard lock(events_mutex_);
    return {recent_events_.begin(), recent_events_.end()};
}

} // namespace autoheal
