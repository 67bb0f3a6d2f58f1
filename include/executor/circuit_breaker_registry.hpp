#pragma once

#include "executor/circuit_breaker.hpp"
#include "store/istate_store.hpp"

#include <functional>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace autoheal {

/**
 * @brief Registry of per-service circuit breakers.
 *
 * Lazily creates breakers on first access using double-checked locking.
 * A new breaker starts from the record persisted in the state store, so a
 * restarted daemon keeps OPEN breakers open.
 */
class CircuitBreakerRegistry {
public:
    CircuitBreakerRegistry(std::shared_ptr<IStateStore> store, const CircuitBreakerConfig& defaults);

    /**
     * @brief Get or create the breaker for a service
     * @return Shared pointer to the breaker (never null)
     */
    [[nodiscard]] std::shared_ptr<CircuitBreaker> get_breaker(const std::string& service);

    /**
     * @brief Apply reloaded thresholds, including per-service overrides,
     * to existing and future breakers
     */
    void apply_config(const MonitorConfig& config);

    /// Force a service's breaker CLOSED and persist it
    [[nodiscard]] Status reset(const std::string& service, TimePoint now);

    /// Installed on every breaker, existing and future
    void set_on_state_change(std::function<void(const StateChangeEvent&)> cb);

    [[nodiscard]] std::vector<CircuitBreakerStats> get_all_stats() const;

    [[nodiscard]] size_t size() const;

private:
    [[nodiscard]] CircuitBreaker::Config config_for(const std::string& service) const;

    std::shared_ptr<IStateStore> store_;

    // Breaker storage (double-checked locking pattern)
    std::unordered_map<std::string, std::shared_ptr<CircuitBreaker>> breakers_;
    mutable std::shared_mutex breakers_mutex_;

    CircuitBreakerConfig defaults_;
    std::unordered_map<std::string, CircuitBreaker::Config> service_configs_;
    std::function<void(const StateChangeEvent&)> on_state_change_;
    mutable std::shared_mutex config_mutex_;
};

} // namespace autoheal
