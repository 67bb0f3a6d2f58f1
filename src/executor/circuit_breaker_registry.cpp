#include "executor/circuit_breaker_registry.hpp"
#include "core/utils.hpp"

#include <format>

namespace autoheal {

CircuitBreakerRegistry::CircuitBreakerRegistry(std::shared_ptr<IStateStore> store,
                                               const CircuitBreakerConfig& defaults)
    : store_(std::move(store)),
      defaults_(defaults) {}

CircuitBreaker::Config CircuitBreakerRegistry::config_for(const std::string& service) const {
    std::shared_lock lock(config_mutex_);
    const auto it = service_configs_.find(service);
    if (it != service_configs_.end()) {
        return it->second;
    }
    return CircuitBreaker::Config::from(defaults_);
}

std::shared_ptr<CircuitBreaker> CircuitBreakerRegistry::get_breaker(const std::string& service) {
    // Fast path: shared lock (read-only)
    {
        std::shared_lock lock(breakers_mutex_);
        const auto it = breakers_.find(service);
        if (it != breakers_.end()) {
            return it->second;
        }
    }

    // Load config and persisted state BEFORE taking the unique lock
    const CircuitBreaker::Config cfg = config_for(service);
    std::optional<CircuitBreakerRecord> persisted;
    if (store_) {
        auto loaded = store_->load_breaker(service);
        if (loaded.is_ok()) {
            persisted = std::move(loaded.value());
        } else if (loaded.error_category() != ErrorCategory::NOT_FOUND) {
            utils::log::warn(std::format("Could not load breaker state for {}: {}",
                                         service, loaded.error_message()));
        }
    }
    std::function<void(const StateChangeEvent&)> cb;
    {
        std::shared_lock lock(config_mutex_);
        cb = on_state_change_;
    }

    // Slow path: unique lock + try_emplace
    std::unique_lock lock(breakers_mutex_);
    auto [it, inserted] = breakers_.try_emplace(service, nullptr);
    if (inserted) {
        it->second = std::make_shared<CircuitBreaker>(service, cfg, std::move(persisted));
        if (cb) it->second->set_on_state_change(std::move(cb));
    }
    return it->second;
}

void CircuitBreakerRegistry::apply_config(const MonitorConfig& config) {
    {
        std::unique_lock lock(config_mutex_);
        defaults_ = config.circuit_breaker;
        service_configs_.clear();
        for (const auto& svc : config.services) {
            service_configs_[svc.name] = CircuitBreaker::Config::from(config.circuit_breaker, &svc);
        }
    }

    std::shared_lock lock(breakers_mutex_);
    for (const auto& [service, breaker] : breakers_) {
        breaker->update_config(config_for(service));
    }
}

Status CircuitBreakerRegistry::reset(const std::string& service, TimePoint now) {
    auto breaker = get_breaker(service);
    breaker->reset(now);
    if (!store_) {
        return Status::ok();
    }
    return store_->save_breaker(breaker->snapshot());
}

void CircuitBreakerRegistry::set_on_state_change(std::function<void(const StateChangeEvent&)> cb) {
    {
        std::unique_lock lock(config_mutex_);
        on_state_change_ = cb;
    }
    std::shared_lock lock(breakers_mutex_);
    for (const auto& [service, breaker] : breakers_) {
        breaker->set_on_state_change(cb);
    }
}

std::vector<CircuitBreakerStats> CircuitBreakerRegistry::get_all_stats() const {
    std::shared_lock lock(breakers_mutex_);
    std::vector<CircuitBreakerStats> result;
    result.reserve(breakers_.size());
    for (const auto& [service, breaker] : breakers_) {
        result.push_back(breaker->get_stats());
    }
    return result;
}

size_t CircuitBreakerRegistry::size() const {
    std::shared_lock lock(breakers_mutex_);
    return breakers_.size();
}

} // namespace autoheal
