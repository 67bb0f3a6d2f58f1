#include <catch2/catch_test_macros.hpp>
#include "executor/circuit_breaker_registry.hpp"
#include "store/memory_state_store.hpp"

using namespace autoheal;
using namespace std::chrono_literals;

namespace {

const TimePoint T0 = std::chrono::system_clock::time_point{} + std::chrono::hours(24 * 365 * 50);

} // anonymous namespace

TEST_CASE("CircuitBreakerRegistry: one breaker per service", "[circuit_breaker]") {
    auto store = std::make_shared<MemoryStateStore>();
    CircuitBreakerRegistry registry(store, CircuitBreakerConfig{});

    auto a = registry.get_breaker("api");
    auto b = registry.get_breaker("api");
    auto c = registry.get_breaker("worker");
    REQUIRE(a == b);
    REQUIRE(a != c);
    REQUIRE(registry.size() == 2);
    REQUIRE(registry.get_all_stats().size() == 2);
}

TEST_CASE("CircuitBreakerRegistry: resumes persisted OPEN breakers", "[circuit_breaker]") {
    auto store = std::make_shared<MemoryStateStore>();
    CircuitBreakerRecord record;
    record.service = "api";
    record.state = CircuitState::OPEN;
    record.failure_count = 3;
    record.opened_at = T0;
    REQUIRE(store->save_breaker(record).is_ok());

    CircuitBreakerRegistry registry(store, CircuitBreakerConfig{});
    auto breaker = registry.get_breaker("api");
    REQUIRE(breaker->get_state() == CircuitState::OPEN);
    REQUIRE_FALSE(breaker->allow(T0 + 60s).allowed);
}

TEST_CASE("CircuitBreakerRegistry: per-service overrides from config", "[circuit_breaker]") {
    auto store = std::make_shared<MemoryStateStore>();
    CircuitBreakerRegistry registry(store, CircuitBreakerConfig{});

    MonitorConfig cfg;
    ServiceConfig fragile;
    fragile.name = "fragile";
    fragile.failure_threshold = 1;
    fragile.cooldown = 10s;
    cfg.services.push_back(fragile);
    ServiceConfig normal;
    normal.name = "normal";
    cfg.services.push_back(normal);

    auto existing = registry.get_breaker("fragile");
    registry.apply_config(cfg);

    REQUIRE(existing->allow(T0).allowed);
    REQUIRE(existing->record_outcome(false, T0) == CircuitState::OPEN);
    REQUIRE(existing->allow(T0 + 11s).allowed);

    auto other = registry.get_breaker("normal");
    REQUIRE(other->allow(T0).allowed);
    REQUIRE(other->record_outcome(false, T0) == CircuitState::CLOSED);
}

TEST_CASE("CircuitBreakerRegistry: reset persists CLOSED", "[circuit_breaker]") {
    auto store = std::make_shared<MemoryStateStore>();
    CircuitBreakerConfig defaults;
    defaults.failure_threshold = 1;
    CircuitBreakerRegistry registry(store, defaults);

    auto breaker = registry.get_breaker("api");
    REQUIRE(breaker->allow(T0).allowed);
    breaker->record_outcome(false, T0);
    REQUIRE(breaker->get_state() == CircuitState::OPEN);

    REQUIRE(registry.reset("api", T0 + 1s).is_ok());
    auto loaded = store->load_breaker("api");
    REQUIRE(loaded.is_ok());
    REQUIRE(loaded.value().state == CircuitState::CLOSED);
}
