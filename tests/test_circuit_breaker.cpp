#include <catch2/catch_test_macros.hpp>
#include "executor/circuit_breaker.hpp"

#include <atomic>
#include <thread>
#include <vector>

using namespace autoheal;
using namespace std::chrono_literals;

namespace {

const TimePoint T0 = std::chrono::system_clock::time_point{} + std::chrono::hours(24 * 365 * 50);

CircuitBreaker::Config test_config() {
    CircuitBreaker::Config cfg;
    cfg.failure_threshold = 3;
    cfg.success_threshold = 1;
    cfg.failure_window = 300s;
    cfg.cooldown = 120s;
    return cfg;
}

// One allow()+record_outcome() round
CircuitState attempt(CircuitBreaker& breaker, bool success, TimePoint now) {
    auto decision = breaker.allow(now);
    REQUIRE(decision.allowed);
    return breaker.record_outcome(success, now);
}

} // anonymous namespace

TEST_CASE("CircuitBreaker: opens exactly at the failure threshold", "[circuit_breaker]") {
    CircuitBreaker breaker("api", test_config());

    REQUIRE(attempt(breaker, false, T0) == CircuitState::CLOSED);
    REQUIRE(attempt(breaker, false, T0 + 10s) == CircuitState::CLOSED);
    REQUIRE(attempt(breaker, false, T0 + 20s) == CircuitState::OPEN);

    const auto record = breaker.snapshot();
    REQUIRE(record.failure_count == 3);
    REQUIRE(record.opened_at == T0 + 20s);

    auto blocked = breaker.allow(T0 + 30s);
    REQUIRE_FALSE(blocked.allowed);
    REQUIRE_FALSE(blocked.busy);
    REQUIRE(blocked.state == CircuitState::OPEN);
    REQUIRE(blocked.retry_after == 110s);
}

TEST_CASE("CircuitBreaker: success in CLOSED resets the failure count", "[circuit_breaker]") {
    CircuitBreaker breaker("api", test_config());

    attempt(breaker, false, T0);
    attempt(breaker, false, T0 + 1s);
    attempt(breaker, true, T0 + 2s);
    REQUIRE(breaker.snapshot().failure_count == 0);

    attempt(breaker, false, T0 + 3s);
    attempt(breaker, false, T0 + 4s);
    REQUIRE(breaker.get_state() == CircuitState::CLOSED);
}

TEST_CASE("CircuitBreaker: failures outside the window start a new count", "[circuit_breaker]") {
    CircuitBreaker breaker("api", test_config());

    attempt(breaker, false, T0);
    attempt(breaker, false, T0 + 10s);
    // Gap larger than failure_window
    attempt(breaker, false, T0 + 400s);
    REQUIRE(breaker.get_state() == CircuitState::CLOSED);
    REQUIRE(breaker.snapshot().failure_count == 1);
}

TEST_CASE("CircuitBreaker: failure window trails the newest failure", "[circuit_breaker]") {
    CircuitBreaker breaker("api", test_config());

    // Gaps of 250s each stay under the window, but only two failures
    // ever fall inside the same 300s span
    attempt(breaker, false, T0);
    attempt(breaker, false, T0 + 250s);
    REQUIRE(attempt(breaker, false, T0 + 500s) == CircuitState::CLOSED);
    REQUIRE(breaker.snapshot().failure_count == 2);

    // T0+250, T0+500, T0+540 are all within 300s of each other
    REQUIRE(attempt(breaker, false, T0 + 540s) == CircuitState::OPEN);
    REQUIRE(breaker.snapshot().failure_count == 3);
}

TEST_CASE("CircuitBreaker: failure exactly one window old still counts", "[circuit_breaker]") {
    CircuitBreaker breaker("api", test_config());

    attempt(breaker, false, T0);
    attempt(breaker, false, T0 + 100s);
    REQUIRE(attempt(breaker, false, T0 + 300s) == CircuitState::OPEN);
}

TEST_CASE("CircuitBreaker: restored CLOSED record keeps its failures", "[circuit_breaker]") {
    CircuitBreakerRecord persisted;
    persisted.service = "api";
    persisted.failure_count = 2;
    persisted.last_failure_at = T0;
    CircuitBreaker breaker("api", test_config(), persisted);

    SECTION("Inside the window the next failure trips") {
        REQUIRE(attempt(breaker, false, T0 + 60s) == CircuitState::OPEN);
    }

    SECTION("Past the window the restored failures expire") {
        REQUIRE(attempt(breaker, false, T0 + 301s) == CircuitState::CLOSED);
        REQUIRE(breaker.snapshot().failure_count == 1);
    }
}

TEST_CASE("CircuitBreaker: cooldown boundary", "[circuit_breaker]") {
    CircuitBreakerRecord persisted;
    persisted.service = "api";
    persisted.state = CircuitState::OPEN;
    persisted.failure_count = 3;
    persisted.opened_at = T0;
    CircuitBreaker breaker("api", test_config(), persisted);

    auto early = breaker.allow(T0 + 119s);
    REQUIRE_FALSE(early.allowed);
    REQUIRE(early.state == CircuitState::OPEN);
    REQUIRE(breaker.get_state() == CircuitState::OPEN);

    auto trial = breaker.allow(T0 + 121s);
    REQUIRE(trial.allowed);
    REQUIRE(trial.state_changed);
    REQUIRE(trial.state == CircuitState::HALF_OPEN);

    // Exactly one trial
    auto second = breaker.allow(T0 + 122s);
    REQUIRE_FALSE(second.allowed);
    REQUIRE(second.busy);

    SECTION("Successful trial closes") {
        REQUIRE(breaker.record_outcome(true, T0 + 125s) == CircuitState::CLOSED);
        const auto record = breaker.snapshot();
        REQUIRE(record.failure_count == 0);
        REQUIRE(record.success_count == 0);
        REQUIRE_FALSE(record.opened_at.has_value());
    }

    SECTION("Failed trial re-opens with a fresh opened_at") {
        REQUIRE(breaker.record_outcome(false, T0 + 125s) == CircuitState::OPEN);
        REQUIRE(breaker.snapshot().opened_at == T0 + 125s);
        REQUIRE_FALSE(breaker.allow(T0 + 200s).allowed);
        REQUIRE(breaker.allow(T0 + 245s).allowed);
    }
}

TEST_CASE("CircuitBreaker: success_threshold above one needs several trials", "[circuit_breaker]") {
    auto cfg = test_config();
    cfg.success_threshold = 2;
    CircuitBreakerRecord persisted;
    persisted.state = CircuitState::OPEN;
    persisted.opened_at = T0;
    CircuitBreaker breaker("api", cfg, persisted);

    REQUIRE(attempt(breaker, true, T0 + 120s) == CircuitState::HALF_OPEN);
    REQUIRE(breaker.snapshot().success_count == 1);
    REQUIRE(attempt(breaker, true, T0 + 130s) == CircuitState::CLOSED);
}

TEST_CASE("CircuitBreaker: only one concurrent attempt per service", "[circuit_breaker]") {
    CircuitBreaker breaker("api", test_config());
    std::atomic<int> allowed{0};
    std::atomic<int> busy{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&] {
            auto d = breaker.allow(T0);
            if (d.allowed) ++allowed;
            if (d.busy) ++busy;
        });
    }
    for (auto& t : threads) t.join();

    REQUIRE(allowed == 1);
    REQUIRE(busy == 7);
    REQUIRE(breaker.in_flight());

    breaker.release();
    REQUIRE_FALSE(breaker.in_flight());
    REQUIRE(breaker.allow(T0).allowed);
}

TEST_CASE("CircuitBreaker: transition events and reset", "[circuit_breaker]") {
    CircuitBreaker breaker("api", test_config());
    std::vector<StateChangeEvent> seen;
    breaker.set_on_state_change([&](const StateChangeEvent& e) { seen.push_back(e); });

    attempt(breaker, false, T0);
    attempt(breaker, false, T0);
    attempt(breaker, false, T0);
    REQUIRE(seen.size() == 1);
    REQUIRE(seen[0].from == CircuitState::CLOSED);
    REQUIRE(seen[0].to == CircuitState::OPEN);

    breaker.reset(T0 + 5s);
    REQUIRE(breaker.get_state() == CircuitState::CLOSED);
    REQUIRE(breaker.get_recent_events().size() == 2);

    const auto stats = breaker.get_stats();
    REQUIRE(stats.transitions_to_open == 1);
    REQUIRE(stats.total_allowed == 3);
}

TEST_CASE("CircuitBreaker: config updates apply to later checks", "[circuit_breaker]") {
    CircuitBreaker breaker("api", test_config());
    auto cfg = test_config();
    cfg.failure_threshold = 1;
    breaker.update_config(cfg);

    REQUIRE(attempt(breaker, false, T0) == CircuitState::OPEN);
}
