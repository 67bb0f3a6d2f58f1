#include <catch2/catch_test_macros.hpp>
#include "executor/action_rate_limiter.hpp"

using namespace autoheal;
using namespace std::chrono_literals;

namespace {

const TimePoint T0 = std::chrono::system_clock::time_point{} + std::chrono::hours(24 * 365 * 50);

ActionWindowEntry restart_at(TimePoint t, const std::string& service = "api") {
    return ActionWindowEntry{service, ActionType::RESTART_CONTAINER, t, false};
}

} // anonymous namespace

TEST_CASE("ActionRateLimiter: fourth action within the window is rejected", "[rate_limit]") {
    ActionRateLimiter limiter;
    RateLimitConfig cfg;
    cfg.max_actions_per_window = 3;
    cfg.window = 300s;

    for (int i = 0; i < 3; ++i) {
        const auto now = T0 + std::chrono::seconds(i * 60);
        REQUIRE(limiter.allow("api", ActionType::RESTART_CONTAINER, now, cfg).allowed);
        limiter.record(restart_at(now));
    }

    auto decision = limiter.allow("api", ActionType::RESTART_CONTAINER, T0 + 200s, cfg);
    REQUIRE_FALSE(decision.allowed);
    REQUIRE(decision.count == 3);
    REQUIRE(decision.retry_after == 100s);
    REQUIRE_FALSE(decision.reason.empty());
    REQUIRE(limiter.total_rejected() == 1);

    SECTION("The oldest entry ageing out frees a slot") {
        REQUIRE(limiter.allow("api", ActionType::RESTART_CONTAINER, T0 + 301s, cfg).allowed);
    }

    SECTION("An entry exactly at the window edge still counts") {
        REQUIRE_FALSE(limiter.allow("api", ActionType::RESTART_CONTAINER, T0 + 300s, cfg).allowed);
    }
}

TEST_CASE("ActionRateLimiter: keys are per service and action type", "[rate_limit]") {
    ActionRateLimiter limiter;
    RateLimitConfig cfg;
    cfg.max_actions_per_window = 1;

    limiter.record(restart_at(T0));
    REQUIRE_FALSE(limiter.allow("api", ActionType::RESTART_CONTAINER, T0, cfg).allowed);
    REQUIRE(limiter.allow("api", ActionType::SCALE_UP, T0, cfg).allowed);
    REQUIRE(limiter.allow("worker", ActionType::RESTART_CONTAINER, T0, cfg).allowed);
}

TEST_CASE("ActionRateLimiter: hydrate and evict", "[rate_limit]") {
    ActionRateLimiter limiter;
    limiter.hydrate({restart_at(T0 + 20s), restart_at(T0), restart_at(T0 + 10s, "worker")});

    REQUIRE(limiter.count("api", ActionType::RESTART_CONTAINER, T0) == 2);
    REQUIRE(limiter.count("api", ActionType::RESTART_CONTAINER, T0 + 15s) == 1);

    limiter.evict_expired(T0 + 315s, 300s);
    REQUIRE(limiter.count("api", ActionType::RESTART_CONTAINER, T0) == 1);
    REQUIRE(limiter.count("worker", ActionType::RESTART_CONTAINER, T0) == 0);
}
