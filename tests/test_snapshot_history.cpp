#include <catch2/catch_test_macros.hpp>
#include "detect/snapshot_history.hpp"

using namespace autoheal;

namespace {

MetricsSnapshot sample(const std::string& service, double cpu) {
    MetricsSnapshot s;
    s.service = service;
    s.reachable = true;
    s.cpu_percent = cpu;
    return s;
}

} // anonymous namespace

TEST_CASE("SnapshotHistory: bounded per service, oldest first", "[history]") {
    SnapshotHistory history(3);

    for (int i = 1; i <= 5; ++i) {
        history.push(sample("api", i * 10.0));
    }
    history.push(sample("worker", 1.0));

    auto recent = history.recent("api");
    REQUIRE(recent.size() == 3);
    REQUIRE(recent.front().cpu_percent == 30.0);
    REQUIRE(recent.back().cpu_percent == 50.0);
    REQUIRE(history.size("worker") == 1);
    REQUIRE(history.recent("unknown").empty());
}

TEST_CASE("SnapshotHistory: shrinking capacity trims existing entries", "[history]") {
    SnapshotHistory history(5);
    for (int i = 0; i < 5; ++i) {
        history.push(sample("api", i));
    }

    history.set_capacity(2);
    auto recent = history.recent("api");
    REQUIRE(recent.size() == 2);
    REQUIRE(recent.front().cpu_percent == 3.0);

    history.forget("api");
    REQUIRE(history.size("api") == 0);
}
