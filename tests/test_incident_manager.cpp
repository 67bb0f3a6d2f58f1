#include <catch2/catch_test_macros.hpp>
#include "incident/incident_manager.hpp"
#include "store/memory_state_store.hpp"
#include "mocks/recording_notifier.hpp"

using namespace autoheal;
using autoheal::test::RecordingNotifier;

namespace {

const TimePoint T0 = std::chrono::system_clock::time_point{} + std::chrono::hours(24 * 365 * 50);

Finding error_rate_finding(Severity severity, const std::string& rate, TimePoint at = T0) {
    Finding f;
    f.service = "api";
    f.kind = FindingKind::HIGH_ERROR_RATE;
    f.severity = severity;
    f.evidence["error_rate"] = rate;
    f.observed_at = at;
    return f;
}

struct Fixture {
    std::shared_ptr<MemoryStateStore> store = std::make_shared<MemoryStateStore>();
    std::shared_ptr<RecordingNotifier> notifier = std::make_shared<RecordingNotifier>();
    IncidentManager manager{store, notifier};
};

} // anonymous namespace

TEST_CASE("IncidentManager: severity upgrade reuses the active incident", "[incident]") {
    Fixture fx;

    auto first = fx.manager.record(error_rate_finding(Severity::WARNING, "0.2200"));
    REQUIRE(first.is_ok());
    REQUIRE(first.value().severity == Severity::WARNING);
    REQUIRE(first.value().status == IncidentStatus::ACTIVE);

    auto second = fx.manager.record(error_rate_finding(Severity::CRITICAL, "0.4500",
                                                       T0 + std::chrono::seconds(5)));
    REQUIRE(second.is_ok());
    REQUIRE(second.value().id == first.value().id);
    REQUIRE(second.value().severity == Severity::CRITICAL);
    REQUIRE(second.value().details.at("error_rate") == "0.4500");

    REQUIRE(fx.store->incident_count() == 1);
    REQUIRE(fx.notifier->count(EventType::INCIDENT_CREATED) == 1);
}

TEST_CASE("IncidentManager: replaying a finding is idempotent", "[incident]") {
    Fixture fx;
    const auto finding = error_rate_finding(Severity::CRITICAL, "0.5000");

    for (int i = 0; i < 5; ++i) {
        REQUIRE(fx.manager.record(finding).is_ok());
    }
    REQUIRE(fx.store->incident_count() == 1);

    // A lower severity never downgrades
    auto again = fx.manager.record(error_rate_finding(Severity::WARNING, "0.2500"));
    REQUIRE(again.value().severity == Severity::CRITICAL);
}

TEST_CASE("IncidentManager: different kinds open separate incidents", "[incident]") {
    Fixture fx;
    REQUIRE(fx.manager.record(error_rate_finding(Severity::WARNING, "0.3")).is_ok());

    Finding health;
    health.service = "api";
    health.kind = FindingKind::HEALTH_CHECK_FAILED;
    health.severity = Severity::CRITICAL;
    health.observed_at = T0;
    REQUIRE(fx.manager.record(health).is_ok());

    auto active = fx.manager.active_incidents("api");
    REQUIRE(active.is_ok());
    REQUIRE(active.value().size() == 2);
}

TEST_CASE("IncidentManager: resolve stamps duration and frees the slot", "[incident]") {
    Fixture fx;
    auto opened = fx.manager.record(error_rate_finding(Severity::WARNING, "0.3"));
    const auto id = opened.value().id;

    auto resolved = fx.manager.resolve(id, T0 + std::chrono::seconds(90));
    REQUIRE(resolved.is_ok());
    REQUIRE(resolved.value().status == IncidentStatus::RESOLVED);
    REQUIRE(resolved.value().resolution_duration == std::chrono::seconds(90));
    REQUIRE(fx.notifier->count(EventType::INCIDENT_RESOLVED) == 1);

    SECTION("Resolving again is a no-op") {
        auto again = fx.manager.resolve(id, T0 + std::chrono::seconds(500));
        REQUIRE(again.is_ok());
        REQUIRE(again.value().resolution_duration == std::chrono::seconds(90));
        REQUIRE(fx.notifier->count(EventType::INCIDENT_RESOLVED) == 1);
    }

    SECTION("A new finding opens a fresh incident") {
        auto fresh = fx.manager.record(error_rate_finding(Severity::WARNING, "0.3"));
        REQUIRE(fresh.value().id != id);
        REQUIRE(fx.store->incident_count() == 2);
    }
}

TEST_CASE("IncidentManager: escalation is terminal", "[incident]") {
    Fixture fx;
    auto opened = fx.manager.record(error_rate_finding(Severity::CRITICAL, "0.9"));
    const auto id = opened.value().id;

    auto escalated = fx.manager.escalate(id, "circuit breaker open", T0);
    REQUIRE(escalated.is_ok());
    REQUIRE(escalated.value().status == IncidentStatus::ESCALATED);
    REQUIRE(escalated.value().escalation_reason == "circuit breaker open");

    auto events = fx.notifier->events();
    REQUIRE(events.back().type == EventType::INCIDENT_ESCALATED);
    REQUIRE(events.back().message.find("ESCALATION REQUIRED for `api`") != std::string::npos);

    // Neither resolve nor a second escalate changes it
    REQUIRE(fx.manager.resolve(id, T0).value().status == IncidentStatus::ESCALATED);
    REQUIRE(fx.manager.escalate(id, "again", T0).value().escalation_reason == "circuit breaker open");
    REQUIRE(fx.notifier->count(EventType::INCIDENT_ESCALATED) == 1);
}

TEST_CASE("IncidentManager: note_attempt counts attempts", "[incident]") {
    Fixture fx;
    auto opened = fx.manager.record(error_rate_finding(Severity::WARNING, "0.3"));
    const auto id = opened.value().id;

    REQUIRE(fx.manager.note_attempt(id, T0).is_ok());
    auto second = fx.manager.note_attempt(id, T0 + std::chrono::seconds(30));
    REQUIRE(second.value().attempts == 2);
    REQUIRE(second.value().last_action_at == T0 + std::chrono::seconds(30));

    REQUIRE(fx.manager.note_attempt(9999, T0).error_category() == ErrorCategory::NOT_FOUND);
}

TEST_CASE("IncidentManager: store failures surface as persistence errors", "[incident]") {
    Fixture fx;
    fx.store->set_fail_writes(true);

    auto result = fx.manager.record(error_rate_finding(Severity::WARNING, "0.3"));
    REQUIRE(result.is_error());
    REQUIRE(result.error_category() == ErrorCategory::PERSISTENCE_ERROR);
    REQUIRE(fx.notifier->count(EventType::INCIDENT_CREATED) == 0);
}

TEST_CASE("IncidentManager: commit resolves and notifies once durable", "[incident]") {
    Fixture fx;
    auto opened = fx.manager.record(error_rate_finding(Severity::WARNING, "0.3"));
    const auto done = T0 + std::chrono::seconds(10);

    RemediationCommit commit;
    commit.action.incident_id = opened.value().id;
    commit.action.service = "api";
    commit.action.action_type = ActionType::RESTART_CONTAINER;
    commit.action.success = true;
    commit.window_entry = ActionWindowEntry{"api", ActionType::RESTART_CONTAINER, done, true};
    commit.breaker.service = "api";
    commit.incident = IncidentManager::stage_outcome(opened.value(), true, done);

    auto stored = fx.manager.commit(commit);
    REQUIRE(stored.is_ok());
    REQUIRE(stored.value().id > 0);
    REQUIRE(fx.manager.get(opened.value().id).value().status == IncidentStatus::RESOLVED);
    REQUIRE(fx.notifier->count(EventType::REMEDIATION_SUCCEEDED) == 1);
    REQUIRE(fx.notifier->count(EventType::INCIDENT_RESOLVED) == 1);
}
