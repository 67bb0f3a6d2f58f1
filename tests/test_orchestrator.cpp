#include <catch2/catch_test_macros.hpp>
#include "core/orchestrator.hpp"
#include "config/config_store.hpp"
#include "store/memory_state_store.hpp"
#include "mocks/mock_lifecycle_provider.hpp"
#include "mocks/mock_metrics_provider.hpp"
#include "mocks/recording_notifier.hpp"

#include "core/utils.hpp"

#include <thread>

using namespace autoheal;
using namespace std::chrono_literals;
using autoheal::test::MockLifecycleProvider;
using autoheal::test::MockMetricsProvider;
using autoheal::test::RecordingNotifier;

namespace {

const TimePoint T0 = std::chrono::system_clock::time_point{} + std::chrono::hours(24 * 365 * 50);

class FlakyCommitStore : public MemoryStateStore {
public:
    Result<RemediationAction> commit_remediation(const RemediationCommit& commit) override {
        if (fail_commit) {
            return Result<RemediationAction>::error(ErrorCategory::PERSISTENCE_ERROR, "disk full");
        }
        return MemoryStateStore::commit_remediation(commit);
    }

    bool fail_commit = false;
};

MonitorConfig base_config() {
    MonitorConfig cfg;
    ServiceConfig api;
    api.name = "api";
    api.health_url = "http://api:8080/health";
    cfg.services.push_back(api);
    cfg.remediation.provider_timeout = 500ms;
    return cfg;
}

struct Harness {
    explicit Harness(MonitorConfig cfg = base_config())
        : config(std::make_shared<ConfigStore>(std::move(cfg))) {
        auto executor = std::make_shared<RemediationExecutor>(
            provider, incidents, breakers, limiter, notifier);
        executor->set_stats(stats);
        Orchestrator::Dependencies deps{config, metrics, store, incidents, limiter, breakers, executor,
                                        stats};
        orchestrator = std::make_unique<Orchestrator>(std::move(deps), DetectorSet::with_defaults());
    }

    std::vector<Incident> active(const std::string& service = "api") {
        auto r = incidents->active_incidents(service);
        REQUIRE(r.is_ok());
        return r.value();
    }

    std::shared_ptr<ConfigStore> config;
    std::shared_ptr<FlakyCommitStore> store = std::make_shared<FlakyCommitStore>();
    std::shared_ptr<RecordingNotifier> notifier = std::make_shared<RecordingNotifier>();
    std::shared_ptr<MockMetricsProvider> metrics = std::make_shared<MockMetricsProvider>();
    std::shared_ptr<MockLifecycleProvider> provider = std::make_shared<MockLifecycleProvider>();
    std::shared_ptr<IncidentManager> incidents = std::make_shared<IncidentManager>(store, notifier);
    std::shared_ptr<CircuitBreakerRegistry> breakers =
        std::make_shared<CircuitBreakerRegistry>(store, CircuitBreakerConfig{});
    std::shared_ptr<ActionRateLimiter> limiter = std::make_shared<ActionRateLimiter>();
    std::shared_ptr<RemediationStats> stats = std::make_shared<RemediationStats>();
    std::unique_ptr<Orchestrator> orchestrator;
};

} // anonymous namespace

TEST_CASE("Orchestrator: unreachable service is restarted and resolved", "[orchestrator]") {
    Harness h;
    h.metrics->set_unreachable("api");

    auto report = h.orchestrator->run_once(T0);
    REQUIRE(report.services_polled == 1);
    REQUIRE(report.findings == 1);
    REQUIRE(report.actions_executed == 1);
    REQUIRE(report.actions_succeeded == 1);
    REQUIRE(h.provider->call_count("restart") == 1);

    REQUIRE(h.active().empty());
    REQUIRE(h.breakers->get_breaker("api")->snapshot().failure_count == 0);
    REQUIRE(h.notifier->count(EventType::INCIDENT_CREATED) == 1);
    REQUIRE(h.notifier->count(EventType::INCIDENT_RESOLVED) == 1);

    h.metrics->set_healthy("api");
    auto quiet = h.orchestrator->run_once(T0 + 5s);
    REQUIRE(quiet.findings == 0);
    REQUIRE(quiet.actions_executed == 0);
}

TEST_CASE("Orchestrator: repeated failures open the breaker and escalate", "[orchestrator]") {
    auto cfg = base_config();
    cfg.rate_limit.max_actions_per_window = 10;
    Harness h(cfg);
    h.metrics->set_unreachable("api");
    h.provider->default_result = ProviderResult::failure("container exited with code 137");

    for (int i = 0; i < 3; ++i) {
        auto report = h.orchestrator->run_once(T0 + std::chrono::seconds(30 * i));
        REQUIRE(report.actions_executed == 1);
        REQUIRE(report.actions_succeeded == 0);
    }
    const auto first = h.active();
    REQUIRE(first.size() == 1);
    REQUIRE(first[0].attempts == 3);
    REQUIRE(h.breakers->get_breaker("api")->get_state() == CircuitState::OPEN);

    // Fourth and fifth ticks never reach the provider
    auto fourth = h.orchestrator->run_once(T0 + 90s);
    REQUIRE(fourth.breaker_blocked == 1);
    REQUIRE(fourth.escalations == 1);
    (void)h.orchestrator->run_once(T0 + 120s);
    REQUIRE(h.provider->call_count("restart") == 3);

    auto escalated = h.incidents->get(first[0].id).value();
    REQUIRE(escalated.status == IncidentStatus::ESCALATED);
    REQUIRE(escalated.escalation_reason.find("circuit breaker open") != std::string::npos);
    REQUIRE(h.notifier->count(EventType::BREAKER_OPENED) == 1);
    REQUIRE(h.notifier->count(EventType::INCIDENT_ESCALATED) >= 1);
}

TEST_CASE("Orchestrator: open breaker does not reopen the incident every tick", "[orchestrator]") {
    auto cfg = base_config();
    cfg.rate_limit.max_actions_per_window = 10;
    cfg.daemon.incident_dedupe_window = 60s;
    Harness h(cfg);
    h.metrics->set_unreachable("api");
    h.provider->default_result = ProviderResult::failure("container exited with code 137");

    for (int i = 0; i < 3; ++i) {
        (void)h.orchestrator->run_once(T0 + std::chrono::seconds(30 * i));
    }
    auto escalating = h.orchestrator->run_once(T0 + 90s);
    REQUIRE(escalating.escalations == 1);

    // The fault persists for the rest of the cooldown
    size_t suppressed = 0;
    for (auto t = 95s; t < 150s; t += 5s) {
        auto report = h.orchestrator->run_once(T0 + t);
        REQUIRE(report.escalations == 0);
        suppressed += report.findings_suppressed;
    }
    REQUIRE(suppressed == 11);
    REQUIRE(h.active().empty());
    REQUIRE(h.notifier->count(EventType::INCIDENT_CREATED) == 1);
    REQUIRE(h.notifier->count(EventType::INCIDENT_ESCALATED) == 1);

    // Once the window has passed a new incident opens and is escalated
    auto after = h.orchestrator->run_once(T0 + 150s);
    REQUIRE(after.findings_suppressed == 0);
    REQUIRE(after.escalations == 1);
    REQUIRE(h.notifier->count(EventType::INCIDENT_CREATED) == 2);
    REQUIRE(h.provider->call_count("restart") == 3);
}

TEST_CASE("Orchestrator: resolved incident is not reopened inside the window", "[orchestrator]") {
    Harness h;
    h.metrics->set_unreachable("api");

    auto first = h.orchestrator->run_once(T0);
    REQUIRE(first.actions_succeeded == 1);

    // Stale failure reported right after the restart
    auto stale = h.orchestrator->run_once(T0 + 5s);
    REQUIRE(stale.findings_suppressed == 1);
    REQUIRE(stale.actions_executed == 0);
    REQUIRE(h.provider->call_count("restart") == 1);

    SECTION("Zero window turns deduplication off") {
        auto cfg = base_config();
        cfg.daemon.incident_dedupe_window = 0s;
        h.config->publish(cfg);
        auto report = h.orchestrator->run_once(T0 + 10s);
        REQUIRE(report.findings_suppressed == 0);
        REQUIRE(report.actions_executed == 1);
    }
}

TEST_CASE("Orchestrator: open breaker escalates ahead of min_action_interval", "[orchestrator]") {
    auto cfg = base_config();
    cfg.daemon.min_action_interval = 30s;
    cfg.services[0].failure_threshold = 1;
    cfg.services[0].cooldown = 20s;
    Harness h(cfg);
    h.metrics->set_unreachable("api");
    h.provider->default_result = ProviderResult::failure("no such container");

    (void)h.orchestrator->run_once(T0);
    const auto incident = h.active().front();
    REQUIRE(h.breakers->get_breaker("api")->get_state() == CircuitState::OPEN);

    // Attempted 5s ago, but the breaker is open: escalate now rather than
    // after the 20s cooldown has already lapsed
    auto report = h.orchestrator->run_once(T0 + 5s);
    REQUIRE(report.breaker_blocked == 1);
    REQUIRE(report.escalations == 1);

    auto escalated = h.incidents->get(incident.id).value();
    REQUIRE(escalated.status == IncidentStatus::ESCALATED);
    REQUIRE(escalated.escalation_reason.find("circuit breaker open") != std::string::npos);
    REQUIRE(h.provider->call_count("restart") == 1);
}

TEST_CASE("Orchestrator: unrecorded escalation aborts the incident step", "[orchestrator]") {
    auto cfg = base_config();
    cfg.remediation.error_rate_action = ActionType::MANUAL;
    Harness h(cfg);

    Finding f;
    f.service = "api";
    f.kind = FindingKind::HIGH_ERROR_RATE;
    f.severity = Severity::CRITICAL;
    f.observed_at = T0;
    const auto incident = h.incidents->record(f).value();

    h.store->set_fail_writes(true);
    auto failed = h.orchestrator->run_once(T0 + 5s);
    REQUIRE(failed.escalations == 0);
    REQUIRE(failed.errors == 2);   // unexecutable action, then the escalation write
    REQUIRE(h.incidents->get(incident.id).value().status == IncidentStatus::ACTIVE);
    REQUIRE_FALSE(h.breakers->get_breaker("api")->in_flight());

    h.store->set_fail_writes(false);
    auto retried = h.orchestrator->run_once(T0 + 10s);
    REQUIRE(retried.escalations == 1);
    auto escalated = h.incidents->get(incident.id).value();
    REQUIRE(escalated.status == IncidentStatus::ESCALATED);
    REQUIRE(escalated.escalation_reason.find("internal error") != std::string::npos);
}

TEST_CASE("Orchestrator: exhausted rate limit escalates an attempted incident", "[orchestrator]") {
    auto cfg = base_config();
    cfg.rate_limit.max_actions_per_window = 2;
    cfg.circuit_breaker.failure_threshold = 10;
    Harness h(cfg);
    h.metrics->set_unreachable("api");
    h.provider->default_result = ProviderResult::failure("still down");

    (void)h.orchestrator->run_once(T0);
    (void)h.orchestrator->run_once(T0 + 30s);
    const auto incident = h.active().front();

    auto third = h.orchestrator->run_once(T0 + 60s);
    REQUIRE(third.rate_limited == 1);
    REQUIRE(third.actions_executed == 0);
    REQUIRE(h.provider->call_count("restart") == 2);

    auto escalated = h.incidents->get(incident.id).value();
    REQUIRE(escalated.status == IncidentStatus::ESCALATED);
    REQUIRE(escalated.escalation_reason.find("rate limit exceeded") != std::string::npos);
}

TEST_CASE("Orchestrator: rate limit holds a fresh incident without escalating", "[orchestrator]") {
    Harness h;
    // First tick hydrates the window from the (empty) store
    (void)h.orchestrator->run_once(T0);
    for (int i = 0; i < 3; ++i) {
        h.limiter->record(ActionWindowEntry{"api", ActionType::RESTART_CONTAINER,
                                            T0 + std::chrono::seconds(i), true});
    }

    h.metrics->set_unreachable("api");
    auto report = h.orchestrator->run_once(T0 + 10s);
    REQUIRE(report.rate_limited == 1);
    REQUIRE(report.escalations == 0);
    REQUIRE(h.provider->calls.empty());
    REQUIRE(h.active().size() == 1);
}

TEST_CASE("Orchestrator: recent attempts wait for min_action_interval", "[orchestrator]") {
    Harness h;
    h.metrics->set_unreachable("api");
    h.provider->queue(ProviderResult::failure("timeout waiting for container"));

    (void)h.orchestrator->run_once(T0);
    REQUIRE(h.provider->call_count("restart") == 1);

    auto early = h.orchestrator->run_once(T0 + 10s);
    REQUIRE(early.actions_executed == 0);
    REQUIRE(h.provider->call_count("restart") == 1);

    auto later = h.orchestrator->run_once(T0 + 31s);
    REQUIRE(later.actions_succeeded == 1);
    REQUIRE(h.active().empty());
}

TEST_CASE("Orchestrator: finding without an automatic action escalates", "[orchestrator]") {
    auto cfg = base_config();
    cfg.remediation.advisory_action = std::nullopt;
    Harness h(cfg);

    MetricsSnapshot snapshot;
    snapshot.service = "api";
    snapshot.reachable = true;
    snapshot.status_code = 200;
    snapshot.advisory = AdvisorySignal{"failure-predictor", 0.95, "disk latency trending up"};
    h.metrics->set(snapshot);

    auto report = h.orchestrator->run_once(T0);
    REQUIRE(report.findings == 1);
    REQUIRE(report.escalations == 1);
    REQUIRE(h.provider->calls.empty());
    REQUIRE(h.active().empty());
}

TEST_CASE("Orchestrator: uncommitted outcome holds the service until it lands", "[orchestrator]") {
    Harness h;
    h.metrics->set_unreachable("api");
    h.store->fail_commit = true;

    auto first = h.orchestrator->run_once(T0);
    REQUIRE(first.errors == 1);
    REQUIRE(h.provider->call_count("restart") == 1);

    auto held = h.orchestrator->run_once(T0 + 60s);
    REQUIRE(held.pending_commits == 1);
    REQUIRE(h.provider->call_count("restart") == 1);

    h.store->fail_commit = false;
    h.metrics->set_healthy("api");
    auto recovered = h.orchestrator->run_once(T0 + 120s);
    REQUIRE(recovered.pending_commits == 0);
    REQUIRE(h.active().empty());
    REQUIRE(h.store->action_count() == 1);
}

TEST_CASE("Orchestrator: disabled services are skipped", "[orchestrator]") {
    auto cfg = base_config();
    ServiceConfig batch;
    batch.name = "batch";
    batch.enabled = false;
    cfg.services.push_back(batch);
    Harness h(cfg);

    auto report = h.orchestrator->run_once(T0);
    REQUIRE(report.services_polled == 1);
    REQUIRE(report.services_skipped == 1);
    REQUIRE(h.metrics->polls == 1);
}

TEST_CASE("Orchestrator: reloaded config applies on the next tick", "[orchestrator]") {
    Harness h;
    (void)h.orchestrator->run_once(T0);

    auto cfg = base_config();
    ServiceConfig worker;
    worker.name = "worker";
    cfg.services.push_back(worker);
    cfg.services[0].failure_threshold = 1;
    h.config->publish(cfg);

    h.provider->default_result = ProviderResult::failure("no such container");
    h.metrics->set_unreachable("api");
    auto report = h.orchestrator->run_once(T0 + 5s);
    REQUIRE(report.services_polled == 2);
    REQUIRE(h.breakers->get_breaker("api")->get_state() == CircuitState::OPEN);
}

TEST_CASE("Orchestrator: manual trigger bypasses gating", "[orchestrator]") {
    Harness h;
    Finding f;
    f.service = "api";
    f.kind = FindingKind::HIGH_ERROR_RATE;
    f.severity = Severity::WARNING;
    f.observed_at = T0;
    auto incident = h.incidents->record(f).value();

    auto result = h.orchestrator->trigger_manual(incident.id, ActionType::SCALE_UP, T0);
    REQUIRE(result.is_ok());
    REQUIRE(result.value().triggered_by == TriggeredBy::MANUAL);
    REQUIRE(h.provider->call_count("scale_up") == 1);
    REQUIRE(h.limiter->count("api", ActionType::SCALE_UP, T0) == 1);

    auto missing = h.orchestrator->trigger_manual(424242, ActionType::RESTART_CONTAINER, T0);
    REQUIRE(missing.error_category() == ErrorCategory::NOT_FOUND);
}

TEST_CASE("Orchestrator: service with an action in flight is skipped", "[orchestrator]") {
    Harness h;
    Finding f;
    f.service = "api";
    f.kind = FindingKind::HEALTH_CHECK_FAILED;
    f.severity = Severity::CRITICAL;
    f.observed_at = T0;
    const auto incident = h.incidents->record(f).value();

    h.provider->delay = 300ms;
    Result<RemediationAction> manual = Result<RemediationAction>::error(ErrorCategory::INTERNAL_ERROR, "not run");
    std::thread operator_thread([&] {
        manual = h.orchestrator->trigger_manual(incident.id, ActionType::RESTART_CONTAINER, T0);
    });
    for (int i = 0; i < 200 && h.provider->call_count("restart") == 0; ++i) {
        std::this_thread::sleep_for(1ms);
    }
    REQUIRE(h.provider->call_count("restart") == 1);

    h.metrics->set_unreachable("api");
    auto report = h.orchestrator->run_once(T0 + 1s);
    operator_thread.join();

    REQUIRE(report.services_skipped == 1);
    REQUIRE(report.services_polled == 0);
    REQUIRE(report.actions_executed == 0);
    REQUIRE(h.metrics->polls == 0);
    REQUIRE(h.provider->call_count("restart") == 1);
    REQUIRE(manual.is_ok());
    REQUIRE(manual.value().triggered_by == TriggeredBy::MANUAL);
}

TEST_CASE("Orchestrator: services are remediated in parallel", "[orchestrator]") {
    auto cfg = base_config();
    ServiceConfig worker;
    worker.name = "worker";
    worker.health_url = "http://worker:9000/health";
    cfg.services.push_back(worker);
    cfg.remediation.verify_after_restart = false;

    SECTION("One batch") {
        cfg.daemon.max_parallel_services = 2;
        Harness h(cfg);
        h.metrics->set_unreachable("api");
        h.metrics->set_unreachable("worker");
        h.provider->delay = 300ms;

        utils::Timer timer;
        auto report = h.orchestrator->run_once(T0);
        REQUIRE(report.actions_succeeded == 2);
        REQUIRE(timer.elapsed_ms() < 550ms);
        REQUIRE(h.provider->call_count("restart") == 2);
    }

    SECTION("Batches of one run back to back") {
        cfg.daemon.max_parallel_services = 1;
        Harness h(cfg);
        h.metrics->set_unreachable("api");
        h.metrics->set_unreachable("worker");
        h.provider->delay = 300ms;

        utils::Timer timer;
        auto report = h.orchestrator->run_once(T0);
        REQUIRE(report.actions_succeeded == 2);
        REQUIRE(timer.elapsed_ms() >= 600ms);
    }
}

TEST_CASE("Orchestrator: driver thread ticks until stopped", "[orchestrator]") {
    auto cfg = base_config();
    cfg.daemon.tick_interval = 1s;
    Harness h(cfg);

    h.orchestrator->start();
    REQUIRE(h.orchestrator->is_running());
    for (int i = 0; i < 200 && h.orchestrator->ticks_completed() == 0; ++i) {
        std::this_thread::sleep_for(10ms);
    }
    h.orchestrator->stop();

    REQUIRE_FALSE(h.orchestrator->is_running());
    REQUIRE(h.orchestrator->ticks_completed() >= 1);
}

TEST_CASE("Orchestrator: detections, actions and tick totals are counted", "[orchestrator]") {
    Harness h;
    h.metrics->set_unreachable("api");
    h.provider->default_result = ProviderResult::failure("container not found");

    (void)h.orchestrator->run_once(T0);
    (void)h.orchestrator->run_once(T0 + 31s);

    const auto stats = h.stats->snapshot();
    REQUIRE(stats.detections.at("health_check_failed") == 2);
    REQUIRE(stats.actions.at({"restart_container", "api"}) == 2);
    REQUIRE(stats.failures.at({"restart_container", "provider"}) == 2);
    REQUIRE(stats.durations.at("restart_container").count == 2);

    const auto totals = h.orchestrator->totals();
    REQUIRE(h.orchestrator->ticks_completed() == 2);
    REQUIRE(totals.services_polled == 2);
    REQUIRE(totals.actions_executed == 2);
    REQUIRE(totals.actions_succeeded == 0);
}
