#include "core/orchestrator.hpp"
#include "executor/remediation_policy.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <future>
#include <vector>

namespace autoheal {

TickReport& TickReport::operator+=(const TickReport& other) {
    services_polled += other.services_polled;
    services_skipped += other.services_skipped;
    findings += other.findings;
    actions_executed += other.actions_executed;
    actions_succeeded += other.actions_succeeded;
    escalations += other.escalations;
    rate_limited += other.rate_limited;
    breaker_blocked += other.breaker_blocked;
    findings_suppressed += other.findings_suppressed;
    errors += other.errors;
    return *this;
}

Orchestrator::Orchestrator(Dependencies deps, DetectorSet detectors)
    : deps_(std::move(deps)),
      detectors_(std::move(detectors)) {}

Orchestrator::~Orchestrator() {
    stop();
}

// ============================================================================
// Driver
// ============================================================================

void Orchestrator::start() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) return;

    utils::log::info("Orchestrator started");
    driver_thread_ = std::thread(&Orchestrator::driver_loop, this);
}

void Orchestrator::stop() {
    bool expected = true;
    if (!running_.compare_exchange_strong(expected, false)) return;

    cv_.notify_one();
    if (driver_thread_.joinable()) {
        driver_thread_.join();
    }
    utils::log::info(std::format("Orchestrator stopped after {} ticks", ticks_completed()));
}

void Orchestrator::driver_loop() {
    while (running_.load(std::memory_order_acquire)) {
        try {
            const auto report = run_once(utils::now());
            utils::log::debug(std::format(
                "Tick: {} polled, {} findings, {} actions ({} ok), {} escalations",
                report.services_polled, report.findings, report.actions_executed,
                report.actions_succeeded, report.escalations));
        } catch (const std::exception& e) {
            utils::log::error(std::format("Tick failed: {}", e.what()));
        }

        const auto interval = deps_.config->get_config()->daemon.tick_interval;
        std::unique_lock lock(cv_mutex_);
        cv_.wait_for(lock, interval, [this] {
            return !running_.load(std::memory_order_acquire);
        });
    }
}

// ============================================================================
// Tick
// ============================================================================

void Orchestrator::ensure_hydrated(const MonitorConfig& config, TimePoint now) {
    if (hydrated_) return;

    auto entries = deps_.store->list_window_entries(now - config.rate_limit.window);
    if (entries.is_error()) {
        utils::log::warn(std::format("Action window not loaded, will retry next tick: {}",
                                     entries.error_message()));
        return;
    }
    deps_.rate_limiter->hydrate(entries.value());
    hydrated_ = true;
    utils::log::info(std::format("Loaded {} recent actions from {} store",
                                 entries.value().size(), deps_.store->name()));
}

void Orchestrator::apply_config(const std::shared_ptr<const MonitorConfig>& config) {
    if (config == applied_config_) return;

    deps_.breakers->apply_config(*config);
    history_.set_capacity(config->detectors.history_size);
    if (applied_config_) {
        for (const auto& old_svc : applied_config_->services) {
            if (!config->find_service(old_svc.name)) {
                history_.forget(old_svc.name);
            }
        }
    }
    applied_config_ = config;
}

TickReport Orchestrator::run_once(TimePoint now) {
    std::lock_guard tick_lock(tick_mutex_);

    const auto config = deps_.config->get_config();
    apply_config(config);
    ensure_hydrated(*config, now);
    deps_.rate_limiter->evict_expired(now, config->rate_limit.window);

    TickReport report;
    report.pending_commits = deps_.executor->retry_pending();

    std::vector<const ServiceConfig*> services;
    for (const auto& svc : config->services) {
        if (svc.enabled) {
            services.push_back(&svc);
        } else {
            ++report.services_skipped;
        }
    }

    const size_t batch = std::max<size_t>(1, config->daemon.max_parallel_services);
    for (size_t offset = 0; offset < services.size(); offset += batch) {
        const size_t end = std::min(services.size(), offset + batch);

        std::vector<std::future<TickReport>> futures;
        futures.reserve(end - offset);
        for (size_t i = offset; i < end; ++i) {
            futures.push_back(std::async(std::launch::async,
                [this, svc = services[i], &config, now] {
                    return process_service(*svc, *config, now);
                }));
        }

        for (size_t i = 0; i < futures.size(); ++i) {
            try {
                report += futures[i].get();
            } catch (const std::exception& e) {
                ++report.errors;
                utils::log::error(std::format("Service {} tick failed: {}",
                                              services[offset + i]->name, e.what()));
            }
        }
    }

    {
        std::lock_guard lock(totals_mutex_);
        totals_ += report;
        totals_.pending_commits = report.pending_commits;
    }
    ticks_.fetch_add(1, std::memory_order_relaxed);
    return report;
}

TickReport Orchestrator::totals() const {
    std::lock_guard lock(totals_mutex_);
    return totals_;
}

TickReport Orchestrator::process_service(const ServiceConfig& service,
                                         const MonitorConfig& config, TimePoint now) {
    TickReport report;

    auto mutex = service_lock(service.name);
    std::unique_lock lock(*mutex, std::try_to_lock);
    if (!lock.owns_lock()) {
        utils::log::debug(std::format("{}: remediation in flight, skipping tick", service.name));
        ++report.services_skipped;
        return report;
    }

    // Observe
    MetricsSnapshot snapshot = deps_.metrics->get_snapshot(service);
    snapshot.service = service.name;
    snapshot.observed_at = now;
    ++report.services_polled;

    const auto history = history_.recent(service.name);
    const auto findings = detectors_.run(snapshot, history, config);
    history_.push(snapshot);
    report.findings = findings.size();

    for (const auto& finding : findings) {
        if (deps_.stats) deps_.stats->record_detection(finding.kind);
        if (deps_.incidents->recently_closed(finding, config.daemon.incident_dedupe_window)) {
            ++report.findings_suppressed;
            utils::log::debug(std::format("{}: {} closed within the last {}s, not reopening",
                service.name, finding_kind_to_string(finding.kind),
                config.daemon.incident_dedupe_window.count()));
            continue;
        }
        auto recorded = deps_.incidents->record(finding);
        if (recorded.is_error()) {
            ++report.errors;
            utils::log::error(std::format("{}: could not record {}: {}", service.name,
                finding_kind_to_string(finding.kind), recorded.error_message()));
        }
    }

    // Outcomes from earlier ticks must land before acting again
    if (deps_.executor->has_pending(service.name)) {
        utils::log::warn(std::format("{}: uncommitted remediation outcome, holding actions",
                                     service.name));
        return report;
    }

    auto active = deps_.incidents->active_incidents(service.name);
    if (active.is_error()) {
        ++report.errors;
        utils::log::error(std::format("{}: could not list incidents: {}",
                                      service.name, active.error_message()));
        return report;
    }

    for (const auto& incident : active.value()) {
        const auto step = handle_incident(incident, config, now, report);
        if (step == IncidentStep::ACTED || step == IncidentStep::ABORT) {
            break;
        }
    }
    return report;
}

Orchestrator::IncidentStep Orchestrator::handle_incident(
    const Incident& incident, const MonitorConfig& config, TimePoint now, TickReport& report) {

    // An open breaker escalates at once, ahead of the recency guard, so the
    // incident is not left waiting until the breaker half-opens
    auto breaker = deps_.breakers->get_breaker(incident.service);
    if (const auto remaining = breaker->open_remaining(now)) {
        ++report.breaker_blocked;
        return escalate(incident, std::format("circuit breaker open, {}s of cooldown remaining",
                                              remaining->count()), now, report)
            ? IncidentStep::ESCALATED : IncidentStep::ABORT;
    }

    if (incident.last_action_at && now - *incident.last_action_at < config.daemon.min_action_interval) {
        return IncidentStep::WAIT;
    }

    const auto action = select_action(incident.kind, config.remediation);
    if (!action) {
        return escalate(incident, "no automatic action configured", now, report)
            ? IncidentStep::ESCALATED : IncidentStep::ABORT;
    }

    // Rate limiter
    const auto rate = deps_.rate_limiter->allow(incident.service, *action, now, config.rate_limit);
    if (!rate.allowed) {
        ++report.rate_limited;
        if (incident.attempts > 0) {
            return escalate(incident, std::format("rate limit exceeded: {}", rate.reason), now, report)
                ? IncidentStep::ESCALATED : IncidentStep::ABORT;
        }
        utils::log::info(std::format("{}: {} rate limited, retry in {}s", incident.service,
            action_type_to_string(*action), rate.retry_after.count()));
        return IncidentStep::WAIT;
    }

    // Circuit breaker
    const auto decision = breaker->allow(now);
    if (decision.state_changed) {
        if (auto st = deps_.store->save_breaker(breaker->snapshot()); st.is_error()) {
            utils::log::warn(std::format("{}: breaker transition not persisted: {}",
                                         incident.service, st.message));
        }
    }
    if (!decision.allowed) {
        if (decision.busy) {
            return IncidentStep::WAIT;
        }
        ++report.breaker_blocked;
        return escalate(incident, std::format("circuit breaker open: {}", decision.reason), now, report)
            ? IncidentStep::ESCALATED : IncidentStep::ABORT;
    }

    // Act
    auto result = deps_.executor->execute(incident, *action, config, now);
    if (result.is_error()) {
        ++report.errors;
        if (result.error_category() == ErrorCategory::INTERNAL_ERROR) {
            utils::log::error(std::format("Incident {}: {}", incident.id, result.error_message()));
            return escalate(incident, std::format("internal error: {}", result.error_message()),
                            now, report)
                ? IncidentStep::ESCALATED : IncidentStep::ABORT;
        }
        utils::log::error(std::format("Incident {}: remediation not recorded: {}",
                                      incident.id, result.error_message()));
        return IncidentStep::ABORT;
    }

    ++report.actions_executed;
    if (result.value().success) {
        ++report.actions_succeeded;
    }
    return IncidentStep::ACTED;
}

bool Orchestrator::escalate(const Incident& incident, const std::string& reason, TimePoint now,
                            TickReport& report) {
    auto escalated = deps_.incidents->escalate(incident.id, reason, now);
    if (escalated.is_error()) {
        ++report.errors;
        utils::log::error(std::format("Incident {}: escalation not recorded: {}",
                                      incident.id, escalated.error_message()));
        return false;
    }
    ++report.escalations;
    return true;
}

// ============================================================================
// Manual actions
// ============================================================================

Result<RemediationAction> Orchestrator::trigger_manual(int64_t incident_id, ActionType action,
                                                       TimePoint now) {
    auto incident = deps_.incidents->get(incident_id);
    if (incident.is_error()) {
        return Result<RemediationAction>::error(incident.error_category(), incident.error_message());
    }

    auto mutex = service_lock(incident.value().service);
    std::lock_guard lock(*mutex);
    const auto config = deps_.config->get_config();
    return deps_.executor->execute_manual(incident.value(), action, *config, now);
}

std::shared_ptr<std::mutex> Orchestrator::service_lock(const std::string& service) {
    std::lock_guard lock(locks_mutex_);
    auto [it, inserted] = service_locks_.try_emplace(service, nullptr);
    if (inserted) {
        it->second = std::make_shared<std::mutex>();
    }
    return it->second;
}

} // namespace autoheal
