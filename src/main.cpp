#include "core/orchestrator.hpp"
#include "core/utils.hpp"
#include "config/config_loader.hpp"
#include "config/config_store.hpp"
#include "config/config_watcher.hpp"
#include "detect/detector_set.hpp"
#include "executor/action_rate_limiter.hpp"
#include "executor/circuit_breaker_registry.hpp"
#include "executor/docker_lifecycle_provider.hpp"
#include "executor/remediation_executor.hpp"
#include "incident/incident_manager.hpp"
#include "metrics/http_metrics_provider.hpp"
#include "notify/notification_dispatcher.hpp"
#include "server/metrics_server.hpp"
#include "store/memory_state_store.hpp"
#include "store/pg_state_store.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <format>
#include <memory>
#include <thread>

using namespace autoheal;

namespace {

std::atomic<bool> g_shutdown_requested{false};

void signal_handler(int /*signal*/) {
    g_shutdown_requested.store(true);
}

std::shared_ptr<IStateStore> make_store(const PersistenceConfig& config) {
    if (config.backend == "postgresql") {
        auto store = std::make_shared<PgStateStore>(config.connection_string);
        if (auto st = store->connect(); st.is_error()) {
            throw std::runtime_error(std::format("PostgreSQL state store: {}", st.message));
        }
        return store;
    }
    return std::make_shared<MemoryStateStore>();
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    try {
        utils::log::info("AutoHeal remediation daemon starting...");

        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        std::string config_file = "config/autoheal.toml";
        if (argc > 1) {
            config_file = argv[1];
        }

        // =====================================================================
        // [1/7] Configuration
        // =====================================================================
        utils::log::info(std::format("[1/7] Loading configuration from {}", config_file));
        auto config_result = ConfigLoader::load_from_file(config_file);
        if (!config_result.success) {
            utils::log::error(config_result.error_message);
            return 1;
        }
        const MonitorConfig& cfg = config_result.config;
        utils::log::set_level(utils::log::parse_level(cfg.logging.level));
        utils::log::info(std::format("Config loaded: {} services, tick every {}s",
                                     cfg.services.size(), cfg.daemon.tick_interval.count()));

        auto config_store = std::make_shared<ConfigStore>(cfg);

        // =====================================================================
        // [2/7] State store
        // =====================================================================
        auto store = make_store(cfg.persistence);
        utils::log::info(std::format("[2/7] State store: {}", store->name()));

        // =====================================================================
        // [3/7] Notifications
        // =====================================================================
        std::shared_ptr<NotificationDispatcher> dispatcher =
            NotificationDispatcher::from_config(cfg.notifications);
        dispatcher->start();
        utils::log::info(std::format("[3/7] Notifications: {} sinks",
                                     dispatcher->get_stats().active_sinks));

        // =====================================================================
        // [4/7] Providers
        // =====================================================================
        auto metrics = std::make_shared<HttpMetricsProvider>(cfg.metrics.timeout);
        auto docker = std::make_shared<DockerLifecycleProvider>(cfg.docker, cfg.services);
        utils::log::info(std::format("[4/7] Providers: metrics={} lifecycle={} ({})",
                                     metrics->name(), docker->name(), cfg.docker.socket_path));

        // =====================================================================
        // [5/7] Remediation core
        // =====================================================================
        auto incidents = std::make_shared<IncidentManager>(store, dispatcher);
        auto rate_limiter = std::make_shared<ActionRateLimiter>();
        auto breakers = std::make_shared<CircuitBreakerRegistry>(store, cfg.circuit_breaker);
        auto executor = std::make_shared<RemediationExecutor>(
            docker, incidents, breakers, rate_limiter, dispatcher);

        auto stats = std::make_shared<RemediationStats>();
        executor->set_stats(stats);
        breakers->set_on_state_change([stats](const StateChangeEvent& e) {
            stats->record_state_change(e.service, e.from, e.to);
        });

        auto orchestrator = std::make_shared<Orchestrator>(
            Orchestrator::Dependencies{
                .config = config_store,
                .metrics = metrics,
                .store = store,
                .incidents = incidents,
                .rate_limiter = rate_limiter,
                .breakers = breakers,
                .executor = executor,
                .stats = stats
            },
            DetectorSet::with_defaults());
        utils::log::info(std::format("[5/7] Remediation: max {} actions/{}s, breaker {} failures/{}s cooldown",
            cfg.rate_limit.max_actions_per_window, cfg.rate_limit.window.count(),
            cfg.circuit_breaker.failure_threshold, cfg.circuit_breaker.cooldown.count()));

        // =====================================================================
        // [6/7] Config watcher
        // =====================================================================
        std::shared_ptr<ConfigWatcher> watcher;
        if (cfg.config_watcher.enabled) {
            watcher = std::make_shared<ConfigWatcher>(
                config_file, std::chrono::seconds{cfg.config_watcher.poll_interval_seconds});

            // Components that hold config outside the per-tick snapshot
            watcher->set_callback([config_store, metrics, docker](const MonitorConfig& new_cfg) {
                utils::log::set_level(utils::log::parse_level(new_cfg.logging.level));
                metrics->set_timeout(new_cfg.metrics.timeout);
                docker->update_services(new_cfg.services);
                config_store->publish(new_cfg);
                utils::log::info(std::format("Config reloaded: {} services (version {})",
                                             new_cfg.services.size(), config_store->version()));
            });
            watcher->start();
            utils::log::info(std::format("[6/7] Config watcher: polling every {}s",
                                         cfg.config_watcher.poll_interval_seconds));
        } else {
            utils::log::info("[6/7] Config watcher: disabled");
        }

        // =====================================================================
        // [7/7] Metrics exporter
        // =====================================================================
        std::unique_ptr<MetricsServer> exporter;
        if (cfg.exporter.enabled) {
            exporter = std::make_unique<MetricsServer>(
                MetricsServer::Sources{
                    .stats = stats,
                    .breakers = breakers,
                    .dispatcher = dispatcher,
                    .orchestrator = orchestrator
                },
                cfg.exporter);
            exporter->start();
            utils::log::info(std::format("[7/7] Metrics exporter: {}:{}{}",
                                         cfg.exporter.bind, exporter->port(), cfg.exporter.path));
        } else {
            utils::log::info("[7/7] Metrics exporter: disabled");
        }

        orchestrator->start();
        utils::log::info("AutoHeal running");

        while (!g_shutdown_requested.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        utils::log::info("Shutdown requested, stopping...");
        if (watcher) {
            watcher->stop();
        }
        orchestrator->stop();
        if (exporter) {
            exporter->stop();
        }

        const size_t pending = executor->pending_count();
        if (pending > 0) {
            utils::log::warn(std::format("{} remediation outcomes could not be persisted", pending));
        }

        dispatcher->flush();
        dispatcher->shutdown();
        const auto stats = dispatcher->get_stats();
        utils::log::info(std::format("Notifications: {} delivered, {} dropped, {} sink failures",
                                     stats.total_delivered, stats.dropped, stats.sink_failures));

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return 1;
    }

    return 0;
}
