#pragma once

#include "config/config_types.hpp"
#include "core/orchestrator.hpp"
#include "core/remediation_stats.hpp"
#include "executor/circuit_breaker_registry.hpp"
#include "notify/notification_dispatcher.hpp"

#include <atomic>
#include <memory>
#include <string>
#include <thread>

// Forward-declare httplib types (avoids pulling in massive header-only library)
namespace httplib {
struct Request;
struct Response;
class Server;
}

namespace autoheal {

/**
 * @brief Prometheus text-format exporter on its own listener thread
 *
 * Every scrape pulls current values from the sources; nothing is cached.
 * Sources other than stats may be null and are then left out of the output.
 */
class MetricsServer {
public:
    struct Sources {
        std::shared_ptr<RemediationStats> stats;
        std::shared_ptr<CircuitBreakerRegistry> breakers;
        std::shared_ptr<NotificationDispatcher> dispatcher;
        std::shared_ptr<const Orchestrator> orchestrator;
    };

    MetricsServer(Sources sources, ExporterConfig config);
    ~MetricsServer();

    MetricsServer(const MetricsServer&) = delete;
    MetricsServer& operator=(const MetricsServer&) = delete;

    /// Bind and start serving; throws std::runtime_error when the address cannot be bound
    void start();

    /// Stop the listener and join its thread
    void stop();

    /// Bound port (the picked one when configured with port 0); 0 before start()
    [[nodiscard]] int port() const { return bound_port_.load(); }

    [[nodiscard]] std::string build_metrics_output() const;

private:
    void handle_metrics(const httplib::Request& req, httplib::Response& res) const;

    Sources sources_;
    ExporterConfig config_;

    std::unique_ptr<httplib::Server> server_;
    std::thread listener_;
    std::atomic<int> bound_port_{0};
};

} // namespace autoheal
