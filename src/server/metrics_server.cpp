#include "server/metrics_server.hpp"
#include "core/http_constants.hpp"
#include "core/utils.hpp"

#include <httplib.h>

#include <format>
#include <stdexcept>

namespace autoheal {

namespace {

// Label values are container and service names, escaped anyway
std::string escape_label(std::string_view value) {
    std::string out;
    out.reserve(value.size());
    for (const char c : value) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '"':  out += "\\\""; break;
            case '\n': out += "\\n"; break;
            default:   out += c;
        }
    }
    return out;
}

int breaker_state_value(CircuitState state) {
    switch (state) {
        case CircuitState::CLOSED:    return 0;
        case CircuitState::OPEN:      return 1;
        case CircuitState::HALF_OPEN: return 2;
    }
    return 0;
}

} // anonymous namespace

MetricsServer::MetricsServer(Sources sources, ExporterConfig config)
    : sources_(std::move(sources)),
      config_(std::move(config)) {}

MetricsServer::~MetricsServer() {
    stop();
}

// ============================================================================
// start() / stop()
// ============================================================================

void MetricsServer::start() {
    if (server_) return;

    auto svr = std::make_unique<httplib::Server>();
    svr->Get(config_.path, [this](const httplib::Request& req, httplib::Response& res) {
        handle_metrics(req, res);
    });

    int port = config_.port;
    if (port == 0) {
        port = svr->bind_to_any_port(config_.bind);
    } else if (!svr->bind_to_port(config_.bind, port)) {
        port = -1;
    }
    if (port < 0) {
        throw std::runtime_error(std::format("Failed to bind metrics exporter on {}:{}",
                                             config_.bind, config_.port));
    }

    server_ = std::move(svr);
    bound_port_.store(port);
    listener_ = std::thread([server = server_.get()] {
        if (!server->listen_after_bind()) {
            utils::log::error("Metrics exporter listener exited with an error");
        }
    });
    server_->wait_until_ready();

    utils::log::info(std::format("Metrics exporter on {}:{}{}", config_.bind, port, config_.path));
}

void MetricsServer::stop() {
    if (!server_) return;

    server_->stop();
    if (listener_.joinable()) {
        listener_.join();
    }
    server_.reset();
    bound_port_.store(0);
    utils::log::info("Metrics exporter stopped");
}

// ============================================================================
// Handler: GET /metrics
// ============================================================================

void MetricsServer::handle_metrics(const httplib::Request&, httplib::Response& res) const {
    res.set_content(build_metrics_output(), http::kPrometheusContentType);
}

std::string MetricsServer::build_metrics_output() const {
    std::string output;

    if (sources_.stats) {
        const auto stats = sources_.stats->snapshot();

        output += "# HELP remediation_actions_total Total number of remediation actions performed\n"
                  "# TYPE remediation_actions_total counter\n";
        for (const auto& [labels, count] : stats.actions) {
            output += std::format("remediation_actions_total{{action_type=\"{}\",target=\"{}\"}} {}\n",
                                  escape_label(labels.first), escape_label(labels.second), count);
        }
        output += "\n";

        output += "# HELP remediation_failures_total Total number of failed remediation actions\n"
                  "# TYPE remediation_failures_total counter\n";
        for (const auto& [labels, count] : stats.failures) {
            output += std::format("remediation_failures_total{{action_type=\"{}\",error_type=\"{}\"}} {}\n",
                                  escape_label(labels.first), escape_label(labels.second), count);
        }
        output += "\n";

        output += "# HELP remediation_duration_seconds Time taken to complete remediation actions\n"
                  "# TYPE remediation_duration_seconds histogram\n";
        for (const auto& [type, histogram] : stats.durations) {
            const auto label = escape_label(type);
            uint64_t cumulative = 0;
            for (size_t i = 0; i < RemediationStats::kDurationBuckets.size(); ++i) {
                cumulative += histogram.buckets[i];
                output += std::format(
                    "remediation_duration_seconds_bucket{{action_type=\"{}\",le=\"{}\"}} {}\n",
                    label, RemediationStats::kDurationBuckets[i], cumulative);
            }
            cumulative += histogram.buckets.back();
            output += std::format(
                "remediation_duration_seconds_bucket{{action_type=\"{}\",le=\"+Inf\"}} {}\n"
                "remediation_duration_seconds_sum{{action_type=\"{}\"}} {:.3f}\n"
                "remediation_duration_seconds_count{{action_type=\"{}\"}} {}\n",
                label, cumulative, label, histogram.sum_seconds, label, histogram.count);
        }
        output += "\n";

        output += "# HELP circuit_breaker_trips_total Number of times circuit breaker tripped\n"
                  "# TYPE circuit_breaker_trips_total counter\n";
        for (const auto& [labels, count] : stats.breaker_trips) {
            output += std::format("circuit_breaker_trips_total{{service=\"{}\",reason=\"{}\"}} {}\n",
                                  escape_label(labels.first), escape_label(labels.second), count);
        }
        output += "\n";

        output += "# HELP detections_total Total number of anomalies detected\n"
                  "# TYPE detections_total counter\n";
        for (const auto& [type, count] : stats.detections) {
            output += std::format("detections_total{{detector_type=\"{}\"}} {}\n",
                                  escape_label(type), count);
        }
        output += "\n";
    }

    if (sources_.breakers) {
        output += "# HELP circuit_breaker_state Circuit breaker state (0=closed, 1=open, 2=half_open)\n"
                  "# TYPE circuit_breaker_state gauge\n";
        for (const auto& b : sources_.breakers->get_all_stats()) {
            output += std::format("circuit_breaker_state{{service=\"{}\"}} {}\n",
                                  escape_label(b.service), breaker_state_value(b.state));
        }
        output += "\n";
    }

    if (sources_.orchestrator) {
        const auto totals = sources_.orchestrator->totals();
        output += std::format(
            "# HELP autoheal_ticks_total Completed orchestrator ticks\n"
            "# TYPE autoheal_ticks_total counter\n"
            "autoheal_ticks_total {}\n\n"
            "# HELP autoheal_services_total Per-tick service outcomes\n"
            "# TYPE autoheal_services_total counter\n"
            "autoheal_services_total{{outcome=\"polled\"}} {}\n"
            "autoheal_services_total{{outcome=\"skipped\"}} {}\n\n"
            "# HELP autoheal_findings_suppressed_total Findings not reopened inside the dedupe window\n"
            "# TYPE autoheal_findings_suppressed_total counter\n"
            "autoheal_findings_suppressed_total {}\n\n"
            "# HELP autoheal_gate_refusals_total Actions refused before execution\n"
            "# TYPE autoheal_gate_refusals_total counter\n"
            "autoheal_gate_refusals_total{{gate=\"rate_limit\"}} {}\n"
            "autoheal_gate_refusals_total{{gate=\"circuit_breaker\"}} {}\n\n"
            "# HELP autoheal_escalations_total Incidents escalated to an operator\n"
            "# TYPE autoheal_escalations_total counter\n"
            "autoheal_escalations_total {}\n\n"
            "# HELP autoheal_tick_errors_total Errors raised while processing services\n"
            "# TYPE autoheal_tick_errors_total counter\n"
            "autoheal_tick_errors_total {}\n\n"
            "# HELP autoheal_detector_errors_total Detector runs that threw\n"
            "# TYPE autoheal_detector_errors_total counter\n"
            "autoheal_detector_errors_total {}\n\n"
            "# HELP autoheal_pending_commits Remediation outcomes waiting to be persisted\n"
            "# TYPE autoheal_pending_commits gauge\n"
            "autoheal_pending_commits {}\n\n",
            sources_.orchestrator->ticks_completed(),
            totals.services_polled, totals.services_skipped,
            totals.findings_suppressed,
            totals.rate_limited, totals.breaker_blocked,
            totals.escalations,
            totals.errors,
            sources_.orchestrator->detector_errors(),
            totals.pending_commits);
    }

    if (sources_.dispatcher) {
        const auto ns = sources_.dispatcher->get_stats();
        output += std::format(
            "# HELP autoheal_notifications_total Notification events by outcome\n"
            "# TYPE autoheal_notifications_total counter\n"
            "autoheal_notifications_total{{outcome=\"enqueued\"}} {}\n"
            "autoheal_notifications_total{{outcome=\"delivered\"}} {}\n"
            "autoheal_notifications_total{{outcome=\"dropped\"}} {}\n\n"
            "# HELP autoheal_notification_sink_failures_total Failed sink deliveries\n"
            "# TYPE autoheal_notification_sink_failures_total counter\n"
            "autoheal_notification_sink_failures_total {}\n\n",
            ns.total_enqueued, ns.total_delivered, ns.dropped, ns.sink_failures);
    }

    return output;
}

} // namespace autoheal
