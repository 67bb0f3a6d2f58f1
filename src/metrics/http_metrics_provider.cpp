#include "metrics/http_metrics_provider.hpp"
#include "core/http_constants.hpp"
#include "core/json.hpp"
#include "core/utils.hpp"

#include <httplib.h>

#include <format>

namespace autoheal {

HttpMetricsProvider::HttpMetricsProvider(std::chrono::milliseconds timeout)
    : timeout_(timeout) {}

void HttpMetricsProvider::set_timeout(std::chrono::milliseconds timeout) {
    std::lock_guard lock(mutex_);
    timeout_ = timeout;
}

MetricsSnapshot HttpMetricsProvider::get_snapshot(const ServiceConfig& service) {
    MetricsSnapshot snapshot;
    snapshot.service = service.name;
    snapshot.observed_at = utils::now();

    std::chrono::milliseconds timeout;
    {
        std::lock_guard lock(mutex_);
        timeout = timeout_;
    }

    try {
        const auto target = http::parse_url(service.health_url);
        httplib::Client client(target.scheme_host());
        client.set_connection_timeout(timeout);
        client.set_read_timeout(timeout);

        auto res = client.Get(target.path);
        if (!res) {
            switch (res.error()) {
                case httplib::Error::Connection:
                    snapshot.error = "connection_refused";
                    break;
                case httplib::Error::ConnectionTimeout:
                case httplib::Error::Read:
                    snapshot.error = "timeout";
                    break;
                default:
                    snapshot.error = httplib::to_string(res.error());
                    break;
            }
            return snapshot;
        }

        snapshot.reachable = true;
        snapshot.status_code = res->status;
        if (res->status != 200) {
            snapshot.error = std::format("HTTP {}", res->status);
            return snapshot;
        }

        if (!parse_payload(res->body, snapshot)) {
            utils::log::warn(std::format("{}: health payload is not a JSON object", service.name));
        }
    } catch (const std::exception& e) {
        snapshot.reachable = false;
        snapshot.error = e.what();
    }
    return snapshot;
}

bool HttpMetricsProvider::parse_payload(const std::string& body, MetricsSnapshot& snapshot) {
    JsonValue doc;
    try {
        doc = JsonValue::parse(body);
    } catch (const JsonValue::parse_error&) {
        return false;
    }
    if (!doc.is_object()) {
        return false;
    }

    const auto metrics = doc["metrics"];
    const auto total_requests = metrics.value<uint64_t>("total_requests", 0);
    const auto total_errors = metrics.value<uint64_t>("total_errors", 0);

    snapshot.error_rate = metrics.value("error_rate", 0.0);
    snapshot.cpu_percent = metrics.value("cpu_usage_percent", 0.0);
    snapshot.memory_mb = metrics.value("memory_usage_mb", 0.0);
    snapshot.memory_percent = metrics.value("memory_usage_percent", 0.0);
    // Percentiles are null until the service has served traffic
    snapshot.p50_ms = metrics.value("response_time_p50_ms", 0.0);
    snapshot.p95_ms = metrics.value("response_time_p95_ms", 0.0);
    snapshot.p99_ms = metrics.value("response_time_p99_ms", 0.0);

    {
        std::lock_guard lock(mutex_);
        auto& prev = previous_[snapshot.service];
        if (total_requests >= prev.requests && total_errors >= prev.errors) {
            snapshot.requests = total_requests - prev.requests;
            snapshot.errors = total_errors - prev.errors;
        } else {
            snapshot.requests = total_requests;
            snapshot.errors = total_errors;
        }
        prev = Counters{total_requests, total_errors};
    }

    const auto advisory = doc["advisory"];
    if (advisory.is_object()) {
        AdvisorySignal signal;
        signal.source = advisory.value("source", std::string{"external"});
        signal.score = advisory.value("score", 0.0);
        signal.message = advisory.value("message", std::string{});
        snapshot.advisory = std::move(signal);
    }
    return true;
}

} // namespace autoheal
