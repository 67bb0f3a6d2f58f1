#pragma once

#include "metrics/imetrics_provider.hpp"

#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>

namespace autoheal {

/**
 * @brief Polls a service's health endpoint with cpp-httplib
 *
 * Expected body:
 * @code
 * {"service": "...",
 *  "metrics": {"total_requests": N, "total_errors": N, "error_rate": 0.0,
 *              "cpu_usage_percent": 0.0, "memory_usage_mb": 0.0,
 *              "response_time_p50_ms": 0.0, "response_time_p95_ms": 0.0,
 *              "response_time_p99_ms": 0.0},
 *  "advisory": {"source": "...", "score": 0.0, "message": "..."}}
 * @endcode
 *
 * The endpoint reports lifetime counters; requests/errors in the snapshot
 * are the deltas since the previous poll of the same service. A counter
 * that goes backwards (service restarted) restarts the delta from zero.
 */
class HttpMetricsProvider : public IMetricsProvider {
public:
    explicit HttpMetricsProvider(std::chrono::milliseconds timeout);

    [[nodiscard]] MetricsSnapshot get_snapshot(const ServiceConfig& service) override;
    [[nodiscard]] std::string name() const override { return "http"; }

    void set_timeout(std::chrono::milliseconds timeout);

    /**
     * @brief Fill @p snapshot from a health payload
     * @return false when the body is not a JSON object
     */
    bool parse_payload(const std::string& body, MetricsSnapshot& snapshot);

private:
    struct Counters {
        uint64_t requests = 0;
        uint64_t errors = 0;
    };

    std::chrono::milliseconds timeout_;
    std::unordered_map<std::string, Counters> previous_;
    std::mutex mutex_;
};

} // namespace autoheal
