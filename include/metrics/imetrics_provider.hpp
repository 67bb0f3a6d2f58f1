#pragma once

#include "config/config_types.hpp"
#include "core/types.hpp"

#include <string>

namespace autoheal {

/**
 * @brief Source of per-service metrics snapshots
 *
 * get_snapshot() never throws: a poll that fails yields reachable=false
 * with the transport error, which the health-check detector turns into a
 * finding.
 */
class IMetricsProvider {
public:
    virtual ~IMetricsProvider() = default;

    [[nodiscard]] virtual MetricsSnapshot get_snapshot(const ServiceConfig& service) = 0;

    [[nodiscard]] virtual std::string name() const = 0;
};

} // namespace autoheal
