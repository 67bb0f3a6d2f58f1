#pragma once

#include "config/config_types.hpp"
#include "core/types.hpp"

#include <optional>
#include <string_view>
#include <vector>

namespace autoheal {

/**
 * @brief One threshold check over a metrics snapshot
 *
 * evaluate() is pure: same snapshot, history and config always give the
 * same answer, and it performs no I/O. History holds earlier snapshots of
 * the same service, oldest first, excluding the current one.
 */
class IDetector {
public:
    virtual ~IDetector() = default;

    [[nodiscard]] virtual std::optional<Finding> evaluate(
        const MetricsSnapshot& snapshot,
        const std::vector<MetricsSnapshot>& history,
        const MonitorConfig& config) const = 0;

    [[nodiscard]] virtual bool enabled(const DetectorConfig& config) const = 0;

    [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace autoheal
