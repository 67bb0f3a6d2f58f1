#pragma once

#include <memory>

namespace autoheal {

struct MonitorConfig;

/**
 * @brief Source of immutable config snapshots
 *
 * The orchestrator fetches one snapshot at the top of every tick and passes
 * it through detectors and the executor. A change published mid-tick is only
 * seen by the next tick.
 */
class IConfigSource {
public:
    virtual ~IConfigSource() = default;

    [[nodiscard]] virtual std::shared_ptr<const MonitorConfig> get_config() const = 0;
};

} // namespace autoheal
