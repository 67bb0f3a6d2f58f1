#pragma once

#include "config/config_types.hpp"
#include "config/iconfig_source.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>

namespace autoheal {

/**
 * @brief In-process config holder, fed by ConfigWatcher reloads
 */
class ConfigStore : public IConfigSource {
public:
    explicit ConfigStore(MonitorConfig initial);

    [[nodiscard]] std::shared_ptr<const MonitorConfig> get_config() const override;

    /// Replace the current snapshot; readers holding the old one keep it alive
    void publish(MonitorConfig config);

    /// Incremented on every publish
    [[nodiscard]] uint64_t version() const { return version_.load(std::memory_order_acquire); }

private:
    std::shared_ptr<const MonitorConfig> current_;
    mutable std::mutex mutex_;
    std::atomic<uint64_t> version_{1};
};

} // namespace autoheal
