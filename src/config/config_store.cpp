#include "config/config_store.hpp"

namespace autoheal {

ConfigStore::ConfigStore(MonitorConfig initial)
    : current_(std::make_shared<const MonitorConfig>(std::move(initial))) {}

std::shared_ptr<const MonitorConfig> ConfigStore::get_config() const {
    std::lock_guard lock(mutex_);
    return current_;
}

void ConfigStore::publish(MonitorConfig config) {
    auto next = std::make_shared<const MonitorConfig>(std::move(config));
    {
        std::lock_guard lock(mutex_);
        current_ = std::move(next);
    }
    version_.fetch_add(1, std::memory_order_acq_rel);
}

} // namespace autoheal
