#pragma once

#include "core/types.hpp"

#include <deque>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace autoheal {

/**
 * @brief Bounded per-service history of recent snapshots
 *
 * Feeds the sustained-tick checks in CpuSpikeDetector and MemoryDetector.
 * Oldest entries are evicted once a service holds `capacity` snapshots.
 */
class SnapshotHistory {
public:
    explicit SnapshotHistory(size_t capacity = 20);

    /// Earlier snapshots for the service, oldest first
    [[nodiscard]] std::vector<MetricsSnapshot> recent(const std::string& service) const;

    void push(const MetricsSnapshot& snapshot);

    /// Capacity follows config reloads; shrinking trims every service
    void set_capacity(size_t capacity);

    void forget(const std::string& service);

    [[nodiscard]] size_t size(const std::string& service) const;

private:
    size_t capacity_;
    std::unordered_map<std::string, std::deque<MetricsSnapshot>> history_;
    mutable std::mutex mutex_;
};

} // namespace autoheal
