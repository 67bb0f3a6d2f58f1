#include "detect/snapshot_history.hpp"

namespace autoheal {

SnapshotHistory::SnapshotHistory(size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity) {}

std::vector<MetricsSnapshot> SnapshotHistory::recent(const std::string& service) const {
    std::lock_guard lock(mutex_);
    const auto it = history_.find(service);
    if (it == history_.end()) return {};
    return {it->second.begin(), it->second.end()};
}

void SnapshotHistory::push(const MetricsSnapshot& snapshot) {
    std::lock_guard lock(mutex_);
    auto& entries = history_[snapshot.service];
    entries.push_back(snapshot);
    while (entries.size() > capacity_) {
        entries.pop_front();
    }
}

void SnapshotHistory::set_capacity(size_t capacity) {
    std::lock_guard lock(mutex_);
    capacity_ = capacity == 0 ? 1 : capacity;
    for (auto& [service, entries] : history_) {
        while (entries.size() > capacity_) {
            entries.pop_front();
        }
    }
}

void SnapshotHistory::forget(const std::string& service) {
    std::lock_guard lock(mutex_);
    history_.erase(service);
}

size_t SnapshotHistory::size(const std::string& service) const {
    std::lock_guard lock(mutex_);
    const auto it = history_.find(service);
    return it == history_.end() ? 0 : it->second.size();
}

} // namespace autoheal
