#include "executor/action_rate_limiter.hpp"

#include <algorithm>
#include <format>
#include <mutex>

namespace autoheal {

std::string ActionRateLimiter::make_key(const std::string& service, ActionType action_type) {
    std::string key = service;
    key += '|';
    key += action_type_to_string(action_type);
    return key;
}

ActionRateLimiter::Decision ActionRateLimiter::allow(
    const std::string& service, ActionType action_type,
    TimePoint now, const RateLimitConfig& config) const {

    Decision decision;
    const TimePoint since = now - config.window;

    std::shared_lock lock(mutex_);
    const auto it = windows_.find(make_key(service, action_type));
    if (it == windows_.end()) {
        return decision;
    }

    const auto& stamps = it->second;
    const auto first_in_window = std::lower_bound(stamps.begin(), stamps.end(), since);
    decision.count = static_cast<size_t>(std::distance(first_in_window, stamps.end()));

    if (decision.count >= config.max_actions_per_window) {
        decision.allowed = false;
        decision.retry_after = std::chrono::duration_cast<std::chrono::seconds>(
            *first_in_window + config.window - now);
        decision.reason = std::format("{} {} actions on {} within {}s (max {})",
            decision.count, action_type_to_string(action_type), service,
            config.window.count(), config.max_actions_per_window);
        total_rejected_.fetch_add(1, std::memory_order_relaxed);
    }
    return decision;
}

void ActionRateLimiter::record(const ActionWindowEntry& entry) {
    std::unique_lock lock(mutex_);
    auto& stamps = windows_[make_key(entry.service, entry.action_type)];
    // Keep sorted; entries almost always arrive in order
    stamps.insert(std::upper_bound(stamps.begin(), stamps.end(), entry.timestamp), entry.timestamp);
}

void ActionRateLimiter::hydrate(const std::vector<ActionWindowEntry>& entries) {
    std::unique_lock lock(mutex_);
    windows_.clear();
    for (const auto& entry : entries) {
        windows_[make_key(entry.service, entry.action_type)].push_back(entry.timestamp);
    }
    for (auto& [key, stamps] : windows_) {
        std::sort(stamps.begin(), stamps.end());
    }
}

void ActionRateLimiter::evict_expired(TimePoint now, std::chrono::seconds window) {
    const TimePoint since = now - window;
    std::unique_lock lock(mutex_);
    for (auto it = windows_.begin(); it != windows_.end();) {
        auto& stamps = it->second;
        while (!stamps.empty() && stamps.front() < since) {
            stamps.pop_front();
        }
        if (stamps.empty()) {
            it = windows_.erase(it);
        } else {
            ++it;
        }
    }
}

size_t ActionRateLimiter::count(const std::string& service, ActionType action_type,
                                TimePoint since) const {
    std::shared_lock lock(mutex_);
    const auto it = windows_.find(make_key(service, action_type));
    if (it == windows_.end()) {
        return 0;
    }
    const auto& stamps = it->second;
    return static_cast<size_t>(std::distance(
        std::lower_bound(stamps.begin(), stamps.end(), since), stamps.end()));
}

} // namespace autoheal
