#pragma once

#include "config/config_types.hpp"
#include "core/types.hpp"

#include <atomic>
#include <chrono>
#include <deque>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace autoheal {

/**
 * @brief Sliding-window limit on remediation actions per (service, action type)
 *
 * An action is allowed while fewer than max_actions_per_window entries exist
 * with timestamp >= now - window. Every attempt (success or failure) is
 * recorded, so a flapping service cannot be restarted in a tight loop.
 * Independent of the circuit breaker.
 *
 * The in-memory window is hydrated from the state store at startup; the
 * store remains the durable copy.
 */
class ActionRateLimiter {
public:
    struct Decision {
        bool allowed = true;
        size_t count = 0;                       // Entries inside the window
        std::chrono::seconds retry_after{0};    // Until the oldest entry leaves the window
        std::string reason;
    };

    ActionRateLimiter() = default;

    [[nodiscard]] Decision allow(const std::string& service, ActionType action_type,
                                 TimePoint now, const RateLimitConfig& config) const;

    void record(const ActionWindowEntry& entry);

    /// Replace the window with persisted entries
    void hydrate(const std::vector<ActionWindowEntry>& entries);

    /// Drop entries older than now - window for every key
    void evict_expired(TimePoint now, std::chrono::seconds window);

    [[nodiscard]] size_t count(const std::string& service, ActionType action_type,
                               TimePoint since) const;

    [[nodiscard]] uint64_t total_rejected() const {
        return total_rejected_.load(std::memory_order_relaxed);
    }

private:
    [[nodiscard]] static std::string make_key(const std::string& service, ActionType action_type);

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::deque<TimePoint>> windows_;
    mutable std::atomic<uint64_t> total_rejected_{0};
};

} // namespace autoheal
