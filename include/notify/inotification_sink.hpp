#pragma once

#include "notify/notification_types.hpp"

#include <string>

namespace autoheal {

/**
 * @brief Abstract interface for notification destinations
 *
 * Sinks are only called from the NotificationDispatcher delivery thread,
 * so implementations need no internal locking.
 */
class INotificationSink {
public:
    virtual ~INotificationSink() = default;

    /// Deliver one event. Returns true on success.
    [[nodiscard]] virtual bool deliver(const NotificationEvent& event) = 0;

    /// Flush buffered output and release handles
    virtual void shutdown() = 0;

    /// Human-readable sink name for logging (e.g. "file:/var/log/autoheal/events.jsonl")
    [[nodiscard]] virtual std::string name() const = 0;
};

} // namespace autoheal
