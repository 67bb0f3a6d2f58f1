#pragma once

#include "core/types.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace autoheal {

enum class EventType {
    INCIDENT_CREATED,
    INCIDENT_RESOLVED,
    INCIDENT_ESCALATED,
    REMEDIATION_SUCCEEDED,
    REMEDIATION_FAILED,
    BREAKER_OPENED
};

[[nodiscard]] constexpr std::string_view event_type_to_string(EventType t) {
    switch (t) {
        case EventType::INCIDENT_CREATED:      return "incident_created";
        case EventType::INCIDENT_RESOLVED:     return "incident_resolved";
        case EventType::INCIDENT_ESCALATED:    return "incident_escalated";
        case EventType::REMEDIATION_SUCCEEDED: return "remediation_succeeded";
        case EventType::REMEDIATION_FAILED:    return "remediation_failed";
        case EventType::BREAKER_OPENED:        return "breaker_opened";
        default: return "unknown";
    }
}

/**
 * @brief Outward-facing event delivered to notification sinks
 */
struct NotificationEvent {
    std::string id;
    EventType type = EventType::INCIDENT_CREATED;
    std::string service;
    Severity severity = Severity::INFO;
    int64_t incident_id = 0;
    std::string title;
    std::string message;
    Evidence fields;
    TimePoint timestamp{};
};

/// Stamps id and timestamp
[[nodiscard]] NotificationEvent make_event(
    EventType type, std::string service, Severity severity,
    std::string title, std::string message);

[[nodiscard]] std::string event_to_json(const NotificationEvent& event);

/// Emoji prefix used by chat sinks
[[nodiscard]] std::string_view severity_emoji(Severity severity);

/**
 * @brief Fire-and-forget notification entry point
 *
 * Implementations must not block the caller and must never throw.
 */
class INotifier {
public:
    virtual ~INotifier() = default;

    virtual void notify(NotificationEvent event) = 0;
};

} // namespace autoheal
