#include "notify/notification_types.hpp"
#include "core/json.hpp"
#include "core/utils.hpp"

#include <format>

namespace autoheal {

NotificationEvent make_event(
    EventType type, std::string service, Severity severity,
    std::string title, std::string message) {
    NotificationEvent event;
    event.id = utils::generate_uuid();
    event.type = type;
    event.service = std::move(service);
    event.severity = severity;
    event.title = std::move(title);
    event.message = std::move(message);
    event.timestamp = utils::now();
    return event;
}

std::string event_to_json(const NotificationEvent& event) {
    return std::format(
        "{{\"id\":\"{}\",\"type\":\"{}\",\"service\":\"{}\",\"severity\":\"{}\","
        "\"incident_id\":{},\"title\":\"{}\",\"message\":\"{}\",\"fields\":{},"
        "\"timestamp\":\"{}\"}}",
        event.id,
        event_type_to_string(event.type),
        utils::escape_json(event.service),
        severity_to_string(event.severity),
        event.incident_id,
        utils::escape_json(event.title),
        utils::escape_json(event.message),
        evidence_to_json(event.fields),
        utils::format_timestamp(event.timestamp));
}

std::string_view severity_emoji(Severity severity) {
    switch (severity) {
        case Severity::CRITICAL: return ":red_circle:";
        case Severity::WARNING:  return ":warning:";
        case Severity::INFO:     return ":information_source:";
        default: return ":grey_question:";
    }
}

} // namespace autoheal
