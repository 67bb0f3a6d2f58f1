#include "notify/console_sink.hpp"
#include "core/utils.hpp"

#include <format>

namespace autoheal {

bool ConsoleSink::deliver(const NotificationEvent& event) {
    std::string line = std::format("[{}] {}: {}", event_type_to_string(event.type),
                                   event.title, event.message);
    for (const auto& [key, value] : event.fields) {
        line += std::format(" {}={}", key, value);
    }

    switch (event.severity) {
        case Severity::CRITICAL: utils::log::error(line); break;
        case Severity::WARNING:  utils::log::warn(line); break;
        default:                 utils::log::info(line); break;
    }
    return true;
}

} // namespace autoheal
