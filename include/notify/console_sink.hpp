#pragma once

#include "notify/inotification_sink.hpp"

namespace autoheal {

/**
 * @brief Writes events to the daemon log, level chosen by severity
 */
class ConsoleSink : public INotificationSink {
public:
    [[nodiscard]] bool deliver(const NotificationEvent& event) override;
    void shutdown() override {}
    [[nodiscard]] std::string name() const override { return "console"; }
};

} // namespace autoheal
