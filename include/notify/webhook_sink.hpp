#pragma once

#include "core/http_constants.hpp"
#include "notify/inotification_sink.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace autoheal {

/**
 * @brief Slack-compatible incoming-webhook sink
 *
 * POSTs {"text", "username", "icon_emoji"} per event through cpp-httplib:
 * one attempt, then up to max_retries retries. Failures are counted and logged, never
 * thrown.
 */
class WebhookSink : public INotificationSink {
public:
    struct Config {
        std::string url;
        std::string auth_header;
        std::string username = "AutoHeal Bot";
        std::string icon_emoji = ":robot_face:";
        std::chrono::milliseconds timeout{5000};
        int max_retries = 3;            // retries after the first attempt
    };

    explicit WebhookSink(const Config& config);

    [[nodiscard]] bool deliver(const NotificationEvent& event) override;
    void shutdown() override {}
    [[nodiscard]] std::string name() const override;

    /// Chat payload for one event
    [[nodiscard]] std::string build_payload(const NotificationEvent& event) const;

    [[nodiscard]] uint64_t send_failures() const { return send_failures_; }
    [[nodiscard]] uint64_t messages_sent() const { return messages_sent_; }

private:
    Config config_;
    http::ParsedUrl target_;
    uint64_t send_failures_ = 0;
    uint64_t messages_sent_ = 0;
};

} // namespace autoheal
