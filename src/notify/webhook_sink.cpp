#include "notify/webhook_sink.hpp"
#include "core/utils.hpp"

#include <httplib.h>

#include <algorithm>
#include <format>

namespace autoheal {

WebhookSink::WebhookSink(const Config& config)
    : config_(config),
      target_(http::parse_url(config.url)) {}

std::string WebhookSink::name() const {
    return "webhook:" + config_.url;
}

std::string WebhookSink::build_payload(const NotificationEvent& event) const {
    std::string text = std::format("{} *{}* - {}: {}",
        severity_emoji(event.severity), severity_to_string(event.severity),
        event.title, event.message);
    if (!event.service.empty()) {
        text += std::format(" (service `{}`)", event.service);
    }

    return std::format("{{\"text\":\"{}\",\"username\":\"{}\",\"icon_emoji\":\"{}\"}}",
        utils::escape_json(text),
        utils::escape_json(config_.username),
        utils::escape_json(config_.icon_emoji));
}

bool WebhookSink::deliver(const NotificationEvent& event) {
    const std::string payload = build_payload(event);
    std::string last_error;

    const int attempts = 1 + std::max(config_.max_retries, 0);
    for (int attempt = 0; attempt < attempts; ++attempt) {
        try {
            httplib::Client client(target_.scheme_host());
            client.set_connection_timeout(config_.timeout);
            client.set_read_timeout(config_.timeout);

            httplib::Headers headers;
            if (!config_.auth_header.empty()) {
                headers.emplace(http::kAuthorizationHeader, config_.auth_header);
            }

            auto res = client.Post(target_.path, headers, payload, http::kJsonContentType);
            if (res && res->status >= 200 && res->status < 300) {
                ++messages_sent_;
                return true;
            }
            last_error = res ? std::format("HTTP {}", res->status)
                             : httplib::to_string(res.error());
        } catch (const std::exception& e) {
            last_error = e.what();
        }
    }

    ++send_failures_;
    utils::log::warn(std::format("Webhook notification failed after {} attempts ({}): {}",
                                 attempts, config_.url, last_error));
    return false;
}

} // namespace autoheal
