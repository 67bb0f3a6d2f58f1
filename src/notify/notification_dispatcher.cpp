#include "notify/notification_dispatcher.hpp"
#include "notify/console_sink.hpp"
#include "notify/file_sink.hpp"
#include "notify/webhook_sink.hpp"
#include "core/utils.hpp"

#include <format>

namespace autoheal {

// ============================================================================
// Construction / Destruction
// ============================================================================

NotificationDispatcher::NotificationDispatcher(size_t queue_capacity)
    : queue_capacity_(queue_capacity == 0 ? 1 : queue_capacity) {}

NotificationDispatcher::~NotificationDispatcher() {
    shutdown();
}

std::unique_ptr<NotificationDispatcher> NotificationDispatcher::from_config(
    const NotificationConfig& config) {
    auto dispatcher = std::make_unique<NotificationDispatcher>(config.queue_capacity);

    if (config.console_enabled) {
        dispatcher->add_sink(std::make_unique<ConsoleSink>());
    }

    if (!config.file.empty()) {
        try {
            dispatcher->add_sink(std::make_unique<FileSink>(config.file));
        } catch (const std::exception& e) {
            utils::log::error(std::format("Notification file sink disabled: {}", e.what()));
        }
    }

    if (config.webhook_enabled && !config.webhook_url.empty()) {
        WebhookSink::Config wh_cfg;
        wh_cfg.url = config.webhook_url;
        wh_cfg.auth_header = config.webhook_auth_header;
        wh_cfg.username = config.webhook_username;
        wh_cfg.icon_emoji = config.webhook_icon_emoji;
        wh_cfg.timeout = config.webhook_timeout;
        wh_cfg.max_retries = config.webhook_max_retries;
        dispatcher->add_sink(std::make_unique<WebhookSink>(wh_cfg));
    }

    return dispatcher;
}

void NotificationDispatcher::add_sink(std::unique_ptr<INotificationSink> sink) {
    sinks_.push_back(std::move(sink));
}

void NotificationDispatcher::start() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
        return;
    }
    delivery_thread_ = std::thread(&NotificationDispatcher::delivery_loop, this);
}

void NotificationDispatcher::shutdown() {
    bool expected = true;
    if (!running_.compare_exchange_strong(expected, false, std::memory_order_acq_rel)) {
        return;
    }

    queue_cv_.notify_all();
    if (delivery_thread_.joinable()) {
        delivery_thread_.join();
    }

    for (auto& sink : sinks_) {
        try {
            sink->shutdown();
        } catch (const std::exception& e) {
            utils::log::warn(std::format("Sink {} shutdown failed: {}", sink->name(), e.what()));
        }
    }
}

// ============================================================================
// Public Interface
// ============================================================================

void NotificationDispatcher::notify(NotificationEvent event) {
    {
        std::lock_guard lock(queue_mutex_);
        if (queue_.size() >= queue_capacity_) {
            dropped_.fetch_add(1, std::memory_order_relaxed);
            utils::log::warn(std::format("Notification queue full, dropping {} for {}",
                                         event_type_to_string(event.type), event.service));
            return;
        }
        queue_.push_back(std::move(event));
    }
    total_enqueued_.fetch_add(1, std::memory_order_relaxed);
    queue_cv_.notify_one();
}

void NotificationDispatcher::flush() {
    std::unique_lock lock(queue_mutex_);
    if (!running_.load(std::memory_order_acquire)) {
        return;
    }
    idle_cv_.wait(lock, [this] {
        return (queue_.empty() && !delivering_) ||
               !running_.load(std::memory_order_acquire);
    });
}

NotificationDispatcher::Stats NotificationDispatcher::get_stats() const {
    return Stats{
        .total_enqueued = total_enqueued_.load(std::memory_order_relaxed),
        .total_delivered = total_delivered_.load(std::memory_order_relaxed),
        .dropped = dropped_.load(std::memory_order_relaxed),
        .sink_failures = sink_failures_.load(std::memory_order_relaxed),
        .active_sinks = sinks_.size()
    };
}

// ============================================================================
// Background Delivery Thread
// ============================================================================

void NotificationDispatcher::deliver_to_sinks(const NotificationEvent& event) {
    for (auto& sink : sinks_) {
        try {
            if (!sink->deliver(event)) {
                sink_failures_.fetch_add(1, std::memory_order_relaxed);
            }
        } catch (const std::exception& e) {
            sink_failures_.fetch_add(1, std::memory_order_relaxed);
            utils::log::error(std::format("Notification sink {} threw: {}", sink->name(), e.what()));
        }
    }
    total_delivered_.fetch_add(1, std::memory_order_relaxed);
}

void NotificationDispatcher::delivery_loop() {
    for (;;) {
        NotificationEvent event;
        {
            std::unique_lock lock(queue_mutex_);
            queue_cv_.wait(lock, [this] {
                return !queue_.empty() || !running_.load(std::memory_order_acquire);
            });

            if (queue_.empty()) {
                // Stopped and drained
                delivering_ = false;
                idle_cv_.notify_all();
                return;
            }

            event = std::move(queue_.front());
            queue_.pop_front();
            delivering_ = true;
        }

        deliver_to_sinks(event);

        {
            std::lock_guard lock(queue_mutex_);
            delivering_ = false;
            if (queue_.empty()) {
                idle_cv_.notify_all();
            }
        }
    }
}

} // namespace autoheal
