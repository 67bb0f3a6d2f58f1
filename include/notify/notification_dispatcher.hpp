#pragma once

#include "config/config_types.hpp"
#include "notify/inotification_sink.hpp"
#include "notify/notification_types.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace autoheal {

/**
 * @brief Asynchronous fan-out of notification events to sinks
 *
 * notify() only enqueues, so the orchestration loop never waits on a slow
 * webhook. A single delivery thread drains the queue and hands each event
 * to every sink; sink failures are counted and logged. When the queue is
 * full the newest event is dropped and counted.
 */
class NotificationDispatcher : public INotifier {
public:
    explicit NotificationDispatcher(size_t queue_capacity = 1024);
    ~NotificationDispatcher() override;

    NotificationDispatcher(const NotificationDispatcher&) = delete;
    NotificationDispatcher& operator=(const NotificationDispatcher&) = delete;

    /// Build console/file/webhook sinks from config
    [[nodiscard]] static std::unique_ptr<NotificationDispatcher> from_config(
        const NotificationConfig& config);

    /// Must be called before start()
    void add_sink(std::unique_ptr<INotificationSink> sink);

    void start();

    /// Drain remaining events, shut sinks down, join the delivery thread
    void shutdown();

    void notify(NotificationEvent event) override;

    /// Block until every event queued so far has been delivered
    void flush();

    struct Stats {
        uint64_t total_enqueued = 0;
        uint64_t total_delivered = 0;
        uint64_t dropped = 0;
        uint64_t sink_failures = 0;
        size_t active_sinks = 0;
    };

    [[nodiscard]] Stats get_stats() const;

private:
    void delivery_loop();
    void deliver_to_sinks(const NotificationEvent& event);

    size_t queue_capacity_;
    std::vector<std::unique_ptr<INotificationSink>> sinks_;

    std::deque<NotificationEvent> queue_;
    mutable std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::condition_variable idle_cv_;
    bool delivering_ = false;

    std::thread delivery_thread_;
    std::atomic<bool> running_{false};

    std::atomic<uint64_t> total_enqueued_{0};
    std::atomic<uint64_t> total_delivered_{0};
    std::atomic<uint64_t> dropped_{0};
    std::atomic<uint64_t> sink_failures_{0};
};

} // namespace autoheal
