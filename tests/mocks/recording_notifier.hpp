#pragma once

#include "notify/inotification_sink.hpp"
#include "notify/notification_types.hpp"

#include <atomic>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace autoheal::test {

// Synchronous INotifier that keeps every event
class RecordingNotifier : public INotifier {
public:
    void notify(NotificationEvent event) override {
        std::lock_guard lock(mutex_);
        events_.push_back(std::move(event));
    }

    std::vector<NotificationEvent> events() const {
        std::lock_guard lock(mutex_);
        return events_;
    }

    size_t count(EventType type) const {
        std::lock_guard lock(mutex_);
        size_t n = 0;
        for (const auto& e : events_) {
            if (e.type == type) ++n;
        }
        return n;
    }

    void clear() {
        std::lock_guard lock(mutex_);
        events_.clear();
    }

private:
    std::vector<NotificationEvent> events_;
    mutable std::mutex mutex_;
};

// Sink for NotificationDispatcher tests
class RecordingSink : public INotificationSink {
public:
    bool deliver(const NotificationEvent& event) override {
        std::lock_guard lock(mutex_);
        if (throw_on_deliver) {
            throw std::runtime_error("sink exploded");
        }
        delivered.push_back(event);
        return succeed;
    }

    void shutdown() override { shutdown_called = true; }
    std::string name() const override { return "recording"; }

    size_t size() const {
        std::lock_guard lock(mutex_);
        return delivered.size();
    }

    bool succeed = true;
    bool throw_on_deliver = false;
    std::atomic<bool> shutdown_called{false};
    std::vector<NotificationEvent> delivered;

private:
    mutable std::mutex mutex_;
};

} // namespace autoheal::test
