#pragma once

#include "executor/ilifecycle_provider.hpp"

#include <atomic>
#include <chrono>
#include <deque>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace autoheal::test {

// Scripted lifecycle provider: queued results first, then the default
class MockLifecycleProvider : public ILifecycleProvider {
public:
    ProviderResult restart(const std::string& target, Budget budget) override {
        return next("restart", target, budget);
    }

    ProviderResult scale(const std::string& target, int delta, Budget budget) override {
        return next(delta > 0 ? "scale_up" : "scale_down", target, budget);
    }

    ProviderResult health(const std::string& target, Budget budget) override {
        std::lock_guard lock(mutex_);
        calls.push_back("health:" + target);
        budgets.push_back(budget);
        return health_result;
    }

    std::string name() const override { return "mock"; }

    void queue(ProviderResult result) {
        std::lock_guard lock(mutex_);
        scripted_.push_back(std::move(result));
    }

    size_t call_count(const std::string& op) const {
        std::lock_guard lock(mutex_);
        size_t n = 0;
        for (const auto& c : calls) {
            if (c.rfind(op + ":", 0) == 0) ++n;
        }
        return n;
    }

    // Test configuration
    ProviderResult default_result = ProviderResult::ok();
    ProviderResult health_result = ProviderResult::ok();
    std::chrono::milliseconds delay{0};
    bool throw_on_call = false;
    std::vector<std::string> calls;
    std::vector<Budget> budgets;        // budget handed to each call, in call order

private:
    ProviderResult next(const std::string& op, const std::string& target, Budget budget) {
        ProviderResult result;
        {
            std::lock_guard lock(mutex_);
            calls.push_back(op + ":" + target);
            budgets.push_back(budget);
            if (scripted_.empty()) {
                result = default_result;
            } else {
                result = scripted_.front();
                scripted_.pop_front();
            }
        }
        if (delay.count() > 0) {
            std::this_thread::sleep_for(delay);
        }
        if (throw_on_call) {
            throw std::runtime_error("docker daemon went away");
        }
        return result;
    }

    std::deque<ProviderResult> scripted_;
    mutable std::mutex mutex_;
};

} // namespace autoheal::test
