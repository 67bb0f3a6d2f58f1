#pragma once

#include <chrono>
#include <string>

namespace autoheal {

/**
 * @brief Result of one lifecycle provider call
 */
struct ProviderResult {
    bool success = false;
    std::string error;

    static ProviderResult ok() { return {true, {}}; }
    static ProviderResult failure(std::string msg) { return {false, std::move(msg)}; }
};

/**
 * @brief Container/process lifecycle backend
 *
 * Calls are idempotent and may block. Each call receives the time left in
 * the executor's budget and must give up within it, so nothing keeps acting
 * on the target after the executor has recorded a timeout. Implementations
 * report failures through ProviderResult and may throw, in which case the
 * executor records the exception message.
 */
class ILifecycleProvider {
public:
    using Budget = std::chrono::milliseconds;

    virtual ~ILifecycleProvider() = default;

    [[nodiscard]] virtual ProviderResult restart(const std::string& target, Budget budget) = 0;

    /// delta > 0 starts replicas, delta < 0 stops them
    [[nodiscard]] virtual ProviderResult scale(const std::string& target, int delta, Budget budget) = 0;

    /// success when the target is running and not reported unhealthy
    [[nodiscard]] virtual ProviderResult health(const std::string& target, Budget budget) = 0;

    [[nodiscard]] virtual std::string name() const = 0;
};

} // namespace autoheal
