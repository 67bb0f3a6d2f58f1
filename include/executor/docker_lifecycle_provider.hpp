#pragma once

#include "config/config_types.hpp"
#include "executor/ilifecycle_provider.hpp"

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace autoheal {

/**
 * @brief Docker Engine API over the local unix socket (cpp-httplib)
 *
 * Every request's read timeout is the caller's remaining budget.
 *
 * restart -> POST /containers/{id}/restart
 * scale   -> POST /containers/{replica}/start | /stop on the service's
 *            replica group (first stopped / last running replica)
 * health  -> GET  /containers/{id}/json, State.Running and State.Health
 */
class DockerLifecycleProvider : public ILifecycleProvider {
public:
    DockerLifecycleProvider(const DockerConfig& config, const std::vector<ServiceConfig>& services);

    [[nodiscard]] ProviderResult restart(const std::string& target, Budget budget) override;
    [[nodiscard]] ProviderResult scale(const std::string& target, int delta, Budget budget) override;
    [[nodiscard]] ProviderResult health(const std::string& target, Budget budget) override;
    [[nodiscard]] std::string name() const override { return "docker"; }

    /// Refresh replica groups after a config reload
    void update_services(const std::vector<ServiceConfig>& services);

    struct ContainerState {
        bool running = false;
        std::string status;         // created | running | exited | ...
        std::string health;         // empty when the image has no healthcheck
    };

    /// Parse a /containers/{id}/json document
    [[nodiscard]] static std::optional<ContainerState> parse_inspect(const std::string& body);

private:
    [[nodiscard]] ProviderResult post(const std::string& container, const std::string& verb,
                                      Budget budget, const std::string& query = {});
    [[nodiscard]] std::optional<ContainerState> inspect(const std::string& container, Budget budget,
                                                        std::string& error);
    [[nodiscard]] std::string api_path(const std::string& container, const std::string& verb) const;
    [[nodiscard]] std::vector<std::string> replicas_of(const std::string& target) const;

    DockerConfig config_;
    std::map<std::string, std::vector<std::string>> replica_groups_;   // target -> replicas
    mutable std::mutex groups_mutex_;
};

} // namespace autoheal
