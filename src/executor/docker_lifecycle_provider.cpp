#include "executor/docker_lifecycle_provider.hpp"
#include "core/http_constants.hpp"
#include "core/json.hpp"
#include "core/utils.hpp"

#include <httplib.h>

#include <algorithm>
#include <chrono>
#include <format>

namespace autoheal {

namespace {

using Clock = std::chrono::steady_clock;

httplib::Client make_client(const DockerConfig& config, std::chrono::milliseconds budget) {
    httplib::Client client(config.socket_path);
    client.set_address_family(AF_UNIX);
    client.set_connection_timeout(std::min<std::chrono::milliseconds>(budget, std::chrono::seconds(2)));
    // restart/stop block for up to stop_timeout while the container drains;
    // validation keeps that below the budget
    client.set_read_timeout(budget);
    return client;
}

std::chrono::milliseconds remaining(Clock::time_point deadline) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
}

std::string docker_error(const httplib::Result& res) {
    if (!res) {
        return std::format("docker API unreachable: {}", httplib::to_string(res.error()));
    }
    try {
        const auto doc = JsonValue::parse(res->body);
        const std::string message = doc.value("message", std::string{});
        if (!message.empty()) {
            return std::format("docker API HTTP {}: {}", res->status, message);
        }
    } catch (const JsonValue::parse_error&) {
        // Non-JSON error body, fall through to the status code
    }
    return std::format("docker API HTTP {}", res->status);
}

} // anonymous namespace

DockerLifecycleProvider::DockerLifecycleProvider(const DockerConfig& config,
                                                 const std::vector<ServiceConfig>& services)
    : config_(config) {
    update_services(services);
}

void DockerLifecycleProvider::update_services(const std::vector<ServiceConfig>& services) {
    std::lock_guard lock(groups_mutex_);
    replica_groups_.clear();
    for (const auto& svc : services) {
        replica_groups_[svc.target()] = svc.replicas;
    }
}

std::vector<std::string> DockerLifecycleProvider::replicas_of(const std::string& target) const {
    std::lock_guard lock(groups_mutex_);
    const auto it = replica_groups_.find(target);
    return it == replica_groups_.end() ? std::vector<std::string>{} : it->second;
}

std::string DockerLifecycleProvider::api_path(const std::string& container, const std::string& verb) const {
    std::string path = std::format("/{}/containers/{}", config_.api_version, container);
    if (!verb.empty()) {
        path += '/';
        path += verb;
    }
    return path;
}

// ============================================================================
// Engine calls
// ============================================================================

ProviderResult DockerLifecycleProvider::post(const std::string& container, const std::string& verb,
                                             Budget budget, const std::string& query) {
    if (budget.count() <= 0) {
        return ProviderResult::failure(std::format("{} {}: time budget exhausted", verb, container));
    }
    auto client = make_client(config_, budget);
    std::string path = api_path(container, verb);
    if (!query.empty()) {
        path += '?';
        path += query;
    }

    auto res = client.Post(path, std::string{}, http::kJsonContentType);
    // 204 No Content on success, 304 when already in the requested state
    if (res && (res->status == 204 || res->status == 304 || res->status == 200)) {
        return ProviderResult::ok();
    }
    return ProviderResult::failure(std::format("{} {}: {}", verb, container, docker_error(res)));
}

std::optional<DockerLifecycleProvider::ContainerState> DockerLifecycleProvider::parse_inspect(
    const std::string& body) {
    try {
        const auto doc = JsonValue::parse(body);
        const auto state = doc["State"];
        if (!state.is_object()) {
            return std::nullopt;
        }
        ContainerState out;
        out.running = state.value("Running", false);
        out.status = state.value("Status", std::string{});
        const auto health = state["Health"];
        if (health.is_object()) {
            out.health = health.value("Status", std::string{});
        }
        return out;
    } catch (const JsonValue::parse_error& e) {
        utils::log::warn(std::format("Malformed docker inspect response: {}", e.what()));
        return std::nullopt;
    }
}

std::optional<DockerLifecycleProvider::ContainerState> DockerLifecycleProvider::inspect(
    const std::string& container, Budget budget, std::string& error) {
    if (budget.count() <= 0) {
        error = std::format("inspect {}: time budget exhausted", container);
        return std::nullopt;
    }
    auto client = make_client(config_, budget);
    auto res = client.Get(api_path(container, "json"));
    if (!res || res->status != 200) {
        error = res && res->status == 404
            ? std::format("container '{}' not found", container)
            : docker_error(res);
        return std::nullopt;
    }
    auto state = parse_inspect(res->body);
    if (!state) {
        error = std::format("container '{}': unreadable inspect response", container);
    }
    return state;
}

// ============================================================================
// ILifecycleProvider
// ============================================================================

ProviderResult DockerLifecycleProvider::restart(const std::string& target, Budget budget) {
    utils::log::info(std::format("Docker: restarting {}", target));
    return post(target, "restart", budget, std::format("t={}", config_.stop_timeout_seconds));
}

ProviderResult DockerLifecycleProvider::scale(const std::string& target, int delta, Budget budget) {
    const auto deadline = Clock::now() + budget;
    const auto replicas = replicas_of(target);
    if (replicas.empty()) {
        return ProviderResult::failure(std::format("no replicas configured for '{}'", target));
    }
    if (delta == 0) {
        return ProviderResult::ok();
    }

    int remaining = delta > 0 ? delta : -delta;
    std::string error;

    auto visit = [&](const std::string& replica) -> bool {
        auto state = inspect(replica, remaining(deadline), error);
        if (!state) {
            utils::log::warn(std::format("Docker: skipping replica {}: {}", replica, error));
            return false;
        }
        if (delta > 0 && !state->running) {
            utils::log::info(std::format("Docker: starting replica {}", replica));
            auto res = post(replica, "start", remaining(deadline));
            if (!res.success) { error = res.error; return false; }
            return true;
        }
        if (delta < 0 && state->running) {
            utils::log::info(std::format("Docker: stopping replica {}", replica));
            auto res = post(replica, "stop", remaining(deadline),
                            std::format("t={}", config_.stop_timeout_seconds));
            if (!res.success) { error = res.error; return false; }
            return true;
        }
        return false;
    };

    if (delta > 0) {
        for (auto it = replicas.begin(); it != replicas.end() && remaining > 0; ++it) {
            if (visit(*it)) --remaining;
        }
    } else {
        for (auto it = replicas.rbegin(); it != replicas.rend() && remaining > 0; ++it) {
            if (visit(*it)) --remaining;
        }
    }

    if (remaining > 0) {
        if (error.empty()) {
            error = delta > 0
                ? std::format("no stopped replica available for '{}'", target)
                : std::format("no running replica to stop for '{}'", target);
        }
        return ProviderResult::failure(std::move(error));
    }
    return ProviderResult::ok();
}

ProviderResult DockerLifecycleProvider::health(const std::string& target, Budget budget) {
    std::string error;
    auto state = inspect(target, budget, error);
    if (!state) {
        return ProviderResult::failure(std::move(error));
    }
    if (!state->running) {
        return ProviderResult::failure(std::format(
            "container '{}' not running (status: {})", target, state->status));
    }
    if (state->health == "unhealthy") {
        return ProviderResult::failure(std::format("container '{}' reports unhealthy", target));
    }
    return ProviderResult::ok();
}

} // namespace autoheal
