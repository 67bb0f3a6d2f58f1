#pragma once

#include "core/types.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace autoheal {

// ============================================================================
// Configuration Types
// ============================================================================

struct DaemonConfig {
    std::chrono::seconds tick_interval{5};
    std::chrono::seconds min_action_interval{30};   // "very recent attempt" guard
    size_t max_parallel_services = 8;
    std::chrono::seconds incident_dedupe_window{60};  // no reopen after a close; 0 disables
};

struct ThresholdConfig {
    double error_rate = 0.20;
    double error_rate_critical = 0.60;
    double cpu_percent = 80.0;
    double response_time_ms = 500.0;
    double memory_mb = 1024.0;
    double advisory_score = 0.70;
    double advisory_critical_score = 0.90;
};

struct DetectorConfig {
    bool health_check_enabled = true;
    bool error_rate_enabled = true;
    bool cpu_enabled = true;
    bool latency_enabled = true;
    bool memory_enabled = true;
    bool advisory_enabled = true;
    uint32_t cpu_sustained_ticks = 3;
    uint32_t memory_sustained_ticks = 3;
    size_t history_size = 20;
};

struct RemediationConfig {
    ActionType error_rate_action = ActionType::RESTART_CONTAINER;
    std::optional<ActionType> advisory_action = ActionType::SCALE_UP;  // nullopt: observe only
    std::chrono::milliseconds provider_timeout{20000};
    bool verify_after_restart = true;
};

struct RateLimitConfig {
    uint32_t max_actions_per_window = 3;
    std::chrono::seconds window{300};
};

struct CircuitBreakerConfig {
    uint32_t failure_threshold = 3;
    uint32_t success_threshold = 1;
    std::chrono::seconds failure_window{300};
    std::chrono::seconds cooldown{120};
};

struct ServiceConfig {
    std::string name;
    std::string health_url;
    std::string container;                 // Defaults to name
    std::vector<std::string> replicas;
    bool enabled = true;

    // Per-service breaker overrides
    std::optional<uint32_t> failure_threshold;
    std::optional<std::chrono::seconds> cooldown;

    [[nodiscard]] const std::string& target() const {
        return container.empty() ? name : container;
    }
};

struct MetricsConfig {
    std::chrono::milliseconds timeout{3000};
};

struct DockerConfig {
    std::string socket_path = "/var/run/docker.sock";
    std::string api_version = "v1.43";
    int stop_timeout_seconds = 10;
};

struct NotificationConfig {
    bool console_enabled = true;
    std::string file;                      // JSONL event log, empty = disabled

    bool webhook_enabled = false;
    std::string webhook_url;
    std::string webhook_auth_header;
    std::string webhook_username = "AutoHeal Bot";
    std::string webhook_icon_emoji = ":robot_face:";
    std::chrono::milliseconds webhook_timeout{5000};
    int webhook_max_retries = 3;

    size_t queue_capacity = 1024;
};

struct PersistenceConfig {
    std::string backend = "memory";        // memory | postgresql
    std::string connection_string;
};

struct LoggingConfig {
    std::string level = "info";
};

struct ConfigWatcherConfig {
    bool enabled = true;
    int poll_interval_seconds = 5;
};

struct ExporterConfig {
    bool enabled = false;
    std::string bind = "0.0.0.0";
    int port = 8000;                       // 0 picks a free port
    std::string path = "/metrics";
};

// ============================================================================
// MonitorConfig - Complete parsed configuration
// ============================================================================

struct MonitorConfig {
    DaemonConfig daemon;
    ThresholdConfig thresholds;
    DetectorConfig detectors;
    RemediationConfig remediation;
    RateLimitConfig rate_limit;
    CircuitBreakerConfig circuit_breaker;
    std::vector<ServiceConfig> services;
    MetricsConfig metrics;
    DockerConfig docker;
    NotificationConfig notifications;
    PersistenceConfig persistence;
    LoggingConfig logging;
    ConfigWatcherConfig config_watcher;
    ExporterConfig exporter;

    [[nodiscard]] const ServiceConfig* find_service(const std::string& name) const {
        for (const auto& svc : services) {
            if (svc.name == name) return &svc;
        }
        return nullptr;
    }
};

} // namespace autoheal
