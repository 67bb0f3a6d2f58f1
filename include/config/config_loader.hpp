#pragma once

#include "config/config_types.hpp"

#include <toml++/toml.hpp>

#include <optional>
#include <string>
#include <vector>

namespace autoheal {

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

class ConfigLoader {
public:
    struct LoadResult {
        bool success = false;
        std::string error_message;
        MonitorConfig config;

        static LoadResult ok(MonitorConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load complete config from TOML file
     *
     * Resolves `include = [...]` relative to the file, then expands
     * ${ENV_VAR} references in every string value.
     *
     * @param config_path Path to autoheal.toml
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load complete config from TOML string (includes not supported)
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Validate a parsed config, collecting every problem
     * @return Empty vector when the config is usable
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const MonitorConfig& config);

private:
    static MonitorConfig extract_all_sections(const toml::table& root);
    static LoadResult validate_and_return(MonitorConfig config);

    static DaemonConfig extract_daemon(const toml::table& root);
    static ThresholdConfig extract_thresholds(const toml::table& root);
    static DetectorConfig extract_detectors(const toml::table& root);
    static RemediationConfig extract_remediation(const toml::table& root);
    static RateLimitConfig extract_rate_limit(const toml::table& root);
    static CircuitBreakerConfig extract_circuit_breaker(const toml::table& root);
    static std::vector<ServiceConfig> extract_services(const toml::table& root);
    static MetricsConfig extract_metrics(const toml::table& root);
    static DockerConfig extract_docker(const toml::table& root);
    static NotificationConfig extract_notifications(const toml::table& root);
    static PersistenceConfig extract_persistence(const toml::table& root);
    static LoggingConfig extract_logging(const toml::table& root);
    static ConfigWatcherConfig extract_config_watcher(const toml::table& root);
    static ExporterConfig extract_exporter(const toml::table& root);
};

} // namespace autoheal
