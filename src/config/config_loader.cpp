#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <cstdlib>
#include <filesystem>
#include <format>
#include <stdexcept>
#include <unordered_set>

using namespace std::string_literals;

namespace autoheal {

// ============================================================================
// TOML Parsing Helpers (env expansion, includes, merging)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_in_array(toml::array& arr);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            s = expand_env_vars(s.get());
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        } else if (val.is_array()) {
            expand_env_vars_in_array(*val.as_array());
        }
    }
}

void expand_env_vars_in_array(toml::array& arr) {
    for (auto& elem : arr) {
        if (elem.is_string()) {
            auto& s = *elem.as_string();
            s = expand_env_vars(s.get());
        } else if (elem.is_table()) {
            expand_env_vars_recursive(*elem.as_table());
        } else if (elem.is_array()) {
            expand_env_vars_in_array(*elem.as_array());
        }
    }
}

/**
 * @brief Deep-merge two toml::tables. Overlay wins for scalars, arrays append.
 */
void merge_tables(toml::table& base, const toml::table& overlay) {
    for (const auto& [key, val] : overlay) {
        if (val.is_table() && base.contains(key) && base[key].is_table()) {
            merge_tables(*base[key].as_table(), *val.as_table());
        } else if (val.is_array() && base.contains(key) && base[key].is_array()) {
            auto& base_arr = *base[key].as_array();
            for (const auto& elem : *val.as_array()) {
                base_arr.push_back(elem);
            }
        } else {
            base.insert_or_assign(key, val);
        }
    }
}

void resolve_includes(toml::table& root, const std::string& base_dir,
                      std::unordered_set<std::string>& visited, const int depth) {
    if (depth > 10) {
        throw std::runtime_error("Config include depth exceeds 10, possible circular include");
    }
    auto inc_node = root["include"];
    if (!inc_node) return;

    std::vector<std::string> paths;
    if (inc_node.is_string()) {
        paths.emplace_back(inc_node.as_string()->get());
    } else if (inc_node.is_array()) {
        for (const auto& item : *inc_node.as_array()) {
            if (item.is_string()) {
                paths.emplace_back(item.as_string()->get());
            }
        }
    }
    root.erase("include");

    for (const auto& rel_path : paths) {
        namespace fs = std::filesystem;
        const std::string abs_path = fs::canonical(fs::path(base_dir) / rel_path).string();

        if (!visited.insert(abs_path).second) {
            throw std::runtime_error(
                std::format("Circular config include detected: {}", abs_path));
        }

        auto included = toml::parse_file(abs_path);
        const std::string inc_dir = fs::path(abs_path).parent_path().string();
        resolve_includes(included, inc_dir, visited, depth + 1);

        // Included file is the base, the including file wins
        merge_tables(included, root);
        root = std::move(included);
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);

    namespace fs = std::filesystem;
    const std::string base_dir = fs::path(file_path).parent_path().string();
    std::unordered_set<std::string> visited;
    visited.insert(fs::canonical(file_path).string());
    resolve_includes(result, base_dir, visited, 0);

    expand_env_vars_recursive(result);
    return result;
}

// ---- Extraction helpers ----------------------------------------------------

std::vector<std::string> toml_string_array(const toml::table& tbl, const std::string_view key) {
    std::vector<std::string> result;
    if (const auto* arr = tbl[key].as_array()) {
        result.reserve(arr->size());
        for (const auto& elem : *arr) {
            if (const auto* s = elem.as_string()) {
                result.emplace_back(s->get());
            }
        }
    }
    return result;
}

ActionType require_action_type(const std::string& value, const std::string_view key) {
    const auto parsed = parse_action_type(utils::to_lower(value));
    if (!parsed) {
        throw std::runtime_error(std::format("{}: unknown action '{}'", key, value));
    }
    return *parsed;
}

/**
 * @brief Read an integer that must not be negative before narrowing it
 *
 * A negative value would otherwise wrap to a huge unsigned count and slip
 * past validation.
 */
template <typename T>
T non_negative(const toml::table& tbl, const std::string_view key, const T fallback,
               const std::string_view section) {
    const auto v = tbl[key].value<int64_t>();
    if (!v) return fallback;
    if (*v < 0) {
        throw std::runtime_error(std::format("{}.{} must be >= 0, got {}", section, key, *v));
    }
    return static_cast<T>(*v);
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

// ---- Section extractors ----------------------------------------------------

DaemonConfig ConfigLoader::extract_daemon(const toml::table& root) {
    DaemonConfig cfg;
    const auto* sec = root["daemon"].as_table();
    if (!sec) return cfg;
    const auto& d = *sec;

    cfg.tick_interval = std::chrono::seconds(d["tick_interval_seconds"].value_or(5));
    cfg.min_action_interval = std::chrono::seconds(d["min_action_interval_seconds"].value_or(30));
    cfg.max_parallel_services = non_negative<size_t>(d, "max_parallel_services", 8, "daemon");
    cfg.incident_dedupe_window = std::chrono::seconds(
        non_negative<int64_t>(d, "incident_dedupe_window_seconds", 60, "daemon"));
    return cfg;
}

ThresholdConfig ConfigLoader::extract_thresholds(const toml::table& root) {
    ThresholdConfig cfg;
    const auto* sec = root["thresholds"].as_table();
    if (!sec) return cfg;
    const auto& t = *sec;

    cfg.error_rate              = t["error_rate"].value_or(cfg.error_rate);
    cfg.error_rate_critical     = t["error_rate_critical"].value_or(cfg.error_rate_critical);
    cfg.cpu_percent             = t["cpu_percent"].value_or(cfg.cpu_percent);
    cfg.response_time_ms        = t["response_time_ms"].value_or(cfg.response_time_ms);
    cfg.memory_mb               = t["memory_mb"].value_or(cfg.memory_mb);
    cfg.advisory_score          = t["advisory_score"].value_or(cfg.advisory_score);
    cfg.advisory_critical_score = t["advisory_critical_score"].value_or(cfg.advisory_critical_score);
    return cfg;
}

DetectorConfig ConfigLoader::extract_detectors(const toml::table& root) {
    DetectorConfig cfg;
    const auto* sec = root["detectors"].as_table();
    if (!sec) return cfg;
    const auto& d = *sec;

    cfg.health_check_enabled = d["health_check"].value_or(cfg.health_check_enabled);
    cfg.error_rate_enabled   = d["error_rate"].value_or(cfg.error_rate_enabled);
    cfg.cpu_enabled          = d["cpu"].value_or(cfg.cpu_enabled);
    cfg.latency_enabled      = d["latency"].value_or(cfg.latency_enabled);
    cfg.memory_enabled       = d["memory"].value_or(cfg.memory_enabled);
    cfg.advisory_enabled     = d["advisory"].value_or(cfg.advisory_enabled);
    cfg.cpu_sustained_ticks = non_negative<uint32_t>(d, "cpu_sustained_ticks", 3, "detectors");
    cfg.memory_sustained_ticks = non_negative<uint32_t>(d, "memory_sustained_ticks", 3, "detectors");
    cfg.history_size = non_negative<size_t>(d, "history_size", 20, "detectors");
    return cfg;
}

RemediationConfig ConfigLoader::extract_remediation(const toml::table& root) {
    RemediationConfig cfg;
    const auto* sec = root["remediation"].as_table();
    if (!sec) return cfg;
    const auto& r = *sec;

    if (const auto action = r["error_rate_action"].value<std::string>()) {
        cfg.error_rate_action = require_action_type(*action, "remediation.error_rate_action");
    }
    if (const auto action = r["advisory_action"].value<std::string>()) {
        if (utils::to_lower(*action) == "none") {
            cfg.advisory_action = std::nullopt;
        } else {
            cfg.advisory_action = require_action_type(*action, "remediation.advisory_action");
        }
    }
    cfg.provider_timeout = std::chrono::milliseconds(r["provider_timeout_ms"].value_or(20000));
    cfg.verify_after_restart = r["verify_after_restart"].value_or(true);
    return cfg;
}

RateLimitConfig ConfigLoader::extract_rate_limit(const toml::table& root) {
    RateLimitConfig cfg;
    const auto* sec = root["rate_limit"].as_table();
    if (!sec) return cfg;

    cfg.max_actions_per_window = non_negative<uint32_t>(*sec, "max_actions_per_window", 3, "rate_limit");
    cfg.window = std::chrono::seconds((*sec)["window_seconds"].value_or(300));
    return cfg;
}

CircuitBreakerConfig ConfigLoader::extract_circuit_breaker(const toml::table& root) {
    CircuitBreakerConfig cfg;
    const auto* sec = root["circuit_breaker"].as_table();
    if (!sec) return cfg;
    const auto& c = *sec;

    cfg.failure_threshold = non_negative<uint32_t>(c, "failure_threshold", 3, "circuit_breaker");
    cfg.success_threshold = non_negative<uint32_t>(c, "success_threshold", 1, "circuit_breaker");
    cfg.failure_window = std::chrono::seconds(c["failure_window_seconds"].value_or(300));
    cfg.cooldown = std::chrono::seconds(c["cooldown_seconds"].value_or(120));
    return cfg;
}

std::vector<ServiceConfig> ConfigLoader::extract_services(const toml::table& root) {
    std::vector<ServiceConfig> result;
    const auto* arr = root["services"].as_array();
    if (!arr) return result;
    result.reserve(arr->size());

    for (const auto& elem : *arr) {
        const auto* svc = elem.as_table();
        if (!svc) continue;
        const auto& s = *svc;

        ServiceConfig cfg;
        cfg.name = s["name"].value_or(""s);
        cfg.health_url = s["health_url"].value_or(""s);
        cfg.container = s["container"].value_or(""s);
        cfg.replicas = toml_string_array(s, "replicas");
        cfg.enabled = s["enabled"].value_or(true);
        if (s.contains("failure_threshold")) {
            cfg.failure_threshold = non_negative<uint32_t>(
                s, "failure_threshold", 0, std::format("services[{}]", result.size()));
        }
        if (const auto v = s["cooldown_seconds"].value<int64_t>()) {
            cfg.cooldown = std::chrono::seconds(*v);
        }
        result.push_back(std::move(cfg));
    }
    return result;
}

MetricsConfig ConfigLoader::extract_metrics(const toml::table& root) {
    MetricsConfig cfg;
    const auto* sec = root["metrics"].as_table();
    if (!sec) return cfg;
    cfg.timeout = std::chrono::milliseconds((*sec)["timeout_ms"].value_or(3000));
    return cfg;
}

DockerConfig ConfigLoader::extract_docker(const toml::table& root) {
    DockerConfig cfg;
    const auto* sec = root["docker"].as_table();
    if (!sec) return cfg;
    cfg.socket_path = (*sec)["socket_path"].value_or(cfg.socket_path);
    cfg.api_version = (*sec)["api_version"].value_or(cfg.api_version);
    cfg.stop_timeout_seconds = non_negative<int>(*sec, "stop_timeout_seconds", cfg.stop_timeout_seconds, "docker");
    return cfg;
}

NotificationConfig ConfigLoader::extract_notifications(const toml::table& root) {
    NotificationConfig cfg;
    const auto* sec = root["notifications"].as_table();
    if (!sec) return cfg;
    const auto& n = *sec;

    cfg.console_enabled = n["console"].value_or(true);
    cfg.file = n["file"].value_or(""s);
    cfg.queue_capacity = non_negative<size_t>(n, "queue_capacity", 1024, "notifications");

    if (const auto* wh = n["webhook"].as_table()) {
        cfg.webhook_enabled = (*wh)["enabled"].value_or(false);
        cfg.webhook_url = (*wh)["url"].value_or(""s);
        cfg.webhook_auth_header = (*wh)["auth_header"].value_or(""s);
        cfg.webhook_username = (*wh)["username"].value_or(cfg.webhook_username);
        cfg.webhook_icon_emoji = (*wh)["icon_emoji"].value_or(cfg.webhook_icon_emoji);
        cfg.webhook_timeout = std::chrono::milliseconds((*wh)["timeout_ms"].value_or(5000));
        cfg.webhook_max_retries = non_negative<int>(*wh, "max_retries", 3, "notifications.webhook");
    }
    return cfg;
}

PersistenceConfig ConfigLoader::extract_persistence(const toml::table& root) {
    PersistenceConfig cfg;
    const auto* sec = root["persistence"].as_table();
    if (!sec) return cfg;
    cfg.backend = utils::to_lower((*sec)["backend"].value_or("memory"s));
    cfg.connection_string = (*sec)["connection_string"].value_or(""s);
    return cfg;
}

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* sec = root["logging"].as_table();
    if (!sec) return cfg;
    cfg.level = (*sec)["level"].value_or("info"s);
    return cfg;
}

ConfigWatcherConfig ConfigLoader::extract_config_watcher(const toml::table& root) {
    ConfigWatcherConfig cfg;
    const auto* sec = root["config_watcher"].as_table();
    if (!sec) return cfg;
    cfg.enabled = (*sec)["enabled"].value_or(true);
    cfg.poll_interval_seconds = (*sec)["poll_interval_seconds"].value_or(5);
    return cfg;
}

ExporterConfig ConfigLoader::extract_exporter(const toml::table& root) {
    ExporterConfig cfg;
    const auto* sec = root["exporter"].as_table();
    if (!sec) return cfg;
    cfg.enabled = (*sec)["enabled"].value_or(false);
    cfg.bind = (*sec)["bind"].value_or("0.0.0.0"s);
    cfg.port = (*sec)["port"].value_or(8000);
    cfg.path = (*sec)["path"].value_or("/metrics"s);
    return cfg;
}

// ---- Shared extraction + validation ----------------------------------------

MonitorConfig ConfigLoader::extract_all_sections(const toml::table& tbl) {
    MonitorConfig config;
    config.daemon = extract_daemon(tbl);
    config.thresholds = extract_thresholds(tbl);
    config.detectors = extract_detectors(tbl);
    config.remediation = extract_remediation(tbl);
    config.rate_limit = extract_rate_limit(tbl);
    config.circuit_breaker = extract_circuit_breaker(tbl);
    config.services = extract_services(tbl);
    config.metrics = extract_metrics(tbl);
    config.docker = extract_docker(tbl);
    config.notifications = extract_notifications(tbl);
    config.persistence = extract_persistence(tbl);
    config.logging = extract_logging(tbl);
    config.config_watcher = extract_config_watcher(tbl);
    config.exporter = extract_exporter(tbl);
    return config;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(MonitorConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const MonitorConfig& config) {
    std::vector<std::string> errors;

    if (config.daemon.tick_interval.count() <= 0) {
        errors.push_back("daemon.tick_interval_seconds must be > 0");
    }
    if (config.daemon.max_parallel_services == 0) {
        errors.push_back("daemon.max_parallel_services must be > 0");
    }

    const auto& t = config.thresholds;
    if (t.error_rate <= 0.0 || t.error_rate > 1.0) {
        errors.push_back(std::format("thresholds.error_rate must be in (0, 1], got {}", t.error_rate));
    }
    if (t.error_rate_critical < t.error_rate) {
        errors.push_back(std::format(
            "thresholds.error_rate_critical ({}) must be >= thresholds.error_rate ({})",
            t.error_rate_critical, t.error_rate));
    }
    if (t.cpu_percent <= 0.0) {
        errors.push_back("thresholds.cpu_percent must be > 0");
    }
    if (t.response_time_ms <= 0.0) {
        errors.push_back("thresholds.response_time_ms must be > 0");
    }
    if (t.advisory_critical_score < t.advisory_score) {
        errors.push_back("thresholds.advisory_critical_score must be >= thresholds.advisory_score");
    }

    if (config.detectors.cpu_sustained_ticks == 0) {
        errors.push_back("detectors.cpu_sustained_ticks must be > 0");
    }
    if (config.detectors.history_size < config.detectors.cpu_sustained_ticks ||
        config.detectors.history_size < config.detectors.memory_sustained_ticks) {
        errors.push_back("detectors.history_size must cover the sustained tick counts");
    }

    if (config.remediation.provider_timeout.count() <= 0) {
        errors.push_back("remediation.provider_timeout_ms must be > 0");
    }
    // Docker waits stop_timeout before killing; the call has to finish inside the budget
    if (std::chrono::seconds(config.docker.stop_timeout_seconds) >= config.remediation.provider_timeout) {
        errors.push_back(std::format(
            "docker.stop_timeout_seconds ({}) must be below remediation.provider_timeout_ms ({})",
            config.docker.stop_timeout_seconds, config.remediation.provider_timeout.count()));
    }

    if (config.rate_limit.max_actions_per_window == 0) {
        errors.push_back("rate_limit.max_actions_per_window must be > 0");
    }
    if (config.rate_limit.window.count() <= 0) {
        errors.push_back("rate_limit.window_seconds must be > 0");
    }

    if (config.circuit_breaker.failure_threshold == 0) {
        errors.push_back("circuit_breaker.failure_threshold must be > 0");
    }
    if (config.circuit_breaker.success_threshold == 0) {
        errors.push_back("circuit_breaker.success_threshold must be > 0");
    }
    if (config.circuit_breaker.cooldown.count() <= 0) {
        errors.push_back("circuit_breaker.cooldown_seconds must be > 0");
    }

    std::unordered_set<std::string> names;
    for (size_t i = 0; i < config.services.size(); ++i) {
        const auto& svc = config.services[i];
        if (svc.name.empty()) {
            errors.push_back(std::format("services[{}].name must not be empty", i));
        } else if (!names.insert(svc.name).second) {
            errors.push_back(std::format("services[{}].name '{}' is duplicated", i, svc.name));
        }
        if (svc.health_url.empty()) {
            errors.push_back(std::format("services[{}].health_url must not be empty", i));
        }
        if (svc.failure_threshold && *svc.failure_threshold == 0) {
            errors.push_back(std::format("services[{}].failure_threshold must be > 0", i));
        }
        if (svc.cooldown && svc.cooldown->count() <= 0) {
            errors.push_back(std::format("services[{}].cooldown_seconds must be > 0", i));
        }
    }

    if (config.persistence.backend != "memory" && config.persistence.backend != "postgresql") {
        errors.push_back(std::format("persistence.backend must be memory or postgresql, got '{}'",
                                     config.persistence.backend));
    }
    if (config.persistence.backend == "postgresql" && config.persistence.connection_string.empty()) {
        errors.push_back("persistence.connection_string required for postgresql backend");
    }

    if (config.notifications.webhook_max_retries < 0) {
        errors.push_back("notifications.webhook.max_retries must be >= 0");
    }
    if (config.notifications.webhook_enabled && config.notifications.webhook_url.empty()) {
        errors.push_back("notifications.webhook.url required when webhook is enabled");
    }

    if (config.exporter.port < 0 || config.exporter.port > 65535) {
        errors.push_back(std::format("exporter.port must be in [0, 65535], got {}",
                                     config.exporter.port));
    }
    if (config.exporter.path.empty() || config.exporter.path.front() != '/') {
        errors.push_back(std::format("exporter.path must start with '/', got '{}'",
                                     config.exporter.path));
    }

    return errors;
}

} // namespace autoheal
