#include <catch2/catch_test_macros.hpp>
#include "config/config_loader.hpp"
#include "config/config_store.hpp"
#include "config/config_watcher.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <thread>

using namespace autoheal;

// ============================================================================
// Helper: Write a TOML string to a temp file
// ============================================================================

static std::string write_temp_toml(const std::string& content, const std::string& suffix = "") {
    auto path = std::filesystem::temp_directory_path() /
                ("autoheal_config" + suffix + "_" +
                 std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()) +
                 ".toml");
    std::ofstream f(path);
    f << content;
    f.close();
    return path.string();
}

static void rewrite(const std::string& path, const std::string& content) {
    std::ofstream f(path, std::ios::trunc);
    f << content;
    f.close();
    // Make the mtime change visible on coarse-grained filesystems
    std::filesystem::last_write_time(path,
        std::filesystem::last_write_time(path) + std::chrono::seconds(2));
}

static const std::string kConfigV1 = R"(
[circuit_breaker]
failure_threshold = 3

[[services]]
name = "api"
health_url = "http://api/health"
)";

static const std::string kConfigV2 = R"(
[circuit_breaker]
failure_threshold = 5

[[services]]
name = "api"
health_url = "http://api/health"

[[services]]
name = "worker"
health_url = "http://worker/health"
)";

// ============================================================================
// ConfigStore
// ============================================================================

TEST_CASE("ConfigStore: publish swaps the snapshot", "[config][reload]") {
    auto loaded = ConfigLoader::load_from_string(kConfigV1);
    REQUIRE(loaded.success);
    ConfigStore store(loaded.config);

    auto before = store.get_config();
    REQUIRE(store.version() == 1);

    auto next = ConfigLoader::load_from_string(kConfigV2);
    REQUIRE(next.success);
    store.publish(next.config);

    // Holders of the old snapshot are unaffected
    REQUIRE(before->services.size() == 1);
    REQUIRE(store.get_config()->services.size() == 2);
    REQUIRE(store.version() == 2);
}

// ============================================================================
// ConfigWatcher
// ============================================================================

TEST_CASE("ConfigWatcher: unchanged file does not reload", "[config][reload]") {
    auto path = write_temp_toml(kConfigV1, "_unchanged");
    ConfigWatcher watcher(path);
    int calls = 0;
    watcher.set_callback([&](const MonitorConfig&) { ++calls; });

    REQUIRE_FALSE(watcher.check_now());
    REQUIRE(calls == 0);
    std::filesystem::remove(path);
}

TEST_CASE("ConfigWatcher: valid edit is delivered", "[config][reload]") {
    auto path = write_temp_toml(kConfigV1, "_valid");
    ConfigWatcher watcher(path);

    uint32_t threshold = 0;
    watcher.set_callback([&](const MonitorConfig& cfg) {
        threshold = cfg.circuit_breaker.failure_threshold;
    });

    rewrite(path, kConfigV2);
    REQUIRE(watcher.check_now());
    REQUIRE(threshold == 5);
    REQUIRE(watcher.reload_count() == 1);
    std::filesystem::remove(path);
}

TEST_CASE("ConfigWatcher: broken edit keeps the old config", "[config][reload]") {
    auto path = write_temp_toml(kConfigV1, "_broken");
    ConfigWatcher watcher(path);
    int calls = 0;
    watcher.set_callback([&](const MonitorConfig&) { ++calls; });

    rewrite(path, "[circuit_breaker]\nfailure_threshold = 0\n");
    REQUIRE_FALSE(watcher.check_now());
    REQUIRE(calls == 0);
    REQUIRE(watcher.failure_count() == 1);
    std::filesystem::remove(path);
}

TEST_CASE("ConfigWatcher: throwing callback is counted as a failure", "[config][reload]") {
    auto path = write_temp_toml(kConfigV1, "_throw");
    ConfigWatcher watcher(path);
    watcher.set_callback([](const MonitorConfig&) {
        throw std::runtime_error("downstream rejected config");
    });

    rewrite(path, kConfigV2);
    REQUIRE_FALSE(watcher.check_now());
    REQUIRE(watcher.failure_count() == 1);
    std::filesystem::remove(path);
}

TEST_CASE("ConfigWatcher: background thread picks up changes", "[config][reload]") {
    auto path = write_temp_toml(kConfigV1, "_thread");
    ConfigWatcher watcher(path, std::chrono::seconds{1});
    ConfigStore store(ConfigLoader::load_from_string(kConfigV1).config);
    watcher.set_callback([&](const MonitorConfig& cfg) { store.publish(cfg); });

    watcher.start();
    REQUIRE(watcher.is_running());
    rewrite(path, kConfigV2);

    for (int i = 0; i < 50 && store.version() == 1; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds{100});
    }
    watcher.stop();

    REQUIRE(store.get_config()->services.size() == 2);
    REQUIRE_FALSE(watcher.is_running());
    std::filesystem::remove(path);
}
