#pragma once

#include "config/config_loader.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <string>
#include <thread>

namespace autoheal {

/**
 * @brief Background config file watcher with hot-reload support
 *
 * Polls the TOML file's modification time. On change the file is re-parsed
 * and validated through ConfigLoader; only a config that loads cleanly is
 * handed to the callback, a broken edit keeps the previous snapshot live.
 *
 * The callback runs on the watcher thread.
 */
class ConfigWatcher {
public:
    using ReloadCallback = std::function<void(const MonitorConfig& new_config)>;

    explicit ConfigWatcher(
        std::string config_path,
        std::chrono::seconds poll_interval = std::chrono::seconds{5});

    ~ConfigWatcher();

    ConfigWatcher(const ConfigWatcher&) = delete;
    ConfigWatcher& operator=(const ConfigWatcher&) = delete;

    void set_callback(ReloadCallback callback);

    void start();
    void stop();

    /**
     * @brief Run one mtime check and reload synchronously
     * @return true if a new config was delivered to the callback
     */
    bool check_now();

    [[nodiscard]] bool is_running() const { return running_.load(); }
    [[nodiscard]] uint64_t reload_count() const { return reload_count_.load(); }
    [[nodiscard]] uint64_t failure_count() const { return failure_count_.load(); }

private:
    void watch_loop(std::stop_token stop);

    std::string config_path_;
    std::chrono::seconds poll_interval_;
    ReloadCallback callback_;

    std::filesystem::file_time_type last_mtime_{};
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> reload_count_{0};
    std::atomic<uint64_t> failure_count_{0};
    std::jthread watch_thread_;
};

} // namespace autoheal
