#include "config/config_watcher.hpp"
#include "core/utils.hpp"

#include <format>

namespace autoheal {

ConfigWatcher::ConfigWatcher(std::string config_path, std::chrono::seconds poll_interval)
    : config_path_(std::move(config_path)),
      poll_interval_(poll_interval) {
    std::error_code ec;
    last_mtime_ = std::filesystem::last_write_time(config_path_, ec);
    if (ec) {
        utils::log::warn(std::format("Config watcher: cannot stat {}: {}", config_path_, ec.message()));
    }
}

ConfigWatcher::~ConfigWatcher() {
    stop();
}

void ConfigWatcher::set_callback(ReloadCallback callback) {
    callback_ = std::move(callback);
}

void ConfigWatcher::start() {
    if (running_.load()) return;
    running_.store(true);
    watch_thread_ = std::jthread([this](std::stop_token stop) {
        watch_loop(std::move(stop));
    });
    utils::log::info(std::format("Config watcher started: polling {} every {}s",
                                  config_path_, poll_interval_.count()));
}

void ConfigWatcher::stop() {
    if (!running_.load()) return;
    running_.store(false);
    if (watch_thread_.joinable()) {
        watch_thread_.request_stop();
        watch_thread_.join();
    }
    utils::log::info("Config watcher stopped");
}

bool ConfigWatcher::check_now() {
    std::error_code ec;
    const auto current_mtime = std::filesystem::last_write_time(config_path_, ec);
    if (ec) {
        utils::log::warn(std::format("Config watcher: cannot stat {}: {}",
                                      config_path_, ec.message()));
        return false;
    }

    if (current_mtime == last_mtime_) {
        return false;
    }

    utils::log::info(std::format("Config file changed: {}", config_path_));
    last_mtime_ = current_mtime;

    auto result = ConfigLoader::load_from_file(config_path_);
    if (!result.success) {
        failure_count_.fetch_add(1);
        utils::log::error(std::format("Config reload failed (keeping old config): {}",
                                       result.error_message));
        return false;
    }

    if (!callback_) return false;

    try {
        callback_(result.config);
    } catch (const std::exception& e) {
        failure_count_.fetch_add(1);
        utils::log::error(std::format("Config reload callback error: {}", e.what()));
        return false;
    }

    reload_count_.fetch_add(1);
    utils::log::info("Config reloaded successfully");
    return true;
}

void ConfigWatcher::watch_loop(std::stop_token stop) {
    while (!stop.stop_requested()) {
        // Sleep in 100ms increments for responsive shutdown
        for (int i = 0; i < poll_interval_.count() * 10 && !stop.stop_requested(); ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds{100});
        }

        if (stop.stop_requested()) break;

        // Editors that write in place may leave a brief incomplete window
        std::error_code ec;
        if (std::filesystem::last_write_time(config_path_, ec) != last_mtime_ && !ec) {
            std::this_thread::sleep_for(std::chrono::milliseconds{100});
        }

        (void)check_now();
    }
}

} // namespace autoheal
