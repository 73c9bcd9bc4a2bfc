#include "config/config_watcher.hpp"
#include "core/utils.hpp"

#include <format>

namespace piiguard {

namespace {

constexpr std::chrono::milliseconds kSleepSlice{50};

} // anonymous namespace

ConfigWatcher::ConfigWatcher(std::string config_path, std::chrono::milliseconds poll_interval)
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
    utils::log::info(std::format("Config watcher started: polling {} every {}ms",
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

void ConfigWatcher::watch_loop(std::stop_token stop) {
    while (!stop.stop_requested()) {
        // Sleep in slices for responsive shutdown
        auto slept = std::chrono::milliseconds{0};
        while (slept < poll_interval_ && !stop.stop_requested()) {
            std::this_thread::sleep_for(kSleepSlice);
            slept += kSleepSlice;
        }

        if (stop.stop_requested()) break;

        std::error_code ec;
        const auto current_mtime = std::filesystem::last_write_time(config_path_, ec);
        if (ec) {
            utils::log::warn(std::format("Config watcher: cannot stat {}: {}",
                                          config_path_, ec.message()));
            continue;
        }

        if (current_mtime == last_mtime_) {
            continue;
        }

        utils::log::info(std::format("Config file changed: {}", config_path_));
        last_mtime_ = current_mtime;

        // Editors that write in place can leave a short incomplete window
        std::this_thread::sleep_for(kSleepSlice);

        auto result = ConfigLoader::load_from_file(config_path_);
        if (!result.success) {
            failure_count_.fetch_add(1);
            utils::log::error(std::format("Config reload failed (keeping old config): {}",
                                           result.error_message));
            continue;
        }

        if (callback_) {
            try {
                callback_(result.config);
                reload_count_.fetch_add(1);
                utils::log::info("Config reloaded successfully");
            } catch (const std::exception& e) {
                failure_count_.fetch_add(1);
                utils::log::error(std::format("Config reload rejected (keeping old config): {}", e.what()));
            }
        }
    }
}

} // namespace piiguard
