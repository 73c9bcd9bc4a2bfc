#pragma once

#include "config/config_loader.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <string>
#include <thread>

namespace piiguard {

/**
 * @brief Background config file watcher with hot-reload support
 *
 * Polls the TOML file's modification time. On change the file is
 * re-parsed via ConfigLoader and, if it loads, handed to the callback,
 * which recompiles and swaps the engine snapshot. A file that fails to
 * load (or a callback that throws) is logged and the running snapshot
 * stays in place.
 *
 * The callback runs on the watcher thread.
 */
class ConfigWatcher {
public:
    using ReloadCallback = std::function<void(const PiiGuardConfig& new_config)>;

    explicit ConfigWatcher(
        std::string config_path,
        std::chrono::milliseconds poll_interval = std::chrono::seconds{5});

    ~ConfigWatcher();

    ConfigWatcher(const ConfigWatcher&) = delete;
    ConfigWatcher& operator=(const ConfigWatcher&) = delete;

    void set_callback(ReloadCallback callback);

    void start();
    void stop();

    [[nodiscard]] bool is_running() const { return running_.load(); }

    /// Successful reloads delivered to the callback
    [[nodiscard]] uint64_t reload_count() const { return reload_count_.load(); }

    /// Change events that failed to load or apply
    [[nodiscard]] uint64_t failure_count() const { return failure_count_.load(); }

private:
    void watch_loop(std::stop_token stop);

    std::string config_path_;
    std::chrono::milliseconds poll_interval_;
    ReloadCallback callback_;

    std::filesystem::file_time_type last_mtime_{};
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> reload_count_{0};
    std::atomic<uint64_t> failure_count_{0};
    std::jthread watch_thread_;
};

} // namespace piiguard
