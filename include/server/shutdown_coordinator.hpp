#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>

namespace piiguard {

/**
 * @brief Admission gate and drain barrier for graceful shutdown
 *
 * Request handlers bracket their work with try_enter_request() /
 * leave_request() (see RequestGuard). After initiate_shutdown() no new
 * request is admitted and wait_for_drain() blocks until the in-flight
 * count reaches zero or the timeout expires.
 */
class ShutdownCoordinator {
public:
    struct Config {
        std::chrono::milliseconds shutdown_timeout{30000};
    };

    ShutdownCoordinator();
    explicit ShutdownCoordinator(const Config& config);

    void initiate_shutdown();

    /// Returns false if shutting down
    [[nodiscard]] bool try_enter_request();

    void leave_request();

    /// True if drained cleanly, false on timeout
    [[nodiscard]] bool wait_for_drain();

    [[nodiscard]] bool is_shutting_down() const {
        return shutting_down_.load(std::memory_order_acquire);
    }

    [[nodiscard]] uint32_t in_flight_count() const {
        return in_flight_.load(std::memory_order_acquire);
    }

private:
    void notify_drain();

    Config config_;
    std::atomic<bool> shutting_down_{false};
    std::atomic<uint32_t> in_flight_{0};
    std::mutex drain_mutex_;
    std::condition_variable drain_cv_;
};

/// Scoped leave_request() for an admitted request
class RequestGuard {
public:
    explicit RequestGuard(ShutdownCoordinator* sc) : sc_(sc) {}
    ~RequestGuard() { if (sc_) sc_->leave_request(); }

    RequestGuard(const RequestGuard&) = delete;
    RequestGuard& operator=(const RequestGuard&) = delete;

private:
    ShutdownCoordinator* sc_;
};

} // namespace piiguard
