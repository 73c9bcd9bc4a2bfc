#include "server/shutdown_coordinator.hpp"

namespace piiguard {

ShutdownCoordinator::ShutdownCoordinator() = default;

ShutdownCoordinator::ShutdownCoordinator(const Config& config)
    : config_(config) {}

void ShutdownCoordinator::notify_drain() {
    // Taking the lock orders the notify after a waiter's predicate check
    {
        std::lock_guard lock(drain_mutex_);
    }
    drain_cv_.notify_all();
}

void ShutdownCoordinator::initiate_shutdown() {
    shutting_down_.store(true, std::memory_order_release);
    notify_drain();
}

bool ShutdownCoordinator::try_enter_request() {
    if (shutting_down_.load(std::memory_order_acquire)) {
        return false;
    }
    in_flight_.fetch_add(1, std::memory_order_acq_rel);
    // Re-check after the increment: initiate_shutdown() may have raced us
    if (shutting_down_.load(std::memory_order_acquire)) {
        in_flight_.fetch_sub(1, std::memory_order_acq_rel);
        notify_drain();
        return false;
    }
    return true;
}

void ShutdownCoordinator::leave_request() {
    const uint32_t prev = in_flight_.fetch_sub(1, std::memory_order_acq_rel);
    if (prev == 1 && shutting_down_.load(std::memory_order_acquire)) {
        notify_drain();
    }
}

bool ShutdownCoordinator::wait_for_drain() {
    std::unique_lock lock(drain_mutex_);
    return drain_cv_.wait_for(lock, config_.shutdown_timeout, [this] {
        return in_flight_.load(std::memory_order_acquire) == 0;
    });
}

} // namespace piiguard
