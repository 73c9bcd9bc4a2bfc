#include <catch2/catch_test_macros.hpp>
#include "config/config_watcher.hpp"
#include "core/engine_snapshot.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>

using namespace piiguard;

// ============================================================================
// Helpers
// ============================================================================

namespace {

std::string write_temp_toml(const std::string& content, const std::string& suffix = "") {
    auto path = std::filesystem::temp_directory_path() /
                ("pii_guard_reload" + suffix + "_" +
                 std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()) +
                 ".toml");
    std::ofstream f(path);
    f << content;
    f.close();
    return path.string();
}

/// Rewrite the file and push its mtime forward so the change is visible
/// even on filesystems with coarse timestamps
void rewrite(const std::string& path, const std::string& content) {
    const auto before = std::filesystem::last_write_time(path);
    {
        std::ofstream f(path, std::ios::trunc);
        f << content;
    }
    std::filesystem::last_write_time(path, before + std::chrono::seconds(2));
}

template <typename Pred>
bool wait_until(Pred pred, std::chrono::milliseconds timeout = std::chrono::milliseconds(3000)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    return pred();
}

} // anonymous namespace

// ============================================================================
// ConfigWatcher
// ============================================================================

TEST_CASE("ConfigWatcher delivers a changed config to the callback", "[config][reload]") {
    const auto path = write_temp_toml("[engine]\nlatency_budget_ms = 10\n", "_deliver");

    std::mutex mutex;
    uint32_t seen_budget = 0;

    ConfigWatcher watcher(path, std::chrono::milliseconds(100));
    watcher.set_callback([&](const PiiGuardConfig& cfg) {
        std::lock_guard lock(mutex);
        seen_budget = cfg.engine.latency_budget_ms;
    });
    watcher.start();
    CHECK(watcher.is_running());

    rewrite(path, "[engine]\nlatency_budget_ms = 42\n");

    REQUIRE(wait_until([&] { return watcher.reload_count() >= 1; }));
    {
        std::lock_guard lock(mutex);
        CHECK(seen_budget == 42);
    }

    watcher.stop();
    CHECK_FALSE(watcher.is_running());
    std::filesystem::remove(path);
}

TEST_CASE("ConfigWatcher ignores a file that fails to load", "[config][reload]") {
    const auto path = write_temp_toml("[engine]\nlatency_budget_ms = 10\n", "_badfile");

    std::atomic<int> calls{0};
    ConfigWatcher watcher(path, std::chrono::milliseconds(100));
    watcher.set_callback([&](const PiiGuardConfig&) { calls.fetch_add(1); });
    watcher.start();

    rewrite(path, "[engine\nthis is not toml");

    REQUIRE(wait_until([&] { return watcher.failure_count() >= 1; }));
    CHECK(calls.load() == 0);
    CHECK(watcher.reload_count() == 0);

    watcher.stop();
    std::filesystem::remove(path);
}

TEST_CASE("ConfigWatcher counts a rejecting callback as a failure", "[config][reload]") {
    const auto path = write_temp_toml("[engine]\nlatency_budget_ms = 10\n", "_reject");

    ConfigWatcher watcher(path, std::chrono::milliseconds(100));
    watcher.set_callback([](const PiiGuardConfig&) {
        throw std::runtime_error("rejected");
    });
    watcher.start();

    rewrite(path, "[engine]\nlatency_budget_ms = 11\n");

    REQUIRE(wait_until([&] { return watcher.failure_count() >= 1; }));
    CHECK(watcher.reload_count() == 0);

    watcher.stop();
    std::filesystem::remove(path);
}

TEST_CASE("ConfigWatcher stop is idempotent and safe without start", "[config][reload]") {
    ConfigWatcher watcher("/nonexistent/pii_guard.toml", std::chrono::milliseconds(100));
    CHECK_FALSE(watcher.is_running());
    watcher.stop();
    watcher.start();
    watcher.stop();
    watcher.stop();
    CHECK_FALSE(watcher.is_running());
}

// ============================================================================
// Watcher -> EngineRegistry
// ============================================================================

TEST_CASE("Hot reload swaps the engine snapshot and keeps it on bad detectors", "[config][reload][snapshot]") {
    const auto path = write_temp_toml("[engine]\nlatency_budget_ms = 10\n", "_registry");

    auto registry = std::make_shared<EngineRegistry>(SnapshotBuilder::build(PiiGuardConfig{}));

    ConfigWatcher watcher(path, std::chrono::milliseconds(100));
    watcher.set_callback([registry](const PiiGuardConfig& cfg) {
        (void)registry->reload(cfg);
    });
    watcher.start();

    rewrite(path, "[engine]\nlatency_budget_ms = 33\n");
    REQUIRE(wait_until([&] { return registry->current()->version() >= 2; }));
    CHECK(registry->current()->engine().latency_budget_ms == 33);
    const auto good_version = registry->current()->version();

    // Loads fine as TOML but the detector set has no policy for its type
    rewrite(path, R"(
        [[detectors]]
        name = "employee_id"
        type = "national_id"
        pattern = "EMP-[0-9]{6}"
    )");
    REQUIRE(wait_until([&] { return watcher.failure_count() >= 1; }));
    CHECK(registry->current()->version() == good_version);
    CHECK(registry->current()->engine().latency_budget_ms == 33);

    watcher.stop();
    std::filesystem::remove(path);
}
