#include "audit/audit_emitter.hpp"
#include "batch/csv_batch.hpp"
#include "config/config_loader.hpp"
#include "config/config_watcher.hpp"
#include "core/engine_snapshot.hpp"
#include "core/pipeline.hpp"
#include "core/utils.hpp"
#include "server/http_server.hpp"
#include "server/shutdown_coordinator.hpp"

#include <csignal>
#include <chrono>
#include <cstdlib>
#include <format>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>

using namespace piiguard;

// Global instances for signal handling and config watcher
std::shared_ptr<HttpServer> g_server;
std::shared_ptr<ConfigWatcher> g_config_watcher;
std::shared_ptr<AuditEmitter> g_audit_emitter;
std::shared_ptr<ShutdownCoordinator> g_shutdown;

namespace {

constexpr std::string_view kDefaultConfigFile = "config/pii_guard.toml";

void print_usage(const char* prog) {
    utils::log::info(std::format("Usage: {} [config.toml]", prog));
    utils::log::info(std::format("       {} --batch <in.csv> <out.csv> [--config config.toml]", prog));
}

void apply_log_level(const LoggingConfig& logging) {
    if (!utils::log::set_level(logging.level)) {
        utils::log::warn(std::format("Unknown log level '{}', keeping current level", logging.level));
    }
}

std::shared_ptr<AuditEmitter> make_audit_emitter(const AuditConfig& audit) {
    if (!audit.enabled) {
        utils::log::info("Audit: disabled");
        return nullptr;
    }
    auto emitter = std::make_shared<AuditEmitter>(audit);
    utils::log::info(std::format("Audit: file={}, syslog={}, integrity={}",
        audit.output_file, audit.syslog_enabled, audit.integrity_enabled));
    return emitter;
}

int run_batch(const std::string& config_file, const std::string& input, const std::string& output) {
    auto config_result = ConfigLoader::load_from_file(config_file);
    if (!config_result.success) {
        utils::log::error(std::format("Fatal: {}", config_result.error_message));
        return 1;
    }
    const auto& config = config_result.config;
    apply_log_level(config.logging);

    auto registry = std::make_shared<EngineRegistry>(SnapshotBuilder::build(config));
    auto audit_emitter = make_audit_emitter(config.audit);

    BatchProcessor processor(registry, audit_emitter);
    const auto stats = processor.run_files(input, output);

    if (audit_emitter) {
        audit_emitter->shutdown();
    }
    utils::log::info(std::format("Wrote {} ({} records, {} with PII, {} skipped, {} invalid JSON)",
        output, stats.rows_written, stats.rows_with_pii, stats.rows_skipped, stats.decode_errors));
    return 0;
}

} // anonymous namespace

void signal_handler(int signal) {
    utils::log::info(std::format("Received signal {}, shutting down...", signal));

    // Stop admitting new requests
    if (g_shutdown) {
        g_shutdown->initiate_shutdown();
    }

    if (g_config_watcher) {
        g_config_watcher->stop();
    }

    // Wait for in-flight requests to drain
    if (g_shutdown) {
        bool drained = g_shutdown->wait_for_drain();
        if (drained) {
            utils::log::info("All in-flight requests drained");
        } else {
            utils::log::warn(std::format("Shutdown timeout: {} requests still in flight",
                g_shutdown->in_flight_count()));
        }
    }

    if (g_server) {
        g_server->stop();
    }
    if (g_audit_emitter) {
        g_audit_emitter->shutdown();
    }
    exit(0);
}

int main(int argc, char* argv[]) {
    try {
        const std::string_view first = argc > 1 ? std::string_view(argv[1]) : std::string_view{};
        if (first == "-h" || first == "--help") {
            print_usage(argv[0]);
            return 0;
        }

        // =====================================================================
        // Batch mode: pii_guard --batch in.csv out.csv [--config path]
        // =====================================================================
        if (first == "--batch") {
            if (argc != 4 && !(argc == 6 && std::string_view(argv[4]) == "--config")) {
                print_usage(argv[0]);
                return 2;
            }
            const std::string config_file = argc == 6 ? argv[5] : std::string(kDefaultConfigFile);
            return run_batch(config_file, argv[2], argv[3]);
        }

        utils::log::info("PII Guard starting...");

        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        const std::string config_file = argc > 1 ? argv[1] : std::string(kDefaultConfigFile);

        // =====================================================================
        // [1/5] Configuration
        // =====================================================================
        utils::log::info(std::format("[1/5] Loading configuration from {}", config_file));
        auto config_result = ConfigLoader::load_from_file(config_file);
        if (!config_result.success) {
            utils::log::error(std::format("Fatal: {}", config_result.error_message));
            return 1;
        }
        const auto& config = config_result.config;
        apply_log_level(config.logging);

        // =====================================================================
        // [2/5] Engine snapshot (DetectorConfigError is fatal here)
        // =====================================================================
        auto registry = std::make_shared<EngineRegistry>(SnapshotBuilder::build(config));
        {
            const auto snapshot = registry->current();
            utils::log::info(std::format(
                "[2/5] Engine: {} detectors, budget={}ms, fallback={}, max_depth={}",
                snapshot->matcher().detectors().size(),
                config.engine.latency_budget_ms,
                fallback_to_string(config.engine.fallback_policy),
                config.engine.max_structure_depth));
        }

        // =====================================================================
        // [3/5] Audit + pipeline
        // =====================================================================
        utils::log::info("[3/5] Audit & pipeline initializing...");
        g_audit_emitter = make_audit_emitter(config.audit);
        auto pipeline = std::make_shared<InterceptorPipeline>(registry, g_audit_emitter);

        // =====================================================================
        // [4/5] HTTP server + graceful shutdown
        // =====================================================================
        utils::log::info("[4/5] HTTP server initializing...");
        g_server = std::make_shared<HttpServer>(pipeline, config.server);

        ShutdownCoordinator::Config shutdown_cfg;
        shutdown_cfg.shutdown_timeout = std::chrono::milliseconds(config.server.shutdown_timeout_ms);
        g_shutdown = std::make_shared<ShutdownCoordinator>(shutdown_cfg);
        g_server->set_shutdown_coordinator(g_shutdown);

        g_server->set_reload_handler([registry, config_file] {
            auto reloaded = ConfigLoader::load_from_file(config_file);
            if (!reloaded.success) {
                throw std::runtime_error(reloaded.error_message);
            }
            const uint64_t version = registry->reload(reloaded.config);
            apply_log_level(reloaded.config.logging);
            return version;
        });

        // =====================================================================
        // [5/5] Config watcher - hot-reload the engine snapshot
        // =====================================================================
        if (config.config_watcher.enabled) {
            g_config_watcher = std::make_shared<ConfigWatcher>(
                config_file,
                std::chrono::seconds{config.config_watcher.poll_interval_seconds});

            // Throwing keeps the previous snapshot; the watcher logs and counts it
            g_config_watcher->set_callback([registry](const PiiGuardConfig& new_cfg) {
                registry->reload(new_cfg);
                apply_log_level(new_cfg.logging);
            });

            g_config_watcher->start();
            utils::log::info(std::format("[5/5] Config watcher: polling every {}s",
                config.config_watcher.poll_interval_seconds));
        } else {
            utils::log::info("[5/5] Config watcher: disabled");
        }

        utils::log::info(std::format("Server ready on {}://{}:{}",
            config.server.tls.enabled ? "https" : "http", config.server.host, config.server.port));

        // Start HTTP server (blocking)
        g_server->start();

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return 1;
    }

    return 0;
}
