#pragma once

#include "core/types.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace piiguard {

// ============================================================================
// Engine Config ([engine])
// ============================================================================

struct EngineConfig {
    uint32_t latency_budget_ms = 10;            // 0 = unbounded
    FallbackPolicy fallback_policy = FallbackPolicy::REJECT;
    int reject_status = 503;
    size_t max_structure_depth = 64;
    double standalone_threshold = 0.8;
    size_t parallel_field_threshold = 256;
    size_t max_detection_workers = 4;
    std::string hash_salt;
};

// ============================================================================
// Logging Config ([logging])
// ============================================================================

struct LoggingConfig {
    std::string level = "info";
};

// ============================================================================
// Server Config ([server], [server.tls])
// ============================================================================

struct TlsConfig {
    bool enabled = false;
    std::string cert_file;
    std::string key_file;
};

struct ServerConfig {
    std::string host = "0.0.0.0";
    uint16_t port = 8080;
    size_t thread_pool_size = 4;
    size_t max_body_bytes = 1024 * 1024;
    uint32_t shutdown_timeout_ms = 30000;
    std::string admin_token;                    // Bearer token for /admin/*; empty = open
    TlsConfig tls;
};

// ============================================================================
// Audit Config ([audit])
// ============================================================================

struct AuditConfig {
    bool enabled = true;
    std::string output_file = "logs/pii_audit.jsonl";
    size_t ring_buffer_size = 65536;
    std::chrono::milliseconds batch_flush_interval{100};
    size_t rotation_max_file_size_mb = 100;
    int rotation_max_files = 10;
    bool integrity_enabled = true;
    bool syslog_enabled = false;
    std::string syslog_ident = "pii-guard";
};

// ============================================================================
// Config Watcher Config ([config_watcher])
// ============================================================================

struct ConfigWatcherConfig {
    bool enabled = true;
    int poll_interval_seconds = 5;
};

// ============================================================================
// Detection Config ([[detectors]], [policy.<type>], [risk_weights], [[combinations]])
// ============================================================================

/**
 * @brief One detector definition as written in TOML
 *
 * Strings are kept raw here; the SnapshotBuilder resolves and validates
 * them (unknown type, bad regex, conflicting strategies) and throws
 * DetectorConfigError.
 */
struct DetectorConfig {
    std::string name;
    std::string type;                       // PiiType name
    std::string kind = "regex";             // regex | luhn | field_value
    std::string pattern;
    std::string validator = "none";
    double confidence = 0.9;
    std::vector<std::string> field_keys;
    size_t min_words = 1;
    std::optional<std::string> strategy;            // Inline policy entry
    std::optional<std::string> elevated_strategy;
};

struct PolicyEntryConfig {
    std::string strategy;
    std::optional<std::string> elevated_strategy;
};

struct CombinationConfig {
    std::string name;
    std::vector<std::string> types;         // Empty = any weak type
    size_t min_distinct = 2;
    double risk_threshold = 0.6;
};

// ============================================================================
// PiiGuardConfig - Complete parsed configuration
// ============================================================================

struct PiiGuardConfig {
    EngineConfig engine;
    LoggingConfig logging;
    ServerConfig server;
    AuditConfig audit;
    ConfigWatcherConfig config_watcher;

    std::vector<DetectorConfig> detectors;                  // Empty = built-in set
    std::map<std::string, PolicyEntryConfig> policy;        // Keyed by type name
    std::map<std::string, double> risk_weights;             // Overrides only
    std::optional<std::vector<CombinationConfig>> combinations;  // nullopt = default rule
};

} // namespace piiguard
