#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <cstdlib>
#include <format>
#include <stdexcept>

using namespace std::string_literals;

namespace piiguard {

// ============================================================================
// TOML Parsing Helpers (env expansion)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 *
 * Unset variables expand to the empty string.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_in_array(toml::array& arr);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto&& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        } else if (val.is_array()) {
            expand_env_vars_in_array(*val.as_array());
        }
    }
}

void expand_env_vars_in_array(toml::array& arr) {
    for (auto& elem : arr) {
        if (elem.is_string()) {
            auto& s = *elem.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (elem.is_table()) {
            expand_env_vars_recursive(*elem.as_table());
        } else if (elem.is_array()) {
            expand_env_vars_in_array(*elem.as_array());
        }
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);
    expand_env_vars_recursive(result);
    return result;
}

// ---- Extraction helpers ----------------------------------------------------

std::vector<std::string> toml_string_array(const toml::table& tbl, const std::string_view key) {
    std::vector<std::string> result;
    if (const auto* arr = tbl[key].as_array()) {
        result.reserve(arr->size());
        for (const auto& elem : *arr) {
            if (const auto* s = elem.as_string()) {
                result.emplace_back(s->get());
            }
        }
    }
    return result;
}

std::optional<std::string> toml_optional_string(const toml::table& tbl, const std::string_view key) {
    if (const auto* v = tbl[key].as_string()) {
        return std::string(v->get());
    }
    return std::nullopt;
}

/// Non-negative integer with a default; negative values are reported as errors
size_t toml_size(const toml::table& tbl, const std::string_view key, const size_t fallback) {
    const int64_t v = tbl[key].value_or(static_cast<int64_t>(fallback));
    if (v < 0) {
        throw std::runtime_error(std::format("'{}' must be non-negative, got {}", key, v));
    }
    return static_cast<size_t>(v);
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

// ---- Section extractors ----------------------------------------------------

EngineConfig ConfigLoader::extract_engine(const toml::table& root) {
    EngineConfig cfg;
    const auto* engine = root["engine"].as_table();
    if (!engine) return cfg;
    const auto& e = *engine;

    cfg.latency_budget_ms = static_cast<uint32_t>(toml_size(e, "latency_budget_ms", cfg.latency_budget_ms));

    const std::string fallback = e["fallback_policy"].value_or("reject"s);
    const auto policy = parse_fallback_policy(fallback);
    if (!policy) {
        throw std::runtime_error(std::format(
            "engine.fallback_policy must be 'reject' or 'redact_all', got '{}'", fallback));
    }
    cfg.fallback_policy = *policy;

    cfg.reject_status = static_cast<int>(e["reject_status"].value_or(int64_t{503}));
    cfg.max_structure_depth = toml_size(e, "max_structure_depth", cfg.max_structure_depth);
    cfg.standalone_threshold = e["standalone_threshold"].value_or(cfg.standalone_threshold);
    cfg.parallel_field_threshold = toml_size(e, "parallel_field_threshold", cfg.parallel_field_threshold);
    cfg.max_detection_workers = toml_size(e, "max_detection_workers", cfg.max_detection_workers);
    cfg.hash_salt = e["hash_salt"].value_or(""s);
    return cfg;
}

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;

    cfg.level = (*logging)["level"].value_or("info"s);
    return cfg;
}

ServerConfig ConfigLoader::extract_server(const toml::table& root) {
    ServerConfig cfg;
    const auto* server = root["server"].as_table();
    if (!server) return cfg;
    const auto& s = *server;

    cfg.host = s["host"].value_or("0.0.0.0"s);
    const int64_t port = s["port"].value_or(int64_t{8080});
    if (port < 1 || port > 65535) {
        throw std::runtime_error(std::format("server.port must be 1-65535, got {}", port));
    }
    cfg.port = static_cast<uint16_t>(port);
    cfg.thread_pool_size = toml_size(s, "threads", cfg.thread_pool_size);
    cfg.max_body_bytes = toml_size(s, "max_body_bytes", cfg.max_body_bytes);
    cfg.shutdown_timeout_ms = static_cast<uint32_t>(toml_size(s, "shutdown_timeout_ms", cfg.shutdown_timeout_ms));
    cfg.admin_token = s["admin_token"].value_or(""s);

    if (const auto* tls = s["tls"].as_table()) {
        cfg.tls.enabled = (*tls)["enabled"].value_or(false);
        cfg.tls.cert_file = (*tls)["cert_file"].value_or(""s);
        cfg.tls.key_file = (*tls)["key_file"].value_or(""s);
    }
    return cfg;
}

AuditConfig ConfigLoader::extract_audit(const toml::table& root) {
    AuditConfig cfg;
    const auto* audit = root["audit"].as_table();
    if (!audit) return cfg;
    const auto& a = *audit;

    cfg.enabled = a["enabled"].value_or(true);
    cfg.output_file = a["output_file"].value_or(cfg.output_file);
    cfg.ring_buffer_size = toml_size(a, "ring_buffer_size", cfg.ring_buffer_size);
    cfg.batch_flush_interval = std::chrono::milliseconds(
        toml_size(a, "batch_flush_interval_ms", static_cast<size_t>(cfg.batch_flush_interval.count())));
    cfg.rotation_max_file_size_mb = toml_size(a, "max_file_size_mb", cfg.rotation_max_file_size_mb);
    cfg.rotation_max_files = static_cast<int>(a["max_files"].value_or(int64_t{10}));
    cfg.integrity_enabled = a["integrity_enabled"].value_or(true);
    cfg.syslog_enabled = a["syslog_enabled"].value_or(false);
    cfg.syslog_ident = a["syslog_ident"].value_or("pii-guard"s);
    return cfg;
}

ConfigWatcherConfig ConfigLoader::extract_config_watcher(const toml::table& root) {
    ConfigWatcherConfig cfg;
    const auto* cw = root["config_watcher"].as_table();
    if (!cw) return cfg;

    cfg.enabled = (*cw)["enabled"].value_or(true);
    cfg.poll_interval_seconds = static_cast<int>((*cw)["poll_interval_seconds"].value_or(int64_t{5}));
    return cfg;
}

std::vector<DetectorConfig> ConfigLoader::extract_detectors(const toml::table& root) {
    std::vector<DetectorConfig> result;
    const auto* arr = root["detectors"].as_array();
    if (!arr) return result;
    result.reserve(arr->size());

    for (const auto& elem : *arr) {
        const auto* d = elem.as_table();
        if (!d) continue;

        DetectorConfig cfg;
        cfg.name = (*d)["name"].value_or(""s);
        cfg.type = (*d)["type"].value_or(""s);
        cfg.kind = utils::to_lower((*d)["kind"].value_or("regex"s));
        cfg.pattern = (*d)["pattern"].value_or(""s);
        cfg.validator = (*d)["validator"].value_or("none"s);
        cfg.confidence = (*d)["confidence"].value_or(0.9);
        cfg.field_keys = toml_string_array(*d, "field_keys");
        cfg.min_words = toml_size(*d, "min_words", 1);
        cfg.strategy = toml_optional_string(*d, "strategy");
        cfg.elevated_strategy = toml_optional_string(*d, "elevated_strategy");

        result.emplace_back(std::move(cfg));
    }
    return result;
}

std::map<std::string, PolicyEntryConfig> ConfigLoader::extract_policy(const toml::table& root) {
    std::map<std::string, PolicyEntryConfig> result;
    const auto* policy = root["policy"].as_table();
    if (!policy) return result;

    for (auto&& [key, val] : *policy) {
        const auto* entry = val.as_table();
        if (!entry) {
            throw std::runtime_error(std::format("policy.{} must be a table", key.str()));
        }
        PolicyEntryConfig cfg;
        cfg.strategy = (*entry)["strategy"].value_or(""s);
        cfg.elevated_strategy = toml_optional_string(*entry, "elevated_strategy");
        result.emplace(std::string(key.str()), std::move(cfg));
    }
    return result;
}

std::map<std::string, double> ConfigLoader::extract_risk_weights(const toml::table& root) {
    std::map<std::string, double> result;
    const auto* weights = root["risk_weights"].as_table();
    if (!weights) return result;

    for (auto&& [key, val] : *weights) {
        const auto w = val.value<double>();
        if (!w) {
            throw std::runtime_error(std::format("risk_weights.{} must be a number", key.str()));
        }
        result.emplace(std::string(key.str()), *w);
    }
    return result;
}

std::optional<std::vector<CombinationConfig>> ConfigLoader::extract_combinations(const toml::table& root) {
    const auto* arr = root["combinations"].as_array();
    if (!arr) return std::nullopt;

    std::vector<CombinationConfig> result;
    result.reserve(arr->size());
    for (const auto& elem : *arr) {
        const auto* c = elem.as_table();
        if (!c) continue;

        CombinationConfig cfg;
        cfg.name = (*c)["name"].value_or(std::format("combination_{}", result.size()));
        cfg.types = toml_string_array(*c, "types");
        cfg.min_distinct = toml_size(*c, "min_distinct", 2);
        cfg.risk_threshold = (*c)["risk_threshold"].value_or(0.6);
        result.emplace_back(std::move(cfg));
    }
    return result;
}

// ---- Orchestration ---------------------------------------------------------

PiiGuardConfig ConfigLoader::extract_all_sections(const toml::table& tbl) {
    PiiGuardConfig config;
    config.engine = extract_engine(tbl);
    config.logging = extract_logging(tbl);
    config.server = extract_server(tbl);
    config.audit = extract_audit(tbl);
    config.config_watcher = extract_config_watcher(tbl);
    config.detectors = extract_detectors(tbl);
    config.policy = extract_policy(tbl);
    config.risk_weights = extract_risk_weights(tbl);
    config.combinations = extract_combinations(tbl);
    return config;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(PiiGuardConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const PiiGuardConfig& config) {
    std::vector<std::string> errors;

    const auto& e = config.engine;
    if (e.reject_status < 400 || e.reject_status > 599) {
        errors.push_back(std::format("engine.reject_status must be 400-599, got {}", e.reject_status));
    }
    if (e.max_structure_depth == 0) {
        errors.push_back("engine.max_structure_depth must be > 0");
    }
    if (e.standalone_threshold < 0.0 || e.standalone_threshold > 1.0) {
        errors.push_back(std::format("engine.standalone_threshold must be within [0, 1], got {}",
                                     e.standalone_threshold));
    }
    if (e.parallel_field_threshold == 0) {
        errors.push_back("engine.parallel_field_threshold must be > 0");
    }
    if (e.max_detection_workers == 0) {
        errors.push_back("engine.max_detection_workers must be > 0");
    }

    const auto level = utils::to_lower(config.logging.level);
    if (level != "debug" && level != "info" && level != "warn" && level != "warning" && level != "error") {
        errors.push_back(std::format("logging.level '{}' is not one of debug|info|warn|error",
                                     config.logging.level));
    }

    if (config.server.thread_pool_size == 0) {
        errors.push_back("server.threads must be > 0");
    }
    if (config.server.max_body_bytes == 0) {
        errors.push_back("server.max_body_bytes must be > 0");
    }
    if (config.server.tls.enabled) {
        if (config.server.tls.cert_file.empty()) {
            errors.push_back("server.tls.cert_file required when TLS is enabled");
        }
        if (config.server.tls.key_file.empty()) {
            errors.push_back("server.tls.key_file required when TLS is enabled");
        }
    }

    if (config.audit.enabled) {
        if (config.audit.output_file.empty()) {
            errors.push_back("audit.output_file required when audit is enabled");
        }
        const auto ring = config.audit.ring_buffer_size;
        if (ring == 0 || (ring & (ring - 1)) != 0) {
            errors.push_back("audit.ring_buffer_size must be a power of 2");
        }
        if (config.audit.rotation_max_files < 1) {
            errors.push_back("audit.max_files must be >= 1");
        }
    }

    if (config.config_watcher.enabled && config.config_watcher.poll_interval_seconds <= 0) {
        errors.push_back("config_watcher.poll_interval_seconds must be > 0");
    }

    for (size_t i = 0; i < config.detectors.size(); ++i) {
        const auto& d = config.detectors[i];
        if (d.name.empty()) {
            errors.push_back(std::format("detectors[{}].name must not be empty", i));
        }
        if (d.type.empty()) {
            errors.push_back(std::format("detectors[{}].type must not be empty", i));
        }
        if (d.kind != "regex" && d.kind != "luhn" && d.kind != "field_value") {
            errors.push_back(std::format("detectors[{}].kind '{}' is not one of regex|luhn|field_value",
                                         i, d.kind));
        }
        if (d.confidence < 0.0 || d.confidence > 1.0) {
            errors.push_back(std::format("detectors[{}].confidence must be within [0, 1], got {}",
                                         i, d.confidence));
        }
    }

    for (const auto& [type, entry] : config.policy) {
        if (entry.strategy.empty()) {
            errors.push_back(std::format("policy.{}.strategy must not be empty", type));
        }
    }

    for (const auto& [type, weight] : config.risk_weights) {
        if (weight < 0.0) {
            errors.push_back(std::format("risk_weights.{} must be >= 0, got {}", type, weight));
        }
    }

    if (config.combinations) {
        for (size_t i = 0; i < config.combinations->size(); ++i) {
            const auto& c = (*config.combinations)[i];
            if (c.min_distinct < 2) {
                errors.push_back(std::format("combinations[{}].min_distinct must be >= 2", i));
            }
            if (c.risk_threshold < 0.0) {
                errors.push_back(std::format("combinations[{}].risk_threshold must be >= 0", i));
            }
        }
    }

    return errors;
}

} // namespace piiguard
