#pragma once

#include "config/config_types.hpp"

#include <toml++/toml.hpp>

#include <string>
#include <vector>

namespace piiguard {

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

/**
 * @brief Loads pii_guard.toml into a PiiGuardConfig
 *
 * Parsing uses toml++; ${VAR} references in any string value are expanded
 * from the environment before extraction. Missing sections fall back to
 * defaults. Structural problems (bad enum names, out-of-range numbers)
 * are collected by validate_config() and reported together.
 *
 * Detector-level semantics (regex compilation, policy coverage) are not
 * checked here; SnapshotBuilder::build() does that when compiling.
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success = false;
        std::string error_message;
        PiiGuardConfig config;

        static LoadResult ok(PiiGuardConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load complete config from TOML file
     * @param config_path Path to pii_guard.toml
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load complete config from TOML string
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Structural validation; returns one message per problem
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const PiiGuardConfig& config);

private:
    static EngineConfig extract_engine(const toml::table& root);
    static LoggingConfig extract_logging(const toml::table& root);
    static ServerConfig extract_server(const toml::table& root);
    static AuditConfig extract_audit(const toml::table& root);
    static ConfigWatcherConfig extract_config_watcher(const toml::table& root);
    static std::vector<DetectorConfig> extract_detectors(const toml::table& root);
    static std::map<std::string, PolicyEntryConfig> extract_policy(const toml::table& root);
    static std::map<std::string, double> extract_risk_weights(const toml::table& root);
    static std::optional<std::vector<CombinationConfig>> extract_combinations(const toml::table& root);

    static PiiGuardConfig extract_all_sections(const toml::table& tbl);
    static LoadResult validate_and_return(PiiGuardConfig config);
};

} // namespace piiguard
