#pragma once

#include "config/config_types.hpp"
#include "detector/combinatorial_detector.hpp"
#include "matcher/pattern_matcher.hpp"
#include "redactor/redactor.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>

namespace piiguard {

/**
 * @brief Immutable compiled configuration shared by all in-flight requests
 *
 * Holds the detector set, redaction policy, combination rules and
 * engine limits. Never mutated after construction; a reload builds a new
 * snapshot and swaps the pointer.
 */
class EngineSnapshot {
public:
    EngineSnapshot(PatternMatcher matcher,
                   CombinatorialDetector combinator,
                   Redactor redactor,
                   EngineConfig engine,
                   uint64_t version);

    [[nodiscard]] const PatternMatcher& matcher() const noexcept { return matcher_; }
    [[nodiscard]] const CombinatorialDetector& combinator() const noexcept { return combinator_; }
    [[nodiscard]] const Redactor& redactor() const noexcept { return redactor_; }
    [[nodiscard]] const RedactionPolicy& policy() const noexcept { return redactor_.policy(); }
    [[nodiscard]] const EngineConfig& engine() const noexcept { return engine_; }
    [[nodiscard]] uint64_t version() const noexcept { return version_; }
    [[nodiscard]] std::chrono::system_clock::time_point loaded_at() const noexcept { return loaded_at_; }

private:
    PatternMatcher matcher_;
    CombinatorialDetector combinator_;
    Redactor redactor_;
    EngineConfig engine_;
    uint64_t version_;
    std::chrono::system_clock::time_point loaded_at_;
};

/**
 * @brief Compiles a PiiGuardConfig into an EngineSnapshot
 *
 * With no [[detectors]] the built-in detector set and built-in policy are
 * used; [policy.<type>] tables and inline detector strategies override
 * entries. A custom detector set starts from an empty policy, so every
 * type it produces needs an entry.
 *
 * Throws DetectorConfigError on any inconsistency, including two
 * detectors of one type with different inline strategies.
 */
class SnapshotBuilder {
public:
    [[nodiscard]] static std::shared_ptr<const EngineSnapshot> build(
        const PiiGuardConfig& config, uint64_t version = 1);

private:
    static RedactionPolicy compile_policy(const PiiGuardConfig& config,
                                          const std::vector<DetectorConfig>& defs,
                                          bool builtin);
    static RiskWeights compile_weights(const std::map<std::string, double>& overrides);
    static std::vector<CombinationRule> compile_rules(
        const std::optional<std::vector<CombinationConfig>>& combinations);
};

/**
 * @brief Process-wide holder of the current snapshot (RCU)
 *
 * Readers take a shared_ptr copy with an acquire load and keep it for
 * the whole request, so a concurrent reload never changes rules under a
 * request in flight. Writers serialize on a mutex and publish with a
 * release store.
 */
class EngineRegistry {
public:
    explicit EngineRegistry(std::shared_ptr<const EngineSnapshot> initial);

    [[nodiscard]] std::shared_ptr<const EngineSnapshot> current() const;

    /**
     * @brief Compile and publish a new snapshot
     * @return Version of the published snapshot
     * @throws DetectorConfigError (the previous snapshot stays active)
     */
    uint64_t reload(const PiiGuardConfig& config);

    void publish(std::shared_ptr<const EngineSnapshot> snapshot);

    [[nodiscard]] uint64_t reload_count() const noexcept {
        return reload_count_.load(std::memory_order_relaxed);
    }

private:
    std::shared_ptr<const EngineSnapshot> snapshot_;
    std::mutex reload_mutex_;
    std::atomic<uint64_t> reload_count_{0};
};

} // namespace piiguard
