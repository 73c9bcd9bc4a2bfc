#include "core/engine_snapshot.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include "detector/detector_factory.hpp"

#include <format>
#include <unordered_set>

namespace piiguard {

namespace {

RedactionStrategy require_strategy(const std::string& name, std::string_view where) {
    const auto s = parse_strategy(name);
    if (!s) {
        throw DetectorConfigError(std::format(
            "{}: unknown redaction strategy '{}'", where, name));
    }
    return *s;
}

PiiType require_type(const std::string& name, std::string_view where) {
    const auto t = parse_pii_type(name);
    if (!t) {
        throw DetectorConfigError(std::format("{}: unknown PII type '{}'", where, name));
    }
    return *t;
}

} // anonymous namespace

// ============================================================================
// EngineSnapshot
// ============================================================================

EngineSnapshot::EngineSnapshot(PatternMatcher matcher,
                               CombinatorialDetector combinator,
                               Redactor redactor,
                               EngineConfig engine,
                               uint64_t version)
    : matcher_(std::move(matcher)),
      combinator_(std::move(combinator)),
      redactor_(std::move(redactor)),
      engine_(std::move(engine)),
      version_(version),
      loaded_at_(std::chrono::system_clock::now()) {}

// ============================================================================
// SnapshotBuilder
// ============================================================================

std::shared_ptr<const EngineSnapshot> SnapshotBuilder::build(const PiiGuardConfig& config, uint64_t version) {
    const bool builtin = config.detectors.empty();
    const auto defs = builtin ? builtin_detector_configs() : config.detectors;

    std::vector<std::shared_ptr<const IDetector>> detectors;
    detectors.reserve(defs.size());
    std::unordered_set<std::string> names;
    for (const auto& def : defs) {
        if (!names.insert(def.name).second) {
            throw DetectorConfigError(std::format("Duplicate detector name '{}'", def.name));
        }
        detectors.push_back(make_detector(def));
    }

    PatternMatcher matcher(std::move(detectors));
    auto policy = compile_policy(config, defs, builtin);
    policy.require_coverage(matcher.active_types());

    CombinatorialDetector combinator(compile_rules(config.combinations),
                                     compile_weights(config.risk_weights));
    Redactor redactor(std::move(policy), config.engine.standalone_threshold, config.engine.hash_salt);

    utils::log::debug(std::format("Compiled engine snapshot v{}: {} detectors, {} combination rules",
                                  version, matcher.detectors().size(), combinator.rules().size()));

    return std::make_shared<const EngineSnapshot>(
        std::move(matcher), std::move(combinator), std::move(redactor), config.engine, version);
}

RedactionPolicy SnapshotBuilder::compile_policy(const PiiGuardConfig& config,
                                                const std::vector<DetectorConfig>& defs,
                                                bool builtin) {
    RedactionPolicy policy = builtin ? RedactionPolicy::builtin() : RedactionPolicy{};

    // [policy.<type>] tables
    std::array<bool, kPiiTypeCount> explicit_entry{};
    for (const auto& [type_name, entry] : config.policy) {
        const auto where = std::format("policy.{}", type_name);
        const auto type = require_type(type_name, where);
        PolicyEntry pe;
        pe.strategy = require_strategy(entry.strategy, where);
        if (entry.elevated_strategy) {
            pe.elevated = require_strategy(*entry.elevated_strategy, where);
        }
        policy.set(type, pe);
        explicit_entry[index_of(type)] = true;
    }

    // Inline detector strategies
    std::array<std::optional<PolicyEntry>, kPiiTypeCount> inline_entry{};
    std::array<std::string, kPiiTypeCount> inline_owner{};
    for (const auto& def : defs) {
        const auto where = std::format("Detector '{}'", def.name);
        if (!def.strategy) {
            if (def.elevated_strategy) {
                throw DetectorConfigError(std::format(
                    "{}: elevated_strategy requires strategy", where));
            }
            continue;
        }

        const auto type = require_type(def.type, where);
        PolicyEntry pe;
        pe.strategy = require_strategy(*def.strategy, where);
        if (def.elevated_strategy) {
            pe.elevated = require_strategy(*def.elevated_strategy, where);
        }

        const auto idx = index_of(type);
        if (inline_entry[idx] && *inline_entry[idx] != pe) {
            throw DetectorConfigError(std::format(
                "Detectors '{}' and '{}' claim PII type '{}' with conflicting policy entries",
                inline_owner[idx], def.name, pii_type_to_string(type)));
        }
        if (explicit_entry[idx] && policy.at(type) != pe) {
            throw DetectorConfigError(std::format(
                "{} conflicts with [policy.{}]", where, pii_type_to_string(type)));
        }
        inline_entry[idx] = pe;
        inline_owner[idx] = def.name;
        policy.set(type, pe);
    }

    return policy;
}

RiskWeights SnapshotBuilder::compile_weights(const std::map<std::string, double>& overrides) {
    auto weights = default_risk_weights();
    for (const auto& [type_name, weight] : overrides) {
        const auto type = require_type(type_name, std::format("risk_weights.{}", type_name));
        weights[index_of(type)] = weight;
    }
    return weights;
}

std::vector<CombinationRule> SnapshotBuilder::compile_rules(
    const std::optional<std::vector<CombinationConfig>>& combinations) {

    std::vector<CombinationRule> rules;
    if (!combinations) {
        rules.push_back(CombinationRule{"default", PiiTypeSet{}, 2, 0.6});
        return rules;
    }

    rules.reserve(combinations->size());
    for (const auto& c : *combinations) {
        CombinationRule rule;
        rule.name = c.name;
        rule.min_distinct = c.min_distinct;
        rule.risk_threshold = c.risk_threshold;
        for (const auto& t : c.types) {
            rule.types.insert(require_type(t, std::format("Combination '{}'", c.name)));
        }
        rules.push_back(std::move(rule));
    }
    return rules;
}

// ============================================================================
// EngineRegistry
// ============================================================================

EngineRegistry::EngineRegistry(std::shared_ptr<const EngineSnapshot> initial) {
    std::atomic_store_explicit(&snapshot_, std::move(initial), std::memory_order_release);
}

std::shared_ptr<const EngineSnapshot> EngineRegistry::current() const {
    return std::atomic_load_explicit(&snapshot_, std::memory_order_acquire);
}

uint64_t EngineRegistry::reload(const PiiGuardConfig& config) {
    std::lock_guard<std::mutex> lock(reload_mutex_);

    const auto old = current();
    const uint64_t version = old ? old->version() + 1 : 1;

    // Throws before the swap, so a bad config never replaces a good one
    auto fresh = SnapshotBuilder::build(config, version);
    std::atomic_store_explicit(&snapshot_, std::move(fresh), std::memory_order_release);
    reload_count_.fetch_add(1, std::memory_order_relaxed);

    utils::log::info(std::format("Engine snapshot v{} active", version));
    return version;
}

void EngineRegistry::publish(std::shared_ptr<const EngineSnapshot> snapshot) {
    std::lock_guard<std::mutex> lock(reload_mutex_);
    std::atomic_store_explicit(&snapshot_, std::move(snapshot), std::memory_order_release);
}

} // namespace piiguard
