#include <catch2/catch_test_macros.hpp>
#include "core/engine_snapshot.hpp"
#include "core/error.hpp"
#include "detector/detector_factory.hpp"

#include <atomic>
#include <thread>
#include <vector>

using namespace piiguard;

namespace {

DetectorConfig email_detector(std::string name = "email") {
    DetectorConfig d;
    d.name = std::move(name);
    d.type = "email";
    d.kind = "regex";
    d.pattern = R"(\b[A-Za-z0-9._%+-]+@[A-Za-z0-9.-]+\.[A-Za-z]{2,}\b)";
    d.confidence = 0.95;
    return d;
}

} // anonymous namespace

// ============================================================================
// SnapshotBuilder
// ============================================================================

TEST_CASE("Default config compiles the built-in detector set", "[snapshot]") {
    const auto snap = SnapshotBuilder::build(PiiGuardConfig{});
    REQUIRE(snap);
    CHECK(snap->version() == 1);
    CHECK(snap->matcher().detectors().size() == builtin_detector_configs().size());
    CHECK(snap->policy().strategy_for(PiiType::CARD_NUMBER, false) == RedactionStrategy::PARTIAL_LAST4);

    REQUIRE(snap->combinator().rules().size() == 1);
    CHECK(snap->combinator().rules()[0].name == "default");
    CHECK(snap->combinator().rules()[0].min_distinct == 2);
    CHECK(snap->engine().latency_budget_ms == 10);
}

TEST_CASE("[policy] tables override built-in entries", "[snapshot][policy]") {
    PiiGuardConfig cfg;
    cfg.policy["email"] = PolicyEntryConfig{"hash", std::string("mask")};

    const auto snap = SnapshotBuilder::build(cfg);
    CHECK(snap->policy().strategy_for(PiiType::EMAIL, false) == RedactionStrategy::HASH);
    CHECK(snap->policy().strategy_for(PiiType::EMAIL, true) == RedactionStrategy::MASK);
    CHECK(snap->policy().strategy_for(PiiType::PHONE, false) == RedactionStrategy::PARTIAL_LAST4);
}

TEST_CASE("A custom detector set needs a policy entry for every type", "[snapshot][policy]") {
    PiiGuardConfig cfg;
    cfg.detectors.push_back(email_detector());
    CHECK_THROWS_AS(SnapshotBuilder::build(cfg), DetectorConfigError);

    SECTION("covered by a [policy] table") {
        cfg.policy["email"] = PolicyEntryConfig{"mask", std::nullopt};
        const auto snap = SnapshotBuilder::build(cfg);
        CHECK(snap->matcher().detectors().size() == 1);
        CHECK(snap->policy().strategy_for(PiiType::EMAIL, true) == RedactionStrategy::DROP_FIELD);
    }
    SECTION("covered inline") {
        cfg.detectors[0].strategy = "partial_last4";
        const auto snap = SnapshotBuilder::build(cfg);
        CHECK(snap->policy().strategy_for(PiiType::EMAIL, false) == RedactionStrategy::PARTIAL_LAST4);
    }
}

TEST_CASE("Conflicting inline strategies for one type are rejected", "[snapshot][policy]") {
    PiiGuardConfig cfg;
    cfg.detectors.push_back(email_detector("email_a"));
    cfg.detectors.push_back(email_detector("email_b"));
    cfg.detectors[0].strategy = "mask";
    cfg.detectors[1].strategy = "hash";
    CHECK_THROWS_AS(SnapshotBuilder::build(cfg), DetectorConfigError);

    // Identical entries are not a conflict
    cfg.detectors[1].strategy = "mask";
    CHECK_NOTHROW(SnapshotBuilder::build(cfg));
}

TEST_CASE("Inline strategy disagreeing with a [policy] table is rejected", "[snapshot][policy]") {
    PiiGuardConfig cfg;
    cfg.detectors.push_back(email_detector());
    cfg.detectors[0].strategy = "mask";
    cfg.policy["email"] = PolicyEntryConfig{"hash", std::nullopt};
    CHECK_THROWS_AS(SnapshotBuilder::build(cfg), DetectorConfigError);
}

TEST_CASE("Snapshot compilation rejects bad definitions", "[snapshot]") {
    PiiGuardConfig cfg;

    SECTION("duplicate detector names") {
        cfg.detectors.push_back(email_detector("dup"));
        cfg.detectors.push_back(email_detector("dup"));
        cfg.policy["email"] = PolicyEntryConfig{"mask", std::nullopt};
        CHECK_THROWS_AS(SnapshotBuilder::build(cfg), DetectorConfigError);
    }
    SECTION("invalid regex") {
        cfg.detectors.push_back(email_detector());
        cfg.detectors[0].pattern = "[unclosed";
        cfg.policy["email"] = PolicyEntryConfig{"mask", std::nullopt};
        CHECK_THROWS_AS(SnapshotBuilder::build(cfg), DetectorConfigError);
    }
    SECTION("unknown policy type") {
        cfg.policy["shoe_size"] = PolicyEntryConfig{"mask", std::nullopt};
        CHECK_THROWS_AS(SnapshotBuilder::build(cfg), DetectorConfigError);
    }
    SECTION("unknown strategy") {
        cfg.policy["email"] = PolicyEntryConfig{"shred", std::nullopt};
        CHECK_THROWS_AS(SnapshotBuilder::build(cfg), DetectorConfigError);
    }
    SECTION("elevated strategy without a base strategy") {
        cfg.detectors.push_back(email_detector());
        cfg.detectors[0].elevated_strategy = "mask";
        CHECK_THROWS_AS(SnapshotBuilder::build(cfg), DetectorConfigError);
    }
    SECTION("unknown risk weight type") {
        cfg.risk_weights["shoe_size"] = 0.5;
        CHECK_THROWS_AS(SnapshotBuilder::build(cfg), DetectorConfigError);
    }
    SECTION("unknown combination type") {
        cfg.combinations = std::vector<CombinationConfig>{{"c", {"shoe_size"}, 2, 0.6}};
        CHECK_THROWS_AS(SnapshotBuilder::build(cfg), DetectorConfigError);
    }
}

TEST_CASE("Risk weights and combinations are compiled from config", "[snapshot][combinatorial]") {
    PiiGuardConfig cfg;
    cfg.risk_weights["name"] = 0.9;
    cfg.combinations = std::vector<CombinationConfig>{
        {"identity", {"name", "dob"}, 2, 1.0},
    };

    const auto snap = SnapshotBuilder::build(cfg);
    CHECK(snap->combinator().weight(PiiType::NAME) == 0.9);
    CHECK(snap->combinator().weight(PiiType::EMAIL) == 0.3);

    REQUIRE(snap->combinator().rules().size() == 1);
    const auto& rule = snap->combinator().rules()[0];
    CHECK(rule.name == "identity");
    CHECK(rule.types.contains(PiiType::NAME));
    CHECK(rule.types.contains(PiiType::DATE_OF_BIRTH));
    CHECK(rule.risk_threshold == 1.0);
}

TEST_CASE("An explicit empty combination list disables escalation", "[snapshot][combinatorial]") {
    PiiGuardConfig cfg;
    cfg.combinations = std::vector<CombinationConfig>{};
    CHECK(SnapshotBuilder::build(cfg)->combinator().rules().empty());
}

// ============================================================================
// EngineRegistry
// ============================================================================

TEST_CASE("EngineRegistry reload publishes a new version", "[snapshot][registry]") {
    EngineRegistry registry(SnapshotBuilder::build(PiiGuardConfig{}));
    const auto before = registry.current();
    CHECK(before->version() == 1);

    PiiGuardConfig cfg;
    cfg.engine.latency_budget_ms = 25;
    CHECK(registry.reload(cfg) == 2);
    CHECK(registry.current()->version() == 2);
    CHECK(registry.current()->engine().latency_budget_ms == 25);
    CHECK(registry.reload_count() == 1);

    // A reader holding the old snapshot keeps its rules
    CHECK(before->version() == 1);
    CHECK(before->engine().latency_budget_ms == 10);
}

TEST_CASE("A failed reload keeps the previous snapshot", "[snapshot][registry]") {
    EngineRegistry registry(SnapshotBuilder::build(PiiGuardConfig{}));

    PiiGuardConfig bad;
    bad.detectors.push_back(email_detector());     // no policy entry

    CHECK_THROWS_AS(registry.reload(bad), DetectorConfigError);
    CHECK(registry.current()->version() == 1);
    CHECK(registry.reload_count() == 0);

    CHECK(registry.reload(PiiGuardConfig{}) == 2);
}

TEST_CASE("Readers see a consistent snapshot during concurrent reloads", "[snapshot][registry][concurrency]") {
    EngineRegistry registry(SnapshotBuilder::build(PiiGuardConfig{}));
    std::atomic<bool> stop{false};
    std::atomic<int> inconsistent{0};

    std::vector<std::thread> readers;
    for (int i = 0; i < 4; ++i) {
        readers.emplace_back([&] {
            uint64_t last = 0;
            while (!stop.load()) {
                const auto snap = registry.current();
                if (!snap || snap->version() < last) inconsistent.fetch_add(1);
                last = snap ? snap->version() : last;
            }
        });
    }

    for (int i = 0; i < 20; ++i) {
        (void)registry.reload(PiiGuardConfig{});
    }
    stop.store(true);
    for (auto& t : readers) t.join();

    CHECK(inconsistent.load() == 0);
    CHECK(registry.current()->version() == 21);
}
