#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "redactor/redaction_policy.hpp"
#include "core/error.hpp"

using namespace piiguard;
using Catch::Matchers::ContainsSubstring;

TEST_CASE("Built-in policy covers every type", "[policy]") {
    const auto policy = RedactionPolicy::builtin();
    for (const auto t : kAllPiiTypes) {
        CHECK(policy.has(t));
        CHECK(policy.strategy_for(t, true) == RedactionStrategy::DROP_FIELD);
    }
}

TEST_CASE("Built-in policy strategies per type", "[policy]") {
    const auto policy = RedactionPolicy::builtin();
    CHECK(policy.strategy_for(PiiType::CARD_NUMBER, false) == RedactionStrategy::PARTIAL_LAST4);
    CHECK(policy.strategy_for(PiiType::NATIONAL_ID, false) == RedactionStrategy::PARTIAL_LAST4);
    CHECK(policy.strategy_for(PiiType::AADHAAR, false) == RedactionStrategy::PARTIAL_LAST4);
    CHECK(policy.strategy_for(PiiType::PHONE, false) == RedactionStrategy::PARTIAL_LAST4);
    CHECK(policy.strategy_for(PiiType::DEVICE_ID, false) == RedactionStrategy::HASH);
    CHECK(policy.strategy_for(PiiType::EMAIL, false) == RedactionStrategy::MASK);
    CHECK(policy.strategy_for(PiiType::NAME, false) == RedactionStrategy::MASK);
}

TEST_CASE("An empty policy has no entries and at() throws", "[policy]") {
    RedactionPolicy policy;
    CHECK_FALSE(policy.has(PiiType::EMAIL));
    CHECK_THROWS_AS(policy.at(PiiType::EMAIL), DetectorConfigError);

    policy.set(PiiType::EMAIL, PolicyEntry{RedactionStrategy::HASH, RedactionStrategy::MASK});
    CHECK(policy.has(PiiType::EMAIL));
    CHECK(policy.strategy_for(PiiType::EMAIL, false) == RedactionStrategy::HASH);
    CHECK(policy.strategy_for(PiiType::EMAIL, true) == RedactionStrategy::MASK);
}

TEST_CASE("require_coverage names every missing type", "[policy]") {
    RedactionPolicy policy;
    policy.set(PiiType::EMAIL, PolicyEntry{});

    PiiTypeSet active;
    active.insert(PiiType::EMAIL);
    CHECK_NOTHROW(policy.require_coverage(active));

    active.insert(PiiType::PHONE);
    active.insert(PiiType::UPI_ID);
    CHECK_THROWS_WITH(policy.require_coverage(active),
                      ContainsSubstring("phone") && ContainsSubstring("upi_id"));
}

TEST_CASE("parse_strategy accepts names and aliases", "[policy]") {
    CHECK(parse_strategy("mask") == RedactionStrategy::MASK);
    CHECK(parse_strategy("mask_with_token") == RedactionStrategy::MASK);
    CHECK(parse_strategy("HASH") == RedactionStrategy::HASH);
    CHECK(parse_strategy("drop_field") == RedactionStrategy::DROP_FIELD);
    CHECK(parse_strategy("partial_last4") == RedactionStrategy::PARTIAL_LAST4);
    CHECK_FALSE(parse_strategy("shred").has_value());
}
