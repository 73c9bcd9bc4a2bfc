#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "detector/combinatorial_detector.hpp"

using namespace piiguard;
using Catch::Matchers::WithinAbs;

namespace {

PiiTypeSet types_of(std::initializer_list<PiiType> types) {
    PiiTypeSet s;
    for (const auto t : types) s.insert(t);
    return s;
}

CombinatorialDetector default_detector() {
    return CombinatorialDetector({CombinationRule{"default", PiiTypeSet{}, 2, 0.6}},
                                 default_risk_weights());
}

} // anonymous namespace

TEST_CASE("A single weak type never fires", "[combinatorial]") {
    const auto det = default_detector();
    CHECK_FALSE(det.evaluate(PiiTypeSet{}).flagged);
    CHECK_FALSE(det.evaluate(types_of({PiiType::NAME})).flagged);
}

TEST_CASE("Name plus date of birth crosses the default threshold", "[combinatorial]") {
    const auto verdict = default_detector().evaluate(
        types_of({PiiType::NAME, PiiType::DATE_OF_BIRTH}));

    REQUIRE(verdict.flagged);
    CHECK(verdict.rules == std::vector<std::string>{"default"});
    CHECK(verdict.participating == types_of({PiiType::NAME, PiiType::DATE_OF_BIRTH}));
    CHECK_THAT(verdict.risk_score, WithinAbs(0.75, 1e-9));
}

TEST_CASE("Name, date of birth and postal code all participate", "[combinatorial]") {
    const auto weak = types_of({PiiType::NAME, PiiType::DATE_OF_BIRTH, PiiType::POSTAL_CODE});
    const auto verdict = default_detector().evaluate(weak);
    REQUIRE(verdict.flagged);
    CHECK(verdict.participating == weak);
    CHECK_THAT(verdict.risk_score, WithinAbs(1.05, 1e-9));
}

TEST_CASE("A score exactly at the threshold fires", "[combinatorial]") {
    // 0.3 + 0.3
    CHECK(default_detector().evaluate(types_of({PiiType::EMAIL, PiiType::IP_ADDRESS})).flagged);
}

TEST_CASE("Scores below the threshold do not fire", "[combinatorial]") {
    CombinatorialDetector det({CombinationRule{"strict", PiiTypeSet{}, 2, 0.7}}, default_risk_weights());
    CHECK_FALSE(det.evaluate(types_of({PiiType::POSTAL_CODE, PiiType::DEVICE_ID})).flagged);
}

TEST_CASE("Rules restricted to types ignore other weak types", "[combinatorial]") {
    CombinatorialDetector det(
        {CombinationRule{"contact", types_of({PiiType::EMAIL, PiiType::PHONE}), 2, 0.6}},
        default_risk_weights());

    const auto verdict = det.evaluate(types_of({PiiType::EMAIL, PiiType::PHONE, PiiType::NAME}));
    REQUIRE(verdict.flagged);
    CHECK(verdict.participating == types_of({PiiType::EMAIL, PiiType::PHONE}));
    CHECK_FALSE(verdict.participating.contains(PiiType::NAME));

    CHECK_FALSE(det.evaluate(types_of({PiiType::EMAIL, PiiType::NAME})).flagged);
}

TEST_CASE("min_distinct is enforced and never below two", "[combinatorial]") {
    CombinatorialDetector three({CombinationRule{"three", PiiTypeSet{}, 3, 0.1}}, default_risk_weights());
    CHECK_FALSE(three.evaluate(types_of({PiiType::NAME, PiiType::ADDRESS})).flagged);
    CHECK(three.evaluate(types_of({PiiType::NAME, PiiType::ADDRESS, PiiType::DEVICE_ID})).flagged);

    CombinatorialDetector one({CombinationRule{"one", types_of({PiiType::NAME}), 1, 0.1}},
                              default_risk_weights());
    CHECK_FALSE(one.evaluate(types_of({PiiType::NAME, PiiType::EMAIL})).flagged);
}

TEST_CASE("Every fired rule is reported and the highest score kept", "[combinatorial]") {
    CombinatorialDetector det({
        CombinationRule{"identity", types_of({PiiType::NAME, PiiType::DATE_OF_BIRTH}), 2, 0.6},
        CombinationRule{"location", types_of({PiiType::NAME, PiiType::ADDRESS, PiiType::POSTAL_CODE}), 2, 0.6},
        CombinationRule{"network", types_of({PiiType::IP_ADDRESS, PiiType::DEVICE_ID}), 2, 0.6},
    }, default_risk_weights());

    const auto verdict = det.evaluate(
        types_of({PiiType::NAME, PiiType::DATE_OF_BIRTH, PiiType::ADDRESS, PiiType::POSTAL_CODE}));
    REQUIRE(verdict.flagged);
    CHECK(verdict.rules == std::vector<std::string>{"identity", "location"});
    CHECK(verdict.participating.size() == 4);
    CHECK_THAT(verdict.risk_score, WithinAbs(1.1, 1e-9));
}

TEST_CASE("Custom weights change the outcome", "[combinatorial]") {
    auto weights = default_risk_weights();
    weights[index_of(PiiType::POSTAL_CODE)] = 0.1;
    weights[index_of(PiiType::DEVICE_ID)] = 0.1;
    CombinatorialDetector det({CombinationRule{"default", PiiTypeSet{}, 2, 0.6}}, weights);

    CHECK_FALSE(det.evaluate(types_of({PiiType::POSTAL_CODE, PiiType::DEVICE_ID})).flagged);
    CHECK(det.weight(PiiType::POSTAL_CODE) == 0.1);
}
