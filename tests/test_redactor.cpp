#include <catch2/catch_test_macros.hpp>
#include "redactor/redactor.hpp"
#include "core/error.hpp"

#include <string>
#include <vector>

using namespace piiguard;

namespace {

Span make_span(size_t start, size_t end, PiiType type, double confidence) {
    Span s;
    s.start_offset = start;
    s.end_offset = end;
    s.pii_type = type;
    s.confidence = confidence;
    s.detector = "test";
    return s;
}

Detection make_detection(size_t leaf_index, std::vector<Span> spans) {
    Detection d;
    d.leaf_index = leaf_index;
    d.spans = std::move(spans);
    return d;
}

Redactor builtin_redactor() {
    return Redactor(RedactionPolicy::builtin(), 0.8, "salt");
}

} // anonymous namespace

TEST_CASE("Standalone spans are replaced in place", "[redactor]") {
    auto doc = JsonDocument::parse(R"({"note":"mail jane@x.io now","id":7})");
    DocumentWalker walker(doc);

    DetectionSet set;
    set.detections.push_back(make_detection(0, {make_span(5, 14, PiiType::EMAIL, 0.95)}));

    const auto result = builtin_redactor().redact(walker, set);
    CHECK(result.payload == R"({"note":"mail [REDACTED_EMAIL] now","id":7})");
    CHECK(result.fields_redacted == 1);
    CHECK(result.spans_redacted == 1);
    CHECK(result.fields_dropped == 0);
    CHECK(result.modified());
}

TEST_CASE("Weak spans are left alone without a combination", "[redactor]") {
    const std::string payload = R"({"name":"Jane Doe"})";
    auto doc = JsonDocument::parse(payload);
    DocumentWalker walker(doc);

    DetectionSet set;
    set.detections.push_back(make_detection(0, {make_span(0, 8, PiiType::NAME, 0.5)}));

    const auto result = builtin_redactor().redact(walker, set);
    CHECK(result.payload == payload);
    CHECK_FALSE(result.modified());
    CHECK(result.spans_redacted == 0);
}

TEST_CASE("Participating weak types use the elevated strategy", "[redactor][combinatorial]") {
    auto doc = JsonDocument::parse(R"({"name":"Jane Doe","dob":"1990-01-01","city":"Austin"})");
    DocumentWalker walker(doc);

    DetectionSet set;
    set.detections.push_back(make_detection(0, {make_span(0, 8, PiiType::NAME, 0.5)}));
    set.detections.push_back(make_detection(1, {make_span(0, 10, PiiType::DATE_OF_BIRTH, 0.5)}));
    set.combination.flagged = true;
    set.combination.participating.insert(PiiType::NAME);
    set.combination.participating.insert(PiiType::DATE_OF_BIRTH);

    const auto result = builtin_redactor().redact(walker, set);
    CHECK(result.payload == R"({"name":null,"dob":null,"city":"Austin"})");
    CHECK(result.fields_dropped == 2);
}

TEST_CASE("Multiple spans in one field are rewritten left to right", "[redactor]") {
    auto doc = JsonDocument::parse(R"({"memo":"ssn 123-45-6789 card 4111111111111111"})");
    DocumentWalker walker(doc);

    DetectionSet set;
    set.detections.push_back(make_detection(0, {
        make_span(4, 15, PiiType::NATIONAL_ID, 0.9),
        make_span(21, 37, PiiType::CARD_NUMBER, 0.95),
    }));

    const auto result = builtin_redactor().redact(walker, set);
    CHECK(result.payload == R"({"memo":"ssn XXX-XX-6789 card XXXXXXXXXXXX1111"})");
    CHECK(result.spans_redacted == 2);
    CHECK(result.fields_redacted == 1);
}

TEST_CASE("A DROP_FIELD span nulls the whole field", "[redactor]") {
    RedactionPolicy policy = RedactionPolicy::builtin();
    policy.set(PiiType::EMAIL, PolicyEntry{RedactionStrategy::DROP_FIELD, RedactionStrategy::DROP_FIELD});
    Redactor redactor(policy, 0.8, "");

    auto doc = JsonDocument::parse(R"(["a@b.io and 123-45-6789"])");
    DocumentWalker walker(doc);

    DetectionSet set;
    set.detections.push_back(make_detection(0, {
        make_span(0, 6, PiiType::EMAIL, 0.95),
        make_span(11, 22, PiiType::NATIONAL_ID, 0.9),
    }));
    CHECK(redactor.redact(walker, set).payload == "[null]");
}

TEST_CASE("rewrite_field rejects spans outside the field", "[redactor]") {
    const auto redactor = builtin_redactor();
    std::vector<Span> spans = {make_span(2, 40, PiiType::EMAIL, 0.95)};
    CHECK_THROWS_AS(redactor.rewrite_field(0, "short", spans, PiiTypeSet{}), PiiGuardError);
}

TEST_CASE("rewrite_field returns nothing when no span is redactable", "[redactor]") {
    const auto redactor = builtin_redactor();
    std::vector<Span> spans = {make_span(0, 4, PiiType::POSTAL_CODE, 0.4)};
    CHECK_FALSE(redactor.rewrite_field(0, "94107", spans, PiiTypeSet{}).has_value());
}

TEST_CASE("HASH replacements are stable for the same salt", "[redactor][hash]") {
    const auto redactor = builtin_redactor();
    std::vector<Span> spans = {make_span(0, 6, PiiType::DEVICE_ID, 0.9)};
    const auto a = redactor.rewrite_field(0, "abc123", spans, PiiTypeSet{});
    const auto b = redactor.rewrite_field(0, "abc123", spans, PiiTypeSet{});
    REQUIRE(a.has_value());
    REQUIRE(b.has_value());
    CHECK(a->text == b->text);
    CHECK(a->text.starts_with("[DEVICE_ID:"));
}

TEST_CASE("redact_all replaces strings and numbers, keeps booleans and null", "[redactor][fallback]") {
    auto doc = JsonDocument::parse(R"({"a":"x","n":12,"b":true,"c":null,"d":["y",1.5]})");
    CHECK(Redactor::redact_all(doc) ==
          R"({"a":"[REDACTED]","n":"[REDACTED]","b":true,"c":null,"d":["[REDACTED]","[REDACTED]"]})");
}
