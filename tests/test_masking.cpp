#include <catch2/catch_test_macros.hpp>
#include "redactor/masking.hpp"

#include <algorithm>
#include <cctype>

using namespace piiguard;

namespace {

bool has_digit(std::string_view s) {
    return std::any_of(s.begin(), s.end(), [](char c) { return std::isdigit(static_cast<unsigned char>(c)); });
}

} // anonymous namespace

// ============================================================================
// MASK
// ============================================================================

TEST_CASE("MASK produces a type token", "[masking]") {
    CHECK(MaskingEngine::mask_value("jane@x.io", RedactionStrategy::MASK, PiiType::EMAIL) == "[REDACTED_EMAIL]");
    CHECK(MaskingEngine::mask_token(PiiType::CARD_NUMBER) == "[REDACTED_CARD_NUMBER]");
    CHECK(MaskingEngine::mask_token(PiiType::DATE_OF_BIRTH) == "[REDACTED_DATE_OF_BIRTH]");
}

// ============================================================================
// HASH
// ============================================================================

TEST_CASE("HASH is deterministic and digit-free", "[masking][hash]") {
    const auto a = MaskingEngine::hash_token(PiiType::EMAIL, "jane@x.io", "salt");
    const auto b = MaskingEngine::hash_token(PiiType::EMAIL, "jane@x.io", "salt");
    CHECK(a == b);

    REQUIRE(a.size() == std::string("[EMAIL:]").size() + 16);
    CHECK(a.starts_with("[EMAIL:"));
    CHECK(a.back() == ']');
    CHECK_FALSE(has_digit(a));

    const auto digest = a.substr(7, 16);
    CHECK(std::all_of(digest.begin(), digest.end(), [](char c) { return c >= 'a' && c <= 'p'; }));
}

TEST_CASE("HASH output depends on value and salt", "[masking][hash]") {
    const auto base = MaskingEngine::hash_token(PiiType::DEVICE_ID, "abc-123", "s1");
    CHECK(base != MaskingEngine::hash_token(PiiType::DEVICE_ID, "abc-124", "s1"));
    CHECK(base != MaskingEngine::hash_token(PiiType::DEVICE_ID, "abc-123", "s2"));
    CHECK(MaskingEngine::mask_value("abc-123", RedactionStrategy::HASH, PiiType::DEVICE_ID, "s1") == base);
}

// ============================================================================
// PARTIAL_LAST4
// ============================================================================

TEST_CASE("PARTIAL_LAST4 keeps separators and the last four alphanumerics", "[masking][partial]") {
    CHECK(MaskingEngine::partial_last4("4111 1111 1111 1111") == "XXXX XXXX XXXX 1111");
    CHECK(MaskingEngine::partial_last4("123-45-6789") == "XXX-XX-6789");
    CHECK(MaskingEngine::partial_last4("9876543210") == "XXXXXX3210");
    CHECK(MaskingEngine::partial_last4("2345 6789 0123") == "XXXX XXXX 0123");
}

TEST_CASE("PARTIAL_LAST4 masks everything in short values", "[masking][partial]") {
    CHECK(MaskingEngine::partial_last4("abcd") == "XXXX");
    CHECK(MaskingEngine::partial_last4("a-1") == "X-X");
    CHECK(MaskingEngine::partial_last4("").empty());
}

// ============================================================================
// DROP_FIELD
// ============================================================================

TEST_CASE("DROP_FIELD yields no replacement text", "[masking]") {
    CHECK_FALSE(MaskingEngine::mask_value("x", RedactionStrategy::DROP_FIELD, PiiType::NAME).has_value());
}

// ============================================================================
// Token recognition
// ============================================================================

TEST_CASE("is_redaction_token recognises every produced token", "[masking][token]") {
    CHECK(MaskingEngine::is_redaction_token("[REDACTED]"));
    CHECK(MaskingEngine::is_redaction_token(MaskingEngine::mask_token(PiiType::ADDRESS)));
    CHECK(MaskingEngine::is_redaction_token(MaskingEngine::hash_token(PiiType::DEVICE_ID, "v", "")));
}

TEST_CASE("is_redaction_token rejects ordinary text", "[masking][token]") {
    CHECK_FALSE(MaskingEngine::is_redaction_token("hello"));
    CHECK_FALSE(MaskingEngine::is_redaction_token("[REDACTED_]"));
    CHECK_FALSE(MaskingEngine::is_redaction_token("[EMAIL:abc]"));
    CHECK_FALSE(MaskingEngine::is_redaction_token("[email:abcdefghijklmnop]"));
    CHECK_FALSE(MaskingEngine::is_redaction_token("[EMAIL:abcdefghijklmnoz]"));
    CHECK_FALSE(MaskingEngine::is_redaction_token("see [REDACTED_EMAIL]"));
}
