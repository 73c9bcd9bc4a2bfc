#include "redactor/masking.hpp"

#include <openssl/sha.h>

namespace piiguard {

namespace {

constexpr std::string_view kMaskPrefix = "[REDACTED_";
constexpr size_t kDigestBytes = 8;
constexpr size_t kKeepTail = 4;

[[nodiscard]] inline bool is_alnum(char c) noexcept {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

[[nodiscard]] inline bool is_label_char(char c) noexcept {
    return (c >= 'A' && c <= 'Z') || c == '_';
}

} // anonymous namespace

std::optional<std::string> MaskingEngine::mask_value(
    std::string_view value,
    RedactionStrategy strategy,
    PiiType type,
    std::string_view salt) {

    switch (strategy) {
        case RedactionStrategy::MASK:
            return mask_token(type);

        case RedactionStrategy::HASH:
            return hash_token(type, value, salt);

        case RedactionStrategy::PARTIAL_LAST4:
            return partial_last4(value);

        case RedactionStrategy::DROP_FIELD:
            return std::nullopt;
    }
    return mask_token(type);
}

std::string MaskingEngine::mask_token(PiiType type) {
    std::string result(kMaskPrefix);
    result += pii_type_label(type);
    result += ']';
    return result;
}

std::string MaskingEngine::hash_token(PiiType type, std::string_view value, std::string_view salt) {
    std::string result;
    result.reserve(pii_type_label(type).size() + 3 + kDigestBytes * 2);
    result += '[';
    result += pii_type_label(type);
    result += ':';
    result += digest_letters(salt, value);
    result += ']';
    return result;
}

std::string MaskingEngine::partial_last4(std::string_view value) {
    size_t alnum_total = 0;
    for (const char c : value) {
        if (is_alnum(c)) ++alnum_total;
    }

    // Too short to reveal anything: mask every alphanumeric
    const size_t reveal_from = alnum_total <= kKeepTail ? alnum_total : alnum_total - kKeepTail;

    std::string result(value);
    size_t seen = 0;
    for (char& c : result) {
        if (!is_alnum(c)) continue;
        if (seen < reveal_from) c = 'X';
        ++seen;
    }
    return result;
}

bool MaskingEngine::is_redaction_token(std::string_view text) noexcept {
    if (text == kRedactAllToken) return true;
    if (text.size() < 3 || text.front() != '[' || text.back() != ']') return false;

    const auto body = text.substr(1, text.size() - 2);

    // [REDACTED_<TYPE>]
    if (text.starts_with(kMaskPrefix)) {
        const auto label = text.substr(kMaskPrefix.size(), text.size() - kMaskPrefix.size() - 1);
        if (label.empty()) return false;
        for (const char c : label) {
            if (!is_label_char(c)) return false;
        }
        return true;
    }

    // [<TYPE>:<digest>]
    const auto colon = body.find(':');
    if (colon == std::string_view::npos || colon == 0) return false;
    for (const char c : body.substr(0, colon)) {
        if (!is_label_char(c)) return false;
    }
    const auto digest = body.substr(colon + 1);
    if (digest.size() != kDigestBytes * 2) return false;
    for (const char c : digest) {
        if (c < 'a' || c > 'p') return false;
    }
    return true;
}

std::string MaskingEngine::digest_letters(std::string_view salt, std::string_view value) {
    std::string input;
    input.reserve(salt.size() + value.size());
    input.append(salt);
    input.append(value);

    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(input.data()), input.size(), hash);

    // One letter per nibble from a-p: digit-free, so digit detectors cannot fire on it
    std::string result;
    result.reserve(kDigestBytes * 2);
    for (size_t i = 0; i < kDigestBytes; ++i) {
        result += static_cast<char>('a' + ((hash[i] >> 4) & 0x0F));
        result += static_cast<char>('a' + (hash[i] & 0x0F));
    }
    return result;
}

} // namespace piiguard
