#include "core/types.hpp"
#include "core/utils.hpp"

namespace piiguard {

std::string pii_type_label(PiiType t) {
    return utils::to_upper(pii_type_to_string(t));
}

std::optional<PiiType> parse_pii_type(std::string_view name) {
    const auto lowered = utils::to_lower(utils::trim(name));
    for (const auto t : kAllPiiTypes) {
        if (pii_type_to_string(t) == lowered) return t;
    }
    // Common aliases seen in config files
    if (lowered == "ssn") return PiiType::NATIONAL_ID;
    if (lowered == "credit_card") return PiiType::CARD_NUMBER;
    if (lowered == "dob") return PiiType::DATE_OF_BIRTH;
    if (lowered == "zip") return PiiType::POSTAL_CODE;
    return std::nullopt;
}

std::optional<RedactionStrategy> parse_strategy(std::string_view name) {
    const auto lowered = utils::to_lower(utils::trim(name));
    if (lowered == "mask" || lowered == "mask_with_token" || lowered == "redact") {
        return RedactionStrategy::MASK;
    }
    if (lowered == "hash") return RedactionStrategy::HASH;
    if (lowered == "drop_field" || lowered == "drop") return RedactionStrategy::DROP_FIELD;
    if (lowered == "partial_last4" || lowered == "partial") return RedactionStrategy::PARTIAL_LAST4;
    return std::nullopt;
}

std::optional<FallbackPolicy> parse_fallback_policy(std::string_view name) {
    const auto lowered = utils::to_lower(utils::trim(name));
    if (lowered == "reject") return FallbackPolicy::REJECT;
    if (lowered == "redact_all") return FallbackPolicy::REDACT_ALL;
    return std::nullopt;
}

std::string FieldPath::to_string() const {
    if (segments.empty()) return "/";

    std::string out;
    for (const auto& seg : segments) {
        out += '/';
        if (seg.is_index) {
            out += std::to_string(seg.index);
            continue;
        }
        for (const char c : seg.key) {
            switch (c) {
                case '~': out += "~0"; break;
                case '/': out += "~1"; break;
                default:  out += c;
            }
        }
    }
    return out;
}

} // namespace piiguard
