#include "redactor/redaction_policy.hpp"
#include "core/error.hpp"

#include <format>

namespace piiguard {

RedactionPolicy RedactionPolicy::builtin() {
    RedactionPolicy policy;
    for (const auto t : kAllPiiTypes) {
        policy.set(t, PolicyEntry{RedactionStrategy::MASK, RedactionStrategy::DROP_FIELD});
    }
    for (const auto t : {PiiType::CARD_NUMBER, PiiType::NATIONAL_ID, PiiType::AADHAAR, PiiType::PHONE}) {
        policy.set(t, PolicyEntry{RedactionStrategy::PARTIAL_LAST4, RedactionStrategy::DROP_FIELD});
    }
    policy.set(PiiType::DEVICE_ID, PolicyEntry{RedactionStrategy::HASH, RedactionStrategy::DROP_FIELD});
    return policy;
}

const PolicyEntry& RedactionPolicy::at(PiiType type) const {
    const auto& entry = entries_[index_of(type)];
    if (!entry) {
        throw DetectorConfigError(std::format(
            "No redaction policy entry for PII type '{}'", pii_type_to_string(type)));
    }
    return *entry;
}

void RedactionPolicy::require_coverage(const PiiTypeSet& active) const {
    std::string missing;
    for (const auto t : active.to_vector()) {
        if (has(t)) continue;
        if (!missing.empty()) missing += ", ";
        missing += pii_type_to_string(t);
    }
    if (!missing.empty()) {
        throw DetectorConfigError(std::format(
            "Redaction policy has no entry for active PII type(s): {}", missing));
    }
}

} // namespace piiguard
