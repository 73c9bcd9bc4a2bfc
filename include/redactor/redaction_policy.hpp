#pragma once

#include "core/types.hpp"

#include <array>
#include <optional>

namespace piiguard {

struct PolicyEntry {
    RedactionStrategy strategy = RedactionStrategy::MASK;
    RedactionStrategy elevated = RedactionStrategy::DROP_FIELD;   // Under combinatorial escalation

    [[nodiscard]] bool operator==(const PolicyEntry&) const = default;
};

/**
 * @brief PiiType -> replacement strategy mapping
 *
 * Every type the active detector set can produce must have exactly one
 * entry; require_coverage() enforces that when a snapshot is compiled.
 */
class RedactionPolicy {
public:
    /// Defaults: partial_last4 for card/national_id/aadhaar/phone, hash for
    /// device_id, mask otherwise; drop_field when elevated
    [[nodiscard]] static RedactionPolicy builtin();

    void set(PiiType type, PolicyEntry entry) noexcept { entries_[index_of(type)] = entry; }

    [[nodiscard]] bool has(PiiType type) const noexcept {
        return entries_[index_of(type)].has_value();
    }

    /// Throws DetectorConfigError when the type has no entry
    [[nodiscard]] const PolicyEntry& at(PiiType type) const;

    [[nodiscard]] RedactionStrategy strategy_for(PiiType type, bool elevated) const {
        const auto& e = at(type);
        return elevated ? e.elevated : e.strategy;
    }

    /// Throws DetectorConfigError naming every active type without an entry
    void require_coverage(const PiiTypeSet& active) const;

private:
    std::array<std::optional<PolicyEntry>, kPiiTypeCount> entries_{};
};

} // namespace piiguard
