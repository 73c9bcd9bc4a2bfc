#pragma once

#include "core/types.hpp"

#include <array>
#include <string>
#include <vector>

namespace piiguard {

/**
 * @brief A risk-increasing co-occurrence of weak PII types
 *
 * Fires when the weak types present in a document that fall within
 * `types` (empty = any type) number at least `min_distinct` and their
 * summed risk weights reach `risk_threshold`.
 */
struct CombinationRule {
    std::string name;
    PiiTypeSet types;
    size_t min_distinct = 2;
    double risk_threshold = 0.6;
};

using RiskWeights = std::array<double, kPiiTypeCount>;

[[nodiscard]] RiskWeights default_risk_weights();

/**
 * @brief Document-level co-occurrence evaluation
 *
 * Runs after every field's spans are collected. Input is the set of
 * types that produced at least one below-threshold (weak) span; output
 * is the union of types participating in any fired rule.
 */
class CombinatorialDetector {
public:
    CombinatorialDetector(std::vector<CombinationRule> rules, RiskWeights weights);

    [[nodiscard]] CombinationVerdict evaluate(const PiiTypeSet& weak_types) const;

    [[nodiscard]] double weight(PiiType t) const noexcept { return weights_[index_of(t)]; }
    [[nodiscard]] const std::vector<CombinationRule>& rules() const noexcept { return rules_; }

private:
    std::vector<CombinationRule> rules_;
    RiskWeights weights_;
};

} // namespace piiguard
