#include "detector/combinatorial_detector.hpp"

#include <algorithm>

namespace piiguard {

namespace {

// Absorbs binary rounding in weight sums (0.4 + 0.35 + 0.3)
constexpr double kScoreEpsilon = 1e-9;

} // anonymous namespace

RiskWeights default_risk_weights() {
    RiskWeights w{};
    w[index_of(PiiType::NATIONAL_ID)]   = 1.0;
    w[index_of(PiiType::AADHAAR)]       = 1.0;
    w[index_of(PiiType::PASSPORT)]      = 0.9;
    w[index_of(PiiType::CARD_NUMBER)]   = 1.0;
    w[index_of(PiiType::EMAIL)]         = 0.3;
    w[index_of(PiiType::PHONE)]         = 0.35;
    w[index_of(PiiType::UPI_ID)]        = 0.35;
    w[index_of(PiiType::IP_ADDRESS)]    = 0.3;
    w[index_of(PiiType::NAME)]          = 0.4;
    w[index_of(PiiType::DATE_OF_BIRTH)] = 0.35;
    w[index_of(PiiType::POSTAL_CODE)]   = 0.3;
    w[index_of(PiiType::ADDRESS)]       = 0.4;
    w[index_of(PiiType::DEVICE_ID)]     = 0.3;
    return w;
}

CombinatorialDetector::CombinatorialDetector(std::vector<CombinationRule> rules, RiskWeights weights)
    : rules_(std::move(rules)), weights_(weights) {}

CombinationVerdict CombinatorialDetector::evaluate(const PiiTypeSet& weak_types) const {
    CombinationVerdict verdict;
    if (weak_types.size() < 2) {
        return verdict;
    }

    for (const auto& rule : rules_) {
        const PiiTypeSet candidates = rule.types.empty()
            ? weak_types
            : weak_types.intersect(rule.types);
        if (candidates.size() < std::max<size_t>(rule.min_distinct, 2)) continue;

        double score = 0.0;
        for (const auto t : candidates.to_vector()) {
            score += weights_[index_of(t)];
        }
        if (score + kScoreEpsilon < rule.risk_threshold) continue;

        verdict.flagged = true;
        verdict.rules.push_back(rule.name);
        verdict.participating.merge(candidates);
        verdict.risk_score = std::max(verdict.risk_score, score);
    }
    return verdict;
}

} // namespace piiguard
