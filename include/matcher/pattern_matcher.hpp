#pragma once

#include "core/types.hpp"
#include "detector/detector.hpp"

#include <memory>
#include <string_view>
#include <vector>

namespace piiguard {

/**
 * @brief Pattern Matcher - runs the standalone detector set over one field
 *
 * Every detector whose key scope admits the field contributes candidate
 * spans; overlaps are then resolved deterministically:
 *   1. higher confidence wins
 *   2. equal confidence: longer span wins
 *   3. still tied: earlier start wins
 * (type and detector name break any remaining tie so results never
 * depend on detector registration order).
 *
 * Stateless and const; one instance is shared by all requests.
 */
class PatternMatcher {
public:
    explicit PatternMatcher(std::vector<std::shared_ptr<const IDetector>> detectors);

    /**
     * @brief Detect PII in one field
     * @param path Field path stamped onto every returned span
     * @param text Decoded field text
     * @return Non-overlapping spans ordered by start_offset
     */
    [[nodiscard]] std::vector<Span> match(const FieldPath& path, std::string_view text) const;

    /**
     * @brief Apply the tie-break rules to a candidate list
     */
    [[nodiscard]] static std::vector<Span> resolve_overlaps(std::vector<Span> candidates);

    [[nodiscard]] const std::vector<std::shared_ptr<const IDetector>>& detectors() const noexcept {
        return detectors_;
    }

    /// Types any registered detector can produce
    [[nodiscard]] PiiTypeSet active_types() const noexcept { return active_types_; }

private:
    std::vector<std::shared_ptr<const IDetector>> detectors_;
    PiiTypeSet active_types_;
};

} // namespace piiguard
