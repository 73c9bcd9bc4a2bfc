#pragma once

#include "detector/detector.hpp"

#include <string>
#include <vector>

namespace piiguard {

/**
 * @brief Card numbers found by a single forward scan of digit groups
 *
 * A candidate is a run of 13-19 digits bounded by non-word characters.
 * Inside the run, a single space or hyphen may follow a 4- or 6-digit
 * group (4-4-4-4, 4-6-5). Candidates must pass the Luhn checksum.
 * Memory use is constant regardless of field length.
 */
class LuhnCardDetector : public DetectorBase {
public:
    LuhnCardDetector(std::string name, double confidence,
                     std::vector<std::string> field_keys = {});

    [[nodiscard]] std::string_view kind() const override { return "luhn"; }

    void match(std::string_view text, std::vector<Span>& out) const override;
};

/**
 * @brief Flags an entire field value when the field key marks it as PII
 *
 * Used for values with no reliable lexical shape (street addresses,
 * device identifiers). Requires field_keys. The span covers the value
 * without surrounding whitespace, and only when it has at least
 * min_words whitespace-separated words.
 */
class FieldValueDetector : public DetectorBase {
public:
    FieldValueDetector(std::string name, PiiType type, double confidence,
                       std::vector<std::string> field_keys, size_t min_words = 1);

    [[nodiscard]] std::string_view kind() const override { return "field_value"; }

    void match(std::string_view text, std::vector<Span>& out) const override;

    [[nodiscard]] size_t min_words() const noexcept { return min_words_; }

private:
    size_t min_words_;
};

} // namespace piiguard
