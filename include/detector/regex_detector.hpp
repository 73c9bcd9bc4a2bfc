#pragma once

#include "detector/detector.hpp"
#include "detector/validators.hpp"

#include <regex>
#include <string>
#include <vector>

namespace piiguard {

/**
 * @brief Regex rule with an optional post-match validator
 *
 * The pattern is compiled once (ECMAScript, optimize). Each non-empty
 * match that passes the validator becomes a span. Throws
 * DetectorConfigError if the pattern does not compile.
 *
 * Text longer than kWindowBytes is scanned in overlapping windows. A match
 * longer than kMaxMatchBytes that crosses a window edge may be missed.
 */
class RegexDetector : public DetectorBase {
public:
    RegexDetector(std::string name, PiiType type, double confidence,
                  const std::string& pattern, Validator validator = Validator::NONE,
                  std::vector<std::string> field_keys = {});

    static constexpr size_t kWindowBytes = 4096;
    static constexpr size_t kMaxMatchBytes = 512;

    [[nodiscard]] std::string_view kind() const override { return "regex"; }

    void match(std::string_view text, std::vector<Span>& out) const override;

    [[nodiscard]] const std::string& pattern() const noexcept { return pattern_; }
    [[nodiscard]] Validator validator() const noexcept { return validator_; }

private:
    std::string pattern_;
    std::regex regex_;
    Validator validator_;
};

} // namespace piiguard
