#include "detector/structural_detectors.hpp"
#include "detector/validators.hpp"
#include "core/error.hpp"
#include "redactor/masking.hpp"

#include <format>

namespace piiguard {

namespace {

[[nodiscard]] inline bool is_digit(char c) noexcept { return c >= '0' && c <= '9'; }

[[nodiscard]] inline bool is_word(char c) noexcept {
    return is_digit(c) || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
}

[[nodiscard]] inline bool is_space(char c) noexcept {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

constexpr size_t kMinCardDigits = 13;
constexpr size_t kMaxCardDigits = 19;

} // anonymous namespace

// ============================================================================
// LuhnCardDetector
// ============================================================================

LuhnCardDetector::LuhnCardDetector(std::string name, double confidence,
                                   std::vector<std::string> field_keys)
    : DetectorBase(std::move(name), PiiType::CARD_NUMBER, confidence, std::move(field_keys)) {}

void LuhnCardDetector::match(std::string_view text, std::vector<Span>& out) const {
    const size_t n = text.size();
    size_t i = 0;

    while (i < n) {
        if (!is_digit(text[i]) || (i > 0 && is_word(text[i - 1]))) {
            ++i;
            continue;
        }

        const size_t start = i;
        size_t digits = 0;
        size_t group = 0;
        size_t run_end = i;

        size_t j = i;
        while (j < n) {
            if (is_digit(text[j])) {
                ++digits;
                ++group;
                ++j;
                run_end = j;
                continue;
            }
            const bool separator = (text[j] == ' ' || text[j] == '-');
            if (separator && (group == 4 || group == 6) && j + 1 < n && is_digit(text[j + 1])) {
                group = 0;
                ++j;
                continue;
            }
            break;
        }

        const bool bounded = run_end >= n || !is_word(text[run_end]);
        if (bounded && digits >= kMinCardDigits && digits <= kMaxCardDigits &&
            validate::luhn(text.substr(start, run_end - start))) {
            emit(start, run_end, out);
        }
        i = run_end;
    }
}

// ============================================================================
// FieldValueDetector
// ============================================================================

FieldValueDetector::FieldValueDetector(std::string name, PiiType type, double confidence,
                                       std::vector<std::string> field_keys, size_t min_words)
    : DetectorBase(std::move(name), type, confidence, std::move(field_keys)),
      min_words_(min_words == 0 ? 1 : min_words) {
    if (this->field_keys().empty()) {
        throw DetectorConfigError(std::format(
            "Detector '{}': field_value detectors require field_keys", this->name()));
    }
}

void FieldValueDetector::match(std::string_view text, std::vector<Span>& out) const {
    size_t start = 0;
    size_t end = text.size();
    while (start < end && is_space(text[start])) ++start;
    while (end > start && is_space(text[end - 1])) --end;
    if (start == end) return;

    // Already-redacted values carry no PII
    if (MaskingEngine::is_redaction_token(text.substr(start, end - start))) return;

    size_t words = 0;
    bool in_word = false;
    for (size_t k = start; k < end; ++k) {
        const bool space = is_space(text[k]);
        if (!space && !in_word) ++words;
        in_word = !space;
    }
    if (words < min_words_) return;

    emit(start, end, out);
}

} // namespace piiguard
