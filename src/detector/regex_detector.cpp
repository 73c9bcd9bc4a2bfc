#include "detector/regex_detector.hpp"
#include "core/error.hpp"

#include <algorithm>
#include <format>

namespace piiguard {

RegexDetector::RegexDetector(std::string name, PiiType type, double confidence,
                             const std::string& pattern, Validator validator,
                             std::vector<std::string> field_keys)
    : DetectorBase(std::move(name), type, confidence, std::move(field_keys)),
      pattern_(pattern),
      validator_(validator) {
    try {
        regex_ = std::regex(pattern_, std::regex::ECMAScript | std::regex::optimize);
    } catch (const std::regex_error& e) {
        throw DetectorConfigError(std::format(
            "Detector '{}': invalid regex pattern: {}", this->name(), e.what()));
    }
}

void RegexDetector::match(std::string_view text, std::vector<Span>& out) const {
    if (text.empty()) return;

    // std::regex recurses once per character a loop consumes, so the
    // engine never sees more than kWindowBytes at a time
    const size_t n = text.size();
    size_t base = 0;

    while (base < n) {
        const size_t end = std::min(n, base + kWindowBytes);
        const bool last = end == n;

        // Matches starting at or after `resume` belong to the next window
        size_t resume = last ? n : end - kMaxMatchBytes;
        size_t accepted_end = base;

        auto flags = std::regex_constants::match_default;
        if (base > 0) flags |= std::regex_constants::match_prev_avail;
        if (!last) flags |= std::regex_constants::match_not_eow | std::regex_constants::match_not_eol;

        const char* first = text.data() + base;
        for (std::cregex_iterator it(first, text.data() + end, regex_, flags), done; it != done; ++it) {
            const auto& m = *it;
            if (m.length(0) == 0) continue;

            const size_t start = base + static_cast<size_t>(m.position(0));
            const size_t stop_at = start + static_cast<size_t>(m.length(0));
            if (start >= resume) break;

            // Cut off by the window edge: rescan from its start
            if (!last && stop_at == end && start > base) {
                resume = start;
                break;
            }

            accepted_end = stop_at;
            if (!validate::run(validator_, text.substr(start, stop_at - start))) continue;
            emit(start, stop_at, out);
        }

        if (last) break;
        base = std::max(resume, accepted_end);
    }
}

} // namespace piiguard
