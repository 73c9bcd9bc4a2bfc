#include "matcher/pattern_matcher.hpp"

#include <algorithm>
#include <iterator>
#include <map>

namespace piiguard {

PatternMatcher::PatternMatcher(std::vector<std::shared_ptr<const IDetector>> detectors)
    : detectors_(std::move(detectors)) {
    for (const auto& d : detectors_) {
        active_types_.insert(d->type());
    }
}

std::vector<Span> PatternMatcher::match(const FieldPath& path, std::string_view text) const {
    if (text.empty()) return {};

    const auto key = path.leaf_key();
    std::vector<Span> candidates;
    for (const auto& detector : detectors_) {
        if (!detector->applies_to(key)) continue;
        detector->match(text, candidates);
    }
    if (candidates.empty()) return {};

    auto spans = resolve_overlaps(std::move(candidates));
    for (auto& s : spans) {
        s.field_path = path;
    }
    return spans;
}

std::vector<Span> PatternMatcher::resolve_overlaps(std::vector<Span> candidates) {
    if (candidates.size() <= 1) return candidates;

    std::sort(candidates.begin(), candidates.end(), [](const Span& a, const Span& b) {
        if (a.confidence != b.confidence) return a.confidence > b.confidence;
        if (a.length() != b.length()) return a.length() > b.length();
        if (a.start_offset != b.start_offset) return a.start_offset < b.start_offset;
        if (a.pii_type != b.pii_type) return a.pii_type < b.pii_type;
        return a.detector < b.detector;
    });

    // Accepted intervals keyed by start; neighbours decide overlap
    std::map<size_t, size_t> taken;
    std::vector<Span> kept;
    kept.reserve(candidates.size());

    for (auto& span : candidates) {
        auto next = taken.lower_bound(span.start_offset);
        if (next != taken.end() && next->first < span.end_offset) continue;
        if (next != taken.begin()) {
            const auto prev = std::prev(next);
            if (prev->second > span.start_offset) continue;
        }
        taken.emplace(span.start_offset, span.end_offset);
        kept.push_back(std::move(span));
    }

    std::sort(kept.begin(), kept.end(), [](const Span& a, const Span& b) {
        return a.start_offset < b.start_offset;
    });
    return kept;
}

} // namespace piiguard
