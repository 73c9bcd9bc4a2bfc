#include "detector/detector.hpp"
#include "core/utils.hpp"

#include <algorithm>

namespace piiguard {

DetectorBase::DetectorBase(std::string name, PiiType type, double confidence,
                           std::vector<std::string> field_keys)
    : name_(std::move(name)),
      type_(type),
      confidence_(std::clamp(confidence, 0.0, 1.0)),
      field_keys_(std::move(field_keys)) {
    for (auto& k : field_keys_) {
        k = utils::to_lower(k);
    }
}

bool DetectorBase::applies_to(std::string_view field_key) const {
    if (field_keys_.empty()) return true;
    if (field_key.empty()) return false;

    const auto lowered = utils::to_lower(field_key);
    return std::find(field_keys_.begin(), field_keys_.end(), lowered) != field_keys_.end();
}

void DetectorBase::emit(size_t start, size_t end, std::vector<Span>& out) const {
    if (start >= end) return;
    Span span;
    span.start_offset = start;
    span.end_offset = end;
    span.pii_type = type_;
    span.confidence = confidence_;
    span.detector = name_;
    out.push_back(std::move(span));
}

} // namespace piiguard
