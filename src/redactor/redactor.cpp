#include "redactor/redactor.hpp"
#include "redactor/masking.hpp"
#include "core/error.hpp"

#include <format>

namespace piiguard {

Redactor::Redactor(RedactionPolicy policy, double standalone_threshold, std::string hash_salt)
    : policy_(std::move(policy)),
      standalone_threshold_(standalone_threshold),
      hash_salt_(std::move(hash_salt)) {}

std::optional<FieldRewrite> Redactor::rewrite_field(
    size_t leaf_index,
    std::string_view text,
    const std::vector<Span>& spans,
    const PiiTypeSet& participating) const {

    struct Planned {
        const Span* span;
        RedactionStrategy strategy;
    };
    std::vector<Planned> planned;
    planned.reserve(spans.size());

    bool drop = false;
    for (const auto& span : spans) {
        if (!is_redactable(span, participating)) continue;
        if (span.end_offset > text.size() || span.start_offset >= span.end_offset) {
            throw PiiGuardError(ErrorCode::INTERNAL_ERROR, std::format(
                "Span [{}, {}) out of range for field {} of length {}",
                span.start_offset, span.end_offset, span.field_path.to_string(), text.size()));
        }
        const auto strategy = policy_.strategy_for(span.pii_type, participating.contains(span.pii_type));
        if (strategy == RedactionStrategy::DROP_FIELD) drop = true;
        planned.push_back({&span, strategy});
    }

    if (planned.empty()) return std::nullopt;

    FieldRewrite rw;
    rw.leaf_index = leaf_index;
    if (drop) {
        rw.kind = FieldRewrite::Kind::NULLIFY;
        return rw;
    }

    // Spans arrive sorted and non-overlapping
    std::string out;
    out.reserve(text.size() + planned.size() * 16);
    size_t cursor = 0;
    for (const auto& p : planned) {
        const auto& s = *p.span;
        if (s.start_offset < cursor) {
            throw PiiGuardError(ErrorCode::INTERNAL_ERROR, std::format(
                "Overlapping spans in field {}", s.field_path.to_string()));
        }
        out.append(text.substr(cursor, s.start_offset - cursor));
        out += *MaskingEngine::mask_value(text.substr(s.start_offset, s.length()),
                                          p.strategy, s.pii_type, hash_salt_);
        cursor = s.end_offset;
    }
    out.append(text.substr(cursor));

    rw.kind = FieldRewrite::Kind::REPLACE_TEXT;
    rw.text = std::move(out);
    return rw;
}

RedactionResult Redactor::redact(const DocumentWalker& walker, const DetectionSet& detections) const {
    RedactionResult result;
    std::vector<FieldRewrite> rewrites;
    rewrites.reserve(detections.detections.size());

    const auto& participating = detections.combination.participating;
    for (const auto& detection : detections.detections) {
        if (detection.spans.empty()) continue;

        const auto field = walker.field_at(detection.leaf_index);
        auto rw = rewrite_field(detection.leaf_index, field.text, detection.spans, participating);
        if (!rw) continue;

        for (const auto& span : detection.spans) {
            if (is_redactable(span, participating)) ++result.spans_redacted;
        }
        ++result.fields_redacted;
        if (rw->kind == FieldRewrite::Kind::NULLIFY) ++result.fields_dropped;
        rewrites.push_back(std::move(*rw));
    }

    result.payload = walker.apply(std::move(rewrites));
    return result;
}

std::string Redactor::redact_all(const JsonDocument& doc) {
    std::vector<FieldRewrite> rewrites;
    const auto& leaves = doc.leaves();
    for (size_t i = 0; i < leaves.size(); ++i) {
        const auto kind = leaves[i].kind;
        if (kind != LeafKind::STRING && kind != LeafKind::NUMBER) continue;

        FieldRewrite rw;
        rw.leaf_index = i;
        rw.text = std::string(MaskingEngine::kRedactAllToken);
        rewrites.push_back(std::move(rw));
    }
    return DocumentWalker(doc).apply(std::move(rewrites));
}

} // namespace piiguard
