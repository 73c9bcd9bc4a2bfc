#pragma once

#include "core/types.hpp"
#include "document/document_walker.hpp"
#include "redactor/redaction_policy.hpp"

#include <optional>
#include <string>
#include <vector>

namespace piiguard {

/**
 * @brief Rewritten payload plus what changed
 */
struct RedactionResult {
    std::string payload;
    size_t fields_redacted = 0;     // Fields whose value changed
    size_t fields_dropped = 0;      // Of those, fields set to null
    size_t spans_redacted = 0;

    [[nodiscard]] bool modified() const noexcept { return fields_redacted > 0; }
};

/**
 * @brief Redactor - applies the RedactionPolicy to a DetectionSet
 *
 * A span is redactable when it is standalone (confidence >= threshold)
 * or its type participates in a fired combination rule. Participating
 * types use their elevated strategy. Each field's replacement is built
 * in one pass over its spans, left to right; a field with any
 * DROP_FIELD span becomes null as a whole.
 */
class Redactor {
public:
    Redactor(RedactionPolicy policy, double standalone_threshold, std::string hash_salt);

    [[nodiscard]] RedactionResult redact(const DocumentWalker& walker,
                                         const DetectionSet& detections) const;

    /**
     * @brief Replacement for one field, or nullopt if nothing in it is redactable
     */
    [[nodiscard]] std::optional<FieldRewrite> rewrite_field(
        size_t leaf_index,
        std::string_view text,
        const std::vector<Span>& spans,
        const PiiTypeSet& participating) const;

    /**
     * @brief Conservative fallback: every string and number leaf -> "[REDACTED]"
     *
     * Booleans and null are kept so the shape survives.
     */
    [[nodiscard]] static std::string redact_all(const JsonDocument& doc);

    [[nodiscard]] bool is_redactable(const Span& span, const PiiTypeSet& participating) const noexcept {
        return span.confidence >= standalone_threshold_ || participating.contains(span.pii_type);
    }

    [[nodiscard]] const RedactionPolicy& policy() const noexcept { return policy_; }
    [[nodiscard]] double standalone_threshold() const noexcept { return standalone_threshold_; }

private:
    RedactionPolicy policy_;
    double standalone_threshold_;
    std::string hash_salt_;
};

} // namespace piiguard
