#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace piiguard {

// ============================================================================
// PII Categories
// ============================================================================

enum class PiiType : uint8_t {
    NATIONAL_ID,
    AADHAAR,
    PASSPORT,
    CARD_NUMBER,
    EMAIL,
    PHONE,
    UPI_ID,
    IP_ADDRESS,
    NAME,
    DATE_OF_BIRTH,
    POSTAL_CODE,
    ADDRESS,
    DEVICE_ID
};

inline constexpr size_t kPiiTypeCount = 13;

inline constexpr std::array<PiiType, kPiiTypeCount> kAllPiiTypes = {
    PiiType::NATIONAL_ID, PiiType::AADHAAR, PiiType::PASSPORT,
    PiiType::CARD_NUMBER, PiiType::EMAIL, PiiType::PHONE,
    PiiType::UPI_ID, PiiType::IP_ADDRESS, PiiType::NAME,
    PiiType::DATE_OF_BIRTH, PiiType::POSTAL_CODE, PiiType::ADDRESS,
    PiiType::DEVICE_ID
};

[[nodiscard]] inline constexpr size_t index_of(PiiType t) noexcept {
    return static_cast<size_t>(t);
}

/// Config-facing lowercase name ("card_number")
[[nodiscard]] inline constexpr std::string_view pii_type_to_string(PiiType t) noexcept {
    switch (t) {
        case PiiType::NATIONAL_ID:   return "national_id";
        case PiiType::AADHAAR:       return "aadhaar";
        case PiiType::PASSPORT:      return "passport";
        case PiiType::CARD_NUMBER:   return "card_number";
        case PiiType::EMAIL:         return "email";
        case PiiType::PHONE:         return "phone";
        case PiiType::UPI_ID:        return "upi_id";
        case PiiType::IP_ADDRESS:    return "ip_address";
        case PiiType::NAME:          return "name";
        case PiiType::DATE_OF_BIRTH: return "date_of_birth";
        case PiiType::POSTAL_CODE:   return "postal_code";
        case PiiType::ADDRESS:       return "address";
        case PiiType::DEVICE_ID:     return "device_id";
    }
    return "unknown";
}

/// Token-facing uppercase name ("CARD_NUMBER")
[[nodiscard]] std::string pii_type_label(PiiType t);

[[nodiscard]] std::optional<PiiType> parse_pii_type(std::string_view name);

/// Fixed-size set of PII types (one bit per category)
class PiiTypeSet {
public:
    void insert(PiiType t) noexcept { bits_ |= bit(t); }
    [[nodiscard]] bool contains(PiiType t) const noexcept { return (bits_ & bit(t)) != 0; }
    [[nodiscard]] bool empty() const noexcept { return bits_ == 0; }
    [[nodiscard]] size_t size() const noexcept { return static_cast<size_t>(__builtin_popcount(bits_)); }
    void merge(const PiiTypeSet& other) noexcept { bits_ |= other.bits_; }

    [[nodiscard]] PiiTypeSet intersect(const PiiTypeSet& other) const noexcept {
        PiiTypeSet out;
        out.bits_ = bits_ & other.bits_;
        return out;
    }

    [[nodiscard]] std::vector<PiiType> to_vector() const {
        std::vector<PiiType> out;
        for (const auto t : kAllPiiTypes) {
            if (contains(t)) out.push_back(t);
        }
        return out;
    }

    [[nodiscard]] bool operator==(const PiiTypeSet&) const = default;

private:
    static constexpr uint32_t bit(PiiType t) noexcept {
        return 1u << static_cast<uint32_t>(t);
    }
    uint32_t bits_ = 0;
};

// ============================================================================
// Field Paths
// ============================================================================

/// One step into a JSON structure: an object key or an array index
struct PathSegment {
    std::string key;
    size_t index = 0;
    bool is_index = false;

    static PathSegment object_key(std::string k) {
        PathSegment s;
        s.key = std::move(k);
        return s;
    }

    static PathSegment array_index(size_t i) {
        PathSegment s;
        s.index = i;
        s.is_index = true;
        return s;
    }

    [[nodiscard]] bool operator==(const PathSegment&) const = default;
};

struct FieldPath {
    std::vector<PathSegment> segments;

    /// Last object key on the path ("" for root or array-only paths)
    [[nodiscard]] std::string_view leaf_key() const noexcept {
        for (auto it = segments.rbegin(); it != segments.rend(); ++it) {
            if (!it->is_index) return it->key;
        }
        return {};
    }

    /// JSON-Pointer rendering: /user/emails/0 (~ and / escaped per RFC 6901)
    [[nodiscard]] std::string to_string() const;

    [[nodiscard]] bool operator==(const FieldPath&) const = default;
};

// ============================================================================
// Detection Results
// ============================================================================

struct Span {
    FieldPath field_path;
    size_t start_offset = 0;        // Byte offset into decoded field text
    size_t end_offset = 0;          // Exclusive
    PiiType pii_type = PiiType::NAME;
    double confidence = 0.0;
    std::string detector;           // Detector name that produced the span

    [[nodiscard]] size_t length() const noexcept { return end_offset - start_offset; }

    [[nodiscard]] bool overlaps(const Span& o) const noexcept {
        return start_offset < o.end_offset && o.start_offset < end_offset;
    }
};

struct Detection {
    FieldPath field_path;
    std::vector<Span> spans;        // Ordered by start_offset, non-overlapping
    bool combinatorial_flag = false;
    size_t leaf_index = 0;          // Position in JsonDocument::leaves()
};

/// Outcome of combinatorial co-occurrence evaluation for one document
struct CombinationVerdict {
    bool flagged = false;
    std::vector<std::string> rules;     // Names of the rules that fired
    PiiTypeSet participating;           // Types escalated to elevated redaction
    double risk_score = 0.0;            // Highest score among fired rules
};

struct DetectionSet {
    std::vector<Detection> detections;  // Field order (document order)
    CombinationVerdict combination;
    size_t fields_scanned = 0;

    [[nodiscard]] size_t span_count() const noexcept {
        size_t n = 0;
        for (const auto& d : detections) n += d.spans.size();
        return n;
    }
};

// ============================================================================
// Redaction Strategies
// ============================================================================

enum class RedactionStrategy : uint8_t {
    MASK,           // [REDACTED_EMAIL]
    HASH,           // [EMAIL:kdjfmeopabcdefgh]
    DROP_FIELD,     // whole field value -> null
    PARTIAL_LAST4   // XXXX-XXXX-XXXX-1111
};

[[nodiscard]] inline constexpr std::string_view strategy_to_string(RedactionStrategy s) noexcept {
    switch (s) {
        case RedactionStrategy::MASK:          return "mask";
        case RedactionStrategy::HASH:          return "hash";
        case RedactionStrategy::DROP_FIELD:    return "drop_field";
        case RedactionStrategy::PARTIAL_LAST4: return "partial_last4";
    }
    return "mask";
}

[[nodiscard]] std::optional<RedactionStrategy> parse_strategy(std::string_view name);

// ============================================================================
// Pipeline State & Fallback
// ============================================================================

enum class PipelineState : uint8_t {
    RECEIVED,
    EXTRACTING,
    DETECTING,
    REDACTING,
    FORWARDING,     // terminal success
    DEGRADED,       // terminal failure-fallback
    CANCELLED       // terminal, upstream gave up
};

[[nodiscard]] inline constexpr std::string_view state_to_string(PipelineState s) noexcept {
    switch (s) {
        case PipelineState::RECEIVED:   return "RECEIVED";
        case PipelineState::EXTRACTING: return "EXTRACTING";
        case PipelineState::DETECTING:  return "DETECTING";
        case PipelineState::REDACTING:  return "REDACTING";
        case PipelineState::FORWARDING: return "FORWARDING";
        case PipelineState::DEGRADED:   return "DEGRADED";
        case PipelineState::CANCELLED:  return "CANCELLED";
    }
    return "UNKNOWN";
}

enum class FallbackPolicy : uint8_t {
    REJECT,
    REDACT_ALL
};

[[nodiscard]] inline constexpr std::string_view fallback_to_string(FallbackPolicy p) noexcept {
    return p == FallbackPolicy::REJECT ? "reject" : "redact_all";
}

[[nodiscard]] std::optional<FallbackPolicy> parse_fallback_policy(std::string_view name);

enum class Outcome : uint8_t {
    FORWARDED,
    REJECTED,
    FALLBACK_REDACTED,
    ABORTED
};

[[nodiscard]] inline constexpr std::string_view outcome_to_string(Outcome o) noexcept {
    switch (o) {
        case Outcome::FORWARDED:         return "forwarded";
        case Outcome::REJECTED:          return "rejected";
        case Outcome::FALLBACK_REDACTED: return "fallback_redacted";
        case Outcome::ABORTED:           return "aborted";
    }
    return "unknown";
}

} // namespace piiguard
