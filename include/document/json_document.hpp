#pragma once

#include "core/types.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace piiguard {

inline constexpr size_t kDefaultMaxStructureDepth = 64;

enum class LeafKind : uint8_t {
    STRING,
    NUMBER,
    BOOLEAN,
    NULL_VALUE
};

/**
 * @brief A scalar value inside the payload, located by its raw byte range
 *
 * For strings the range includes the surrounding quotes. Leaves are stored
 * in document order, so their ranges are strictly increasing.
 */
struct LeafRef {
    FieldPath path;
    LeafKind kind = LeafKind::NULL_VALUE;
    size_t begin = 0;
    size_t end = 0;
    bool has_escapes = false;   // String token contains a backslash
};

/**
 * @brief Immutable, position-indexed JSON payload
 *
 * Parsing validates UTF-8 and RFC 8259 grammar and records every scalar
 * leaf with its path and raw byte range. The original bytes are kept
 * untouched; rewrites splice replacement tokens into a copy (see
 * DocumentWalker::apply), so whitespace, number spelling and escapes of
 * untouched values survive byte-for-byte.
 *
 * Throws PayloadDecodeError (bad UTF-8 / malformed JSON) or
 * StructureTooDeepError (nesting beyond max_depth).
 */
class JsonDocument {
public:
    [[nodiscard]] static JsonDocument parse(std::string payload,
                                            size_t max_depth = kDefaultMaxStructureDepth);

    [[nodiscard]] const std::string& raw() const noexcept { return raw_; }
    [[nodiscard]] const std::vector<LeafRef>& leaves() const noexcept { return leaves_; }
    [[nodiscard]] size_t max_depth_seen() const noexcept { return max_depth_seen_; }

    [[nodiscard]] std::string_view raw_token(const LeafRef& leaf) const noexcept {
        return std::string_view(raw_).substr(leaf.begin, leaf.end - leaf.begin);
    }

    /// Decoded text of a STRING leaf (escape sequences resolved)
    [[nodiscard]] std::string decode_string(const LeafRef& leaf) const;

private:
    JsonDocument() = default;

    std::string raw_;
    std::vector<LeafRef> leaves_;
    size_t max_depth_seen_ = 0;
};

/**
 * @brief Offset of the first invalid UTF-8 byte, or nullopt if the buffer is valid
 *
 * Rejects overlong encodings, UTF-16 surrogates and code points above U+10FFFF.
 */
[[nodiscard]] std::optional<size_t> find_invalid_utf8(std::string_view bytes) noexcept;

namespace json_codec {

/// Decode a quoted JSON string token ("a\nb") into UTF-8 text
[[nodiscard]] std::string decode_string_token(std::string_view token);

/// Encode UTF-8 text as a quoted JSON string token
[[nodiscard]] std::string encode_string(std::string_view text);

} // namespace json_codec

} // namespace piiguard
