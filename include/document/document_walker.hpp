#pragma once

#include "document/json_document.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace piiguard {

/**
 * @brief One string-valued leaf handed to the matcher
 */
struct FieldText {
    size_t leaf_index = 0;      // Index into JsonDocument::leaves()
    const FieldPath* path = nullptr;
    std::string text;           // Decoded UTF-8
};

/**
 * @brief Replacement for one leaf value
 *
 * REPLACE_TEXT encodes `text` as a JSON string; NULLIFY writes `null`.
 */
struct FieldRewrite {
    enum class Kind { REPLACE_TEXT, NULLIFY };

    size_t leaf_index = 0;
    Kind kind = Kind::REPLACE_TEXT;
    std::string text;
};

/**
 * @brief Lazy, pull-based cursor over the string leaves of a document
 *
 * Text is decoded only when next() reaches the leaf.
 */
class FieldCursor {
public:
    explicit FieldCursor(const JsonDocument& doc) : doc_(doc) {}

    [[nodiscard]] std::optional<FieldText> next();

private:
    const JsonDocument& doc_;
    size_t pos_ = 0;
};

/**
 * @brief Document Walker - deterministic traversal and reverse rewrite
 *
 * Forward: string leaves in depth-first order (object keys in insertion
 * order, arrays by index). Numbers, booleans and null are skipped.
 *
 * Reverse: apply() splices per-leaf rewrites into a copy of the original
 * bytes. Everything outside the rewritten leaves is copied verbatim.
 */
class DocumentWalker {
public:
    explicit DocumentWalker(const JsonDocument& doc) : doc_(doc) {}

    [[nodiscard]] FieldCursor fields() const { return FieldCursor(doc_); }

    /// Indices (into leaves()) of every STRING leaf, in document order
    [[nodiscard]] std::vector<size_t> string_leaf_indices() const;

    /// Decode one leaf by index (used by parallel workers)
    [[nodiscard]] FieldText field_at(size_t leaf_index) const;

    /**
     * @brief Produce the rewritten payload
     * @param rewrites At most one rewrite per leaf; any order
     */
    [[nodiscard]] std::string apply(std::vector<FieldRewrite> rewrites) const;

    [[nodiscard]] const JsonDocument& document() const noexcept { return doc_; }

private:
    const JsonDocument& doc_;
};

} // namespace piiguard
