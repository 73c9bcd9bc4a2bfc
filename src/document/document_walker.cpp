#include "document/document_walker.hpp"
#include "core/error.hpp"

#include <algorithm>
#include <format>

namespace piiguard {

std::optional<FieldText> FieldCursor::next() {
    const auto& leaves = doc_.leaves();
    while (pos_ < leaves.size()) {
        const size_t idx = pos_++;
        const auto& leaf = leaves[idx];
        if (leaf.kind != LeafKind::STRING) continue;
        return FieldText{idx, &leaf.path, doc_.decode_string(leaf)};
    }
    return std::nullopt;
}

std::vector<size_t> DocumentWalker::string_leaf_indices() const {
    std::vector<size_t> out;
    const auto& leaves = doc_.leaves();
    out.reserve(leaves.size());
    for (size_t i = 0; i < leaves.size(); ++i) {
        if (leaves[i].kind == LeafKind::STRING) out.push_back(i);
    }
    return out;
}

FieldText DocumentWalker::field_at(size_t leaf_index) const {
    const auto& leaf = doc_.leaves().at(leaf_index);
    if (leaf.kind != LeafKind::STRING) {
        throw PiiGuardError(ErrorCode::INTERNAL_ERROR,
            std::format("Leaf {} is not a string", leaf.path.to_string()));
    }
    return FieldText{leaf_index, &leaf.path, doc_.decode_string(leaf)};
}

std::string DocumentWalker::apply(std::vector<FieldRewrite> rewrites) const {
    const auto& raw = doc_.raw();
    if (rewrites.empty()) {
        return raw;
    }

    std::sort(rewrites.begin(), rewrites.end(),
              [](const FieldRewrite& a, const FieldRewrite& b) {
                  return a.leaf_index < b.leaf_index;
              });

    const auto& leaves = doc_.leaves();
    std::string out;
    out.reserve(raw.size() + rewrites.size() * 16);

    size_t cursor = 0;
    size_t last_leaf = leaves.size();
    for (const auto& rw : rewrites) {
        if (rw.leaf_index >= leaves.size()) {
            throw PiiGuardError(ErrorCode::INTERNAL_ERROR,
                std::format("Rewrite targets unknown leaf {}", rw.leaf_index));
        }
        if (rw.leaf_index == last_leaf) {
            throw PiiGuardError(ErrorCode::INTERNAL_ERROR,
                std::format("Duplicate rewrite for {}", leaves[rw.leaf_index].path.to_string()));
        }
        last_leaf = rw.leaf_index;

        const auto& leaf = leaves[rw.leaf_index];
        out.append(raw, cursor, leaf.begin - cursor);
        if (rw.kind == FieldRewrite::Kind::NULLIFY) {
            out += "null";
        } else {
            out += json_codec::encode_string(rw.text);
        }
        cursor = leaf.end;
    }
    out.append(raw, cursor, std::string::npos);
    return out;
}

} // namespace piiguard
