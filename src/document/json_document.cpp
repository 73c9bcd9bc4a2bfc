#include "document/json_document.hpp"
#include "core/error.hpp"

#include <glaze/glaze.hpp>

#include <algorithm>

namespace piiguard {

namespace {

[[nodiscard]] inline bool is_digit(char c) noexcept { return c >= '0' && c <= '9'; }

[[nodiscard]] inline bool is_hex(char c) noexcept {
    return is_digit(c) || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

/**
 * @brief Single-pass recursive-descent indexer
 *
 * Recursion depth is bounded by max_depth, so adversarial nesting fails
 * with StructureTooDeepError before it can exhaust the stack.
 */
class Indexer {
public:
    Indexer(const std::string& src, size_t max_depth, std::vector<LeafRef>& leaves)
        : src_(src), max_depth_(max_depth), leaves_(leaves) {}

    void run() {
        skip_ws();
        FieldPath path;
        parse_value(path, 0);
        skip_ws();
        if (pos_ != src_.size()) {
            fail("Trailing characters after JSON value");
        }
    }

    [[nodiscard]] size_t max_depth_seen() const noexcept { return max_depth_seen_; }

private:
    [[noreturn]] void fail(const char* reason) const {
        throw PayloadDecodeError(reason, pos_);
    }

    void skip_ws() noexcept {
        while (pos_ < src_.size()) {
            const char c = src_[pos_];
            if (c != ' ' && c != '\t' && c != '\n' && c != '\r') break;
            ++pos_;
        }
    }

    void expect(char c) {
        if (pos_ >= src_.size() || src_[pos_] != c) {
            fail(c == ':' ? "Expected ':' after object key" : "Unexpected character");
        }
        ++pos_;
    }

    void enter(size_t depth) {
        if (depth > max_depth_) {
            throw StructureTooDeepError(max_depth_, pos_);
        }
        max_depth_seen_ = std::max(max_depth_seen_, depth);
    }

    void push_leaf(const FieldPath& path, LeafKind kind, size_t begin, bool escapes = false) {
        LeafRef leaf;
        leaf.path = path;
        leaf.kind = kind;
        leaf.begin = begin;
        leaf.end = pos_;
        leaf.has_escapes = escapes;
        leaves_.push_back(std::move(leaf));
    }

    void parse_value(FieldPath& path, size_t depth) {
        if (pos_ >= src_.size()) {
            fail("Unexpected end of input");
        }

        const size_t begin = pos_;
        switch (src_[pos_]) {
            case '{':
                parse_object(path, depth + 1);
                return;
            case '[':
                parse_array(path, depth + 1);
                return;
            case '"': {
                const bool escapes = scan_string();
                push_leaf(path, LeafKind::STRING, begin, escapes);
                return;
            }
            case 't':
                scan_literal("true");
                push_leaf(path, LeafKind::BOOLEAN, begin);
                return;
            case 'f':
                scan_literal("false");
                push_leaf(path, LeafKind::BOOLEAN, begin);
                return;
            case 'n':
                scan_literal("null");
                push_leaf(path, LeafKind::NULL_VALUE, begin);
                return;
            default:
                if (src_[pos_] == '-' || is_digit(src_[pos_])) {
                    scan_number();
                    push_leaf(path, LeafKind::NUMBER, begin);
                    return;
                }
                fail("Unexpected character");
        }
    }

    void parse_object(FieldPath& path, size_t depth) {
        enter(depth);
        ++pos_;  // '{'
        skip_ws();
        if (pos_ < src_.size() && src_[pos_] == '}') {
            ++pos_;
            return;
        }

        while (true) {
            if (pos_ >= src_.size() || src_[pos_] != '"') {
                fail("Expected object key");
            }
            const size_t key_begin = pos_;
            const bool escapes = scan_string();
            std::string key = escapes
                ? json_codec::decode_string_token(
                      std::string_view(src_).substr(key_begin, pos_ - key_begin))
                : src_.substr(key_begin + 1, pos_ - key_begin - 2);

            skip_ws();
            expect(':');
            skip_ws();

            path.segments.push_back(PathSegment::object_key(std::move(key)));
            parse_value(path, depth);
            path.segments.pop_back();

            skip_ws();
            if (pos_ >= src_.size()) {
                fail("Unterminated object");
            }
            if (src_[pos_] == ',') {
                ++pos_;
                skip_ws();
                continue;
            }
            if (src_[pos_] == '}') {
                ++pos_;
                return;
            }
            fail("Expected ',' or '}' in object");
        }
    }

    void parse_array(FieldPath& path, size_t depth) {
        enter(depth);
        ++pos_;  // '['
        skip_ws();
        if (pos_ < src_.size() && src_[pos_] == ']') {
            ++pos_;
            return;
        }

        size_t index = 0;
        while (true) {
            path.segments.push_back(PathSegment::array_index(index++));
            parse_value(path, depth);
            path.segments.pop_back();

            skip_ws();
            if (pos_ >= src_.size()) {
                fail("Unterminated array");
            }
            if (src_[pos_] == ',') {
                ++pos_;
                skip_ws();
                continue;
            }
            if (src_[pos_] == ']') {
                ++pos_;
                return;
            }
            fail("Expected ',' or ']' in array");
        }
    }

    /// Advances past a string token; returns true if it contains escapes
    bool scan_string() {
        ++pos_;  // opening quote
        bool escapes = false;
        while (pos_ < src_.size()) {
            const auto c = static_cast<unsigned char>(src_[pos_]);
            if (c == '"') {
                ++pos_;
                return escapes;
            }
            if (c == '\\') {
                escapes = true;
                if (pos_ + 1 >= src_.size()) break;
                switch (src_[pos_ + 1]) {
                    case '"': case '\\': case '/':
                    case 'b': case 'f': case 'n': case 'r': case 't':
                        pos_ += 2;
                        continue;
                    case 'u':
                        if (pos_ + 6 > src_.size()) fail("Truncated \\u escape");
                        for (size_t i = 2; i < 6; ++i) {
                            if (!is_hex(src_[pos_ + i])) fail("Invalid \\u escape");
                        }
                        pos_ += 6;
                        continue;
                    default:
                        fail("Invalid escape sequence");
                }
            }
            if (c < 0x20) {
                fail("Unescaped control character in string");
            }
            ++pos_;
        }
        fail("Unterminated string");
    }

    void scan_literal(std::string_view literal) {
        if (src_.compare(pos_, literal.size(), literal) != 0) {
            fail("Invalid literal");
        }
        pos_ += literal.size();
    }

    void scan_digits() {
        if (pos_ >= src_.size() || !is_digit(src_[pos_])) {
            fail("Invalid number");
        }
        while (pos_ < src_.size() && is_digit(src_[pos_])) ++pos_;
    }

    void scan_number() {
        if (src_[pos_] == '-') ++pos_;
        if (pos_ >= src_.size()) fail("Invalid number");

        if (src_[pos_] == '0') {
            ++pos_;
        } else {
            scan_digits();
        }
        if (pos_ < src_.size() && src_[pos_] == '.') {
            ++pos_;
            scan_digits();
        }
        if (pos_ < src_.size() && (src_[pos_] == 'e' || src_[pos_] == 'E')) {
            ++pos_;
            if (pos_ < src_.size() && (src_[pos_] == '+' || src_[pos_] == '-')) ++pos_;
            scan_digits();
        }
    }

    const std::string& src_;
    const size_t max_depth_;
    std::vector<LeafRef>& leaves_;
    size_t pos_ = 0;
    size_t max_depth_seen_ = 0;
};

} // anonymous namespace

// ============================================================================
// UTF-8 validation
// ============================================================================

std::optional<size_t> find_invalid_utf8(std::string_view bytes) noexcept {
    const auto* s = reinterpret_cast<const unsigned char*>(bytes.data());
    const size_t n = bytes.size();
    size_t i = 0;

    while (i < n) {
        const unsigned char c = s[i];
        if (c < 0x80) {
            ++i;
            continue;
        }

        size_t len = 0;
        uint32_t cp = 0;
        if ((c & 0xE0) == 0xC0) {
            len = 2;
            cp = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            len = 3;
            cp = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            len = 4;
            cp = c & 0x07;
        } else {
            return i;
        }

        if (i + len > n) return i;
        for (size_t k = 1; k < len; ++k) {
            if ((s[i + k] & 0xC0) != 0x80) return i;
            cp = (cp << 6) | (s[i + k] & 0x3F);
        }

        // Overlong forms, surrogates, out of range
        if ((len == 2 && cp < 0x80) ||
            (len == 3 && cp < 0x800) ||
            (len == 4 && cp < 0x10000) ||
            (cp >= 0xD800 && cp <= 0xDFFF) ||
            cp > 0x10FFFF) {
            return i;
        }
        i += len;
    }
    return std::nullopt;
}

// ============================================================================
// String token codec (glaze)
// ============================================================================

namespace json_codec {

std::string decode_string_token(std::string_view token) {
    std::string out;
    // glaze expects a null-terminated buffer
    const std::string buffer(token);
    const auto ec = glz::read_json(out, buffer);
    if (ec) {
        throw PayloadDecodeError("Invalid JSON string escape", 0);
    }
    return out;
}

std::string encode_string(std::string_view text) {
    std::string out;
    const auto ec = glz::write_json(text, out);
    if (ec) {
        throw PiiGuardError(ErrorCode::INTERNAL_ERROR, "Failed to encode JSON string");
    }
    return out;
}

} // namespace json_codec

// ============================================================================
// JsonDocument
// ============================================================================

JsonDocument JsonDocument::parse(std::string payload, size_t max_depth) {
    if (const auto bad = find_invalid_utf8(payload)) {
        throw PayloadDecodeError("Invalid UTF-8 sequence", *bad);
    }

    JsonDocument doc;
    doc.raw_ = std::move(payload);

    Indexer indexer(doc.raw_, max_depth, doc.leaves_);
    indexer.run();
    doc.max_depth_seen_ = indexer.max_depth_seen();
    return doc;
}

std::string JsonDocument::decode_string(const LeafRef& leaf) const {
    const auto token = raw_token(leaf);
    if (!leaf.has_escapes) {
        return std::string(token.substr(1, token.size() - 2));
    }
    return json_codec::decode_string_token(token);
}

} // namespace piiguard
