#pragma once

#include "core/types.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace piiguard {

/**
 * @brief Replacement text for one span
 *
 * Strategies:
 * - MASK:          [REDACTED_<TYPE>]
 * - HASH:          [<TYPE>:<16 letters a-p>]  (SHA-256 of salt + text)
 * - PARTIAL_LAST4: alphanumerics -> 'X' except the last four
 * - DROP_FIELD:    no span text; the whole field becomes null
 *
 * No output contains digits that were not already in the input's last
 * four alphanumerics, so a redacted value never re-triggers a detector.
 */
class MaskingEngine {
public:
    static constexpr std::string_view kRedactAllToken = "[REDACTED]";

    /**
     * @brief Replacement for a span's source text
     * @return nullopt for DROP_FIELD (caller nullifies the field)
     */
    [[nodiscard]] static std::optional<std::string> mask_value(
        std::string_view value,
        RedactionStrategy strategy,
        PiiType type,
        std::string_view salt = {});

    [[nodiscard]] static std::string mask_token(PiiType type);
    [[nodiscard]] static std::string hash_token(PiiType type, std::string_view value,
                                                std::string_view salt);
    [[nodiscard]] static std::string partial_last4(std::string_view value);

    /// True for text that is exactly one token produced by MASK, HASH or redact_all
    [[nodiscard]] static bool is_redaction_token(std::string_view text) noexcept;

private:
    static std::string digest_letters(std::string_view salt, std::string_view value);
};

} // namespace piiguard
