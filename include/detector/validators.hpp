#pragma once

#include <optional>
#include <string_view>

namespace piiguard {

/**
 * @brief Post-match checks that cut regex false positives
 */
enum class Validator {
    NONE,
    LUHN,       // 13-19 digits, mod-10 checksum
    SSN,        // US SSN area/group/serial rules
    AADHAAR,    // 12 digits, first digit 2-9
    IPV4,       // four octets, each 0-255
    DATE        // YYYY-MM-DD or DD/MM/YYYY, real calendar date
};

[[nodiscard]] std::optional<Validator> parse_validator(std::string_view name);
[[nodiscard]] std::string_view validator_to_string(Validator v) noexcept;

namespace validate {

/// Luhn check over the digits in `value` (separators ignored)
[[nodiscard]] bool luhn(std::string_view value) noexcept;

[[nodiscard]] bool ssn(std::string_view value) noexcept;

[[nodiscard]] bool aadhaar(std::string_view value) noexcept;

[[nodiscard]] bool ipv4(std::string_view value) noexcept;

[[nodiscard]] bool calendar_date(std::string_view value) noexcept;

[[nodiscard]] bool run(Validator v, std::string_view value) noexcept;

} // namespace validate

} // namespace piiguard
