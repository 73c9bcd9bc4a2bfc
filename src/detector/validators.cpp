#include "detector/validators.hpp"
#include "core/utils.hpp"

#include <array>
#include <cctype>

namespace piiguard {

namespace {

/// Collect up to N digits from value; returns digit count (may exceed N)
template <size_t N>
size_t collect_digits(std::string_view value, std::array<int, N>& out) noexcept {
    size_t count = 0;
    for (const char c : value) {
        if (std::isdigit(static_cast<unsigned char>(c))) {
            if (count < N) out[count] = c - '0';
            ++count;
        }
    }
    return count;
}

[[nodiscard]] int to_int(const std::array<int, 19>& d, size_t from, size_t len) noexcept {
    int v = 0;
    for (size_t i = from; i < from + len; ++i) v = v * 10 + d[i];
    return v;
}

[[nodiscard]] bool is_leap(int year) noexcept {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

[[nodiscard]] bool valid_ymd(int y, int m, int d) noexcept {
    static constexpr std::array<int, 12> kDays = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (y < 1900 || y > 2100 || m < 1 || m > 12 || d < 1) return false;
    const int max_day = (m == 2 && is_leap(y)) ? 29 : kDays[static_cast<size_t>(m - 1)];
    return d <= max_day;
}

} // anonymous namespace

std::optional<Validator> parse_validator(std::string_view name) {
    const auto lowered = utils::to_lower(utils::trim(name));
    if (lowered.empty() || lowered == "none") return Validator::NONE;
    if (lowered == "luhn") return Validator::LUHN;
    if (lowered == "ssn") return Validator::SSN;
    if (lowered == "aadhaar") return Validator::AADHAAR;
    if (lowered == "ipv4") return Validator::IPV4;
    if (lowered == "date") return Validator::DATE;
    return std::nullopt;
}

std::string_view validator_to_string(Validator v) noexcept {
    switch (v) {
        case Validator::NONE:    return "none";
        case Validator::LUHN:    return "luhn";
        case Validator::SSN:     return "ssn";
        case Validator::AADHAAR: return "aadhaar";
        case Validator::IPV4:    return "ipv4";
        case Validator::DATE:    return "date";
    }
    return "none";
}

namespace validate {

bool luhn(std::string_view value) noexcept {
    std::array<int, 19> digits{};
    const size_t count = collect_digits(value, digits);
    if (count < 13 || count > 19) {
        return false;
    }

    int sum = 0;
    bool double_digit = false;

    // Process from right to left
    for (size_t i = count; i-- > 0;) {
        int digit = digits[i];
        if (double_digit) {
            digit *= 2;
            if (digit > 9) {
                digit -= 9;
            }
        }
        sum += digit;
        double_digit = !double_digit;
    }

    return (sum % 10) == 0;
}

bool ssn(std::string_view value) noexcept {
    std::array<int, 19> digits{};
    if (collect_digits(value, digits) != 9) {
        return false;
    }

    // Area number (first 3) cannot be 000, 666, or 900-999
    const int area = to_int(digits, 0, 3);
    if (area == 0 || area == 666 || area >= 900) {
        return false;
    }

    // Group (middle 2) cannot be 00, serial (last 4) cannot be 0000
    return to_int(digits, 3, 2) != 0 && to_int(digits, 5, 4) != 0;
}

bool aadhaar(std::string_view value) noexcept {
    std::array<int, 19> digits{};
    if (collect_digits(value, digits) != 12) {
        return false;
    }
    return digits[0] >= 2;
}

bool ipv4(std::string_view value) noexcept {
    int octets = 0;
    int current = -1;
    for (const char c : value) {
        if (c == '.') {
            if (current < 0) return false;
            ++octets;
            current = -1;
            continue;
        }
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
        current = (current < 0 ? 0 : current * 10) + (c - '0');
        if (current > 255) return false;
    }
    return current >= 0 && octets == 3;
}

bool calendar_date(std::string_view value) noexcept {
    std::array<int, 19> d{};
    const size_t count = collect_digits(value, d);
    if (count != 8 || value.size() != 10) {
        return false;
    }
    // YYYY-MM-DD
    if (value[4] == '-' || value[4] == '/') {
        return valid_ymd(to_int(d, 0, 4), to_int(d, 4, 2), to_int(d, 6, 2));
    }
    // DD/MM/YYYY or DD-MM-YYYY
    return valid_ymd(to_int(d, 4, 4), to_int(d, 2, 2), to_int(d, 0, 2));
}

bool run(Validator v, std::string_view value) noexcept {
    switch (v) {
        case Validator::NONE:    return true;
        case Validator::LUHN:    return luhn(value);
        case Validator::SSN:     return ssn(value);
        case Validator::AADHAAR: return aadhaar(value);
        case Validator::IPV4:    return ipv4(value);
        case Validator::DATE:    return calendar_date(value);
    }
    return false;
}

} // namespace validate

} // namespace piiguard
