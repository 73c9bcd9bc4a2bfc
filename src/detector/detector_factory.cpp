#include "detector/detector_factory.hpp"
#include "detector/regex_detector.hpp"
#include "detector/structural_detectors.hpp"
#include "detector/validators.hpp"
#include "core/error.hpp"

#include <format>

namespace piiguard {

namespace {

DetectorConfig regex_def(std::string name, std::string type, double confidence,
                         std::string pattern, std::string validator = "none",
                         std::vector<std::string> field_keys = {}) {
    DetectorConfig d;
    d.name = std::move(name);
    d.type = std::move(type);
    d.kind = "regex";
    d.confidence = confidence;
    d.pattern = std::move(pattern);
    d.validator = std::move(validator);
    d.field_keys = std::move(field_keys);
    return d;
}

DetectorConfig field_value_def(std::string name, std::string type, double confidence,
                               std::vector<std::string> field_keys, size_t min_words) {
    DetectorConfig d;
    d.name = std::move(name);
    d.type = std::move(type);
    d.kind = "field_value";
    d.confidence = confidence;
    d.field_keys = std::move(field_keys);
    d.min_words = min_words;
    return d;
}

} // anonymous namespace

std::vector<DetectorConfig> builtin_detector_configs() {
    std::vector<DetectorConfig> defs;

    // High-confidence standalone detectors
    DetectorConfig card;
    card.name = "card_luhn";
    card.type = "card_number";
    card.kind = "luhn";
    card.confidence = 0.95;
    defs.push_back(std::move(card));

    defs.push_back(regex_def("us_ssn", "national_id", 0.9,
        R"(\b\d{3}-\d{2}-\d{4}\b)", "ssn"));
    defs.push_back(regex_def("aadhaar", "aadhaar", 0.85,
        R"(\b\d{4}\s?\d{4}\s?\d{4}\b)", "aadhaar"));
    defs.push_back(regex_def("passport", "passport", 0.8,
        R"(\b[A-Z][0-9]{7}\b)"));
    defs.push_back(regex_def("email", "email", 0.95,
        R"(\b[A-Za-z0-9._%+-]+@[A-Za-z0-9.-]+\.[A-Za-z]{2,}\b)"));
    defs.push_back(regex_def("upi_id", "upi_id", 0.85,
        R"(\b[A-Za-z0-9._-]+@[A-Za-z]{2,}\b)"));
    defs.push_back(regex_def("phone", "phone", 0.85,
        R"(\b\d{3}[-.\s]?\d{3}[-.\s]?\d{4}\b)"));

    // Weak detectors: only redacted under combinatorial escalation
    defs.push_back(regex_def("ipv4", "ip_address", 0.5,
        R"(\b(?:\d{1,3}\.){3}\d{1,3}\b)", "ipv4"));
    defs.push_back(regex_def("person_name", "name", 0.5,
        R"(\b[A-Z][a-z]+(?:\s[A-Z][a-z]+)+\b)", "none",
        {"name", "full_name", "customer_name", "first_name", "last_name", "contact_name"}));
    defs.push_back(regex_def("date_of_birth", "date_of_birth", 0.5,
        R"(\b(?:\d{4}-\d{2}-\d{2}|\d{2}/\d{2}/\d{4})\b)", "date",
        {"dob", "date_of_birth", "birth_date", "birthdate", "birthday"}));
    defs.push_back(regex_def("postal_code", "postal_code", 0.4,
        R"(\b\d{5}(?:-\d{4})?\b|\b\d{6}\b)", "none",
        {"zip", "zipcode", "zip_code", "postal_code", "postcode", "pin_code", "pincode"}));
    defs.push_back(field_value_def("street_address", "address", 0.5,
        {"address", "street", "street_address", "home_address"}, 3));
    defs.push_back(field_value_def("device_id", "device_id", 0.4,
        {"device_id", "deviceid", "imei", "android_id", "idfa"}, 1));

    return defs;
}

std::shared_ptr<const IDetector> make_detector(const DetectorConfig& config) {
    const auto type = parse_pii_type(config.type);
    if (!type) {
        throw DetectorConfigError(std::format(
            "Detector '{}': unknown PII type '{}'", config.name, config.type));
    }

    if (config.kind == "luhn") {
        return std::make_shared<LuhnCardDetector>(config.name, config.confidence, config.field_keys);
    }

    if (config.kind == "field_value") {
        return std::make_shared<FieldValueDetector>(
            config.name, *type, config.confidence, config.field_keys, config.min_words);
    }

    if (config.kind == "regex") {
        if (config.pattern.empty()) {
            throw DetectorConfigError(std::format(
                "Detector '{}': regex detectors require a pattern", config.name));
        }
        const auto validator = parse_validator(config.validator);
        if (!validator) {
            throw DetectorConfigError(std::format(
                "Detector '{}': unknown validator '{}'", config.name, config.validator));
        }
        return std::make_shared<RegexDetector>(
            config.name, *type, config.confidence, config.pattern, *validator, config.field_keys);
    }

    throw DetectorConfigError(std::format(
        "Detector '{}': unknown kind '{}'", config.name, config.kind));
}

} // namespace piiguard
