#pragma once

#include "config/config_types.hpp"
#include "detector/detector.hpp"

#include <memory>
#include <vector>

namespace piiguard {

/**
 * @brief Built-in detector definitions (used when [[detectors]] is absent)
 *
 * Covers US and Indian formats: SSN, Aadhaar, passport, Luhn cards,
 * email, UPI, 10-digit phones, IPv4, plus key-scoped weak detectors for
 * names, dates of birth, postal codes, addresses and device ids.
 */
[[nodiscard]] std::vector<DetectorConfig> builtin_detector_configs();

/**
 * @brief Compile one detector definition
 *
 * Throws DetectorConfigError for an unknown type, kind or validator, a
 * regex detector without a pattern, an invalid pattern, or a
 * field_value detector without field_keys.
 */
[[nodiscard]] std::shared_ptr<const IDetector> make_detector(const DetectorConfig& config);

} // namespace piiguard
