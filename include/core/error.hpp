#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

namespace piiguard {

/**
 * @brief Error codes surfaced in pipeline results, audit records and HTTP bodies
 */
enum class ErrorCode {
    NONE,
    STRUCTURE_TOO_DEEP,
    PAYLOAD_DECODE_ERROR,
    DETECTOR_CONFIG_ERROR,
    LATENCY_BUDGET_EXCEEDED,
    INTERNAL_ERROR
};

[[nodiscard]] inline constexpr std::string_view error_code_to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::NONE:                    return "NONE";
        case ErrorCode::STRUCTURE_TOO_DEEP:      return "STRUCTURE_TOO_DEEP";
        case ErrorCode::PAYLOAD_DECODE_ERROR:    return "PAYLOAD_DECODE_ERROR";
        case ErrorCode::DETECTOR_CONFIG_ERROR:   return "DETECTOR_CONFIG_ERROR";
        case ErrorCode::LATENCY_BUDGET_EXCEEDED: return "LATENCY_BUDGET_EXCEEDED";
        case ErrorCode::INTERNAL_ERROR:          return "INTERNAL_ERROR";
    }
    return "INTERNAL_ERROR";
}

/**
 * @brief Base of the engine's exception hierarchy
 *
 * Per-request errors never leave InterceptorPipeline::process(); they are
 * converted into the DEGRADED state there. DetectorConfigError is the only
 * one expected to reach main() (startup) or the reload path.
 */
class PiiGuardError : public std::runtime_error {
public:
    PiiGuardError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

class StructureTooDeepError : public PiiGuardError {
public:
    StructureTooDeepError(size_t max_depth, size_t offset)
        : PiiGuardError(ErrorCode::STRUCTURE_TOO_DEEP,
                        "JSON nesting exceeds max depth " + std::to_string(max_depth) +
                        " at byte " + std::to_string(offset)),
          max_depth_(max_depth) {}

    [[nodiscard]] size_t max_depth() const noexcept { return max_depth_; }

private:
    size_t max_depth_;
};

class PayloadDecodeError : public PiiGuardError {
public:
    PayloadDecodeError(const std::string& reason, size_t offset)
        : PiiGuardError(ErrorCode::PAYLOAD_DECODE_ERROR,
                        reason + " at byte " + std::to_string(offset)),
          offset_(offset) {}

    [[nodiscard]] size_t offset() const noexcept { return offset_; }

private:
    size_t offset_;
};

class DetectorConfigError : public PiiGuardError {
public:
    explicit DetectorConfigError(const std::string& message)
        : PiiGuardError(ErrorCode::DETECTOR_CONFIG_ERROR, message) {}
};

class LatencyBudgetExceeded : public PiiGuardError {
public:
    LatencyBudgetExceeded(std::string_view stage, long long elapsed_us, long long budget_us)
        : PiiGuardError(ErrorCode::LATENCY_BUDGET_EXCEEDED,
                        "Latency budget exceeded during " + std::string(stage) + " (" +
                        std::to_string(elapsed_us) + "us > " + std::to_string(budget_us) + "us)") {}
};

} // namespace piiguard
