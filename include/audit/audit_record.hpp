#pragma once

#include "core/error.hpp"
#include "core/types.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace piiguard {

/**
 * @brief One detected span as it appears in the audit trail
 *
 * Location and classification only. The matched text is never copied
 * into an audit record.
 */
struct AuditSpan {
    std::string field_path;         // JSON-Pointer rendering
    size_t start_offset = 0;
    size_t end_offset = 0;
    PiiType pii_type = PiiType::NAME;
    double confidence = 0.0;
    bool redacted = false;
};

struct AuditRecord {
    std::string audit_id;
    uint64_t sequence_num = 0;                  // Assigned by AuditEmitter::emit()
    std::chrono::system_clock::time_point timestamp;
    std::string document_id;

    std::vector<AuditSpan> detections;
    double latency_ms = 0.0;

    PipelineState state = PipelineState::FORWARDING;
    Outcome outcome = Outcome::FORWARDED;
    ErrorCode error_code = ErrorCode::NONE;

    bool combinatorial_flag = false;
    std::vector<std::string> combination_rules;
    double risk_score = 0.0;

    size_t fields_scanned = 0;
    size_t fields_redacted = 0;
    uint64_t snapshot_version = 0;

    // Hash chain, filled by the writer thread
    std::string previous_hash;
    std::string record_hash;
};

} // namespace piiguard
