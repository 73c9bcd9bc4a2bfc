#pragma once

#include "audit/audit_emitter.hpp"
#include "core/engine_snapshot.hpp"
#include "core/error.hpp"
#include "core/types.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>

namespace piiguard {

/**
 * @brief Result of one pipeline invocation
 *
 * Exactly one of: the sanitized payload (FORWARDING), a fallback
 * (DEGRADED: rejection body or conservative redaction) or nothing
 * (CANCELLED). Never the raw payload with PII left in place.
 */
struct InterceptResult {
    PipelineState state = PipelineState::RECEIVED;
    Outcome outcome = Outcome::FORWARDED;
    std::string body;
    int http_status = 200;

    ErrorCode error_code = ErrorCode::NONE;
    std::string error_message;

    DetectionSet detections;
    bool redacted = false;              // body differs from the input
    std::chrono::microseconds latency{0};
    uint64_t snapshot_version = 0;
    std::string document_id;

    [[nodiscard]] bool forwarded() const noexcept { return state == PipelineState::FORWARDING; }
};

/**
 * @brief Interceptor Pipeline - per-request orchestration
 *
 * RECEIVED -> EXTRACTING -> DETECTING -> REDACTING -> FORWARDING
 *          \-> DEGRADED (any error, including budget overrun)
 *          \-> CANCELLED (stop requested by the caller)
 *
 * One snapshot is pinned for the whole request. The latency budget is
 * checked after every field and after every stage; an overrun raises
 * LatencyBudgetExceeded, which lands in DEGRADED like any other error.
 * Fields are matched in parallel once a document has at least
 * parallel_field_threshold of them.
 *
 * process() never throws.
 */
class InterceptorPipeline {
public:
    struct Options {
        /// Replaces engine.latency_budget_ms when set (0 = unbounded)
        std::optional<uint32_t> latency_budget_ms;
    };

    /// Called on entry to each stage, from the request thread
    using StageHook = std::function<void(PipelineState stage)>;

    InterceptorPipeline(std::shared_ptr<EngineRegistry> registry,
                        std::shared_ptr<AuditEmitter> audit_emitter,
                        Options options);

    InterceptorPipeline(std::shared_ptr<EngineRegistry> registry,
                        std::shared_ptr<AuditEmitter> audit_emitter = nullptr)
        : InterceptorPipeline(std::move(registry), std::move(audit_emitter), Options{}) {}

    /**
     * @brief Sanitize one JSON payload
     * @param document_id Correlation id for the audit record (generated if empty)
     * @param stop Cancellation from the upstream caller
     */
    [[nodiscard]] InterceptResult process(std::string payload,
                                          std::string document_id = {},
                                          std::stop_token stop = {}) const;

    void set_stage_hook(StageHook hook) { stage_hook_ = std::move(hook); }

    [[nodiscard]] std::shared_ptr<EngineRegistry> registry() const { return registry_; }
    [[nodiscard]] std::shared_ptr<AuditEmitter> audit_emitter() const { return audit_emitter_; }

    struct Stats {
        uint64_t total_requests;
        uint64_t forwarded;
        uint64_t redacted;              ///< Forwarded with at least one field changed
        uint64_t degraded;
        uint64_t rejected;
        uint64_t fallback_redacted;
        uint64_t cancelled;
        uint64_t budget_exceeded;
        uint64_t fields_scanned;
        uint64_t spans_detected;
    };

    [[nodiscard]] Stats get_stats() const;

private:
    class Deadline;

    [[nodiscard]] DetectionSet detect(const DocumentWalker& walker,
                                      const EngineSnapshot& snapshot,
                                      const Deadline& deadline,
                                      std::stop_token stop) const;

    [[nodiscard]] std::vector<Detection> detect_parallel(const DocumentWalker& walker,
                                                         const EngineSnapshot& snapshot,
                                                         const std::vector<size_t>& leaf_indices,
                                                         const Deadline& deadline,
                                                         std::stop_token stop) const;

    void enter(PipelineState stage, InterceptResult& result) const;
    void emit_audit(const InterceptResult& result, const EngineSnapshot& snapshot) const;

    std::shared_ptr<EngineRegistry> registry_;
    std::shared_ptr<AuditEmitter> audit_emitter_;
    Options options_;
    StageHook stage_hook_;

    mutable std::atomic<uint64_t> total_requests_{0};
    mutable std::atomic<uint64_t> forwarded_{0};
    mutable std::atomic<uint64_t> redacted_{0};
    mutable std::atomic<uint64_t> degraded_{0};
    mutable std::atomic<uint64_t> rejected_{0};
    mutable std::atomic<uint64_t> fallback_redacted_{0};
    mutable std::atomic<uint64_t> cancelled_{0};
    mutable std::atomic<uint64_t> budget_exceeded_{0};
    mutable std::atomic<uint64_t> fields_scanned_{0};
    mutable std::atomic<uint64_t> spans_detected_{0};
};

} // namespace piiguard
