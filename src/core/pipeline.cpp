#include "core/pipeline.hpp"
#include "core/utils.hpp"
#include "document/document_walker.hpp"
#include "document/json_document.hpp"

#include <algorithm>
#include <exception>
#include <format>
#include <future>
#include <stdexcept>

namespace piiguard {

namespace {

/// Unwinds the request when the caller's stop_token fires
class RequestCancelled : public std::exception {
public:
    [[nodiscard]] const char* what() const noexcept override { return "request cancelled"; }
};

constexpr int kCancelledStatus = 499;

std::string reject_body(ErrorCode code, std::string_view message) {
    return std::format("{{\"error\":{},\"code\":\"{}\"}}",
                       json_codec::encode_string(message), error_code_to_string(code));
}

} // anonymous namespace

// ============================================================================
// Deadline
// ============================================================================

class InterceptorPipeline::Deadline {
public:
    explicit Deadline(uint32_t budget_ms)
        : budget_(std::chrono::milliseconds(budget_ms)) {}

    [[nodiscard]] bool bounded() const noexcept { return budget_.count() > 0; }

    [[nodiscard]] bool expired() const {
        return bounded() && timer_.elapsed_us() > budget_;
    }

    void check(std::string_view stage) const {
        if (!bounded()) return;
        const auto elapsed = timer_.elapsed_us();
        if (elapsed > budget_) {
            throw LatencyBudgetExceeded(stage, elapsed.count(), budget_.count());
        }
    }

    [[nodiscard]] std::chrono::microseconds elapsed() const { return timer_.elapsed_us(); }

private:
    utils::Timer timer_;
    std::chrono::microseconds budget_;
};

// ============================================================================
// Construction
// ============================================================================

InterceptorPipeline::InterceptorPipeline(std::shared_ptr<EngineRegistry> registry,
                                         std::shared_ptr<AuditEmitter> audit_emitter,
                                         Options options)
    : registry_(std::move(registry)),
      audit_emitter_(std::move(audit_emitter)),
      options_(options) {
    if (!registry_) {
        throw std::invalid_argument("InterceptorPipeline requires an EngineRegistry");
    }
}

void InterceptorPipeline::enter(PipelineState stage, InterceptResult& result) const {
    result.state = stage;
    if (stage_hook_) {
        stage_hook_(stage);
    }
}

// ============================================================================
// process
// ============================================================================

InterceptResult InterceptorPipeline::process(std::string payload,
                                             std::string document_id,
                                             std::stop_token stop) const {
    total_requests_.fetch_add(1, std::memory_order_relaxed);

    // Pinned for the whole request; a concurrent reload cannot change rules mid-flight
    const auto snapshot = registry_->current();
    const auto& engine = snapshot->engine();
    const Deadline deadline(options_.latency_budget_ms.value_or(engine.latency_budget_ms));

    InterceptResult result;
    result.snapshot_version = snapshot->version();
    result.document_id = document_id.empty() ? utils::generate_uuid() : std::move(document_id);

    auto check_stop = [&stop] {
        if (stop.stop_requested()) throw RequestCancelled();
    };

    std::optional<JsonDocument> doc;
    try {
        enter(PipelineState::RECEIVED, result);
        check_stop();

        enter(PipelineState::EXTRACTING, result);
        doc.emplace(JsonDocument::parse(std::move(payload), engine.max_structure_depth));
        const DocumentWalker walker(*doc);
        deadline.check("extraction");
        check_stop();

        enter(PipelineState::DETECTING, result);
        result.detections = detect(walker, *snapshot, deadline, stop);
        deadline.check("detection");

        enter(PipelineState::REDACTING, result);
        auto redaction = snapshot->redactor().redact(walker, result.detections);
        deadline.check("redaction");
        check_stop();

        result.state = PipelineState::FORWARDING;
        result.outcome = Outcome::FORWARDED;
        result.http_status = 200;
        result.redacted = redaction.modified();
        result.body = std::move(redaction.payload);

        forwarded_.fetch_add(1, std::memory_order_relaxed);
        if (result.redacted) redacted_.fetch_add(1, std::memory_order_relaxed);
    } catch (const RequestCancelled&) {
        result.state = PipelineState::CANCELLED;
        result.outcome = Outcome::ABORTED;
        result.http_status = kCancelledStatus;
        result.body.clear();
        result.latency = deadline.elapsed();
        cancelled_.fetch_add(1, std::memory_order_relaxed);
        utils::log::debug(std::format("Document {} cancelled", result.document_id));
        return result;
    } catch (const PiiGuardError& e) {
        result.error_code = e.code();
        result.error_message = e.what();
    } catch (const std::exception& e) {
        result.error_code = ErrorCode::INTERNAL_ERROR;
        result.error_message = "internal error";
        utils::log::error(std::format("Document {}: unexpected error in {}: {}",
                                      result.document_id, state_to_string(result.state), e.what()));
    } catch (...) {
        result.error_code = ErrorCode::INTERNAL_ERROR;
        result.error_message = "internal error";
        utils::log::error(std::format("Document {}: unknown exception in {}",
                                      result.document_id, state_to_string(result.state)));
    }

    if (result.error_code != ErrorCode::NONE) {
        utils::log::warn(std::format("Document {} degraded during {}: {} ({})",
                                     result.document_id, state_to_string(result.state),
                                     error_code_to_string(result.error_code), result.error_message));

        result.state = PipelineState::DEGRADED;
        result.redacted = false;
        degraded_.fetch_add(1, std::memory_order_relaxed);
        if (result.error_code == ErrorCode::LATENCY_BUDGET_EXCEEDED) {
            budget_exceeded_.fetch_add(1, std::memory_order_relaxed);
        }

        if (engine.fallback_policy == FallbackPolicy::REDACT_ALL) {
            result.outcome = Outcome::FALLBACK_REDACTED;
            result.http_status = 200;
            try {
                result.body = doc ? Redactor::redact_all(*doc) : std::string(R"({"redacted":true})");
            } catch (const std::exception& e) {
                utils::log::error(std::format("Document {}: redact_all failed: {}",
                                              result.document_id, e.what()));
                result.body = R"({"redacted":true})";
            } catch (...) {
                utils::log::error(std::format("Document {}: redact_all failed", result.document_id));
                result.body = R"({"redacted":true})";
            }
            result.redacted = true;
            fallback_redacted_.fetch_add(1, std::memory_order_relaxed);
        } else {
            result.outcome = Outcome::REJECTED;
            result.http_status = engine.reject_status;
            result.body = reject_body(result.error_code, result.error_message);
            rejected_.fetch_add(1, std::memory_order_relaxed);
        }
    }

    result.latency = deadline.elapsed();
    emit_audit(result, *snapshot);
    return result;
}

// ============================================================================
// Detection
// ============================================================================

DetectionSet InterceptorPipeline::detect(const DocumentWalker& walker,
                                         const EngineSnapshot& snapshot,
                                         const Deadline& deadline,
                                         std::stop_token stop) const {
    const auto& engine = snapshot.engine();
    const auto& matcher = snapshot.matcher();

    DetectionSet set;
    const auto leaf_indices = walker.string_leaf_indices();

    if (engine.max_detection_workers > 1 && leaf_indices.size() >= engine.parallel_field_threshold) {
        set.detections = detect_parallel(walker, snapshot, leaf_indices, deadline, stop);
    } else {
        auto cursor = walker.fields();
        while (auto field = cursor.next()) {
            auto spans = matcher.match(*field->path, field->text);
            if (!spans.empty()) {
                Detection d;
                d.field_path = *field->path;
                d.spans = std::move(spans);
                d.leaf_index = field->leaf_index;
                set.detections.push_back(std::move(d));
            }
            deadline.check("detection");
            if (stop.stop_requested()) throw RequestCancelled();
        }
    }
    set.fields_scanned = leaf_indices.size();

    // Weak spans feed the document-level co-occurrence rules
    PiiTypeSet weak_types;
    const double threshold = engine.standalone_threshold;
    for (const auto& d : set.detections) {
        for (const auto& s : d.spans) {
            if (s.confidence < threshold) weak_types.insert(s.pii_type);
        }
    }

    set.combination = snapshot.combinator().evaluate(weak_types);
    if (set.combination.flagged) {
        for (auto& d : set.detections) {
            for (const auto& s : d.spans) {
                if (s.confidence < threshold && set.combination.participating.contains(s.pii_type)) {
                    d.combinatorial_flag = true;
                    break;
                }
            }
        }
    }

    fields_scanned_.fetch_add(set.fields_scanned, std::memory_order_relaxed);
    spans_detected_.fetch_add(set.span_count(), std::memory_order_relaxed);
    return set;
}

std::vector<Detection> InterceptorPipeline::detect_parallel(const DocumentWalker& walker,
                                                            const EngineSnapshot& snapshot,
                                                            const std::vector<size_t>& leaf_indices,
                                                            const Deadline& deadline,
                                                            std::stop_token stop) const {
    const auto& matcher = snapshot.matcher();
    const size_t workers = std::min(snapshot.engine().max_detection_workers, leaf_indices.size());
    const size_t chunk = (leaf_indices.size() + workers - 1) / workers;

    std::atomic<bool> abort{false};

    auto run_chunk = [&](size_t begin, size_t end) {
        std::vector<Detection> local;
        for (size_t i = begin; i < end; ++i) {
            if (abort.load(std::memory_order_relaxed)) break;

            auto field = walker.field_at(leaf_indices[i]);
            auto spans = matcher.match(*field.path, field.text);
            if (!spans.empty()) {
                Detection d;
                d.field_path = *field.path;
                d.spans = std::move(spans);
                d.leaf_index = field.leaf_index;
                local.push_back(std::move(d));
            }

            if (deadline.expired() || stop.stop_requested()) {
                abort.store(true, std::memory_order_relaxed);
                break;
            }
        }
        return local;
    };

    std::vector<std::future<std::vector<Detection>>> futures;
    futures.reserve(workers);
    for (size_t begin = 0; begin < leaf_indices.size(); begin += chunk) {
        const size_t end = std::min(begin + chunk, leaf_indices.size());
        futures.push_back(std::async(std::launch::async, run_chunk, begin, end));
    }

    // Join every worker before rethrowing: they all borrow the walker
    std::vector<Detection> merged;
    std::exception_ptr first_error;
    for (auto& f : futures) {
        try {
            auto part = f.get();
            for (auto& d : part) merged.push_back(std::move(d));
        } catch (...) {
            if (!first_error) first_error = std::current_exception();
        }
    }
    if (first_error) std::rethrow_exception(first_error);

    if (stop.stop_requested()) throw RequestCancelled();
    deadline.check("detection");
    return merged;
}

// ============================================================================
// Audit
// ============================================================================

void InterceptorPipeline::emit_audit(const InterceptResult& result, const EngineSnapshot& snapshot) const {
    if (!audit_emitter_) return;

    AuditRecord record;
    record.audit_id = utils::generate_uuid();
    record.timestamp = std::chrono::system_clock::now();
    record.document_id = result.document_id;
    record.latency_ms = static_cast<double>(result.latency.count()) / 1000.0;
    record.state = result.state;
    record.outcome = result.outcome;
    record.error_code = result.error_code;
    record.combinatorial_flag = result.detections.combination.flagged;
    record.combination_rules = result.detections.combination.rules;
    record.risk_score = result.detections.combination.risk_score;
    record.fields_scanned = result.detections.fields_scanned;
    record.snapshot_version = result.snapshot_version;

    const auto& redactor = snapshot.redactor();
    const auto& participating = result.detections.combination.participating;
    const bool fallback_all = result.outcome == Outcome::FALLBACK_REDACTED;
    for (const auto& d : result.detections.detections) {
        const std::string path = d.field_path.to_string();
        bool field_redacted = false;
        for (const auto& s : d.spans) {
            AuditSpan as;
            as.field_path = path;
            as.start_offset = s.start_offset;
            as.end_offset = s.end_offset;
            as.pii_type = s.pii_type;
            as.confidence = s.confidence;
            as.redacted = result.forwarded()
                ? redactor.is_redactable(s, participating)
                : fallback_all;
            field_redacted = field_redacted || as.redacted;
            record.detections.push_back(std::move(as));
        }
        if (field_redacted) ++record.fields_redacted;
    }

    audit_emitter_->emit(std::move(record));
}

InterceptorPipeline::Stats InterceptorPipeline::get_stats() const {
    return {
        .total_requests = total_requests_.load(std::memory_order_relaxed),
        .forwarded = forwarded_.load(std::memory_order_relaxed),
        .redacted = redacted_.load(std::memory_order_relaxed),
        .degraded = degraded_.load(std::memory_order_relaxed),
        .rejected = rejected_.load(std::memory_order_relaxed),
        .fallback_redacted = fallback_redacted_.load(std::memory_order_relaxed),
        .cancelled = cancelled_.load(std::memory_order_relaxed),
        .budget_exceeded = budget_exceeded_.load(std::memory_order_relaxed),
        .fields_scanned = fields_scanned_.load(std::memory_order_relaxed),
        .spans_detected = spans_detected_.load(std::memory_order_relaxed),
    };
}

} // namespace piiguard
