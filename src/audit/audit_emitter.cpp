#include "audit/audit_emitter.hpp"
#include "audit/file_sink.hpp"
#include "audit/syslog_sink.hpp"
#include "core/utils.hpp"
#include "document/json_document.hpp"

#include <openssl/evp.h>

#include <format>
#include <future>

namespace piiguard {

// ============================================================================
// Construction / Destruction
// ============================================================================

namespace {

std::vector<std::unique_ptr<IAuditSink>> sinks_from_config(const AuditConfig& config) {
    std::vector<std::unique_ptr<IAuditSink>> sinks;

    FileSink::Config file_cfg;
    file_cfg.output_file = config.output_file;
    file_cfg.max_file_size_bytes = config.rotation_max_file_size_mb * 1024ULL * 1024;
    file_cfg.max_files = config.rotation_max_files;
    sinks.push_back(std::make_unique<FileSink>(file_cfg));

    if (config.syslog_enabled) {
        SyslogSink::Config sl_cfg;
        sl_cfg.ident = config.syslog_ident;
        sinks.push_back(std::make_unique<SyslogSink>(sl_cfg));
    }
    return sinks;
}

} // anonymous namespace

AuditEmitter::AuditEmitter(const AuditConfig& config)
    : AuditEmitter(config, sinks_from_config(config)) {}

AuditEmitter::AuditEmitter(const AuditConfig& config, std::vector<std::unique_ptr<IAuditSink>> sinks)
    : sinks_(std::move(sinks)),
      ring_buffer_(config.ring_buffer_size),
      batch_flush_interval_(config.batch_flush_interval),
      integrity_enabled_(config.integrity_enabled) {
    start();
}

void AuditEmitter::start() {
    running_.store(true, std::memory_order_release);
    writer_thread_ = std::thread(&AuditEmitter::writer_thread_func, this);
}

AuditEmitter::~AuditEmitter() {
    shutdown();
}

// ============================================================================
// Public Interface
// ============================================================================

void AuditEmitter::emit(AuditRecord record) {
    if (!running_.load(std::memory_order_acquire)) {
        return;
    }

    record.sequence_num = sequence_counter_.fetch_add(1, std::memory_order_relaxed);
    if (ring_buffer_.try_push(std::move(record))) {
        total_emitted_.fetch_add(1, std::memory_order_relaxed);
    }
}

void AuditEmitter::flush() {
    if (!running_.load(std::memory_order_acquire)) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(flush_mutex_);
        flush_requested_.store(true, std::memory_order_release);
    }
    flush_cv_.notify_one();

    while (flush_requested_.load(std::memory_order_acquire)) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
        if (!running_.load(std::memory_order_acquire)) {
            break;
        }
    }
}

void AuditEmitter::shutdown() {
    bool expected = true;
    if (!running_.compare_exchange_strong(expected, false, std::memory_order_acq_rel)) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(flush_mutex_);
    }
    flush_cv_.notify_one();

    if (writer_thread_.joinable()) {
        writer_thread_.join();
    }
}

AuditEmitter::Stats AuditEmitter::get_stats() const {
    return Stats{
        .total_emitted = total_emitted_.load(std::memory_order_relaxed),
        .total_written = total_written_.load(std::memory_order_relaxed),
        .overflow_dropped = ring_buffer_.overflow_count(),
        .flush_count = flush_count_.load(std::memory_order_relaxed),
        .sink_write_failures = sink_write_failures_.load(std::memory_order_relaxed),
        .active_sinks = sinks_.size()
    };
}

// ============================================================================
// Sink Helpers
// ============================================================================

void AuditEmitter::write_to_sinks(std::string_view data) {
    if (sinks_.size() <= 1) {
        for (auto& sink : sinks_) {
            if (!sink->write(data)) {
                sink_write_failures_.fetch_add(1, std::memory_order_relaxed);
                utils::log::warn(std::format("Audit sink {} write failed", sink->name()));
            }
        }
        return;
    }

    // Multiple sinks: write concurrently. `data` outlives every future
    // because all of them are joined before returning.
    std::vector<std::future<bool>> futures;
    futures.reserve(sinks_.size());

    for (auto& sink : sinks_) {
        futures.push_back(std::async(std::launch::async,
            [&sink, data] { return sink->write(data); }));
    }

    for (size_t i = 0; i < futures.size(); ++i) {
        bool ok = false;
        try {
            ok = futures[i].get();
        } catch (const std::exception& e) {
            utils::log::warn(std::format("Audit sink {} threw: {}", sinks_[i]->name(), e.what()));
        }
        if (!ok) {
            sink_write_failures_.fetch_add(1, std::memory_order_relaxed);
            utils::log::warn(std::format("Audit sink {} write failed", sinks_[i]->name()));
        }
    }
}

void AuditEmitter::flush_sinks() {
    for (auto& sink : sinks_) {
        sink->flush();
    }
}

void AuditEmitter::shutdown_sinks() {
    for (auto& sink : sinks_) {
        sink->flush();
        sink->shutdown();
    }
}

// ============================================================================
// Background Writer Thread
// ============================================================================

void AuditEmitter::write_batch(std::vector<AuditRecord>& batch) {
    if (integrity_enabled_) {
        for (auto& record : batch) {
            record.previous_hash = previous_hash_;
            record.record_hash = compute_record_hash(record, previous_hash_);
            previous_hash_ = record.record_hash;
        }
    }

    std::string output;
    output.reserve(batch.size() * 512);
    for (const auto& record : batch) {
        output += to_json(record);
        output += '\n';
    }

    write_to_sinks(output);

    total_written_.fetch_add(batch.size(), std::memory_order_relaxed);
    flush_count_.fetch_add(1, std::memory_order_relaxed);
    if (++batches_since_fsync_ >= kFsyncInterval) {
        flush_sinks();
        batches_since_fsync_ = 0;
    }
}

void AuditEmitter::writer_thread_func() {
    std::vector<AuditRecord> batch;
    batch.reserve(kMaxBatchSize);

    while (true) {
        {
            std::unique_lock<std::mutex> lock(flush_mutex_);
            flush_cv_.wait_for(lock, batch_flush_interval_, [this] {
                return flush_requested_.load(std::memory_order_acquire)
                    || !running_.load(std::memory_order_acquire);
            });
        }

        // Only a request observed before draining may be acknowledged
        const bool flush_pending = flush_requested_.load(std::memory_order_acquire);

        bool did_work = false;
        while (true) {
            batch.clear();
            if (ring_buffer_.drain(batch, kMaxBatchSize) == 0) {
                break;
            }
            did_work = true;
            write_batch(batch);
        }

        if (flush_pending) {
            if (did_work) {
                flush_sinks();
                batches_since_fsync_ = 0;
            }
            flush_requested_.store(false, std::memory_order_release);
        }

        if (!running_.load(std::memory_order_acquire)) {
            // Final drain: producers may still have been mid-push
            batch.clear();
            while (ring_buffer_.drain(batch, kMaxBatchSize) > 0) {
                write_batch(batch);
                batch.clear();
            }
            shutdown_sinks();
            return;
        }
    }
}

// ============================================================================
// JSON Serialization
// ============================================================================

namespace {

void append_event_tracking(std::string& out, const AuditRecord& r) {
    out += std::format("\"audit_id\":\"{}\",\"sequence_num\":{},\"timestamp\":\"{}\",",
                       r.audit_id, r.sequence_num, utils::format_timestamp(r.timestamp));
    out += std::format("\"document_id\":{},", json_codec::encode_string(r.document_id));
}

void append_outcome(std::string& out, const AuditRecord& r) {
    out += std::format("\"state\":\"{}\",\"outcome\":\"{}\",\"error_code\":\"{}\",",
                       state_to_string(r.state),
                       outcome_to_string(r.outcome),
                       error_code_to_string(r.error_code));
    out += std::format("\"latency_ms\":{:.3f},\"fields_scanned\":{},\"fields_redacted\":{},"
                       "\"snapshot_version\":{},",
                       r.latency_ms, r.fields_scanned, r.fields_redacted, r.snapshot_version);
}

void append_combination(std::string& out, const AuditRecord& r) {
    out += std::format("\"combinatorial_flag\":{},", utils::booltostr(r.combinatorial_flag));
    if (r.combinatorial_flag) {
        out += "\"combination_rules\":[";
        for (size_t i = 0; i < r.combination_rules.size(); ++i) {
            if (i > 0) out += ',';
            out += json_codec::encode_string(r.combination_rules[i]);
        }
        out += std::format("],\"risk_score\":{:.3f},", r.risk_score);
    }
}

void append_detections(std::string& out, const AuditRecord& r) {
    out += "\"detections\":[";
    for (size_t i = 0; i < r.detections.size(); ++i) {
        const auto& d = r.detections[i];
        if (i > 0) out += ',';
        out += std::format(
            "{{\"field_path\":{},\"start\":{},\"end\":{},\"type\":\"{}\","
            "\"confidence\":{:.2f},\"redacted\":{}}}",
            json_codec::encode_string(d.field_path), d.start_offset, d.end_offset,
            pii_type_to_string(d.pii_type), d.confidence, utils::booltostr(d.redacted));
    }
    out += "],";
}

void append_integrity(std::string& out, const AuditRecord& r) {
    if (!r.record_hash.empty()) {
        out += std::format("\"record_hash\":\"{}\",\"previous_hash\":\"{}\"",
                           r.record_hash, r.previous_hash);
    } else if (!out.empty() && out.back() == ',') {
        out.pop_back();
    }
}

std::string body_without_integrity(const AuditRecord& r) {
    std::string out;
    out.reserve(256 + r.detections.size() * 96);
    append_event_tracking(out, r);
    append_outcome(out, r);
    append_combination(out, r);
    append_detections(out, r);
    return out;
}

} // anonymous namespace

std::string AuditEmitter::to_json(const AuditRecord& record) {
    std::string result;
    result += '{';
    result += body_without_integrity(record);
    append_integrity(result, record);
    result += '}';
    return result;
}

std::string AuditEmitter::compute_record_hash(
    const AuditRecord& record, const std::string& prev_hash) {

    std::string input = body_without_integrity(record);
    input += '|';
    input += prev_hash;

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) return "";

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;

    const bool ok = EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) == 1
        && EVP_DigestUpdate(ctx, input.data(), input.size()) == 1
        && EVP_DigestFinal_ex(ctx, hash, &hash_len) == 1;
    EVP_MD_CTX_free(ctx);
    if (!ok) return "";

    static constexpr char hex_chars[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(hash_len * 2);
    for (unsigned int i = 0; i < hash_len; ++i) {
        hex += hex_chars[(hash[i] >> 4) & 0x0F];
        hex += hex_chars[hash[i] & 0x0F];
    }
    return hex;
}

} // namespace piiguard
