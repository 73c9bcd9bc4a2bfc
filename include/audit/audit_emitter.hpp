#pragma once

#include "audit/audit_record.hpp"
#include "audit/audit_sink.hpp"
#include "audit/ring_buffer.hpp"
#include "config/config_types.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace piiguard {

/**
 * @brief Async audit emitter
 *
 * Decouples audit record production from I/O using a lock-free MPSC
 * ring buffer and a dedicated background writer thread.
 *
 * Pipeline threads call emit(), which never blocks: when the buffer is
 * full the record is dropped and counted. The writer drains in batches,
 * links each record into a SHA-256 hash chain, serializes it as one
 * JSON line and writes the batch to every sink. Sink failures are
 * counted and logged, never propagated.
 *
 *   [worker 1] --emit()--> [ring buffer] --drain()--> [writer] --> [file sink]
 *   [worker N] --emit()-->                                     --> [syslog sink]
 */
class AuditEmitter {
public:
    /**
     * @brief Construct from AuditConfig
     *
     * Creates a rotating FileSink, plus a SyslogSink when enabled.
     * Starts the writer thread immediately.
     */
    explicit AuditEmitter(const AuditConfig& config);

    /// Construct with caller-supplied sinks (ring size, flush interval and
    /// integrity flag still come from config)
    AuditEmitter(const AuditConfig& config, std::vector<std::unique_ptr<IAuditSink>> sinks);

    ~AuditEmitter();

    // Non-copyable, non-movable (owns thread and ring buffer)
    AuditEmitter(const AuditEmitter&) = delete;
    AuditEmitter& operator=(const AuditEmitter&) = delete;
    AuditEmitter(AuditEmitter&&) = delete;
    AuditEmitter& operator=(AuditEmitter&&) = delete;

    /**
     * @brief Enqueue a record (non-blocking)
     *
     * Assigns the sequence number; drops and counts the record if the
     * buffer is full.
     */
    void emit(AuditRecord record);

    /// Block until everything emitted so far has reached the sinks
    void flush();

    /// Drain, flush and close all sinks. Idempotent.
    void shutdown();

    struct Stats {
        uint64_t total_emitted;         ///< Records accepted into the ring buffer
        uint64_t total_written;         ///< Records handed to sinks
        uint64_t overflow_dropped;      ///< Records dropped (buffer full)
        uint64_t flush_count;           ///< Batches written
        uint64_t sink_write_failures;   ///< Failed sink writes
        size_t active_sinks;
    };

    [[nodiscard]] Stats get_stats() const;

    /// One JSON line, without trailing newline
    [[nodiscard]] static std::string to_json(const AuditRecord& record);

    /// SHA-256 (hex) over the record's JSON body without hash fields, then prev_hash
    [[nodiscard]] static std::string compute_record_hash(const AuditRecord& record,
                                                         const std::string& prev_hash);

private:
    void start();
    void writer_thread_func();
    void write_batch(std::vector<AuditRecord>& batch);

    void write_to_sinks(std::string_view data);
    void flush_sinks();
    void shutdown_sinks();

    static constexpr size_t kMaxBatchSize = 1000;
    static constexpr size_t kFsyncInterval = 10;

    std::vector<std::unique_ptr<IAuditSink>> sinks_;
    MPSCRingBuffer<AuditRecord> ring_buffer_;

    std::thread writer_thread_;
    std::atomic<bool> running_{false};

    std::mutex flush_mutex_;
    std::condition_variable flush_cv_;
    std::atomic<bool> flush_requested_{false};

    std::chrono::milliseconds batch_flush_interval_{100};

    std::atomic<uint64_t> total_emitted_{0};
    std::atomic<uint64_t> total_written_{0};
    std::atomic<uint64_t> flush_count_{0};
    std::atomic<uint64_t> sink_write_failures_{0};
    std::atomic<uint64_t> sequence_counter_{0};

    // Hash chain (writer thread only)
    bool integrity_enabled_{true};
    std::string previous_hash_;
    size_t batches_since_fsync_ = 0;
};

} // namespace piiguard
