#pragma once

#include <string>
#include <string_view>

namespace piiguard {

/**
 * @brief Abstract interface for audit output destinations
 *
 * Each sink receives newline-terminated JSON records (one or more per
 * call) from the AuditEmitter's writer thread. Implementations are only
 * called from that thread, so no internal locking is needed.
 */
class IAuditSink {
public:
    virtual ~IAuditSink() = default;

    /// Write serialized records. Returns false on failure; the emitter
    /// counts the failure and moves on.
    [[nodiscard]] virtual bool write(std::string_view json_lines) = 0;

    virtual void flush() = 0;

    /// Graceful shutdown (drain buffers, close handles)
    virtual void shutdown() = 0;

    /// e.g. "file:/var/log/pii_audit.jsonl"
    [[nodiscard]] virtual std::string name() const = 0;
};

} // namespace piiguard
