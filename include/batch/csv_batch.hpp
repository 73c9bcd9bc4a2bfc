#pragma once

#include "core/pipeline.hpp"

#include <cstdint>
#include <iosfwd>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace piiguard {

// ============================================================================
// CSV Reader / Writer (RFC 4180)
// ============================================================================

/**
 * @brief Streaming CSV row reader
 *
 * Quoted fields may contain delimiters, doubled quotes and line breaks.
 * CRLF and LF line endings are both accepted. Blank lines are skipped.
 */
class CsvReader {
public:
    explicit CsvReader(std::istream& input) : input_(input) {}

    /// False at end of input; throws std::runtime_error on an unterminated quote
    [[nodiscard]] bool read_row(std::vector<std::string>& fields);

    /// Physical line number where the last returned row started (1-based)
    [[nodiscard]] size_t row_line() const noexcept { return row_line_; }

private:
    std::istream& input_;
    size_t line_ = 0;
    size_t row_line_ = 0;
};

class CsvWriter {
public:
    explicit CsvWriter(std::ostream& output) : output_(output) {}

    void write_row(const std::vector<std::string>& fields);

    /// Quote only when the field holds a delimiter, quote or line break
    [[nodiscard]] static std::string escape_field(std::string_view field);

private:
    std::ostream& output_;
};

// ============================================================================
// BatchProcessor
// ============================================================================

/**
 * @brief Offline CSV mode: record_id,data_json -> record_id,redacted_data_json,is_pii
 *
 * Each data_json cell runs through the same InterceptorPipeline as the
 * sidecar, with the latency budget disabled. is_pii is "True" when the
 * pipeline changed the document. Rows that cannot be decoded, or that end
 * DEGRADED for any other reason, are logged and skipped; their raw data
 * is never written.
 */
class BatchProcessor {
public:
    struct Stats {
        uint64_t rows_read = 0;
        uint64_t rows_written = 0;
        uint64_t rows_with_pii = 0;
        uint64_t rows_skipped = 0;          ///< All skipped rows
        uint64_t decode_errors = 0;         ///< Subset of rows_skipped
    };

    explicit BatchProcessor(std::shared_ptr<EngineRegistry> registry,
                            std::shared_ptr<AuditEmitter> audit_emitter = nullptr);

    /// Throws std::runtime_error on a missing header column or malformed CSV
    Stats run(std::istream& input, std::ostream& output);

    /// Throws std::runtime_error if either file cannot be opened
    Stats run_files(const std::string& input_path, const std::string& output_path);

private:
    InterceptorPipeline pipeline_;
};

} // namespace piiguard
