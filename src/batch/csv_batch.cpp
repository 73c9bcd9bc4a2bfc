#include "batch/csv_batch.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <fstream>
#include <istream>
#include <ostream>
#include <stdexcept>

namespace piiguard {

namespace {

constexpr char kDelimiter = ',';
constexpr char kQuote = '"';
constexpr std::string_view kLineTerminator = "\r\n";

constexpr std::string_view kRecordIdColumn = "record_id";
constexpr std::string_view kDataColumn = "data_json";

size_t column_index(const std::vector<std::string>& header, std::string_view name) {
    const auto it = std::find(header.begin(), header.end(), name);
    if (it == header.end()) {
        throw std::runtime_error(std::format("CSV header is missing column '{}'", name));
    }
    return static_cast<size_t>(it - header.begin());
}

} // anonymous namespace

// ============================================================================
// CsvReader
// ============================================================================

bool CsvReader::read_row(std::vector<std::string>& fields) {
    fields.clear();

    std::string line;
    // Skip blank lines between records
    do {
        if (!std::getline(input_, line)) return false;
        ++line_;
        if (!line.empty() && line.back() == '\r') line.pop_back();
    } while (line.empty());

    row_line_ = line_;
    std::string field;
    bool in_quotes = false;

    while (true) {
        for (size_t i = 0; i < line.size(); ++i) {
            const char c = line[i];
            if (in_quotes) {
                if (c == kQuote) {
                    if (i + 1 < line.size() && line[i + 1] == kQuote) {
                        field += kQuote;
                        ++i;
                    } else {
                        in_quotes = false;
                    }
                } else {
                    field += c;
                }
            } else if (c == kQuote) {
                in_quotes = true;
            } else if (c == kDelimiter) {
                fields.push_back(std::move(field));
                field.clear();
            } else {
                field += c;
            }
        }

        if (!in_quotes) break;

        // Quoted field spans a line break
        if (!std::getline(input_, line)) {
            throw std::runtime_error(std::format(
                "Unterminated quoted field in CSV row starting at line {}", row_line_));
        }
        ++line_;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        field += '\n';
    }

    fields.push_back(std::move(field));
    return true;
}

// ============================================================================
// CsvWriter
// ============================================================================

std::string CsvWriter::escape_field(std::string_view field) {
    const bool needs_quotes = field.find_first_of("\",\r\n") != std::string_view::npos;
    if (!needs_quotes) return std::string(field);

    std::string out;
    out.reserve(field.size() + 2);
    out += kQuote;
    for (const char c : field) {
        if (c == kQuote) out += kQuote;
        out += c;
    }
    out += kQuote;
    return out;
}

void CsvWriter::write_row(const std::vector<std::string>& fields) {
    for (size_t i = 0; i < fields.size(); ++i) {
        if (i > 0) output_ << kDelimiter;
        output_ << escape_field(fields[i]);
    }
    output_ << kLineTerminator;
}

// ============================================================================
// BatchProcessor
// ============================================================================

BatchProcessor::BatchProcessor(std::shared_ptr<EngineRegistry> registry,
                               std::shared_ptr<AuditEmitter> audit_emitter)
    : pipeline_(std::move(registry), std::move(audit_emitter),
                InterceptorPipeline::Options{.latency_budget_ms = 0}) {}

BatchProcessor::Stats BatchProcessor::run(std::istream& input, std::ostream& output) {
    Stats stats;
    CsvReader reader(input);
    CsvWriter writer(output);

    std::vector<std::string> header;
    if (!reader.read_row(header)) {
        throw std::runtime_error("CSV input is empty");
    }
    const size_t id_col = column_index(header, kRecordIdColumn);
    const size_t data_col = column_index(header, kDataColumn);
    const size_t min_columns = std::max(id_col, data_col) + 1;

    writer.write_row({"record_id", "redacted_data_json", "is_pii"});

    std::vector<std::string> row;
    while (reader.read_row(row)) {
        ++stats.rows_read;

        if (row.size() < min_columns) {
            utils::log::warn(std::format("Skipping CSV line {}: expected at least {} columns, got {}",
                                         reader.row_line(), min_columns, row.size()));
            ++stats.rows_skipped;
            continue;
        }

        const std::string& record_id = row[id_col];
        auto result = pipeline_.process(std::move(row[data_col]), record_id);

        if (!result.forwarded()) {
            if (result.error_code == ErrorCode::PAYLOAD_DECODE_ERROR) {
                ++stats.decode_errors;
                utils::log::warn(std::format("Skipping record {}: invalid JSON ({})",
                                             record_id, result.error_message));
            } else {
                utils::log::warn(std::format("Skipping record {}: {} ({})",
                                             record_id, error_code_to_string(result.error_code),
                                             result.error_message));
            }
            ++stats.rows_skipped;
            continue;
        }

        writer.write_row({record_id, result.body, result.redacted ? "True" : "False"});
        ++stats.rows_written;
        if (result.redacted) ++stats.rows_with_pii;
    }

    output.flush();
    if (!output) {
        throw std::runtime_error("Failed writing CSV output");
    }

    utils::log::info(std::format("Batch complete: {} rows read, {} written, {} with PII, {} skipped",
                                 stats.rows_read, stats.rows_written, stats.rows_with_pii,
                                 stats.rows_skipped));
    return stats;
}

BatchProcessor::Stats BatchProcessor::run_files(const std::string& input_path,
                                                const std::string& output_path) {
    std::ifstream in(input_path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("Cannot open input CSV: " + input_path);
    }
    std::ofstream out(output_path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw std::runtime_error("Cannot open output CSV: " + output_path);
    }
    return run(in, out);
}

} // namespace piiguard
