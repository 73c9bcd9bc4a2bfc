#pragma once

#include "audit/audit_sink.hpp"

#include <cstddef>
#include <fstream>
#include <string>

namespace piiguard {

/**
 * @brief JSONL audit file with size-based rotation
 *
 * Rotated files are named audit.jsonl.1 (newest) .. audit.jsonl.N;
 * anything beyond max_files is deleted. The parent directory is created
 * if missing.
 *
 * Called exclusively from the AuditEmitter writer thread.
 */
class FileSink : public IAuditSink {
public:
    struct Config {
        std::string output_file = "pii_audit.jsonl";
        size_t max_file_size_bytes = 100ULL * 1024 * 1024;
        int max_files = 10;
    };

    /// Throws std::runtime_error if the file cannot be opened
    explicit FileSink(const Config& config);
    ~FileSink() override;

    [[nodiscard]] bool write(std::string_view json_lines) override;
    void flush() override;
    void shutdown() override;
    [[nodiscard]] std::string name() const override;

    [[nodiscard]] size_t rotation_count() const { return rotation_count_; }
    [[nodiscard]] size_t current_file_size() const { return current_file_size_; }

private:
    void rotate_file();

    Config config_;
    std::ofstream file_stream_;
    size_t current_file_size_ = 0;
    size_t rotation_count_ = 0;
};

} // namespace piiguard
