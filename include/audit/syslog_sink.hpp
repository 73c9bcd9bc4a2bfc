#pragma once

#include "audit/audit_sink.hpp"

#include <cstdint>
#include <string>

namespace piiguard {

/**
 * @brief POSIX syslog audit sink
 *
 * One syslog message per audit record (batches are split on newlines).
 */
class SyslogSink : public IAuditSink {
public:
    struct Config {
        std::string ident = "pii-guard";
        int facility = 128;   // LOG_LOCAL0
        int priority = 6;     // LOG_INFO
    };

    explicit SyslogSink(const Config& config);
    ~SyslogSink() override;

    [[nodiscard]] bool write(std::string_view json_lines) override;
    void flush() override;
    void shutdown() override;
    [[nodiscard]] std::string name() const override;

    [[nodiscard]] uint64_t records_written() const { return records_written_; }

private:
    Config config_;
    uint64_t records_written_ = 0;
    bool open_ = false;
};

} // namespace piiguard
