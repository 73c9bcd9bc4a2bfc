#include "audit/syslog_sink.hpp"

#include <syslog.h>

namespace piiguard {

SyslogSink::SyslogSink(const Config& config)
    : config_(config) {
    // openlog keeps the pointer; config_.ident lives as long as the sink
    openlog(config_.ident.c_str(), LOG_NDELAY | LOG_PID, config_.facility);
    open_ = true;
}

SyslogSink::~SyslogSink() {
    shutdown();
}

bool SyslogSink::write(std::string_view json_lines) {
    if (!open_) return false;

    size_t pos = 0;
    while (pos < json_lines.size()) {
        size_t end = json_lines.find('\n', pos);
        if (end == std::string_view::npos) end = json_lines.size();

        if (end > pos) {
            const std::string msg(json_lines.substr(pos, end - pos));
            syslog(config_.priority, "%s", msg.c_str());
            ++records_written_;
        }
        pos = end + 1;
    }
    return true;
}

void SyslogSink::flush() {
    // syslog(3) is unbuffered
}

void SyslogSink::shutdown() {
    if (open_) {
        closelog();
        open_ = false;
    }
}

std::string SyslogSink::name() const {
    return "syslog:" + config_.ident;
}

} // namespace piiguard
