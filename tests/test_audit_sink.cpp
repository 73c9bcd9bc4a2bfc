#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "audit/audit_emitter.hpp"
#include "audit/file_sink.hpp"
#include "audit/syslog_sink.hpp"
#include "core/utils.hpp"
#include "mocks/memory_audit_sink.hpp"

#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace piiguard;
using Catch::Matchers::ContainsSubstring;

namespace {

std::string read_file_contents(const std::string& path) {
    std::ifstream ifs(path);
    return std::string(std::istreambuf_iterator<char>(ifs),
                       std::istreambuf_iterator<char>());
}

AuditRecord sample_record(const std::string& document_id) {
    AuditRecord record;
    record.audit_id = utils::generate_uuid();
    record.timestamp = std::chrono::system_clock::now();
    record.document_id = document_id;
    record.fields_scanned = 3;

    AuditSpan span;
    span.field_path = "/user/email";
    span.start_offset = 0;
    span.end_offset = 16;
    span.pii_type = PiiType::EMAIL;
    span.confidence = 0.95;
    span.redacted = true;
    record.detections.push_back(span);
    record.fields_redacted = 1;
    return record;
}

AuditConfig test_config() {
    AuditConfig cfg;
    cfg.ring_buffer_size = 64;
    cfg.batch_flush_interval = std::chrono::milliseconds(10);
    return cfg;
}

} // anonymous namespace

// ============================================================================
// FileSink
// ============================================================================

TEST_CASE("Audit Sink: FileSink basic write", "[audit][sink]") {
    const std::string test_file = "/tmp/piiguard_file_sink_basic.jsonl";
    std::filesystem::remove(test_file);

    {
        FileSink::Config cfg;
        cfg.output_file = test_file;
        FileSink sink(cfg);

        CHECK(sink.name() == "file:" + test_file);
        REQUIRE(sink.write("{\"event\":\"test\"}\n"));
        CHECK(sink.current_file_size() == 17);
        sink.flush();
    }

    CHECK(read_file_contents(test_file) == "{\"event\":\"test\"}\n");
    std::filesystem::remove(test_file);
}

TEST_CASE("Audit Sink: FileSink appends to an existing file", "[audit][sink]") {
    const std::string test_file = "/tmp/piiguard_file_sink_append.jsonl";
    std::filesystem::remove(test_file);

    FileSink::Config cfg;
    cfg.output_file = test_file;
    {
        FileSink sink(cfg);
        REQUIRE(sink.write("one\n"));
    }
    {
        FileSink sink(cfg);
        CHECK(sink.current_file_size() == 4);
        REQUIRE(sink.write("two\n"));
    }

    CHECK(read_file_contents(test_file) == "one\ntwo\n");
    std::filesystem::remove(test_file);
}

TEST_CASE("Audit Sink: FileSink creates missing directories", "[audit][sink]") {
    const auto dir = std::filesystem::temp_directory_path() / "piiguard_sink_dir" / "nested";
    std::filesystem::remove_all(dir.parent_path());

    FileSink::Config cfg;
    cfg.output_file = (dir / "audit.jsonl").string();
    {
        FileSink sink(cfg);
        REQUIRE(sink.write("x\n"));
    }
    CHECK(std::filesystem::exists(cfg.output_file));
    std::filesystem::remove_all(dir.parent_path());
}

TEST_CASE("Audit Sink: FileSink write fails after shutdown", "[audit][sink]") {
    const std::string test_file = "/tmp/piiguard_file_sink_shutdown.jsonl";
    FileSink::Config cfg;
    cfg.output_file = test_file;

    FileSink sink(cfg);
    sink.shutdown();
    CHECK_FALSE(sink.write("late\n"));
    sink.shutdown();
    std::filesystem::remove(test_file);
}

// ============================================================================
// SyslogSink
// ============================================================================

TEST_CASE("Audit Sink: SyslogSink splits batches into records", "[audit][sink][syslog]") {
    SyslogSink::Config cfg;
    cfg.ident = "piiguard-test";
    SyslogSink sink(cfg);

    CHECK(sink.name() == "syslog:piiguard-test");
    REQUIRE(sink.write("{\"a\":1}\n{\"b\":2}\n"));
    CHECK(sink.records_written() == 2);

    sink.shutdown();
    CHECK_FALSE(sink.write("{\"c\":3}\n"));
}

// ============================================================================
// AuditEmitter fan-out
// ============================================================================

TEST_CASE("Audit Sink: emitter writes one JSON line per record", "[audit][emitter]") {
    auto state = std::make_shared<testing::MemoryAuditSink::State>();
    std::vector<std::unique_ptr<IAuditSink>> sinks;
    sinks.push_back(std::make_unique<testing::MemoryAuditSink>(state));
    AuditEmitter emitter(test_config(), std::move(sinks));

    emitter.emit(sample_record("doc-a"));
    emitter.emit(sample_record("doc-b"));
    emitter.flush();

    const auto lines = state->snapshot();
    REQUIRE(lines.size() == 2);
    CHECK_THAT(lines[0], ContainsSubstring(R"("document_id":"doc-a")"));
    CHECK_THAT(lines[0], ContainsSubstring(R"("sequence_num":0)"));
    CHECK_THAT(lines[1], ContainsSubstring(R"("sequence_num":1)"));
    CHECK_THAT(lines[0], ContainsSubstring(R"("field_path":"/user/email")"));
    CHECK_THAT(lines[0], ContainsSubstring(R"("confidence":0.95)"));
    CHECK(lines[0].front() == '{');
    CHECK(lines[0].back() == '}');

    const auto stats = emitter.get_stats();
    CHECK(stats.total_emitted == 2);
    CHECK(stats.total_written == 2);
    CHECK(stats.active_sinks == 1);
}

TEST_CASE("Audit Sink: every sink receives every record", "[audit][emitter]") {
    auto first = std::make_shared<testing::MemoryAuditSink::State>();
    auto second = std::make_shared<testing::MemoryAuditSink::State>();
    std::vector<std::unique_ptr<IAuditSink>> sinks;
    sinks.push_back(std::make_unique<testing::MemoryAuditSink>(first));
    sinks.push_back(std::make_unique<testing::MemoryAuditSink>(second));
    AuditEmitter emitter(test_config(), std::move(sinks));

    for (int i = 0; i < 5; ++i) emitter.emit(sample_record("doc"));
    emitter.flush();

    CHECK(first->snapshot().size() == 5);
    CHECK(second->snapshot() == first->snapshot());
}

TEST_CASE("Audit Sink: a failing sink is counted and does not block others", "[audit][emitter]") {
    auto failing = std::make_shared<testing::MemoryAuditSink::State>();
    failing->fail_writes.store(true);
    auto healthy = std::make_shared<testing::MemoryAuditSink::State>();

    std::vector<std::unique_ptr<IAuditSink>> sinks;
    sinks.push_back(std::make_unique<testing::MemoryAuditSink>(failing));
    sinks.push_back(std::make_unique<testing::MemoryAuditSink>(healthy));
    AuditEmitter emitter(test_config(), std::move(sinks));

    emitter.emit(sample_record("doc"));
    emitter.flush();

    CHECK(healthy->snapshot().size() == 1);
    CHECK(failing->snapshot().empty());
    CHECK(emitter.get_stats().sink_write_failures >= 1);
}

TEST_CASE("Audit Sink: overflow drops and counts records", "[audit][emitter]") {
    auto state = std::make_shared<testing::MemoryAuditSink::State>();
    std::vector<std::unique_ptr<IAuditSink>> sinks;
    sinks.push_back(std::make_unique<testing::MemoryAuditSink>(state));

    auto cfg = test_config();
    cfg.ring_buffer_size = 4;
    cfg.batch_flush_interval = std::chrono::milliseconds(1000);
    AuditEmitter emitter(cfg, std::move(sinks));

    for (int i = 0; i < 100; ++i) emitter.emit(sample_record("burst"));
    emitter.flush();

    const auto stats = emitter.get_stats();
    CHECK(stats.total_emitted + stats.overflow_dropped == 100);
    CHECK(stats.overflow_dropped > 0);
    CHECK(state->snapshot().size() == stats.total_emitted);
}

TEST_CASE("Audit Sink: shutdown drains, closes sinks and ignores later emits", "[audit][emitter]") {
    auto state = std::make_shared<testing::MemoryAuditSink::State>();
    std::vector<std::unique_ptr<IAuditSink>> sinks;
    sinks.push_back(std::make_unique<testing::MemoryAuditSink>(state));

    auto cfg = test_config();
    cfg.batch_flush_interval = std::chrono::milliseconds(1000);
    AuditEmitter emitter(cfg, std::move(sinks));

    emitter.emit(sample_record("before"));
    emitter.shutdown();
    CHECK(state->snapshot().size() == 1);
    CHECK(state->shut_down.load());

    emitter.emit(sample_record("after"));
    emitter.flush();
    emitter.shutdown();
    CHECK(state->snapshot().size() == 1);
    CHECK(emitter.get_stats().total_emitted == 1);
}

TEST_CASE("Audit Sink: concurrent producers lose nothing below capacity", "[audit][emitter][concurrency]") {
    auto state = std::make_shared<testing::MemoryAuditSink::State>();
    std::vector<std::unique_ptr<IAuditSink>> sinks;
    sinks.push_back(std::make_unique<testing::MemoryAuditSink>(state));

    auto cfg = test_config();
    cfg.ring_buffer_size = 4096;
    AuditEmitter emitter(cfg, std::move(sinks));

    std::vector<std::thread> producers;
    for (int t = 0; t < 4; ++t) {
        producers.emplace_back([&emitter, t] {
            for (int i = 0; i < 250; ++i) {
                emitter.emit(sample_record("t" + std::to_string(t)));
            }
        });
    }
    for (auto& p : producers) p.join();
    emitter.flush();

    CHECK(state->snapshot().size() == 1000);
    CHECK(emitter.get_stats().overflow_dropped == 0);
}
