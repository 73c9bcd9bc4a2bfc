#include <catch2/catch_test_macros.hpp>
#include "audit/audit_emitter.hpp"
#include "audit/file_sink.hpp"

#include <filesystem>
#include <fstream>
#include <string>

using namespace piiguard;

namespace {

std::string read_file_contents(const std::string& path) {
    std::ifstream ifs(path);
    return std::string(std::istreambuf_iterator<char>(ifs),
                       std::istreambuf_iterator<char>());
}

void cleanup_rotation_files(const std::string& base, int max_files) {
    std::filesystem::remove(base);
    for (int i = 1; i <= max_files + 2; ++i) {
        std::filesystem::remove(base + "." + std::to_string(i));
    }
}

} // anonymous namespace

TEST_CASE("Audit Rotation: no rotation below the size limit", "[audit][rotation]") {
    const std::string base = "/tmp/piiguard_rot_none.jsonl";
    cleanup_rotation_files(base, 3);

    FileSink::Config cfg{base, 1024, 3};
    FileSink sink(cfg);
    REQUIRE(sink.write("short line\n"));
    REQUIRE(sink.write("another line\n"));
    CHECK(sink.rotation_count() == 0);
    CHECK_FALSE(std::filesystem::exists(base + ".1"));

    sink.shutdown();
    cleanup_rotation_files(base, 3);
}

TEST_CASE("Audit Rotation: exceeding the limit moves the file to .1", "[audit][rotation]") {
    const std::string base = "/tmp/piiguard_rot_basic.jsonl";
    cleanup_rotation_files(base, 3);

    {
        FileSink::Config cfg{base, 32, 3};
        FileSink sink(cfg);
        REQUIRE(sink.write("{\"n\":\"first-record-xxxxxxx\"}\n"));
        REQUIRE(sink.write("{\"n\":\"second-record-xxxxxx\"}\n"));
        CHECK(sink.rotation_count() == 1);
        CHECK(sink.current_file_size() == 29);
    }

    REQUIRE(std::filesystem::exists(base + ".1"));
    CHECK(read_file_contents(base + ".1") == "{\"n\":\"first-record-xxxxxxx\"}\n");
    CHECK(read_file_contents(base) == "{\"n\":\"second-record-xxxxxx\"}\n");

    cleanup_rotation_files(base, 3);
}

TEST_CASE("Audit Rotation: .1 is always the newest rotated file", "[audit][rotation]") {
    const std::string base = "/tmp/piiguard_rot_order.jsonl";
    cleanup_rotation_files(base, 5);

    {
        FileSink::Config cfg{base, 8, 5};
        FileSink sink(cfg);
        REQUIRE(sink.write("aaaaaa\n"));
        REQUIRE(sink.write("bbbbbb\n"));
        REQUIRE(sink.write("cccccc\n"));
        CHECK(sink.rotation_count() == 2);
    }

    CHECK(read_file_contents(base) == "cccccc\n");
    CHECK(read_file_contents(base + ".1") == "bbbbbb\n");
    CHECK(read_file_contents(base + ".2") == "aaaaaa\n");

    cleanup_rotation_files(base, 5);
}

TEST_CASE("Audit Rotation: files beyond max_files are deleted", "[audit][rotation]") {
    const std::string base = "/tmp/piiguard_rot_prune.jsonl";
    const int max_files = 2;
    cleanup_rotation_files(base, max_files);

    {
        FileSink::Config cfg{base, 8, max_files};
        FileSink sink(cfg);
        for (int i = 0; i < 6; ++i) {
            REQUIRE(sink.write("line-" + std::to_string(i) + "\n"));
        }
        CHECK(sink.rotation_count() == 5);
    }

    CHECK(std::filesystem::exists(base));
    CHECK(std::filesystem::exists(base + ".1"));
    CHECK(std::filesystem::exists(base + ".2"));
    CHECK_FALSE(std::filesystem::exists(base + ".3"));
    CHECK(read_file_contents(base) == "line-5\n");
    CHECK(read_file_contents(base + ".2") == "line-3\n");

    cleanup_rotation_files(base, max_files);
}

TEST_CASE("Audit Rotation: an oversized single write still lands", "[audit][rotation]") {
    const std::string base = "/tmp/piiguard_rot_oversize.jsonl";
    cleanup_rotation_files(base, 2);

    {
        FileSink::Config cfg{base, 4, 2};
        FileSink sink(cfg);
        REQUIRE(sink.write("this line is longer than four bytes\n"));
        CHECK(sink.rotation_count() == 0);
    }
    CHECK(read_file_contents(base) == "this line is longer than four bytes\n");

    cleanup_rotation_files(base, 2);
}

TEST_CASE("Audit Rotation: emitter config drives file rotation", "[audit][rotation][emitter]") {
    const std::string base = "/tmp/piiguard_rot_emitter.jsonl";
    cleanup_rotation_files(base, 3);

    AuditConfig cfg;
    cfg.output_file = base;
    cfg.rotation_max_file_size_mb = 1;
    cfg.rotation_max_files = 3;
    cfg.ring_buffer_size = 64;
    cfg.batch_flush_interval = std::chrono::milliseconds(10);

    {
        AuditEmitter emitter(cfg);
        AuditRecord record;
        record.audit_id = "a1";
        record.document_id = "rotation-doc";
        emitter.emit(record);
        emitter.flush();
        CHECK(emitter.get_stats().active_sinks == 1);
    }

    const auto contents = read_file_contents(base);
    CHECK(contents.find("rotation-doc") != std::string::npos);
    CHECK_FALSE(std::filesystem::exists(base + ".1"));

    cleanup_rotation_files(base, 3);
}
