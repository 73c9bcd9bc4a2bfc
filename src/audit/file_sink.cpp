#include "audit/file_sink.hpp"
#include "core/utils.hpp"

#include <filesystem>
#include <format>
#include <stdexcept>

namespace piiguard {

FileSink::FileSink(const Config& config)
    : config_(config) {
    std::error_code ec;
    const auto parent = std::filesystem::path(config_.output_file).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
    }

    file_stream_.open(config_.output_file, std::ios::app);
    if (!file_stream_.is_open()) {
        throw std::runtime_error("Failed to open audit file: " + config_.output_file);
    }

    const auto file_size = std::filesystem::file_size(config_.output_file, ec);
    if (!ec) {
        current_file_size_ = static_cast<size_t>(file_size);
    }
}

FileSink::~FileSink() {
    shutdown();
}

bool FileSink::write(std::string_view json_lines) {
    if (!file_stream_.is_open()) return false;

    if (current_file_size_ > 0 &&
        current_file_size_ + json_lines.size() > config_.max_file_size_bytes) {
        rotate_file();
        if (!file_stream_.is_open()) return false;
    }

    file_stream_.write(json_lines.data(), static_cast<std::streamsize>(json_lines.size()));
    current_file_size_ += json_lines.size();
    return file_stream_.good();
}

void FileSink::flush() {
    file_stream_.flush();
}

void FileSink::shutdown() {
    if (file_stream_.is_open()) {
        file_stream_.flush();
        file_stream_.close();
    }
}

std::string FileSink::name() const {
    return "file:" + config_.output_file;
}

void FileSink::rotate_file() {
    file_stream_.flush();
    file_stream_.close();

    // Missing intermediate files are expected; rename/remove errors are ignored
    std::error_code ec;
    std::filesystem::remove(std::format("{}.{}", config_.output_file, config_.max_files), ec);

    for (int i = config_.max_files - 1; i >= 1; --i) {
        std::filesystem::rename(std::format("{}.{}", config_.output_file, i),
                                std::format("{}.{}", config_.output_file, i + 1), ec);
    }
    std::filesystem::rename(config_.output_file, config_.output_file + ".1", ec);

    file_stream_.open(config_.output_file, std::ios::app);
    if (!file_stream_.is_open()) {
        utils::log::error(std::format("Audit file {} could not be reopened after rotation",
                                      config_.output_file));
    }
    current_file_size_ = 0;
    ++rotation_count_;
}

} // namespace piiguard
