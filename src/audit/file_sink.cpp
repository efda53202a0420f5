#include "audit/file_sink.hpp"
#include "core/utils.hpp"

#include <filesystem>
#include <format>

namespace sqlguard {

Result<std::unique_ptr<FileSink>> FileSink::open(const Config& config) {
    using R = Result<std::unique_ptr<FileSink>>;

    std::unique_ptr<FileSink> sink(new FileSink(config));
    if (!sink->file_stream_.is_open()) {
        return R::error(ErrorCategory::CONFIG_ERROR,
            "Failed to open audit file: " + config.output_file);
    }
    return R::ok(std::move(sink));
}

FileSink::FileSink(Config config)
    : config_(std::move(config)) {
    file_stream_.open(config_.output_file, std::ios::app);

    std::error_code ec;
    const auto file_size = std::filesystem::file_size(config_.output_file, ec);
    if (!ec) {
        current_file_size_ = static_cast<size_t>(file_size);
    }
}

FileSink::~FileSink() {
    shutdown();
}

bool FileSink::write(std::string_view lines) {
    if (current_file_size_ >= config_.max_file_size_bytes) {
        rotate_file();
    }
    if (!file_stream_.is_open()) {
        return false;
    }
    file_stream_.write(lines.data(), static_cast<std::streamsize>(lines.size()));
    current_file_size_ += lines.size();
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

    std::error_code ec;
    std::filesystem::remove(std::format("{}.{}", config_.output_file, config_.max_files), ec);

    // .N -> .N+1; missing files are skipped
    for (int i = config_.max_files - 1; i >= 1; --i) {
        std::filesystem::rename(std::format("{}.{}", config_.output_file, i),
                                std::format("{}.{}", config_.output_file, i + 1), ec);
    }
    std::filesystem::rename(config_.output_file, config_.output_file + ".1", ec);
    if (ec) {
        utils::log::warn(std::format("Audit rotation of {} failed: {}", config_.output_file, ec.message()));
    }

    file_stream_.open(config_.output_file, std::ios::app);
    current_file_size_ = 0;
    ++rotation_count_;
}

} // namespace sqlguard
