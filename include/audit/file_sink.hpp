#pragma once

#include "audit/audit_sink.hpp"
#include "core/error.hpp"
#include <cstddef>
#include <fstream>
#include <memory>
#include <string>

namespace sqlguard {

/**
 * @brief JSON-lines audit file with size-based rotation
 *
 * Rotated files get numeric suffixes (audit.jsonl.1 is the newest);
 * files beyond max_files are deleted.
 */
class FileSink : public IAuditSink {
public:
    struct Config {
        std::string output_file = "audit.jsonl";
        size_t max_file_size_bytes = 100ULL * 1024 * 1024;
        int max_files = 10;
    };

    // CONFIG_ERROR when the file cannot be opened for append
    [[nodiscard]] static Result<std::unique_ptr<FileSink>> open(const Config& config);

    ~FileSink() override;

    [[nodiscard]] bool write(std::string_view lines) override;
    void flush() override;
    void shutdown() override;
    [[nodiscard]] std::string name() const override;

    [[nodiscard]] size_t rotation_count() const { return rotation_count_; }
    [[nodiscard]] size_t current_file_size() const { return current_file_size_; }

private:
    explicit FileSink(Config config);

    void rotate_file();

    Config config_;
    std::ofstream file_stream_;
    size_t current_file_size_ = 0;
    size_t rotation_count_ = 0;
};

} // namespace sqlguard
