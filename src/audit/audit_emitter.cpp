#include "audit/audit_emitter.hpp"
#include "audit/file_sink.hpp"
#include "core/utils.hpp"

#include <openssl/evp.h>

#include <format>

namespace sqlguard {

// ============================================================================
// Construction / Destruction
// ============================================================================

Result<std::shared_ptr<AuditEmitter>> AuditEmitter::create(const AuditConfig& config) {
    using R = Result<std::shared_ptr<AuditEmitter>>;

    FileSink::Config file_cfg;
    file_cfg.output_file = config.output_file;
    file_cfg.max_file_size_bytes = config.rotation_max_file_size_mb * 1024ULL * 1024;
    file_cfg.max_files = config.rotation_max_files;

    auto sink = FileSink::open(file_cfg);
    if (sink.is_error()) {
        return R::error(sink.error_category(), sink.error_message());
    }

    std::vector<std::unique_ptr<IAuditSink>> sinks;
    sinks.push_back(std::move(sink.value()));
    return R::ok(std::make_shared<AuditEmitter>(std::move(sinks), config));
}

AuditEmitter::AuditEmitter(std::vector<std::unique_ptr<IAuditSink>> sinks,
                           const AuditConfig& config)
    : sinks_(std::move(sinks)),
      ring_buffer_(config.ring_buffer_size),
      batch_flush_interval_(config.batch_flush_interval),
      max_batch_size_(config.max_batch_size == 0 ? 1 : config.max_batch_size),
      integrity_enabled_(config.integrity_enabled) {
    running_.store(true, std::memory_order_release);
    writer_thread_ = std::thread(&AuditEmitter::writer_thread_func, this);
}

AuditEmitter::~AuditEmitter() {
    shutdown();
}

// ============================================================================
// Public Interface
// ============================================================================

void AuditEmitter::emit(AuditRecord record) {
    if (!running_.load(std::memory_order_acquire)) {
        return;
    }
    record.sequence_num = sequence_counter_.fetch_add(1, std::memory_order_relaxed);
    if (ring_buffer_.try_push(std::move(record))) {
        total_emitted_.fetch_add(1, std::memory_order_relaxed);
    }
}

void AuditEmitter::flush() {
    std::unique_lock<std::mutex> lock(flush_mutex_);
    if (!running_.load(std::memory_order_acquire)) {
        return;
    }
    flush_requested_ = true;
    flush_cv_.notify_one();
    flush_done_cv_.wait(lock, [this] {
        return !flush_requested_ || !running_.load(std::memory_order_acquire);
    });
}

void AuditEmitter::shutdown() {
    {
        std::lock_guard<std::mutex> lock(flush_mutex_);
        if (!running_.exchange(false, std::memory_order_acq_rel)) {
            return;
        }
    }
    flush_cv_.notify_one();
    if (writer_thread_.joinable()) {
        writer_thread_.join();
    }
    flush_done_cv_.notify_all();
}

AuditEmitter::Stats AuditEmitter::get_stats() const {
    return Stats{
        .total_emitted = total_emitted_.load(std::memory_order_relaxed),
        .total_written = total_written_.load(std::memory_order_relaxed),
        .overflow_dropped = ring_buffer_.overflow_count(),
        .flush_count = flush_count_.load(std::memory_order_relaxed),
        .sink_write_failures = sink_write_failures_.load(std::memory_order_relaxed),
        .active_sinks = sinks_.size()
    };
}

// ============================================================================
// Background Writer Thread
// ============================================================================

size_t AuditEmitter::write_batch(std::vector<AuditRecord>& batch) {
    if (integrity_enabled_) {
        for (auto& record : batch) {
            record.previous_hash = previous_hash_;
            record.record_hash = compute_record_hash(record, previous_hash_);
            previous_hash_ = record.record_hash;
        }
    }

    std::string output;
    output.reserve(batch.size() * 512);
    for (const auto& record : batch) {
        output += to_json(record);
        output += '\n';
    }

    for (auto& sink : sinks_) {
        if (!sink->write(output)) {
            const auto failures = sink_write_failures_.fetch_add(1, std::memory_order_relaxed) + 1;
            utils::log::error(std::format("Audit sink {} write failed ({} records lost, {} failures total)",
                sink->name(), batch.size(), failures));
        }
    }

    total_written_.fetch_add(batch.size(), std::memory_order_relaxed);
    flush_count_.fetch_add(1, std::memory_order_relaxed);
    return batch.size();
}

void AuditEmitter::writer_thread_func() {
    std::vector<AuditRecord> batch;
    batch.reserve(max_batch_size_);

    while (true) {
        bool flush_now = false;
        {
            std::unique_lock<std::mutex> lock(flush_mutex_);
            flush_cv_.wait_for(lock, batch_flush_interval_, [this] {
                return flush_requested_ || !running_.load(std::memory_order_acquire);
            });
            flush_now = flush_requested_;
        }

        bool did_work = false;
        while (ring_buffer_.drain(batch, max_batch_size_) > 0) {
            write_batch(batch);
            batch.clear();
            did_work = true;
        }
        if (did_work || flush_now) {
            for (auto& sink : sinks_) sink->flush();
        }

        if (flush_now) {
            {
                std::lock_guard<std::mutex> lock(flush_mutex_);
                flush_requested_ = false;
            }
            flush_done_cv_.notify_all();
        }

        if (!running_.load(std::memory_order_acquire)) {
            while (ring_buffer_.drain(batch, max_batch_size_) > 0) {
                write_batch(batch);
                batch.clear();
            }
            for (auto& sink : sinks_) {
                sink->flush();
                sink->shutdown();
            }
            return;
        }
    }
}

// ============================================================================
// JSON Serialization
// ============================================================================

namespace {

void append_string(std::string& out, std::string_view key, std::string_view value) {
    out += std::format("\"{}\":\"{}\",", key, utils::escape_json(value));
}

void append_event(std::string& out, const AuditRecord& r) {
    out += std::format("\"audit_id\":\"{}\",\"sequence_num\":{},\"timestamp\":\"{}\",\"event\":\"{}\",",
                       r.audit_id, r.sequence_num, utils::format_timestamp(r.timestamp),
                       audit_event_kind_to_string(r.kind));
}

void append_identity(std::string& out, const AuditRecord& r) {
    out += std::format("\"identity\":{{\"role\":\"{}\",\"subject_id\":\"{}\",\"display_name\":\"{}\"}},",
                       utils::escape_json(r.role), utils::escape_json(r.subject_id),
                       utils::escape_json(r.display_name));
}

void append_request(std::string& out, const AuditRecord& r) {
    if (!r.question.empty()) {
        append_string(out, "question", r.question);
    }
    append_string(out, "sql", r.sql);
    out += std::format("\"fingerprint_hash\":{},", r.fingerprint_hash);
}

void append_verdict(std::string& out, const AuditRecord& r) {
    if (r.denial_reason) {
        out += std::format("\"reason\":\"{}\",", denial_reason_to_string(*r.denial_reason));
    }
    if (!r.detail.empty()) {
        append_string(out, "detail", r.detail);
    }
}

void append_execution(std::string& out, const AuditRecord& r) {
    if (r.error_kind) {
        out += std::format("\"error_kind\":\"{}\",", execution_error_kind_to_string(*r.error_kind));
        append_string(out, "error_message", r.error_message);
    }
    out += std::format("\"rows_returned\":{},\"elapsed_ms\":{:.3f},", r.rows_returned, r.elapsed_ms);
}

void append_sensitive(std::string& out, const AuditRecord& r) {
    if (r.sensitive_columns.empty()) return;
    out += "\"sensitive_columns\":[";
    for (size_t i = 0; i < r.sensitive_columns.size(); ++i) {
        if (i > 0) out += ',';
        out += std::format("\"{}\"", utils::escape_json(r.sensitive_columns[i]));
    }
    out += "],";
}

void append_integrity(std::string& out, const AuditRecord& r) {
    if (!r.record_hash.empty()) {
        out += std::format("\"record_hash\":\"{}\",\"previous_hash\":\"{}\"",
                           r.record_hash, r.previous_hash);
    } else if (!out.empty() && out.back() == ',') {
        out.pop_back();
    }
}

} // anonymous namespace

std::string AuditEmitter::to_json(const AuditRecord& record) {
    std::string result;
    result.reserve(512);
    result += '{';
    append_event(result, record);
    append_identity(result, record);
    append_request(result, record);
    append_verdict(result, record);
    append_execution(result, record);
    append_sensitive(result, record);
    append_integrity(result, record);
    result += '}';
    return result;
}

std::string AuditEmitter::compute_record_hash(const AuditRecord& record,
                                              const std::string& prev_hash) {
    // sequence|timestamp|event|role|subject|sql|reason|previous_hash
    std::string input;
    input.reserve(256 + record.sql.size());
    input += std::format("{}|{}|{}|{}|{}|", record.sequence_num,
                         utils::format_timestamp(record.timestamp),
                         audit_event_kind_to_string(record.kind),
                         record.role, record.subject_id);
    input += record.sql;
    input += '|';
    input += record.denial_reason ? denial_reason_to_string(*record.denial_reason) : "";
    input += '|';
    input += prev_hash;

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) return "";

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;

    const bool ok = EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) == 1 &&
                    EVP_DigestUpdate(ctx, input.data(), input.size()) == 1 &&
                    EVP_DigestFinal_ex(ctx, hash, &hash_len) == 1;
    EVP_MD_CTX_free(ctx);
    if (!ok) return "";

    static constexpr char hex_chars[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(hash_len * 2);
    for (unsigned int i = 0; i < hash_len; ++i) {
        hex += hex_chars[(hash[i] >> 4) & 0x0F];
        hex += hex_chars[hash[i] & 0x0F];
    }
    return hex;
}

} // namespace sqlguard
