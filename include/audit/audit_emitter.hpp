#pragma once

#include "audit/audit_record.hpp"
#include "audit/audit_sink.hpp"
#include "audit/ring_buffer.hpp"
#include "config/config_types.hpp"
#include "core/error.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace sqlguard {

/**
 * @brief Asynchronous audit emitter
 *
 * Request threads call emit(), which never blocks and never fails: the
 * record goes into a lock-free MPSC ring buffer, or is dropped and counted
 * when the buffer is full. A background writer thread drains batches,
 * extends the optional SHA-256 hash chain and writes JSON lines to the
 * sinks. Sink failures are counted and reported on the diagnostic log.
 *
 *   [request] --emit()--> [ring buffer] --drain()--> [writer] --> [FileSink]
 */
class AuditEmitter {
public:
    /**
     * @brief Emitter with a rotating FileSink built from config
     * @return CONFIG_ERROR when the audit file cannot be opened
     */
    [[nodiscard]] static Result<std::shared_ptr<AuditEmitter>> create(const AuditConfig& config);

    // Starts the writer thread immediately
    AuditEmitter(std::vector<std::unique_ptr<IAuditSink>> sinks, const AuditConfig& config);

    ~AuditEmitter();

    AuditEmitter(const AuditEmitter&) = delete;
    AuditEmitter& operator=(const AuditEmitter&) = delete;
    AuditEmitter(AuditEmitter&&) = delete;
    AuditEmitter& operator=(AuditEmitter&&) = delete;

    /**
     * @brief Enqueue a record (non-blocking)
     *
     * Assigns the sequence number. Dropped silently after shutdown.
     */
    void emit(AuditRecord record);

    // Blocks until everything emitted so far has reached the sinks
    void flush();

    // Drain, flush and close all sinks; idempotent
    void shutdown();

    struct Stats {
        uint64_t total_emitted;
        uint64_t total_written;
        uint64_t overflow_dropped;
        uint64_t flush_count;
        uint64_t sink_write_failures;
        size_t active_sinks;
    };

    [[nodiscard]] Stats get_stats() const;

    [[nodiscard]] static std::string to_json(const AuditRecord& record);
    [[nodiscard]] static std::string compute_record_hash(const AuditRecord& record,
                                                         const std::string& prev_hash);

private:
    void writer_thread_func();
    size_t write_batch(std::vector<AuditRecord>& batch);

    std::vector<std::unique_ptr<IAuditSink>> sinks_;
    MPSCRingBuffer<AuditRecord> ring_buffer_;

    std::thread writer_thread_;
    std::atomic<bool> running_{false};

    std::mutex flush_mutex_;
    std::condition_variable flush_cv_;
    std::condition_variable flush_done_cv_;
    bool flush_requested_ = false;          // guarded by flush_mutex_

    std::chrono::milliseconds batch_flush_interval_;
    size_t max_batch_size_;

    std::atomic<uint64_t> total_emitted_{0};
    std::atomic<uint64_t> total_written_{0};
    std::atomic<uint64_t> flush_count_{0};
    std::atomic<uint64_t> sink_write_failures_{0};
    std::atomic<uint64_t> sequence_counter_{0};

    // Hash chain (writer thread only)
    bool integrity_enabled_;
    std::string previous_hash_;
};

} // namespace sqlguard
