#pragma once

#include "db/iconnection_factory.hpp"
#include "db/iconnection_pool.hpp"
#include "db/pooled_connection.hpp"
#include <atomic>
#include <chrono>
#include <deque>
#include <memory>
#include <mutex>
#include <semaphore>
#include <string>
#include <unordered_map>

namespace sqlguard {

/**
 * @brief Database-agnostic connection pool
 *
 * - Bounded: max_connections enforced via counting_semaphore
 * - Lazy: connections created on demand up to max, min pre-warmed
 * - Health checks only for connections idle longer than idle_timeout
 * - Connections older than max_lifetime are recycled on acquire
 * - RAII: PooledConnection returns itself on destruction
 */
class GenericConnectionPool : public IConnectionPool {
public:
    GenericConnectionPool(const PoolConfig& config,
                          std::shared_ptr<IConnectionFactory> factory);

    ~GenericConnectionPool() override;

    std::unique_ptr<PooledConnection> acquire(std::chrono::milliseconds timeout) override;

    PoolStats get_stats() const override;

    void drain() override;

private:
    using Clock = std::chrono::steady_clock;

    std::unique_ptr<IDbConnection> create_connection();

    // Close a connection and forget its timestamps
    void discard(std::unique_ptr<IDbConnection> conn);

    void return_connection(std::unique_ptr<IDbConnection> conn);

    PoolConfig config_;
    std::shared_ptr<IConnectionFactory> factory_;

    std::deque<std::unique_ptr<IDbConnection>> idle_connections_;
    std::unordered_map<IDbConnection*, Clock::time_point> created_at_;
    std::unordered_map<IDbConnection*, Clock::time_point> last_used_;
    mutable std::mutex mutex_;

    std::counting_semaphore<> semaphore_;

    std::atomic<size_t> total_connections_{0};
    std::atomic<size_t> total_acquires_{0};
    std::atomic<size_t> total_releases_{0};
    std::atomic<size_t> failed_acquires_{0};
    std::atomic<size_t> health_check_failures_{0};
    std::atomic<size_t> connections_recycled_{0};

    std::atomic<bool> shutdown_{false};
};

} // namespace sqlguard
