#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace sqlguard {

class PooledConnection;

struct PoolConfig {
    std::string connection_string;
    size_t min_connections = 1;
    size_t max_connections = 8;
    std::chrono::milliseconds idle_timeout{300000};   // health-check connections idle longer than this
    std::string health_check_query{"SELECT 1"};
    std::chrono::seconds max_lifetime{3600};          // 0 = disabled
};

struct PoolStats {
    size_t total_connections = 0;
    size_t idle_connections = 0;
    size_t active_connections = 0;
    size_t total_acquires = 0;
    size_t total_releases = 0;
    size_t failed_acquires = 0;
    size_t health_check_failures = 0;
    size_t connections_recycled = 0;
};

/**
 * @brief Bounded pool of database connections
 */
class IConnectionPool {
public:
    virtual ~IConnectionPool() = default;

    /**
     * @brief Acquire a connection, waiting at most timeout
     * @return RAII handle, or nullptr when the pool is exhausted or
     *         a new connection cannot be opened
     */
    [[nodiscard]] virtual std::unique_ptr<PooledConnection> acquire(
        std::chrono::milliseconds timeout) = 0;

    [[nodiscard]] virtual PoolStats get_stats() const = 0;

    // Close idle connections and refuse further acquires
    virtual void drain() = 0;
};

} // namespace sqlguard
