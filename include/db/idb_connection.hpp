#pragma once

#include "core/types.hpp"
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace sqlguard {

/**
 * @brief Result set from a query execution
 *
 * Owns the result data (copied out of the native result handle).
 */
struct DbResultSet {
    bool success = false;
    std::string error_message;
    std::string sql_state;          // SQLSTATE on failure, e.g. "57014"

    std::vector<std::string> column_names;
    std::vector<Row> rows;          // nullopt = SQL NULL
    uint64_t total_rows = 0;        // Rows produced by the server (may exceed rows.size())

    bool has_rows = false;          // SELECT vs utility statement

    static DbResultSet failure(std::string message, std::string state = {}) {
        DbResultSet r;
        r.error_message = std::move(message);
        r.sql_state = std::move(state);
        return r;
    }
};

/**
 * @brief Abstract database connection
 *
 * Wraps a single native connection handle. Not thread-safe; one request
 * uses a connection at a time through the pool. The only cross-thread
 * entry point is the handle returned by cancel_handle().
 */
class IDbConnection {
public:
    virtual ~IDbConnection() = default;

    /**
     * @brief Execute a statement
     * @param max_rows Copy at most this many rows into the result (0 = all);
     *                 total_rows still reports the server's count
     */
    [[nodiscard]] virtual DbResultSet execute(const std::string& sql, size_t max_rows) = 0;

    [[nodiscard]] virtual bool is_healthy(const std::string& health_check_query) = 0;

    [[nodiscard]] virtual bool is_connected() const = 0;

    /**
     * @brief Server-side timeout for subsequent statements (0 = none)
     *
     * PostgreSQL: SET statement_timeout = N
     */
    virtual bool set_query_timeout(uint32_t timeout_ms) = 0;

    /**
     * @brief Callable that asks the server to abort the running statement
     *
     * Safe to invoke from another thread while execute() is in progress.
     * Returns true when the cancel request was delivered. Empty when the
     * backend cannot cancel.
     */
    [[nodiscard]] virtual std::function<bool()> cancel_handle() = 0;

    virtual void close() = 0;
};

} // namespace sqlguard
