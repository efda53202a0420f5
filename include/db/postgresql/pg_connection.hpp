#pragma once

#include "db/iconnection_factory.hpp"
#include "db/idb_connection.hpp"
#include <chrono>
#include <libpq-fe.h>
#include <string>

namespace sqlguard {

/**
 * @brief PostgreSQL connection implementing IDbConnection
 *
 * All libpq calls for request execution are encapsulated here.
 */
class PgConnection : public IDbConnection {
public:
    // Takes ownership
    explicit PgConnection(PGconn* conn);

    ~PgConnection() override;

    PgConnection(const PgConnection&) = delete;
    PgConnection& operator=(const PgConnection&) = delete;

    DbResultSet execute(const std::string& sql, size_t max_rows) override;
    bool is_healthy(const std::string& health_check_query) override;
    bool is_connected() const override;
    bool set_query_timeout(uint32_t timeout_ms) override;
    std::function<bool()> cancel_handle() override;
    void close() override;

private:
    DbResultSet process_tuples_result(PGresult* res, size_t max_rows);

    PGconn* conn_;
};

class PgConnectionFactory : public IConnectionFactory {
public:
    // libpq connect_timeout has whole-second granularity (minimum 2s)
    explicit PgConnectionFactory(std::chrono::milliseconds connect_timeout = std::chrono::seconds{5})
        : connect_timeout_(connect_timeout) {}

    std::unique_ptr<IDbConnection> create(const std::string& connection_string) override;

private:
    std::chrono::milliseconds connect_timeout_;
};

} // namespace sqlguard
