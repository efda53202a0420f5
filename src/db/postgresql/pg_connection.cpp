#include "db/postgresql/pg_connection.hpp"
#include "core/utils.hpp"
#include <algorithm>
#include <format>
#include <memory>
#include <string>

namespace sqlguard {

namespace {

struct PGCancelDeleter {
    void operator()(PGcancel* cancel) const noexcept {
        if (cancel) {
            PQfreeCancel(cancel);
        }
    }
};

std::string trim_message(const char* msg) {
    return utils::trim(msg ? msg : "");
}

} // anonymous namespace

// ============================================================================
// PgConnection
// ============================================================================

PgConnection::PgConnection(PGconn* conn)
    : conn_(conn) {}

PgConnection::~PgConnection() {
    close();
}

DbResultSet PgConnection::execute(const std::string& sql, size_t max_rows) {
    if (!conn_) {
        return DbResultSet::failure("Connection is closed");
    }

    PGresult* res = PQexec(conn_, sql.c_str());
    if (!res) {
        return DbResultSet::failure(trim_message(PQerrorMessage(conn_)));
    }

    const ExecStatusType status = PQresultStatus(res);
    DbResultSet result;

    if (status == PGRES_TUPLES_OK) {
        result = process_tuples_result(res, max_rows);
    } else if (status == PGRES_COMMAND_OK) {
        result.success = true;
    } else {
        const char* state = PQresultErrorField(res, PG_DIAG_SQLSTATE);
        result = DbResultSet::failure(trim_message(PQresultErrorMessage(res)),
                                      state ? state : "");
    }

    PQclear(res);
    return result;
}

bool PgConnection::is_healthy(const std::string& health_check_query) {
    if (!is_connected()) {
        return false;
    }

    PGresult* res = PQexec(conn_, health_check_query.c_str());
    if (!res) {
        return false;
    }
    const ExecStatusType status = PQresultStatus(res);
    PQclear(res);
    return status == PGRES_TUPLES_OK || status == PGRES_COMMAND_OK;
}

bool PgConnection::is_connected() const {
    return conn_ != nullptr && PQstatus(conn_) == CONNECTION_OK;
}

bool PgConnection::set_query_timeout(uint32_t timeout_ms) {
    if (!conn_) {
        return false;
    }

    const std::string timeout_sql = std::format("SET statement_timeout = {}", timeout_ms);
    PGresult* res = PQexec(conn_, timeout_sql.c_str());
    if (!res) {
        return false;
    }
    const bool success = PQresultStatus(res) == PGRES_COMMAND_OK;
    PQclear(res);
    return success;
}

std::function<bool()> PgConnection::cancel_handle() {
    if (!conn_) {
        return {};
    }
    // PGcancel is independent of the PGconn and safe to use from another thread
    std::shared_ptr<PGcancel> cancel(PQgetCancel(conn_), PGCancelDeleter{});
    if (!cancel) {
        return {};
    }
    return [cancel] {
        char errbuf[256];
        if (PQcancel(cancel.get(), errbuf, sizeof(errbuf)) == 1) {
            return true;
        }
        utils::log::warn(std::format("Cancel request failed: {}", errbuf));
        return false;
    };
}

void PgConnection::close() {
    if (conn_) {
        PQfinish(conn_);
        conn_ = nullptr;
    }
}

DbResultSet PgConnection::process_tuples_result(PGresult* res, size_t max_rows) {
    DbResultSet result;
    result.success = true;
    result.has_rows = true;

    const int ncols = PQnfields(res);
    result.column_names.reserve(static_cast<size_t>(ncols));
    for (int i = 0; i < ncols; ++i) {
        result.column_names.emplace_back(PQfname(res, i));
    }

    const int nrows = PQntuples(res);
    result.total_rows = static_cast<uint64_t>(nrows);

    size_t copy_rows = static_cast<size_t>(nrows);
    if (max_rows > 0 && copy_rows > max_rows) {
        copy_rows = max_rows;
    }
    result.rows.reserve(copy_rows);

    for (size_t i = 0; i < copy_rows; ++i) {
        Row row;
        row.reserve(static_cast<size_t>(ncols));
        for (int j = 0; j < ncols; ++j) {
            if (PQgetisnull(res, static_cast<int>(i), j)) {
                row.emplace_back(std::nullopt);
            } else {
                row.emplace_back(PQgetvalue(res, static_cast<int>(i), j));
            }
        }
        result.rows.push_back(std::move(row));
    }

    return result;
}

// ============================================================================
// PgConnectionFactory
// ============================================================================

std::unique_ptr<IDbConnection> PgConnectionFactory::create(const std::string& connection_string) {
    // expand_dbname lets the first value be a full conninfo string or URI
    const auto timeout_s = std::to_string(std::max<int64_t>(
        2, std::chrono::duration_cast<std::chrono::seconds>(connect_timeout_).count()));
    const char* keywords[] = {"dbname", "connect_timeout", nullptr};
    const char* values[] = {connection_string.c_str(), timeout_s.c_str(), nullptr};
    PGconn* conn = PQconnectdbParams(keywords, values, 1);

    if (!conn) {
        utils::log::error("Failed to allocate PGconn");
        return nullptr;
    }

    if (PQstatus(conn) != CONNECTION_OK) {
        utils::log::error(std::format("Failed to connect: {}", trim_message(PQerrorMessage(conn))));
        PQfinish(conn);
        return nullptr;
    }

    return std::make_unique<PgConnection>(conn);
}

} // namespace sqlguard
