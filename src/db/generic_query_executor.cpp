#include "db/generic_query_executor.hpp"
#include "db/pooled_connection.hpp"
#include "core/utils.hpp"
#include <format>

namespace sqlguard {

namespace {

// SQLSTATE query_canceled: raised for both statement_timeout and PQcancel
constexpr std::string_view kSqlStateQueryCanceled = "57014";

} // anonymous namespace

GenericQueryExecutor::GenericQueryExecutor(
    std::shared_ptr<IConnectionPool> pool,
    const Config& config)
    : pool_(std::move(pool)),
      config_(config) {}

ExecutionOutcome GenericQueryExecutor::execute(const std::string& sql, CancellationToken* cancel) {
    utils::Timer timer;

    if (cancel && cancel->is_cancelled()) {
        return fail(sql, ExecutionErrorKind::CANCELLED, "Request cancelled before execution",
                    timer.elapsed_ms());
    }

    auto conn_handle = pool_->acquire(config_.acquire_timeout);
    if (!conn_handle || !conn_handle->is_valid()) {
        return fail(sql, ExecutionErrorKind::POOL_EXHAUSTED,
                    "Failed to acquire database connection from pool", timer.elapsed_ms());
    }

    auto* conn = conn_handle->get();

    if (config_.query_timeout_ms > 0 && !conn->set_query_timeout(config_.query_timeout_ms)) {
        utils::log::warn(std::format("Could not set statement_timeout to {} ms",
            config_.query_timeout_ms));
    }

    const auto begin = conn->execute("BEGIN TRANSACTION READ ONLY", 0);
    if (!begin.success) {
        return fail(sql, ExecutionErrorKind::DRIVER_ERROR,
                    std::format("Could not open read-only transaction: {}", begin.error_message),
                    timer.elapsed_ms());
    }

    // One extra row is enough to detect overflow without copying the rest
    const size_t fetch_limit = config_.max_result_rows > 0
        ? static_cast<size_t>(config_.max_result_rows) + 1 : 0;

    DbResultSet db_result;
    {
        CancellationToken::ScopedHook hook(cancel, conn->cancel_handle());
        db_result = conn->execute(sql, fetch_limit);
    }

    const auto rollback = conn->execute("ROLLBACK", 0);
    if (!rollback.success) {
        utils::log::warn(std::format("ROLLBACK failed: {}", rollback.error_message));
    }

    const double elapsed_ms = timer.elapsed_ms();

    if (!db_result.success) {
        if (cancel && cancel->is_cancelled()) {
            return fail(sql, ExecutionErrorKind::CANCELLED, "Query cancelled", elapsed_ms);
        }
        if (db_result.sql_state == kSqlStateQueryCanceled) {
            return fail(sql, ExecutionErrorKind::TIMEOUT,
                        std::format("Query exceeded timeout of {} ms", config_.query_timeout_ms),
                        elapsed_ms);
        }
        return fail(sql, ExecutionErrorKind::DRIVER_ERROR,
                    std::format("Database error: {}", db_result.error_message), elapsed_ms);
    }

    if (config_.max_result_rows > 0 && db_result.total_rows > config_.max_result_rows) {
        return fail(sql, ExecutionErrorKind::RESULT_TOO_LARGE,
                    std::format("Result set exceeds max_result_rows limit ({} rows)",
                        config_.max_result_rows),
                    elapsed_ms);
    }

    ExecutionResult result;
    result.column_names = std::move(db_result.column_names);
    result.rows = std::move(db_result.rows);
    result.row_count = result.rows.size();
    result.elapsed_ms = elapsed_ms;

    utils::log::debug(std::format("Query returned {} rows in {:.3f} ms",
        result.row_count, elapsed_ms));
    return ExecutionOutcome::ok(std::move(result));
}

ExecutionOutcome GenericQueryExecutor::fail(const std::string& sql, ExecutionErrorKind kind,
                                            std::string message, double elapsed_ms) const {
    utils::log::error(std::format("Execution failed ({}): {} | SQL: {}",
        execution_error_kind_to_string(kind), message, sql));
    return ExecutionOutcome::failure(kind, std::move(message), elapsed_ms);
}

} // namespace sqlguard
