#pragma once

#include "db/iconnection_pool.hpp"
#include "db/iquery_executor.hpp"
#include <chrono>
#include <cstdint>
#include <memory>

namespace sqlguard {

/**
 * @brief Database-agnostic query executor
 *
 * Uses IConnectionPool to lease a connection and IDbConnection::execute()
 * to run the statement inside a read-only transaction that is always
 * rolled back. No per-backend executor needed.
 */
class GenericQueryExecutor : public IQueryExecutor {
public:
    struct Config {
        uint32_t query_timeout_ms = 30000;
        uint32_t max_result_rows = 10000;
        std::chrono::milliseconds acquire_timeout{5000};
    };

    GenericQueryExecutor(std::shared_ptr<IConnectionPool> pool, const Config& config);

    explicit GenericQueryExecutor(std::shared_ptr<IConnectionPool> pool)
        : GenericQueryExecutor(std::move(pool), Config{}) {}

    ~GenericQueryExecutor() override = default;

    ExecutionOutcome execute(const std::string& sql, CancellationToken* cancel = nullptr) override;

private:
    ExecutionOutcome fail(const std::string& sql, ExecutionErrorKind kind,
                          std::string message, double elapsed_ms) const;

    std::shared_ptr<IConnectionPool> pool_;
    Config config_;
};

} // namespace sqlguard
