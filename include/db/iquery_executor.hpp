#pragma once

#include "core/cancellation.hpp"
#include "core/types.hpp"
#include <string>

namespace sqlguard {

/**
 * @brief Abstract query executor interface
 *
 * Pipeline holds shared_ptr<IQueryExecutor>. Failures are returned as
 * ExecutionOutcome errors and are never retried.
 */
class IQueryExecutor {
public:
    virtual ~IQueryExecutor() = default;

    /**
     * @brief Execute an already-authorized read-only statement
     * @param cancel Optional token; cancel() aborts the running statement
     */
    [[nodiscard]] virtual ExecutionOutcome execute(
        const std::string& sql, CancellationToken* cancel = nullptr) = 0;
};

} // namespace sqlguard
