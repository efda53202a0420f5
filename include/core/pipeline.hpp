#pragma once

#include "audit/audit_emitter.hpp"
#include "core/cancellation.hpp"
#include "core/sql_generator.hpp"
#include "core/types.hpp"
#include "db/iquery_executor.hpp"
#include "policy/policy_store.hpp"
#include "schema/schema_catalog.hpp"
#include "security/authorization_validator.hpp"
#include <atomic>
#include <memory>
#include <string>
#include <vector>

namespace sqlguard {

/**
 * @brief Collaborators the pipeline is built from
 *
 * schema, policy and executor are required; audit and generator may be
 * null (no audit trail, process_question unavailable).
 */
struct PipelineComponents {
    std::shared_ptr<const SchemaCatalog> schema;
    std::shared_ptr<const PolicyStore> policy;
    std::shared_ptr<IQueryExecutor> executor;
    std::shared_ptr<AuditEmitter> audit;
    std::shared_ptr<ISqlGenerator> generator;
};

/**
 * @brief Pipeline coordinator - orchestrates the per-request flow
 *
 * Layers:
 * 1. Authorize (statement type, injection screen, RBAC tables/columns)
 * 2. Rewrite (RLS row filter)
 * 3. Final gate (PostgreSQL grammar: exactly one SELECT)
 * 4. Sensitive-column access audit (best effort)
 * 5. Execute (read-only transaction, timeout, cancellation)
 * 6. Audit outcome
 *
 * Any denial short-circuits before execution. Requests share no mutable
 * state; the schema snapshot is swapped atomically by reinitialize_schema()
 * while in-flight requests keep the one they started with.
 */
class Pipeline {
public:
    explicit Pipeline(PipelineComponents components);

    /**
     * @brief Authorize, rewrite and execute a candidate statement
     * @param cancel Optional token; cancel() aborts a running query
     */
    GuardResponse process_candidate(const std::string& sql, const Identity& identity,
                                    CancellationToken* cancel = nullptr);

    /**
     * @brief Generate SQL for a question, then process_candidate() it
     *
     * Clarifications and refusals bypass authorization and are returned
     * as-is.
     */
    GuardResponse process_question(const std::string& question, const Identity& identity,
                                   CancellationToken* cancel = nullptr);

    // Publish a freshly loaded catalog; the previous one stays valid for in-flight requests
    void reinitialize_schema(std::shared_ptr<const SchemaCatalog> schema);

    [[nodiscard]] std::shared_ptr<const SchemaCatalog> schema() const;

    /**
     * @brief Sensitive columns a statement reads, as "table.column"
     *
     * Qualified references match directly; an unqualified column counts for
     * every referenced table that marks it sensitive.
     */
    [[nodiscard]] static std::vector<std::string> sensitive_columns_accessed(
        const std::string& sql, const SchemaCatalog& schema, const PolicyStore& policy);

    struct Stats {
        uint64_t total_requests;
        uint64_t requests_denied;
        uint64_t requests_executed;
        uint64_t execution_failures;
        uint64_t generator_passthroughs;
    };

    [[nodiscard]] Stats get_stats() const {
        return {
            total_requests_.load(std::memory_order_relaxed),
            requests_denied_.load(std::memory_order_relaxed),
            requests_executed_.load(std::memory_order_relaxed),
            execution_failures_.load(std::memory_order_relaxed),
            generator_passthroughs_.load(std::memory_order_relaxed)
        };
    }

private:
    GuardResponse run_candidate(const std::string& sql, const Identity& identity,
                                const std::string& question, CancellationToken* cancel);

    [[nodiscard]] std::shared_ptr<const AuthorizationValidator> validator() const;

    void audit_sensitive_access(const std::string& sql, const Identity& identity,
                                const std::string& question, const SchemaCatalog& schema);

    void emit_outcome(AuditRecord record, const std::string& question);

    std::shared_ptr<const PolicyStore> policy_;
    std::shared_ptr<IQueryExecutor> executor_;
    std::shared_ptr<AuditEmitter> audit_;
    std::shared_ptr<ISqlGenerator> generator_;

    // RCU: readers take a snapshot, reinitialize_schema() swaps it
    std::shared_ptr<const AuthorizationValidator> validator_;

    std::atomic<uint64_t> total_requests_{0};
    std::atomic<uint64_t> requests_denied_{0};
    std::atomic<uint64_t> requests_executed_{0};
    std::atomic<uint64_t> execution_failures_{0};
    std::atomic<uint64_t> generator_passthroughs_{0};
};

} // namespace sqlguard
