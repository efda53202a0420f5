#include "core/pipeline.hpp"
#include "core/query_rewriter.hpp"
#include "core/utils.hpp"
#include "parser/sql_lexer.hpp"
#include "parser/statement_extractor.hpp"
#include <algorithm>
#include <format>
#include <stdexcept>

namespace sqlguard {

Pipeline::Pipeline(PipelineComponents components)
    : policy_(std::move(components.policy)),
      executor_(std::move(components.executor)),
      audit_(std::move(components.audit)),
      generator_(std::move(components.generator)) {
    if (!components.schema || !policy_ || !executor_) {
        throw std::invalid_argument("Pipeline requires a schema, a policy store and an executor");
    }
    validator_ = std::make_shared<const AuthorizationValidator>(
        std::move(components.schema), policy_, audit_);
}

// ============================================================================
// Schema snapshot
// ============================================================================

std::shared_ptr<const AuthorizationValidator> Pipeline::validator() const {
    return std::atomic_load_explicit(&validator_, std::memory_order_acquire);
}

std::shared_ptr<const SchemaCatalog> Pipeline::schema() const {
    const auto v = validator();
    // Aliasing constructor: the catalog lives as long as this validator snapshot
    return std::shared_ptr<const SchemaCatalog>(v, &v->schema());
}

void Pipeline::reinitialize_schema(std::shared_ptr<const SchemaCatalog> schema) {
    if (!schema) {
        utils::log::error("Schema reinitialization ignored: no catalog supplied");
        return;
    }
    const size_t tables = schema->table_count();
    auto next = std::make_shared<const AuthorizationValidator>(std::move(schema), policy_, audit_);
    std::atomic_store_explicit(&validator_, std::move(next), std::memory_order_release);
    utils::log::info(std::format("Schema catalog reinitialized ({} tables)", tables));
}

// ============================================================================
// Candidate statements
// ============================================================================

GuardResponse Pipeline::process_candidate(const std::string& sql, const Identity& identity,
                                          CancellationToken* cancel) {
    return run_candidate(sql, identity, {}, cancel);
}

GuardResponse Pipeline::run_candidate(const std::string& sql, const Identity& identity,
                                      const std::string& question, CancellationToken* cancel) {
    total_requests_.fetch_add(1, std::memory_order_relaxed);
    const auto v = validator();

    // Layer 1: authorize the statement as generated
    const auto verdict = v->authorize(sql, identity);
    if (verdict.is_denied()) {
        requests_denied_.fetch_add(1, std::memory_order_relaxed);
        return GuardResponse::denied(verdict);
    }

    // Layer 2: row-level security
    const std::string final_sql = QueryRewriter::apply_row_filter(sql, identity, *policy_);

    // Layer 3: what reaches the database must be one plain SELECT
    const auto final_verdict = v->verify_final_statement(final_sql, identity);
    if (final_verdict.is_denied()) {
        requests_denied_.fetch_add(1, std::memory_order_relaxed);
        return GuardResponse::denied(final_verdict);
    }

    // Layer 4: sensitive-column access audit (never aborts the request)
    try {
        audit_sensitive_access(final_sql, identity, question, v->schema());
    } catch (const std::exception& e) {
        utils::log::error(std::format("Sensitive-column audit failed: {}", e.what()));
    }

    // Layer 5: execute
    utils::log::info(std::format("Executing for {}: {}", identity.describe(), final_sql));
    auto outcome = executor_->execute(final_sql, cancel);

    // Layer 6: audit the outcome
    AuditRecord record(outcome.success ? AuditEventKind::QUERY_EXECUTED
                                       : AuditEventKind::EXECUTION_FAILED,
                       identity, final_sql);
    record.fingerprint_hash = SqlLexer::fingerprint(final_sql).hash;
    record.elapsed_ms = outcome.result.elapsed_ms;

    if (!outcome.success) {
        execution_failures_.fetch_add(1, std::memory_order_relaxed);
        record.error_kind = outcome.error_kind;
        record.error_message = outcome.error_message;
        emit_outcome(std::move(record), question);
        return GuardResponse::execution_error(final_sql, outcome.error_kind,
                                              std::move(outcome.error_message));
    }

    requests_executed_.fetch_add(1, std::memory_order_relaxed);
    record.rows_returned = outcome.result.row_count;
    emit_outcome(std::move(record), question);
    return GuardResponse::ok(final_sql, std::move(outcome.result));
}

// ============================================================================
// Questions
// ============================================================================

GuardResponse Pipeline::process_question(const std::string& question, const Identity& identity,
                                         CancellationToken* cancel) {
    if (!generator_) {
        return GuardResponse::passthrough(ResponseStatus::GENERATOR_ERROR,
                                          "SQL generator is not configured");
    }

    const auto v = validator();

    GenerationRequest request;
    request.question = question;
    request.identity = identity;
    request.visible_schema = std::make_shared<const SchemaCatalog>(
        v->schema().filtered(policy_->allowed_tables(identity.role)));
    request.row_filter = policy_->row_filter_predicate(identity);

    auto generated = generator_->generate(request);

    if (generated.is_sql()) {
        utils::log::debug(std::format("Generated SQL for {}: {}", identity.describe(), generated.text));
        return run_candidate(generated.text, identity, question, cancel);
    }

    generator_passthroughs_.fetch_add(1, std::memory_order_relaxed);

    AuditRecord record(AuditEventKind::GENERATOR_OUTCOME, identity, {});
    record.detail = std::format("{}: {}", generation_kind_to_string(generated.kind), generated.text);
    emit_outcome(std::move(record), question);

    switch (generated.kind) {
        case GenerationKind::CLARIFICATION:
            return GuardResponse::passthrough(ResponseStatus::CLARIFICATION, std::move(generated.text));
        case GenerationKind::REFUSAL:
            utils::log::warn(std::format("Generator refused request from {}: {}",
                identity.describe(), generated.text));
            return GuardResponse::passthrough(ResponseStatus::REFUSAL, std::move(generated.text));
        default:
            return GuardResponse::passthrough(ResponseStatus::GENERATOR_ERROR, std::move(generated.text));
    }
}

// ============================================================================
// Auditing
// ============================================================================

std::vector<std::string> Pipeline::sensitive_columns_accessed(
    const std::string& sql, const SchemaCatalog& schema, const PolicyStore& policy) {

    const auto refs = StatementExtractor::extract(sql, schema);
    std::vector<std::string> accessed;
    const auto add = [&accessed](const std::string& table, const std::string& column) {
        auto name = std::format("{}.{}", table, column);
        if (std::ranges::find(accessed, name) == accessed.end()) {
            accessed.push_back(std::move(name));
        }
    };

    for (const auto& ref : refs.columns) {
        if (ref.is_qualified()) {
            if (policy.is_sensitive(ref.table, ref.column)) add(ref.table, ref.column);
            continue;
        }
        for (const auto& table : refs.tables) {
            if (policy.is_sensitive(table, ref.column)) add(table, ref.column);
        }
    }
    return accessed;
}

void Pipeline::audit_sensitive_access(const std::string& sql, const Identity& identity,
                                      const std::string& question, const SchemaCatalog& schema) {
    auto accessed = sensitive_columns_accessed(sql, schema, *policy_);
    if (accessed.empty()) return;

    utils::log::debug(std::format("Sensitive data access by {}: {}",
        identity.describe(), utils::join(accessed, ", ")));

    AuditRecord record(AuditEventKind::DATA_ACCESS, identity, sql);
    record.fingerprint_hash = SqlLexer::fingerprint(sql).hash;
    record.sensitive_columns = std::move(accessed);
    emit_outcome(std::move(record), question);
}

void Pipeline::emit_outcome(AuditRecord record, const std::string& question) {
    if (!audit_) return;
    record.question = question;
    audit_->emit(std::move(record));
}

} // namespace sqlguard
