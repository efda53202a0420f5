#include "security/authorization_validator.hpp"
#include "core/utils.hpp"
#include "parser/sql_lexer.hpp"
#include "parser/sql_parser.hpp"
#include "parser/statement_extractor.hpp"

#include <format>

namespace sqlguard {

namespace {

// First token after any opening parentheses: "(SELECT ...) UNION (SELECT ...)"
bool starts_with_select(const std::vector<Token>& tokens) {
    for (const auto& tok : tokens) {
        if (tok.is(TokenKind::LPAREN)) continue;
        return tok.is_keyword("SELECT");
    }
    return false;
}

bool granted_anywhere(const TableGrants& grants, const std::string& column) {
    for (const auto& [table, columns] : grants) {
        if (columns.contains(column)) return true;
    }
    return false;
}

// "table.column" when exactly one referenced table defines the column
std::string describe_unqualified(const std::string& column, const ExtractedReferences& refs,
                                 const SchemaCatalog& schema) {
    std::string owner;
    for (const auto& table : refs.tables) {
        if (!schema.has_column(table, column)) continue;
        if (!owner.empty()) return column;
        owner = table;
    }
    return owner.empty() ? column : owner + "." + column;
}

} // anonymous namespace

AuthorizationValidator::AuthorizationValidator(std::shared_ptr<const SchemaCatalog> schema,
                                               std::shared_ptr<const PolicyStore> policy,
                                               std::shared_ptr<AuditEmitter> audit)
    : schema_(std::move(schema)),
      policy_(std::move(policy)),
      audit_(std::move(audit)),
      screener_(policy_) {}

AuthorizationVerdict AuthorizationValidator::authorize(std::string_view sql,
                                                       const Identity& identity) const {
    const auto tokens = SqlLexer::tokenize(sql);

    if (!starts_with_select(tokens)) {
        return deny(sql, identity, DenialReason::FORBIDDEN_QUERY_TYPE, {});
    }

    if (const auto pattern = screener_.first_match(sql)) {
        return deny(sql, identity, DenialReason::INJECTION_SUSPECTED,
                    std::format("pattern {}", *pattern));
    }

    const ExtractedReferences refs = StatementExtractor::extract(tokens, *schema_);

    for (const auto& function : refs.functions) {
        if (policy_->is_forbidden_function(function)) {
            return deny(sql, identity, DenialReason::FORBIDDEN_QUERY_TYPE,
                        std::format("function {}", function));
        }
    }

    const TableGrants& allowed = policy_->allowed_tables(identity.role);

    // No grants at all: denied even for table-free statements such as SELECT 1
    if (allowed.empty()) {
        return deny(sql, identity, DenialReason::UNAUTHORIZED_TABLE,
                    refs.tables.empty() ? std::string{} : refs.tables.front());
    }

    for (const auto& table : refs.tables) {
        if (!allowed.contains(table)) {
            return deny(sql, identity, DenialReason::UNAUTHORIZED_TABLE, table);
        }
    }

    for (const auto& ref : refs.columns) {
        if (ref.is_qualified()) {
            const auto grant = allowed.find(ref.table);
            if (grant == allowed.end() || !grant->second.contains(ref.column)) {
                return deny(sql, identity, DenialReason::UNAUTHORIZED_COLUMN, ref.full_name());
            }
        } else if (!granted_anywhere(allowed, ref.column)) {
            return deny(sql, identity, DenialReason::UNAUTHORIZED_COLUMN,
                        describe_unqualified(ref.column, refs, *schema_));
        }
    }

    utils::log::debug(std::format("Authorized for {}: {} tables, {} columns",
        identity.describe(), refs.tables.size(), refs.columns.size()));
    return AuthorizationVerdict::authorized();
}

AuthorizationVerdict AuthorizationValidator::verify_final_statement(
    std::string_view sql, const Identity& identity) const {

    const StatementShape shape = SqlParser::inspect(sql);
    if (shape.is_single_read_only_select()) {
        return AuthorizationVerdict::authorized();
    }

    std::string detail;
    if (!shape.parsed) {
        detail = "unparseable: " + shape.error;
    } else if (shape.statement_count != 1) {
        detail = std::format("{} statements", shape.statement_count);
    } else if (shape.select_into) {
        detail = "SELECT INTO";
    } else if (shape.locking_clause) {
        detail = "locking clause";
    } else if (shape.data_modifying) {
        detail = "data-modifying statement";
    } else {
        detail = shape.type;
    }
    return deny(sql, identity, DenialReason::FORBIDDEN_QUERY_TYPE, std::move(detail));
}

AuthorizationVerdict AuthorizationValidator::deny(std::string_view sql, const Identity& identity,
                                                  DenialReason reason, std::string detail) const {
    utils::log::warn(std::format("Security violation by {}: {}{}{} | SQL: {}",
        identity.describe(), denial_reason_to_string(reason),
        detail.empty() ? "" : " ", detail, sql));

    if (audit_) {
        AuditRecord record(AuditEventKind::SECURITY_VIOLATION, identity, std::string(sql));
        record.fingerprint_hash = SqlLexer::fingerprint(sql).hash;
        record.denial_reason = reason;
        record.detail = detail;
        audit_->emit(std::move(record));
    }

    return AuthorizationVerdict::denied(reason, std::move(detail));
}

} // namespace sqlguard
