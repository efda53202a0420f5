#pragma once

#include "audit/audit_emitter.hpp"
#include "core/types.hpp"
#include "policy/policy_store.hpp"
#include "schema/schema_catalog.hpp"
#include "security/injection_screener.hpp"
#include <memory>
#include <string>
#include <string_view>

namespace sqlguard {

/**
 * @brief Accepts or rejects a candidate statement for an identity
 *
 * Checks, short-circuiting on the first failure:
 * 1. statement starts with SELECT           -> ForbiddenQueryType
 * 2. no injection pattern matches           -> InjectionSuspected
 * 3. no forbidden function is called        -> ForbiddenQueryType(function f)
 * 4. every referenced table is granted      -> UnauthorizedTable
 * 5. every qualified column is granted      -> UnauthorizedColumn(table.column)
 * 6. every unqualified column is granted
 *    on at least one allowed table          -> UnauthorizedColumn(column)
 *
 * An unqualified denial names table.column when exactly one referenced
 * table defines the column.
 *
 * Every denial is logged at WARN and emitted to the audit trail before the
 * verdict is returned. Unknown roles have no grants, so any statement
 * touching a table is denied.
 */
class AuthorizationValidator {
public:
    AuthorizationValidator(std::shared_ptr<const SchemaCatalog> schema,
                           std::shared_ptr<const PolicyStore> policy,
                           std::shared_ptr<AuditEmitter> audit = nullptr);

    [[nodiscard]] AuthorizationVerdict authorize(std::string_view sql,
                                                 const Identity& identity) const;

    /**
     * @brief Final gate on the statement about to be executed
     *
     * Requires PostgreSQL's grammar to see exactly one SELECT without
     * INTO or a locking clause; anything else is ForbiddenQueryType.
     */
    [[nodiscard]] AuthorizationVerdict verify_final_statement(std::string_view sql,
                                                              const Identity& identity) const;

    [[nodiscard]] const SchemaCatalog& schema() const { return *schema_; }

private:
    AuthorizationVerdict deny(std::string_view sql, const Identity& identity,
                              DenialReason reason, std::string detail) const;

    std::shared_ptr<const SchemaCatalog> schema_;
    std::shared_ptr<const PolicyStore> policy_;
    std::shared_ptr<AuditEmitter> audit_;
    InjectionScreener screener_;
};

} // namespace sqlguard
