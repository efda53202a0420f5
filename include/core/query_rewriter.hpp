#pragma once

#include "core/types.hpp"
#include "parser/sql_lexer.hpp"
#include "policy/policy_store.hpp"

#include <string>
#include <string_view>

namespace sqlguard {

/**
 * @brief Row-level security rewriter
 *
 * Adds the identity's row-filter predicate to every SELECT block whose own
 * FROM list names the filtered table: set-operation branches, scalar and
 * EXISTS/IN subqueries, derived tables and CTE bodies alike. The column is
 * qualified with the name the block binds the table to (`o.employee_id`
 * for `FROM orders o`), once per binding in a self-join.
 * - no WHERE clause: ` WHERE pred` before GROUP BY / ORDER BY / LIMIT / ...
 * - WHERE of AND-ed conjuncts: ` AND pred` at the end of the condition
 * - WHERE with a top-level OR: `(cond) AND pred`, so the filter cannot be
 *   bypassed by operator precedence
 * - `TABLE t` becomes `SELECT * FROM t WHERE pred`
 *
 * A reference to the table outside any recognised FROM list (a whole-row
 * argument, an unusual construct) makes every top-level block carry the
 * table-qualified predicate, so the database rejects the statement instead
 * of returning unfiltered rows.
 *
 * Idempotent: a block whose WHERE already has the predicate as a
 * top-level conjunct (`binding.column = v`, or `column = v` when the table
 * is bound once; either side of `=`, any spacing or enclosing parentheses)
 * is left unchanged. Matching is done on tokens, so text inside string
 * literals never counts.
 *
 * Roles without a template pass through unchanged. Stateless.
 */
class QueryRewriter {
public:
    [[nodiscard]] static std::string apply_row_filter(std::string_view sql,
                                                      const Identity& identity,
                                                      const PolicyStore& policy);

    [[nodiscard]] static std::string apply_predicate(std::string_view sql,
                                                     const RowFilterRule& rule,
                                                     const std::string& subject_id);
};

} // namespace sqlguard
