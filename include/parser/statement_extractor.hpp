#pragma once

#include "core/types.hpp"
#include "parser/sql_lexer.hpp"
#include "schema/schema_catalog.hpp"
#include <string_view>
#include <vector>

namespace sqlguard {

/**
 * @brief Recovers the tables and (table, column) pairs a statement touches
 *
 * Two phases over the token stream:
 *
 * 1. Classification: a state machine over token kinds with one frame per
 *    parenthesis level. Each frame tracks the clause it is in
 *    (select list, FROM list, expression) and, inside a FROM list, whether
 *    a table name or an alias is expected next. Function names are
 *    collected into `functions` rather than treated as columns (their
 *    arguments are still scanned), FROM inside a function call
 *    (EXTRACT(YEAR FROM d)) does not open a FROM list, and alias
 *    definitions are not treated as column references. Any word after a
 *    dot is a name (t.last), as is BY or BETWEEN in operand position.
 *
 * 2. Resolution against the catalog: qualifiers are resolved through the
 *    alias map (over-approximated when an alias is reused), unresolved or
 *    derived-table qualifiers fall back to unqualified references, and
 *    wildcards expand to the catalog columns of the tables in scope. A bare
 *    name that is no column but a table or alias (row_to_json(o)) is a
 *    whole-row reference and expands like o.*.
 *
 * Errs towards over-reporting: an ambiguous token may produce a spurious
 * reference (a safe denial) but a real reference is never dropped.
 * Identifiers in a FROM position are reported as tables even when the
 * catalog does not know them.
 */
class StatementExtractor {
public:
    [[nodiscard]] static ExtractedReferences extract(std::string_view sql,
                                                     const SchemaCatalog& schema);

    [[nodiscard]] static ExtractedReferences extract(const std::vector<Token>& tokens,
                                                     const SchemaCatalog& schema);

    enum class Clause {
        NONE,
        SELECT_LIST,
        FROM_LIST,
        EXPRESSION
    };

    enum class FromState {
        EXPECT_TABLE,       // after FROM, JOIN or a FROM-list comma
        AFTER_TABLE,        // table seen; alias may follow
        EXPECT_ALIAS,       // after AS
        AFTER_DERIVED,      // subquery or table function seen; alias may follow
        AFTER_ALIAS
    };
};

} // namespace sqlguard
