#pragma once

#include <string>
#include <string_view>

namespace sqlguard {

/**
 * @brief Statement-level shape of a query, as PostgreSQL's own grammar sees it
 */
struct StatementShape {
    bool parsed = false;
    size_t statement_count = 0;
    std::string type;               // Parse node of the first statement, e.g. "SelectStmt"
    bool select_into = false;       // SELECT ... INTO creates a table
    bool locking_clause = false;    // FOR UPDATE / FOR SHARE
    bool data_modifying = false;    // INSERT/UPDATE/DELETE/MERGE anywhere, e.g. in a WITH
    std::string error;              // Parser message when !parsed

    // Exactly one plain SELECT
    [[nodiscard]] bool is_single_read_only_select() const {
        return parsed && statement_count == 1 && type == "SelectStmt" &&
               !select_into && !locking_clause && !data_modifying;
    }
};

/**
 * @brief SQL Parser - wraps libpg_query (PostgreSQL's parser)
 *
 * Stateless, safe for concurrent use.
 */
class SqlParser {
public:
    [[nodiscard]] static StatementShape inspect(std::string_view sql);
};

} // namespace sqlguard
