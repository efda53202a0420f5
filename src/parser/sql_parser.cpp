#include "parser/sql_parser.hpp"
#include "core/json.hpp"

// libpg_query C API
extern "C" {
#include "pg_query.h"
}

namespace sqlguard {

namespace {

// AST field keys
constexpr std::string_view kStmts = "stmts";
constexpr std::string_view kStmt = "stmt";
constexpr std::string_view kIntoClause = "intoClause";
constexpr std::string_view kLockingClause = "lockingClause";
constexpr std::string_view kModifyingNodes[] = {
    "InsertStmt", "UpdateStmt", "DeleteStmt", "MergeStmt"
};

// Depth-first search for a field name anywhere below node
bool has_field(const JsonValue& node, std::string_view field) {
    if (node.contains(field)) return true;
    bool found = false;
    node.for_each_child([&](std::string_view, const JsonValue& child) {
        if (!found && (child.is_object() || child.is_array())) {
            found = has_field(child, field);
        }
    });
    return found;
}

} // anonymous namespace

StatementShape SqlParser::inspect(std::string_view sql) {
    StatementShape shape;

    PgQueryParseResult parse_result = pg_query_parse(std::string(sql).c_str());

    if (parse_result.error) {
        shape.error = parse_result.error->message
            ? parse_result.error->message
            : "Unknown parse error";
        pg_query_free_parse_result(parse_result);
        return shape;
    }

    if (!parse_result.parse_tree) {
        pg_query_free_parse_result(parse_result);
        shape.error = "Empty parse tree";
        return shape;
    }

    // {"version": N, "stmts": [{"stmt": {"SelectStmt": {...}}}, ...]}
    JsonValue tree;
    try {
        tree = JsonValue::parse(parse_result.parse_tree);
    } catch (const JsonValue::parse_error& e) {
        pg_query_free_parse_result(parse_result);
        shape.error = e.what();
        return shape;
    }
    pg_query_free_parse_result(parse_result);

    const JsonValue stmts = tree[kStmts];
    shape.parsed = true;
    shape.statement_count = stmts.is_array() ? stmts.size() : 0;
    if (shape.statement_count == 0) {
        return shape;
    }

    const JsonValue first = stmts[size_t{0}][kStmt];
    first.for_each_child([&](std::string_view key, const JsonValue&) {
        if (shape.type.empty()) shape.type = std::string(key);
    });

    shape.select_into = has_field(first, kIntoClause);
    shape.locking_clause = has_field(first, kLockingClause);
    for (const auto node : kModifyingNodes) {
        if (has_field(first, node)) {
            shape.data_modifying = true;
            break;
        }
    }
    return shape;
}

} // namespace sqlguard
