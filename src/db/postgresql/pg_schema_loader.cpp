#include "db/postgresql/pg_schema_loader.hpp"
#include "core/utils.hpp"
#include <format>

namespace sqlguard {

namespace {

// Column indices in the result sets (matching the SELECT order)
constexpr size_t COL_TABLE  = 0;
constexpr size_t COL_COLUMN = 1;

constexpr size_t FK_CHILD_TABLE   = 0;
constexpr size_t FK_CHILD_COLUMN  = 1;
constexpr size_t FK_PARENT_TABLE  = 2;
constexpr size_t FK_PARENT_COLUMN = 3;

std::string quote_literal(const std::string& value) {
    std::string out = "'";
    for (char c : value) {
        if (c == '\'') out += '\'';
        out += c;
    }
    out += '\'';
    return out;
}

const std::string& cell(const Row& row, size_t index) {
    static const std::string kEmpty;
    if (index >= row.size() || !row[index]) return kEmpty;
    return *row[index];
}

} // anonymous namespace

std::string PgSchemaLoader::columns_query(const std::string& schema_name) {
    return std::format(
        "SELECT table_name, column_name "
        "FROM information_schema.columns "
        "WHERE table_schema = {} "
        "ORDER BY table_name, ordinal_position",
        quote_literal(schema_name));
}

std::string PgSchemaLoader::foreign_keys_query(const std::string& schema_name) {
    return std::format(
        "SELECT DISTINCT ON (tc.table_name, tc.constraint_name) "
        "    tc.table_name, kcu.column_name, ccu.table_name, ccu.column_name "
        "FROM information_schema.table_constraints tc "
        "JOIN information_schema.key_column_usage kcu "
        "    ON kcu.constraint_name = tc.constraint_name "
        "   AND kcu.table_schema = tc.table_schema "
        "JOIN information_schema.constraint_column_usage ccu "
        "    ON ccu.constraint_name = tc.constraint_name "
        "   AND ccu.constraint_schema = tc.table_schema "
        "WHERE tc.constraint_type = 'FOREIGN KEY' "
        "  AND tc.table_schema = {} "
        "ORDER BY tc.table_name, tc.constraint_name, kcu.ordinal_position",
        quote_literal(schema_name));
}

Result<std::shared_ptr<const SchemaCatalog>> PgSchemaLoader::load(
    IDbConnection& conn, const std::string& schema_name) {

    using R = Result<std::shared_ptr<const SchemaCatalog>>;

    if (!conn.is_connected()) {
        return R::error(ErrorCategory::SCHEMA_UNAVAILABLE, "Database connection is not open");
    }

    const DbResultSet columns = conn.execute(columns_query(schema_name), 0);
    if (!columns.success) {
        return R::error(ErrorCategory::SCHEMA_UNAVAILABLE,
            std::format("Column introspection failed: {}", columns.error_message));
    }

    SchemaCatalog::Builder builder(schema_name);
    for (const auto& row : columns.rows) {
        builder.add_column(cell(row, COL_TABLE), cell(row, COL_COLUMN));
    }

    const DbResultSet fks = conn.execute(foreign_keys_query(schema_name), 0);
    if (!fks.success) {
        return R::error(ErrorCategory::SCHEMA_UNAVAILABLE,
            std::format("Foreign key introspection failed: {}", fks.error_message));
    }

    for (const auto& row : fks.rows) {
        builder.add_foreign_key(ForeignKey{
            cell(row, FK_CHILD_TABLE), cell(row, FK_CHILD_COLUMN),
            cell(row, FK_PARENT_TABLE), cell(row, FK_PARENT_COLUMN)});
    }

    auto catalog = std::make_shared<const SchemaCatalog>(builder.build());
    if (catalog->empty()) {
        return R::error(ErrorCategory::SCHEMA_UNAVAILABLE,
            std::format("Schema '{}' has no tables", schema_name));
    }

    utils::log::info(std::format("Schema '{}' loaded: {} tables, {} relationships",
        schema_name, catalog->table_count(), catalog->relationships().size()));
    return R::ok(std::move(catalog));
}

} // namespace sqlguard
