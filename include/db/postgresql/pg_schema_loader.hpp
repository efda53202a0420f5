#pragma once

#include "db/ischema_loader.hpp"

namespace sqlguard {

/**
 * @brief PostgreSQL schema loader
 *
 * Columns from information_schema.columns in ordinal order; foreign keys
 * from the information_schema constraint views, keeping the first column
 * pair of each constraint. When several constraints link the same two
 * tables, the last one (by constraint name) wins.
 */
class PgSchemaLoader : public ISchemaLoader {
public:
    [[nodiscard]] Result<std::shared_ptr<const SchemaCatalog>> load(
        IDbConnection& conn, const std::string& schema_name) override;

    [[nodiscard]] static std::string columns_query(const std::string& schema_name);
    [[nodiscard]] static std::string foreign_keys_query(const std::string& schema_name);
};

} // namespace sqlguard
