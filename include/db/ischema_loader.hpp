#pragma once

#include "core/error.hpp"
#include "db/idb_connection.hpp"
#include "schema/schema_catalog.hpp"
#include <memory>
#include <string>

namespace sqlguard {

/**
 * @brief Introspects the target database into a SchemaCatalog
 *
 * Each call builds a new immutable catalog; callers swap it in and
 * in-flight requests keep the previous one alive.
 */
class ISchemaLoader {
public:
    virtual ~ISchemaLoader() = default;

    /**
     * @return The catalog, or SCHEMA_UNAVAILABLE when the catalog queries
     *         fail or the schema has no tables
     */
    [[nodiscard]] virtual Result<std::shared_ptr<const SchemaCatalog>> load(
        IDbConnection& conn, const std::string& schema_name) = 0;
};

} // namespace sqlguard
