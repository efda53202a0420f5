#pragma once

#include "db/idb_connection.hpp"
#include <memory>
#include <string>

namespace sqlguard {

/**
 * @brief Creates database connections (PQconnectdb for PostgreSQL)
 */
class IConnectionFactory {
public:
    virtual ~IConnectionFactory() = default;

    // nullptr on failure; the reason is logged by the factory
    [[nodiscard]] virtual std::unique_ptr<IDbConnection> create(
        const std::string& connection_string) = 0;
};

} // namespace sqlguard
