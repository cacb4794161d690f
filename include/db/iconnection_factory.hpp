#pragma once

#include "db/idb_connection.hpp"
#include <memory>
#include <string>

namespace pgtenant {

/**
 * @brief Abstract factory for creating database connections
 *
 * The PostgreSQL factory wraps PQconnectdb; tests plug in an in-memory one.
 */
class IConnectionFactory {
public:
    virtual ~IConnectionFactory() = default;

    /**
     * @brief Create a new database connection
     * @param connection_string libpq connection string
     * @return New connection, or nullptr on failure
     */
    [[nodiscard]] virtual std::unique_ptr<IDbConnection> create(
        const std::string& connection_string) = 0;
};

} // namespace pgtenant
