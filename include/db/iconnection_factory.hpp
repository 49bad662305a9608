#pragma once

#include "db/idb_connection.hpp"
#include <memory>
#include <string>

namespace pgcrud {

/**
 * @brief Abstract factory for creating database connections
 *
 * Wraps the native connection function (PQconnectdb) so that the
 * facade can reopen a connection without knowing the backend.
 */
class IConnectionFactory {
public:
    virtual ~IConnectionFactory() = default;

    /**
     * @brief Create a new database connection
     * @param connection_string Backend-specific connection string
     * @return New connection, or nullptr on failure
     */
    [[nodiscard]] virtual std::unique_ptr<IDbConnection> create(
        const std::string& connection_string) = 0;
};

} // namespace pgcrud
