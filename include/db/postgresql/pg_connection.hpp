#pragma once

#include "db/idb_connection.hpp"
#include "db/iconnection_factory.hpp"
#include <libpq-fe.h>
#include <string>

namespace pgcrud {

/**
 * @brief PostgreSQL connection implementing IDbConnection
 *
 * Wraps PGconn* and provides the transport capabilities used by Database.
 * All libpq calls are encapsulated here.
 */
class PgConnection : public IDbConnection {
public:
    /**
     * @brief Construct from existing PGconn* (takes ownership)
     */
    explicit PgConnection(PGconn* conn);

    ~PgConnection() override;

    PgConnection(const PgConnection&) = delete;
    PgConnection& operator=(const PgConnection&) = delete;

    DbResultSet execute(const std::string& sql, const ParamList& params) override;
    std::string escape_identifier(std::string_view name) override;
    std::string escape_bytea(const std::vector<uint8_t>& data) override;
    std::vector<uint8_t> unescape_bytea(std::string_view text) override;
    int server_version() const override;
    int socket() const override;
    bool is_connected() const override;
    void reset() override;
    void close() override;

private:
    /**
     * @brief Process a row-returning result (PGRES_TUPLES_OK)
     */
    static DbResultSet process_tuples_result(PGresult* res);

    /**
     * @brief Process a command result (PGRES_COMMAND_OK)
     */
    static DbResultSet process_command_result(PGresult* res);

    /**
     * @brief Build a failed result carrying message and SQLSTATE
     */
    DbResultSet process_error_result(PGresult* res) const;

    PGconn* conn_;
};

/**
 * @brief PostgreSQL connection factory
 *
 * Creates PgConnection instances using PQconnectdb.
 */
class PgConnectionFactory : public IConnectionFactory {
public:
    std::unique_ptr<IDbConnection> create(const std::string& connection_string) override;
};

} // namespace pgcrud
