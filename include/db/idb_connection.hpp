#pragma once

#include "core/types.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pgcrud {

/**
 * @brief Result set from a statement execution
 *
 * Returned by IDbConnection::execute().
 * Owns the result data (copied from native result handles).
 */
struct DbResultSet {
    bool success = false;
    std::string error_message;
    std::string sqlstate;           // SQLSTATE of a server-reported error

    // For statements returning rows (SELECT, ... RETURNING)
    std::vector<std::string> column_names;
    std::vector<std::vector<std::optional<std::string>>> rows;  // nullopt = SQL NULL

    // For DML
    uint64_t affected_rows = 0;

    [[nodiscard]] size_t row_count() const { return rows.size(); }
};

/**
 * @brief Capabilities the metadata cache and statement builder need from a transport
 *
 * Wraps a single native connection handle (PGconn*).
 * Implementations are not thread-safe: one connection per thread.
 *
 * Does NOT expose native handles to prevent leaking backend types.
 */
class IDbConnection {
public:
    virtual ~IDbConnection() = default;

    /**
     * @brief Execute a statement with positional text parameters ($1, $2, ...)
     * @param sql SQL text
     * @param params Parameter values, nullopt for NULL
     * @return Result set with rows or affected count; success=false on server error
     */
    [[nodiscard]] virtual DbResultSet execute(const std::string& sql, const ParamList& params) = 0;

    /**
     * @brief Quote a name for use as an SQL identifier
     */
    [[nodiscard]] virtual std::string escape_identifier(std::string_view name) = 0;

    /**
     * @brief Escape binary data for use as a bytea text parameter
     */
    [[nodiscard]] virtual std::string escape_bytea(const std::vector<uint8_t>& data) = 0;

    /**
     * @brief Decode the text representation of a bytea value
     */
    [[nodiscard]] virtual std::vector<uint8_t> unescape_bytea(std::string_view text) = 0;

    /**
     * @brief Server version as an integer (e.g. 90500 for 9.5.0)
     */
    [[nodiscard]] virtual int server_version() const = 0;

    /**
     * @brief Socket descriptor of the connection (-1 if none)
     */
    [[nodiscard]] virtual int socket() const = 0;

    /**
     * @brief Check if connection is in a valid state (connected)
     */
    [[nodiscard]] virtual bool is_connected() const = 0;

    /**
     * @brief Re-establish the connection with the original parameters
     */
    virtual void reset() = 0;

    /**
     * @brief Close the connection and release resources
     */
    virtual void close() = 0;
};

} // namespace pgcrud
