#include "db/postgresql/pg_connection.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include <cstring>
#include <format>
#include <memory>

namespace pgcrud {

namespace {

// RAII wrapper for PGresult* (auto-calls PQclear on destruction)
struct PGResultDeleter {
    void operator()(PGresult* res) const noexcept {
        if (res) {
            PQclear(res);
        }
    }
};
using PGResultPtr = std::unique_ptr<PGresult, PGResultDeleter>;

// Memory handed out by PQescape* / PQunescapeBytea
struct PQFreememDeleter {
    void operator()(void* ptr) const noexcept {
        if (ptr) {
            PQfreemem(ptr);
        }
    }
};

} // anonymous namespace

// ============================================================================
// PgConnection
// ============================================================================

PgConnection::PgConnection(PGconn* conn)
    : conn_(conn) {}

PgConnection::~PgConnection() {
    close();
}

DbResultSet PgConnection::execute(const std::string& sql, const ParamList& params) {
    if (!conn_) {
        DbResultSet result;
        result.error_message = "Connection is null";
        return result;
    }

    // libpq wants a parallel array of C strings, nullptr meaning NULL
    std::vector<const char*> values;
    values.reserve(params.size());
    for (const auto& param : params) {
        values.push_back(param ? param->c_str() : nullptr);
    }

    PGResultPtr res(PQexecParams(conn_, sql.c_str(),
        static_cast<int>(values.size()), nullptr,
        values.empty() ? nullptr : values.data(),
        nullptr, nullptr, 0));

    if (!res) {
        DbResultSet result;
        result.error_message = PQerrorMessage(conn_);
        return result;
    }

    const ExecStatusType status = PQresultStatus(res.get());

    if (status == PGRES_TUPLES_OK) {
        return process_tuples_result(res.get());
    }

    if (status == PGRES_COMMAND_OK || status == PGRES_EMPTY_QUERY) {
        return process_command_result(res.get());
    }

    return process_error_result(res.get());
}

std::string PgConnection::escape_identifier(std::string_view name) {
    if (!conn_) {
        throw InvalidConnectionError("Connection is not valid");
    }
    std::unique_ptr<char, PQFreememDeleter> escaped(
        PQescapeIdentifier(conn_, name.data(), name.size()));
    if (!escaped) {
        throw DatabaseError(std::format("Cannot escape identifier: {}", PQerrorMessage(conn_)));
    }
    return std::string(escaped.get());
}

std::string PgConnection::escape_bytea(const std::vector<uint8_t>& data) {
    if (!conn_) {
        throw InvalidConnectionError("Connection is not valid");
    }
    size_t escaped_len = 0;
    std::unique_ptr<unsigned char, PQFreememDeleter> escaped(
        PQescapeByteaConn(conn_, data.data(), data.size(), &escaped_len));
    if (!escaped) {
        throw DatabaseError(std::format("Cannot escape bytea: {}", PQerrorMessage(conn_)));
    }
    // escaped_len includes the terminating zero byte
    return std::string(reinterpret_cast<const char*>(escaped.get()),
        escaped_len > 0 ? escaped_len - 1 : 0);
}

std::vector<uint8_t> PgConnection::unescape_bytea(std::string_view text) {
    const std::string terminated(text);
    size_t len = 0;
    std::unique_ptr<unsigned char, PQFreememDeleter> raw(
        PQunescapeBytea(reinterpret_cast<const unsigned char*>(terminated.c_str()), &len));
    if (!raw) {
        throw DatabaseError("Cannot unescape bytea value");
    }
    return std::vector<uint8_t>(raw.get(), raw.get() + len);
}

int PgConnection::server_version() const {
    return conn_ ? PQserverVersion(conn_) : 0;
}

int PgConnection::socket() const {
    return conn_ ? PQsocket(conn_) : -1;
}

bool PgConnection::is_connected() const {
    return conn_ != nullptr && PQstatus(conn_) == CONNECTION_OK;
}

void PgConnection::reset() {
    if (!conn_) {
        throw InvalidConnectionError("Connection already closed");
    }
    PQreset(conn_);
    if (PQstatus(conn_) != CONNECTION_OK) {
        throw DatabaseError(std::format("Connection reset failed: {}", PQerrorMessage(conn_)));
    }
}

void PgConnection::close() {
    if (conn_) {
        PQfinish(conn_);
        conn_ = nullptr;
    }
}

DbResultSet PgConnection::process_tuples_result(PGresult* res) {
    DbResultSet result;
    result.success = true;

    const int ncols = PQnfields(res);
    result.column_names.reserve(ncols);
    for (int i = 0; i < ncols; i++) {
        result.column_names.emplace_back(PQfname(res, i));
    }

    const int nrows = PQntuples(res);
    result.rows.reserve(nrows);

    for (int i = 0; i < nrows; i++) {
        std::vector<std::optional<std::string>> row;
        row.reserve(ncols);
        for (int j = 0; j < ncols; j++) {
            if (PQgetisnull(res, i, j)) {
                row.emplace_back(std::nullopt);
            } else {
                row.emplace_back(std::string(PQgetvalue(res, i, j),
                    static_cast<size_t>(PQgetlength(res, i, j))));
            }
        }
        result.rows.push_back(std::move(row));
    }

    result.affected_rows = static_cast<uint64_t>(nrows);
    return result;
}

DbResultSet PgConnection::process_command_result(PGresult* res) {
    DbResultSet result;
    result.success = true;

    const char* affected = PQcmdTuples(res);
    if (affected && std::strlen(affected) > 0) {
        result.affected_rows = utils::try_parse_int<uint64_t>(affected).value_or(0);
    }

    return result;
}

DbResultSet PgConnection::process_error_result(PGresult* res) const {
    DbResultSet result;
    result.success = false;

    const char* message = PQresultErrorMessage(res);
    result.error_message = (message && *message) ? message : PQerrorMessage(conn_);
    result.error_message = utils::rtrim(result.error_message);

    const char* sqlstate = PQresultErrorField(res, PG_DIAG_SQLSTATE);
    if (sqlstate) {
        result.sqlstate = sqlstate;
    }
    return result;
}

// ============================================================================
// PgConnectionFactory
// ============================================================================

std::unique_ptr<IDbConnection> PgConnectionFactory::create(
    const std::string& connection_string) {

    PGconn* conn = PQconnectdb(connection_string.c_str());

    if (!conn) {
        utils::log::error("Failed to allocate PGconn");
        return nullptr;
    }

    if (PQstatus(conn) != CONNECTION_OK) {
        utils::log::error(std::format("Failed to connect: {}", utils::rtrim(PQerrorMessage(conn))));
        PQfinish(conn);
        return nullptr;
    }

    return std::make_unique<PgConnection>(conn);
}

} // namespace pgcrud
