#pragma once

#include "config/config_types.hpp"
#include "core/types.hpp"
#include "crud/row_marshaller.hpp"
#include "crud/statement_builder.hpp"
#include "db/iconnection_factory.hpp"
#include "db/idb_connection.hpp"
#include "schema/metadata_cache.hpp"
#include "schema/privilege_cache.hpp"

#include <cstdint>
#include <initializer_list>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace pgcrud {

/**
 * @brief Schema-aware CRUD facade over one PostgreSQL connection
 *
 * Owns the transport handle together with the attribute, primary key and
 * privilege caches. Rows are exchanged as Records that are updated in place
 * with the values the server actually stored.
 *
 * A trailing "*" on a table name (descendant tables hint) is ignored by all
 * row operations. Names containing a dot are treated as qualified and must
 * be quoted by the caller.
 *
 * Not thread-safe: use one instance per thread.
 */
class Database {
public:
    /// Single column name or ordered column list
    using KeyName = std::variant<std::string, KeyColumns>;

    /**
     * @brief Connect with a libpq connection string
     * @throws DatabaseError if the connection cannot be established
     */
    explicit Database(const std::string& connection_string);

    /**
     * @brief Connect using a loaded config (also applies logging and metadata settings)
     */
    explicit Database(const ClientConfig& config);

    /**
     * @brief Connect through a custom factory (kept for reopen())
     */
    Database(std::unique_ptr<IConnectionFactory> factory, std::string connection_string);

    /**
     * @brief Take ownership of an established connection
     * @throws InvalidConnectionError if the connection is null or not connected
     */
    explicit Database(std::unique_ptr<IDbConnection> connection);

    /**
     * @brief Use a connection owned by the caller
     *
     * close() only detaches from it and reopen() is a no-op.
     * @throws InvalidConnectionError if the connection is not connected
     */
    explicit Database(IDbConnection& connection);

    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;
    Database(Database&&) = delete;
    Database& operator=(Database&&) = delete;

    // ========================================================================
    // Raw execution
    // ========================================================================

    /**
     * @brief Execute a statement as given
     * @throws DatabaseError carrying the SQLSTATE if the server rejects it
     */
    DbResultSet query(const std::string& sql, const ParamList& params = {});

    // ========================================================================
    // Table metadata
    // ========================================================================

    /**
     * @brief Primary key of a table
     * @param composite Always return a column list, even for a single column
     * @param flush Drop the primary key cache first
     * @throws NotFoundError if the table has no primary key
     */
    [[nodiscard]] KeyName pkey(const std::string& table, bool composite = false, bool flush = false);

    [[nodiscard]] KeyColumns pkey_columns(const std::string& table, bool flush = false);

    /**
     * @brief Ordered attribute map of a table
     * @param flush Drop the attribute cache first
     */
    [[nodiscard]] std::shared_ptr<const AttributeMap> get_attnames(
        const std::string& table, bool flush = false);

    [[nodiscard]] bool use_regtypes() const;

    /**
     * @brief Switch get_attnames() between simple and full catalog type names
     * @return The mode now in effect
     */
    bool use_regtypes(bool enabled);

    [[nodiscard]] bool has_table_privilege(const std::string& table,
        const std::string& privilege = "select");

    // ========================================================================
    // Row operations
    // ========================================================================

    /**
     * @brief Fetch one row into a record
     *
     * The key is the given keyname, else the primary key, else the row's OID
     * when the table has OIDs and the record carries one ("oid(<table>)" or
     * "oid"). Fetched columns overwrite the record.
     *
     * @throws NotFoundError if no key can be determined or no row matches
     * @throws ValidationError if key values are missing from the record
     */
    Record& get(const std::string& table, Record& row,
        const std::optional<KeyName>& keyname = std::nullopt);

    /**
     * @brief Fetch one row by bare key value(s)
     * @throws ValidationError if the number of values differs from the key
     */
    [[nodiscard]] Record get_by_key(const std::string& table, const std::vector<Value>& key_values,
        const std::optional<KeyName>& keyname = std::nullopt);

    /**
     * @brief Insert a row; the record is reloaded with the stored values
     *
     * A literal "oid" entry is dropped, defaults and trigger changes are
     * picked up through RETURNING.
     */
    Record& insert(const std::string& table, Record& row);

    /**
     * @brief Update a row located by primary key or "oid(<table>)"
     *
     * A literal "oid" entry is ignored. Does nothing when there is no
     * non-key column to set; a key matching no row leaves the record as is.
     */
    Record& update(const std::string& table, Record& row);

    /**
     * @brief Insert, or resolve a primary key conflict in a single statement
     *
     * See StatementBuilder::build_upsert() for the meaning of overrides.
     * When the conflict is resolved with DO NOTHING, the current row is
     * fetched instead.
     *
     * @throws NotFoundError if the table has no primary key
     * @throws UnsupportedError if the server predates ON CONFLICT (9.5)
     */
    Record& upsert(const std::string& table, Record& row, const Record& overrides = {});

    /**
     * @brief Delete a row located like update()
     * @return Number of deleted rows (0 if nothing matched)
     */
    uint64_t delete_row(const std::string& table, Record& row);

    /**
     * @brief Empty one table
     * @param only Do not truncate descendant tables
     */
    void truncate(const std::string& table, bool restart = false, bool cascade = false,
        bool only = false);

    /**
     * @brief Empty several tables at once
     * @param only Empty, a single flag for all tables, or one flag per table
     */
    void truncate(const std::vector<std::string>& tables, bool restart = false,
        bool cascade = false, const std::vector<bool>& only = {});
    void truncate(std::initializer_list<std::string> tables, bool restart = false,
        bool cascade = false, const std::vector<bool>& only = {});

    /**
     * @brief Empty a set of tables (in set order) with one only flag for all
     */
    void truncate(const std::set<std::string>& tables, bool restart = false,
        bool cascade = false, bool only = false);

    /**
     * @brief Reset every column of a record to the neutral value of its type
     *
     * 0 for numeric types, false for bool, "" for everything else.
     */
    Record& clear(const std::string& table, Record& row);
    [[nodiscard]] Record clear(const std::string& table);

    // ========================================================================
    // Table listings
    // ========================================================================

    /// Rows as JSON objects (column -> value), or bare values when scalar
    using RowList = std::vector<Value>;

    /// (key, row) pairs in query order; composite keys are arrays in key column order
    using KeyedRows = std::vector<std::pair<Value, Value>>;

    /**
     * @brief Fetch the rows of a table (or any row returning expression)
     *
     * Without an explicit order, rows are ordered by the selected columns,
     * else by the primary key, else by all columns. Values of a plain
     * relation are decoded by its column types; rows of other expressions
     * are text and unordered by default.
     *
     * @throws ValidationError if the table name is empty
     */
    [[nodiscard]] RowList get_as_list(const std::string& table, const SelectOptions& options = {});

    /**
     * @brief Fetch the rows of a table keyed by the primary key or keyname
     *
     * Row values hold the non-key columns (only the first one when scalar).
     * A key occurring twice keeps its first position and the last row.
     * Without an explicit order, rows are ordered by the selected columns,
     * else by the key columns.
     *
     * @throws NotFoundError if no keyname is given and the table has no primary key
     * @throws ValidationError if a key column is missing from the result
     */
    [[nodiscard]] KeyedRows get_as_dict(const std::string& table,
        const std::optional<KeyName>& keyname = std::nullopt,
        const SelectOptions& options = {});

    // ========================================================================
    // Catalog listing
    // ========================================================================

    [[nodiscard]] std::vector<std::string> get_databases();

    /**
     * @brief Qualified names of relations outside the system schemas
     * @param kinds pg_class.relkind letters to include (empty = all)
     */
    [[nodiscard]] std::vector<std::string> get_relations(const std::string& kinds = {});

    [[nodiscard]] std::vector<std::string> get_tables();

    // ========================================================================
    // Run-time parameters
    // ========================================================================

    [[nodiscard]] std::string get_parameter(const std::string& name);
    [[nodiscard]] std::vector<std::string> get_parameter(const std::vector<std::string>& names);

    /**
     * @brief Every setting (SHOW ALL) as name -> value
     */
    [[nodiscard]] std::map<std::string, std::string> get_all_parameters();

    /**
     * @brief SET a parameter, or RESET it when no value is given
     *
     * The name "all" resets every parameter and takes no value.
     * @param local Only for the current transaction
     */
    void set_parameter(const std::string& name,
        const std::optional<std::string>& value = std::nullopt, bool local = false);
    void set_parameter(const std::vector<std::string>& names,
        const std::optional<std::string>& value, bool local = false);
    void set_parameter(const std::vector<std::string>& names,
        const std::vector<std::string>& values, bool local = false);
    void set_parameter(const std::map<std::string, std::optional<std::string>>& values,
        bool local = false);

    // ========================================================================
    // Transactions
    // ========================================================================

    void begin(const std::string& mode = {});
    void commit();
    void rollback(const std::string& savepoint = {});
    void savepoint(const std::string& name);
    void release(const std::string& name);

    // ========================================================================
    // Escaping and encoding
    // ========================================================================

    [[nodiscard]] std::string escape_identifier(std::string_view name);
    [[nodiscard]] std::string escape_bytea(const std::vector<uint8_t>& data);
    [[nodiscard]] std::vector<uint8_t> unescape_bytea(std::string_view text);

    [[nodiscard]] static std::string encode_json(const Value& value);

    /**
     * @throws ValidationError on malformed JSON
     */
    [[nodiscard]] static Value decode_json(const std::string& text);

    // ========================================================================
    // Connection lifecycle
    // ========================================================================

    [[nodiscard]] int server_version() const;

    /**
     * @throws InvalidConnectionError if already closed
     */
    void close();

    void reset();

    /**
     * @brief Replace the connection with a fresh one to the same database
     *
     * Works after close() too. No-op for borrowed connections.
     */
    void reopen();

    [[nodiscard]] bool is_open() const { return conn_ != nullptr; }

private:
    using ParameterList = std::vector<std::pair<std::string, std::optional<std::string>>>;

    void attach(std::unique_ptr<IDbConnection> connection);

    // Every public operation goes through one of these first
    void ensure_open() const;
    [[nodiscard]] IDbConnection& connection() const;

    DbResultSet run(const std::string& sql, const ParamList& params);
    DbResultSet run(const Statement& statement);

    /**
     * @brief Key columns for get/update/delete with primary key and OID fallback
     * @param has_oid Whether an OID value is available for the row
     */
    [[nodiscard]] KeyColumns resolve_key(const std::string& table, const Record& row,
        bool has_oid, const std::optional<KeyName>& keyname);

    [[nodiscard]] static KeyColumns to_columns(const KeyName& keyname);

    // Column types of a listed relation; empty for subqueries and other expressions
    [[nodiscard]] std::shared_ptr<const AttributeMap> listing_attributes(const std::string& table);
    [[nodiscard]] std::vector<std::string> quoted(const std::vector<std::string>& columns);
    [[nodiscard]] static std::string normalize_parameter(const std::string& name);

    void apply_parameters(const ParameterList& params, bool local);

    std::unique_ptr<IConnectionFactory> factory_;
    std::string connection_string_;

    std::unique_ptr<IDbConnection> owned_;
    IDbConnection* conn_ = nullptr;
    bool closeable_ = true;

    MetadataCache metadata_{[this](const std::string& sql, const ParamList& params) {
        return run(sql, params);
    }};
    PrivilegeCache privileges_{[this](const std::string& sql, const ParamList& params) {
        return run(sql, params);
    }};
    RowMarshaller marshaller_{[this](std::string_view text) {
        return connection().unescape_bytea(text);
    }};
};

/**
 * @brief Transaction scope: BEGIN on construction, ROLLBACK on destruction
 *        unless committed or rolled back explicitly
 */
class Transaction {
public:
    explicit Transaction(Database& db, const std::string& mode = {});
    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void commit();
    void rollback();

    [[nodiscard]] bool active() const { return active_; }

private:
    Database& db_;
    bool active_ = false;
};

} // namespace pgcrud
