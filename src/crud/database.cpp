#include "crud/database.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include "crud/param_preparer.hpp"
#include "db/postgresql/pg_connection.hpp"
#include "db/sql_names.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <unordered_map>

namespace pgcrud {

namespace {

// First version with INSERT ... ON CONFLICT
constexpr int kUpsertMinServerVersion = 90500;

const std::string& apply_logging(const ClientConfig& config) {
    if (const auto level = utils::log::parse_level(config.logging.level)) {
        utils::log::set_level(*level);
    }
    return config.database.connection_string;
}

// Plain or qualified relation name, as opposed to a subquery or join
bool names_relation(const std::string& source) {
    return source.find_first_of("( \t\n") == std::string::npos;
}

std::vector<std::string> first_column(const DbResultSet& result) {
    std::vector<std::string> values;
    values.reserve(result.rows.size());
    for (const auto& row : result.rows) {
        values.push_back(!row.empty() && row[0] ? *row[0] : std::string());
    }
    return values;
}

} // anonymous namespace

// ============================================================================
// Construction
// ============================================================================

Database::Database(const std::string& connection_string)
    : Database(std::make_unique<PgConnectionFactory>(), connection_string) {}

Database::Database(const ClientConfig& config)
    : Database(std::make_unique<PgConnectionFactory>(), apply_logging(config)) {
    metadata_.set_use_regtypes(config.metadata.use_regtypes);
}

Database::Database(std::unique_ptr<IConnectionFactory> factory, std::string connection_string)
    : factory_(std::move(factory)), connection_string_(std::move(connection_string)) {
    if (!factory_) {
        throw InvalidConnectionError("No connection factory given");
    }
    auto conn = factory_->create(connection_string_);
    if (!conn) {
        throw DatabaseError("Cannot connect to database");
    }
    attach(std::move(conn));
}

Database::Database(std::unique_ptr<IDbConnection> connection) {
    attach(std::move(connection));
}

Database::Database(IDbConnection& connection)
    : closeable_(false) {
    if (!connection.is_connected()) {
        throw InvalidConnectionError("Connection is not valid");
    }
    conn_ = &connection;
}

Database::~Database() = default;

void Database::attach(std::unique_ptr<IDbConnection> connection) {
    if (!connection) {
        throw InvalidConnectionError("No connection given");
    }
    if (!connection->is_connected()) {
        throw InvalidConnectionError("Connection is not valid");
    }
    owned_ = std::move(connection);
    conn_ = owned_.get();
    utils::log::info(std::format("Connected to PostgreSQL server version {}",
        conn_->server_version()));
}

void Database::ensure_open() const {
    if (!conn_) {
        throw InvalidConnectionError("Connection is not valid");
    }
}

IDbConnection& Database::connection() const {
    ensure_open();
    return *conn_;
}

// ============================================================================
// Execution
// ============================================================================

DbResultSet Database::run(const std::string& sql, const ParamList& params) {
    auto& conn = connection();
    const std::string statement = params.empty()
        ? sql
        : std::format("{}\n  with {}", sql, describe_params(params));
    utils::log::debug(statement);

    auto result = conn.execute(sql, params);
    if (!result.success) {
        throw DatabaseError(std::format("{}\nin {}", result.error_message, statement),
            result.sqlstate);
    }
    return result;
}

DbResultSet Database::run(const Statement& statement) {
    return run(statement.sql(), statement.params());
}

DbResultSet Database::query(const std::string& sql, const ParamList& params) {
    return run(sql, params);
}

// ============================================================================
// Table metadata
// ============================================================================

Database::KeyName Database::pkey(const std::string& table, bool composite, bool flush) {
    KeyColumns columns = pkey_columns(table, flush);
    if (!composite && columns.size() == 1) {
        return columns.front();
    }
    return columns;
}

KeyColumns Database::pkey_columns(const std::string& table, bool flush) {
    ensure_open();
    return metadata_.primary_key(table, flush);
}

std::shared_ptr<const AttributeMap> Database::get_attnames(const std::string& table, bool flush) {
    ensure_open();
    return metadata_.attributes(table, flush);
}

bool Database::use_regtypes() const {
    return metadata_.use_regtypes();
}

bool Database::use_regtypes(bool enabled) {
    return metadata_.set_use_regtypes(enabled);
}

bool Database::has_table_privilege(const std::string& table, const std::string& privilege) {
    ensure_open();
    return privileges_.has_table_privilege(table, privilege);
}

KeyColumns Database::to_columns(const KeyName& keyname) {
    KeyColumns columns;
    if (const auto* single = std::get_if<std::string>(&keyname)) {
        columns.push_back(*single);
    } else {
        columns = std::get<KeyColumns>(keyname);
    }
    if (columns.empty()) {
        throw ValidationError("No key columns given");
    }
    for (const auto& column : columns) {
        if (column.empty()) {
            throw ValidationError("Empty key column name");
        }
    }
    return columns;
}

KeyColumns Database::resolve_key(const std::string& table, const Record& row,
    bool has_oid, const std::optional<KeyName>& keyname) {
    if (keyname) {
        return to_columns(*keyname);
    }

    KeyColumns key;
    try {
        key = metadata_.primary_key(table);
    } catch (const NotFoundError&) {
        if (has_oid) {
            return {"oid"};
        }
        throw;
    }

    for (const auto& column : key) {
        if (!row.contains(column)) {
            if (has_oid) {
                return {"oid"};
            }
            throw ValidationError(std::format(
                "Missing value in row for primary key column {} of {}", column, table));
        }
    }
    return key;
}

// ============================================================================
// Row operations
// ============================================================================

Record& Database::get(const std::string& table, Record& row, const std::optional<KeyName>& keyname) {
    const std::string name = db::strip_descendant_hint(table);
    auto& conn = connection();
    const auto attrs = metadata_.attributes(name);
    const std::string qoid = oid_key(name);

    // A literal "oid" wins over the munged key
    std::optional<Value> oid;
    if (attrs->has_oids()) {
        if (const auto it = row.find("oid"); it != row.end()) {
            oid = it->second;
        } else if (const auto munged = row.find(qoid); munged != row.end()) {
            oid = munged->second;
        }
    }

    const KeyColumns key = resolve_key(name, row, oid.has_value(), keyname);

    Record lookup = row;
    lookup.erase("oid");
    if (oid) {
        lookup["oid"] = *oid;
    }
    const auto statement = StatementBuilder(conn).build_get(name, *attrs, key, lookup);

    row.erase("oid");
    if (oid) {
        row[qoid] = *oid;
    }

    const auto result = run(statement);
    if (result.rows.empty()) {
        throw NotFoundError(std::format("No such record in {}\nwhere {}\nwith {}",
            name, statement.condition(), describe_params(statement.params())));
    }
    marshaller_.merge_row(result, 0, *attrs, name, row);
    return row;
}

Record Database::get_by_key(const std::string& table, const std::vector<Value>& key_values,
    const std::optional<KeyName>& keyname) {
    const std::string name = db::strip_descendant_hint(table);
    const KeyColumns key = keyname ? to_columns(*keyname) : pkey_columns(name);
    if (key.size() != key_values.size()) {
        throw ValidationError(std::format(
            "Differing number of items in keyname ({}) and row ({})",
            key.size(), key_values.size()));
    }

    Record row;
    for (size_t i = 0; i < key.size(); ++i) {
        row[key[i]] = key_values[i];
    }
    get(name, row, KeyName(key));
    return row;
}

Record& Database::insert(const std::string& table, Record& row) {
    const std::string name = db::strip_descendant_hint(table);
    auto& conn = connection();
    row.erase("oid");

    const auto attrs = metadata_.attributes(name);
    const auto result = run(StatementBuilder(conn).build_insert(name, *attrs, row));
    if (!result.rows.empty()) {
        marshaller_.merge_row(result, 0, *attrs, name, row);
    }
    return row;
}

Record& Database::update(const std::string& table, Record& row) {
    const std::string name = db::strip_descendant_hint(table);
    auto& conn = connection();
    row.erase("oid");

    const auto attrs = metadata_.attributes(name);
    std::optional<Value> oid;
    if (attrs->has_oids()) {
        if (const auto it = row.find(oid_key(name)); it != row.end()) {
            oid = it->second;
        }
    }

    const KeyColumns key = resolve_key(name, row, oid.has_value(), std::nullopt);
    Record lookup = row;
    if (oid) {
        lookup["oid"] = *oid;
    }

    const auto statement = StatementBuilder(conn).build_update(name, *attrs, key, lookup);
    if (!statement) {
        return row;
    }
    const auto result = run(*statement);
    if (!result.rows.empty()) {
        marshaller_.merge_row(result, 0, *attrs, name, row);
    }
    return row;
}

Record& Database::upsert(const std::string& table, Record& row, const Record& overrides) {
    const std::string name = db::strip_descendant_hint(table);
    auto& conn = connection();
    row.erase("oid");

    const auto attrs = metadata_.attributes(name);
    const KeyColumns key = metadata_.primary_key(name);

    const auto statement = StatementBuilder(conn).build_upsert(name, *attrs, key, row, overrides);
    if (!statement) {
        return row;
    }

    DbResultSet result;
    try {
        result = run(*statement);
    } catch (const DatabaseError& e) {
        const int version = conn.server_version();
        if (version < kUpsertMinServerVersion) {
            utils::log::warn(std::format("Upsert into {} failed on server version {}: {}",
                name, version, e.what()));
            throw UnsupportedError(
                "Upsert operation is not supported by PostgreSQL version", e.sqlstate());
        }
        throw;
    }

    if (!result.rows.empty()) {
        marshaller_.merge_row(result, 0, *attrs, name, row);
    } else {
        // Conflict resolved with DO NOTHING
        get(name, row);
    }
    return row;
}

uint64_t Database::delete_row(const std::string& table, Record& row) {
    const std::string name = db::strip_descendant_hint(table);
    auto& conn = connection();
    row.erase("oid");

    const auto attrs = metadata_.attributes(name);
    std::optional<Value> oid;
    if (attrs->has_oids()) {
        if (const auto it = row.find(oid_key(name)); it != row.end()) {
            oid = it->second;
        }
    }

    const KeyColumns key = resolve_key(name, row, oid.has_value(), std::nullopt);
    Record lookup = row;
    if (oid) {
        lookup["oid"] = *oid;
    }

    const auto result = run(StatementBuilder(conn).build_delete(name, *attrs, key, lookup));
    return result.affected_rows;
}

void Database::truncate(const std::string& table, bool restart, bool cascade, bool only) {
    truncate(std::vector<std::string>{table}, restart, cascade, std::vector<bool>{only});
}

void Database::truncate(const std::vector<std::string>& tables, bool restart, bool cascade,
    const std::vector<bool>& only) {
    auto& conn = connection();
    run(StatementBuilder(conn).build_truncate(tables, only, restart, cascade));
}

void Database::truncate(std::initializer_list<std::string> tables, bool restart, bool cascade,
    const std::vector<bool>& only) {
    truncate(std::vector<std::string>(tables), restart, cascade, only);
}

void Database::truncate(const std::set<std::string>& tables, bool restart, bool cascade,
    bool only) {
    truncate(std::vector<std::string>(tables.begin(), tables.end()), restart, cascade,
        std::vector<bool>{only});
}

Record& Database::clear(const std::string& table, Record& row) {
    const auto attrs = get_attnames(db::strip_descendant_hint(table));
    for (const auto& attr : *attrs) {
        if (attr.name == "oid") {
            continue;
        }
        if (is_numeric(attr.semantic)) {
            row[attr.name] = 0;
        } else if (attr.semantic == SemanticType::BOOL) {
            row[attr.name] = false;
        } else {
            row[attr.name] = "";
        }
    }
    return row;
}

Record Database::clear(const std::string& table) {
    Record row;
    clear(table, row);
    return row;
}

// ============================================================================
// Table listings
// ============================================================================

std::shared_ptr<const AttributeMap> Database::listing_attributes(const std::string& table) {
    if (!names_relation(table)) {
        return std::make_shared<const AttributeMap>();
    }
    return metadata_.attributes(table);
}

std::vector<std::string> Database::quoted(const std::vector<std::string>& columns) {
    std::vector<std::string> names;
    names.reserve(columns.size());
    for (const auto& column : columns) {
        names.push_back(connection().escape_identifier(column));
    }
    return names;
}

Database::RowList Database::get_as_list(const std::string& table, const SelectOptions& options) {
    ensure_open();
    if (utils::trim(table).empty()) {
        throw ValidationError("The table name is missing");
    }

    const auto attrs = listing_attributes(table);

    std::vector<std::string> order;
    if (options.order) {
        order = *options.order;
    } else if (!options.what.empty()) {
        order = options.what;
    } else if (names_relation(table)) {
        try {
            order = quoted(metadata_.primary_key(table));
        } catch (const NotFoundError&) {
            std::vector<std::string> columns;
            for (const auto& attr : *attrs) {
                columns.push_back(attr.name);
            }
            order = quoted(columns);
        }
    }

    const auto result = run(StatementBuilder::build_select(table, options, order));

    RowList rows;
    rows.reserve(result.rows.size());
    for (size_t i = 0; i < result.rows.size(); ++i) {
        if (options.scalar) {
            rows.push_back(marshaller_.decode_field(result, i, 0, *attrs));
        } else {
            rows.emplace_back(marshaller_.to_record(result, i, *attrs, table));
        }
    }
    return rows;
}

Database::KeyedRows Database::get_as_dict(const std::string& table,
    const std::optional<KeyName>& keyname, const SelectOptions& options) {
    ensure_open();
    if (utils::trim(table).empty()) {
        throw ValidationError("The table name is missing");
    }

    const KeyColumns key = keyname ? to_columns(*keyname) : metadata_.primary_key(table);
    const auto attrs = listing_attributes(table);

    std::vector<std::string> order;
    if (options.order) {
        order = *options.order;
    } else if (!options.what.empty()) {
        order = options.what;
    } else {
        order = quoted(key);
    }

    const auto result = run(StatementBuilder::build_select(table, options, order));

    KeyedRows rows;
    if (result.rows.empty()) {
        return rows;
    }

    std::vector<size_t> key_index;
    key_index.reserve(key.size());
    for (const auto& column : key) {
        const auto it = std::find(result.column_names.begin(), result.column_names.end(), column);
        if (it == result.column_names.end()) {
            throw ValidationError(std::format("Missing keyname {} in row", column));
        }
        key_index.push_back(static_cast<size_t>(it - result.column_names.begin()));
    }
    std::vector<size_t> value_index;
    for (size_t col = 0; col < result.column_names.size(); ++col) {
        if (std::find(key_index.begin(), key_index.end(), col) == key_index.end()) {
            value_index.push_back(col);
        }
    }

    std::unordered_map<std::string, size_t> position;
    rows.reserve(result.rows.size());
    for (size_t i = 0; i < result.rows.size(); ++i) {
        Value row_key;
        if (key_index.size() == 1) {
            row_key = marshaller_.decode_field(result, i, key_index.front(), *attrs);
        } else {
            row_key = Value::array();
            for (const size_t col : key_index) {
                row_key.push_back(marshaller_.decode_field(result, i, col, *attrs));
            }
        }

        Value row_value;
        if (options.scalar) {
            if (!value_index.empty()) {
                row_value = marshaller_.decode_field(result, i, value_index.front(), *attrs);
            }
        } else {
            row_value = Value::object();
            for (const size_t col : value_index) {
                row_value[result.column_names[col]] =
                    marshaller_.decode_field(result, i, col, *attrs);
            }
        }

        const auto [it, inserted] = position.emplace(row_key.dump(), rows.size());
        if (inserted) {
            rows.emplace_back(std::move(row_key), std::move(row_value));
        } else {
            rows[it->second].second = std::move(row_value);
        }
    }
    return rows;
}

// ============================================================================
// Catalog listing
// ============================================================================

std::vector<std::string> Database::get_databases() {
    return first_column(run("SELECT datname FROM pg_database", {}));
}

std::vector<std::string> Database::get_relations(const std::string& kinds) {
    std::string where;
    if (!kinds.empty()) {
        std::vector<std::string> letters;
        for (const char kind : kinds) {
            if (!std::isalpha(static_cast<unsigned char>(kind))) {
                throw ValidationError(std::format("Invalid relation kind '{}'", kind));
            }
            letters.push_back(std::format("'{}'", kind));
        }
        where = std::format(" AND r.relkind IN ({})", utils::join(letters, ","));
    }

    const std::string sql = std::format(
        "SELECT quote_ident(s.nspname)||'.'||quote_ident(r.relname)"
        " FROM pg_class r"
        " JOIN pg_namespace s ON s.oid = r.relnamespace"
        " WHERE s.nspname NOT SIMILAR TO 'pg/_%|information/_schema' ESCAPE '/'{}"
        " ORDER BY s.nspname, r.relname", where);
    return first_column(run(sql, {}));
}

std::vector<std::string> Database::get_tables() {
    return get_relations("r");
}

// ============================================================================
// Run-time parameters
// ============================================================================

std::string Database::normalize_parameter(const std::string& name) {
    const std::string param = utils::to_lower(utils::trim(name));
    if (param.empty()) {
        throw ValidationError("Invalid parameter: empty name");
    }
    for (const char c : param) {
        const auto uc = static_cast<unsigned char>(c);
        if (!std::isalnum(uc) && c != '_' && c != '.') {
            throw ValidationError(std::format("Invalid parameter name '{}'", name));
        }
    }
    return param;
}

std::string Database::get_parameter(const std::string& name) {
    const std::string param = normalize_parameter(name);
    if (param == "all") {
        throw ValidationError("Use get_all_parameters() to fetch every setting");
    }
    const auto values = first_column(run("SHOW " + param, {}));
    return values.empty() ? std::string() : values.front();
}

std::vector<std::string> Database::get_parameter(const std::vector<std::string>& names) {
    if (names.empty()) {
        throw ValidationError("No parameter has been specified");
    }
    std::vector<std::string> params;
    params.reserve(names.size());
    for (const auto& name : names) {
        params.push_back(normalize_parameter(name));
        if (params.back() == "all") {
            throw ValidationError("Use get_all_parameters() to fetch every setting");
        }
    }

    std::vector<std::string> values;
    values.reserve(params.size());
    for (const auto& param : params) {
        const auto result = first_column(run("SHOW " + param, {}));
        values.push_back(result.empty() ? std::string() : result.front());
    }
    return values;
}

std::map<std::string, std::string> Database::get_all_parameters() {
    const auto result = run("SHOW ALL", {});
    std::map<std::string, std::string> settings;
    for (const auto& row : result.rows) {
        if (row.size() < 2 || !row[0]) {
            continue;
        }
        settings[*row[0]] = row[1].value_or("");
    }
    return settings;
}

void Database::set_parameter(const std::string& name, const std::optional<std::string>& value,
    bool local) {
    apply_parameters(ParameterList{{name, value}}, local);
}

void Database::set_parameter(const std::vector<std::string>& names,
    const std::optional<std::string>& value, bool local) {
    ParameterList params;
    params.reserve(names.size());
    for (const auto& name : names) {
        params.emplace_back(name, value);
    }
    apply_parameters(params, local);
}

void Database::set_parameter(const std::vector<std::string>& names,
    const std::vector<std::string>& values, bool local) {
    if (names.size() != values.size()) {
        throw ValidationError(std::format(
            "Differing number of parameters ({}) and values ({})", names.size(), values.size()));
    }
    ParameterList params;
    params.reserve(names.size());
    for (size_t i = 0; i < names.size(); ++i) {
        params.emplace_back(names[i], values[i]);
    }
    apply_parameters(params, local);
}

void Database::set_parameter(const std::map<std::string, std::optional<std::string>>& values,
    bool local) {
    apply_parameters(ParameterList(values.begin(), values.end()), local);
}

void Database::apply_parameters(const ParameterList& params, bool local) {
    if (params.empty()) {
        throw ValidationError("No parameter has been specified");
    }

    ParameterList normalized;
    normalized.reserve(params.size());
    for (const auto& [name, value] : params) {
        std::string param = normalize_parameter(name);
        if (param == "all") {
            if (value) {
                throw ValidationError("A value must not be specified when parameter is 'all'");
            }
            if (local) {
                throw ValidationError("Parameter 'all' cannot be reset locally");
            }
            normalized = {{"all", std::nullopt}};
            break;
        }
        normalized.emplace_back(std::move(param), value);
    }

    for (const auto& [param, value] : normalized) {
        std::string sql;
        if (value) {
            sql = std::format("SET{} {} TO {}", local ? " LOCAL" : "", param, *value);
        } else if (local) {
            sql = std::format("SET LOCAL {} TO DEFAULT", param);
        } else {
            sql = std::format("RESET {}", param);
        }
        run(sql, {});
    }
}

// ============================================================================
// Transactions
// ============================================================================

void Database::begin(const std::string& mode) {
    run(mode.empty() ? std::string("BEGIN") : "BEGIN " + mode, {});
}

void Database::commit() {
    run("COMMIT", {});
}

void Database::rollback(const std::string& savepoint) {
    run(savepoint.empty() ? std::string("ROLLBACK") : "ROLLBACK TO " + savepoint, {});
}

void Database::savepoint(const std::string& name) {
    if (name.empty()) {
        throw ValidationError("Savepoint name must not be empty");
    }
    run("SAVEPOINT " + name, {});
}

void Database::release(const std::string& name) {
    if (name.empty()) {
        throw ValidationError("Savepoint name must not be empty");
    }
    run("RELEASE " + name, {});
}

// ============================================================================
// Escaping and encoding
// ============================================================================

std::string Database::escape_identifier(std::string_view name) {
    return connection().escape_identifier(name);
}

std::string Database::escape_bytea(const std::vector<uint8_t>& data) {
    return connection().escape_bytea(data);
}

std::vector<uint8_t> Database::unescape_bytea(std::string_view text) {
    return connection().unescape_bytea(text);
}

std::string Database::encode_json(const Value& value) {
    return value.dump();
}

Value Database::decode_json(const std::string& text) {
    try {
        return Value::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        throw ValidationError(std::format("Invalid JSON: {}", e.what()));
    }
}

// ============================================================================
// Connection lifecycle
// ============================================================================

int Database::server_version() const {
    return connection().server_version();
}

void Database::close() {
    if (!conn_) {
        throw InvalidConnectionError("Connection already closed");
    }
    if (owned_) {
        owned_->close();
        owned_.reset();
    }
    conn_ = nullptr;
    utils::log::debug("Connection closed");
}

void Database::reset() {
    connection().reset();
}

void Database::reopen() {
    if (!closeable_) {
        return;
    }
    if (!factory_) {
        throw InvalidConnectionError("Cannot reopen a connection without connection parameters");
    }
    auto fresh = factory_->create(connection_string_);
    if (!fresh) {
        throw DatabaseError("Cannot reopen connection");
    }
    if (owned_) {
        owned_->close();
    }
    attach(std::move(fresh));
}

// ============================================================================
// Transaction
// ============================================================================

Transaction::Transaction(Database& db, const std::string& mode)
    : db_(db) {
    db_.begin(mode);
    active_ = true;
}

Transaction::~Transaction() {
    if (!active_) {
        return;
    }
    utils::log::warn("Transaction left without commit, rolling back");
    try {
        db_.rollback();
    } catch (const std::exception& e) {
        utils::log::error(std::format("Rollback failed: {}", e.what()));
    }
}

void Transaction::commit() {
    db_.commit();
    active_ = false;
}

void Transaction::rollback() {
    db_.rollback();
    active_ = false;
}

} // namespace pgcrud
