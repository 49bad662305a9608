#pragma once

#include "core/utils.hpp"
#include "db/iconnection_factory.hpp"
#include "db/idb_connection.hpp"

#include <memory>
#include <string>
#include <vector>

namespace pgcrud::testing {

/**
 * @brief Scripted connection for testing statement generation without a server
 *
 * Responses are chosen by SQL substring; when several rules match, the most
 * recently added one wins. Statements without a matching rule succeed as
 * empty commands. Every executed statement is recorded.
 */
class MockConnection : public IDbConnection {
public:
    struct Executed {
        std::string sql;
        ParamList params;
    };

    using Row = std::vector<std::optional<std::string>>;

    // ---- Canned results ----------------------------------------------------

    static DbResultSet rows(std::vector<std::string> columns, std::vector<Row> data) {
        DbResultSet result;
        result.success = true;
        result.column_names = std::move(columns);
        result.rows = std::move(data);
        result.affected_rows = result.rows.size();
        return result;
    }

    static DbResultSet command(uint64_t affected = 0) {
        DbResultSet result;
        result.success = true;
        result.affected_rows = affected;
        return result;
    }

    static DbResultSet error(std::string message, std::string sqlstate = "42601") {
        DbResultSet result;
        result.success = false;
        result.error_message = std::move(message);
        result.sqlstate = std::move(sqlstate);
        return result;
    }

    // ---- Scripting ---------------------------------------------------------

    void on(std::string sql_fragment, DbResultSet result) {
        rules_.push_back({std::move(sql_fragment), std::move(result)});
    }

    /**
     * @brief Script the catalog answers for one table
     * @param attributes (name, type) pairs in column order
     * @param primary_key (name, attnum) pairs, empty for no primary key
     * @param indkey pg_index.indkey text, e.g. "2 1"
     */
    void add_table(const std::string& table,
                   const std::vector<std::pair<std::string, std::string>>& attributes,
                   const std::vector<std::pair<std::string, int>>& primary_key = {},
                   const std::string& indkey = {}) {
        std::vector<Row> attr_rows;
        for (const auto& [name, type] : attributes) {
            attr_rows.push_back({name, type});
        }
        tables_.push_back({table, rows({"attname", "typname"}, std::move(attr_rows))});

        std::vector<Row> key_rows;
        for (const auto& [name, attnum] : primary_key) {
            key_rows.push_back({name, std::to_string(attnum), indkey});
        }
        primary_keys_.push_back({table, rows({"attname", "attnum", "indkey"}, std::move(key_rows))});
    }

    void set_server_version(int version) { server_version_ = version; }
    void set_connected(bool connected) { connected_ = connected; }

    // ---- Inspection --------------------------------------------------------

    [[nodiscard]] const std::vector<Executed>& executed() const { return executed_; }
    [[nodiscard]] const Executed& last() const { return executed_.back(); }
    void clear_executed() { executed_.clear(); }

    [[nodiscard]] size_t count_containing(const std::string& fragment) const {
        size_t n = 0;
        for (const auto& e : executed_) {
            if (e.sql.find(fragment) != std::string::npos) ++n;
        }
        return n;
    }

    [[nodiscard]] int reset_count() const { return reset_count_; }
    [[nodiscard]] bool closed() const { return closed_; }

    // ---- IDbConnection -----------------------------------------------------

    [[nodiscard]] DbResultSet execute(const std::string& sql, const ParamList& params) override {
        executed_.push_back({sql, params});

        for (auto it = rules_.rbegin(); it != rules_.rend(); ++it) {
            if (sql.find(it->fragment) != std::string::npos) {
                return it->result;
            }
        }

        // Catalog lookups are answered per table (first parameter)
        if (!params.empty() && params[0]) {
            if (sql.find("FROM pg_attribute") != std::string::npos) {
                if (const auto* r = find_table(tables_, *params[0])) return *r;
                return rows({"attname", "typname"}, {});
            }
            if (sql.find("FROM pg_index") != std::string::npos) {
                if (const auto* r = find_table(primary_keys_, *params[0])) return *r;
                return rows({"attname", "attnum", "indkey"}, {});
            }
        }

        return command();
    }

    [[nodiscard]] std::string escape_identifier(std::string_view name) override {
        std::string quoted = "\"";
        for (const char c : name) {
            if (c == '"') quoted += '"';
            quoted += c;
        }
        quoted += '"';
        return quoted;
    }

    [[nodiscard]] std::string escape_bytea(const std::vector<uint8_t>& data) override {
        return "\\x" + utils::bytes_to_hex(data);
    }

    [[nodiscard]] std::vector<uint8_t> unescape_bytea(std::string_view text) override {
        if (text.starts_with("\\x")) {
            return utils::hex_to_bytes(text.substr(2));
        }
        return {text.begin(), text.end()};
    }

    [[nodiscard]] int server_version() const override { return server_version_; }
    [[nodiscard]] int socket() const override { return connected_ ? 3 : -1; }
    [[nodiscard]] bool is_connected() const override { return connected_ && !closed_; }

    void reset() override { ++reset_count_; }
    void close() override { closed_ = true; }

private:
    struct Rule {
        std::string fragment;
        DbResultSet result;
    };

    struct TableEntry {
        std::string table;
        DbResultSet result;
    };

    static const DbResultSet* find_table(const std::vector<TableEntry>& entries,
                                         const std::string& table) {
        for (auto it = entries.rbegin(); it != entries.rend(); ++it) {
            if (it->table == table) return &it->result;
        }
        return nullptr;
    }

    std::vector<Rule> rules_;
    std::vector<TableEntry> tables_;
    std::vector<TableEntry> primary_keys_;
    std::vector<Executed> executed_;
    int server_version_ = 160000;
    int reset_count_ = 0;
    bool connected_ = true;
    bool closed_ = false;
};

/**
 * @brief Factory handing out MockConnections; keeps raw pointers for inspection
 */
class MockConnectionFactory : public IConnectionFactory {
public:
    [[nodiscard]] std::unique_ptr<IDbConnection> create(const std::string& connection_string) override {
        connection_strings.push_back(connection_string);
        if (fail) {
            return nullptr;
        }
        auto conn = std::make_unique<MockConnection>();
        created.push_back(conn.get());
        return conn;
    }

    bool fail = false;
    std::vector<std::string> connection_strings;
    std::vector<MockConnection*> created;
};

} // namespace pgcrud::testing
