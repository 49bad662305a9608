#include "crud/statement_builder.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include "db/sql_names.hpp"
#include <format>
#include <unordered_set>

namespace pgcrud {

StatementBuilder::StatementBuilder(IDbConnection& conn)
    : conn_(conn) {}

std::string StatementBuilder::escape_qualified_name(const std::string& name) const {
    // "a.b" may be a schema-qualified name or a name with a dot in it;
    // only the caller knows, so it must come quoted already
    if (db::is_qualified_name(name)) {
        return name;
    }
    return conn_.escape_identifier(name);
}

ParamPreparer StatementBuilder::make_preparer() const {
    return ParamPreparer([this](const std::vector<uint8_t>& data) {
        return conn_.escape_bytea(data);
    });
}

const char* StatementBuilder::returning(const AttributeMap& attrs) {
    return attrs.has_oids() ? "oid, *" : "*";
}

std::string StatementBuilder::where_clause(const std::string& table, const AttributeMap& attrs,
    const KeyColumns& key, const Record& row, ParamPreparer& preparer) const {
    if (key.empty()) {
        throw ValidationError(std::format("No key columns given for table {}", table));
    }

    std::vector<std::string> conditions;
    conditions.reserve(key.size());
    for (const auto& column : key) {
        const Attribute* attr = attrs.find(column);
        if (!attr) {
            throw ValidationError(std::format("Column {} does not exist in table {}", column, table));
        }
        const auto value = row.find(column);
        if (value == row.end()) {
            throw ValidationError(std::format("Missing value in row for key column {}", column));
        }
        conditions.push_back(std::format("{} = {}",
            conn_.escape_identifier(column), preparer.prepare(value->second, attr->semantic)));
    }
    return utils::join(conditions, " AND ");
}

// ============================================================================
// GET / INSERT / UPDATE / DELETE
// ============================================================================

Statement StatementBuilder::build_get(const std::string& table, const AttributeMap& attrs,
    const KeyColumns& key, const Record& row) const {
    auto preparer = make_preparer();
    std::string where = where_clause(table, attrs, key, row, preparer);

    std::string sql = std::format("SELECT {} FROM {} WHERE {} LIMIT 1",
        returning(attrs), escape_qualified_name(table), where);
    return Statement(std::move(sql), preparer.take(), std::move(where));
}

Statement StatementBuilder::build_insert(const std::string& table, const AttributeMap& attrs,
    const Record& row) const {
    auto preparer = make_preparer();
    std::vector<std::string> names;
    std::vector<std::string> values;

    for (const auto& attr : attrs) {
        if (attr.name == "oid") {
            continue;
        }
        const auto value = row.find(attr.name);
        if (value == row.end()) {
            continue;
        }
        names.push_back(conn_.escape_identifier(attr.name));
        values.push_back(preparer.prepare(value->second, attr.semantic));
    }

    std::string sql;
    if (names.empty()) {
        sql = std::format("INSERT INTO {} DEFAULT VALUES RETURNING {}",
            escape_qualified_name(table), returning(attrs));
    } else {
        sql = std::format("INSERT INTO {} ({}) VALUES ({}) RETURNING {}",
            escape_qualified_name(table), utils::join(names, ", "),
            utils::join(values, ", "), returning(attrs));
    }
    return Statement(std::move(sql), preparer.take());
}

std::optional<Statement> StatementBuilder::build_update(const std::string& table,
    const AttributeMap& attrs, const KeyColumns& key, const Record& row) const {
    auto preparer = make_preparer();
    std::string where = where_clause(table, attrs, key, row, preparer);

    const std::unordered_set<std::string> key_set(key.begin(), key.end());
    std::vector<std::string> assignments;
    for (const auto& attr : attrs) {
        if (attr.name == "oid" || key_set.contains(attr.name)) {
            continue;
        }
        const auto value = row.find(attr.name);
        if (value == row.end()) {
            continue;
        }
        assignments.push_back(std::format("{} = {}",
            conn_.escape_identifier(attr.name), preparer.prepare(value->second, attr.semantic)));
    }

    if (assignments.empty()) {
        return std::nullopt;
    }

    std::string sql = std::format("UPDATE {} SET {} WHERE {} RETURNING {}",
        escape_qualified_name(table), utils::join(assignments, ", "), where, returning(attrs));
    return Statement(std::move(sql), preparer.take(), std::move(where));
}

Statement StatementBuilder::build_delete(const std::string& table, const AttributeMap& attrs,
    const KeyColumns& key, const Record& row) const {
    auto preparer = make_preparer();
    std::string where = where_clause(table, attrs, key, row, preparer);

    std::string sql = std::format("DELETE FROM {} WHERE {}", escape_qualified_name(table), where);
    return Statement(std::move(sql), preparer.take(), std::move(where));
}

// ============================================================================
// UPSERT
// ============================================================================

std::optional<Statement> StatementBuilder::build_upsert(const std::string& table,
    const AttributeMap& attrs, const KeyColumns& key, const Record& row,
    const Record& overrides) const {
    auto preparer = make_preparer();
    std::vector<std::string> names;
    std::vector<std::string> values;

    for (const auto& attr : attrs) {
        if (attr.name == "oid") {
            continue;
        }
        const auto value = row.find(attr.name);
        if (value == row.end()) {
            continue;
        }
        names.push_back(conn_.escape_identifier(attr.name));
        values.push_back(preparer.prepare(value->second, attr.semantic));
    }

    if (names.empty()) {
        return std::nullopt;
    }

    std::vector<std::string> target;
    target.reserve(key.size());
    for (const auto& column : key) {
        target.push_back(conn_.escape_identifier(column));
    }

    std::unordered_set<std::string> skip(key.begin(), key.end());
    skip.insert("oid");

    std::vector<std::string> updates;
    for (const auto& attr : attrs) {
        if (skip.contains(attr.name)) {
            continue;
        }
        const auto override_it = overrides.find(attr.name);
        const Value action = override_it != overrides.end()
            ? override_it->second
            : Value(row.contains(attr.name));
        if (!is_truthy(action)) {
            continue;
        }
        const std::string column = conn_.escape_identifier(attr.name);
        if (action.is_string()) {
            updates.push_back(std::format("{} = {}", column, action.get<std::string>()));
        } else {
            updates.push_back(std::format("{} = excluded.{}", column, column));
        }
    }

    const std::string action = updates.empty()
        ? std::string("NOTHING")
        : "UPDATE SET " + utils::join(updates, ", ");

    std::string sql = std::format(
        "INSERT INTO {} AS included ({}) VALUES ({}) ON CONFLICT ({}) DO {} RETURNING {}",
        escape_qualified_name(table), utils::join(names, ", "), utils::join(values, ", "),
        utils::join(target, ", "), action, returning(attrs));
    return Statement(std::move(sql), preparer.take());
}

// ============================================================================
// SELECT (table listings)
// ============================================================================

Statement StatementBuilder::build_select(const std::string& source,
    const SelectOptions& options, const std::vector<std::string>& order) {
    if (utils::trim(source).empty()) {
        throw ValidationError("The table name is missing");
    }

    std::string sql = std::format("SELECT {} FROM {}",
        options.what.empty() ? std::string("*") : utils::join(options.what, ", "), source);
    if (!options.where.empty()) {
        sql += " WHERE " + utils::join(options.where, " AND ");
    }
    if (!order.empty()) {
        sql += " ORDER BY " + utils::join(order, ", ");
    }
    if (options.limit) {
        sql += std::format(" LIMIT {}", options.limit);
    }
    if (options.offset) {
        sql += std::format(" OFFSET {}", options.offset);
    }
    return Statement(std::move(sql), ParamList{});
}

// ============================================================================
// TRUNCATE
// ============================================================================

Statement StatementBuilder::build_truncate(const std::vector<std::string>& tables,
    const std::vector<bool>& only, bool restart, bool cascade) const {
    if (tables.empty()) {
        throw ValidationError("No table has been specified");
    }
    if (only.size() > 1 && only.size() != tables.size()) {
        throw ValidationError(std::format(
            "Differing number of tables ({}) and only options ({})", tables.size(), only.size()));
    }

    std::vector<std::string> targets;
    targets.reserve(tables.size());
    for (size_t i = 0; i < tables.size(); ++i) {
        const bool only_this = only.empty() ? false : (only.size() == 1 ? only[0] : only[i]);
        std::string name = tables[i];
        if (db::has_descendant_hint(name)) {
            if (only_this) {
                throw ValidationError(std::format(
                    "Contradictory table name and only options for {}", name));
            }
            name = db::strip_descendant_hint(name);
        }
        if (name.empty()) {
            throw ValidationError("Empty table name");
        }
        name = escape_qualified_name(name);
        targets.push_back(only_this ? "ONLY " + name : name);
    }

    std::string sql = "TRUNCATE " + utils::join(targets, ", ");
    if (restart) {
        sql += " RESTART IDENTITY";
    }
    if (cascade) {
        sql += " CASCADE";
    }
    return Statement(std::move(sql), ParamList{});
}

} // namespace pgcrud
