#pragma once

#include "core/types.hpp"
#include "crud/param_preparer.hpp"
#include "db/idb_connection.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace pgcrud {

/**
 * @brief SQL text together with its positional parameters
 *
 * Built in one go by StatementBuilder and never modified afterwards, so
 * the $N placeholders always line up with params().
 */
class Statement {
public:
    Statement(std::string sql, ParamList params, std::string condition = {})
        : sql_(std::move(sql)), params_(std::move(params)), condition_(std::move(condition)) {}

    [[nodiscard]] const std::string& sql() const { return sql_; }
    [[nodiscard]] const ParamList& params() const { return params_; }

    // WHERE clause of key based statements, for diagnostics
    [[nodiscard]] const std::string& condition() const { return condition_; }

private:
    std::string sql_;
    ParamList params_;
    std::string condition_;
};

/**
 * @brief Row selection for Database::get_as_list() and get_as_dict()
 *
 * All parts are SQL fragments inserted verbatim.
 */
struct SelectOptions {
    std::vector<std::string> what;                  // empty = *
    std::vector<std::string> where;                 // joined with AND
    std::optional<std::vector<std::string>> order;  // nullopt = default order, empty = unordered
    uint64_t limit = 0;                             // 0 = no limit
    uint64_t offset = 0;
    bool scalar = false;                            // keep only the first (non-key) column
};

/**
 * @brief Synthesizes CRUD statements from cached table metadata
 *
 * Table names must already be stripped of a trailing "*" (except for
 * truncate, which interprets it). Names containing a dot are taken as
 * qualified and inserted verbatim; all other names and all column names
 * are escaped as identifiers.
 */
class StatementBuilder {
public:
    explicit StatementBuilder(IDbConnection& conn);

    [[nodiscard]] std::string escape_qualified_name(const std::string& name) const;

    /**
     * @brief SELECT [oid, ]* FROM t WHERE <key> LIMIT 1
     * @throws ValidationError if a key column is unknown or has no value in row
     */
    [[nodiscard]] Statement build_get(const std::string& table, const AttributeMap& attrs,
        const KeyColumns& key, const Record& row) const;

    /**
     * @brief INSERT INTO t (<cols>) VALUES (<vals>) RETURNING [oid, ]*
     *
     * Uses DEFAULT VALUES when the row has no column of the table.
     */
    [[nodiscard]] Statement build_insert(const std::string& table, const AttributeMap& attrs,
        const Record& row) const;

    /**
     * @brief UPDATE t SET <non-key cols> WHERE <key> RETURNING [oid, ]*
     * @return nullopt when there is nothing to set
     */
    [[nodiscard]] std::optional<Statement> build_update(const std::string& table,
        const AttributeMap& attrs, const KeyColumns& key, const Record& row) const;

    /**
     * @brief INSERT ... ON CONFLICT (<key>) DO NOTHING | DO UPDATE SET ...
     *
     * For each non-key column the override decides the conflict action:
     * falsy = leave unchanged, string = update expression used verbatim,
     * other truthy values = take the proposed (excluded) value. Without an
     * override, columns present in the row are updated.
     *
     * @return nullopt when the row has no column of the table
     */
    [[nodiscard]] std::optional<Statement> build_upsert(const std::string& table,
        const AttributeMap& attrs, const KeyColumns& key, const Record& row,
        const Record& overrides) const;

    /**
     * @brief DELETE FROM t WHERE <key>
     */
    [[nodiscard]] Statement build_delete(const std::string& table, const AttributeMap& attrs,
        const KeyColumns& key, const Record& row) const;

    /**
     * @brief TRUNCATE [ONLY] t1, ... [RESTART IDENTITY] [CASCADE]
     * @param only Empty (no ONLY), one flag for all tables, or one flag per table
     * @throws ValidationError on empty table list, mismatched flags, or a
     *         "name*" table combined with ONLY
     */
    [[nodiscard]] Statement build_truncate(const std::vector<std::string>& tables,
        const std::vector<bool>& only, bool restart, bool cascade) const;

    /**
     * @brief SELECT <what> FROM <source> [WHERE ...] [ORDER BY ...] [LIMIT n] [OFFSET n]
     *
     * The source is used as given, so it may be any row returning expression.
     * @param order Resolved ORDER BY list (empty = no ORDER BY)
     */
    [[nodiscard]] static Statement build_select(const std::string& source,
        const SelectOptions& options, const std::vector<std::string>& order);

private:
    [[nodiscard]] ParamPreparer make_preparer() const;

    [[nodiscard]] std::string where_clause(const std::string& table, const AttributeMap& attrs,
        const KeyColumns& key, const Record& row, ParamPreparer& preparer) const;

    [[nodiscard]] static const char* returning(const AttributeMap& attrs);

    IDbConnection& conn_;
};

} // namespace pgcrud
