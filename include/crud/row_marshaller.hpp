#pragma once

#include "core/types.hpp"
#include "db/idb_connection.hpp"
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pgcrud {

/**
 * @brief Converts result rows into Records
 *
 * Values are decoded according to the semantic type of their column;
 * the raw "oid" column is renamed to "oid(<table>)".
 */
class RowMarshaller {
public:
    using BinaryUnescaper = std::function<std::vector<uint8_t>(std::string_view)>;

    explicit RowMarshaller(BinaryUnescaper unescape_bytea);

    /**
     * @brief Merge one result row into a record, overwriting existing keys
     * @param result Result set holding the row
     * @param row_index Row to merge
     * @param attrs Attribute map of the table the row comes from
     * @param table Table name used for the OID key
     */
    void merge_row(const DbResultSet& result, size_t row_index,
        const AttributeMap& attrs, const std::string& table, Record& record) const;

    /**
     * @brief Build a fresh record from one result row
     */
    [[nodiscard]] Record to_record(const DbResultSet& result, size_t row_index,
        const AttributeMap& attrs, const std::string& table) const;

    /**
     * @brief Decode one cell by the type of its column (text for unknown columns)
     */
    [[nodiscard]] Value decode_field(const DbResultSet& result, size_t row_index, size_t column,
        const AttributeMap& attrs) const;

    /**
     * @brief Decode one text cell (nullopt = NULL)
     */
    [[nodiscard]] Value decode(const std::optional<std::string>& raw, SemanticType type) const;

private:
    BinaryUnescaper unescape_bytea_;
};

} // namespace pgcrud
