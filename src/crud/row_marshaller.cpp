#include "crud/row_marshaller.hpp"
#include "core/utils.hpp"

namespace pgcrud {

RowMarshaller::RowMarshaller(BinaryUnescaper unescape_bytea)
    : unescape_bytea_(std::move(unescape_bytea)) {}

void RowMarshaller::merge_row(const DbResultSet& result, size_t row_index,
    const AttributeMap& attrs, const std::string& table, Record& record) const {
    if (row_index >= result.rows.size()) {
        return;
    }
    const auto& row = result.rows[row_index];
    const bool has_oids = attrs.has_oids();

    for (size_t col = 0; col < result.column_names.size() && col < row.size(); ++col) {
        const std::string& name = result.column_names[col];
        if (has_oids && name == "oid") {
            record[oid_key(table)] = decode(row[col], SemanticType::INT);
            continue;
        }
        record[name] = decode_field(result, row_index, col, attrs);
    }
}

Value RowMarshaller::decode_field(const DbResultSet& result, size_t row_index, size_t column,
    const AttributeMap& attrs) const {
    const auto& row = result.rows.at(row_index);
    if (column >= row.size() || column >= result.column_names.size()) {
        return nullptr;
    }
    const Attribute* attr = attrs.find(result.column_names[column]);
    return decode(row[column], attr ? attr->semantic : SemanticType::TEXT);
}

Record RowMarshaller::to_record(const DbResultSet& result, size_t row_index,
    const AttributeMap& attrs, const std::string& table) const {
    Record record;
    merge_row(result, row_index, attrs, table, record);
    return record;
}

Value RowMarshaller::decode(const std::optional<std::string>& raw, SemanticType type) const {
    if (!raw) {
        return nullptr;
    }
    const std::string& text = *raw;

    switch (type) {
        case SemanticType::BYTEA:
            return Value::binary(unescape_bytea_(text));
        case SemanticType::BOOL:
            if (text == "t") return true;
            if (text == "f") return false;
            return text;
        case SemanticType::INT:
            if (const auto v = utils::try_parse_int<int64_t>(text)) return *v;
            return text;
        case SemanticType::FLOAT:
            if (const auto v = utils::try_parse_double(text)) return *v;
            return text;
        case SemanticType::JSON: {
            auto parsed = Value::parse(text, nullptr, false);
            if (parsed.is_discarded()) return text;
            return parsed;
        }
        // Kept as text: exact decimals, currency and date/time literals
        case SemanticType::NUM:
        case SemanticType::MONEY:
        case SemanticType::DATE:
        case SemanticType::TEXT:
        default:
            return text;
    }
}

} // namespace pgcrud
