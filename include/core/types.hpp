#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace pgcrud {

// ============================================================================
// Values and Records
// ============================================================================

/**
 * @brief A single cell value
 *
 * null, boolean, integer, floating point, string, array/object (json columns)
 * and binary (bytea columns).
 */
using Value = nlohmann::json;

/**
 * @brief A logical row: column name -> value
 *
 * May also carry the synthetic "oid(<table>)" key.
 */
using Record = std::unordered_map<std::string, Value>;

/**
 * @brief A positional statement parameter in text format (nullopt = SQL NULL)
 */
using Param = std::optional<std::string>;
using ParamList = std::vector<Param>;

/**
 * @brief Ordered key column names
 */
using KeyColumns = std::vector<std::string>;

/**
 * @brief Classic truthiness: null, false, 0, "", empty containers are falsy
 */
[[nodiscard]] inline bool is_truthy(const Value& value) {
    switch (value.type()) {
        case Value::value_t::null: return false;
        case Value::value_t::boolean: return value.get<bool>();
        case Value::value_t::number_integer: return value.get<int64_t>() != 0;
        case Value::value_t::number_unsigned: return value.get<uint64_t>() != 0;
        case Value::value_t::number_float: return value.get<double>() != 0.0;
        case Value::value_t::string: return !value.get_ref<const std::string&>().empty();
        case Value::value_t::array:
        case Value::value_t::object: return !value.empty();
        case Value::value_t::binary: return !value.get_binary().empty();
        default: return false;
    }
}

/**
 * @brief Key under which a row's OID is stored in a Record
 */
[[nodiscard]] inline std::string oid_key(const std::string& table) {
    return "oid(" + table + ")";
}

// ============================================================================
// Semantic Types
// ============================================================================

enum class SemanticType : uint8_t {
    BOOL,
    DATE,
    INT,
    FLOAT,
    NUM,
    MONEY,
    BYTEA,
    JSON,
    TEXT
};

[[nodiscard]] inline const char* semantic_type_to_string(SemanticType type) {
    switch (type) {
        case SemanticType::BOOL: return "bool";
        case SemanticType::DATE: return "date";
        case SemanticType::INT: return "int";
        case SemanticType::FLOAT: return "float";
        case SemanticType::NUM: return "num";
        case SemanticType::MONEY: return "money";
        case SemanticType::BYTEA: return "bytea";
        case SemanticType::JSON: return "json";
        case SemanticType::TEXT: return "text";
        default: return "text";
    }
}

[[nodiscard]] inline bool is_numeric(SemanticType type) {
    return type == SemanticType::INT || type == SemanticType::FLOAT ||
           type == SemanticType::NUM || type == SemanticType::MONEY;
}

// ============================================================================
// Table Metadata
// ============================================================================

struct Attribute {
    std::string name;
    std::string type;           // simple class name, or regtype name in full-name mode
    SemanticType semantic = SemanticType::TEXT;

    Attribute() = default;
    Attribute(std::string n, std::string t, SemanticType s)
        : name(std::move(n)), type(std::move(t)), semantic(s) {}
};

/**
 * @brief Ordered column name -> type map of one table (attnum order)
 */
class AttributeMap {
public:
    void add(Attribute attr) {
        column_index_[attr.name] = columns_.size();
        columns_.push_back(std::move(attr));
    }

    [[nodiscard]] const Attribute* find(const std::string& name) const {
        auto it = column_index_.find(name);
        if (it != column_index_.end() && it->second < columns_.size()) {
            return &columns_[it->second];
        }
        return nullptr;
    }

    [[nodiscard]] bool contains(const std::string& name) const {
        return column_index_.contains(name);
    }

    // True when the table exposes the system "oid" column
    [[nodiscard]] bool has_oids() const { return contains("oid"); }

    [[nodiscard]] size_t size() const { return columns_.size(); }
    [[nodiscard]] bool empty() const { return columns_.empty(); }

    [[nodiscard]] std::vector<Attribute>::const_iterator begin() const { return columns_.begin(); }
    [[nodiscard]] std::vector<Attribute>::const_iterator end() const { return columns_.end(); }

private:
    std::vector<Attribute> columns_;
    std::unordered_map<std::string, size_t> column_index_;
};

} // namespace pgcrud
