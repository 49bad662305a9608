#include "db/postgresql/pg_type_map.hpp"
#include <array>

namespace pgcrud {

namespace {

struct PrefixRule {
    std::string_view prefix;
    SemanticType type;
};

// Order matters: the first matching prefix wins
constexpr std::array<PrefixRule, 14> kPrefixRules = {{
    {"bool", SemanticType::BOOL},
    {"abstime", SemanticType::DATE},
    {"date", SemanticType::DATE},
    {"interval", SemanticType::DATE},
    {"timestamp", SemanticType::DATE},
    {"cid", SemanticType::INT},
    {"oid", SemanticType::INT},
    {"int", SemanticType::INT},
    {"xid", SemanticType::INT},
    {"float", SemanticType::FLOAT},
    {"numeric", SemanticType::NUM},
    {"money", SemanticType::MONEY},
    {"bytea", SemanticType::BYTEA},
    {"json", SemanticType::JSON},
}};

} // anonymous namespace

SemanticType PgTypeMap::classify(std::string_view type_name) {
    for (const auto& rule : kPrefixRules) {
        if (type_name.starts_with(rule.prefix)) {
            return rule.type;
        }
    }
    return SemanticType::TEXT;
}

} // namespace pgcrud
