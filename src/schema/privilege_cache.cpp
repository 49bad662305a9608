#include "schema/privilege_cache.hpp"
#include "core/utils.hpp"
#include "db/sql_names.hpp"
#include <format>

namespace pgcrud {

PrivilegeCache::PrivilegeCache(MetadataCache::QueryFunc query)
    : query_(std::move(query)) {}

bool PrivilegeCache::has_table_privilege(const std::string& table, const std::string& privilege) {
    auto key = std::make_pair(table, utils::to_lower(privilege));

    const auto it = privileges_.find(key);
    if (it != privileges_.end()) {
        return it->second;
    }

    const std::string sql = std::format("SELECT has_table_privilege({}, $2)",
        db::qualified_param(table, 1));
    const auto result = query_(sql, ParamList{key.first, key.second});

    const bool granted = !result.rows.empty() && !result.rows.front().empty() &&
        result.rows.front().front() == std::optional<std::string>("t");

    privileges_.emplace(std::move(key), granted);
    return granted;
}

} // namespace pgcrud
