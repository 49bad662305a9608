#pragma once

#include "schema/metadata_cache.hpp"
#include <map>
#include <string>
#include <utility>

namespace pgcrud {

/**
 * @brief Cache of has_table_privilege() answers keyed by (table, privilege)
 *
 * Privileges are assumed stable for the lifetime of the owner; there is
 * no invalidation. Use a fresh Database if grants change.
 */
class PrivilegeCache {
public:
    explicit PrivilegeCache(MetadataCache::QueryFunc query);

    /**
     * @brief Check whether the current user holds a privilege on a table
     * @param privilege Privilege name, case-insensitive (e.g. "select")
     */
    [[nodiscard]] bool has_table_privilege(const std::string& table,
        const std::string& privilege = "select");

    [[nodiscard]] size_t size() const { return privileges_.size(); }

private:
    MetadataCache::QueryFunc query_;
    std::map<std::pair<std::string, std::string>, bool> privileges_;
};

} // namespace pgcrud
