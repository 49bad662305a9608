#pragma once

#include "core/types.hpp"
#include "db/idb_connection.hpp"
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>

namespace pgcrud {

/**
 * @brief Lazily populated per-table attribute and primary key caches
 *
 * Both caches are keyed by the table name exactly as given by the caller.
 * Entries stay valid until flushed; a table without a primary key is
 * remembered as such and reported with NotFoundError on every lookup.
 *
 * Not thread-safe: owned by a single Database instance.
 */
class MetadataCache {
public:
    /**
     * @brief Callback executing a catalog query
     *
     * Must return a successful result or throw. Allows dependency
     * injection for testing.
     */
    using QueryFunc = std::function<DbResultSet(const std::string& sql, const ParamList& params)>;

    explicit MetadataCache(QueryFunc query);

    /**
     * @brief Ordered column name -> type map of a table
     * @param table Table name (qualified names must be quoted by the caller)
     * @param flush Drop the whole attribute cache before the lookup
     */
    [[nodiscard]] std::shared_ptr<const AttributeMap> attributes(
        const std::string& table, bool flush = false);

    /**
     * @brief Primary key columns of a table in index key order
     * @param flush Drop the whole primary key cache before the lookup
     * @throws NotFoundError if the table has no primary key
     */
    [[nodiscard]] KeyColumns primary_key(const std::string& table, bool flush = false);

    [[nodiscard]] bool use_regtypes() const { return use_regtypes_; }

    /**
     * @brief Switch between simple class names and full catalog type names
     *
     * Changing the mode invalidates the attribute cache.
     * @return The mode now in effect
     */
    bool set_use_regtypes(bool enabled);

    void flush_attributes();
    void flush_primary_keys();

    [[nodiscard]] size_t attribute_cache_size() const { return attributes_.size(); }
    [[nodiscard]] size_t primary_key_cache_size() const { return primary_keys_.size(); }

private:
    std::shared_ptr<const AttributeMap> load_attributes(const std::string& table) const;
    KeyColumns load_primary_key(const std::string& table) const;

    QueryFunc query_;
    bool use_regtypes_ = false;

    std::unordered_map<std::string, std::shared_ptr<const AttributeMap>> attributes_;
    // An empty key list records a table without primary key
    std::unordered_map<std::string, KeyColumns> primary_keys_;
};

} // namespace pgcrud
