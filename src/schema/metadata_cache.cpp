#include "schema/metadata_cache.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include "db/postgresql/pg_type_map.hpp"
#include "db/sql_names.hpp"
#include <algorithm>
#include <format>
#include <utility>

namespace pgcrud {

MetadataCache::MetadataCache(QueryFunc query)
    : query_(std::move(query)) {}

// ============================================================================
// Attribute Cache
// ============================================================================

std::shared_ptr<const AttributeMap> MetadataCache::attributes(
    const std::string& table, bool flush) {
    if (flush) {
        flush_attributes();
    }

    const auto it = attributes_.find(table);
    if (it != attributes_.end()) {
        return it->second;
    }

    auto loaded = load_attributes(table);
    attributes_.emplace(table, loaded);
    return loaded;
}

std::shared_ptr<const AttributeMap> MetadataCache::load_attributes(const std::string& table) const {
    // Column indices in the result set (matching the SELECT order)
    static constexpr size_t COL_NAME    = 0;
    static constexpr size_t COL_TYPNAME = 1;
    static constexpr size_t COL_REGTYPE = 2;

    const std::string sql = std::format(
        "SELECT a.attname, t.typname{} "
        "FROM pg_attribute a "
        "JOIN pg_type t ON t.oid = a.atttypid "
        "WHERE a.attrelid = {}::regclass "
        "AND (a.attnum > 0 OR a.attname = 'oid') "
        "AND NOT a.attisdropped "
        "ORDER BY a.attnum",
        use_regtypes_ ? ", a.atttypid::regtype" : "",
        db::qualified_param(table, 1));

    const auto result = query_(sql, ParamList{table});

    auto attrs = std::make_shared<AttributeMap>();
    for (const auto& row : result.rows) {
        if (row.size() <= COL_TYPNAME || !row[COL_NAME] || !row[COL_TYPNAME]) {
            continue;
        }
        const SemanticType semantic = PgTypeMap::classify(*row[COL_TYPNAME]);
        std::string type_name;
        if (use_regtypes_ && row.size() > COL_REGTYPE && row[COL_REGTYPE]) {
            type_name = *row[COL_REGTYPE];
        } else {
            type_name = semantic_type_to_string(semantic);
        }
        attrs->add(Attribute(*row[COL_NAME], std::move(type_name), semantic));
    }
    return attrs;
}

bool MetadataCache::set_use_regtypes(bool enabled) {
    if (enabled != use_regtypes_) {
        use_regtypes_ = enabled;
        flush_attributes();
    }
    return use_regtypes_;
}

void MetadataCache::flush_attributes() {
    if (attributes_.empty()) {
        return;
    }
    attributes_.clear();
    utils::log::debug("The attnames cache has been flushed");
}

// ============================================================================
// Primary Key Cache
// ============================================================================

KeyColumns MetadataCache::primary_key(const std::string& table, bool flush) {
    if (flush) {
        flush_primary_keys();
    }

    auto it = primary_keys_.find(table);
    if (it == primary_keys_.end()) {
        it = primary_keys_.emplace(table, load_primary_key(table)).first;
    }

    if (it->second.empty()) {
        throw NotFoundError(std::format("Table {} has no primary key", table));
    }
    return it->second;
}

KeyColumns MetadataCache::load_primary_key(const std::string& table) const {
    static constexpr size_t COL_NAME   = 0;
    static constexpr size_t COL_ATTNUM = 1;
    static constexpr size_t COL_INDKEY = 2;

    const std::string sql = std::format(
        "SELECT a.attname, a.attnum, i.indkey "
        "FROM pg_index i "
        "JOIN pg_attribute a ON a.attrelid = i.indrelid "
        "AND a.attnum = ANY(i.indkey) "
        "AND NOT a.attisdropped "
        "WHERE i.indrelid = {}::regclass "
        "AND i.indisprimary "
        "ORDER BY a.attnum",
        db::qualified_param(table, 1));

    const auto result = query_(sql, ParamList{table});

    struct KeyPart {
        std::string name;
        int attnum;
    };
    std::vector<KeyPart> parts;
    parts.reserve(result.rows.size());
    for (const auto& row : result.rows) {
        if (row.size() <= COL_INDKEY || !row[COL_NAME] || !row[COL_ATTNUM]) {
            continue;
        }
        parts.push_back({*row[COL_NAME],
            utils::try_parse_int<int>(*row[COL_ATTNUM]).value_or(0)});
    }

    // Use the column order of the primary key index, not the table order
    if (parts.size() > 1 && result.rows.front()[COL_INDKEY]) {
        std::vector<int> indkey;
        for (const auto& token : utils::split(*result.rows.front()[COL_INDKEY], ' ')) {
            indkey.push_back(utils::try_parse_int<int>(token).value_or(0));
        }
        const auto position = [&indkey](int attnum) {
            return std::find(indkey.begin(), indkey.end(), attnum) - indkey.begin();
        };
        std::stable_sort(parts.begin(), parts.end(),
            [&position](const KeyPart& a, const KeyPart& b) {
                return position(a.attnum) < position(b.attnum);
            });
    }

    KeyColumns columns;
    columns.reserve(parts.size());
    for (auto& part : parts) {
        columns.push_back(std::move(part.name));
    }
    return columns;
}

void MetadataCache::flush_primary_keys() {
    if (primary_keys_.empty()) {
        return;
    }
    primary_keys_.clear();
    utils::log::debug("The pkey cache has been flushed");
}

} // namespace pgcrud
