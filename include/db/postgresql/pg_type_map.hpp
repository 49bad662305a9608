#pragma once

#include "core/types.hpp"
#include <string_view>

namespace pgcrud {

/**
 * @brief PostgreSQL type classification utilities
 *
 * Maps catalog type names (pg_type.typname) to the SemanticType used
 * for parameter preparation and row decoding.
 */
class PgTypeMap {
public:
    /**
     * @brief Classify a raw pg_type.typname by ordered prefix rules
     *
     * bool -> BOOL; abstime/date/interval/timestamp -> DATE;
     * cid/oid/int/xid -> INT; float -> FLOAT; numeric -> NUM;
     * money -> MONEY; bytea -> BYTEA; json -> JSON; anything else -> TEXT.
     */
    [[nodiscard]] static SemanticType classify(std::string_view type_name);
};

} // namespace pgcrud
