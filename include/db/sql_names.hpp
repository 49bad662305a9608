#pragma once

#include "core/utils.hpp"
#include <format>
#include <string>
#include <string_view>

namespace pgcrud::db {

inline constexpr char kDot = '.';
inline constexpr char kDescendantHint = '*';

/**
 * @brief Drop a trailing "*" (include descendant tables) from a table name
 */
[[nodiscard]] inline std::string strip_descendant_hint(const std::string& table) {
    if (!table.empty() && table.back() == kDescendantHint) {
        return utils::rtrim(table.substr(0, table.size() - 1));
    }
    return table;
}

[[nodiscard]] inline bool has_descendant_hint(const std::string& table) {
    return !table.empty() && table.back() == kDescendantHint;
}

/**
 * @brief A name with a dot is treated as schema-qualified and quoted by the caller
 */
[[nodiscard]] inline bool is_qualified_name(std::string_view name) {
    return name.find(kDot) != std::string_view::npos;
}

/**
 * @brief Placeholder for a table name passed as a catalog query parameter
 *
 * Unqualified names are quoted server side with quote_ident() so that
 * the ::regclass cast resolves them exactly as given.
 */
[[nodiscard]] inline std::string qualified_param(std::string_view name, size_t index) {
    if (is_qualified_name(name)) {
        return std::format("${}", index);
    }
    return std::format("quote_ident(${})", index);
}

} // namespace pgcrud::db
