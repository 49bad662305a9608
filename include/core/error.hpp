#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace pgcrud {

/**
 * @brief Error categories surfaced by the database facade
 */
enum class ErrorCategory {
    NONE,
    NOT_FOUND,
    VALIDATION_ERROR,
    DATABASE_ERROR,
    UNSUPPORTED,
    INVALID_CONNECTION
};

[[nodiscard]] inline const char* error_category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE: return "NONE";
        case ErrorCategory::NOT_FOUND: return "NOT_FOUND";
        case ErrorCategory::VALIDATION_ERROR: return "VALIDATION_ERROR";
        case ErrorCategory::DATABASE_ERROR: return "DATABASE_ERROR";
        case ErrorCategory::UNSUPPORTED: return "UNSUPPORTED";
        case ErrorCategory::INVALID_CONNECTION: return "INVALID_CONNECTION";
        default: return "NONE";
    }
}

/**
 * @brief Base class of every failure raised by pgcrud
 */
class Error : public std::runtime_error {
public:
    Error(ErrorCategory category, const std::string& message)
        : std::runtime_error(message), category_(category) {}

    [[nodiscard]] ErrorCategory category() const noexcept { return category_; }

private:
    ErrorCategory category_;
};

/**
 * @brief Missing primary key or no row matching the given key
 */
class NotFoundError : public Error {
public:
    explicit NotFoundError(const std::string& message)
        : Error(ErrorCategory::NOT_FOUND, message) {}
};

/**
 * @brief Malformed arguments, raised before any statement is sent
 */
class ValidationError : public Error {
public:
    explicit ValidationError(const std::string& message)
        : Error(ErrorCategory::VALIDATION_ERROR, message) {}
};

/**
 * @brief Statement rejected by the server
 *
 * Carries the SQLSTATE reported by the server (empty when unavailable).
 */
class DatabaseError : public Error {
public:
    explicit DatabaseError(const std::string& message, std::string sqlstate = {})
        : Error(ErrorCategory::DATABASE_ERROR, message), sqlstate_(std::move(sqlstate)) {}

    [[nodiscard]] const std::string& sqlstate() const noexcept { return sqlstate_; }

protected:
    DatabaseError(ErrorCategory category, const std::string& message, std::string sqlstate)
        : Error(category, message), sqlstate_(std::move(sqlstate)) {}

private:
    std::string sqlstate_;
};

/**
 * @brief Feature not available on the connected server version
 */
class UnsupportedError : public DatabaseError {
public:
    explicit UnsupportedError(const std::string& message, std::string sqlstate = {})
        : DatabaseError(ErrorCategory::UNSUPPORTED, message, std::move(sqlstate)) {}
};

/**
 * @brief Operation on a closed or never-opened connection
 */
class InvalidConnectionError : public Error {
public:
    explicit InvalidConnectionError(const std::string& message)
        : Error(ErrorCategory::INVALID_CONNECTION, message) {}
};

} // namespace pgcrud
