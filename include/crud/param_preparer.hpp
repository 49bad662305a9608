#pragma once

#include "core/types.hpp"
#include <functional>
#include <string>
#include <vector>

namespace pgcrud {

/**
 * @brief Outcome of preparing one value for a statement
 */
enum class PrepareOutcome {
    PARAMETER,  // append to the parameter list, emit $N
    ABSENT,     // no value, emit NULL
    INLINE      // emit the text verbatim (date keywords)
};

struct PreparedValue {
    PrepareOutcome outcome = PrepareOutcome::ABSENT;
    std::string text;

    static PreparedValue parameter(std::string text) {
        return {PrepareOutcome::PARAMETER, std::move(text)};
    }
    static PreparedValue absent() { return {PrepareOutcome::ABSENT, {}}; }
    static PreparedValue inline_sql(std::string text) {
        return {PrepareOutcome::INLINE, std::move(text)};
    }
};

/**
 * @brief Accumulates positional parameters while a statement is assembled
 *
 * Every call to prepare() returns the SQL fragment to splice into the
 * statement, so the placeholder numbering always matches the order of
 * the parameter list.
 */
class ParamPreparer {
public:
    using BinaryEscaper = std::function<std::string(const std::vector<uint8_t>&)>;

    explicit ParamPreparer(BinaryEscaper escape_bytea);

    /**
     * @brief Prepare a value of the given semantic type
     * @return "$N" for a parameter, "NULL" when absent, or an inline keyword
     */
    [[nodiscard]] std::string prepare(const Value& value, SemanticType type);

    [[nodiscard]] const ParamList& params() const { return params_; }
    [[nodiscard]] size_t size() const { return params_.size(); }

    /**
     * @brief Hand over the accumulated parameters (leaves the preparer empty)
     */
    [[nodiscard]] ParamList take() { return std::move(params_); }

    // Per-type preparation, independent of any parameter list
    [[nodiscard]] static PreparedValue prepare_bool(const Value& value);
    [[nodiscard]] static PreparedValue prepare_date(const Value& value);
    [[nodiscard]] static PreparedValue prepare_num(const Value& value);
    [[nodiscard]] static PreparedValue prepare_json(const Value& value);
    [[nodiscard]] PreparedValue prepare_bytea(const Value& value) const;

    /**
     * @brief Text form of an arbitrary value for a text parameter
     */
    [[nodiscard]] static std::string to_text(const Value& value);

private:
    BinaryEscaper escape_bytea_;
    ParamList params_;
};

/**
 * @brief Human-readable "$1='a', $2=NULL" rendering for diagnostics
 *
 * Long values are elided and non-printable bytes escaped.
 */
[[nodiscard]] std::string describe_params(const ParamList& params);

} // namespace pgcrud
