#include "crud/param_preparer.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include <cmath>
#include <format>
#include <string_view>
#include <unordered_set>

namespace pgcrud {

namespace {

const std::unordered_set<std::string>& bool_true_values() {
    static const std::unordered_set<std::string> values = {
        "t", "true", "1", "y", "yes", "on"};
    return values;
}

// Must be emitted as bare SQL, quoting would turn them into plain strings
const std::unordered_set<std::string>& date_literals() {
    static const std::unordered_set<std::string> literals = {
        "current_date", "current_time", "current_timestamp",
        "localtime", "localtimestamp"};
    return literals;
}

constexpr size_t kMaxDescribedLength = 64;

} // anonymous namespace

ParamPreparer::ParamPreparer(BinaryEscaper escape_bytea)
    : escape_bytea_(std::move(escape_bytea)) {}

std::string ParamPreparer::prepare(const Value& value, SemanticType type) {
    PreparedValue prepared;
    if (value.is_null()) {
        prepared = PreparedValue::absent();
    } else {
        switch (type) {
            case SemanticType::BOOL:  prepared = prepare_bool(value); break;
            case SemanticType::DATE:  prepared = prepare_date(value); break;
            case SemanticType::INT:
            case SemanticType::FLOAT:
            case SemanticType::NUM:
            case SemanticType::MONEY: prepared = prepare_num(value); break;
            case SemanticType::BYTEA: prepared = prepare_bytea(value); break;
            case SemanticType::JSON:  prepared = prepare_json(value); break;
            case SemanticType::TEXT:
            default:                  prepared = PreparedValue::parameter(to_text(value)); break;
        }
    }

    switch (prepared.outcome) {
        case PrepareOutcome::PARAMETER:
            params_.emplace_back(std::move(prepared.text));
            return std::format("${}", params_.size());
        case PrepareOutcome::INLINE:
            return prepared.text;
        case PrepareOutcome::ABSENT:
        default:
            return "NULL";
    }
}

PreparedValue ParamPreparer::prepare_bool(const Value& value) {
    if (value.is_string()) {
        const auto& s = value.get_ref<const std::string&>();
        if (s.empty()) {
            return PreparedValue::absent();
        }
        return PreparedValue::parameter(bool_true_values().contains(utils::to_lower(s)) ? "t" : "f");
    }
    return PreparedValue::parameter(is_truthy(value) ? "t" : "f");
}

PreparedValue ParamPreparer::prepare_date(const Value& value) {
    if (!is_truthy(value)) {
        return PreparedValue::absent();
    }
    if (value.is_string()) {
        const auto& s = value.get_ref<const std::string&>();
        if (date_literals().contains(utils::to_lower(s))) {
            return PreparedValue::inline_sql(s);
        }
    }
    return PreparedValue::parameter(to_text(value));
}

PreparedValue ParamPreparer::prepare_num(const Value& value) {
    if (value.is_boolean()) {
        return PreparedValue::parameter(value.get<bool>() ? "1" : "0");
    }
    // Zero is a real value; only other falsy values mean "no value"
    if (value.is_number()) {
        return PreparedValue::parameter(to_text(value));
    }
    if (!is_truthy(value)) {
        return PreparedValue::absent();
    }
    return PreparedValue::parameter(to_text(value));
}

PreparedValue ParamPreparer::prepare_bytea(const Value& value) const {
    if (value.is_binary()) {
        return PreparedValue::parameter(escape_bytea_(value.get_binary()));
    }
    if (value.is_string()) {
        const auto& s = value.get_ref<const std::string&>();
        return PreparedValue::parameter(escape_bytea_(std::vector<uint8_t>(s.begin(), s.end())));
    }
    throw ValidationError(std::format("Cannot use a {} value for a bytea column", value.type_name()));
}

PreparedValue ParamPreparer::prepare_json(const Value& value) {
    return PreparedValue::parameter(value.dump());
}

std::string ParamPreparer::to_text(const Value& value) {
    switch (value.type()) {
        case Value::value_t::string: return value.get<std::string>();
        case Value::value_t::boolean: return value.get<bool>() ? "true" : "false";
        case Value::value_t::number_integer: return std::to_string(value.get<int64_t>());
        case Value::value_t::number_unsigned: return std::to_string(value.get<uint64_t>());
        case Value::value_t::number_float: {
            // dump() renders non-finite numbers as null
            const double d = value.get<double>();
            if (std::isnan(d)) return "NaN";
            if (std::isinf(d)) return d > 0 ? "Infinity" : "-Infinity";
            return value.dump();
        }
        case Value::value_t::binary: return "\\x" + utils::bytes_to_hex(value.get_binary());
        default: return value.dump();
    }
}

std::string describe_params(const ParamList& params) {
    std::vector<std::string> parts;
    parts.reserve(params.size());
    for (size_t i = 0; i < params.size(); ++i) {
        if (!params[i]) {
            parts.push_back(std::format("${}=NULL", i + 1));
            continue;
        }
        std::string_view raw = *params[i];
        const bool elided = raw.size() > kMaxDescribedLength;
        if (elided) {
            raw = raw.substr(0, kMaxDescribedLength - 3);
        }
        std::string rendered = "'";
        for (const char c : raw) {
            const auto uc = static_cast<unsigned char>(c);
            if (c == '\'' || c == '\\') {
                rendered += '\\';
                rendered += c;
            } else if (uc < 0x20 || uc == 0x7F) {
                rendered += std::format("\\x{:02x}", uc);
            } else {
                rendered += c;
            }
        }
        rendered += elided ? "...'" : "'";
        parts.push_back(std::format("${}={}", i + 1, rendered));
    }
    return utils::join(parts, ", ");
}

} // namespace pgcrud
