#pragma once

#ifdef __cplusplus

#include <cmath>
#include <cstdint>
#include <string>
#include <optional>
#include <vector>
#include <map>
#include <memory>
#include <variant>
#include <nlohmann/json.hpp>

namespace tether {

// Primary key type (identity key of a persisted record)
using primary_key_t = int64_t;

// Supported attribute values
using column_value_t = std::variant<
    std::nullptr_t,
    int64_t,
    double,
    std::string,
    std::vector<uint8_t>  // blob
>;

// Attribute name -> value. Ordered so serialized output is stable.
using attributes_t = std::map<std::string, column_value_t>;

// Column type enumeration
enum class column_type {
    integer,
    real,
    text,
    blob
};

// Column definition for schema
struct column_def {
    std::string name;
    column_type type = column_type::text;
    bool nullable = true;
    bool is_primary_key = false;
    bool is_unique = false;
};

// Table schema
struct table_schema {
    std::string name;
    std::vector<column_def> columns;
};

class record;
using record_ptr = std::shared_ptr<record>;

namespace detail {

    inline bool is_null(const column_value_t& v) {
        return std::holds_alternative<std::nullptr_t>(v);
    }

    /// Blank means null, an empty blob, or a string made only of whitespace.
    inline bool is_blank(const column_value_t& v) {
        if (is_null(v)) return true;
        if (auto* s = std::get_if<std::string>(&v)) {
            return s->find_first_not_of(" \t\r\n\f\v") == std::string::npos;
        }
        if (auto* b = std::get_if<std::vector<uint8_t>>(&v)) {
            return b->empty();
        }
        return false;
    }

    /// Casts a value to an identity key. Integral text ("42") is accepted;
    /// anything that is not a whole number yields nullopt.
    inline std::optional<primary_key_t> to_identity(const column_value_t& v) {
        if (auto* i = std::get_if<int64_t>(&v)) {
            return *i;
        }
        if (auto* d = std::get_if<double>(&v)) {
            // [-2^63, 2^63) is exactly representable; outside it the cast is undefined
            if (!std::isfinite(*d) || *d < -9223372036854775808.0 || *d >= 9223372036854775808.0) {
                return std::nullopt;
            }
            auto truncated = static_cast<primary_key_t>(*d);
            if (static_cast<double>(truncated) != *d) return std::nullopt;
            return truncated;
        }
        if (auto* s = std::get_if<std::string>(&v)) {
            auto first = s->find_first_not_of(" \t\r\n");
            auto last = s->find_last_not_of(" \t\r\n");
            if (first == std::string::npos) return std::nullopt;
            std::string trimmed = s->substr(first, last - first + 1);
            size_t consumed = 0;
            try {
                long long parsed = std::stoll(trimmed, &consumed);
                if (consumed != trimmed.size()) return std::nullopt;
                return static_cast<primary_key_t>(parsed);
            } catch (const std::exception&) {
                return std::nullopt;
            }
        }
        return std::nullopt;
    }

    inline nlohmann::json to_json_value(const column_value_t& v) {
        return std::visit([](auto&& value) -> nlohmann::json {
            using T = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<T, std::nullptr_t>) {
                return nullptr;
            } else if constexpr (std::is_same_v<T, std::vector<uint8_t>>) {
                return nlohmann::json::binary(value);
            } else {
                return value;
            }
        }, v);
    }

    inline column_value_t from_json_value(const nlohmann::json& j) {
        if (j.is_null()) return nullptr;
        if (j.is_boolean()) return static_cast<int64_t>(j.get<bool>() ? 1 : 0);
        if (j.is_number_integer()) return j.get<int64_t>();
        if (j.is_number_float()) return j.get<double>();
        if (j.is_string()) return j.get<std::string>();
        if (j.is_binary()) return std::vector<uint8_t>(j.get_binary().begin(), j.get_binary().end());
        return j.dump();
    }

    /// Short printable form, used in log lines and error messages.
    inline std::string describe(const column_value_t& v) {
        return std::visit([](auto&& value) -> std::string {
            using T = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<T, std::nullptr_t>) {
                return "NULL";
            } else if constexpr (std::is_same_v<T, int64_t> || std::is_same_v<T, double>) {
                return std::to_string(value);
            } else if constexpr (std::is_same_v<T, std::string>) {
                return "'" + value + "'";
            } else {
                return "<blob " + std::to_string(value.size()) + " bytes>";
            }
        }, v);
    }

} // namespace detail

} // namespace tether

#endif // __cplusplus
