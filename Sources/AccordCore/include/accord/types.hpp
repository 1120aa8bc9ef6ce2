#pragma once

#ifdef __cplusplus

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

namespace accord {

// Timestamp type (UTC, microsecond resolution when stored as text)
using timestamp_t = std::chrono::system_clock::time_point;

using blob_t = std::vector<uint8_t>;

// Value as the driver binds and returns it
using column_value_t = std::variant<
    std::nullptr_t,
    bool,
    int64_t,
    double,
    std::string,
    blob_t
>;

// Value as a field stores it. nullptr means "no value".
using value_t = std::variant<
    std::nullptr_t,
    bool,
    int64_t,
    double,
    std::string,
    blob_t,
    timestamp_t
>;

// One result row, columns in SELECT order
using row_t = std::vector<column_value_t>;

// Semantic field types. The dialect maps these to column types and
// converts values on the way in and out.
enum class value_type {
    integer,
    small_integer,
    big_integer,
    real,
    boolean,
    text,
    varchar,
    fixed_char,
    blob,
    timestamp
};

inline const char* to_string(value_type type) {
    switch (type) {
        case value_type::integer: return "integer";
        case value_type::small_integer: return "small_integer";
        case value_type::big_integer: return "big_integer";
        case value_type::real: return "real";
        case value_type::boolean: return "boolean";
        case value_type::text: return "text";
        case value_type::varchar: return "varchar";
        case value_type::fixed_char: return "fixed_char";
        case value_type::blob: return "blob";
        case value_type::timestamp: return "timestamp";
    }
    return "unknown";
}

// A generated SQL statement and the values for its bind markers, in marker order
struct statement {
    std::string sql;
    std::vector<column_value_t> params;
};

inline bool is_null(const value_t& value) {
    return std::holds_alternative<std::nullptr_t>(value);
}

inline bool is_null(const column_value_t& value) {
    return std::holds_alternative<std::nullptr_t>(value);
}

// ============================================================================
// Timestamp text form: "YYYY-MM-DDTHH:MM:SS.ffffff" (UTC)
// ============================================================================

inline std::string format_timestamp(timestamp_t ts) {
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(ts.time_since_epoch()).count();
    auto secs = micros / 1000000;
    auto frac = micros % 1000000;
    if (frac < 0) {
        frac += 1000000;
        secs -= 1;
    }
    std::time_t t = static_cast<std::time_t>(secs);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[40];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%06lld",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                  tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<long long>(frac));
    return buf;
}

// Accepts "YYYY-MM-DD HH:MM:SS" or "YYYY-MM-DDTHH:MM:SS" with optional fraction
inline std::optional<timestamp_t> parse_timestamp(const std::string& s) {
    std::tm tm{};
    char sep = 0;
    int consumed = 0;
    if (std::sscanf(s.c_str(), "%4d-%2d-%2d%c%2d:%2d:%2d%n",
                    &tm.tm_year, &tm.tm_mon, &tm.tm_mday, &sep,
                    &tm.tm_hour, &tm.tm_min, &tm.tm_sec, &consumed) != 7) {
        return std::nullopt;
    }
    if (sep != 'T' && sep != ' ') return std::nullopt;
    tm.tm_year -= 1900;
    tm.tm_mon -= 1;

    int64_t micros = 0;
    size_t pos = static_cast<size_t>(consumed);
    if (pos < s.size() && s[pos] == '.') {
        int digits = 0;
        for (++pos; pos < s.size() && s[pos] >= '0' && s[pos] <= '9'; ++pos) {
            if (digits < 6) {
                micros = micros * 10 + (s[pos] - '0');
                ++digits;
            }
        }
        for (; digits < 6; ++digits) micros *= 10;
    }
    if (pos != s.size()) return std::nullopt;

    auto secs = static_cast<int64_t>(timegm(&tm));
    return timestamp_t(std::chrono::duration_cast<timestamp_t::duration>(
        std::chrono::microseconds(secs * 1000000 + micros)));
}

// ============================================================================
// Helpers for building value_t from plain C++ values
// ============================================================================

template<typename T>
struct is_optional : std::false_type {};

template<typename T>
struct is_optional<std::optional<T>> : std::true_type {};

template<typename T>
value_t make_value(T&& v) {
    using U = std::decay_t<T>;
    if constexpr (std::is_same_v<U, value_t>) {
        return std::forward<T>(v);
    } else if constexpr (std::is_same_v<U, std::nullptr_t>) {
        return nullptr;
    } else if constexpr (std::is_same_v<U, bool>) {
        return value_t(std::in_place_type<bool>, v);
    } else if constexpr (std::is_integral_v<U>) {
        return value_t(std::in_place_type<int64_t>, static_cast<int64_t>(v));
    } else if constexpr (std::is_floating_point_v<U>) {
        return value_t(std::in_place_type<double>, static_cast<double>(v));
    } else if constexpr (std::is_convertible_v<U, std::string_view>) {
        return value_t(std::in_place_type<std::string>, std::string(std::string_view(v)));
    } else if constexpr (std::is_same_v<U, blob_t>) {
        return value_t(std::in_place_type<blob_t>, std::forward<T>(v));
    } else if constexpr (std::is_same_v<U, timestamp_t>) {
        return value_t(std::in_place_type<timestamp_t>, v);
    } else if constexpr (is_optional<U>::value) {
        if (!v.has_value()) return nullptr;
        return make_value(*v);
    } else {
        static_assert(sizeof(U) == 0, "unsupported value type");
    }
}

// Read a stored value as T; nullopt when null or of another type
template<typename T>
std::optional<T> value_as(const value_t& value) {
    if (const auto* p = std::get_if<T>(&value)) return *p;
    return std::nullopt;
}

// Short human-readable form used in logs and to_string()
inline std::string describe(const value_t& value) {
    return std::visit([](auto&& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            return "NULL";
        } else if constexpr (std::is_same_v<T, bool>) {
            return v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return std::to_string(v);
        } else if constexpr (std::is_same_v<T, double>) {
            char buf[32];
            std::snprintf(buf, sizeof(buf), "%g", v);
            return buf;
        } else if constexpr (std::is_same_v<T, std::string>) {
            return "'" + v + "'";
        } else if constexpr (std::is_same_v<T, blob_t>) {
            return "<blob " + std::to_string(v.size()) + " bytes>";
        } else {
            return format_timestamp(v);
        }
    }, value);
}

inline std::string describe(const column_value_t& value) {
    return std::visit([](auto&& v) -> std::string {
        return describe(value_t(v));
    }, value);
}

} // namespace accord

#endif // __cplusplus
