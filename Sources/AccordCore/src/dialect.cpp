#include "accord/dialect.hpp"
#include "accord/errors.hpp"
#include <cmath>
#include <limits>

namespace accord {

namespace {

[[noreturn]] void conversion_failed(const column_value_t& value, value_type type) {
    throw validation_error("Cannot read " + describe(value) + " as a " + to_string(type) + " value");
}

} // namespace

// ============================================================================
// dialect
// ============================================================================

std::string dialect::quote_identifier(const std::string& identifier) const {
    std::string result = "\"";
    for (char c : identifier) {
        if (c == '"') result += '"';
        result += c;
    }
    result += '"';
    return result;
}

std::string dialect::column_type(value_type type, size_t length) const {
    switch (type) {
        case value_type::integer: return "INTEGER";
        case value_type::small_integer: return "SMALLINT";
        case value_type::big_integer: return "BIGINT";
        case value_type::real: return "REAL";
        case value_type::boolean: return "BOOLEAN";
        case value_type::text: return "TEXT";
        case value_type::varchar: return "VARCHAR(" + std::to_string(length) + ")";
        case value_type::fixed_char: return "CHARACTER(" + std::to_string(length) + ")";
        case value_type::blob: return "BLOB";
        case value_type::timestamp: return "TIMESTAMP";
    }
    return "TEXT";
}

column_value_t dialect::to_backend(const value_t& value) const {
    return std::visit([this](auto&& v) -> column_value_t {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, bool>) {
            if (native_booleans()) return v;
            return static_cast<int64_t>(v ? 1 : 0);
        } else if constexpr (std::is_same_v<T, timestamp_t>) {
            return format_timestamp(v);
        } else {
            return v;
        }
    }, value);
}

value_t dialect::from_backend(const column_value_t& value, value_type type) const {
    if (is_null(value)) return nullptr;

    switch (type) {
        case value_type::integer:
        case value_type::small_integer:
        case value_type::big_integer:
            if (const auto* i = std::get_if<int64_t>(&value)) return *i;
            if (const auto* b = std::get_if<bool>(&value)) return static_cast<int64_t>(*b ? 1 : 0);
            if (const auto* d = std::get_if<double>(&value)) {
                if (std::trunc(*d) == *d &&
                    *d >= static_cast<double>(std::numeric_limits<int64_t>::min()) &&
                    *d <= static_cast<double>(std::numeric_limits<int64_t>::max())) {
                    return static_cast<int64_t>(*d);
                }
            }
            break;
        case value_type::real:
            if (const auto* d = std::get_if<double>(&value)) return *d;
            if (const auto* i = std::get_if<int64_t>(&value)) return static_cast<double>(*i);
            break;
        case value_type::boolean:
            if (const auto* b = std::get_if<bool>(&value)) return *b;
            if (const auto* i = std::get_if<int64_t>(&value)) return *i != 0;
            break;
        case value_type::text:
        case value_type::varchar:
        case value_type::fixed_char:
            if (const auto* s = std::get_if<std::string>(&value)) return *s;
            break;
        case value_type::blob:
            if (const auto* b = std::get_if<blob_t>(&value)) return *b;
            if (const auto* s = std::get_if<std::string>(&value)) return blob_t(s->begin(), s->end());
            break;
        case value_type::timestamp:
            if (const auto* s = std::get_if<std::string>(&value)) {
                if (auto ts = parse_timestamp(*s)) return *ts;
            }
            break;
    }
    conversion_failed(value, type);
}

std::string dialect::qualify(const std::string& schema, const std::string& object) const {
    if (schema.empty()) return quote_identifier(object);
    if (schema_support()) return quote_identifier(schema) + "." + quote_identifier(object);
    return quote_identifier(schema + "_" + object);
}

std::string dialect::qualify_raw(const std::string& schema, const std::string& object) const {
    if (schema.empty()) return object;
    return schema + (schema_support() ? "." : "_") + object;
}

std::string dialect::parameter_list(size_t count, size_t start) const {
    std::string result;
    for (size_t i = 0; i < count; ++i) {
        if (i != 0) result += ", ";
        result += marker(start + i);
    }
    return result;
}

std::string dialect::parameter_values(const std::vector<std::string>& columns,
                                      size_t start,
                                      const std::string& joiner) const {
    std::string result;
    for (size_t i = 0; i < columns.size(); ++i) {
        if (i != 0) result += joiner;
        result += quote_identifier(columns[i]) + " = " + marker(start + i, columns[i]);
    }
    return result;
}

// ============================================================================
// sqlite_dialect
// ============================================================================

std::string sqlite_dialect::marker(size_t, const std::string&) const {
    return "?";
}

std::string sqlite_dialect::column_type(value_type type, size_t length) const {
    if (type == value_type::timestamp) return "TEXT";
    return dialect::column_type(type, length);
}

// SQLite has no sequences; emulate one with a single-row table
std::vector<std::string> sqlite_dialect::create_sequence_sql() const {
    return {
        "CREATE TABLE IF NOT EXISTS {name} (seq_start {index_type}, seq_interval {index_type}, "
        "seq_lastval {index_type}, seq_nextval {index_type})",
        "INSERT INTO {name} VALUES ({start}, {interval}, {start}, {start})"
    };
}

std::vector<std::string> sqlite_dialect::nextval_sequence_sql() const {
    return {
        "UPDATE {name} SET seq_lastval = seq_nextval, seq_nextval = seq_nextval + seq_interval",
        "SELECT seq_lastval FROM {name}"
    };
}

std::vector<std::string> sqlite_dialect::reset_sequence_sql() const {
    return {
        "UPDATE {name} SET seq_lastval = seq_start, seq_nextval = seq_start"
    };
}

// ============================================================================
// postgresql_dialect
// ============================================================================

std::string postgresql_dialect::marker(size_t index, const std::string&) const {
    return "$" + std::to_string(index);
}

std::string postgresql_dialect::column_type(value_type type, size_t length) const {
    switch (type) {
        case value_type::real: return "DOUBLE PRECISION";
        case value_type::blob: return "BYTEA";
        default: return dialect::column_type(type, length);
    }
}

std::vector<std::string> postgresql_dialect::create_sequence_sql() const {
    return {
        "CREATE SEQUENCE IF NOT EXISTS {name} AS {index_type} START {start} INCREMENT {interval}"
    };
}

std::vector<std::string> postgresql_dialect::nextval_sequence_sql() const {
    return {
        "SELECT nextval('{name}')"
    };
}

std::vector<std::string> postgresql_dialect::reset_sequence_sql() const {
    return {
        "ALTER SEQUENCE {name} RESTART"
    };
}

} // namespace accord
