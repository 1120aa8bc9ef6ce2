#pragma once

#ifdef __cplusplus

#include "context.hpp"
#include "cursor.hpp"
#include "dialect.hpp"
#include "types.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace accord {

class query_schema;
class sequence;

struct field_options {
    /// Column name in generated SQL; defaults to the field name.
    std::string sql_name;

    bool nullable = true;

    /// Context entry this field tracks. During propagation a present,
    /// non-null context value replaces the stored value.
    std::optional<std::string> context_key;

    /// Query whose single result refresh() adopts when a cursor is available.
    std::shared_ptr<const query_schema> query;
};

// Where generators (sequences, bound queries) get their database access from
struct field_source {
    cursor& cur;
    const dialect& dia;
};

// ============================================================================
// field - typed slot specification shared by records, queries and
// transactions. The field holds no value itself: every operation takes the
// slot it should read or write.
// ============================================================================

class field {
public:
    field(std::string name, value_type type, field_options options = {});
    virtual ~field() = default;

    const std::string& name() const { return name_; }
    const std::string& sql_name() const { return sql_name_; }
    value_type type() const { return type_; }
    bool nullable() const { return nullable_; }
    const std::optional<std::string>& context_key() const { return context_key_; }
    const std::shared_ptr<const query_schema>& query() const { return query_; }

    /// Whether the stored value identifies the context entry: such fields
    /// restrict context SELECTs and feed values back into the context.
    /// Counters that only read the context are not linked.
    virtual bool links_context() const { return context_key_.has_value(); }

    /// Declared length for varchar/fixed_char fields, 0 otherwise.
    virtual size_t length() const { return 0; }

    /// Type, nullability and length check. Returns the value as it will be
    /// stored (widened or truncated where the field allows it).
    /// Throws validation_error.
    value_t validate(const value_t& value) const;

    /// The context value for context_key when present and non-null,
    /// otherwise `stored`. No side effects.
    value_t resolve(const value_t& stored, const context* ctx) const;

    /// Idempotent re-derivation: adopts the context value (see resolve) or,
    /// with a source and a bound query, the query's single result. Stores
    /// the outcome in `slot` and returns it.
    virtual value_t refresh(value_t& slot, context* ctx, const field_source* source) const;

    /// May generate a new value from an external source. The base version
    /// refreshes. Stores the outcome and, when context_key is set and the
    /// value is not null, writes it into the context.
    virtual value_t update(value_t& slot, context* ctx, const field_source& source) const;

    /// Column type for the dialect, with NOT NULL when the field is not nullable
    virtual std::string sql_type(const dialect& d) const;

    /// Stored value -> the value bound for this column
    virtual column_value_t to_backend(const value_t& value, const dialect& d) const;

    /// Column value -> validated stored value. Throws validation_error.
    virtual value_t from_backend(const column_value_t& value, const dialect& d) const;

    std::string to_string() const;

protected:
    /// Convert a non-null value to the stored form or throw validation_error.
    virtual value_t convert(const value_t& value) const = 0;

    [[noreturn]] void reject(const value_t& value, const std::string& reason) const;

private:
    std::string name_;
    std::string sql_name_;
    value_type type_;
    bool nullable_;
    std::optional<std::string> context_key_;
    std::shared_ptr<const query_schema> query_;
};

using field_ptr = std::shared_ptr<const field>;

// ============================================================================
// Concrete field kinds
// ============================================================================

class int_field : public field {
public:
    explicit int_field(std::string name, field_options options = {})
        : field(std::move(name), value_type::integer, std::move(options)) {}
protected:
    value_t convert(const value_t& value) const override;
};

class small_int_field : public field {
public:
    explicit small_int_field(std::string name, field_options options = {})
        : field(std::move(name), value_type::small_integer, std::move(options)) {}
protected:
    value_t convert(const value_t& value) const override;
};

class big_int_field : public field {
public:
    explicit big_int_field(std::string name, field_options options = {})
        : field(std::move(name), value_type::big_integer, std::move(options)) {}
protected:
    value_t convert(const value_t& value) const override;
};

// Integers are accepted and widened
class real_field : public field {
public:
    explicit real_field(std::string name, field_options options = {})
        : field(std::move(name), value_type::real, std::move(options)) {}
protected:
    value_t convert(const value_t& value) const override;
};

class boolean_field : public field {
public:
    explicit boolean_field(std::string name, field_options options = {})
        : field(std::move(name), value_type::boolean, std::move(options)) {}
protected:
    value_t convert(const value_t& value) const override;
};

class text_field : public field {
public:
    explicit text_field(std::string name, field_options options = {})
        : field(std::move(name), value_type::text, std::move(options)) {}
protected:
    value_t convert(const value_t& value) const override;
};

// Lengths count UTF-8 code points, not bytes.
// Strings longer than max_length are rejected, or cut when silent_truncate is set
class varchar_field : public field {
public:
    varchar_field(std::string name, size_t max_length, bool silent_truncate = false,
                  field_options options = {})
        : field(std::move(name), value_type::varchar, std::move(options)),
          max_length_(max_length), silent_truncate_(silent_truncate) {}

    size_t length() const override { return max_length_; }
    bool silent_truncate() const { return silent_truncate_; }

protected:
    value_t convert(const value_t& value) const override;

private:
    size_t max_length_;
    bool silent_truncate_;
};

class char_field : public field {
public:
    char_field(std::string name, size_t length, field_options options = {})
        : field(std::move(name), value_type::fixed_char, std::move(options)), length_(length) {}

    size_t length() const override { return length_; }

protected:
    value_t convert(const value_t& value) const override;

private:
    size_t length_;
};

class blob_field : public field {
public:
    explicit blob_field(std::string name, field_options options = {})
        : field(std::move(name), value_type::blob, std::move(options)) {}
protected:
    value_t convert(const value_t& value) const override;
};

// Accepts timestamp_t, or text in the "YYYY-MM-DD HH:MM:SS[.ffffff]" form
class timestamp_field : public field {
public:
    explicit timestamp_field(std::string name, field_options options = {})
        : field(std::move(name), value_type::timestamp, std::move(options)) {}
protected:
    value_t convert(const value_t& value) const override;
};

// ----------------------------------------------------------------------------
// row_enum_field - numbers rows within one transaction. Each refresh with a
// context takes the next value of the counter stored under context_key,
// starting the counter at starting_number. Not nullable.
// ----------------------------------------------------------------------------

class row_enum_field : public int_field {
public:
    row_enum_field(std::string name, std::string context_key, int64_t starting_number = 1,
                   field_options options = {});

    int64_t starting_number() const { return starting_number_; }

    bool links_context() const override { return false; }

    value_t refresh(value_t& slot, context* ctx, const field_source* source) const override;

private:
    int64_t starting_number_;
};

// ----------------------------------------------------------------------------
// enum_field - one of a fixed list of names, stored as its ordinal (the
// position in `names`). Accepts an ordinal or a name. Dialects with native
// enum types declare the column as `enum_sql` and exchange names with the
// backend; others fall back to SMALLINT ordinals.
// ----------------------------------------------------------------------------

class enum_field : public field {
public:
    enum_field(std::string name, std::vector<std::string> names, std::string enum_sql,
               field_options options = {});

    const std::vector<std::string>& names() const { return names_; }
    const std::string& enum_sql() const { return enum_sql_; }

    /// Throws validation_error for an ordinal outside the list
    const std::string& name_of(int64_t ordinal) const;

    std::optional<int64_t> ordinal_of(const std::string& name) const;

    std::string sql_type(const dialect& d) const override;
    column_value_t to_backend(const value_t& value, const dialect& d) const override;
    value_t from_backend(const column_value_t& value, const dialect& d) const override;

protected:
    value_t convert(const value_t& value) const override;

private:
    std::vector<std::string> names_;
    std::string enum_sql_;
};

// update() draws the next value from a database sequence
class sequence_field : public big_int_field {
public:
    sequence_field(std::string name, std::shared_ptr<const sequence> seq, field_options options = {});

    const sequence& seq() const { return *sequence_; }

    value_t update(value_t& slot, context* ctx, const field_source& source) const override;

private:
    std::shared_ptr<const sequence> sequence_;
};

// update() stamps the current UTC time
class utc_now_timestamp_field : public timestamp_field {
public:
    explicit utc_now_timestamp_field(std::string name, field_options options = {})
        : timestamp_field(std::move(name), std::move(options)) {}

    value_t update(value_t& slot, context* ctx, const field_source& source) const override;
};

template<typename F, typename... Args>
field_ptr make_field(Args&&... args) {
    return std::make_shared<F>(std::forward<Args>(args)...);
}

} // namespace accord

#endif // __cplusplus
