#pragma once

#ifdef __cplusplus

#include "context.hpp"
#include "cursor.hpp"
#include "dialect.hpp"
#include "field.hpp"
#include "record.hpp"
#include <initializer_list>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace accord {

// ============================================================================
// query_schema - parametrised SQL text, its result shape and the fields
// bound to its placeholders.
//
// Placeholder grammar:
//   {identifier}          parameter, replaced by the dialect's bind marker
//   {schema.object}       name reference, written per dialect
// Anything else in braces is left as text.
// ============================================================================

class query_schema {
public:
    query_schema(std::string name,
                 std::string text,
                 record_schema_ptr result,
                 std::vector<field_ptr> parameters = {});

    query_schema(const query_schema&) = delete;
    query_schema& operator=(const query_schema&) = delete;

    const std::string& name() const { return name_; }
    const std::string& text() const { return text_; }
    const record_schema_ptr& result_schema() const { return result_; }
    const std::vector<field_ptr>& parameters() const { return parameters_; }

    std::optional<size_t> parameter_index(const std::string& parameter) const;

    /// Parameter placeholders in text order, one entry per occurrence
    std::vector<std::string> placeholders() const;

    /// Placeholders that name no parameter field
    std::vector<std::string> unbound_placeholders() const;

    std::string to_string() const;

private:
    friend class query;

    enum class segment_kind { text, parameter, reference };

    struct segment {
        segment_kind kind;
        std::string value;       // text, or the parameter name
        std::string object;      // reference only: value is the schema
    };

    std::string name_;
    std::string text_;
    record_schema_ptr result_;
    std::vector<field_ptr> parameters_;
    std::vector<segment> segments_;

    void parse();
};

using query_schema_ptr = std::shared_ptr<const query_schema>;

query_schema_ptr make_query(std::string name,
                            std::string text,
                            record_schema_ptr result,
                            std::vector<field_ptr> parameters = {});

// ============================================================================
// query - one instance of a query_schema holding a value per parameter field
// ============================================================================

class query {
public:
    using named_value = std::pair<std::string, value_t>;

    explicit query(query_schema_ptr schema);
    query(query_schema_ptr schema, std::initializer_list<named_value> values);

    const query_schema& schema() const { return *schema_; }
    const query_schema_ptr& schema_ptr() const { return schema_; }

    const value_t& get(const std::string& parameter) const;

    template<typename T>
    void set(const std::string& parameter, T&& value) {
        set_value(parameter, make_value(std::forward<T>(value)));
    }

    void set_value(const std::string& parameter, value_t value);

    /// Take each parameter's value from the context entry named by its
    /// context_key (or its own name) when that entry is present and non-null.
    void set_context(const context& ctx);

    /// Parameter values keyed by parameter name
    context get_context() const;

    /// Statement text with markers and the bound values in marker order.
    /// Positional dialects get one value per occurrence; numbered and named
    /// dialects reuse the marker of a repeated parameter.
    /// Throws query_parameter_error for placeholders without a parameter.
    statement query_sql(const dialect& d) const;

    std::vector<row_t> execute(cursor& cur, const dialect& d) const;

    /// Every row materialised through the result schema
    std::vector<record> result_records(cursor& cur, const dialect& d) const;

    /// First row, or nullopt when the query returns none
    std::optional<record> result_record(cursor& cur, const dialect& d) const;

    /// The only value of a one-row, one-column result. Throws db_error otherwise.
    column_value_t result_single_value(cursor& cur, const dialect& d) const;

private:
    query_schema_ptr schema_;
    std::vector<value_t> values_;
};

} // namespace accord

#endif // __cplusplus
