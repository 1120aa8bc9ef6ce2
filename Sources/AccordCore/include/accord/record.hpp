#pragma once

#ifdef __cplusplus

#include "context.hpp"
#include "dialect.hpp"
#include "field.hpp"
#include "types.hpp"
#include <initializer_list>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace accord {

class relation_schema;
class table_schema;
class view_schema;

// ============================================================================
// record_schema - static, ordered list of fields describing one entity shape.
// Shared by every record created from it.
// ============================================================================

class record_schema {
public:
    record_schema(std::string name, std::vector<field_ptr> fields);
    virtual ~record_schema() = default;

    record_schema(const record_schema&) = delete;
    record_schema& operator=(const record_schema&) = delete;

    const std::string& name() const { return name_; }
    const std::vector<field_ptr>& fields() const { return fields_; }
    size_t size() const { return fields_.size(); }

    std::optional<size_t> index_of(const std::string& field_name) const;

    /// Like index_of, throwing schema_violation_error for unknown names.
    size_t require_index(const std::string& field_name) const;

    const field& field_at(size_t index) const { return *fields_[index]; }
    const field& get_field(const std::string& field_name) const;

    std::vector<std::string> field_names() const;

    /// Quoted SQL column names joined with ", "
    std::string column_names_sql(const dialect& d) const;

    virtual const relation_schema* as_relation() const { return nullptr; }
    virtual const table_schema* as_table() const { return nullptr; }
    virtual const view_schema* as_view() const { return nullptr; }

    virtual std::string to_string() const;

private:
    std::string name_;
    std::vector<field_ptr> fields_;
};

using record_schema_ptr = std::shared_ptr<const record_schema>;

/// Convenience for plain (non-table) record shapes
record_schema_ptr make_record_schema(std::string name, std::vector<field_ptr> fields);

// ============================================================================
// record - one typed slot per field of its schema. Only declared names are
// settable and every assignment is validated by the field.
// ============================================================================

class record {
public:
    using named_value = std::pair<std::string, value_t>;

    explicit record(record_schema_ptr schema);

    /// Positional values, one per field in declaration order
    record(record_schema_ptr schema, std::vector<value_t> values);

    record(record_schema_ptr schema, std::initializer_list<named_value> values);

    const record_schema& schema() const { return *schema_; }
    const record_schema_ptr& schema_ptr() const { return schema_; }

    const value_t& get(const std::string& field_name) const;

    template<typename T>
    std::optional<T> get_as(const std::string& field_name) const {
        return value_as<T>(get(field_name));
    }

    /// Throws schema_violation_error for unknown names, validation_error for
    /// values the field rejects.
    template<typename T>
    void set(const std::string& field_name, T&& value) {
        set_at(schema_->require_index(field_name), make_value(std::forward<T>(value)));
    }

    const value_t& at(size_t index) const { return values_.at(index); }
    void set_at(size_t index, value_t value);

    const std::vector<value_t>& values() const { return values_; }

    /// Set every slot to null without validation
    void clear();

    /// Refresh every field against the context, so context-bound fields
    /// take the context value and row counters advance.
    void propagate(context& ctx);

    /// Values of the fields linked to a context entry, keyed by the entry
    /// name. Null values are skipped; the first field for a key wins.
    context context_values_stored() const;

    /// Replace all values from a result row (columns in field order).
    /// Throws db_error when the column count does not match.
    void load_row(const row_t& row, const dialect& d);

    /// Backend values in field order
    std::vector<column_value_t> backend_values(const dialect& d) const;

    bool operator==(const record& other) const;
    bool operator!=(const record& other) const { return !(*this == other); }

    std::string to_string() const;

private:
    record_schema_ptr schema_;
    std::vector<value_t> values_;
};

} // namespace accord

#endif // __cplusplus
