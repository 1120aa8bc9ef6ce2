#pragma once

#ifdef __cplusplus

#include "constraints.hpp"
#include "context.hpp"
#include "dialect.hpp"
#include "record.hpp"
#include "sql_schema.hpp"
#include "types.hpp"
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace accord {

// ============================================================================
// relation_schema - a record shape bound to a named relation in the
// database. Generates the SELECT statements tables and views share.
// ============================================================================

class relation_schema : public record_schema {
public:
    relation_schema(std::string name, std::vector<field_ptr> fields, sql_schema_ptr schema);

    const sql_schema_ptr& schema() const { return schema_; }

    /// Quoted name, qualified by the sql_schema when there is one
    std::string qualified_name(const dialect& d) const;

    /// SELECT of all columns, restricted by "column = value" for each
    /// (field name, value) pair. Throws schema_violation_error for unknown fields.
    statement simple_select_sql(const dialect& d,
                                const std::vector<std::pair<std::string, value_t>>& predicates = {}) const;

    /// SELECT restricted by every context-linked field whose context entry
    /// is present and not null. With no such field, throws
    /// unbound_query_error unless allow_unlimited is set.
    statement context_select_sql(const context& ctx, const dialect& d, bool allow_unlimited = false) const;

    const relation_schema* as_relation() const override { return this; }

private:
    sql_schema_ptr schema_;
};

// ============================================================================
// table_schema - relation with constraints and the full set of generated
// statements. At most one primary key.
// ============================================================================

class table_schema : public relation_schema {
public:
    table_schema(std::string table_name,
                 std::vector<field_ptr> fields,
                 std::vector<constraint> constraints = {},
                 sql_schema_ptr schema = nullptr);

    const std::vector<constraint>& constraints() const { return constraints_; }

    /// nullptr when the table has none
    const constraint* primary_key() const;

    std::vector<const constraint*> foreign_keys() const;

    statement insert_sql(const record& r, const dialect& d) const;

    /// SET every non-key column, WHERE on the primary key.
    /// Throws schema_error without a primary key or with a null key value.
    statement update_sql(const record& r, const dialect& d) const;

    statement delete_sql(const record& r, const dialect& d) const;

    statement pk_select_sql(const record& r, const dialect& d) const;

    /// SELECT on `parent` for the row the record's foreign key to it refers
    /// to. Throws schema_error when no foreign key references `parent`.
    statement parent_select_sql(const record& r, const table_schema& parent, const dialect& d) const;

    std::string create_table_sql(const dialect& d) const;

    const table_schema* as_table() const override { return this; }

    std::string to_string() const override;

private:
    std::vector<constraint> constraints_;
    std::optional<size_t> primary_key_;

    void check_record(const record& r) const;

    // Primary-key column names and values; null values are a schema_error
    std::pair<std::vector<std::string>, std::vector<column_value_t>>
    pk_items(const record& r, const dialect& d) const;
};

using table_schema_ptr = std::shared_ptr<const table_schema>;

table_schema_ptr make_table(std::string table_name,
                            std::vector<field_ptr> fields,
                            std::vector<constraint> constraints = {},
                            sql_schema_ptr schema = nullptr);

} // namespace accord

#endif // __cplusplus
