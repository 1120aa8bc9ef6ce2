#include "accord/table.hpp"
#include "accord/errors.hpp"
#include <algorithm>

namespace accord {

// ============================================================================
// relation_schema
// ============================================================================

relation_schema::relation_schema(std::string name, std::vector<field_ptr> fields, sql_schema_ptr schema)
    : record_schema(std::move(name), std::move(fields)), schema_(std::move(schema)) {
    if (this->name().empty()) {
        throw schema_error("A table or view needs a name");
    }
}

std::string relation_schema::qualified_name(const dialect& d) const {
    if (schema_) {
        return schema_->qualified_name(name(), d);
    }
    return d.quote_identifier(name());
}

statement relation_schema::simple_select_sql(
        const dialect& d, const std::vector<std::pair<std::string, value_t>>& predicates) const {
    statement result;
    result.sql = "SELECT " + column_names_sql(d) + " FROM " + qualified_name(d);

    if (!predicates.empty()) {
        std::vector<std::string> columns;
        for (const auto& [field_name, value] : predicates) {
            const field& f = get_field(field_name);
            columns.push_back(f.sql_name());
            result.params.push_back(f.to_backend(value, d));
        }
        result.sql += " WHERE " + d.parameter_values(columns, 1, " AND ");
    }
    result.sql += ";";
    return result;
}

statement relation_schema::context_select_sql(const context& ctx, const dialect& d,
                                              bool allow_unlimited) const {
    statement result;
    result.sql = "SELECT " + column_names_sql(d) + " FROM " + qualified_name(d);

    std::vector<std::string> columns;
    for (const auto& f : fields()) {
        if (!f->links_context()) continue;
        const value_t* value = ctx.find(*f->context_key());
        if (value && !is_null(*value)) {
            columns.push_back(f->sql_name());
            result.params.push_back(f->to_backend(*value, d));
        }
    }

    if (columns.empty()) {
        if (!allow_unlimited) {
            throw unbound_query_error("No context value restricts the SELECT on " + name() +
                                      "; check for missing or misnamed context entries");
        }
    } else {
        result.sql += " WHERE " + d.parameter_values(columns, 1, " AND ");
    }
    result.sql += ";";
    return result;
}

// ============================================================================
// table_schema
// ============================================================================

table_schema::table_schema(std::string table_name,
                           std::vector<field_ptr> fields,
                           std::vector<constraint> constraints,
                           sql_schema_ptr schema)
    : relation_schema(std::move(table_name), std::move(fields), std::move(schema)),
      constraints_(std::move(constraints)) {
    for (size_t i = 0; i < constraints_.size(); ++i) {
        auto& c = constraints_[i];
        c.sql_columns.clear();
        for (const auto& column : c.columns) {
            auto index = index_of(column);
            if (!index) {
                throw schema_error("Constraint " + c.to_string() + " on " + name() +
                                   " references non-existent column " + column);
            }
            c.sql_columns.push_back(field_at(*index).sql_name());
        }

        if (c.kind == constraint_kind::primary_key) {
            if (primary_key_) {
                throw schema_error("Table " + name() + " has more than one primary key");
            }
            primary_key_ = i;
        }

        if (c.kind == constraint_kind::foreign_key && c.reference_columns.empty()) {
            c.reference_columns = c.sql_columns;
        }
    }
}

const constraint* table_schema::primary_key() const {
    return primary_key_ ? &constraints_[*primary_key_] : nullptr;
}

std::vector<const constraint*> table_schema::foreign_keys() const {
    std::vector<const constraint*> result;
    for (const auto& c : constraints_) {
        if (c.kind == constraint_kind::foreign_key) {
            result.push_back(&c);
        }
    }
    return result;
}

void table_schema::check_record(const record& r) const {
    if (&r.schema() != this) {
        throw schema_violation_error("A " + r.schema().name() + " record cannot be written to table " +
                                     name());
    }
}

std::pair<std::vector<std::string>, std::vector<column_value_t>>
table_schema::pk_items(const record& r, const dialect& d) const {
    const constraint* pk = primary_key();
    if (!pk) {
        throw schema_error("Table " + name() + " has no primary key");
    }

    std::vector<std::string> columns;
    std::vector<column_value_t> values;
    for (size_t i = 0; i < pk->columns.size(); ++i) {
        const value_t& value = r.get(pk->columns[i]);
        if (is_null(value)) {
            throw schema_error("Value for primary key column " + pk->columns[i] + " of " + name() +
                               " is null");
        }
        columns.push_back(pk->sql_columns[i]);
        values.push_back(get_field(pk->columns[i]).to_backend(value, d));
    }
    return {std::move(columns), std::move(values)};
}

statement table_schema::insert_sql(const record& r, const dialect& d) const {
    check_record(r);
    statement result;
    result.sql = "INSERT INTO " + qualified_name(d) + " (" + column_names_sql(d) + ") VALUES (" +
                 d.parameter_list(size()) + ");";
    result.params = r.backend_values(d);
    return result;
}

statement table_schema::update_sql(const record& r, const dialect& d) const {
    check_record(r);
    auto [pk_columns, pk_values] = pk_items(r, d);
    const auto& key_fields = primary_key()->columns;

    std::vector<std::string> set_columns;
    statement result;
    for (size_t i = 0; i < size(); ++i) {
        const field& f = field_at(i);
        if (std::find(key_fields.begin(), key_fields.end(), f.name()) != key_fields.end()) continue;
        set_columns.push_back(f.sql_name());
        result.params.push_back(f.to_backend(r.at(i), d));
    }
    if (set_columns.empty()) {
        throw schema_error("Table " + name() + " has no columns outside its primary key to update");
    }

    result.sql = "UPDATE " + qualified_name(d) + " SET " + d.parameter_values(set_columns, 1) +
                 " WHERE " + d.parameter_values(pk_columns, set_columns.size() + 1, " AND ") + ";";
    result.params.insert(result.params.end(), pk_values.begin(), pk_values.end());
    return result;
}

statement table_schema::delete_sql(const record& r, const dialect& d) const {
    check_record(r);
    auto [pk_columns, pk_values] = pk_items(r, d);
    statement result;
    result.sql = "DELETE FROM " + qualified_name(d) + " WHERE " +
                 d.parameter_values(pk_columns, 1, " AND ") + ";";
    result.params = std::move(pk_values);
    return result;
}

statement table_schema::pk_select_sql(const record& r, const dialect& d) const {
    check_record(r);
    auto [pk_columns, pk_values] = pk_items(r, d);
    statement result;
    result.sql = "SELECT " + column_names_sql(d) + " FROM " + qualified_name(d) + " WHERE " +
                 d.parameter_values(pk_columns, 1, " AND ") + ";";
    result.params = std::move(pk_values);
    return result;
}

statement table_schema::parent_select_sql(const record& r, const table_schema& parent,
                                          const dialect& d) const {
    check_record(r);
    for (const auto* fk : foreign_keys()) {
        if (fk->foreign_table != parent.name()) continue;

        statement result;
        for (const auto& column : fk->columns) {
            const value_t& value = r.get(column);
            if (is_null(value)) {
                throw schema_error("Foreign key column " + column + " of " + name() + " is null");
            }
            result.params.push_back(get_field(column).to_backend(value, d));
        }
        result.sql = "SELECT " + parent.column_names_sql(d) + " FROM " + parent.qualified_name(d) +
                     " WHERE " + d.parameter_values(fk->reference_columns, 1, " AND ") + ";";
        return result;
    }
    throw schema_error("Table " + name() + " has no foreign key referencing " + parent.name());
}

std::string table_schema::create_table_sql(const dialect& d) const {
    std::string result = "CREATE TABLE IF NOT EXISTS " + qualified_name(d) + " (\n    ";
    for (size_t i = 0; i < size(); ++i) {
        if (i != 0) result += ",\n    ";
        result += d.quote_identifier(field_at(i).sql_name()) + " " + field_at(i).sql_type(d);
    }
    for (const auto& c : constraints_) {
        result += ",\n    " + c.sql_ddl(d);
    }
    result += "\n);";
    return result;
}

std::string table_schema::to_string() const {
    std::string result = "table " + record_schema::to_string();
    for (const auto& c : constraints_) {
        result += "\n  " + c.to_string();
    }
    return result;
}

table_schema_ptr make_table(std::string table_name,
                            std::vector<field_ptr> fields,
                            std::vector<constraint> constraints,
                            sql_schema_ptr schema) {
    return std::make_shared<table_schema>(std::move(table_name), std::move(fields),
                                          std::move(constraints), std::move(schema));
}

} // namespace accord
