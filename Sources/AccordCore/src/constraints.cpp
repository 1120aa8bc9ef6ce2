#include "accord/constraints.hpp"
#include "accord/errors.hpp"

namespace accord {

namespace {

std::string quoted_list(const std::vector<std::string>& names, const dialect& d) {
    std::string result;
    for (size_t i = 0; i < names.size(); ++i) {
        if (i != 0) result += ", ";
        result += d.quote_identifier(names[i]);
    }
    return result;
}

std::string plain_list(const std::vector<std::string>& names) {
    std::string result;
    for (size_t i = 0; i < names.size(); ++i) {
        if (i != 0) result += ", ";
        result += names[i];
    }
    return result;
}

constraint columns_constraint(constraint_kind kind, std::vector<std::string> columns, std::string name) {
    if (columns.empty()) {
        throw schema_error("Constraint needs at least one column");
    }
    constraint c{};
    c.kind = kind;
    c.name = std::move(name);
    c.columns = std::move(columns);
    return c;
}

} // namespace

constraint primary_key(std::vector<std::string> columns, std::string name) {
    return columns_constraint(constraint_kind::primary_key, std::move(columns), std::move(name));
}

constraint foreign_key(std::vector<std::string> columns,
                       std::string foreign_table,
                       std::vector<std::string> reference_columns,
                       sql_schema_ptr foreign_schema,
                       std::string name) {
    if (foreign_table.empty()) {
        throw schema_error("Foreign key needs a referenced table");
    }
    if (!reference_columns.empty() && reference_columns.size() != columns.size()) {
        throw schema_error("Foreign key on " + plain_list(columns) + " references " +
                           std::to_string(reference_columns.size()) + " columns");
    }
    auto c = columns_constraint(constraint_kind::foreign_key, std::move(columns), std::move(name));
    c.foreign_table = std::move(foreign_table);
    c.foreign_schema = std::move(foreign_schema);
    c.reference_columns = std::move(reference_columns);
    return c;
}

constraint unique(std::vector<std::string> columns, std::string name) {
    return columns_constraint(constraint_kind::unique, std::move(columns), std::move(name));
}

constraint check(std::string sql, std::string name) {
    if (sql.empty()) {
        throw schema_error("Check constraint needs an expression");
    }
    constraint c{};
    c.kind = constraint_kind::check;
    c.name = std::move(name);
    c.check_sql = std::move(sql);
    return c;
}

std::string constraint::sql_ddl(const dialect& d) const {
    std::string result;
    if (!name.empty()) {
        result = "CONSTRAINT " + d.quote_identifier(name) + " ";
    }
    switch (kind) {
        case constraint_kind::primary_key:
            result += "PRIMARY KEY (" + quoted_list(sql_columns, d) + ")";
            break;
        case constraint_kind::foreign_key: {
            std::string table = foreign_schema ? foreign_schema->qualified_name(foreign_table, d)
                                               : d.quote_identifier(foreign_table);
            result += "FOREIGN KEY (" + quoted_list(sql_columns, d) + ") REFERENCES " + table +
                      " (" + quoted_list(reference_columns, d) + ")";
            break;
        }
        case constraint_kind::unique:
            result += "UNIQUE (" + quoted_list(sql_columns, d) + ")";
            break;
        case constraint_kind::check:
            result += "CHECK (" + check_sql + ")";
            break;
    }
    return result;
}

std::string constraint::to_string() const {
    switch (kind) {
        case constraint_kind::primary_key:
            return "primary key (" + plain_list(columns) + ")";
        case constraint_kind::foreign_key:
            return "foreign key (" + plain_list(columns) + ") -> " + foreign_table;
        case constraint_kind::unique:
            return "unique (" + plain_list(columns) + ")";
        case constraint_kind::check:
            return "check (" + check_sql + ")";
    }
    return "constraint";
}

} // namespace accord
