#include "accord/view.hpp"
#include "accord/errors.hpp"

namespace accord {

view_schema::view_schema(std::string view_name,
                         std::vector<field_ptr> fields,
                         std::string query_text,
                         sql_schema_ptr schema)
    : relation_schema(std::move(view_name), std::move(fields), std::move(schema)),
      query_text_(std::move(query_text)) {
    if (query_text_.empty()) {
        throw schema_error("View " + name() + " needs a defining query");
    }
}

std::string view_schema::definition_sql(const dialect& d) const {
    return rewrite_schema_references(query_text_, d);
}

std::string view_schema::create_view_sql(const dialect& d) const {
    std::string result = "CREATE VIEW IF NOT EXISTS " + qualified_name(d) + " (";
    result += column_names_sql(d);
    result += ") AS\n" + definition_sql(d) + ";";
    return result;
}

std::string view_schema::to_string() const {
    return "view " + record_schema::to_string() + "\n  as " + query_text_;
}

view_schema_ptr make_view(std::string view_name,
                          std::vector<field_ptr> fields,
                          std::string query_text,
                          sql_schema_ptr schema) {
    return std::make_shared<view_schema>(std::move(view_name), std::move(fields),
                                         std::move(query_text), std::move(schema));
}

} // namespace accord
