#pragma once

#ifdef __cplusplus

#include "table.hpp"
#include <memory>
#include <string>
#include <vector>

namespace accord {

// A named, read-only relation defined by a query. Fields describe the
// view's columns in order. "{schema.object}" references in the query text
// are written out per dialect.
class view_schema : public relation_schema {
public:
    view_schema(std::string view_name,
                std::vector<field_ptr> fields,
                std::string query_text,
                sql_schema_ptr schema = nullptr);

    const std::string& query_text() const { return query_text_; }

    /// Query text with schema references rewritten for the dialect
    std::string definition_sql(const dialect& d) const;

    std::string create_view_sql(const dialect& d) const;

    const view_schema* as_view() const override { return this; }

    std::string to_string() const override;

private:
    std::string query_text_;
};

using view_schema_ptr = std::shared_ptr<const view_schema>;

view_schema_ptr make_view(std::string view_name,
                          std::vector<field_ptr> fields,
                          std::string query_text,
                          sql_schema_ptr schema = nullptr);

} // namespace accord

#endif // __cplusplus
