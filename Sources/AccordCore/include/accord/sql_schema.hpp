#pragma once

#ifdef __cplusplus

#include "dialect.hpp"
#include <memory>
#include <string>

namespace accord {

// A namespace grouping tables, views and sequences. Backends with schema
// support write "schema.object"; the others get "schema_object".
class sql_schema {
public:
    explicit sql_schema(std::string name);

    const std::string& name() const { return name_; }

    /// Quoted, qualified name for generated SQL
    std::string qualified_name(const std::string& object, const dialect& d) const;

    /// Unquoted form for hand-written SQL text
    std::string qualified_name_raw(const std::string& object, const dialect& d) const;

private:
    std::string name_;
};

using sql_schema_ptr = std::shared_ptr<const sql_schema>;

/// Rewrite every "{schema.object}" reference in hand-written SQL to the
/// dialect's qualified form. Other braces are left untouched.
std::string rewrite_schema_references(const std::string& text, const dialect& d);

} // namespace accord

#endif // __cplusplus
