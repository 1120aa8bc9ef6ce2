#pragma once

#ifdef __cplusplus

#include "dialect.hpp"
#include "sql_schema.hpp"
#include <string>
#include <vector>

namespace accord {

enum class constraint_kind {
    primary_key,
    foreign_key,
    unique,
    check
};

// ============================================================================
// constraint - structural rule on a table. Column lists hold field names;
// the table fills in the matching SQL column names when it is defined.
// ============================================================================

struct constraint {
    constraint_kind kind;
    std::string name;                       ///< optional CONSTRAINT name
    std::vector<std::string> columns;       ///< field names, in key order
    std::vector<std::string> sql_columns;   ///< set by the owning table

    // foreign_key only
    std::string foreign_table;
    sql_schema_ptr foreign_schema;
    std::vector<std::string> reference_columns;  ///< defaults to sql_columns

    // check only
    std::string check_sql;

    /// Table-level DDL clause, e.g. "PRIMARY KEY ("a", "b")"
    std::string sql_ddl(const dialect& d) const;

    std::string to_string() const;
};

constraint primary_key(std::vector<std::string> columns, std::string name = {});

constraint foreign_key(std::vector<std::string> columns,
                       std::string foreign_table,
                       std::vector<std::string> reference_columns = {},
                       sql_schema_ptr foreign_schema = nullptr,
                       std::string name = {});

constraint unique(std::vector<std::string> columns, std::string name = {});

constraint check(std::string sql, std::string name = {});

} // namespace accord

#endif // __cplusplus
