#pragma once

#ifdef __cplusplus

#include "cursor.hpp"
#include "dialect.hpp"
#include "sql_schema.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace accord {

// ============================================================================
// sequence - a database sequence, used as the external generator behind
// sequence_field. Backends without sequences get the table emulation the
// dialect describes.
// ============================================================================

class sequence {
public:
    explicit sequence(std::string name,
                      int64_t start = 1,
                      int64_t interval = 1,
                      value_type index_type = value_type::big_integer,
                      sql_schema_ptr schema = nullptr);

    const std::string& name() const { return name_; }
    int64_t start() const { return start_; }
    int64_t interval() const { return interval_; }
    value_type index_type() const { return index_type_; }
    const sql_schema_ptr& schema() const { return schema_; }

    std::string qualified_name(const dialect& d) const;

    std::vector<std::string> create_sql(const dialect& d) const;
    std::vector<std::string> nextval_sql(const dialect& d) const;
    std::vector<std::string> reset_sql(const dialect& d) const;

    void create(cursor& cur, const dialect& d) const;

    /// Next value of the sequence. Throws db_error when the backend fails or
    /// returns no value.
    int64_t nextval(cursor& cur, const dialect& d) const;

    void reset(cursor& cur, const dialect& d) const;

private:
    std::string name_;
    int64_t start_;
    int64_t interval_;
    value_type index_type_;
    sql_schema_ptr schema_;

    std::vector<std::string> fill(const std::vector<std::string>& templates, const dialect& d) const;
};

} // namespace accord

#endif // __cplusplus
