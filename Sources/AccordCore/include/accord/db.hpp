#pragma once

#ifdef __cplusplus

#include "cursor.hpp"
#include "errors.hpp"
#include "types.hpp"
#include <sqlite3.h>
#include <string>
#include <vector>

namespace accord {

struct configuration {
    /// Database file path. Use ":memory:" for an in-memory database.
    std::string path = ":memory:";

    /// Open with SQLITE_OPEN_READONLY; no journal mode changes.
    bool read_only = false;

    /// Issue PRAGMA foreign_keys = ON after opening.
    bool foreign_keys = true;

    /// sqlite3_busy_timeout in milliseconds. 0 disables the busy handler.
    int busy_timeout_ms = 5000;

    configuration() = default;

    explicit configuration(const std::string& p) : path(p) {}
};

// sqlite3 connection implementing the cursor interface
class sqlite_database : public cursor {
public:
    explicit sqlite_database(const configuration& config = {});
    ~sqlite_database() override;

    // Non-copyable
    sqlite_database(const sqlite_database&) = delete;
    sqlite_database& operator=(const sqlite_database&) = delete;

    // Moveable
    sqlite_database(sqlite_database&& other) noexcept;
    sqlite_database& operator=(sqlite_database&& other) noexcept;

    std::vector<row_t> execute(const std::string& sql,
                               const std::vector<column_value_t>& params = {}) override;

    void begin(isolation_level level = isolation_level::serializable) override;
    void commit() override;
    void rollback() override;

    bool is_in_transaction() const;
    bool table_exists(const std::string& name) const;

    const configuration& config() const { return config_; }

    // Raw access (use sparingly)
    sqlite3* handle() const { return db_; }

private:
    sqlite3* db_ = nullptr;
    configuration config_;

    void exec_simple(const char* sql);
    void bind_value(sqlite3_stmt* stmt, int index, const column_value_t& value);
    column_value_t extract_column(sqlite3_stmt* stmt, int index);
};

} // namespace accord

#endif // __cplusplus
