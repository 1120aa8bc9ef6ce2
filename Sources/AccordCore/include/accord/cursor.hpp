#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include <string>
#include <vector>

namespace accord {

// Isolation requested when a scope opens. `manual` means the caller manages
// the database transaction and no BEGIN/COMMIT/ROLLBACK is issued.
enum class isolation_level {
    manual,
    read_uncommitted,
    read_committed,
    repeatable_read,
    serializable
};

// ============================================================================
// cursor - the database connection accord drives. Everything else about the
// connection (pooling, reconnects, isolation guarantees) belongs to the
// implementation.
// ============================================================================

class cursor {
public:
    virtual ~cursor() = default;

    /// Execute one statement with bound parameters and return its rows
    /// (empty for statements that return none). Throws db_error.
    virtual std::vector<row_t> execute(const std::string& sql,
                                       const std::vector<column_value_t>& params = {}) = 0;

    virtual void begin(isolation_level level = isolation_level::serializable) = 0;
    virtual void commit() = 0;
    virtual void rollback() = 0;
};

// RAII transaction guard: begins on construction, rolls back on destruction
// unless committed or rolled back explicitly.
class transaction_scope {
public:
    transaction_scope(cursor& cur, isolation_level level);
    ~transaction_scope();

    transaction_scope(const transaction_scope&) = delete;
    transaction_scope& operator=(const transaction_scope&) = delete;

    void commit();
    void rollback();

    bool managed() const { return managed_; }
    bool completed() const { return completed_; }

private:
    cursor& cursor_;
    bool managed_;
    bool completed_ = false;
};

} // namespace accord

#endif // __cplusplus
