#pragma once

#ifdef __cplusplus

#include "cursor.hpp"
#include <string>
#include <vector>

namespace accord {

// ============================================================================
// logging_cursor - wraps another cursor, logs every call at info level and
// records it in history() so callers can inspect what was sent.
// ============================================================================

class logging_cursor : public cursor {
public:
    struct event {
        std::string sql;                     ///< statement text, or BEGIN/COMMIT/ROLLBACK
        std::vector<column_value_t> params;
        size_t rows = 0;                     ///< rows returned by execute()
    };

    explicit logging_cursor(cursor& inner) : inner_(inner) {}

    std::vector<row_t> execute(const std::string& sql,
                               const std::vector<column_value_t>& params = {}) override;

    void begin(isolation_level level = isolation_level::serializable) override;
    void commit() override;
    void rollback() override;

    const std::vector<event>& history() const { return history_; }
    void clear_history() { history_.clear(); }

    /// Number of recorded events whose SQL starts with the given prefix.
    size_t count_statements(const std::string& prefix) const;

private:
    cursor& inner_;
    std::vector<event> history_;
};

} // namespace accord

#endif // __cplusplus
