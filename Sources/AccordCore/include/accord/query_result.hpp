#pragma once

#ifdef __cplusplus

#include "cursor.hpp"
#include "query.hpp"
#include "record_list.hpp"
#include <memory>

namespace accord {

// ============================================================================
// query_result - record list filled from the query instance it owns. The
// query's parameters are set (directly or from a context) before refresh.
// ============================================================================

class query_result : public record_list {
public:
    explicit query_result(query_schema_ptr schema,
                          isolation_level isolation = isolation_level::serializable);

    query_result(const query_result& other);
    query_result& operator=(const query_result& other);
    /// A moved-from result is empty and keeps a copy of the query, so it
    /// can still be refreshed.
    query_result(query_result&& other);
    query_result& operator=(query_result&& other);

    query& get_query() { return *query_; }
    const query& get_query() const { return *query_; }

    isolation_level isolation() const { return isolation_; }

    void set_context(const context& ctx) { query_->set_context(ctx); }
    context get_context() const { return query_->get_context(); }

    /// Clear, then repopulate inside a scope of its own
    void refresh(cursor& cur, const dialect& d);

    /// Replace the contents with the query's rows inside the caller's scope
    void load(cursor& cur, const dialect& d);

private:
    std::unique_ptr<query> query_;
    isolation_level isolation_;
};

} // namespace accord

#endif // __cplusplus
