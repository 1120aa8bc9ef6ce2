#include "accord/query_result.hpp"
#include "accord/errors.hpp"
#include "accord/log.hpp"

namespace accord {

namespace {

const record_schema_ptr& result_schema_of(const query_schema_ptr& schema) {
    if (!schema) {
        throw schema_error("query_result needs a query_schema");
    }
    if (!schema->result_schema()) {
        throw schema_error("Query " + schema->name() + " has no result record type");
    }
    return schema->result_schema();
}

} // namespace

query_result::query_result(query_schema_ptr schema, isolation_level isolation)
    : record_list(result_schema_of(schema)),
      query_(std::make_unique<query>(std::move(schema))),
      isolation_(isolation) {}

query_result::query_result(const query_result& other)
    : record_list(other),
      query_(std::make_unique<query>(*other.query_)),
      isolation_(other.isolation_) {}

query_result& query_result::operator=(const query_result& other) {
    if (this != &other) {
        record_list::operator=(other);
        query_ = std::make_unique<query>(*other.query_);
        isolation_ = other.isolation_;
    }
    return *this;
}

query_result::query_result(query_result&& other)
    : record_list(std::move(other)),
      query_(std::make_unique<query>(*other.query_)),
      isolation_(other.isolation_) {}

query_result& query_result::operator=(query_result&& other) {
    if (this != &other) {
        record_list::operator=(std::move(other));
        query_ = std::make_unique<query>(*other.query_);
        isolation_ = other.isolation_;
    }
    return *this;
}

void query_result::refresh(cursor& cur, const dialect& d) {
    clear();
    transaction_scope scope(cur, isolation_);
    load(cur, d);
    scope.commit();
}

void query_result::load(cursor& cur, const dialect& d) {
    auto records = query_->result_records(cur, d);
    clear();
    for (auto& r : records) {
        append(std::move(r));
    }
    LOG_DEBUG("query_result", "%s loaded %zu rows", query_->schema().name().c_str(), size());
}

} // namespace accord
