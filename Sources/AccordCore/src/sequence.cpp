#include "accord/sequence.hpp"
#include "accord/errors.hpp"
#include "accord/log.hpp"

namespace accord {

namespace {

void replace_all(std::string& text, const std::string& from, const std::string& to) {
    size_t pos = 0;
    while ((pos = text.find(from, pos)) != std::string::npos) {
        text.replace(pos, from.size(), to);
        pos += to.size();
    }
}

} // namespace

sequence::sequence(std::string name, int64_t start, int64_t interval,
                   value_type index_type, sql_schema_ptr schema)
    : name_(std::move(name)), start_(start), interval_(interval),
      index_type_(index_type), schema_(std::move(schema)) {
    if (name_.empty()) {
        throw schema_error("sequence needs a name");
    }
    if (interval_ == 0) {
        throw schema_error("sequence '" + name_ + "' has a zero interval");
    }
}

std::string sequence::qualified_name(const dialect& d) const {
    if (schema_) {
        return schema_->qualified_name_raw(name_, d);
    }
    return name_;
}

std::vector<std::string> sequence::fill(const std::vector<std::string>& templates,
                                        const dialect& d) const {
    std::vector<std::string> result;
    result.reserve(templates.size());
    for (auto text : templates) {
        replace_all(text, "{name}", qualified_name(d));
        replace_all(text, "{start}", std::to_string(start_));
        replace_all(text, "{interval}", std::to_string(interval_));
        replace_all(text, "{index_type}", d.column_type(index_type_));
        result.push_back(std::move(text));
    }
    return result;
}

std::vector<std::string> sequence::create_sql(const dialect& d) const {
    return fill(d.create_sequence_sql(), d);
}

std::vector<std::string> sequence::nextval_sql(const dialect& d) const {
    return fill(d.nextval_sequence_sql(), d);
}

std::vector<std::string> sequence::reset_sql(const dialect& d) const {
    return fill(d.reset_sequence_sql(), d);
}

void sequence::create(cursor& cur, const dialect& d) const {
    for (const auto& sql : create_sql(d)) {
        cur.execute(sql);
    }
}

int64_t sequence::nextval(cursor& cur, const dialect& d) const {
    std::vector<row_t> rows;
    for (const auto& sql : nextval_sql(d)) {
        rows = cur.execute(sql);
    }
    if (rows.size() != 1 || rows[0].size() != 1) {
        throw db_error("Sequence '" + name_ + "' did not return a value");
    }
    value_t value = d.from_backend(rows[0][0], index_type_);
    auto next = value_as<int64_t>(value);
    if (!next) {
        throw db_error("Sequence '" + name_ + "' returned " + describe(rows[0][0]));
    }
    LOG_DEBUG("sequence", "%s -> %lld", name_.c_str(), static_cast<long long>(*next));
    return *next;
}

void sequence::reset(cursor& cur, const dialect& d) const {
    for (const auto& sql : reset_sql(d)) {
        cur.execute(sql);
    }
}

} // namespace accord
