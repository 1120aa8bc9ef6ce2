#include "accord/logging_cursor.hpp"
#include "accord/log.hpp"

namespace accord {

namespace {

std::string describe_params(const std::vector<column_value_t>& params) {
    std::string result = "[";
    for (size_t i = 0; i < params.size(); ++i) {
        if (i != 0) result += ", ";
        result += describe(params[i]);
    }
    result += "]";
    return result;
}

} // namespace

std::vector<row_t> logging_cursor::execute(const std::string& sql,
                                           const std::vector<column_value_t>& params) {
    LOG_INFO("cursor", "%s %s", sql.c_str(), describe_params(params).c_str());
    auto rows = inner_.execute(sql, params);
    history_.push_back({sql, params, rows.size()});
    return rows;
}

void logging_cursor::begin(isolation_level level) {
    LOG_INFO("cursor", "BEGIN");
    inner_.begin(level);
    history_.push_back({"BEGIN", {}, 0});
}

void logging_cursor::commit() {
    LOG_INFO("cursor", "COMMIT");
    inner_.commit();
    history_.push_back({"COMMIT", {}, 0});
}

void logging_cursor::rollback() {
    LOG_INFO("cursor", "ROLLBACK");
    inner_.rollback();
    history_.push_back({"ROLLBACK", {}, 0});
}

size_t logging_cursor::count_statements(const std::string& prefix) const {
    size_t count = 0;
    for (const auto& e : history_) {
        if (e.sql.compare(0, prefix.size(), prefix) == 0) ++count;
    }
    return count;
}

} // namespace accord
