#include "accord/query.hpp"
#include "accord/errors.hpp"
#include "accord/log.hpp"
#include <cctype>
#include <unordered_map>
#include <unordered_set>

namespace accord {

namespace {

bool is_identifier_start(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool is_identifier_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

size_t identifier_length(const std::string& text, size_t pos) {
    if (pos >= text.size() || !is_identifier_start(text[pos])) return 0;
    size_t end = pos + 1;
    while (end < text.size() && is_identifier_char(text[end])) ++end;
    return end - pos;
}

} // namespace

// ============================================================================
// query_schema
// ============================================================================

query_schema::query_schema(std::string name,
                           std::string text,
                           record_schema_ptr result,
                           std::vector<field_ptr> parameters)
    : name_(std::move(name)),
      text_(std::move(text)),
      result_(std::move(result)),
      parameters_(std::move(parameters)) {
    std::unordered_set<std::string> seen;
    for (const auto& p : parameters_) {
        if (!p) {
            throw schema_error("Query '" + name_ + "' has a null parameter field");
        }
        if (!seen.insert(p->name()).second) {
            throw schema_error("Query '" + name_ + "' declares parameter '" + p->name() + "' twice");
        }
    }
    parse();
}

void query_schema::parse() {
    std::string literal;
    size_t pos = 0;

    auto flush = [&] {
        if (!literal.empty()) {
            segments_.push_back({segment_kind::text, std::move(literal), {}});
            literal.clear();
        }
    };

    while (pos < text_.size()) {
        if (text_[pos] == '{') {
            size_t first_len = identifier_length(text_, pos + 1);
            size_t after = pos + 1 + first_len;
            if (first_len > 0 && after < text_.size()) {
                if (text_[after] == '}') {
                    flush();
                    segments_.push_back({segment_kind::parameter, text_.substr(pos + 1, first_len), {}});
                    pos = after + 1;
                    continue;
                }
                if (text_[after] == '.') {
                    size_t second_len = identifier_length(text_, after + 1);
                    size_t close = after + 1 + second_len;
                    if (second_len > 0 && close < text_.size() && text_[close] == '}') {
                        flush();
                        segments_.push_back({segment_kind::reference,
                                             text_.substr(pos + 1, first_len),
                                             text_.substr(after + 1, second_len)});
                        pos = close + 1;
                        continue;
                    }
                }
            }
        }
        literal += text_[pos++];
    }
    flush();
}

std::optional<size_t> query_schema::parameter_index(const std::string& parameter) const {
    for (size_t i = 0; i < parameters_.size(); ++i) {
        if (parameters_[i]->name() == parameter) return i;
    }
    return std::nullopt;
}

std::vector<std::string> query_schema::placeholders() const {
    std::vector<std::string> result;
    for (const auto& s : segments_) {
        if (s.kind == segment_kind::parameter) {
            result.push_back(s.value);
        }
    }
    return result;
}

std::vector<std::string> query_schema::unbound_placeholders() const {
    std::vector<std::string> result;
    for (const auto& s : segments_) {
        if (s.kind == segment_kind::parameter && !parameter_index(s.value)) {
            result.push_back(s.value);
        }
    }
    return result;
}

std::string query_schema::to_string() const {
    std::string result = "query " + name_ + ": " + text_;
    for (const auto& p : parameters_) {
        result += "\n  " + p->to_string();
    }
    return result;
}

query_schema_ptr make_query(std::string name,
                            std::string text,
                            record_schema_ptr result,
                            std::vector<field_ptr> parameters) {
    return std::make_shared<query_schema>(std::move(name), std::move(text),
                                          std::move(result), std::move(parameters));
}

// ============================================================================
// query
// ============================================================================

query::query(query_schema_ptr schema) : schema_(std::move(schema)) {
    if (!schema_) {
        throw schema_error("query needs a query_schema");
    }
    values_.assign(schema_->parameters().size(), nullptr);
}

query::query(query_schema_ptr schema, std::initializer_list<named_value> values)
    : query(std::move(schema)) {
    for (const auto& [name, value] : values) {
        set_value(name, value);
    }
}

const value_t& query::get(const std::string& parameter) const {
    auto index = schema_->parameter_index(parameter);
    if (!index) {
        throw schema_violation_error("'" + parameter + "' is not a parameter of query " + schema_->name());
    }
    return values_[*index];
}

void query::set_value(const std::string& parameter, value_t value) {
    auto index = schema_->parameter_index(parameter);
    if (!index) {
        throw schema_violation_error("'" + parameter + "' is not a parameter of query " + schema_->name());
    }
    values_[*index] = schema_->parameters()[*index]->validate(value);
}

void query::set_context(const context& ctx) {
    const auto& params = schema_->parameters();
    for (size_t i = 0; i < params.size(); ++i) {
        const std::string& key = params[i]->context_key().value_or(params[i]->name());
        if (const value_t* v = ctx.find(key); v && !is_null(*v)) {
            values_[i] = params[i]->validate(*v);
        }
    }
}

context query::get_context() const {
    context result;
    const auto& params = schema_->parameters();
    for (size_t i = 0; i < params.size(); ++i) {
        result.set(params[i]->name(), values_[i]);
    }
    return result;
}

statement query::query_sql(const dialect& d) const {
    statement result;
    std::unordered_map<std::string, size_t> assigned;
    size_t next_marker = 1;
    const bool reuse = d.binding() != binding_style::positional;

    for (const auto& s : schema_->segments_) {
        switch (s.kind) {
            case query_schema::segment_kind::text:
                result.sql += s.value;
                break;
            case query_schema::segment_kind::reference:
                result.sql += d.qualify_raw(s.value, s.object);
                break;
            case query_schema::segment_kind::parameter: {
                auto index = schema_->parameter_index(s.value);
                if (!index) {
                    throw query_parameter_error("Placeholder {" + s.value + "} in query " + schema_->name() +
                                                " does not match any of its parameters");
                }
                if (reuse) {
                    auto it = assigned.find(s.value);
                    if (it != assigned.end()) {
                        result.sql += d.marker(it->second, s.value);
                        break;
                    }
                    assigned.emplace(s.value, next_marker);
                }
                result.sql += d.marker(next_marker++, s.value);
                const field& parameter = *schema_->parameters()[*index];
                result.params.push_back(parameter.to_backend(values_[*index], d));
                break;
            }
        }
    }
    return result;
}

std::vector<row_t> query::execute(cursor& cur, const dialect& d) const {
    auto stmt = query_sql(d);
    LOG_DEBUG("query", "%s: %s", schema_->name().c_str(), stmt.sql.c_str());
    return cur.execute(stmt.sql, stmt.params);
}

std::vector<record> query::result_records(cursor& cur, const dialect& d) const {
    if (!schema_->result_schema()) {
        throw schema_error("Query " + schema_->name() + " has no result record type");
    }
    std::vector<record> result;
    for (const auto& row : execute(cur, d)) {
        record r(schema_->result_schema());
        r.load_row(row, d);
        result.push_back(std::move(r));
    }
    return result;
}

std::optional<record> query::result_record(cursor& cur, const dialect& d) const {
    auto records = result_records(cur, d);
    if (records.empty()) {
        return std::nullopt;
    }
    return std::move(records.front());
}

column_value_t query::result_single_value(cursor& cur, const dialect& d) const {
    auto rows = execute(cur, d);
    if (rows.empty()) {
        throw db_error("Query " + schema_->name() + " returned no result");
    }
    if (rows.size() != 1 || rows[0].size() != 1) {
        throw db_error("Query " + schema_->name() + " did not return a single value");
    }
    return rows[0][0];
}

} // namespace accord
