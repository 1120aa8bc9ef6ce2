#include "accord/record.hpp"
#include "accord/errors.hpp"
#include <unordered_set>

namespace accord {

// ============================================================================
// record_schema
// ============================================================================

record_schema::record_schema(std::string name, std::vector<field_ptr> fields)
    : name_(std::move(name)), fields_(std::move(fields)) {
    std::unordered_set<std::string> seen;
    for (const auto& f : fields_) {
        if (!f) {
            throw schema_error("Record '" + name_ + "' has a null field");
        }
        if (!seen.insert(f->name()).second) {
            throw schema_error("Record '" + name_ + "' declares field '" + f->name() + "' twice");
        }
    }
}

std::optional<size_t> record_schema::index_of(const std::string& field_name) const {
    for (size_t i = 0; i < fields_.size(); ++i) {
        if (fields_[i]->name() == field_name) return i;
    }
    return std::nullopt;
}

size_t record_schema::require_index(const std::string& field_name) const {
    auto index = index_of(field_name);
    if (!index) {
        throw schema_violation_error("'" + field_name + "' is not a field of " + name_);
    }
    return *index;
}

const field& record_schema::get_field(const std::string& field_name) const {
    return *fields_[require_index(field_name)];
}

std::vector<std::string> record_schema::field_names() const {
    std::vector<std::string> names;
    names.reserve(fields_.size());
    for (const auto& f : fields_) {
        names.push_back(f->name());
    }
    return names;
}

std::string record_schema::column_names_sql(const dialect& d) const {
    std::string result;
    for (size_t i = 0; i < fields_.size(); ++i) {
        if (i != 0) result += ", ";
        result += d.quote_identifier(fields_[i]->sql_name());
    }
    return result;
}

std::string record_schema::to_string() const {
    std::string result = name_ + " {\n";
    for (const auto& f : fields_) {
        result += "  " + f->to_string() + "\n";
    }
    result += "}";
    return result;
}

record_schema_ptr make_record_schema(std::string name, std::vector<field_ptr> fields) {
    return std::make_shared<record_schema>(std::move(name), std::move(fields));
}

// ============================================================================
// record
// ============================================================================

record::record(record_schema_ptr schema) : schema_(std::move(schema)) {
    if (!schema_) {
        throw schema_error("record needs a schema");
    }
    values_.assign(schema_->size(), nullptr);
}

record::record(record_schema_ptr schema, std::vector<value_t> values) : record(std::move(schema)) {
    if (values.size() != values_.size()) {
        throw schema_violation_error(std::to_string(values_.size()) + " values required for " +
                                     schema_->name() + ", " + std::to_string(values.size()) +
                                     " supplied");
    }
    for (size_t i = 0; i < values.size(); ++i) {
        set_at(i, std::move(values[i]));
    }
}

record::record(record_schema_ptr schema, std::initializer_list<named_value> values)
    : record(std::move(schema)) {
    for (const auto& [name, value] : values) {
        set_at(schema_->require_index(name), value);
    }
}

const value_t& record::get(const std::string& field_name) const {
    return values_[schema_->require_index(field_name)];
}

void record::set_at(size_t index, value_t value) {
    if (index >= values_.size()) {
        throw schema_violation_error("Field index " + std::to_string(index) + " is out of range for " +
                                     schema_->name());
    }
    values_[index] = schema_->field_at(index).validate(value);
}

void record::clear() {
    for (auto& v : values_) {
        v = nullptr;
    }
}

void record::propagate(context& ctx) {
    for (size_t i = 0; i < values_.size(); ++i) {
        schema_->field_at(i).refresh(values_[i], &ctx, nullptr);
    }
}

context record::context_values_stored() const {
    context result;
    for (size_t i = 0; i < values_.size(); ++i) {
        const field& f = schema_->field_at(i);
        if (!f.links_context() || is_null(values_[i])) continue;
        if (!result.contains(*f.context_key())) {
            result.set(*f.context_key(), values_[i]);
        }
    }
    return result;
}

void record::load_row(const row_t& row, const dialect& d) {
    if (row.size() != values_.size()) {
        throw db_error("Result row has " + std::to_string(row.size()) + " columns, " +
                       schema_->name() + " has " + std::to_string(values_.size()) + " fields");
    }
    for (size_t i = 0; i < row.size(); ++i) {
        const field& f = schema_->field_at(i);
        values_[i] = f.from_backend(row[i], d);
    }
}

std::vector<column_value_t> record::backend_values(const dialect& d) const {
    std::vector<column_value_t> result;
    result.reserve(values_.size());
    for (size_t i = 0; i < values_.size(); ++i) {
        result.push_back(schema_->field_at(i).to_backend(values_[i], d));
    }
    return result;
}

bool record::operator==(const record& other) const {
    return schema_ == other.schema_ && values_ == other.values_;
}

std::string record::to_string() const {
    std::string result = schema_->name() + "(";
    for (size_t i = 0; i < values_.size(); ++i) {
        if (i != 0) result += ", ";
        result += schema_->field_at(i).name() + "=" + describe(values_[i]);
    }
    result += ")";
    return result;
}

} // namespace accord
