#include "accord/record_list.hpp"
#include "accord/errors.hpp"

namespace accord {

record_list::record_list(record_schema_ptr schema) : schema_(std::move(schema)) {
    if (!schema_) {
        throw schema_error("record_list needs a schema");
    }
}

record_list::record_list(record_schema_ptr schema, std::vector<record> records)
    : record_list(std::move(schema)) {
    for (auto& r : records) {
        append(std::move(r));
    }
}

record_list::record_list(record_list&& other) noexcept
    : schema_(other.schema_), records_(std::move(other.records_)) {
    other.records_.clear();
}

record_list& record_list::operator=(record_list&& other) noexcept {
    if (this != &other) {
        schema_ = other.schema_;
        records_ = std::move(other.records_);
        other.records_.clear();
    }
    return *this;
}

void record_list::check(const record& r) const {
    if (r.schema_ptr() != schema_) {
        throw schema_violation_error("A " + r.schema().name() + " record cannot be stored in a list of " +
                                     schema_->name());
    }
}

void record_list::check_index(size_t index, size_t limit, const char* operation) const {
    if (index >= limit) {
        throw schema_violation_error("Position " + std::to_string(index) + " is outside the list of " +
                                     std::to_string(records_.size()) + " " + schema_->name() +
                                     " records (" + operation + ")");
    }
}

void record_list::append(record r) {
    check(r);
    records_.push_back(std::move(r));
}

void record_list::insert(size_t pos, record r) {
    check(r);
    check_index(pos, records_.size() + 1, "insert");
    records_.insert(records_.begin() + static_cast<std::ptrdiff_t>(pos), std::move(r));
}

void record_list::set(size_t index, record r) {
    check(r);
    check_index(index, records_.size(), "set");
    records_[index] = std::move(r);
}

record& record_list::emplace(std::vector<value_t> values) {
    records_.emplace_back(schema_, std::move(values));
    return records_.back();
}

void record_list::erase(size_t index) {
    check_index(index, records_.size(), "erase");
    records_.erase(records_.begin() + static_cast<std::ptrdiff_t>(index));
}

projection record_list::project(const std::string& field_name) const {
    return projection(records_, schema_->require_index(field_name));
}

bool record_list::operator==(const record_list& other) const {
    return schema_ == other.schema_ && records_ == other.records_;
}

std::string record_list::to_string() const {
    std::string result = schema_->name() + " [";
    for (const auto& r : records_) {
        result += "\n  " + r.to_string();
    }
    result += records_.empty() ? "]" : "\n]";
    return result;
}

} // namespace accord
