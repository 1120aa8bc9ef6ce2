#include "accord/field.hpp"
#include "accord/errors.hpp"
#include "accord/log.hpp"
#include "accord/query.hpp"
#include "accord/sequence.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace accord {

namespace {

template<typename Int>
value_t checked_integer(const field& f, const value_t& value) {
    const auto* i = std::get_if<int64_t>(&value);
    if (!i) {
        throw validation_error("Field '" + f.name() + "' can only be set to integer values, not " +
                               describe(value));
    }
    if (*i < static_cast<int64_t>(std::numeric_limits<Int>::min()) ||
        *i > static_cast<int64_t>(std::numeric_limits<Int>::max())) {
        throw validation_error("Value " + std::to_string(*i) + " is out of range for field '" +
                               f.name() + "' (" + to_string(f.type()) + ")");
    }
    return *i;
}

size_t utf8_length(const std::string& s) {
    size_t count = 0;
    for (unsigned char c : s) {
        if ((c & 0xC0) != 0x80) ++count;
    }
    return count;
}

// Byte offset just past the first `chars` code points
size_t utf8_prefix_bytes(const std::string& s, size_t chars) {
    size_t seen = 0;
    for (size_t i = 0; i < s.size(); ++i) {
        if ((static_cast<unsigned char>(s[i]) & 0xC0) != 0x80) {
            if (seen == chars) return i;
            ++seen;
        }
    }
    return s.size();
}

} // namespace

// ============================================================================
// field
// ============================================================================

field::field(std::string name, value_type type, field_options options)
    : name_(std::move(name)),
      sql_name_(options.sql_name.empty() ? name_ : std::move(options.sql_name)),
      type_(type),
      nullable_(options.nullable),
      context_key_(std::move(options.context_key)),
      query_(std::move(options.query)) {
    if (name_.empty()) {
        throw schema_error("Field name cannot be empty");
    }
}

value_t field::validate(const value_t& value) const {
    if (is_null(value)) {
        if (!nullable_) {
            throw validation_error("Field '" + name_ + "' can not be null");
        }
        return nullptr;
    }
    return convert(value);
}

value_t field::resolve(const value_t& stored, const context* ctx) const {
    if (ctx && context_key_) {
        if (const value_t* v = ctx->find(*context_key_); v && !is_null(*v)) {
            return *v;
        }
    }
    return stored;
}

value_t field::refresh(value_t& slot, context* ctx, const field_source* source) const {
    if (ctx && context_key_ && ctx->has_value(*context_key_)) {
        slot = validate(*ctx->find(*context_key_));
        return slot;
    }

    if (query_ && source) {
        accord::query q(query_);
        if (ctx) {
            q.set_context(*ctx);
        }
        auto result = q.result_single_value(source->cur, source->dia);
        slot = from_backend(result, source->dia);
        LOG_DEBUG("field", "%s refreshed from query %s: %s",
                  name_.c_str(), query_->name().c_str(), describe(slot).c_str());
    }
    return slot;
}

value_t field::update(value_t& slot, context* ctx, const field_source& source) const {
    value_t value = refresh(slot, ctx, &source);
    if (ctx && context_key_ && !is_null(value)) {
        ctx->set(*context_key_, value);
    }
    return value;
}

std::string field::sql_type(const dialect& d) const {
    std::string result = d.column_type(type_, length());
    if (!nullable_) {
        result += " NOT NULL";
    }
    return result;
}

column_value_t field::to_backend(const value_t& value, const dialect& d) const {
    return d.to_backend(value);
}

value_t field::from_backend(const column_value_t& value, const dialect& d) const {
    return validate(d.from_backend(value, type_));
}

std::string field::to_string() const {
    std::string result = name_ + " (" + accord::to_string(type_);
    if (length() > 0) {
        result += "(" + std::to_string(length()) + ")";
    }
    if (sql_name_ != name_) {
        result += " as " + sql_name_;
    }
    if (context_key_) {
        result += ", context " + *context_key_;
    }
    if (!nullable_) {
        result += ", not null";
    }
    result += ")";
    return result;
}

void field::reject(const value_t& value, const std::string& reason) const {
    throw validation_error("Field '" + name_ + "' " + reason + ", not " + describe(value));
}

// ============================================================================
// Concrete kinds
// ============================================================================

value_t int_field::convert(const value_t& value) const {
    return checked_integer<int32_t>(*this, value);
}

value_t small_int_field::convert(const value_t& value) const {
    return checked_integer<int16_t>(*this, value);
}

value_t big_int_field::convert(const value_t& value) const {
    return checked_integer<int64_t>(*this, value);
}

value_t real_field::convert(const value_t& value) const {
    if (const auto* d = std::get_if<double>(&value)) return *d;
    if (const auto* i = std::get_if<int64_t>(&value)) return static_cast<double>(*i);
    reject(value, "can only be set to numeric values");
}

value_t boolean_field::convert(const value_t& value) const {
    if (const auto* b = std::get_if<bool>(&value)) return *b;
    reject(value, "can only be set to boolean values");
}

value_t text_field::convert(const value_t& value) const {
    if (const auto* s = std::get_if<std::string>(&value)) return *s;
    reject(value, "can only be set to text values");
}

value_t varchar_field::convert(const value_t& value) const {
    const auto* s = std::get_if<std::string>(&value);
    if (!s) {
        reject(value, "can only be set to text values");
    }
    size_t chars = utf8_length(*s);
    if (chars <= max_length_) {
        return *s;
    }
    if (silent_truncate_) {
        return s->substr(0, utf8_prefix_bytes(*s, max_length_));
    }
    throw validation_error("Field '" + name() + "' is limited to " + std::to_string(max_length_) +
                           " characters, value has " + std::to_string(chars));
}

value_t char_field::convert(const value_t& value) const {
    const auto* s = std::get_if<std::string>(&value);
    if (!s) {
        reject(value, "can only be set to text values");
    }
    size_t chars = utf8_length(*s);
    if (chars > length_) {
        throw validation_error("Field '" + name() + "' holds " + std::to_string(length_) +
                               " characters, value has " + std::to_string(chars));
    }
    return *s;
}

value_t blob_field::convert(const value_t& value) const {
    if (const auto* b = std::get_if<blob_t>(&value)) return *b;
    reject(value, "can only be set to blob values");
}

value_t timestamp_field::convert(const value_t& value) const {
    if (const auto* t = std::get_if<timestamp_t>(&value)) return *t;
    if (const auto* s = std::get_if<std::string>(&value)) {
        if (auto ts = parse_timestamp(*s)) return *ts;
    }
    reject(value, "can only be set to timestamps");
}

// ============================================================================
// enum_field
// ============================================================================

enum_field::enum_field(std::string name, std::vector<std::string> names, std::string enum_sql,
                       field_options options)
    : field(std::move(name), value_type::small_integer, std::move(options)),
      names_(std::move(names)), enum_sql_(std::move(enum_sql)) {
    if (names_.empty()) {
        throw schema_error("enum_field '" + this->name() + "' needs at least one name");
    }
    if (names_.size() > static_cast<size_t>(std::numeric_limits<int16_t>::max())) {
        throw schema_error("enum_field '" + this->name() + "' has too many names");
    }
    for (size_t i = 0; i < names_.size(); ++i) {
        if (std::find(names_.begin(), names_.begin() + i, names_[i]) != names_.begin() + i) {
            throw schema_error("enum_field '" + this->name() + "' lists '" + names_[i] + "' twice");
        }
    }
}

const std::string& enum_field::name_of(int64_t ordinal) const {
    if (ordinal < 0 || static_cast<size_t>(ordinal) >= names_.size()) {
        throw validation_error("Field '" + name() + "' has no value with ordinal " +
                               std::to_string(ordinal));
    }
    return names_[static_cast<size_t>(ordinal)];
}

std::optional<int64_t> enum_field::ordinal_of(const std::string& value_name) const {
    auto it = std::find(names_.begin(), names_.end(), value_name);
    if (it == names_.end()) return std::nullopt;
    return static_cast<int64_t>(it - names_.begin());
}

value_t enum_field::convert(const value_t& value) const {
    if (const auto* i = std::get_if<int64_t>(&value)) {
        name_of(*i);
        return *i;
    }
    if (const auto* s = std::get_if<std::string>(&value)) {
        if (auto ordinal = ordinal_of(*s)) return *ordinal;
        reject(value, "has no value with that name");
    }
    reject(value, "can only be set to an enum name or ordinal");
}

std::string enum_field::sql_type(const dialect& d) const {
    if (!d.enum_support()) {
        return field::sql_type(d);
    }
    std::string result = enum_sql_;
    if (!nullable()) {
        result += " NOT NULL";
    }
    return result;
}

column_value_t enum_field::to_backend(const value_t& value, const dialect& d) const {
    if (const auto* i = std::get_if<int64_t>(&value); i && d.enum_support()) {
        return name_of(*i);
    }
    return field::to_backend(value, d);
}

value_t enum_field::from_backend(const column_value_t& value, const dialect& d) const {
    if (const auto* s = std::get_if<std::string>(&value)) {
        return validate(*s);
    }
    return field::from_backend(value, d);
}

// ============================================================================
// row_enum_field
// ============================================================================

namespace {

field_options with_context_key(field_options options, std::string key) {
    options.context_key = std::move(key);
    options.nullable = false;
    return options;
}

} // namespace

row_enum_field::row_enum_field(std::string name, std::string context_key, int64_t starting_number,
                               field_options options)
    : int_field(std::move(name), with_context_key(std::move(options), std::move(context_key))),
      starting_number_(starting_number) {}

value_t row_enum_field::refresh(value_t& slot, context* ctx, const field_source*) const {
    if (!ctx) {
        return slot;
    }
    const std::string& key = *context_key();
    int64_t next = starting_number_;
    if (const value_t* current = ctx->find(key)) {
        if (auto n = value_as<int64_t>(*current)) {
            next = *n + 1;
        }
    }
    ctx->set(key, next);
    slot = validate(next);
    return slot;
}

// ============================================================================
// sequence_field
// ============================================================================

sequence_field::sequence_field(std::string name, std::shared_ptr<const sequence> seq,
                               field_options options)
    : big_int_field(std::move(name), std::move(options)), sequence_(std::move(seq)) {
    if (!sequence_) {
        throw schema_error("sequence_field '" + this->name() + "' needs a sequence");
    }
}

value_t sequence_field::update(value_t& slot, context* ctx, const field_source& source) const {
    int64_t next = 0;
    try {
        next = sequence_->nextval(source.cur, source.dia);
    } catch (const db_error& e) {
        LOG_ERROR("field", "Sequence %s failed for %s: %s",
                  sequence_->name().c_str(), name().c_str(), e.what());
        throw generation_error("Could not draw a value from sequence '" + sequence_->name() +
                               "' for field '" + name() + "': " + e.what());
    }
    slot = validate(next);
    if (ctx && context_key()) {
        ctx->set(*context_key(), slot);
    }
    return slot;
}

// ============================================================================
// utc_now_timestamp_field
// ============================================================================

value_t utc_now_timestamp_field::update(value_t& slot, context* ctx, const field_source&) const {
    auto now = std::chrono::time_point_cast<std::chrono::microseconds>(std::chrono::system_clock::now());
    slot = timestamp_t(now);
    if (ctx && context_key()) {
        ctx->set(*context_key(), slot);
    }
    return slot;
}

} // namespace accord
