#include "accord/serialize_json.hpp"
#include "accord/errors.hpp"

namespace accord {

namespace {

constexpr const char* record_tag = "__record__";
constexpr const char* record_list_tag = "__record_list__";
constexpr const char* transaction_tag = "__transaction__";
constexpr const char* version_tag = "__version__";

std::string to_hex(const blob_t& blob) {
    static const char digits[] = "0123456789abcdef";
    std::string result;
    result.reserve(blob.size() * 2);
    for (uint8_t b : blob) {
        result += digits[b >> 4];
        result += digits[b & 0x0f];
    }
    return result;
}

int hex_digit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::optional<blob_t> from_hex(const std::string& text) {
    if (text.size() % 2 != 0) return std::nullopt;
    blob_t result;
    result.reserve(text.size() / 2);
    for (size_t i = 0; i < text.size(); i += 2) {
        int hi = hex_digit(text[i]);
        int lo = hex_digit(text[i + 1]);
        if (hi < 0 || lo < 0) return std::nullopt;
        result.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return result;
}

std::string tag_of(const nlohmann::json& j, const char* tag) {
    if (!j.is_object() || !j.contains(tag) || !j[tag].is_string()) {
        throw validation_error(std::string("JSON object has no ") + tag + " tag");
    }
    return j[tag].get<std::string>();
}

bool is_tag(const std::string& key) {
    return key.size() > 4 && key.compare(0, 2, "__") == 0 && key.compare(key.size() - 2, 2, "__") == 0;
}

} // namespace

// ============================================================================
// Encoding
// ============================================================================

nlohmann::json value_to_json(const value_t& value) {
    return std::visit([](auto&& v) -> nlohmann::json {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            return nullptr;
        } else if constexpr (std::is_same_v<T, blob_t>) {
            return to_hex(v);
        } else if constexpr (std::is_same_v<T, timestamp_t>) {
            return format_timestamp(v);
        } else {
            return v;
        }
    }, value);
}

nlohmann::json record_values_json(const record& r) {
    nlohmann::json j = nlohmann::json::object();
    for (size_t i = 0; i < r.values().size(); ++i) {
        j[r.schema().field_at(i).name()] = value_to_json(r.at(i));
    }
    return j;
}

void to_json(nlohmann::json& j, const record& r) {
    j = record_values_json(r);
    j[record_tag] = r.schema().name();
}

void to_json(nlohmann::json& j, const record_list& list) {
    nlohmann::json values = nlohmann::json::array();
    for (const auto& r : list) {
        values.push_back(record_values_json(r));
    }
    j = nlohmann::json::object();
    j[record_list_tag] = list.schema().name();
    j["values"] = std::move(values);
}

void to_json(nlohmann::json& j, const transaction& t) {
    j = nlohmann::json::object();
    j[transaction_tag] = t.schema().name();
    if (!t.schema().version().empty()) {
        j[version_tag] = t.schema().version();
    }

    const auto& attributes = t.schema().attributes();
    for (size_t i = 0; i < attributes.size(); ++i) {
        std::visit([&](auto&& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, value_t>) {
                j[attributes[i].name] = value_to_json(v);
            } else if constexpr (std::is_same_v<T, query_result>) {
                j[attributes[i].name] = static_cast<const record_list&>(v);
            } else {
                j[attributes[i].name] = v;
            }
        }, t.slot_at(i));
    }
}

// ============================================================================
// Decoding
// ============================================================================

value_t value_from_json(const nlohmann::json& j, const field& f) {
    if (j.is_null()) {
        return f.validate(nullptr);
    }

    value_t value = nullptr;
    switch (f.type()) {
        case value_type::integer:
        case value_type::small_integer:
        case value_type::big_integer:
            if (j.is_number_integer()) value = j.get<int64_t>();
            break;
        case value_type::real:
            if (j.is_number()) value = j.get<double>();
            break;
        case value_type::boolean:
            if (j.is_boolean()) value = j.get<bool>();
            break;
        case value_type::text:
        case value_type::varchar:
        case value_type::fixed_char:
        case value_type::timestamp:
            if (j.is_string()) value = j.get<std::string>();
            break;
        case value_type::blob:
            if (j.is_string()) {
                if (auto blob = from_hex(j.get<std::string>())) value = std::move(*blob);
            }
            break;
    }

    if (is_null(value)) {
        throw validation_error("Cannot decode " + j.dump() + " for field '" + f.name() + "' (" +
                               to_string(f.type()) + ")");
    }
    return f.validate(value);
}

void json_registry::register_record(record_schema_ptr schema) {
    if (!schema) {
        throw schema_error("register_record needs a schema");
    }
    records_[schema->name()] = std::move(schema);
}

void json_registry::register_transaction(transaction_schema_ptr schema) {
    if (!schema) {
        throw schema_error("register_transaction needs a schema");
    }
    for (const auto& a : schema->attributes()) {
        if (a.schema) {
            register_record(a.schema);
        } else if (a.query) {
            register_record(a.query->result_schema());
        }
    }
    transactions_[schema->name()] = std::move(schema);
}

const record_schema_ptr& json_registry::lookup_record(const std::string& name) const {
    auto it = records_.find(name);
    if (it == records_.end()) {
        throw schema_violation_error("Record type " + name + " is not registered");
    }
    return it->second;
}

void json_registry::load_values(record& r, const nlohmann::json& values) const {
    if (!values.is_object()) {
        throw validation_error("Record values must be a JSON object");
    }
    for (const auto& item : values.items()) {
        if (is_tag(item.key())) continue;
        size_t index = r.schema().require_index(item.key());
        r.set_at(index, value_from_json(item.value(), r.schema().field_at(index)));
    }
}

record json_registry::decode_record(const nlohmann::json& j) const {
    record r(lookup_record(tag_of(j, record_tag)));
    load_values(r, j);
    return r;
}

record_list json_registry::decode_record_list(const nlohmann::json& j) const {
    record_list list(lookup_record(tag_of(j, record_list_tag)));
    if (!j.contains("values") || !j["values"].is_array()) {
        throw validation_error("Record list JSON has no values array");
    }
    for (const auto& values : j["values"]) {
        record r(list.schema_ptr());
        load_values(r, values);
        list.append(std::move(r));
    }
    return list;
}

transaction json_registry::decode_transaction(const nlohmann::json& j) const {
    std::string name = tag_of(j, transaction_tag);
    auto it = transactions_.find(name);
    if (it == transactions_.end()) {
        throw schema_violation_error("Transaction type " + name + " is not registered");
    }

    transaction result(it->second);
    for (const auto& item : j.items()) {
        const std::string& key = item.key();
        const nlohmann::json& value = item.value();
        if (is_tag(key)) continue;
        size_t index = result.schema().require_index(key);
        const auto& a = result.schema().attributes()[index];
        switch (a.kind) {
            case attribute_kind::field:
                result.set_value(key, value_from_json(value, *a.field));
                break;
            case attribute_kind::record:
                result.set_record(key, decode_record(value));
                break;
            case attribute_kind::record_list:
                result.set_list(key, decode_record_list(value));
                break;
            case attribute_kind::query_result: {
                auto& target = result.get_query_result(key);
                target.clear();
                for (auto& r : decode_record_list(value)) {
                    target.append(std::move(r));
                }
                break;
            }
        }
    }
    return result;
}

json_registry::decoded json_registry::decode(const std::string& text) const {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        throw validation_error(std::string("Invalid JSON: ") + e.what());
    }

    if (j.is_object()) {
        if (j.contains(transaction_tag)) return decode_transaction(j);
        if (j.contains(record_list_tag)) return decode_record_list(j);
        if (j.contains(record_tag)) return decode_record(j);
    }
    throw validation_error("JSON is not a tagged record, record list or transaction");
}

} // namespace accord
