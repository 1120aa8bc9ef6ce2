#pragma once

#ifdef __cplusplus

#include "record.hpp"
#include "record_list.hpp"
#include "transaction.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <unordered_map>
#include <variant>

// ============================================================================
// JSON encoding of records, record lists and transactions.
//
// Objects carry a tag naming their schema so json_registry can rebuild them:
//   record        {"__record__": "Orders", "order_id": 1, ...}
//   record_list   {"__record_list__": "Orders", "values": [{...}, ...]}
//   transaction   {"__transaction__": "NewOrder", "__version__": "1", ...}
// Timestamps are ISO-8601 text, blobs lower-case hex text.
// ============================================================================

namespace accord {

void to_json(nlohmann::json& j, const record& r);
void to_json(nlohmann::json& j, const record_list& list);
void to_json(nlohmann::json& j, const transaction& t);

/// Field values only, without the schema tag
nlohmann::json record_values_json(const record& r);

nlohmann::json value_to_json(const value_t& value);

/// Decode a JSON value for a field of the given type; the field validates it.
/// Throws validation_error when the JSON type does not fit.
value_t value_from_json(const nlohmann::json& j, const field& f);

class json_registry {
public:
    using decoded = std::variant<record, record_list, transaction>;

    void register_record(record_schema_ptr schema);
    void register_transaction(transaction_schema_ptr schema);

    /// Throws schema_violation_error for unregistered schema names and
    /// unknown field names, validation_error for malformed input.
    record decode_record(const nlohmann::json& j) const;
    record_list decode_record_list(const nlohmann::json& j) const;
    transaction decode_transaction(const nlohmann::json& j) const;

    /// Parse text and decode it according to its tag
    decoded decode(const std::string& text) const;

private:
    std::unordered_map<std::string, record_schema_ptr> records_;
    std::unordered_map<std::string, transaction_schema_ptr> transactions_;

    const record_schema_ptr& lookup_record(const std::string& name) const;
    void load_values(record& r, const nlohmann::json& values) const;
};

} // namespace accord

#endif // __cplusplus
