#pragma once

#ifdef __cplusplus

#include "context.hpp"
#include "cursor.hpp"
#include "dialect.hpp"
#include "field.hpp"
#include "query_result.hpp"
#include "record.hpp"
#include "record_list.hpp"
#include "table.hpp"
#include <initializer_list>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace accord {

class transaction;

// ============================================================================
// Attributes - the parts a transaction is made of, in declaration order.
// Declaration order is execution order: a later field may depend on the
// context values of the fields before it.
// ============================================================================

enum class attribute_kind {
    field,          ///< context field owned by the transaction
    record,         ///< single record (table, view or plain)
    record_list,    ///< list of records of one schema
    query_result    ///< list filled from an owned query
};

struct transaction_attribute {
    attribute_kind kind;
    std::string name;
    field_ptr field;
    record_schema_ptr schema;
    query_schema_ptr query;
};

/// Context field; the attribute and its context entry take the field's name
transaction_attribute attach_field(field_ptr f);
transaction_attribute attach_record(std::string name, record_schema_ptr schema);
transaction_attribute attach_list(std::string name, record_schema_ptr schema);
transaction_attribute attach_query_result(std::string name, query_schema_ptr query);

// ============================================================================
// Hooks - strategy object supplied with the transaction schema. A rejected
// result aborts the operation with verification_error; hooks may also throw.
// ============================================================================

struct hook_result {
    bool accepted = true;
    std::string reason;

    static hook_result accept() { return {}; }
    static hook_result reject(std::string reason) { return {false, std::move(reason)}; }
};

class transaction_hooks {
public:
    virtual ~transaction_hooks() = default;

    virtual hook_result pre_insert(transaction& t, context& ctx, cursor& cur) const;
    virtual hook_result pre_update(transaction& t, context& ctx, cursor& cur) const;
    virtual hook_result pre_delete(transaction& t, context& ctx, cursor& cur) const;

    /// Runs after context_select has loaded every attribute. The default
    /// copies values found in the loaded records into null or missing
    /// context entries and into the transaction's null context fields.
    virtual hook_result post_select(transaction& t, context& ctx, cursor& cur) const;

    /// Consistency check run by every operation after its pre hook
    virtual hook_result verify(const transaction& t, const context& ctx, cursor& cur) const;
};

// ============================================================================
// transaction_schema - static definition shared by transaction instances
// ============================================================================

struct transaction_options {
    std::string version;

    /// serializable when unset
    std::optional<isolation_level> isolation;

    /// sqlite_dialect when unset
    std::shared_ptr<const dialect> default_dialect;

    /// transaction_hooks base behaviour when unset
    std::shared_ptr<const transaction_hooks> hooks;
};

class transaction_schema;
using transaction_schema_ptr = std::shared_ptr<const transaction_schema>;

class transaction_schema {
public:
    transaction_schema(std::string name,
                       std::vector<transaction_attribute> attributes,
                       transaction_options options = {});

    transaction_schema(const transaction_schema&) = delete;
    transaction_schema& operator=(const transaction_schema&) = delete;

    const std::string& name() const { return name_; }
    const std::string& version() const { return version_; }
    isolation_level isolation() const { return isolation_; }
    const dialect& default_dialect() const { return *dialect_; }
    const transaction_hooks& hooks() const { return *hooks_; }

    const std::vector<transaction_attribute>& attributes() const { return attributes_; }

    std::optional<size_t> index_of(const std::string& attribute) const;

    /// Like index_of, throwing schema_violation_error for unknown names
    size_t require_index(const std::string& attribute) const;

    /// A new schema with this schema's attributes followed by `extra`.
    /// Options left unset in `overrides` keep this schema's values.
    transaction_schema_ptr derive(std::string name,
                                  std::vector<transaction_attribute> extra = {},
                                  transaction_options overrides = {}) const;

private:
    std::string name_;
    std::string version_;
    isolation_level isolation_;
    std::shared_ptr<const dialect> dialect_;
    std::shared_ptr<const transaction_hooks> hooks_;
    std::vector<transaction_attribute> attributes_;
};

transaction_schema_ptr make_transaction_schema(std::string name,
                                               std::vector<transaction_attribute> attributes,
                                               transaction_options options = {});

enum class transaction_state {
    idle,
    context_built,
    hook_run,
    verified,
    executing,
    committed,
    aborted
};

const char* to_string(transaction_state state);

// ============================================================================
// transaction - one instance of a transaction_schema. Owns a value per
// context field and a container per record attribute. Copies are deep.
//
// Every operation runs context build, hook, verify and the statements of
// every attribute inside one scope on the cursor; any failure rolls the
// whole operation back. The dialect defaults to the schema's.
// ============================================================================

class transaction {
public:
    using named_value = std::pair<std::string, value_t>;
    using slot = std::variant<value_t, record, record_list, query_result>;

    explicit transaction(transaction_schema_ptr schema);
    transaction(transaction_schema_ptr schema, std::initializer_list<named_value> fields);

    const transaction_schema& schema() const { return *schema_; }
    const transaction_schema_ptr& schema_ptr() const { return schema_; }

    transaction_state state() const { return state_; }

    // Context fields

    const value_t& get(const std::string& field_name) const;

    template<typename T>
    std::optional<T> get_as(const std::string& field_name) const {
        return value_as<T>(get(field_name));
    }

    template<typename T>
    void set(const std::string& field_name, T&& value) {
        set_value(field_name, make_value(std::forward<T>(value)));
    }

    void set_value(const std::string& field_name, value_t value);

    // Record attributes. Access to an attribute of another kind throws
    // schema_violation_error.

    record& get_record(const std::string& name);
    const record& get_record(const std::string& name) const;
    void set_record(const std::string& name, record r);

    record_list& get_list(const std::string& name);
    const record_list& get_list(const std::string& name) const;
    void set_list(const std::string& name, record_list list);

    query_result& get_query_result(const std::string& name);
    const query_result& get_query_result(const std::string& name) const;

    // Context construction

    /// Stored, non-null context field values. No database access.
    context get_context() const;

    /// refresh() on every context field in declaration order
    context get_refreshed_context(cursor& cur, const dialect* d = nullptr);

    /// update() on every context field in declaration order; may allocate
    /// sequence values and timestamps
    context get_updated_context(cursor& cur, const dialect* d = nullptr);

    /// Context entries implied by the values stored in the record
    /// attributes. The first non-null value found for a key wins.
    context get_context_from_records() const;

    // Orchestrated operations. Each returns the context it ran with.

    /// Generates new context values, then inserts every table record
    context insert_new(cursor& cur, const dialect* d = nullptr);

    /// Inserts every table record using the refreshed context
    context insert_existing(cursor& cur, const dialect* d = nullptr);

    /// Updates every table record by primary key. Throws schema_error
    /// before any statement when an attached table has no primary key.
    context update(cursor& cur, const dialect* d = nullptr);

    /// Deletes every table record by primary key, attributes in reverse
    /// declaration order
    context remove(cursor& cur, const dialect* d = nullptr);

    /// Replaces every record attribute with the rows matching the context.
    /// Throws unbound_query_error when a table or view would be read
    /// without any restriction and allow_unlimited is not set.
    context context_select(cursor& cur, const dialect* d = nullptr, bool allow_unlimited = false);

    transaction copy() const { return *this; }

    const slot& slot_at(size_t index) const { return slots_.at(index); }

    std::string to_string() const;

private:
    enum class write_op { insert_new, insert_existing, update, remove };

    transaction_schema_ptr schema_;
    std::vector<slot> slots_;
    transaction_state state_ = transaction_state::idle;

    template<typename T>
    T& slot_as(const std::string& name);

    template<typename T>
    const T& slot_as(const std::string& name) const;

    const dialect& resolve_dialect(const dialect* d) const;
    void enter(transaction_state next);
    void check_primary_keys() const;
    void propagate_all(context& ctx);
    context run_write(write_op op, cursor& cur, const dialect& d);
};

} // namespace accord

#endif // __cplusplus
