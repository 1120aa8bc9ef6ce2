#include "accord/transaction.hpp"
#include "accord/errors.hpp"
#include "accord/log.hpp"
#include <unordered_set>

namespace accord {

namespace {

void check_hook(const hook_result& result, const char* hook) {
    if (!result.accepted) {
        throw verification_error(result.reason.empty() ? std::string(hook) + " rejected the transaction"
                                                       : result.reason);
    }
}

// Fill null or missing context entries from `found`
void merge_missing(context& ctx, const context& found) {
    for (const auto& [key, value] : found) {
        if (!ctx.has_value(key) && !is_null(value)) {
            ctx.set(key, value);
        }
    }
}

} // namespace

// ============================================================================
// Attributes
// ============================================================================

transaction_attribute attach_field(field_ptr f) {
    if (!f) {
        throw schema_error("attach_field needs a field");
    }
    transaction_attribute a{attribute_kind::field, f->name(), nullptr, nullptr, nullptr};
    a.field = std::move(f);
    return a;
}

transaction_attribute attach_record(std::string name, record_schema_ptr schema) {
    if (!schema) {
        throw schema_error("attach_record '" + name + "' needs a schema");
    }
    return {attribute_kind::record, std::move(name), nullptr, std::move(schema), nullptr};
}

transaction_attribute attach_list(std::string name, record_schema_ptr schema) {
    if (!schema) {
        throw schema_error("attach_list '" + name + "' needs a schema");
    }
    return {attribute_kind::record_list, std::move(name), nullptr, std::move(schema), nullptr};
}

transaction_attribute attach_query_result(std::string name, query_schema_ptr query) {
    if (!query || !query->result_schema()) {
        throw schema_error("attach_query_result '" + name + "' needs a query with a result type");
    }
    return {attribute_kind::query_result, std::move(name), nullptr, nullptr, std::move(query)};
}

// ============================================================================
// transaction_hooks
// ============================================================================

hook_result transaction_hooks::pre_insert(transaction&, context&, cursor&) const {
    return hook_result::accept();
}

hook_result transaction_hooks::pre_update(transaction&, context&, cursor&) const {
    return hook_result::accept();
}

hook_result transaction_hooks::pre_delete(transaction&, context&, cursor&) const {
    return hook_result::accept();
}

hook_result transaction_hooks::post_select(transaction& t, context& ctx, cursor&) const {
    context found = t.get_context_from_records();
    merge_missing(ctx, found);

    for (const auto& a : t.schema().attributes()) {
        if (a.kind != attribute_kind::field) continue;
        const value_t* value = found.find(a.name);
        if (value && !is_null(*value) && is_null(t.get(a.name))) {
            t.set_value(a.name, *value);
        }
    }
    return hook_result::accept();
}

hook_result transaction_hooks::verify(const transaction&, const context&, cursor&) const {
    return hook_result::accept();
}

// ============================================================================
// transaction_schema
// ============================================================================

transaction_schema::transaction_schema(std::string name,
                                       std::vector<transaction_attribute> attributes,
                                       transaction_options options)
    : name_(std::move(name)),
      version_(std::move(options.version)),
      isolation_(options.isolation.value_or(isolation_level::serializable)),
      dialect_(std::move(options.default_dialect)),
      hooks_(std::move(options.hooks)),
      attributes_(std::move(attributes)) {
    if (!dialect_) {
        dialect_ = std::make_shared<sqlite_dialect>();
    }
    if (!hooks_) {
        hooks_ = std::make_shared<transaction_hooks>();
    }

    std::unordered_set<std::string> seen;
    for (const auto& a : attributes_) {
        if (a.name.empty()) {
            throw schema_error("Transaction " + name_ + " has an attribute without a name");
        }
        if (!seen.insert(a.name).second) {
            throw schema_error("Transaction " + name_ + " declares '" + a.name + "' twice");
        }
        bool complete = false;
        switch (a.kind) {
            case attribute_kind::field: complete = a.field != nullptr; break;
            case attribute_kind::record:
            case attribute_kind::record_list: complete = a.schema != nullptr; break;
            case attribute_kind::query_result: complete = a.query && a.query->result_schema(); break;
        }
        if (!complete) {
            throw schema_error("Attribute '" + a.name + "' of transaction " + name_ + " is incomplete");
        }
    }
}

std::optional<size_t> transaction_schema::index_of(const std::string& attribute) const {
    for (size_t i = 0; i < attributes_.size(); ++i) {
        if (attributes_[i].name == attribute) return i;
    }
    return std::nullopt;
}

size_t transaction_schema::require_index(const std::string& attribute) const {
    auto index = index_of(attribute);
    if (!index) {
        throw schema_violation_error("'" + attribute + "' is not an attribute of transaction " + name_);
    }
    return *index;
}

transaction_schema_ptr transaction_schema::derive(std::string name,
                                                  std::vector<transaction_attribute> extra,
                                                  transaction_options overrides) const {
    std::vector<transaction_attribute> attributes = attributes_;
    for (auto& a : extra) {
        attributes.push_back(std::move(a));
    }

    transaction_options options;
    options.version = overrides.version.empty() ? version_ : std::move(overrides.version);
    options.isolation = overrides.isolation.value_or(isolation_);
    options.default_dialect = overrides.default_dialect ? std::move(overrides.default_dialect) : dialect_;
    options.hooks = overrides.hooks ? std::move(overrides.hooks) : hooks_;

    return std::make_shared<transaction_schema>(std::move(name), std::move(attributes), std::move(options));
}

transaction_schema_ptr make_transaction_schema(std::string name,
                                               std::vector<transaction_attribute> attributes,
                                               transaction_options options) {
    return std::make_shared<transaction_schema>(std::move(name), std::move(attributes), std::move(options));
}

const char* to_string(transaction_state state) {
    switch (state) {
        case transaction_state::idle: return "idle";
        case transaction_state::context_built: return "context_built";
        case transaction_state::hook_run: return "hook_run";
        case transaction_state::verified: return "verified";
        case transaction_state::executing: return "executing";
        case transaction_state::committed: return "committed";
        case transaction_state::aborted: return "aborted";
    }
    return "unknown";
}

// ============================================================================
// transaction - construction and access
// ============================================================================

transaction::transaction(transaction_schema_ptr schema) : schema_(std::move(schema)) {
    if (!schema_) {
        throw schema_error("transaction needs a transaction_schema");
    }
    slots_.reserve(schema_->attributes().size());
    for (const auto& a : schema_->attributes()) {
        switch (a.kind) {
            case attribute_kind::field:
                slots_.emplace_back(std::in_place_type<value_t>, nullptr);
                break;
            case attribute_kind::record:
                slots_.emplace_back(std::in_place_type<record>, a.schema);
                break;
            case attribute_kind::record_list:
                slots_.emplace_back(std::in_place_type<record_list>, a.schema);
                break;
            case attribute_kind::query_result:
                slots_.emplace_back(std::in_place_type<query_result>, a.query);
                break;
        }
    }
}

transaction::transaction(transaction_schema_ptr schema, std::initializer_list<named_value> fields)
    : transaction(std::move(schema)) {
    for (const auto& [name, value] : fields) {
        set_value(name, value);
    }
}

template<typename T>
T& transaction::slot_as(const std::string& name) {
    auto* p = std::get_if<T>(&slots_[schema_->require_index(name)]);
    if (!p) {
        throw schema_violation_error("Attribute '" + name + "' of transaction " + schema_->name() +
                                     " is not of the requested kind");
    }
    return *p;
}

template<typename T>
const T& transaction::slot_as(const std::string& name) const {
    const auto* p = std::get_if<T>(&slots_[schema_->require_index(name)]);
    if (!p) {
        throw schema_violation_error("Attribute '" + name + "' of transaction " + schema_->name() +
                                     " is not of the requested kind");
    }
    return *p;
}

const value_t& transaction::get(const std::string& field_name) const {
    return slot_as<value_t>(field_name);
}

void transaction::set_value(const std::string& field_name, value_t value) {
    size_t index = schema_->require_index(field_name);
    const auto& a = schema_->attributes()[index];
    if (a.kind != attribute_kind::field) {
        throw schema_violation_error("Attribute '" + field_name + "' of transaction " + schema_->name() +
                                     " is not a context field");
    }
    std::get<value_t>(slots_[index]) = a.field->validate(value);
}

record& transaction::get_record(const std::string& name) {
    return slot_as<record>(name);
}

const record& transaction::get_record(const std::string& name) const {
    return slot_as<record>(name);
}

void transaction::set_record(const std::string& name, record r) {
    record& target = slot_as<record>(name);
    if (r.schema_ptr() != target.schema_ptr()) {
        throw schema_violation_error("Attribute '" + name + "' holds " + target.schema().name() +
                                     " records, not " + r.schema().name());
    }
    target = std::move(r);
}

record_list& transaction::get_list(const std::string& name) {
    return slot_as<record_list>(name);
}

const record_list& transaction::get_list(const std::string& name) const {
    return slot_as<record_list>(name);
}

void transaction::set_list(const std::string& name, record_list list) {
    record_list& target = slot_as<record_list>(name);
    if (list.schema_ptr() != target.schema_ptr()) {
        throw schema_violation_error("Attribute '" + name + "' holds " + target.schema().name() +
                                     " records, not " + list.schema().name());
    }
    target = std::move(list);
}

query_result& transaction::get_query_result(const std::string& name) {
    return slot_as<query_result>(name);
}

const query_result& transaction::get_query_result(const std::string& name) const {
    return slot_as<query_result>(name);
}

// ============================================================================
// Context construction
// ============================================================================

const dialect& transaction::resolve_dialect(const dialect* d) const {
    return d ? *d : schema_->default_dialect();
}

context transaction::get_context() const {
    context result;
    const auto& attributes = schema_->attributes();
    for (size_t i = 0; i < attributes.size(); ++i) {
        if (attributes[i].kind != attribute_kind::field) continue;
        const auto& value = std::get<value_t>(slots_[i]);
        if (!is_null(value)) {
            result.set(attributes[i].name, value);
        }
    }
    return result;
}

context transaction::get_refreshed_context(cursor& cur, const dialect* d) {
    field_source source{cur, resolve_dialect(d)};
    context result;
    const auto& attributes = schema_->attributes();
    for (size_t i = 0; i < attributes.size(); ++i) {
        if (attributes[i].kind != attribute_kind::field) continue;
        value_t value = attributes[i].field->refresh(std::get<value_t>(slots_[i]), &result, &source);
        if (!is_null(value)) {
            result.set(attributes[i].name, std::move(value));
        }
    }
    return result;
}

context transaction::get_updated_context(cursor& cur, const dialect* d) {
    field_source source{cur, resolve_dialect(d)};
    context result;
    const auto& attributes = schema_->attributes();
    for (size_t i = 0; i < attributes.size(); ++i) {
        if (attributes[i].kind != attribute_kind::field) continue;
        value_t value = attributes[i].field->update(std::get<value_t>(slots_[i]), &result, source);
        if (!is_null(value)) {
            result.set(attributes[i].name, std::move(value));
        }
    }
    return result;
}

context transaction::get_context_from_records() const {
    context result;
    for (const auto& s : slots_) {
        if (const auto* r = std::get_if<record>(&s)) {
            merge_missing(result, r->context_values_stored());
        } else if (const auto* list = std::get_if<record_list>(&s)) {
            for (const auto& r : *list) {
                merge_missing(result, r.context_values_stored());
            }
        } else if (const auto* qr = std::get_if<query_result>(&s)) {
            for (const auto& r : *qr) {
                merge_missing(result, r.context_values_stored());
            }
        }
    }
    return result;
}

// ============================================================================
// Orchestrated operations
// ============================================================================

void transaction::enter(transaction_state next) {
    LOG_DEBUG("transaction", "%s: %s -> %s", schema_->name().c_str(),
              accord::to_string(state_), accord::to_string(next));
    state_ = next;
}

void transaction::check_primary_keys() const {
    for (const auto& a : schema_->attributes()) {
        if (a.kind != attribute_kind::record && a.kind != attribute_kind::record_list) continue;
        const table_schema* table = a.schema->as_table();
        if (table && !table->primary_key()) {
            throw schema_error("Table " + table->name() + " (attribute '" + a.name +
                               "') has no primary key constraint, so it cannot be updated");
        }
    }
}

// Context values flow into every table or view record in declaration order,
// so row counters number the rows of the whole transaction consistently.
void transaction::propagate_all(context& ctx) {
    for (auto& s : slots_) {
        if (auto* r = std::get_if<record>(&s)) {
            if (r->schema().as_relation()) {
                r->propagate(ctx);
            }
        } else if (auto* list = std::get_if<record_list>(&s)) {
            if (list->schema().as_relation()) {
                for (auto& rec : *list) {
                    rec.propagate(ctx);
                }
            }
        }
    }
}

context transaction::run_write(write_op op, cursor& cur, const dialect& d) {
    static const char* const op_names[] = {"insert_new", "insert_existing", "update", "remove"};
    const char* op_name = op_names[static_cast<int>(op)];

    state_ = transaction_state::idle;
    try {
        if (op == write_op::update) {
            check_primary_keys();
        }

        // Generated values have external side effects, so they are drawn
        // before the scope opens and are not reclaimed on a later abort.
        std::optional<context> generated;
        if (op == write_op::insert_new) {
            generated = get_updated_context(cur, &d);
            enter(transaction_state::context_built);
        }

        transaction_scope scope(cur, schema_->isolation());

        context ctx = generated ? std::move(*generated) : get_refreshed_context(cur, &d);
        if (!generated) {
            enter(transaction_state::context_built);
        }

        const transaction_hooks& hooks = schema_->hooks();
        switch (op) {
            case write_op::insert_new:
            case write_op::insert_existing:
                check_hook(hooks.pre_insert(*this, ctx, cur), "pre_insert");
                break;
            case write_op::update:
                check_hook(hooks.pre_update(*this, ctx, cur), "pre_update");
                break;
            case write_op::remove:
                check_hook(hooks.pre_delete(*this, ctx, cur), "pre_delete");
                break;
        }
        enter(transaction_state::hook_run);

        check_hook(hooks.verify(*this, ctx, cur), "verify");
        enter(transaction_state::verified);

        enter(transaction_state::executing);
        context working = ctx;
        propagate_all(working);

        auto execute_record = [&](const table_schema& table, const record& r) {
            statement stmt;
            switch (op) {
                case write_op::insert_new:
                case write_op::insert_existing:
                    stmt = table.insert_sql(r, d);
                    break;
                case write_op::update:
                    stmt = table.update_sql(r, d);
                    break;
                case write_op::remove:
                    stmt = table.delete_sql(r, d);
                    break;
            }
            LOG_DEBUG("transaction", "%s: %s", schema_->name().c_str(), stmt.sql.c_str());
            cur.execute(stmt.sql, stmt.params);
        };

        auto execute_slot = [&](slot& s) {
            if (auto* r = std::get_if<record>(&s)) {
                if (const table_schema* table = r->schema().as_table()) {
                    execute_record(*table, *r);
                }
            } else if (auto* list = std::get_if<record_list>(&s)) {
                if (const table_schema* table = list->schema().as_table()) {
                    for (const auto& rec : *list) {
                        execute_record(*table, rec);
                    }
                }
            }
        };

        if (op == write_op::remove) {
            for (auto it = slots_.rbegin(); it != slots_.rend(); ++it) {
                execute_slot(*it);
            }
        } else {
            for (auto& s : slots_) {
                execute_slot(s);
            }
        }

        scope.commit();
        enter(transaction_state::committed);
        LOG_INFO("transaction", "%s %s committed with context %s", schema_->name().c_str(), op_name,
                 ctx.to_string().c_str());
        return ctx;
    } catch (const std::exception& e) {
        LOG_WARN("transaction", "%s %s aborted in state %s: %s", schema_->name().c_str(), op_name,
                 accord::to_string(state_), e.what());
        state_ = transaction_state::aborted;
        throw;
    }
}

context transaction::insert_new(cursor& cur, const dialect* d) {
    return run_write(write_op::insert_new, cur, resolve_dialect(d));
}

context transaction::insert_existing(cursor& cur, const dialect* d) {
    return run_write(write_op::insert_existing, cur, resolve_dialect(d));
}

context transaction::update(cursor& cur, const dialect* d) {
    return run_write(write_op::update, cur, resolve_dialect(d));
}

context transaction::remove(cursor& cur, const dialect* d) {
    return run_write(write_op::remove, cur, resolve_dialect(d));
}

context transaction::context_select(cursor& cur, const dialect* d, bool allow_unlimited) {
    const dialect& dia = resolve_dialect(d);
    state_ = transaction_state::idle;
    try {
        transaction_scope scope(cur, schema_->isolation());

        context ctx = get_refreshed_context(cur, &dia);
        enter(transaction_state::context_built);
        enter(transaction_state::executing);

        for (auto& s : slots_) {
            if (auto* r = std::get_if<record>(&s)) {
                const relation_schema* relation = r->schema().as_relation();
                if (!relation) {
                    r->clear();
                    continue;
                }
                auto stmt = relation->context_select_sql(ctx, dia, allow_unlimited);
                auto rows = cur.execute(stmt.sql, stmt.params);
                if (rows.empty()) {
                    r->clear();
                } else {
                    r->load_row(rows.front(), dia);
                }
            } else if (auto* qr = std::get_if<query_result>(&s)) {
                qr->set_context(ctx);
                qr->load(cur, dia);
            } else if (auto* list = std::get_if<record_list>(&s)) {
                list->clear();
                const relation_schema* relation = list->schema().as_relation();
                if (!relation) continue;
                auto stmt = relation->context_select_sql(ctx, dia, allow_unlimited);
                for (const auto& row : cur.execute(stmt.sql, stmt.params)) {
                    record rec(list->schema_ptr());
                    rec.load_row(row, dia);
                    list->append(std::move(rec));
                }
            }
        }

        const transaction_hooks& hooks = schema_->hooks();
        check_hook(hooks.post_select(*this, ctx, cur), "post_select");
        enter(transaction_state::hook_run);

        check_hook(hooks.verify(*this, ctx, cur), "verify");
        enter(transaction_state::verified);

        scope.commit();
        enter(transaction_state::committed);
        return ctx;
    } catch (const std::exception& e) {
        LOG_WARN("transaction", "%s context_select aborted in state %s: %s", schema_->name().c_str(),
                 accord::to_string(state_), e.what());
        state_ = transaction_state::aborted;
        throw;
    }
}

std::string transaction::to_string() const {
    std::string result = schema_->name();
    if (!schema_->version().empty()) {
        result += " (" + schema_->version() + ")";
    }
    result += ":";
    const auto& attributes = schema_->attributes();
    for (size_t i = 0; i < attributes.size(); ++i) {
        result += "\n* " + attributes[i].name + " = ";
        std::visit([&](auto&& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, value_t>) {
                result += describe(v);
            } else {
                result += v.to_string();
            }
        }, slots_[i]);
    }
    return result;
}

} // namespace accord
