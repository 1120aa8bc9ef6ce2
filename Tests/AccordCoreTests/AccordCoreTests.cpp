#include <accord/accord.hpp>
#include <cassert>
#include <iostream>
#include <algorithm>
#include <string>
#include <vector>

using namespace accord;

// ============================================================================
// Helpers
// ============================================================================

static value_t iv(int64_t v) { return v; }
static value_t dv(double v) { return v; }
static value_t sv(const std::string& v) { return v; }

template<typename E, typename F>
static bool throws(F&& f) {
    try {
        f();
    } catch (const E&) {
        return true;
    }
    return false;
}

static int64_t count_rows(cursor& cur, const std::string& table) {
    auto rows = cur.execute("SELECT COUNT(*) FROM " + table);
    return std::get<int64_t>(rows.at(0).at(0));
}

static const sqlite_dialect sqlite{};
static const postgresql_dialect postgres{};

// ============================================================================
// Schema definitions shared by the tests
// ============================================================================

static table_schema_ptr make_orders(sql_schema_ptr schema = nullptr) {
    return make_table("Orders", {
        make_field<int_field>("order_id", field_options{.nullable = false}),
        make_field<int_field>("trans_id", field_options{.context_key = "trans_id"}),
        make_field<real_field>("amount"),
    }, {primary_key({"order_id"})}, std::move(schema));
}

static table_schema_ptr make_lines(const table_schema_ptr& orders) {
    return make_table("Lines", {
        make_field<int_field>("line_id", field_options{.nullable = false}),
        make_field<int_field>("order_id"),
        make_field<text_field>("item"),
    }, {
        primary_key({"line_id"}),
        foreign_key({"order_id"}, orders->name()),
    });
}

static void create_table(cursor& cur, const table_schema& table) {
    cur.execute(table.create_table_sql(sqlite));
}

// ============================================================================
// Test: Context
// ============================================================================

void test_context() {
    std::cout << "Testing context..." << std::endl;

    context ctx;
    ctx.set("x", iv(1));
    ctx.set("y", sv("two"));
    ctx.set("z", nullptr);
    ctx.set("x", iv(10));  // replaced in place

    std::vector<std::string> expected = {"x", "y", "z"};
    assert(ctx.keys() == expected);
    assert(ctx.at("x") == iv(10));
    assert(ctx.contains("z"));
    assert(!ctx.has_value("z"));
    assert(ctx.has_value("y"));
    assert(ctx.find("missing") == nullptr);
    assert(throws<std::out_of_range>([&] { ctx.at("missing"); }));

    assert(ctx.erase("y"));
    assert(!ctx.erase("y"));
    assert(ctx.size() == 2);

    context same{{"x", iv(10)}, {"z", nullptr}};
    assert(ctx == same);

    std::cout << "  Context test passed!" << std::endl;
}

// ============================================================================
// Test: Field validation
// ============================================================================

void test_field_validation() {
    std::cout << "Testing field validation..." << std::endl;

    int_field count("count");
    assert(count.validate(iv(5)) == iv(5));
    assert(throws<validation_error>([&] { count.validate(sv("five")); }));
    assert(throws<validation_error>([&] { count.validate(iv(int64_t(1) << 40)); }));
    assert(is_null(count.validate(nullptr)));

    int_field required("required", field_options{.nullable = false});
    assert(throws<validation_error>([&] { required.validate(nullptr); }));

    small_int_field small("small");
    assert(throws<validation_error>([&] { small.validate(iv(40000)); }));

    big_int_field big("big");
    assert(big.validate(iv(int64_t(1) << 40)) == iv(int64_t(1) << 40));

    real_field real("real");
    assert(real.validate(iv(3)) == dv(3.0));
    assert(throws<validation_error>([&] { real.validate(true); }));

    boolean_field flag("flag");
    assert(flag.validate(true) == value_t(true));
    assert(throws<validation_error>([&] { flag.validate(iv(1)); }));

    varchar_field strict("code", 4);
    assert(strict.validate(sv("abcd")) == sv("abcd"));
    assert(throws<validation_error>([&] { strict.validate(sv("abcde")); }));

    varchar_field cut("code", 4, true);
    assert(cut.validate(sv("abcdef")) == sv("abcd"));

    char_field fixed("currency", 3);
    assert(fixed.validate(sv("GBP")) == sv("GBP"));
    assert(throws<validation_error>([&] { fixed.validate(sv("GBPX")); }));

    // Lengths count UTF-8 characters, and truncation keeps them whole
    const std::string hee = "h\xc3\xa9\xc3\xa9";  // 3 characters, 5 bytes
    varchar_field name3("name", 3);
    assert(name3.validate(sv(hee)) == sv(hee));
    try {
        varchar_field("name", 2).validate(sv(hee));
        assert(false);
    } catch (const validation_error& e) {
        assert(std::string(e.what()).find("value has 3") != std::string::npos);
    }
    varchar_field name2("name", 2, true);
    assert(name2.validate(sv(hee)) == sv("h\xc3\xa9"));
    assert(varchar_field("name", 1, true).validate(sv("\xe2\x82\xac" "5")) == sv("\xe2\x82\xac"));

    char_field pair("pair", 2);
    assert(pair.validate(sv("\xc3\xa9\xc3\xa9")) == sv("\xc3\xa9\xc3\xa9"));
    assert(throws<validation_error>([&] { pair.validate(sv(hee)); }));

    timestamp_field when("when");
    auto ts = parse_timestamp("2024-03-01T12:30:45.123456");
    assert(ts.has_value());
    assert(when.validate(sv("2024-03-01 12:30:45.123456")) == value_t(*ts));
    assert(throws<validation_error>([&] { when.validate(sv("yesterday")); }));
    assert(format_timestamp(*ts) == "2024-03-01T12:30:45.123456");

    blob_field data("data");
    blob_t bytes = {0x01, 0xff};
    assert(data.validate(bytes) == value_t(bytes));
    assert(throws<validation_error>([&] { data.validate(sv("01ff")); }));

    std::cout << "  Field validation test passed!" << std::endl;
}

// ============================================================================
// Test: Field refresh / update
// ============================================================================

void test_field_refresh_update() {
    std::cout << "Testing field refresh and update..." << std::endl;

    sqlite_database db;
    field_source source{db, sqlite};

    // A context value always replaces the stored value
    int_field linked("trans_id", field_options{.context_key = "trans_id"});
    value_t slot = iv(5);
    context ctx{{"trans_id", iv(7)}};
    assert(linked.resolve(slot, &ctx) == iv(7));
    assert(slot == iv(5));
    assert(linked.refresh(slot, &ctx, nullptr) == iv(7));
    assert(slot == iv(7));

    // Refresh is idempotent
    value_t again = linked.refresh(slot, &ctx, nullptr);
    assert(again == iv(7));
    assert(linked.refresh(slot, &ctx, nullptr) == again);

    // No context value: stored value unchanged
    context empty;
    value_t stored = iv(3);
    assert(linked.refresh(stored, &empty, nullptr) == iv(3));
    assert(linked.refresh(stored, nullptr, nullptr) == iv(3));

    // Null context values do not override
    context null_ctx{{"trans_id", nullptr}};
    assert(linked.refresh(stored, &null_ctx, nullptr) == iv(3));

    // Base update refreshes and writes the context entry
    context written;
    value_t own = iv(11);
    assert(linked.update(own, &written, source) == iv(11));
    assert(written.at("trans_id") == iv(11));

    // utc_now stamps on update only
    utc_now_timestamp_field created("created", field_options{.context_key = "created"});
    value_t ts_slot = nullptr;
    assert(is_null(created.refresh(ts_slot, nullptr, nullptr)));
    context ts_ctx;
    created.update(ts_slot, &ts_ctx, source);
    assert(std::holds_alternative<timestamp_t>(ts_slot));
    assert(ts_ctx.at("created") == ts_slot);

    // Row counters number successive refreshes
    row_enum_field row("row_id", "row_id", 1);
    context rows_ctx;
    value_t r1 = nullptr, r2 = nullptr;
    assert(row.refresh(r1, &rows_ctx, nullptr) == iv(1));
    assert(row.refresh(r2, &rows_ctx, nullptr) == iv(2));
    assert(rows_ctx.at("row_id") == iv(2));
    assert(!row.links_context());

    std::cout << "  Field refresh/update test passed!" << std::endl;
}

// ============================================================================
// Test: Records
// ============================================================================

void test_records() {
    std::cout << "Testing records..." << std::endl;

    auto orders = make_orders();

    record order(orders, {iv(1), iv(7), dv(2.5)});
    assert(order.get("order_id") == iv(1));
    assert(order.get_as<double>("amount") == 2.5);

    order.set("amount", 4);
    assert(order.get("amount") == dv(4.0));

    assert(throws<schema_violation_error>([&] { order.set("colour", "red"); }));
    assert(throws<schema_violation_error>([&] { order.get("colour"); }));
    assert(throws<validation_error>([&] { order.set("trans_id", "seven"); }));
    assert(throws<validation_error>([&] { order.set("order_id", nullptr); }));
    assert(throws<schema_violation_error>([&] { (void)record(orders, {iv(1), iv(2)}); }));

    record named(orders, {{"order_id", 2}, {"amount", 1.5}});
    assert(is_null(named.get("trans_id")));
    assert(throws<schema_violation_error>([&] { (void)record(orders, {{"nope", 1}}); }));

    // Propagation takes context values for linked fields only
    context ctx{{"trans_id", iv(9)}, {"order_id", iv(100)}};
    named.propagate(ctx);
    assert(named.get("trans_id") == iv(9));
    assert(named.get("order_id") == iv(2));

    context stored = named.context_values_stored();
    assert(stored.size() == 1);
    assert(stored.at("trans_id") == iv(9));

    record copy = named;
    copy.set("amount", 8.0);
    assert(named.get("amount") == dv(1.5));
    assert(copy != named);

    // Duplicate field names are rejected when the schema is defined
    assert(throws<schema_error>([] {
        make_record_schema("Dup", {make_field<int_field>("a"), make_field<text_field>("a")});
    }));

    std::cout << "  Records test passed!" << std::endl;
}

// ============================================================================
// Test: Record lists
// ============================================================================

void test_record_list() {
    std::cout << "Testing record lists..." << std::endl;

    auto orders = make_orders();
    auto lines = make_lines(orders);

    record_list list(orders);
    list.emplace({iv(1), iv(7), dv(1.0)});
    list.emplace({iv(2), iv(7), dv(2.0)});

    auto amounts = list.project("amount");
    double total = 0;
    for (const auto& v : amounts) {
        total += *value_as<double>(v);
    }
    assert(total == 3.0);

    // Projection is lazy: it sees records added later, and can be restarted
    list.append(record(orders, {iv(3), iv(8), dv(4.0)}));
    assert(std::distance(amounts.begin(), amounts.end()) == 3);
    std::vector<value_t> ids(list.project("order_id").begin(), list.project("order_id").end());
    assert(ids.size() == 3);
    assert(ids[2] == iv(3));

    assert(throws<schema_violation_error>([&] { list.project("missing"); }));
    assert(throws<schema_violation_error>([&] { list.append(record(lines)); }));

    list.insert(0, record(orders, {iv(0), nullptr, nullptr}));
    assert(list.at(0).get("order_id") == iv(0));
    list.erase(0);
    assert(list.size() == 3);

    record_list copy = list;
    copy.at(0).set("amount", 50.0);
    assert(list.at(0).get("amount") == dv(1.0));

    // Positions past the end are rejected like any other invalid record placement
    list.insert(3, record(orders, {iv(4), nullptr, nullptr}));
    assert(list.size() == 4);
    list.erase(3);
    assert(throws<schema_violation_error>([&] { list.insert(5, record(orders)); }));
    assert(throws<schema_violation_error>([&] { list.set(3, record(orders)); }));
    assert(throws<schema_violation_error>([&] { list.erase(3); }));
    assert(list.size() == 3);

    // A moved-from list is empty but still typed
    record_list moved = std::move(copy);
    assert(moved.size() == 3);
    assert(copy.empty());
    assert(copy.schema_ptr() == orders);
    copy.emplace({iv(9), nullptr, nullptr});
    assert(copy.size() == 1);

    std::cout << "  Record list test passed!" << std::endl;
}

// ============================================================================
// Test: Table statement generation
// ============================================================================

void test_table_statements() {
    std::cout << "Testing table statements..." << std::endl;

    auto orders = make_orders();
    record order(orders, {iv(1), iv(7), dv(2.5)});

    auto insert = orders->insert_sql(order, sqlite);
    assert(insert.sql == "INSERT INTO \"Orders\" (\"order_id\", \"trans_id\", \"amount\") VALUES (?, ?, ?);");
    assert(insert.params.size() == 3);

    auto update = orders->update_sql(order, postgres);
    assert(update.sql == "UPDATE \"Orders\" SET \"trans_id\" = $1, \"amount\" = $2 WHERE \"order_id\" = $3;");
    assert(update.params.size() == 3);
    assert(std::get<int64_t>(update.params[2]) == 1);

    auto remove = orders->delete_sql(order, sqlite);
    assert(remove.sql == "DELETE FROM \"Orders\" WHERE \"order_id\" = ?;");

    auto pk = orders->pk_select_sql(order, sqlite);
    assert(pk.sql == "SELECT \"order_id\", \"trans_id\", \"amount\" FROM \"Orders\" WHERE \"order_id\" = ?;");

    auto simple = orders->simple_select_sql(postgres, {{"trans_id", iv(7)}, {"amount", dv(2.5)}});
    assert(simple.sql == "SELECT \"order_id\", \"trans_id\", \"amount\" FROM \"Orders\" "
                         "WHERE \"trans_id\" = $1 AND \"amount\" = $2;");

    context ctx{{"trans_id", iv(7)}};
    auto by_context = orders->context_select_sql(ctx, sqlite);
    assert(by_context.sql == "SELECT \"order_id\", \"trans_id\", \"amount\" FROM \"Orders\" WHERE \"trans_id\" = ?;");
    assert(std::get<int64_t>(by_context.params.at(0)) == 7);

    context none;
    assert(throws<unbound_query_error>([&] { orders->context_select_sql(none, sqlite); }));
    auto unlimited = orders->context_select_sql(none, sqlite, true);
    assert(unlimited.sql == "SELECT \"order_id\", \"trans_id\", \"amount\" FROM \"Orders\";");

    // Null key values never produce an unconstrained WHERE
    record keyless(orders);
    assert(throws<schema_error>([&] { orders->update_sql(keyless, sqlite); }));
    assert(throws<schema_error>([&] { orders->delete_sql(keyless, sqlite); }));

    // Structural errors at definition time
    assert(throws<schema_error>([] {
        make_table("Twice", {make_field<int_field>("a"), make_field<int_field>("b")},
                   {primary_key({"a"}), primary_key({"b"})});
    }));
    assert(throws<schema_error>([] {
        make_table("Bad", {make_field<int_field>("a")}, {primary_key({"zzz"})});
    }));

    auto lines = make_lines(orders);
    record line(lines, {iv(10), iv(1), sv("widget")});
    auto parent = lines->parent_select_sql(line, *orders, sqlite);
    assert(parent.sql == "SELECT \"order_id\", \"trans_id\", \"amount\" FROM \"Orders\" WHERE \"order_id\" = ?;");
    assert(throws<schema_error>([&] { orders->parent_select_sql(order, *lines, sqlite); }));

    // Records of another table are refused
    assert(throws<schema_violation_error>([&] { lines->insert_sql(order, sqlite); }));

    std::cout << "  Table statements test passed!" << std::endl;
}

// ============================================================================
// Test: Dialects and schema qualification
// ============================================================================

void test_dialects() {
    std::cout << "Testing dialects..." << std::endl;

    assert(sqlite.marker(3) == "?");
    assert(postgres.marker(3) == "$3");
    assert(sqlite.quote_identifier("we\"ird") == "\"we\"\"ird\"");

    assert(std::get<int64_t>(sqlite.to_backend(true)) == 1);
    assert(std::get<bool>(postgres.to_backend(true)));

    auto ts = *parse_timestamp("2024-01-02T03:04:05");
    assert(std::get<std::string>(sqlite.to_backend(ts)) == "2024-01-02T03:04:05.000000");
    assert(sqlite.from_backend(std::string("2024-01-02T03:04:05.000000"), value_type::timestamp) == value_t(ts));
    assert(sqlite.from_backend(int64_t{1}, value_type::boolean) == value_t(true));
    assert(sqlite.from_backend(int64_t{2}, value_type::real) == dv(2.0));
    assert(throws<validation_error>([] { sqlite.from_backend(std::string("x"), value_type::integer); }));

    assert(sqlite.column_type(value_type::varchar, 12) == "VARCHAR(12)");
    assert(sqlite.column_type(value_type::timestamp) == "TEXT");
    assert(postgres.column_type(value_type::blob) == "BYTEA");

    auto acct = std::make_shared<sql_schema>("acct");
    auto orders = make_orders(acct);
    assert(orders->qualified_name(sqlite) == "\"acct_Orders\"");
    assert(orders->qualified_name(postgres) == "\"acct\".\"Orders\"");

    std::string text = "SELECT * FROM {acct.Orders} WHERE x = '{literal}'";
    assert(rewrite_schema_references(text, sqlite) == "SELECT * FROM acct_Orders WHERE x = '{literal}'");
    assert(rewrite_schema_references(text, postgres) == "SELECT * FROM acct.Orders WHERE x = '{literal}'");

    std::cout << "  Dialects test passed!" << std::endl;
}

// ============================================================================
// Test: Enum fields
// ============================================================================

void test_enum_field() {
    std::cout << "Testing enum fields..." << std::endl;

    enum_field light("light", {"red", "amber", "green"}, "trafficlight");
    assert(light.type() == value_type::small_integer);
    assert(light.validate(sv("amber")) == iv(1));
    assert(light.validate(iv(2)) == iv(2));
    assert(light.name_of(0) == "red");
    assert(!light.ordinal_of("blue").has_value());
    assert(throws<validation_error>([&] { light.validate(sv("blue")); }));
    assert(throws<validation_error>([&] { light.validate(iv(3)); }));
    assert(throws<validation_error>([&] { light.validate(iv(-1)); }));
    assert(throws<validation_error>([&] { light.validate(dv(1.0)); }));
    assert(throws<schema_error>([] { (void)enum_field("empty", {}, "nothing"); }));
    assert(throws<schema_error>([] { (void)enum_field("twice", {"a", "a"}, "letters"); }));

    // Native enum type where the dialect has one, SMALLINT otherwise
    assert(light.sql_type(postgres) == "trafficlight");
    assert(light.sql_type(sqlite) == "SMALLINT");
    enum_field required("required", {"on", "off"}, "switch_state", field_options{.nullable = false});
    assert(required.sql_type(postgres) == "switch_state NOT NULL");
    assert(required.sql_type(sqlite) == "SMALLINT NOT NULL");

    // Names go to enum-aware backends, ordinals to the rest
    assert(std::get<std::string>(light.to_backend(iv(2), postgres)) == "green");
    assert(std::get<int64_t>(light.to_backend(iv(2), sqlite)) == 2);
    assert(light.from_backend(std::string("red"), postgres) == iv(0));
    assert(light.from_backend(int64_t{1}, sqlite) == iv(1));
    assert(is_null(light.from_backend(nullptr, postgres)));

    auto signals = make_table("Signals", {
        make_field<int_field>("signal_id", field_options{.nullable = false}),
        make_field<enum_field>("light", std::vector<std::string>{"red", "amber", "green"},
                               "trafficlight"),
    }, {primary_key({"signal_id"})});
    assert(signals->create_table_sql(postgres).find("\"light\" trafficlight") != std::string::npos);

    record r(signals, {iv(1), sv("green")});
    assert(r.get("light") == iv(2));
    auto pg_insert = signals->insert_sql(r, postgres);
    assert(std::get<std::string>(pg_insert.params[1]) == "green");

    sqlite_database db;
    create_table(db, *signals);
    auto insert = signals->insert_sql(r, sqlite);
    db.execute(insert.sql, insert.params);
    auto rows = db.execute("SELECT light FROM Signals");
    assert(std::get<int64_t>(rows[0][0]) == 2);

    record loaded(signals);
    loaded.load_row(db.execute("SELECT signal_id, light FROM Signals")[0], sqlite);
    assert(loaded.get("light") == iv(2));
    loaded.load_row({int64_t{1}, std::string("amber")}, postgres);
    assert(loaded.get("light") == iv(1));

    std::cout << "  Enum field test passed!" << std::endl;
}

// ============================================================================
// Test: Query placeholders
// ============================================================================

void test_query_placeholders() {
    std::cout << "Testing query placeholders..." << std::endl;

    auto orders = make_orders();
    auto q = make_query("OrdersFor",
                        "SELECT order_id, trans_id, amount FROM {acct.Orders} "
                        "WHERE trans_id = {tid} OR order_id = {tid} OR amount > {min}",
                        orders,
                        {make_field<int_field>("tid"), make_field<real_field>("min")});

    std::vector<std::string> expected = {"tid", "tid", "min"};
    assert(q->placeholders() == expected);

    query instance(q, {{"tid", 7}, {"min", 1.5}});

    auto positional = instance.query_sql(sqlite);
    assert(positional.sql == "SELECT order_id, trans_id, amount FROM acct_Orders "
                             "WHERE trans_id = ? OR order_id = ? OR amount > ?");
    assert(positional.params.size() == 3);
    assert(std::get<int64_t>(positional.params[1]) == 7);

    auto numbered = instance.query_sql(postgres);
    assert(numbered.sql == "SELECT order_id, trans_id, amount FROM acct.Orders "
                           "WHERE trans_id = $1 OR order_id = $1 OR amount > $2");
    assert(numbered.params.size() == 2);
    assert(std::get<double>(numbered.params[1]) == 1.5);

    // Context values keyed by parameter name (or context_key)
    context ctx{{"tid", iv(9)}};
    instance.set_context(ctx);
    assert(instance.get("tid") == iv(9));
    assert(instance.get("min") == dv(1.5));

    assert(throws<schema_violation_error>([&] { instance.set("nope", 1); }));
    assert(throws<validation_error>([&] { instance.set("tid", "x"); }));

    auto unbound = make_query("Unbound", "SELECT * FROM Orders WHERE trans_id = {missing}", orders);
    assert(unbound->unbound_placeholders().size() == 1);
    query broken(unbound);
    assert(throws<query_parameter_error>([&] { broken.query_sql(sqlite); }));

    std::cout << "  Query placeholders test passed!" << std::endl;
}

// ============================================================================
// Test: Query execution and query results
// ============================================================================

void test_query_results() {
    std::cout << "Testing query results..." << std::endl;

    sqlite_database db;
    auto orders = make_orders();
    create_table(db, *orders);
    db.execute("INSERT INTO Orders VALUES (1, 7, 1.0), (2, 7, 2.0), (3, 8, 4.0)");

    auto q = make_query("OrdersFor",
                        "SELECT order_id, trans_id, amount FROM Orders WHERE trans_id = {trans_id} ORDER BY order_id",
                        orders,
                        {make_field<int_field>("trans_id")});

    query_result result(q);
    result.get_query().set("trans_id", 7);
    result.refresh(db, sqlite);
    assert(result.size() == 2);
    assert(result.at(1).get("amount") == dv(2.0));
    assert(!db.is_in_transaction());

    // Refresh clears before refetching
    result.set_context(context{{"trans_id", iv(8)}});
    result.refresh(db, sqlite);
    assert(result.size() == 1);
    assert(result.at(0).get("order_id") == iv(3));

    // Copies own their query
    query_result copy = result;
    copy.get_query().set("trans_id", 7);
    assert(result.get_query().get("trans_id") == iv(8));

    // Moving takes the rows; the source keeps its query and can refresh again
    query_result moved = std::move(copy);
    assert(moved.size() == 1);
    assert(moved.get_query().get("trans_id") == iv(7));
    assert(copy.empty());
    assert(copy.get_query().get("trans_id") == iv(7));
    copy.refresh(db, sqlite);
    assert(copy.size() == 2);

    query_result assigned(q);
    assigned = std::move(moved);
    assert(assigned.size() == 1);
    moved.set_context(context{{"trans_id", iv(8)}});
    moved.refresh(db, sqlite);
    assert(moved.size() == 1);

    auto one = query(q, {{"trans_id", 8}}).result_record(db, sqlite);
    assert(one.has_value());
    assert(one->get("amount") == dv(4.0));
    assert(!query(q, {{"trans_id", 99}}).result_record(db, sqlite).has_value());

    auto count = make_query("CountFor", "SELECT COUNT(*) FROM Orders WHERE trans_id = {trans_id}",
                            make_record_schema("Count", {make_field<int_field>("n")}),
                            {make_field<int_field>("trans_id")});
    auto n = query(count, {{"trans_id", 7}}).result_single_value(db, sqlite);
    assert(std::get<int64_t>(n) == 2);

    auto two_columns = make_query("Two", "SELECT 1, 2", nullptr);
    assert(throws<db_error>([&] { query(two_columns).result_single_value(db, sqlite); }));
    auto no_rows = make_query("None", "SELECT 1 WHERE 0", nullptr);
    assert(throws<db_error>([&] { query(no_rows).result_single_value(db, sqlite); }));

    std::cout << "  Query results test passed!" << std::endl;
}

// ============================================================================
// Test: Context ordering and idempotence in transactions
// ============================================================================

void test_transaction_context() {
    std::cout << "Testing transaction context..." << std::endl;

    sqlite_database db;
    auto schema = make_transaction_schema("Ordered", {
        attach_field(make_field<int_field>("x")),
        attach_field(make_field<text_field>("y")),
        attach_field(make_field<real_field>("z")),
    });

    transaction t(schema, {{"x", 1}, {"y", "two"}, {"z", 3.0}});
    std::vector<std::string> expected = {"x", "y", "z"};

    assert(t.get_context().keys() == expected);
    assert(t.get_updated_context(db).keys() == expected);

    context first = t.get_refreshed_context(db);
    context second = t.get_refreshed_context(db);
    assert(first.keys() == expected);
    assert(first == second);

    // Null fields are left out of the context
    t.set_value("y", nullptr);
    std::vector<std::string> without_y = {"x", "z"};
    assert(t.get_context().keys() == without_y);

    assert(throws<schema_violation_error>([&] { t.set("w", 1); }));
    assert(throws<validation_error>([&] { t.set("x", "one"); }));
    assert(throws<schema_error>([] {
        make_transaction_schema("Twice", {attach_field(make_field<int_field>("x")),
                                          attach_field(make_field<int_field>("x"))});
    }));

    std::cout << "  Transaction context test passed!" << std::endl;
}

// ============================================================================
// Test: insert_new end to end
// ============================================================================

void test_insert_new() {
    std::cout << "Testing insert_new..." << std::endl;

    sqlite_database db;
    auto orders = make_orders();
    create_table(db, *orders);

    auto trans_seq = std::make_shared<sequence>("trans_seq", 101);
    trans_seq->create(db, sqlite);

    auto schema = make_transaction_schema("NewOrder", {
        attach_field(make_field<sequence_field>("trans_id", trans_seq)),
        attach_record("order", orders),
    }, {.version = "1"});

    transaction t(schema);
    t.get_record("order").set("order_id", 1);
    t.get_record("order").set("amount", 12.5);

    context ctx = t.insert_new(db);
    assert(ctx.size() == 1);
    assert(ctx.at("trans_id") == iv(101));
    assert(t.get("trans_id") == iv(101));
    assert(t.get_record("order").get("trans_id") == iv(101));
    assert(t.state() == transaction_state::committed);

    auto rows = db.execute("SELECT trans_id, amount FROM Orders WHERE order_id = 1");
    assert(rows.size() == 1);
    assert(std::get<int64_t>(rows[0][0]) == 101);
    assert(std::get<double>(rows[0][1]) == 12.5);

    // The next insert draws the next sequence value
    t.get_record("order").set("order_id", 2);
    context next = t.insert_new(db);
    assert(next.at("trans_id") == iv(102));
    assert(count_rows(db, "Orders") == 2);

    std::cout << "  insert_new test passed!" << std::endl;
}

// ============================================================================
// Test: context_select round trip
// ============================================================================

void test_context_select_round_trip() {
    std::cout << "Testing context_select round trip..." << std::endl;

    sqlite_database db;
    auto items = make_table("Items", {
        make_field<int_field>("a", field_options{.nullable = false, .context_key = "a"}),
        make_field<text_field>("b"),
        make_field<int_field>("c"),
    }, {primary_key({"a"})});
    create_table(db, *items);

    auto schema = make_transaction_schema("ItemTrans", {
        attach_field(make_field<int_field>("a")),
        attach_record("item", items),
    });

    transaction writer(schema, {{"a", 1}});
    writer.set_record("item", record(items, {iv(1), sv("x"), iv(2)}));
    writer.insert_existing(db);

    transaction reader(schema, {{"a", 1}});
    context ctx = reader.context_select(db);
    assert(ctx.at("a") == iv(1));
    assert(reader.get_record("item") == writer.get_record("item"));
    assert(reader.state() == transaction_state::committed);

    // No matching row clears the record
    transaction missing(schema, {{"a", 2}});
    missing.get_record("item").set("b", "stale");
    missing.context_select(db);
    assert(is_null(missing.get_record("item").get("b")));

    std::cout << "  context_select round trip test passed!" << std::endl;
}

// ============================================================================
// Test: Unbound guard
// ============================================================================

void test_unbound_guard() {
    std::cout << "Testing unbound context_select guard..." << std::endl;

    sqlite_database db;
    auto orders = make_orders();
    create_table(db, *orders);
    db.execute("INSERT INTO Orders VALUES (1, 7, 1.0), (2, 8, 2.0)");

    auto schema = make_transaction_schema("AllOrders", {
        attach_field(make_field<int_field>("trans_id")),
        attach_list("orders", orders),
    });

    transaction t(schema);
    assert(throws<unbound_query_error>([&] { t.context_select(db); }));
    assert(t.state() == transaction_state::aborted);
    assert(!db.is_in_transaction());

    t.context_select(db, nullptr, true);
    assert(t.get_list("orders").size() == 2);

    // Back-propagation fills the null context field from the first row
    assert(t.get("trans_id") == iv(7));

    std::cout << "  Unbound guard test passed!" << std::endl;
}

// ============================================================================
// Test: update
// ============================================================================

void test_update() {
    std::cout << "Testing update..." << std::endl;

    sqlite_database db;
    logging_cursor log(db);
    auto orders = make_orders();
    create_table(db, *orders);

    auto schema = make_transaction_schema("EditOrder", {
        attach_field(make_field<int_field>("trans_id")),
        attach_record("order", orders),
    });

    transaction t(schema, {{"trans_id", 7}});
    t.set_record("order", record(orders, {iv(1), nullptr, dv(1.0)}));
    t.insert_existing(log);

    t.get_record("order").set("amount", 9.5);
    t.set("trans_id", 8);
    t.update(log);

    auto rows = db.execute("SELECT trans_id, amount FROM Orders WHERE order_id = 1");
    assert(std::get<int64_t>(rows[0][0]) == 8);
    assert(std::get<double>(rows[0][1]) == 9.5);
    assert(log.count_statements("UPDATE") == 1);

    // Without a primary key nothing is sent, not even BEGIN
    auto notes = make_table("Notes", {
        make_field<int_field>("trans_id", field_options{.context_key = "trans_id"}),
        make_field<text_field>("body"),
    });
    auto bad = make_transaction_schema("EditNotes", {
        attach_field(make_field<int_field>("trans_id")),
        attach_list("notes", notes),
    });
    transaction n(bad, {{"trans_id", 7}});
    log.clear_history();
    assert(throws<schema_error>([&] { n.update(log); }));
    assert(log.history().empty());
    assert(n.state() == transaction_state::aborted);

    std::cout << "  Update test passed!" << std::endl;
}

// ============================================================================
// Test: remove
// ============================================================================

void test_remove() {
    std::cout << "Testing remove..." << std::endl;

    sqlite_database db;
    logging_cursor log(db);
    auto orders = make_orders();
    auto lines = make_lines(orders);
    create_table(db, *orders);
    create_table(db, *lines);

    auto schema = make_transaction_schema("OrderWithLines", {
        attach_field(make_field<int_field>("trans_id")),
        attach_record("order", orders),
        attach_list("lines", lines),
    });

    transaction t(schema, {{"trans_id", 7}});
    t.set_record("order", record(orders, {iv(1), nullptr, dv(3.0)}));
    t.get_list("lines").emplace({iv(10), iv(1), sv("bolt")});
    t.get_list("lines").emplace({iv(11), iv(1), sv("nut")});
    t.insert_existing(db);
    assert(count_rows(db, "Lines") == 2);

    // Lines go first so the foreign key never dangles
    t.remove(log);
    assert(count_rows(db, "Orders") == 0);
    assert(count_rows(db, "Lines") == 0);

    std::vector<std::string> deletes;
    for (const auto& e : log.history()) {
        if (e.sql.rfind("DELETE", 0) == 0) deletes.push_back(e.sql);
    }
    assert(deletes.size() == 3);
    assert(deletes[0].find("\"Lines\"") != std::string::npos);
    assert(deletes[2].find("\"Orders\"") != std::string::npos);

    std::cout << "  Remove test passed!" << std::endl;
}

// ============================================================================
// Test: Row enumeration
// ============================================================================

void test_row_enumeration() {
    std::cout << "Testing row enumeration..." << std::endl;

    sqlite_database db;
    auto journal = make_table("Journal", {
        make_field<int_field>("tid", field_options{.context_key = "tid"}),
        make_field<row_enum_field>("row_id", "row_id", 1),
        make_field<real_field>("amount"),
    }, {primary_key({"tid", "row_id"})});
    create_table(db, *journal);

    auto schema = make_transaction_schema("Posting", {
        attach_field(make_field<int_field>("tid")),
        attach_list("rows", journal),
    });

    transaction t(schema, {{"tid", 5}});
    for (double amount : {10.0, -4.0, -6.0}) {
        record r(journal);
        r.set("amount", amount);
        t.get_list("rows").append(std::move(r));
    }

    context ctx = t.insert_existing(db);
    assert(!ctx.contains("row_id"));

    auto rows = db.execute("SELECT tid, row_id, amount FROM Journal ORDER BY row_id");
    assert(rows.size() == 3);
    for (size_t i = 0; i < rows.size(); ++i) {
        assert(std::get<int64_t>(rows[i][0]) == 5);
        assert(std::get<int64_t>(rows[i][1]) == static_cast<int64_t>(i + 1));
    }

    // Row counters never restrict a context select
    transaction reader(schema, {{"tid", 5}});
    reader.context_select(db);
    assert(reader.get_list("rows").size() == 3);

    std::cout << "  Row enumeration test passed!" << std::endl;
}

// ============================================================================
// Test: Hooks and verification rollback
// ============================================================================

class order_total_hooks : public transaction_hooks {
public:
    hook_result pre_insert(transaction& t, context&, cursor&) const override {
        double total = 0;
        for (const auto& v : t.get_list("lines").project("amount")) {
            total += value_as<double>(v).value_or(0.0);
        }
        t.get_record("header").set("amount", total);
        return hook_result::accept();
    }

    hook_result verify(const transaction& t, const context&, cursor&) const override {
        if (t.get_list("lines").empty()) {
            return hook_result::reject("An order needs at least one line");
        }
        return hook_result::accept();
    }
};

class audit_then_reject_hooks : public transaction_hooks {
public:
    hook_result pre_insert(transaction&, context&, cursor& cur) const override {
        cur.execute("INSERT INTO Audit VALUES ('attempt')");
        return hook_result::accept();
    }

    hook_result verify(const transaction&, const context&, cursor&) const override {
        return hook_result::reject("");
    }
};

void test_hooks() {
    std::cout << "Testing hooks..." << std::endl;

    sqlite_database db;
    auto orders = make_orders();
    auto line_amounts = make_table("LineAmounts", {
        make_field<int_field>("line_id", field_options{.nullable = false}),
        make_field<int_field>("trans_id", field_options{.context_key = "trans_id"}),
        make_field<real_field>("amount"),
    }, {primary_key({"line_id"})});
    create_table(db, *orders);
    create_table(db, *line_amounts);
    db.execute("CREATE TABLE Audit (note TEXT)");

    auto schema = make_transaction_schema("TotalledOrder", {
        attach_field(make_field<int_field>("trans_id")),
        attach_record("header", orders),
        attach_list("lines", line_amounts),
    }, {.hooks = std::make_shared<order_total_hooks>()});

    transaction t(schema, {{"trans_id", 3}});
    t.get_record("header").set("order_id", 1);

    // verify rejects an order without lines
    try {
        t.insert_existing(db);
        assert(false);
    } catch (const verification_error& e) {
        assert(std::string(e.what()) == "An order needs at least one line");
    }
    assert(t.state() == transaction_state::aborted);
    assert(count_rows(db, "Orders") == 0);

    t.get_list("lines").emplace({iv(1), nullptr, dv(2.5)});
    t.get_list("lines").emplace({iv(2), nullptr, dv(4.0)});
    t.insert_existing(db);
    auto rows = db.execute("SELECT amount FROM Orders WHERE order_id = 1");
    assert(std::get<double>(rows[0][0]) == 6.5);

    // Work done by a hook is rolled back when verification fails
    auto rejecting = schema->derive("RejectedOrder", {}, {.hooks = std::make_shared<audit_then_reject_hooks>()});
    assert(rejecting->attributes().size() == 3);
    transaction r(rejecting, {{"trans_id", 4}});
    r.get_record("header").set("order_id", 2);
    assert(throws<verification_error>([&] { r.insert_existing(db); }));
    assert(count_rows(db, "Audit") == 0);
    assert(count_rows(db, "Orders") == 1);

    // A failing statement rolls back the ones before it
    auto plain = schema->derive("PlainOrder", {}, {.hooks = std::make_shared<transaction_hooks>()});
    transaction dup(plain, {{"trans_id", 5}});
    dup.get_record("header").set("order_id", 3);
    dup.get_list("lines").emplace({iv(1), nullptr, dv(1.0)});  // line 1 already exists
    assert(throws<db_error>([&] { dup.insert_existing(db); }));
    assert(count_rows(db, "Orders") == 1);
    assert(count_rows(db, "LineAmounts") == 2);

    std::cout << "  Hooks test passed!" << std::endl;
}

// ============================================================================
// Test: Hook rejections on update, remove and context_select
// ============================================================================

class rejecting_hooks : public transaction_hooks {
public:
    enum class stage { update, remove, select, verify };

    explicit rejecting_hooks(stage s) : stage_(s) {}

    hook_result pre_update(transaction&, context&, cursor&) const override {
        return decide(stage::update, "Orders are frozen");
    }

    hook_result pre_delete(transaction&, context&, cursor&) const override {
        return decide(stage::remove, "Orders are kept for audit");
    }

    hook_result post_select(transaction&, context&, cursor&) const override {
        return decide(stage::select, "Loaded order is incomplete");
    }

    hook_result verify(const transaction&, const context&, cursor&) const override {
        return decide(stage::verify, "Loaded order failed its checks");
    }

private:
    hook_result decide(stage s, const std::string& reason) const {
        return s == stage_ ? hook_result::reject(reason) : hook_result::accept();
    }

    stage stage_;
};

void test_hook_rejections() {
    std::cout << "Testing hook rejections..." << std::endl;

    sqlite_database db;
    logging_cursor log(db);
    auto orders = make_orders();
    create_table(db, *orders);

    auto base = make_transaction_schema("GuardedOrder", {
        attach_field(make_field<int_field>("trans_id")),
        attach_record("order", orders),
    });
    transaction seed(base, {{"trans_id", 7}});
    seed.get_record("order").set("order_id", 1);
    seed.get_record("order").set("amount", 2.0);
    seed.insert_existing(db);

    auto guarded = [&](const std::string& name, rejecting_hooks::stage s) {
        return base->derive(name, {}, {.hooks = std::make_shared<rejecting_hooks>(s)});
    };
    auto expect_rejection = [&](transaction& t, const std::string& reason, auto&& operation) {
        log.clear_history();
        try {
            operation();
            assert(false);
        } catch (const verification_error& e) {
            assert(std::string(e.what()) == reason);
        }
        assert(t.state() == transaction_state::aborted);
        assert(log.count_statements("BEGIN") == 1);
        assert(log.count_statements("ROLLBACK") == 1);
        assert(log.count_statements("COMMIT") == 0);
        assert(!db.is_in_transaction());
    };

    // pre_update: no UPDATE is sent and the row keeps its values
    transaction u(guarded("FrozenOrder", rejecting_hooks::stage::update), {{"trans_id", 7}});
    u.get_record("order").set("order_id", 1);
    u.get_record("order").set("amount", 9.0);
    expect_rejection(u, "Orders are frozen", [&] { u.update(log); });
    assert(log.count_statements("UPDATE") == 0);
    auto rows = db.execute("SELECT amount FROM Orders WHERE order_id = 1");
    assert(std::get<double>(rows[0][0]) == 2.0);

    // pre_delete: no DELETE is sent
    transaction d(guarded("KeptOrder", rejecting_hooks::stage::remove), {{"trans_id", 7}});
    d.get_record("order").set("order_id", 1);
    expect_rejection(d, "Orders are kept for audit", [&] { d.remove(log); });
    assert(log.count_statements("DELETE") == 0);
    assert(count_rows(db, "Orders") == 1);

    // post_select and verify both abort a context_select after the rows were read
    transaction ps(guarded("IncompleteOrder", rejecting_hooks::stage::select), {{"trans_id", 7}});
    expect_rejection(ps, "Loaded order is incomplete", [&] { ps.context_select(log); });
    assert(log.count_statements("SELECT") == 1);

    transaction v(guarded("CheckedOrder", rejecting_hooks::stage::verify), {{"trans_id", 7}});
    expect_rejection(v, "Loaded order failed its checks", [&] { v.context_select(log); });
    assert(log.count_statements("SELECT") == 1);

    // The same transaction schema still accepts what its hooks allow
    transaction ok(guarded("FrozenOrderReader", rejecting_hooks::stage::update), {{"trans_id", 7}});
    ok.context_select(log);
    assert(ok.state() == transaction_state::committed);
    assert(ok.get_record("order").get("amount") == dv(2.0));

    std::cout << "  Hook rejections test passed!" << std::endl;
}

// ============================================================================
// Test: post_select back-propagation
// ============================================================================

void test_post_select() {
    std::cout << "Testing post_select back-propagation..." << std::endl;

    sqlite_database db;
    auto shipments = make_table("Shipments", {
        make_field<int_field>("ship_id", field_options{.nullable = false}),
        make_field<int_field>("trans_id", field_options{.context_key = "trans_id"}),
        make_field<text_field>("region", field_options{.context_key = "region"}),
    }, {primary_key({"ship_id"})});
    create_table(db, *shipments);
    db.execute("INSERT INTO Shipments VALUES (1, 7, 'north'), (2, 8, 'south')");

    auto schema = make_transaction_schema("Shipping", {
        attach_field(make_field<int_field>("trans_id")),
        attach_field(make_field<text_field>("region")),
        attach_record("shipment", shipments),
    });

    transaction t(schema, {{"trans_id", 8}});
    context ctx = t.context_select(db);
    assert(ctx.at("region") == sv("south"));
    assert(t.get("region") == sv("south"));
    assert(t.get_record("shipment").get("ship_id") == iv(2));

    context from_records = t.get_context_from_records();
    assert(from_records.at("trans_id") == iv(8));

    std::cout << "  post_select test passed!" << std::endl;
}

// ============================================================================
// Test: Fields bound to queries
// ============================================================================

void test_query_bound_field() {
    std::cout << "Testing query-bound fields..." << std::endl;

    sqlite_database db;
    auto orders = make_orders();
    create_table(db, *orders);
    db.execute("INSERT INTO Orders VALUES (1, 7, 1.0), (2, 7, 2.0), (3, 8, 4.0)");

    auto total_for = make_query("TotalFor",
                                "SELECT SUM(amount) FROM Orders WHERE trans_id = {trans_id}",
                                make_record_schema("Total", {make_field<real_field>("total")}),
                                {make_field<int_field>("trans_id")});

    auto schema = make_transaction_schema("Summary", {
        attach_field(make_field<int_field>("trans_id")),
        attach_field(make_field<real_field>("total", field_options{.query = total_for})),
        attach_query_result("orders", make_query("OrdersFor",
            "SELECT order_id, trans_id, amount FROM Orders WHERE trans_id = {trans_id} ORDER BY order_id",
            orders, {make_field<int_field>("trans_id")})),
    });

    transaction t(schema, {{"trans_id", 7}});
    context ctx = t.get_refreshed_context(db);
    assert(ctx.at("total") == dv(3.0));
    assert(t.get("total") == dv(3.0));
    assert(t.get_context().keys().size() == 2);

    // context_select refreshes query results with the context
    t.context_select(db);
    assert(t.get_query_result("orders").size() == 2);
    assert(t.get_query_result("orders").get_query().get("trans_id") == iv(7));

    std::cout << "  Query-bound field test passed!" << std::endl;
}

// ============================================================================
// Test: Views
// ============================================================================

void test_views() {
    std::cout << "Testing views..." << std::endl;

    sqlite_database db;
    auto acct = std::make_shared<sql_schema>("acct");
    auto orders = make_orders(acct);
    create_table(db, *orders);
    assert(db.table_exists("acct_Orders"));
    db.execute("INSERT INTO acct_Orders VALUES (1, 7, 1.0), (2, 7, 2.0), (3, 8, 4.0)");

    auto totals = make_view("OrderTotals", {
        make_field<int_field>("trans_id", field_options{.context_key = "trans_id"}),
        make_field<real_field>("total"),
    }, "SELECT trans_id, SUM(amount) FROM {acct.Orders} GROUP BY trans_id", acct);
    db.execute(totals->create_view_sql(sqlite));

    auto schema = make_transaction_schema("ReadTotals", {
        attach_field(make_field<int_field>("trans_id")),
        attach_record("totals", totals),
    });

    transaction t(schema, {{"trans_id", 7}});
    t.context_select(db);
    assert(t.get_record("totals").get("total") == dv(3.0));

    // Views are never written
    logging_cursor log(db);
    t.insert_existing(log);
    assert(log.count_statements("INSERT") == 0);
    assert(log.count_statements("COMMIT") == 1);

    std::cout << "  Views test passed!" << std::endl;
}

// ============================================================================
// Test: Isolation level and logging cursor
// ============================================================================

void test_isolation_and_logging() {
    std::cout << "Testing isolation and logging cursor..." << std::endl;

    sqlite_database db;
    logging_cursor log(db);
    auto orders = make_orders();
    create_table(db, *orders);

    auto managed = make_transaction_schema("Managed", {
        attach_field(make_field<int_field>("trans_id")),
        attach_record("order", orders),
    });
    transaction t(managed, {{"trans_id", 1}});
    t.get_record("order").set("order_id", 1);
    t.insert_existing(log);

    assert(log.history().size() == 3);
    assert(log.history()[0].sql == "BEGIN");
    assert(log.history()[1].params.size() == 3);
    assert(log.history()[2].sql == "COMMIT");

    // Manual isolation leaves BEGIN/COMMIT to the caller
    auto manual = managed->derive("Manual", {}, {.isolation = isolation_level::manual});
    assert(manual->isolation() == isolation_level::manual);
    transaction m(manual, {{"trans_id", 2}});
    m.get_record("order").set("order_id", 2);

    log.clear_history();
    db.begin();
    m.insert_existing(log);
    assert(db.is_in_transaction());
    db.rollback();
    assert(log.count_statements("BEGIN") == 0);
    assert(log.count_statements("INSERT") == 1);
    assert(count_rows(db, "Orders") == 1);

    set_log_level(log_level::debug);
    assert(get_log_level() == log_level::debug);
    set_log_level(log_level::off);

    std::cout << "  Isolation and logging test passed!" << std::endl;
}

// ============================================================================
// Test: Generator failures
// ============================================================================

void test_generation_error() {
    std::cout << "Testing generation errors..." << std::endl;

    sqlite_database db;
    logging_cursor log(db);
    auto orders = make_orders();
    create_table(db, *orders);

    auto missing_seq = std::make_shared<sequence>("never_created");
    auto schema = make_transaction_schema("Broken", {
        attach_field(make_field<sequence_field>("trans_id", missing_seq)),
        attach_record("order", orders),
    });

    transaction t(schema);
    t.get_record("order").set("order_id", 1);
    assert(throws<generation_error>([&] { t.insert_new(log); }));
    assert(t.state() == transaction_state::aborted);
    assert(log.count_statements("BEGIN") == 0);
    assert(count_rows(db, "Orders") == 0);

    std::cout << "  Generation error test passed!" << std::endl;
}

// ============================================================================
// Test: Copies
// ============================================================================

void test_copy() {
    std::cout << "Testing transaction copies..." << std::endl;

    auto orders = make_orders();
    auto schema = make_transaction_schema("Copyable", {
        attach_field(make_field<int_field>("trans_id")),
        attach_record("order", orders),
        attach_list("more", orders),
    });

    transaction t(schema, {{"trans_id", 1}});
    t.get_record("order").set("amount", 1.0);
    t.get_list("more").emplace({iv(5), nullptr, dv(5.0)});

    transaction c = t.copy();
    c.set("trans_id", 2);
    c.get_record("order").set("amount", 2.0);
    c.get_list("more").at(0).set("amount", 6.0);

    assert(t.get("trans_id") == iv(1));
    assert(t.get_record("order").get("amount") == dv(1.0));
    assert(t.get_list("more").at(0).get("amount") == dv(5.0));

    assert(throws<schema_violation_error>([&] { t.get_list("order"); }));
    assert(throws<schema_violation_error>([&] { t.get_record("nothing"); }));

    std::cout << "  Copy test passed!" << std::endl;
}

// ============================================================================
// Test: JSON
// ============================================================================

void test_json() {
    std::cout << "Testing JSON serialization..." << std::endl;

    auto orders = make_orders();
    auto events = make_table("Events", {
        make_field<int_field>("event_id", field_options{.nullable = false}),
        make_field<timestamp_field>("at"),
        make_field<blob_field>("payload"),
        make_field<boolean_field>("urgent"),
    }, {primary_key({"event_id"})});

    auto schema = make_transaction_schema("Bundle", {
        attach_field(make_field<int_field>("trans_id")),
        attach_record("order", orders),
        attach_list("events", events),
    }, {.version = "2"});

    transaction t(schema, {{"trans_id", 7}});
    t.set_record("order", record(orders, {iv(1), iv(7), dv(2.5)}));
    t.get_list("events").emplace({iv(1), value_t(*parse_timestamp("2024-05-06T07:08:09.101112")),
                                  value_t(blob_t{0xde, 0xad}), value_t(true)});

    nlohmann::json j = t;
    assert(j["__transaction__"] == "Bundle");
    assert(j["__version__"] == "2");
    assert(j["order"]["__record__"] == "Orders");
    assert(j["events"]["values"][0]["payload"] == "dead");
    assert(j["events"]["values"][0]["at"] == "2024-05-06T07:08:09.101112");

    json_registry registry;
    registry.register_transaction(schema);

    auto decoded = registry.decode(j.dump());
    auto& back = std::get<transaction>(decoded);
    assert(back.get("trans_id") == iv(7));
    assert(back.get_record("order") == t.get_record("order"));
    assert(back.get_list("events") == t.get_list("events"));

    nlohmann::json rj = t.get_record("order");
    auto rec = std::get<record>(registry.decode(rj.dump()));
    assert(rec == t.get_record("order"));

    assert(throws<schema_violation_error>([&] {
        registry.decode(R"({"__record__": "Unknown", "a": 1})");
    }));
    assert(throws<schema_violation_error>([&] {
        registry.decode(R"({"__record__": "Orders", "colour": "red"})");
    }));
    assert(throws<validation_error>([&] {
        registry.decode(R"({"__record__": "Orders", "order_id": "one"})");
    }));
    assert(throws<validation_error>([&] { registry.decode("{not json"); }));

    std::cout << "  JSON test passed!" << std::endl;
}

// ============================================================================
// Main
// ============================================================================

int main() {
    std::cout << "=== AccordCore Tests ===" << std::endl;
    std::cout << std::endl;

    try {
        // Value model
        test_context();
        test_field_validation();
        test_field_refresh_update();
        test_records();
        test_record_list();

        // SQL generation
        test_table_statements();
        test_dialects();
        test_enum_field();
        test_query_placeholders();
        test_query_results();

        // Transactions
        test_transaction_context();
        test_insert_new();
        test_context_select_round_trip();
        test_unbound_guard();
        test_update();
        test_remove();
        test_row_enumeration();
        test_hooks();
        test_hook_rejections();
        test_post_select();
        test_query_bound_field();
        test_views();
        test_isolation_and_logging();
        test_generation_error();
        test_copy();

        // Serialization
        test_json();

        std::cout << std::endl;
        std::cout << "========================================" << std::endl;
        std::cout << "All tests passed! (26 test suites)" << std::endl;
        std::cout << "========================================" << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
