#include <catch2/catch_test_macros.hpp>
#include "function_router.hpp"
#include "test_fixtures.hpp"

using namespace sandlot;

static const Value& field(const Value& row, const std::string& key) {
    const Value* v = row.as_dict().find(Value::string(key));
    REQUIRE(v != nullptr);
    return *v;
}

static Value where_of(const std::string& col, Value value) {
    Value w = Value::dict();
    w.as_dict().set(Value::string(col), std::move(value));
    return w;
}

struct RouterFixture {
    std::unique_ptr<SqliteAnalyticStore> inner = make_test_table_store();
    CountingStore store{*inner};
    FunctionRouter router{store};

    Value call(const std::string& name, std::vector<Value> args = {}, KwArgs kwargs = {}) {
        return router.dispatch(name, args, kwargs);
    }
};

static RouterErrorKind error_kind_of(RouterFixture& f, const std::string& name,
                                     std::vector<Value> args, KwArgs kwargs = {}) {
    try {
        f.call(name, std::move(args), std::move(kwargs));
    } catch (const RouterError& e) {
        return e.kind();
    }
    FAIL("expected RouterError");
    return RouterErrorKind::QueryFailed;
}

// ── Dispatch ────────────────────────────────────────────────────

TEST_CASE("FunctionRouter: four primitives are registered", "[router]") {
    const auto& names = FunctionRouter::function_names();
    REQUIRE(names == std::vector<std::string>{"fetch", "count", "describe", "tables"});
}

TEST_CASE("FunctionRouter: unknown function", "[router]") {
    RouterFixture f;
    try {
        f.call("drop_everything");
        FAIL("expected RouterError");
    } catch (const RouterError& e) {
        REQUIRE(e.kind() == RouterErrorKind::UnknownFunction);
        REQUIRE(std::string(e.what()) == "Unknown external function: drop_everything");
    }
}

// ── fetch ───────────────────────────────────────────────────────

TEST_CASE("FunctionRouter: fetch returns every row as dicts", "[router]") {
    RouterFixture f;
    auto rows = f.call("fetch", {Value::string("test_table")});
    REQUIRE(rows.is_list());
    REQUIRE(rows.items().size() == 3);
    REQUIRE(field(rows.items()[0], "name").as_str() == "a");
}

TEST_CASE("FunctionRouter: fetch order_by DESC", "[router]") {
    RouterFixture f;
    auto rows = f.call("fetch", {Value::string("test_table")},
                       {{"order_by", Value::string("id DESC")}});
    REQUIRE(field(rows.items()[0], "id").as_int() == 3);
}

TEST_CASE("FunctionRouter: fetch with columns and limit", "[router]") {
    RouterFixture f;
    auto rows = f.call("fetch", {Value::string("test_table")},
                       {{"columns", Value::list({Value::string("name")})},
                        {"order_by", Value::string("id asc")},
                        {"limit", Value::integer(2)}});
    REQUIRE(rows.items().size() == 2);
    REQUIRE(rows.items()[0].as_dict().size() == 1);
    REQUIRE(field(rows.items()[1], "name").as_str() == "b");
    REQUIRE(f.store.last_query == "SELECT name FROM test_table ORDER BY id asc LIMIT 2");
}

TEST_CASE("FunctionRouter: fetch limit accepts numeric strings", "[router]") {
    RouterFixture f;
    auto rows = f.call("fetch", {Value::string("test_table")}, {{"limit", Value::string("1")}});
    REQUIRE(rows.items().size() == 1);
}

TEST_CASE("FunctionRouter: where filters by equality", "[router]") {
    RouterFixture f;
    auto rows = f.call("fetch", {Value::string("test_table")},
                       {{"where", where_of("name", Value::string("b"))}});
    REQUIRE(rows.items().size() == 1);
    REQUIRE(field(rows.items()[0], "id").as_int() == 2);
}

TEST_CASE("FunctionRouter: where value with quotes matches literally", "[router]") {
    RouterFixture f;
    auto rows = f.call("fetch", {Value::string("test_table")},
                       {{"where", where_of("name", Value::string("a' OR '1'='1"))}});
    REQUIRE(rows.items().empty());
}

TEST_CASE("FunctionRouter: where None becomes IS NULL", "[router]") {
    RouterFixture f;
    auto rows = f.call("fetch", {Value::string("test_table")},
                       {{"where", where_of("name", Value::none())}});
    REQUIRE(rows.items().empty());
    REQUIRE(f.store.last_query == "SELECT * FROM test_table WHERE name IS NULL");
}

TEST_CASE("FunctionRouter: injected column name never executes", "[router]") {
    RouterFixture f;
    auto kind = error_kind_of(f, "fetch", {Value::string("test_table")},
                              {{"columns", Value::list({Value::string("; DROP TABLE x")})}});
    REQUIRE(kind == RouterErrorKind::InvalidIdentifier);
    REQUIRE(f.store.sql_calls == 0);
}

TEST_CASE("FunctionRouter: invalid where key", "[router]") {
    RouterFixture f;
    auto kind = error_kind_of(f, "fetch", {Value::string("test_table")},
                              {{"where", where_of("name = 1 OR 1", Value::integer(1))}});
    REQUIRE(kind == RouterErrorKind::InvalidIdentifier);
    REQUIRE(f.store.sql_calls == 0);
}

TEST_CASE("FunctionRouter: invalid order_by", "[router]") {
    RouterFixture f;
    auto kind = error_kind_of(f, "fetch", {Value::string("test_table")},
                              {{"order_by", Value::string("id; DROP TABLE test_table")}});
    REQUIRE(kind == RouterErrorKind::InvalidOrderBy);
    REQUIRE(f.store.sql_calls == 0);
}

TEST_CASE("FunctionRouter: unknown table lists the valid ones", "[router]") {
    RouterFixture f;
    try {
        f.call("fetch", {Value::string("nope")});
        FAIL("expected RouterError");
    } catch (const RouterError& e) {
        REQUIRE(e.kind() == RouterErrorKind::UnknownTable);
        REQUIRE(std::string(e.what()) == "Unknown table: nope. Available: test_table");
    }
    REQUIRE(f.store.sql_calls == 0);
}

TEST_CASE("FunctionRouter: argument binding errors", "[router]") {
    RouterFixture f;
    REQUIRE(error_kind_of(f, "fetch", {}) == RouterErrorKind::InvalidArgument);
    REQUIRE(error_kind_of(f, "fetch", {Value::integer(1)}) == RouterErrorKind::InvalidArgument);
    REQUIRE(error_kind_of(f, "count", {Value::string("test_table")},
                          {{"limit", Value::integer(1)}}) == RouterErrorKind::InvalidArgument);
    REQUIRE(error_kind_of(f, "tables", {Value::string("x")}) == RouterErrorKind::InvalidArgument);
    REQUIRE(error_kind_of(f, "fetch", {Value::string("test_table")},
                          {{"where", Value::list()}}) == RouterErrorKind::InvalidArgument);
    REQUIRE(error_kind_of(f, "fetch", {Value::string("test_table")},
                          {{"limit", Value::string("ten")}}) == RouterErrorKind::InvalidArgument);
}

// ── count / describe / tables ───────────────────────────────────

TEST_CASE("FunctionRouter: count matches fetch length", "[router]") {
    RouterFixture f;
    auto n = f.call("count", {Value::string("test_table")});
    auto rows = f.call("fetch", {Value::string("test_table")});
    REQUIRE(n.is_int());
    REQUIRE(n.as_int() == static_cast<int64_t>(rows.items().size()));
}

TEST_CASE("FunctionRouter: count with where", "[router]") {
    RouterFixture f;
    auto n = f.call("count", {Value::string("test_table")},
                    {{"where", where_of("name", Value::string("a"))}});
    REQUIRE(n.as_int() == 1);
    auto none = f.call("count", {Value::string("test_table"), where_of("id", Value::integer(99))});
    REQUIRE(none.as_int() == 0);
}

TEST_CASE("FunctionRouter: describe lists every column", "[router]") {
    RouterFixture f;
    auto cols = f.call("describe", {Value::string("test_table")});
    REQUIRE(cols.items().size() == 2);
    REQUIRE(field(cols.items()[0], "column_name").as_str() == "id");
    REQUIRE(field(cols.items()[0], "column_type").as_str() == "INTEGER");
    REQUIRE(field(cols.items()[0], "nullable").is_bool());
    REQUIRE(field(cols.items()[1], "column_name").as_str() == "name");
}

TEST_CASE("FunctionRouter: describe validates the table first", "[router]") {
    RouterFixture f;
    REQUIRE(error_kind_of(f, "describe", {Value::string("missing")}) == RouterErrorKind::UnknownTable);
    REQUIRE(f.store.describe_calls == 0);
}

TEST_CASE("FunctionRouter: tables includes the fixture table", "[router]") {
    RouterFixture f;
    auto names = f.call("tables");
    REQUIRE(names.is_list());
    bool found = false;
    for (const auto& n : names.items()) {
        if (n.as_str() == "test_table") found = true;
    }
    REQUIRE(found);
}
