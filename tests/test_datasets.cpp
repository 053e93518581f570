#include <catch2/catch_test_macros.hpp>
#include "store/datasets.hpp"
#include "store/sqlite_util.hpp"
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <unistd.h>

using namespace sandlot;

static std::string write_temp(const std::string& name, const std::string& content) {
    std::string path = "/tmp/sandlot_test_" + std::to_string(getpid()) + "_" + name;
    std::ofstream out(path);
    out << content;
    return path;
}

// ── CSV parsing ─────────────────────────────────────────────────

TEST_CASE("parse_csv: infers column types", "[datasets]") {
    auto t = parse_csv("id,price,label\n1,2.5,x\n2,3,y\n");
    REQUIRE(t.columns.size() == 3);
    REQUIRE(t.columns[0].column_type == "INTEGER");
    REQUIRE(t.columns[1].column_type == "REAL");
    REQUIRE(t.columns[2].column_type == "TEXT");
    REQUIRE(t.rows.size() == 2);
    REQUIRE(t.rows[1][0].as_int() == 2);
    REQUIRE(t.rows[1][1].is_float());
    REQUIRE(t.rows[1][1].as_float() == 3.0);
    REQUIRE(t.rows[0][2].as_str() == "x");
}

TEST_CASE("parse_csv: quoted fields with commas and quotes", "[datasets]") {
    auto t = parse_csv("name,note\r\n\"Smith, John\",\"said \"\"hi\"\"\"\r\n");
    REQUIRE(t.rows.size() == 1);
    REQUIRE(t.rows[0][0].as_str() == "Smith, John");
    REQUIRE(t.rows[0][1].as_str() == "said \"hi\"");
}

TEST_CASE("parse_csv: empty cells are NULL and keep numeric typing", "[datasets]") {
    auto t = parse_csv("age,name\n22,a\n,b\n");
    REQUIRE(t.columns[0].column_type == "INTEGER");
    REQUIRE(t.rows[1][0].is_none());
}

TEST_CASE("parse_csv: headers become identifiers", "[datasets]") {
    auto t = parse_csv("\xEF\xBB\xBFFirst Name,1st,First Name\nx,y,z\n");
    REQUIRE(t.columns[0].column_name == "First_Name");
    REQUIRE(t.columns[1].column_name == "_1st");
    REQUIRE(t.columns[2].column_name == "First_Name_2");
}

TEST_CASE("parse_csv: ragged rows are rejected", "[datasets]") {
    REQUIRE_THROWS(parse_csv("a,b\n1\n"));
    REQUIRE_THROWS(parse_csv("a\n\"open\n"));
}

// ── JSON records ────────────────────────────────────────────────

TEST_CASE("parse_json_records: columns in first-seen order", "[datasets]") {
    auto t = parse_json_records(R"([{"name":"Pikachu","hp":35},{"name":"Mew","hp":100,"legendary":true}])");
    REQUIRE(t.columns.size() == 3);
    REQUIRE(t.columns[0].column_name == "name");
    REQUIRE(t.columns[1].column_type == "INTEGER");
    REQUIRE(t.columns[2].column_name == "legendary");
    REQUIRE(t.rows[0][2].is_none());
    REQUIRE(t.rows[1][2].as_int() == 1);
}

TEST_CASE("parse_json_records: rejects non-array documents", "[datasets]") {
    REQUIRE_THROWS(parse_json_records(R"({"a":1})"));
    REQUIRE_THROWS(parse_json_records(R"([1, 2])"));
}

// ── Loading and schema context ──────────────────────────────────

TEST_CASE("load_datasets: loads good files and skips bad ones", "[datasets]") {
    std::string csv = write_temp("people.csv", "id,name\n1,a\n2,b\n");
    SqliteAnalyticStore store;
    std::vector<DatasetConfig> datasets = {
        {"people", csv, "csv", "People"},
        {"ghost", "/tmp/sandlot_missing_dataset.csv", "csv", "Missing"},
    };
    REQUIRE(load_datasets(store, datasets) == 1);
    REQUIRE(store.table_names() == std::vector<std::string>{"people"});
    auto rows = store.execute_sql("SELECT name FROM people ORDER BY id");
    REQUIRE(rows.size() == 2);
    REQUIRE(rows[1][0].second.as_str() == "b");
    std::remove(csv.c_str());
}

TEST_CASE("build_schema_context: describes every dataset", "[datasets]") {
    std::string csv = write_temp("scores.csv", "player,score\nann,3.5\nbob,4\n");
    SqliteAnalyticStore store;
    std::vector<DatasetConfig> datasets = {
        {"scores", csv, "csv", "Game scores"},
        {"absent", "/tmp/sandlot_missing_dataset.csv", "csv", "Not loaded"},
    };
    load_datasets(store, datasets);

    auto ctx = build_schema_context(store, datasets);
    REQUIRE(ctx.find("## Available Tables") == 0);
    REQUIRE(ctx.find("### scores\nGame scores\n~2 rows") != std::string::npos);
    REQUIRE(ctx.find("| score | REAL |") != std::string::npos);
    REQUIRE(ctx.find("### absent\nNot loaded\n(schema unavailable)") != std::string::npos);
    std::remove(csv.c_str());
}

TEST_CASE("SqliteAnalyticStore: sealed store rejects writes", "[datasets]") {
    SqliteAnalyticStore store;
    store.execute_script("CREATE TABLE t (x INTEGER); INSERT INTO t VALUES (1);");
    store.seal();
    REQUIRE(store.sealed());
    REQUIRE_THROWS_AS(store.execute_sql("DELETE FROM t"), StoreError);
    REQUIRE(store.execute_sql("SELECT x FROM t").size() == 1);
}
