#include <catch2/catch_test_macros.hpp>
#include "crud/database.hpp"
#include "core/error.hpp"
#include "mocks/mock_connection.hpp"

using namespace pgcrud;
using pgcrud::testing::MockConnection;

namespace {

void add_items(MockConnection& conn) {
    conn.add_table("items", {{"id", "int4"}, {"name", "varchar"}, {"qty", "int4"}}, {{"id", 1}}, "1");
    conn.on("FROM items", MockConnection::rows({"id", "name", "qty"},
        {{"1", "widget", "5"}, {"2", "gadget", "0"}}));
}

} // namespace

// ============================================================================
// get_as_list
// ============================================================================

TEST_CASE("get_as_list: whole table ordered by primary key", "[database][listing]") {
    MockConnection conn;
    add_items(conn);
    Database db(conn);

    const auto rows = db.get_as_list("items");
    CHECK(conn.last().sql == R"(SELECT * FROM items ORDER BY "id")");

    REQUIRE(rows.size() == 2);
    CHECK(rows[0].at("id") == 1);
    CHECK(rows[0].at("name") == "widget");
    CHECK(rows[0].at("qty") == 5);
    CHECK(rows[1].at("qty") == 0);
}

TEST_CASE("get_as_list: selection options", "[database][listing]") {
    MockConnection conn;
    add_items(conn);
    Database db(conn);

    SECTION("columns, conditions and paging") {
        SelectOptions options;
        options.what = {"name", "qty"};
        options.where = {"qty > 1", "name <> ''"};
        options.limit = 10;
        options.offset = 5;
        (void)db.get_as_list("items", options);
        CHECK(conn.last().sql ==
              "SELECT name, qty FROM items WHERE qty > 1 AND name <> '' "
              "ORDER BY name, qty LIMIT 10 OFFSET 5");
    }

    SECTION("explicit order") {
        SelectOptions options;
        options.order = std::vector<std::string>{"qty DESC"};
        (void)db.get_as_list("items", options);
        CHECK(conn.last().sql == "SELECT * FROM items ORDER BY qty DESC");
    }

    SECTION("empty order means unordered") {
        SelectOptions options;
        options.order = std::vector<std::string>{};
        (void)db.get_as_list("items", options);
        CHECK(conn.last().sql == "SELECT * FROM items");
    }

    SECTION("scalar keeps the first column") {
        SelectOptions options;
        options.scalar = true;
        const auto ids = db.get_as_list("items", options);
        CHECK(ids == Database::RowList{1, 2});
    }
}

TEST_CASE("get_as_list: table without primary key is ordered by all columns", "[database][listing]") {
    MockConnection conn;
    conn.add_table("notes", {{"a", "int4"}, {"b", "text"}});
    conn.on("FROM notes", MockConnection::rows({"a", "b"}, {}));
    Database db(conn);

    CHECK(db.get_as_list("notes").empty());
    CHECK(conn.last().sql == R"(SELECT * FROM notes ORDER BY "a", "b")");
}

TEST_CASE("get_as_list: expressions skip the catalog", "[database][listing]") {
    MockConnection conn;
    conn.on("AS t", MockConnection::rows({"x"}, {{"1"}}));
    Database db(conn);

    const auto rows = db.get_as_list("(SELECT 1 AS x) AS t");
    CHECK(conn.last().sql == "SELECT * FROM (SELECT 1 AS x) AS t");
    CHECK(conn.count_containing("pg_attribute") == 0);
    CHECK(conn.count_containing("pg_index") == 0);
    REQUIRE(rows.size() == 1);
    CHECK(rows[0].at("x") == "1");
}

TEST_CASE("get_as_list: table name is required", "[database][listing]") {
    MockConnection conn;
    Database db(conn);

    CHECK_THROWS_AS(db.get_as_list(""), ValidationError);
    CHECK_THROWS_AS(db.get_as_dict(" "), ValidationError);
    CHECK(conn.executed().empty());
}

// ============================================================================
// get_as_dict
// ============================================================================

TEST_CASE("get_as_dict: rows keyed by primary key", "[database][listing]") {
    MockConnection conn;
    add_items(conn);
    Database db(conn);

    const auto rows = db.get_as_dict("items");
    CHECK(conn.last().sql == R"(SELECT * FROM items ORDER BY "id")");

    REQUIRE(rows.size() == 2);
    CHECK(rows[0].first == 1);
    CHECK(rows[0].second == Value{{"name", "widget"}, {"qty", 5}});
    CHECK(rows[1].first == 2);
    CHECK(rows[1].second.at("qty") == 0);
}

TEST_CASE("get_as_dict: composite key in key order", "[database][listing]") {
    MockConnection conn;
    conn.add_table("pairs", {{"a", "int4"}, {"b", "int4"}, {"v", "text"}},
                   {{"a", 1}, {"b", 2}}, "2 1");
    conn.on("FROM pairs", MockConnection::rows({"a", "b", "v"}, {{"1", "2", "x"}}));
    Database db(conn);

    const auto rows = db.get_as_dict("pairs");
    CHECK(conn.last().sql == R"(SELECT * FROM pairs ORDER BY "b", "a")");
    REQUIRE(rows.size() == 1);
    CHECK(rows[0].first == Value::array({2, 1}));
    CHECK(rows[0].second == Value{{"v", "x"}});
}

TEST_CASE("get_as_dict: explicit keyname and scalar rows", "[database][listing]") {
    MockConnection conn;
    add_items(conn);
    Database db(conn);

    SelectOptions options;
    options.scalar = true;
    const auto rows = db.get_as_dict("items", Database::KeyName(std::string("name")), options);

    CHECK(conn.last().sql == R"(SELECT * FROM items ORDER BY "name")");
    REQUIRE(rows.size() == 2);
    CHECK(rows[0].first == "widget");
    CHECK(rows[0].second == 1);
    CHECK(rows[1].first == "gadget");
    CHECK(rows[1].second == 2);
}

TEST_CASE("get_as_dict: repeated keys keep their first position", "[database][listing]") {
    MockConnection conn;
    conn.add_table("tags", {{"tag", "text"}, {"n", "int4"}}, {{"tag", 1}}, "1");
    conn.on("FROM tags", MockConnection::rows({"tag", "n"},
        {{"a", "1"}, {"b", "2"}, {"a", "3"}}));
    Database db(conn);

    const auto rows = db.get_as_dict("tags");
    REQUIRE(rows.size() == 2);
    CHECK(rows[0].first == "a");
    CHECK(rows[0].second == Value{{"n", 3}});
    CHECK(rows[1].first == "b");
}

TEST_CASE("get_as_dict: failures", "[database][listing]") {
    MockConnection conn;
    add_items(conn);
    conn.add_table("notes", {{"a", "int4"}});
    Database db(conn);

    SECTION("no primary key") {
        CHECK_THROWS_AS(db.get_as_dict("notes"), NotFoundError);
        CHECK(conn.count_containing("FROM notes") == 0);
    }

    SECTION("key column not selected") {
        conn.on("SELECT name FROM items", MockConnection::rows({"name"}, {{"widget"}}));
        SelectOptions options;
        options.what = {"name"};
        CHECK_THROWS_AS(db.get_as_dict("items", std::nullopt, options), ValidationError);
    }

    SECTION("empty result") {
        conn.on("FROM items", MockConnection::rows({"id", "name", "qty"}, {}));
        CHECK(db.get_as_dict("items").empty());
    }
}
