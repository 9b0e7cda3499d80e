/**
 * @file query_builder_test.cpp
 * @brief Unit tests for the fluent query builder
 */

#include <dbmigrate/errors/query_error.hpp>
#include <dbmigrate/storage/query_builder.hpp>

#include "fixtures/memory_connection.hpp"

#include <catch2/catch_test_macros.hpp>

using namespace dbmigrate;
using namespace dbmigrate::storage;
using dbmigrate::test::make_memory_connection;

namespace {

void create_items_table(database_connection& db) {
    auto created = db.schema().create_table(
        "items", "id INTEGER PRIMARY KEY AUTOINCREMENT, name TEXT NOT NULL, "
                 "batch INTEGER NOT NULL, note TEXT");
    REQUIRE(created.is_ok());
}

void insert_item(database_connection& db, const std::string& name, int batch) {
    auto inserted = db.query().table("items").insert(
        {{"name", name}, {"batch", std::to_string(batch)}});
    REQUIRE(inserted.is_ok());
}

}  // namespace

// ============================================================================
// SQL Generation
// ============================================================================

TEST_CASE("query_builder renders SQL with placeholders", "[storage][query]") {
    auto db = make_memory_connection();

    SECTION("select all") {
        CHECK(db->query().from("items").to_sql() == "SELECT * FROM \"items\"");
    }

    SECTION("columns, conditions, ordering and limit") {
        auto query = db->query();
        query.from("items")
            .select({"id", "name"})
            .where("batch", ">=", "2")
            .where("name", "a")
            .order_by("batch", sort_direction::descending)
            .order_by("id")
            .limit(5);

        CHECK(query.to_sql() ==
              "SELECT \"id\", \"name\" FROM \"items\" WHERE \"batch\" >= ? AND "
              "\"name\" = ? ORDER BY \"batch\" DESC, \"id\" ASC LIMIT 5");

        auto bindings = query.bindings();
        REQUIRE(bindings.size() == 2);
        CHECK(bindings[0] == std::pair<std::string, std::string>("batch", "2"));
        CHECK(bindings[1] == std::pair<std::string, std::string>("name", "a"));
    }

    SECTION("table prefix applies") {
        sqlite_options options;
        options.table_prefix = "app_";
        auto prefixed = make_memory_connection(options);
        CHECK(prefixed->query().from("items").to_sql() == "SELECT * FROM \"app_items\"");
    }
}

// ============================================================================
// Terminals
// ============================================================================

TEST_CASE("query_builder terminals run against SQLite", "[storage][query]") {
    auto db = make_memory_connection();
    create_items_table(*db);

    SECTION("insert returns the new row id") {
        auto first = db->query().table("items").insert({{"name", "a"}, {"batch", "1"}});
        auto second = db->query().table("items").insert({{"name", "b"}, {"batch", "1"}});
        REQUIRE(first.is_ok());
        REQUIRE(second.is_ok());
        CHECK(second.value() == first.value() + 1);
    }

    SECTION("get, first and pluck") {
        insert_item(*db, "a", 1);
        insert_item(*db, "b", 2);
        insert_item(*db, "c", 2);

        auto rows = db->query().from("items").where("batch", "2").get();
        REQUIRE(rows.is_ok());
        CHECK(rows.value().size() == 2);

        auto last = db->query()
                        .from("items")
                        .order_by("id", sort_direction::descending)
                        .first();
        REQUIRE(last.is_ok());
        REQUIRE(last.value().has_value());
        CHECK(last.value()->at("name") == "c");

        auto names = db->query().from("items").order_by("id").pluck("name");
        REQUIRE(names.is_ok());
        CHECK(names.value() == std::vector<std::string>{"a", "b", "c"});
    }

    SECTION("first on an empty match set") {
        auto none = db->query().from("items").where("name", "missing").first();
        REQUIRE(none.is_ok());
        CHECK_FALSE(none.value().has_value());
    }

    SECTION("NULL columns are absent from rows") {
        insert_item(*db, "a", 1);
        auto row = db->query().from("items").first();
        REQUIRE(row.is_ok());
        REQUIRE(row.value().has_value());
        CHECK(row.value()->count("note") == 0);
        CHECK(row.value()->count("name") == 1);
    }

    SECTION("max and count") {
        auto empty_max = db->query().from("items").max("batch");
        REQUIRE(empty_max.is_ok());
        CHECK_FALSE(empty_max.value().has_value());

        insert_item(*db, "a", 1);
        insert_item(*db, "b", 3);

        auto max_batch = db->query().from("items").max("batch");
        REQUIRE(max_batch.is_ok());
        CHECK(max_batch.value() == std::optional<std::string>("3"));

        auto count = db->query().from("items").where("batch", "<", "3").count();
        REQUIRE(count.is_ok());
        CHECK(count.value() == 1);
    }

    SECTION("remove deletes matching rows") {
        insert_item(*db, "a", 1);
        insert_item(*db, "b", 2);

        auto removed = db->query().from("items").where("name", "a").remove();
        REQUIRE(removed.is_ok());
        CHECK(removed.value() == 1);
        CHECK(dbmigrate::test::row_count(*db, "items") == 1);
    }
}

// ============================================================================
// Errors
// ============================================================================

TEST_CASE("query_builder rejects invalid queries", "[storage][query][error]") {
    auto db = make_memory_connection();
    create_items_table(*db);

    SECTION("unsupported operator") {
        auto result = db->query().from("items").where("name", "; DROP", "x").get();
        REQUIRE(result.is_err());
        CHECK(result.error().module == "query");
        CHECK(result.error().message.find("Unsupported operator") != std::string::npos);
    }

    SECTION("operators are case-insensitive") {
        insert_item(*db, "alpha", 1);
        auto result = db->query().from("items").where("name", "like", "al%").count();
        REQUIRE(result.is_ok());
        CHECK(result.value() == 1);
    }

    SECTION("missing table name") {
        auto result = db->query().get();
        REQUIRE(result.is_err());
        CHECK(result.error().message == "No table specified for query");
    }

    SECTION("empty insert") {
        auto result = db->query().table("items").insert({});
        REQUIRE(result.is_err());
    }

    SECTION("driver errors surface as query errors") {
        auto result = db->query().from("no_such_table").get();
        REQUIRE(result.is_err());
        auto error = errors::query_error::from_error_info(result.error());
        REQUIRE(error.has_value());
        CHECK(result.error().message.find("no such table") != std::string::npos);
    }
}
