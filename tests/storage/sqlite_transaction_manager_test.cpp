/**
 * @file sqlite_transaction_manager_test.cpp
 * @brief Unit tests for SQLite transactions, nesting and savepoints
 */

#include <dbmigrate/errors/transaction_error.hpp>
#include <dbmigrate/storage/sqlite_transaction_manager.hpp>

#include "fixtures/memory_connection.hpp"
#include "mocks/mock_logger.hpp"

#include <catch2/catch_test_macros.hpp>

#include <stdexcept>

using namespace dbmigrate;
using namespace dbmigrate::storage;
using dbmigrate::test::make_memory_connection;
using dbmigrate::test::row_count;

namespace {

void create_items(sqlite_connection& db) {
    REQUIRE(db.execute_script("CREATE TABLE items (name TEXT)").is_ok());
}

auto insert(sqlite_connection& db, const std::string& name) -> VoidResult {
    auto result = db.execute("INSERT INTO items (name) VALUES (?)", {{"name", name}});
    if (result.is_err()) {
        return result.error();
    }
    return ok();
}

}  // namespace

TEST_CASE("transaction begin, commit and rollback", "[storage][transaction]") {
    auto db = make_memory_connection();
    create_items(*db);
    auto& tx = db->transaction();

    CHECK_FALSE(tx.is_active());
    CHECK(tx.level() == 0);

    SECTION("commit keeps changes") {
        REQUIRE(tx.begin().is_ok());
        CHECK(tx.is_active());
        REQUIRE(insert(*db, "a").is_ok());
        REQUIRE(tx.commit().is_ok());
        CHECK_FALSE(tx.is_active());
        CHECK(row_count(*db, "items") == 1);
    }

    SECTION("rollback discards changes") {
        REQUIRE(tx.begin().is_ok());
        REQUIRE(insert(*db, "a").is_ok());
        REQUIRE(tx.rollback().is_ok());
        CHECK(row_count(*db, "items") == 0);
    }

    SECTION("commit without a transaction") {
        auto result = tx.commit();
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::transaction_not_active);
        CHECK(result.error().module == "transaction");
    }

    SECTION("DDL is transactional") {
        REQUIRE(tx.begin().is_ok());
        REQUIRE(db->schema().create_table("scratch", "id INTEGER").is_ok());
        REQUIRE(tx.rollback().is_ok());
        CHECK_FALSE(db->schema().table_exists("scratch"));
    }
}

TEST_CASE("nested transactions use savepoints", "[storage][transaction]") {
    SECTION("inner rollback keeps outer work") {
        auto db = make_memory_connection();
        create_items(*db);
        auto& tx = db->transaction();

        REQUIRE(tx.begin().is_ok());
        REQUIRE(insert(*db, "outer").is_ok());

        REQUIRE(tx.begin().is_ok());
        CHECK(tx.level() == 2);
        REQUIRE(insert(*db, "inner").is_ok());
        REQUIRE(tx.rollback().is_ok());
        CHECK(tx.level() == 1);

        REQUIRE(tx.commit().is_ok());
        CHECK(row_count(*db, "items") == 1);
    }

    SECTION("nesting can be disabled") {
        sqlite_options options;
        options.allow_nested_transactions = false;
        auto db = make_memory_connection(options);
        auto& tx = db->transaction();

        REQUIRE(tx.begin().is_ok());
        auto nested = tx.begin();
        REQUIRE(nested.is_err());
        CHECK(nested.error().code == error_codes::transaction_nested_unsupported);
        REQUIRE(tx.rollback().is_ok());
    }
}

TEST_CASE("user savepoints", "[storage][transaction]") {
    auto db = make_memory_connection();
    create_items(*db);
    auto& tx = db->transaction();

    SECTION("savepoint requires a transaction") {
        auto result = tx.savepoint("sp1");
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::transaction_not_active);
    }

    SECTION("rollback_to undoes work after the savepoint") {
        REQUIRE(tx.begin().is_ok());
        REQUIRE(insert(*db, "a").is_ok());
        REQUIRE(tx.savepoint("sp1").is_ok());
        REQUIRE(insert(*db, "b").is_ok());
        REQUIRE(tx.rollback_to("sp1").is_ok());
        REQUIRE(tx.commit().is_ok());
        CHECK(row_count(*db, "items") == 1);
    }

    SECTION("unknown savepoints") {
        REQUIRE(tx.begin().is_ok());
        auto result = tx.release_savepoint("missing");
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::transaction_savepoint_not_found);
        REQUIRE(tx.rollback().is_ok());
    }

    SECTION("released savepoints are forgotten") {
        REQUIRE(tx.begin().is_ok());
        REQUIRE(tx.savepoint("sp1").is_ok());
        REQUIRE(tx.release_savepoint("sp1").is_ok());
        CHECK(tx.rollback_to("sp1").is_err());
        REQUIRE(tx.commit().is_ok());
    }
}

TEST_CASE("transaction_manager::run", "[storage][transaction]") {
    auto logger = std::make_shared<dbmigrate::test::mock_logger>();
    auto db = make_memory_connection({}, logger);
    create_items(*db);
    auto& tx = db->transaction();

    SECTION("commits on success") {
        auto result = tx.run([&]() { return insert(*db, "a"); });
        REQUIRE(result.is_ok());
        CHECK_FALSE(tx.is_active());
        CHECK(row_count(*db, "items") == 1);
    }

    SECTION("rolls back and returns the original error") {
        auto result = tx.run([&]() -> VoidResult {
            auto inserted = insert(*db, "a");
            if (inserted.is_err()) {
                return inserted;
            }
            return void_error(error_codes::schema_operation_failed, "boom", "schema");
        });
        REQUIRE(result.is_err());
        CHECK(result.error().message == "boom");
        CHECK(result.error().module == "schema");
        CHECK_FALSE(tx.is_active());
        CHECK(row_count(*db, "items") == 0);
    }

    SECTION("converts exceptions after rolling back") {
        auto result = tx.run([&]() -> VoidResult {
            auto inserted = insert(*db, "a");
            if (inserted.is_err()) {
                return inserted;
            }
            throw std::runtime_error("callback exploded");
        });
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::transaction_callback_failed);
        CHECK(result.error().message.find("callback exploded") != std::string::npos);
        CHECK(row_count(*db, "items") == 0);
    }
}

TEST_CASE("a failed commit leaves no transaction behind", "[storage][transaction]") {
    auto db = make_memory_connection();
    REQUIRE(db->execute_script(
                  "CREATE TABLE parents (id INTEGER PRIMARY KEY);"
                  "CREATE TABLE children (id INTEGER PRIMARY KEY, parent_id INTEGER "
                  "REFERENCES parents(id) DEFERRABLE INITIALLY DEFERRED)")
                .is_ok());
    auto& tx = db->transaction();

    SECTION("commit") {
        REQUIRE(tx.begin().is_ok());
        REQUIRE(db->execute("INSERT INTO children (parent_id) VALUES (42)").is_ok());

        auto committed = tx.commit();
        REQUIRE(committed.is_err());
        CHECK(committed.error().code == error_codes::transaction_commit_failed);
        CHECK_FALSE(tx.is_active());
        CHECK_FALSE(db->in_transaction());
        CHECK(row_count(*db, "children") == 0);
    }

    SECTION("run") {
        auto result = tx.run([&]() -> VoidResult {
            auto inserted = db->execute("INSERT INTO children (parent_id) VALUES (42)");
            if (inserted.is_err()) {
                return inserted.error();
            }
            return ok();
        });
        REQUIRE(result.is_err());
        CHECK(result.error().module == "transaction");
        CHECK_FALSE(tx.is_active());
        CHECK_FALSE(db->in_transaction());
        CHECK(row_count(*db, "children") == 0);
    }

    // The connection is usable again
    REQUIRE(tx.begin().is_ok());
    CHECK(tx.level() == 1);
    REQUIRE(tx.rollback().is_ok());
}
