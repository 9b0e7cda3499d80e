/**
 * @file migration_error_test.cpp
 * @brief Unit tests for migration_error and retry classification
 */

#include <dbmigrate/errors/migration_error.hpp>
#include <dbmigrate/errors/query_error.hpp>
#include <dbmigrate/errors/schema_error.hpp>
#include <dbmigrate/errors/transaction_error.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace dbmigrate;
using namespace dbmigrate::errors;

TEST_CASE("migration_error wraps its cause", "[errors][migration]") {
    const auto cause = query_error::deadlock("ALTER TABLE users").to_error_info();

    SECTION("migration_failed") {
        auto error = migration_error::migration_failed("2024_01_01_000000_a", cause);
        CHECK(error.code() == error_codes::migration_failed);
        CHECK(error.message() ==
              "Migration [2024_01_01_000000_a] failed: "
              "Deadlock found when trying to get lock; try restarting transaction");
        CHECK(error.migration_name() ==
              std::optional<std::string>("2024_01_01_000000_a"));
        REQUIRE(error.cause().has_value());
        CHECK(error.cause()->module == "query");
        CHECK(error.is_retryable());
    }

    SECTION("rollback_failed") {
        auto error = migration_error::rollback_failed("b", cause);
        CHECK(error.code() == error_codes::migration_rollback_failed);
        CHECK(error.message().rfind("Rollback of migration [b] failed: ", 0) == 0);
        CHECK(error.is_retryable());
    }

    SECTION("non transient causes are not retryable") {
        auto schema = schema_error::table_already_exists("users").to_error_info();
        CHECK_FALSE(migration_error::migration_failed("a", schema).is_retryable());
    }
}

TEST_CASE("migration_error state errors", "[errors][migration]") {
    CHECK(migration_error::migration_not_found("x").message() ==
          "Migration [x] not found");
    CHECK(migration_error::migration_already_ran("x").message() ==
          "Migration [x] has already been executed");
    CHECK(migration_error::migration_not_ran("x").message() ==
          "Migration [x] has not been executed and cannot be rolled back");
    CHECK(migration_error::lock_unavailable("dbmigrate", "runner-1").message() ==
          "Migration lock [dbmigrate] is held by runner-1");

    auto plain = migration_error::migration_not_found("x");
    CHECK_FALSE(plain.cause().has_value());
    CHECK_FALSE(plain.is_retryable());
}

TEST_CASE("migration_error with_sql attaches the statement", "[errors][migration]") {
    auto error = migration_error::invalid_migration("x", "bad");
    error.with_sql("DROP TABLE users");
    CHECK(error.sql() == std::optional<std::string>("DROP TABLE users"));
}

TEST_CASE("migration_error converts to error_info", "[errors][migration][transport]") {
    auto info = migration_error::migration_not_ran("x").to_error_info();
    CHECK(info.code == error_codes::migration_not_ran);
    CHECK(info.module == "migration");
}

TEST_CASE("is_retryable classifies transported errors", "[errors][retry]") {
    CHECK(is_retryable(query_error::lock_wait_timeout("UPDATE").to_error_info()));
    CHECK(is_retryable(transaction_error::lock_timeout().to_error_info()));
    CHECK_FALSE(is_retryable(query_error::syntax_error("X", "y").to_error_info()));
    CHECK_FALSE(is_retryable(schema_error::table_not_found("t").to_error_info()));
    CHECK_FALSE(is_retryable(error_info{-1, "unknown", "other"}));
}
