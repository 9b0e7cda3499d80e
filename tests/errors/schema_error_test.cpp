/**
 * @file schema_error_test.cpp
 * @brief Unit tests for schema_error
 */

#include <dbmigrate/errors/schema_error.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace dbmigrate;
using namespace dbmigrate::errors;

TEST_CASE("schema_error messages", "[errors][schema]") {
    SECTION("table errors carry the table") {
        auto error = schema_error::table_already_exists("users");
        CHECK(error.code() == error_codes::schema_table_already_exists);
        CHECK(error.message() == "Table \"users\" already exists");
        CHECK(error.table() == std::optional<std::string>("users"));
        CHECK_FALSE(error.column().has_value());

        CHECK(schema_error::table_not_found("users").message() ==
              "Table \"users\" does not exist");
        CHECK(schema_error::table_creation_failed("users", "disk full").message() ==
              "Failed to create table \"users\": disk full");
    }

    SECTION("column errors carry table and column") {
        auto error = schema_error::column_already_exists("users", "email");
        CHECK(error.message() == "Column \"email\" already exists in table \"users\"");
        CHECK(error.table() == std::optional<std::string>("users"));
        CHECK(error.column() == std::optional<std::string>("email"));

        CHECK(schema_error::column_not_found("users", "email").code() ==
              error_codes::schema_column_not_found);
    }

    SECTION("index and foreign key errors carry the constraint") {
        auto index = schema_error::index_not_found("users", "idx_email");
        CHECK(index.message() == "Index \"idx_email\" does not exist on table \"users\"");
        CHECK(index.constraint() == std::optional<std::string>("idx_email"));

        auto fk = schema_error::foreign_key_failed("posts", "fk_posts_user",
                                                   "not supported");
        CHECK(fk.code() == error_codes::schema_foreign_key_failed);
        CHECK(fk.constraint() == std::optional<std::string>("fk_posts_user"));
    }

    SECTION("generic failures") {
        CHECK(schema_error::operation_failed("syntax error").message() ==
              "Schema operation failed: syntax error");
        CHECK(schema_error::invalid_schema_version("3", "5").code() ==
              error_codes::schema_invalid_version);
    }
}

TEST_CASE("schema_error converts to error_info", "[errors][schema][transport]") {
    auto info = schema_error::table_not_found("users").to_error_info();
    CHECK(info.code == error_codes::schema_table_not_found);
    CHECK(info.module == "schema");
    CHECK(info.message == "Table \"users\" does not exist");
}
