/**
 * @file schema_error.cpp
 * @brief Implementation of schema error constructors
 */

#include <dbmigrate/errors/schema_error.hpp>

#include <dbmigrate/compat/format.hpp>

namespace dbmigrate::errors {

schema_error::schema_error(int code, std::string message,
                           std::optional<std::string> table,
                           std::optional<std::string> column,
                           std::optional<std::string> constraint)
    : code_(code),
      message_(std::move(message)),
      table_(std::move(table)),
      column_(std::move(column)),
      constraint_(std::move(constraint)) {}

auto schema_error::table_creation_failed(std::string_view table,
                                         std::string_view reason)
    -> schema_error {
    return {error_codes::schema_table_creation_failed,
            compat::format("Failed to create table \"{}\": {}", table, reason),
            std::string(table)};
}

auto schema_error::table_already_exists(std::string_view table)
    -> schema_error {
    return {error_codes::schema_table_already_exists,
            compat::format("Table \"{}\" already exists", table),
            std::string(table)};
}

auto schema_error::table_not_found(std::string_view table) -> schema_error {
    return {error_codes::schema_table_not_found,
            compat::format("Table \"{}\" does not exist", table),
            std::string(table)};
}

auto schema_error::column_add_failed(std::string_view table,
                                     std::string_view column,
                                     std::string_view reason) -> schema_error {
    return {error_codes::schema_column_add_failed,
            compat::format("Failed to add column \"{}\" to table \"{}\": {}",
                           column, table, reason),
            std::string(table), std::string(column)};
}

auto schema_error::column_already_exists(std::string_view table,
                                         std::string_view column)
    -> schema_error {
    return {error_codes::schema_column_already_exists,
            compat::format("Column \"{}\" already exists in table \"{}\"",
                           column, table),
            std::string(table), std::string(column)};
}

auto schema_error::column_not_found(std::string_view table,
                                    std::string_view column) -> schema_error {
    return {error_codes::schema_column_not_found,
            compat::format("Column \"{}\" does not exist in table \"{}\"",
                           column, table),
            std::string(table), std::string(column)};
}

auto schema_error::index_creation_failed(std::string_view table,
                                         std::string_view index,
                                         std::string_view reason)
    -> schema_error {
    return {error_codes::schema_index_creation_failed,
            compat::format("Failed to create index \"{}\" on table \"{}\": {}",
                           index, table, reason),
            std::string(table), std::nullopt,
            std::string(index)};
}

auto schema_error::index_not_found(std::string_view table,
                                   std::string_view index) -> schema_error {
    return {error_codes::schema_index_not_found,
            compat::format("Index \"{}\" does not exist on table \"{}\"",
                           index, table),
            std::string(table), std::nullopt,
            std::string(index)};
}

auto schema_error::foreign_key_failed(std::string_view table,
                                      std::string_view constraint,
                                      std::string_view reason)
    -> schema_error {
    return {error_codes::schema_foreign_key_failed,
            compat::format(
                "Failed to create foreign key \"{}\" on table \"{}\": {}",
                constraint, table, reason),
            std::string(table), std::nullopt,
            std::string(constraint)};
}

auto schema_error::invalid_schema_version(std::string_view current,
                                          std::string_view expected)
    -> schema_error {
    return {error_codes::schema_invalid_version,
            compat::format(
                "Invalid schema version: current \"{}\", expected \"{}\"",
                current, expected)};
}

auto schema_error::operation_failed(std::string_view reason) -> schema_error {
    return {error_codes::schema_operation_failed,
            compat::format("Schema operation failed: {}", reason)};
}

auto schema_error::to_error_info() const -> error_info {
    if (table_) {
        return error_info{code_, message_, std::string(module_name), *table_};
    }
    return error_info{code_, message_, std::string(module_name)};
}

}  // namespace dbmigrate::errors
