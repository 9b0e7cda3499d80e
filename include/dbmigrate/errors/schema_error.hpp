/**
 * @file schema_error.hpp
 * @brief Errors raised by DDL operations
 */

#pragma once

#include <dbmigrate/core/result.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace dbmigrate::errors {

/**
 * @brief Failed DDL operation
 *
 * Each named constructor fixes the error code and the message template, so
 * callers never format schema messages themselves.
 */
class schema_error {
public:
    schema_error(int code, std::string message,
                 std::optional<std::string> table = std::nullopt,
                 std::optional<std::string> column = std::nullopt,
                 std::optional<std::string> constraint = std::nullopt);

    [[nodiscard]] static auto table_creation_failed(std::string_view table,
                                                    std::string_view reason)
        -> schema_error;
    [[nodiscard]] static auto table_already_exists(std::string_view table)
        -> schema_error;
    [[nodiscard]] static auto table_not_found(std::string_view table)
        -> schema_error;
    [[nodiscard]] static auto column_add_failed(std::string_view table,
                                                std::string_view column,
                                                std::string_view reason)
        -> schema_error;
    [[nodiscard]] static auto column_already_exists(std::string_view table,
                                                    std::string_view column)
        -> schema_error;
    [[nodiscard]] static auto column_not_found(std::string_view table,
                                               std::string_view column)
        -> schema_error;
    [[nodiscard]] static auto index_creation_failed(std::string_view table,
                                                    std::string_view index,
                                                    std::string_view reason)
        -> schema_error;
    [[nodiscard]] static auto index_not_found(std::string_view table,
                                              std::string_view index)
        -> schema_error;
    [[nodiscard]] static auto foreign_key_failed(std::string_view table,
                                                 std::string_view constraint,
                                                 std::string_view reason)
        -> schema_error;
    [[nodiscard]] static auto invalid_schema_version(std::string_view current,
                                                     std::string_view expected)
        -> schema_error;

    /// Generic failure of a raw DDL statement
    [[nodiscard]] static auto operation_failed(std::string_view reason)
        -> schema_error;

    [[nodiscard]] auto code() const noexcept -> int { return code_; }
    [[nodiscard]] auto message() const noexcept -> const std::string& {
        return message_;
    }
    [[nodiscard]] auto table() const noexcept
        -> const std::optional<std::string>& {
        return table_;
    }
    [[nodiscard]] auto column() const noexcept
        -> const std::optional<std::string>& {
        return column_;
    }
    /// Index or foreign key name
    [[nodiscard]] auto constraint() const noexcept
        -> const std::optional<std::string>& {
        return constraint_;
    }

    /// module is "schema"; details holds the table name when known
    [[nodiscard]] auto to_error_info() const -> error_info;

    static constexpr std::string_view module_name = "schema";

private:
    int code_;
    std::string message_;
    std::optional<std::string> table_;
    std::optional<std::string> column_;
    std::optional<std::string> constraint_;
};

}  // namespace dbmigrate::errors
