/**
 * @file sqlite_schema_manager.hpp
 * @brief SQLite implementation of schema_manager
 */

#pragma once

#include <dbmigrate/di/ilogger.hpp>
#include <dbmigrate/errors/schema_error.hpp>
#include <dbmigrate/storage/schema_manager.hpp>

#include <memory>

namespace dbmigrate::storage {

class sqlite_connection;

/**
 * @brief DDL for sqlite_connection
 *
 * Existence checks read sqlite_master and PRAGMA table_info. SQLite cannot
 * add a foreign key to an existing table, so add_foreign_key always fails
 * with schema_error::foreign_key_failed.
 */
class sqlite_schema_manager final : public schema_manager {
public:
    sqlite_schema_manager(sqlite_connection& db,
                          std::shared_ptr<di::ILogger> logger);

    [[nodiscard]] auto create_table(std::string_view table,
                                    std::string_view definition)
        -> VoidResult override;
    [[nodiscard]] auto drop_table(std::string_view table) -> VoidResult override;
    [[nodiscard]] auto drop_table_if_exists(std::string_view table)
        -> VoidResult override;
    [[nodiscard]] auto table_exists(std::string_view table) -> bool override;
    [[nodiscard]] auto has_table(std::string_view table) -> Result<bool> override;

    [[nodiscard]] auto add_column(std::string_view table,
                                  std::string_view column,
                                  std::string_view definition)
        -> VoidResult override;
    [[nodiscard]] auto drop_column(std::string_view table,
                                   std::string_view column)
        -> VoidResult override;
    [[nodiscard]] auto column_exists(std::string_view table,
                                     std::string_view column) -> bool override;

    [[nodiscard]] auto add_index(std::string_view table,
                                 std::string_view index,
                                 const std::vector<std::string>& columns,
                                 bool unique = false) -> VoidResult override;
    [[nodiscard]] auto drop_index(std::string_view table,
                                  std::string_view index)
        -> VoidResult override;
    [[nodiscard]] auto index_exists(std::string_view table,
                                    std::string_view index) -> bool override;

    [[nodiscard]] auto add_foreign_key(std::string_view table,
                                       std::string_view constraint,
                                       std::string_view column,
                                       std::string_view referenced_table,
                                       std::string_view referenced_column,
                                       std::string_view on_delete = {})
        -> VoidResult override;

    [[nodiscard]] auto raw(std::string_view sql) -> VoidResult override;

private:
    [[nodiscard]] auto object_exists(std::string_view type,
                                     const std::string& name) -> Result<bool>;

    /// Pass lock contention through untouched, wrap everything else
    [[nodiscard]] static auto ddl_failure(const error_info& cause,
                                          const errors::schema_error& wrapped)
        -> error_info;

    sqlite_connection& db_;
    std::shared_ptr<di::ILogger> logger_;
};

}  // namespace dbmigrate::storage
