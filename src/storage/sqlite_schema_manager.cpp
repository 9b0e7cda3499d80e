/**
 * @file sqlite_schema_manager.cpp
 * @brief Implementation of SQLite DDL operations
 */

#include <dbmigrate/storage/sqlite_schema_manager.hpp>

#include <dbmigrate/compat/format.hpp>
#include <dbmigrate/errors/query_error.hpp>
#include <dbmigrate/errors/schema_error.hpp>
#include <dbmigrate/storage/sqlite_connection.hpp>

namespace dbmigrate::storage {

sqlite_schema_manager::sqlite_schema_manager(sqlite_connection& db,
                                             std::shared_ptr<di::ILogger> logger)
    : db_(db), logger_(logger ? std::move(logger) : di::null_logger()) {}

// ============================================================================
// Tables
// ============================================================================

auto sqlite_schema_manager::create_table(std::string_view table,
                                         std::string_view definition)
    -> VoidResult {
    if (table_exists(table)) {
        return errors::schema_error::table_already_exists(table).to_error_info();
    }

    auto sql = compat::format("CREATE TABLE {} ({})",
                              db_.quote_identifier(db_.full_table_name(table)),
                              definition);
    auto result = db_.execute_script(sql);
    if (result.is_err()) {
        return ddl_failure(
            result.error(),
            errors::schema_error::table_creation_failed(table,
                                                        result.error().message));
    }

    logger_->debug_fmt("Created table {}", db_.full_table_name(table));
    return ok();
}

auto sqlite_schema_manager::drop_table(std::string_view table) -> VoidResult {
    if (!table_exists(table)) {
        return errors::schema_error::table_not_found(table).to_error_info();
    }
    return drop_table_if_exists(table);
}

auto sqlite_schema_manager::drop_table_if_exists(std::string_view table)
    -> VoidResult {
    auto sql = compat::format("DROP TABLE IF EXISTS {}",
                              db_.quote_identifier(db_.full_table_name(table)));
    auto result = db_.execute_script(sql);
    if (result.is_err()) {
        return ddl_failure(
            result.error(),
            errors::schema_error::operation_failed(result.error().message));
    }

    logger_->debug_fmt("Dropped table {}", db_.full_table_name(table));
    return ok();
}

auto sqlite_schema_manager::table_exists(std::string_view table) -> bool {
    auto exists = has_table(table);
    if (exists.is_err()) {
        logger_->warn_fmt("Cannot inspect sqlite_master for {}: {}",
                          db_.full_table_name(table), exists.error().message);
        return false;
    }
    return exists.value();
}

auto sqlite_schema_manager::has_table(std::string_view table) -> Result<bool> {
    return object_exists("table", db_.full_table_name(table));
}

// ============================================================================
// Columns
// ============================================================================

auto sqlite_schema_manager::add_column(std::string_view table,
                                       std::string_view column,
                                       std::string_view definition)
    -> VoidResult {
    if (!table_exists(table)) {
        return errors::schema_error::table_not_found(table).to_error_info();
    }
    if (column_exists(table, column)) {
        return errors::schema_error::column_already_exists(table, column)
            .to_error_info();
    }

    auto sql = compat::format("ALTER TABLE {} ADD COLUMN {} {}",
                              db_.quote_identifier(db_.full_table_name(table)),
                              db_.quote_identifier(column), definition);
    auto result = db_.execute_script(sql);
    if (result.is_err()) {
        return ddl_failure(
            result.error(),
            errors::schema_error::column_add_failed(table, column,
                                                    result.error().message));
    }
    return ok();
}

auto sqlite_schema_manager::drop_column(std::string_view table,
                                        std::string_view column)
    -> VoidResult {
    if (!column_exists(table, column)) {
        return errors::schema_error::column_not_found(table, column)
            .to_error_info();
    }

    // Requires SQLite 3.35 or later
    auto sql = compat::format("ALTER TABLE {} DROP COLUMN {}",
                              db_.quote_identifier(db_.full_table_name(table)),
                              db_.quote_identifier(column));
    auto result = db_.execute_script(sql);
    if (result.is_err()) {
        return ddl_failure(
            result.error(),
            errors::schema_error::operation_failed(result.error().message));
    }
    return ok();
}

auto sqlite_schema_manager::column_exists(std::string_view table,
                                          std::string_view column) -> bool {
    auto sql = compat::format("PRAGMA table_info({})",
                              db_.quote_identifier(db_.full_table_name(table)));
    auto result = db_.select(sql);
    if (result.is_err()) {
        logger_->warn_fmt("Cannot inspect columns of {}: {}",
                          db_.full_table_name(table), result.error().message);
        return false;
    }

    for (const auto& row : result.value()) {
        auto it = row.find("name");
        if (it != row.end() && it->second == column) {
            return true;
        }
    }
    return false;
}

// ============================================================================
// Indexes and constraints
// ============================================================================

auto sqlite_schema_manager::add_index(std::string_view table,
                                      std::string_view index,
                                      const std::vector<std::string>& columns,
                                      bool unique) -> VoidResult {
    if (columns.empty()) {
        return errors::schema_error::index_creation_failed(table, index,
                                                           "no columns given")
            .to_error_info();
    }

    std::string column_list;
    for (const auto& column : columns) {
        if (!column_list.empty()) {
            column_list += ", ";
        }
        column_list += db_.quote_identifier(column);
    }

    auto sql = compat::format("CREATE {}INDEX {} ON {} ({})",
                              unique ? "UNIQUE " : "",
                              db_.quote_identifier(db_.full_table_name(index)),
                              db_.quote_identifier(db_.full_table_name(table)),
                              column_list);
    auto result = db_.execute_script(sql);
    if (result.is_err()) {
        return ddl_failure(
            result.error(),
            errors::schema_error::index_creation_failed(table, index,
                                                        result.error().message));
    }
    return ok();
}

auto sqlite_schema_manager::drop_index(std::string_view table,
                                       std::string_view index) -> VoidResult {
    if (!index_exists(table, index)) {
        return errors::schema_error::index_not_found(table, index)
            .to_error_info();
    }

    auto sql = compat::format("DROP INDEX {}",
                              db_.quote_identifier(db_.full_table_name(index)));
    auto result = db_.execute_script(sql);
    if (result.is_err()) {
        return ddl_failure(
            result.error(),
            errors::schema_error::operation_failed(result.error().message));
    }
    return ok();
}

auto sqlite_schema_manager::index_exists(std::string_view table,
                                         std::string_view index) -> bool {
    auto result = db_.select(
        "SELECT name FROM sqlite_master WHERE type = 'index' AND name = ? "
        "AND tbl_name = ?",
        {{"name", db_.full_table_name(index)},
         {"tbl_name", db_.full_table_name(table)}});
    if (result.is_err()) {
        logger_->warn_fmt("Cannot inspect indexes of {}: {}",
                          db_.full_table_name(table), result.error().message);
        return false;
    }
    return !result.value().empty();
}

auto sqlite_schema_manager::add_foreign_key(
    std::string_view table, std::string_view constraint,
    [[maybe_unused]] std::string_view column,
    [[maybe_unused]] std::string_view referenced_table,
    [[maybe_unused]] std::string_view referenced_column,
    [[maybe_unused]] std::string_view on_delete) -> VoidResult {
    return errors::schema_error::foreign_key_failed(
               table, constraint,
               "SQLite does not support adding foreign keys to an existing "
               "table; declare them in create_table")
        .to_error_info();
}

auto sqlite_schema_manager::raw(std::string_view sql) -> VoidResult {
    auto result = db_.execute_script(std::string(sql));
    if (result.is_err()) {
        return ddl_failure(
            result.error(),
            errors::schema_error::operation_failed(result.error().message));
    }
    return ok();
}

// ============================================================================
// Private Helpers
// ============================================================================

auto sqlite_schema_manager::object_exists(std::string_view type,
                                          const std::string& name)
    -> Result<bool> {
    auto result = db_.select(
        "SELECT name FROM sqlite_master WHERE type = ? AND name = ?",
        {{"type", std::string(type)}, {"name", name}});
    if (result.is_err()) {
        return result.error();
    }
    return ok(!result.value().empty());
}

auto sqlite_schema_manager::ddl_failure(const error_info& cause,
                                        const errors::schema_error& wrapped)
    -> error_info {
    if (auto query = errors::query_error::from_error_info(cause);
        query && query->is_retryable()) {
        return cause;
    }
    return wrapped.to_error_info();
}

}  // namespace dbmigrate::storage
