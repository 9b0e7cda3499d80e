/**
 * @file sqlite_connection.hpp
 * @brief SQLite adapter of the schema/connection port
 *
 * This file provides the sqlite_connection class that implements
 * database_connection on top of the SQLite C API, together with its
 * transaction and schema managers.
 */

#pragma once

#include <dbmigrate/di/ilogger.hpp>
#include <dbmigrate/storage/database_connection.hpp>

#include <chrono>
#include <memory>
#include <string>

namespace dbmigrate::storage {

/**
 * @brief SQLite connection options
 */
struct sqlite_options {
    /// Prefix prepended to every table name
    std::string table_prefix;

    /// Time to wait on a locked database before failing with SQLITE_BUSY
    std::chrono::milliseconds busy_timeout{5000};

    /// Enforce foreign key constraints (PRAGMA foreign_keys)
    bool foreign_keys{true};

    /// Map nested begin() calls onto savepoints
    bool allow_nested_transactions{true};
};

/**
 * @brief database_connection backed by a SQLite database file
 *
 * Native failures are reported as query_error values carrying the SQLite
 * extended result code as vendor code, so the retry predicates
 * (is_deadlock, is_lock_timeout) work on them.
 *
 * **Thread Safety:** This class is NOT thread-safe.
 *
 * @example
 * @code
 * auto db = std::make_shared<sqlite_connection>("app.db");
 * if (auto result = db->connect(); result.is_err()) {
 *     return result;
 * }
 * auto rows = db->select("SELECT name FROM sqlite_master");
 * @endcode
 */
class sqlite_connection final : public database_connection {
public:
    /**
     * @brief Construct an unconnected adapter
     *
     * @param path Database file path, or ":memory:"
     * @param options Connection options
     * @param logger Logger for statement tracing; null logger when omitted
     */
    explicit sqlite_connection(std::string path, sqlite_options options = {},
                               std::shared_ptr<di::ILogger> logger = nullptr);

    ~sqlite_connection() override;

    // ========================================================================
    // database_connection
    // ========================================================================

    [[nodiscard]] auto connect() -> VoidResult override;
    void disconnect() override;
    [[nodiscard]] auto is_connected() const noexcept -> bool override;
    [[nodiscard]] auto driver_name() const -> std::string override;
    [[nodiscard]] auto table_prefix() const -> const std::string& override;
    [[nodiscard]] auto quote_identifier(std::string_view identifier) const
        -> std::string override;

    [[nodiscard]] auto select(const std::string& sql,
                              const binding_list& bindings = {})
        -> Result<database_result> override;
    [[nodiscard]] auto execute(const std::string& sql,
                               const binding_list& bindings = {})
        -> Result<std::uint64_t> override;
    [[nodiscard]] auto last_insert_id() const -> std::int64_t override;

    [[nodiscard]] auto transaction() -> transaction_manager& override;
    [[nodiscard]] auto schema() -> schema_manager& override;

    // ========================================================================
    // SQLite specific
    // ========================================================================

    /**
     * @brief Execute one or more statements without bindings
     *
     * Used for DDL scripts; statements are separated by semicolons.
     */
    [[nodiscard]] auto execute_script(const std::string& sql) -> VoidResult;

    /// True while SQLite itself has a transaction open (autocommit is off)
    [[nodiscard]] auto in_transaction() const noexcept -> bool;

    [[nodiscard]] auto path() const -> const std::string&;

    [[nodiscard]] auto options() const -> const sqlite_options&;

private:
    class impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace dbmigrate::storage
